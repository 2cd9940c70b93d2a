/*
 * Copyright 2025 Accord Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Accord Configuration - Implementation

#include "config.hpp"

#include <atomic>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/logging.hpp"
#include "config_validator.hpp"

namespace accord::control {

namespace {

constexpr uint32_t MAX_EXCHANGE_TTL_SECONDS = 900;
constexpr uint32_t MAX_INTROSPECTION_TTL_MS = 30000;
constexpr uint32_t MAX_TIMEOUT_MS = 30000;

void validate_timeout(std::string_view name, uint32_t value, ValidationResult& result) {
    if (value == 0 || value > MAX_TIMEOUT_MS) {
        result.add_error("timeouts." + std::string(name) + " must be between 1 and " +
                         std::to_string(MAX_TIMEOUT_MS) + " ms (got " + std::to_string(value) +
                         ")");
    }
}

bool is_http_url(std::string_view url) {
    return url.starts_with("http://") || url.starts_with("https://");
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        LOG_ERROR(logging::get_logger(), "Cannot open configuration file: path={}", path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(logging::get_logger(), "Configuration JSON parsing error: {}", e.what());
        return std::nullopt;
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        LOG_WARNING(logging::get_logger(), "Configuration warning: {}", warning);
    }

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            LOG_ERROR(logging::get_logger(), "Configuration error: {}", error);
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    if (config.local_instance.empty()) {
        result.add_error("local_instance must be set");
    }

    // Exchange tokens
    if (config.exchange_token.ttl_seconds == 0 ||
        config.exchange_token.ttl_seconds > MAX_EXCHANGE_TTL_SECONDS) {
        result.add_error("exchange_token.ttl_seconds must be between 1 and " +
                         std::to_string(MAX_EXCHANGE_TTL_SECONDS) + " (got " +
                         std::to_string(config.exchange_token.ttl_seconds) + ")");
    }
    if (config.exchange_token.prefix.empty() ||
        config.exchange_token.prefix.find('.') != std::string::npos) {
        result.add_error("exchange_token.prefix must be non-empty and must not contain '.'");
    }
    if (config.exchange_token.key_id.empty()) {
        result.add_error("exchange_token.key_id must be set");
    }
    if (config.exchange_token.signing_key_path.empty()) {
        result.add_warning(
            "exchange_token.signing_key_path not set, an ephemeral signing key will be generated");
    }

    // Instances
    if (config.instances.empty()) {
        result.add_warning("No peer instances configured");
    }

    for (const auto& instance : config.instances) {
        if (instance.instance_id.empty()) {
            result.add_error("Instance instance_id cannot be empty");
            continue;
        }
        std::string context = "Instance '" + instance.instance_id + "'";

        if (!is_http_url(instance.base_url)) {
            result.add_error(context + ": base_url must be an http(s) URL");
        }
        if (!is_http_url(instance.introspection_url)) {
            result.add_error(context + ": introspection_url must be an http(s) URL");
        }
        if (instance.signing_keys_url.empty()) {
            if (!instance.introspection_only) {
                result.add_warning(context +
                                   ": no signing_keys_url, every token will be introspected");
            }
        } else if (!is_http_url(instance.signing_keys_url)) {
            result.add_error(context + ": signing_keys_url must be an http(s) URL");
        }
        if (instance.country.empty()) {
            result.add_warning(context + ": country not set");
        }
    }

    // Circuit breaker
    const auto& cb = config.circuit_breaker;
    if (cb.failure_threshold == 0) {
        result.add_error("circuit_breaker.failure_threshold must be > 0");
    }
    if (cb.success_threshold == 0) {
        result.add_error("circuit_breaker.success_threshold must be > 0");
    }
    if (cb.recovery_timeout_ms == 0) {
        result.add_error("circuit_breaker.recovery_timeout_ms must be > 0");
    }
    if (cb.failure_window_ms == 0) {
        result.add_error("circuit_breaker.failure_window_ms must be > 0");
    }
    if (cb.half_open_request_percentage > 100) {
        result.add_error("circuit_breaker.half_open_request_percentage must be <= 100");
    } else if (cb.half_open_request_percentage == 0) {
        result.add_warning(
            "circuit_breaker.half_open_request_percentage is 0, peers recover only through "
            "explicit probes");
    }
    if (cb.half_open_timeout_ms > 0 && cb.half_open_timeout_ms < cb.recovery_timeout_ms) {
        result.add_warning("circuit_breaker.half_open_timeout_ms is shorter than "
                           "recovery_timeout_ms");
    }

    if (config.monitor.tick_interval_ms == 0) {
        result.add_error("monitor.tick_interval_ms must be > 0");
    }

    // Caches
    if (config.caches.introspection_ttl_ms == 0 ||
        config.caches.introspection_ttl_ms > MAX_INTROSPECTION_TTL_MS) {
        result.add_error("caches.introspection_ttl_ms must be between 1 and " +
                         std::to_string(MAX_INTROSPECTION_TTL_MS));
    }
    if (config.caches.authz_ttl_ms == 0) {
        result.add_error("caches.authz_ttl_ms must be > 0");
    }
    if (config.caches.jwks_ttl_ms == 0) {
        result.add_error("caches.jwks_ttl_ms must be > 0");
    }
    if (config.caches.capacity == 0) {
        result.add_error("caches.capacity must be > 0");
    }

    validate_timeout("introspection_ms", config.timeouts.introspection_ms, result);
    validate_timeout("jwks_ms", config.timeouts.jwks_ms, result);
    validate_timeout("local_policy_ms", config.timeouts.local_policy_ms, result);
    validate_timeout("remote_policy_ms", config.timeouts.remote_policy_ms, result);

    // Policy engine
    if (!is_http_url(config.policy.engine_url)) {
        result.add_error("policy.engine_url must be an http(s) URL");
    }
    if (config.policy.policy_path.empty() || config.policy.policy_path.front() == '/') {
        result.add_error("policy.policy_path must be a relative path such as "
                         "'dive/authorization'");
    }

    // Logging
    const auto& level = config.logging.level;
    if (level != "trace" && level != "debug" && level != "info" && level != "warning" &&
        level != "error" && level != "critical") {
        result.add_error("logging.level must be one of: trace, debug, info, warning, error, "
                         "critical");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("logging.format must be 'json' or 'text'");
    }

    // Cross-reference checks (trust edges, labels, scopes)
    result.merge(ConfigValidator::validate(config));

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(logging::get_logger(), "Configuration serialization failed: {}", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    return load_and_swap(config_path_);
}

bool ConfigManager::reload() {
    if (config_path_.empty()) {
        return false;
    }
    return load_and_swap(config_path_);
}

bool ConfigManager::load_and_swap(std::string_view path) {
    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    // RCU pattern: old config remains valid until all readers release their references
    auto new_config = std::make_shared<const Config>(std::move(*maybe_config));
    std::atomic_store(&current_config_, new_config);

    LOG_INFO(logging::get_logger(),
             "Configuration loaded: path={}, local_instance={}, instances={}, trusts={}",
             config_path_, new_config->local_instance, new_config->instances.size(),
             new_config->trusts.size());
    return true;
}

std::shared_ptr<const Config> ConfigManager::get() const noexcept {
    return std::atomic_load(&current_config_);
}

}  // namespace accord::control
