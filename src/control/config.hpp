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

// Accord Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace accord::control {

/// Exchange tokens minted by this instance
struct ExchangeTokenConfig {
    std::string issuer;                 // iss of minted tokens (defaults to local_instance)
    std::string prefix = "accord";      // First segment of the opaque token
    uint32_t ttl_seconds = 900;         // Capped at 15 minutes
    std::string signing_key_path;       // PEM private key (EC P-256); empty = ephemeral key
    std::string key_id = "exchange-1";  // kid published in the JWKS
};

/// Peer instance entry
struct InstanceEntry {
    std::string instance_id;  // Instance code, e.g. "GBR"
    std::string base_url;
    std::string introspection_url;
    std::string signing_keys_url;
    std::string trust_level = "medium";  // high, medium, low
    std::string country;
    bool enabled = true;
    bool introspection_only = false;  // Skip local signature verification

    // National clearance label -> canonical label
    std::map<std::string, std::string> clearance_mapping;
};

/// Directional trust edge (source -> target)
struct TrustEntry {
    std::string source;
    std::string target;
    std::string trust_level = "medium";
    std::string max_classification = "UNCLASSIFIED";
    std::vector<std::string> allowed_scopes;
    bool enabled = true;
    int64_t established_at = 0;         // Unix seconds
    std::optional<int64_t> expires_at;  // Unix seconds
};

/// Circuit breaker defaults shared by every peer
struct CircuitBreakerConfigSchema {
    uint32_t failure_threshold = 5;
    uint32_t success_threshold = 3;
    uint32_t recovery_timeout_ms = 30000;
    uint32_t half_open_timeout_ms = 60000;
    uint32_t failure_window_ms = 60000;
    uint32_t half_open_request_percentage = 20;
    uint64_t max_offline_time_ms = 86400000;
};

struct MonitorConfig {
    uint32_t tick_interval_ms = 1000;
};

struct CacheConfig {
    uint32_t introspection_ttl_ms = 30000;  // Never above 30000
    uint32_t jwks_ttl_ms = 3600000;
    uint32_t authz_ttl_ms = 60000;
    uint32_t capacity = 10000;  // Per cache
};

/// Outbound call timeouts (each 1-30000 ms)
struct TimeoutConfig {
    uint32_t introspection_ms = 10000;
    uint32_t jwks_ms = 5000;
    uint32_t local_policy_ms = 5000;
    uint32_t remote_policy_ms = 10000;
};

struct PolicyConfig {
    std::string engine_url = "http://localhost:8181";
    std::string policy_path = "dive/authorization";
    std::string enhanced_audit_threshold = "SECRET";
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";              // debug, info, warning, error
    std::string format = "json";             // json, text
    std::string output = "/var/log/accord";  // Log directory (accord.log appended)

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Accord configuration
struct Config {
    std::string local_instance;
    ExchangeTokenConfig exchange_token;
    std::vector<InstanceEntry> instances;
    std::vector<TrustEntry> trusts;

    CircuitBreakerConfigSchema circuit_breaker;
    MonitorConfig monitor;
    CacheConfig caches;
    TimeoutConfig timeouts;
    PolicyConfig policy;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
    std::optional<std::string> description;
};

// All config types use custom from_json/to_json (no macros - avoids conflicts)

inline void from_json(const nlohmann::json& j, ExchangeTokenConfig& e) {
    e.issuer = j.value("issuer", std::string());
    e.prefix = j.value("prefix", std::string("accord"));
    e.ttl_seconds = j.value("ttl_seconds", 900u);
    e.signing_key_path = j.value("signing_key_path", std::string());
    e.key_id = j.value("key_id", std::string("exchange-1"));
}

inline void from_json(const nlohmann::json& j, InstanceEntry& i) {
    i.instance_id = j.value("instance_id", std::string());
    i.base_url = j.value("base_url", std::string());
    i.introspection_url = j.value("introspection_url", std::string());
    i.signing_keys_url = j.value("signing_keys_url", std::string());
    i.trust_level = j.value("trust_level", std::string("medium"));
    i.country = j.value("country", std::string());
    i.enabled = j.value("enabled", true);
    i.introspection_only = j.value("introspection_only", false);
    i.clearance_mapping =
        j.value("clearance_mapping", std::map<std::string, std::string>());
}

inline void from_json(const nlohmann::json& j, TrustEntry& t) {
    t.source = j.value("source", std::string());
    t.target = j.value("target", std::string());
    t.trust_level = j.value("trust_level", std::string("medium"));
    t.max_classification = j.value("max_classification", std::string("UNCLASSIFIED"));
    t.allowed_scopes = j.value("allowed_scopes", std::vector<std::string>());
    t.enabled = j.value("enabled", true);
    t.established_at = j.value("established_at", int64_t(0));
    if (j.contains("expires_at") && !j.at("expires_at").is_null()) {
        t.expires_at = j.at("expires_at").get<int64_t>();
    }
}

inline void from_json(const nlohmann::json& j, CircuitBreakerConfigSchema& c) {
    c.failure_threshold = j.value("failure_threshold", 5u);
    c.success_threshold = j.value("success_threshold", 3u);
    c.recovery_timeout_ms = j.value("recovery_timeout_ms", 30000u);
    c.half_open_timeout_ms = j.value("half_open_timeout_ms", 60000u);
    c.failure_window_ms = j.value("failure_window_ms", 60000u);
    c.half_open_request_percentage = j.value("half_open_request_percentage", 20u);
    c.max_offline_time_ms = j.value("max_offline_time_ms", uint64_t(86400000));
}

inline void from_json(const nlohmann::json& j, MonitorConfig& m) {
    m.tick_interval_ms = j.value("tick_interval_ms", 1000u);
}

inline void from_json(const nlohmann::json& j, CacheConfig& c) {
    c.introspection_ttl_ms = j.value("introspection_ttl_ms", 30000u);
    c.jwks_ttl_ms = j.value("jwks_ttl_ms", 3600000u);
    c.authz_ttl_ms = j.value("authz_ttl_ms", 60000u);
    c.capacity = j.value("capacity", 10000u);
}

inline void from_json(const nlohmann::json& j, TimeoutConfig& t) {
    t.introspection_ms = j.value("introspection_ms", 10000u);
    t.jwks_ms = j.value("jwks_ms", 5000u);
    t.local_policy_ms = j.value("local_policy_ms", 5000u);
    t.remote_policy_ms = j.value("remote_policy_ms", 10000u);
}

inline void from_json(const nlohmann::json& j, PolicyConfig& p) {
    p.engine_url = j.value("engine_url", std::string("http://localhost:8181"));
    p.policy_path = j.value("policy_path", std::string("dive/authorization"));
    p.enhanced_audit_threshold = j.value("enhanced_audit_threshold", std::string("SECRET"));
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/accord"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    c.local_instance = j.value("local_instance", std::string());
    if (j.contains("exchange_token")) {
        j.at("exchange_token").get_to(c.exchange_token);
    }
    if (j.contains("instances")) {
        j.at("instances").get_to(c.instances);
    }
    if (j.contains("trusts")) {
        j.at("trusts").get_to(c.trusts);
    }
    if (j.contains("circuit_breaker")) {
        j.at("circuit_breaker").get_to(c.circuit_breaker);
    }
    if (j.contains("monitor")) {
        j.at("monitor").get_to(c.monitor);
    }
    if (j.contains("caches")) {
        j.at("caches").get_to(c.caches);
    }
    if (j.contains("timeouts")) {
        j.at("timeouts").get_to(c.timeouts);
    }
    if (j.contains("policy")) {
        j.at("policy").get_to(c.policy);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    if (j.contains("version")) {
        j.at("version").get_to(c.version);
    }
    if (j.contains("description") && !j.at("description").is_null()) {
        c.description = j.at("description").get<std::string>();
    }
}

// ============================================================================
// to_json functions for all config types
// ============================================================================

inline void to_json(nlohmann::json& j, const ExchangeTokenConfig& e) {
    j = nlohmann::json{{"issuer", e.issuer},
                       {"prefix", e.prefix},
                       {"ttl_seconds", e.ttl_seconds},
                       {"signing_key_path", e.signing_key_path},
                       {"key_id", e.key_id}};
}

inline void to_json(nlohmann::json& j, const InstanceEntry& i) {
    j = nlohmann::json{{"instance_id", i.instance_id},
                       {"base_url", i.base_url},
                       {"introspection_url", i.introspection_url},
                       {"signing_keys_url", i.signing_keys_url},
                       {"trust_level", i.trust_level},
                       {"country", i.country},
                       {"enabled", i.enabled},
                       {"introspection_only", i.introspection_only},
                       {"clearance_mapping", i.clearance_mapping}};
}

inline void to_json(nlohmann::json& j, const TrustEntry& t) {
    j = nlohmann::json{{"source", t.source},
                       {"target", t.target},
                       {"trust_level", t.trust_level},
                       {"max_classification", t.max_classification},
                       {"allowed_scopes", t.allowed_scopes},
                       {"enabled", t.enabled},
                       {"established_at", t.established_at}};
    if (t.expires_at) {
        j["expires_at"] = *t.expires_at;
    }
}

inline void to_json(nlohmann::json& j, const CircuitBreakerConfigSchema& c) {
    j = nlohmann::json{{"failure_threshold", c.failure_threshold},
                       {"success_threshold", c.success_threshold},
                       {"recovery_timeout_ms", c.recovery_timeout_ms},
                       {"half_open_timeout_ms", c.half_open_timeout_ms},
                       {"failure_window_ms", c.failure_window_ms},
                       {"half_open_request_percentage", c.half_open_request_percentage},
                       {"max_offline_time_ms", c.max_offline_time_ms}};
}

inline void to_json(nlohmann::json& j, const MonitorConfig& m) {
    j = nlohmann::json{{"tick_interval_ms", m.tick_interval_ms}};
}

inline void to_json(nlohmann::json& j, const CacheConfig& c) {
    j = nlohmann::json{{"introspection_ttl_ms", c.introspection_ttl_ms},
                       {"jwks_ttl_ms", c.jwks_ttl_ms},
                       {"authz_ttl_ms", c.authz_ttl_ms},
                       {"capacity", c.capacity}};
}

inline void to_json(nlohmann::json& j, const TimeoutConfig& t) {
    j = nlohmann::json{{"introspection_ms", t.introspection_ms},
                       {"jwks_ms", t.jwks_ms},
                       {"local_policy_ms", t.local_policy_ms},
                       {"remote_policy_ms", t.remote_policy_ms}};
}

inline void to_json(nlohmann::json& j, const PolicyConfig& p) {
    j = nlohmann::json{{"engine_url", p.engine_url},
                       {"policy_path", p.policy_path},
                       {"enhanced_audit_threshold", p.enhanced_audit_threshold}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["local_instance"] = c.local_instance;
    j["exchange_token"] = c.exchange_token;
    j["instances"] = c.instances;
    j["trusts"] = c.trusts;
    j["circuit_breaker"] = c.circuit_breaker;
    j["monitor"] = c.monitor;
    j["caches"] = c.caches;
    j["timeouts"] = c.timeouts;
    j["policy"] = c.policy;
    j["logging"] = c.logging;
    j["version"] = c.version;
    if (c.description) {
        j["description"] = *c.description;
    }
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    void merge(const ValidationResult& other) {
        for (const auto& e : other.errors) {
            add_error(e);
        }
        for (const auto& w : other.warnings) {
            add_warning(w);
        }
    }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Structural checks plus ConfigValidator cross-reference checks
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Configuration manager with hot-reload support (RCU pattern)
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load initial configuration
    [[nodiscard]] bool load(std::string_view path);

    /// Reload configuration (hot-reload with RCU)
    [[nodiscard]] bool reload();

    /// Get current configuration (thread-safe read)
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept;

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return get() != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    [[nodiscard]] bool load_and_swap(std::string_view path);

    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace accord::control
