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

// Config Validator - Implementation

#include "config_validator.hpp"

#include <cctype>
#include <chrono>
#include <set>
#include <sstream>
#include <utility>

#include "../core/string_utils.hpp"
#include "../federation/classification.hpp"

namespace accord::control {

namespace {

bool is_valid_trust_level(std::string_view level) {
    return level == "high" || level == "medium" || level == "low";
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

ValidationResult ConfigValidator::validate(const Config& config) {
    ValidationResult result;

    validate_instances(config, result);
    validate_trusts(config, result);
    validate_policy(config, result);

    return result;
}

std::string ConfigValidator::validate_instance_id(std::string_view id) {
    if (id.empty()) {
        return "Instance id cannot be empty";
    }
    if (id.length() > MAX_INSTANCE_ID_LENGTH) {
        std::ostringstream msg;
        msg << "Instance id too long (" << id.length() << " > " << MAX_INSTANCE_ID_LENGTH
            << " chars)";
        return msg.str();
    }

    // Character whitelist: [a-zA-Z0-9_-] only (ids end up in headers and log lines)
    for (size_t i = 0; i < id.length(); ++i) {
        char c = id[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            std::ostringstream msg;
            msg << "Invalid character '" << c << "' at position " << i
                << " (only alphanumeric, underscore, and hyphen allowed)";
            return msg.str();
        }
    }
    return "";
}

std::string ConfigValidator::validate_scope(std::string_view scope) {
    if (scope.empty()) {
        return "Scope cannot be empty";
    }
    if (scope.length() > MAX_SCOPE_LENGTH) {
        std::ostringstream msg;
        msg << "Scope too long (" << scope.length() << " > " << MAX_SCOPE_LENGTH << " chars)";
        return msg.str();
    }

    // Scopes travel space-separated in the exchange token, so whitespace is never allowed
    for (size_t i = 0; i < scope.length(); ++i) {
        char c = scope[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != ':' &&
            c != '.' && c != '/') {
            std::ostringstream msg;
            msg << "Invalid character '" << c << "' at position " << i
                << " (only alphanumeric and _ - : . / allowed)";
            return msg.str();
        }
    }
    return "";
}

void ConfigValidator::validate_instances(const Config& config, ValidationResult& result) {
    if (!config.local_instance.empty()) {
        std::string error = validate_instance_id(config.local_instance);
        if (!error.empty()) {
            result.add_error("Invalid local_instance '" + config.local_instance + "': " + error);
        }
    }

    std::set<std::string> seen;
    for (const auto& instance : config.instances) {
        if (instance.instance_id.empty()) {
            continue;  // Reported by ConfigLoader
        }

        std::string error = validate_instance_id(instance.instance_id);
        if (!error.empty()) {
            result.add_error("Invalid instance id '" + instance.instance_id + "': " + error);
            continue;
        }

        // Ids are matched case-insensitively at runtime
        if (!seen.insert(core::to_upper(instance.instance_id)).second) {
            result.add_error("Duplicate instance '" + instance.instance_id + "'");
        }

        if (!is_valid_trust_level(instance.trust_level)) {
            result.add_error("Instance '" + instance.instance_id + "': invalid trust_level '" +
                             instance.trust_level + "' (must be 'high', 'medium', or 'low')");
        }

        for (const auto& [national, canonical] : instance.clearance_mapping) {
            if (!federation::is_known_classification(canonical)) {
                result.add_error("Instance '" + instance.instance_id + "': clearance_mapping '" +
                                 national + "' maps to unknown classification '" + canonical +
                                 "'");
            }
        }
    }
}

void ConfigValidator::validate_trusts(const Config& config, ValidationResult& result) {
    std::set<std::pair<std::string, std::string>> edges;
    const int64_t now = unix_now();

    for (size_t i = 0; i < config.trusts.size(); ++i) {
        const auto& trust = config.trusts[i];
        std::ostringstream ctx;
        ctx << "Trust #" << i << " (" << trust.source << " -> " << trust.target << ")";
        const std::string context = ctx.str();

        bool endpoints_ok = true;
        for (const auto* endpoint : {&trust.source, &trust.target}) {
            if (endpoint->empty()) {
                result.add_error(context + ": source and target must be set");
                endpoints_ok = false;
                break;
            }
            if (!instance_exists(config, *endpoint)) {
                std::string suggestion = suggest_similar_instance(config, *endpoint);

                std::ostringstream msg;
                msg << context << ": Unknown instance '" << *endpoint << "'";
                if (!suggestion.empty()) {
                    msg << ". Did you mean: " << suggestion;
                }
                result.add_error(msg.str());
                endpoints_ok = false;
            }
        }

        if (endpoints_ok) {
            if (core::to_upper(trust.source) == core::to_upper(trust.target)) {
                result.add_error(context + ": an instance cannot hold a trust edge to itself");
            }
            auto key = std::make_pair(core::to_upper(trust.source), core::to_upper(trust.target));
            if (!edges.insert(key).second) {
                result.add_error(context + ": duplicate trust edge (only the first would apply)");
            }
        }

        if (!is_valid_trust_level(trust.trust_level)) {
            result.add_error(context + ": invalid trust_level '" + trust.trust_level + "'");
        }

        if (!federation::is_known_classification(trust.max_classification)) {
            result.add_error(context + ": unknown max_classification '" +
                             trust.max_classification + "'");
        }

        for (const auto& scope : trust.allowed_scopes) {
            std::string error = validate_scope(scope);
            if (!error.empty()) {
                result.add_error(context + ": invalid scope '" + scope + "': " + error);
            }
        }
        if (trust.allowed_scopes.empty()) {
            result.add_warning(context + ": no allowed_scopes, exchange tokens will carry none");
        }

        if (trust.expires_at) {
            if (*trust.expires_at <= trust.established_at) {
                result.add_error(context + ": expires_at must be after established_at");
            } else if (*trust.expires_at <= now) {
                result.add_warning(context + ": already expired, treated as absent");
            }
        }

        if (!trust.enabled) {
            result.add_warning(context + ": disabled");
        }
    }
}

void ConfigValidator::validate_policy(const Config& config, ValidationResult& result) {
    if (!federation::is_known_classification(config.policy.enhanced_audit_threshold)) {
        result.add_error("policy.enhanced_audit_threshold: unknown classification '" +
                         config.policy.enhanced_audit_threshold + "'");
    }
}

bool ConfigValidator::instance_exists(const Config& config, std::string_view id) {
    std::string upper = core::to_upper(id);
    if (core::to_upper(config.local_instance) == upper) {
        return true;
    }
    for (const auto& instance : config.instances) {
        if (core::to_upper(instance.instance_id) == upper) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ConfigValidator::get_all_instance_ids(const Config& config) {
    std::vector<std::string> ids;
    if (!config.local_instance.empty()) {
        ids.push_back(config.local_instance);
    }
    for (const auto& instance : config.instances) {
        ids.push_back(instance.instance_id);
    }
    return ids;
}

std::string ConfigValidator::suggest_similar_instance(const Config& config,
                                                      const std::string& typo) {
    // Don't fuzzy-match excessively long input
    if (typo.length() > MAX_INSTANCE_ID_LENGTH) {
        return "";
    }

    std::vector<std::string> similar =
        core::find_similar_strings(typo, get_all_instance_ids(config), MAX_LEVENSHTEIN_DISTANCE);

    if (similar.size() > MAX_FUZZY_MATCH_CANDIDATES) {
        similar.resize(MAX_FUZZY_MATCH_CANDIDATES);
    }

    return core::join(similar, ", ");
}

}  // namespace accord::control
