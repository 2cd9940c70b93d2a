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

// Configuration Validator - Trust Matrix Consistency & Typo Detection

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"

namespace accord::control {

/// Limits for operator-supplied names
constexpr size_t MAX_INSTANCE_ID_LENGTH = 32;
constexpr size_t MAX_SCOPE_LENGTH = 128;
constexpr size_t MAX_LEVENSHTEIN_DISTANCE = 2;
constexpr size_t MAX_FUZZY_MATCH_CANDIDATES = 3;

/// Cross-reference validation of the federation configuration
class ConfigValidator {
public:
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Empty string when valid, otherwise the reason
    [[nodiscard]] static std::string validate_instance_id(std::string_view id);
    [[nodiscard]] static std::string validate_scope(std::string_view scope);

private:
    /// Duplicate ids, trust level values, clearance mapping targets
    static void validate_instances(const Config& config, ValidationResult& result);

    /// Unknown endpoints, self edges, duplicates, ceilings, expiry
    static void validate_trusts(const Config& config, ValidationResult& result);

    /// Thresholds that must name a canonical classification
    static void validate_policy(const Config& config, ValidationResult& result);

    [[nodiscard]] static bool instance_exists(const Config& config, std::string_view id);

    [[nodiscard]] static std::vector<std::string> get_all_instance_ids(const Config& config);

    /// Similar instance ids for typos
    [[nodiscard]] static std::string suggest_similar_instance(const Config& config,
                                                              const std::string& typo);
};

}  // namespace accord::control
