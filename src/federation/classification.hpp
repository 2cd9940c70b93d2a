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

// Accord Classification - Header
// Canonical classification hierarchy and national clearance vocabularies

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace accord::federation {

/// Canonical hierarchy, ordered by sensitivity
enum class Classification : uint8_t {
    UNCLASSIFIED = 0,
    RESTRICTED = 1,
    CONFIDENTIAL = 2,
    SECRET = 3,
    TOP_SECRET = 4
};

[[nodiscard]] constexpr std::string_view to_string(Classification c) noexcept {
    switch (c) {
        case Classification::UNCLASSIFIED:
            return "UNCLASSIFIED";
        case Classification::RESTRICTED:
            return "RESTRICTED";
        case Classification::CONFIDENTIAL:
            return "CONFIDENTIAL";
        case Classification::SECRET:
            return "SECRET";
        case Classification::TOP_SECRET:
            return "TOP_SECRET";
    }
    return "UNCLASSIFIED";
}

/// Canonical label lookup (case-insensitive)
[[nodiscard]] std::optional<Classification> parse_classification(std::string_view label);

[[nodiscard]] bool is_known_classification(std::string_view label);

/// Numeric level of a canonical label. Unknown labels rank as UNCLASSIFIED (0).
[[nodiscard]] int classification_level(std::string_view label);

/// National label -> canonical label
using ClearanceMapping = std::map<std::string, std::string>;

/// Exact match first, then upper-case match; unmapped labels pass through unchanged
[[nodiscard]] std::string translate_clearance(std::string_view clearance,
                                              const ClearanceMapping& mapping);

/// Canonical classification of a label after translation through the
/// owner's vocabulary; nullopt when it still names no canonical level
[[nodiscard]] std::optional<Classification> normalize_classification(
    std::string_view label, const ClearanceMapping& mapping);

/// Built-in vocabulary for a country code (FRA, DEU, GBR, USA), empty for others
[[nodiscard]] const ClearanceMapping& national_clearance_mapping(std::string_view country);

}  // namespace accord::federation
