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

// Accord Classification - Implementation

#include "classification.hpp"

#include <array>
#include <utility>

#include "../core/string_utils.hpp"

namespace accord::federation {

namespace {

constexpr std::array<std::pair<std::string_view, Classification>, 5> kHierarchy = {{
    {"UNCLASSIFIED", Classification::UNCLASSIFIED},
    {"RESTRICTED", Classification::RESTRICTED},
    {"CONFIDENTIAL", Classification::CONFIDENTIAL},
    {"SECRET", Classification::SECRET},
    {"TOP_SECRET", Classification::TOP_SECRET},
}};

const ClearanceMapping kEmptyMapping;

const ClearanceMapping kUsaMapping = {
    {"TOP_SECRET", "TOP_SECRET"},
    {"SECRET", "SECRET"},
    {"CONFIDENTIAL", "CONFIDENTIAL"},
    {"UNCLASSIFIED", "UNCLASSIFIED"},
};

const ClearanceMapping kFraMapping = {
    {"TRES_SECRET_DEFENSE", "TOP_SECRET"},
    {"SECRET_DEFENSE", "SECRET"},
    {"CONFIDENTIEL_DEFENSE", "CONFIDENTIAL"},
    {"DIFFUSION_RESTREINTE", "CONFIDENTIAL"},
    {"NON_PROTEGE", "UNCLASSIFIED"},
    {"TOP_SECRET", "TOP_SECRET"},
    {"SECRET", "SECRET"},
    {"CONFIDENTIAL", "CONFIDENTIAL"},
    {"UNCLASSIFIED", "UNCLASSIFIED"},
};

const ClearanceMapping kGbrMapping = {
    {"TOP_SECRET", "TOP_SECRET"},
    {"SECRET", "SECRET"},
    {"OFFICIAL_SENSITIVE", "CONFIDENTIAL"},
    {"OFFICIAL", "UNCLASSIFIED"},
};

const ClearanceMapping kDeuMapping = {
    {"STRENG_GEHEIM", "TOP_SECRET"},
    {"GEHEIM", "SECRET"},
    {"VS_VERTRAULICH", "CONFIDENTIAL"},
    {"VS_NUR_FUER_DEN_DIENSTGEBRAUCH", "CONFIDENTIAL"},
    {"OFFEN", "UNCLASSIFIED"},
    {"TOP_SECRET", "TOP_SECRET"},
    {"SECRET", "SECRET"},
    {"CONFIDENTIAL", "CONFIDENTIAL"},
    {"UNCLASSIFIED", "UNCLASSIFIED"},
};

}  // namespace

std::optional<Classification> parse_classification(std::string_view label) {
    std::string upper = core::to_upper(label);
    for (const auto& [name, value] : kHierarchy) {
        if (upper == name) {
            return value;
        }
    }
    return std::nullopt;
}

bool is_known_classification(std::string_view label) {
    return parse_classification(label).has_value();
}

int classification_level(std::string_view label) {
    auto parsed = parse_classification(label);
    return parsed ? static_cast<int>(*parsed) : 0;
}

std::string translate_clearance(std::string_view clearance, const ClearanceMapping& mapping) {
    auto it = mapping.find(std::string(clearance));
    if (it != mapping.end()) {
        return it->second;
    }

    it = mapping.find(core::to_upper(clearance));
    if (it != mapping.end()) {
        return it->second;
    }

    return std::string(clearance);
}

std::optional<Classification> normalize_classification(std::string_view label,
                                                       const ClearanceMapping& mapping) {
    return parse_classification(translate_clearance(label, mapping));
}

const ClearanceMapping& national_clearance_mapping(std::string_view country) {
    std::string code = core::to_upper(country);
    if (code == "USA") {
        return kUsaMapping;
    }
    if (code == "FRA") {
        return kFraMapping;
    }
    if (code == "GBR") {
        return kGbrMapping;
    }
    if (code == "DEU") {
        return kDeuMapping;
    }
    return kEmptyMapping;
}

}  // namespace accord::federation
