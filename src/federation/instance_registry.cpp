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

// Accord Instance Registry - Implementation

#include "instance_registry.hpp"

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace accord::federation {

InstanceRegistry::InstanceRegistry(std::vector<InstanceConfig> instances)
    : instances_(std::move(instances)) {
    for (size_t i = 0; i < instances_.size(); ++i) {
        auto& instance = instances_[i];

        // Fall back to the built-in national vocabulary
        if (instance.clearance_mapping.empty()) {
            instance.clearance_mapping = national_clearance_mapping(instance.country);
        }

        auto [it, inserted] = index_.emplace(core::to_upper(instance.instance_id), i);
        if (!inserted) {
            LOG_WARNING(logging::get_logger(),
                        "Duplicate instance ignored: instance_id={}", instance.instance_id);
        }
    }
}

std::optional<InstanceConfig> InstanceRegistry::resolve(std::string_view instance_id) const {
    auto it = index_.find(core::to_upper(instance_id));
    if (it == index_.end()) {
        return std::nullopt;
    }
    const auto& instance = instances_[it->second];
    if (!instance.enabled) {
        return std::nullopt;
    }
    return instance;
}

bool InstanceRegistry::contains(std::string_view instance_id) const {
    return index_.contains(core::to_upper(instance_id));
}

bool InstanceRegistry::is_available(std::string_view instance_id,
                                    std::string_view local_instance) const {
    if (instance_id.empty()) {
        return false;
    }
    if (contains(instance_id)) {
        return resolve(instance_id).has_value();
    }
    return core::to_upper(instance_id) == core::to_upper(local_instance);
}

std::vector<InstanceConfig> InstanceRegistry::enabled_instances() const {
    std::vector<InstanceConfig> result;
    for (const auto& instance : instances_) {
        if (instance.enabled) {
            result.push_back(instance);
        }
    }
    return result;
}

}  // namespace accord::federation
