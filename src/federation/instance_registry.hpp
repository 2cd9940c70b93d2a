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

// Accord Instance Registry - Header

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace accord::federation {

/// Immutable table of peer instances. Lookups are case-insensitive.
class InstanceRegistry {
public:
    explicit InstanceRegistry(std::vector<InstanceConfig> instances);

    /// Enabled instance by id; unknown and disabled ids both yield nullopt
    [[nodiscard]] std::optional<InstanceConfig> resolve(std::string_view instance_id) const;

    /// Known instance regardless of the enabled flag
    [[nodiscard]] bool contains(std::string_view instance_id) const;

    /// Enabled registered instance, or the unregistered local instance itself.
    /// Anything else takes part in no trust relationship.
    [[nodiscard]] bool is_available(std::string_view instance_id,
                                    std::string_view local_instance) const;

    [[nodiscard]] std::vector<InstanceConfig> enabled_instances() const;

    [[nodiscard]] size_t size() const noexcept { return instances_.size(); }

private:
    std::vector<InstanceConfig> instances_;
    std::unordered_map<std::string, size_t> index_;  // upper-case id -> position
};

}  // namespace accord::federation
