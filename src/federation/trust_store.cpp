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

// Accord Trust Store - Implementation

#include "trust_store.hpp"

#include <algorithm>

#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace accord::federation {

// ============================================================================
// StaticTrustStore
// ============================================================================

StaticTrustStore::StaticTrustStore(TrustEdges edges)
    : edges_(std::make_shared<const TrustEdges>(std::move(edges))) {}

std::shared_ptr<const TrustEdges> StaticTrustStore::snapshot() const {
    return std::atomic_load(&edges_);
}

void StaticTrustStore::replace_all(TrustEdges edges) {
    auto fresh = std::make_shared<const TrustEdges>(std::move(edges));
    size_t count = fresh->size();
    std::atomic_store(&edges_, std::move(fresh));
    auto version = version_.fetch_add(1, std::memory_order_acq_rel) + 1;
    LOG_INFO(logging::get_logger(), "Trust matrix replaced: edges={}, version={}", count,
             version);
}

// ============================================================================
// TrustMatrix
// ============================================================================

TrustMatrix::TrustMatrix(std::shared_ptr<TrustStore> store, NowFn now)
    : store_(std::move(store)), now_(now ? std::move(now) : NowFn(&Clock::now)) {}

std::optional<BilateralTrust> TrustMatrix::verify_trust(std::string_view source,
                                                        std::string_view target) const {
    if (source.empty() || target.empty()) {
        return std::nullopt;
    }

    auto edges = store_->snapshot();
    if (!edges) {
        return std::nullopt;
    }

    const std::string source_key = core::to_upper(source);
    const std::string target_key = core::to_upper(target);
    const auto now = now_();

    // First matching edge decides; a disabled or expired edge is absent
    for (const auto& edge : *edges) {
        if (core::to_upper(edge.source_instance) == source_key &&
            core::to_upper(edge.target_instance) == target_key) {
            if (!usable(edge, now)) {
                return std::nullopt;
            }
            return edge;
        }
    }
    return std::nullopt;
}

std::vector<BilateralTrust> TrustMatrix::list_trusts_for(std::string_view instance) const {
    std::vector<BilateralTrust> result;
    auto edges = store_->snapshot();
    if (!edges) {
        return result;
    }

    const std::string key = core::to_upper(instance);
    const auto now = now_();
    for (const auto& edge : *edges) {
        if (core::to_upper(edge.source_instance) == key && usable(edge, now)) {
            result.push_back(edge);
        }
    }
    return result;
}

std::vector<std::string> filter_scopes_by_trust(const std::vector<std::string>& requested,
                                               const BilateralTrust& trust) {
    if (requested.empty()) {
        return trust.allowed_scopes;
    }

    std::vector<std::string> result;
    for (const auto& scope : requested) {
        if (std::find(trust.allowed_scopes.begin(), trust.allowed_scopes.end(), scope) !=
            trust.allowed_scopes.end()) {
            result.push_back(scope);
        }
    }
    return result;
}

}  // namespace accord::federation
