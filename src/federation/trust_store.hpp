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

// Accord Trust Store - Header
// Bilateral trust edges and the directional lookup over them

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace accord::federation {

using TrustEdges = std::vector<BilateralTrust>;

/// Source of trust edges. Implementations return immutable snapshots so a
/// refresh never disturbs a lookup in progress.
class TrustStore {
public:
    virtual ~TrustStore() = default;

    [[nodiscard]] virtual std::shared_ptr<const TrustEdges> snapshot() const = 0;
};

/// Edges held in memory, initially from configuration
class StaticTrustStore final : public TrustStore {
public:
    explicit StaticTrustStore(TrustEdges edges);

    [[nodiscard]] std::shared_ptr<const TrustEdges> snapshot() const override;

    /// Swap in a new edge set (RCU)
    void replace_all(TrustEdges edges);

    [[nodiscard]] uint64_t version() const noexcept {
        return version_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<const TrustEdges> edges_;
    std::atomic<uint64_t> version_{1};
};

/// Directional trust lookup with enablement and expiry applied
class TrustMatrix {
public:
    using NowFn = std::function<Clock::time_point()>;

    explicit TrustMatrix(std::shared_ptr<TrustStore> store, NowFn now = {});

    /// Edge source -> target when present, enabled and unexpired
    [[nodiscard]] std::optional<BilateralTrust> verify_trust(std::string_view source,
                                                             std::string_view target) const;

    [[nodiscard]] bool has_trust(std::string_view source, std::string_view target) const {
        return verify_trust(source, target).has_value();
    }

    /// Usable edges whose source is instance
    [[nodiscard]] std::vector<BilateralTrust> list_trusts_for(std::string_view instance) const;

    [[nodiscard]] const std::shared_ptr<TrustStore>& store() const noexcept { return store_; }

private:
    [[nodiscard]] bool usable(const BilateralTrust& edge, Clock::time_point now) const noexcept {
        return edge.enabled && !edge.expired(now);
    }

    std::shared_ptr<TrustStore> store_;
    NowFn now_;
};

/// Requested scopes the edge permits, in request order. An empty request
/// yields every scope of the edge.
[[nodiscard]] std::vector<std::string> filter_scopes_by_trust(
    const std::vector<std::string>& requested, const BilateralTrust& trust);

}  // namespace accord::federation
