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

// Accord Breaker Registry - Header
// One circuit breaker per peer instance, created on first use

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "circuit_breaker.hpp"

namespace accord::resilience {

class BreakerRegistry {
public:
    BreakerRegistry(CircuitBreakerConfig config,
                    std::vector<std::shared_ptr<CircuitObserver>> observers = {},
                    CircuitBreaker::RandomSource random = {});
    ~BreakerRegistry() = default;

    // Non-copyable, non-movable
    BreakerRegistry(const BreakerRegistry&) = delete;
    BreakerRegistry& operator=(const BreakerRegistry&) = delete;
    BreakerRegistry(BreakerRegistry&&) = delete;
    BreakerRegistry& operator=(BreakerRegistry&&) = delete;

    /// Breaker for peer, created with the shared config on first request
    [[nodiscard]] std::shared_ptr<CircuitBreaker> get(std::string_view peer);

    /// Existing breaker only (nullptr if the peer was never called)
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(std::string_view peer) const;

    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> all() const;

    void enter_maintenance(std::string_view peer, std::string_view reason);
    void exit_maintenance(std::string_view peer);

    /// Apply to every breaker known now
    void enter_maintenance_all(std::string_view reason);
    void exit_maintenance_all();

    void tick_all();
    void reset_all();

    [[nodiscard]] std::vector<FailoverState> snapshots() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    CircuitBreakerConfig config_;
    std::vector<std::shared_ptr<CircuitObserver>> observers_;
    CircuitBreaker::RandomSource random_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace accord::resilience
