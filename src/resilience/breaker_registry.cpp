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

// Accord Breaker Registry - Implementation

#include "breaker_registry.hpp"

#include <algorithm>

namespace accord::resilience {

BreakerRegistry::BreakerRegistry(CircuitBreakerConfig config,
                                 std::vector<std::shared_ptr<CircuitObserver>> observers,
                                 CircuitBreaker::RandomSource random)
    : config_(config), observers_(std::move(observers)), random_(std::move(random)) {}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get(std::string_view peer) {
    std::lock_guard lock(mutex_);
    std::string key(peer);
    auto it = breakers_.find(key);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(key, config_, observers_, random_);
    breakers_.emplace(std::move(key), breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::find(std::string_view peer) const {
    std::lock_guard lock(mutex_);
    auto it = breakers_.find(std::string(peer));
    return it != breakers_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<CircuitBreaker>> BreakerRegistry::all() const {
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(breakers_.size());
        for (const auto& [peer, breaker] : breakers_) {
            result.push_back(breaker);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a->peer() < b->peer(); });
    return result;
}

void BreakerRegistry::enter_maintenance(std::string_view peer, std::string_view reason) {
    get(peer)->enter_maintenance(reason);
}

void BreakerRegistry::exit_maintenance(std::string_view peer) {
    if (auto breaker = find(peer)) {
        breaker->exit_maintenance();
    }
}

// Breakers are copied out first so transitions (and observer callbacks) run
// without the registry lock
void BreakerRegistry::enter_maintenance_all(std::string_view reason) {
    for (const auto& breaker : all()) {
        breaker->enter_maintenance(reason);
    }
}

void BreakerRegistry::exit_maintenance_all() {
    for (const auto& breaker : all()) {
        breaker->exit_maintenance();
    }
}

void BreakerRegistry::tick_all() {
    for (const auto& breaker : all()) {
        breaker->tick();
    }
}

void BreakerRegistry::reset_all() {
    for (const auto& breaker : all()) {
        breaker->reset();
    }
}

std::vector<FailoverState> BreakerRegistry::snapshots() const {
    std::vector<FailoverState> result;
    for (const auto& breaker : all()) {
        result.push_back(breaker->snapshot());
    }
    return result;
}

size_t BreakerRegistry::size() const {
    std::lock_guard lock(mutex_);
    return breakers_.size();
}

}  // namespace accord::resilience
