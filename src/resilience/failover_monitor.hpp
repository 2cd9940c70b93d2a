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

// Accord Failover Monitor - Header
// Background thread that drives time-based breaker transitions

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "breaker_registry.hpp"

namespace accord::resilience {

/// Ticks every breaker in the registry so an OPEN peer moves to HALF_OPEN
/// after its recovery timeout even when no request is routed to it.
class FailoverMonitor {
public:
    FailoverMonitor(std::shared_ptr<BreakerRegistry> registry,
                    std::chrono::milliseconds tick_interval);
    ~FailoverMonitor();

    // Non-copyable, non-movable (owns thread)
    FailoverMonitor(const FailoverMonitor&) = delete;
    FailoverMonitor& operator=(const FailoverMonitor&) = delete;
    FailoverMonitor(FailoverMonitor&&) = delete;
    FailoverMonitor& operator=(FailoverMonitor&&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t tick_count() const noexcept { return ticks_.load(); }

private:
    void tick_loop();

    std::shared_ptr<BreakerRegistry> registry_;
    std::chrono::milliseconds tick_interval_;

    std::unique_ptr<std::thread> tick_thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};

    // Wakes the loop early on stop()
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

}  // namespace accord::resilience
