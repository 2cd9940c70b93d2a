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

// Accord Failover Monitor - Implementation

#include "failover_monitor.hpp"

#include "../core/logging.hpp"

namespace accord::resilience {

FailoverMonitor::FailoverMonitor(std::shared_ptr<BreakerRegistry> registry,
                                 std::chrono::milliseconds tick_interval)
    : registry_(std::move(registry)), tick_interval_(tick_interval) {
    if (tick_interval_.count() <= 0) {
        tick_interval_ = std::chrono::milliseconds(1000);
    }
}

FailoverMonitor::~FailoverMonitor() {
    stop();
}

void FailoverMonitor::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }

    LOG_INFO(logging::get_logger(), "Failover monitor started: tick_interval_ms={}",
             tick_interval_.count());
    tick_thread_ = std::make_unique<std::thread>(&FailoverMonitor::tick_loop, this);
}

void FailoverMonitor::stop() {
    {
        std::lock_guard lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;  // Not running
        }
    }
    wait_cv_.notify_all();

    if (tick_thread_ && tick_thread_->joinable()) {
        tick_thread_->join();
    }
    tick_thread_.reset();
    LOG_INFO(logging::get_logger(), "Failover monitor stopped: ticks={}", ticks_.load());
}

void FailoverMonitor::tick_loop() {
    while (running_) {
        {
            std::unique_lock lock(wait_mutex_);
            wait_cv_.wait_for(lock, tick_interval_, [this] { return !running_.load(); });
        }

        if (!running_)
            break;

        registry_->tick_all();
        ticks_.fetch_add(1, std::memory_order_relaxed);
    }
}

}  // namespace accord::resilience
