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

// Accord Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include <algorithm>
#include <exception>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"

namespace accord::resilience {

namespace {

uint64_t elapsed_ms(std::chrono::steady_clock::time_point from,
                    std::chrono::steady_clock::time_point to) {
    if (to <= from) {
        return 0;
    }
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

}  // namespace

CircuitBreaker::CircuitBreaker(std::string peer, CircuitBreakerConfig config,
                               std::vector<std::shared_ptr<CircuitObserver>> observers,
                               RandomSource random)
    : peer_(std::move(peer)),
      config_(config),
      observers_(std::move(observers)),
      random_(random ? std::move(random) : RandomSource(&core::random_percent)),
      state_entered_(SteadyClock::now()),
      created_(SteadyClock::now()) {
    std::erase_if(observers_, [](const auto& observer) { return observer == nullptr; });
}

Admission CircuitBreaker::try_acquire() {
    Events events;
    Admission admission = Admission::ALLOWED;
    {
        std::lock_guard lock(mutex_);
        tick_locked(events);

        if (maintenance_) {
            admission = Admission::REJECTED_MAINTENANCE;
        } else {
            switch (state_.load(std::memory_order_relaxed)) {
                case CircuitState::CLOSED:
                    admission = Admission::ALLOWED;
                    break;

                case CircuitState::OPEN:
                    admission = Admission::REJECTED_OPEN;
                    break;

                case CircuitState::HALF_OPEN:
                    // Independent draw per call; a burst may admit zero or many probes
                    if (random_() < static_cast<double>(config_.half_open_request_percentage)) {
                        admission = Admission::ALLOWED;
                        metrics_.total_half_open_probes++;
                    } else {
                        admission = Admission::REJECTED_HALF_OPEN;
                    }
                    break;
            }
        }

        if (admission != Admission::ALLOWED) {
            metrics_.rejected_requests++;
        }
    }
    notify(events);
    return admission;
}

void CircuitBreaker::record_success() {
    Events events;
    {
        std::lock_guard lock(mutex_);
        auto wall_now = WallClock::now();
        last_success_ = wall_now;
        last_peer_contact_ = wall_now;
        successes_++;
        metrics_.total_successes++;

        policy_cache_expiry_ = wall_now + std::chrono::milliseconds(config_.max_offline_time_ms);

        auto state = state_.load(std::memory_order_relaxed);
        if (state == CircuitState::HALF_OPEN && successes_ >= config_.success_threshold) {
            close_locked(events);
        } else if (state == CircuitState::OPEN) {
            // A call admitted before the circuit opened may still complete
            LOG_WARNING(logging::get_logger(), "Success recorded while circuit open: peer={}",
                        peer_);
        }
        update_mode_locked(events);
    }
    notify(events);
}

void CircuitBreaker::record_failure(std::string_view reason) {
    Events events;
    {
        std::lock_guard lock(mutex_);
        auto now = SteadyClock::now();
        last_failure_ = WallClock::now();
        failures_++;
        metrics_.total_failures++;

        failure_history_.push_back(now);
        prune_failures_locked(now);

        auto state = state_.load(std::memory_order_relaxed);
        if (state == CircuitState::CLOSED) {
            if (failure_history_.size() >= config_.failure_threshold) {
                LOG_WARNING(logging::get_logger(),
                            "Circuit breaker failure threshold reached: peer={}, failures={}, "
                            "window_ms={}, reason={}",
                            peer_, failure_history_.size(), config_.failure_window_ms, reason);
                open_locked(events);
            }
        } else if (state == CircuitState::HALF_OPEN) {
            LOG_WARNING(logging::get_logger(), "Recovery probe failed: peer={}, reason={}", peer_,
                        reason);
            open_locked(events);
        }
    }
    notify(events);
}

void CircuitBreaker::tick() {
    Events events;
    {
        std::lock_guard lock(mutex_);
        tick_locked(events);
    }
    notify(events);
}

void CircuitBreaker::force_open(std::string_view reason) {
    Events events;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) != CircuitState::OPEN) {
            LOG_WARNING(logging::get_logger(), "Circuit breaker forced open: peer={}, reason={}",
                        peer_, reason);
            open_locked(events);
        }
    }
    notify(events);
}

void CircuitBreaker::force_close() {
    Events events;
    {
        std::lock_guard lock(mutex_);
        if (state_.load(std::memory_order_relaxed) != CircuitState::CLOSED) {
            LOG_INFO(logging::get_logger(), "Circuit breaker forced closed: peer={}", peer_);
            close_locked(events);
        } else {
            failure_history_.clear();
            failures_ = 0;
        }
    }
    notify(events);
}

void CircuitBreaker::enter_maintenance(std::string_view reason) {
    Events events;
    {
        std::lock_guard lock(mutex_);
        maintenance_ = true;
        maintenance_reason_ = std::string(reason);
        maintenance_started_at_ = WallClock::now();
        LOG_INFO(logging::get_logger(), "Entering maintenance mode: peer={}, reason={}", peer_,
                 reason);
        update_mode_locked(events);
    }
    notify(events);
}

void CircuitBreaker::exit_maintenance() {
    Events events;
    {
        std::lock_guard lock(mutex_);
        if (!maintenance_) {
            return;
        }
        uint64_t duration_ms = 0;
        if (maintenance_started_at_) {
            duration_ms = static_cast<uint64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(WallClock::now() -
                                                                      *maintenance_started_at_)
                    .count());
        }
        maintenance_ = false;
        maintenance_reason_.clear();
        maintenance_started_at_.reset();
        LOG_INFO(logging::get_logger(), "Exiting maintenance mode: peer={}, duration_ms={}", peer_,
                 duration_ms);

        // Mode falls back to whatever the circuit state implies
        update_mode_locked(events);
    }
    notify(events);
}

ProbeResult CircuitBreaker::execute_probe(const std::function<bool()>& probe) {
    ProbeResult result;
    auto start = SteadyClock::now();

    std::string failure_reason = "probe reported unhealthy";
    try {
        result.success = probe();
    } catch (const std::exception& e) {
        result.success = false;
        failure_reason = e.what();
    }
    result.latency_ms = elapsed_ms(start, SteadyClock::now());

    if (state_.load(std::memory_order_acquire) == CircuitState::HALF_OPEN) {
        std::lock_guard lock(mutex_);
        metrics_.total_half_open_probes++;
    }

    if (result.success) {
        record_success();
    } else {
        LOG_WARNING(logging::get_logger(), "Health probe failed: peer={}, latency_ms={}, error={}",
                    peer_, result.latency_ms, failure_reason);
        record_failure(failure_reason);
    }

    result.state_after = get_state();
    return result;
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    auto now = SteadyClock::now();
    state_.store(CircuitState::CLOSED, std::memory_order_release);
    mode_.store(FailoverMode::NORMAL, std::memory_order_release);
    failure_history_.clear();
    failures_ = 0;
    successes_ = 0;
    state_entered_ = now;
    maintenance_ = false;
    maintenance_reason_.clear();
    maintenance_started_at_.reset();
    last_failure_.reset();
    last_success_.reset();
    last_state_change_.reset();
    opened_at_.reset();
    half_open_at_.reset();
    offline_since_.reset();
    offline_since_steady_.reset();
    last_peer_contact_.reset();
    policy_cache_expiry_.reset();
    recovery_attempts_ = 0;
    last_recovery_attempt_.reset();
    metrics_ = FailoverMetrics{};
    cumulative_outage_ms_ = 0;
    created_ = now;
}

uint32_t CircuitBreaker::recent_failure_count() {
    std::lock_guard lock(mutex_);
    prune_failures_locked(SteadyClock::now());
    return static_cast<uint32_t>(failure_history_.size());
}

FailoverState CircuitBreaker::snapshot() const {
    std::lock_guard lock(mutex_);
    auto now = SteadyClock::now();
    auto cutoff = now - std::chrono::milliseconds(config_.failure_window_ms);

    FailoverState s;
    s.peer = peer_;
    s.mode = mode_.load(std::memory_order_relaxed);
    s.circuit.state = state_.load(std::memory_order_relaxed);
    s.circuit.failures = failures_;
    s.circuit.successes = successes_;
    s.circuit.recent_failures = static_cast<uint32_t>(
        std::count_if(failure_history_.begin(), failure_history_.end(),
                      [&](const auto& ts) { return ts > cutoff; }));
    s.circuit.last_failure = last_failure_;
    s.circuit.last_success = last_success_;
    s.circuit.last_state_change = last_state_change_;
    s.circuit.opened_at = opened_at_;
    s.circuit.half_open_at = half_open_at_;
    s.offline_since = offline_since_;
    s.last_peer_contact = last_peer_contact_;
    s.policy_cache_expiry = policy_cache_expiry_;
    s.policy_cache_valid = policy_cache_expiry_ && *policy_cache_expiry_ > WallClock::now();
    s.maintenance_reason = maintenance_reason_;
    s.maintenance_started_at = maintenance_started_at_;
    s.recovery_attempts = recovery_attempts_;
    s.last_recovery_attempt = last_recovery_attempt_;
    return s;
}

FailoverMetrics CircuitBreaker::metrics() const {
    std::lock_guard lock(mutex_);
    auto now = SteadyClock::now();

    FailoverMetrics m = metrics_;
    m.current_outage_ms = offline_since_steady_ ? elapsed_ms(*offline_since_steady_, now) : 0;

    uint64_t total_ms = elapsed_ms(created_, now);
    if (total_ms > 0) {
        double outage = static_cast<double>(cumulative_outage_ms_ + m.current_outage_ms);
        double total = static_cast<double>(total_ms);
        m.uptime_percentage = std::clamp((total - outage) / total * 100.0, 0.0, 100.0);
    } else {
        m.uptime_percentage = 100.0;
    }
    return m;
}

bool CircuitBreaker::policy_cache_valid() const {
    std::lock_guard lock(mutex_);
    return policy_cache_expiry_ && *policy_cache_expiry_ > WallClock::now();
}

void CircuitBreaker::set_policy_cache_expiry(WallClock::time_point expiry) {
    std::lock_guard lock(mutex_);
    policy_cache_expiry_ = expiry;
}

// ============================================================================
// Transitions (mutex_ held)
// ============================================================================

void CircuitBreaker::open_locked(Events& events) {
    auto now = SteadyClock::now();
    auto wall_now = WallClock::now();

    set_state_locked(CircuitState::OPEN, events);
    // Re-entering OPEN from HALF_OPEN restarts the recovery timer
    state_entered_ = now;
    opened_at_ = wall_now;
    successes_ = 0;
    metrics_.total_circuit_opens++;

    if (!offline_since_) {
        offline_since_ = wall_now;
        offline_since_steady_ = now;
    }
    update_mode_locked(events);
}

void CircuitBreaker::half_open_locked(Events& events) {
    if (state_.load(std::memory_order_relaxed) != CircuitState::OPEN) {
        return;
    }
    set_state_locked(CircuitState::HALF_OPEN, events);
    half_open_at_ = WallClock::now();
    successes_ = 0;
    failures_ = 0;
    recovery_attempts_++;
    last_recovery_attempt_ = half_open_at_;
    update_mode_locked(events);
}

void CircuitBreaker::close_locked(Events& events) {
    auto now = SteadyClock::now();
    uint64_t outage_ms = offline_since_steady_ ? elapsed_ms(*offline_since_steady_, now) : 0;

    set_state_locked(CircuitState::CLOSED, events);
    failures_ = 0;
    successes_ = 0;
    failure_history_.clear();
    opened_at_.reset();
    half_open_at_.reset();

    if (offline_since_) {
        metrics_.total_recoveries++;
        metrics_.longest_outage_ms = std::max(metrics_.longest_outage_ms, outage_ms);
        auto n = static_cast<double>(metrics_.total_recoveries);
        metrics_.average_recovery_time_ms =
            (metrics_.average_recovery_time_ms * (n - 1) + static_cast<double>(outage_ms)) / n;
        cumulative_outage_ms_ += outage_ms;
        events.recovered = std::make_pair(outage_ms, recovery_attempts_);
        LOG_INFO(logging::get_logger(),
                 "Peer recovered: peer={}, outage_ms={}, recovery_attempts={}", peer_, outage_ms,
                 recovery_attempts_);
    }
    offline_since_.reset();
    offline_since_steady_.reset();
    update_mode_locked(events);
}

void CircuitBreaker::set_state_locked(CircuitState new_state, Events& events) {
    auto old_state = state_.exchange(new_state, std::memory_order_acq_rel);
    if (old_state == new_state) {
        return;
    }
    state_entered_ = SteadyClock::now();
    last_state_change_ = WallClock::now();
    events.transitions.emplace_back(old_state, new_state);
    LOG_INFO(logging::get_logger(), "Circuit breaker {} -> {}: peer={}", to_string(old_state),
             to_string(new_state), peer_);
}

void CircuitBreaker::tick_locked(Events& events) {
    auto now = SteadyClock::now();
    auto state = state_.load(std::memory_order_relaxed);
    auto in_state_ms = elapsed_ms(state_entered_, now);

    if (state == CircuitState::OPEN && in_state_ms >= config_.recovery_timeout_ms) {
        half_open_locked(events);
    } else if (state == CircuitState::HALF_OPEN && in_state_ms >= config_.half_open_timeout_ms) {
        LOG_WARNING(logging::get_logger(),
                    "Half-open timeout expired, reopening circuit: peer={}, elapsed_ms={}", peer_,
                    in_state_ms);
        open_locked(events);
    }

    // DEGRADED becomes OFFLINE purely with the passage of time
    update_mode_locked(events);
}

FailoverMode CircuitBreaker::derive_mode_locked() const {
    if (maintenance_) {
        return FailoverMode::MAINTENANCE;
    }
    if (state_.load(std::memory_order_relaxed) == CircuitState::CLOSED) {
        return FailoverMode::NORMAL;
    }
    if (offline_since_steady_ &&
        elapsed_ms(*offline_since_steady_, SteadyClock::now()) >= config_.max_offline_time_ms) {
        return FailoverMode::OFFLINE;
    }
    return FailoverMode::DEGRADED;
}

void CircuitBreaker::update_mode_locked(Events& events) {
    auto new_mode = derive_mode_locked();
    auto old_mode = mode_.exchange(new_mode, std::memory_order_acq_rel);
    if (old_mode != new_mode) {
        events.mode_changes.emplace_back(old_mode, new_mode);
        LOG_INFO(logging::get_logger(), "Failover mode changed: peer={}, from={}, to={}", peer_,
                 to_string(old_mode), to_string(new_mode));
    }
}

void CircuitBreaker::prune_failures_locked(SteadyClock::time_point now) {
    auto cutoff = now - std::chrono::milliseconds(config_.failure_window_ms);
    while (!failure_history_.empty() && failure_history_.front() <= cutoff) {
        failure_history_.pop_front();
    }
}

void CircuitBreaker::notify(const Events& events) {
    for (const auto& observer : observers_) {
        for (const auto& [from, to] : events.transitions) {
            observer->on_state_change(peer_, from, to);
        }
        for (const auto& [from, to] : events.mode_changes) {
            observer->on_mode_change(peer_, from, to);
        }
        if (events.recovered) {
            observer->on_recovered(peer_, events.recovered->first, events.recovered->second);
        }
    }
}

}  // namespace accord::resilience
