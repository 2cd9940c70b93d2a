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

// Accord Circuit Breaker - Header
// Per-peer failover controller: stops calling an unhealthy instance and probes for recovery

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace accord::resilience {

/// Circuit breaker state
enum class CircuitState : uint8_t {
    CLOSED,     // Normal operation, calls allowed
    OPEN,       // Peer considered down, calls rejected
    HALF_OPEN   // Recovery probing, a percentage of calls allowed
};

/// Failover mode derived from circuit state (MAINTENANCE is only set explicitly)
enum class FailoverMode : uint8_t {
    NORMAL,       // Circuit closed
    DEGRADED,     // Circuit open or half-open, cached policy still valid
    OFFLINE,      // Outage longer than max_offline_time_ms
    MAINTENANCE   // Administratively disabled, never auto-exited
};

/// Result of asking the breaker for permission to call the peer
enum class Admission : uint8_t {
    ALLOWED,
    REJECTED_OPEN,         // Recovery window not elapsed
    REJECTED_HALF_OPEN,    // Lost the half-open admission draw
    REJECTED_MAINTENANCE
};

/// Circuit breaker configuration
struct CircuitBreakerConfig {
    /// Failures inside failure_window_ms that open the circuit
    uint32_t failure_threshold = 5;

    /// Consecutive HALF_OPEN successes that close the circuit
    uint32_t success_threshold = 3;

    /// Time in OPEN before the automatic move to HALF_OPEN
    uint32_t recovery_timeout_ms = 30000;

    /// Time allowed in HALF_OPEN before forcing back to OPEN
    uint32_t half_open_timeout_ms = 60000;

    /// Sliding window for failure counting
    uint32_t failure_window_ms = 60000;

    /// Percentage (0-100) of calls admitted while HALF_OPEN
    uint32_t half_open_request_percentage = 20;

    /// Outage length after which DEGRADED becomes OFFLINE, and the validity
    /// window of locally cached policy after the last successful contact
    uint64_t max_offline_time_ms = 24ULL * 60 * 60 * 1000;
};

using WallClock = std::chrono::system_clock;
using OptionalTime = std::optional<WallClock::time_point>;

/// Breaker bookkeeping, as seen from outside
struct CircuitSnapshot {
    CircuitState state = CircuitState::CLOSED;
    uint32_t failures = 0;             // Since last state change
    uint32_t successes = 0;            // Since last state change
    uint32_t recent_failures = 0;      // Inside the sliding window
    OptionalTime last_failure;
    OptionalTime last_success;
    OptionalTime last_state_change;
    OptionalTime opened_at;
    OptionalTime half_open_at;
};

/// Aggregate failover view of one peer
struct FailoverState {
    std::string peer;
    FailoverMode mode = FailoverMode::NORMAL;
    CircuitSnapshot circuit;
    OptionalTime offline_since;
    OptionalTime last_peer_contact;
    bool policy_cache_valid = false;
    OptionalTime policy_cache_expiry;
    std::string maintenance_reason;
    OptionalTime maintenance_started_at;
    uint32_t recovery_attempts = 0;
    OptionalTime last_recovery_attempt;
};

/// Outage and traffic counters
struct FailoverMetrics {
    uint64_t total_failures = 0;
    uint64_t total_successes = 0;
    uint64_t total_recoveries = 0;
    uint64_t total_circuit_opens = 0;
    uint64_t total_half_open_probes = 0;
    uint64_t rejected_requests = 0;
    double average_recovery_time_ms = 0.0;
    uint64_t longest_outage_ms = 0;
    uint64_t current_outage_ms = 0;
    double uptime_percentage = 100.0;
};

/// Outcome of an explicit health probe
struct ProbeResult {
    bool success = false;
    uint64_t latency_ms = 0;
    CircuitState state_after = CircuitState::CLOSED;
};

/// Notified on transitions. Subscribed at construction; callbacks run on the
/// thread that caused the transition, after the breaker lock is released.
class CircuitObserver {
public:
    virtual ~CircuitObserver() = default;

    virtual void on_state_change(std::string_view peer, CircuitState from, CircuitState to) = 0;

    virtual void on_mode_change(std::string_view /*peer*/, FailoverMode /*from*/,
                                FailoverMode /*to*/) {}

    virtual void on_recovered(std::string_view /*peer*/, uint64_t /*outage_ms*/,
                              uint32_t /*recovery_attempts*/) {}
};

/// Circuit breaker for one remote dependency
///
/// State machine:
///   CLOSED → OPEN (failure_threshold failures within failure_window_ms)
///   OPEN → HALF_OPEN (recovery_timeout_ms elapsed; timer driven via tick())
///   HALF_OPEN → CLOSED (success_threshold consecutive successes)
///   HALF_OPEN → OPEN (any failure, or half_open_timeout_ms elapsed)
///
/// Maintenance overrides every state and is left only via exit_maintenance().
///
/// Thread-safety: all methods may be called concurrently. Admission checks
/// never perform I/O.
class CircuitBreaker {
public:
    /// Returns a uniform draw in [0, 100)
    using RandomSource = std::function<double()>;

    CircuitBreaker(std::string peer, CircuitBreakerConfig config,
                   std::vector<std::shared_ptr<CircuitObserver>> observers = {},
                   RandomSource random = {});
    ~CircuitBreaker() = default;

    // Non-copyable, non-movable (owns mutex)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    /// Decide whether a call may proceed (counts rejections)
    [[nodiscard]] Admission try_acquire();

    [[nodiscard]] bool should_allow_request() { return try_acquire() == Admission::ALLOWED; }

    void record_success();

    /// Record failed call (transport error, timeout, 5xx)
    void record_failure(std::string_view reason = {});

    /// Apply time-based transitions (recovery and half-open timeout).
    /// Called periodically by the failover monitor and on every admission check.
    void tick();

    /// Manual override: open now (health checker, operator)
    void force_open(std::string_view reason);

    /// Manual override: close now and clear failure history
    void force_close();

    void enter_maintenance(std::string_view reason);
    void exit_maintenance();

    /// Run a health check and record its outcome
    ProbeResult execute_probe(const std::function<bool()>& probe);

    /// Forget all history and metrics (maintenance flag included)
    void reset();

    [[nodiscard]] CircuitState get_state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] FailoverMode get_mode() const noexcept {
        return mode_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool in_maintenance() const noexcept {
        return mode_.load(std::memory_order_acquire) == FailoverMode::MAINTENANCE;
    }

    [[nodiscard]] uint32_t recent_failure_count();

    [[nodiscard]] FailoverState snapshot() const;
    [[nodiscard]] FailoverMetrics metrics() const;

    /// Locally cached policy may still be trusted
    [[nodiscard]] bool policy_cache_valid() const;
    void set_policy_cache_expiry(WallClock::time_point expiry);

    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    using SteadyClock = std::chrono::steady_clock;

    /// Observer notifications collected under the lock, delivered after it
    struct Events {
        std::vector<std::pair<CircuitState, CircuitState>> transitions;
        std::vector<std::pair<FailoverMode, FailoverMode>> mode_changes;
        std::optional<std::pair<uint64_t, uint32_t>> recovered;
    };

    void open_locked(Events& events);
    void half_open_locked(Events& events);
    void close_locked(Events& events);
    void set_state_locked(CircuitState new_state, Events& events);
    void tick_locked(Events& events);
    void update_mode_locked(Events& events);
    void prune_failures_locked(SteadyClock::time_point now);
    [[nodiscard]] FailoverMode derive_mode_locked() const;
    void notify(const Events& events);

    std::string peer_;
    CircuitBreakerConfig config_;
    std::vector<std::shared_ptr<CircuitObserver>> observers_;
    RandomSource random_;

    mutable std::mutex mutex_;

    // Read without the lock for observability
    std::atomic<CircuitState> state_{CircuitState::CLOSED};
    std::atomic<FailoverMode> mode_{FailoverMode::NORMAL};

    // Guarded by mutex_
    std::deque<SteadyClock::time_point> failure_history_;
    uint32_t failures_ = 0;
    uint32_t successes_ = 0;
    SteadyClock::time_point state_entered_;
    bool maintenance_ = false;
    std::string maintenance_reason_;
    OptionalTime maintenance_started_at_;
    OptionalTime last_failure_;
    OptionalTime last_success_;
    OptionalTime last_state_change_;
    OptionalTime opened_at_;
    OptionalTime half_open_at_;
    OptionalTime offline_since_;
    std::optional<SteadyClock::time_point> offline_since_steady_;
    OptionalTime last_peer_contact_;
    OptionalTime policy_cache_expiry_;
    uint32_t recovery_attempts_ = 0;
    OptionalTime last_recovery_attempt_;

    // Metrics (guarded by mutex_)
    FailoverMetrics metrics_;
    uint64_t cumulative_outage_ms_ = 0;
    SteadyClock::time_point created_;
};

/// Convert circuit state to string for logging
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(FailoverMode mode) noexcept {
    switch (mode) {
        case FailoverMode::NORMAL:
            return "normal";
        case FailoverMode::DEGRADED:
            return "degraded";
        case FailoverMode::OFFLINE:
            return "offline";
        case FailoverMode::MAINTENANCE:
            return "maintenance";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(Admission admission) noexcept {
    switch (admission) {
        case Admission::ALLOWED:
            return "allowed";
        case Admission::REJECTED_OPEN:
            return "circuit_open";
        case Admission::REJECTED_HALF_OPEN:
            return "half_open_throttled";
        case Admission::REJECTED_MAINTENANCE:
            return "maintenance";
    }
    return "unknown";
}

}  // namespace accord::resilience
