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

// Unit tests for the per-peer circuit breaker and the breaker registry

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include <thread>

#include "mocks.hpp"
#include "resilience/breaker_registry.hpp"
#include "resilience/circuit_breaker.hpp"

using namespace accord::resilience;
using accord::testing::RecordingObserver;

namespace {

// Draws that always win / always lose the half-open admission
CircuitBreaker::RandomSource always_admit() {
    return [] { return 0.0; };
}

CircuitBreaker::RandomSource never_admit() {
    return [] { return 99.9; };
}

void fail_times(CircuitBreaker& breaker, int n) {
    for (int i = 0; i < n; ++i) {
        breaker.record_failure("test");
    }
}

}  // namespace

TEST_CASE("CircuitBreaker - Basic construction", "[circuit_breaker]") {
    CircuitBreaker breaker("GBR", CircuitBreakerConfig{});

    REQUIRE(breaker.peer() == "GBR");
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.get_mode() == FailoverMode::NORMAL);

    auto metrics = breaker.metrics();
    REQUIRE(metrics.total_failures == 0);
    REQUIRE(metrics.total_successes == 0);
    REQUIRE(metrics.rejected_requests == 0);
    REQUIRE(metrics.uptime_percentage == 100.0);
}

TEST_CASE("CircuitBreaker - to_string conversion", "[circuit_breaker]") {
    REQUIRE(to_string(CircuitState::CLOSED) == "CLOSED");
    REQUIRE(to_string(CircuitState::OPEN) == "OPEN");
    REQUIRE(to_string(CircuitState::HALF_OPEN) == "HALF_OPEN");

    REQUIRE(to_string(FailoverMode::DEGRADED) == "degraded");
    REQUIRE(to_string(FailoverMode::MAINTENANCE) == "maintenance");
    REQUIRE(to_string(Admission::REJECTED_OPEN) == "circuit_open");
}

TEST_CASE("CircuitBreaker - Allows requests in CLOSED state", "[circuit_breaker]") {
    CircuitBreaker breaker("GBR", CircuitBreakerConfig{});

    REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
    REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
    REQUIRE(breaker.should_allow_request());
}

TEST_CASE("CircuitBreaker - Opens circuit after failure threshold", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 5;
    config.failure_window_ms = 10000;

    CircuitBreaker breaker("GBR", config);

    for (int i = 0; i < 4; ++i) {
        breaker.record_failure("timeout");
        REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    }

    // 5th failure inside the window
    breaker.record_failure("timeout");
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE(breaker.get_mode() == FailoverMode::DEGRADED);
    REQUIRE(breaker.metrics().total_failures == 5);
    REQUIRE(breaker.metrics().total_circuit_opens == 1);
}

TEST_CASE("CircuitBreaker - Rejects requests in OPEN state", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.recovery_timeout_ms = 60000;  // Won't expire during test

    CircuitBreaker breaker("GBR", config);
    fail_times(breaker, 3);

    REQUIRE(breaker.try_acquire() == Admission::REJECTED_OPEN);
    REQUIRE(breaker.try_acquire() == Admission::REJECTED_OPEN);
    REQUIRE(breaker.metrics().rejected_requests == 2);
}

TEST_CASE("CircuitBreaker - Sliding window drops old failures", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.failure_window_ms = 100;

    CircuitBreaker breaker("GBR", config);
    fail_times(breaker, 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));

    // Earlier failures left the window
    breaker.record_failure("late");
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.recent_failure_count() == 1);
}

TEST_CASE("CircuitBreaker - Transitions to HALF_OPEN after recovery timeout",
          "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 2;
    config.recovery_timeout_ms = 50;

    CircuitBreaker breaker("GBR", config, {}, always_admit());
    fail_times(breaker, 2);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    SECTION("tick moves the circuit without any request") {
        breaker.tick();
        REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
        REQUIRE(breaker.snapshot().recovery_attempts == 1);
    }

    SECTION("admission check applies the transition first") {
        REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
        REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
        REQUIRE(breaker.metrics().total_half_open_probes == 1);
    }
}

TEST_CASE("CircuitBreaker - HALF_OPEN admits a percentage of calls", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.recovery_timeout_ms = 10;
    config.half_open_request_percentage = 20;

    SECTION("draw above the percentage is rejected") {
        CircuitBreaker breaker("GBR", config, {}, never_admit());
        breaker.record_failure("down");
        std::this_thread::sleep_for(std::chrono::milliseconds(30));

        REQUIRE(breaker.try_acquire() == Admission::REJECTED_HALF_OPEN);
        REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);
    }

    SECTION("draw below the percentage is admitted") {
        double draw = 19.0;
        CircuitBreaker breaker("GBR", config, {}, [&draw] { return draw; });
        breaker.record_failure("down");
        std::this_thread::sleep_for(std::chrono::milliseconds(30));

        REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
        draw = 20.0;
        REQUIRE(breaker.try_acquire() == Admission::REJECTED_HALF_OPEN);
    }
}

TEST_CASE("CircuitBreaker - HALF_OPEN closes on success threshold", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 2;
    config.success_threshold = 3;
    config.recovery_timeout_ms = 20;

    auto observer = std::make_shared<RecordingObserver>();
    CircuitBreaker breaker("GBR", config, {observer}, always_admit());
    fail_times(breaker, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    breaker.tick();
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);

    breaker.record_success();
    breaker.record_success();
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);

    breaker.record_success();
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.get_mode() == FailoverMode::NORMAL);

    auto metrics = breaker.metrics();
    REQUIRE(metrics.total_recoveries == 1);
    REQUIRE(metrics.longest_outage_ms >= 20);
    REQUIRE(metrics.current_outage_ms == 0);
    REQUIRE(breaker.snapshot().offline_since == std::nullopt);

    REQUIRE(observer->recoveries() == 1);
    REQUIRE(observer->last_recovery_attempts() == 1);
}

TEST_CASE("CircuitBreaker - HALF_OPEN reopens on failure", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 2;
    config.recovery_timeout_ms = 20;

    CircuitBreaker breaker("GBR", config, {}, always_admit());
    fail_times(breaker, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    breaker.tick();
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);

    // A single failed probe is enough
    breaker.record_failure("probe failed");
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE(breaker.metrics().total_circuit_opens == 2);
}

TEST_CASE("CircuitBreaker - HALF_OPEN timeout reopens the circuit", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.recovery_timeout_ms = 20;
    config.half_open_timeout_ms = 40;

    CircuitBreaker breaker("GBR", config, {}, never_admit());
    breaker.record_failure("down");
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    breaker.tick();
    REQUIRE(breaker.get_state() == CircuitState::HALF_OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    breaker.tick();
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
}

TEST_CASE("CircuitBreaker - Long outage becomes OFFLINE", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.recovery_timeout_ms = 60000;
    config.max_offline_time_ms = 30;

    CircuitBreaker breaker("GBR", config);
    breaker.record_failure("down");
    REQUIRE(breaker.get_mode() == FailoverMode::DEGRADED);

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    breaker.tick();
    REQUIRE(breaker.get_mode() == FailoverMode::OFFLINE);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);
    REQUIRE(breaker.metrics().current_outage_ms >= 30);
}

TEST_CASE("CircuitBreaker - Maintenance overrides every state", "[circuit_breaker][maintenance]") {
    auto observer = std::make_shared<RecordingObserver>();
    CircuitBreaker breaker("GBR", CircuitBreakerConfig{}, {observer});

    breaker.enter_maintenance("planned upgrade");
    REQUIRE(breaker.in_maintenance());
    REQUIRE(breaker.get_mode() == FailoverMode::MAINTENANCE);
    REQUIRE(breaker.try_acquire() == Admission::REJECTED_MAINTENANCE);
    REQUIRE(breaker.snapshot().maintenance_reason == "planned upgrade");

    // Never left automatically
    breaker.tick();
    breaker.record_success();
    REQUIRE(breaker.get_mode() == FailoverMode::MAINTENANCE);

    breaker.exit_maintenance();
    REQUIRE(breaker.get_mode() == FailoverMode::NORMAL);
    REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
    REQUIRE(breaker.snapshot().maintenance_reason.empty());

    auto modes = observer->modes();
    REQUIRE(modes.size() == 2);
    REQUIRE(modes[0] == FailoverMode::MAINTENANCE);
    REQUIRE(modes[1] == FailoverMode::NORMAL);
}

TEST_CASE("CircuitBreaker - Maintenance exit falls back to circuit mode",
          "[circuit_breaker][maintenance]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.recovery_timeout_ms = 60000;

    CircuitBreaker breaker("GBR", config);
    breaker.record_failure("down");
    breaker.enter_maintenance("investigating");
    REQUIRE(breaker.get_mode() == FailoverMode::MAINTENANCE);

    breaker.exit_maintenance();
    REQUIRE(breaker.get_mode() == FailoverMode::DEGRADED);
    REQUIRE(breaker.try_acquire() == Admission::REJECTED_OPEN);
}

TEST_CASE("CircuitBreaker - force_open and force_close", "[circuit_breaker]") {
    auto observer = std::make_shared<RecordingObserver>();
    CircuitBreaker breaker("GBR", CircuitBreakerConfig{}, {observer});

    breaker.force_open("health check failed");
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    // Idempotent
    breaker.force_open("again");
    REQUIRE(breaker.metrics().total_circuit_opens == 1);

    breaker.force_close();
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.recent_failure_count() == 0);

    auto transitions = observer->transitions();
    REQUIRE(transitions.size() == 2);
    REQUIRE(transitions[0].peer == "GBR");
    REQUIRE(transitions[0].from == CircuitState::CLOSED);
    REQUIRE(transitions[0].to == CircuitState::OPEN);
    REQUIRE(transitions[1].to == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Health probe outcome is recorded", "[circuit_breaker][probe]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;

    SECTION("successful probe") {
        CircuitBreaker breaker("GBR", config);
        auto result = breaker.execute_probe([] { return true; });
        REQUIRE(result.success);
        REQUIRE(result.state_after == CircuitState::CLOSED);
        REQUIRE(breaker.metrics().total_successes == 1);
    }

    SECTION("throwing probe counts as failure") {
        CircuitBreaker breaker("GBR", config);
        auto result = breaker.execute_probe([]() -> bool {
            throw std::runtime_error("connection reset");
        });
        REQUIRE_FALSE(result.success);
        REQUIRE(result.state_after == CircuitState::OPEN);
    }
}

TEST_CASE("CircuitBreaker - Policy cache validity follows peer contact", "[circuit_breaker]") {
    CircuitBreaker breaker("GBR", CircuitBreakerConfig{});
    REQUIRE_FALSE(breaker.policy_cache_valid());

    breaker.record_success();
    REQUIRE(breaker.policy_cache_valid());
    REQUIRE(breaker.snapshot().last_peer_contact.has_value());

    breaker.set_policy_cache_expiry(WallClock::now() - std::chrono::seconds(1));
    REQUIRE_FALSE(breaker.policy_cache_valid());
}

TEST_CASE("CircuitBreaker - Uptime drops during an outage", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;
    config.recovery_timeout_ms = 60000;

    CircuitBreaker breaker("GBR", config);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    breaker.record_failure("down");
    std::this_thread::sleep_for(std::chrono::milliseconds(40));

    auto metrics = breaker.metrics();
    REQUIRE(metrics.current_outage_ms >= 40);
    REQUIRE(metrics.uptime_percentage < 100.0);
    REQUIRE(metrics.uptime_percentage >= 0.0);
}

TEST_CASE("CircuitBreaker - Reset forgets everything", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;

    CircuitBreaker breaker("GBR", config);
    breaker.record_failure("down");
    breaker.enter_maintenance("ops");

    breaker.reset();
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
    REQUIRE(breaker.get_mode() == FailoverMode::NORMAL);
    REQUIRE(breaker.metrics().total_failures == 0);
    REQUIRE(breaker.try_acquire() == Admission::ALLOWED);
}

TEST_CASE("CircuitBreaker - Full state machine cycle", "[circuit_breaker]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.success_threshold = 2;
    config.recovery_timeout_ms = 30;

    auto observer = std::make_shared<RecordingObserver>();
    CircuitBreaker breaker("FRA", config, {observer}, always_admit());

    // CLOSED -> OPEN
    fail_times(breaker, 3);
    REQUIRE(breaker.get_state() == CircuitState::OPEN);

    // OPEN -> HALF_OPEN
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    REQUIRE(breaker.try_acquire() == Admission::ALLOWED);

    // HALF_OPEN -> CLOSED
    breaker.record_success();
    breaker.record_success();
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);

    auto transitions = observer->transitions();
    REQUIRE(transitions.size() == 3);
    REQUIRE(transitions[0].to == CircuitState::OPEN);
    REQUIRE(transitions[1].to == CircuitState::HALF_OPEN);
    REQUIRE(transitions[2].to == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Concurrent recording", "[circuit_breaker][concurrency]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1000000;

    CircuitBreaker breaker("GBR", config);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&breaker] {
            for (int i = 0; i < 500; ++i) {
                (void)breaker.try_acquire();
                breaker.record_success();
                breaker.record_failure("load");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto metrics = breaker.metrics();
    REQUIRE(metrics.total_successes == 2000);
    REQUIRE(metrics.total_failures == 2000);
    REQUIRE(breaker.get_state() == CircuitState::CLOSED);
}

// ============================================================================
// BreakerRegistry
// ============================================================================

TEST_CASE("BreakerRegistry - One breaker per peer", "[circuit_breaker][registry]") {
    BreakerRegistry registry(CircuitBreakerConfig{});

    REQUIRE(registry.find("GBR") == nullptr);

    auto first = registry.get("GBR");
    auto second = registry.get("GBR");
    REQUIRE(first == second);
    REQUIRE(registry.find("GBR") == first);
    REQUIRE(registry.size() == 1);

    // Independent state per peer
    first->force_open("down");
    REQUIRE(registry.get("FRA")->get_state() == CircuitState::CLOSED);
}

TEST_CASE("BreakerRegistry - Listing is ordered by peer", "[circuit_breaker][registry]") {
    BreakerRegistry registry(CircuitBreakerConfig{});
    (void)registry.get("USA");
    (void)registry.get("DEU");
    (void)registry.get("GBR");

    auto all = registry.all();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0]->peer() == "DEU");
    REQUIRE(all[1]->peer() == "GBR");
    REQUIRE(all[2]->peer() == "USA");

    auto snapshots = registry.snapshots();
    REQUIRE(snapshots.size() == 3);
    REQUIRE(snapshots[0].peer == "DEU");
}

TEST_CASE("BreakerRegistry - Maintenance helpers", "[circuit_breaker][registry][maintenance]") {
    BreakerRegistry registry(CircuitBreakerConfig{});
    (void)registry.get("GBR");
    (void)registry.get("FRA");

    registry.enter_maintenance("DEU", "new peer onboarding");
    REQUIRE(registry.find("DEU")->in_maintenance());

    registry.enter_maintenance_all("federation freeze");
    for (const auto& breaker : registry.all()) {
        REQUIRE(breaker->try_acquire() == Admission::REJECTED_MAINTENANCE);
    }

    registry.exit_maintenance("GBR");
    REQUIRE_FALSE(registry.find("GBR")->in_maintenance());
    REQUIRE(registry.find("FRA")->in_maintenance());

    registry.exit_maintenance_all();
    REQUIRE_FALSE(registry.find("FRA")->in_maintenance());

    // Unknown peer is a no-op
    registry.exit_maintenance("ITA");
    REQUIRE(registry.find("ITA") == nullptr);
}

TEST_CASE("BreakerRegistry - Observers and shared config reach every breaker",
          "[circuit_breaker][registry]") {
    CircuitBreakerConfig config;
    config.failure_threshold = 1;

    auto observer = std::make_shared<RecordingObserver>();
    BreakerRegistry registry(config, {observer});

    registry.get("GBR")->record_failure("down");
    registry.get("FRA")->record_failure("down");

    REQUIRE(observer->transitions().size() == 2);
    REQUIRE(registry.get("FRA")->config().failure_threshold == 1);

    registry.reset_all();
    REQUIRE(registry.get("GBR")->get_state() == CircuitState::CLOSED);
}
