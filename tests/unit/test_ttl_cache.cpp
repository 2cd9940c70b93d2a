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

#include <catch2/catch_test_macros.hpp>
#include <thread>
#include <vector>

#include "core/ttl_cache.hpp"

using namespace accord::core;

TEST_CASE("TtlCache - Hit and miss", "[ttl_cache]") {
    TtlCache<int> cache(std::chrono::seconds(10), 8);

    REQUIRE_FALSE(cache.get("a").has_value());
    cache.put("a", 1);
    REQUIRE(cache.get("a") == 1);

    auto stats = cache.stats();
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.size == 1);
    REQUIRE(stats.capacity == 8);
}

TEST_CASE("TtlCache - Entries expire", "[ttl_cache]") {
    TtlCache<std::string> cache(std::chrono::milliseconds(20), 8);
    cache.put("token", "claims");
    REQUIRE(cache.get("token").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE_FALSE(cache.get("token").has_value());
    REQUIRE(cache.size() == 0);
}

TEST_CASE("TtlCache - Per-entry TTL is clamped to the cache TTL", "[ttl_cache]") {
    TtlCache<int> cache(std::chrono::milliseconds(20), 8);

    cache.put("long", 1, std::chrono::hours(1));
    cache.put("none", 2, std::chrono::milliseconds(0));
    REQUIRE_FALSE(cache.get("none").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    REQUIRE_FALSE(cache.get("long").has_value());
}

TEST_CASE("TtlCache - LRU eviction at capacity", "[ttl_cache]") {
    TtlCache<int> cache(std::chrono::seconds(10), 2);
    cache.put("a", 1);
    cache.put("b", 2);
    REQUIRE(cache.get("a") == 1);  // a is now most recent

    cache.put("c", 3);
    REQUIRE_FALSE(cache.get("b").has_value());
    REQUIRE(cache.get("a") == 1);
    REQUIRE(cache.get("c") == 3);
    REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("TtlCache - Overwrite, erase, clear, purge", "[ttl_cache]") {
    TtlCache<int> cache(std::chrono::seconds(10), 4);
    cache.put("a", 1);
    cache.put("a", 5);
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get("a") == 5);

    cache.erase("a");
    REQUIRE_FALSE(cache.get("a").has_value());

    cache.put("x", 1, std::chrono::milliseconds(5));
    cache.put("y", 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(cache.purge_expired() == 1);
    REQUIRE(cache.size() == 1);

    cache.clear();
    REQUIRE(cache.size() == 0);
}

TEST_CASE("TtlCache - Zero capacity stores nothing", "[ttl_cache]") {
    TtlCache<int> cache(std::chrono::seconds(10), 0);
    cache.put("a", 1);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("TtlCache - Concurrent access", "[ttl_cache][concurrency]") {
    TtlCache<int> cache(std::chrono::seconds(10), 64);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                auto key = std::to_string((t * 500 + i) % 100);
                cache.put(key, i);
                (void)cache.get(key);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    REQUIRE(cache.size() <= 64);
}
