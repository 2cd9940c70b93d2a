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

// Accord TTL Cache - Header
// Shared LRU cache with per-entry expiry (introspection and authorization results)

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace accord::core {

/// Cache statistics snapshot
struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
};

/// Thread-safe LRU cache whose entries expire after a fixed TTL.
///
/// Writes are last-writer-wins. Concurrent misses for the same key are not
/// coalesced; each caller computes and stores its own value.
template <typename Value>
class TtlCache {
public:
    using Clock = std::chrono::steady_clock;

    TtlCache(std::chrono::milliseconds ttl, size_t capacity) : ttl_(ttl), capacity_(capacity) {}
    ~TtlCache() = default;

    // Non-copyable, non-movable (owns mutex)
    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;
    TtlCache(TtlCache&&) = delete;
    TtlCache& operator=(TtlCache&&) = delete;

    /// Lookup (nullopt on miss or expired entry)
    [[nodiscard]] std::optional<Value> get(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        if (Clock::now() >= it->second->expires_at) {
            entries_.erase(it->second);
            index_.erase(it);
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        entries_.splice(entries_.begin(), entries_, it->second);
        hits_.fetch_add(1, std::memory_order_relaxed);
        return it->second->value;
    }

    void put(const std::string& key, Value value) { put(key, std::move(value), ttl_); }

    /// Insert with an explicit TTL (clamped to the cache TTL)
    void put(const std::string& key, Value value, std::chrono::milliseconds ttl) {
        if (capacity_ == 0 || ttl.count() <= 0) {
            return;
        }
        auto expires_at = Clock::now() + std::min(ttl, ttl_);

        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->expires_at = expires_at;
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        if (index_.size() >= capacity_) {
            index_.erase(entries_.back().key);
            entries_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        entries_.push_front(Entry{key, std::move(value), expires_at});
        index_[key] = entries_.begin();
    }

    void erase(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = index_.find(key);
        if (it != index_.end()) {
            entries_.erase(it->second);
            index_.erase(it);
        }
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
        index_.clear();
    }

    /// Drop expired entries, returns number removed
    size_t purge_expired() {
        std::lock_guard lock(mutex_);
        auto now = Clock::now();
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now >= it->expires_at) {
                index_.erase(it->key);
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] CacheStats stats() const {
        CacheStats s;
        s.size = size();
        s.capacity = capacity_;
        s.hits = hits_.load(std::memory_order_relaxed);
        s.misses = misses_.load(std::memory_order_relaxed);
        s.evictions = evictions_.load(std::memory_order_relaxed);
        return s;
    }

    [[nodiscard]] std::chrono::milliseconds ttl() const noexcept { return ttl_; }

private:
    struct Entry {
        std::string key;
        Value value;
        Clock::time_point expires_at;
    };

    std::chrono::milliseconds ttl_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::list<Entry> entries_;  // Most recently used at front
    std::unordered_map<std::string, typename std::list<Entry>::iterator> index_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

}  // namespace accord::core
