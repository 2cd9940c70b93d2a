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

// Accord JWKS - Header
// JWK conversion and a per-issuer signing-key cache

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "http_client.hpp"
#include "jwt.hpp"

namespace accord::core {

/// JWK (JSON Web Key), RFC 7517 subset
struct JsonWebKey {
    std::string kty;   // "RSA" or "EC"
    std::string alg;   // "RS256", "ES256" (optional on the wire)
    std::string kid;
    std::string use;   // "sig"

    // RSA
    std::string n;
    std::string e;

    // EC
    std::string crv;   // "P-256"
    std::string x;
    std::string y;

    [[nodiscard]] static std::optional<JsonWebKey> parse(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Parse `{"keys": [...]}`. Entries that are not objects are skipped; a
/// document without a keys array is rejected.
[[nodiscard]] std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json);

/// JWK to verification key (alg inferred from kty/crv when absent)
[[nodiscard]] std::optional<VerificationKey> jwk_to_verification_key(const JsonWebKey& jwk);

/// Public JWK for an RSA or EC P-256 key
[[nodiscard]] std::optional<JsonWebKey> public_key_to_jwk(EVP_PKEY* pkey, JwtAlgorithm alg,
                                                          std::string_view key_id);

/// JWKS cache configuration
struct JwksCacheConfig {
    std::chrono::milliseconds ttl{3600000};     // 1 hour
    std::chrono::milliseconds timeout{5000};    // Per fetch
};

/// Signing keys of peer instances, keyed by JWKS URL.
///
/// Fetches happen outside the lock. When a refresh fails the previous key set
/// is kept and served until a later refresh succeeds.
class JwksCache {
public:
    JwksCache(std::shared_ptr<HttpClient> http, JwksCacheConfig config);
    ~JwksCache() = default;

    // Non-copyable, non-movable
    JwksCache(const JwksCache&) = delete;
    JwksCache& operator=(const JwksCache&) = delete;
    JwksCache(JwksCache&&) = delete;
    JwksCache& operator=(JwksCache&&) = delete;

    /// Keys for url, fetching when absent or older than the TTL.
    /// Returns nullptr when no key set could ever be obtained.
    [[nodiscard]] std::shared_ptr<const KeyManager> get_keys(const std::string& url);

    /// Force a fetch now, returns true when a usable key set was stored
    [[nodiscard]] bool refresh(const std::string& url);

    void clear();

    [[nodiscard]] size_t size() const;
    [[nodiscard]] uint64_t fetch_count() const noexcept {
        return fetches_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t fetch_failures() const noexcept {
        return fetch_failures_.load(std::memory_order_relaxed);
    }

private:
    struct Entry {
        std::shared_ptr<const KeyManager> keys;
        std::chrono::steady_clock::time_point fetched_at;
    };

    /// HTTP GET + parse + convert (no lock held)
    [[nodiscard]] std::shared_ptr<const KeyManager> fetch(const std::string& url);

    std::shared_ptr<HttpClient> http_;
    JwksCacheConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;

    std::atomic<uint64_t> fetches_{0};
    std::atomic<uint64_t> fetch_failures_{0};
};

}  // namespace accord::core
