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

// Accord Token Validator - Header
// Validates bearer tokens issued by a peer instance

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/http_client.hpp"
#include "../core/jwks.hpp"
#include "../core/jwt.hpp"
#include "../core/ttl_cache.hpp"
#include "../resilience/breaker_registry.hpp"
#include "instance_registry.hpp"
#include "trust_store.hpp"
#include "types.hpp"

namespace accord::federation {

struct IntrospectionRequest {
    std::string token;
    std::string origin_instance;      // Issuer of the token
    std::string requesting_instance;  // Instance that received the token
    std::string request_id;
    std::vector<std::string> requested_scopes;
};

struct TokenValidatorConfig {
    std::string local_instance;  // Sent as X-Federated-From
    std::chrono::milliseconds introspection_ttl{30000};
    size_t cache_capacity = 10000;
    std::chrono::milliseconds introspection_timeout{10000};
    int64_t clock_skew_seconds = 30;
};

/// Token validation across an instance boundary.
///
/// Flow for every call:
///   1. Trust gate requesting -> origin (absent edge: inactive, no I/O)
///   2. Origin must be registered and enabled
///   3. Introspection cache
///   4. Local signature check against the origin's published keys
///   5. Remote introspection through the origin's circuit breaker, only when
///      the token could not be checked locally
///
/// A token that fails a local check it could be subjected to (bad signature,
/// expired) is rejected without asking the origin.
class TokenValidator {
public:
    TokenValidator(TokenValidatorConfig config, std::shared_ptr<const InstanceRegistry> instances,
                   std::shared_ptr<const TrustMatrix> trust,
                   std::shared_ptr<core::HttpClient> http, std::shared_ptr<core::JwksCache> jwks,
                   std::shared_ptr<resilience::BreakerRegistry> breakers);
    ~TokenValidator() = default;

    TokenValidator(const TokenValidator&) = delete;
    TokenValidator& operator=(const TokenValidator&) = delete;

    [[nodiscard]] IntrospectionResult introspect(const IntrospectionRequest& request);

    void clear_cache() { cache_.clear(); }
    [[nodiscard]] core::CacheStats cache_stats() const { return cache_.stats(); }

    [[nodiscard]] const InstanceRegistry& instances() const noexcept { return *instances_; }

    [[nodiscard]] uint64_t local_validations() const noexcept {
        return local_validations_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t remote_introspections() const noexcept {
        return remote_introspections_.load(std::memory_order_relaxed);
    }

    /// Cache key: digest of the token bound to both instances
    [[nodiscard]] static std::string cache_key(const IntrospectionRequest& request);

private:
    /// Result when the token could be judged locally, nullopt to fall back
    [[nodiscard]] std::optional<IntrospectionResult> validate_locally(
        const IntrospectionRequest& request, const InstanceConfig& instance);

    [[nodiscard]] IntrospectionResult introspect_remote(const IntrospectionRequest& request,
                                                        const InstanceConfig& instance);

    TokenValidatorConfig config_;
    std::shared_ptr<const InstanceRegistry> instances_;
    std::shared_ptr<const TrustMatrix> trust_;
    std::shared_ptr<core::HttpClient> http_;
    std::shared_ptr<core::JwksCache> jwks_;
    std::shared_ptr<resilience::BreakerRegistry> breakers_;
    core::JwtValidator jwt_;

    core::TtlCache<IntrospectionResult> cache_;

    std::atomic<uint64_t> local_validations_{0};
    std::atomic<uint64_t> remote_introspections_{0};
};

/// Normalized claims from a token payload. Missing attributes default from
/// the issuing instance (country) or to the most restrictive reading.
[[nodiscard]] TokenClaims claims_from_payload(const nlohmann::json& payload,
                                              const InstanceConfig& issuer);

/// Introspection reply checked against its schema. nullopt when the body is
/// not JSON or a field has the wrong type.
struct IntrospectionReply {
    bool active = false;
    TokenClaims claims;
};

[[nodiscard]] std::optional<IntrospectionReply> parse_introspection_reply(
    std::string_view body, const InstanceConfig& issuer);

}  // namespace accord::federation
