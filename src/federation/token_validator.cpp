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

// Accord Token Validator - Implementation

#include "token_validator.hpp"

#include <fmt/format.h>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace accord::federation {

namespace {

std::string string_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> result;
    auto it = j.find(key);
    if (it == j.end()) {
        return result;
    }
    if (it->is_string()) {
        result.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                result.push_back(entry.get<std::string>());
            }
        }
    }
    return result;
}

int64_t integer_field(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number()) {
        return it->get<int64_t>();
    }
    return 0;
}

// Optional field present with the wrong JSON type
bool wrong_type(const nlohmann::json& j, const char* key, bool (nlohmann::json::*check)() const
                                                                 noexcept) {
    auto it = j.find(key);
    return it != j.end() && !it->is_null() && !((*it).*check)();
}

bool is_string_array(const nlohmann::json& j) {
    if (!j.is_array()) {
        return false;
    }
    for (const auto& entry : j) {
        if (!entry.is_string()) {
            return false;
        }
    }
    return true;
}

uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

}  // namespace

// ============================================================================
// Claims normalization
// ============================================================================

TokenClaims claims_from_payload(const nlohmann::json& payload, const InstanceConfig& issuer) {
    TokenClaims claims;
    claims.sub = string_field(payload, "sub");
    claims.iss = string_field(payload, "iss");
    claims.aud = string_list(payload, "aud");
    claims.exp = integer_field(payload, "exp");
    claims.iat = integer_field(payload, "iat");
    claims.jti = optional_string(payload, "jti");

    claims.unique_id = string_field(payload, "uniqueID");
    if (claims.unique_id.empty()) {
        claims.unique_id = string_field(payload, "preferred_username");
    }
    if (claims.unique_id.empty()) {
        claims.unique_id = claims.sub;
    }

    claims.clearance = string_field(payload, "clearance");
    if (claims.clearance.empty()) {
        claims.clearance = "UNCLASSIFIED";
    }

    claims.country_of_affiliation = string_field(payload, "countryOfAffiliation");
    if (claims.country_of_affiliation.empty()) {
        claims.country_of_affiliation = issuer.country;
    }

    claims.community_of_interest = payload.contains("acpCOI") ? string_list(payload, "acpCOI")
                                                              : string_list(payload, "coi");
    claims.organization_type = optional_string(payload, "organizationType");
    claims.instance_code = issuer.instance_id;
    return claims;
}

std::optional<IntrospectionReply> parse_introspection_reply(std::string_view body,
                                                            const InstanceConfig& issuer) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto active = j.find("active");
        if (active == j.end() || !active->is_boolean()) {
            return std::nullopt;
        }

        IntrospectionReply reply;
        reply.active = active->get<bool>();
        if (!reply.active) {
            return reply;
        }

        // Required for an active token
        auto sub = j.find("sub");
        auto iss = j.find("iss");
        auto exp = j.find("exp");
        if (sub == j.end() || !sub->is_string() || iss == j.end() || !iss->is_string() ||
            exp == j.end() || !exp->is_number()) {
            return std::nullopt;
        }

        if (wrong_type(j, "iat", &nlohmann::json::is_number) ||
            wrong_type(j, "jti", &nlohmann::json::is_string) ||
            wrong_type(j, "uniqueID", &nlohmann::json::is_string) ||
            wrong_type(j, "clearance", &nlohmann::json::is_string) ||
            wrong_type(j, "countryOfAffiliation", &nlohmann::json::is_string) ||
            wrong_type(j, "organizationType", &nlohmann::json::is_string)) {
            return std::nullopt;
        }
        if (j.contains("aud") && !j["aud"].is_string() && !is_string_array(j["aud"])) {
            return std::nullopt;
        }
        if (j.contains("acpCOI") && !is_string_array(j["acpCOI"])) {
            return std::nullopt;
        }

        reply.claims = claims_from_payload(j, issuer);
        return reply;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// TokenValidator
// ============================================================================

TokenValidator::TokenValidator(TokenValidatorConfig config,
                               std::shared_ptr<const InstanceRegistry> instances,
                               std::shared_ptr<const TrustMatrix> trust,
                               std::shared_ptr<core::HttpClient> http,
                               std::shared_ptr<core::JwksCache> jwks,
                               std::shared_ptr<resilience::BreakerRegistry> breakers)
    : config_(std::move(config)),
      instances_(std::move(instances)),
      trust_(std::move(trust)),
      http_(std::move(http)),
      jwks_(std::move(jwks)),
      breakers_(std::move(breakers)),
      jwt_(core::JwtValidatorConfig{true, {}, {}, config_.clock_skew_seconds}),
      cache_(config_.introspection_ttl, config_.cache_capacity) {}

std::string TokenValidator::cache_key(const IntrospectionRequest& request) {
    return core::fingerprint({{"token_digest", core::sha256_hex(request.token)},
                              {"origin", core::to_upper(request.origin_instance)},
                              {"requesting", core::to_upper(request.requesting_instance)}});
}

IntrospectionResult TokenValidator::introspect(const IntrospectionRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    auto* logger = logging::get_logger();

    // The requesting instance must trust the token's origin
    auto trust = trust_->verify_trust(request.requesting_instance, request.origin_instance);
    if (!trust) {
        LOG_TRUST_DECISION(logger, request.request_id, request.requesting_instance,
                           request.origin_instance, "deny", "no_bilateral_trust");
        auto result = IntrospectionResult::inactive(
            request.origin_instance, false, core::ErrorCode::NoBilateralTrust,
            fmt::format("No bilateral trust between {} and {}", request.requesting_instance,
                        request.origin_instance));
        result.latency_ms = elapsed_ms(start);
        return result;
    }

    auto instance = instances_->resolve(request.origin_instance);
    if (!instance) {
        auto result = IntrospectionResult::inactive(
            request.origin_instance, true, core::ErrorCode::UnknownInstance,
            fmt::format("Origin instance {} not found or disabled", request.origin_instance));
        result.latency_ms = elapsed_ms(start);
        return result;
    }

    const std::string key = cache_key(request);
    if (auto cached = cache_.get(key)) {
        LOG_DEBUG(logger, "Introspection cache hit: request_id={}, origin={}, token={}",
                  request.request_id, request.origin_instance,
                  logging::token_fingerprint(request.token));
        cached->cache_hit = true;
        cached->scopes_allowed = filter_scopes_by_trust(request.requested_scopes, *trust);
        cached->latency_ms = elapsed_ms(start);
        return std::move(*cached);
    }

    IntrospectionResult result;
    if (auto local = validate_locally(request, *instance)) {
        result = std::move(*local);
    } else {
        result = introspect_remote(request, *instance);
    }

    result.origin_instance = request.origin_instance;
    result.trust_verified = true;
    if (result.active) {
        result.scopes_allowed = filter_scopes_by_trust(request.requested_scopes, *trust);
        // A cached answer must not outlive the token; the cache ignores ttl <= 0
        if (result.claims) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                from_unix_seconds(result.claims->exp) - Clock::now());
            cache_.put(key, result, remaining);
        }
    }
    result.latency_ms = elapsed_ms(start);

    LOG_INFO(logger,
             "Token introspection completed: request_id={}, origin={}, active={}, local={}, "
             "latency_ms={}",
             request.request_id, request.origin_instance, result.active,
             result.validated_locally, result.latency_ms);
    return result;
}

std::optional<IntrospectionResult> TokenValidator::validate_locally(
    const IntrospectionRequest& request, const InstanceConfig& instance) {
    if (instance.introspection_only || instance.signing_keys_url.empty() || !jwks_) {
        return std::nullopt;
    }

    auto keys = jwks_->get_keys(instance.signing_keys_url);
    if (!keys) {
        LOG_DEBUG(logging::get_logger(), "No signing keys for instance: instance_id={}",
                  instance.instance_id);
        return std::nullopt;
    }

    auto validation = jwt_.validate(request.token, *keys);
    switch (validation.code) {
        case core::TokenError::None:
            break;
        case core::TokenError::Malformed:
        case core::TokenError::UnsupportedAlgorithm:
        case core::TokenError::UnknownKey:
            // Not checkable here (opaque token, rotated key): ask the origin
            LOG_DEBUG(logging::get_logger(),
                      "Local validation not possible: request_id={}, origin={}, reason={}",
                      request.request_id, instance.instance_id,
                      core::to_string(validation.code));
            return std::nullopt;
        case core::TokenError::Expired:
            local_validations_.fetch_add(1, std::memory_order_relaxed);
            return IntrospectionResult::inactive(instance.instance_id, true,
                                                 core::ErrorCode::TokenExpired, "Token expired");
        case core::TokenError::BadSignature:
        case core::TokenError::NotYetValid:
        case core::TokenError::ClaimMismatch:
            local_validations_.fetch_add(1, std::memory_order_relaxed);
            LOG_WARNING(logging::get_logger(),
                        "Token rejected locally: request_id={}, origin={}, reason={}, token={}",
                        request.request_id, instance.instance_id, validation.error,
                        logging::token_fingerprint(request.token));
            return IntrospectionResult::inactive(instance.instance_id, true,
                                                 core::ErrorCode::TokenInvalid, validation.error);
    }

    local_validations_.fetch_add(1, std::memory_order_relaxed);

    IntrospectionResult result;
    result.active = true;
    result.claims = claims_from_payload(validation.claims.custom, instance);
    result.validated_at = Clock::now();
    result.validated_locally = true;
    return result;
}

IntrospectionResult TokenValidator::introspect_remote(const IntrospectionRequest& request,
                                                      const InstanceConfig& instance) {
    auto* logger = logging::get_logger();
    const std::string& peer = instance.instance_id;

    if (instance.introspection_url.empty()) {
        return IntrospectionResult::inactive(peer, true, core::ErrorCode::TokenInvalid,
                                             "Token cannot be validated locally and instance "
                                             "has no introspection endpoint");
    }

    auto breaker = breakers_->get(peer);
    auto admission = breaker->try_acquire();
    if (admission != resilience::Admission::ALLOWED) {
        auto code = admission == resilience::Admission::REJECTED_MAINTENANCE
                        ? core::ErrorCode::MaintenanceMode
                        : core::ErrorCode::CircuitOpen;
        LOG_WARNING(logger, "Introspection skipped: request_id={}, peer={}, admission={}",
                    request.request_id, peer, resilience::to_string(admission));
        return IntrospectionResult::inactive(
            peer, true, code,
            fmt::format("Introspection to {} rejected: {}", peer,
                        resilience::to_string(admission)));
    }

    const auto start = std::chrono::steady_clock::now();
    core::HttpHeaders headers{{"X-Federated-From", config_.local_instance}};
    auto response = http_->post(instance.introspection_url,
                                "token=" + core::form_encode(request.token),
                                "application/x-www-form-urlencoded", headers,
                                config_.introspection_timeout);
    remote_introspections_.fetch_add(1, std::memory_order_relaxed);
    const uint64_t latency = elapsed_ms(start);

    if (response.transport_failed() || response.status >= 500) {
        std::string detail =
            response.transport_failed() ? response.error : fmt::format("HTTP {}", response.status);
        breaker->record_failure(detail);
        LOG_PEER_CALL(logger, "introspection_failed", peer, response.status, latency,
                      request.request_id);
        return IntrospectionResult::inactive(peer, true,
                                             core::ErrorCode::RemoteEvaluationUnavailable,
                                             "Introspection endpoint unavailable: " + detail);
    }

    if (!response.ok()) {
        // The peer answered; it just refused this token
        breaker->record_success();
        LOG_PEER_CALL(logger, "introspection_rejected", peer, response.status, latency,
                      request.request_id);
        return IntrospectionResult::inactive(
            peer, true, core::ErrorCode::TokenInvalid,
            fmt::format("Introspection rejected with status {}", response.status));
    }

    auto reply = parse_introspection_reply(response.body, instance);
    if (!reply) {
        breaker->record_failure("malformed introspection response");
        LOG_ERROR_CTX(logger, "Malformed introspection response", request.request_id,
                      core::to_string(core::ErrorCode::MalformedResponse), peer);
        return IntrospectionResult::inactive(peer, true, core::ErrorCode::MalformedResponse,
                                             "Malformed introspection response");
    }

    breaker->record_success();
    LOG_PEER_CALL(logger, "introspection", peer, response.status, latency, request.request_id);

    if (!reply->active) {
        return IntrospectionResult::inactive(peer, true, core::ErrorCode::TokenInvalid,
                                             "Token is not active");
    }
    if (reply->claims.exp <= to_unix_seconds(Clock::now())) {
        return IntrospectionResult::inactive(peer, true, core::ErrorCode::TokenExpired,
                                             "Token expired");
    }

    IntrospectionResult result;
    result.active = true;
    result.claims = std::move(reply->claims);
    result.validated_at = Clock::now();
    return result;
}

}  // namespace accord::federation
