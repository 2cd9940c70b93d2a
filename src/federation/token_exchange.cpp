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

// Accord Token Exchange - Implementation

#include "token_exchange.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../core/crypto.hpp"
#include "../core/jwks.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace accord::federation {

void to_json(nlohmann::json& j, const TokenExchangeResult& r) {
    if (r.success) {
        j = nlohmann::json{{"access_token", r.access_token},
                           {"token_type", r.token_type},
                           {"expires_in", r.expires_in},
                           {"issued_token_type", r.issued_token_type},
                           {"scope", r.scope},
                           {"audit_id", r.audit_id}};
        return;
    }
    j = nlohmann::json{{"error", core::to_string(r.code)},
                       {"error_description", r.error_description},
                       {"audit_id", r.audit_id}};
}

ExchangeTokenIssuer::ExchangeTokenIssuer(ExchangeIssuerConfig config,
                                         std::shared_ptr<const TrustMatrix> trust,
                                         std::shared_ptr<TokenValidator> validator,
                                         std::shared_ptr<const core::SigningKey> signing_key)
    : config_(std::move(config)),
      trust_(std::move(trust)),
      validator_(std::move(validator)),
      signing_key_(std::move(signing_key)) {
    if (config_.ttl.count() <= 0 || config_.ttl > MAX_EXCHANGE_TOKEN_TTL) {
        config_.ttl = MAX_EXCHANGE_TOKEN_TTL;
    }
    if (signing_key_ && signing_key_->valid()) {
        verification_key_ = signing_key_->verification_key();
    }
}

TokenExchangeResult ExchangeTokenIssuer::exchange(const TokenExchangeRequest& request) {
    const std::string audit_id = core::random_uuid();
    auto* logger = logging::get_logger();

    LOG_INFO(logger, "Token exchange request: request_id={}, audit_id={}, origin={}, target={}",
             request.request_id, audit_id, request.origin_instance, request.target_instance);

    // Unknown and disabled instances hold no trust
    const auto& instances = validator_->instances();
    auto trust =
        instances.is_available(request.origin_instance, config_.local_instance) &&
                instances.is_available(request.target_instance, config_.local_instance)
            ? trust_->verify_trust(request.origin_instance, request.target_instance)
            : std::nullopt;
    if (!trust) {
        LOG_TRUST_DECISION(logger, request.request_id, request.origin_instance,
                           request.target_instance, "deny", "invalid_grant");
        return TokenExchangeResult::failure(
            core::ErrorCode::InvalidGrant,
            fmt::format("No bilateral trust between {} and {}", request.origin_instance,
                        request.target_instance),
            request, audit_id);
    }

    // The target must in turn accept tokens from the origin
    auto introspection = validator_->introspect(IntrospectionRequest{
        request.subject_token, request.origin_instance, request.target_instance,
        request.request_id, {}});
    if (!introspection.active || !introspection.claims) {
        LOG_TRUST_DECISION(logger, request.request_id, request.origin_instance,
                           request.target_instance, "deny",
                           core::to_string(introspection.code));
        return TokenExchangeResult::failure(
            core::ErrorCode::InvalidGrant,
            introspection.error.value_or("Subject token is invalid or expired"), request,
            audit_id);
    }

    if (!signing_key_ || !signing_key_->valid()) {
        LOG_ERROR_CTX(logger, "Token exchange failed", request.request_id,
                      core::to_string(core::ErrorCode::SigningFailed), "no signing key");
        return TokenExchangeResult::failure(core::ErrorCode::SigningFailed,
                                            "Exchange token could not be signed", request,
                                            audit_id);
    }

    auto scopes = filter_scopes_by_trust(request.requested_scopes, *trust);

    // Never outlive the subject token
    const int64_t now = to_unix_seconds(Clock::now());
    int64_t expires_at = now + config_.ttl.count();
    if (introspection.claims->exp > 0) {
        expires_at = std::min(expires_at, introspection.claims->exp);
    }
    if (expires_at <= now) {
        // Accepted within clock skew but already past exp
        LOG_TRUST_DECISION(logger, request.request_id, request.origin_instance,
                           request.target_instance, "deny", "subject_token_expired");
        return TokenExchangeResult::failure(core::ErrorCode::InvalidGrant,
                                            "Subject token expired", request, audit_id);
    }

    auto token = mint(*introspection.claims, *trust, request.target_instance, scopes, now,
                      expires_at);
    if (!token) {
        LOG_ERROR_CTX(logger, "Token exchange failed", request.request_id,
                      core::to_string(core::ErrorCode::SigningFailed), "signature failed");
        return TokenExchangeResult::failure(core::ErrorCode::SigningFailed,
                                            "Exchange token could not be signed", request,
                                            audit_id);
    }

    TokenExchangeResult result;
    result.success = true;
    result.access_token = std::move(*token);
    result.token_type = "Bearer";
    result.expires_in = expires_at - now;
    result.issued_token_type = request.requested_token_type.empty()
                                   ? std::string(TOKEN_TYPE_ACCESS_TOKEN)
                                   : request.requested_token_type;
    result.scope = core::join(scopes, " ");
    result.origin_instance = request.origin_instance;
    result.target_instance = request.target_instance;
    result.audit_id = audit_id;

    LOG_INFO(logger,
             "Token exchange completed: request_id={}, audit_id={}, origin={}, target={}, "
             "scope={}, expires_in={}",
             request.request_id, audit_id, request.origin_instance, request.target_instance,
             result.scope, result.expires_in);
    return result;
}

std::optional<std::string> ExchangeTokenIssuer::mint(const TokenClaims& claims,
                                                     const BilateralTrust& trust,
                                                     std::string_view target_instance,
                                                     const std::vector<std::string>& scopes,
                                                     int64_t issued_at,
                                                     int64_t expires_at) const {
    nlohmann::json payload = {
        {"iss", config_.issuer},
        {"sub", claims.unique_id},
        {"aud", std::string(target_instance)},
        {"exp", expires_at},
        {"iat", issued_at},
        {"jti", core::random_uuid()},
        {"kid", signing_key_->key_id()},
        {"uniqueID", claims.unique_id},
        {"clearance", claims.clearance},
        {"countryOfAffiliation", claims.country_of_affiliation},
        {"acpCOI", claims.community_of_interest},
        {"token_exchange",
         {{"original_issuer", claims.iss},
          {"original_instance", claims.instance_code},
          {"target_instance", std::string(target_instance)},
          {"trust_level", to_string(trust.trust_level)},
          {"max_classification", trust.max_classification}}},
        {"scope", core::join(scopes, " ")}};
    if (claims.organization_type) {
        payload["organizationType"] = *claims.organization_type;
    }

    std::string signing_input = config_.prefix + "." + core::base64url_encode(payload.dump());
    auto signature = signing_key_->sign(signing_input);
    if (!signature) {
        return std::nullopt;
    }
    return signing_input + "." + core::base64url_encode(*signature);
}

ExchangeTokenVerification ExchangeTokenIssuer::verify(std::string_view token,
                                                      std::string_view expected_audience) const {
    if (!verification_key_) {
        return {false, {}, "No verification key"};
    }
    return verify_with_key(token, config_.prefix, *verification_key_, expected_audience);
}

ExchangeTokenVerification ExchangeTokenIssuer::verify_with_key(
    std::string_view token, std::string_view prefix, const core::VerificationKey& key,
    std::string_view expected_audience) {
    auto segments = core::split_token(token);
    if (!segments) {
        return {false, {}, "Malformed exchange token"};
    }
    if (segments->header != prefix) {
        return {false, {}, "Unexpected token prefix"};
    }

    auto payload_json = core::base64url_decode(segments->payload);
    auto signature = core::base64url_decode(segments->signature);
    if (!payload_json || !signature) {
        return {false, {}, "Invalid segment encoding"};
    }

    core::JwtValidator checker(core::JwtValidatorConfig{});
    if (!checker.verify_signature(key.algorithm, segments->signing_input, *signature, key)) {
        return {false, {}, "Invalid signature"};
    }

    try {
        auto payload = nlohmann::json::parse(*payload_json);
        if (!payload.is_object() || !payload.contains("exp") || !payload["exp"].is_number()) {
            return {false, {}, "Invalid claims format"};
        }
        if (payload["exp"].get<int64_t>() <= to_unix_seconds(Clock::now())) {
            return {false, {}, "Token expired"};
        }
        auto aud = payload.value("aud", "");
        if (core::to_upper(aud) != core::to_upper(expected_audience)) {
            return {false, {}, "Audience mismatch"};
        }
        return {true, std::move(payload), {}};
    } catch (const nlohmann::json::exception&) {
        return {false, {}, "Invalid claims format"};
    }
}

nlohmann::json ExchangeTokenIssuer::public_jwks() const {
    nlohmann::json keys = nlohmann::json::array();
    if (signing_key_ && signing_key_->valid()) {
        if (auto jwk = core::public_key_to_jwk(signing_key_->native_handle(),
                                               signing_key_->algorithm(),
                                               signing_key_->key_id())) {
            keys.push_back(jwk->to_json());
        }
    }
    return nlohmann::json{{"keys", keys}};
}

}  // namespace accord::federation
