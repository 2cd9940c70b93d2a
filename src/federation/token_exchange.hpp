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

// Accord Token Exchange - Header
// Short-lived delegated access tokens for a peer instance (RFC 8693 style)

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/error.hpp"
#include "../core/jwt.hpp"
#include "token_validator.hpp"
#include "trust_store.hpp"

namespace accord::federation {

inline constexpr std::string_view TOKEN_TYPE_ACCESS_TOKEN =
    "urn:ietf:params:oauth:token-type:access_token";

/// Hard ceiling on exchange token lifetime
inline constexpr std::chrono::seconds MAX_EXCHANGE_TOKEN_TTL{900};

struct TokenExchangeRequest {
    std::string subject_token;
    std::string subject_token_type{TOKEN_TYPE_ACCESS_TOKEN};
    std::string origin_instance;  // Issuer of subject_token
    std::string target_instance;  // Audience of the new token
    std::vector<std::string> requested_scopes;
    std::string requested_token_type;
    std::string request_id;
};

struct TokenExchangeResult {
    bool success = false;

    // RFC 8693 response
    std::string access_token;
    std::string token_type;
    int64_t expires_in = 0;
    std::string issued_token_type;
    std::string scope;

    std::string origin_instance;
    std::string target_instance;
    core::ErrorCode code = core::ErrorCode::None;  // InvalidGrant, SigningFailed
    std::string error_description;
    std::string audit_id;

    [[nodiscard]] static TokenExchangeResult failure(core::ErrorCode code,
                                                     std::string description,
                                                     const TokenExchangeRequest& request,
                                                     std::string audit_id) {
        TokenExchangeResult r;
        r.code = code;
        r.error_description = std::move(description);
        r.origin_instance = request.origin_instance;
        r.target_instance = request.target_instance;
        r.audit_id = std::move(audit_id);
        return r;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return success; }
};

/// RFC 8693 success body, or {error, error_description}
void to_json(nlohmann::json& j, const TokenExchangeResult& r);

struct ExchangeIssuerConfig {
    std::string local_instance;
    std::string issuer;               // iss of minted tokens
    std::string prefix = "accord";    // First token segment
    std::chrono::seconds ttl{900};    // Clamped to MAX_EXCHANGE_TOKEN_TTL
};

/// Outcome of checking an exchange token
struct ExchangeTokenVerification {
    bool valid = false;
    nlohmann::json payload;
    std::string error;

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Mints exchange tokens: prefix.base64url(payload).base64url(signature), the
/// signature covering "prefix.payload" under this instance's private key.
class ExchangeTokenIssuer {
public:
    ExchangeTokenIssuer(ExchangeIssuerConfig config, std::shared_ptr<const TrustMatrix> trust,
                        std::shared_ptr<TokenValidator> validator,
                        std::shared_ptr<const core::SigningKey> signing_key);

    ExchangeTokenIssuer(const ExchangeTokenIssuer&) = delete;
    ExchangeTokenIssuer& operator=(const ExchangeTokenIssuer&) = delete;

    [[nodiscard]] TokenExchangeResult exchange(const TokenExchangeRequest& request);

    /// Check a token minted by this issuer: prefix, signature, expiry, audience
    [[nodiscard]] ExchangeTokenVerification verify(std::string_view token,
                                                   std::string_view expected_audience) const;

    /// Same checks against another issuer's published key
    [[nodiscard]] static ExchangeTokenVerification verify_with_key(
        std::string_view token, std::string_view prefix, const core::VerificationKey& key,
        std::string_view expected_audience);

    /// Public half of the signing key as {"keys":[JWK]}
    [[nodiscard]] nlohmann::json public_jwks() const;

    [[nodiscard]] std::chrono::seconds ttl() const noexcept { return config_.ttl; }
    [[nodiscard]] const std::string& prefix() const noexcept { return config_.prefix; }

private:
    [[nodiscard]] std::optional<std::string> mint(const TokenClaims& claims,
                                                  const BilateralTrust& trust,
                                                  std::string_view target_instance,
                                                  const std::vector<std::string>& scopes,
                                                  int64_t issued_at, int64_t expires_at) const;

    ExchangeIssuerConfig config_;
    std::shared_ptr<const TrustMatrix> trust_;
    std::shared_ptr<TokenValidator> validator_;
    std::shared_ptr<const core::SigningKey> signing_key_;
    std::optional<core::VerificationKey> verification_key_;
};

}  // namespace accord::federation
