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

// Accord JWT - Header
// Compact JWS verification (RS256/ES256/HS256) and ES256/RS256 signing

#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace accord::core {

/// JWT algorithm types
enum class JwtAlgorithm {
    RS256,  // RSA + SHA-256 (asymmetric)
    ES256,  // ECDSA P-256 + SHA-256 (asymmetric)
    HS256,  // HMAC + SHA-256 (symmetric)
    None    // No signature (always rejected)
};

/// JOSE header
struct JwtHeader {
    JwtAlgorithm algorithm;
    std::string type;     // Usually "JWT"
    std::string key_id;   // kid, selects the issuer key

    [[nodiscard]] static std::optional<JwtHeader> parse(std::string_view json);
};

/// Decoded payload. Domain claims stay in `custom`.
struct JwtClaims {
    std::string sub;
    std::string iss;
    std::vector<std::string> aud;  // String or array on the wire
    int64_t exp = 0;
    int64_t iat = 0;
    int64_t nbf = 0;
    std::string jti;
    std::string scope;
    nlohmann::json custom;

    [[nodiscard]] bool has_audience(std::string_view audience) const;

    [[nodiscard]] static std::optional<JwtClaims> parse(std::string_view json);
};

/// Public key (or HMAC secret) used to check a signature
struct VerificationKey {
    JwtAlgorithm algorithm;
    std::string key_id;

    // Key material (only one is set based on algorithm)
    EVP_PKEY* public_key = nullptr;     // RS256/ES256
    std::vector<uint8_t> hmac_secret;   // HS256

    ~VerificationKey();

    // Non-copyable (owns OpenSSL resources)
    VerificationKey(const VerificationKey&) = delete;
    VerificationKey& operator=(const VerificationKey&) = delete;
    VerificationKey(VerificationKey&&) noexcept;
    VerificationKey& operator=(VerificationKey&&) noexcept;

    VerificationKey() = default;

    /// Load RSA/ECDSA public key from a PEM file
    [[nodiscard]] static std::optional<VerificationKey> load_public_key(JwtAlgorithm alg,
                                                                         std::string_view key_id,
                                                                         std::string_view pem_path);

    /// Parse RSA/ECDSA public key from PEM text
    [[nodiscard]] static std::optional<VerificationKey> from_pem(JwtAlgorithm alg,
                                                                  std::string_view key_id,
                                                                  std::string_view pem);

    /// Load HMAC secret from base64url-encoded string
    [[nodiscard]] static std::optional<VerificationKey> load_hmac_secret(std::string_view key_id,
                                                                          std::string_view secret);
};

/// Keys published by one issuer (supports rotation via kid)
class KeyManager {
public:
    KeyManager() = default;
    ~KeyManager() = default;

    // Non-copyable, movable
    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    KeyManager(KeyManager&&) noexcept = default;
    KeyManager& operator=(KeyManager&&) noexcept = default;

    void add_key(VerificationKey key);

    /// Key matching algorithm and kid (empty kid matches the first key of that algorithm)
    [[nodiscard]] const VerificationKey* get_key(JwtAlgorithm alg,
                                                  std::string_view key_id) const;

    [[nodiscard]] bool has_key_id(std::string_view key_id) const;

    [[nodiscard]] size_t key_count() const noexcept { return keys_.size(); }

    void clear() { keys_.clear(); }

private:
    std::vector<VerificationKey> keys_;
};

/// Private key used to sign tokens minted by this instance
class SigningKey {
public:
    SigningKey() = default;
    ~SigningKey();

    SigningKey(const SigningKey&) = delete;
    SigningKey& operator=(const SigningKey&) = delete;
    SigningKey(SigningKey&&) noexcept;
    SigningKey& operator=(SigningKey&&) noexcept;

    /// Load an EC P-256 or RSA private key from a PEM file
    [[nodiscard]] static std::optional<SigningKey> load_private_key(std::string_view key_id,
                                                                     std::string_view pem_path);

    [[nodiscard]] static std::optional<SigningKey> from_pem(std::string_view key_id,
                                                             std::string_view pem);

    /// Fresh EC P-256 key pair
    [[nodiscard]] static std::optional<SigningKey> generate_es256(std::string_view key_id);

    /// Signature over message (ES256 returns the JOSE r||s form)
    [[nodiscard]] std::optional<std::string> sign(std::string_view message) const;

    /// Public half, for local verification and publication
    [[nodiscard]] std::optional<VerificationKey> verification_key() const;

    /// Public key as PEM (SubjectPublicKeyInfo)
    [[nodiscard]] std::string public_key_pem() const;

    [[nodiscard]] JwtAlgorithm algorithm() const noexcept { return algorithm_; }
    [[nodiscard]] const std::string& key_id() const noexcept { return key_id_; }
    [[nodiscard]] EVP_PKEY* native_handle() const noexcept { return private_key_; }
    [[nodiscard]] bool valid() const noexcept { return private_key_ != nullptr; }

private:
    SigningKey(EVP_PKEY* key, JwtAlgorithm alg, std::string key_id)
        : private_key_(key), algorithm_(alg), key_id_(std::move(key_id)) {}

    EVP_PKEY* private_key_ = nullptr;
    JwtAlgorithm algorithm_ = JwtAlgorithm::ES256;
    std::string key_id_;
};

/// Why a token was rejected
enum class TokenError : uint8_t {
    None,
    Malformed,             // Not three segments, bad encoding, bad JSON
    UnsupportedAlgorithm,  // alg=none or unknown
    UnknownKey,            // No key for (alg, kid)
    BadSignature,
    Expired,
    NotYetValid,
    ClaimMismatch          // iss/aud not accepted
};

[[nodiscard]] constexpr std::string_view to_string(TokenError error) noexcept {
    switch (error) {
        case TokenError::None:
            return "none";
        case TokenError::Malformed:
            return "malformed";
        case TokenError::UnsupportedAlgorithm:
            return "unsupported_algorithm";
        case TokenError::UnknownKey:
            return "unknown_key";
        case TokenError::BadSignature:
            return "bad_signature";
        case TokenError::Expired:
            return "expired";
        case TokenError::NotYetValid:
            return "not_yet_valid";
        case TokenError::ClaimMismatch:
            return "claim_mismatch";
    }
    return "unknown";
}

/// JWT validation result
struct ValidationResult {
    bool valid = false;
    JwtClaims claims;
    std::string error;
    TokenError code = TokenError::None;

    [[nodiscard]] static ValidationResult success(JwtClaims claims) {
        return {true, std::move(claims), "", TokenError::None};
    }

    [[nodiscard]] static ValidationResult failure(TokenError code, std::string error) {
        return {false, {}, std::move(error), code};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// JWT validator configuration
struct JwtValidatorConfig {
    bool require_exp = true;
    std::vector<std::string> allowed_issuers;
    std::vector<std::string> allowed_audiences;
    int64_t clock_skew_seconds = 30;  // Tolerance for exp/nbf
};

/// Stateless JWT validator. Keys are supplied per call so one validator
/// serves every issuer.
class JwtValidator {
public:
    explicit JwtValidator(JwtValidatorConfig config);

    [[nodiscard]] ValidationResult validate(std::string_view token, const KeyManager& keys) const;

    /// Time and issuer/audience checks on already-verified claims
    [[nodiscard]] ValidationResult validate_claims(JwtClaims claims) const;

    /// JOSE signature check over message (also used for exchange tokens)
    [[nodiscard]] bool verify_signature(JwtAlgorithm alg, std::string_view message,
                                        std::string_view signature,
                                        const VerificationKey& key) const;

    [[nodiscard]] const JwtValidatorConfig& config() const noexcept { return config_; }

private:
    JwtValidatorConfig config_;
};

/// Three dot-separated segments of a compact token
struct TokenSegments {
    std::string_view header;
    std::string_view payload;
    std::string_view signature;
    std::string_view signing_input;  // header.payload
};

[[nodiscard]] std::optional<TokenSegments> split_token(std::string_view token);

/// Decode the header without verifying anything
[[nodiscard]] std::optional<JwtHeader> peek_header(std::string_view token);

/// Build header.payload.signature with the given key (alg/kid set from the key)
[[nodiscard]] std::optional<std::string> encode_jwt(const nlohmann::json& payload,
                                                    const SigningKey& key);

// Utility functions

/// Base64url encode (RFC 4648, unpadded)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode (RFC 4648, padding optional)
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// JOSE r||s ECDSA signature to ASN.1 DER (what EVP_DigestVerify expects)
[[nodiscard]] std::optional<std::string> ieee_p1363_to_der(std::string_view signature);

/// ASN.1 DER ECDSA signature to JOSE r||s with fixed-width coordinates
[[nodiscard]] std::optional<std::string> der_to_ieee_p1363(std::string_view der,
                                                           size_t coordinate_size = 32);

[[nodiscard]] std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str);

[[nodiscard]] std::string_view algorithm_to_string(JwtAlgorithm alg);

}  // namespace accord::core
