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

// Accord JWT - Implementation

#include "jwt.hpp"

#include <algorithm>
#include <cstdio>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/hmac.h>
#include <openssl/pem.h>

namespace accord::core {

namespace {

const unsigned char* as_bytes(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

std::optional<JwtAlgorithm> algorithm_for_key(EVP_PKEY* pkey) {
    switch (EVP_PKEY_base_id(pkey)) {
        case EVP_PKEY_EC:
            return JwtAlgorithm::ES256;
        case EVP_PKEY_RSA:
            return JwtAlgorithm::RS256;
        default:
            return std::nullopt;
    }
}

bool key_matches_algorithm(EVP_PKEY* pkey, JwtAlgorithm alg) {
    auto key_alg = algorithm_for_key(pkey);
    return key_alg && *key_alg == alg;
}

std::string bio_to_string(BIO* bio) {
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio, &mem);
    if (!mem || !mem->data) {
        return "";
    }
    return std::string(mem->data, mem->length);
}

}  // namespace

// ============================================================================
// Base64url
// ============================================================================

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bmem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    BIO_flush(b64);

    std::string result = bio_to_string(b64);
    BIO_free_all(b64);

    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());
    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return std::string{};
    }

    std::string base64(input);
    for (char c : base64) {
        bool allowed = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                       c == '-' || c == '_' || c == '+' || c == '/' || c == '=';
        if (!allowed) {
            return std::nullopt;
        }
    }
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');
    base64.append((4 - (base64.size() % 4)) % 4, '=');

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.size()));
    bmem = BIO_push(b64, bmem);
    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> buffer(base64.size());
    int decoded_size = BIO_read(bmem, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bmem);

    if (decoded_size <= 0) {
        return std::nullopt;
    }
    return std::string(buffer.data(), static_cast<size_t>(decoded_size));
}

// ============================================================================
// ECDSA signature encodings
// ============================================================================

std::optional<std::string> ieee_p1363_to_der(std::string_view signature) {
    if (signature.empty() || signature.size() % 2 != 0) {
        return std::nullopt;
    }
    const int half = static_cast<int>(signature.size() / 2);

    BIGNUM* r = BN_bin2bn(as_bytes(signature), half, nullptr);
    BIGNUM* s = BN_bin2bn(as_bytes(signature) + half, half, nullptr);
    ECDSA_SIG* sig = ECDSA_SIG_new();
    if (!r || !s || !sig) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    // sig takes ownership of r and s
    if (ECDSA_SIG_set0(sig, r, s) != 1) {
        BN_free(r);
        BN_free(s);
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    int der_len = i2d_ECDSA_SIG(sig, nullptr);
    if (der_len <= 0) {
        ECDSA_SIG_free(sig);
        return std::nullopt;
    }

    std::string der(static_cast<size_t>(der_len), '\0');
    auto* out = reinterpret_cast<unsigned char*>(der.data());
    i2d_ECDSA_SIG(sig, &out);
    ECDSA_SIG_free(sig);
    return der;
}

std::optional<std::string> der_to_ieee_p1363(std::string_view der, size_t coordinate_size) {
    const unsigned char* in = as_bytes(der);
    ECDSA_SIG* sig = d2i_ECDSA_SIG(nullptr, &in, static_cast<long>(der.size()));
    if (!sig) {
        return std::nullopt;
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig, &r, &s);

    std::string raw(coordinate_size * 2, '\0');
    auto* out = reinterpret_cast<unsigned char*>(raw.data());
    bool ok = BN_bn2binpad(r, out, static_cast<int>(coordinate_size)) > 0 &&
              BN_bn2binpad(s, out + coordinate_size, static_cast<int>(coordinate_size)) > 0;
    ECDSA_SIG_free(sig);

    if (!ok) {
        return std::nullopt;
    }
    return raw;
}

// ============================================================================
// Algorithm Utilities
// ============================================================================

std::optional<JwtAlgorithm> parse_algorithm(std::string_view alg_str) {
    if (alg_str == "RS256") {
        return JwtAlgorithm::RS256;
    } else if (alg_str == "ES256") {
        return JwtAlgorithm::ES256;
    } else if (alg_str == "HS256") {
        return JwtAlgorithm::HS256;
    } else if (alg_str == "none") {
        return JwtAlgorithm::None;
    }
    return std::nullopt;
}

std::string_view algorithm_to_string(JwtAlgorithm alg) {
    switch (alg) {
        case JwtAlgorithm::RS256:
            return "RS256";
        case JwtAlgorithm::ES256:
            return "ES256";
        case JwtAlgorithm::HS256:
            return "HS256";
        case JwtAlgorithm::None:
            return "none";
    }
    return "unknown";
}

// ============================================================================
// Header / Claims
// ============================================================================

std::optional<JwtHeader> JwtHeader::parse(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object() || !j.contains("alg") || !j["alg"].is_string()) {
            return std::nullopt;
        }

        auto alg = parse_algorithm(j["alg"].get<std::string>());
        if (!alg) {
            return std::nullopt;
        }

        JwtHeader header;
        header.algorithm = *alg;
        header.type = j.value("typ", "JWT");
        header.key_id = j.value("kid", "");
        return header;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

bool JwtClaims::has_audience(std::string_view audience) const {
    return std::find(aud.begin(), aud.end(), audience) != aud.end();
}

std::optional<JwtClaims> JwtClaims::parse(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            return std::nullopt;
        }

        JwtClaims claims;
        claims.sub = j.value("sub", "");
        claims.iss = j.value("iss", "");
        if (j.contains("aud")) {
            const auto& aud = j["aud"];
            if (aud.is_string()) {
                claims.aud.push_back(aud.get<std::string>());
            } else if (aud.is_array()) {
                for (const auto& entry : aud) {
                    if (entry.is_string()) {
                        claims.aud.push_back(entry.get<std::string>());
                    }
                }
            }
        }
        claims.exp = j.value("exp", int64_t(0));
        claims.iat = j.value("iat", int64_t(0));
        claims.nbf = j.value("nbf", int64_t(0));
        claims.jti = j.value("jti", "");
        claims.scope = j.value("scope", "");
        claims.custom = std::move(j);
        return claims;
    } catch (const nlohmann::json::exception&) {
        // Wrong claim types (e.g. exp as string) land here too
        return std::nullopt;
    }
}

// ============================================================================
// VerificationKey
// ============================================================================

VerificationKey::~VerificationKey() {
    if (public_key) {
        EVP_PKEY_free(public_key);
        public_key = nullptr;
    }
}

VerificationKey::VerificationKey(VerificationKey&& other) noexcept
    : algorithm(other.algorithm),
      key_id(std::move(other.key_id)),
      public_key(other.public_key),
      hmac_secret(std::move(other.hmac_secret)) {
    other.public_key = nullptr;
}

VerificationKey& VerificationKey::operator=(VerificationKey&& other) noexcept {
    if (this != &other) {
        if (public_key) {
            EVP_PKEY_free(public_key);
        }
        algorithm = other.algorithm;
        key_id = std::move(other.key_id);
        public_key = other.public_key;
        hmac_secret = std::move(other.hmac_secret);
        other.public_key = nullptr;
    }
    return *this;
}

std::optional<VerificationKey> VerificationKey::load_public_key(JwtAlgorithm alg,
                                                                 std::string_view key_id,
                                                                 std::string_view pem_path) {
    FILE* fp = std::fopen(std::string(pem_path).c_str(), "r");
    if (!fp) {
        return std::nullopt;
    }
    EVP_PKEY* pkey = PEM_read_PUBKEY(fp, nullptr, nullptr, nullptr);
    std::fclose(fp);

    if (!pkey) {
        return std::nullopt;
    }
    if (!key_matches_algorithm(pkey, alg)) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }

    VerificationKey key;
    key.algorithm = alg;
    key.key_id = std::string(key_id);
    key.public_key = pkey;
    return key;
}

std::optional<VerificationKey> VerificationKey::from_pem(JwtAlgorithm alg, std::string_view key_id,
                                                          std::string_view pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return std::nullopt;
    }
    EVP_PKEY* pkey = PEM_read_bio_PUBKEY(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        return std::nullopt;
    }
    if (!key_matches_algorithm(pkey, alg)) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }

    VerificationKey key;
    key.algorithm = alg;
    key.key_id = std::string(key_id);
    key.public_key = pkey;
    return key;
}

std::optional<VerificationKey> VerificationKey::load_hmac_secret(std::string_view key_id,
                                                                  std::string_view secret) {
    auto decoded = base64url_decode(secret);
    if (!decoded || decoded->empty()) {
        return std::nullopt;
    }

    VerificationKey key;
    key.algorithm = JwtAlgorithm::HS256;
    key.key_id = std::string(key_id);
    key.hmac_secret.assign(decoded->begin(), decoded->end());
    return key;
}

// ============================================================================
// KeyManager
// ============================================================================

void KeyManager::add_key(VerificationKey key) {
    keys_.push_back(std::move(key));
}

const VerificationKey* KeyManager::get_key(JwtAlgorithm alg, std::string_view key_id) const {
    for (const auto& key : keys_) {
        if (key.algorithm == alg && (key_id.empty() || key.key_id == key_id)) {
            return &key;
        }
    }
    return nullptr;
}

bool KeyManager::has_key_id(std::string_view key_id) const {
    return std::any_of(keys_.begin(), keys_.end(),
                       [&](const VerificationKey& key) { return key.key_id == key_id; });
}

// ============================================================================
// SigningKey
// ============================================================================

SigningKey::~SigningKey() {
    if (private_key_) {
        EVP_PKEY_free(private_key_);
        private_key_ = nullptr;
    }
}

SigningKey::SigningKey(SigningKey&& other) noexcept
    : private_key_(other.private_key_),
      algorithm_(other.algorithm_),
      key_id_(std::move(other.key_id_)) {
    other.private_key_ = nullptr;
}

SigningKey& SigningKey::operator=(SigningKey&& other) noexcept {
    if (this != &other) {
        if (private_key_) {
            EVP_PKEY_free(private_key_);
        }
        private_key_ = other.private_key_;
        algorithm_ = other.algorithm_;
        key_id_ = std::move(other.key_id_);
        other.private_key_ = nullptr;
    }
    return *this;
}

std::optional<SigningKey> SigningKey::load_private_key(std::string_view key_id,
                                                        std::string_view pem_path) {
    FILE* fp = std::fopen(std::string(pem_path).c_str(), "r");
    if (!fp) {
        return std::nullopt;
    }
    EVP_PKEY* pkey = PEM_read_PrivateKey(fp, nullptr, nullptr, nullptr);
    std::fclose(fp);

    if (!pkey) {
        return std::nullopt;
    }
    auto alg = algorithm_for_key(pkey);
    if (!alg) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }
    return SigningKey(pkey, *alg, std::string(key_id));
}

std::optional<SigningKey> SigningKey::from_pem(std::string_view key_id, std::string_view pem) {
    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        return std::nullopt;
    }
    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);

    if (!pkey) {
        return std::nullopt;
    }
    auto alg = algorithm_for_key(pkey);
    if (!alg) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }
    return SigningKey(pkey, *alg, std::string(key_id));
}

std::optional<SigningKey> SigningKey::generate_es256(std::string_view key_id) {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!pctx) {
        return std::nullopt;
    }

    EVP_PKEY* pkey = nullptr;
    bool ok = EVP_PKEY_keygen_init(pctx) > 0 &&
              EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) > 0 &&
              EVP_PKEY_keygen(pctx, &pkey) > 0;
    EVP_PKEY_CTX_free(pctx);

    if (!ok || !pkey) {
        EVP_PKEY_free(pkey);
        return std::nullopt;
    }
    return SigningKey(pkey, JwtAlgorithm::ES256, std::string(key_id));
}

std::optional<std::string> SigningKey::sign(std::string_view message) const {
    if (!private_key_) {
        return std::nullopt;
    }

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return std::nullopt;
    }

    std::string signature;
    size_t sig_len = 0;
    bool ok = EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, private_key_) == 1 &&
              EVP_DigestSign(ctx, nullptr, &sig_len, as_bytes(message), message.size()) == 1;
    if (ok) {
        signature.resize(sig_len);
        ok = EVP_DigestSign(ctx, reinterpret_cast<unsigned char*>(signature.data()), &sig_len,
                            as_bytes(message), message.size()) == 1;
        signature.resize(sig_len);
    }
    EVP_MD_CTX_free(ctx);

    if (!ok) {
        return std::nullopt;
    }
    if (algorithm_ == JwtAlgorithm::ES256) {
        return der_to_ieee_p1363(signature);
    }
    return signature;
}

std::string SigningKey::public_key_pem() const {
    if (!private_key_) {
        return "";
    }
    BIO* bio = BIO_new(BIO_s_mem());
    if (!bio) {
        return "";
    }
    std::string pem;
    if (PEM_write_bio_PUBKEY(bio, private_key_) == 1) {
        pem = bio_to_string(bio);
    }
    BIO_free(bio);
    return pem;
}

std::optional<VerificationKey> SigningKey::verification_key() const {
    auto pem = public_key_pem();
    if (pem.empty()) {
        return std::nullopt;
    }
    return VerificationKey::from_pem(algorithm_, key_id_, pem);
}

// ============================================================================
// Token encoding
// ============================================================================

std::optional<TokenSegments> split_token(std::string_view token) {
    auto first = token.find('.');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = token.find('.', first + 1);
    if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
        return std::nullopt;
    }

    TokenSegments segments;
    segments.header = token.substr(0, first);
    segments.payload = token.substr(first + 1, second - first - 1);
    segments.signature = token.substr(second + 1);
    segments.signing_input = token.substr(0, second);

    if (segments.header.empty() || segments.payload.empty() || segments.signature.empty()) {
        return std::nullopt;
    }
    return segments;
}

std::optional<JwtHeader> peek_header(std::string_view token) {
    auto segments = split_token(token);
    if (!segments) {
        return std::nullopt;
    }
    auto header_json = base64url_decode(segments->header);
    if (!header_json) {
        return std::nullopt;
    }
    return JwtHeader::parse(*header_json);
}

std::optional<std::string> encode_jwt(const nlohmann::json& payload, const SigningKey& key) {
    nlohmann::json header = {{"alg", algorithm_to_string(key.algorithm())}, {"typ", "JWT"}};
    if (!key.key_id().empty()) {
        header["kid"] = key.key_id();
    }

    std::string signing_input =
        base64url_encode(header.dump()) + "." + base64url_encode(payload.dump());
    auto signature = key.sign(signing_input);
    if (!signature) {
        return std::nullopt;
    }
    return signing_input + "." + base64url_encode(*signature);
}

// ============================================================================
// JwtValidator
// ============================================================================

JwtValidator::JwtValidator(JwtValidatorConfig config) : config_(std::move(config)) {}

ValidationResult JwtValidator::validate(std::string_view token, const KeyManager& keys) const {
    // STEP 1: Split and decode
    auto segments = split_token(token);
    if (!segments) {
        return ValidationResult::failure(TokenError::Malformed, "Malformed JWT");
    }

    auto header_json = base64url_decode(segments->header);
    auto payload_json = base64url_decode(segments->payload);
    auto signature = base64url_decode(segments->signature);
    if (!header_json || !payload_json || !signature) {
        return ValidationResult::failure(TokenError::Malformed, "Invalid segment encoding");
    }

    // STEP 2: Header
    auto header = JwtHeader::parse(*header_json);
    if (!header) {
        return ValidationResult::failure(TokenError::Malformed, "Invalid header format");
    }
    if (header->algorithm == JwtAlgorithm::None) {
        return ValidationResult::failure(TokenError::UnsupportedAlgorithm,
                                         "Algorithm 'none' not allowed");
    }

    // STEP 3: Key lookup
    const VerificationKey* key = keys.get_key(header->algorithm, header->key_id);
    if (!key) {
        return ValidationResult::failure(TokenError::UnknownKey, "Unknown key ID");
    }

    // STEP 4: Signature
    if (!verify_signature(header->algorithm, segments->signing_input, *signature, *key)) {
        return ValidationResult::failure(TokenError::BadSignature, "Invalid signature");
    }

    // STEP 5: Claims
    auto claims = JwtClaims::parse(*payload_json);
    if (!claims) {
        return ValidationResult::failure(TokenError::Malformed, "Invalid claims format");
    }
    return validate_claims(std::move(*claims));
}

bool JwtValidator::verify_signature(JwtAlgorithm alg, std::string_view message,
                                    std::string_view signature,
                                    const VerificationKey& key) const {
    switch (alg) {
        case JwtAlgorithm::RS256:
        case JwtAlgorithm::ES256: {
            if (!key.public_key) {
                return false;
            }

            // JOSE ES256 signatures are fixed 64-byte r||s
            std::string der;
            if (alg == JwtAlgorithm::ES256) {
                if (signature.size() != 64) {
                    return false;
                }
                auto converted = ieee_p1363_to_der(signature);
                if (!converted) {
                    return false;
                }
                der = std::move(*converted);
                signature = der;
            }

            EVP_MD_CTX* ctx = EVP_MD_CTX_new();
            if (!ctx) {
                return false;
            }
            bool valid =
                EVP_DigestVerifyInit(ctx, nullptr, EVP_sha256(), nullptr, key.public_key) == 1 &&
                EVP_DigestVerifyUpdate(ctx, message.data(), message.size()) == 1 &&
                EVP_DigestVerifyFinal(ctx, as_bytes(signature), signature.size()) == 1;
            EVP_MD_CTX_free(ctx);
            return valid;
        }

        case JwtAlgorithm::HS256: {
            if (key.hmac_secret.empty()) {
                return false;
            }
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int digest_len = 0;
            if (!HMAC(EVP_sha256(), key.hmac_secret.data(),
                      static_cast<int>(key.hmac_secret.size()), as_bytes(message), message.size(),
                      digest, &digest_len)) {
                return false;
            }
            if (digest_len != signature.size()) {
                return false;
            }
            return CRYPTO_memcmp(digest, signature.data(), digest_len) == 0;
        }

        case JwtAlgorithm::None:
            return false;
    }
    return false;
}

ValidationResult JwtValidator::validate_claims(JwtClaims claims) const {
    auto now = static_cast<int64_t>(std::time(nullptr));

    if (claims.exp > 0) {
        if (claims.exp + config_.clock_skew_seconds < now) {
            return ValidationResult::failure(TokenError::Expired, "Token expired");
        }
    } else if (config_.require_exp) {
        return ValidationResult::failure(TokenError::Malformed, "Missing exp claim");
    }

    if (claims.nbf > 0 && claims.nbf - config_.clock_skew_seconds > now) {
        return ValidationResult::failure(TokenError::NotYetValid, "Token not yet valid");
    }

    if (!config_.allowed_issuers.empty() &&
        std::find(config_.allowed_issuers.begin(), config_.allowed_issuers.end(), claims.iss) ==
            config_.allowed_issuers.end()) {
        return ValidationResult::failure(TokenError::ClaimMismatch, "Invalid issuer");
    }

    if (!config_.allowed_audiences.empty()) {
        bool accepted =
            std::any_of(config_.allowed_audiences.begin(), config_.allowed_audiences.end(),
                        [&](const std::string& aud) { return claims.has_audience(aud); });
        if (!accepted) {
            return ValidationResult::failure(TokenError::ClaimMismatch, "Invalid audience");
        }
    }

    return ValidationResult::success(std::move(claims));
}

}  // namespace accord::core
