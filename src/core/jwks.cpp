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

// Accord JWKS - Implementation

#include "jwks.hpp"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include "logging.hpp"

namespace accord::core {

namespace {

BIGNUM* decode_bignum(std::string_view b64url) {
    auto bin = base64url_decode(b64url);
    if (!bin || bin->empty()) {
        return nullptr;
    }
    return BN_bin2bn(reinterpret_cast<const unsigned char*>(bin->data()),
                     static_cast<int>(bin->size()), nullptr);
}

std::string encode_bignum(const BIGNUM* bn, int fixed_size = 0) {
    int size = fixed_size > 0 ? fixed_size : BN_num_bytes(bn);
    std::string bin(static_cast<size_t>(size), '\0');
    if (BN_bn2binpad(bn, reinterpret_cast<unsigned char*>(bin.data()), size) < 0) {
        return "";
    }
    return base64url_encode(bin);
}

EVP_PKEY* rsa_jwk_to_evp_pkey(const JsonWebKey& jwk) {
    BIGNUM* n_bn = decode_bignum(jwk.n);
    BIGNUM* e_bn = decode_bignum(jwk.e);
    if (n_bn == nullptr || e_bn == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    RSA* rsa = RSA_new();
    if (rsa == nullptr) {
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    // rsa owns n and e after this call
    if (RSA_set0_key(rsa, n_bn, e_bn, nullptr) != 1) {
        RSA_free(rsa);
        BN_free(n_bn);
        BN_free(e_bn);
        return nullptr;
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (pkey == nullptr || EVP_PKEY_assign_RSA(pkey, rsa) != 1) {
        EVP_PKEY_free(pkey);
        RSA_free(rsa);
        return nullptr;
    }
    return pkey;
}

EVP_PKEY* ec_jwk_to_evp_pkey(const JsonWebKey& jwk) {
    if (jwk.crv != "P-256") {
        return nullptr;
    }

    BIGNUM* x_bn = decode_bignum(jwk.x);
    BIGNUM* y_bn = decode_bignum(jwk.y);
    EC_KEY* ec_key = EC_KEY_new_by_curve_name(NID_X9_62_prime256v1);
    if (x_bn == nullptr || y_bn == nullptr || ec_key == nullptr) {
        BN_free(x_bn);
        BN_free(y_bn);
        EC_KEY_free(ec_key);
        return nullptr;
    }

    // Rejects points that are not on the curve
    int ok = EC_KEY_set_public_key_affine_coordinates(ec_key, x_bn, y_bn);
    BN_free(x_bn);
    BN_free(y_bn);
    if (ok != 1) {
        EC_KEY_free(ec_key);
        return nullptr;
    }

    EVP_PKEY* pkey = EVP_PKEY_new();
    if (pkey == nullptr || EVP_PKEY_assign_EC_KEY(pkey, ec_key) != 1) {
        EVP_PKEY_free(pkey);
        EC_KEY_free(ec_key);
        return nullptr;
    }
    return pkey;
}

}  // namespace

// ============================================================================
// JsonWebKey
// ============================================================================

std::optional<JsonWebKey> JsonWebKey::parse(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    try {
        JsonWebKey jwk;
        jwk.kty = j.value("kty", "");
        jwk.alg = j.value("alg", "");
        jwk.kid = j.value("kid", "");
        jwk.use = j.value("use", "sig");

        if (jwk.kty == "RSA") {
            jwk.n = j.value("n", "");
            jwk.e = j.value("e", "");
            if (jwk.n.empty() || jwk.e.empty()) {
                return std::nullopt;
            }
        } else if (jwk.kty == "EC") {
            jwk.crv = j.value("crv", "");
            jwk.x = j.value("x", "");
            jwk.y = j.value("y", "");
            if (jwk.x.empty() || jwk.y.empty()) {
                return std::nullopt;
            }
        } else {
            return std::nullopt;
        }
        return jwk;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

nlohmann::json JsonWebKey::to_json() const {
    nlohmann::json j = {{"kty", kty}, {"kid", kid}, {"use", use}};
    if (!alg.empty()) {
        j["alg"] = alg;
    }
    if (kty == "RSA") {
        j["n"] = n;
        j["e"] = e;
    } else if (kty == "EC") {
        j["crv"] = crv;
        j["x"] = x;
        j["y"] = y;
    }
    return j;
}

std::optional<std::vector<JsonWebKey>> parse_jwks(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object() || !j.contains("keys") || !j["keys"].is_array()) {
            return std::nullopt;
        }

        std::vector<JsonWebKey> keys;
        for (const auto& entry : j["keys"]) {
            if (auto jwk = JsonWebKey::parse(entry)) {
                keys.push_back(std::move(*jwk));
            }
        }
        return keys;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<VerificationKey> jwk_to_verification_key(const JsonWebKey& jwk) {
    if (!jwk.use.empty() && jwk.use != "sig") {
        return std::nullopt;
    }

    std::optional<JwtAlgorithm> alg;
    if (!jwk.alg.empty()) {
        alg = parse_algorithm(jwk.alg);
    } else if (jwk.kty == "RSA") {
        alg = JwtAlgorithm::RS256;
    } else if (jwk.kty == "EC" && jwk.crv == "P-256") {
        alg = JwtAlgorithm::ES256;
    }
    if (!alg || *alg == JwtAlgorithm::None || *alg == JwtAlgorithm::HS256) {
        return std::nullopt;
    }

    VerificationKey key;
    key.algorithm = *alg;
    key.key_id = jwk.kid;

    if (jwk.kty == "RSA" && *alg == JwtAlgorithm::RS256) {
        key.public_key = rsa_jwk_to_evp_pkey(jwk);
    } else if (jwk.kty == "EC" && *alg == JwtAlgorithm::ES256) {
        key.public_key = ec_jwk_to_evp_pkey(jwk);
    }

    if (key.public_key == nullptr) {
        return std::nullopt;
    }
    return key;
}

std::optional<JsonWebKey> public_key_to_jwk(EVP_PKEY* pkey, JwtAlgorithm alg,
                                            std::string_view key_id) {
    if (pkey == nullptr) {
        return std::nullopt;
    }

    JsonWebKey jwk;
    jwk.kid = std::string(key_id);
    jwk.use = "sig";
    jwk.alg = std::string(algorithm_to_string(alg));

    if (alg == JwtAlgorithm::RS256 && EVP_PKEY_base_id(pkey) == EVP_PKEY_RSA) {
        BIGNUM* n = nullptr;
        BIGNUM* e = nullptr;
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_N, &n) != 1 ||
            EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_E, &e) != 1) {
            BN_free(n);
            BN_free(e);
            return std::nullopt;
        }
        jwk.kty = "RSA";
        jwk.n = encode_bignum(n);
        jwk.e = encode_bignum(e);
        BN_free(n);
        BN_free(e);
        return jwk;
    }

    if (alg == JwtAlgorithm::ES256 && EVP_PKEY_base_id(pkey) == EVP_PKEY_EC) {
        BIGNUM* x = nullptr;
        BIGNUM* y = nullptr;
        if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_X, &x) != 1 ||
            EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_EC_PUB_Y, &y) != 1) {
            BN_free(x);
            BN_free(y);
            return std::nullopt;
        }
        jwk.kty = "EC";
        jwk.crv = "P-256";
        jwk.x = encode_bignum(x, 32);
        jwk.y = encode_bignum(y, 32);
        BN_free(x);
        BN_free(y);
        return jwk;
    }

    return std::nullopt;
}

// ============================================================================
// JwksCache
// ============================================================================

JwksCache::JwksCache(std::shared_ptr<HttpClient> http, JwksCacheConfig config)
    : http_(std::move(http)), config_(config) {}

std::shared_ptr<const KeyManager> JwksCache::get_keys(const std::string& url) {
    std::shared_ptr<const KeyManager> stale;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(url);
        if (it != entries_.end()) {
            if (std::chrono::steady_clock::now() - it->second.fetched_at < config_.ttl) {
                return it->second.keys;
            }
            stale = it->second.keys;
        }
    }

    auto fresh = fetch(url);
    if (!fresh) {
        return stale;
    }

    std::lock_guard lock(mutex_);
    entries_[url] = Entry{fresh, std::chrono::steady_clock::now()};
    return fresh;
}

bool JwksCache::refresh(const std::string& url) {
    auto fresh = fetch(url);
    if (!fresh) {
        return false;
    }
    std::lock_guard lock(mutex_);
    entries_[url] = Entry{std::move(fresh), std::chrono::steady_clock::now()};
    return true;
}

void JwksCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

size_t JwksCache::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::shared_ptr<const KeyManager> JwksCache::fetch(const std::string& url) {
    auto* logger = logging::get_logger();
    fetches_.fetch_add(1, std::memory_order_relaxed);

    auto response = http_->get(url, {{"Accept", "application/json"}}, config_.timeout);
    if (!response.ok()) {
        fetch_failures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "JWKS fetch failed: url={}, status={}, error={}", url,
                    response.status, response.error);
        return nullptr;
    }

    auto jwks = parse_jwks(response.body);
    if (!jwks) {
        fetch_failures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "JWKS document rejected: url={}", url);
        return nullptr;
    }

    auto keys = std::make_shared<KeyManager>();
    for (const auto& jwk : *jwks) {
        if (auto key = jwk_to_verification_key(jwk)) {
            keys->add_key(std::move(*key));
        }
    }

    if (keys->key_count() == 0) {
        fetch_failures_.fetch_add(1, std::memory_order_relaxed);
        LOG_WARNING(logger, "JWKS contained no usable signing keys: url={}", url);
        return nullptr;
    }

    LOG_INFO(logger, "JWKS refreshed: url={}, keys={}", url, keys->key_count());
    return keys;
}

}  // namespace accord::core
