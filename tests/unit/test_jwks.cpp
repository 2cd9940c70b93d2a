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
#include <ctime>
#include <thread>

#include "core/jwks.hpp"
#include "mocks.hpp"

using namespace accord::core;
using accord::testing::MockHttpClient;

namespace {

const std::string kJwksUrl = "https://gbr.example/.well-known/jwks.json";

nlohmann::json jwks_for(const SigningKey& key) {
    auto jwk = public_key_to_jwk(key.native_handle(), key.algorithm(), key.key_id());
    REQUIRE(jwk.has_value());
    return {{"keys", nlohmann::json::array({jwk->to_json()})}};
}

}  // namespace

TEST_CASE("JsonWebKey parsing", "[jwks]") {
    SECTION("RSA key") {
        auto jwk = JsonWebKey::parse(
            {{"kty", "RSA"}, {"kid", "r1"}, {"n", "sXch"}, {"e", "AQAB"}, {"alg", "RS256"}});
        REQUIRE(jwk.has_value());
        REQUIRE(jwk->kty == "RSA");
        REQUIRE(jwk->use == "sig");
        REQUIRE(jwk->e == "AQAB");
    }

    SECTION("EC key") {
        auto jwk = JsonWebKey::parse(
            {{"kty", "EC"}, {"kid", "e1"}, {"crv", "P-256"}, {"x", "AAAA"}, {"y", "BBBB"}});
        REQUIRE(jwk.has_value());
        REQUIRE(jwk->crv == "P-256");
    }

    SECTION("missing material") {
        REQUIRE_FALSE(JsonWebKey::parse({{"kty", "RSA"}, {"n", "sXch"}}).has_value());
        REQUIRE_FALSE(JsonWebKey::parse({{"kty", "EC"}, {"x", "AAAA"}}).has_value());
    }

    SECTION("unsupported key type") {
        REQUIRE_FALSE(JsonWebKey::parse({{"kty", "oct"}, {"k", "c2VjcmV0"}}).has_value());
        REQUIRE_FALSE(JsonWebKey::parse(nlohmann::json::array()).has_value());
    }
}

TEST_CASE("JWKS document parsing", "[jwks]") {
    auto keys = parse_jwks(R"({"keys":[
        {"kty":"EC","kid":"a","crv":"P-256","x":"AAAA","y":"BBBB"},
        "not-an-object",
        {"kty":"oct","k":"c2VjcmV0"}
    ]})");
    REQUIRE(keys.has_value());
    REQUIRE(keys->size() == 1);
    REQUIRE(keys->front().kid == "a");

    REQUIRE_FALSE(parse_jwks(R"({"items":[]})").has_value());
    REQUIRE_FALSE(parse_jwks(R"({"keys":{}})").has_value());
    REQUIRE_FALSE(parse_jwks("{broken").has_value());
}

TEST_CASE("JWK conversion round trip verifies real signatures", "[jwks][es256]") {
    auto signer = SigningKey::generate_es256("gbr-2025");
    REQUIRE(signer.has_value());

    auto jwk = public_key_to_jwk(signer->native_handle(), JwtAlgorithm::ES256, "gbr-2025");
    REQUIRE(jwk.has_value());
    REQUIRE(jwk->kty == "EC");
    REQUIRE(jwk->alg == "ES256");
    REQUIRE(jwk->x.size() == 43);  // 32 bytes unpadded

    auto key = jwk_to_verification_key(*jwk);
    REQUIRE(key.has_value());
    REQUIRE(key->algorithm == JwtAlgorithm::ES256);
    REQUIRE(key->key_id == "gbr-2025");

    KeyManager keys;
    keys.add_key(std::move(*key));

    nlohmann::json payload = {{"sub", "bob"},
                              {"exp", static_cast<int64_t>(std::time(nullptr)) + 60}};
    auto token = encode_jwt(payload, *signer);
    REQUIRE(token.has_value());
    REQUIRE(JwtValidator(JwtValidatorConfig{}).validate(*token, keys).valid);
}

TEST_CASE("JWK conversion rejects unusable keys", "[jwks]") {
    JsonWebKey encryption_key;
    encryption_key.kty = "EC";
    encryption_key.crv = "P-256";
    encryption_key.use = "enc";
    encryption_key.x = "AAAA";
    encryption_key.y = "BBBB";
    REQUIRE_FALSE(jwk_to_verification_key(encryption_key).has_value());

    JsonWebKey wrong_curve = encryption_key;
    wrong_curve.use = "sig";
    wrong_curve.crv = "P-384";
    REQUIRE_FALSE(jwk_to_verification_key(wrong_curve).has_value());

    JsonWebKey bad_point = encryption_key;
    bad_point.use = "sig";
    REQUIRE_FALSE(jwk_to_verification_key(bad_point).has_value());

    REQUIRE_FALSE(public_key_to_jwk(nullptr, JwtAlgorithm::ES256, "x").has_value());
}

TEST_CASE("JwksCache fetches and caches per URL", "[jwks][cache]") {
    auto signer = SigningKey::generate_es256("k1");
    REQUIRE(signer.has_value());

    auto http = std::make_shared<MockHttpClient>();
    http->respond_json(kJwksUrl, 200, jwks_for(*signer));

    JwksCache cache(http, JwksCacheConfig{});

    auto keys = cache.get_keys(kJwksUrl);
    REQUIRE(keys != nullptr);
    REQUIRE(keys->has_key_id("k1"));
    REQUIRE(cache.size() == 1);

    auto again = cache.get_keys(kJwksUrl);
    REQUIRE(again == keys);
    REQUIRE(cache.fetch_count() == 1);
    REQUIRE(http->call_count(kJwksUrl) == 1);

    auto call = http->last_call();
    REQUIRE(call.method == "GET");
    REQUIRE(call.header("Accept") == "application/json");

    cache.clear();
    REQUIRE(cache.size() == 0);
    REQUIRE(cache.get_keys(kJwksUrl) != nullptr);
    REQUIRE(cache.fetch_count() == 2);
}

TEST_CASE("JwksCache refetches after TTL", "[jwks][cache]") {
    auto first = SigningKey::generate_es256("old");
    auto second = SigningKey::generate_es256("new");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    auto http = std::make_shared<MockHttpClient>();
    http->respond_json(kJwksUrl, 200, jwks_for(*first));

    JwksCacheConfig config;
    config.ttl = std::chrono::milliseconds(20);
    JwksCache cache(http, config);

    REQUIRE(cache.get_keys(kJwksUrl)->has_key_id("old"));

    // Key rotation at the peer
    http->respond_json(kJwksUrl, 200, jwks_for(*second));
    std::this_thread::sleep_for(std::chrono::milliseconds(40));

    auto keys = cache.get_keys(kJwksUrl);
    REQUIRE(keys->has_key_id("new"));
    REQUIRE_FALSE(keys->has_key_id("old"));
    REQUIRE(cache.fetch_count() == 2);
}

TEST_CASE("JwksCache serves stale keys when refresh fails", "[jwks][cache]") {
    auto signer = SigningKey::generate_es256("k1");
    REQUIRE(signer.has_value());

    auto http = std::make_shared<MockHttpClient>();
    http->respond_json(kJwksUrl, 200, jwks_for(*signer));

    JwksCacheConfig config;
    config.ttl = std::chrono::milliseconds(10);
    JwksCache cache(http, config);

    auto keys = cache.get_keys(kJwksUrl);
    REQUIRE(keys != nullptr);

    http->fail(kJwksUrl);
    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    auto stale = cache.get_keys(kJwksUrl);
    REQUIRE(stale == keys);
    REQUIRE(cache.fetch_failures() == 1);
    REQUIRE_FALSE(cache.refresh(kJwksUrl));
    REQUIRE(cache.fetch_failures() == 2);
}

TEST_CASE("JwksCache failure modes without a prior key set", "[jwks][cache]") {
    auto http = std::make_shared<MockHttpClient>();
    JwksCache cache(http, JwksCacheConfig{});

    SECTION("transport failure") {
        http->fail(kJwksUrl);
        REQUIRE(cache.get_keys(kJwksUrl) == nullptr);
    }

    SECTION("error status") {
        http->respond(kJwksUrl, 503, "unavailable");
        REQUIRE(cache.get_keys(kJwksUrl) == nullptr);
    }

    SECTION("not a JWKS document") {
        http->respond(kJwksUrl, 200, "<html></html>");
        REQUIRE(cache.get_keys(kJwksUrl) == nullptr);
    }

    SECTION("no usable keys") {
        http->respond(kJwksUrl, 200, R"({"keys":[{"kty":"oct","k":"c2VjcmV0"}]})");
        REQUIRE(cache.get_keys(kJwksUrl) == nullptr);
    }

    REQUIRE(cache.fetch_failures() == 1);
    REQUIRE(cache.size() == 0);
}
