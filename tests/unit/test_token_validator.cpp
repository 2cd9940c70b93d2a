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

#include "federation/token_validator.hpp"
#include "mocks.hpp"

using namespace accord;
using namespace accord::federation;
using accord::testing::MockHttpClient;

namespace {

const std::string kGbrJwks = "https://gbr.example/.well-known/jwks.json";
const std::string kGbrIntrospect = "https://gbr.example/oauth/introspect";
const std::string kFraIntrospect = "https://fra.example/oauth/introspect";

int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

nlohmann::json active_reply(const std::string& sub) {
    return {{"active", true},
            {"sub", sub},
            {"iss", "https://idp.fra.example"},
            {"exp", now_seconds() + 600},
            {"uniqueID", sub + "@fra"},
            {"clearance", "SECRET_DEFENSE"},
            {"acpCOI", {"NATO", "EU"}}};
}

/// USA receives tokens issued by GBR (JWT with published keys) and FRA
/// (opaque, introspection only)
struct ValidatorFixture {
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::shared_ptr<resilience::BreakerRegistry> breakers;
    std::shared_ptr<TokenValidator> validator;
    std::optional<core::SigningKey> gbr_key = core::SigningKey::generate_es256("gbr-1");

    explicit ValidatorFixture(TokenValidatorConfig config = {}) {
        InstanceConfig usa;
        usa.instance_id = "USA";
        usa.country = "USA";

        InstanceConfig gbr;
        gbr.instance_id = "GBR";
        gbr.country = "GBR";
        gbr.introspection_url = kGbrIntrospect;
        gbr.signing_keys_url = kGbrJwks;

        InstanceConfig fra;
        fra.instance_id = "FRA";
        fra.country = "FRA";
        fra.introspection_url = kFraIntrospect;
        fra.introspection_only = true;

        BilateralTrust usa_gbr;
        usa_gbr.source_instance = "USA";
        usa_gbr.target_instance = "GBR";
        usa_gbr.allowed_scopes = {"policy:base", "read:resources"};

        BilateralTrust usa_fra = usa_gbr;
        usa_fra.target_instance = "FRA";

        BilateralTrust usa_esp = usa_gbr;
        usa_esp.target_instance = "ESP";  // Trusted but never registered

        auto instances = std::make_shared<InstanceRegistry>(std::vector{usa, gbr, fra});
        auto trust = std::make_shared<TrustMatrix>(
            std::make_shared<StaticTrustStore>(TrustEdges{usa_gbr, usa_fra, usa_esp}));

        resilience::CircuitBreakerConfig breaker_config;
        breaker_config.failure_threshold = 2;
        breakers = std::make_shared<resilience::BreakerRegistry>(
            breaker_config, std::vector<std::shared_ptr<resilience::CircuitObserver>>{},
            [] { return 0.0; });

        auto jwks = std::make_shared<core::JwksCache>(http, core::JwksCacheConfig{});

        config.local_instance = "USA";
        validator = std::make_shared<TokenValidator>(config, instances, trust, http, jwks,
                                                     breakers);

        REQUIRE(gbr_key.has_value());
        auto jwk = core::public_key_to_jwk(gbr_key->native_handle(), core::JwtAlgorithm::ES256,
                                           "gbr-1");
        http->respond_json(kGbrJwks, 200, {{"keys", nlohmann::json::array({jwk->to_json()})}});
    }

    std::string gbr_token(nlohmann::json payload) const {
        auto token = core::encode_jwt(payload, *gbr_key);
        REQUIRE(token.has_value());
        return *token;
    }

    IntrospectionResult introspect(const std::string& token, const std::string& origin,
                                   std::vector<std::string> scopes = {}) {
        return validator->introspect({token, origin, "USA", "req-1", std::move(scopes)});
    }
};

}  // namespace

TEST_CASE("TokenValidator - Trust gate precedes any I/O", "[token_validator][trust]") {
    ValidatorFixture f;

    SECTION("no edge from the requesting instance") {
        auto result = f.validator->introspect({"token", "USA", "GBR", "req-1", {}});
        REQUIRE_FALSE(result.active);
        REQUIRE_FALSE(result.trust_verified);
        REQUIRE(result.code == core::ErrorCode::NoBilateralTrust);
    }

    SECTION("reverse of an existing edge") {
        auto result = f.validator->introspect({"token", "USA", "FRA", "req-1", {}});
        REQUIRE(result.code == core::ErrorCode::NoBilateralTrust);
    }

    REQUIRE(f.http->call_count() == 0);
}

TEST_CASE("TokenValidator - Unregistered origin", "[token_validator]") {
    ValidatorFixture f;
    auto result = f.introspect("token", "ESP");

    REQUIRE_FALSE(result.active);
    REQUIRE(result.trust_verified);
    REQUIRE(result.code == core::ErrorCode::UnknownInstance);
    REQUIRE(f.http->call_count() == 0);
}

TEST_CASE("TokenValidator - Local signature validation", "[token_validator][local]") {
    ValidatorFixture f;
    auto token = f.gbr_token({{"sub", "alice"},
                              {"iss", "https://idp.gbr.example"},
                              {"exp", now_seconds() + 600},
                              {"uniqueID", "alice@gbr"},
                              {"clearance", "OFFICIAL_SENSITIVE"},
                              {"acpCOI", nlohmann::json::array({"FVEY"})}});

    auto result = f.introspect(token, "GBR", {"read:resources", "admin"});

    REQUIRE(result.active);
    REQUIRE(result.validated_locally);
    REQUIRE(result.trust_verified);
    REQUIRE(result.origin_instance == "GBR");
    REQUIRE(result.claims->unique_id == "alice@gbr");
    REQUIRE(result.claims->clearance == "OFFICIAL_SENSITIVE");
    REQUIRE(result.claims->country_of_affiliation == "GBR");
    REQUIRE(result.claims->instance_code == "GBR");
    REQUIRE(result.claims->community_of_interest == std::vector<std::string>{"FVEY"});
    REQUIRE(*result.scopes_allowed == std::vector<std::string>{"read:resources"});

    REQUIRE(f.http->call_count(kGbrIntrospect) == 0);
    REQUIRE(f.validator->local_validations() == 1);
    REQUIRE(f.validator->remote_introspections() == 0);
}

TEST_CASE("TokenValidator - Local rejection skips introspection", "[token_validator][local]") {
    ValidatorFixture f;

    SECTION("expired") {
        auto token = f.gbr_token({{"sub", "alice"}, {"exp", now_seconds() - 3600}});
        auto result = f.introspect(token, "GBR");
        REQUIRE(result.code == core::ErrorCode::TokenExpired);
    }

    SECTION("signed by another key") {
        auto forger = core::SigningKey::generate_es256("gbr-1");
        auto token = core::encode_jwt({{"sub", "mallory"}, {"exp", now_seconds() + 600}},
                                      *forger);
        auto result = f.introspect(*token, "GBR");
        REQUIRE(result.code == core::ErrorCode::TokenInvalid);
    }

    REQUIRE(f.http->call_count(kGbrIntrospect) == 0);
}

TEST_CASE("TokenValidator - Remote introspection", "[token_validator][remote]") {
    ValidatorFixture f;
    f.http->respond_json(kFraIntrospect, 200, active_reply("jean"));

    auto result = f.introspect("opaque-token abc", "FRA", {"policy:base"});

    REQUIRE(result.active);
    REQUIRE_FALSE(result.validated_locally);
    REQUIRE(result.claims->unique_id == "jean@fra");
    REQUIRE(result.claims->clearance == "SECRET_DEFENSE");
    REQUIRE(result.claims->country_of_affiliation == "FRA");
    REQUIRE(result.claims->community_of_interest == std::vector<std::string>{"NATO", "EU"});
    REQUIRE(*result.scopes_allowed == std::vector<std::string>{"policy:base"});

    auto call = f.http->last_call();
    REQUIRE(call.method == "POST");
    REQUIRE(call.url == kFraIntrospect);
    REQUIRE(call.body == "token=opaque-token+abc");
    REQUIRE(call.header("X-Federated-From") == "USA");

    // FRA publishes no keys, so nothing was fetched
    REQUIRE(f.http->call_count(kGbrJwks) == 0);
    REQUIRE(f.validator->remote_introspections() == 1);
    REQUIRE(f.breakers->get("FRA")->metrics().total_successes == 1);
}

TEST_CASE("TokenValidator - Opaque token for a JWT issuer falls back to introspection",
          "[token_validator][remote]") {
    ValidatorFixture f;
    f.http->respond_json(kGbrIntrospect, 200, active_reply("bob"));

    auto result = f.introspect("not-a-jwt", "GBR");
    REQUIRE(result.active);
    REQUIRE_FALSE(result.validated_locally);
    REQUIRE(f.http->call_count(kGbrIntrospect) == 1);
}

TEST_CASE("TokenValidator - Introspection results are cached", "[token_validator][cache]") {
    ValidatorFixture f;
    f.http->respond_json(kFraIntrospect, 200, active_reply("jean"));

    auto first = f.introspect("opaque", "FRA");
    auto second = f.introspect("opaque", "FRA", {"read:resources"});

    REQUIRE(first.active);
    REQUIRE_FALSE(first.cache_hit);
    REQUIRE(second.active);
    REQUIRE(second.cache_hit);
    REQUIRE(*second.scopes_allowed == std::vector<std::string>{"read:resources"});
    REQUIRE(f.http->call_count(kFraIntrospect) == 1);

    f.validator->clear_cache();
    REQUIRE_FALSE(f.introspect("opaque", "FRA").cache_hit);
    REQUIRE(f.http->call_count(kFraIntrospect) == 2);
}

TEST_CASE("TokenValidator - Cache entries never outlive the token", "[token_validator][cache]") {
    ValidatorFixture f;

    SECTION("remote answer expires before the cache ttl") {
        auto reply = active_reply("jean");
        reply["exp"] = now_seconds() + 2;
        f.http->respond_json(kFraIntrospect, 200, reply);

        REQUIRE(f.introspect("short-lived", "FRA").active);
        REQUIRE(f.validator->cache_stats().size == 1);

        std::this_thread::sleep_for(std::chrono::milliseconds(2100));

        auto result = f.introspect("short-lived", "FRA");
        REQUIRE_FALSE(result.active);
        REQUIRE_FALSE(result.cache_hit);
        REQUIRE(result.code == core::ErrorCode::TokenExpired);
        REQUIRE(f.http->call_count(kFraIntrospect) == 2);
    }

    SECTION("token accepted within clock skew is not cached") {
        auto token = f.gbr_token({{"sub", "alice"}, {"exp", now_seconds() - 5}});

        REQUIRE(f.introspect(token, "GBR").active);
        REQUIRE(f.validator->cache_stats().size == 0);

        REQUIRE_FALSE(f.introspect(token, "GBR").cache_hit);
        REQUIRE(f.validator->local_validations() == 2);
    }
}

TEST_CASE("TokenValidator - Inactive tokens are not cached", "[token_validator][cache]") {
    ValidatorFixture f;
    f.http->respond_json(kFraIntrospect, 200, {{"active", false}});

    auto result = f.introspect("revoked", "FRA");
    REQUIRE_FALSE(result.active);
    REQUIRE(result.code == core::ErrorCode::TokenInvalid);
    REQUIRE(*result.error == "Token is not active");

    (void)f.introspect("revoked", "FRA");
    REQUIRE(f.http->call_count(kFraIntrospect) == 2);
}

TEST_CASE("TokenValidator - Peer refusals and malformed replies", "[token_validator][remote]") {
    ValidatorFixture f;

    SECTION("4xx is an answer, not an outage") {
        f.http->respond(kFraIntrospect, 401, "unauthorized");
        auto result = f.introspect("opaque", "FRA");
        REQUIRE(result.code == core::ErrorCode::TokenInvalid);
        REQUIRE(f.breakers->get("FRA")->metrics().total_failures == 0);
    }

    SECTION("not JSON") {
        f.http->respond(kFraIntrospect, 200, "<html>");
        REQUIRE(f.introspect("opaque", "FRA").code == core::ErrorCode::MalformedResponse);
    }

    SECTION("active without required claims") {
        f.http->respond_json(kFraIntrospect, 200, {{"active", true}, {"sub", "x"}});
        REQUIRE(f.introspect("opaque", "FRA").code == core::ErrorCode::MalformedResponse);
    }

    SECTION("active but already expired") {
        auto reply = active_reply("jean");
        reply["exp"] = now_seconds() - 10;
        f.http->respond_json(kFraIntrospect, 200, reply);
        REQUIRE(f.introspect("opaque", "FRA").code == core::ErrorCode::TokenExpired);
    }
}

TEST_CASE("TokenValidator - Outages open the peer circuit", "[token_validator][circuit]") {
    ValidatorFixture f;
    f.http->respond(kFraIntrospect, 503, "down");

    auto first = f.introspect("opaque", "FRA");
    REQUIRE(first.code == core::ErrorCode::RemoteEvaluationUnavailable);

    f.http->fail(kFraIntrospect, "timeout");
    auto second = f.introspect("opaque", "FRA");
    REQUIRE(second.code == core::ErrorCode::RemoteEvaluationUnavailable);
    REQUIRE(f.breakers->get("FRA")->get_state() == resilience::CircuitState::OPEN);

    // Rejected without touching the network
    auto third = f.introspect("opaque", "FRA");
    REQUIRE(third.code == core::ErrorCode::CircuitOpen);
    REQUIRE(f.http->call_count(kFraIntrospect) == 2);

    // Other peers are unaffected
    REQUIRE(f.breakers->get("GBR")->get_state() == resilience::CircuitState::CLOSED);
}

TEST_CASE("TokenValidator - Maintenance mode", "[token_validator][circuit]") {
    ValidatorFixture f;
    f.http->respond_json(kFraIntrospect, 200, active_reply("jean"));
    f.breakers->enter_maintenance("FRA", "planned upgrade");

    auto result = f.introspect("opaque", "FRA");
    REQUIRE(result.code == core::ErrorCode::MaintenanceMode);
    REQUIRE(f.http->call_count() == 0);

    f.breakers->exit_maintenance("FRA");
    REQUIRE(f.introspect("opaque", "FRA").active);
}

TEST_CASE("Introspection reply parsing", "[token_validator][parse]") {
    InstanceConfig fra;
    fra.instance_id = "FRA";
    fra.country = "FRA";

    SECTION("inactive needs nothing else") {
        auto reply = parse_introspection_reply(R"({"active":false})", fra);
        REQUIRE(reply.has_value());
        REQUIRE_FALSE(reply->active);
    }

    SECTION("active field must be boolean") {
        REQUIRE_FALSE(parse_introspection_reply(R"({"active":"true"})", fra).has_value());
        REQUIRE_FALSE(parse_introspection_reply(R"({})", fra).has_value());
        REQUIRE_FALSE(parse_introspection_reply(R"([true])", fra).has_value());
    }

    SECTION("wrongly typed optional fields are rejected") {
        auto reply = active_reply("jean");
        reply["clearance"] = 3;
        REQUIRE_FALSE(parse_introspection_reply(reply.dump(), fra).has_value());

        reply = active_reply("jean");
        reply["acpCOI"] = {"NATO", 7};
        REQUIRE_FALSE(parse_introspection_reply(reply.dump(), fra).has_value());

        reply = active_reply("jean");
        reply["aud"] = 42;
        REQUIRE_FALSE(parse_introspection_reply(reply.dump(), fra).has_value());
    }

    SECTION("null optional fields are accepted") {
        auto reply = active_reply("jean");
        reply["organizationType"] = nullptr;
        auto parsed = parse_introspection_reply(reply.dump(), fra);
        REQUIRE(parsed.has_value());
        REQUIRE_FALSE(parsed->claims.organization_type.has_value());
    }
}

TEST_CASE("Claims normalization defaults", "[token_validator][claims]") {
    InstanceConfig deu;
    deu.instance_id = "DEU";
    deu.country = "DEU";

    SECTION("minimal payload") {
        auto claims = claims_from_payload({{"sub", "k123"}}, deu);
        REQUIRE(claims.unique_id == "k123");
        REQUIRE(claims.clearance == "UNCLASSIFIED");
        REQUIRE(claims.country_of_affiliation == "DEU");
        REQUIRE(claims.community_of_interest.empty());
        REQUIRE(claims.instance_code == "DEU");
    }

    SECTION("preferred_username before sub") {
        auto claims = claims_from_payload({{"sub", "k123"}, {"preferred_username", "klaus"}}, deu);
        REQUIRE(claims.unique_id == "klaus");
    }

    SECTION("coi alias and string audience") {
        nlohmann::json payload = {
            {"sub", "k"}, {"coi", nlohmann::json::array({"NATO"})}, {"aud", "accord"}};
        auto claims = claims_from_payload(payload, deu);
        REQUIRE(claims.community_of_interest == std::vector<std::string>{"NATO"});
        REQUIRE(claims.aud == std::vector<std::string>{"accord"});
    }
}
