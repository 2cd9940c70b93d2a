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

#include "federation/policy_client.hpp"
#include "mocks.hpp"

using namespace accord;
using namespace accord::federation;
using accord::testing::MockHttpClient;
using accord::testing::MockPolicyDecisionPoint;

namespace {

const std::string kOpaUrl = "http://opa.local:8181/v1/data/accord/authorization";
const std::string kFraEvaluate = "https://fra.example/api/federation/evaluate-policy";

PolicyRequest sample_request() {
    PolicyRequest request;
    request.subject.unique_id = "john.doe@usa";
    request.subject.clearance = "SECRET";
    request.subject.country_of_affiliation = "USA";
    request.subject.acp_coi = {"NATO"};
    request.subject.origin_instance = "USA";
    request.resource.resource_id = "doc-42";
    request.resource.classification = "CONFIDENTIAL";
    request.resource.releasability_to = {"USA", "FRA"};
    request.resource.instance_id = "FRA";
    request.action = Action::DOWNLOAD;
    request.request_id = "req-42";
    return request;
}

InstanceConfig fra_instance() {
    InstanceConfig fra;
    fra.instance_id = "FRA";
    fra.country = "FRA";
    fra.base_url = "https://fra.example/";
    return fra;
}

}  // namespace

TEST_CASE("OPA client - Decision URL", "[policy_client][opa]") {
    auto http = std::make_shared<MockHttpClient>();

    OpaPolicyClient plain({"http://opa.local:8181", "accord/authorization"}, http);
    REQUIRE(plain.decision_url() == kOpaUrl);

    OpaPolicyClient slashes({"http://opa.local:8181/", "/accord/authorization"}, http);
    REQUIRE(slashes.decision_url() == kOpaUrl);
}

TEST_CASE("OPA client - Input document", "[policy_client][opa]") {
    auto input = OpaPolicyClient::build_input(sample_request())["input"];

    REQUIRE(input["subject"]["authenticated"] == true);
    REQUIRE(input["subject"]["uniqueID"] == "john.doe@usa");
    REQUIRE(input["subject"]["acpCOI"][0] == "NATO");
    REQUIRE_FALSE(input["subject"].contains("dutyOrg"));
    REQUIRE(input["action"]["operation"] == "download");
    REQUIRE(input["resource"]["releasabilityTo"].size() == 2);
    REQUIRE(input["context"]["requestId"] == "req-42");
    REQUIRE(input["context"]["federatedAccess"] == true);
    REQUIRE(input["context"]["originInstance"] == "USA");
    REQUIRE(input["context"]["targetInstance"] == "FRA");
}

TEST_CASE("OPA client - Decision parsing", "[policy_client][opa]") {
    SECTION("nested decision object") {
        auto d = OpaPolicyClient::parse_decision(
            R"({"result":{"decision":{"allow":false,"reason":"Insufficient clearance"}}})");
        REQUIRE(d.has_value());
        REQUIRE_FALSE(d->allow);
        REQUIRE(d->reason == "Insufficient clearance");
        REQUIRE(d->evaluated());
    }

    SECTION("flat result with default reason") {
        auto d = OpaPolicyClient::parse_decision(R"({"result":{"allow":true}})");
        REQUIRE(d.has_value());
        REQUIRE(d->allow);
        REQUIRE(d->reason == "Access allowed");
    }

    SECTION("undefined or malformed") {
        REQUIRE_FALSE(OpaPolicyClient::parse_decision(R"({})").has_value());
        REQUIRE_FALSE(OpaPolicyClient::parse_decision(R"({"result":true})").has_value());
        REQUIRE_FALSE(OpaPolicyClient::parse_decision(R"({"result":{"allow":"yes"}})").has_value());
        REQUIRE_FALSE(OpaPolicyClient::parse_decision("nope").has_value());
    }
}

TEST_CASE("OPA client - Evaluation", "[policy_client][opa]") {
    auto http = std::make_shared<MockHttpClient>();
    OpaPolicyClient client({"http://opa.local:8181", "accord/authorization"}, http);

    SECTION("answered") {
        http->respond_json(kOpaUrl, 200, {{"result", {{"allow", true}, {"reason", "ok"}}}});
        auto decision = client.evaluate(sample_request());
        REQUIRE(decision.allow);
        REQUIRE(decision.reason == "ok");

        auto body = nlohmann::json::parse(http->last_call().body);
        REQUIRE(body["input"]["resource"]["resourceId"] == "doc-42");
    }

    SECTION("engine down fails closed") {
        http->fail(kOpaUrl);
        auto decision = client.evaluate(sample_request());
        REQUIRE_FALSE(decision.allow);
        REQUIRE(decision.code == core::ErrorCode::LocalEvaluationUnavailable);
        REQUIRE(decision.reason == "Policy evaluation unavailable (fail-closed)");
    }

    SECTION("engine error fails closed") {
        http->respond(kOpaUrl, 500, "boom");
        REQUIRE(client.evaluate(sample_request()).code ==
                core::ErrorCode::LocalEvaluationUnavailable);
    }

    SECTION("undefined decision fails closed") {
        http->respond(kOpaUrl, 200, "{}");
        REQUIRE_FALSE(client.evaluate(sample_request()).evaluated());
    }
}

TEST_CASE("Remote policy - Payload and decision parsing", "[policy_client][remote]") {
    auto payload = RemotePolicyClient::build_payload(sample_request(), "SECRET", "USA");
    REQUIRE(payload["subject"]["clearance"] == "SECRET");
    REQUIRE(payload["subject"]["federatedFrom"] == "USA");
    REQUIRE(payload["resource"]["resourceId"] == "doc-42");
    REQUIRE(payload["action"] == "download");
    REQUIRE(payload["requestId"] == "req-42");

    auto with_null = RemotePolicyClient::parse_decision(R"({"allow":false,"reason":null})");
    REQUIRE(with_null.has_value());
    REQUIRE(with_null->reason == "Access denied");

    REQUIRE(RemotePolicyClient::parse_decision(R"({"allow":true,"reason":"ok"})")->allow);
    REQUIRE_FALSE(RemotePolicyClient::parse_decision(R"({"allow":1})").has_value());
    REQUIRE_FALSE(RemotePolicyClient::parse_decision(R"({"allow":true,"reason":5})").has_value());
    REQUIRE_FALSE(RemotePolicyClient::parse_decision("[]").has_value());
}

TEST_CASE("Remote policy - Evaluation at the owning instance", "[policy_client][remote]") {
    auto http = std::make_shared<MockHttpClient>();
    resilience::CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = 2;
    auto breakers = std::make_shared<resilience::BreakerRegistry>(breaker_config);
    auto fallback = std::make_shared<MockPolicyDecisionPoint>(
        PolicyDecision::answered(true, "Local fallback allowed"));

    RemotePolicyClient client({"USA", std::chrono::milliseconds(1000)}, http, breakers, fallback);

    SECTION("answered with headers") {
        http->respond_json(kFraEvaluate, 200, {{"allow", true}, {"reason", "Releasable"}});
        auto request = sample_request();
        request.bearer_token = "tok";

        auto decision = client.evaluate(request, fra_instance(), "SECRET");
        REQUIRE(decision.allow);
        REQUIRE(decision.instance_id == "FRA");
        REQUIRE_FALSE(decision.local_fallback);

        auto call = http->last_call();
        REQUIRE(call.url == kFraEvaluate);
        REQUIRE(call.header("X-Request-Id") == "req-42");
        REQUIRE(call.header("X-Federated-From") == "USA");
        REQUIRE(call.header("Authorization") == "Bearer tok");
        REQUIRE(client.remote_calls() == 1);
    }

    SECTION("no bearer token, no Authorization header") {
        http->respond_json(kFraEvaluate, 200, {{"allow", false}});
        auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE_FALSE(decision.allow);
        REQUIRE(decision.evaluated());
        REQUIRE(http->last_call().header("Authorization").empty());
    }

    SECTION("missing endpoint falls back to the local engine") {
        http->respond(kFraEvaluate, 404, "not found");
        auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE(decision.allow);
        REQUIRE(decision.local_fallback);
        REQUIRE(decision.instance_id == "FRA");
        REQUIRE(fallback->call_count() == 1);
        REQUIRE(fallback->last_request().subject.clearance == "SECRET");
    }

    SECTION("other client errors fail closed without tripping the breaker") {
        http->respond(kFraEvaluate, 403, "forbidden");
        auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE(decision.code == core::ErrorCode::RemoteEvaluationUnavailable);
        REQUIRE(breakers->get("FRA")->metrics().total_failures == 0);
    }

    SECTION("malformed reply") {
        http->respond(kFraEvaluate, 200, R"({"permit":true})");
        auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE(decision.code == core::ErrorCode::MalformedResponse);
        REQUIRE_FALSE(decision.allow);
    }

    SECTION("outage opens the circuit") {
        http->respond(kFraEvaluate, 502, "bad gateway");
        REQUIRE(client.evaluate(sample_request(), fra_instance(), "SECRET").code ==
                core::ErrorCode::RemoteEvaluationUnavailable);
        REQUIRE(client.evaluate(sample_request(), fra_instance(), "SECRET").code ==
                core::ErrorCode::RemoteEvaluationUnavailable);

        auto rejected = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE(rejected.code == core::ErrorCode::CircuitOpen);
        REQUIRE(http->call_count(kFraEvaluate) == 2);
    }

    SECTION("maintenance") {
        breakers->enter_maintenance("FRA", "upgrade");
        auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
        REQUIRE(decision.code == core::ErrorCode::MaintenanceMode);
        REQUIRE(http->call_count() == 0);
    }
}

TEST_CASE("Remote policy - 404 without a fallback engine", "[policy_client][remote]") {
    auto http = std::make_shared<MockHttpClient>();
    http->respond(kFraEvaluate, 404, "");
    RemotePolicyClient client({"USA", std::chrono::milliseconds(1000)}, http,
                              std::make_shared<resilience::BreakerRegistry>(
                                  resilience::CircuitBreakerConfig{}),
                              nullptr);

    auto decision = client.evaluate(sample_request(), fra_instance(), "SECRET");
    REQUIRE_FALSE(decision.allow);
    REQUIRE(decision.code == core::ErrorCode::RemoteEvaluationUnavailable);
}
