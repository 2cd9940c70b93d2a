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

// Accord Policy Clients - Implementation

#include "policy_client.hpp"

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace accord::federation {

namespace {

constexpr std::string_view FAIL_CLOSED_REASON = "Policy evaluation unavailable (fail-closed)";

uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

}  // namespace

// ============================================================================
// OpaPolicyClient
// ============================================================================

OpaPolicyClient::OpaPolicyClient(OpaClientConfig config, std::shared_ptr<core::HttpClient> http)
    : config_(std::move(config)), http_(std::move(http)) {}

std::string OpaPolicyClient::decision_url() const {
    std::string path = config_.policy_path;
    while (!path.empty() && path.front() == '/') {
        path.erase(path.begin());
    }
    return fmt::format("{}/v1/data/{}", trim_trailing_slash(config_.engine_url), path);
}

nlohmann::json OpaPolicyClient::build_input(const PolicyRequest& request) {
    const auto& subject = request.subject;
    const auto& resource = request.resource;

    nlohmann::json subject_json = {{"authenticated", true},
                                   {"uniqueID", subject.unique_id},
                                   {"clearance", subject.clearance},
                                   {"countryOfAffiliation", subject.country_of_affiliation},
                                   {"acpCOI", subject.acp_coi}};
    if (subject.organization_type) {
        subject_json["organizationType"] = *subject.organization_type;
    }
    if (subject.duty_org) {
        subject_json["dutyOrg"] = *subject.duty_org;
    }

    return nlohmann::json{
        {"input",
         {{"subject", subject_json},
          {"action", {{"operation", to_string(request.action)}}},
          {"resource",
           {{"resourceId", resource.resource_id},
            {"classification", resource.classification},
            {"releasabilityTo", resource.releasability_to},
            {"COI", resource.coi}}},
          {"context",
           {{"currentTime", format_timestamp(Clock::now())},
            {"requestId", request.request_id},
            {"federatedAccess", true},
            {"originInstance", subject.origin_instance},
            {"targetInstance", resource.instance_id}}}}}};
}

std::optional<PolicyDecision> OpaPolicyClient::parse_decision(std::string_view body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("result") || !j["result"].is_object()) {
            return std::nullopt;
        }

        const auto& result = j["result"];
        const auto& decision =
            result.contains("decision") && result["decision"].is_object() ? result["decision"]
                                                                          : result;
        if (!decision.contains("allow") || !decision["allow"].is_boolean()) {
            return std::nullopt;
        }

        bool allow = decision["allow"].get<bool>();
        std::string reason;
        if (decision.contains("reason") && decision["reason"].is_string()) {
            reason = decision["reason"].get<std::string>();
        }
        if (reason.empty()) {
            reason = allow ? "Access allowed" : "Access denied";
        }
        return PolicyDecision::answered(allow, std::move(reason));
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

PolicyDecision OpaPolicyClient::evaluate(const PolicyRequest& request) {
    auto* logger = logging::get_logger();
    const auto start = std::chrono::steady_clock::now();

    auto response = http_->post(decision_url(), build_input(request).dump(), "application/json",
                                {}, config_.timeout);
    const uint64_t latency = elapsed_ms(start);

    if (!response.ok()) {
        std::string detail =
            response.transport_failed() ? response.error : fmt::format("HTTP {}", response.status);
        LOG_ERROR_CTX(logger, "Local policy evaluation failed", request.request_id,
                      core::to_string(core::ErrorCode::LocalEvaluationUnavailable), detail);
        return PolicyDecision::unavailable(core::ErrorCode::LocalEvaluationUnavailable,
                                           std::string(FAIL_CLOSED_REASON));
    }

    auto decision = parse_decision(response.body);
    if (!decision) {
        LOG_ERROR_CTX(logger, "Local policy evaluation failed", request.request_id,
                      core::to_string(core::ErrorCode::LocalEvaluationUnavailable),
                      "malformed decision");
        return PolicyDecision::unavailable(core::ErrorCode::LocalEvaluationUnavailable,
                                           std::string(FAIL_CLOSED_REASON));
    }

    LOG_PEER_CALL(logger, "local_policy", "opa", response.status, latency, request.request_id);
    return *decision;
}

// ============================================================================
// RemotePolicyClient
// ============================================================================

RemotePolicyClient::RemotePolicyClient(RemotePolicyConfig config,
                                       std::shared_ptr<core::HttpClient> http,
                                       std::shared_ptr<resilience::BreakerRegistry> breakers,
                                       std::shared_ptr<PolicyDecisionPoint> local_fallback)
    : config_(std::move(config)),
      http_(std::move(http)),
      breakers_(std::move(breakers)),
      local_fallback_(std::move(local_fallback)) {}

nlohmann::json RemotePolicyClient::build_payload(const PolicyRequest& request,
                                                 const std::string& translated_clearance,
                                                 std::string_view federated_from) {
    nlohmann::json subject = request.subject;
    subject["clearance"] = translated_clearance;
    subject["federatedFrom"] = std::string(federated_from);

    return nlohmann::json{{"subject", subject},
                          {"resource", request.resource},
                          {"action", to_string(request.action)},
                          {"requestId", request.request_id}};
}

std::optional<PolicyDecision> RemotePolicyClient::parse_decision(std::string_view body) {
    try {
        auto j = nlohmann::json::parse(body);
        if (!j.is_object() || !j.contains("allow") || !j["allow"].is_boolean()) {
            return std::nullopt;
        }
        if (j.contains("reason") && !j["reason"].is_string() && !j["reason"].is_null()) {
            return std::nullopt;
        }

        bool allow = j["allow"].get<bool>();
        std::string reason;
        if (j.contains("reason") && j["reason"].is_string()) {
            reason = j["reason"].get<std::string>();
        }
        if (reason.empty()) {
            reason = allow ? "Access allowed" : "Access denied";
        }
        return PolicyDecision::answered(allow, std::move(reason));
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

PolicyDecision RemotePolicyClient::evaluate(const PolicyRequest& request,
                                            const InstanceConfig& owner,
                                            const std::string& translated_clearance) {
    auto* logger = logging::get_logger();
    const std::string& peer = owner.instance_id;

    auto breaker = breakers_->get(peer);
    auto admission = breaker->try_acquire();
    if (admission != resilience::Admission::ALLOWED) {
        auto code = admission == resilience::Admission::REJECTED_MAINTENANCE
                        ? core::ErrorCode::MaintenanceMode
                        : core::ErrorCode::CircuitOpen;
        LOG_WARNING(logger, "Remote evaluation skipped: request_id={}, peer={}, admission={}",
                    request.request_id, peer, resilience::to_string(admission));
        return PolicyDecision::unavailable(
            code,
            fmt::format("Remote instance {} unavailable: {}", peer,
                        resilience::to_string(admission)),
            peer);
    }

    core::HttpHeaders headers{{"X-Request-Id", request.request_id},
                              {"X-Federated-From", config_.local_instance}};
    if (!request.bearer_token.empty()) {
        headers.emplace_back("Authorization", "Bearer " + request.bearer_token);
    }

    const auto start = std::chrono::steady_clock::now();
    auto response = http_->post(
        trim_trailing_slash(owner.base_url) + std::string(REMOTE_EVALUATION_PATH),
        build_payload(request, translated_clearance, config_.local_instance).dump(),
        "application/json", headers, config_.timeout);
    remote_calls_.fetch_add(1, std::memory_order_relaxed);
    const uint64_t latency = elapsed_ms(start);

    if (response.transport_failed() || response.status >= 500) {
        std::string detail =
            response.transport_failed() ? response.error : fmt::format("HTTP {}", response.status);
        breaker->record_failure(detail);
        LOG_PEER_CALL(logger, "remote_policy_failed", peer, response.status, latency,
                      request.request_id);
        return PolicyDecision::unavailable(core::ErrorCode::RemoteEvaluationUnavailable,
                                           "Remote policy evaluation failed: " + detail, peer);
    }

    if (response.status == 404) {
        // Peer is up but predates the evaluation endpoint
        breaker->record_success();
        LOG_PEER_CALL(logger, "remote_policy_missing", peer, response.status, latency,
                      request.request_id);
        if (!local_fallback_) {
            return PolicyDecision::unavailable(core::ErrorCode::RemoteEvaluationUnavailable,
                                               "Remote evaluation endpoint not found", peer);
        }

        PolicyRequest translated = request;
        translated.subject.clearance = translated_clearance;
        auto decision = local_fallback_->evaluate(translated);
        decision.instance_id = peer;
        decision.local_fallback = true;
        return decision;
    }

    if (!response.ok()) {
        breaker->record_success();
        LOG_PEER_CALL(logger, "remote_policy_rejected", peer, response.status, latency,
                      request.request_id);
        return PolicyDecision::unavailable(
            core::ErrorCode::RemoteEvaluationUnavailable,
            fmt::format("Remote policy evaluation rejected with status {}", response.status),
            peer);
    }

    auto decision = parse_decision(response.body);
    if (!decision) {
        breaker->record_failure("malformed evaluation response");
        LOG_ERROR_CTX(logger, "Malformed remote policy response", request.request_id,
                      core::to_string(core::ErrorCode::MalformedResponse), peer);
        return PolicyDecision::unavailable(core::ErrorCode::MalformedResponse,
                                           "Malformed remote policy response", peer);
    }

    breaker->record_success();
    LOG_PEER_CALL(logger, "remote_policy", peer, response.status, latency, request.request_id);
    decision->instance_id = peer;
    return *decision;
}

}  // namespace accord::federation
