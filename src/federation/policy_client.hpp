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

// Accord Policy Clients - Header
// Local policy engine and remote peer evaluation endpoints

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "../core/http_client.hpp"
#include "../resilience/breaker_registry.hpp"
#include "types.hpp"

namespace accord::federation {

struct PolicyRequest {
    Subject subject;
    Resource resource;
    Action action = Action::READ;
    std::string request_id;
    std::string bearer_token;  // Forwarded to the owning instance
};

/// Anything that can answer allow/deny for a request. Implementations never
/// throw; failure is a PolicyDecision with a non-None code.
class PolicyDecisionPoint {
public:
    virtual ~PolicyDecisionPoint() = default;

    [[nodiscard]] virtual PolicyDecision evaluate(const PolicyRequest& request) = 0;
};

struct OpaClientConfig {
    std::string engine_url = "http://localhost:8181";
    std::string policy_path = "dive/authorization";
    std::chrono::milliseconds timeout{5000};
};

/// Open Policy Agent data API: POST {engine}/v1/data/{path} with {"input": ...}
class OpaPolicyClient final : public PolicyDecisionPoint {
public:
    OpaPolicyClient(OpaClientConfig config, std::shared_ptr<core::HttpClient> http);

    [[nodiscard]] PolicyDecision evaluate(const PolicyRequest& request) override;

    [[nodiscard]] std::string decision_url() const;

    [[nodiscard]] static nlohmann::json build_input(const PolicyRequest& request);

    /// Reads result.decision or result; allow must be a boolean
    [[nodiscard]] static std::optional<PolicyDecision> parse_decision(std::string_view body);

private:
    OpaClientConfig config_;
    std::shared_ptr<core::HttpClient> http_;
};

struct RemotePolicyConfig {
    std::string local_instance;
    std::chrono::milliseconds timeout{10000};
};

inline constexpr std::string_view REMOTE_EVALUATION_PATH = "/api/federation/evaluate-policy";

/// Policy evaluation at the instance owning a resource, through that
/// instance's circuit breaker. A peer without the evaluation endpoint (404)
/// is evaluated by the local engine with the translated clearance.
class RemotePolicyClient {
public:
    RemotePolicyClient(RemotePolicyConfig config, std::shared_ptr<core::HttpClient> http,
                       std::shared_ptr<resilience::BreakerRegistry> breakers,
                       std::shared_ptr<PolicyDecisionPoint> local_fallback);

    [[nodiscard]] PolicyDecision evaluate(const PolicyRequest& request,
                                          const InstanceConfig& owner,
                                          const std::string& translated_clearance);

    [[nodiscard]] uint64_t remote_calls() const noexcept {
        return remote_calls_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] static nlohmann::json build_payload(const PolicyRequest& request,
                                                      const std::string& translated_clearance,
                                                      std::string_view federated_from);

    /// {allow: bool, reason?: string}
    [[nodiscard]] static std::optional<PolicyDecision> parse_decision(std::string_view body);

private:
    RemotePolicyConfig config_;
    std::shared_ptr<core::HttpClient> http_;
    std::shared_ptr<resilience::BreakerRegistry> breakers_;
    std::shared_ptr<PolicyDecisionPoint> local_fallback_;
    std::atomic<uint64_t> remote_calls_{0};
};

}  // namespace accord::federation
