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

// Accord Cross-Instance Authorization - Header
// Origin and destination policy evaluation with clearance translation

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/ttl_cache.hpp"
#include "audit.hpp"
#include "instance_registry.hpp"
#include "policy_client.hpp"
#include "token_validator.hpp"
#include "trust_store.hpp"
#include "types.hpp"

namespace accord::federation {

struct AuthzRequest {
    Subject subject;
    Resource resource;
    Action action = Action::READ;
    std::string request_id;
    std::string bearer_token;
};

struct AuthzEvaluatorConfig {
    std::string local_instance;
    std::chrono::milliseconds cache_ttl{60000};
    size_t cache_capacity = 10000;
    std::string enhanced_audit_threshold = "SECRET";
};

/// Cross-instance authorization.
///
/// evaluate():
///   cache -> local policy (deny stops here) -> clearance translation ->
///   remote policy at the owning instance -> AND merge -> obligations -> cache
///
/// evaluate_with_bilateral_trust() first requires the edge
/// origin -> owning instance, checks the resource against the edge's
/// classification ceiling and validates the bearer token, all before any
/// policy engine is consulted.
///
/// Every failure to obtain an answer is a deny. Answered decisions (allow
/// and deny) are cached; failures are not.
class AuthzEvaluator {
public:
    AuthzEvaluator(AuthzEvaluatorConfig config, std::shared_ptr<const InstanceRegistry> instances,
                   std::shared_ptr<const TrustMatrix> trust,
                   std::shared_ptr<TokenValidator> validator,
                   std::shared_ptr<PolicyDecisionPoint> local_policy,
                   std::shared_ptr<RemotePolicyClient> remote_policy,
                   std::shared_ptr<AuditSink> audit);

    AuthzEvaluator(const AuthzEvaluator&) = delete;
    AuthzEvaluator& operator=(const AuthzEvaluator&) = delete;

    [[nodiscard]] CrossInstanceAuthzResult evaluate(const AuthzRequest& request);

    [[nodiscard]] CrossInstanceAuthzResult evaluate_with_bilateral_trust(
        const AuthzRequest& request);

    /// Usable edges leaving the local instance
    [[nodiscard]] std::vector<BilateralTrust> bilateral_trusts() const;

    [[nodiscard]] bool has_bilateral_trust(std::string_view source,
                                           std::string_view target) const {
        return trust_->has_trust(source, target);
    }

    void clear_cache() { cache_.clear(); }
    [[nodiscard]] core::CacheStats cache_stats() const { return cache_.stats(); }

    [[nodiscard]] static std::string cache_key(const AuthzRequest& request);

private:
    [[nodiscard]] std::vector<std::string> determine_obligations(
        const AuthzRequest& request, const std::optional<InstanceConfig>& owner) const;

    [[nodiscard]] bool is_remote(std::string_view instance_id) const;

    void append(std::vector<AuditEntry>& trail, std::string_view request_id,
                std::string_view instance_id, std::string_view action, AuditOutcome outcome,
                std::string details) const;

    AuthzEvaluatorConfig config_;
    std::shared_ptr<const InstanceRegistry> instances_;
    std::shared_ptr<const TrustMatrix> trust_;
    std::shared_ptr<TokenValidator> validator_;
    std::shared_ptr<PolicyDecisionPoint> local_policy_;
    std::shared_ptr<RemotePolicyClient> remote_policy_;
    std::shared_ptr<AuditSink> audit_;

    core::TtlCache<CrossInstanceAuthzResult> cache_;
};

}  // namespace accord::federation
