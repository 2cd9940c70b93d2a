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

// Accord Cross-Instance Authorization - Implementation

#include "authz_evaluator.hpp"

#include <iterator>

#include <fmt/format.h>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"
#include "../core/string_utils.hpp"

namespace accord::federation {

namespace {

const ClearanceMapping kNoVocabulary;

uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - start)
                                     .count());
}

AuditOutcome outcome_of(const PolicyDecision& decision) {
    if (!decision.evaluated()) {
        return AuditOutcome::ERROR;
    }
    return decision.allow ? AuditOutcome::ALLOW : AuditOutcome::DENY;
}

bool is_circuit_rejection(core::ErrorCode code) {
    return code == core::ErrorCode::CircuitOpen || code == core::ErrorCode::MaintenanceMode;
}

}  // namespace

AuthzEvaluator::AuthzEvaluator(AuthzEvaluatorConfig config,
                               std::shared_ptr<const InstanceRegistry> instances,
                               std::shared_ptr<const TrustMatrix> trust,
                               std::shared_ptr<TokenValidator> validator,
                               std::shared_ptr<PolicyDecisionPoint> local_policy,
                               std::shared_ptr<RemotePolicyClient> remote_policy,
                               std::shared_ptr<AuditSink> audit)
    : config_(std::move(config)),
      instances_(std::move(instances)),
      trust_(std::move(trust)),
      validator_(std::move(validator)),
      local_policy_(std::move(local_policy)),
      remote_policy_(std::move(remote_policy)),
      audit_(std::move(audit)),
      cache_(config_.cache_ttl, config_.cache_capacity) {}

std::string AuthzEvaluator::cache_key(const AuthzRequest& request) {
    return core::fingerprint({{"subject", request.subject.unique_id},
                              {"clearance", request.subject.clearance},
                              {"country", request.subject.country_of_affiliation},
                              {"resource", request.resource.resource_id},
                              {"instance", core::to_upper(request.resource.instance_id)},
                              {"action", to_string(request.action)}});
}

bool AuthzEvaluator::is_remote(std::string_view instance_id) const {
    return !instance_id.empty() &&
           core::to_upper(instance_id) != core::to_upper(config_.local_instance);
}

void AuthzEvaluator::append(std::vector<AuditEntry>& trail, std::string_view request_id,
                            std::string_view instance_id, std::string_view action,
                            AuditOutcome outcome, std::string details) const {
    AuditEntry entry{Clock::now(), std::string(instance_id), std::string(action), outcome,
                     std::move(details)};
    if (audit_) {
        audit_->record(request_id, entry);
    }
    trail.push_back(std::move(entry));
}

std::vector<BilateralTrust> AuthzEvaluator::bilateral_trusts() const {
    return trust_->list_trusts_for(config_.local_instance);
}

CrossInstanceAuthzResult AuthzEvaluator::evaluate(const AuthzRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    auto* logger = logging::get_logger();
    const auto& owning = request.resource.instance_id;

    // A failing cache only disables caching for this call
    bool cache_enabled = true;
    std::string key;
    try {
        key = cache_key(request);
        if (auto cached = cache_.get(key)) {
            LOG_DEBUG(logger, "Authorization cache hit: request_id={}, resource={}",
                      request.request_id, request.resource.resource_id);
            cached->details.cache_hit = true;
            cached->execution_time_ms = elapsed_ms(start);
            return std::move(*cached);
        }
    } catch (const std::exception& e) {
        LOG_WARNING(logger, "Authorization cache unavailable: request_id={}, error={}",
                    request.request_id, e.what());
        cache_enabled = false;
    }

    auto store = [&](const CrossInstanceAuthzResult& result) {
        if (!cache_enabled) {
            return;
        }
        try {
            cache_.put(key, result);
        } catch (const std::exception& e) {
            LOG_WARNING(logger, "Authorization cache write failed: request_id={}, error={}",
                        request.request_id, e.what());
        }
    };

    LOG_INFO(logger,
             "Cross-instance authorization started: request_id={}, subject_country={}, "
             "resource_instance={}, action={}",
             request.request_id, request.subject.country_of_affiliation, owning,
             to_string(request.action));

    CrossInstanceAuthzResult result;
    auto& trail = result.audit_trail;
    const bool remote = is_remote(owning);

    std::optional<InstanceConfig> owner;
    if (!owning.empty()) {
        owner = instances_->resolve(owning);
    }
    if (remote && !owner) {
        append(trail, request.request_id, owning, "instance_resolution_failed",
               AuditOutcome::DENY, fmt::format("Unknown or disabled instance {}", owning));
        result.reason = fmt::format("Unknown instance: {}", owning);
        result.code = core::ErrorCode::UnknownInstance;
        result.details.local_decision = PolicyDecision::unavailable(
            core::ErrorCode::UnknownInstance, "Owning instance not registered");
        result.execution_time_ms = elapsed_ms(start);
        LOG_TRUST_DECISION(logger, request.request_id, config_.local_instance, owning, "deny",
                           result.reason);
        return result;
    }

    PolicyRequest policy_request{request.subject, request.resource, request.action,
                                 request.request_id, request.bearer_token};

    // Step 1: local policy (origin)
    append(trail, request.request_id, config_.local_instance, "local_policy_evaluation",
           AuditOutcome::ALLOW, "Starting local policy evaluation");
    auto local = local_policy_->evaluate(policy_request);
    append(trail, request.request_id, config_.local_instance, "local_policy_result",
           outcome_of(local), local.reason);

    result.details.local_decision = local;
    if (!local.allow) {
        result.reason = fmt::format("Local policy denied: {}", local.reason);
        result.code = local.code;
        result.execution_time_ms = elapsed_ms(start);
        if (local.evaluated()) {
            store(result);
        }
        LOG_TRUST_DECISION(logger, request.request_id, config_.local_instance, owning, "deny",
                           result.reason);
        return result;
    }

    if (remote) {
        // Step 2: translate clearance into the owner's vocabulary
        std::string translated = request.subject.clearance;
        if (!owner->clearance_mapping.empty()) {
            translated = translate_clearance(request.subject.clearance, owner->clearance_mapping);
            result.details.attribute_translation =
                AttributeTranslation{request.subject.clearance, translated, owner->instance_id};
            append(trail, request.request_id, owner->instance_id, "attribute_translation",
                   AuditOutcome::ALLOW,
                   fmt::format("Clearance {} -> {}", request.subject.clearance, translated));
        }

        // Step 3: remote policy (destination)
        append(trail, request.request_id, owning, "remote_policy_evaluation",
               AuditOutcome::ALLOW, "Starting remote policy evaluation");
        auto remote_decision = remote_policy_->evaluate(policy_request, *owner, translated);
        result.details.remote_decision = remote_decision;

        if (!remote_decision.evaluated()) {
            const bool rejected = is_circuit_rejection(remote_decision.code);
            append(trail, request.request_id, owning,
                   rejected ? "remote_policy_circuit_open" : "remote_policy_error",
                   AuditOutcome::ERROR, remote_decision.reason);
            LOG_ERROR_CTX(logger, "Remote policy evaluation failed", request.request_id,
                          core::to_string(remote_decision.code), remote_decision.reason);

            result.reason = "Remote policy evaluation failed (fail-closed)";
            result.code =
                rejected ? remote_decision.code : core::ErrorCode::RemoteEvaluationUnavailable;
            result.execution_time_ms = elapsed_ms(start);
            return result;
        }

        append(trail, request.request_id, owning, "remote_policy_result",
               outcome_of(remote_decision), remote_decision.reason);
        if (!remote_decision.allow) {
            result.reason = fmt::format("Remote policy denied: {}", remote_decision.reason);
            result.execution_time_ms = elapsed_ms(start);
            store(result);
            LOG_TRUST_DECISION(logger, request.request_id, config_.local_instance, owning,
                               "deny", result.reason);
            return result;
        }
    }

    // Step 4: both allowed
    result.allow = true;
    result.reason = remote ? "Access granted by local and remote policies"
                           : "Access granted by local policy";
    result.obligations = determine_obligations(request, owner);
    result.execution_time_ms = elapsed_ms(start);
    store(result);

    LOG_TRUST_DECISION(logger, request.request_id, config_.local_instance, owning, "allow",
                       result.reason);
    return result;
}

CrossInstanceAuthzResult AuthzEvaluator::evaluate_with_bilateral_trust(
    const AuthzRequest& request) {
    const auto start = std::chrono::steady_clock::now();
    auto* logger = logging::get_logger();

    const std::string source = request.subject.origin_instance.empty()
                                   ? config_.local_instance
                                   : request.subject.origin_instance;
    const std::string& target = request.resource.instance_id;

    std::vector<AuditEntry> trail;
    auto deny = [&](std::string reason, core::ErrorCode code, std::string local_reason) {
        CrossInstanceAuthzResult result;
        result.reason = std::move(reason);
        result.code = code;
        result.details.local_decision = PolicyDecision::unavailable(code, std::move(local_reason));
        result.audit_trail = std::move(trail);
        result.execution_time_ms = elapsed_ms(start);
        LOG_TRUST_DECISION(logger, request.request_id, source, target, "deny", result.reason);
        return result;
    };

    // Step 1: directional trust source -> target
    append(trail, request.request_id, source, "bilateral_trust_check", AuditOutcome::ALLOW,
           fmt::format("Checking trust from {} to {}", source, target));

    // Unknown and disabled instances hold no trust
    auto trust = instances_->is_available(source, config_.local_instance) &&
                         instances_->is_available(target, config_.local_instance)
                     ? trust_->verify_trust(source, target)
                     : std::nullopt;
    if (!trust) {
        append(trail, request.request_id, source, "bilateral_trust_denied", AuditOutcome::DENY,
               fmt::format("No bilateral trust between {} and {}", source, target));
        return deny(fmt::format("No bilateral trust between {} and {}", source, target),
                    core::ErrorCode::NoBilateralTrust, "Bilateral trust check failed");
    }

    // Step 2: classification ceiling of the edge. A label that cannot be
    // placed in the canonical hierarchy never fits under a ceiling.
    auto owner = instances_->resolve(target);
    const ClearanceMapping& vocabulary = owner ? owner->clearance_mapping : kNoVocabulary;
    auto level = normalize_classification(request.resource.classification, vocabulary);
    auto ceiling = parse_classification(trust->max_classification);
    if (!level || !ceiling || *level > *ceiling) {
        append(trail, request.request_id, target, "classification_check_failed",
               AuditOutcome::DENY,
               fmt::format("Resource {} exceeds max {}", request.resource.classification,
                           trust->max_classification));
        return deny(fmt::format("Resource classification {} exceeds bilateral trust limit {}",
                                request.resource.classification, trust->max_classification),
                    core::ErrorCode::ClassificationExceedsTrust,
                    "Classification exceeds trust level");
    }

    append(trail, request.request_id, source, "bilateral_trust_verified", AuditOutcome::ALLOW,
           fmt::format("Trust level: {}, max classification: {}", to_string(trust->trust_level),
                       trust->max_classification));

    // Step 3: bearer token, when one was presented
    if (!request.bearer_token.empty()) {
        auto validation = validator_->introspect(IntrospectionRequest{
            request.bearer_token, source, target, request.request_id, {}});
        std::string error = validation.error.value_or("Token validation failed");
        append(trail, request.request_id, source, "token_validation",
               validation.active ? AuditOutcome::ALLOW : AuditOutcome::DENY,
               validation.active ? std::string("Token validated successfully") : error);
        if (!validation.active) {
            auto code = validation.code == core::ErrorCode::TokenExpired
                            ? core::ErrorCode::TokenExpired
                            : core::ErrorCode::TokenInvalid;
            return deny(fmt::format("Token validation failed: {}", error), code,
                        "Token validation failed");
        }
    }

    // Step 4: standard evaluation
    auto result = evaluate(request);
    result.details.bilateral_trust = *trust;
    trail.insert(trail.end(), std::make_move_iterator(result.audit_trail.begin()),
                 std::make_move_iterator(result.audit_trail.end()));
    result.audit_trail = std::move(trail);
    result.execution_time_ms = elapsed_ms(start);
    return result;
}

std::vector<std::string> AuthzEvaluator::determine_obligations(
    const AuthzRequest& request, const std::optional<InstanceConfig>& owner) const {
    std::vector<std::string> result;

    result.emplace_back(obligations::AUDIT_FEDERATED_ACCESS);

    const std::string owner_country = owner ? owner->country : std::string();
    if (core::to_upper(request.subject.country_of_affiliation) != core::to_upper(owner_country)) {
        result.emplace_back(obligations::MARK_COALITION_ACCESS);
    }

    if (request.action == Action::DECRYPT) {
        result.emplace_back(obligations::KAS_KEY_REQUEST);
    }

    if (classification_level(request.resource.classification) >=
        classification_level(config_.enhanced_audit_threshold)) {
        result.emplace_back(obligations::ENHANCED_AUDIT_LOGGING);
    }
    return result;
}

}  // namespace accord::federation
