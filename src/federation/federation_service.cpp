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

// Accord Federation Service - Implementation

#include "federation_service.hpp"

#include "../core/logging.hpp"

namespace accord::federation {

namespace {

nlohmann::json cache_json(const core::CacheStats& stats) {
    return nlohmann::json{{"size", stats.size},
                          {"capacity", stats.capacity},
                          {"hits", stats.hits},
                          {"misses", stats.misses},
                          {"evictions", stats.evictions}};
}

nlohmann::json optional_time(const resilience::OptionalTime& tp) {
    return tp ? nlohmann::json(format_timestamp(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json peer_json(const resilience::CircuitBreaker& breaker) {
    auto state = breaker.snapshot();
    auto metrics = breaker.metrics();

    return nlohmann::json{
        {"peer", state.peer},
        {"mode", resilience::to_string(state.mode)},
        {"circuit",
         {{"state", resilience::to_string(state.circuit.state)},
          {"failures", state.circuit.failures},
          {"successes", state.circuit.successes},
          {"recentFailures", state.circuit.recent_failures},
          {"lastFailure", optional_time(state.circuit.last_failure)},
          {"lastSuccess", optional_time(state.circuit.last_success)},
          {"lastStateChange", optional_time(state.circuit.last_state_change)}}},
        {"offlineSince", optional_time(state.offline_since)},
        {"lastPeerContact", optional_time(state.last_peer_contact)},
        {"policyCacheValid", state.policy_cache_valid},
        {"maintenanceReason", state.maintenance_reason},
        {"recoveryAttempts", state.recovery_attempts},
        {"metrics",
         {{"totalFailures", metrics.total_failures},
          {"totalSuccesses", metrics.total_successes},
          {"totalRecoveries", metrics.total_recoveries},
          {"totalCircuitOpens", metrics.total_circuit_opens},
          {"totalHalfOpenProbes", metrics.total_half_open_probes},
          {"rejectedRequests", metrics.rejected_requests},
          {"averageRecoveryTimeMs", metrics.average_recovery_time_ms},
          {"longestOutageMs", metrics.longest_outage_ms},
          {"currentOutageMs", metrics.current_outage_ms},
          {"uptimePercentage", metrics.uptime_percentage}}}};
}

}  // namespace

// ============================================================================
// Configuration conversion
// ============================================================================

InstanceConfig to_instance_config(const control::InstanceEntry& entry) {
    InstanceConfig instance;
    instance.instance_id = entry.instance_id;
    instance.base_url = entry.base_url;
    instance.introspection_url = entry.introspection_url;
    instance.signing_keys_url = entry.signing_keys_url;
    instance.trust_level = parse_trust_level(entry.trust_level).value_or(TrustLevel::LOW);
    instance.country = entry.country;
    instance.enabled = entry.enabled;
    instance.introspection_only = entry.introspection_only;
    instance.clearance_mapping = entry.clearance_mapping;
    return instance;
}

BilateralTrust to_bilateral_trust(const control::TrustEntry& entry) {
    BilateralTrust trust;
    trust.source_instance = entry.source;
    trust.target_instance = entry.target;
    trust.trust_level = parse_trust_level(entry.trust_level).value_or(TrustLevel::LOW);
    trust.max_classification = entry.max_classification;
    trust.allowed_scopes = entry.allowed_scopes;
    trust.enabled = entry.enabled;
    trust.established_at = from_unix_seconds(entry.established_at);
    if (entry.expires_at) {
        trust.expires_at = from_unix_seconds(*entry.expires_at);
    }
    return trust;
}

resilience::CircuitBreakerConfig to_breaker_config(
    const control::CircuitBreakerConfigSchema& schema) {
    resilience::CircuitBreakerConfig config;
    config.failure_threshold = schema.failure_threshold;
    config.success_threshold = schema.success_threshold;
    config.recovery_timeout_ms = schema.recovery_timeout_ms;
    config.half_open_timeout_ms = schema.half_open_timeout_ms;
    config.failure_window_ms = schema.failure_window_ms;
    config.half_open_request_percentage = schema.half_open_request_percentage;
    config.max_offline_time_ms = schema.max_offline_time_ms;
    return config;
}

// ============================================================================
// FederationService
// ============================================================================

std::unique_ptr<FederationService> FederationService::create(const control::Config& config,
                                                             Dependencies deps) {
    auto* logger = logging::get_logger();
    auto service = std::make_unique<FederationService>(Passkey{});
    service->local_instance_ = config.local_instance;

    // Exchange signing key
    service->signing_key_ = std::move(deps.signing_key);
    if (!service->signing_key_) {
        const auto& token_config = config.exchange_token;
        std::optional<core::SigningKey> key;
        if (!token_config.signing_key_path.empty()) {
            key = core::SigningKey::load_private_key(token_config.key_id,
                                                     token_config.signing_key_path);
            if (!key) {
                LOG_ERROR(logger, "Failed to load exchange signing key: path={}",
                          token_config.signing_key_path);
                return nullptr;
            }
        } else {
            LOG_WARNING(logger,
                        "No exchange signing key configured, generating an ephemeral key: "
                        "kid={}",
                        token_config.key_id);
            key = core::SigningKey::generate_es256(token_config.key_id);
            if (!key) {
                LOG_ERROR(logger, "Failed to generate exchange signing key");
                return nullptr;
            }
        }
        service->signing_key_ = std::make_shared<const core::SigningKey>(std::move(*key));
    }

    service->http_ = deps.http ? std::move(deps.http) : std::make_shared<core::HttplibClient>();
    service->audit_ = deps.audit ? std::move(deps.audit) : std::make_shared<LogAuditSink>();

    // Instances and trust
    std::vector<InstanceConfig> instances;
    instances.reserve(config.instances.size());
    for (const auto& entry : config.instances) {
        instances.push_back(to_instance_config(entry));
    }
    service->instances_ = std::make_shared<const InstanceRegistry>(std::move(instances));

    if (deps.trust_store) {
        service->trust_store_ = std::move(deps.trust_store);
    } else {
        TrustEdges edges;
        edges.reserve(config.trusts.size());
        for (const auto& entry : config.trusts) {
            edges.push_back(to_bilateral_trust(entry));
        }
        service->trust_store_ = std::make_shared<StaticTrustStore>(std::move(edges));
    }
    service->trust_ = std::make_shared<const TrustMatrix>(service->trust_store_);

    // Failover
    service->breakers_ = std::make_shared<resilience::BreakerRegistry>(
        to_breaker_config(config.circuit_breaker), std::move(deps.observers),
        std::move(deps.random));
    service->monitor_ = std::make_unique<resilience::FailoverMonitor>(
        service->breakers_, std::chrono::milliseconds(config.monitor.tick_interval_ms));

    // Token validation and exchange
    service->jwks_ = std::make_shared<core::JwksCache>(
        service->http_,
        core::JwksCacheConfig{std::chrono::milliseconds(config.caches.jwks_ttl_ms),
                              std::chrono::milliseconds(config.timeouts.jwks_ms)});

    TokenValidatorConfig validator_config;
    validator_config.local_instance = config.local_instance;
    validator_config.introspection_ttl =
        std::chrono::milliseconds(config.caches.introspection_ttl_ms);
    validator_config.cache_capacity = config.caches.capacity;
    validator_config.introspection_timeout =
        std::chrono::milliseconds(config.timeouts.introspection_ms);
    service->validator_ = std::make_shared<TokenValidator>(
        validator_config, service->instances_, service->trust_, service->http_, service->jwks_,
        service->breakers_);

    ExchangeIssuerConfig issuer_config;
    issuer_config.local_instance = config.local_instance;
    issuer_config.issuer = config.exchange_token.issuer.empty() ? config.local_instance
                                                                : config.exchange_token.issuer;
    issuer_config.prefix = config.exchange_token.prefix;
    issuer_config.ttl = std::chrono::seconds(config.exchange_token.ttl_seconds);
    service->issuer_ = std::make_unique<ExchangeTokenIssuer>(
        issuer_config, service->trust_, service->validator_, service->signing_key_);

    // Policy
    if (deps.local_policy) {
        service->local_policy_ = std::move(deps.local_policy);
    } else {
        service->local_policy_ = std::make_shared<OpaPolicyClient>(
            OpaClientConfig{config.policy.engine_url, config.policy.policy_path,
                            std::chrono::milliseconds(config.timeouts.local_policy_ms)},
            service->http_);
    }
    service->remote_policy_ = std::make_shared<RemotePolicyClient>(
        RemotePolicyConfig{config.local_instance,
                           std::chrono::milliseconds(config.timeouts.remote_policy_ms)},
        service->http_, service->breakers_, service->local_policy_);

    AuthzEvaluatorConfig evaluator_config;
    evaluator_config.local_instance = config.local_instance;
    evaluator_config.cache_ttl = std::chrono::milliseconds(config.caches.authz_ttl_ms);
    evaluator_config.cache_capacity = config.caches.capacity;
    evaluator_config.enhanced_audit_threshold = config.policy.enhanced_audit_threshold;
    service->evaluator_ = std::make_unique<AuthzEvaluator>(
        evaluator_config, service->instances_, service->trust_, service->validator_,
        service->local_policy_, service->remote_policy_, service->audit_);

    LOG_INFO(logger, "Federation service ready: local_instance={}, instances={}, trusts={}",
             config.local_instance, service->instances_->size(),
             service->trust_store_->snapshot()->size());
    return service;
}

FederationService::~FederationService() {
    stop();
}

void FederationService::start() {
    if (monitor_) {
        monitor_->start();
    }
}

void FederationService::stop() {
    if (monitor_) {
        monitor_->stop();
    }
}

nlohmann::json FederationService::status() const {
    nlohmann::json peers = nlohmann::json::array();
    for (const auto& breaker : breakers_->all()) {
        peers.push_back(peer_json(*breaker));
    }

    nlohmann::json instances = nlohmann::json::array();
    for (const auto& instance : instances_->enabled_instances()) {
        instances.push_back(nlohmann::json(instance));
    }

    return nlohmann::json{
        {"localInstance", local_instance_},
        {"instances", instances},
        {"trusts", trust_->list_trusts_for(local_instance_)},
        {"caches",
         {{"introspection", cache_json(validator_->cache_stats())},
          {"authorization", cache_json(evaluator_->cache_stats())},
          {"signingKeys",
           {{"size", jwks_->size()},
            {"fetches", jwks_->fetch_count()},
            {"failures", jwks_->fetch_failures()}}}}},
        {"validation",
         {{"local", validator_->local_validations()},
          {"remote", validator_->remote_introspections()}}},
        {"peers", peers},
        {"monitor", {{"running", monitor_->running()}, {"ticks", monitor_->tick_count()}}}};
}

void FederationService::clear_caches() {
    validator_->clear_cache();
    evaluator_->clear_cache();
    jwks_->clear();
    LOG_INFO(logging::get_logger(), "Federation caches cleared");
}

bool FederationService::reload_trusts(const std::vector<control::TrustEntry>& trusts) {
    auto store = std::dynamic_pointer_cast<StaticTrustStore>(trust_store_);
    if (!store) {
        LOG_WARNING(logging::get_logger(), "Trust reload skipped: trust store is not reloadable");
        return false;
    }

    TrustEdges edges;
    edges.reserve(trusts.size());
    for (const auto& entry : trusts) {
        edges.push_back(to_bilateral_trust(entry));
    }
    store->replace_all(std::move(edges));

    // Cached decisions were made under the old edges
    validator_->clear_cache();
    evaluator_->clear_cache();
    return true;
}

}  // namespace accord::federation
