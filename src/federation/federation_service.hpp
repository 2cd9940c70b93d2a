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

// Accord Federation Service - Header
// Builds every federation component from configuration and owns them

#pragma once

#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "../control/config.hpp"
#include "../core/http_client.hpp"
#include "../core/jwks.hpp"
#include "../core/jwt.hpp"
#include "../resilience/breaker_registry.hpp"
#include "../resilience/failover_monitor.hpp"
#include "audit.hpp"
#include "authz_evaluator.hpp"
#include "instance_registry.hpp"
#include "policy_client.hpp"
#include "token_exchange.hpp"
#include "token_validator.hpp"
#include "trust_store.hpp"

namespace accord::federation {

/// Collaborators that may be substituted. Anything left empty is built from
/// the configuration.
struct Dependencies {
    std::shared_ptr<core::HttpClient> http;
    std::shared_ptr<TrustStore> trust_store;
    std::shared_ptr<AuditSink> audit;
    std::shared_ptr<PolicyDecisionPoint> local_policy;
    std::shared_ptr<const core::SigningKey> signing_key;
    std::vector<std::shared_ptr<resilience::CircuitObserver>> observers;
    resilience::CircuitBreaker::RandomSource random;
};

// Configuration entries to domain types

[[nodiscard]] InstanceConfig to_instance_config(const control::InstanceEntry& entry);

[[nodiscard]] BilateralTrust to_bilateral_trust(const control::TrustEntry& entry);

[[nodiscard]] resilience::CircuitBreakerConfig to_breaker_config(
    const control::CircuitBreakerConfigSchema& schema);

class FederationService {
    /// Only create() can name this, so only create() can construct
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    explicit FederationService(Passkey) {}

    /// nullptr when a configured signing key cannot be loaded
    [[nodiscard]] static std::unique_ptr<FederationService> create(const control::Config& config,
                                                                   Dependencies deps = {});
    ~FederationService();

    FederationService(const FederationService&) = delete;
    FederationService& operator=(const FederationService&) = delete;

    /// Start / stop the failover monitor
    void start();
    void stop();

    [[nodiscard]] TokenValidator& token_validator() noexcept { return *validator_; }
    [[nodiscard]] ExchangeTokenIssuer& token_exchange() noexcept { return *issuer_; }
    [[nodiscard]] AuthzEvaluator& authz_evaluator() noexcept { return *evaluator_; }
    [[nodiscard]] resilience::BreakerRegistry& breakers() noexcept { return *breakers_; }
    [[nodiscard]] const TrustMatrix& trust_matrix() const noexcept { return *trust_; }
    [[nodiscard]] const InstanceRegistry& instances() const noexcept { return *instances_; }
    [[nodiscard]] const resilience::FailoverMonitor& monitor() const noexcept { return *monitor_; }

    /// Caches, per-peer failover state, instances and local trusts
    [[nodiscard]] nlohmann::json status() const;

    void clear_caches();

    /// Replace the trust edges. Only possible when the trust store is the
    /// configuration-backed StaticTrustStore.
    [[nodiscard]] bool reload_trusts(const std::vector<control::TrustEntry>& trusts);

    [[nodiscard]] const std::string& local_instance() const noexcept { return local_instance_; }

private:
    std::string local_instance_;

    std::shared_ptr<core::HttpClient> http_;
    std::shared_ptr<const InstanceRegistry> instances_;
    std::shared_ptr<TrustStore> trust_store_;
    std::shared_ptr<const TrustMatrix> trust_;
    std::shared_ptr<resilience::BreakerRegistry> breakers_;
    std::unique_ptr<resilience::FailoverMonitor> monitor_;
    std::shared_ptr<core::JwksCache> jwks_;
    std::shared_ptr<TokenValidator> validator_;
    std::shared_ptr<const core::SigningKey> signing_key_;
    std::unique_ptr<ExchangeTokenIssuer> issuer_;
    std::shared_ptr<PolicyDecisionPoint> local_policy_;
    std::shared_ptr<RemotePolicyClient> remote_policy_;
    std::shared_ptr<AuditSink> audit_;
    std::unique_ptr<AuthzEvaluator> evaluator_;
};

}  // namespace accord::federation
