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

// Accord Federation Types - Header
// Instances, trust edges, normalized claims and authorization results

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/error.hpp"
#include "classification.hpp"

namespace accord::federation {

using Clock = std::chrono::system_clock;

enum class TrustLevel : uint8_t { HIGH, MEDIUM, LOW };

[[nodiscard]] constexpr std::string_view to_string(TrustLevel level) noexcept {
    switch (level) {
        case TrustLevel::HIGH:
            return "high";
        case TrustLevel::MEDIUM:
            return "medium";
        case TrustLevel::LOW:
            return "low";
    }
    return "low";
}

[[nodiscard]] std::optional<TrustLevel> parse_trust_level(std::string_view level);

/// Known peer. Built from configuration at startup and never mutated.
struct InstanceConfig {
    std::string instance_id;
    std::string base_url;
    std::string introspection_url;
    std::string signing_keys_url;
    TrustLevel trust_level = TrustLevel::MEDIUM;
    std::string country;
    bool enabled = true;
    bool introspection_only = false;
    ClearanceMapping clearance_mapping;
};

/// Directional edge source -> target. A -> B says nothing about B -> A.
struct BilateralTrust {
    std::string source_instance;
    std::string target_instance;
    TrustLevel trust_level = TrustLevel::MEDIUM;
    std::string max_classification = "UNCLASSIFIED";
    std::vector<std::string> allowed_scopes;
    bool enabled = true;
    Clock::time_point established_at{};
    std::optional<Clock::time_point> expires_at;

    [[nodiscard]] bool expired(Clock::time_point now) const noexcept {
        return expires_at && *expires_at <= now;
    }
};

/// Subject attributes extracted from a validated token
struct TokenClaims {
    std::string sub;
    std::string iss;
    std::vector<std::string> aud;
    int64_t exp = 0;
    int64_t iat = 0;
    std::optional<std::string> jti;

    std::string unique_id;
    std::string clearance = "UNCLASSIFIED";
    std::string country_of_affiliation;
    std::vector<std::string> community_of_interest;  // acpCOI, order preserved
    std::optional<std::string> organization_type;
    std::string instance_code;
};

struct IntrospectionResult {
    bool active = false;
    std::optional<TokenClaims> claims;
    std::string origin_instance;
    Clock::time_point validated_at{};
    bool trust_verified = false;
    std::optional<std::vector<std::string>> scopes_allowed;
    std::optional<std::string> error;
    core::ErrorCode code = core::ErrorCode::None;
    bool cache_hit = false;
    uint64_t latency_ms = 0;
    bool validated_locally = false;  // Signature checked here, no introspection call

    [[nodiscard]] static IntrospectionResult inactive(std::string origin, bool trust_verified,
                                                      core::ErrorCode code, std::string error) {
        IntrospectionResult r;
        r.origin_instance = std::move(origin);
        r.validated_at = Clock::now();
        r.trust_verified = trust_verified;
        r.code = code;
        r.error = std::move(error);
        return r;
    }

    [[nodiscard]] explicit operator bool() const noexcept { return active; }
};

struct Subject {
    std::string unique_id;
    std::string clearance;
    std::string country_of_affiliation;
    std::vector<std::string> acp_coi;
    std::optional<std::string> organization_type;
    std::optional<std::string> duty_org;
    std::string origin_instance;  // Empty means the local instance
};

struct Resource {
    std::string resource_id;
    std::optional<std::string> title;
    std::string classification = "UNCLASSIFIED";
    std::vector<std::string> releasability_to;
    std::vector<std::string> coi;
    std::string instance_id;  // Owning instance
    std::string instance_url;
};

enum class Action : uint8_t { READ, WRITE, DECRYPT, DOWNLOAD };

[[nodiscard]] constexpr std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::READ:
            return "read";
        case Action::WRITE:
            return "write";
        case Action::DECRYPT:
            return "decrypt";
        case Action::DOWNLOAD:
            return "download";
    }
    return "read";
}

[[nodiscard]] std::optional<Action> parse_action(std::string_view action);

/// Answer of one policy decision point
struct PolicyDecision {
    bool allow = false;
    std::string reason;
    std::string instance_id;

    // None when a policy engine actually answered. Otherwise the decision is
    // a fail-closed deny and code says why no answer was obtained.
    core::ErrorCode code = core::ErrorCode::None;
    bool local_fallback = false;  // Remote endpoint missing, evaluated locally

    [[nodiscard]] bool evaluated() const noexcept { return code == core::ErrorCode::None; }

    [[nodiscard]] static PolicyDecision answered(bool allow, std::string reason,
                                                 std::string instance_id = {}) {
        return {allow, std::move(reason), std::move(instance_id), core::ErrorCode::None, false};
    }

    [[nodiscard]] static PolicyDecision unavailable(core::ErrorCode code, std::string reason,
                                                    std::string instance_id = {}) {
        return {false, std::move(reason), std::move(instance_id), code, false};
    }
};

struct AttributeTranslation {
    std::string original_clearance;
    std::string translated_clearance;
    std::string clearance_mapping;  // Instance whose vocabulary was applied
};

enum class AuditOutcome : uint8_t { ALLOW, DENY, ERROR };

[[nodiscard]] constexpr std::string_view to_string(AuditOutcome outcome) noexcept {
    switch (outcome) {
        case AuditOutcome::ALLOW:
            return "allow";
        case AuditOutcome::DENY:
            return "deny";
        case AuditOutcome::ERROR:
            return "error";
    }
    return "error";
}

struct AuditEntry {
    Clock::time_point timestamp{};
    std::string instance_id;
    std::string action;
    AuditOutcome outcome = AuditOutcome::ALLOW;
    std::string details;
};

struct EvaluationDetails {
    PolicyDecision local_decision;
    std::optional<PolicyDecision> remote_decision;
    std::optional<AttributeTranslation> attribute_translation;
    std::optional<BilateralTrust> bilateral_trust;
    bool cache_hit = false;
};

namespace obligations {
inline constexpr std::string_view AUDIT_FEDERATED_ACCESS = "AUDIT_FEDERATED_ACCESS";
inline constexpr std::string_view MARK_COALITION_ACCESS = "MARK_COALITION_ACCESS";
inline constexpr std::string_view KAS_KEY_REQUEST = "KAS_KEY_REQUEST";
inline constexpr std::string_view ENHANCED_AUDIT_LOGGING = "ENHANCED_AUDIT_LOGGING";
}  // namespace obligations

struct CrossInstanceAuthzResult {
    bool allow = false;
    std::string reason;
    core::ErrorCode code = core::ErrorCode::None;
    EvaluationDetails details;
    std::vector<std::string> obligations;
    uint64_t execution_time_ms = 0;
    std::vector<AuditEntry> audit_trail;

    [[nodiscard]] bool has_obligation(std::string_view obligation) const;

    [[nodiscard]] explicit operator bool() const noexcept { return allow; }
};

/// ISO 8601 UTC with milliseconds
[[nodiscard]] std::string format_timestamp(Clock::time_point tp);

[[nodiscard]] Clock::time_point from_unix_seconds(int64_t seconds);
[[nodiscard]] int64_t to_unix_seconds(Clock::time_point tp);

// JSON (wire and status representations)
void to_json(nlohmann::json& j, const BilateralTrust& t);
void to_json(nlohmann::json& j, const InstanceConfig& i);
void to_json(nlohmann::json& j, const TokenClaims& c);
void to_json(nlohmann::json& j, const IntrospectionResult& r);
void to_json(nlohmann::json& j, const Subject& s);
void to_json(nlohmann::json& j, const Resource& r);
void to_json(nlohmann::json& j, const PolicyDecision& d);
void to_json(nlohmann::json& j, const AttributeTranslation& t);
void to_json(nlohmann::json& j, const AuditEntry& e);
void to_json(nlohmann::json& j, const CrossInstanceAuthzResult& r);

}  // namespace accord::federation
