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

// Accord Federation Types - Implementation

#include "types.hpp"

#include <algorithm>
#include <ctime>

#include <fmt/format.h>

namespace accord::federation {

std::optional<TrustLevel> parse_trust_level(std::string_view level) {
    if (level == "high") {
        return TrustLevel::HIGH;
    }
    if (level == "medium") {
        return TrustLevel::MEDIUM;
    }
    if (level == "low") {
        return TrustLevel::LOW;
    }
    return std::nullopt;
}

std::optional<Action> parse_action(std::string_view action) {
    if (action == "read") {
        return Action::READ;
    }
    if (action == "write") {
        return Action::WRITE;
    }
    if (action == "decrypt") {
        return Action::DECRYPT;
    }
    if (action == "download") {
        return Action::DOWNLOAD;
    }
    return std::nullopt;
}

bool CrossInstanceAuthzResult::has_obligation(std::string_view obligation) const {
    return std::find(obligations.begin(), obligations.end(), obligation) != obligations.end();
}

std::string format_timestamp(Clock::time_point tp) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
    std::time_t t = Clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

Clock::time_point from_unix_seconds(int64_t seconds) {
    return Clock::time_point(std::chrono::seconds(seconds));
}

int64_t to_unix_seconds(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const BilateralTrust& t) {
    j = nlohmann::json{{"sourceInstance", t.source_instance},
                       {"targetInstance", t.target_instance},
                       {"trustLevel", to_string(t.trust_level)},
                       {"maxClassification", t.max_classification},
                       {"allowedScopes", t.allowed_scopes},
                       {"enabled", t.enabled},
                       {"establishedAt", format_timestamp(t.established_at)}};
    if (t.expires_at) {
        j["expiresAt"] = format_timestamp(*t.expires_at);
    }
}

void to_json(nlohmann::json& j, const InstanceConfig& i) {
    j = nlohmann::json{{"instanceId", i.instance_id},
                       {"baseUrl", i.base_url},
                       {"introspectionUrl", i.introspection_url},
                       {"signingKeysUrl", i.signing_keys_url},
                       {"trustLevel", to_string(i.trust_level)},
                       {"country", i.country},
                       {"enabled", i.enabled}};
}

void to_json(nlohmann::json& j, const TokenClaims& c) {
    j = nlohmann::json{{"sub", c.sub},
                       {"iss", c.iss},
                       {"aud", c.aud},
                       {"exp", c.exp},
                       {"iat", c.iat},
                       {"uniqueID", c.unique_id},
                       {"clearance", c.clearance},
                       {"countryOfAffiliation", c.country_of_affiliation},
                       {"acpCOI", c.community_of_interest},
                       {"instanceCode", c.instance_code}};
    if (c.jti) {
        j["jti"] = *c.jti;
    }
    if (c.organization_type) {
        j["organizationType"] = *c.organization_type;
    }
}

void to_json(nlohmann::json& j, const IntrospectionResult& r) {
    j = nlohmann::json{{"active", r.active},
                       {"originInstance", r.origin_instance},
                       {"validatedAt", format_timestamp(r.validated_at)},
                       {"trustVerified", r.trust_verified},
                       {"cacheHit", r.cache_hit},
                       {"latencyMs", r.latency_ms}};
    if (r.claims) {
        j["claims"] = *r.claims;
    }
    if (r.scopes_allowed) {
        j["scopesAllowed"] = *r.scopes_allowed;
    }
    if (r.error) {
        j["error"] = *r.error;
        j["code"] = core::to_string(r.code);
    }
}

void to_json(nlohmann::json& j, const Subject& s) {
    j = nlohmann::json{{"uniqueID", s.unique_id},
                       {"clearance", s.clearance},
                       {"countryOfAffiliation", s.country_of_affiliation},
                       {"acpCOI", s.acp_coi}};
    if (s.organization_type) {
        j["organizationType"] = *s.organization_type;
    }
    if (s.duty_org) {
        j["dutyOrg"] = *s.duty_org;
    }
    if (!s.origin_instance.empty()) {
        j["originInstance"] = s.origin_instance;
    }
}

void to_json(nlohmann::json& j, const Resource& r) {
    j = nlohmann::json{{"resourceId", r.resource_id},
                       {"classification", r.classification},
                       {"releasabilityTo", r.releasability_to},
                       {"COI", r.coi},
                       {"instanceId", r.instance_id}};
    if (r.title) {
        j["title"] = *r.title;
    }
    if (!r.instance_url.empty()) {
        j["instanceUrl"] = r.instance_url;
    }
}

void to_json(nlohmann::json& j, const PolicyDecision& d) {
    j = nlohmann::json{{"allow", d.allow}, {"reason", d.reason}};
    if (!d.instance_id.empty()) {
        j["instanceId"] = d.instance_id;
    }
    if (!d.evaluated()) {
        j["code"] = core::to_string(d.code);
    }
    if (d.local_fallback) {
        j["localFallback"] = true;
    }
}

void to_json(nlohmann::json& j, const AttributeTranslation& t) {
    j = nlohmann::json{{"originalClearance", t.original_clearance},
                       {"translatedClearance", t.translated_clearance},
                       {"clearanceMapping", t.clearance_mapping}};
}

void to_json(nlohmann::json& j, const AuditEntry& e) {
    j = nlohmann::json{{"timestamp", format_timestamp(e.timestamp)},
                       {"instanceId", e.instance_id},
                       {"action", e.action},
                       {"outcome", to_string(e.outcome)},
                       {"details", e.details}};
}

void to_json(nlohmann::json& j, const CrossInstanceAuthzResult& r) {
    nlohmann::json details = {{"localDecision", r.details.local_decision},
                              {"cacheHit", r.details.cache_hit}};
    if (r.details.remote_decision) {
        details["remoteDecision"] = *r.details.remote_decision;
    }
    if (r.details.attribute_translation) {
        details["attributeTranslation"] = *r.details.attribute_translation;
    }
    if (r.details.bilateral_trust) {
        details["bilateralTrust"] = *r.details.bilateral_trust;
    }

    j = nlohmann::json{{"allow", r.allow},
                       {"reason", r.reason},
                       {"evaluationDetails", details},
                       {"obligations", r.obligations},
                       {"executionTimeMs", r.execution_time_ms},
                       {"auditTrail", r.audit_trail}};
    if (r.code != core::ErrorCode::None) {
        j["code"] = core::to_string(r.code);
    }
}

}  // namespace accord::federation
