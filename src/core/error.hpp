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

// Accord Error Codes - Header
// Machine-readable failure codes shared by every federation operation

#pragma once

#include <cstdint>
#include <string_view>

namespace accord::core {

/// Failure taxonomy. Every code resolves to a deny when it surfaces during
/// cross-instance evaluation.
enum class ErrorCode : uint8_t {
    None,
    NoBilateralTrust,             // No edge, disabled edge or expired edge
    UnknownInstance,              // Instance not registered or disabled
    TokenInvalid,                 // Signature failure, malformed token
    TokenExpired,                 // exp in the past
    ClassificationExceedsTrust,   // Resource above the edge's ceiling
    RemoteEvaluationUnavailable,  // Timeout, non-2xx, malformed reply
    LocalEvaluationUnavailable,   // Local policy engine unreachable
    CircuitOpen,                  // Peer breaker rejected the call
    MaintenanceMode,              // Peer administratively disabled
    InvalidGrant,                 // Token exchange refused (no trust, inactive subject token)
    MalformedResponse,            // Peer reply failed schema validation
    SigningFailed                 // Local signing key unusable
};

/// Stable wire/log representation of an error code
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::NoBilateralTrust:
            return "no_bilateral_trust";
        case ErrorCode::UnknownInstance:
            return "unknown_instance";
        case ErrorCode::TokenInvalid:
            return "token_invalid";
        case ErrorCode::TokenExpired:
            return "token_expired";
        case ErrorCode::ClassificationExceedsTrust:
            return "classification_exceeds_trust";
        case ErrorCode::RemoteEvaluationUnavailable:
            return "remote_evaluation_unavailable";
        case ErrorCode::LocalEvaluationUnavailable:
            return "local_evaluation_unavailable";
        case ErrorCode::CircuitOpen:
            return "circuit_open";
        case ErrorCode::MaintenanceMode:
            return "maintenance_mode";
        case ErrorCode::InvalidGrant:
            return "invalid_grant";
        case ErrorCode::MalformedResponse:
            return "malformed_response";
        case ErrorCode::SigningFailed:
            return "signing_failed";
    }
    return "unknown";
}

}  // namespace accord::core
