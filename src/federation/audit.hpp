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

// Accord Audit Sink - Header

#pragma once

#include <string_view>

#include "types.hpp"

namespace accord::federation {

/// Receives every audit trail entry as it is produced
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record(std::string_view request_id, const AuditEntry& entry) = 0;
};

/// Writes entries to the process logger at INFO
class LogAuditSink final : public AuditSink {
public:
    void record(std::string_view request_id, const AuditEntry& entry) override;
};

}  // namespace accord::federation
