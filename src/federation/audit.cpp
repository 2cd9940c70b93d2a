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

// Accord Audit Sink - Implementation

#include "audit.hpp"

#include "../core/logging.hpp"

namespace accord::federation {

void LogAuditSink::record(std::string_view request_id, const AuditEntry& entry) {
    LOG_INFO(logging::get_logger(),
             "Audit: request_id={}, instance={}, action={}, outcome={}, details={}", request_id,
             entry.instance_id, entry.action, to_string(entry.outcome), entry.details);
}

}  // namespace accord::federation
