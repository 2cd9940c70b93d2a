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

// Accord Crypto Helpers - Header
// Digests, cache fingerprints and random identifiers (OpenSSL)

#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace accord::core {

/// Lower-case hex SHA-256 of input
[[nodiscard]] std::string sha256_hex(std::string_view input);

/// Cache key derived from a JSON object of identifying fields.
/// nlohmann::json orders object keys, so equal field sets give equal keys.
[[nodiscard]] std::string fingerprint(const nlohmann::json& fields);

/// Random RFC 4122 version 4 UUID from RAND_bytes
[[nodiscard]] std::string random_uuid();

/// Uniform draw in [0, 100) used for probabilistic admission
[[nodiscard]] double random_percent();

}  // namespace accord::core
