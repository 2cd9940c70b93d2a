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

// Accord Crypto Helpers - Implementation

#include "crypto.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <random>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace accord::core {

std::string sha256_hex(std::string_view input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return "";
    }

    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        fmt::format_to(std::back_inserter(out), "{:02x}", digest[i]);
    }
    return out;
}

std::string fingerprint(const nlohmann::json& fields) {
    return sha256_hex(fields.dump());
}

std::string random_uuid() {
    std::array<uint8_t, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        // CSPRNG unavailable: fall back to a seeded mt19937
        std::mt19937_64 rng(std::random_device{}() ^
                            std::chrono::steady_clock::now().time_since_epoch().count());
        for (auto& b : bytes) {
            b = static_cast<uint8_t>(rng() & 0xFF);
        }
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        fmt::format_to(std::back_inserter(out), "{:02x}", bytes[i]);
    }
    return out;
}

double random_percent() {
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 100.0);
    return dist(rng);
}

}  // namespace accord::core
