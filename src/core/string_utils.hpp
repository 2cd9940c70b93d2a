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

// String Utilities - Scope lists, case folding and typo suggestions

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace accord::core {

/// Edit distance (insert, delete, substitute) between two strings
[[nodiscard]] inline size_t levenshtein_distance(std::string_view a, std::string_view b) {
    if (a.empty())
        return b.size();
    if (b.empty())
        return a.size();

    // Two rolling rows
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            if (a[i - 1] == b[j - 1]) {
                curr[j] = prev[j - 1];
            } else {
                curr[j] = 1 + std::min({prev[j], curr[j - 1], prev[j - 1]});
            }
        }
        std::swap(prev, curr);
    }

    return prev[b.size()];
}

/// Candidates within max_distance edits of target, closest first (exact matches excluded)
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 2) {
    std::vector<std::pair<std::string, size_t>> matches;
    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance > 0 && distance <= max_distance) {
            matches.emplace_back(candidate, distance);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (auto& [candidate, _] : matches) {
        result.push_back(std::move(candidate));
    }
    return result;
}

[[nodiscard]] inline std::string join(const std::vector<std::string>& parts,
                                      std::string_view delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += delimiter;
        }
        out += parts[i];
    }
    return out;
}

/// Split on ASCII whitespace, dropping empty fields ("a  b" -> {"a", "b"})
[[nodiscard]] inline std::vector<std::string> split_whitespace(std::string_view input) {
    std::vector<std::string> out;
    size_t pos = 0;
    while (pos < input.size()) {
        while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
        size_t start = pos;
        while (pos < input.size() && !std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
        if (pos > start) {
            out.emplace_back(input.substr(start, pos - start));
        }
    }
    return out;
}

[[nodiscard]] inline std::string to_upper(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

[[nodiscard]] inline std::string to_lower(std::string_view input) {
    std::string out(input);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace accord::core
