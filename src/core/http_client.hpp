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

// Accord HTTP Client - Header
// Outbound HTTP seam used for introspection, key fetches and policy calls

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace accord::core {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// Outcome of one outbound call. A transport failure (connect, timeout)
/// leaves status at 0 and sets error.
struct HttpResponse {
    int status = 0;
    std::string body;
    std::string error;

    [[nodiscard]] bool transport_failed() const noexcept { return !error.empty(); }
    [[nodiscard]] bool ok() const noexcept {
        return error.empty() && status >= 200 && status < 300;
    }
};

/// Blocking HTTP client. Each call carries its own timeout; implementations
/// must never retry on their own.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    [[nodiscard]] virtual HttpResponse get(const std::string& url, const HttpHeaders& headers,
                                           std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual HttpResponse post(const std::string& url, const std::string& body,
                                            const std::string& content_type,
                                            const HttpHeaders& headers,
                                            std::chrono::milliseconds timeout) = 0;
};

/// cpp-httplib backed client (one connection per call)
class HttplibClient final : public HttpClient {
public:
    HttplibClient() = default;

    [[nodiscard]] HttpResponse get(const std::string& url, const HttpHeaders& headers,
                                   std::chrono::milliseconds timeout) override;

    [[nodiscard]] HttpResponse post(const std::string& url, const std::string& body,
                                    const std::string& content_type, const HttpHeaders& headers,
                                    std::chrono::milliseconds timeout) override;
};

/// URL split into scheme://host[:port] and path[?query]
struct UrlParts {
    std::string origin;
    std::string path;
};

[[nodiscard]] std::optional<UrlParts> split_url(std::string_view url);

/// application/x-www-form-urlencoded component encoding
[[nodiscard]] std::string form_encode(std::string_view value);

}  // namespace accord::core
