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

// Accord HTTP Client - Implementation

#include "http_client.hpp"

#include <httplib.h>

#include <cctype>
#include <exception>

#include <fmt/format.h>

namespace accord::core {

namespace {

httplib::Headers to_httplib_headers(const HttpHeaders& headers) {
    httplib::Headers out;
    for (const auto& [name, value] : headers) {
        out.emplace(name, value);
    }
    return out;
}

HttpResponse from_result(const httplib::Result& res) {
    HttpResponse out;
    if (!res) {
        out.error = httplib::to_string(res.error());
        return out;
    }
    out.status = res->status;
    out.body = res->body;
    return out;
}

void apply_timeouts(httplib::Client& client, std::chrono::milliseconds timeout) {
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
}

}  // namespace

std::optional<UrlParts> split_url(std::string_view url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }

    auto host_start = scheme_end + 3;
    auto path_start = url.find('/', host_start);
    UrlParts parts;
    if (path_start == std::string_view::npos) {
        parts.origin = std::string(url);
        parts.path = "/";
    } else {
        parts.origin = std::string(url.substr(0, path_start));
        parts.path = std::string(url.substr(path_start));
    }

    if (parts.origin.size() <= host_start) {
        return std::nullopt;  // Empty host
    }
    return parts;
}

std::string form_encode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

HttpResponse HttplibClient::get(const std::string& url, const HttpHeaders& headers,
                                std::chrono::milliseconds timeout) {
    auto parts = split_url(url);
    if (!parts) {
        return HttpResponse{0, "", "invalid url"};
    }

    try {
        httplib::Client client(parts->origin);
        apply_timeouts(client, timeout);
        return from_result(client.Get(parts->path, to_httplib_headers(headers)));
    } catch (const std::exception& e) {
        return HttpResponse{0, "", e.what()};
    }
}

HttpResponse HttplibClient::post(const std::string& url, const std::string& body,
                                 const std::string& content_type, const HttpHeaders& headers,
                                 std::chrono::milliseconds timeout) {
    auto parts = split_url(url);
    if (!parts) {
        return HttpResponse{0, "", "invalid url"};
    }

    try {
        httplib::Client client(parts->origin);
        apply_timeouts(client, timeout);
        return from_result(
            client.Post(parts->path, to_httplib_headers(headers), body, content_type));
    } catch (const std::exception& e) {
        return HttpResponse{0, "", e.what()};
    }
}

}  // namespace accord::core
