/*
 * Copyright 2025 Eden Contributors
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

// Eden HTTP Protocol - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace eden::http {

namespace {

const std::string* find_in(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& [key, value] : headers) {
        if (header_name_equals(key, name)) {
            return &value;
        }
    }
    return nullptr;
}

size_t remove_from(HeaderList& headers, std::string_view name) {
    auto before = headers.size();
    std::erase_if(headers, [name](const auto& header) { return header_name_equals(header.first, name); });
    return before - headers.size();
}

void set_in(HeaderList& headers, std::string_view name, std::string_view value) {
    bool replaced = false;
    std::erase_if(headers, [&](auto& header) {
        if (!header_name_equals(header.first, name)) {
            return false;
        }
        if (replaced) {
            return true;
        }
        header.second.assign(value);
        replaced = true;
        return false;
    });
    if (!replaced) {
        headers.emplace_back(std::string(name), std::string(value));
    }
}

}  // namespace

// Request helper methods

std::string_view Request::method_string() const noexcept {
    if (!method_name.empty()) {
        return method_name;
    }
    return to_string(method);
}

const std::string* Request::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const std::string* value = find_header(name);
    return value ? std::string_view(*value) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Request::set_header(std::string_view name, std::string_view value) {
    set_in(headers, name, value);
}

void Request::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

size_t Request::remove_header(std::string_view name) {
    return remove_from(headers, name);
}

size_t Request::content_length() const noexcept {
    auto value = get_header("Content-Length", "0");
    size_t length = 0;
    std::from_chars(value.data(), value.data() + value.size(), length);
    return length;
}

bool Request::keep_alive() const noexcept {
    auto connection = get_header("Connection");

    // HTTP/1.1 defaults to keep-alive
    if (version == Version::HTTP_1_1) {
        return !header_name_equals(connection, "close");
    }

    // HTTP/1.0 defaults to close
    return header_name_equals(connection, "keep-alive");
}

// Response helper methods

const std::string* Response::find_header(std::string_view name) const noexcept {
    return find_in(headers, name);
}

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const std::string* value = find_header(name);
    return value ? std::string_view(*value) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_header(name) != nullptr;
}

void Response::set_header(std::string_view name, std::string_view value) {
    set_in(headers, name, value);
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

size_t Response::remove_header(std::string_view name) {
    return remove_from(headers, name);
}

void Response::set_content_type(std::string_view content_type) {
    set_header("Content-Type", content_type);
}

std::string serialize_response(const Response& response, bool keep_alive) {
    std::string out;
    out.reserve(256 + response.body.size());

    fmt::format_to(std::back_inserter(out), "{} {} {}\r\n", to_string(response.version),
                   response.status_code(), to_reason_phrase(response.status));

    for (const auto& [name, value] : response.headers) {
        if (header_name_equals(name, "Content-Length") ||
            header_name_equals(name, "Transfer-Encoding") ||
            header_name_equals(name, "Connection")) {
            continue;
        }
        fmt::format_to(std::back_inserter(out), "{}: {}\r\n", name, value);
    }

    // 1xx, 204 and 304 never carry a body or a Content-Length
    uint16_t code = response.status_code();
    bool bodyless = code < 200 || code == 204 || code == 304;
    if (!bodyless) {
        // An empty body with an explicit length is a HEAD reply: keep the GET length
        const std::string* declared = response.body.empty() ? response.find_header("Content-Length")
                                                            : nullptr;
        if (declared != nullptr) {
            fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n", *declared);
        } else {
            fmt::format_to(std::back_inserter(out), "Content-Length: {}\r\n",
                           response.body.size());
        }
    }
    out.append(keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    out.append("\r\n");
    if (!bodyless) {
        out.append(response.body);
    }
    return out;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
        case Version::UNKNOWN:
            return "HTTP/1.1";
    }
    return "HTTP/1.1";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::Created:
            return "Created";
        case StatusCode::Accepted:
            return "Accepted";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::MovedPermanently:
            return "Moved Permanently";
        case StatusCode::Found:
            return "Found";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::Conflict:
            return "Conflict";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::URITooLong:
            return "URI Too Long";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }

    auto value = static_cast<uint16_t>(code);
    if (value >= 500)
        return "Server Error";
    if (value >= 400)
        return "Client Error";
    if (value >= 300)
        return "Redirection";
    if (value >= 200)
        return "Success";
    return "Informational";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

std::string url_decode(std::string_view value) {
    std::string out;
    out.reserve(value.size());

    for (size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out += ' ';
            continue;
        }
        if (c == '%' && i + 2 < value.size()) {
            unsigned int byte = 0;
            auto [ptr, ec] = std::from_chars(value.data() + i + 1, value.data() + i + 3, byte, 16);
            if (ec == std::errc{} && ptr == value.data() + i + 3) {
                out += static_cast<char>(byte);
                i += 2;
                continue;
            }
        }
        out += c;
    }
    return out;
}

std::optional<std::string> query_param(std::string_view query, std::string_view name) {
    while (!query.empty()) {
        size_t amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);

        size_t eq = pair.find('=');
        std::string_view key = pair.substr(0, eq);
        if (url_decode(key) == name) {
            return eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

}  // namespace eden::http
