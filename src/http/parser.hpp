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

// Eden HTTP Parser - Header
// Incremental HTTP/1.1 request parser built on llhttp

#pragma once

#include "http.hpp"

#include <llhttp.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace eden::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,      // Request fully parsed
    Incomplete,    // Need more data
    TooLarge,      // Header or body limit exceeded
    Error          // Parse error
};

/// Size limits applied while parsing
struct ParserLimits {
    size_t max_header_size = 8 * 1024;
    size_t max_body_size = 1024 * 1024;
};

/// HTTP/1.1 request parser (wraps llhttp)
/// Data may arrive in arbitrary chunks. The parser stops after each complete
/// message so pipelined requests on a keep-alive connection are returned one at a time.
class Parser {
public:
    explicit Parser(ParserLimits limits = {});
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to settings_ and ctx_)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Feed bytes into the parser
    /// Returns ParseResult and number of bytes consumed. On Complete the bytes after
    /// 'consumed' belong to the next request and must be fed again after reset().
    [[nodiscard]] std::pair<ParseResult, size_t> parse_request(std::span<const char> data,
                                                               Request& request);

    /// Reset parser state for the next request on the same connection
    void reset();

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get last llhttp error code
    [[nodiscard]] llhttp_errno_t error_code() const noexcept { return ctx_.error; }

    /// True once any byte of the current request has been seen
    [[nodiscard]] bool in_progress() const noexcept { return ctx_.started; }

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        Request* request = nullptr;
        ParserLimits limits;

        size_t header_bytes = 0;
        bool last_was_field = false;
        bool started = false;
        bool message_complete = false;
        bool too_large = false;
        llhttp_errno_t error = HPE_OK;
    };

    Context ctx_;
};

/// Helper: Parse a complete HTTP request held in one buffer
/// Returns std::nullopt on error or when the request is incomplete
[[nodiscard]] std::optional<Request> parse_http_request(std::string_view data,
                                                        ParserLimits limits = {});

}  // namespace eden::http
