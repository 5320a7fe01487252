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

// Eden HTTP Parser - Implementation

#include "parser.hpp"

namespace eden::http {

Parser::Parser(ParserLimits limits) {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    ctx_.limits = limits;
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

std::pair<ParseResult, size_t> Parser::parse_request(std::span<const char> data,
                                                     Request& request) {
    ctx_.request = &request;

    if (data.empty()) {
        return {ParseResult::Incomplete, 0};
    }

    llhttp_errno_t err = llhttp_execute(&parser_, data.data(), data.size());

    size_t consumed = data.size();

    // on_message_complete pauses the parser so trailing bytes stay unconsumed
    if (err == HPE_PAUSED) {
        const char* stop = llhttp_get_error_pos(&parser_);
        if (stop) {
            consumed = static_cast<size_t>(stop - data.data());
        }
        llhttp_resume(&parser_);
        return {ParseResult::Complete, consumed};
    }

    if (err != HPE_OK) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(error_pos - data.data());
        }
        ctx_.error = err;
        return {ctx_.too_large ? ParseResult::TooLarge : ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    return {ParseResult::Incomplete, consumed};
}

void Parser::reset() {
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;

    auto limits = ctx_.limits;
    ctx_ = Context{};
    ctx_.limits = limits;
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.too_large) {
        return "request too large";
    }
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->started = true;
    ctx->message_complete = false;
    ctx->error = HPE_OK;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->header_bytes += length;
    if (ctx->header_bytes > ctx->limits.max_header_size) {
        ctx->too_large = true;
        return -1;
    }

    // URL may arrive in several chunks
    ctx->request->uri.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    ctx->header_bytes += length;
    if (ctx->header_bytes > ctx->limits.max_header_size) {
        ctx->too_large = true;
        return -1;
    }

    auto& headers = ctx->request->headers;
    if (!ctx->last_was_field || headers.empty()) {
        headers.emplace_back(std::string(at, length), std::string());
    } else {
        headers.back().first.append(at, length);
    }

    ctx->last_was_field = true;
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request || ctx->request->headers.empty()) return -1;

    ctx->header_bytes += length;
    if (ctx->header_bytes > ctx->limits.max_header_size) {
        ctx->too_large = true;
        return -1;
    }

    ctx->request->headers.back().second.append(at, length);
    ctx->last_was_field = false;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    Request& request = *ctx->request;

    uint8_t major = parser->http_major;
    uint8_t minor = parser->http_minor;
    if (major == 1 && minor == 0) {
        request.version = Version::HTTP_1_0;
    } else if (major == 1 && minor == 1) {
        request.version = Version::HTTP_1_1;
    } else {
        request.version = Version::UNKNOWN;
    }

    request.method_name = llhttp_method_name(static_cast<llhttp_method_t>(llhttp_get_method(parser)));
    request.method = parse_method(request.method_name);

    size_t query_pos = request.uri.find('?');
    if (query_pos != std::string::npos) {
        request.path = request.uri.substr(0, query_pos);
        request.query = request.uri.substr(query_pos + 1);
    } else {
        request.path = request.uri;
        request.query.clear();
    }

    if (request.content_length() > ctx->limits.max_body_size) {
        ctx->too_large = true;
        return -1;
    }

    return 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // Chunked bodies have no Content-Length to check up front
    if (ctx->request->body.size() + length > ctx->limits.max_body_size) {
        ctx->too_large = true;
        return -1;
    }

    ctx->request->body.append(at, length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;
    return HPE_PAUSED;
}

// Convenience wrapper

std::optional<Request> parse_http_request(std::string_view data, ParserLimits limits) {
    Parser parser(limits);
    Request request;

    auto [result, consumed] = parser.parse_request(std::span<const char>(data.data(), data.size()),
                                                   request);

    if (result == ParseResult::Complete) {
        return request;
    }

    return std::nullopt;
}

}  // namespace eden::http
