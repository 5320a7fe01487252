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

// Eden Middleware - Implementation

#include "middleware.hpp"

#include <algorithm>
#include <exception>

#include "../core/logging.hpp"

namespace eden::gateway {

MiddlewareChain::MiddlewareChain() : chain_(std::make_shared<const std::vector<Middleware>>()) {}

void MiddlewareChain::add_middleware(Middleware middleware) {
    std::lock_guard lock(write_mutex_);

    auto next = std::make_shared<std::vector<Middleware>>(*chain_.load());
    next->push_back(std::move(middleware));
    std::stable_sort(next->begin(), next->end(),
                     [](const Middleware& a, const Middleware& b) { return a.priority < b.priority; });

    chain_.store(std::move(next));
}

std::vector<Middleware> MiddlewareChain::get_middlewares() const {
    return *chain_.load();
}

MiddlewareResult MiddlewareChain::run(RequestContext& ctx, http::Request& request) const {
    Snapshot snapshot = chain_.load();

    for (const auto& middleware : *snapshot) {
        MiddlewareResult result;
        try {
            result = middleware.handler(ctx, request);
        } catch (const std::exception& e) {
            LOG_ERROR_CTX(logging::get_logger(), "Middleware threw", ctx.correlation_id,
                          middleware.name, e.what());
            ctx.set_error("Internal server error", 500);
            return MiddlewareResult::Error;
        }

        if (result == MiddlewareResult::Continue) {
            continue;
        }

        if (result == MiddlewareResult::Error && !ctx.has_error) {
            ctx.set_error("Internal server error", 500);
        }

        LOG_DEBUG(logging::get_logger(), "Middleware {} stopped chain: correlation_id={}",
                  middleware.name, ctx.correlation_id);
        return result;
    }

    return MiddlewareResult::Continue;
}

// Built-in middlewares

Middleware make_request_id_middleware(int32_t priority) {
    return Middleware{
        "request-id", priority, [](RequestContext& ctx, http::Request& request) {
            if (request.get_header("X-Request-ID").empty()) {
                request.set_header("X-Request-ID", ctx.correlation_id);
            }
            return MiddlewareResult::Continue;
        }};
}

Middleware make_forwarded_headers_middleware(int32_t priority) {
    return Middleware{
        "forwarded-headers", priority, [](RequestContext& ctx, http::Request& request) {
            if (!ctx.client_ip.empty()) {
                auto existing = request.get_header("X-Forwarded-For");
                if (existing.empty()) {
                    request.set_header("X-Forwarded-For", ctx.client_ip);
                } else {
                    request.set_header("X-Forwarded-For",
                                       std::string(existing) + ", " + ctx.client_ip);
                }
            }

            if (!request.has_header("X-Forwarded-Proto")) {
                request.set_header("X-Forwarded-Proto", "http");
            }

            std::string host(request.get_header("Host"));
            if (!host.empty() && !request.has_header("X-Forwarded-Host")) {
                request.set_header("X-Forwarded-Host", host);
            }
            return MiddlewareResult::Continue;
        }};
}

}  // namespace eden::gateway
