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

// Eden Logging - Header
// Asynchronous structured logging (quill) and correlation ids

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace eden::control {
struct LogConfig;
}

namespace eden::logging {

// Start the Quill backend thread (idempotent, called once at startup)
void init_logging_system();

// Create the process logger from config (console or rotating file sink)
quill::Logger* init_logger(const eden::control::LogConfig& config);

// Flush and stop the backend thread (called at exit)
void shutdown_logging();

// Process logger. Falls back to a console logger if init_logger() was never
// called, so callers never receive nullptr.
quill::Logger* get_logger();

// Random UUID v4 (8-4-4-4-12)
std::string generate_uuid();

// Correlation id: {per-thread uuid}#{counter}
std::string generate_correlation_id();

// Validate correlation id format
bool is_valid_uuid(std::string_view uuid);

// Logging macros for structured logging

// Request completion logging
#define LOG_REQUEST(logger, method, path, status, duration_us, client_ip, correlation_id) \
    LOG_INFO(logger,                                                                      \
             "Request completed: method={}, path={}, status={}, "                         \
             "duration_us={}, client_ip={}, correlation_id={}",                           \
             method, path, status, duration_us, client_ip, correlation_id)

// Error logging with context
#define LOG_ERROR_CTX(logger, message, correlation_id, error_code, error_detail)        \
    LOG_ERROR(logger, "{}: correlation_id={}, error_code={}, error_detail={}", message, \
              correlation_id, error_code, error_detail)

// Upstream call event logging
#define LOG_UPSTREAM(logger, event, service, target, correlation_id)                   \
    LOG_INFO(logger, "Upstream {}: service={}, target={}, correlation_id={}", event, \
             service, target, correlation_id)

}  // namespace eden::logging
