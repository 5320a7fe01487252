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

// Eden Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <system_error>

#include "../control/config.hpp"

namespace eden::logging {

namespace {

std::atomic<quill::Logger*> g_logger{nullptr};
std::once_flag g_backend_once;
std::atomic<bool> g_backend_started{false};

quill::LogLevel parse_level(std::string_view level) {
    std::string level_lower{level};
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(), ::tolower);

    if (level_lower == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level_lower == "warning" || level_lower == "warn") {
        return quill::LogLevel::Warning;
    }
    if (level_lower == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

}  // namespace

void init_logging_system() {
    std::call_once(g_backend_once, [] {
        quill::Backend::start();
        g_backend_started.store(true, std::memory_order_release);
    });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    init_logging_system();

    quill::Logger* logger = nullptr;

    if (log_config.output.empty() || log_config.output == "stdout") {
        auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("eden_console");
        logger = quill::Frontend::create_or_get_logger("eden", std::move(console_sink));
    } else {
        std::error_code ec;
        std::filesystem::create_directories(log_config.output, ec);
        if (ec) {
            // Unwritable log directory: keep serving, log to the console instead
            auto console_sink =
                quill::Frontend::create_or_get_sink<quill::ConsoleSink>("eden_console");
            logger = quill::Frontend::create_or_get_logger("eden", std::move(console_sink));
            LOG_WARNING(logger, "Cannot create log directory {}: {}, logging to stdout",
                        log_config.output, ec.message());
        } else {
            quill::RotatingFileSinkConfig config;
            config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000ULL);
            config.set_max_backup_files(log_config.rotation.max_files);
            config.set_open_mode('a');

            std::string log_path = fmt::format("{}/gateway.log", log_config.output);

            if (log_config.format == "json") {
                auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
                    log_path, config);
                logger = quill::Frontend::create_or_get_logger("eden", std::move(json_sink));
            } else {
                auto file_sink =
                    quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(log_path, config);
                logger = quill::Frontend::create_or_get_logger("eden", std::move(file_sink));
            }
        }
    }

    logger->set_log_level(parse_level(log_config.level));
    g_logger.store(logger, std::memory_order_release);
    return logger;
}

void shutdown_logging() {
    if (!g_backend_started.load(std::memory_order_acquire)) {
        return;
    }
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* get_logger() {
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        return logger;
    }

    // Not configured yet: default console logger
    init_logging_system();
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("eden_console");
    auto* fallback = quill::Frontend::create_or_get_logger("eden_default", std::move(console_sink));

    quill::Logger* expected = nullptr;
    if (g_logger.compare_exchange_strong(expected, fallback, std::memory_order_acq_rel)) {
        return fallback;
    }
    return expected;
}

std::string generate_uuid() {
    // XOR combines hardware randomness with timestamp for thread-unique seed
    static thread_local std::mt19937 rng(
        std::random_device{}() ^
        static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::uniform_int_distribution<uint32_t> dist;

    std::array<uint8_t, 16> uuid_bytes{};
    for (size_t i = 0; i < 16; i += 4) {
        uint32_t random_val = dist(rng);
        uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
        uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
        uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
        uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
    }

    // Version 4, RFC4122 variant
    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(uuid_bytes[i]);
    }

    return oss.str();
}

std::string generate_correlation_id() {
    // Base UUID generated once per worker thread, counter appended per request
    static thread_local std::string base_uuid = generate_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_uuid(std::string_view uuid) {
    // Format: {uuid}#{counter}, e.g. 550e8400-e29b-41d4-a716-446655440000#42
    size_t hash_pos = uuid.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = uuid.substr(0, hash_pos);
    std::string_view counter_part = uuid.substr(hash_pos + 1);

    if (uuid_part.length() != 36) {
        return false;
    }

    if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
        uuid_part[23] != '-') {
        return false;
    }

    // Version nibble
    if (uuid_part[14] != '4') {
        return false;
    }

    // Variant nibble: 8, 9, a or b
    char variant = uuid_part[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' && variant != 'A' &&
        variant != 'B') {
        return false;
    }

    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    for (size_t i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        if (!is_hex(uuid_part[i])) {
            return false;
        }
    }

    if (counter_part.empty()) {
        return false;
    }

    return std::all_of(counter_part.begin(), counter_part.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace eden::logging
