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

// Eden API Gateway - Main Entry Point
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include "control/config.hpp"
#include "core/logging.hpp"
#include "runtime/orchestrator.hpp"

namespace {

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        eden::runtime::g_shutdown_requested.store(true, std::memory_order_relaxed);
    }
}

void print_usage(const char* program) {
    fprintf(stderr, "Usage: %s [--config <config.json>]\n", program);
    fprintf(stderr, "Without --config the built-in Eden service routes are served.\n");
}

}  // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        } else {
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    eden::logging::init_logging_system();

    std::optional<eden::control::Config> config;
    if (config_path) {
        config = eden::control::ConfigLoader::load_from_file(*config_path);
        if (!config) {
            fprintf(stderr, "Failed to load configuration from %s\n", config_path->c_str());
            eden::logging::shutdown_logging();
            return EXIT_FAILURE;
        }
    } else {
        config = eden::control::ConfigLoader::default_config();
    }

    auto* logger = eden::logging::init_logger(config->logging);

    size_t overrides = eden::control::ConfigLoader::apply_env_overrides(*config);
    if (overrides > 0) {
        LOG_INFO(logger, "Applied {} service URL override(s) from the environment", overrides);

        auto validation = eden::control::ConfigLoader::validate(*config);
        if (!validation.valid) {
            for (const auto& error : validation.errors) {
                LOG_ERROR(logger, "Configuration error: {}", error);
            }
            eden::logging::shutdown_logging();
            return EXIT_FAILURE;
        }
    }

    LOG_INFO(logger, "Eden API Gateway {} starting on {}:{}", config->version,
             config->server.listen_address, config->server.listen_port);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    auto ec = eden::runtime::run_gateway(*config);
    if (ec) {
        LOG_ERROR(logger, "Gateway error: {}", ec.message());
        eden::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    LOG_INFO(logger, "Eden API Gateway stopped");
    eden::logging::shutdown_logging();
    return EXIT_SUCCESS;
}
