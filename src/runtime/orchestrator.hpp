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

// Eden Runtime Orchestrator - Header
// Wires the gateway listener, admin server and health prober together and
// runs them until shutdown is requested

#pragma once

#include <atomic>
#include <system_error>

#include "../control/config.hpp"

namespace eden::runtime {

// Set by the signal handler; run_gateway() returns once it observes it
extern std::atomic<bool> g_shutdown_requested;

/// Run the gateway until g_shutdown_requested is set
/// Returns the first startup error (bind, listen); shutdown itself never fails.
[[nodiscard]] std::error_code run_gateway(const control::Config& config);

}  // namespace eden::runtime
