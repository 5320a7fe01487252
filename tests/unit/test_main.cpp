// Eden Unit Tests - Main Entry Point
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        eden::logging::init_logging_system();

        eden::control::LogConfig log_config;
        log_config.output = "/tmp/eden_tests";
        log_config.level = "debug";
        eden::logging::init_logger(log_config);
    }

    ~GlobalSetup() { eden::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
