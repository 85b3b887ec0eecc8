#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "logging.hpp"

int main(int argc, char* argv[]) {
    // Components log through core::logging::getLogger(), which requires initialization
    core::logging::initialize("strategy_charts_tests", spdlog::level::warn, spdlog::level::debug);
    return Catch::Session().run(argc, argv);
}
