#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include "util/logger.hpp"

int main(int argc, char** argv) {
    // Quiet by default; DEVSNAP_TEST_LOG=debug to see broker logs while tests run
    devsnap::util::init_logger();
    const char* level = std::getenv("DEVSNAP_TEST_LOG");
    devsnap::util::set_log_level(level ? devsnap::util::parse_log_level(level) : spdlog::level::off);

    return Catch::Session().run(argc, argv);
}
