#include <spdlog/spdlog.h>
#include <optional>
#include "broker/broker.hpp"
#include "broker/config.hpp"
#include "util/logger.hpp"

namespace {

void print_usage(const char* argv0) {
    spdlog::info("usage: {} [--config file.json] [--socket path] [--host addr] [--port n] [--log-level level]",
        argv0);
}

} // namespace

int main(int argc, char** argv) {
    devsnap::util::init_logger();

    spdlog::info("=================================");
    spdlog::info("  devsnap broker v0.1.0");
    spdlog::info("=================================");

    devsnap::broker::BrokerConfig config;
    std::optional<std::string> config_path;

    // Flags are parsed twice: once to find --config, then again so they win over the file
    auto args = devsnap::broker::apply_args(argc, argv, config, config_path);
    if (!args.success) {
        spdlog::error("{}", args.error);
        print_usage(argv[0]);
        return 2;
    }

    if (config_path) {
        config = devsnap::broker::BrokerConfig{};
        auto loaded = devsnap::broker::load_config_file(*config_path, config);
        if (!loaded.success) {
            spdlog::error("{}", loaded.error);
            return 1;
        }
    }
    devsnap::broker::apply_env_overrides(config);
    args = devsnap::broker::apply_args(argc, argv, config, config_path);
    if (!args.success) {
        spdlog::error("{}", args.error);
        return 2;
    }

    devsnap::util::set_log_level(devsnap::util::parse_log_level(config.log_level));

    auto valid = devsnap::broker::validate(config);
    if (!valid.success) {
        spdlog::error("Invalid configuration: {}", valid.error);
        return 1;
    }

    devsnap::broker::Broker broker(config);
    if (!broker.init()) {
        spdlog::error("Failed to initialize broker");
        return 1;
    }
    broker.install_signal_handlers();

    // Run (blocks until Ctrl+C)
    broker.run();

    return 0;
}
