#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace devsnap::broker {

// Broker configuration
struct BrokerConfig {
    std::string socket_path = "/tmp/devsnap.sock";   // agent channel endpoint
    std::string http_host = "127.0.0.1";
    int http_port = 5178;
    std::string route_prefix = "/__snap";
    int http_worker_threads = 8;

    // Liveness: "active" listing window (~3 missed 15s heartbeats),
    // sweep cadence and the stale threshold the sweeper evicts at
    int64_t active_window_ms = 45'000;
    int64_t sweep_interval_ms = 60'000;
    int64_t stale_after_ms = 5 * 60'000;

    // Default wait budgets for operator requests
    int64_t dump_wait_ms = 5'000;
    int64_t ping_wait_ms = 3'000;
    int64_t max_wait_ms = 10 * 60'000;

    std::string log_level = "info";
};

struct ConfigResult {
    bool success = false;
    std::string error;
};

// Overlay values from a JSON file onto config. Unknown keys are ignored.
ConfigResult load_config_file(const std::string& path, BrokerConfig& config);

// Overlay DEVSNAP_* environment variables onto config
void apply_env_overrides(BrokerConfig& config);

// Overlay command line flags onto config. Sets config_path if --config is given.
ConfigResult apply_args(int argc, char** argv, BrokerConfig& config,
                        std::optional<std::string>& config_path);

// Range checks on intervals and ports
ConfigResult validate(const BrokerConfig& config);

} // namespace devsnap::broker
