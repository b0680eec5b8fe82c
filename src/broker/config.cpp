#include "broker/config.hpp"
#include "broker/correlation_table.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace devsnap::broker {

namespace {

std::optional<int> parse_int(const std::string& text) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

ConfigResult load_config_file(const std::string& path, BrokerConfig& config) {
    ConfigResult result;

    std::ifstream in(path);
    if (!in) {
        result.error = "cannot open config file: " + path;
        return result;
    }

    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            result.error = "config root must be an object";
            return result;
        }

        config.socket_path = j.value("socket_path", config.socket_path);
        config.http_host = j.value("http_host", config.http_host);
        config.http_port = j.value("http_port", config.http_port);
        config.route_prefix = j.value("route_prefix", config.route_prefix);
        config.http_worker_threads = j.value("http_worker_threads", config.http_worker_threads);
        config.active_window_ms = j.value("active_window_ms", config.active_window_ms);
        config.sweep_interval_ms = j.value("sweep_interval_ms", config.sweep_interval_ms);
        config.stale_after_ms = j.value("stale_after_ms", config.stale_after_ms);
        config.dump_wait_ms = j.value("dump_wait_ms", config.dump_wait_ms);
        config.ping_wait_ms = j.value("ping_wait_ms", config.ping_wait_ms);
        config.max_wait_ms = j.value("max_wait_ms", config.max_wait_ms);
        config.log_level = j.value("log_level", config.log_level);
    } catch (const std::exception& e) {
        result.error = std::string("invalid config file: ") + e.what();
        return result;
    }

    spdlog::debug("Loaded config from {}", path);
    result.success = true;
    return result;
}

void apply_env_overrides(BrokerConfig& config) {
    if (const char* socket = std::getenv("DEVSNAP_SOCKET")) {
        config.socket_path = socket;
    }
    if (const char* host = std::getenv("DEVSNAP_HTTP_HOST")) {
        config.http_host = host;
    }
    if (const char* port = std::getenv("DEVSNAP_HTTP_PORT")) {
        if (auto value = parse_int(port)) {
            config.http_port = *value;
        } else {
            spdlog::warn("Ignoring DEVSNAP_HTTP_PORT={} (not a number)", port);
        }
    }
    if (const char* level = std::getenv("DEVSNAP_LOG_LEVEL")) {
        config.log_level = level;
    }
}

ConfigResult apply_args(int argc, char** argv, BrokerConfig& config,
                        std::optional<std::string>& config_path) {
    ConfigResult result;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            result.error = "missing value for " + arg;
            return result;
        }
        std::string value = argv[++i];

        if (arg == "--config") {
            config_path = value;
        } else if (arg == "--socket") {
            config.socket_path = value;
        } else if (arg == "--host") {
            config.http_host = value;
        } else if (arg == "--port") {
            auto port = parse_int(value);
            if (!port) {
                result.error = "invalid port: " + value;
                return result;
            }
            config.http_port = *port;
        } else if (arg == "--log-level") {
            config.log_level = value;
        } else {
            result.error = "unknown option: " + arg;
            return result;
        }
    }

    result.success = true;
    return result;
}

ConfigResult validate(const BrokerConfig& config) {
    ConfigResult result;

    if (config.socket_path.empty()) {
        result.error = "socket_path must not be empty";
    } else if (config.http_port <= 0 || config.http_port > 65535) {
        result.error = "http_port out of range: " + std::to_string(config.http_port);
    } else if (config.http_worker_threads <= 0) {
        result.error = "http_worker_threads must be positive";
    } else if (config.active_window_ms < 0) {
        result.error = "active_window_ms must not be negative";
    } else if (config.sweep_interval_ms <= 0) {
        result.error = "sweep_interval_ms must be positive";
    } else if (config.stale_after_ms <= 0) {
        result.error = "stale_after_ms must be positive";
    } else if (config.dump_wait_ms <= 0 || config.ping_wait_ms <= 0) {
        result.error = "wait budgets must be positive";
    } else if (config.max_wait_ms < config.dump_wait_ms || config.max_wait_ms < config.ping_wait_ms) {
        result.error = "max_wait_ms must cover the default wait budgets";
    } else if (config.max_wait_ms > CorrelationTable::MAX_TIMEOUT_MS) {
        result.error = "max_wait_ms above " + std::to_string(CorrelationTable::MAX_TIMEOUT_MS);
    } else {
        result.success = true;
    }
    return result;
}

} // namespace devsnap::broker
