#include <catch2/catch.hpp>
#include "broker/config.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>
#include <unistd.h>

using namespace devsnap::broker;

namespace {

// Config file removed when the test ends
class TempFile {
public:
    explicit TempFile(const std::string& contents) {
        char name[] = "/tmp/devsnap-config-XXXXXX";
        int fd = mkstemp(name);
        if (fd >= 0) {
            close(fd);
        }
        path_ = name;
        std::ofstream(path_) << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Builds a mutable argv from string literals
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> argv;

    Args(std::initializer_list<const char*> args) : storage(args.begin(), args.end()) {
        for (auto& s : storage) {
            argv.push_back(s.data());
        }
    }
    int argc() { return static_cast<int>(argv.size()); }
};

} // namespace

TEST_CASE("Defaults are valid", "[config]") {
    BrokerConfig config;
    REQUIRE(validate(config).success);
    REQUIRE(config.http_port == 5178);
    REQUIRE(config.route_prefix == "/__snap");
    REQUIRE(config.active_window_ms == 45'000);
}

TEST_CASE("Config file overlays known keys", "[config]") {
    TempFile file(R"({"http_port": 6000, "socket_path": "/tmp/x.sock",
                      "active_window_ms": 10000, "max_wait_ms": 120000, "unknown": true})");
    BrokerConfig config;

    auto result = load_config_file(file.path(), config);
    REQUIRE(result.success);
    REQUIRE(config.http_port == 6000);
    REQUIRE(config.socket_path == "/tmp/x.sock");
    REQUIRE(config.active_window_ms == 10'000);
    REQUIRE(config.max_wait_ms == 120'000);
    REQUIRE(config.http_host == "127.0.0.1");
}

TEST_CASE("Bad config files are reported", "[config]") {
    BrokerConfig config;

    SECTION("missing") {
        auto result = load_config_file("/nonexistent/devsnap.json", config);
        REQUIRE_FALSE(result.success);
        REQUIRE(result.error.find("cannot open") != std::string::npos);
    }
    SECTION("not json") {
        TempFile file("http_port = 1");
        REQUIRE_FALSE(load_config_file(file.path(), config).success);
    }
    SECTION("wrong type") {
        TempFile file(R"({"http_port": "eighty"})");
        REQUIRE_FALSE(load_config_file(file.path(), config).success);
    }
    SECTION("not an object") {
        TempFile file("[1, 2]");
        REQUIRE_FALSE(load_config_file(file.path(), config).success);
    }
}

TEST_CASE("Environment overrides file values", "[config]") {
    setenv("DEVSNAP_HTTP_PORT", "7001", 1);
    setenv("DEVSNAP_SOCKET", "/tmp/env.sock", 1);
    BrokerConfig config;
    apply_env_overrides(config);
    REQUIRE(config.http_port == 7001);
    REQUIRE(config.socket_path == "/tmp/env.sock");

    setenv("DEVSNAP_HTTP_PORT", "seventy", 1);
    apply_env_overrides(config);
    REQUIRE(config.http_port == 7001);

    unsetenv("DEVSNAP_HTTP_PORT");
    unsetenv("DEVSNAP_SOCKET");
}

TEST_CASE("Command line flags are applied", "[config]") {
    BrokerConfig config;
    std::optional<std::string> config_path;

    Args args{"devsnapd", "--port", "9000", "--socket", "/tmp/cli.sock",
              "--config", "/etc/devsnap.json", "--log-level", "debug"};
    auto result = apply_args(args.argc(), args.argv.data(), config, config_path);
    REQUIRE(result.success);
    REQUIRE(config.http_port == 9000);
    REQUIRE(config.socket_path == "/tmp/cli.sock");
    REQUIRE(config.log_level == "debug");
    REQUIRE(config_path == std::string("/etc/devsnap.json"));
}

TEST_CASE("Bad flags are rejected", "[config]") {
    BrokerConfig config;
    std::optional<std::string> config_path;

    Args unknown{"devsnapd", "--verbose", "yes"};
    REQUIRE(apply_args(unknown.argc(), unknown.argv.data(), config, config_path).error == "unknown option: --verbose");

    Args missing{"devsnapd", "--port"};
    REQUIRE_FALSE(apply_args(missing.argc(), missing.argv.data(), config, config_path).success);

    Args port{"devsnapd", "--port", "80x"};
    REQUIRE_FALSE(apply_args(port.argc(), port.argv.data(), config, config_path).success);
}

TEST_CASE("Validation catches out-of-range values", "[config]") {
    BrokerConfig config;

    SECTION("port") {
        config.http_port = 70000;
        REQUIRE_FALSE(validate(config).success);
    }
    SECTION("sweep interval") {
        config.sweep_interval_ms = 0;
        REQUIRE_FALSE(validate(config).success);
    }
    SECTION("wait budget") {
        config.ping_wait_ms = -1;
        REQUIRE_FALSE(validate(config).success);
    }
    SECTION("maximum wait below the defaults") {
        config.max_wait_ms = config.dump_wait_ms - 1;
        REQUIRE_FALSE(validate(config).success);
    }
    SECTION("maximum wait beyond the deadline clamp") {
        config.max_wait_ms = 10'000'000'000'000LL;
        REQUIRE_FALSE(validate(config).success);
    }
    SECTION("socket path") {
        config.socket_path.clear();
        REQUIRE(validate(config).error == "socket_path must not be empty");
    }
}
