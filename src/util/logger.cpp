#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace devsnap::util {

void init_logger() {
    auto console = spdlog::get("devsnap");
    if (!console) {
        console = spdlog::stdout_color_mt("devsnap");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to off; only honour off when asked for
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace devsnap::util
