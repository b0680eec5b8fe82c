#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace devsnap::util {

// Source of wall-clock time in epoch milliseconds
using WallClock = std::function<int64_t()>;

inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace devsnap::util
