#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace taskrelay {
namespace utils {

// Wall-clock source in milliseconds since the Unix epoch
using EpochClock = std::function<std::int64_t()>;

inline std::int64_t epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace utils
} // namespace taskrelay
