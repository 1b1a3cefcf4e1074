#pragma once

/**
 * Time utilities
 *
 * The engine never reads the clock itself; callers pass `now`. Tools use
 * this to get that value from the wall clock.
 */

#include <chrono>
#include <cstdint>

namespace p2p {
namespace util {

/**
 * Current wall-clock time in whole seconds since Unix epoch.
 */
inline uint64_t wall_clock_secs() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()
    ).count();
}

constexpr uint64_t hours(uint64_t h) { return h * 60 * 60; }

}  // namespace util
}  // namespace p2p
