#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include "common/types.hpp"

namespace cmm {
namespace time_utils {

// UTC, millisecond precision: 2026-01-31T12:00:00.000Z
std::string to_iso8601(WallClock t);
std::string now_iso8601();

// Wall-clock microseconds since epoch, used to order wallet transactions
int64_t now_micros();

/**
 * Monotonic timer for per-request latency in the replay tool.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_us() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

} // namespace time_utils
} // namespace cmm
