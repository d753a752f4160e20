#pragma once

#include "serverscore/common.hpp"
#include <chrono>
#include <string>

namespace serverscore {
namespace time {

// Type aliases for convenience
using Clock = std::chrono::system_clock;
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::system_clock::duration;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// Get current time
TimePoint now();

// Get current Unix timestamp (milliseconds since epoch)
uint64_t timestamp_milliseconds();

// Convert TimePoint to Unix timestamp (milliseconds)
uint64_t to_timestamp_ms(const TimePoint& tp);

// Convert Unix timestamp (milliseconds) to TimePoint
TimePoint from_timestamp_ms(uint64_t timestamp_ms);

// Convert TimePoint to string (ISO 8601 format, UTC)
std::string to_string(const TimePoint& tp);

// Parse ISO 8601 string to TimePoint.
// Accepts an optional fractional part and a trailing 'Z' or +HH:MM / -HH:MM offset.
// Throws std::runtime_error on malformed input.
TimePoint from_string(const std::string& str);

// Absolute distance between two millisecond timestamps
inline uint64_t abs_diff_ms(uint64_t a, uint64_t b) {
    return a > b ? a - b : b - a;
}

// Timer for measuring elapsed time
class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    uint64_t elapsed_milliseconds() const {
        return std::chrono::duration_cast<Milliseconds>(
            std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace time
} // namespace serverscore
