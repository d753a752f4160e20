#include "serverscore/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <stdexcept>

#ifdef _WIN32
#define timegm _mkgmtime
#endif

namespace serverscore {
namespace time {

TimePoint now() {
    return Clock::now();
}

uint64_t timestamp_milliseconds() {
    return std::chrono::duration_cast<Milliseconds>(
        Clock::now().time_since_epoch()
    ).count();
}

uint64_t to_timestamp_ms(const TimePoint& tp) {
    return std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count();
}

TimePoint from_timestamp_ms(uint64_t timestamp_ms) {
    return TimePoint(std::chrono::duration_cast<Duration>(Milliseconds(timestamp_ms)));
}

std::string to_string(const TimePoint& tp) {
    auto time_t_val = Clock::to_time_t(tp);
    std::tm tm_val;

#ifdef SERVERSCORE_PLATFORM_WINDOWS
    gmtime_s(&tm_val, &time_t_val);
#else
    gmtime_r(&time_t_val, &tm_val);
#endif

    auto ms = std::chrono::duration_cast<Milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

TimePoint from_string(const std::string& str) {
    std::tm tm_val = {};
    std::istringstream iss(str);

    iss >> std::get_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::runtime_error("Failed to parse time string: " + str);
    }

    // Fraction: keep millisecond precision, ignore further digits
    int64_t ms = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            int d = iss.get() - '0';
            if (digits < 3) {
                ms = ms * 10 + d;
            }
            ++digits;
        }
        if (digits == 0) {
            throw std::runtime_error("Failed to parse time fraction: " + str);
        }
        for (; digits < 3; ++digits) {
            ms *= 10;
        }
    }

    // Zone designator; naive timestamps are treated as UTC
    int64_t offset_seconds = 0;
    int next = iss.peek();
    if (next == 'Z' || next == 'z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        char sign = static_cast<char>(iss.get());
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        iss >> hours;
        if (iss.peek() == ':') {
            iss >> colon >> minutes;
        }
        if (iss.fail() || hours > 23 || minutes > 59) {
            throw std::runtime_error("Failed to parse time offset: " + str);
        }
        offset_seconds = (hours * 3600 + minutes * 60) * (sign == '-' ? -1 : 1);
    }

    if (iss.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Trailing characters in time string: " + str);
    }

    auto time_t_val = timegm(&tm_val);
    auto tp = Clock::from_time_t(time_t_val);
    tp += Milliseconds(ms);
    tp -= Seconds(offset_seconds);

    return tp;
}

} // namespace time
} // namespace serverscore
