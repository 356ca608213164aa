#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace utils {

using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;

struct Stopwatch {
    Stopwatch();

    // elapsed time since construction
    std::int64_t elapsed_ms() const;

private:
    SteadyClock::time_point start_;
};

// Current time
SystemClock::time_point now_system();

// "YYYY-MM-DD HH:MM:SS.mmm" in local time (log lines)
std::string format_time_local(SystemClock::time_point tp);

// Format now in local time
std::string now_local_string();

// "YYYY-MM-DD HH:MM:SS" in local time (reports)
std::string format_seconds_local(SystemClock::time_point tp);

// "YYYY-MM-DD_HH-MM-SS" in local time, safe for file and folder names
std::string format_file_stamp(SystemClock::time_point tp);

// Checks that s has exactly the shape produced by format_file_stamp
bool is_file_stamp(const std::string& s);

// POSIX timespec (stat mtime) -> system_clock
SystemClock::time_point from_timespec(const struct timespec& ts);

} // namespace utils
