#include "time_utils.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace utils {

namespace {

std::tm to_local_tm(SystemClock::time_point tp) {
    auto tt = SystemClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&tt, &tm);
    return tm;
}

std::string put_time_(SystemClock::time_point tp, const char* fmt) {
    std::tm tm = to_local_tm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

} // namespace

Stopwatch::Stopwatch() : start_(SteadyClock::now()) {}

std::int64_t Stopwatch::elapsed_ms() const {
    auto d = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start_);
    return (std::int64_t)d.count();
}

SystemClock::time_point now_system() {
    return SystemClock::now();
}

std::string format_time_local(SystemClock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << put_time_(tp, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

std::string now_local_string() {
    return format_time_local(now_system());
}

std::string format_seconds_local(SystemClock::time_point tp) {
    return put_time_(tp, "%Y-%m-%d %H:%M:%S");
}

std::string format_file_stamp(SystemClock::time_point tp) {
    return put_time_(tp, "%Y-%m-%d_%H-%M-%S");
}

bool is_file_stamp(const std::string& s) {
    // YYYY-MM-DD_HH-MM-SS
    static const char pattern[] = "dddd-dd-dd_dd-dd-dd";
    if (s.size() != sizeof(pattern) - 1) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (pattern[i] == 'd') {
            if (!std::isdigit((unsigned char)s[i])) return false;
        } else if (s[i] != pattern[i]) {
            return false;
        }
    }
    return true;
}

SystemClock::time_point from_timespec(const struct timespec& ts) {
    auto d = std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
    return SystemClock::time_point(std::chrono::duration_cast<SystemClock::duration>(d));
}

} // namespace utils
