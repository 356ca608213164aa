#include "logging.h"

#include "time_utils.h"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace utils {

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::toupper(c); });

    if (v == "DEBUG")                   return LogLevel::Debug;
    if (v == "INFO")                    return LogLevel::Info;
    if (v == "WARNING" || v == "WARN")  return LogLevel::Warning;
    if (v == "ERROR")                   return LogLevel::Error;
    if (v == "CRITICAL")                return LogLevel::Critical;
    return std::nullopt;
}

const char* log_level_name(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "INFO";
    }
}

Logger::Logger() : console_(std::cout) {}

Logger::Logger(std::ostream& console) : console_(console) {}

void Logger::set_level(LogLevel lvl) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = lvl;
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mu_);
    if (path.empty()) {
        file_.reset();
        return true;
    }
    std::ofstream ofs(path, std::ios::out | std::ios::app);
    if (!ofs.is_open()) return false;
    file_.emplace(std::move(ofs));
    return true;
}

void Logger::log(LogLevel lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lock(mu_);
    if ((int)lvl < (int)level_) return;

    std::string line =
        "[" + now_local_string() + "]" +
        "[" + log_level_name(lvl) + "] " +
        msg;

    console_ << line << "\n";
    console_.flush();

    if (file_.has_value()) {
        (*file_) << line << "\n";
        file_->flush();
    }
}

} // namespace utils
