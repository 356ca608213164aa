#pragma once

#include <fstream>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace utils {

enum class LogLevel {
    Debug    = 0,
    Info     = 1,
    Warning  = 2,
    Error    = 3,
    Critical = 4,
};

// "debug", "INFO", "warn", "Warning", ... -> LogLevel
std::optional<LogLevel> parse_log_level(const std::string& s);

const char* log_level_name(LogLevel lvl);

class Logger {
public:
    // Writes to std::cout
    Logger();

    // Writes to the given stream, which must outlive the logger
    explicit Logger(std::ostream& console);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel lvl);

    // Optional: log to file as well as the console stream
    // If path empty -> disables file output
    bool set_log_file(const std::string& path);

    // Log raw message at level
    void log(LogLevel lvl, const std::string& msg);

    void debug   (const std::string& msg) { log(LogLevel::Debug,    msg); }
    void info    (const std::string& msg) { log(LogLevel::Info,     msg); }
    void warning (const std::string& msg) { log(LogLevel::Warning,  msg); }
    void error   (const std::string& msg) { log(LogLevel::Error,    msg); }
    void critical(const std::string& msg) { log(LogLevel::Critical, msg); }

private:
    std::mutex mu_;
    std::ostream& console_;
    LogLevel level_ = LogLevel::Info;
    std::optional<std::ofstream> file_;
};

} // namespace utils
