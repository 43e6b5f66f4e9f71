#pragma once
#include <fstream>
#include <iostream>
#include <string>

namespace geosync {

enum class LogLevel : int {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3,
    off = 4
};

// "debug", "info", "warning", "error", "critical" (= error). Unknown -> info.
LogLevel parse_log_level(const std::string &name);
const char *log_level_name(LogLevel level);

// Leveled line logger. Owned by main() and handed to components by reference.
class Logger {
public:
    explicit Logger(std::ostream &console = std::cerr, LogLevel level = LogLevel::info);

    // mode "a" appends, anything else truncates. Throws std::runtime_error.
    void open_file(const std::string &path, const std::string &mode = "a");

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel level) const { return level >= level_ && level_ != LogLevel::off; }

    void log(LogLevel level, const std::string &tag, const std::string &message);
    void debug(const std::string &tag, const std::string &message)   { log(LogLevel::debug, tag, message); }
    void info(const std::string &tag, const std::string &message)    { log(LogLevel::info, tag, message); }
    void warning(const std::string &tag, const std::string &message) { log(LogLevel::warning, tag, message); }
    void error(const std::string &tag, const std::string &message)   { log(LogLevel::error, tag, message); }

private:
    std::ostream &console_;
    std::ofstream file_;
    LogLevel level_;
};

} // namespace geosync
