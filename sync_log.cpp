#include "sync_log.h"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace geosync {

LogLevel parse_log_level(const std::string &name) {
    std::string l = name;
    std::transform(l.begin(), l.end(), l.begin(), ::tolower);
    if (l == "debug")                       return LogLevel::debug;
    if (l == "warning" || l == "warn")      return LogLevel::warning;
    if (l == "error" || l == "critical")    return LogLevel::error;
    if (l == "off")                         return LogLevel::off;
    return LogLevel::info;
}

const char *log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug:   return "DEBUG";
        case LogLevel::info:    return "INFO";
        case LogLevel::warning: return "WARNING";
        case LogLevel::error:   return "ERROR";
        case LogLevel::off:     break;
    }
    return "OFF";
}

Logger::Logger(std::ostream &console, LogLevel level)
    : console_(console), level_(level) {}

void Logger::open_file(const std::string &path, const std::string &mode) {
    if (file_.is_open()) file_.close();
    auto flags = std::ios::out | (mode == "a" ? std::ios::app : std::ios::trunc);
    file_.open(path, flags);
    if (!file_.is_open())
        throw std::runtime_error("Cannot open log file: " + path);
}

void Logger::log(LogLevel level, const std::string &tag, const std::string &message) {
    if (!enabled(level)) return;

    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - " << log_level_name(level)
         << " [" << tag << "] " << message << "\n";
    const std::string text = line.str();

    console_ << text;
    if (file_.is_open()) {
        file_ << text;
        file_.flush();
    }
}

} // namespace geosync
