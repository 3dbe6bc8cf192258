#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace codonbeam {

/**
 * @brief Diagnostic levels, most severe first
 */
enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug
};

[[nodiscard]] constexpr std::string_view logLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
    }
    return "log";
}

/**
 * @brief Leveled diagnostics over a borrowed stream
 *
 * Messages above the threshold are dropped. Lines are written as
 * "[level] message".
 */
class Logger {
public:
    explicit Logger(std::ostream& os, LogLevel threshold = LogLevel::Info) noexcept
        : os_(&os), threshold_(threshold) {}

    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level <= threshold_; }
    [[nodiscard]] LogLevel threshold() const noexcept { return threshold_; }
    void setThreshold(LogLevel level) noexcept { threshold_ = level; }

    void log(LogLevel level, std::string_view message) const {
        if (!enabled(level)) return;
        *os_ << '[' << logLevelName(level) << "] " << message << '\n';
    }

    void error(std::string_view message) const { log(LogLevel::Error, message); }
    void warn(std::string_view message) const { log(LogLevel::Warn, message); }
    void info(std::string_view message) const { log(LogLevel::Info, message); }
    void debug(std::string_view message) const { log(LogLevel::Debug, message); }

private:
    std::ostream* os_;
    LogLevel threshold_;
};

/**
 * @brief Human-readable elapsed time: "12.4 ms", "3.2 s", "4m 10s", "1h 2m 3s"
 */
inline std::string formatDuration(std::chrono::duration<double, std::milli> elapsed) {
    double ms = elapsed.count();
    if (ms < 0) ms = 0;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (ms < 1000.0) {
        oss << ms << " ms";
        return oss.str();
    }
    if (ms < 60000.0) {
        oss << ms / 1000.0 << " s";
        return oss.str();
    }

    const auto total_seconds = static_cast<int64_t>(ms / 1000.0);
    const int64_t seconds = total_seconds % 60;
    const int64_t total_minutes = total_seconds / 60;
    if (total_minutes < 60) {
        return std::to_string(total_minutes) + "m " + std::to_string(seconds) + "s";
    }

    const int64_t minutes = total_minutes % 60;
    const int64_t hours = total_minutes / 60;
    return std::to_string(hours) + "h " + std::to_string(minutes) + "m " +
           std::to_string(seconds) + "s";
}

} // namespace codonbeam
