#pragma once

#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <mutex>
#include <string>
#include <string_view>

namespace vpncheck::engine {

enum class LogLevel { Debug = 0, Info = 1, Warning = 2, Error = 3 };

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/// Throws ConfigError for names other than debug/info/warning/error (case-insensitive).
[[nodiscard]] LogLevel parse_log_level(std::string_view name);

/**
 * \brief Caller-owned, thread-safe line logger.
 *
 * Console lines read `LEVEL: message`. When a log file is configured every line
 * is also appended there as `YYYY-MM-DD HH:MM:SS - LEVEL - message`.
 * Engine components take a `Logger*`; passing nullptr silences them.
 */
class Logger {
public:
    struct Config {
        LogLevel min_level{LogLevel::Info};
        std::ostream* console{nullptr};       ///< nullptr disables console output
        std::filesystem::path file{};         ///< empty disables the file sink
    };

    explicit Logger(Config config);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, std::string_view message);

    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warning(std::string_view message) { log(LogLevel::Warning, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }

    [[nodiscard]] LogLevel min_level() const noexcept { return config_.min_level; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Null-tolerant helpers used throughout the engine.
inline void log_info(Logger* logger, std::string_view message) {
    if (logger) logger->info(message);
}
inline void log_warning(Logger* logger, std::string_view message) {
    if (logger) logger->warning(message);
}
inline void log_error(Logger* logger, std::string_view message) {
    if (logger) logger->error(message);
}
inline void log_debug(Logger* logger, std::string_view message) {
    if (logger) logger->debug(message);
}

}  // namespace vpncheck::engine
