#include "vpncheck_engine/logger.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/text_util.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>

namespace {

std::string timestamp_now() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

}  // namespace

namespace vpncheck::engine {

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(std::string_view name) {
    const auto lowered = to_lower_copy(name);
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warning" || lowered == "warn") return LogLevel::Warning;
    if (lowered == "error") return LogLevel::Error;
    throw ConfigError("Unknown log level '" + std::string{name} + "'");
}

Logger::Logger(Config config) : config_{std::move(config)} {
    if (config_.file.empty()) {
        return;
    }
    const auto parent = config_.file.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    file_.open(config_.file, std::ios::app);
    if (!file_.is_open()) {
        throw ConfigError("Unable to open log file: " + config_.file.string());
    }
}

void Logger::log(LogLevel level, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(config_.min_level)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.console) {
        *config_.console << to_string(level) << ": " << message << '\n';
    }
    if (file_.is_open()) {
        file_ << timestamp_now() << " - " << to_string(level) << " - " << message << '\n';
        file_.flush();
    }
}

}  // namespace vpncheck::engine
