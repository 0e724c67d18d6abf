#include "vpncheck_engine/result_sink.hpp"
#include "vpncheck_engine/logger.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

void ensure_file(const std::filesystem::path& destination, vpncheck::engine::Logger* logger) {
    if (std::filesystem::exists(destination)) {
        return;
    }
    const auto parent = destination.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(destination, std::ios::app);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to create result file: " + destination.string());
    }
    vpncheck::engine::log_info(logger, "Created empty file: " + destination.string());
}

}  // namespace

namespace vpncheck::engine {

ResultSink::ResultSink(Config config) : config_{std::move(config)} {
    ensure_file(config_.valid_accounts, config_.logger);
    ensure_file(config_.device_limit_accounts, config_.logger);
}

void ResultSink::record_valid(const std::string& account, const std::string& expiry_text) {
    append_line(config_.valid_accounts, account + " (Expires at: " + expiry_text + ")");
}

void ResultSink::record_device_limit(const std::string& account) {
    append_line(config_.device_limit_accounts, account);
}

void ResultSink::append_line(const std::filesystem::path& destination, const std::string& line) {
    std::ofstream output(destination, std::ios::app);
    if (!output.is_open()) {
        throw std::runtime_error("Unable to open result file: " + destination.string());
    }
    output << line << '\n';
    if (!output) {
        throw std::runtime_error("Short write: " + destination.string());
    }
}

}  // namespace vpncheck::engine
