#pragma once

#include <filesystem>
#include <string>

namespace vpncheck::engine {

class Logger;

/**
 * \brief Append-only text files for accounts that passed validation and for
 * accounts refused for having too many devices.
 *
 * Both files are created (with parent directories) on construction if absent.
 * Lines are appended and never rewritten or deduplicated, so overlapping runs
 * duplicate lines. Writes come from the single worker thread; no locking.
 */
class ResultSink {
public:
    struct Config {
        std::filesystem::path valid_accounts{"nullvad_working.txt"};
        std::filesystem::path device_limit_accounts{"nullvad_max_devices.txt"};
        Logger* logger{nullptr};
    };

    /// Throws std::runtime_error when a file cannot be created.
    explicit ResultSink(Config config);

    /// Appends `<account> (Expires at: <expiry_text>)`.
    void record_valid(const std::string& account, const std::string& expiry_text);

    /// Appends the bare account identifier.
    void record_device_limit(const std::string& account);

    [[nodiscard]] const std::filesystem::path& valid_accounts_path() const noexcept { return config_.valid_accounts; }
    [[nodiscard]] const std::filesystem::path& device_limit_path() const noexcept {
        return config_.device_limit_accounts;
    }

private:
    void append_line(const std::filesystem::path& destination, const std::string& line);

    Config config_;
};

}  // namespace vpncheck::engine
