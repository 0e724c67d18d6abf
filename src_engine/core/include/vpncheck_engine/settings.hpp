#pragma once

#include "logger.hpp"
#include "proxy_config.hpp"
#include "rate_limiter.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace vpncheck::engine {

/**
 * \brief Run configuration of the checker.
 *
 * Relative file names are resolved against `data_dir`.
 */
struct CheckerSettings {
    std::string client_executable{"mullvad"};
    std::filesystem::path data_dir{"."};
    std::filesystem::path input_file{"nullvad_in.txt"};
    std::filesystem::path valid_file{"nullvad_working.txt"};
    std::filesystem::path device_limit_file{"nullvad_max_devices.txt"};
    Pacing pacing{};
    std::string proxy{};
    std::string proxy_type{"SOCKS5"};
    bool use_proxy{false};
    std::filesystem::path log_file{"nullvad_checker.log"};  ///< empty disables file logging
    LogLevel log_level{LogLevel::Info};

    [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& file) const;

    [[nodiscard]] std::filesystem::path input_path() const { return resolve(input_file); }
    [[nodiscard]] std::filesystem::path valid_path() const { return resolve(valid_file); }
    [[nodiscard]] std::filesystem::path device_limit_path() const { return resolve(device_limit_file); }
    [[nodiscard]] std::filesystem::path log_path() const;

    /// Proxy to inject, or std::nullopt when disabled. Throws ConfigError on a bad proxy.
    [[nodiscard]] std::optional<ProxyConfig> proxy_config() const;
};

/**
 * \brief Loads CheckerSettings from a line-oriented `key=value` file.
 *
 * Lines starting with `#` and blank lines are ignored; whitespace around keys
 * and values is trimmed. Recognised keys:
 *   - `client`: client executable name or path.
 *   - `data_dir`, `input_file`, `valid_file`, `device_limit_file`, `log_file`.
 *   - `pre_check_delay_ms`, `post_check_cooldown_ms`: non-negative integers.
 *   - `proxy`: `domain:port[:username[:password]]`.
 *   - `proxy_type`: http, https, socks4 or socks5 (case-insensitive).
 *   - `use_proxy`: boolean (`true/false`, `yes/no`, `on/off`, `1/0`).
 *   - `log_level`: debug, info, warning or error.
 *
 * Example:
 * \code{.txt}
 * client=/usr/bin/mullvad
 * data_dir=/var/lib/vpncheck
 * pre_check_delay_ms=3000
 * proxy=proxy.example.com:1080:user:pass
 * proxy_type=socks5
 * use_proxy=yes
 * \endcode
 *
 * Unknown keys and malformed values throw ConfigError naming file and line.
 */
class SettingsLoader {
public:
    SettingsLoader() = default;

    [[nodiscard]] CheckerSettings load(const std::filesystem::path& file) const;

    /// Applies one key on top of `settings`; `origin` is used in error messages.
    static void apply(CheckerSettings& settings,
                      const std::string& key,
                      const std::string& value,
                      const std::string& origin);
};

}  // namespace vpncheck::engine
