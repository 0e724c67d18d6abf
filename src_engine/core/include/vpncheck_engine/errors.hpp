#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace vpncheck::engine {

/**
 * \brief Setup-time failure caused by the caller (bad proxy string, bad settings, unreadable list).
 *
 * Never auto-corrected; aborts before a batch starts.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * \brief Proxy kind outside HTTP / HTTPS / SOCKS4 / SOCKS5.
 */
class UnsupportedProxyKind : public ConfigError {
public:
    explicit UnsupportedProxyKind(const std::string& kind)
        : ConfigError("Unsupported proxy type: " + kind), kind_(kind) {}

    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }

private:
    std::string kind_;
};

/**
 * \brief External command could not be spawned or exited with a non-zero status.
 */
class ExecutionError : public std::runtime_error {
public:
    ExecutionError(const std::string& what, int exit_code, std::string stderr_text)
        : std::runtime_error(what), exit_code_(exit_code), stderr_text_(std::move(stderr_text)) {}

    /// -1 when the process never ran or was killed by a signal.
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }

private:
    int exit_code_;
    std::string stderr_text_;
};

/**
 * \brief Expiry marker missing from the status output, or the date it carries is malformed.
 */
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace vpncheck::engine
