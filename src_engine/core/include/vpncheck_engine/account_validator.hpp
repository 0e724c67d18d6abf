#pragma once

#include "account_status.hpp"
#include "client_commands.hpp"
#include "command_runner.hpp"
#include "output_rules.hpp"
#include "proxy_config.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace vpncheck::engine {

class Logger;
class ResultSink;

/**
 * \brief Two-step login / status-check protocol against the external client.
 *
 * `set_account` logs the client into an account and classifies the response
 * through the LoginRules table. `get_validity` reads the status of whichever
 * account is currently logged in, so it must follow a successful
 * `set_account`. Qualifying results are appended to the ResultSink.
 */
class AccountValidator {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Config {
        ClientCommands commands{};
        LoginRules rules{LoginRules::defaults()};
        std::optional<ProxyConfig> proxy{};  ///< environment injected into every client call
        Clock clock{};                       ///< empty = system_clock::now
        Logger* logger{nullptr};
    };

    /// Throws ConfigError when the proxy has no kind.
    AccountValidator(CommandRunner& runner, ResultSink& sink, Config config);

    /**
     * Rule order: accepted, too many devices (also recorded in the device-limit
     * file), not found; then execution failure, then unknown response.
     * Blank accounts are rejected with EmptyInput without running anything.
     */
    [[nodiscard]] LoginResult set_account(const std::string& account);

    /**
     * Expiry is the end of the printed UTC day; valid when it is not before now.
     * Never throws for lookup or parse problems: they come back as
     * `is_valid=false` with `error_message` set.
     */
    [[nodiscard]] AccountStatus get_validity(const std::string& account);

    /// Best-effort; true when the client printed anything. Failures are only logged.
    bool logout();

private:
    [[nodiscard]] LoginResult reject(const std::string& account, RejectReason reason, std::string detail);
    [[nodiscard]] std::chrono::system_clock::time_point now() const;

    CommandRunner& runner_;
    ResultSink& sink_;
    Config config_;
    EnvOverrides env_;
};

}  // namespace vpncheck::engine
