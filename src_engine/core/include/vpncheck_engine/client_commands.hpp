#pragma once

#include <string>

namespace vpncheck::engine {

/// Wraps `text` in single quotes so the shell passes it through as one literal word.
[[nodiscard]] std::string shell_quote(const std::string& text);

/**
 * \brief Command lines understood by the external client.
 *
 * The login command is a template; `{account}` is replaced by the shell-quoted
 * account identifier.
 */
struct ClientCommands {
    std::string login_template{"mullvad account login {account}"};
    std::string status{"mullvad account get"};
    std::string logout{"mullvad account logout"};

    /// Commands for a client installed under `executable` (e.g. "mullvad", "/opt/mullvad/bin/mullvad").
    [[nodiscard]] static ClientCommands for_executable(const std::string& executable);

    [[nodiscard]] std::string login(const std::string& account) const;
};

}  // namespace vpncheck::engine
