#include "vpncheck_engine/client_commands.hpp"

#include <string>
#include <string_view>

namespace vpncheck::engine {

std::string shell_quote(const std::string& text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (char ch : text) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

ClientCommands ClientCommands::for_executable(const std::string& executable) {
    const auto exe = shell_quote(executable);
    ClientCommands commands;
    commands.login_template = exe + " account login {account}";
    commands.status = exe + " account get";
    commands.logout = exe + " account logout";
    return commands;
}

std::string ClientCommands::login(const std::string& account) const {
    static constexpr std::string_view kPlaceholder = "{account}";
    std::string command = login_template;
    const auto pos = command.find(kPlaceholder);
    if (pos == std::string::npos) {
        return command + " " + shell_quote(account);
    }
    command.replace(pos, kPlaceholder.size(), shell_quote(account));
    return command;
}

}  // namespace vpncheck::engine
