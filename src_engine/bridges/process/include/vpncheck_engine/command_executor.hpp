#pragma once

#include "vpncheck_engine/command_runner.hpp"

#include <string>
#include <vector>

namespace vpncheck::engine {

/**
 * Subprocess bridge to the external VPN client.
 *
 * Every call spawns one `<shell> -c <command>` child with a fresh environment
 * (parent environment overlaid by the per-call overrides), captures stdout and
 * stderr through pipes and waits for the exit status. No state is kept between
 * calls.
 *
 * The child runs in its own process group with default SIGINT/SIGTERM handling
 * and an empty signal mask, so a Ctrl-C delivered to the caller's group never
 * cuts a client call short.
 *
 * No timeout is imposed: the client's own network timeouts bound each call.
 * Callers needing a hard deadline must wrap the call.
 */
class CommandExecutor final : public CommandRunner {
public:
    struct Config {
        // Shell used to interpret the command line.
        std::string shell{"/bin/sh"};
    };

    CommandExecutor() = default;
    explicit CommandExecutor(Config cfg);

    /// Returns stdout; throws ExecutionError on spawn failure or non-zero exit.
    [[nodiscard]] std::string run(const std::string& command, const EnvOverrides& env_overrides) override;

    /// `KEY=VALUE` entries of the current environment with the overrides applied (sorted by key).
    [[nodiscard]] static std::vector<std::string> build_environment(const EnvOverrides& env_overrides);

private:
    Config cfg_;
};

}  // namespace vpncheck::engine
