#pragma once

#include "proxy_config.hpp"

#include <string>

namespace vpncheck::engine {

/**
 * \brief Seam between the validator and the external client.
 *
 * Implementations run `command` to completion with the current environment
 * overlaid by `env_overrides` and return the captured standard output.
 * A non-zero exit status throws ExecutionError carrying the standard-error text.
 */
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    [[nodiscard]] virtual std::string run(const std::string& command, const EnvOverrides& env_overrides) = 0;
};

}  // namespace vpncheck::engine
