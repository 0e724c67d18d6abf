#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace vpncheck::engine {

/**
 * \brief Reads newline-delimited account identifiers.
 *
 * Each line is trimmed; blank lines are dropped. Order and duplicates are kept.
 */
class AccountListLoader {
public:
    AccountListLoader() = default;

    /// Throws ConfigError when the file is missing or unreadable.
    [[nodiscard]] std::vector<std::string> load(const std::filesystem::path& file) const;

    [[nodiscard]] std::vector<std::string> load(std::istream& input) const;

    /// Creates an empty list file (and its directory) if it does not exist yet.
    void ensure_exists(const std::filesystem::path& file) const;
};

}  // namespace vpncheck::engine
