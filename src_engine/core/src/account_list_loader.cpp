#include "vpncheck_engine/account_list_loader.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/text_util.hpp"

#include <fstream>
#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace vpncheck::engine {

std::vector<std::string> AccountListLoader::load(std::istream& input) const {
    std::vector<std::string> accounts;
    std::string raw_line;
    while (std::getline(input, raw_line)) {
        auto trimmed = trim_copy(raw_line);
        if (trimmed.empty()) {
            continue;
        }
        accounts.emplace_back(std::move(trimmed));
    }
    return accounts;
}

std::vector<std::string> AccountListLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw ConfigError("Account list does not exist: " + file.string());
    }
    if (!std::filesystem::is_regular_file(file)) {
        throw ConfigError("Account list is not a regular file: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw ConfigError("Unable to open account list: " + file.string());
    }
    return load(input);
}

void AccountListLoader::ensure_exists(const std::filesystem::path& file) const {
    if (std::filesystem::exists(file)) {
        return;
    }
    const auto parent = file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream output(file, std::ios::app);
    if (!output.is_open()) {
        throw ConfigError("Unable to create account list: " + file.string());
    }
}

}  // namespace vpncheck::engine
