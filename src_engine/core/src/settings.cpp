#include "vpncheck_engine/settings.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/text_util.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

bool parse_boolean(std::string_view raw, const std::string& origin) {
    const auto lowered = vpncheck::engine::to_lower_copy(raw);
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        return false;
    }
    throw vpncheck::engine::ConfigError("Invalid boolean value '" + std::string{raw} + "' at " + origin);
}

std::chrono::milliseconds parse_millis(const std::string& raw, const std::string& origin) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
        throw vpncheck::engine::ConfigError("Expected a non-negative integer, got '" + raw + "' at " + origin);
    }
    try {
        return std::chrono::milliseconds{std::stoll(raw)};
    } catch (const std::out_of_range&) {
        throw vpncheck::engine::ConfigError("Value out of range '" + raw + "' at " + origin);
    }
}

}  // namespace

namespace vpncheck::engine {

std::filesystem::path CheckerSettings::resolve(const std::filesystem::path& file) const {
    if (file.empty() || file.is_absolute()) {
        return file;
    }
    return data_dir / file;
}

std::filesystem::path CheckerSettings::log_path() const {
    return log_file.empty() ? std::filesystem::path{} : resolve(log_file);
}

std::optional<ProxyConfig> CheckerSettings::proxy_config() const {
    if (!use_proxy) {
        return std::nullopt;
    }
    return ProxyConfig::parse(proxy, proxy_type);
}

void SettingsLoader::apply(CheckerSettings& settings,
                           const std::string& key,
                           const std::string& value,
                           const std::string& origin) {
    if (key == "client") {
        if (value.empty()) {
            throw ConfigError("Empty client executable at " + origin);
        }
        settings.client_executable = value;
    } else if (key == "data_dir") {
        settings.data_dir = value;
    } else if (key == "input_file") {
        settings.input_file = value;
    } else if (key == "valid_file") {
        settings.valid_file = value;
    } else if (key == "device_limit_file") {
        settings.device_limit_file = value;
    } else if (key == "log_file") {
        settings.log_file = value;
    } else if (key == "pre_check_delay_ms") {
        settings.pacing.pre_check_delay = parse_millis(value, origin);
    } else if (key == "post_check_cooldown_ms") {
        settings.pacing.post_check_cooldown = parse_millis(value, origin);
    } else if (key == "proxy") {
        settings.proxy = value;
    } else if (key == "proxy_type") {
        settings.proxy_type = value;
    } else if (key == "use_proxy") {
        settings.use_proxy = parse_boolean(value, origin);
    } else if (key == "log_level") {
        try {
            settings.log_level = parse_log_level(value);
        } catch (const ConfigError& ex) {
            throw ConfigError(std::string(ex.what()) + " at " + origin);
        }
    } else {
        throw ConfigError("Unknown settings key '" + key + "' at " + origin);
    }
}

CheckerSettings SettingsLoader::load(const std::filesystem::path& file) const {
    if (!std::filesystem::exists(file)) {
        throw ConfigError("Settings file does not exist: " + file.string());
    }

    std::ifstream input(file);
    if (!input.is_open()) {
        throw ConfigError("Unable to open settings file: " + file.string());
    }

    CheckerSettings settings;
    std::string raw_line;
    std::size_t line_no = 0;
    while (std::getline(input, raw_line)) {
        ++line_no;
        const std::string origin = file.string() + ":" + std::to_string(line_no);

        const auto trimmed = trim_copy(raw_line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }

        const auto delimiter = trimmed.find('=');
        if (delimiter == std::string::npos) {
            throw ConfigError("Expected 'key=value' entry at " + origin);
        }

        const auto key = trim_copy(std::string_view{trimmed}.substr(0, delimiter));
        const auto value = trim_copy(std::string_view{trimmed}.substr(delimiter + 1));
        if (key.empty()) {
            throw ConfigError("Empty key at " + origin);
        }

        apply(settings, key, value, origin);
    }
    return settings;
}

}  // namespace vpncheck::engine
