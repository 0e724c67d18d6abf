#include "vpncheck_engine/proxy_config.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/text_util.hpp"

#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> split(std::string_view input, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = input.find(delimiter, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(input.substr(start));
            break;
        }
        parts.emplace_back(input.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<std::string> optional_part(const std::vector<std::string>& parts, std::size_t index) {
    if (index >= parts.size() || parts[index].empty()) {
        return std::nullopt;
    }
    return parts[index];
}

}  // namespace

namespace vpncheck::engine {

std::string_view scheme_of(ProxyKind kind) noexcept {
    switch (kind) {
        case ProxyKind::Http: return "http";
        case ProxyKind::Https: return "https";
        case ProxyKind::Socks4: return "socks4";
        case ProxyKind::Socks5: return "socks5";
    }
    return "http";
}

ProxyKind parse_proxy_kind(std::string_view name) {
    const auto lowered = to_lower_copy(name);
    if (lowered == "http") return ProxyKind::Http;
    if (lowered == "https") return ProxyKind::Https;
    if (lowered == "socks4") return ProxyKind::Socks4;
    if (lowered == "socks5") return ProxyKind::Socks5;
    throw UnsupportedProxyKind(std::string{name});
}

ProxyConfig::ProxyConfig(std::string domain,
                         std::string port,
                         std::optional<std::string> username,
                         std::optional<std::string> password,
                         std::optional<ProxyKind> kind)
    : domain_{std::move(domain)},
      port_{std::move(port)},
      username_{std::move(username)},
      password_{std::move(password)},
      kind_{kind} {}

std::optional<ProxyConfig> ProxyConfig::parse(std::string_view raw, std::string_view kind) {
    if (raw.empty() || kind.empty()) {
        return std::nullopt;
    }

    // Kind is validated first so an unsupported kind is reported even for a malformed string.
    const ProxyKind parsed_kind = parse_proxy_kind(kind);

    const auto parts = split(raw, ':');
    if (parts.size() < 2) {
        throw ConfigError("Invalid proxy format: proxy must at least contain Domain:Port");
    }
    if (parts[0].empty() || parts[1].empty()) {
        throw ConfigError("Invalid proxy format: empty domain or port in '" + std::string{raw} + "'");
    }

    return ProxyConfig(parts[0], parts[1], optional_part(parts, 2), optional_part(parts, 3), parsed_kind);
}

bool ProxyConfig::has_credentials() const noexcept {
    return username_ && !username_->empty() && password_ && !password_->empty();
}

std::string ProxyConfig::to_url() const {
    if (!kind_) {
        throw ConfigError("Proxy type must be set");
    }

    std::string url{scheme_of(*kind_)};
    url += "://";
    if (has_credentials()) {
        url += *username_ + ":" + *password_ + "@";
    }
    url += domain_ + ":" + port_;
    return url;
}

EnvOverrides ProxyConfig::environment_overrides() const {
    const auto url = to_url();
    EnvOverrides env;
    switch (*kind_) {
        case ProxyKind::Http:
        case ProxyKind::Https:
            env["HTTP_PROXY"] = url;
            env["HTTPS_PROXY"] = url;
            break;
        case ProxyKind::Socks4:
        case ProxyKind::Socks5:
            // The client's libraries disagree on which spelling they read.
            env["ALL_PROXY"] = url;
            env["all_proxy"] = url;
            break;
    }
    return env;
}

std::string ProxyConfig::describe() const {
    std::string text = kind_ ? std::string{scheme_of(*kind_)} : std::string{"untyped"};
    text += " proxy at " + domain_ + ":" + port_;
    if (has_credentials()) {
        text += " (authenticated)";
    }
    return text;
}

}  // namespace vpncheck::engine
