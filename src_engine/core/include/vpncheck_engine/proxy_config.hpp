#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace vpncheck::engine {

enum class ProxyKind { Http, Https, Socks4, Socks5 };

/// URL scheme for the kind: "http", "https", "socks4", "socks5".
[[nodiscard]] std::string_view scheme_of(ProxyKind kind) noexcept;

/// Case-insensitive; throws UnsupportedProxyKind for anything else.
[[nodiscard]] ProxyKind parse_proxy_kind(std::string_view name);

/// Environment variable name -> value.
using EnvOverrides = std::map<std::string, std::string>;

/**
 * \brief Immutable description of an upstream proxy for the external client.
 *
 * Built from `domain:port[:username[:password]]`. Credentials are rendered only
 * when both username and password are present (non-empty).
 */
class ProxyConfig {
public:
    ProxyConfig(std::string domain,
                std::string port,
                std::optional<std::string> username = std::nullopt,
                std::optional<std::string> password = std::nullopt,
                std::optional<ProxyKind> kind = std::nullopt);

    /**
     * Parses the colon-delimited proxy string.
     *
     * Returns std::nullopt ("no proxy") when either `raw` or `kind` is empty.
     * Throws UnsupportedProxyKind for an unknown kind and ConfigError when the
     * string lacks a domain or port.
     */
    [[nodiscard]] static std::optional<ProxyConfig> parse(std::string_view raw, std::string_view kind);

    /// `<kind>://[<username>:<password>@]<domain>:<port>`; throws ConfigError when kind is unset.
    [[nodiscard]] std::string to_url() const;

    /**
     * HTTP/HTTPS kinds set HTTP_PROXY and HTTPS_PROXY; SOCKS kinds set ALL_PROXY
     * and all_proxy. Both sets are never produced together.
     */
    [[nodiscard]] EnvOverrides environment_overrides() const;

    /// Log-safe rendering without credentials, e.g. "socks5 proxy at host:1080".
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] const std::string& domain() const noexcept { return domain_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::optional<std::string>& username() const noexcept { return username_; }
    [[nodiscard]] const std::optional<std::string>& password() const noexcept { return password_; }
    [[nodiscard]] std::optional<ProxyKind> kind() const noexcept { return kind_; }

    [[nodiscard]] bool has_credentials() const noexcept;

private:
    std::string domain_;
    std::string port_;
    std::optional<std::string> username_;
    std::optional<std::string> password_;
    std::optional<ProxyKind> kind_;
};

}  // namespace vpncheck::engine
