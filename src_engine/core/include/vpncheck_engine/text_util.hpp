#pragma once

#include <string>
#include <string_view>

namespace vpncheck::engine {

/// Copy of `input` without leading/trailing whitespace (space, \t, \n, \r, \f, \v).
[[nodiscard]] std::string trim_copy(std::string_view input);

/// ASCII lower-case copy of `input`.
[[nodiscard]] std::string to_lower_copy(std::string_view input);

/// True for an empty string or one made only of whitespace.
[[nodiscard]] bool is_blank(std::string_view input) noexcept;

}  // namespace vpncheck::engine
