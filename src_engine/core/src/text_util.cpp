#include "vpncheck_engine/text_util.hpp"

#include <cctype>

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

}  // namespace

namespace vpncheck::engine {

std::string trim_copy(std::string_view input) {
    const auto begin = input.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(kWhitespace);
    return std::string{input.substr(begin, end - begin + 1)};
}

std::string to_lower_copy(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (unsigned char ch : input) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

bool is_blank(std::string_view input) noexcept {
    return input.find_first_not_of(kWhitespace) == std::string_view::npos;
}

}  // namespace vpncheck::engine
