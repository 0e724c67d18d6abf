#include "vpncheck_engine/output_rules.hpp"
#include "vpncheck_engine/errors.hpp"

#include <regex>
#include <string>
#include <utility>

namespace {

constexpr std::string_view kAccountPlaceholder = "{account}";

std::string expand_marker(const std::string& marker, const std::string& account) {
    std::string expanded = marker;
    std::size_t pos = 0;
    while ((pos = expanded.find(kAccountPlaceholder, pos)) != std::string::npos) {
        expanded.replace(pos, kAccountPlaceholder.size(), account);
        pos += account.size();
    }
    return expanded;
}

}  // namespace

namespace vpncheck::engine {

LoginRules::LoginRules(std::vector<LoginRule> rules) : rules_{std::move(rules)} {}

LoginRules LoginRules::defaults() {
    return LoginRules({
        LoginRule{"Mullvad account \"{account}\" set", std::nullopt},
        LoginRule{"There are too many devices on the account.", RejectReason::TooManyDevices},
        LoginRule{"The account does not exist", RejectReason::NotFound},
    });
}

std::optional<LoginRule> LoginRules::match(std::string_view output,
                                           const std::string& account,
                                           bool rejections_only) const {
    for (const auto& rule : rules_) {
        if (rejections_only && !rule.reject) {
            continue;
        }
        const auto marker = expand_marker(rule.marker, account);
        if (!marker.empty() && output.find(marker) != std::string_view::npos) {
            return rule;
        }
    }
    return std::nullopt;
}

std::chrono::system_clock::time_point end_of_day_utc(int year, unsigned month, unsigned day) {
    using namespace std::chrono;
    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        throw ParseError("Error parsing expiry date: " + std::to_string(year) + "-" + std::to_string(month) + "-" +
                         std::to_string(day) + " is not a calendar date");
    }
    const auto day_start = time_point_cast<system_clock::duration>(sys_days{ymd});
    return day_start + hours{23} + minutes{59} + seconds{59} + microseconds{999999};
}

ExpiryDate extract_expiry(std::string_view status_output) {
    static const std::regex kExpiresAt(R"(Expires at:\s+(\d{4})-(\d{2})-(\d{2}))");

    const std::string text{status_output};
    std::smatch match;
    if (!std::regex_search(text, match, kExpiresAt)) {
        throw ParseError("Could not find expiry date");
    }

    const int year = std::stoi(match[1].str());
    const auto month = static_cast<unsigned>(std::stoi(match[2].str()));
    const auto day = static_cast<unsigned>(std::stoi(match[3].str()));

    ExpiryDate expiry;
    expiry.text = match[1].str() + "-" + match[2].str() + "-" + match[3].str();
    expiry.instant = end_of_day_utc(year, month, day);
    return expiry;
}

}  // namespace vpncheck::engine
