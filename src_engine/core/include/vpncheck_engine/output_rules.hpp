#pragma once

#include "account_status.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vpncheck::engine {

/**
 * \brief One substring rule over the client's login output.
 *
 * `marker` may contain `{account}`, replaced by the literal account identifier
 * before matching. A rule without `reject` marks the login as accepted.
 */
struct LoginRule {
    std::string marker;
    std::optional<RejectReason> reject{};
};

/**
 * \brief Prioritised `(marker, verdict)` table, evaluated top to bottom.
 *
 * The marker texts are the client's wording and must match it verbatim; keep
 * edits to the table, not to the matching code.
 */
class LoginRules {
public:
    explicit LoginRules(std::vector<LoginRule> rules);

    /// Success, too-many-devices, does-not-exist, in that order.
    [[nodiscard]] static LoginRules defaults();

    /**
     * First rule whose marker occurs in `output`, or std::nullopt.
     * With `rejections_only` set, accepting rules are skipped (used on the
     * stderr of a failed command).
     */
    [[nodiscard]] std::optional<LoginRule> match(std::string_view output,
                                                 const std::string& account,
                                                 bool rejections_only = false) const;

    [[nodiscard]] const std::vector<LoginRule>& rules() const noexcept { return rules_; }

private:
    std::vector<LoginRule> rules_;
};

/// Expiry extracted from status output.
struct ExpiryDate {
    std::string text;                               ///< YYYY-MM-DD as printed
    std::chrono::system_clock::time_point instant;  ///< 23:59:59.999999 UTC of that day
};

/**
 * Finds `Expires at: YYYY-MM-DD` in the status output.
 * Throws ParseError when the marker is absent or the date is not a calendar date.
 */
[[nodiscard]] ExpiryDate extract_expiry(std::string_view status_output);

/// Last representable microsecond of the given UTC calendar day; throws ParseError on a bad date.
[[nodiscard]] std::chrono::system_clock::time_point end_of_day_utc(int year, unsigned month, unsigned day);

}  // namespace vpncheck::engine
