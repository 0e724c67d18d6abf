#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace vpncheck::engine {

/// Why a login attempt was not accepted.
enum class RejectReason {
    EmptyInput,       ///< blank account string, nothing executed
    TooManyDevices,   ///< provider refuses further devices for the account
    NotFound,         ///< account does not exist
    ExecutionFailed,  ///< the client could not be run or exited non-zero
    UnknownResponse,  ///< output matched no known marker
};

[[nodiscard]] std::string_view to_string(RejectReason reason) noexcept;

/// Human-readable text for a rejection, as shown to the operator.
[[nodiscard]] std::string_view describe(RejectReason reason) noexcept;

struct LoginResult {
    bool accepted{false};
    std::optional<RejectReason> reason{};
    std::string detail{};  ///< stderr text or other diagnostics, may be empty
};

/**
 * \brief Outcome of a status lookup for the currently logged-in account.
 *
 * Created once per validated account and never mutated afterwards.
 */
struct AccountStatus {
    std::string account_number;
    bool is_valid{false};
    std::optional<std::chrono::system_clock::time_point> expiry_date{};
    std::optional<std::string> expiry_text{};  ///< the YYYY-MM-DD found in the output
    std::optional<std::string> error_message{};
    bool device_limit_reached{false};
};

enum class OutcomeCategory { Valid, Invalid, Error };

[[nodiscard]] std::string_view to_string(OutcomeCategory category) noexcept;

/**
 * \brief Per-account record emitted by the batch worker, in input order.
 */
struct ClassificationOutcome {
    std::string account;
    OutcomeCategory category{OutcomeCategory::Error};
    std::string message;
};

/// TooManyDevices and NotFound are terminal negatives (Invalid); everything else is an Error.
[[nodiscard]] OutcomeCategory category_for(RejectReason reason) noexcept;

}  // namespace vpncheck::engine
