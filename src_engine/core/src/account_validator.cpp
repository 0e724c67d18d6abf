#include "vpncheck_engine/account_validator.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/logger.hpp"
#include "vpncheck_engine/result_sink.hpp"
#include "vpncheck_engine/text_util.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace vpncheck::engine {

AccountValidator::AccountValidator(CommandRunner& runner, ResultSink& sink, Config config)
    : runner_{runner}, sink_{sink}, config_{std::move(config)} {
    if (config_.proxy) {
        env_ = config_.proxy->environment_overrides();
        log_info(config_.logger, "Proxy configured: " + config_.proxy->describe());
    }
}

std::chrono::system_clock::time_point AccountValidator::now() const {
    return config_.clock ? config_.clock() : std::chrono::system_clock::now();
}

LoginResult AccountValidator::reject(const std::string& account, RejectReason reason, std::string detail) {
    switch (reason) {
        case RejectReason::TooManyDevices:
            log_warning(config_.logger, "Account " + account + " has too many devices");
            try {
                sink_.record_device_limit(account);
            } catch (const std::runtime_error& ex) {
                log_error(config_.logger, std::string("Failed to record device-limit account: ") + ex.what());
            }
            break;
        case RejectReason::NotFound:
            log_info(config_.logger, "Account " + account + " is invalid");
            break;
        case RejectReason::UnknownResponse:
            log_warning(config_.logger, "Unrecognised login response for " + account + ": " + trim_copy(detail));
            break;
        default:
            break;
    }
    return LoginResult{false, reason, std::move(detail)};
}

LoginResult AccountValidator::set_account(const std::string& account) {
    if (is_blank(account)) {
        return LoginResult{false, RejectReason::EmptyInput, {}};
    }

    std::string output;
    try {
        output = runner_.run(config_.commands.login(account), env_);
    } catch (const ExecutionError& ex) {
        log_error(config_.logger, std::string("Command execution failed: ") + ex.what());
        // The client reports refusals on stderr with a failing exit status.
        if (const auto rule = config_.rules.match(ex.stderr_text(), account, true)) {
            return reject(account, *rule->reject, ex.stderr_text());
        }
        return LoginResult{false, RejectReason::ExecutionFailed, ex.what()};
    }

    if (output.empty()) {
        return LoginResult{false, RejectReason::ExecutionFailed, "no output"};
    }

    const auto rule = config_.rules.match(output, account);
    if (!rule) {
        return reject(account, RejectReason::UnknownResponse, output);
    }
    if (rule->reject) {
        return reject(account, *rule->reject, output);
    }

    log_info(config_.logger, "Account " + account + " set successfully");
    return LoginResult{true, std::nullopt, {}};
}

AccountStatus AccountValidator::get_validity(const std::string& account) {
    AccountStatus status;
    status.account_number = account;

    std::string output;
    try {
        output = runner_.run(config_.commands.status, env_);
    } catch (const ExecutionError& ex) {
        log_error(config_.logger, std::string("Command execution failed: ") + ex.what());
        status.error_message = std::string("Failed to get account info: ") + ex.what();
        return status;
    }
    if (output.empty()) {
        status.error_message = "Failed to get account info";
        return status;
    }

    ExpiryDate expiry;
    try {
        expiry = extract_expiry(output);
    } catch (const ParseError& ex) {
        log_error(config_.logger, "Expiry lookup failed for " + account + ": " + ex.what());
        status.error_message = ex.what();
        return status;
    }

    status.expiry_date = expiry.instant;
    status.expiry_text = expiry.text;
    status.is_valid = expiry.instant >= now();

    if (!status.is_valid) {
        log_info(config_.logger, "Expired account: " + account + ", expired " + expiry.text);
        return status;
    }

    log_info(config_.logger, "Valid account found: " + account + ", expires " + expiry.text);
    try {
        sink_.record_valid(account, expiry.text);
    } catch (const std::runtime_error& ex) {
        log_error(config_.logger, std::string("Failed to record valid account: ") + ex.what());
    }
    return status;
}

bool AccountValidator::logout() {
    try {
        const auto output = runner_.run(config_.commands.logout, env_);
        if (!output.empty()) {
            log_info(config_.logger, "Logged out successfully");
            return true;
        }
    } catch (const ExecutionError& ex) {
        log_error(config_.logger, std::string("Command execution failed: ") + ex.what());
    }
    log_warning(config_.logger, "Logout failed");
    return false;
}

}  // namespace vpncheck::engine
