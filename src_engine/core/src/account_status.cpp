#include "vpncheck_engine/account_status.hpp"

namespace vpncheck::engine {

std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::EmptyInput: return "EmptyInput";
        case RejectReason::TooManyDevices: return "TooManyDevices";
        case RejectReason::NotFound: return "NotFound";
        case RejectReason::ExecutionFailed: return "ExecutionFailed";
        case RejectReason::UnknownResponse: return "UnknownResponse";
    }
    return "UnknownResponse";
}

std::string_view describe(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::EmptyInput: return "Empty account number";
        case RejectReason::TooManyDevices: return "Too many devices";
        case RejectReason::NotFound: return "Account does not exist";
        case RejectReason::ExecutionFailed: return "Command execution failed";
        case RejectReason::UnknownResponse: return "Unknown error";
    }
    return "Unknown error";
}

std::string_view to_string(OutcomeCategory category) noexcept {
    switch (category) {
        case OutcomeCategory::Valid: return "Valid";
        case OutcomeCategory::Invalid: return "Invalid";
        case OutcomeCategory::Error: return "Error";
    }
    return "Error";
}

OutcomeCategory category_for(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::TooManyDevices:
        case RejectReason::NotFound:
            return OutcomeCategory::Invalid;
        case RejectReason::EmptyInput:
        case RejectReason::ExecutionFailed:
        case RejectReason::UnknownResponse:
            return OutcomeCategory::Error;
    }
    return OutcomeCategory::Error;
}

}  // namespace vpncheck::engine
