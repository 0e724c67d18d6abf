#include "vpncheck_engine/batch_worker.hpp"
#include "vpncheck_engine/logger.hpp"
#include "vpncheck_engine/result_sink.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace vpncheck::engine {

std::string_view to_string(BatchState state) noexcept {
    switch (state) {
        case BatchState::Idle: return "Idle";
        case BatchState::Running: return "Running";
        case BatchState::Completed: return "Completed";
        case BatchState::Cancelled: return "Cancelled";
    }
    return "Idle";
}

BatchWorker::BatchWorker(CommandRunner& runner, ResultSink& sink, Config config)
    : runner_{runner}, sink_{sink}, config_{std::move(config)} {}

BatchWorker::~BatchWorker() {
    stop();
    wait();
}

bool BatchWorker::prepare(BatchRequest& request, BatchListener& listener) {
    if (state_.load() != BatchState::Idle) {
        throw std::logic_error("BatchWorker already ran; create a new instance for another batch");
    }

    if (request.accounts.empty()) {
        log_warning(config_.logger, "No accounts to check");
        if (listener.on_empty_input) {
            listener.on_empty_input();
        }
        return false;
    }

    AccountValidator::Config validator_cfg;
    validator_cfg.commands = config_.commands;
    validator_cfg.rules = config_.rules;
    validator_cfg.proxy = request.proxy;
    validator_cfg.clock = config_.clock;
    validator_cfg.logger = config_.logger;
    auto validator = std::make_unique<AccountValidator>(runner_, sink_, std::move(validator_cfg));

    std::lock_guard<std::mutex> lock(mutex_);
    validator_ = std::move(validator);
    limiter_ = std::make_unique<RateLimiter>(request.pacing);
    request_ = std::move(request);
    listener_ = std::move(listener);
    state_.store(BatchState::Running);
    log_info(config_.logger, "Started checking " + std::to_string(request_.accounts.size()) + " accounts");
    return true;
}

bool BatchWorker::start(BatchRequest request, BatchListener listener) {
    if (!prepare(request, listener)) {
        return false;
    }
    thread_ = std::thread([this] { execute(); });
    return true;
}

BatchState BatchWorker::run(BatchRequest request, BatchListener listener) {
    if (!prepare(request, listener)) {
        return state_.load();
    }
    execute();
    return state_.load();
}

void BatchWorker::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load() != BatchState::Running) {
        return;
    }
    stop_requested_.store(true);
    if (limiter_) {
        limiter_->cancel();
    }
}

BatchState BatchWorker::wait() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    return state_.load();
}

bool BatchWorker::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return finished_cv_.wait_for(lock, timeout, [this] {
        const auto s = state_.load();
        return s == BatchState::Completed || s == BatchState::Cancelled;
    });
}

void BatchWorker::execute() {
    const auto& accounts = request_.accounts;
    std::size_t index = 0;
    for (; index < accounts.size(); ++index) {
        if (stop_requested_.load() || !limiter_->before_check()) {
            break;
        }

        const auto outcome = process(accounts[index]);
        processed_.fetch_add(1);
        if (listener_.on_outcome) {
            try {
                listener_.on_outcome(outcome);
            } catch (const std::exception& ex) {
                log_error(config_.logger, std::string("Outcome listener failed: ") + ex.what());
            }
        }

        limiter_->after_check();
    }

    if (index < accounts.size()) {
        log_info(config_.logger, "Stopped checking accounts after " + std::to_string(index) + " of " +
                                     std::to_string(accounts.size()));
        // Leave the client unauthenticated.
        validator_->logout();
        finish(BatchState::Cancelled);
    } else {
        log_info(config_.logger, "Finished checking " + std::to_string(accounts.size()) + " accounts");
        finish(BatchState::Completed);
    }
}

ClassificationOutcome BatchWorker::process(const std::string& account) {
    ClassificationOutcome outcome;
    outcome.account = account;
    try {
        const auto login = validator_->set_account(account);
        if (!login.accepted) {
            const auto reason = login.reason.value_or(RejectReason::UnknownResponse);
            log_info(config_.logger, "Account check failed: " + account + ", error: " + std::string(describe(reason)));
            outcome.category = category_for(reason);
            outcome.message = std::string(describe(reason));
            return outcome;
        }

        const auto status = validator_->get_validity(account);
        if (status.is_valid) {
            outcome.category = OutcomeCategory::Valid;
            outcome.message = "Valid until " + status.expiry_text.value_or("?");
        } else if (status.error_message) {
            outcome.category = OutcomeCategory::Error;
            outcome.message = *status.error_message;
        } else {
            outcome.category = OutcomeCategory::Invalid;
            outcome.message = "Account expired";
        }
        // Logout precedes the outcome: listeners always observe a logged-out client.
        validator_->logout();
    } catch (const std::exception& ex) {
        log_error(config_.logger, "Error while checking " + account + ": " + ex.what());
        outcome.category = OutcomeCategory::Error;
        outcome.message = ex.what();
    }
    return outcome;
}

void BatchWorker::finish(BatchState end_state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.store(end_state);
    }
    finished_cv_.notify_all();
    if (listener_.on_finished) {
        try {
            listener_.on_finished(end_state);
        } catch (const std::exception& ex) {
            log_error(config_.logger, std::string("Finish listener failed: ") + ex.what());
        }
    }
}

}  // namespace vpncheck::engine
