#pragma once

#include "account_status.hpp"
#include "account_validator.hpp"
#include "client_commands.hpp"
#include "command_runner.hpp"
#include "output_rules.hpp"
#include "proxy_config.hpp"
#include "rate_limiter.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vpncheck::engine {

class Logger;
class ResultSink;

enum class BatchState { Idle, Running, Completed, Cancelled };

[[nodiscard]] std::string_view to_string(BatchState state) noexcept;

struct BatchRequest {
    std::vector<std::string> accounts;
    Pacing pacing{};
    std::optional<ProxyConfig> proxy{};
};

/**
 * \brief Callbacks invoked from the worker thread.
 *
 * `on_outcome` fires exactly once per processed account, in input order.
 * `on_finished` fires once with Completed or Cancelled. `on_empty_input` fires
 * instead of both when the request carries no accounts.
 */
struct BatchListener {
    std::function<void(const ClassificationOutcome&)> on_outcome{};
    std::function<void(BatchState)> on_finished{};
    std::function<void()> on_empty_input{};
};

/**
 * \brief Sequential, cancellable driver of AccountValidator over an account list.
 *
 * State machine: Idle -> Running -> {Completed | Cancelled}. Both end states are
 * terminal; run another batch with a new instance. Accounts are processed one
 * at a time on a single background thread because the client keeps a single
 * login session.
 *
 * Cancellation is cooperative: stop() ends a pending pacing wait immediately,
 * but an in-flight client call always completes. The worker checks the flag
 * between accounts and, when it stops early, logs the client out once.
 */
class BatchWorker {
public:
    struct Config {
        ClientCommands commands{};
        LoginRules rules{LoginRules::defaults()};
        AccountValidator::Clock clock{};
        Logger* logger{nullptr};
    };

    BatchWorker(CommandRunner& runner, ResultSink& sink, Config config);
    ~BatchWorker();

    BatchWorker(const BatchWorker&) = delete;
    BatchWorker& operator=(const BatchWorker&) = delete;

    /**
     * Starts the batch on a background thread.
     *
     * Returns false and calls `on_empty_input` when there are no accounts (the
     * worker stays Idle). Throws ConfigError for an unusable proxy and
     * std::logic_error when this instance already ran.
     */
    bool start(BatchRequest request, BatchListener listener);

    /// Same as start() but processes the batch on the calling thread; returns the end state.
    BatchState run(BatchRequest request, BatchListener listener);

    /// Requests cancellation; safe from any thread, including listener callbacks.
    void stop();

    /// Blocks until the background run ends; returns the end state (Idle if never started).
    BatchState wait();

    /// True once the batch reached Completed or Cancelled within `timeout`.
    bool wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] BatchState state() const noexcept { return state_.load(); }
    [[nodiscard]] std::size_t processed() const noexcept { return processed_.load(); }

private:
    bool prepare(BatchRequest& request, BatchListener& listener);
    void execute();
    [[nodiscard]] ClassificationOutcome process(const std::string& account);
    void finish(BatchState end_state);

    CommandRunner& runner_;
    ResultSink& sink_;
    Config config_;

    BatchRequest request_{};
    BatchListener listener_{};
    std::unique_ptr<AccountValidator> validator_;
    std::unique_ptr<RateLimiter> limiter_;

    std::atomic<BatchState> state_{BatchState::Idle};
    std::atomic<bool> stop_requested_{false};
    std::atomic<std::size_t> processed_{0};

    std::mutex mutex_;
    std::condition_variable finished_cv_;
    std::thread thread_;
};

}  // namespace vpncheck::engine
