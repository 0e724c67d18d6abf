#pragma once

#include <atomic>
#include <functional>
#include <initializer_list>
#include <thread>
#include <vector>

#include <signal.h>

namespace vpncheck::engine {

/**
 * \brief Delivers termination signals to a callback on a dedicated thread.
 *
 * The constructor blocks `signals` in the calling thread, so construct it
 * before starting any other thread that must not see them (threads inherit the
 * mask). A watcher thread then picks them up with sigwait() and runs the
 * callback immediately, in ordinary thread context, where taking locks is fine.
 *
 * The destructor stops the thread without invoking the callback and restores
 * the previous signal mask of the constructing thread.
 */
class SignalWatcher {
public:
    using Callback = std::function<void(int)>;

    /// Throws std::system_error when the mask cannot be changed.
    SignalWatcher(std::initializer_list<int> signals, Callback on_signal);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Number of signals handed to the callback so far.
    [[nodiscard]] int received() const noexcept { return received_.load(); }

private:
    void watch();

    std::vector<int> signals_;
    Callback on_signal_;
    sigset_t set_{};
    sigset_t previous_{};
    std::atomic<bool> stopping_{false};
    std::atomic<int> received_{0};
    std::thread thread_;
};

}  // namespace vpncheck::engine
