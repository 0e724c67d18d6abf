#include "vpncheck_engine/signal_watcher.hpp"

#include <pthread.h>
#include <system_error>
#include <utility>

namespace vpncheck::engine {

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Callback on_signal)
    : signals_(signals), on_signal_{std::move(on_signal)} {
    sigemptyset(&set_);
    for (const int sig : signals_) {
        sigaddset(&set_, sig);
    }
    if (const int rc = ::pthread_sigmask(SIG_BLOCK, &set_, &previous_); rc != 0) {
        throw std::system_error(rc, std::generic_category(), "pthread_sigmask");
    }
    try {
        thread_ = std::thread([this] { watch(); });
    } catch (...) {
        ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
        throw;
    }
}

SignalWatcher::~SignalWatcher() {
    stopping_.store(true);
    if (thread_.joinable()) {
        if (!signals_.empty()) {
            ::pthread_kill(thread_.native_handle(), signals_.front());
        }
        thread_.join();
    }
    ::pthread_sigmask(SIG_SETMASK, &previous_, nullptr);
}

void SignalWatcher::watch() {
    if (signals_.empty()) {
        return;
    }
    while (true) {
        int sig = 0;
        if (::sigwait(&set_, &sig) != 0) {
            return;
        }
        if (stopping_.load()) {
            return;
        }
        received_.fetch_add(1);
        if (on_signal_) {
            on_signal_(sig);
        }
    }
}

}  // namespace vpncheck::engine
