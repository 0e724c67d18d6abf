#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace vpncheck::engine {

/// Pause before each account check and cooldown after it.
struct Pacing {
    std::chrono::milliseconds pre_check_delay{2000};
    std::chrono::milliseconds post_check_cooldown{1000};
};

/**
 * \brief Paces successive account checks; any pending wait ends early on cancel().
 *
 * Cancellation is sticky: once cancelled, every later wait returns immediately.
 */
class RateLimiter {
public:
    explicit RateLimiter(Pacing pacing = {});

    /// Sleeps for `delay` unless cancelled first. Returns false when cancelled.
    bool wait(std::chrono::milliseconds delay);

    bool before_check() { return wait(pacing_.pre_check_delay); }
    bool after_check() { return wait(pacing_.post_check_cooldown); }

    void cancel();
    [[nodiscard]] bool cancelled() const;

    [[nodiscard]] const Pacing& pacing() const noexcept { return pacing_; }

private:
    Pacing pacing_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_{false};
};

}  // namespace vpncheck::engine
