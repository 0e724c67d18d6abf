#include "vpncheck_engine/rate_limiter.hpp"

namespace vpncheck::engine {

RateLimiter::RateLimiter(Pacing pacing) : pacing_{pacing} {}

bool RateLimiter::wait(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (delay.count() <= 0) {
        return !cancelled_;
    }
    cv_.wait_for(lock, delay, [this] { return cancelled_; });
    return !cancelled_;
}

void RateLimiter::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool RateLimiter::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

}  // namespace vpncheck::engine
