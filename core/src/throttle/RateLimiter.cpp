// Token bucket: refills continuously at the configured rate, burst capped to
// one second worth of bytes. Oversized requests go into debt so the long-run
// average still matches the limit.
#include "vrpkg/RateLimiter.hpp"

#include <algorithm>

namespace vrpkg {

namespace {
// Upper bound for a single wait so cancellation and setLimit() are observed
// well below one second.
constexpr std::chrono::milliseconds kMaxWaitSlice{50};
} // namespace

RateLimiter::RateLimiter(std::uint64_t bytesPerSec)
    : rate_(bytesPerSec), tokens_(double(bytesPerSec)), last_(Clock::now()) {}

void RateLimiter::refillLocked(Clock::time_point now) {
    const std::uint64_t rate = rate_.load();
    if (rate > 0 && now > last_) {
        const double elapsedSec =
            std::chrono::duration<double>(now - last_).count();
        tokens_ = std::min(double(rate), tokens_ + elapsedSec * double(rate));
    }
    last_ = now;
}

void RateLimiter::setLimit(std::uint64_t bytesPerSec) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const auto now = Clock::now();
        const bool wasUnlimited = (rate_.load() == 0);
        // Settle what the old rate produced before swapping.
        refillLocked(now);
        rate_.store(bytesPerSec);
        if (bytesPerSec > 0) {
            if (wasUnlimited)
                tokens_ = double(bytesPerSec);
            else
                tokens_ = std::min(tokens_, double(bytesPerSec));
        }
    }
    cv_.notify_all();
}

bool RateLimiter::acquire(std::uint64_t n, const CancelCB &shouldCancel) {
    if (n == 0 || rate_.load() == 0)
        return true;
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        if (shouldCancel && shouldCancel())
            return false;
        const std::uint64_t rate = rate_.load();
        if (rate == 0)
            return true;
        refillLocked(Clock::now());
        const double need = double(std::min<std::uint64_t>(n, rate));
        if (tokens_ >= need) {
            tokens_ -= double(n);
            return true;
        }
        const double waitSec = (need - tokens_) / double(rate);
        auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<double>(waitSec));
        if (wait < std::chrono::milliseconds(1))
            wait = std::chrono::milliseconds(1);
        cv_.wait_for(lk, std::min(wait, kMaxWaitSlice));
    }
}

} // namespace vrpkg
