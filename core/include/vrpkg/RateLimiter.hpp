// Token bucket shared by every transfer moving bytes in one direction.
#pragma once
#include "TransferTypes.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace vrpkg {

class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(std::uint64_t bytesPerSec = 0);

    // 0 = unlimited. Accumulated tokens are kept (clamped to the new burst)
    // so running transfers speed up or slow down without a restart.
    void setLimit(std::uint64_t bytesPerSec);
    std::uint64_t limit() const { return rate_.load(); }

    // Blocks until n bytes may pass. Returns false when shouldCancel fired
    // while waiting; no tokens are consumed in that case.
    bool acquire(std::uint64_t n, const CancelCB &shouldCancel = {});

private:
    void refillLocked(Clock::time_point now);

    std::atomic<std::uint64_t> rate_{0};
    mutable std::mutex mtx_; // protects tokens_ and last_
    std::condition_variable cv_;
    double tokens_ = 0.0;
    Clock::time_point last_;
};

// One bucket per direction; this is the process-wide RateLimiterConfig.
class BandwidthLimits {
public:
    RateLimiter &download() { return download_; }
    RateLimiter &upload() { return upload_; }

private:
    RateLimiter download_;
    RateLimiter upload_;
};

} // namespace vrpkg
