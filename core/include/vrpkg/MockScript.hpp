// Scripted behavior for the mock collaborators used by tests.
#pragma once
#include "TransferTypes.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>

namespace vrpkg {

// Byte-moving call (fetch, push, upload).
struct MockTransferScript {
    std::uint64_t totalBytes = 64 * 1024;
    std::size_t chunkBytes = 16 * 1024;
    std::chrono::milliseconds chunkDelay{0};
    bool holdUntilReleased = false; // pause after the first chunk
    bool stall = false;             // never report progress, wait for cancel
    std::uint64_t failAfterBytes = 0; // 0 = never
    int failTimes = -1;               // with failAfterBytes: -1 = always
    std::string failMessage = "Mock transfer failed";
};

// Step-based call (extract, install, pull).
struct MockStepScript {
    int steps = 4;
    std::chrono::milliseconds stepDelay{0};
    bool holdUntilReleased = false;
    bool stall = false;
    int failTimes = 0; // fail the next N calls
    std::string failMessage = "Mock step failed";
};

// Lets a test park a mock call and let it go later. Releases are sticky
// until reset().
class MockGate {
public:
    void release(const std::string &key) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            released_.insert(key);
        }
        cv_.notify_all();
    }

    void reset(const std::string &key) {
        std::lock_guard<std::mutex> lk(mtx_);
        released_.erase(key);
    }

    // False when shouldCancel fired first.
    bool wait(const std::string &key, const CancelCB &shouldCancel) {
        std::unique_lock<std::mutex> lk(mtx_);
        while (!released_.count(key)) {
            if (shouldCancel && shouldCancel())
                return false;
            cv_.wait_for(lk, std::chrono::milliseconds(10));
        }
        return true;
    }

private:
    std::mutex mtx_;
    std::condition_variable cv_;
    std::unordered_set<std::string> released_;
};

// Runs a step script: reports steps/steps progress, honors hold, stall and
// cancellation. failNow makes the call fail after the last step.
bool runMockSteps(const MockStepScript &s, bool failNow, MockGate &gate,
                  const std::string &key, std::string &err,
                  const ProgressCB &progress, const CancelCB &shouldCancel);

} // namespace vrpkg
