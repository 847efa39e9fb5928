#include "vrpkg/MockScript.hpp"

#include <thread>

namespace vrpkg {

bool runMockSteps(const MockStepScript &s, bool failNow, MockGate &gate,
                  const std::string &key, std::string &err,
                  const ProgressCB &progress, const CancelCB &shouldCancel) {
    auto canceled = [&shouldCancel]() {
        return shouldCancel && shouldCancel();
    };
    if (s.stall) {
        while (!canceled())
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        err = "Cancelled";
        return false;
    }
    const int steps = s.steps > 0 ? s.steps : 1;
    for (int i = 1; i <= steps; ++i) {
        if (canceled()) {
            err = "Cancelled";
            return false;
        }
        if (progress)
            progress(std::uint64_t(i), std::uint64_t(steps));
        if (i == 1 && s.holdUntilReleased && !gate.wait(key, shouldCancel)) {
            err = "Cancelled";
            return false;
        }
        if (s.stepDelay.count() > 0)
            std::this_thread::sleep_for(s.stepDelay);
    }
    if (failNow) {
        err = s.failMessage;
        return false;
    }
    return true;
}

} // namespace vrpkg
