#pragma once
#include "MockScript.hpp"
#include "TransferExecutor.hpp"

#include <unordered_map>
#include <vector>

namespace vrpkg {

// In-memory executor. fetch() writes deterministic bytes to destPath so the
// integrity checks of the queue can run against a real file.
class MockTransferExecutor : public TransferExecutor {
public:
    bool fetch(const std::string &locator, const std::string &destPath,
               std::string &err, ProgressCB progress = {},
               CancelCB shouldCancel = {}) override;

    bool push(const std::string &srcPath, const std::string &device,
              std::string &err, ProgressCB progress = {},
              CancelCB shouldCancel = {}) override;

    bool upload(const std::string &srcPath, const std::string &locator,
                std::string &err, ProgressCB progress = {},
                CancelCB shouldCancel = {}) override;

    // Scripts are keyed by locator (fetch/upload) or device (push).
    void setScript(const std::string &key, const MockTransferScript &s);
    void setDefaultScript(const MockTransferScript &s);
    void release(const std::string &key) { gate_.release(key); }

    int callCount(const std::string &key) const;
    int activeCalls() const;
    int maxActiveCalls() const;
    std::vector<std::string> pushedPaths() const;
    std::vector<std::string> uploadedPaths() const;

private:
    bool run(const std::string &key, const std::string &destPath,
             std::string &err, const ProgressCB &progress,
             const CancelCB &shouldCancel);
    MockTransferScript scriptFor(const std::string &key);

    mutable std::mutex mtx_;
    MockTransferScript default_;
    std::unordered_map<std::string, MockTransferScript> scripts_;
    std::unordered_map<std::string, int> calls_;
    std::vector<std::string> pushed_;
    std::vector<std::string> uploaded_;
    int active_ = 0;
    int maxActive_ = 0;
    MockGate gate_;
};

} // namespace vrpkg
