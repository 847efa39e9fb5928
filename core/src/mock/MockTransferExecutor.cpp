#include "vrpkg/MockTransferExecutor.hpp"

#include <algorithm>
#include <cstdio>
#include <thread>

namespace vrpkg {

namespace {
struct ActiveCallGuard {
    std::mutex &mtx;
    int &active;
    ActiveCallGuard(std::mutex &m, int &a, int &maxActive)
        : mtx(m), active(a) {
        std::lock_guard<std::mutex> lk(mtx);
        ++active;
        maxActive = std::max(maxActive, active);
    }
    ~ActiveCallGuard() {
        std::lock_guard<std::mutex> lk(mtx);
        --active;
    }
};
} // namespace

void MockTransferExecutor::setScript(const std::string &key,
                                     const MockTransferScript &s) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        scripts_[key] = s;
    }
    gate_.reset(key);
}

void MockTransferExecutor::setDefaultScript(const MockTransferScript &s) {
    std::lock_guard<std::mutex> lk(mtx_);
    default_ = s;
}

MockTransferScript MockTransferExecutor::scriptFor(const std::string &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    calls_[key] += 1;
    auto it = scripts_.find(key);
    if (it == scripts_.end())
        return default_;
    MockTransferScript s = it->second;
    if (it->second.failAfterBytes > 0) {
        if (it->second.failTimes == 0)
            s.failAfterBytes = 0;
        else if (it->second.failTimes > 0)
            it->second.failTimes -= 1;
    }
    return s;
}

bool MockTransferExecutor::run(const std::string &key,
                               const std::string &destPath, std::string &err,
                               const ProgressCB &progress,
                               const CancelCB &shouldCancel) {
    const MockTransferScript s = scriptFor(key);
    ActiveCallGuard guard(mtx_, active_, maxActive_);
    auto canceled = [&shouldCancel]() {
        return shouldCancel && shouldCancel();
    };

    if (s.stall) {
        while (!canceled())
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        err = "Cancelled";
        return false;
    }

    FILE *out = nullptr;
    if (!destPath.empty()) {
        out = std::fopen(destPath.c_str(), "wb");
        if (!out) {
            err = "Mock cannot open " + destPath;
            return false;
        }
    }
    auto fail = [&](const std::string &msg) {
        if (out)
            std::fclose(out);
        err = msg;
        return false;
    };

    std::vector<char> buf(std::max<std::size_t>(s.chunkBytes, 1));
    std::uint64_t done = 0;
    bool first = true;
    while (done < s.totalBytes) {
        if (canceled())
            return fail("Cancelled");
        if (s.failAfterBytes > 0 && done >= s.failAfterBytes)
            return fail(s.failMessage);
        const std::size_t n = std::size_t(
            std::min<std::uint64_t>(buf.size(), s.totalBytes - done));
        for (std::size_t i = 0; i < n; ++i)
            buf[i] = char((done + i) % 251);
        if (out && std::fwrite(buf.data(), 1, n, out) != n)
            return fail("Mock write failed");
        done += n;
        if (progress)
            progress(done, s.totalBytes);
        if (first && s.holdUntilReleased) {
            if (!gate_.wait(key, shouldCancel))
                return fail("Cancelled");
        }
        first = false;
        if (s.chunkDelay.count() > 0)
            std::this_thread::sleep_for(s.chunkDelay);
    }
    if (s.failAfterBytes > 0 && done >= s.failAfterBytes)
        return fail(s.failMessage);
    if (out && std::fclose(out) != 0) {
        err = "Mock flush failed";
        return false;
    }
    return true;
}

bool MockTransferExecutor::fetch(const std::string &locator,
                                 const std::string &destPath, std::string &err,
                                 ProgressCB progress, CancelCB shouldCancel) {
    return run(locator, destPath, err, progress, shouldCancel);
}

bool MockTransferExecutor::push(const std::string &srcPath,
                                const std::string &device, std::string &err,
                                ProgressCB progress, CancelCB shouldCancel) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pushed_.push_back(srcPath);
    }
    return run(device, std::string(), err, progress, shouldCancel);
}

bool MockTransferExecutor::upload(const std::string &srcPath,
                                  const std::string &locator, std::string &err,
                                  ProgressCB progress, CancelCB shouldCancel) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        uploaded_.push_back(srcPath);
    }
    return run(locator, std::string(), err, progress, shouldCancel);
}

int MockTransferExecutor::callCount(const std::string &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = calls_.find(key);
    return it == calls_.end() ? 0 : it->second;
}

int MockTransferExecutor::activeCalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return active_;
}

int MockTransferExecutor::maxActiveCalls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxActive_;
}

std::vector<std::string> MockTransferExecutor::pushedPaths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return pushed_;
}

std::vector<std::string> MockTransferExecutor::uploadedPaths() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return uploaded_;
}

} // namespace vrpkg
