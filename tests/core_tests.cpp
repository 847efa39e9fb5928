// Core unit tests without external framework (run via CTest).
#include "vrpkg/LocalFileTransferExecutor.hpp"
#include "vrpkg/MockDeviceController.hpp"
#include "vrpkg/MockExtractor.hpp"
#include "vrpkg/MockTransferExecutor.hpp"
#include "vrpkg/ProgressAggregator.hpp"
#include "vrpkg/RateLimiter.hpp"
#include "vrpkg/RuntimeLogging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

struct TempDir {
    fs::path path;
    TempDir() {
        static int counter = 0;
        const auto stamp =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("vrpkg-core-" + std::to_string(stamp) + "-" +
                std::to_string(counter++));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

long long msSince(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - t0)
        .count();
}

void writeFile(const fs::path &p, std::size_t bytes) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    for (std::size_t i = 0; i < bytes; ++i)
        out.put(char(i % 97));
}

std::string readFile(const fs::path &p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

void test_rate_limiter_unlimited(TestContext &t) {
    vrpkg::RateLimiter rl(0);
    const auto t0 = std::chrono::steady_clock::now();
    t.check(rl.acquire(512u * 1024 * 1024), "unlimited acquire should pass");
    t.check(msSince(t0) < 50, "unlimited acquire should not wait");
}

void test_rate_limiter_throttles(TestContext &t) {
    vrpkg::RateLimiter rl(100000);
    const auto t0 = std::chrono::steady_clock::now();
    t.check(rl.acquire(100000), "burst acquire should pass");
    t.check(msSince(t0) < 100, "a full bucket should admit one second at once");
    t.check(rl.acquire(50000), "second acquire should pass after waiting");
    const long long elapsed = msSince(t0);
    t.check(elapsed >= 400, "50000 bytes at 100000 B/s should take ~500 ms");
    t.check(elapsed < 2000, "throttled acquire should not overshoot badly");
}

void test_rate_limiter_debt_keeps_average(TestContext &t) {
    vrpkg::RateLimiter rl(50000);
    t.check(rl.acquire(50000), "drain the bucket");
    const auto t0 = std::chrono::steady_clock::now();
    // Larger than the burst: admitted once a full burst is available, the
    // remainder is paid by the next caller.
    t.check(rl.acquire(75000), "oversized acquire should pass");
    t.check(rl.acquire(10000), "follow-up acquire should pass");
    t.check(msSince(t0) >= 1300,
            "debt from an oversized request should delay the next one");
}

void test_rate_limiter_cancel_while_waiting(TestContext &t) {
    vrpkg::RateLimiter rl(1000);
    t.check(rl.acquire(1000), "drain the bucket");
    const auto t0 = std::chrono::steady_clock::now();
    const bool ok = rl.acquire(1000, [t0]() { return msSince(t0) > 100; });
    t.check(!ok, "acquire should report cancellation");
    t.check(msSince(t0) < 400, "cancel should be observed within a wait slice");
}

void test_rate_limiter_set_limit_wakes_waiters(TestContext &t) {
    vrpkg::RateLimiter rl(1000);
    t.check(rl.acquire(1000), "drain the bucket");
    std::atomic<bool> done{false};
    const auto t0 = std::chrono::steady_clock::now();
    std::thread waiter([&]() {
        rl.acquire(1000);
        done = true;
    });
    std::this_thread::sleep_for(50ms);
    t.check(!done.load(), "waiter should still be blocked at 1000 B/s");
    rl.setLimit(0);
    waiter.join();
    t.check(msSince(t0) < 500, "switching to unlimited should release waiters");
    t.check(rl.limit() == 0, "limit should read back as unlimited");
}

void test_rate_limiter_shared_by_threads(TestContext &t) {
    vrpkg::RateLimiter rl(200000);
    t.check(rl.acquire(200000), "drain the bucket");
    const auto t0 = std::chrono::steady_clock::now();
    auto worker = [&rl]() {
        for (int i = 0; i < 4; ++i)
            rl.acquire(25000);
    };
    std::thread a(worker);
    std::thread b(worker);
    a.join();
    b.join();
    t.check(msSince(t0) >= 800,
            "two jobs sharing a bucket should be capped together");
}

void test_bandwidth_limits_directions(TestContext &t) {
    vrpkg::BandwidthLimits limits;
    limits.download().setLimit(1000);
    limits.upload().setLimit(2000);
    t.check(limits.download().limit() == 1000 && limits.upload().limit() == 2000,
            "each direction keeps its own limit");
    t.check(limits.upload().acquire(2000), "drain the upload bucket");
    const auto t0 = std::chrono::steady_clock::now();
    t.check(limits.download().acquire(1000),
            "download bucket is not drained by uploads");
    t.check(msSince(t0) < 100, "a full download bucket admits its burst at once");
}

void test_aggregator_debounce(TestContext &t) {
    vrpkg::ProgressAggregator agg(100ms);
    const auto t0 = vrpkg::ProgressAggregator::Clock::now();
    agg.begin("a");
    auto p = agg.report("a", 10, 100, t0);
    t.check(p && *p == 10, "first report should always be emitted");
    p = agg.report("a", 20, 100, t0 + 10ms);
    t.check(!p, "report inside the interval should be debounced");
    p = agg.report("a", 30, 100, t0 + 150ms);
    t.check(p && *p == 30, "report after the interval should be emitted");
    p = agg.report("a", 30, 100, t0 + 400ms);
    t.check(!p, "unchanged percent should not be emitted");
    p = agg.report("a", 100, 100, t0 + 401ms);
    t.check(p && *p == 100, "reaching 100 should never be debounced");
}

void test_aggregator_begin_resets(TestContext &t) {
    vrpkg::ProgressAggregator agg(1000ms);
    const auto t0 = vrpkg::ProgressAggregator::Clock::now();
    agg.begin("a");
    agg.report("a", 100, 100, t0);
    agg.begin("a");
    const auto p = agg.report("a", 5, 100, t0 + 1ms);
    t.check(p && *p == 5, "a new phase should start from a fresh entry");
}

void test_aggregator_overall(TestContext &t) {
    vrpkg::ProgressAggregator agg;
    agg.begin("a");
    agg.begin("b");
    agg.report("a", 50, 100);
    agg.report("b", 0, 300);
    t.check(agg.overallPercent() == 12, "overall should be sum(done)/sum(total)");
    t.check(agg.complete("b") == 100, "complete should yield 100");
    t.check(agg.overallPercent() == 87, "completed entry counts as fully done");
    agg.forget("a");
    t.check(agg.trackedCount() == 1, "forget should drop the entry");
    t.check(agg.overallPercent() == 100, "only the completed entry remains");
    agg.forget("b");
    t.check(agg.overallPercent() == 0, "no tracked entries means 0");
}

void test_local_fetch_copies_with_progress(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.path / "mirror" / "games" / "pkg.7z", 200 * 1024);
    vrpkg::LocalFileTransferExecutor ex((tmp.path / "mirror").string(),
                                        (tmp.path / "devices").string());
    std::vector<std::uint64_t> seen;
    std::uint64_t lastTotal = 0;
    std::string err;
    const fs::path dest = tmp.path / "dl" / "pkg.7z";
    const bool ok = ex.fetch(
        "games/pkg.7z", dest.string(), err,
        [&](std::uint64_t done, std::uint64_t total) {
            seen.push_back(done);
            lastTotal = total;
        });
    t.check(ok, "fetch of a mirrored file should succeed: " + err);
    t.check(readFile(dest) == readFile(tmp.path / "mirror" / "games" / "pkg.7z"),
            "fetched bytes should match the source");
    bool monotonic = true;
    for (std::size_t i = 1; i < seen.size(); ++i)
        monotonic = monotonic && seen[i] >= seen[i - 1];
    t.check(monotonic, "progress should be monotonic");
    t.check(!seen.empty() && seen.back() == 200 * 1024 && lastTotal == 200 * 1024,
            "final progress should equal the file size");
    t.check(seen.size() >= 4, "64 KiB chunks should report several times");
}

void test_local_fetch_cancel_and_missing(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.path / "mirror" / "big.bin", 512 * 1024);
    vrpkg::LocalFileTransferExecutor ex((tmp.path / "mirror").string(), "");
    int chunks = 0;
    std::string err;
    const bool ok = ex.fetch(
        "file://" + (tmp.path / "mirror" / "big.bin").string(),
        (tmp.path / "out.bin").string(), err,
        [&](std::uint64_t, std::uint64_t) { ++chunks; },
        [&]() { return chunks >= 2; });
    t.check(!ok, "fetch should stop when cancelled");
    t.check(err == "Cancelled", "cancelled fetch should say so");

    err.clear();
    t.check(!ex.fetch("nope.bin", (tmp.path / "x").string(), err),
            "fetch of a missing item should fail");
    t.checkContains(err, "not found", "missing item error should be explicit");
}

void test_local_push_and_upload(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.path / "content" / "com.example.game" / "main.obb", 1000);
    writeFile(tmp.path / "content" / "com.example.game" / "sub" / "patch.obb",
              500);
    vrpkg::LocalFileTransferExecutor ex((tmp.path / "mirror").string(),
                                        (tmp.path / "devices").string());
    const std::string src = (tmp.path / "content" / "com.example.game").string();
    std::string err;
    t.check(!ex.push(src, "QUEST1", err), "push to an unmounted device fails");
    t.checkContains(err, "not mounted", "push error should name the cause");

    fs::create_directories(tmp.path / "devices" / "QUEST1");
    err.clear();
    std::uint64_t last = 0;
    t.check(ex.push(src, "QUEST1", err,
                    [&](std::uint64_t d, std::uint64_t) { last = d; }),
            "push of a directory should succeed: " + err);
    t.check(fs::exists(tmp.path / "devices" / "QUEST1" / "com.example.game" /
                       "sub" / "patch.obb"),
            "push should copy the tree under the device directory");
    t.check(last == 1500, "push progress should cover every file");

    err.clear();
    t.check(ex.upload(src, "uploads/com.example.game", err),
            "upload to a relative locator should succeed: " + err);
    t.check(fs::exists(tmp.path / "mirror" / "uploads" / "com.example.game" /
                       "main.obb"),
            "upload should land under the mirror root");
}

void test_mock_transfer_fail_then_succeed(TestContext &t) {
    TempDir tmp;
    vrpkg::MockTransferExecutor ex;
    vrpkg::MockTransferScript s;
    s.totalBytes = 48 * 1024;
    s.failAfterBytes = 16 * 1024;
    s.failTimes = 1;
    s.failMessage = "connection reset";
    ex.setScript("cat/a", s);
    std::string err;
    const fs::path dest = tmp.path / "a.bin";
    t.check(!ex.fetch("cat/a", dest.string(), err), "first fetch should fail");
    t.check(err == "connection reset", "scripted failure message expected");
    err.clear();
    t.check(ex.fetch("cat/a", dest.string(), err), "second fetch should pass");
    t.check(fs::file_size(dest) == 48 * 1024, "fetch should write totalBytes");
    const std::string bytes = readFile(dest);
    t.check(bytes.size() > 300 && bytes[251] == 0 && bytes[252] == 1,
            "mock bytes should follow the i % 251 pattern");
    t.check(ex.callCount("cat/a") == 2, "both calls should be counted");
}

void test_mock_transfer_hold_and_release(TestContext &t) {
    vrpkg::MockTransferExecutor ex;
    vrpkg::MockTransferScript s;
    s.holdUntilReleased = true;
    ex.setScript("dev1", s);
    std::atomic<bool> finished{false};
    std::thread th([&]() {
        std::string err;
        ex.push("/tmp/whatever", "dev1", err);
        finished = true;
    });
    for (int i = 0; i < 200 && ex.activeCalls() == 0; ++i)
        std::this_thread::sleep_for(5ms);
    std::this_thread::sleep_for(30ms);
    t.check(!finished.load(), "held call should not finish before release");
    ex.release("dev1");
    th.join();
    t.check(finished.load(), "released call should finish");
    t.check(ex.pushedPaths().size() == 1, "push should be recorded");
    t.check(ex.maxActiveCalls() == 1, "one call at a time was active");
}

void test_mock_extractor_cancel_leaves_partial(TestContext &t) {
    TempDir tmp;
    writeFile(tmp.path / "pkg.7z", 10);
    vrpkg::MockExtractor mx;
    vrpkg::MockStepScript s;
    s.stall = true;
    mx.setScript("pkg.7z", s);
    const auto t0 = std::chrono::steady_clock::now();
    std::string err;
    const bool ok = mx.extract((tmp.path / "pkg.7z").string(),
                               (tmp.path / "out").string(), err, {},
                               [t0]() { return msSince(t0) > 50; });
    t.check(!ok, "stalled extraction should end on cancel");
    t.check(fs::exists(tmp.path / "out" / ".partial"),
            "cancelled extraction should leave partial output behind");

    mx.setScript("pkg.7z", vrpkg::MockStepScript{});
    err.clear();
    t.check(mx.extract((tmp.path / "pkg.7z").string(),
                       (tmp.path / "out").string(), err),
            "scripted extraction should succeed: " + err);
    t.check(fs::exists(tmp.path / "out" / "package.apk") &&
                !fs::exists(tmp.path / "out" / ".partial"),
            "finished extraction should hold only the content");
    t.check(mx.callCount("pkg.7z") == 2, "extract calls should be counted");
}

void test_mock_device_conflict(TestContext &t) {
    vrpkg::MockDeviceController dev;
    dev.setConflicts("Q1", 1);
    std::string err;
    t.check(!dev.install("Q1", "/pkg", err), "conflicting install should fail");
    t.check(dev.isUpdateConflict(err), "conflict should be recognized");
    err.clear();
    t.check(dev.install("Q1", "/pkg", err), "next install should pass");
    t.check(dev.installs().size() == 2, "both installs should be recorded");
    t.check(!dev.isUpdateConflict("Failure [INSTALL_FAILED_INSUFFICIENT_STORAGE]"),
            "other failures are not conflicts");
}

void test_locator_helpers(TestContext &t) {
    t.check(vrpkg::locatorBaseName("https://m.example/a/b.7z?sig=1") == "b.7z",
            "basename should drop the query");
    t.check(vrpkg::locatorBaseName("file:///srv/mirror/x.zip") == "x.zip",
            "basename should handle file URLs");
    t.check(vrpkg::locatorBaseName("dir/") == "", "trailing slash has no name");
    t.check(vrpkg::stripFileScheme("file:///a/b") == "/a/b",
            "file scheme should be stripped");
    t.check(vrpkg::stripFileScheme("/a/b") == "/a/b", "plain path unchanged");
}

void test_locator_redaction(TestContext &t) {
    ::unsetenv("VRPKG_ENV");
    ::unsetenv("VRPKG_LOG_SENSITIVE");
    t.check(vrpkg::locatorForLog("https://user:pw@host/p?sig=abc") ==
                "https://<redacted>@host/p?<redacted>",
            "credentials and query should be redacted");
    t.check(vrpkg::locatorForLog("games/pkg.7z") == "games/pkg.7z",
            "plain locators are logged as is");
    ::setenv("VRPKG_LOG_SENSITIVE", "1", 1);
    t.check(vrpkg::locatorForLog("https://u:p@h/x") == "https://<redacted>@h/x",
            "sensitive flag alone is not enough outside dev");
    ::setenv("VRPKG_ENV", "dev", 1);
    t.check(vrpkg::locatorForLog("https://u:p@h/x") == "https://u:p@h/x",
            "dev environment with the flag logs locators verbatim");
    ::unsetenv("VRPKG_ENV");
    ::unsetenv("VRPKG_LOG_SENSITIVE");
}

} // namespace

int main() {
    TestContext t;
    test_rate_limiter_unlimited(t);
    test_rate_limiter_throttles(t);
    test_rate_limiter_debt_keeps_average(t);
    test_rate_limiter_cancel_while_waiting(t);
    test_rate_limiter_set_limit_wakes_waiters(t);
    test_rate_limiter_shared_by_threads(t);
    test_bandwidth_limits_directions(t);
    test_aggregator_debounce(t);
    test_aggregator_begin_resets(t);
    test_aggregator_overall(t);
    test_local_fetch_copies_with_progress(t);
    test_local_fetch_cancel_and_missing(t);
    test_local_push_and_upload(t);
    test_mock_transfer_fail_then_succeed(t);
    test_mock_transfer_hold_and_release(t);
    test_mock_extractor_cancel_leaves_partial(t);
    test_mock_device_conflict(t);
    test_locator_helpers(t);
    test_locator_redaction(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] vrpkg_core_tests\n";
    return EXIT_SUCCESS;
}
