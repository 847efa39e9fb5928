#include "vrpkg/ProgressAggregator.hpp"

#include <algorithm>

namespace vrpkg {

static int percentOf(std::uint64_t done, std::uint64_t total) {
    if (total == 0)
        return 0;
    if (done >= total)
        return 100;
    return int((done * 100) / total);
}

ProgressAggregator::ProgressAggregator(std::chrono::milliseconds minInterval)
    : minInterval_(minInterval) {}

void ProgressAggregator::begin(const std::string &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    entries_[key] = Entry{};
}

std::optional<int> ProgressAggregator::report(const std::string &key,
                                              std::uint64_t done,
                                              std::uint64_t total,
                                              Clock::time_point now) {
    std::lock_guard<std::mutex> lk(mtx_);
    Entry &e = entries_[key];
    e.done = done;
    e.total = total;
    const int pct = percentOf(done, total);
    if (pct == e.lastPercent)
        return std::nullopt;
    const bool first = (e.lastPercent < 0);
    if (pct < 100 && !first && (now - e.lastEmit) < minInterval_)
        return std::nullopt;
    e.lastPercent = pct;
    e.lastEmit = now;
    return pct;
}

int ProgressAggregator::complete(const std::string &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    Entry &e = entries_[key];
    if (e.total == 0)
        e.total = std::max<std::uint64_t>(e.done, 1);
    e.done = e.total;
    e.lastPercent = 100;
    e.lastEmit = Clock::now();
    return 100;
}

void ProgressAggregator::forget(const std::string &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    entries_.erase(key);
}

int ProgressAggregator::overallPercent() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::uint64_t done = 0;
    std::uint64_t total = 0;
    for (const auto &kv : entries_) {
        done += std::min(kv.second.done, kv.second.total);
        total += kv.second.total;
    }
    return percentOf(done, total);
}

std::size_t ProgressAggregator::trackedCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}

} // namespace vrpkg
