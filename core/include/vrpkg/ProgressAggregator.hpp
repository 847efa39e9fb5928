// Turns raw byte callbacks into debounced 0..100 figures per job and an
// overall figure across every tracked job.
#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace vrpkg {

class ProgressAggregator {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressAggregator(
        std::chrono::milliseconds minInterval = std::chrono::milliseconds(100));

    // Start tracking a new phase for key (percent back to 0).
    void begin(const std::string &key);

    // Record progress; returns the percent to publish or nullopt when the
    // update is debounced. Reaching 100 is never debounced.
    std::optional<int> report(const std::string &key, std::uint64_t done,
                              std::uint64_t total,
                              Clock::time_point now = Clock::now());

    // Phase finished: always yields 100.
    int complete(const std::string &key);

    void forget(const std::string &key);

    // Sum of done over sum of total of tracked entries (0 when none).
    int overallPercent() const;
    std::size_t trackedCount() const;

private:
    struct Entry {
        std::uint64_t done = 0;
        std::uint64_t total = 0;
        int lastPercent = -1;
        Clock::time_point lastEmit{};
    };

    mutable std::mutex mtx_;
    std::chrono::milliseconds minInterval_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace vrpkg
