#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdc::common::metrics {

// Process-wide counters and latency timers. Keys are dotted names such as
// "provider.yahoo.calls"; the set is open-ended.
class Registry {
public:
    struct TimerSnapshot {
        std::uint64_t samples{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
        std::optional<double> maxMs{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, TimerSnapshot> timers;
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(const std::string& timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        Registry& registry_;
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& counterKey) const;
    void recordLatency(const std::string& timerKey, double latencyMs);
    Snapshot snapshot() const;

    // Test hook; production code never resets.
    void reset();

private:
    static constexpr std::size_t kMaxSamples = 4096;

    struct TimerMetrics {
        std::uint64_t samples{0};
        std::size_t next{0};
        std::vector<double> latenciesMs;
    };

    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, TimerMetrics> timers_;
};

}  // namespace mdc::common::metrics
