#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace mdc::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double position = std::clamp(quantile, 0.0, 1.0) * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));
    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex] + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(const std::string& timerKey)
    : registry_(Registry::instance()), key_(timerKey), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
        std::chrono::steady_clock::now() - start_);
    registry_.recordLatency(key_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

void Registry::recordLatency(const std::string& timerKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& timer = timers_[timerKey];
    ++timer.samples;
    if (timer.latenciesMs.size() < kMaxSamples) {
        timer.latenciesMs.push_back(latencyMs);
    } else {
        timer.latenciesMs[timer.next] = latencyMs;
    }
    timer.next = (timer.next + 1U) % kMaxSamples;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, value);
    }
    for (const auto& [key, timer] : timers_) {
        TimerSnapshot timerSnapshot;
        timerSnapshot.samples = timer.samples;
        auto latencies = timer.latenciesMs;
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            timerSnapshot.p95Ms = computeQuantile(latencies, 0.95);
            timerSnapshot.p99Ms = computeQuantile(latencies, 0.99);
            timerSnapshot.maxMs = latencies.back();
        }
        snapshot.timers.emplace(key, std::move(timerSnapshot));
    }
    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    timers_.clear();
}

}  // namespace mdc::common::metrics
