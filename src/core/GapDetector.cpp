#include "core/GapDetector.h"

namespace core {

std::vector<domain::Gap> detectGaps(domain::TimestampMs requestedStart,
                                    domain::TimestampMs requestedEnd,
                                    const std::vector<domain::Candle>& freshCandles,
                                    domain::TimestampMs intervalMs) {
    std::vector<domain::Gap> gaps;
    if (freshCandles.empty()) {
        gaps.push_back({requestedStart, requestedEnd});
        return gaps;
    }

    const auto& first = freshCandles.front();
    if (first.ts - intervalMs > requestedStart) {
        gaps.push_back({requestedStart, first.ts - intervalMs});
    }

    for (std::size_t i = 0; i + 1 < freshCandles.size(); ++i) {
        const auto current = freshCandles[i].ts;
        const auto next = freshCandles[i + 1].ts;
        if (next - current > intervalMs) {
            gaps.push_back({current + intervalMs, next - intervalMs});
        }
    }

    const auto& last = freshCandles.back();
    if (requestedEnd - last.ts > intervalMs) {
        gaps.push_back({last.ts + intervalMs, requestedEnd});
    }
    return gaps;
}

}  // namespace core
