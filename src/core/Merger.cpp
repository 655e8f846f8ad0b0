#include "core/Merger.h"

#include <map>

namespace core {

std::vector<domain::Candle> mergeCandles(const std::vector<domain::Candle>& cached,
                                         const std::vector<domain::Candle>& fetched,
                                         domain::TimestampMs start,
                                         domain::TimestampMs end) {
    std::map<domain::TimestampMs, const domain::Candle*> byTs;
    for (const auto& candle : cached) {
        byTs[candle.ts] = &candle;
    }
    for (const auto& candle : fetched) {
        byTs[candle.ts] = &candle;
    }

    std::vector<domain::Candle> merged;
    merged.reserve(byTs.size());
    for (auto it = byTs.lower_bound(start); it != byTs.end() && it->first <= end; ++it) {
        merged.push_back(*it->second);
    }
    return merged;
}

}  // namespace core
