#include "adapters/memory/MemoryCandleStore.hpp"

#include <limits>

namespace adapters::memory {

MemoryCandleStore::MemoryCandleStore(domain::TtlPolicy ttl) : ttl_(ttl) {}

std::vector<domain::Candle> MemoryCandleStore::readFresh(const domain::Ticker& ticker,
                                                         domain::Timeframe timeframe,
                                                         domain::TimestampMs start,
                                                         domain::TimestampMs end,
                                                         domain::TimestampMs now) const {
    std::vector<domain::Candle> candles;
    if (start > end) {
        return candles;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto first = rows_.lower_bound(Key{ticker, timeframe, start});
    const auto last = rows_.upper_bound(Key{ticker, timeframe, end});
    for (auto it = first; it != last; ++it) {
        if (ttl_.isFresh(timeframe, it->second.fetchedAt, now)) {
            candles.push_back(it->second.candle);
        }
    }
    return candles;
}

void MemoryCandleStore::upsert(const std::vector<domain::CacheRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records) {
        const auto& candle = record.candle;
        rows_[Key{candle.ticker, candle.timeframe, candle.ts}] = record;
    }
}

domain::contracts::StoreStats MemoryCandleStore::stats(const domain::Ticker& ticker,
                                                       domain::Timeframe timeframe) const {
    domain::contracts::StoreStats stats;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto first = rows_.lower_bound(Key{ticker, timeframe, std::numeric_limits<domain::TimestampMs>::min()});
    const auto last = rows_.upper_bound(Key{ticker, timeframe, std::numeric_limits<domain::TimestampMs>::max()});
    for (auto it = first; it != last; ++it) {
        const auto ts = it->second.candle.ts;
        if (stats.rows == 0) {
            stats.minTs = ts;
        }
        stats.maxTs = ts;
        ++stats.rows;
    }
    return stats;
}

std::size_t MemoryCandleStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

}  // namespace adapters::memory
