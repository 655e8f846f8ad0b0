#pragma once

#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::memory {

// In-process store used by tests and --storage memory. Same freshness and
// upsert semantics as the DuckDB store, without persistence.
class MemoryCandleStore : public domain::contracts::ICandleStore {
public:
    explicit MemoryCandleStore(domain::TtlPolicy ttl = {});

    std::vector<domain::Candle> readFresh(const domain::Ticker& ticker,
                                          domain::Timeframe timeframe,
                                          domain::TimestampMs start,
                                          domain::TimestampMs end,
                                          domain::TimestampMs now) const override;

    void upsert(const std::vector<domain::CacheRecord>& records) override;

    domain::contracts::StoreStats stats(const domain::Ticker& ticker,
                                        domain::Timeframe timeframe) const override;

    std::size_t size() const;

private:
    using Key = std::tuple<std::string, domain::Timeframe, domain::TimestampMs>;

    domain::TtlPolicy ttl_;
    mutable std::mutex mutex_;
    std::map<Key, domain::CacheRecord> rows_;
};

}  // namespace adapters::memory
