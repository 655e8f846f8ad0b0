#pragma once

#include <memory>
#include <vector>

#include "adapters/duckdb/DuckStore.hpp"
#include "domain/Ports.hpp"

namespace adapters::duckdb {

class DuckCandleStore : public domain::contracts::ICandleStore {
public:
    DuckCandleStore(std::shared_ptr<DuckStore> store, domain::TtlPolicy ttl);

    std::vector<domain::Candle> readFresh(const domain::Ticker& ticker,
                                          domain::Timeframe timeframe,
                                          domain::TimestampMs start,
                                          domain::TimestampMs end,
                                          domain::TimestampMs now) const override;

    void upsert(const std::vector<domain::CacheRecord>& records) override;

    domain::contracts::StoreStats stats(const domain::Ticker& ticker,
                                        domain::Timeframe timeframe) const override;

private:
    std::shared_ptr<DuckStore> store_;
    domain::TtlPolicy ttl_;
};

}  // namespace adapters::duckdb
