#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace domain::contracts {

struct StoreStats {
    std::size_t rows{0};
    std::optional<TimestampMs> minTs{};
    std::optional<TimestampMs> maxTs{};
};

class ICandleStore {
public:
    virtual ~ICandleStore() = default;

    // Records inside [start, end] that are fresh at `now`, ascending by ts.
    // @throws StorageError
    virtual std::vector<Candle> readFresh(const Ticker& ticker,
                                          Timeframe timeframe,
                                          TimestampMs start,
                                          TimestampMs end,
                                          TimestampMs now) const = 0;

    // Insert-or-replace keyed by (ticker, timeframe, ts).
    // @throws StorageError when one or more rows could not be written
    virtual void upsert(const std::vector<CacheRecord>& records) = 0;

    virtual StoreStats stats(const Ticker& ticker, Timeframe timeframe) const = 0;
};

struct ProviderDescriptor {
    std::string name;
    int priority{0};
    std::vector<AssetClass> assetClasses;
    TimestampMs maxSpanMs{90 * kDayMs};

    bool supports(AssetClass assetClass) const {
        for (const auto supported : assetClasses) {
            if (supported == assetClass) {
                return true;
            }
        }
        return false;
    }
};

struct FetchRequest {
    Ticker ticker;
    Timeframe timeframe{Timeframe::OneDay};
    TimestampMs start{0};
    TimestampMs end{0};
    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};

class IProvider {
public:
    virtual ~IProvider() = default;

    virtual const ProviderDescriptor& descriptor() const = 0;

    // Candles with ts in [request.start, request.end], UTC, any order.
    // @throws ProviderRateLimited, ProviderTransientError
    virtual std::vector<Candle> fetch(const FetchRequest& request) = 0;
};

}  // namespace domain::contracts
