#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "app/ProviderLadder.hpp"
#include "domain/Types.h"

namespace app {

struct FetchOutcome {
    std::vector<domain::Candle> candles;
    std::vector<domain::Gap> residualGaps;
};

// Walks the provider ladder for one gap, chunk by chunk. Never throws for
// provider failures: a chunk no provider could fill becomes a residual gap.
class FetchOrchestrator {
public:
    struct Options {
        domain::TimestampMs chunkLimitMs{90 * domain::kDayMs};
    };

    explicit FetchOrchestrator(ProviderLadder ladder);
    FetchOrchestrator(ProviderLadder ladder, Options options);

    FetchOutcome fetchGap(const domain::Ticker& ticker,
                          domain::Timeframe timeframe,
                          const domain::Gap& gap,
                          domain::AssetClass assetClass);

    // min(chunk limit, smallest max span on the asset class ladder)
    domain::TimestampMs chunkSizeFor(domain::AssetClass assetClass) const;

    const ProviderLadder& ladder() const noexcept { return ladder_; }

    // Consecutive closed chunks [s, s + size - 1ms]; the last ends at gap.end.
    static std::vector<domain::Gap> splitIntoChunks(const domain::Gap& gap, domain::TimestampMs chunkMs);

    // 5 s plus 1 s per 10 days of span, at most 60 s.
    static std::chrono::milliseconds timeoutFor(domain::TimestampMs spanMs);

private:
    bool tryProvider(const ProviderPtr& provider,
                     const domain::Ticker& ticker,
                     domain::Timeframe timeframe,
                     const domain::Gap& chunk,
                     std::vector<domain::Candle>& out);

    ProviderLadder ladder_;
    Options options_;
    std::unordered_map<const domain::contracts::IProvider*, std::unique_ptr<std::mutex>> providerMutexes_;
};

}  // namespace app
