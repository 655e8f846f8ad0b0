#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "domain/Types.h"

namespace app {

class CacheEngine;

struct WarmSummary {
    std::size_t pairs{0};
    std::size_t candles{0};
    std::size_t residualGaps{0};
    std::size_t failures{0};
};

// Pre-populates the cache for every symbol x timeframe pair. One bad pair is
// logged and skipped; the rest still run.
class CacheWarmer {
public:
    explicit CacheWarmer(CacheEngine& engine);

    WarmSummary run(const std::vector<std::string>& symbols,
                    const std::vector<std::string>& timeframes,
                    domain::TimestampMs from,
                    domain::TimestampMs to);

private:
    CacheEngine& engine_;
};

}  // namespace app
