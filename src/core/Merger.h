#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

// Union of both inputs keyed by ts, fetched rows replacing cached ones,
// ascending and limited to [start, end].
std::vector<domain::Candle> mergeCandles(const std::vector<domain::Candle>& cached,
                                         const std::vector<domain::Candle>& fetched,
                                         domain::TimestampMs start,
                                         domain::TimestampMs end);

}  // namespace core
