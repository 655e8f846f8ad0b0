#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

// Sub-ranges of [requestedStart, requestedEnd] not covered by freshCandles,
// which must be sorted ascending by ts. Holes no wider than one interval are
// not reported.
std::vector<domain::Gap> detectGaps(domain::TimestampMs requestedStart,
                                    domain::TimestampMs requestedEnd,
                                    const std::vector<domain::Candle>& freshCandles,
                                    domain::TimestampMs intervalMs);

}  // namespace core
