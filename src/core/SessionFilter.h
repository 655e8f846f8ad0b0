#pragma once

#include <vector>

#include "domain/Types.h"

namespace core {

// Regular-session window in New York local time, minutes after midnight,
// half-open [openMinutes, closeMinutes).
struct SessionWindow {
    int openMinutes{9 * 60 + 30};
    int closeMinutes{16 * 60};
};

class SessionFilter {
public:
    SessionFilter() = default;
    explicit SessionFilter(SessionWindow window) : window_(window) {}

    // Crypto and daily bars pass through; equity intraday bars survive only
    // on weekdays inside the window.
    std::vector<domain::Candle> apply(std::vector<domain::Candle> candles, domain::AssetClass assetClass) const;

    bool inSession(domain::TimestampMs barOpenUtc) const noexcept;

    // False when no equity bar could open inside the gap: weekend days for
    // daily bars, nights and weekends for intraday bars. Holidays count as open.
    bool hasSessionTime(const domain::Gap& gap, domain::Timeframe timeframe) const noexcept;

private:
    SessionWindow window_{};
};

}  // namespace core
