#include "core/SessionFilter.h"

#include <algorithm>

#include "core/TimeUtils.h"

namespace core {
namespace {

bool isWeekend(unsigned weekday) {
    return weekday == 0 || weekday == 6;
}

}  // namespace

bool SessionFilter::inSession(domain::TimestampMs barOpenUtc) const noexcept {
    const auto local = TimeUtils::newYorkCivil(barOpenUtc);
    if (isWeekend(local.weekday)) {
        return false;
    }
    const int minuteOfDay = local.hour * 60 + local.minute;
    return minuteOfDay >= window_.openMinutes && minuteOfDay < window_.closeMinutes;
}

bool SessionFilter::hasSessionTime(const domain::Gap& gap, domain::Timeframe timeframe) const noexcept {
    if (gap.end < gap.start) {
        return false;
    }

    if (!domain::is_intraday(timeframe)) {
        // Daily bars are keyed to 00:00 UTC of the trading date.
        for (auto ts = domain::align_up_ms(gap.start, domain::kDayMs); ts <= gap.end; ts += domain::kDayMs) {
            if (!isWeekend(TimeUtils::civilFromUtcMs(ts).weekday)) {
                return true;
            }
        }
        return false;
    }

    const auto first = TimeUtils::newYorkCivil(gap.start);
    for (auto dayStart = TimeUtils::utcMsFromCivil(first.year, first.month, first.day); dayStart <= gap.end;
         dayStart += domain::kDayMs) {
        const auto date = TimeUtils::civilFromUtcMs(dayStart);
        if (isWeekend(date.weekday)) {
            continue;
        }
        const auto open = TimeUtils::newYorkLocalToUtcMs(date.year, date.month, date.day, window_.openMinutes / 60,
                                                         window_.openMinutes % 60, 0);
        const auto close = TimeUtils::newYorkLocalToUtcMs(date.year, date.month, date.day, window_.closeMinutes / 60,
                                                          window_.closeMinutes % 60, 0);
        if (open <= gap.end && close > gap.start) {
            return true;
        }
    }
    return false;
}

std::vector<domain::Candle> SessionFilter::apply(std::vector<domain::Candle> candles,
                                                 domain::AssetClass assetClass) const {
    if (assetClass == domain::AssetClass::Crypto || candles.empty()) {
        return candles;
    }

    candles.erase(std::remove_if(candles.begin(), candles.end(),
                                 [this](const domain::Candle& candle) {
                                     return domain::is_intraday(candle.timeframe) && !inSession(candle.ts);
                                 }),
                  candles.end());
    return candles;
}

}  // namespace core
