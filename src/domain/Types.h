#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "domain/Decimal.hpp"

namespace domain {

// Milliseconds since the Unix epoch, UTC. Every boundary of the engine speaks
// this representation; providers convert exchange-local time before returning.
using TimestampMs = std::int64_t;
using Ticker = std::string;

constexpr TimestampMs kSecondMs = 1'000;
constexpr TimestampMs kMinuteMs = 60 * kSecondMs;
constexpr TimestampMs kHourMs = 60 * kMinuteMs;
constexpr TimestampMs kDayMs = 24 * kHourMs;

inline TimestampMs align_down_ms(TimestampMs t, TimestampMs step) {
    if (step <= 0) {
        return t;
    }
    const auto rem = t % step;
    return rem < 0 ? t - rem - step : t - rem;
}

inline TimestampMs align_up_ms(TimestampMs t, TimestampMs step) {
    const auto down = align_down_ms(t, step);
    return down == t ? t : down + step;
}

enum class Timeframe {
    OneMinute,
    FiveMinutes,
    FifteenMinutes,
    OneHour,
    OneDay,
};

constexpr TimestampMs interval_ms(Timeframe timeframe) noexcept {
    switch (timeframe) {
    case Timeframe::OneMinute:
        return kMinuteMs;
    case Timeframe::FiveMinutes:
        return 5 * kMinuteMs;
    case Timeframe::FifteenMinutes:
        return 15 * kMinuteMs;
    case Timeframe::OneHour:
        return kHourMs;
    case Timeframe::OneDay:
        return kDayMs;
    }
    return kDayMs;
}

constexpr bool is_intraday(Timeframe timeframe) noexcept {
    return timeframe != Timeframe::OneDay;
}

inline std::string timeframe_label(Timeframe timeframe) {
    switch (timeframe) {
    case Timeframe::OneMinute:
        return "1m";
    case Timeframe::FiveMinutes:
        return "5m";
    case Timeframe::FifteenMinutes:
        return "15m";
    case Timeframe::OneHour:
        return "1h";
    case Timeframe::OneDay:
        return "1d";
    }
    return "";
}

inline std::optional<Timeframe> timeframe_from_label(std::string_view value) {
    std::string normalized;
    normalized.reserve(value.size());
    for (char ch : value) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }

    if (normalized == "1m" || normalized == "1min" || normalized == "1minute") {
        return Timeframe::OneMinute;
    }
    if (normalized == "5m" || normalized == "5min" || normalized == "5minute") {
        return Timeframe::FiveMinutes;
    }
    if (normalized == "15m" || normalized == "15min" || normalized == "15minute") {
        return Timeframe::FifteenMinutes;
    }
    if (normalized == "1h" || normalized == "60m" || normalized == "60min") {
        return Timeframe::OneHour;
    }
    if (normalized == "1d" || normalized == "1day" || normalized == "24h") {
        return Timeframe::OneDay;
    }
    return std::nullopt;
}

/// Freshness window per timeframe class.
struct TtlPolicy {
    TimestampMs intradayMs{kHourMs};
    TimestampMs dailyMs{kDayMs};

    constexpr TimestampMs ttlFor(Timeframe timeframe) const noexcept {
        return is_intraday(timeframe) ? intradayMs : dailyMs;
    }

    constexpr bool isFresh(Timeframe timeframe, TimestampMs fetchedAt, TimestampMs now) const noexcept {
        return now - fetchedAt < ttlFor(timeframe);
    }
};

enum class AssetClass {
    Equity,
    Crypto,
};

inline const char* asset_class_label(AssetClass assetClass) noexcept {
    return assetClass == AssetClass::Crypto ? "crypto" : "equity";
}

struct Candle {
    Ticker ticker;
    Timeframe timeframe{Timeframe::OneDay};
    TimestampMs ts{0};
    Decimal open;
    Decimal high;
    Decimal low;
    Decimal close;
    Decimal volume;
};

struct CacheRecord {
    Candle candle;
    TimestampMs fetchedAt{0};
};

// Closed range [start, end] lacking fresh coverage.
struct Gap {
    TimestampMs start{0};
    TimestampMs end{0};

    TimestampMs span() const noexcept { return end - start; }
    bool operator==(const Gap& other) const noexcept { return start == other.start && end == other.end; }
    bool operator!=(const Gap& other) const noexcept { return !(*this == other); }
};

struct PriceSeries {
    Ticker ticker;
    Timeframe timeframe{Timeframe::OneDay};
    TimestampMs start{0};
    TimestampMs end{0};
    std::vector<Candle> candles;
    std::vector<Gap> residualGaps;

    bool complete() const noexcept { return residualGaps.empty(); }
};

inline void sort_by_timestamp(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& lhs, const Candle& rhs) {
        return lhs.ts < rhs.ts;
    });
}

}  // namespace domain
