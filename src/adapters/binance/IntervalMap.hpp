#pragma once

#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters::binance {

std::string binance_interval(domain::Timeframe timeframe);

// BTC, BTC-USD, BTCUSD and btc/usdt all map to BTCUSDT.
std::string binance_symbol(const domain::Ticker& ticker);

namespace detail {

constexpr std::string_view binance_interval_literal(domain::Timeframe timeframe) {
    switch (timeframe) {
    case domain::Timeframe::OneMinute:
        return "1m";
    case domain::Timeframe::FiveMinutes:
        return "5m";
    case domain::Timeframe::FifteenMinutes:
        return "15m";
    case domain::Timeframe::OneHour:
        return "1h";
    case domain::Timeframe::OneDay:
        return "1d";
    }
    return "1d";
}

} // namespace detail

static_assert(detail::binance_interval_literal(domain::Timeframe::OneMinute) == std::string_view{"1m"});
static_assert(detail::binance_interval_literal(domain::Timeframe::FifteenMinutes) == std::string_view{"15m"});
static_assert(detail::binance_interval_literal(domain::Timeframe::OneDay) == std::string_view{"1d"});

} // namespace adapters::binance
