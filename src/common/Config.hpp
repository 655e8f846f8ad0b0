#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace mdc::common {

struct Config {
    mdc::log::Level logLevel = mdc::log::Level::Info;
    std::string storage = "duck";
    std::string duckdbPath = "data/price_cache.duckdb";

    std::size_t fetchThreads = 4;
    std::int64_t chunkLimitDays = 90;
    std::int64_t intradayTtlMs = 3'600'000;
    std::int64_t dailyTtlMs = 86'400'000;
    // Minutes after midnight, New York local time.
    int sessionOpenMinutes = 9 * 60 + 30;
    int sessionCloseMinutes = 16 * 60;

    std::vector<std::string> equityProviders{"alphavantage", "yahoo"};
    std::vector<std::string> cryptoProviders{"binance", "coingecko"};
    std::vector<std::string> cryptoMarkers{"BTC", "ETH", "USDT", "USDC", "BNB",
                                           "ADA", "SOL", "XRP", "DOT", "DOGE"};
    std::string alphaVantageApiKey;
    std::string coingeckoApiKey;

    std::string ticker;
    std::string timeframe = "1d";
    std::string from;
    std::string to;

    bool listProviders = false;
    bool warm = false;
    bool stats = false;
    std::vector<std::string> warmSymbols{};
    std::vector<std::string> warmTimeframes{"1d"};

    static Config fromArgs(int argc, char** argv);
};

}  // namespace mdc::common
