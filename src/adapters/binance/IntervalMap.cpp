#include "adapters/binance/IntervalMap.hpp"

#include <cctype>

namespace adapters::binance {
namespace {

bool endsWith(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string binance_interval(domain::Timeframe timeframe) {
    return std::string(detail::binance_interval_literal(timeframe));
}

std::string binance_symbol(const domain::Ticker& ticker) {
    std::string symbol;
    symbol.reserve(ticker.size() + 4);
    for (const char ch : ticker) {
        if (ch == '-' || ch == '/' || ch == '_' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
            continue;
        }
        symbol.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    if (endsWith(symbol, "USDT") || endsWith(symbol, "USDC") || endsWith(symbol, "BUSD")) {
        return symbol;
    }
    if (endsWith(symbol, "USD")) {
        return symbol + "T";
    }
    return symbol + "USDT";
}

} // namespace adapters::binance
