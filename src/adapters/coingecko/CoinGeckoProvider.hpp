#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::coingecko {

// BTC, BTC-USD and BTCUSDT map to "bitcoin"; unknown bases fall back to the
// lower-cased base symbol.
std::string coin_id(const domain::Ticker& ticker);

// Buckets market_chart/range price points into OHLC bars of the timeframe.
// The endpoint carries no per-bar volume, so volume is zero.
std::vector<domain::Candle> parse_market_chart(const std::string& body,
                                               const domain::Ticker& ticker,
                                               domain::Timeframe timeframe);

class CoinGeckoProvider : public domain::contracts::IProvider {
public:
    explicit CoinGeckoProvider(std::string apiKey = {},
                               int priority = 1,
                               infra::http::HttpTransport transport = infra::http::default_transport());

    const domain::contracts::ProviderDescriptor& descriptor() const override { return descriptor_; }

    std::vector<domain::Candle> fetch(const domain::contracts::FetchRequest& request) override;

private:
    std::string apiKey_;
    domain::contracts::ProviderDescriptor descriptor_;
    infra::http::HttpTransport transport_;
};

}  // namespace adapters::coingecko
