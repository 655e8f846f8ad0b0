#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::binance {

// Parses a /api/v3/klines array. Rows are tagged with the caller's ticker.
// Throws std::runtime_error on anything that is not a kline array.
std::vector<domain::Candle> parse_klines(const std::string& body,
                                         const domain::Ticker& ticker,
                                         domain::Timeframe timeframe);

class BinanceProvider : public domain::contracts::IProvider {
public:
    static constexpr std::size_t kMaxLimit = 1000;

    explicit BinanceProvider(int priority = 0,
                             infra::http::HttpTransport transport = infra::http::default_transport());

    const domain::contracts::ProviderDescriptor& descriptor() const override { return descriptor_; }

    std::vector<domain::Candle> fetch(const domain::contracts::FetchRequest& request) override;

private:
    domain::contracts::ProviderDescriptor descriptor_;
    infra::http::HttpTransport transport_;
};

}  // namespace adapters::binance
