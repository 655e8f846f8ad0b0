#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::yahoo {

// Parses a v8 chart payload. Bars with any null OHLC field are skipped.
// Daily bars are keyed to 00:00 UTC of their New York trading date.
// Throws std::runtime_error on an error payload or a missing result.
std::vector<domain::Candle> parse_chart(const std::string& body,
                                        const domain::Ticker& ticker,
                                        domain::Timeframe timeframe);

std::string yahoo_interval(domain::Timeframe timeframe);

// BRK.B -> BRK-B, the form the chart endpoint expects.
std::string yahoo_symbol(const domain::Ticker& ticker);

class YahooProvider : public domain::contracts::IProvider {
public:
    explicit YahooProvider(int priority = 1,
                           infra::http::HttpTransport transport = infra::http::default_transport());

    const domain::contracts::ProviderDescriptor& descriptor() const override { return descriptor_; }

    std::vector<domain::Candle> fetch(const domain::contracts::FetchRequest& request) override;

private:
    domain::contracts::ProviderDescriptor descriptor_;
    infra::http::HttpTransport transport_;
};

}  // namespace adapters::yahoo
