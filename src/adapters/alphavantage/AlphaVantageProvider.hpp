#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::alphavantage {

// Parses TIME_SERIES_DAILY / TIME_SERIES_INTRADAY payloads. Intraday keys are
// US/Eastern wall-clock times and are converted to UTC; daily keys map to
// 00:00 UTC of the date.
// Throws domain::ProviderRateLimited on "Note"/"Information" throttle bodies
// and std::runtime_error on error or malformed payloads.
std::vector<domain::Candle> parse_time_series(const std::string& body,
                                              const domain::Ticker& ticker,
                                              domain::Timeframe timeframe);

class AlphaVantageProvider : public domain::contracts::IProvider {
public:
    AlphaVantageProvider(std::string apiKey,
                         int priority = 0,
                         infra::http::HttpTransport transport = infra::http::default_transport());

    const domain::contracts::ProviderDescriptor& descriptor() const override { return descriptor_; }

    std::vector<domain::Candle> fetch(const domain::contracts::FetchRequest& request) override;

private:
    std::string apiKey_;
    domain::contracts::ProviderDescriptor descriptor_;
    infra::http::HttpTransport transport_;
};

}  // namespace adapters::alphavantage
