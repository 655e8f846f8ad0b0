#include "adapters/alphavantage/AlphaVantageProvider.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "adapters/ProviderSupport.hpp"
#include "common/JsonUtils.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"
#include "domain/Errors.hpp"

namespace adapters::alphavantage {
namespace {

constexpr const char* kName = "alphavantage";
constexpr const char* kHost = "www.alphavantage.co";

const char* intradayInterval(domain::Timeframe timeframe) {
    switch (timeframe) {
    case domain::Timeframe::OneMinute:
        return "1min";
    case domain::Timeframe::FiveMinutes:
        return "5min";
    case domain::Timeframe::FifteenMinutes:
        return "15min";
    case domain::Timeframe::OneHour:
        return "60min";
    case domain::Timeframe::OneDay:
        break;
    }
    return "";
}

std::string seriesKey(domain::Timeframe timeframe) {
    if (timeframe == domain::Timeframe::OneDay) {
        return "Time Series (Daily)";
    }
    return std::string{"Time Series ("} + intradayInterval(timeframe) + ")";
}

domain::TimestampMs parseSeriesTimestamp(const std::string& key, domain::Timeframe timeframe) {
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    const int fields = std::sscanf(key.c_str(), "%d-%u-%u %d:%d:%d", &year, &month, &day, &hour, &minute, &second);
    if (fields != 3 && fields != 6) {
        throw std::runtime_error("Malformed Alpha Vantage timestamp: " + key);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::runtime_error("Malformed Alpha Vantage timestamp: " + key);
    }
    if (fields == 3 || timeframe == domain::Timeframe::OneDay) {
        return core::TimeUtils::utcMsFromCivil(year, month, day);
    }
    const auto utc = core::TimeUtils::newYorkLocalToUtcMs(year, month, day, hour, minute, second);
    return domain::align_down_ms(utc, domain::kMinuteMs);
}

domain::Decimal fieldValue(const boost::json::object& bar, const char* key, const char* fallbackKey = nullptr) {
    const auto* value = bar.if_contains(key);
    if ((value == nullptr || value->is_null()) && fallbackKey != nullptr) {
        value = bar.if_contains(fallbackKey);
    }
    if (value == nullptr || value->is_null()) {
        return domain::Decimal{};
    }
    return mdc::common::json_to_decimal(*value);
}

}  // namespace

std::vector<domain::Candle> parse_time_series(const std::string& body,
                                              const domain::Ticker& ticker,
                                              domain::Timeframe timeframe) {
    const auto json = mdc::common::parse_json(body, "Alpha Vantage");
    if (!json.is_object()) {
        throw std::runtime_error("Unexpected Alpha Vantage response type");
    }
    const auto& root = json.as_object();

    for (const char* throttleKey : {"Note", "Information"}) {
        if (const auto* note = root.if_contains(throttleKey); note != nullptr && note->is_string()) {
            throw domain::ProviderRateLimited(kName, note->as_string().c_str());
        }
    }
    if (const auto* error = root.if_contains("Error Message"); error != nullptr && error->is_string()) {
        throw std::runtime_error(std::string{"Alpha Vantage error: "} + error->as_string().c_str());
    }

    const auto key = seriesKey(timeframe);
    const auto* series = root.if_contains(key);
    if (series == nullptr || !series->is_object()) {
        throw std::runtime_error("Alpha Vantage response missing '" + key + "'");
    }

    std::vector<domain::Candle> candles;
    candles.reserve(series->as_object().size());
    for (const auto& entry : series->as_object()) {
        if (!entry.value().is_object()) {
            throw std::runtime_error("Unexpected Alpha Vantage bar type");
        }
        const auto& bar = entry.value().as_object();

        domain::Candle candle;
        candle.ticker = ticker;
        candle.timeframe = timeframe;
        candle.ts = parseSeriesTimestamp(std::string{entry.key()}, timeframe);
        candle.open = fieldValue(bar, "1. open");
        candle.high = fieldValue(bar, "2. high");
        candle.low = fieldValue(bar, "3. low");
        candle.close = fieldValue(bar, "4. close");
        candle.volume = fieldValue(bar, "5. volume", "6. volume");
        candles.push_back(std::move(candle));
    }
    domain::sort_by_timestamp(candles);
    return candles;
}

AlphaVantageProvider::AlphaVantageProvider(std::string apiKey, int priority, infra::http::HttpTransport transport)
    : apiKey_(std::move(apiKey)),
      descriptor_{kName, priority, {domain::AssetClass::Equity}, 90 * domain::kDayMs},
      transport_(std::move(transport)) {
    if (apiKey_.empty()) {
        throw domain::ConfigError("Alpha Vantage provider requires an API key");
    }
}

std::vector<domain::Candle> AlphaVantageProvider::fetch(const domain::contracts::FetchRequest& request) {
    std::ostringstream target;
    target << "/query?symbol=" << infra::http::url_encode(request.ticker);
    if (request.timeframe == domain::Timeframe::OneDay) {
        target << "&function=TIME_SERIES_DAILY";
    } else {
        target << "&function=TIME_SERIES_INTRADAY&interval=" << intradayInterval(request.timeframe);
    }
    target << "&outputsize=full&apikey=" << infra::http::url_encode(apiKey_);

    infra::http::HttpRequest httpRequest;
    httpRequest.host = kHost;
    httpRequest.target = target.str();
    httpRequest.timeout = request.timeout;
    LOG_DEBUG("Alpha Vantage query for " << request.ticker << ' ' << domain::timeframe_label(request.timeframe));

    const auto response = getChecked(kName, transport_, httpRequest);
    try {
        return clipToRequest(parse_time_series(response.body, request.ticker, request.timeframe), request);
    } catch (const domain::ProviderError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::ProviderTransientError(kName, ex.what());
    }
}

}  // namespace adapters::alphavantage
