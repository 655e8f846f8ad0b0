#include "adapters/yahoo/YahooProvider.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "adapters/ProviderSupport.hpp"
#include "common/JsonUtils.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"
#include "domain/Errors.hpp"

namespace adapters::yahoo {
namespace {

constexpr const char* kName = "yahoo";
constexpr const char* kHost = "query1.finance.yahoo.com";

const boost::json::array* arrayField(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    return value != nullptr && value->is_array() ? &value->as_array() : nullptr;
}

bool numericAt(const boost::json::array* values, std::size_t index) {
    return values != nullptr && index < values->size() && !(*values)[index].is_null();
}

domain::TimestampMs barTimestamp(std::int64_t epochSeconds, domain::Timeframe timeframe) {
    const auto utcMs = epochSeconds * domain::kSecondMs;
    if (timeframe == domain::Timeframe::OneDay) {
        const auto local = core::TimeUtils::newYorkCivil(utcMs);
        return core::TimeUtils::utcMsFromCivil(local.year, local.month, local.day);
    }
    // Equity hourly bars open on the half hour; keep the provider's open time.
    return domain::align_down_ms(utcMs, domain::kMinuteMs);
}

}  // namespace

std::string yahoo_interval(domain::Timeframe timeframe) {
    switch (timeframe) {
    case domain::Timeframe::OneMinute:
        return "1m";
    case domain::Timeframe::FiveMinutes:
        return "5m";
    case domain::Timeframe::FifteenMinutes:
        return "15m";
    case domain::Timeframe::OneHour:
        return "60m";
    case domain::Timeframe::OneDay:
        return "1d";
    }
    return "1d";
}

std::string yahoo_symbol(const domain::Ticker& ticker) {
    std::string symbol = ticker;
    for (auto& ch : symbol) {
        if (ch == '.') {
            ch = '-';
        }
    }
    return symbol;
}

std::vector<domain::Candle> parse_chart(const std::string& body,
                                        const domain::Ticker& ticker,
                                        domain::Timeframe timeframe) {
    const auto json = mdc::common::parse_json(body, "Yahoo chart");
    if (!json.is_object()) {
        throw std::runtime_error("Unexpected Yahoo chart response type");
    }
    const auto* chartValue = json.as_object().if_contains("chart");
    if (chartValue == nullptr || !chartValue->is_object()) {
        throw std::runtime_error("Yahoo chart response missing 'chart'");
    }
    const auto& chart = chartValue->as_object();

    if (const auto* error = chart.if_contains("error"); error != nullptr && !error->is_null()) {
        std::string description = "unknown error";
        if (error->is_object()) {
            if (const auto* text = error->as_object().if_contains("description"); text != nullptr && text->is_string()) {
                description = text->as_string().c_str();
            }
        }
        throw std::runtime_error("Yahoo chart error: " + description);
    }

    const auto* results = arrayField(chart, "result");
    if (results == nullptr || results->empty() || !(*results)[0].is_object()) {
        throw std::runtime_error("Yahoo chart response missing result");
    }
    const auto& result = (*results)[0].as_object();

    std::vector<domain::Candle> candles;
    const auto* timestamps = arrayField(result, "timestamp");
    if (timestamps == nullptr) {
        // No bars in the window.
        return candles;
    }

    const auto* indicators = result.if_contains("indicators");
    if (indicators == nullptr || !indicators->is_object()) {
        throw std::runtime_error("Yahoo chart response missing indicators");
    }
    const auto* quotes = arrayField(indicators->as_object(), "quote");
    if (quotes == nullptr || quotes->empty() || !(*quotes)[0].is_object()) {
        throw std::runtime_error("Yahoo chart response missing quote block");
    }
    const auto& quote = (*quotes)[0].as_object();
    const auto* opens = arrayField(quote, "open");
    const auto* highs = arrayField(quote, "high");
    const auto* lows = arrayField(quote, "low");
    const auto* closes = arrayField(quote, "close");
    const auto* volumes = arrayField(quote, "volume");

    candles.reserve(timestamps->size());
    for (std::size_t i = 0; i < timestamps->size(); ++i) {
        if (!numericAt(opens, i) || !numericAt(highs, i) || !numericAt(lows, i) || !numericAt(closes, i)) {
            continue;
        }
        domain::Candle candle;
        candle.ticker = ticker;
        candle.timeframe = timeframe;
        candle.ts = barTimestamp(mdc::common::json_to_int64((*timestamps)[i]), timeframe);
        candle.open = mdc::common::json_to_decimal((*opens)[i]);
        candle.high = mdc::common::json_to_decimal((*highs)[i]);
        candle.low = mdc::common::json_to_decimal((*lows)[i]);
        candle.close = mdc::common::json_to_decimal((*closes)[i]);
        if (numericAt(volumes, i)) {
            candle.volume = mdc::common::json_to_decimal((*volumes)[i]);
        }
        candles.push_back(std::move(candle));
    }
    return candles;
}

YahooProvider::YahooProvider(int priority, infra::http::HttpTransport transport)
    : descriptor_{kName, priority, {domain::AssetClass::Equity}, 60 * domain::kDayMs},
      transport_(std::move(transport)) {}

std::vector<domain::Candle> YahooProvider::fetch(const domain::contracts::FetchRequest& request) {
    // period2 is exclusive upstream.
    const auto period1 = request.start / domain::kSecondMs;
    const auto period2 = request.end / domain::kSecondMs + 1;

    std::ostringstream target;
    target << "/v8/finance/chart/" << infra::http::url_encode(yahoo_symbol(request.ticker))
           << "?period1=" << period1 << "&period2=" << period2
           << "&interval=" << yahoo_interval(request.timeframe) << "&includePrePost=false&events=history";

    infra::http::HttpRequest httpRequest;
    httpRequest.host = kHost;
    httpRequest.target = target.str();
    httpRequest.timeout = request.timeout;
    LOG_DEBUG("Yahoo chart " << httpRequest.target);

    const auto response = getChecked(kName, transport_, httpRequest);
    try {
        return clipToRequest(parse_chart(response.body, request.ticker, request.timeframe), request);
    } catch (const std::exception& ex) {
        throw domain::ProviderTransientError(kName, ex.what());
    }
}

}  // namespace adapters::yahoo
