#include "adapters/binance/BinanceProvider.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/ProviderSupport.hpp"
#include "adapters/binance/IntervalMap.hpp"
#include "common/JsonUtils.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::binance {

namespace {
constexpr const char* kName = "binance";
constexpr const char* kHost = "api.binance.com";
}

std::vector<domain::Candle> parse_klines(const std::string& body,
                                         const domain::Ticker& ticker,
                                         domain::Timeframe timeframe) {
    const auto json = mdc::common::parse_json(body, "Binance");
    if (json.is_object()) {
        const auto& obj = json.as_object();
        std::string message = "Unexpected Binance response object";
        if (const auto* msg = obj.if_contains("msg"); msg != nullptr && msg->is_string()) {
            message = "Binance error: " + std::string{msg->as_string().c_str()};
        }
        throw std::runtime_error(message);
    }
    if (!json.is_array()) {
        throw std::runtime_error("Unexpected Binance response type (expected array)");
    }

    std::vector<domain::Candle> candles;
    candles.reserve(json.as_array().size());
    for (const auto& rowValue : json.as_array()) {
        if (!rowValue.is_array()) {
            throw std::runtime_error("Unexpected Binance kline row type");
        }
        const auto& row = rowValue.as_array();
        if (row.size() < 6) {
            throw std::runtime_error("Incomplete Binance kline row");
        }

        domain::Candle candle;
        candle.ticker = ticker;
        candle.timeframe = timeframe;
        candle.ts = domain::align_down_ms(mdc::common::json_to_int64(row.at(0)), domain::interval_ms(timeframe));
        candle.open = mdc::common::json_to_decimal(row.at(1));
        candle.high = mdc::common::json_to_decimal(row.at(2));
        candle.low = mdc::common::json_to_decimal(row.at(3));
        candle.close = mdc::common::json_to_decimal(row.at(4));
        candle.volume = mdc::common::json_to_decimal(row.at(5));
        candles.push_back(std::move(candle));
    }
    return candles;
}

BinanceProvider::BinanceProvider(int priority, infra::http::HttpTransport transport)
    : descriptor_{kName, priority, {domain::AssetClass::Crypto}, 90 * domain::kDayMs},
      transport_(std::move(transport)) {}

std::vector<domain::Candle> BinanceProvider::fetch(const domain::contracts::FetchRequest& request) {
    const std::string symbol = binance_symbol(request.ticker);
    const std::string intervalLiteral = binance_interval(request.timeframe);
    const auto intervalMs = domain::interval_ms(request.timeframe);

    std::vector<domain::Candle> candles;
    auto currentStart = request.start;
    while (currentStart <= request.end) {
        std::ostringstream target;
        target << "/api/v3/klines?symbol=" << symbol << "&interval=" << intervalLiteral
               << "&startTime=" << currentStart << "&endTime=" << request.end << "&limit=" << kMaxLimit;

        infra::http::HttpRequest httpRequest;
        httpRequest.host = kHost;
        httpRequest.target = target.str();
        httpRequest.timeout = request.timeout;
        LOG_DEBUG("Binance REST " << httpRequest.target);

        const auto response = getChecked(kName, transport_, httpRequest);
        std::vector<domain::Candle> page;
        try {
            page = parse_klines(response.body, request.ticker, request.timeframe);
        } catch (const std::exception& ex) {
            throw domain::ProviderTransientError(kName, ex.what());
        }
        if (page.empty()) {
            break;
        }

        const auto lastTs = page.back().ts;
        const bool fullPage = page.size() >= kMaxLimit;
        candles.insert(candles.end(), std::make_move_iterator(page.begin()), std::make_move_iterator(page.end()));
        if (!fullPage || lastTs + intervalMs <= currentStart) {
            break;
        }
        currentStart = lastTs + intervalMs;
    }

    return clipToRequest(std::move(candles), request);
}

}  // namespace adapters::binance
