#include "adapters/coingecko/CoinGeckoProvider.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <boost/json.hpp>

#include "adapters/ProviderSupport.hpp"
#include "common/JsonUtils.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::coingecko {
namespace {

constexpr const char* kName = "coingecko";
constexpr const char* kHost = "api.coingecko.com";

const std::unordered_map<std::string, std::string>& coinIds() {
    static const std::unordered_map<std::string, std::string> ids{
        {"BTC", "bitcoin"},   {"ETH", "ethereum"}, {"USDT", "tether"},  {"USDC", "usd-coin"},
        {"BNB", "binancecoin"}, {"ADA", "cardano"}, {"SOL", "solana"},   {"XRP", "ripple"},
        {"DOT", "polkadot"},  {"DOGE", "dogecoin"},
    };
    return ids;
}

std::string baseSymbol(const domain::Ticker& ticker) {
    std::string symbol;
    for (const char ch : ticker) {
        if (ch == '-' || ch == '/' || ch == '_') {
            break;
        }
        symbol.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    if (coinIds().count(symbol) != 0) {
        return symbol;
    }
    for (const char* quote : {"USDT", "USDC", "USD"}) {
        const std::string suffix{quote};
        if (symbol.size() > suffix.size() &&
            symbol.compare(symbol.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return symbol.substr(0, symbol.size() - suffix.size());
        }
    }
    return symbol;
}

struct Bucket {
    domain::Decimal open;
    domain::Decimal high;
    domain::Decimal low;
    domain::Decimal close;
};

}  // namespace

std::string coin_id(const domain::Ticker& ticker) {
    const auto base = baseSymbol(ticker);
    if (const auto it = coinIds().find(base); it != coinIds().end()) {
        return it->second;
    }
    std::string lower = base;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::vector<domain::Candle> parse_market_chart(const std::string& body,
                                               const domain::Ticker& ticker,
                                               domain::Timeframe timeframe) {
    const auto json = mdc::common::parse_json(body, "CoinGecko");
    if (!json.is_object()) {
        throw std::runtime_error("Unexpected CoinGecko response type");
    }
    const auto& root = json.as_object();
    if (const auto* error = root.if_contains("error"); error != nullptr && !error->is_null()) {
        throw std::runtime_error("CoinGecko error: " + boost::json::serialize(*error));
    }
    const auto* prices = root.if_contains("prices");
    if (prices == nullptr || !prices->is_array()) {
        throw std::runtime_error("CoinGecko response missing 'prices'");
    }

    const auto step = domain::interval_ms(timeframe);
    // Points arrive in time order; ordered map keeps that per bucket.
    std::map<domain::TimestampMs, Bucket> buckets;
    for (const auto& pointValue : prices->as_array()) {
        if (!pointValue.is_array() || pointValue.as_array().size() < 2) {
            throw std::runtime_error("Unexpected CoinGecko price point");
        }
        const auto& point = pointValue.as_array();
        if (point[1].is_null()) {
            continue;
        }
        const auto ts = domain::align_down_ms(mdc::common::json_to_int64(point[0]), step);
        const auto price = mdc::common::json_to_decimal(point[1]);

        auto [it, inserted] = buckets.try_emplace(ts, Bucket{price, price, price, price});
        if (!inserted) {
            auto& bucket = it->second;
            bucket.high = std::max(bucket.high, price);
            bucket.low = std::min(bucket.low, price);
            bucket.close = price;
        }
    }

    std::vector<domain::Candle> candles;
    candles.reserve(buckets.size());
    for (const auto& [ts, bucket] : buckets) {
        domain::Candle candle;
        candle.ticker = ticker;
        candle.timeframe = timeframe;
        candle.ts = ts;
        candle.open = bucket.open;
        candle.high = bucket.high;
        candle.low = bucket.low;
        candle.close = bucket.close;
        candles.push_back(std::move(candle));
    }
    return candles;
}

CoinGeckoProvider::CoinGeckoProvider(std::string apiKey, int priority, infra::http::HttpTransport transport)
    : apiKey_(std::move(apiKey)),
      descriptor_{kName, priority, {domain::AssetClass::Crypto}, 365 * domain::kDayMs},
      transport_(std::move(transport)) {}

std::vector<domain::Candle> CoinGeckoProvider::fetch(const domain::contracts::FetchRequest& request) {
    std::ostringstream target;
    target << "/api/v3/coins/" << infra::http::url_encode(coin_id(request.ticker))
           << "/market_chart/range?vs_currency=usd&from=" << request.start / domain::kSecondMs
           << "&to=" << request.end / domain::kSecondMs + 1;

    infra::http::HttpRequest httpRequest;
    httpRequest.host = kHost;
    httpRequest.target = target.str();
    httpRequest.timeout = request.timeout;
    if (!apiKey_.empty()) {
        httpRequest.headers.emplace_back("x-cg-demo-api-key", apiKey_);
    }
    LOG_DEBUG("CoinGecko " << httpRequest.target);

    const auto response = getChecked(kName, transport_, httpRequest);
    try {
        return clipToRequest(parse_market_chart(response.body, request.ticker, request.timeframe), request);
    } catch (const std::exception& ex) {
        throw domain::ProviderTransientError(kName, ex.what());
    }
}

}  // namespace adapters::coingecko
