#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/json.hpp>

#include "adapters/memory/MemoryCandleStore.hpp"
#include "app/CacheEngine.hpp"
#include "app/CacheWarmer.hpp"
#include "app/JsonReport.hpp"
#include "app/ProviderFactory.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "support/TestSupport.hpp"

using domain::AssetClass;
using domain::Timeframe;
using mdc::common::metrics::Registry;
using testsupport::check;
using testsupport::day;
using testsupport::FakeProvider;

namespace {

infra::http::HttpTransport unusedTransport() {
    return [](const infra::http::HttpRequest&) -> infra::http::HttpResponse {
        throw std::runtime_error("network disabled in tests");
    };
}

std::vector<std::string> names(const std::vector<app::ProviderPtr>& ladder) {
    std::vector<std::string> out;
    for (const auto& provider : ladder) {
        out.push_back(provider->descriptor().name);
    }
    return out;
}

bool providerFactory() {
    bool ok = true;
    mdc::common::Config config;

    const auto withoutKey = app::buildProviderLadder(config, unusedTransport());
    ok &= check((names(withoutKey.forAssetClass(AssetClass::Equity)) == std::vector<std::string>{"yahoo"}),
                "Alpha Vantage skipped without a key");
    ok &= check((names(withoutKey.forAssetClass(AssetClass::Crypto)) == std::vector<std::string>{"binance", "coingecko"}),
                "default crypto ladder");

    config.alphaVantageApiKey = "demo";
    config.equityProviders = {"yahoo", "alphavantage"};
    const auto withKey = app::buildProviderLadder(config, unusedTransport());
    ok &= check((names(withKey.forAssetClass(AssetClass::Equity)) == std::vector<std::string>{"yahoo", "alphavantage"}),
                "list order sets priority");

    config.cryptoProviders = {"coingecko", "yahoo"};
    const auto crossListed = app::buildProviderLadder(config, unusedTransport());
    ok &= check((names(crossListed.forAssetClass(AssetClass::Crypto)) == std::vector<std::string>{"coingecko"}),
                "equity provider never joins the crypto ladder");
    ok &= check(crossListed.providers().size() == 3, "each provider built once");

    config.cryptoProviders = {"bloomberg"};
    try {
        app::buildProviderLadder(config, unusedTransport());
        ok &= check(false, "unknown provider must be rejected");
    } catch (const domain::ConfigError&) {
    }
    return ok;
}

bool cacheWarmer() {
    auto upstream = std::make_shared<FakeProvider>("fake", 0, std::vector<AssetClass>{AssetClass::Equity, AssetClass::Crypto},
                                                   365 * domain::kDayMs, testsupport::servesBars());
    auto store = std::make_shared<adapters::memory::MemoryCandleStore>();
    testsupport::ManualClock clock{day(2024, 2, 1)};
    app::CacheEngine engine{store,
                            std::make_shared<app::FetchOrchestrator>(app::ProviderLadder{{upstream}}),
                            std::make_shared<core::WorkerPool>(2),
                            core::SessionFilter{},
                            core::AssetClassifier{},
                            clock.fn()};

    app::CacheWarmer warmer{engine};
    const auto summary = warmer.run({"aapl", "AAPL", "btc", "BAD$"}, {"1d", "2h", "1d"}, day(2024, 1, 1), day(2024, 1, 5));
    bool ok = check(summary.pairs == 6, "three symbols by two timeframes");
    ok &= check(summary.candles == 10, "five daily candles for each valid symbol");
    ok &= check(summary.failures == 4, "unknown timeframe and bad ticker counted as failures");
    ok &= check(summary.residualGaps == 0, "nothing left missing");
    ok &= check(store->size() == 10, "warmed rows persisted");

    const auto again = warmer.run({"AAPL"}, {"1d"}, day(2024, 1, 1), day(2024, 1, 5));
    ok &= check(again.candles == 5 && upstream->callCount() == 2, "second warm served from cache");
    return ok;
}

bool jsonReport() {
    domain::PriceSeries series;
    series.ticker = "AAPL";
    series.timeframe = Timeframe::OneDay;
    series.start = day(2024, 1, 2);
    series.end = day(2024, 1, 4);
    auto candle = testsupport::makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 2), 1'856'400);
    series.candles.push_back(candle);
    series.residualGaps.push_back({day(2024, 1, 3), day(2024, 1, 4)});

    const auto text = app::serialize_json(app::series_to_json(series));
    const auto parsed = boost::json::parse(text).as_object();
    bool ok = check(parsed.at("ticker").as_string() == "AAPL", "ticker emitted");
    ok &= check(parsed.at("timeframe").as_string() == "1d", "timeframe label emitted");
    ok &= check(!parsed.at("complete").as_bool(), "incomplete series flagged");

    const auto& candles = parsed.at("candles").as_array();
    ok &= check(candles.size() == 1, "one candle emitted");
    if (candles.size() == 1) {
        const auto& row = candles[0].as_object();
        ok &= check(row.at("close").as_string() == "185.6400", "price emitted as exact decimal string");
        ok &= check(row.at("time").as_string() == "2024-01-02T00:00:00Z", "ISO timestamp emitted");
        ok &= check(row.at("ts").as_int64() == day(2024, 1, 2), "epoch milliseconds emitted");
    }
    const auto& gaps = parsed.at("residual_gaps").as_array();
    ok &= check(gaps.size() == 1 && gaps[0].as_object().at("start").as_int64() == day(2024, 1, 3), "gap emitted");

    auto yahoo = std::make_shared<FakeProvider>("yahoo", 1, std::vector<AssetClass>{AssetClass::Equity},
                                                60 * domain::kDayMs, testsupport::servesBars());
    auto binance = std::make_shared<FakeProvider>("binance", 0, std::vector<AssetClass>{AssetClass::Crypto},
                                                  90 * domain::kDayMs, testsupport::servesBars());
    const auto providers = app::providers_to_json(app::ProviderLadder{{yahoo, binance}});
    ok &= check(providers.at("equity").as_array().size() == 1 && providers.at("crypto").as_array().size() == 1,
                "one provider per class");
    ok &= check(providers.at("equity").as_array()[0].as_object().at("max_span_days").as_int64() == 60,
                "max span reported in days");
    return ok;
}

bool metrics() {
    auto& registry = Registry::instance();
    registry.reset();
    registry.incrementCounter("provider.yahoo.calls");
    registry.incrementCounter("provider.yahoo.calls", 2);
    registry.incrementCounter("cache.gaps", 0);
    for (int i = 1; i <= 100; ++i) {
        registry.recordLatency("get_price_data", static_cast<double>(i));
    }
    { Registry::ScopedTimer timer("scoped"); }

    const auto snapshot = registry.snapshot();
    bool ok = check(registry.counter("provider.yahoo.calls") == 3, "counter accumulates");
    ok &= check(snapshot.counters.count("cache.gaps") == 0, "zero increments are not recorded");
    const auto& timer = snapshot.timers.at("get_price_data");
    ok &= check(timer.samples == 100 && timer.maxMs && *timer.maxMs == 100.0, "timer samples and max");
    ok &= check(timer.p95Ms && *timer.p95Ms > 94.0 && *timer.p95Ms < 96.0, "p95 interpolated");
    ok &= check(snapshot.timers.count("scoped") == 1, "scoped timer recorded");

    domain::contracts::StoreStats stats;
    stats.rows = 2;
    stats.minTs = day(2024, 1, 1);
    const auto json = app::stats_to_json(stats, snapshot);
    ok &= check(json.at("store").as_object().at("rows").as_uint64() == 2, "store rows reported");
    ok &= check(json.at("store").as_object().at("max_ts").is_null(), "missing bound is null");
    ok &= check(json.at("counters").as_object().at("provider.yahoo.calls").as_uint64() == 3, "counters reported");
    return ok;
}

}  // namespace

int main() {
    mdc::log::setLevel(mdc::log::Level::Error);
    bool ok = true;
    ok &= providerFactory();
    ok &= cacheWarmer();
    ok &= jsonReport();
    ok &= metrics();
    if (!ok) {
        return 1;
    }
    std::cout << "test_app passed\n";
    return 0;
}
