#include "app/CacheEngine.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/GapDetector.h"
#include "core/Merger.h"
#include "core/TimeUtils.h"
#include "domain/Errors.hpp"

namespace app {
namespace {

using mdc::common::metrics::Registry;

constexpr std::size_t kMaxTickerLength = 20;

bool isTickerChar(char ch) {
    return std::isupper(static_cast<unsigned char>(ch)) != 0 || std::isdigit(static_cast<unsigned char>(ch)) != 0 ||
           ch == '.' || ch == '-' || ch == '/' || ch == '=' || ch == '^';
}

std::vector<domain::CacheRecord> toRecords(const std::vector<domain::Candle>& candles, domain::TimestampMs now) {
    std::vector<domain::CacheRecord> records;
    records.reserve(candles.size());
    for (const auto& candle : candles) {
        records.push_back({candle, now});
    }
    return records;
}

}  // namespace

CacheEngine::CacheEngine(std::shared_ptr<domain::contracts::ICandleStore> store,
                         std::shared_ptr<FetchOrchestrator> orchestrator,
                         std::shared_ptr<core::WorkerPool> pool,
                         core::SessionFilter sessionFilter,
                         core::AssetClassifier classifier,
                         Clock clock)
    : store_(std::move(store)),
      orchestrator_(std::move(orchestrator)),
      pool_(std::move(pool)),
      sessionFilter_(sessionFilter),
      classifier_(std::move(classifier)),
      clock_(clock ? std::move(clock) : Clock{&core::TimeUtils::nowMs}) {
    if (!store_ || !orchestrator_ || !pool_) {
        throw std::invalid_argument("CacheEngine requires a store, an orchestrator and a worker pool");
    }
}

domain::Ticker CacheEngine::normalizeTicker(const std::string& ticker) {
    std::string normalized;
    normalized.reserve(ticker.size());
    for (const char ch : ticker) {
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    }
    const auto notSpace = [](unsigned char ch) { return std::isspace(ch) == 0; };
    normalized.erase(normalized.begin(), std::find_if(normalized.begin(), normalized.end(), notSpace));
    normalized.erase(std::find_if(normalized.rbegin(), normalized.rend(), notSpace).base(), normalized.end());

    if (normalized.empty() || normalized.size() > kMaxTickerLength ||
        !std::all_of(normalized.begin(), normalized.end(), isTickerChar)) {
        throw domain::ConfigError("Invalid ticker: '" + ticker + "'");
    }
    return normalized;
}

std::string CacheEngine::flightKey(const domain::Ticker& ticker,
                                   domain::Timeframe timeframe,
                                   const domain::Gap& gap) const {
    return ticker + '|' + domain::timeframe_label(timeframe) + '|' + std::to_string(gap.start) + '|' +
           std::to_string(gap.end);
}

domain::PriceSeries CacheEngine::getPriceData(const std::string& ticker,
                                              domain::Timeframe timeframe,
                                              std::optional<domain::TimestampMs> start,
                                              std::optional<domain::TimestampMs> end) {
    const auto resolvedEnd = end.value_or(clock_());
    const auto resolvedStart = start.value_or(resolvedEnd - kDefaultLookbackMs);
    return getPriceData(ticker, timeframe, resolvedStart, resolvedEnd);
}

domain::PriceSeries CacheEngine::getPriceData(const std::string& ticker,
                                              domain::Timeframe timeframe,
                                              domain::TimestampMs start,
                                              domain::TimestampMs end) {
    const auto normalized = normalizeTicker(ticker);
    if (start > end) {
        throw domain::ConfigError("Invalid range: start " + std::to_string(start) + " is after end " +
                                  std::to_string(end));
    }

    Registry::ScopedTimer timer("get_price_data");
    auto& registry = Registry::instance();
    const auto now = clock_();
    const auto label = domain::timeframe_label(timeframe);

    domain::PriceSeries series;
    series.ticker = normalized;
    series.timeframe = timeframe;
    series.start = start;
    series.end = end;

    std::vector<domain::Candle> fresh;
    try {
        fresh = store_->readFresh(normalized, timeframe, start, end, now);
    } catch (const std::exception& ex) {
        LOG_WARN("Cache read failed for " << normalized << ' ' << label << ", treating as empty: " << ex.what());
        fresh.clear();
    }
    registry.incrementCounter("cache.fresh_rows", fresh.size());

    const auto assetClass = classifier_.classify(normalized);
    auto gaps = core::detectGaps(start, end, fresh, domain::interval_ms(timeframe));
    if (assetClass == domain::AssetClass::Equity && !gaps.empty()) {
        const auto detected = gaps.size();
        gaps.erase(std::remove_if(gaps.begin(), gaps.end(),
                                  [this, timeframe](const domain::Gap& gap) {
                                      return !sessionFilter_.hasSessionTime(gap, timeframe);
                                  }),
                   gaps.end());
        if (gaps.size() != detected) {
            registry.incrementCounter("cache.closed_market_gaps", detected - gaps.size());
            LOG_DEBUG("Skipped " << detected - gaps.size() << " closed-market gap(s) for " << normalized << ' '
                                 << label);
        }
    }
    if (gaps.empty()) {
        LOG_DEBUG("Cache hit for " << normalized << ' ' << label << ": " << fresh.size() << " candles");
        series.candles = std::move(fresh);
        return series;
    }
    registry.incrementCounter("cache.gaps", gaps.size());

    LOG_INFO("Fetching " << gaps.size() << " gap(s) for " << normalized << ' ' << label << " ("
                         << domain::asset_class_label(assetClass) << "), " << fresh.size() << " fresh candles cached");

    std::vector<std::pair<domain::Gap, std::future<FetchOutcome>>> pending;
    pending.reserve(gaps.size());
    for (const auto& gap : gaps) {
        auto key = flightKey(normalized, timeframe, gap);
        pending.emplace_back(gap, pool_->submit([this, key = std::move(key), normalized, timeframe, gap, assetClass]() {
            bool shared = false;
            auto outcome = flights_.run(key, [&]() {
                return orchestrator_->fetchGap(normalized, timeframe, gap, assetClass);
            }, &shared);
            if (shared) {
                Registry::instance().incrementCounter("singleflight.shared");
            }
            return outcome;
        }));
    }

    std::vector<domain::Candle> fetched;
    for (auto& [gap, future] : pending) {
        try {
            auto outcome = future.get();
            fetched.insert(fetched.end(), std::make_move_iterator(outcome.candles.begin()),
                           std::make_move_iterator(outcome.candles.end()));
            series.residualGaps.insert(series.residualGaps.end(), outcome.residualGaps.begin(),
                                       outcome.residualGaps.end());
        } catch (const std::exception& ex) {
            LOG_ERR("Gap fetch aborted for " << normalized << ' ' << label << ": " << ex.what());
            series.residualGaps.push_back(gap);
        }
    }

    auto filtered = sessionFilter_.apply(std::move(fetched), assetClass);
    series.candles = core::mergeCandles(fresh, filtered, start, end);

    if (!filtered.empty()) {
        try {
            store_->upsert(toRecords(filtered, now));
        } catch (const std::exception& ex) {
            registry.incrementCounter("store.write_failures");
            LOG_WARN("Cache write-back failed for " << normalized << ' ' << label << ": " << ex.what());
        }
    }

    std::sort(series.residualGaps.begin(), series.residualGaps.end(),
              [](const domain::Gap& lhs, const domain::Gap& rhs) { return lhs.start < rhs.start; });

    LOG_INFO("Served " << series.candles.size() << " candles for " << normalized << ' ' << label << " with "
                       << series.residualGaps.size() << " residual gap(s)");
    return series;
}

}  // namespace app
