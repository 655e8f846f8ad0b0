#include "app/JsonReport.hpp"

#include <array>
#include <chrono>

#include <boost/json/serializer.hpp>

#include "core/TimeUtils.h"

namespace app {
namespace {

boost::json::object gap_to_json(const domain::Gap& gap) {
    boost::json::object obj;
    obj["start"] = gap.start;
    obj["end"] = gap.end;
    obj["start_iso"] = core::TimeUtils::formatIsoUtc(gap.start);
    obj["end_iso"] = core::TimeUtils::formatIsoUtc(gap.end);
    return obj;
}

boost::json::array ladder_to_json(const std::vector<ProviderPtr>& ladder) {
    boost::json::array out;
    for (const auto& provider : ladder) {
        const auto& descriptor = provider->descriptor();
        boost::json::object entry;
        entry["name"] = descriptor.name;
        entry["priority"] = descriptor.priority;
        entry["max_span_days"] = descriptor.maxSpanMs / domain::kDayMs;
        out.push_back(std::move(entry));
    }
    return out;
}

}  // namespace

boost::json::object series_to_json(const domain::PriceSeries& series) {
    boost::json::object obj;
    obj["ticker"] = series.ticker;
    obj["timeframe"] = domain::timeframe_label(series.timeframe);
    obj["start"] = series.start;
    obj["end"] = series.end;
    obj["complete"] = series.complete();

    boost::json::array candles;
    candles.reserve(series.candles.size());
    for (const auto& candle : series.candles) {
        boost::json::object row;
        row["ts"] = candle.ts;
        row["time"] = core::TimeUtils::formatIsoUtc(candle.ts);
        row["open"] = candle.open.toString();
        row["high"] = candle.high.toString();
        row["low"] = candle.low.toString();
        row["close"] = candle.close.toString();
        row["volume"] = candle.volume.toString();
        candles.push_back(std::move(row));
    }
    obj["candles"] = std::move(candles);

    boost::json::array gaps;
    for (const auto& gap : series.residualGaps) {
        gaps.push_back(gap_to_json(gap));
    }
    obj["residual_gaps"] = std::move(gaps);
    return obj;
}

boost::json::object providers_to_json(const ProviderLadder& ladder) {
    boost::json::object obj;
    obj["equity"] = ladder_to_json(ladder.forAssetClass(domain::AssetClass::Equity));
    obj["crypto"] = ladder_to_json(ladder.forAssetClass(domain::AssetClass::Crypto));
    return obj;
}

boost::json::object stats_to_json(const domain::contracts::StoreStats& stats,
                                  const mdc::common::metrics::Registry::Snapshot& metrics) {
    boost::json::object store;
    store["rows"] = stats.rows;
    store["min_ts"] = stats.minTs ? boost::json::value(*stats.minTs) : boost::json::value(nullptr);
    store["max_ts"] = stats.maxTs ? boost::json::value(*stats.maxTs) : boost::json::value(nullptr);

    boost::json::object counters;
    for (const auto& [key, value] : metrics.counters) {
        counters[key] = value;
    }

    boost::json::object timers;
    for (const auto& [key, timer] : metrics.timers) {
        boost::json::object entry;
        entry["samples"] = timer.samples;
        if (timer.p95Ms) {
            entry["p95_ms"] = *timer.p95Ms;
        }
        if (timer.p99Ms) {
            entry["p99_ms"] = *timer.p99Ms;
        }
        if (timer.maxMs) {
            entry["max_ms"] = *timer.maxMs;
        }
        timers[key] = std::move(entry);
    }

    boost::json::object obj;
    obj["store"] = std::move(store);
    obj["counters"] = std::move(counters);
    obj["timers"] = std::move(timers);
    obj["uptime_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(metrics.capturedAt - metrics.startTime)
                           .count();
    return obj;
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};
    while (!sr.done()) {
        const auto chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }
    return result;
}

}  // namespace app
