#include "app/CacheWarmer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "app/CacheEngine.hpp"
#include "common/Log.hpp"
#include "core/TimeUtils.h"

namespace app {
namespace {

std::vector<std::string> deduplicateList(std::vector<std::string> values) {
    std::vector<std::string> unique;
    unique.reserve(values.size());
    for (auto& value : values) {
        if (value.empty()) {
            continue;
        }
        if (std::find(unique.begin(), unique.end(), value) == unique.end()) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

}  // namespace

CacheWarmer::CacheWarmer(CacheEngine& engine) : engine_(engine) {}

WarmSummary CacheWarmer::run(const std::vector<std::string>& symbols,
                             const std::vector<std::string>& timeframes,
                             domain::TimestampMs from,
                             domain::TimestampMs to) {
    std::vector<std::string> upperSymbols;
    upperSymbols.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        upperSymbols.push_back(toUpper(symbol));
    }
    const auto uniqueSymbols = deduplicateList(std::move(upperSymbols));
    const auto uniqueTimeframes = deduplicateList(timeframes);

    WarmSummary summary;
    const auto total = uniqueSymbols.size() * uniqueTimeframes.size();
    LOG_INFO("CacheWarmer: warming " << total << " pair(s) from " << core::TimeUtils::formatIsoUtc(from) << " to "
                                     << core::TimeUtils::formatIsoUtc(to));

    for (const auto& symbol : uniqueSymbols) {
        for (const auto& timeframeLabel : uniqueTimeframes) {
            ++summary.pairs;
            const auto timeframe = domain::timeframe_from_label(timeframeLabel);
            if (!timeframe) {
                ++summary.failures;
                LOG_WARN("CacheWarmer: unknown timeframe '" << timeframeLabel << "', skipping " << symbol);
                continue;
            }

            try {
                const auto series = engine_.getPriceData(symbol, *timeframe, from, to);
                summary.candles += series.candles.size();
                summary.residualGaps += series.residualGaps.size();
                LOG_INFO("CacheWarmer: [" << summary.pairs << '/' << total << "] " << series.ticker << ' '
                                          << domain::timeframe_label(*timeframe) << " candles="
                                          << series.candles.size() << " residual_gaps=" << series.residualGaps.size());
                for (const auto& gap : series.residualGaps) {
                    LOG_WARN("CacheWarmer: " << series.ticker << ' ' << domain::timeframe_label(*timeframe)
                                             << " still missing " << core::TimeUtils::formatIsoUtc(gap.start) << ".."
                                             << core::TimeUtils::formatIsoUtc(gap.end));
                }
            } catch (const std::exception& ex) {
                ++summary.failures;
                LOG_ERR("CacheWarmer: " << symbol << ' ' << timeframeLabel << " failed: " << ex.what());
            }
        }
    }

    LOG_INFO("CacheWarmer: done pairs=" << summary.pairs << " candles=" << summary.candles
                                        << " residual_gaps=" << summary.residualGaps
                                        << " failures=" << summary.failures);
    return summary;
}

}  // namespace app
