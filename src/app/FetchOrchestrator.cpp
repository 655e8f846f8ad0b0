#include "app/FetchOrchestrator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"
#include "domain/Errors.hpp"

namespace app {
namespace {

using mdc::common::metrics::Registry;

constexpr std::chrono::milliseconds kBaseTimeout{5'000};
constexpr std::chrono::milliseconds kMaxTimeout{60'000};

std::string describe(const domain::Gap& chunk) {
    return core::TimeUtils::formatIsoUtc(chunk.start) + ".." + core::TimeUtils::formatIsoUtc(chunk.end);
}

}  // namespace

FetchOrchestrator::FetchOrchestrator(ProviderLadder ladder) : FetchOrchestrator(std::move(ladder), Options{}) {}

FetchOrchestrator::FetchOrchestrator(ProviderLadder ladder, Options options)
    : ladder_(std::move(ladder)), options_(options) {
    if (options_.chunkLimitMs <= 0) {
        throw domain::ConfigError("Chunk limit must be positive");
    }
    for (const auto& provider : ladder_.providers()) {
        providerMutexes_.emplace(provider.get(), std::make_unique<std::mutex>());
    }
}

domain::TimestampMs FetchOrchestrator::chunkSizeFor(domain::AssetClass assetClass) const {
    auto size = options_.chunkLimitMs;
    for (const auto& provider : ladder_.forAssetClass(assetClass)) {
        const auto span = provider->descriptor().maxSpanMs;
        if (span > 0) {
            size = std::min(size, span);
        }
    }
    return size;
}

std::vector<domain::Gap> FetchOrchestrator::splitIntoChunks(const domain::Gap& gap, domain::TimestampMs chunkMs) {
    std::vector<domain::Gap> chunks;
    if (gap.start > gap.end || chunkMs <= 0) {
        return chunks;
    }
    auto cursor = gap.start;
    while (true) {
        const auto chunkEnd = gap.end - cursor < chunkMs ? gap.end : cursor + chunkMs - 1;
        chunks.push_back({cursor, chunkEnd});
        if (chunkEnd >= gap.end) {
            break;
        }
        cursor = chunkEnd + 1;
    }
    return chunks;
}

std::chrono::milliseconds FetchOrchestrator::timeoutFor(domain::TimestampMs spanMs) {
    const auto extra = std::chrono::seconds(std::max<domain::TimestampMs>(spanMs, 0) / (10 * domain::kDayMs));
    return std::min<std::chrono::milliseconds>(kBaseTimeout + extra, kMaxTimeout);
}

bool FetchOrchestrator::tryProvider(const ProviderPtr& provider,
                                    const domain::Ticker& ticker,
                                    domain::Timeframe timeframe,
                                    const domain::Gap& chunk,
                                    std::vector<domain::Candle>& out) {
    const auto& name = provider->descriptor().name;
    auto& registry = Registry::instance();
    registry.incrementCounter("provider." + name + ".calls");

    domain::contracts::FetchRequest request;
    request.ticker = ticker;
    request.timeframe = timeframe;
    request.start = chunk.start;
    request.end = chunk.end;
    request.timeout = timeoutFor(chunk.span());

    std::vector<domain::Candle> candles;
    try {
        std::lock_guard<std::mutex> lock(*providerMutexes_.at(provider.get()));
        candles = provider->fetch(request);
    } catch (const domain::ProviderRateLimited& ex) {
        registry.incrementCounter("provider." + name + ".rate_limited");
        LOG_WARN("Provider " << name << " rate limited for " << ticker << ' ' << describe(chunk) << ": "
                             << ex.what());
        return false;
    } catch (const std::exception& ex) {
        registry.incrementCounter("provider." + name + ".failures");
        LOG_WARN("Provider " << name << " failed for " << ticker << ' ' << describe(chunk) << ": " << ex.what());
        return false;
    }

    candles.erase(std::remove_if(candles.begin(), candles.end(),
                                 [&chunk](const domain::Candle& candle) {
                                     return candle.ts < chunk.start || candle.ts > chunk.end;
                                 }),
                  candles.end());
    if (candles.empty()) {
        registry.incrementCounter("provider." + name + ".failures");
        LOG_WARN("Provider " << name << " returned no data for " << ticker << ' ' << describe(chunk));
        return false;
    }

    for (auto& candle : candles) {
        candle.ticker = ticker;
        candle.timeframe = timeframe;
    }
    LOG_DEBUG("Provider " << name << " returned " << candles.size() << " candles for " << ticker << ' '
                          << describe(chunk));
    out.insert(out.end(), std::make_move_iterator(candles.begin()), std::make_move_iterator(candles.end()));
    return true;
}

FetchOutcome FetchOrchestrator::fetchGap(const domain::Ticker& ticker,
                                         domain::Timeframe timeframe,
                                         const domain::Gap& gap,
                                         domain::AssetClass assetClass) {
    FetchOutcome outcome;
    const auto ladder = ladder_.forAssetClass(assetClass);
    if (ladder.empty()) {
        LOG_WARN("No provider configured for " << domain::asset_class_label(assetClass) << " ticker " << ticker);
        Registry::instance().incrementCounter("ladder.residual_chunks");
        outcome.residualGaps.push_back(gap);
        return outcome;
    }

    for (const auto& chunk : splitIntoChunks(gap, chunkSizeFor(assetClass))) {
        bool filled = false;
        for (const auto& provider : ladder) {
            if (tryProvider(provider, ticker, timeframe, chunk, outcome.candles)) {
                filled = true;
                break;
            }
        }
        if (!filled) {
            LOG_WARN("All providers failed for " << ticker << ' ' << domain::timeframe_label(timeframe) << ' '
                                                 << describe(chunk) << "; leaving residual gap");
            Registry::instance().incrementCounter("ladder.residual_chunks");
            outcome.residualGaps.push_back(chunk);
        }
    }
    return outcome;
}

}  // namespace app
