#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "app/FetchOrchestrator.hpp"
#include "core/AssetClassifier.h"
#include "core/SessionFilter.h"
#include "core/SingleFlight.h"
#include "core/WorkerPool.h"
#include "domain/Ports.hpp"

namespace app {

// Read-through cache over the candle store. Serves fresh cached rows, fills
// the holes from the provider ladder and writes fetched rows back.
class CacheEngine {
public:
    using Clock = std::function<domain::TimestampMs()>;

    static constexpr domain::TimestampMs kDefaultLookbackMs = 365 * domain::kDayMs;

    CacheEngine(std::shared_ptr<domain::contracts::ICandleStore> store,
                std::shared_ptr<FetchOrchestrator> orchestrator,
                std::shared_ptr<core::WorkerPool> pool,
                core::SessionFilter sessionFilter = {},
                core::AssetClassifier classifier = {},
                Clock clock = {});

    // Only ConfigError escapes; provider and storage failures degrade into
    // residual gaps or a skipped write-back.
    domain::PriceSeries getPriceData(const std::string& ticker,
                                     domain::Timeframe timeframe,
                                     domain::TimestampMs start,
                                     domain::TimestampMs end);

    // end defaults to now, start to end minus one year.
    domain::PriceSeries getPriceData(const std::string& ticker,
                                     domain::Timeframe timeframe,
                                     std::optional<domain::TimestampMs> start,
                                     std::optional<domain::TimestampMs> end);

    // Trimmed, upper-cased, [A-Z0-9.-/=^]{1,20}. @throws ConfigError
    static domain::Ticker normalizeTicker(const std::string& ticker);

    const core::AssetClassifier& classifier() const noexcept { return classifier_; }
    domain::contracts::ICandleStore& store() const noexcept { return *store_; }

private:
    std::string flightKey(const domain::Ticker& ticker, domain::Timeframe timeframe, const domain::Gap& gap) const;

    std::shared_ptr<domain::contracts::ICandleStore> store_;
    std::shared_ptr<FetchOrchestrator> orchestrator_;
    std::shared_ptr<core::WorkerPool> pool_;
    core::SessionFilter sessionFilter_;
    core::AssetClassifier classifier_;
    Clock clock_;
    core::SingleFlight<FetchOutcome> flights_;
};

}  // namespace app
