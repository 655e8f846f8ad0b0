#include <iostream>
#include <vector>

#include "core/AssetClassifier.h"
#include "core/Merger.h"
#include "support/TestSupport.hpp"

using domain::AssetClass;
using domain::Timeframe;
using testsupport::bars;
using testsupport::check;
using testsupport::day;
using testsupport::makeCandle;

namespace {

bool fetchedWinsAndSorted() {
    const std::vector<domain::Candle> cached{
        makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 3), 1'000'000),
        makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 4), 1'000'000),
    };
    const std::vector<domain::Candle> fetched{
        makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 5), 2'000'000),
        makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 4), 3'000'000),
        makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 2), 2'000'000),
    };
    const auto merged = core::mergeCandles(cached, fetched, day(2024, 1, 1), day(2024, 1, 10));

    bool ok = check(merged.size() == 4, "union without duplicates");
    for (std::size_t i = 1; i < merged.size(); ++i) {
        ok &= check(merged[i - 1].ts < merged[i].ts, "strictly ascending");
    }
    if (merged.size() == 4) {
        ok &= check(merged[2].ts == day(2024, 1, 4) && merged[2].close.raw() == 3'000'000, "fetched row replaces cached");
    }
    return ok;
}

bool clippedToRange() {
    const auto cached = bars("AAPL", Timeframe::OneDay, day(2023, 12, 30), day(2024, 1, 2));
    const auto merged = core::mergeCandles(cached, {}, day(2024, 1, 1), day(2024, 1, 1));
    return check(merged.size() == 1 && merged[0].ts == day(2024, 1, 1), "rows outside range are dropped");
}

bool classifier() {
    const core::AssetClassifier classifier;
    bool ok = true;
    ok &= check(classifier.classify("BTC") == AssetClass::Crypto, "BTC is crypto");
    ok &= check(classifier.classify("eth-usd") == AssetClass::Crypto, "lower-case ETH pair is crypto");
    ok &= check(classifier.classify("SOLUSDT") == AssetClass::Crypto, "SOLUSDT is crypto");
    ok &= check(classifier.classify("AAPL") == AssetClass::Equity, "AAPL is equity");
    ok &= check(classifier.classify("MSFT") == AssetClass::Equity, "MSFT is equity");

    const core::AssetClassifier custom{{"XYZ"}};
    ok &= check(custom.classify("BTC") == AssetClass::Equity, "custom markers replace defaults");
    ok &= check(custom.classify("XYZ1") == AssetClass::Crypto, "custom marker matches");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= fetchedWinsAndSorted();
    ok &= clippedToRange();
    ok &= classifier();
    if (!ok) {
        return 1;
    }
    std::cout << "test_merger passed\n";
    return 0;
}
