#include <chrono>
#include <iostream>
#include <memory>
#include <vector>

#include "app/FetchOrchestrator.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "support/TestSupport.hpp"

using app::FetchOrchestrator;
using app::ProviderLadder;
using domain::AssetClass;
using domain::Gap;
using domain::Timeframe;
using mdc::common::metrics::Registry;
using testsupport::check;
using testsupport::day;
using testsupport::FakeProvider;
using testsupport::servesBars;

namespace {

constexpr auto kDay = domain::kDayMs;

std::shared_ptr<FakeProvider> equityProvider(const std::string& name, int priority, FakeProvider::Handler handler) {
    return std::make_shared<FakeProvider>(name, priority, std::vector<AssetClass>{AssetClass::Equity}, 365 * kDay,
                                          std::move(handler));
}

bool chunking() {
    const Gap gap{day(2024, 1, 1), day(2024, 1, 1) + 250 * kDay - 1};
    const auto chunks = FetchOrchestrator::splitIntoChunks(gap, 90 * kDay);
    bool ok = check(chunks.size() == 3, "250 days split into three 90 day chunks");
    if (chunks.size() == 3) {
        ok &= check(chunks[0] == Gap{gap.start, gap.start + 90 * kDay - 1}, "first chunk");
        ok &= check(chunks[1].start == chunks[0].end + 1, "chunks are contiguous");
        ok &= check(chunks[2].end == gap.end, "last chunk ends at the gap end");
    }

    const auto single = FetchOrchestrator::splitIntoChunks({day(2024, 1, 1), day(2024, 1, 1)}, 90 * kDay);
    ok &= check(single.size() == 1 && single[0].start == single[0].end, "single point gap is one chunk");
    ok &= check(FetchOrchestrator::splitIntoChunks({10, 5}, kDay).empty(), "inverted gap yields nothing");
    return ok;
}

bool timeouts() {
    bool ok = true;
    ok &= check(FetchOrchestrator::timeoutFor(0) == std::chrono::seconds(5), "base timeout 5 s");
    ok &= check(FetchOrchestrator::timeoutFor(10 * kDay) == std::chrono::seconds(6), "one extra second per 10 days");
    ok &= check(FetchOrchestrator::timeoutFor(250 * kDay) == std::chrono::seconds(30), "250 days gives 30 s");
    ok &= check(FetchOrchestrator::timeoutFor(5000 * kDay) == std::chrono::seconds(60), "capped at 60 s");
    return ok;
}

bool chunkSizeHonoursMaxSpan() {
    auto narrow = std::make_shared<FakeProvider>("narrow", 0, std::vector<AssetClass>{AssetClass::Crypto}, 30 * kDay,
                                                 servesBars());
    auto wide = equityProvider("wide", 0, servesBars());
    FetchOrchestrator orchestrator{ProviderLadder{{narrow, wide}}};
    bool ok = check(orchestrator.chunkSizeFor(AssetClass::Crypto) == 30 * kDay, "crypto ladder capped at 30 days");
    ok &= check(orchestrator.chunkSizeFor(AssetClass::Equity) == 90 * kDay, "equity uses the general limit");
    return ok;
}

bool longGapIssuesThreeCalls() {
    Registry::instance().reset();
    auto provider = equityProvider("primary", 0, servesBars());
    FetchOrchestrator orchestrator{ProviderLadder{{provider}}};

    const Gap gap{day(2023, 1, 1), day(2023, 1, 1) + 250 * kDay - 1};
    const auto outcome = orchestrator.fetchGap("AAPL", Timeframe::OneDay, gap, AssetClass::Equity);

    bool ok = check(provider->callCount() == 3, "one provider call per chunk");
    ok &= check(outcome.residualGaps.empty(), "no residual gaps");
    ok &= check(outcome.candles.size() == 250, "every day of the gap fetched");
    for (const auto& call : provider->calls()) {
        ok &= check(call.end - call.start < 90 * kDay, "each request within the chunk limit");
    }
    ok &= check(Registry::instance().counter("provider.primary.calls") == 3, "calls counted");
    return ok;
}

bool rateLimitFallsThrough() {
    Registry::instance().reset();
    auto limited = equityProvider("limited", 0, [](const domain::contracts::FetchRequest&) -> std::vector<domain::Candle> {
        throw domain::ProviderRateLimited("limited", "quota exhausted");
    });
    auto backup = equityProvider("backup", 1, servesBars(2'000'000));
    // Insertion order reversed to check priority ordering.
    FetchOrchestrator orchestrator{ProviderLadder{{backup, limited}}};

    const Gap gap{day(2024, 1, 1), day(2024, 1, 5)};
    const auto outcome = orchestrator.fetchGap("aapl-feed", Timeframe::OneDay, gap, AssetClass::Equity);

    bool ok = check(limited->callCount() == 1 && backup->callCount() == 1, "ladder tried in priority order");
    ok &= check(outcome.residualGaps.empty(), "backup filled the chunk");
    ok &= check(outcome.candles.size() == 5, "five daily candles");
    if (!outcome.candles.empty()) {
        ok &= check(outcome.candles.front().close.raw() == 2'000'000, "candles come from the backup");
        ok &= check(outcome.candles.front().ticker == "aapl-feed", "candles carry the requested ticker");
    }
    ok &= check(Registry::instance().counter("provider.limited.rate_limited") == 1, "rate limit counted");
    return ok;
}

bool emptyAndFailingProviders() {
    Registry::instance().reset();
    auto empty = equityProvider("empty", 0, [](const domain::contracts::FetchRequest&) {
        return std::vector<domain::Candle>{};
    });
    auto outside = equityProvider("outside", 1, [](const domain::contracts::FetchRequest& request) {
        // Bars entirely outside the window count as no data.
        return testsupport::bars(request.ticker, request.timeframe, request.end + kDay, request.end + 3 * kDay);
    });
    auto broken = equityProvider("broken", 2, [](const domain::contracts::FetchRequest&) -> std::vector<domain::Candle> {
        throw domain::ProviderTransientError("broken", "HTTP 503");
    });
    FetchOrchestrator orchestrator{ProviderLadder{{empty, outside, broken}}};

    const Gap gap{day(2024, 1, 1), day(2024, 1, 5)};
    const auto outcome = orchestrator.fetchGap("AAPL", Timeframe::OneDay, gap, AssetClass::Equity);

    bool ok = check(empty->callCount() == 1 && outside->callCount() == 1 && broken->callCount() == 1,
                    "every provider attempted once");
    ok &= check(outcome.candles.empty(), "nothing fetched");
    ok &= check(outcome.residualGaps.size() == 1 && outcome.residualGaps[0] == gap, "chunk left as residual gap");
    ok &= check(Registry::instance().counter("ladder.residual_chunks") == 1, "residual chunk counted");
    ok &= check(Registry::instance().counter("provider.broken.failures") == 1, "failure counted");
    return ok;
}

bool partialFailureKeepsOtherChunks() {
    auto flaky = equityProvider("flaky", 0, [](const domain::contracts::FetchRequest& request) {
        if (request.start > day(2024, 1, 1)) {
            throw domain::ProviderTransientError("flaky", "timeout");
        }
        return testsupport::bars(request.ticker, request.timeframe, request.start, request.end);
    });
    FetchOrchestrator orchestrator{ProviderLadder{{flaky}}};

    const Gap gap{day(2024, 1, 1), day(2024, 1, 1) + 120 * kDay - 1};
    const auto outcome = orchestrator.fetchGap("AAPL", Timeframe::OneDay, gap, AssetClass::Equity);

    bool ok = check(outcome.candles.size() == 90, "first chunk kept");
    ok &= check(outcome.residualGaps.size() == 1 && outcome.residualGaps[0].end == gap.end,
                "second chunk becomes residual");
    return ok;
}

bool noProviderForClass() {
    auto equity = equityProvider("equity-only", 0, servesBars());
    FetchOrchestrator orchestrator{ProviderLadder{{equity}}};
    const Gap gap{day(2024, 1, 1), day(2024, 1, 2)};
    const auto outcome = orchestrator.fetchGap("BTC", Timeframe::OneDay, gap, AssetClass::Crypto);
    bool ok = check(equity->callCount() == 0, "unsupported provider never called");
    ok &= check(outcome.residualGaps.size() == 1 && outcome.residualGaps[0] == gap, "whole gap residual");
    return ok;
}

bool rejectsBadLimit() {
    try {
        FetchOrchestrator orchestrator{ProviderLadder{}, FetchOrchestrator::Options{0}};
        return check(false, "zero chunk limit must throw");
    } catch (const domain::ConfigError&) {
        return true;
    }
}

}  // namespace

int main() {
    mdc::log::setLevel(mdc::log::Level::Error);
    bool ok = true;
    ok &= chunking();
    ok &= timeouts();
    ok &= chunkSizeHonoursMaxSpan();
    ok &= longGapIssuesThreeCalls();
    ok &= rateLimitFallsThrough();
    ok &= emptyAndFailingProviders();
    ok &= partialFailureKeepsOtherChunks();
    ok &= noProviderForClass();
    ok &= rejectsBadLimit();
    if (!ok) {
        return 1;
    }
    std::cout << "test_fetch_orchestrator passed\n";
    return 0;
}
