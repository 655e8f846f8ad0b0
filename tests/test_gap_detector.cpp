#include <iostream>
#include <vector>

#include "core/GapDetector.h"
#include "support/TestSupport.hpp"

using domain::Gap;
using domain::Timeframe;
using testsupport::bars;
using testsupport::check;
using testsupport::day;

namespace {

constexpr auto kDay = domain::kDayMs;

bool emptyCacheIsOneGap() {
    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 10), {}, kDay);
    return check(gaps.size() == 1 && gaps[0] == Gap{day(2024, 1, 1), day(2024, 1, 10)},
                 "empty cache yields the whole request");
}

bool leadingAndTrailing() {
    const auto fresh = bars("AAPL", Timeframe::OneDay, day(2024, 1, 3), day(2024, 1, 5));
    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 10), fresh, kDay);
    bool ok = check(gaps.size() == 2, "two gaps around the cached block");
    if (gaps.size() == 2) {
        ok &= check(gaps[0] == Gap{day(2024, 1, 1), day(2024, 1, 2)}, "leading gap 01-01..01-02");
        ok &= check(gaps[1] == Gap{day(2024, 1, 6), day(2024, 1, 10)}, "trailing gap 01-06..01-10");
    }
    return ok;
}

bool interiorHole() {
    auto fresh = bars("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 3));
    const auto tail = bars("AAPL", Timeframe::OneDay, day(2024, 1, 8), day(2024, 1, 10));
    fresh.insert(fresh.end(), tail.begin(), tail.end());

    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 10), fresh, kDay);
    return check(gaps.size() == 1 && gaps[0] == Gap{day(2024, 1, 4), day(2024, 1, 7)}, "interior gap 01-04..01-07");
}

bool fullCoverage() {
    const auto fresh = bars("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 10));
    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 10), fresh, kDay);
    return check(gaps.empty(), "fully cached range has no gaps");
}

bool subIntervalSlackIsIgnored() {
    // Request ends half a day after the last bar: less than one interval.
    const auto fresh = bars("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5));
    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 5) + kDay / 2, fresh, kDay);
    bool ok = check(gaps.empty(), "trailing slack under one interval is not a gap");

    // A single missing bar produces no interior gap only when the step equals the interval.
    std::vector<domain::Candle> spaced{fresh[0], fresh[2]};
    const auto interior = core::detectGaps(day(2024, 1, 1), day(2024, 1, 3), spaced, kDay);
    ok &= check(interior.size() == 1 && interior[0] == Gap{day(2024, 1, 2), day(2024, 1, 2)},
                "one missing bar is a single-point gap");
    return ok;
}

bool leadingNeedsMoreThanOneInterval() {
    // First cached bar is exactly one interval after the start: no leading gap.
    const auto fresh = bars("AAPL", Timeframe::OneDay, day(2024, 1, 2), day(2024, 1, 10));
    const auto gaps = core::detectGaps(day(2024, 1, 1), day(2024, 1, 10), fresh, kDay);
    return check(gaps.empty(), "start within one interval of first bar");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= emptyCacheIsOneGap();
    ok &= leadingAndTrailing();
    ok &= interiorHole();
    ok &= fullCoverage();
    ok &= subIntervalSlackIsIgnored();
    ok &= leadingNeedsMoreThanOneInterval();
    if (!ok) {
        return 1;
    }
    std::cout << "test_gap_detector passed\n";
    return 0;
}
