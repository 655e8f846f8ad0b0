#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "support/TestSupport.hpp"

namespace testsupport {

inline std::vector<domain::CacheRecord> toRecords(const std::vector<domain::Candle>& candles,
                                                  domain::TimestampMs fetchedAt) {
    std::vector<domain::CacheRecord> out;
    out.reserve(candles.size());
    for (const auto& candle : candles) {
        out.push_back({candle, fetchedAt});
    }
    return out;
}

// Behaviour every ICandleStore must share. The store must start empty and use
// the default TTL policy.
inline bool runStoreContract(domain::contracts::ICandleStore& store, const std::string& label) {
    using domain::Timeframe;
    const auto t0 = day(2024, 2, 1);
    bool ok = true;

    const auto empty = store.stats("AAPL", Timeframe::OneDay);
    ok &= check(empty.rows == 0 && !empty.minTs && !empty.maxTs, label + ": empty stats");

    store.upsert(toRecords(bars("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5)), t0));
    store.upsert(toRecords(bars("MSFT", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5)), t0));

    const auto all = store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5), t0 + 1);
    ok &= check(all.size() == 5, label + ": five fresh rows");
    for (std::size_t i = 1; i < all.size(); ++i) {
        ok &= check(all[i - 1].ts < all[i].ts, label + ": rows ascending");
    }
    for (const auto& candle : all) {
        ok &= check(candle.ticker == "AAPL" && candle.timeframe == Timeframe::OneDay, label + ": key columns");
    }

    const auto inner = store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 2), day(2024, 1, 4), t0);
    ok &= check(inner.size() == 3, label + ": range bounds inclusive");
    ok &= check(store.readFresh("AAPL", Timeframe::OneHour, day(2024, 1, 1), day(2024, 1, 5), t0).empty(),
                label + ": timeframes isolated");
    ok &= check(store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 5), day(2024, 1, 1), t0).empty(),
                label + ": inverted range is empty");

    // Replace one row with new prices and a later fetch time.
    auto replacement = makeCandle("AAPL", Timeframe::OneDay, day(2024, 1, 3), 1'871'500);
    replacement.volume = domain::Decimal::parse("123456789.1234");
    store.upsert({{replacement, t0 + domain::kHourMs}});

    const auto replaced = store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 3), day(2024, 1, 3), t0);
    ok &= check(replaced.size() == 1, label + ": upsert keeps one row per key");
    if (replaced.size() == 1) {
        ok &= check(replaced[0].close.raw() == 1'871'500, label + ": close replaced exactly");
        ok &= check(replaced[0].high.raw() == 1'872'000 && replaced[0].low.raw() == 1'871'000,
                    label + ": high and low exact");
        ok &= check(replaced[0].volume.toString() == "123456789.1234", label + ": volume exact");
    }

    // Daily TTL: the first rows expire one day after t0, the replaced row an hour later.
    const auto afterTtl = store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5),
                                          t0 + domain::kDayMs);
    ok &= check(afterTtl.size() == 1 && afterTtl[0].ts == day(2024, 1, 3), label + ": stale rows hidden");
    ok &= check(store.readFresh("AAPL", Timeframe::OneDay, day(2024, 1, 1), day(2024, 1, 5),
                                t0 + domain::kDayMs - 1)
                        .size() == 5,
                label + ": rows fresh until the TTL elapses");

    // Intraday TTL is one hour.
    store.upsert(toRecords(bars("AAPL", Timeframe::FiveMinutes, t0, t0 + domain::kHourMs), t0));
    const auto window = t0 + domain::kHourMs;
    ok &= check(store.readFresh("AAPL", Timeframe::FiveMinutes, t0, window, t0 + domain::kHourMs - 1).size() == 13,
                label + ": intraday rows fresh within the hour");
    ok &= check(store.readFresh("AAPL", Timeframe::FiveMinutes, t0, window, t0 + domain::kHourMs).empty(),
                label + ": intraday rows stale after an hour");

    const auto stats = store.stats("AAPL", Timeframe::OneDay);
    ok &= check(stats.rows == 5, label + ": stats count rows regardless of freshness");
    ok &= check(stats.minTs && *stats.minTs == day(2024, 1, 1), label + ": stats min");
    ok &= check(stats.maxTs && *stats.maxTs == day(2024, 1, 5), label + ": stats max");
    return ok;
}

}  // namespace testsupport
