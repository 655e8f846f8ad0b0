#include <iostream>
#include <stdexcept>
#include <string>

#include "core/TimeUtils.h"
#include "domain/Decimal.hpp"
#include "domain/Types.h"
#include "support/TestSupport.hpp"

using domain::Decimal;
using testsupport::check;

namespace {

bool decimalParsing() {
    bool ok = true;
    ok &= check(Decimal::parse("185.64").raw() == 1'856'400, "185.64 parses exactly");
    ok &= check(Decimal::parse("185.640000").toString() == "185.6400", "extra zeros are dropped");
    ok &= check(Decimal::parse("-0.5").toString() == "-0.5000", "negative fraction");
    ok &= check(Decimal::parse("  42 ").toString() == "42.0000", "integral with spaces");
    ok &= check(Decimal::parse("0.00005").raw() == 1, "fifth digit rounds up");
    ok &= check(Decimal::parse("0.00004").raw() == 0, "fifth digit rounds down");
    ok &= check(Decimal::parse("1.5e2").toString() == "150.0000", "exponent notation");
    ok &= check(Decimal::fromDouble(187.15).toString() == "187.1500", "double rounding");
    ok &= check(Decimal::fromInt(3) < Decimal::parse("3.0001"), "ordering");

    ok &= check(Decimal::parse("99999999999999.9999").toString() == "99999999999999.9999", "largest storable value");
    ok &= check(Decimal::parse("-00099999999999999").toString() == "-99999999999999.0000", "leading zeros not counted");
    for (const char* tooLarge : {"922337203685477.99995", "123456789012345", "99999999999999.99995", "-1e15"}) {
        try {
            (void)Decimal::parse(tooLarge);
            ok &= check(false, std::string{"expected range failure for '"} + tooLarge + "'");
        } catch (const std::invalid_argument&) {
        }
    }

    for (const char* bad : {"", "abc", "1.2.3", "--1", "."}) {
        try {
            (void)Decimal::parse(bad);
            ok &= check(false, std::string{"expected parse failure for '"} + bad + "'");
        } catch (const std::invalid_argument&) {
        }
    }
    return ok;
}

bool timeframes() {
    bool ok = true;
    ok &= check(domain::timeframe_from_label("1d") == domain::Timeframe::OneDay, "1d label");
    ok &= check(domain::timeframe_from_label("60m") == domain::Timeframe::OneHour, "60m alias");
    ok &= check(domain::timeframe_from_label(" 15MIN ") == domain::Timeframe::FifteenMinutes, "15min alias");
    ok &= check(!domain::timeframe_from_label("2h").has_value(), "2h is rejected");
    ok &= check(domain::interval_ms(domain::Timeframe::FiveMinutes) == 300'000, "5m interval");
    ok &= check(domain::is_intraday(domain::Timeframe::OneHour), "1h is intraday");
    ok &= check(!domain::is_intraday(domain::Timeframe::OneDay), "1d is daily");
    ok &= check(domain::align_down_ms(-1, 1000) == -1000, "align_down handles negatives");
    ok &= check(domain::align_up_ms(1001, 1000) == 2000, "align_up");
    return ok;
}

bool ttlPolicy() {
    const domain::TtlPolicy ttl;
    bool ok = true;
    ok &= check(ttl.ttlFor(domain::Timeframe::OneMinute) == domain::kHourMs, "intraday TTL is one hour");
    ok &= check(ttl.ttlFor(domain::Timeframe::OneDay) == domain::kDayMs, "daily TTL is one day");
    ok &= check(ttl.isFresh(domain::Timeframe::OneHour, 0, domain::kHourMs - 1), "fresh just before expiry");
    ok &= check(!ttl.isFresh(domain::Timeframe::OneHour, 0, domain::kHourMs), "stale at expiry");
    return ok;
}

bool timeUtils() {
    using namespace core::TimeUtils;
    bool ok = true;
    ok &= check(daysFromCivil(1970, 1, 1) == 0, "epoch day");
    ok &= check(daysFromCivil(2024, 3, 1) - daysFromCivil(2024, 2, 28) == 2, "leap year");

    const auto civil = civilFromUtcMs(utcMsFromCivil(2024, 1, 6, 13, 45, 10));
    ok &= check(civil.year == 2024 && civil.month == 1 && civil.day == 6, "civil date round trip");
    ok &= check(civil.hour == 13 && civil.minute == 45 && civil.second == 10, "civil time round trip");
    ok &= check(civil.weekday == 6, "2024-01-06 is a Saturday");

    // 2024 DST: 2024-03-10 07:00Z to 2024-11-03 06:00Z.
    ok &= check(!isNewYorkDst(utcMsFromCivil(2024, 3, 10, 6, 59, 59)), "EST before switch");
    ok &= check(isNewYorkDst(utcMsFromCivil(2024, 3, 10, 7, 0, 0)), "EDT after switch");
    ok &= check(isNewYorkDst(utcMsFromCivil(2024, 11, 3, 5, 59, 59)), "EDT before fall back");
    ok &= check(!isNewYorkDst(utcMsFromCivil(2024, 11, 3, 6, 0, 0)), "EST after fall back");

    ok &= check(newYorkLocalToUtcMs(2024, 1, 2, 9, 30, 0) == utcMsFromCivil(2024, 1, 2, 14, 30, 0),
                "winter open is 14:30Z");
    ok &= check(newYorkLocalToUtcMs(2024, 7, 2, 9, 30, 0) == utcMsFromCivil(2024, 7, 2, 13, 30, 0),
                "summer open is 13:30Z");

    const auto now = utcMsFromCivil(2024, 5, 1, 12, 0, 0);
    ok &= check(parseUtc("2024-01-10", false, now) == utcMsFromCivil(2024, 1, 10), "date start");
    ok &= check(parseUtc("2024-01-10", true, now) == utcMsFromCivil(2024, 1, 11) - 1, "date end");
    ok &= check(parseUtc("2024-01-10T09:15:00Z", true, now) == utcMsFromCivil(2024, 1, 10, 9, 15, 0),
                "ISO timestamp");
    ok &= check(parseUtc("now", false, now) == now, "now keyword");
    ok &= check(!parseUtc("10/01/2024", false, now).has_value(), "foreign format rejected");
    ok &= check(formatIsoUtc(utcMsFromCivil(2024, 1, 2, 3, 4, 5)) == "2024-01-02T03:04:05Z", "ISO format");
    return ok;
}

}  // namespace

int main() {
    bool ok = true;
    ok &= decimalParsing();
    ok &= timeframes();
    ok &= ttlPolicy();
    ok &= timeUtils();
    if (!ok) {
        return 1;
    }
    std::cout << "test_types passed\n";
    return 0;
}
