#include "core/TimeUtils.h"

#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace core::TimeUtils {
namespace {

using domain::kDayMs;
using domain::kHourMs;
using domain::kMinuteMs;
using domain::kSecondMs;
using domain::TimestampMs;

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) noexcept {
    const auto q = value / divisor;
    return (value % divisor != 0 && ((value < 0) != (divisor < 0))) ? q - 1 : q;
}

// Day of month of the n-th Sunday (1-based) of the given month.
unsigned nthSunday(int year, unsigned month, unsigned n) noexcept {
    const auto firstDays = daysFromCivil(year, month, 1);
    const auto firstWeekday = static_cast<unsigned>((firstDays % 7 + 11) % 7);
    const unsigned firstSunday = 1U + (7U - firstWeekday) % 7U;
    return firstSunday + 7U * (n - 1U);
}

}  // namespace

std::int64_t daysFromCivil(int year, unsigned month, unsigned day) noexcept {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const auto yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153U * (month > 2 ? month - 3 : month + 9) + 2U) / 5U + day - 1U;
    const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilTime civilFromUtcMs(TimestampMs ms) noexcept {
    const auto days = floorDiv(ms, kDayMs);
    const auto msOfDay = ms - days * kDayMs;

    const std::int64_t z = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
    const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
    const unsigned mp = (5U * doy + 2U) / 153U;

    CivilTime civil;
    civil.day = doy - (153U * mp + 2U) / 5U + 1U;
    civil.month = mp < 10 ? mp + 3 : mp - 9;
    civil.year = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400) + (civil.month <= 2 ? 1 : 0);
    civil.hour = static_cast<int>(msOfDay / kHourMs);
    civil.minute = static_cast<int>((msOfDay % kHourMs) / kMinuteMs);
    civil.second = static_cast<int>((msOfDay % kMinuteMs) / kSecondMs);
    // 1970-01-01 was a Thursday.
    civil.weekday = static_cast<unsigned>(((days % 7) + 11) % 7);
    return civil;
}

TimestampMs utcMsFromCivil(int year, unsigned month, unsigned day, int hour, int minute, int second) noexcept {
    return daysFromCivil(year, month, day) * kDayMs + hour * kHourMs + minute * kMinuteMs + second * kSecondMs;
}

bool isNewYorkDst(TimestampMs utcMs) noexcept {
    const int year = civilFromUtcMs(utcMs).year;
    // 02:00 EST = 07:00 UTC; 02:00 EDT = 06:00 UTC.
    const auto start = utcMsFromCivil(year, 3, nthSunday(year, 3, 2), 7);
    const auto end = utcMsFromCivil(year, 11, nthSunday(year, 11, 1), 6);
    return utcMs >= start && utcMs < end;
}

int newYorkOffsetMinutes(TimestampMs utcMs) noexcept {
    return isNewYorkDst(utcMs) ? -240 : -300;
}

CivilTime newYorkCivil(TimestampMs utcMs) noexcept {
    return civilFromUtcMs(utcMs + newYorkOffsetMinutes(utcMs) * kMinuteMs);
}

TimestampMs newYorkLocalToUtcMs(int year, unsigned month, unsigned day, int hour, int minute, int second) noexcept {
    const auto asUtc = utcMsFromCivil(year, month, day, hour, minute, second);
    const auto daylight = asUtc + 4 * kHourMs;
    if (isNewYorkDst(daylight)) {
        return daylight;
    }
    return asUtc + 5 * kHourMs;
}

std::optional<TimestampMs> parseUtc(std::string_view value, bool endOfDay, TimestampMs nowMs) {
    std::string text;
    for (const char ch : value) {
        text.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.pop_back();
    }
    if (text.empty()) {
        return std::nullopt;
    }
    if (text == "now") {
        return nowMs;
    }
    if (text.back() == 'z') {
        text.pop_back();
    }
    for (auto& ch : text) {
        if (ch == 't') {
            ch = ' ';
        }
    }

    std::tm tm{};
    std::istringstream input(text);
    const bool hasTime = text.size() > 10;
    input >> std::get_time(&tm, hasTime ? "%Y-%m-%d %H:%M:%S" : "%Y-%m-%d");
    if (input.fail()) {
        return std::nullopt;
    }
    input >> std::ws;
    if (!input.eof()) {
        return std::nullopt;
    }

    const auto month = static_cast<unsigned>(tm.tm_mon + 1);
    const auto day = static_cast<unsigned>(tm.tm_mday);
    if (month < 1 || month > 12 || day < 1 || day > 31) {
        return std::nullopt;
    }
    auto ms = utcMsFromCivil(tm.tm_year + 1900, month, day, tm.tm_hour, tm.tm_min, tm.tm_sec);
    if (!hasTime && endOfDay) {
        ms += kDayMs - 1;
    }
    return ms;
}

std::string formatIsoUtc(TimestampMs ms) {
    const auto civil = civilFromUtcMs(ms);
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ", civil.year, civil.month,
                  civil.day, civil.hour, civil.minute, civil.second);
    return buffer;
}

TimestampMs nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace core::TimeUtils
