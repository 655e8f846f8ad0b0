#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace core::TimeUtils {

struct CivilTime {
    int year{1970};
    unsigned month{1};
    unsigned day{1};
    int hour{0};
    int minute{0};
    int second{0};
    // 0 = Sunday ... 6 = Saturday
    unsigned weekday{4};
};

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t daysFromCivil(int year, unsigned month, unsigned day) noexcept;

CivilTime civilFromUtcMs(domain::TimestampMs ms) noexcept;

domain::TimestampMs utcMsFromCivil(int year, unsigned month, unsigned day,
                                   int hour = 0, int minute = 0, int second = 0) noexcept;

// America/New_York under the post-2007 US rules: DST from the second Sunday
// of March 02:00 local to the first Sunday of November 02:00 local.
bool isNewYorkDst(domain::TimestampMs utcMs) noexcept;
int newYorkOffsetMinutes(domain::TimestampMs utcMs) noexcept;
CivilTime newYorkCivil(domain::TimestampMs utcMs) noexcept;
domain::TimestampMs newYorkLocalToUtcMs(int year, unsigned month, unsigned day,
                                        int hour, int minute, int second) noexcept;

// Accepts "now", "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" and
// "YYYY-MM-DDTHH:MM:SS[Z]" (UTC). A date-only value resolves to the start of
// the day, or its last millisecond when endOfDay is set.
std::optional<domain::TimestampMs> parseUtc(std::string_view value, bool endOfDay,
                                            domain::TimestampMs nowMs);

std::string formatIsoUtc(domain::TimestampMs ms);

domain::TimestampMs nowMs();

}  // namespace core::TimeUtils
