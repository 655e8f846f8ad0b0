#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace domain {

/// Fixed-point decimal with four fractional digits.
///
/// Internal representation: int64_t where value = raw / 10^4, bounded to the
/// DECIMAL(18,4) columns prices are persisted in (|value| <= 99999999999999.9999).
///
/// Example:
///   185.64 is represented as 1856400
///   0.0001 is represented as 1
class Decimal {
public:
    static constexpr int kScale = 4;
    static constexpr std::int64_t kFactor = 10'000;

    constexpr Decimal() = default;

    static constexpr Decimal fromRaw(std::int64_t raw) { return Decimal(raw); }

    static constexpr Decimal fromInt(std::int64_t value) { return Decimal(value * kFactor); }

    /// Rounds half away from zero to the fourth digit.
    /// @throws std::invalid_argument on NaN, infinity or out-of-range values
    static Decimal fromDouble(double value);

    /// Exact parse of "123", "-0.5", "185.640000"; extra fractional digits are
    /// rounded. Exponent notation falls back to fromDouble.
    /// @throws std::invalid_argument on malformed or out-of-range input
    static Decimal parse(std::string_view text);

    constexpr std::int64_t raw() const noexcept { return raw_; }

    /// Always prints four fractional digits, e.g. "185.6400".
    std::string toString() const;

    constexpr bool operator==(const Decimal& other) const { return raw_ == other.raw_; }
    constexpr bool operator!=(const Decimal& other) const { return raw_ != other.raw_; }
    constexpr bool operator<(const Decimal& other) const { return raw_ < other.raw_; }
    constexpr bool operator<=(const Decimal& other) const { return raw_ <= other.raw_; }
    constexpr bool operator>(const Decimal& other) const { return raw_ > other.raw_; }
    constexpr bool operator>=(const Decimal& other) const { return raw_ >= other.raw_; }

private:
    constexpr explicit Decimal(std::int64_t raw) : raw_(raw) {}

    std::int64_t raw_{0};
};

}  // namespace domain
