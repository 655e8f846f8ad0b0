#include "domain/Decimal.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace domain {
namespace {

// DECIMAL(18,4): fourteen integral digits.
constexpr std::size_t kMaxIntegralDigits = 14;
constexpr std::int64_t kMaxRaw = 999'999'999'999'999'999;

std::invalid_argument outOfRange(std::string_view text) {
    return std::invalid_argument("Decimal value out of range: '" + std::string(text) + "'");
}

std::invalid_argument malformed(std::string_view text) {
    return std::invalid_argument("Malformed decimal value: '" + std::string(text) + "'");
}

bool hasExponent(std::string_view text) {
    return text.find_first_of("eE") != std::string_view::npos;
}

}  // namespace

Decimal Decimal::fromDouble(double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("Decimal::fromDouble received a non-finite value");
    }
    const double scaled = std::round(value * static_cast<double>(kFactor));
    if (std::fabs(scaled) >= static_cast<double>(kMaxRaw + 1)) {
        throw std::invalid_argument("Decimal::fromDouble value out of range");
    }
    return Decimal(static_cast<std::int64_t>(scaled));
}

Decimal Decimal::parse(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
        --end;
    }
    const auto trimmed = text.substr(begin, end - begin);
    if (trimmed.empty()) {
        throw malformed(text);
    }

    if (hasExponent(trimmed)) {
        const std::string copy{trimmed};
        char* parsedEnd = nullptr;
        const double value = std::strtod(copy.c_str(), &parsedEnd);
        if (parsedEnd == copy.c_str() || *parsedEnd != '\0') {
            throw malformed(text);
        }
        return fromDouble(value);
    }

    std::size_t idx = 0;
    bool negative = false;
    if (trimmed[idx] == '+' || trimmed[idx] == '-') {
        negative = trimmed[idx] == '-';
        ++idx;
    }

    std::int64_t integral = 0;
    std::size_t integralDigits = 0;
    std::size_t significantDigits = 0;
    while (idx < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[idx])) != 0) {
        const int digit = trimmed[idx] - '0';
        if (integral != 0 || digit != 0) {
            if (++significantDigits > kMaxIntegralDigits) {
                throw outOfRange(text);
            }
        }
        integral = integral * 10 + digit;
        ++integralDigits;
        ++idx;
    }

    std::int64_t fraction = 0;
    std::size_t fractionDigits = 0;
    bool roundUp = false;
    if (idx < trimmed.size() && trimmed[idx] == '.') {
        ++idx;
        while (idx < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[idx])) != 0) {
            const int digit = trimmed[idx] - '0';
            if (fractionDigits < static_cast<std::size_t>(kScale)) {
                fraction = fraction * 10 + digit;
            } else if (fractionDigits == static_cast<std::size_t>(kScale)) {
                roundUp = digit >= 5;
            }
            ++fractionDigits;
            ++idx;
        }
    }

    if (idx != trimmed.size() || (integralDigits == 0 && fractionDigits == 0)) {
        throw malformed(text);
    }

    for (std::size_t pad = fractionDigits; pad < static_cast<std::size_t>(kScale); ++pad) {
        fraction *= 10;
    }

    const std::int64_t raw = integral * kFactor + fraction + (roundUp ? 1 : 0);
    if (raw > kMaxRaw) {
        throw outOfRange(text);
    }
    return Decimal(negative ? -raw : raw);
}

std::string Decimal::toString() const {
    const bool negative = raw_ < 0;
    // raw_ is bounded by parse/fromDouble, so negation cannot overflow in practice.
    const std::int64_t magnitude = negative ? -raw_ : raw_;
    std::string fraction = std::to_string(magnitude % kFactor);
    fraction.insert(fraction.begin(), static_cast<std::size_t>(kScale) - fraction.size(), '0');

    std::string out;
    if (negative) {
        out.push_back('-');
    }
    out += std::to_string(magnitude / kFactor);
    out.push_back('.');
    out += fraction;
    return out;
}

}  // namespace domain
