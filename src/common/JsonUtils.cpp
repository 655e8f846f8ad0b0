#include "common/JsonUtils.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace mdc::common {

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

domain::Decimal json_to_decimal(const boost::json::value& value) {
    try {
        if (value.is_string()) {
            return domain::Decimal::parse(value.as_string().c_str());
        }
        if (value.is_int64()) {
            return domain::Decimal::fromInt(value.as_int64());
        }
        if (value.is_uint64()) {
            return domain::Decimal::fromInt(static_cast<std::int64_t>(value.as_uint64()));
        }
        if (value.is_double()) {
            return domain::Decimal::fromDouble(value.as_double());
        }
    } catch (const std::invalid_argument& ex) {
        throw std::runtime_error(std::string{"Failed to parse decimal value: "} + ex.what());
    }
    throw std::runtime_error("Unsupported JSON type for decimal conversion");
}

boost::json::value parse_json(const std::string& body, const std::string& context) {
    boost::json::error_code ec;
    auto value = boost::json::parse(body, ec);
    if (ec) {
        throw std::runtime_error("Failed to parse " + context + " response: " + ec.message());
    }
    return value;
}

}  // namespace mdc::common
