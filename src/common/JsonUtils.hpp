#pragma once

#include <cstdint>
#include <string>

#include <boost/json.hpp>

#include "domain/Decimal.hpp"

namespace mdc::common {

// Numeric coercions for upstream payloads that mix JSON numbers and numeric
// strings. All throw std::runtime_error on unsupported types or garbage.
std::int64_t json_to_int64(const boost::json::value& value);
domain::Decimal json_to_decimal(const boost::json::value& value);

// Parses the body, throwing std::runtime_error with the given context.
boost::json::value parse_json(const std::string& body, const std::string& context);

}  // namespace mdc::common
