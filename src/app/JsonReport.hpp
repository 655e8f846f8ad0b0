#pragma once

#include <string>

#include <boost/json.hpp>

#include "app/ProviderLadder.hpp"
#include "common/Metrics.hpp"
#include "domain/Ports.hpp"
#include "domain/Types.h"

namespace app {

// Prices are emitted as decimal strings ("185.6400") so no precision is lost.
boost::json::object series_to_json(const domain::PriceSeries& series);

// One entry per asset class, providers in ladder order.
boost::json::object providers_to_json(const ProviderLadder& ladder);

boost::json::object stats_to_json(const domain::contracts::StoreStats& stats,
                                  const mdc::common::metrics::Registry::Snapshot& metrics);

std::string serialize_json(const boost::json::value& value);

}  // namespace app
