#pragma once

#include "app/ProviderLadder.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace mdc::common {
struct Config;
}

namespace app {

// Builds the configured providers. Priority is the position of the provider
// name in its asset-class list. Alpha Vantage without an API key is skipped.
// @throws domain::ConfigError on unknown provider names
ProviderLadder buildProviderLadder(const mdc::common::Config& config,
                                   const infra::http::HttpTransport& transport = infra::http::default_transport());

}  // namespace app
