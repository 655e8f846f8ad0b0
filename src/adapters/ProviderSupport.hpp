#pragma once

#include <string>
#include <vector>

#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters {

// Runs the transport and maps the outcome onto the provider error contract:
// 429 raises ProviderRateLimited, transport failures and other non-2xx
// statuses raise ProviderTransientError.
infra::http::HttpResponse getChecked(const std::string& provider,
                                     const infra::http::HttpTransport& transport,
                                     const infra::http::HttpRequest& request);

// Keeps candles whose ts lies inside the request window.
std::vector<domain::Candle> clipToRequest(std::vector<domain::Candle> candles,
                                          const domain::contracts::FetchRequest& request);

}  // namespace adapters
