#include "adapters/ProviderSupport.hpp"

#include <algorithm>

#include "domain/Errors.hpp"

namespace adapters {

infra::http::HttpResponse getChecked(const std::string& provider,
                                     const infra::http::HttpTransport& transport,
                                     const infra::http::HttpRequest& request) {
    infra::http::HttpResponse response;
    try {
        response = transport(request);
    } catch (const std::exception& ex) {
        throw domain::ProviderTransientError(provider, ex.what());
    }

    if (response.status == 429U) {
        std::string message = "HTTP 429";
        if (!response.retry_after.empty()) {
            message += " (retry after " + response.retry_after + "s)";
        }
        throw domain::ProviderRateLimited(provider, message);
    }
    if (response.status < 200U || response.status >= 300U) {
        throw domain::ProviderTransientError(provider, "HTTP " + std::to_string(response.status));
    }
    return response;
}

std::vector<domain::Candle> clipToRequest(std::vector<domain::Candle> candles,
                                          const domain::contracts::FetchRequest& request) {
    candles.erase(std::remove_if(candles.begin(), candles.end(),
                                 [&request](const domain::Candle& candle) {
                                     return candle.ts < request.start || candle.ts > request.end;
                                 }),
                  candles.end());
    return candles;
}

}  // namespace adapters
