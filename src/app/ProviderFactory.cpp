#include "app/ProviderFactory.hpp"

#include <map>
#include <memory>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "adapters/alphavantage/AlphaVantageProvider.hpp"
#include "adapters/binance/BinanceProvider.hpp"
#include "adapters/coingecko/CoinGeckoProvider.hpp"
#include "adapters/yahoo/YahooProvider.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace app {
namespace {

ProviderPtr makeProvider(const std::string& name,
                         int priority,
                         const mdc::common::Config& config,
                         const infra::http::HttpTransport& transport) {
    if (name == "alphavantage") {
        if (config.alphaVantageApiKey.empty()) {
            LOG_WARN("Alpha Vantage listed but ALPHA_VANTAGE_API_KEY is empty; provider skipped");
            return nullptr;
        }
        return std::make_shared<adapters::alphavantage::AlphaVantageProvider>(config.alphaVantageApiKey, priority,
                                                                              transport);
    }
    if (name == "yahoo") {
        return std::make_shared<adapters::yahoo::YahooProvider>(priority, transport);
    }
    if (name == "binance") {
        return std::make_shared<adapters::binance::BinanceProvider>(priority, transport);
    }
    if (name == "coingecko") {
        return std::make_shared<adapters::coingecko::CoinGeckoProvider>(config.coingeckoApiKey, priority, transport);
    }
    throw domain::ConfigError("Unknown provider: " + name);
}

void warnIfUnsupported(const ProviderPtr& provider,
                       const std::vector<std::string>& listed,
                       domain::AssetClass assetClass) {
    const auto& descriptor = provider->descriptor();
    if (std::find(listed.begin(), listed.end(), descriptor.name) != listed.end() &&
        !descriptor.supports(assetClass)) {
        LOG_WARN("Provider " << descriptor.name << " does not serve " << domain::asset_class_label(assetClass)
                             << " tickers; ignoring it on that ladder");
    }
}

}  // namespace

ProviderLadder buildProviderLadder(const mdc::common::Config& config, const infra::http::HttpTransport& transport) {
    // First listing wins when a name appears in both lists.
    std::map<std::string, int> priorities;
    std::vector<std::string> order;
    for (const auto* names : {&config.equityProviders, &config.cryptoProviders}) {
        for (std::size_t index = 0; index < names->size(); ++index) {
            const auto& name = (*names)[index];
            if (priorities.emplace(name, static_cast<int>(index)).second) {
                order.push_back(name);
            }
        }
    }

    std::vector<ProviderPtr> providers;
    for (const auto& name : order) {
        if (auto provider = makeProvider(name, priorities.at(name), config, transport)) {
            warnIfUnsupported(provider, config.equityProviders, domain::AssetClass::Equity);
            warnIfUnsupported(provider, config.cryptoProviders, domain::AssetClass::Crypto);
            LOG_INFO("Provider " << name << " enabled, priority " << priorities.at(name));
            providers.push_back(std::move(provider));
        }
    }
    return ProviderLadder(std::move(providers));
}

}  // namespace app
