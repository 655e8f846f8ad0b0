#include "app/ProviderLadder.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace app {

ProviderLadder::ProviderLadder(std::vector<ProviderPtr> providers) : providers_(std::move(providers)) {
    for (const auto& provider : providers_) {
        if (!provider) {
            throw std::invalid_argument("ProviderLadder received a null provider");
        }
    }
}

std::vector<ProviderPtr> ProviderLadder::forAssetClass(domain::AssetClass assetClass) const {
    std::vector<ProviderPtr> ladder;
    for (const auto& provider : providers_) {
        if (provider->descriptor().supports(assetClass)) {
            ladder.push_back(provider);
        }
    }
    std::stable_sort(ladder.begin(), ladder.end(), [](const ProviderPtr& lhs, const ProviderPtr& rhs) {
        return lhs->descriptor().priority < rhs->descriptor().priority;
    });
    return ladder;
}

}  // namespace app
