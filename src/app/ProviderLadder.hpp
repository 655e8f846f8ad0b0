#pragma once

#include <memory>
#include <vector>

#include "domain/Ports.hpp"

namespace app {

using ProviderPtr = std::shared_ptr<domain::contracts::IProvider>;

// Immutable provider set. The ladder for an asset class is every provider
// supporting it, ascending by descriptor priority (ties keep insertion order).
class ProviderLadder {
public:
    ProviderLadder() = default;
    explicit ProviderLadder(std::vector<ProviderPtr> providers);

    std::vector<ProviderPtr> forAssetClass(domain::AssetClass assetClass) const;

    const std::vector<ProviderPtr>& providers() const noexcept { return providers_; }
    bool empty() const noexcept { return providers_.empty(); }

private:
    std::vector<ProviderPtr> providers_;
};

}  // namespace app
