#include "core/AssetClassifier.h"

#include <algorithm>
#include <cctype>

namespace core {

std::vector<std::string> AssetClassifier::defaultMarkers() {
    return {"BTC", "ETH", "USDT", "USDC", "BNB", "ADA", "SOL", "XRP", "DOT", "DOGE"};
}

domain::AssetClass AssetClassifier::classify(const domain::Ticker& ticker) const {
    std::string upper = ticker;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    for (const auto& marker : markers_) {
        if (!marker.empty() && upper.find(marker) != std::string::npos) {
            return domain::AssetClass::Crypto;
        }
    }
    return domain::AssetClass::Equity;
}

}  // namespace core
