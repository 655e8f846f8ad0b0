#pragma once

#include <string>
#include <utility>
#include <vector>

#include "domain/Types.h"

namespace core {

class AssetClassifier {
public:
    static std::vector<std::string> defaultMarkers();

    AssetClassifier() : markers_(defaultMarkers()) {}
    explicit AssetClassifier(std::vector<std::string> markers) : markers_(std::move(markers)) {}

    // Crypto when the upper-cased ticker contains any marker as a substring.
    domain::AssetClass classify(const domain::Ticker& ticker) const;

private:
    std::vector<std::string> markers_;
};

}  // namespace core
