#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace domain {

// Invalid ticker, timeframe, range or configuration value. The only failure
// that aborts a price request.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ProviderError : public std::runtime_error {
public:
    ProviderError(std::string provider, const std::string& message)
        : std::runtime_error(provider + ": " + message), provider_(std::move(provider)) {}

    const std::string& provider() const noexcept { return provider_; }

private:
    std::string provider_;
};

// Timeout, network failure, 5xx or an unusable payload.
class ProviderTransientError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

// Upstream quota exhausted. The ladder advances immediately, no backoff.
class ProviderRateLimited : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class StorageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace domain
