#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include "domain/Errors.hpp"

namespace mdc::common {
namespace {

using domain::ConfigError;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string toUpper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto notSpace = [](unsigned char ch) { return std::isspace(ch) == 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), notSpace));
    value.erase(std::find_if(value.rbegin(), value.rend(), notSpace).base(), value.end());
    return value;
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::int64_t parsePositive(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("not a positive integer");
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError("Invalid value for " + label + ": " + value);
    }
}

std::string parseStorage(const std::string& value) {
    const auto normalized = toLower(trim(value));
    if (normalized == "duck" || normalized == "memory") {
        return normalized;
    }
    throw ConfigError("Invalid storage backend: " + value);
}

// "HH:MM" to minutes after midnight.
int parseClock(const std::string& value, const std::string& label) {
    const auto text = trim(value);
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 3 != text.size()) {
        throw ConfigError("Invalid time of day for " + label + ": " + value);
    }
    try {
        const int hours = std::stoi(text.substr(0, colon));
        const int minutes = std::stoi(text.substr(colon + 1));
        if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
            throw std::out_of_range("clock");
        }
        return hours * 60 + minutes;
    } catch (const std::exception&) {
        throw ConfigError("Invalid time of day for " + label + ": " + value);
    }
}

std::vector<std::string> parseNameList(const std::string& value, const std::string& label) {
    auto list = parseCsvList(value);
    for (auto& item : list) {
        item = toLower(item);
    }
    if (list.empty()) {
        throw ConfigError(label + " must name at least one entry");
    }
    return list;
}

std::vector<std::string> parseMarkerList(const std::string& value) {
    auto list = parseCsvList(value);
    for (auto& item : list) {
        item = toUpper(item);
    }
    return list;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

std::string envValue(const char* name) {
    if (const char* value = std::getenv(name)) {
        return trim(value);
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (auto env = envValue("LOG_LEVEL"); !env.empty()) {
        config.logLevel = mdc::log::levelFromString(toLower(env));
    }
    if (auto env = envValue("MDC_STORAGE"); !env.empty()) {
        config.storage = parseStorage(env);
    }
    if (auto env = envValue("DUCKDB_PATH"); !env.empty()) {
        config.duckdbPath = env;
    }
    if (auto env = envValue("MDC_FETCH_THREADS"); !env.empty()) {
        config.fetchThreads = static_cast<std::size_t>(parsePositive(env, "MDC_FETCH_THREADS"));
    }
    if (auto env = envValue("MDC_CHUNK_LIMIT_DAYS"); !env.empty()) {
        config.chunkLimitDays = parsePositive(env, "MDC_CHUNK_LIMIT_DAYS");
    }
    if (auto env = envValue("MDC_TTL_INTRADAY_MS"); !env.empty()) {
        config.intradayTtlMs = parsePositive(env, "MDC_TTL_INTRADAY_MS");
    }
    if (auto env = envValue("MDC_TTL_DAILY_MS"); !env.empty()) {
        config.dailyTtlMs = parsePositive(env, "MDC_TTL_DAILY_MS");
    }
    if (auto env = envValue("MDC_SESSION_OPEN"); !env.empty()) {
        config.sessionOpenMinutes = parseClock(env, "MDC_SESSION_OPEN");
    }
    if (auto env = envValue("MDC_SESSION_CLOSE"); !env.empty()) {
        config.sessionCloseMinutes = parseClock(env, "MDC_SESSION_CLOSE");
    }
    if (auto env = envValue("MDC_EQUITY_PROVIDERS"); !env.empty()) {
        config.equityProviders = parseNameList(env, "MDC_EQUITY_PROVIDERS");
    }
    if (auto env = envValue("MDC_CRYPTO_PROVIDERS"); !env.empty()) {
        config.cryptoProviders = parseNameList(env, "MDC_CRYPTO_PROVIDERS");
    }
    if (auto env = envValue("MDC_CRYPTO_MARKERS"); !env.empty()) {
        config.cryptoMarkers = parseMarkerList(env);
    }
    config.alphaVantageApiKey = envValue("ALPHA_VANTAGE_API_KEY");
    config.coingeckoApiKey = envValue("COINGECKO_API_KEY");

    if (auto arg = valueFromArgs(argc, argv, "--log-level"); !arg.empty()) {
        config.logLevel = mdc::log::levelFromString(toLower(arg));
    }
    if (auto arg = valueFromArgs(argc, argv, "--storage"); !arg.empty()) {
        config.storage = parseStorage(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--duckdb"); !arg.empty()) {
        config.duckdbPath = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--fetch-threads"); !arg.empty()) {
        config.fetchThreads = static_cast<std::size_t>(parsePositive(arg, "--fetch-threads"));
    }
    if (auto arg = valueFromArgs(argc, argv, "--chunk-limit-days"); !arg.empty()) {
        config.chunkLimitDays = parsePositive(arg, "--chunk-limit-days");
    }
    if (auto arg = valueFromArgs(argc, argv, "--ttl-intraday-ms"); !arg.empty()) {
        config.intradayTtlMs = parsePositive(arg, "--ttl-intraday-ms");
    }
    if (auto arg = valueFromArgs(argc, argv, "--ttl-daily-ms"); !arg.empty()) {
        config.dailyTtlMs = parsePositive(arg, "--ttl-daily-ms");
    }
    if (auto arg = valueFromArgs(argc, argv, "--session-open"); !arg.empty()) {
        config.sessionOpenMinutes = parseClock(arg, "--session-open");
    }
    if (auto arg = valueFromArgs(argc, argv, "--session-close"); !arg.empty()) {
        config.sessionCloseMinutes = parseClock(arg, "--session-close");
    }
    if (auto arg = valueFromArgs(argc, argv, "--equity-providers"); !arg.empty()) {
        config.equityProviders = parseNameList(arg, "--equity-providers");
    }
    if (auto arg = valueFromArgs(argc, argv, "--crypto-providers"); !arg.empty()) {
        config.cryptoProviders = parseNameList(arg, "--crypto-providers");
    }
    if (auto arg = valueFromArgs(argc, argv, "--crypto-markers"); !arg.empty()) {
        config.cryptoMarkers = parseMarkerList(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--alphavantage-key"); !arg.empty()) {
        config.alphaVantageApiKey = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--coingecko-key"); !arg.empty()) {
        config.coingeckoApiKey = trim(arg);
    }

    if (auto arg = valueFromArgs(argc, argv, "--ticker"); !arg.empty()) {
        config.ticker = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--timeframe"); !arg.empty()) {
        config.timeframe = toLower(trim(arg));
    }
    if (auto arg = valueFromArgs(argc, argv, "--from"); !arg.empty()) {
        config.from = trim(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--to"); !arg.empty()) {
        config.to = trim(arg);
    }

    config.listProviders = hasFlag(argc, argv, "--list-providers");
    config.warm = hasFlag(argc, argv, "--warm");
    config.stats = hasFlag(argc, argv, "--stats");
    if (auto arg = valueFromArgs(argc, argv, "--symbols"); !arg.empty()) {
        config.warmSymbols = parseCsvList(arg);
    }
    if (auto arg = valueFromArgs(argc, argv, "--timeframes"); !arg.empty()) {
        auto list = parseCsvList(arg);
        if (!list.empty()) {
            config.warmTimeframes = std::move(list);
        }
    }

    if (config.sessionOpenMinutes >= config.sessionCloseMinutes) {
        throw ConfigError("Session open must precede session close");
    }
    if (config.warm && config.warmSymbols.empty()) {
        throw ConfigError("--warm requires --symbols");
    }

    if (config.storage == "duck") {
        const std::filesystem::path duckPath{config.duckdbPath};
        const auto parentDir = duckPath.parent_path();
        if (!parentDir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parentDir, ec);
            if (ec) {
                throw ConfigError("Cannot create DuckDB directory (" + parentDir.string() + "): " +
                                  ec.message());
            }
        }
        LOG_INFO("DuckDB path: " << duckPath.string());
    }

    return config;
}

}  // namespace mdc::common
