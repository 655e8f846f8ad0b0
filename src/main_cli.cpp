#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "adapters/duckdb/DuckCandleStore.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/memory/MemoryCandleStore.hpp"
#include "app/CacheEngine.hpp"
#include "app/CacheWarmer.hpp"
#include "app/FetchOrchestrator.hpp"
#include "app/JsonReport.hpp"
#include "app/ProviderFactory.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/TimeUtils.h"
#include "domain/Errors.hpp"

namespace {

constexpr int kExitConfigError = 2;

std::optional<domain::TimestampMs> parseBound(const std::string& value, bool endOfDay, const char* flag,
                                              domain::TimestampMs now) {
    if (value.empty()) {
        return std::nullopt;
    }
    auto parsed = core::TimeUtils::parseUtc(value, endOfDay, now);
    if (!parsed) {
        throw domain::ConfigError(std::string{"Invalid "} + flag + " value '" + value +
                                  "' (expected YYYY-MM-DD, YYYY-MM-DDTHH:MM:SSZ or now)");
    }
    return parsed;
}

std::shared_ptr<domain::contracts::ICandleStore> makeStore(const mdc::common::Config& config,
                                                           const domain::TtlPolicy& ttl) {
    if (config.storage == "memory") {
        LOG_INFO("Candle store: in-memory");
        return std::make_shared<adapters::memory::MemoryCandleStore>(ttl);
    }
    auto duckStore = std::make_shared<adapters::duckdb::DuckStore>(config.duckdbPath);
    duckStore->migrate();
    LOG_INFO("Candle store: DuckDB -> " << config.duckdbPath);
    return std::make_shared<adapters::duckdb::DuckCandleStore>(std::move(duckStore), ttl);
}

void printJson(const boost::json::value& value) {
    std::cout << app::serialize_json(value) << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        if (auto eptr = std::current_exception()) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& ex) {
                std::fprintf(stderr, "std::terminate: %s\n", ex.what());
            } catch (...) {
                std::fprintf(stderr, "std::terminate: unknown exception\n");
            }
        } else {
            std::fprintf(stderr, "std::terminate without current_exception\n");
        }
        std::_Exit(1);
    });

    try {
        const auto config = mdc::common::Config::fromArgs(argc, argv);
        mdc::log::setLevel(config.logLevel);

        LOG_INFO("Configuration loaded");
        LOG_INFO("  Log level: " << mdc::log::levelToString(config.logLevel));
        LOG_INFO("  Storage: " << config.storage);
        LOG_INFO("  Fetch threads: " << config.fetchThreads);
        LOG_INFO("  Chunk limit: " << config.chunkLimitDays << " days");
        LOG_INFO("  TTL intraday=" << config.intradayTtlMs << " ms daily=" << config.dailyTtlMs << " ms");

        auto ladder = app::buildProviderLadder(config);
        if (config.listProviders) {
            printJson(app::providers_to_json(ladder));
            return EXIT_SUCCESS;
        }

        const domain::TtlPolicy ttl{config.intradayTtlMs, config.dailyTtlMs};
        auto store = makeStore(config, ttl);

        app::FetchOrchestrator::Options options;
        options.chunkLimitMs = config.chunkLimitDays * domain::kDayMs;
        auto orchestrator = std::make_shared<app::FetchOrchestrator>(std::move(ladder), options);
        auto pool = std::make_shared<core::WorkerPool>(config.fetchThreads);
        const core::SessionFilter sessionFilter{core::SessionWindow{config.sessionOpenMinutes,
                                                                    config.sessionCloseMinutes}};
        app::CacheEngine engine(store, orchestrator, pool, sessionFilter, core::AssetClassifier{config.cryptoMarkers});

        const auto now = core::TimeUtils::nowMs();
        const auto from = parseBound(config.from, false, "--from", now);
        const auto to = parseBound(config.to, true, "--to", now);

        if (config.warm) {
            const auto end = to.value_or(now);
            const auto start = from.value_or(end - app::CacheEngine::kDefaultLookbackMs);
            app::CacheWarmer warmer(engine);
            const auto summary = warmer.run(config.warmSymbols, config.warmTimeframes, start, end);

            boost::json::object out;
            out["pairs"] = summary.pairs;
            out["candles"] = summary.candles;
            out["residual_gaps"] = summary.residualGaps;
            out["failures"] = summary.failures;
            printJson(out);
            return summary.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (config.ticker.empty()) {
            throw domain::ConfigError("--ticker is required (or use --list-providers / --warm)");
        }
        const auto timeframe = domain::timeframe_from_label(config.timeframe);
        if (!timeframe) {
            throw domain::ConfigError("Unsupported timeframe: " + config.timeframe);
        }

        const auto series = engine.getPriceData(config.ticker, *timeframe, from, to);
        auto out = app::series_to_json(series);
        if (config.stats) {
            try {
                out["stats"] = app::stats_to_json(store->stats(series.ticker, series.timeframe),
                                                  mdc::common::metrics::Registry::instance().snapshot());
            } catch (const domain::StorageError& ex) {
                LOG_WARN("Store stats unavailable: " << ex.what());
            }
        }
        printJson(out);
    } catch (const domain::ConfigError& ex) {
        LOG_ERR("Configuration error: " << ex.what());
        return kExitConfigError;
    } catch (const std::exception& ex) {
        LOG_ERR("Fatal error: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
