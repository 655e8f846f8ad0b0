#include "adapters/duckdb/DuckCandleStore.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace adapters::duckdb {
namespace {

// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr std::uint8_t kDecimalWidth = 18;
constexpr std::uint8_t kDecimalScale = static_cast<std::uint8_t>(domain::Decimal::kScale);

constexpr auto kSelectFresh =
    "SELECT ts, CAST(open AS VARCHAR), CAST(high AS VARCHAR), CAST(low AS VARCHAR), "
    "CAST(close AS VARCHAR), CAST(volume AS VARCHAR) FROM price_cache "
    "WHERE ticker = ? AND timeframe = ? AND ts >= ? AND ts <= ? AND fetched_at > ? "
    "ORDER BY ts ASC";

constexpr auto kUpsert =
    "INSERT OR REPLACE INTO price_cache "
    "(ticker, timeframe, ts, open, high, low, close, volume, fetched_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

constexpr auto kStats =
    "SELECT COUNT(*), MIN(ts), MAX(ts) FROM price_cache WHERE ticker = ? AND timeframe = ?";

::duckdb::Value decimalValue(const domain::Decimal& value) {
    return ::duckdb::Value::DECIMAL(value.raw(), kDecimalWidth, kDecimalScale);
}

domain::Decimal decimalFrom(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return domain::Decimal{};
    }
    return domain::Decimal::parse(value.ToString());
}

std::unique_ptr<::duckdb::PreparedStatement> prepare(::duckdb::Connection& connection, const char* sql) {
    auto statement = connection.Prepare(sql);
    if (!statement || statement->HasError()) {
        const std::string errorMessage =
            statement ? statement->GetError() : std::string{"failed to prepare statement"};
        throw domain::StorageError("DuckCandleStore prepare failed: " + errorMessage);
    }
    return statement;
}

void bindRecord(DuckdbValueVector& parameters, const domain::CacheRecord& record) {
    const auto& candle = record.candle;
    parameters.clear();
    parameters.emplace_back(candle.ticker);
    parameters.emplace_back(domain::timeframe_label(candle.timeframe));
    parameters.emplace_back(::duckdb::Value::BIGINT(candle.ts));
    parameters.emplace_back(decimalValue(candle.open));
    parameters.emplace_back(decimalValue(candle.high));
    parameters.emplace_back(decimalValue(candle.low));
    parameters.emplace_back(decimalValue(candle.close));
    parameters.emplace_back(decimalValue(candle.volume));
    parameters.emplace_back(::duckdb::Value::BIGINT(record.fetchedAt));
}

// Empty string on success, the DuckDB error otherwise.
std::string executeRecord(::duckdb::PreparedStatement& statement,
                          DuckdbValueVector& parameters,
                          const domain::CacheRecord& record) {
    bindRecord(parameters, record);
    auto result = statement.Execute(parameters);
    if (!result || result->HasError()) {
        return result ? result->GetError() : std::string{"failed to execute statement"};
    }
    return {};
}

}  // namespace

DuckCandleStore::DuckCandleStore(std::shared_ptr<DuckStore> store, domain::TtlPolicy ttl)
    : store_(std::move(store)), ttl_(ttl) {
    if (!store_) {
        throw std::invalid_argument("DuckCandleStore requires a DuckStore");
    }
}

std::vector<domain::Candle> DuckCandleStore::readFresh(const domain::Ticker& ticker,
                                                       domain::Timeframe timeframe,
                                                       domain::TimestampMs start,
                                                       domain::TimestampMs end,
                                                       domain::TimestampMs now) const {
    if (ticker.empty() || start > end) {
        return {};
    }

    try {
        auto connection = store_->connect();
        auto statement = prepare(*connection, kSelectFresh);

        DuckdbValueVector parameters;
        parameters.reserve(5);
        parameters.emplace_back(ticker);
        parameters.emplace_back(domain::timeframe_label(timeframe));
        parameters.emplace_back(::duckdb::Value::BIGINT(start));
        parameters.emplace_back(::duckdb::Value::BIGINT(end));
        parameters.emplace_back(::duckdb::Value::BIGINT(now - ttl_.ttlFor(timeframe)));

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            throw domain::StorageError("DuckCandleStore read failed: " + errorMessage);
        }

        std::vector<domain::Candle> candles;
        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                const auto tsValue = chunk->GetValue(0, row);
                if (tsValue.IsNull()) {
                    continue;
                }
                domain::Candle candle;
                candle.ticker = ticker;
                candle.timeframe = timeframe;
                candle.ts = tsValue.GetValue<std::int64_t>();
                candle.open = decimalFrom(chunk->GetValue(1, row));
                candle.high = decimalFrom(chunk->GetValue(2, row));
                candle.low = decimalFrom(chunk->GetValue(3, row));
                candle.close = decimalFrom(chunk->GetValue(4, row));
                candle.volume = decimalFrom(chunk->GetValue(5, row));
                candles.push_back(std::move(candle));
            }
        }
        return candles;
    } catch (const domain::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::StorageError(std::string{"DuckCandleStore read exception: "} + ex.what());
    }
}

void DuckCandleStore::upsert(const std::vector<domain::CacheRecord>& records) {
    if (records.empty()) {
        return;
    }

    auto connection = store_->connect();
    auto statement = prepare(*connection, kUpsert);
    DuckdbValueVector parameters;
    parameters.reserve(9);

    std::string batchError;
    try {
        connection->BeginTransaction();
        for (const auto& record : records) {
            batchError = executeRecord(*statement, parameters, record);
            if (!batchError.empty()) {
                break;
            }
        }
        if (batchError.empty()) {
            connection->Commit();
            LOG_DEBUG("DuckCandleStore upserted " << records.size() << " rows");
            return;
        }
    } catch (const std::exception& ex) {
        batchError = ex.what();
    }

    try {
        if (connection->HasActiveTransaction()) {
            connection->Rollback();
        }
    } catch (const std::exception& ex) {
        LOG_WARN("DuckCandleStore rollback failed: " << ex.what());
    }

    LOG_WARN("DuckCandleStore batch of " << records.size() << " rows failed (" << batchError
                                         << "); retrying row by row");

    std::size_t failed = 0;
    std::string firstError;
    for (const auto& record : records) {
        std::string rowError;
        try {
            rowError = executeRecord(*statement, parameters, record);
        } catch (const std::exception& ex) {
            rowError = ex.what();
        }
        if (!rowError.empty()) {
            if (failed == 0) {
                firstError = record.candle.ticker + "@" + std::to_string(record.candle.ts) + ": " + rowError;
            }
            ++failed;
        }
    }

    if (failed > 0) {
        throw domain::StorageError("DuckCandleStore failed to write " + std::to_string(failed) + " of " +
                                   std::to_string(records.size()) + " rows; first error: " + firstError);
    }
}

domain::contracts::StoreStats DuckCandleStore::stats(const domain::Ticker& ticker,
                                                     domain::Timeframe timeframe) const {
    domain::contracts::StoreStats stats;
    try {
        auto connection = store_->connect();
        auto statement = prepare(*connection, kStats);
        DuckdbValueVector parameters;
        parameters.emplace_back(ticker);
        parameters.emplace_back(domain::timeframe_label(timeframe));

        auto result = statement->Execute(parameters);
        if (!result || result->HasError()) {
            const std::string errorMessage = result ? result->GetError() : std::string{"unknown query error"};
            throw domain::StorageError("DuckCandleStore stats failed: " + errorMessage);
        }
        if (auto chunk = result->Fetch(); chunk && chunk->size() > 0) {
            stats.rows = static_cast<std::size_t>(chunk->GetValue(0, 0).GetValue<std::int64_t>());
            if (const auto minValue = chunk->GetValue(1, 0); !minValue.IsNull()) {
                stats.minTs = minValue.GetValue<std::int64_t>();
            }
            if (const auto maxValue = chunk->GetValue(2, 0); !maxValue.IsNull()) {
                stats.maxTs = maxValue.GetValue<std::int64_t>();
            }
        }
    } catch (const domain::StorageError&) {
        throw;
    } catch (const std::exception& ex) {
        throw domain::StorageError(std::string{"DuckCandleStore stats exception: "} + ex.what());
    }
    return stats;
}

}  // namespace adapters::duckdb
