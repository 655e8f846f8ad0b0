#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr auto kCreatePriceCacheTable = R"SQL(
    CREATE TABLE IF NOT EXISTS price_cache (
        ticker TEXT NOT NULL,
        timeframe TEXT NOT NULL,
        ts BIGINT NOT NULL,
        open DECIMAL(18,4),
        high DECIMAL(18,4),
        low DECIMAL(18,4),
        close DECIMAL(18,4),
        volume DECIMAL(18,4),
        fetched_at BIGINT NOT NULL,
        PRIMARY KEY(ticker, timeframe, ts)
    )
)SQL";

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {
    if (dbPath_ != kInMemory) {
        const fs::path path{dbPath_};
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                throw domain::StorageError("DuckStore: unable to create directory '" +
                                           path.parent_path().string() + "': " + ec.message());
            }
        }
    }

    try {
        database_ = std::make_unique<::duckdb::DuckDB>(dbPath_ == kInMemory ? nullptr : dbPath_.c_str());
    } catch (const std::exception& ex) {
        throw domain::StorageError("DuckStore: cannot open '" + dbPath_ + "': " + ex.what());
    }
}

DuckStore::~DuckStore() = default;

std::unique_ptr<::duckdb::Connection> DuckStore::connect() const {
    return std::make_unique<::duckdb::Connection>(*database_);
}

void DuckStore::migrate() {
    auto connection = connect();
    auto result = connection->Query(kCreatePriceCacheTable);
    if (!result || result->HasError()) {
        const std::string errorMessage =
            result ? result->GetError() : std::string("unknown error creating price_cache table");
        throw domain::StorageError("DuckStore: migration failed: " + errorMessage);
    }
    LOG_INFO("DuckStore migration finished for " << dbPath_);
}

}  // namespace adapters::duckdb
