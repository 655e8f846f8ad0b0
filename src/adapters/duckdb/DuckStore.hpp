#pragma once

#include <memory>
#include <string>

namespace duckdb {
class DuckDB;
class Connection;
}  // namespace duckdb

namespace adapters::duckdb {

// Owns the process-wide DuckDB database. Callers open one Connection per
// operation; the instance itself is safe to share between threads.
class DuckStore {
public:
    static constexpr const char* kInMemory = ":memory:";

    explicit DuckStore(std::string dbPath = "data/price_cache.duckdb");
    ~DuckStore();

    DuckStore(const DuckStore&) = delete;
    DuckStore& operator=(const DuckStore&) = delete;

    // Creates price_cache when missing. @throws domain::StorageError
    void migrate();

    std::unique_ptr<::duckdb::Connection> connect() const;

    const std::string& path() const noexcept { return dbPath_; }

private:
    std::string dbPath_;
    std::unique_ptr<::duckdb::DuckDB> database_;
};

}  // namespace adapters::duckdb
