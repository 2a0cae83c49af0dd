#ifndef DATASWAP_SQLITE_BACKEND_HPP
#define DATASWAP_SQLITE_BACKEND_HPP

#include "dataswap/backend.hpp"

#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace dataswap {

// =============================================================================
// SQLite Statement (RAII prepare / bind / step / finalize)
// =============================================================================

class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const char* sql);
    ~SqliteStatement();

    // Non-copyable
    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bind(int index, const std::string& value);
    void bind(int index, int64_t value);
    void bind_amount(int index, Amount value);  // Stored as decimal text

    // Returns true while a row is available
    bool step();

    std::string get_string(int column) const;
    int64_t get_int64(int column) const;
    Amount get_amount(int column) const;

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

// =============================================================================
// SQLite Backend
// =============================================================================

class SqliteBackend : public Backend {
public:
    // Opens (or creates) the database at path; ":memory:" is accepted.
    explicit SqliteBackend(const std::string& path);
    ~SqliteBackend() override;

    // Non-copyable
    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    std::string name() const override { return "sqlite:" + path_; }

    std::optional<Pool> fetch_pool(const std::string& pair_id) override;
    std::vector<Pool> fetch_pools() override;
    void store_pool(const Pool& pool) override;

    uint64_t append_trade(const Trade& trade) override;
    std::vector<Trade> fetch_trades(const TradeFilter& filter, size_t limit) override;
    MarketStats trade_stats(int64_t since) override;

    std::vector<LiquidityEvent> fetch_liquidity_events(const std::string& provider,
                                                       size_t limit) override;

    // BEGIN IMMEDIATE ... COMMIT; rolled back on any failure
    uint64_t commit_trade(const Pool& pool, const Trade& trade) override;
    uint64_t commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) override;

private:
    void execute(const char* sql);
    void rollback();

    // Callers hold mutex_
    void write_pool(const Pool& pool);
    uint64_t insert_trade(const Trade& trade);
    uint64_t insert_event(const LiquidityEvent& event);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;  // One connection, serialized
};

} // namespace dataswap

#endif // DATASWAP_SQLITE_BACKEND_HPP
