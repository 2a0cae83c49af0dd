// =============================================================================
// sqlite_backend.cpp - Durable pool / trade / liquidity-event storage
// =============================================================================

#include "dataswap/sqlite_backend.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/math.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <map>

namespace dataswap {

namespace {

const char* const kSchema[] = {
    "PRAGMA synchronous=NORMAL;",
    "PRAGMA journal_mode=WAL;",
    "PRAGMA foreign_keys=ON;",

    "CREATE TABLE IF NOT EXISTS pools ("
    "  pair_id      TEXT PRIMARY KEY,"
    "  token_a      TEXT NOT NULL,"
    "  token_b      TEXT NOT NULL,"
    "  reserve_a    TEXT NOT NULL,"
    "  reserve_b    TEXT NOT NULL,"
    "  total_units  TEXT NOT NULL,"
    "  version      INTEGER NOT NULL,"
    "  created_at   INTEGER NOT NULL,"
    "  updated_at   INTEGER NOT NULL"
    ");",

    "CREATE TABLE IF NOT EXISTS trades ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  pair_id        TEXT NOT NULL,"
    "  token_in       TEXT NOT NULL,"
    "  token_out      TEXT NOT NULL,"
    "  amount_in      TEXT NOT NULL,"
    "  amount_out     TEXT NOT NULL,"
    "  fee            TEXT NOT NULL,"
    "  price          TEXT NOT NULL,"
    "  price_impact   TEXT NOT NULL,"
    "  trader         TEXT NOT NULL,"
    "  settlement_ref TEXT NOT NULL,"
    "  request_id     TEXT NOT NULL DEFAULT '',"
    "  executed_at    INTEGER NOT NULL"
    ");",
    "CREATE INDEX IF NOT EXISTS trades_pair_idx ON trades(pair_id);",
    "CREATE INDEX IF NOT EXISTS trades_trader_idx ON trades(trader);",

    "CREATE TABLE IF NOT EXISTS liquidity_events ("
    "  id             INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  pair_id        TEXT NOT NULL,"
    "  action         TEXT NOT NULL,"
    "  provider       TEXT NOT NULL,"
    "  amount_a       TEXT NOT NULL,"
    "  amount_b       TEXT NOT NULL,"
    "  units          TEXT NOT NULL,"
    "  settlement_ref TEXT NOT NULL,"
    "  created_at     INTEGER NOT NULL"
    ");",
    "CREATE INDEX IF NOT EXISTS liquidity_provider_idx ON liquidity_events(provider);",
};

const char* const kTradeColumns =
    "id, pair_id, token_in, token_out, amount_in, amount_out, fee, price, "
    "price_impact, trader, settlement_ref, request_id, executed_at";

[[noreturn]] void storage_error(sqlite3* db, const std::string& what) {
    std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "no connection");
    throw Error(ErrorCode::StorageError, msg);
}

Pool read_pool(const SqliteStatement& st) {
    Pool pool;
    pool.key.token_a = st.get_string(1);
    pool.key.token_b = st.get_string(2);
    pool.reserve_a = st.get_amount(3);
    pool.reserve_b = st.get_amount(4);
    pool.total_units = st.get_amount(5);
    pool.version = static_cast<uint64_t>(st.get_int64(6));
    pool.created_at = st.get_int64(7);
    pool.updated_at = st.get_int64(8);
    return pool;
}

Trade read_trade(const SqliteStatement& st) {
    Trade t;
    t.id = static_cast<uint64_t>(st.get_int64(0));
    t.pair_id = st.get_string(1);
    t.token_in = st.get_string(2);
    t.token_out = st.get_string(3);
    t.amount_in = st.get_amount(4);
    t.amount_out = st.get_amount(5);
    t.fee = st.get_amount(6);
    t.price = st.get_amount(7);
    t.price_impact_pct = st.get_amount(8);
    t.trader = st.get_string(9);
    t.settlement_ref = st.get_string(10);
    t.request_id = st.get_string(11);
    t.timestamp = st.get_int64(12);
    return t;
}

} // anonymous namespace

// =============================================================================
// SqliteStatement
// =============================================================================

SqliteStatement::SqliteStatement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
        storage_error(db_, std::string("prepare failed for '") + sql + "'");
    }
}

SqliteStatement::~SqliteStatement() {
    sqlite3_finalize(stmt_);
}

void SqliteStatement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        storage_error(db_, "bind failed");
    }
}

void SqliteStatement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        storage_error(db_, "bind failed");
    }
}

void SqliteStatement::bind_amount(int index, Amount value) {
    bind(index, x18::to_string(value));
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    storage_error(db_, "step failed");
}

std::string SqliteStatement::get_string(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
}

int64_t SqliteStatement::get_int64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

Amount SqliteStatement::get_amount(int column) const {
    try {
        return x18::from_string(get_string(column));
    } catch (const Error& e) {
        throw Error(ErrorCode::StorageError, std::string("corrupt amount column: ") + e.what());
    }
}

// =============================================================================
// SqliteBackend
// =============================================================================

SqliteBackend::SqliteBackend(const std::string& path) : path_(path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = "cannot open database " + path;
        if (db_) {
            msg += ": ";
            msg += sqlite3_errmsg(db_);
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw Error(ErrorCode::StorageError, msg);
    }
    sqlite3_busy_timeout(db_, 5000);

    try {
        for (const char* sql : kSchema) {
            execute(sql);
        }
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    spdlog::info("sqlite backend opened at {}", path_);
}

SqliteBackend::~SqliteBackend() {
    if (db_) sqlite3_close(db_);
}

void SqliteBackend::execute(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = std::string("exec failed for '") + sql + "': " + (err ? err : "unknown");
        sqlite3_free(err);
        throw Error(ErrorCode::StorageError, msg);
    }
}

std::optional<Pool> SqliteBackend::fetch_pool(const std::string& pair_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_,
        "SELECT pair_id, token_a, token_b, reserve_a, reserve_b, total_units, "
        "version, created_at, updated_at FROM pools WHERE pair_id = ?;");
    st.bind(1, pair_id);
    if (!st.step()) return std::nullopt;
    return read_pool(st);
}

std::vector<Pool> SqliteBackend::fetch_pools() {
    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_,
        "SELECT pair_id, token_a, token_b, reserve_a, reserve_b, total_units, "
        "version, created_at, updated_at FROM pools ORDER BY pair_id;");
    std::vector<Pool> result;
    while (st.step()) {
        result.push_back(read_pool(st));
    }
    return result;
}

void SqliteBackend::write_pool(const Pool& pool) {
    SqliteStatement st(db_,
        "INSERT INTO pools (pair_id, token_a, token_b, reserve_a, reserve_b, total_units, "
        "version, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(pair_id) DO UPDATE SET reserve_a = excluded.reserve_a, "
        "reserve_b = excluded.reserve_b, total_units = excluded.total_units, "
        "version = excluded.version, updated_at = excluded.updated_at;");
    st.bind(1, pool.key.id());
    st.bind(2, pool.key.token_a);
    st.bind(3, pool.key.token_b);
    st.bind_amount(4, pool.reserve_a);
    st.bind_amount(5, pool.reserve_b);
    st.bind_amount(6, pool.total_units);
    st.bind(7, static_cast<int64_t>(pool.version));
    st.bind(8, pool.created_at);
    st.bind(9, pool.updated_at);
    st.step();
}

uint64_t SqliteBackend::insert_trade(const Trade& trade) {
    SqliteStatement st(db_,
        "INSERT INTO trades (pair_id, token_in, token_out, amount_in, amount_out, fee, "
        "price, price_impact, trader, settlement_ref, request_id, executed_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind(1, trade.pair_id);
    st.bind(2, trade.token_in);
    st.bind(3, trade.token_out);
    st.bind_amount(4, trade.amount_in);
    st.bind_amount(5, trade.amount_out);
    st.bind_amount(6, trade.fee);
    st.bind_amount(7, trade.price);
    st.bind_amount(8, trade.price_impact_pct);
    st.bind(9, trade.trader);
    st.bind(10, trade.settlement_ref);
    st.bind(11, trade.request_id);
    st.bind(12, trade.timestamp);
    st.step();
    return static_cast<uint64_t>(sqlite3_last_insert_rowid(db_));
}

uint64_t SqliteBackend::insert_event(const LiquidityEvent& event) {
    SqliteStatement st(db_,
        "INSERT INTO liquidity_events (pair_id, action, provider, amount_a, amount_b, "
        "units, settlement_ref, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
    st.bind(1, event.pair_id);
    st.bind(2, std::string(to_string(event.action)));
    st.bind(3, event.provider);
    st.bind_amount(4, event.amount_a);
    st.bind_amount(5, event.amount_b);
    st.bind_amount(6, event.units);
    st.bind(7, event.settlement_ref);
    st.bind(8, event.timestamp);
    st.step();
    return static_cast<uint64_t>(sqlite3_last_insert_rowid(db_));
}

void SqliteBackend::rollback() {
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        spdlog::error("sqlite rollback failed: {}", err ? err : "unknown");
    }
    sqlite3_free(err);
}

void SqliteBackend::store_pool(const Pool& pool) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_pool(pool);
}

uint64_t SqliteBackend::append_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    return insert_trade(trade);
}

uint64_t SqliteBackend::commit_trade(const Pool& pool, const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        write_pool(pool);
        uint64_t id = insert_trade(trade);
        execute("COMMIT;");
        return id;
    } catch (const Error&) {
        rollback();
        throw;
    }
}

uint64_t SqliteBackend::commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    execute("BEGIN IMMEDIATE;");
    try {
        write_pool(pool);
        uint64_t id = insert_event(event);
        execute("COMMIT;");
        return id;
    } catch (const Error&) {
        rollback();
        throw;
    }
}

std::vector<Trade> SqliteBackend::fetch_trades(const TradeFilter& filter, size_t limit) {
    std::string sql = std::string("SELECT ") + kTradeColumns + " FROM trades WHERE 1 = 1";
    if (filter.pair_id) sql += " AND pair_id = ?";
    if (filter.trader) sql += " AND trader = ?";
    if (filter.token) sql += " AND (token_in = ? OR token_out = ?)";
    if (filter.request_id) sql += " AND request_id = ?";
    if (filter.since) sql += " AND executed_at >= ?";
    sql += " ORDER BY id DESC LIMIT ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_, sql.c_str());
    int index = 1;
    if (filter.pair_id) st.bind(index++, *filter.pair_id);
    if (filter.trader) st.bind(index++, *filter.trader);
    if (filter.token) {
        st.bind(index++, *filter.token);
        st.bind(index++, *filter.token);
    }
    if (filter.request_id) st.bind(index++, *filter.request_id);
    if (filter.since) st.bind(index++, *filter.since);
    st.bind(index, static_cast<int64_t>(limit));

    std::vector<Trade> result;
    while (st.step()) {
        result.push_back(read_trade(st));
    }
    return result;
}

MarketStats SqliteBackend::trade_stats(int64_t since) {
    std::lock_guard<std::mutex> lock(mutex_);
    MarketStats stats;
    {
        SqliteStatement st(db_, "SELECT COUNT(*) FROM trades;");
        if (st.step()) stats.total_trades = static_cast<uint64_t>(st.get_int64(0));
    }

    // Amounts are exact decimal text, so sum them here rather than in SQL
    SqliteStatement st(db_, "SELECT token_in, amount_in FROM trades WHERE executed_at >= ?;");
    st.bind(1, since);
    std::map<std::string, Amount> volume;
    while (st.step()) {
        ++stats.window_trades;
        Amount& v = volume[st.get_string(0)];
        v = math::saturating_add(v, st.get_amount(1));
    }
    stats.volume_by_token.assign(volume.begin(), volume.end());
    return stats;
}

std::vector<LiquidityEvent> SqliteBackend::fetch_liquidity_events(const std::string& provider,
                                                                  size_t limit) {
    std::string sql =
        "SELECT id, pair_id, action, provider, amount_a, amount_b, units, settlement_ref, "
        "created_at FROM liquidity_events";
    if (!provider.empty()) sql += " WHERE provider = ?";
    sql += " ORDER BY id DESC LIMIT ?;";

    std::lock_guard<std::mutex> lock(mutex_);
    SqliteStatement st(db_, sql.c_str());
    int index = 1;
    if (!provider.empty()) st.bind(index++, provider);
    st.bind(index, static_cast<int64_t>(limit));

    std::vector<LiquidityEvent> result;
    while (st.step()) {
        LiquidityEvent e;
        e.id = static_cast<uint64_t>(st.get_int64(0));
        e.pair_id = st.get_string(1);
        e.action = liquidity_action_from_string(st.get_string(2));
        e.provider = st.get_string(3);
        e.amount_a = st.get_amount(4);
        e.amount_b = st.get_amount(5);
        e.units = st.get_amount(6);
        e.settlement_ref = st.get_string(7);
        e.timestamp = st.get_int64(8);
        result.push_back(std::move(e));
    }
    return result;
}

} // namespace dataswap
