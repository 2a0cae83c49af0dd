#ifndef DATASWAP_BACKEND_HPP
#define DATASWAP_BACKEND_HPP

#include "dataswap/config.hpp"
#include "dataswap/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dataswap {

// =============================================================================
// Trade Query Filter
// =============================================================================

struct TradeFilter {
    std::optional<std::string> pair_id;
    std::optional<std::string> trader;
    std::optional<std::string> token;       // Matches token_in or token_out
    std::optional<std::string> request_id;
    std::optional<int64_t> since;           // Unix ms, inclusive

    bool matches(const Trade& t) const;
};

// =============================================================================
// Backend Interface
// =============================================================================
//
// Durable storage for pools, trades and liquidity events. Implementations are
// internally synchronized. Any failure is reported as Error(StorageError).

class Backend {
public:
    virtual ~Backend() = default;

    virtual std::string name() const = 0;

    virtual std::optional<Pool> fetch_pool(const std::string& pair_id) = 0;
    virtual std::vector<Pool> fetch_pools() = 0;
    virtual void store_pool(const Pool& pool) = 0;

    // Append a trade and return its assigned sequence id
    virtual uint64_t append_trade(const Trade& trade) = 0;
    // Most recent first
    virtual std::vector<Trade> fetch_trades(const TradeFilter& filter, size_t limit) = 0;
    // Total trade count, plus count and per-token input volume since `since`
    // (volumes saturate). window_ms and total_pools are left to the caller.
    virtual MarketStats trade_stats(int64_t since) = 0;

    // Most recent first; empty provider matches all
    virtual std::vector<LiquidityEvent> fetch_liquidity_events(const std::string& provider,
                                                               size_t limit) = 0;

    // Store the pool and append its record as one unit: either both are
    // durable or neither is. Returns the record's sequence id.
    virtual uint64_t commit_trade(const Pool& pool, const Trade& trade) = 0;
    virtual uint64_t commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) = 0;
};

// =============================================================================
// In-Memory Backend
// =============================================================================

class MemoryBackend : public Backend {
public:
    MemoryBackend() = default;

    std::string name() const override { return "memory"; }

    std::optional<Pool> fetch_pool(const std::string& pair_id) override;
    std::vector<Pool> fetch_pools() override;
    void store_pool(const Pool& pool) override;

    uint64_t append_trade(const Trade& trade) override;
    std::vector<Trade> fetch_trades(const TradeFilter& filter, size_t limit) override;
    MarketStats trade_stats(int64_t since) override;

    std::vector<LiquidityEvent> fetch_liquidity_events(const std::string& provider,
                                                       size_t limit) override;

    uint64_t commit_trade(const Pool& pool, const Trade& trade) override;
    uint64_t commit_liquidity_event(const Pool& pool, const LiquidityEvent& event) override;

private:
    // Callers hold mutex_
    uint64_t push_trade(const Trade& trade);
    uint64_t push_event(const LiquidityEvent& event);

    std::mutex mutex_;
    std::map<std::string, Pool> pools_;
    std::vector<Trade> trades_;
    std::vector<LiquidityEvent> events_;
};

// Select a backend by StoreConfig::backend ("memory" or "sqlite").
// Throws Error(InvalidConfig) for an unknown name.
std::shared_ptr<Backend> make_backend(const StoreConfig& config);

} // namespace dataswap

#endif // DATASWAP_BACKEND_HPP
