#ifndef DATASWAP_TRADE_LEDGER_HPP
#define DATASWAP_TRADE_LEDGER_HPP

#include "dataswap/backend.hpp"
#include "dataswap/types.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dataswap {

// =============================================================================
// Trade Listener
// =============================================================================

class TradeListener {
public:
    virtual ~TradeListener() = default;
    virtual void on_trade(const Trade& trade) = 0;
    virtual void on_liquidity(const LiquidityEvent& event) = 0;
};

class NullTradeListener : public TradeListener {
public:
    void on_trade(const Trade&) override {}
    void on_liquidity(const LiquidityEvent&) override {}
};

// =============================================================================
// TradeLedger - append-only history of swaps and liquidity events
// =============================================================================

class TradeLedger {
public:
    static constexpr size_t DEFAULT_RECENT_LIMIT = 20;
    static constexpr size_t DEFAULT_QUERY_LIMIT = 50;

    explicit TradeLedger(std::shared_ptr<Backend> backend, size_t max_limit = 500);

    // Non-copyable
    TradeLedger(const TradeLedger&) = delete;
    TradeLedger& operator=(const TradeLedger&) = delete;

    // Appends, notifies, and returns the stored record with its sequence id
    Trade record(const Trade& trade);

    // Durably writes the pool state together with the record that produced
    // it. Listeners are not told until publish(), after the state is visible.
    Trade commit(const Pool& pool, const Trade& trade);
    LiquidityEvent commit(const Pool& pool, const LiquidityEvent& event);

    void publish(const Trade& trade);
    void publish(const LiquidityEvent& event);

    // All queries return most recent first
    std::vector<Trade> recent_trades(size_t limit = DEFAULT_RECENT_LIMIT) const;
    std::vector<Trade> trades_for_pool(const PairKey& key, size_t limit = DEFAULT_QUERY_LIMIT) const;
    std::vector<Trade> trades_for_trader(const std::string& trader,
                                         size_t limit = DEFAULT_QUERY_LIMIT) const;
    std::vector<Trade> trades_for_token(const std::string& token,
                                        size_t limit = DEFAULT_QUERY_LIMIT) const;
    // Request ids are scoped to one trader on one pool
    std::optional<Trade> find_trade(const PairKey& key, const std::string& trader,
                                    const std::string& request_id) const;

    std::vector<LiquidityEvent> liquidity_history(const std::string& provider,
                                                  size_t limit = DEFAULT_QUERY_LIMIT) const;

    // Trade counts and per-token input volume over the trailing window
    MarketStats market_stats(int64_t window_ms = 24 * 60 * 60 * 1000) const;

    void set_listener(TradeListener* listener);

    size_t max_limit() const { return max_limit_; }

private:
    size_t clamp(size_t limit) const;

    std::shared_ptr<Backend> backend_;
    size_t max_limit_;
    std::atomic<TradeListener*> listener_;
    NullTradeListener null_listener_;
};

} // namespace dataswap

#endif // DATASWAP_TRADE_LEDGER_HPP
