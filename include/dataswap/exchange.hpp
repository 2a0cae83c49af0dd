#ifndef DATASWAP_EXCHANGE_HPP
#define DATASWAP_EXCHANGE_HPP

#include <memory>
#include <string>
#include <vector>

#include "dataswap/backend.hpp"
#include "dataswap/config.hpp"
#include "dataswap/liquidity_manager.hpp"
#include "dataswap/pool_store.hpp"
#include "dataswap/positions.hpp"
#include "dataswap/settlement.hpp"
#include "dataswap/swap_executor.hpp"
#include "dataswap/trade_ledger.hpp"

namespace dataswap {

// Exchange owning the pool store, ledger, executors and collaborators
class Exchange {
public:
    // Builds backend and settlement from config
    explicit Exchange(const Config& config);

    // Injected collaborators (tests, embedding)
    Exchange(const Config& config,
             std::shared_ptr<Backend> backend,
             std::shared_ptr<Settlement> settlement,
             std::shared_ptr<PositionLedger> positions);
    ~Exchange();

    // Non-copyable
    Exchange(const Exchange&) = delete;
    Exchange& operator=(const Exchange&) = delete;

    // Swaps
    QuoteResult quote(const std::string& token_in, const std::string& token_out,
                      Amount amount_in) const;
    Trade swap(const SwapRequest& request);
    Trade swap(const std::string& token_in, const std::string& token_out,
               Amount amount_in, Amount min_amount_out, const std::string& trader);

    // Liquidity
    AddLiquidityResult add_liquidity(const std::string& token_a, const std::string& token_b,
                                     Amount amount_a, Amount amount_b,
                                     const std::string& provider);
    RemoveLiquidityResult remove_liquidity(const std::string& token_a, const std::string& token_b,
                                           Amount units, const std::string& provider);
    RemovalQuote liquidity_value(const std::string& token_a, const std::string& token_b,
                                 Amount units) const;
    std::vector<LiquidityPosition> positions(const std::string& provider) const;
    std::vector<LiquidityEvent> liquidity_history(const std::string& provider, size_t limit) const;

    // Pools
    PoolInfo pool_info(const std::string& token_a, const std::string& token_b) const;
    std::vector<PoolInfo> list_pools() const;

    // History
    std::vector<Trade> recent_trades(size_t limit) const;
    std::vector<Trade> trades_for_pool(const std::string& token_a, const std::string& token_b,
                                       size_t limit) const;
    std::vector<Trade> trades_for_trader(const std::string& trader, size_t limit) const;
    std::vector<Trade> trades_for_token(const std::string& token, size_t limit) const;
    MarketStats market_stats(int64_t window_ms) const;

    void set_trade_listener(TradeListener* listener);

    const Config& config() const { return config_; }

    // Statistics
    struct Stats {
        uint64_t total_pools;
        uint64_t total_swaps;
        uint64_t slippage_rejections;
        uint64_t replayed_swaps;
        uint64_t liquidity_deposits;
        uint64_t liquidity_withdrawals;
        uint64_t aborted_mutations;
        uint64_t lock_timeouts;
    };
    Stats get_stats() const;

private:
    void restore_positions();

    Config config_;
    std::shared_ptr<Backend> backend_;
    std::shared_ptr<Settlement> settlement_;
    std::shared_ptr<PositionLedger> positions_;

    std::unique_ptr<PoolStore> store_;
    std::unique_ptr<TradeLedger> ledger_;
    std::unique_ptr<SwapExecutor> swaps_;
    std::unique_ptr<LiquidityManager> liquidity_;
};

} // namespace dataswap

#endif // DATASWAP_EXCHANGE_HPP
