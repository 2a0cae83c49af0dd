#ifndef DATASWAP_SWAP_EXECUTOR_HPP
#define DATASWAP_SWAP_EXECUTOR_HPP

#include "dataswap/pool_store.hpp"
#include "dataswap/settlement.hpp"
#include "dataswap/trade_ledger.hpp"
#include "dataswap/types.hpp"

#include <atomic>
#include <string>

namespace dataswap {

struct SwapRequest {
    std::string token_in;
    std::string token_out;
    Amount amount_in = 0;
    Amount min_amount_out = 0;
    std::string trader;
    std::string request_id;  // Optional; repeats return the recorded trade
};

// =============================================================================
// SwapExecutor - quote, validate, commit
// =============================================================================

class SwapExecutor {
public:
    SwapExecutor(PoolStore& store, TradeLedger& ledger, Settlement& settlement,
                 uint32_t fee_bps);

    // Non-copyable
    SwapExecutor(const SwapExecutor&) = delete;
    SwapExecutor& operator=(const SwapExecutor&) = delete;

    // Advisory quote against an unlocked snapshot
    QuoteResult get_quote(const std::string& token_in, const std::string& token_out,
                          Amount amount_in) const;

    // Recomputes under the pool lock and commits, or throws with no state
    // change: SlippageExceeded, InsufficientLiquidity, InsufficientAmount,
    // PoolNotFound, InvalidPair, LockTimeout, SettlementFailed,
    // InvariantViolation.
    Trade execute_swap(const SwapRequest& request);
    Trade execute_swap(const std::string& token_in, const std::string& token_out,
                       Amount amount_in, Amount min_amount_out, const std::string& trader);

    uint32_t fee_bps() const { return fee_bps_; }

    struct Stats {
        uint64_t executed;
        uint64_t slippage_rejections;
        uint64_t replays;
    };
    Stats get_stats() const;

private:
    static void validate(const SwapRequest& request);

    PoolStore& store_;
    TradeLedger& ledger_;
    Settlement& settlement_;
    uint32_t fee_bps_;

    std::atomic<uint64_t> executed_{0};
    std::atomic<uint64_t> slippage_rejections_{0};
    std::atomic<uint64_t> replays_{0};
};

} // namespace dataswap

#endif // DATASWAP_SWAP_EXECUTOR_HPP
