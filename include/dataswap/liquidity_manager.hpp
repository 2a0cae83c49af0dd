#ifndef DATASWAP_LIQUIDITY_MANAGER_HPP
#define DATASWAP_LIQUIDITY_MANAGER_HPP

#include "dataswap/pool_store.hpp"
#include "dataswap/positions.hpp"
#include "dataswap/settlement.hpp"
#include "dataswap/trade_ledger.hpp"
#include "dataswap/types.hpp"

#include <atomic>
#include <string>

namespace dataswap {

// =============================================================================
// LiquidityManager - proportional mint / burn of liquidity units
// =============================================================================
//
// Amounts in and out are expressed in the caller's token order, whichever
// way the pool stores the pair.

class LiquidityManager {
public:
    LiquidityManager(PoolStore& store, PositionLedger& positions, TradeLedger& ledger,
                     Settlement& settlement, uint32_t ratio_tolerance_bps);

    // Non-copyable
    LiquidityManager(const LiquidityManager&) = delete;
    LiquidityManager& operator=(const LiquidityManager&) = delete;

    // Creates the pool on first deposit. Throws InsufficientAmount,
    // InvalidLiquidityAmount, InvalidPair, LockTimeout, SettlementFailed.
    AddLiquidityResult add_liquidity(const std::string& token_a, const std::string& token_b,
                                     Amount amount_a, Amount amount_b,
                                     const std::string& provider);

    // Throws PoolNotFound, InvalidLiquidityAmount, InsufficientPosition,
    // LockTimeout, SettlementFailed.
    RemoveLiquidityResult remove_liquidity(const std::string& token_a, const std::string& token_b,
                                           Amount units, const std::string& provider);

    // Redemption value of units at current reserves; no lock, no mutation
    RemovalQuote liquidity_value(const std::string& token_a, const std::string& token_b,
                                 Amount units) const;

    struct Stats {
        uint64_t deposits;
        uint64_t withdrawals;
    };
    Stats get_stats() const;

private:
    PoolStore& store_;
    PositionLedger& positions_;
    TradeLedger& ledger_;
    Settlement& settlement_;
    uint32_t ratio_tolerance_bps_;

    std::atomic<uint64_t> deposits_{0};
    std::atomic<uint64_t> withdrawals_{0};
};

} // namespace dataswap

#endif // DATASWAP_LIQUIDITY_MANAGER_HPP
