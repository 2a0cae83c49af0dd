// =============================================================================
// liquidity_manager.cpp - Deposits, withdrawals, position accounting
// =============================================================================

#include "dataswap/liquidity_manager.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/logging.hpp"
#include "dataswap/math.hpp"
#include "dataswap/pricing.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace dataswap {

LiquidityManager::LiquidityManager(PoolStore& store, PositionLedger& positions,
                                   TradeLedger& ledger, Settlement& settlement,
                                   uint32_t ratio_tolerance_bps)
    : store_(store), positions_(positions), ledger_(ledger), settlement_(settlement),
      ratio_tolerance_bps_(ratio_tolerance_bps) {}

// =============================================================================
// Add
// =============================================================================

AddLiquidityResult LiquidityManager::add_liquidity(const std::string& token_a,
                                                   const std::string& token_b,
                                                   Amount amount_a, Amount amount_b,
                                                   const std::string& provider) {
    PairKey key = PairKey::of(token_a, token_b);
    if (amount_a <= 0 || amount_b <= 0) {
        throw Error(ErrorCode::InsufficientAmount, "both deposit amounts must be positive");
    }
    if (provider.empty()) {
        throw Error(ErrorCode::InvalidRequest, "provider is required");
    }

    // Map caller order onto canonical order
    bool swapped = token_a != key.token_a;
    Amount canon_a = swapped ? amount_b : amount_a;
    Amount canon_b = swapped ? amount_a : amount_b;

    store_.create_pool_if_absent(key);

    LiquidityQuote q;
    std::string reference;
    Amount position_units = 0;

    auto mutate = [&](const Pool& pool) -> std::optional<Pool> {
        q = pricing::quote_liquidity_add(pool.reserve_a, pool.reserve_b, pool.total_units,
                                         canon_a, canon_b, ratio_tolerance_bps_);

        Pool next = pool;
        next.reserve_a = math::checked_add(pool.reserve_a, q.consumed_a, ErrorCode::InvalidAmount,
                                           "deposit overflows reserve");
        next.reserve_b = math::checked_add(pool.reserve_b, q.consumed_b, ErrorCode::InvalidAmount,
                                           "deposit overflows reserve");
        next.total_units = math::checked_add(pool.total_units, q.minted_units,
                                             ErrorCode::InvalidAmount,
                                             "deposit overflows liquidity units");

        SettlementRequest settle;
        settle.kind = SettlementKind::AddLiquidity;
        settle.pair_id = key.id();
        settle.account = provider;
        settle.legs = {
            TransferLeg{key.token_a, q.consumed_a},
            TransferLeg{key.token_b, q.consumed_b},
        };
        reference = settlement_.settle(settle);
        return next;
    };

    LiquidityEvent event;
    auto persist = [&](const Pool& next) {
        event.pair_id = key.id();
        event.action = LiquidityAction::Add;
        event.provider = provider;
        event.amount_a = q.consumed_a;
        event.amount_b = q.consumed_b;
        event.units = q.minted_units;
        event.settlement_ref = reference;
        event = ledger_.commit(next, event);
    };

    // Units are credited only once the deposit is durable
    auto on_commit = [&](const Pool&) {
        positions_.credit(key, provider, q.minted_units);
        position_units = positions_.units_of(key, provider);
        ledger_.publish(event);
    };

    Pool committed = store_.with_pool_lock_persisting(key, mutate, persist, on_commit);
    deposits_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("{} added liquidity, minted {} units ({})", provider,
                 x18::to_string(q.minted_units), describe(committed));

    AddLiquidityResult result;
    result.pair_id = key.id();
    result.minted_units = q.minted_units;
    result.consumed_a = swapped ? q.consumed_b : q.consumed_a;
    result.consumed_b = swapped ? q.consumed_a : q.consumed_b;
    result.refund_a = swapped ? q.refund_b : q.refund_a;
    result.refund_b = swapped ? q.refund_a : q.refund_b;
    result.position_units = position_units;
    result.settlement_ref = reference;
    return result;
}

// =============================================================================
// Remove
// =============================================================================

RemoveLiquidityResult LiquidityManager::remove_liquidity(const std::string& token_a,
                                                         const std::string& token_b,
                                                         Amount units,
                                                         const std::string& provider) {
    PairKey key = PairKey::of(token_a, token_b);
    if (units <= 0) {
        throw Error(ErrorCode::InvalidLiquidityAmount, "units to burn must be positive");
    }
    bool swapped = token_a != key.token_a;

    RemovalQuote q;
    std::string reference;
    Amount position_units = 0;

    auto mutate = [&](const Pool& pool) -> std::optional<Pool> {
        Amount held = positions_.units_of(key, provider);
        if (held < units) {
            throw Error(ErrorCode::InsufficientPosition,
                        provider + " holds " + x18::to_string(held) + " units of " + key.id() +
                        ", requested " + x18::to_string(units));
        }

        q = pricing::quote_liquidity_remove(pool.reserve_a, pool.reserve_b,
                                            pool.total_units, units);

        SettlementRequest settle;
        settle.kind = SettlementKind::RemoveLiquidity;
        settle.pair_id = key.id();
        settle.account = provider;
        settle.legs = {
            TransferLeg{key.token_a, -q.amount_a},
            TransferLeg{key.token_b, -q.amount_b},
        };
        reference = settlement_.settle(settle);

        Pool next = pool;
        next.reserve_a -= q.amount_a;
        next.reserve_b -= q.amount_b;
        next.total_units -= units;
        return next;
    };

    LiquidityEvent event;
    auto persist = [&](const Pool& next) {
        event.pair_id = key.id();
        event.action = LiquidityAction::Remove;
        event.provider = provider;
        event.amount_a = q.amount_a;
        event.amount_b = q.amount_b;
        event.units = units;
        event.settlement_ref = reference;
        event = ledger_.commit(next, event);
    };

    auto on_commit = [&](const Pool&) {
        positions_.debit(key, provider, units);
        position_units = positions_.units_of(key, provider);
        ledger_.publish(event);
    };

    Pool committed = store_.with_pool_lock_persisting(key, mutate, persist, on_commit);
    withdrawals_.fetch_add(1, std::memory_order_relaxed);
    spdlog::info("{} removed {} units ({})", provider, x18::to_string(units), describe(committed));

    RemoveLiquidityResult result;
    result.pair_id = key.id();
    result.amount_a = swapped ? q.amount_b : q.amount_a;
    result.amount_b = swapped ? q.amount_a : q.amount_b;
    result.burned_units = units;
    result.position_units = position_units;
    result.settlement_ref = reference;
    return result;
}

// =============================================================================
// Queries
// =============================================================================

RemovalQuote LiquidityManager::liquidity_value(const std::string& token_a,
                                               const std::string& token_b,
                                               Amount units) const {
    PairKey key = PairKey::of(token_a, token_b);
    Pool pool = store_.get_pool(key);
    RemovalQuote q = pricing::quote_liquidity_remove(pool.reserve_a, pool.reserve_b,
                                                     pool.total_units, units);
    if (token_a != key.token_a) std::swap(q.amount_a, q.amount_b);
    return q;
}

LiquidityManager::Stats LiquidityManager::get_stats() const {
    return Stats{
        deposits_.load(std::memory_order_relaxed),
        withdrawals_.load(std::memory_order_relaxed),
    };
}

} // namespace dataswap
