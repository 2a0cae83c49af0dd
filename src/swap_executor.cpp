// =============================================================================
// swap_executor.cpp - Single-swap execution under the pool lock
// =============================================================================

#include "dataswap/swap_executor.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/logging.hpp"
#include "dataswap/math.hpp"
#include "dataswap/pricing.hpp"

#include <spdlog/spdlog.h>

#include <optional>

namespace dataswap {

SwapExecutor::SwapExecutor(PoolStore& store, TradeLedger& ledger, Settlement& settlement,
                           uint32_t fee_bps)
    : store_(store), ledger_(ledger), settlement_(settlement), fee_bps_(fee_bps) {
    if (fee_bps_ >= BPS_DENOMINATOR) {
        throw Error(ErrorCode::InvalidFee, "fee " + std::to_string(fee_bps_) + " bps out of range");
    }
}

void SwapExecutor::validate(const SwapRequest& request) {
    PairKey::of(request.token_in, request.token_out);
    if (request.amount_in <= 0) {
        throw Error(ErrorCode::InsufficientAmount, "amount in must be positive");
    }
    if (request.min_amount_out < 0) {
        throw Error(ErrorCode::InvalidAmount, "minimum amount out must not be negative");
    }
    if (request.trader.empty()) {
        throw Error(ErrorCode::InvalidRequest, "trader is required");
    }
}

// =============================================================================
// Quote
// =============================================================================

QuoteResult SwapExecutor::get_quote(const std::string& token_in, const std::string& token_out,
                                    Amount amount_in) const {
    PairKey key = PairKey::of(token_in, token_out);
    Pool pool = store_.get_pool(key);

    QuoteResult result;
    result.token_in = token_in;
    result.token_out = token_out;
    result.amount_in = amount_in;
    result.reserve_in = pool.reserve_of(token_in);
    result.reserve_out = pool.reserve_of(token_out);
    result.pool_version = pool.version;

    SwapQuote q = pricing::quote_swap(result.reserve_in, result.reserve_out, amount_in, fee_bps_);
    result.amount_out = q.amount_out;
    result.fee = q.fee;
    result.price_impact_pct = q.price_impact_pct;
    result.execution_price = q.execution_price;

    spdlog::debug("quote {} {} -> {} {} (impact {}%, version {})",
                  x18::to_string(amount_in), token_in, x18::to_string(q.amount_out), token_out,
                  x18::to_string(q.price_impact_pct), pool.version);
    return result;
}

// =============================================================================
// Execution
// =============================================================================

Trade SwapExecutor::execute_swap(const std::string& token_in, const std::string& token_out,
                                 Amount amount_in, Amount min_amount_out,
                                 const std::string& trader) {
    SwapRequest request;
    request.token_in = token_in;
    request.token_out = token_out;
    request.amount_in = amount_in;
    request.min_amount_out = min_amount_out;
    request.trader = trader;
    return execute_swap(request);
}

Trade SwapExecutor::execute_swap(const SwapRequest& request) {
    validate(request);
    PairKey key = PairKey::of(request.token_in, request.token_out);
    bool in_is_a = request.token_in == key.token_a;

    std::optional<Trade> replayed;
    Trade trade;

    auto mutate = [&](const Pool& pool) -> std::optional<Pool> {
        // Same pool, same lock: a repeated request id cannot race its original
        replayed = ledger_.find_trade(key, request.trader, request.request_id);
        if (replayed) {
            if (replayed->token_in != request.token_in || replayed->amount_in != request.amount_in) {
                throw Error(ErrorCode::InvalidRequest,
                            "request id " + request.request_id + " was already used for " +
                            x18::to_string(replayed->amount_in) + " " + replayed->token_in +
                            " -> " + replayed->token_out + " (trade #" +
                            std::to_string(replayed->id) + ")");
            }
            return std::nullopt;
        }

        Amount reserve_in = in_is_a ? pool.reserve_a : pool.reserve_b;
        Amount reserve_out = in_is_a ? pool.reserve_b : pool.reserve_a;
        SwapQuote q = pricing::quote_swap(reserve_in, reserve_out, request.amount_in, fee_bps_);

        if (q.amount_out < request.min_amount_out) {
            slippage_rejections_.fetch_add(1, std::memory_order_relaxed);
            throw Error(ErrorCode::SlippageExceeded,
                        "output " + x18::to_string(q.amount_out) + " " + request.token_out +
                        " below minimum " + x18::to_string(request.min_amount_out) +
                        " (reserves " + x18::to_string(reserve_in) + " / " +
                        x18::to_string(reserve_out) + ")");
        }

        Amount next_in = math::checked_add(reserve_in, request.amount_in, ErrorCode::InvalidAmount,
                                           "swap input overflows the pool reserve");
        Amount next_out = reserve_out - q.amount_out;
        if (!math::product_not_decreased(reserve_in, reserve_out, next_in, next_out)) {
            throw Error(ErrorCode::InvariantViolation,
                        "swap of " + x18::to_string(request.amount_in) + " " + request.token_in +
                        " for " + x18::to_string(q.amount_out) + " would shrink k on " + describe(pool));
        }

        SettlementRequest settle;
        settle.kind = SettlementKind::Swap;
        settle.pair_id = key.id();
        settle.account = request.trader;
        settle.legs = {
            TransferLeg{request.token_in, request.amount_in},
            TransferLeg{request.token_out, -q.amount_out},
        };
        std::string reference = settlement_.settle(settle);

        trade.pair_id = key.id();
        trade.token_in = request.token_in;
        trade.token_out = request.token_out;
        trade.amount_in = request.amount_in;
        trade.amount_out = q.amount_out;
        trade.fee = q.fee;
        trade.price = q.execution_price;
        trade.price_impact_pct = q.price_impact_pct;
        trade.trader = request.trader;
        trade.settlement_ref = reference;
        trade.request_id = request.request_id;

        Pool next = pool;
        (in_is_a ? next.reserve_a : next.reserve_b) = next_in;
        (in_is_a ? next.reserve_b : next.reserve_a) = next_out;
        return next;
    };

    // Reserves and the trade become durable together
    auto persist = [&](const Pool& next) {
        trade.timestamp = next.updated_at;
        trade = ledger_.commit(next, trade);
    };
    auto on_commit = [&](const Pool&) { ledger_.publish(trade); };

    try {
        Pool committed = store_.with_pool_lock_persisting(key, mutate, persist, on_commit);
        if (replayed) {
            replays_.fetch_add(1, std::memory_order_relaxed);
            spdlog::info("request {} from {} already executed as trade #{}",
                         request.request_id, request.trader, replayed->id);
            return *replayed;
        }
        executed_.fetch_add(1, std::memory_order_relaxed);
        spdlog::info("swap #{} {} {} -> {} {} by {} ({})", trade.id,
                     x18::to_string(trade.amount_in), trade.token_in,
                     x18::to_string(trade.amount_out), trade.token_out, trade.trader,
                     describe(committed));
        return trade;
    } catch (const Error& e) {
        if (is_user_error(e.code())) {
            spdlog::warn("swap rejected: {}: {}", to_string(e.code()), e.what());
        }
        throw;
    }
}

SwapExecutor::Stats SwapExecutor::get_stats() const {
    return Stats{
        executed_.load(std::memory_order_relaxed),
        slippage_rejections_.load(std::memory_order_relaxed),
        replays_.load(std::memory_order_relaxed),
    };
}

} // namespace dataswap
