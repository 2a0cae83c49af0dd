// =============================================================================
// pricing.cpp - Constant-product quotes, liquidity mint/burn math
// =============================================================================

#include "dataswap/pricing.hpp"
#include "dataswap/errors.hpp"
#include "dataswap/math.hpp"

#include <algorithm>

namespace dataswap {
namespace pricing {

using math::mul_div;

// =============================================================================
// Swap
// =============================================================================

SwapQuote quote_swap(Amount reserve_in, Amount reserve_out,
                     Amount amount_in, uint32_t fee_bps) {
    if (fee_bps >= BPS_DENOMINATOR) {
        throw Error(ErrorCode::InvalidFee,
                    "fee " + std::to_string(fee_bps) + " bps out of range");
    }
    if (amount_in <= 0) {
        throw Error(ErrorCode::InsufficientAmount, "amount in must be positive");
    }
    if (reserve_in <= 0 || reserve_out <= 0) {
        throw Error(ErrorCode::InsufficientLiquidity, "pool has no liquidity");
    }

    SwapQuote q;
    q.effective_in = mul_div(amount_in, BPS_DENOMINATOR - fee_bps, BPS_DENOMINATOR);
    q.fee = amount_in - q.effective_in;
    Amount denom = math::checked_add(reserve_in, q.effective_in, ErrorCode::InvalidAmount,
                                     "swap input overflows the pool reserve");
    q.amount_out = mul_div(reserve_out, q.effective_in, denom);

    if (q.amount_out >= reserve_out) {
        throw Error(ErrorCode::InsufficientLiquidity,
                    "output " + x18::to_string(q.amount_out) +
                    " exhausts reserve " + x18::to_string(reserve_out));
    }
    if (q.amount_out <= 0) {
        throw Error(ErrorCode::InsufficientAmount,
                    "amount in " + x18::to_string(amount_in) + " yields no output");
    }

    q.spot_price = mul_div(reserve_out, X18_ONE, reserve_in);
    q.execution_price = mul_div(q.amount_out, X18_ONE, amount_in);
    if (q.spot_price > 0) {
        Amount gap = math::abs128(q.spot_price - q.execution_price);
        q.price_impact_pct = mul_div(gap, 100 * X18_ONE, q.spot_price);
    } else {
        // Spot price below 1e-18: any trade moves it entirely
        q.price_impact_pct = 100 * X18_ONE;
    }
    return q;
}

// =============================================================================
// Liquidity
// =============================================================================

LiquidityQuote quote_liquidity_add(Amount reserve_a, Amount reserve_b,
                                   Amount total_units,
                                   Amount amount_a, Amount amount_b,
                                   uint32_t ratio_tolerance_bps) {
    if (amount_a <= 0 || amount_b <= 0) {
        throw Error(ErrorCode::InsufficientAmount,
                    "both deposit amounts must be positive");
    }

    LiquidityQuote q;

    // First deposit sets the price
    if (total_units == 0) {
        q.minted_units = math::sqrt_product(amount_a, amount_b);
        q.consumed_a = amount_a;
        q.consumed_b = amount_b;
        if (q.minted_units <= 0) {
            throw Error(ErrorCode::InsufficientAmount, "deposit too small to mint units");
        }
        return q;
    }

    if (reserve_a <= 0 || reserve_b <= 0) {
        throw Error(ErrorCode::InvariantViolation,
                    "pool has outstanding units but empty reserves");
    }

    // Consume the ratio-matching share of the over-supplied side
    Amount b_optimal = mul_div(amount_a, reserve_b, reserve_a);
    Amount excess = 0;
    Amount supplied = 0;
    if (b_optimal <= amount_b) {
        q.consumed_a = amount_a;
        q.consumed_b = b_optimal;
        excess = amount_b - b_optimal;
        supplied = amount_b;
    } else {
        Amount a_optimal = mul_div(amount_b, reserve_a, reserve_b);
        q.consumed_a = a_optimal;
        q.consumed_b = amount_b;
        excess = amount_a - a_optimal;
        supplied = amount_a;
    }

    Amount excess_bps = mul_div(excess, BPS_DENOMINATOR, supplied);
    if (excess_bps > static_cast<Amount>(ratio_tolerance_bps)) {
        throw Error(ErrorCode::InvalidLiquidityAmount,
                    "deposit ratio " + x18::to_string(amount_a) + ":" +
                    x18::to_string(amount_b) + " deviates from pool ratio " +
                    x18::to_string(reserve_a) + ":" + x18::to_string(reserve_b) +
                    " by more than " + std::to_string(ratio_tolerance_bps) + " bps");
    }

    q.refund_a = amount_a - q.consumed_a;
    q.refund_b = amount_b - q.consumed_b;
    q.minted_units = std::min(mul_div(q.consumed_a, total_units, reserve_a),
                              mul_div(q.consumed_b, total_units, reserve_b));
    if (q.minted_units <= 0) {
        throw Error(ErrorCode::InsufficientAmount, "deposit too small to mint units");
    }
    return q;
}

RemovalQuote quote_liquidity_remove(Amount reserve_a, Amount reserve_b,
                                    Amount total_units, Amount units) {
    if (units <= 0) {
        throw Error(ErrorCode::InvalidLiquidityAmount, "units to burn must be positive");
    }
    if (units > total_units) {
        throw Error(ErrorCode::InvalidLiquidityAmount,
                    "cannot burn " + x18::to_string(units) + " of " +
                    x18::to_string(total_units) + " outstanding units");
    }

    RemovalQuote q;
    q.amount_a = mul_div(reserve_a, units, total_units);
    q.amount_b = mul_div(reserve_b, units, total_units);
    return q;
}

Amount min_amount_out(Amount quoted_amount_out, uint32_t slippage_bps) {
    if (slippage_bps > MAX_SLIPPAGE_BPS) {
        throw Error(ErrorCode::InvalidRequest,
                    "slippage tolerance " + std::to_string(slippage_bps) +
                    " bps exceeds " + std::to_string(MAX_SLIPPAGE_BPS));
    }
    if (quoted_amount_out <= 0) return 0;
    return mul_div(quoted_amount_out, BPS_DENOMINATOR - slippage_bps, BPS_DENOMINATOR);
}

} // namespace pricing
} // namespace dataswap
