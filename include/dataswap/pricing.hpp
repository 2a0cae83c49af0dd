#ifndef DATASWAP_PRICING_HPP
#define DATASWAP_PRICING_HPP

#include "dataswap/types.hpp"

namespace dataswap {
namespace pricing {

// =============================================================================
// Constant-Product Pricing (x * y = k)
// =============================================================================
//
// Pure functions over a reserve snapshot. No locking, no I/O. Every rounding
// step favours the pool: outputs round down and fees round up.

constexpr uint32_t DEFAULT_FEE_BPS = 30;               // 0.30%
constexpr uint32_t DEFAULT_RATIO_TOLERANCE_BPS = 100;  // 1.00%
constexpr uint32_t MAX_SLIPPAGE_BPS = 5000;            // 50%

// Quote a swap of amount_in against (reserve_in, reserve_out).
// Throws InsufficientAmount, InsufficientLiquidity or InvalidFee.
SwapQuote quote_swap(Amount reserve_in, Amount reserve_out,
                     Amount amount_in, uint32_t fee_bps);

// Units minted for a deposit. An empty pool (total_units == 0) mints
// sqrt(amount_a * amount_b). Otherwise the deposit must match the pool ratio
// within ratio_tolerance_bps; the excess of the over-supplied side is
// reported as a refund.
// Throws InsufficientAmount or InvalidLiquidityAmount.
LiquidityQuote quote_liquidity_add(Amount reserve_a, Amount reserve_b,
                                   Amount total_units,
                                   Amount amount_a, Amount amount_b,
                                   uint32_t ratio_tolerance_bps = DEFAULT_RATIO_TOLERANCE_BPS);

// Proportional payout for burning units. Throws InvalidLiquidityAmount.
RemovalQuote quote_liquidity_remove(Amount reserve_a, Amount reserve_b,
                                    Amount total_units, Amount units);

// Minimum acceptable output for a quoted amount under a slippage tolerance.
// Throws InvalidRequest when slippage_bps exceeds MAX_SLIPPAGE_BPS.
Amount min_amount_out(Amount quoted_amount_out, uint32_t slippage_bps);

} // namespace pricing
} // namespace dataswap

#endif // DATASWAP_PRICING_HPP
