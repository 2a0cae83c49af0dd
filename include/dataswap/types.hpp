#ifndef DATASWAP_TYPES_HPP
#define DATASWAP_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dataswap {

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;
using Amount = I128;  // X18 token quantity

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18
constexpr int X18_DECIMALS = 18;

// Basis-point denominator for fees, tolerances and slippage
constexpr uint32_t BPS_DENOMINATOR = 10000;

namespace x18 {

// Display and test approximations only; never feeds back into amounts
inline double to_double(I128 v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

// Parse a decimal string ("12", "0.5", "1000.000000000000000001").
// Throws Error(InvalidAmount) on malformed input or more than 18 decimals.
I128 from_string(const std::string& s);

// Canonical decimal rendering, trailing fractional zeros trimmed.
std::string to_string(I128 v);

// Plain integer rendering of the raw value (no scaling).
std::string raw_string(I128 v);

} // namespace x18

// =============================================================================
// Pair Key (order-independent pool identifier)
// =============================================================================

struct PairKey {
    std::string token_a;  // Sorted: token_a < token_b
    std::string token_b;

    // Canonicalize an unordered pair. Throws Error(InvalidPair) for empty or
    // identical tokens.
    static PairKey of(const std::string& x, const std::string& y);

    std::string id() const { return token_a + "/" + token_b; }

    bool contains(const std::string& token) const {
        return token == token_a || token == token_b;
    }

    bool operator==(const PairKey& other) const {
        return token_a == other.token_a && token_b == other.token_b;
    }
    bool operator!=(const PairKey& other) const { return !(*this == other); }
    bool operator<(const PairKey& other) const {
        return token_a < other.token_a ||
               (token_a == other.token_a && token_b < other.token_b);
    }
};

// =============================================================================
// Pool
// =============================================================================

struct Pool {
    PairKey key;
    Amount reserve_a = 0;         // X18, indexed by key.token_a
    Amount reserve_b = 0;         // X18, indexed by key.token_b
    Amount total_units = 0;       // X18, outstanding liquidity units
    uint64_t version = 0;         // Committed mutations
    int64_t created_at = 0;       // Unix ms
    int64_t updated_at = 0;       // Unix ms

    bool empty() const { return total_units == 0; }

    Amount reserve_of(const std::string& token) const {
        return token == key.token_a ? reserve_a : reserve_b;
    }

    // Spot price of token_b in units of token_a (X18). Zero for an empty pool.
    Amount price_a_in_b() const;
};

// =============================================================================
// Quotes
// =============================================================================

struct SwapQuote {
    Amount amount_out = 0;
    Amount fee = 0;               // Input-token units kept by the pool
    Amount effective_in = 0;      // amount_in net of fee
    Amount spot_price = 0;        // reserve_out / reserve_in
    Amount execution_price = 0;   // amount_out / amount_in
    Amount price_impact_pct = 0;  // X18 percent, 1e18 == 1%
};

struct QuoteResult {
    std::string token_in;
    std::string token_out;
    Amount amount_in = 0;
    Amount amount_out = 0;
    Amount fee = 0;
    Amount price_impact_pct = 0;
    Amount execution_price = 0;
    Amount reserve_in = 0;        // Snapshot reserves the quote was computed on
    Amount reserve_out = 0;
    uint64_t pool_version = 0;
};

struct LiquidityQuote {
    Amount minted_units = 0;
    Amount consumed_a = 0;
    Amount consumed_b = 0;
    Amount refund_a = 0;          // Requested minus consumed
    Amount refund_b = 0;
};

struct RemovalQuote {
    Amount amount_a = 0;
    Amount amount_b = 0;
};

// =============================================================================
// Records
// =============================================================================

struct Trade {
    uint64_t id = 0;              // Ledger-assigned sequence
    std::string pair_id;
    std::string token_in;
    std::string token_out;
    Amount amount_in = 0;
    Amount amount_out = 0;
    Amount fee = 0;
    Amount price = 0;             // amount_out / amount_in (X18)
    Amount price_impact_pct = 0;
    std::string trader;
    std::string settlement_ref;
    std::string request_id;       // Caller-supplied, may be empty
    int64_t timestamp = 0;        // Unix ms
};

enum class LiquidityAction : uint8_t {
    Add = 0,
    Remove = 1,
};

const char* to_string(LiquidityAction action);
LiquidityAction liquidity_action_from_string(const std::string& s);

struct LiquidityEvent {
    uint64_t id = 0;
    std::string pair_id;
    LiquidityAction action = LiquidityAction::Add;
    std::string provider;
    Amount amount_a = 0;          // Canonical token order
    Amount amount_b = 0;
    Amount units = 0;             // Minted (Add) or burned (Remove)
    std::string settlement_ref;
    int64_t timestamp = 0;
};

struct LiquidityPosition {
    PairKey key;
    std::string provider;
    Amount units = 0;
};

// =============================================================================
// Operation Results (caller token order)
// =============================================================================

struct AddLiquidityResult {
    std::string pair_id;
    Amount minted_units = 0;
    Amount consumed_a = 0;        // Of the caller's token_a
    Amount consumed_b = 0;
    Amount refund_a = 0;
    Amount refund_b = 0;
    Amount position_units = 0;    // Provider total after the deposit
    std::string settlement_ref;
};

struct RemoveLiquidityResult {
    std::string pair_id;
    Amount amount_a = 0;          // Of the caller's token_a
    Amount amount_b = 0;
    Amount burned_units = 0;
    Amount position_units = 0;    // Provider total after the withdrawal
    std::string settlement_ref;
};

struct PoolInfo {
    std::string pair_id;
    std::string token_a;          // Caller order
    std::string token_b;
    Amount reserve_a = 0;
    Amount reserve_b = 0;
    Amount total_units = 0;
    Amount price = 0;             // token_b per token_a (X18)
    uint64_t version = 0;
    int64_t updated_at = 0;
};

struct MarketStats {
    uint64_t total_trades = 0;
    uint64_t window_trades = 0;
    int64_t window_ms = 0;
    std::vector<std::pair<std::string, Amount>> volume_by_token;  // Input volume in window
    uint64_t total_pools = 0;
};

// Milliseconds since the Unix epoch
int64_t now_ms();

} // namespace dataswap

#endif // DATASWAP_TYPES_HPP
