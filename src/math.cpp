// =============================================================================
// math.cpp - 256-bit intermediates for X18 reserve arithmetic
// =============================================================================

#include "dataswap/math.hpp"
#include "dataswap/errors.hpp"

#include <string>

namespace dataswap {
namespace math {

namespace {

// Number of significant bits
inline int bit_length(const U256& v) {
    int bits = 0;
    U128 tmp = v.hi != 0 ? v.hi : v.lo;
    while (tmp != 0) { tmp >>= 1; bits++; }
    return v.hi != 0 ? bits + 128 : bits;
}

inline U128 bit_at(const U256& v, int i) {
    return i >= 128 ? (v.hi >> (i - 128)) & 1 : (v.lo >> i) & 1;
}

// Average of two U128 values without overflowing the sum
inline U128 midpoint(U128 a, U128 b) {
    return (a >> 1) + (b >> 1) + (((a & 1) + (b & 1)) >> 1);
}

constexpr U128 kMaxI128 = ~U128(0) >> 1;

[[noreturn]] void throw_out_of_range() {
    throw Error(ErrorCode::InvalidAmount, "result exceeds the supported amount range");
}

} // anonymous namespace

// =============================================================================
// Multiplication / Division
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Split into 64-bit halves to avoid overflow
    constexpr U128 MASK64 = (U128(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    // Accumulate with carry
    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    U256 result;
    result.lo = (p0 & MASK64) | (mid << 64);
    result.hi = p3 + (p1 >> 64) + (p2 >> 64) + carry;
    return result;
}

U128 div_u256_u128(const U256& num, U128 denom, U128* rem) {
    if (denom == 0) {
        throw Error(ErrorCode::InvariantViolation, "division by zero");
    }
    if (num.hi == 0) {
        if (rem) *rem = num.lo % denom;
        return num.lo / denom;
    }
    if (num.hi >= denom) {
        throw Error(ErrorCode::InvariantViolation, "mul_div quotient overflow");
    }

    // Restoring long division, one bit at a time. The running remainder stays
    // below denom, so after the shift it fits in 129 bits (carry + r).
    U128 quot = 0;
    U128 r = 0;
    for (int i = bit_length(num) - 1; i >= 0; --i) {
        bool carry = (r >> 127) != 0;
        r = (r << 1) | bit_at(num, i);
        quot <<= 1;
        if (carry || r >= denom) {
            r -= denom;  // Wraps correctly when carry is set
            quot |= 1;
        }
    }
    if (rem) *rem = r;
    return quot;
}

I128 mul_div(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom <= 0) {
        throw Error(ErrorCode::InvariantViolation, "mul_div operand out of range");
    }
    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    if (product.hi >= static_cast<U128>(denom)) throw_out_of_range();
    U128 result = div_u256_u128(product, static_cast<U128>(denom));
    if (result > kMaxI128) throw_out_of_range();
    return static_cast<I128>(result);
}

I128 mul_div_up(I128 a, I128 b, I128 denom) {
    if (a < 0 || b < 0 || denom <= 0) {
        throw Error(ErrorCode::InvariantViolation, "mul_div operand out of range");
    }
    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    if (product.hi >= static_cast<U128>(denom)) throw_out_of_range();
    U128 rem = 0;
    U128 result = div_u256_u128(product, static_cast<U128>(denom), &rem);
    if (rem != 0) {
        result += 1;
    }
    if (result > kMaxI128) throw_out_of_range();
    return static_cast<I128>(result);
}

// =============================================================================
// Square Root (Newton-Raphson over a 256-bit radicand)
// =============================================================================

I128 sqrt_product(I128 a, I128 b) {
    if (a < 0 || b < 0) {
        throw Error(ErrorCode::InvariantViolation, "sqrt of negative product");
    }
    U256 n = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    if (n.is_zero()) return 0;

    // Start at 2^ceil(bits/2) >= sqrt(n). Operands are below 2^127, so the
    // product is below 2^254 and the seed fits in 127 bits.
    int bits = bit_length(n);
    U128 x = U128(1) << ((bits + 1) / 2);
    U128 y = midpoint(x, div_u256_u128(n, x));
    while (y < x) {
        x = y;
        y = midpoint(x, div_u256_u128(n, x));
    }
    return static_cast<I128>(x);
}

// =============================================================================
// Addition
// =============================================================================

I128 checked_add(I128 a, I128 b, ErrorCode code, const char* what) {
    I128 sum;
    if (__builtin_add_overflow(a, b, &sum)) {
        throw Error(code, std::string(what) + ": " + x18::to_string(a) + " + " +
                          x18::to_string(b) + " exceeds the supported amount range");
    }
    return sum;
}

I128 saturating_add(I128 a, I128 b) {
    I128 sum;
    if (__builtin_add_overflow(a, b, &sum)) {
        return b > 0 ? static_cast<I128>(kMaxI128) : -static_cast<I128>(kMaxI128) - 1;
    }
    return sum;
}

bool product_not_decreased(I128 before_a, I128 before_b,
                           I128 after_a, I128 after_b) {
    if (after_a < 0 || after_b < 0) return false;
    U256 before = mul_u128(static_cast<U128>(before_a), static_cast<U128>(before_b));
    U256 after = mul_u128(static_cast<U128>(after_a), static_cast<U128>(after_b));
    return after >= before;
}

} // namespace math
} // namespace dataswap
