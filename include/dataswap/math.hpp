#ifndef DATASWAP_MATH_HPP
#define DATASWAP_MATH_HPP

#include "dataswap/errors.hpp"
#include "dataswap/types.hpp"

namespace dataswap {
namespace math {

// =============================================================================
// 256-bit Arithmetic (U256 via two U128 limbs)
// =============================================================================

struct U256 {
    U128 lo;  // Low 128 bits
    U128 hi;  // High 128 bits

    U256() : lo(0), hi(0) {}
    U256(U128 l) : lo(l), hi(0) {}
    U256(U128 l, U128 h) : lo(l), hi(h) {}

    bool operator==(const U256& other) const {
        return lo == other.lo && hi == other.hi;
    }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
    bool operator>=(const U256& other) const { return !(*this < other); }
    bool operator>(const U256& other) const { return other < *this; }
    bool is_zero() const { return lo == 0 && hi == 0; }
};

// Full 256-bit product of two U128 values
U256 mul_u128(U128 a, U128 b);

// 256/128 division. The quotient must fit in 128 bits; the remainder is
// written to *rem when non-null. Throws Error(InvariantViolation) when the
// divisor is zero or the quotient overflows.
U128 div_u256_u128(const U256& num, U128 denom, U128* rem = nullptr);

// floor(a * b / denom) with a 256-bit intermediate. Operands must be >= 0.
// A quotient beyond the I128 range is an input magnitude problem and throws
// Error(InvalidAmount); negative operands or a zero denominator throw
// Error(InvariantViolation).
I128 mul_div(I128 a, I128 b, I128 denom);

// ceil(a * b / denom)
I128 mul_div_up(I128 a, I128 b, I128 denom);

// floor(sqrt(a * b)) over the exact 256-bit product. Used to seed an empty
// pool: with both operands in X18 the result is X18 as well.
I128 sqrt_product(I128 a, I128 b);

// Exact comparison of reserve products: returns true when
// after_a * after_b >= before_a * before_b.
bool product_not_decreased(I128 before_a, I128 before_b,
                           I128 after_a, I128 after_b);

// =============================================================================
// Overflow-checked addition
// =============================================================================

// a + b, or throws Error(code) naming `what` when the sum leaves the I128 range
I128 checked_add(I128 a, I128 b, ErrorCode code, const char* what);

// a + b clamped to the I128 range (aggregates only)
I128 saturating_add(I128 a, I128 b);

inline I128 abs128(I128 x) { return x < 0 ? -x : x; }

} // namespace math
} // namespace dataswap

#endif // DATASWAP_MATH_HPP
