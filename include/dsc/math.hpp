#ifndef DSC_MATH_HPP
#define DSC_MATH_HPP

#include "types.hpp"

namespace dsc {
namespace math {

// =============================================================================
// Wide Intermediates
//
// Products of two X18 values need up to 256 bits before the division that
// brings them back to X18. value = hi * 2^128 + lo.
// =============================================================================

struct U256 {
    U128 lo = 0;
    U128 hi = 0;
};

struct DivResult {
    U256 quotient;
    U128 remainder;
};

// Full 256-bit product of two U128 values
U256 mul_u128(U128 a, U128 b);

// Long division of a U256 by a non-zero U128
DivResult div_u256_u128(const U256& num, U128 denom);

// =============================================================================
// Checked Fixed-Point Helpers
//
// All helpers take non-negative operands; a negative operand, a zero
// denominator, or a result that does not fit in I128 throws
// EngineError(ARITHMETIC_OVERFLOW).
// =============================================================================

// floor(a * b / denom) with a 256-bit intermediate
I128 mul_div(I128 a, I128 b, I128 denom);

// As mul_div, but a quotient above I128_MAX clamps to I128_MAX
I128 mul_div_saturating(I128 a, I128 b, I128 denom);

I128 checked_add(I128 a, I128 b);
I128 checked_mul(I128 a, I128 b);

} // namespace math
} // namespace dsc

#endif // DSC_MATH_HPP
