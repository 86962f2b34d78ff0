// =============================================================================
// math.cpp - 256-bit Intermediate Arithmetic
// =============================================================================

#include "dsc/math.hpp"
#include "dsc/errors.hpp"

namespace dsc {
namespace math {

namespace {

void require_non_negative(I128 a, I128 b, const char* op) {
    if (a < 0 || b < 0) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW,
                          std::string("negative operand in ") + op);
    }
}

bool fits_i128(const U256& v) {
    return v.hi == 0 && v.lo <= static_cast<U128>(I128_MAX);
}

U256 product_over(I128 a, I128 b, I128 denom, const char* op) {
    require_non_negative(a, b, op);
    if (denom <= 0) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW,
                          std::string("non-positive denominator in ") + op);
    }
    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    return div_u256_u128(product, static_cast<U128>(denom)).quotient;
}

} // anonymous namespace

// =============================================================================
// Wide Multiply
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    // Schoolbook over 64-bit words, least significant first. Each partial
    // x*y + word + carry is at most 2^128 - 1.
    const uint64_t x[2] = {static_cast<uint64_t>(a), static_cast<uint64_t>(a >> 64)};
    const uint64_t y[2] = {static_cast<uint64_t>(b), static_cast<uint64_t>(b >> 64)};
    uint64_t w[4] = {0, 0, 0, 0};

    for (int i = 0; i < 2; ++i) {
        U128 carry = 0;
        for (int j = 0; j < 2; ++j) {
            U128 t = static_cast<U128>(x[i]) * y[j] + w[i + j] + carry;
            w[i + j] = static_cast<uint64_t>(t);
            carry = t >> 64;
        }
        w[i + 2] = static_cast<uint64_t>(carry);
    }

    U256 out;
    out.lo = (static_cast<U128>(w[1]) << 64) | w[0];
    out.hi = (static_cast<U128>(w[3]) << 64) | w[2];
    return out;
}

DivResult div_u256_u128(const U256& num, U128 denom) {
    if (denom == 0) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW, "division by zero");
    }

    DivResult out;
    if (num.hi == 0) {
        out.quotient.lo = num.lo / denom;
        out.remainder = num.lo % denom;
        return out;
    }

    // Restoring long division, one bit at a time from the top.
    // rem stays below denom; `top` is the bit shifted out of rem.
    U128 rem = 0;
    for (int i = 255; i >= 0; --i) {
        U128 bit = (i >= 128) ? (num.hi >> (i - 128)) & 1 : (num.lo >> i) & 1;
        bool top = (rem >> 127) != 0;
        rem = (rem << 1) | bit;

        if (top || rem >= denom) {
            rem -= denom;  // wraps back into range when top is set
            if (i >= 128) {
                out.quotient.hi |= static_cast<U128>(1) << (i - 128);
            } else {
                out.quotient.lo |= static_cast<U128>(1) << i;
            }
        }
    }
    out.remainder = rem;
    return out;
}

// =============================================================================
// Checked Helpers
// =============================================================================

I128 mul_div(I128 a, I128 b, I128 denom) {
    U256 q = product_over(a, b, denom, "mul_div");
    if (!fits_i128(q)) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW,
                          "mul_div result exceeds 128 bits");
    }
    return static_cast<I128>(q.lo);
}

I128 mul_div_saturating(I128 a, I128 b, I128 denom) {
    U256 q = product_over(a, b, denom, "mul_div_saturating");
    return fits_i128(q) ? static_cast<I128>(q.lo) : I128_MAX;
}

I128 checked_add(I128 a, I128 b) {
    require_non_negative(a, b, "checked_add");
    if (a > I128_MAX - b) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW,
                          to_string(a) + " + " + to_string(b) + " overflows");
    }
    return a + b;
}

I128 checked_mul(I128 a, I128 b) {
    require_non_negative(a, b, "checked_mul");
    U256 product = mul_u128(static_cast<U128>(a), static_cast<U128>(b));
    if (!fits_i128(product)) {
        throw EngineError(ErrorKind::ARITHMETIC_OVERFLOW,
                          to_string(a) + " * " + to_string(b) + " overflows");
    }
    return static_cast<I128>(product.lo);
}

} // namespace math
} // namespace dsc
