// =============================================================================
// types.cpp - Address and Fixed-Point Formatting
// =============================================================================

#include "dsc/types.hpp"
#include "dsc/errors.hpp"

#include <algorithm>

namespace dsc {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string unsigned_digits(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

U128 magnitude(I128 v) {
    // -I128_MIN is not representable, go through the unsigned domain
    return v < 0 ? static_cast<U128>(0) - static_cast<U128>(v) : static_cast<U128>(v);
}

} // anonymous namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

Address from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) {
        throw EngineError(ErrorKind::INVALID_CONFIGURATION,
                          "address must have 40 hex digits: " + std::string(text));
    }

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw EngineError(ErrorKind::INVALID_CONFIGURATION,
                              "invalid hex digit in address: " + std::string(text));
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Integer Formatting
// =============================================================================

std::string to_string(I128 v) {
    std::string digits = unsigned_digits(magnitude(v));
    return v < 0 ? "-" + digits : digits;
}

namespace x18 {

std::string to_string(I128 v) {
    U128 mag = magnitude(v);
    U128 one = static_cast<U128>(X18_ONE);

    std::string frac = unsigned_digits(mag % one);
    frac.insert(0, 18 - frac.size(), '0');

    std::string out = unsigned_digits(mag / one) + "." + frac;
    return v < 0 ? "-" + out : out;
}

} // namespace x18

} // namespace dsc
