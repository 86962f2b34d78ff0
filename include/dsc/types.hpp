#ifndef DSC_TYPES_HPP
#define DSC_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <string_view>
#include <cstddef>

namespace dsc {

// =============================================================================
// Addresses (EVM-style 20-byte identifiers)
//
// Users, collateral assets, price feeds and the engine itself are all
// identified by an Address.
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

namespace addresses {

constexpr Address ZERO = {};

// Address whose low 8 bytes hold `id` (big-endian), e.g. from_id(1) = 0x00..01
constexpr Address from_id(uint64_t id) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((id >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without "0x"; throws InvalidConfiguration
Address from_hex(std::string_view text);

} // namespace addresses

// =============================================================================
// Fixed-Point Arithmetic (X18 = 18 decimal places)
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);

constexpr I128 X18_ONE = 1000000000000000000LL;  // 1e18

namespace x18 {

inline I128 from_int(int64_t v) {
    return static_cast<I128>(v) * X18_ONE;
}

inline int64_t to_int(I128 v) {
    return static_cast<int64_t>(v / X18_ONE);
}

// Decimal rendering with all 18 fractional digits, e.g. "0.666666666666666666"
std::string to_string(I128 v);

} // namespace x18

// Plain integer rendering (no fixed-point scaling)
std::string to_string(I128 v);

// =============================================================================
// Protocol Constants
// =============================================================================

namespace protocol {

constexpr uint32_t LEDGER_DECIMALS = 18;
constexpr uint32_t FEED_DECIMALS = 8;

constexpr I128 PRECISION = X18_ONE;
constexpr I128 ADDITIONAL_FEED_PRECISION = 10000000000LL;  // 10^(18 - 8)

constexpr I128 LIQUIDATION_THRESHOLD = 50;   // 200% overcollateralized
constexpr I128 LIQUIDATION_BONUS = 10;       // 10% bonus to liquidators
constexpr I128 LIQUIDATION_PRECISION = 100;

constexpr I128 MIN_HEALTH_FACTOR = X18_ONE;
constexpr I128 MAX_HEALTH_FACTOR = I128_MAX;

constexpr uint64_t ORACLE_TIMEOUT = 3 * 60 * 60;  // seconds

} // namespace protocol

} // namespace dsc

#endif // DSC_TYPES_HPP
