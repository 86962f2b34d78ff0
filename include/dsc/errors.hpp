#ifndef DSC_ERRORS_HPP
#define DSC_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind : int32_t {
    INVALID_AMOUNT = -1,
    ASSET_NOT_ALLOWED = -2,
    CONFIGURATION_MISMATCH = -3,
    TRANSFER_FAILED = -4,
    INSUFFICIENT_BALANCE = -10,
    MINT_FAILED = -11,
    BELOW_MINIMUM_HEALTH_FACTOR = -12,
    NOT_LIQUIDATABLE = -15,
    HEALTH_FACTOR_NOT_IMPROVED = -16,
    STALE_PRICE = -20,
    INVALID_PRICE = -22,
    ARITHMETIC_OVERFLOW = -25,
    REENTRANCY = -30,
    INVALID_CONFIGURATION = -40
};

const char* to_string(ErrorKind kind);

// =============================================================================
// Exceptions
// =============================================================================

// Every engine failure surfaces as an EngineError; branch on kind().
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& msg);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// BELOW_MINIMUM_HEALTH_FACTOR, with the offending ratio (X18)
class HealthFactorError : public EngineError {
public:
    explicit HealthFactorError(I128 health_factor);

    I128 health_factor() const noexcept { return health_factor_; }

private:
    I128 health_factor_;
};

} // namespace dsc

#endif // DSC_ERRORS_HPP
