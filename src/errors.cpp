// =============================================================================
// errors.cpp - Engine Error Taxonomy
// =============================================================================

#include "dsc/errors.hpp"

namespace dsc {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_AMOUNT:              return "InvalidAmount";
        case ErrorKind::ASSET_NOT_ALLOWED:           return "AssetNotAllowed";
        case ErrorKind::CONFIGURATION_MISMATCH:      return "ConfigurationMismatch";
        case ErrorKind::TRANSFER_FAILED:             return "TransferFailed";
        case ErrorKind::INSUFFICIENT_BALANCE:        return "InsufficientBalance";
        case ErrorKind::MINT_FAILED:                 return "MintFailed";
        case ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR: return "BelowMinimumHealthFactor";
        case ErrorKind::NOT_LIQUIDATABLE:            return "NotLiquidatable";
        case ErrorKind::HEALTH_FACTOR_NOT_IMPROVED:  return "HealthFactorNotImproved";
        case ErrorKind::STALE_PRICE:                 return "StalePrice";
        case ErrorKind::INVALID_PRICE:               return "InvalidPrice";
        case ErrorKind::ARITHMETIC_OVERFLOW:         return "ArithmeticOverflow";
        case ErrorKind::REENTRANCY:                  return "Reentrancy";
        case ErrorKind::INVALID_CONFIGURATION:       return "InvalidConfiguration";
    }
    return "Unknown";
}

EngineError::EngineError(ErrorKind kind, const std::string& msg)
    : std::runtime_error(std::string(to_string(kind)) + ": " + msg), kind_(kind) {}

HealthFactorError::HealthFactorError(I128 health_factor)
    : EngineError(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR,
                  "health factor " + x18::to_string(health_factor) + " below minimum " +
                  x18::to_string(protocol::MIN_HEALTH_FACTOR)),
      health_factor_(health_factor) {}

} // namespace dsc
