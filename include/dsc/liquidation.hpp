#ifndef DSC_LIQUIDATION_HPP
#define DSC_LIQUIDATION_HPP

#include "types.hpp"
#include "listener.hpp"
#include "operation.hpp"
#include "position.hpp"
#include "registry.hpp"
#include "solvency.hpp"

namespace dsc {

struct LiquidationQuote {
    I128 token_amount;   // Debt converted to collateral units
    I128 bonus;          // LIQUIDATION_BONUS% of token_amount

    I128 payout() const { return token_amount + bonus; }
};

// =============================================================================
// LiquidationEngine - Seize Collateral of Unhealthy Positions
//
// The bonus assumes the position is still above 110% collateralized in the
// seized asset. Below that the payout exceeds the user's balance and the
// seizure fails with INSUFFICIENT_BALANCE; there is no fallback to another
// asset or a reduced bonus.
// =============================================================================

class LiquidationEngine {
public:
    LiquidationEngine(const AssetRegistry& registry, const SolvencyCalculator& solvency,
                      PositionManager& positions);

    LiquidationQuote quote(const Address& asset, I128 debt_to_cover) const;

    // Seize quote(asset, debt_to_cover).payout() of `user`'s `asset` for the
    // liquidator and retire debt_to_cover of user's debt with the
    // liquidator's tokens. Fails unless the user starts unhealthy, ends
    // healthier, and the liquidator stays healthy.
    LiquidationResult liquidate(Operation& op, const Address& liquidator, const Address& asset,
                                const Address& user, I128 debt_to_cover);

private:
    const AssetRegistry& registry_;
    const SolvencyCalculator& solvency_;
    PositionManager& positions_;
};

} // namespace dsc

#endif // DSC_LIQUIDATION_HPP
