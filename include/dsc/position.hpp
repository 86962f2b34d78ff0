#ifndef DSC_POSITION_HPP
#define DSC_POSITION_HPP

#include "types.hpp"
#include "operation.hpp"
#include "registry.hpp"
#include "solvency.hpp"
#include "token.hpp"

namespace dsc {

// =============================================================================
// PositionManager - Deposit / Mint / Redeem / Burn
//
// Each entry point records its ledger effects and queued interactions in the
// caller's Operation; nothing is applied until Operation::commit.
// =============================================================================

class PositionManager {
public:
    PositionManager(const AssetRegistry& registry, const SolvencyCalculator& solvency,
                    ICustody& custody, IDebtToken& debt_token, const Address& engine_address);

    void deposit_collateral(Operation& op, const Address& user, const Address& asset, I128 amount);

    // Credits debt, then requires the user to stay healthy
    void mint_debt(Operation& op, const Address& user, I128 amount);

    void deposit_collateral_and_mint(Operation& op, const Address& user, const Address& asset,
                                     I128 collateral_amount, I128 debt_amount);

    void redeem_collateral(Operation& op, const Address& user, const Address& asset, I128 amount);

    void burn_debt(Operation& op, const Address& user, I128 amount);

    // Burn first, then redeem, so the final check sees the smaller debt
    void redeem_collateral_for_debt(Operation& op, const Address& user, const Address& asset,
                                    I128 collateral_amount, I128 debt_amount);

    // =========================================================================
    // Primitives (also used by liquidation)
    // =========================================================================

    // Moves `amount` of `asset` out of custody to `to`. When from != to the
    // amount is re-credited to `to` so the ledger keeps track of it.
    void redeem(Operation& op, const Address& from, const Address& to,
                const Address& asset, I128 amount);

    // Retires `amount` of on_behalf_of's debt using tokens pulled from
    // burn_from. When they differ, burn_from's own debt shrinks as well.
    void burn(Operation& op, const Address& burn_from, const Address& on_behalf_of, I128 amount);

private:
    const AssetRegistry& registry_;
    const SolvencyCalculator& solvency_;
    ICustody& custody_;
    IDebtToken& debt_token_;
    Address engine_address_;
};

} // namespace dsc

#endif // DSC_POSITION_HPP
