// =============================================================================
// liquidation.cpp - LiquidationEngine Implementation
// =============================================================================

#include "dsc/liquidation.hpp"
#include "dsc/errors.hpp"
#include "dsc/math.hpp"

namespace dsc {

LiquidationEngine::LiquidationEngine(const AssetRegistry& registry,
                                     const SolvencyCalculator& solvency,
                                     PositionManager& positions)
    : registry_(registry), solvency_(solvency), positions_(positions) {}

LiquidationQuote LiquidationEngine::quote(const Address& asset, I128 debt_to_cover) const {
    if (debt_to_cover <= 0) {
        throw EngineError(ErrorKind::INVALID_AMOUNT,
                          "debt to cover must be > 0, got " + to_string(debt_to_cover));
    }
    registry_.require_registered(asset);

    LiquidationQuote q;
    q.token_amount = solvency_.token_amount_from_usd(asset, debt_to_cover);
    q.bonus = math::mul_div(q.token_amount, protocol::LIQUIDATION_BONUS,
                            protocol::LIQUIDATION_PRECISION);
    return q;
}

LiquidationResult LiquidationEngine::liquidate(Operation& op, const Address& liquidator,
                                               const Address& asset, const Address& user,
                                               I128 debt_to_cover) {
    if (debt_to_cover <= 0) {
        throw EngineError(ErrorKind::INVALID_AMOUNT,
                          "debt to cover must be > 0, got " + to_string(debt_to_cover));
    }
    registry_.require_registered(asset);

    // 1. Precondition
    I128 starting_hf = solvency_.health_factor(op.view(), user);
    if (starting_hf >= protocol::MIN_HEALTH_FACTOR) {
        throw EngineError(ErrorKind::NOT_LIQUIDATABLE,
                          addresses::to_hex(user) + " health factor " + x18::to_string(starting_hf));
    }

    // 2. Sizing
    LiquidationQuote q = quote(asset, debt_to_cover);

    // 3. Debt settlement, 4. Seizure. The pull is queued ahead of the payout
    // so a failed payout can hand the tokens back from the engine's balance.
    positions_.burn(op, liquidator, user, debt_to_cover);
    positions_.redeem(op, user, liquidator, asset, math::checked_add(q.token_amount, q.bonus));

    // 5. Post-check
    I128 ending_hf = solvency_.health_factor(op.view(), user);
    if (ending_hf <= starting_hf) {
        throw EngineError(ErrorKind::HEALTH_FACTOR_NOT_IMPROVED,
                          x18::to_string(starting_hf) + " -> " + x18::to_string(ending_hf));
    }

    // 6. Liquidator safety
    solvency_.assert_healthy(op.view(), liquidator);

    LiquidationResult result{user, liquidator, asset, debt_to_cover,
                             q.token_amount, q.bonus, starting_hf, ending_hf};
    op.notify([result](EngineListener& l) { l.on_liquidation(result); });
    return result;
}

} // namespace dsc
