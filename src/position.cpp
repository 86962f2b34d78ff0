// =============================================================================
// position.cpp - PositionManager Implementation
// =============================================================================

#include "dsc/position.hpp"
#include "dsc/errors.hpp"

namespace dsc {

namespace {

void require_positive(I128 amount, const char* what) {
    if (amount <= 0) {
        throw EngineError(ErrorKind::INVALID_AMOUNT,
                          std::string(what) + " must be > 0, got " + to_string(amount));
    }
}

} // anonymous namespace

PositionManager::PositionManager(const AssetRegistry& registry, const SolvencyCalculator& solvency,
                                 ICustody& custody, IDebtToken& debt_token,
                                 const Address& engine_address)
    : registry_(registry),
      solvency_(solvency),
      custody_(custody),
      debt_token_(debt_token),
      engine_address_(engine_address) {}

// =============================================================================
// Collateral
// =============================================================================

void PositionManager::deposit_collateral(Operation& op, const Address& user,
                                         const Address& asset, I128 amount) {
    require_positive(amount, "collateral amount");
    registry_.require_registered(asset);

    op.txn().credit(user, asset, amount);

    ICustody* custody = &custody_;
    op.add_interaction(Interaction{
        "transfer in " + to_string(amount) + " of " + addresses::to_hex(asset),
        ErrorKind::TRANSFER_FAILED,
        [custody, asset, user, amount] { return custody->transfer_in(asset, user, amount); },
        [custody, asset, user, amount] { return custody->transfer_out(asset, user, amount); }
    });

    op.notify([user, asset, amount](EngineListener& l) {
        l.on_collateral_deposited(user, asset, amount);
    });
}

void PositionManager::redeem_collateral(Operation& op, const Address& user,
                                        const Address& asset, I128 amount) {
    require_positive(amount, "collateral amount");
    registry_.require_registered(asset);

    redeem(op, user, user, asset, amount);
    solvency_.assert_healthy(op.view(), user);
}

void PositionManager::redeem(Operation& op, const Address& from, const Address& to,
                             const Address& asset, I128 amount) {
    op.txn().debit(from, asset, amount);
    if (from != to) {
        op.txn().credit(to, asset, amount);
    }

    ICustody* custody = &custody_;
    op.add_interaction(Interaction{
        "transfer out " + to_string(amount) + " of " + addresses::to_hex(asset),
        ErrorKind::TRANSFER_FAILED,
        [custody, asset, to, amount] { return custody->transfer_out(asset, to, amount); },
        [custody, asset, to, amount] { return custody->transfer_in(asset, to, amount); }
    });

    op.notify([from, to, asset, amount](EngineListener& l) {
        l.on_collateral_redeemed(from, to, asset, amount);
    });
}

// =============================================================================
// Debt
// =============================================================================

void PositionManager::mint_debt(Operation& op, const Address& user, I128 amount) {
    require_positive(amount, "debt amount");

    op.txn().credit_debt(user, amount);
    solvency_.assert_healthy(op.view(), user);

    IDebtToken* token = &debt_token_;
    op.add_interaction(Interaction{
        "mint " + to_string(amount) + " debt tokens",
        ErrorKind::MINT_FAILED,
        [token, user, amount] { return token->mint(user, amount); },
        {}
    });

    op.notify([user, amount](EngineListener& l) { l.on_debt_minted(user, amount); });
}

void PositionManager::burn_debt(Operation& op, const Address& user, I128 amount) {
    require_positive(amount, "debt amount");

    burn(op, user, user, amount);
    solvency_.assert_healthy(op.view(), user);
}

void PositionManager::burn(Operation& op, const Address& burn_from,
                           const Address& on_behalf_of, I128 amount) {
    require_positive(amount, "debt amount");

    I128 owed = op.view().debt_balance(on_behalf_of);
    if (owed < amount) {
        throw EngineError(ErrorKind::INSUFFICIENT_BALANCE,
                          "burn " + to_string(amount) + " exceeds debt " + to_string(owed) +
                          " of " + addresses::to_hex(on_behalf_of));
    }
    op.txn().debit_debt(on_behalf_of, amount);

    IDebtToken* token = &debt_token_;
    Address engine = engine_address_;
    op.add_interaction(Interaction{
        "pull " + to_string(amount) + " debt tokens from " + addresses::to_hex(burn_from),
        ErrorKind::TRANSFER_FAILED,
        [token, burn_from, engine, amount] { return token->transfer_from(burn_from, engine, amount); },
        [token, burn_from, engine, amount] { return token->transfer_from(engine, burn_from, amount); }
    });

    if (burn_from != on_behalf_of) {
        op.txn().debit_debt(burn_from, amount);
    }

    op.add_finalizer(Interaction{
        "burn " + to_string(amount) + " debt tokens",
        ErrorKind::TRANSFER_FAILED,
        [token, amount] {
            try {
                token->burn(amount);
            } catch (const TokenError& e) {
                throw EngineError(ErrorKind::TRANSFER_FAILED,
                                  "burn of " + to_string(amount) + " rejected: " + e.what());
            }
            return true;
        },
        {}
    });

    op.notify([burn_from, on_behalf_of, amount](EngineListener& l) {
        l.on_debt_burned(burn_from, on_behalf_of, amount);
    });
}

// =============================================================================
// Composites
// =============================================================================

void PositionManager::deposit_collateral_and_mint(Operation& op, const Address& user,
                                                  const Address& asset,
                                                  I128 collateral_amount, I128 debt_amount) {
    deposit_collateral(op, user, asset, collateral_amount);
    mint_debt(op, user, debt_amount);
}

void PositionManager::redeem_collateral_for_debt(Operation& op, const Address& user,
                                                 const Address& asset,
                                                 I128 collateral_amount, I128 debt_amount) {
    require_positive(collateral_amount, "collateral amount");
    require_positive(debt_amount, "debt amount");
    registry_.require_registered(asset);

    burn(op, user, user, debt_amount);
    redeem(op, user, user, asset, collateral_amount);
    solvency_.assert_healthy(op.view(), user);
}

} // namespace dsc
