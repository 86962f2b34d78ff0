// =============================================================================
// ledger.cpp - Collateral and Debt Ledgers
// =============================================================================

#include "dsc/ledger.hpp"
#include "dsc/errors.hpp"
#include "dsc/math.hpp"

#include <mutex>

namespace dsc {

namespace {

void require_positive(I128 amount) {
    if (amount <= 0) {
        throw EngineError(ErrorKind::INVALID_AMOUNT, "amount must be > 0, got " + to_string(amount));
    }
}

void require_covered(I128 balance, I128 amount, const std::string& what) {
    if (amount > balance) {
        throw EngineError(ErrorKind::INSUFFICIENT_BALANCE,
                          what + ": debit " + to_string(amount) + " exceeds balance " +
                          to_string(balance));
    }
}

} // anonymous namespace

// =============================================================================
// Ledger
// =============================================================================

AccountState Ledger::account(const Address& user) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(user);
    return it != accounts_.end() ? it->second : AccountState{};
}

I128 Ledger::collateral_balance(const Address& user, const Address& asset) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(user);
    return it != accounts_.end() ? it->second.collateral_of(asset) : 0;
}

I128 Ledger::debt_balance(const Address& user) const {
    std::shared_lock lock(mutex_);
    auto it = accounts_.find(user);
    return it != accounts_.end() ? it->second.debt_minted : 0;
}

size_t Ledger::account_count() const {
    std::shared_lock lock(mutex_);
    return accounts_.size();
}

void Ledger::commit(const LedgerTxn& txn) {
    std::unique_lock lock(mutex_);
    for (const auto& [user, state] : txn.touched_) {
        accounts_[user] = state;
    }
}

// =============================================================================
// LedgerTxn
// =============================================================================

LedgerTxn::LedgerTxn(const Ledger& base) : base_(base) {}

const AccountState* LedgerTxn::touched(const Address& user) const {
    auto it = touched_.find(user);
    return it != touched_.end() ? &it->second : nullptr;
}

AccountState& LedgerTxn::working(const Address& user) {
    auto it = touched_.find(user);
    if (it == touched_.end()) {
        it = touched_.emplace(user, base_.account(user)).first;
    }
    return it->second;
}

AccountState LedgerTxn::account(const Address& user) const {
    if (const AccountState* state = touched(user)) return *state;
    return base_.account(user);
}

I128 LedgerTxn::collateral_balance(const Address& user, const Address& asset) const {
    if (const AccountState* state = touched(user)) return state->collateral_of(asset);
    return base_.collateral_balance(user, asset);
}

I128 LedgerTxn::debt_balance(const Address& user) const {
    if (const AccountState* state = touched(user)) return state->debt_minted;
    return base_.debt_balance(user);
}

void LedgerTxn::credit(const Address& user, const Address& asset, I128 amount) {
    require_positive(amount);
    AccountState& state = working(user);
    I128& balance = state.collateral[asset];
    balance = math::checked_add(balance, amount);
    changes_.push_back({LedgerEntry::COLLATERAL, user, asset, amount, Direction::CREDIT});
}

void LedgerTxn::debit(const Address& user, const Address& asset, I128 amount) {
    require_positive(amount);
    require_covered(collateral_balance(user, asset), amount,
                    "collateral " + addresses::to_hex(asset) + " of " + addresses::to_hex(user));
    working(user).collateral[asset] -= amount;
    changes_.push_back({LedgerEntry::COLLATERAL, user, asset, amount, Direction::DEBIT});
}

void LedgerTxn::credit_debt(const Address& user, I128 amount) {
    require_positive(amount);
    AccountState& state = working(user);
    state.debt_minted = math::checked_add(state.debt_minted, amount);
    changes_.push_back({LedgerEntry::DEBT, user, addresses::ZERO, amount, Direction::CREDIT});
}

void LedgerTxn::debit_debt(const Address& user, I128 amount) {
    require_positive(amount);
    require_covered(debt_balance(user), amount, "debt of " + addresses::to_hex(user));
    working(user).debt_minted -= amount;
    changes_.push_back({LedgerEntry::DEBT, user, addresses::ZERO, amount, Direction::DEBIT});
}

} // namespace dsc
