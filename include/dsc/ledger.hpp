#ifndef DSC_LEDGER_HPP
#define DSC_LEDGER_HPP

#include <unordered_map>
#include <shared_mutex>
#include <vector>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Account State
//
// A user's position is the pair (collateral per asset, debt minted). Accounts
// appear on first credit and are never removed; an all-zero account is the
// same as one that was never used.
// =============================================================================

struct AccountState {
    std::unordered_map<Address, I128, AddressHash> collateral;  // asset -> amount
    I128 debt_minted = 0;

    I128 collateral_of(const Address& asset) const {
        auto it = collateral.find(asset);
        return it != collateral.end() ? it->second : 0;
    }
};

// =============================================================================
// Ledger Change Record (observability)
// =============================================================================

enum class LedgerEntry : uint8_t {
    COLLATERAL = 0,
    DEBT = 1
};

enum class Direction : uint8_t {
    CREDIT = 0,
    DEBIT = 1
};

struct LedgerChange {
    LedgerEntry entry;
    Address user;
    Address asset;       // Zero for DEBT entries
    I128 amount;
    Direction direction;
};

// =============================================================================
// LedgerView - Read Access to Collateral and Debt Balances
// =============================================================================

class LedgerView {
public:
    virtual ~LedgerView() = default;

    // Point-in-time copy of one account
    virtual AccountState account(const Address& user) const = 0;

    virtual I128 collateral_balance(const Address& user, const Address& asset) const = 0;
    virtual I128 debt_balance(const Address& user) const = 0;
};

class LedgerTxn;

// =============================================================================
// Ledger - Committed Collateral Ledger + Debt Ledger
//
// Mutated only through commit(). Readers take a shared lock for the duration
// of a single lookup or account copy.
// =============================================================================

class Ledger : public LedgerView {
public:
    Ledger() = default;

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    AccountState account(const Address& user) const override;
    I128 collateral_balance(const Address& user, const Address& asset) const override;
    I128 debt_balance(const Address& user) const override;

    size_t account_count() const;

    // Publish every account the transaction touched, under one exclusive lock
    void commit(const LedgerTxn& txn);

private:
    std::unordered_map<Address, AccountState, AddressHash> accounts_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// LedgerTxn - Copy-on-touch Overlay over a Ledger
//
// Mutations apply to private copies of the touched accounts; nothing reaches
// the base ledger until Ledger::commit. Discarding the transaction discards
// every mutation.
// =============================================================================

class LedgerTxn : public LedgerView {
public:
    explicit LedgerTxn(const Ledger& base);

    AccountState account(const Address& user) const override;
    I128 collateral_balance(const Address& user, const Address& asset) const override;
    I128 debt_balance(const Address& user) const override;

    // Collateral ledger. Amounts must be > 0 (INVALID_AMOUNT); debit throws
    // INSUFFICIENT_BALANCE when amount exceeds the recorded balance.
    void credit(const Address& user, const Address& asset, I128 amount);
    void debit(const Address& user, const Address& asset, I128 amount);

    // Debt ledger, same contract
    void credit_debt(const Address& user, I128 amount);
    void debit_debt(const Address& user, I128 amount);

    const std::vector<LedgerChange>& changes() const { return changes_; }
    bool empty() const { return changes_.empty(); }

private:
    friend class Ledger;

    AccountState& working(const Address& user);
    const AccountState* touched(const Address& user) const;

    const Ledger& base_;
    std::unordered_map<Address, AccountState, AddressHash> touched_;
    std::vector<LedgerChange> changes_;
};

} // namespace dsc

#endif // DSC_LEDGER_HPP
