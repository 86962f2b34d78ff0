#ifndef DSC_TOKEN_HPP
#define DSC_TOKEN_HPP

#include <unordered_map>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Collaborator Capabilities
// =============================================================================

// Custody of collateral assets held by the engine. false = transfer failed.
class ICustody {
public:
    virtual ~ICustody() = default;

    virtual bool transfer_in(const Address& asset, const Address& from, I128 amount) = 0;
    virtual bool transfer_out(const Address& asset, const Address& to, I128 amount) = 0;
};

// The synthetic debt token. The engine is its owner and sole minter.
class IDebtToken {
public:
    virtual ~IDebtToken() = default;

    virtual bool mint(const Address& to, I128 amount) = 0;

    // Burns from the owner's own balance
    virtual void burn(I128 amount) = 0;

    virtual bool transfer_from(const Address& from, const Address& to, I128 amount) = 0;
};

// =============================================================================
// In-memory Reference Implementations
// =============================================================================

class TokenError : public std::runtime_error {
public:
    explicit TokenError(const std::string& msg) : std::runtime_error(msg) {}
};

// Fungible token book: balances, supply and allowances per token address
class TokenBalances {
public:
    TokenBalances() = default;

    TokenBalances(const TokenBalances&) = delete;
    TokenBalances& operator=(const TokenBalances&) = delete;

    // Throws TokenError on zero recipient or non-positive amount
    void mint(const Address& token, const Address& to, I128 amount);

    // false on non-positive amount or insufficient balance
    bool burn(const Address& token, const Address& from, I128 amount);
    bool transfer(const Address& token, const Address& from, const Address& to, I128 amount);

    // Spends `spender`'s allowance unless spender == from
    bool transfer_from(const Address& token, const Address& spender,
                       const Address& from, const Address& to, I128 amount);

    void approve(const Address& token, const Address& owner, const Address& spender, I128 amount);

    I128 balance_of(const Address& token, const Address& holder) const;
    I128 allowance(const Address& token, const Address& owner, const Address& spender) const;
    I128 total_supply(const Address& token) const;

private:
    struct TokenState {
        std::unordered_map<Address, I128, AddressHash> balances;
        // owner -> spender -> amount
        std::unordered_map<Address, std::unordered_map<Address, I128, AddressHash>, AddressHash> allowances;
        I128 total_supply = 0;
    };

    bool move_locked(TokenState& state, const Address& from, const Address& to, I128 amount);

    std::unordered_map<Address, TokenState, AddressHash> tokens_;
    mutable std::shared_mutex mutex_;
};

// Custody over a TokenBalances book. Deposits pull through the allowance the
// depositor granted to `custodian`.
class TokenCustody : public ICustody {
public:
    TokenCustody(TokenBalances& book, const Address& custodian);

    bool transfer_in(const Address& asset, const Address& from, I128 amount) override;
    bool transfer_out(const Address& asset, const Address& to, I128 amount) override;

    const Address& custodian() const { return custodian_; }

private:
    TokenBalances& book_;
    Address custodian_;
};

// Debt token over a TokenBalances book, owned by `owner`
class StableToken : public IDebtToken {
public:
    StableToken(TokenBalances& book, const Address& token, const Address& owner);

    bool mint(const Address& to, I128 amount) override;
    void burn(I128 amount) override;
    bool transfer_from(const Address& from, const Address& to, I128 amount) override;

    const Address& address() const { return token_; }
    const Address& owner() const { return owner_; }
    I128 balance_of(const Address& holder) const { return book_.balance_of(token_, holder); }
    I128 total_supply() const { return book_.total_supply(token_); }

private:
    TokenBalances& book_;
    Address token_;
    Address owner_;
};

} // namespace dsc

#endif // DSC_TOKEN_HPP
