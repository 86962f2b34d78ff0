// =============================================================================
// token.cpp - In-memory Token Book, Custody and Debt Token
// =============================================================================

#include "dsc/token.hpp"

#include <mutex>

namespace dsc {

// =============================================================================
// TokenBalances
// =============================================================================

bool TokenBalances::move_locked(TokenState& state, const Address& from,
                                const Address& to, I128 amount) {
    auto it = state.balances.find(from);
    if (it == state.balances.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    state.balances[to] += amount;
    return true;
}

void TokenBalances::mint(const Address& token, const Address& to, I128 amount) {
    if (addresses::is_zero(to)) {
        throw TokenError("mint to the zero address");
    }
    if (amount <= 0) {
        throw TokenError("mint amount must be > 0");
    }

    std::unique_lock lock(mutex_);
    TokenState& state = tokens_[token];
    state.balances[to] += amount;
    state.total_supply += amount;
}

bool TokenBalances::burn(const Address& token, const Address& from, I128 amount) {
    if (amount <= 0) return false;

    std::unique_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    if (token_it == tokens_.end()) return false;

    TokenState& state = token_it->second;
    auto it = state.balances.find(from);
    if (it == state.balances.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    state.total_supply -= amount;
    return true;
}

bool TokenBalances::transfer(const Address& token, const Address& from,
                             const Address& to, I128 amount) {
    if (amount <= 0 || addresses::is_zero(to)) return false;

    std::unique_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    if (token_it == tokens_.end()) return false;
    return move_locked(token_it->second, from, to, amount);
}

bool TokenBalances::transfer_from(const Address& token, const Address& spender,
                                  const Address& from, const Address& to, I128 amount) {
    if (amount <= 0 || addresses::is_zero(to)) return false;

    std::unique_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    if (token_it == tokens_.end()) return false;
    TokenState& state = token_it->second;

    if (spender == from) {
        return move_locked(state, from, to, amount);
    }

    auto owner_it = state.allowances.find(from);
    if (owner_it == state.allowances.end()) return false;
    auto spender_it = owner_it->second.find(spender);
    if (spender_it == owner_it->second.end() || spender_it->second < amount) {
        return false;
    }

    if (!move_locked(state, from, to, amount)) return false;
    spender_it->second -= amount;
    return true;
}

void TokenBalances::approve(const Address& token, const Address& owner,
                            const Address& spender, I128 amount) {
    std::unique_lock lock(mutex_);
    tokens_[token].allowances[owner][spender] = amount;
}

I128 TokenBalances::balance_of(const Address& token, const Address& holder) const {
    std::shared_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    if (token_it == tokens_.end()) return 0;
    auto it = token_it->second.balances.find(holder);
    return it != token_it->second.balances.end() ? it->second : 0;
}

I128 TokenBalances::allowance(const Address& token, const Address& owner,
                              const Address& spender) const {
    std::shared_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    if (token_it == tokens_.end()) return 0;
    auto owner_it = token_it->second.allowances.find(owner);
    if (owner_it == token_it->second.allowances.end()) return 0;
    auto it = owner_it->second.find(spender);
    return it != owner_it->second.end() ? it->second : 0;
}

I128 TokenBalances::total_supply(const Address& token) const {
    std::shared_lock lock(mutex_);
    auto token_it = tokens_.find(token);
    return token_it != tokens_.end() ? token_it->second.total_supply : 0;
}

// =============================================================================
// TokenCustody
// =============================================================================

TokenCustody::TokenCustody(TokenBalances& book, const Address& custodian)
    : book_(book), custodian_(custodian) {}

bool TokenCustody::transfer_in(const Address& asset, const Address& from, I128 amount) {
    return book_.transfer_from(asset, custodian_, from, custodian_, amount);
}

bool TokenCustody::transfer_out(const Address& asset, const Address& to, I128 amount) {
    return book_.transfer(asset, custodian_, to, amount);
}

// =============================================================================
// StableToken
// =============================================================================

StableToken::StableToken(TokenBalances& book, const Address& token, const Address& owner)
    : book_(book), token_(token), owner_(owner) {}

bool StableToken::mint(const Address& to, I128 amount) {
    if (addresses::is_zero(to) || amount <= 0) {
        return false;
    }
    book_.mint(token_, to, amount);
    return true;
}

void StableToken::burn(I128 amount) {
    if (amount <= 0) {
        throw TokenError("burn amount must be > 0");
    }
    if (!book_.burn(token_, owner_, amount)) {
        throw TokenError("burn amount " + to_string(amount) + " exceeds owner balance " +
                         to_string(book_.balance_of(token_, owner_)));
    }
}

bool StableToken::transfer_from(const Address& from, const Address& to, I128 amount) {
    return book_.transfer_from(token_, owner_, from, to, amount);
}

} // namespace dsc
