// =============================================================================
// engine.cpp - Stablecoin Engine Facade
// =============================================================================

#include "dsc/engine.hpp"

#include <mutex>

#include <spdlog/spdlog.h>

namespace dsc {

// =============================================================================
// Constructors
// =============================================================================

Engine::Engine(const EngineConfig& config, const PriceOracle& oracle,
               ICustody& custody, IDebtToken& debt_token)
    : Engine(config.collateral_tokens, config.price_feeds, config.engine_address,
             oracle, custody, debt_token) {}

Engine::Engine(const std::vector<Address>& collateral_tokens,
               const std::vector<Address>& price_feeds,
               const Address& engine_address, const PriceOracle& oracle,
               ICustody& custody, IDebtToken& debt_token)
    : engine_address_(engine_address),
      registry_(collateral_tokens, price_feeds),
      oracle_(oracle),
      solvency_(registry_, oracle_),
      custody_(custody),
      debt_token_(debt_token),
      positions_(registry_, solvency_, custody_, debt_token_, engine_address_),
      liquidations_(registry_, solvency_, positions_),
      listener_(&null_listener_) {
    spdlog::info("engine {} initialised with {} collateral asset(s)",
                 addresses::to_hex(engine_address_), registry_.size());
}

void Engine::set_listener(EngineListener* listener) {
    listener_.store(listener ? listener : &null_listener_, std::memory_order_release);
}

void Engine::finish(Operation& op) {
    op.publish(*listener_.load(std::memory_order_acquire));
}

// =============================================================================
// Collateral
// =============================================================================

void Engine::deposit_collateral(const Address& caller, const Address& asset, I128 amount) {
    Operation op(ledger_, "deposit_collateral");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.deposit_collateral(op, caller, asset, amount);
        op.commit();
    }
    spdlog::debug("{} deposited {} of {}", addresses::to_hex(caller), to_string(amount),
                  addresses::to_hex(asset));
    finish(op);
}

void Engine::redeem_collateral(const Address& caller, const Address& asset, I128 amount) {
    Operation op(ledger_, "redeem_collateral");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.redeem_collateral(op, caller, asset, amount);
        op.commit();
    }
    spdlog::debug("{} redeemed {} of {}", addresses::to_hex(caller), to_string(amount),
                  addresses::to_hex(asset));
    finish(op);
}

// =============================================================================
// Debt
// =============================================================================

void Engine::mint_debt(const Address& caller, I128 amount) {
    Operation op(ledger_, "mint_debt");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.mint_debt(op, caller, amount);
        op.commit();
    }
    spdlog::debug("{} minted {}", addresses::to_hex(caller), to_string(amount));
    finish(op);
}

void Engine::burn_debt(const Address& caller, I128 amount) {
    Operation op(ledger_, "burn_debt");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.burn_debt(op, caller, amount);
        op.commit();
    }
    spdlog::debug("{} burned {}", addresses::to_hex(caller), to_string(amount));
    finish(op);
}

// =============================================================================
// Composites
// =============================================================================

void Engine::deposit_collateral_and_mint(const Address& caller, const Address& asset,
                                         I128 collateral_amount, I128 debt_amount) {
    Operation op(ledger_, "deposit_collateral_and_mint");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.deposit_collateral_and_mint(op, caller, asset, collateral_amount, debt_amount);
        op.commit();
    }
    spdlog::debug("{} deposited {} of {} and minted {}", addresses::to_hex(caller),
                  to_string(collateral_amount), addresses::to_hex(asset), to_string(debt_amount));
    finish(op);
}

void Engine::redeem_collateral_for_debt(const Address& caller, const Address& asset,
                                        I128 collateral_amount, I128 debt_amount) {
    Operation op(ledger_, "redeem_collateral_for_debt");
    {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        positions_.redeem_collateral_for_debt(op, caller, asset, collateral_amount, debt_amount);
        op.commit();
    }
    spdlog::debug("{} burned {} and redeemed {} of {}", addresses::to_hex(caller),
                  to_string(debt_amount), to_string(collateral_amount), addresses::to_hex(asset));
    finish(op);
}

// =============================================================================
// Liquidation
// =============================================================================

LiquidationResult Engine::liquidate(const Address& caller, const Address& asset,
                                    const Address& user, I128 debt_to_cover) {
    Operation op(ledger_, "liquidate");
    LiquidationResult result;
    try {
        std::lock_guard<NonReentrantMutex> lock(guard_);
        result = liquidations_.liquidate(op, caller, asset, user, debt_to_cover);
        op.commit();
    } catch (const EngineError& e) {
        spdlog::warn("liquidation of {} by {} rejected: {}", addresses::to_hex(user),
                     addresses::to_hex(caller), e.what());
        throw;
    }

    spdlog::info("{} liquidated {}: covered {} debt for {} + {} bonus of {}, health {} -> {}",
                 addresses::to_hex(caller), addresses::to_hex(user),
                 to_string(result.debt_covered), to_string(result.collateral_seized),
                 to_string(result.bonus), addresses::to_hex(asset),
                 x18::to_string(result.starting_health_factor),
                 x18::to_string(result.ending_health_factor));
    finish(op);
    return result;
}

// =============================================================================
// Queries
// =============================================================================

AccountInfo Engine::account_information(const Address& user) const {
    return solvency_.account_information(ledger_, user);
}

I128 Engine::health_factor(const Address& user) const {
    return solvency_.health_factor(ledger_, user);
}

I128 Engine::collateral_balance(const Address& user, const Address& asset) const {
    return ledger_.collateral_balance(user, asset);
}

I128 Engine::account_collateral_value(const Address& user) const {
    return solvency_.total_collateral_usd(ledger_, user);
}

I128 Engine::max_mintable_usd(const Address& user) const {
    return solvency_.max_mintable_usd(ledger_, user);
}

I128 Engine::usd_value(const Address& asset, I128 amount) const {
    return solvency_.usd_value(asset, amount);
}

I128 Engine::token_amount_from_usd(const Address& asset, I128 usd_amount) const {
    return solvency_.token_amount_from_usd(asset, usd_amount);
}

LiquidationQuote Engine::quote_liquidation(const Address& asset, I128 debt_to_cover) const {
    return liquidations_.quote(asset, debt_to_cover);
}

} // namespace dsc
