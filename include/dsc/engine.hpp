#ifndef DSC_ENGINE_HPP
#define DSC_ENGINE_HPP

// =============================================================================
// DSC - Overcollateralized Stablecoin Engine
//
//   AssetRegistry       allow-listed collateral + price feeds
//   Ledger              collateral and debt per user
//   SolvencyCalculator  USD valuation, health factor
//   PositionManager     deposit / mint / redeem / burn
//   LiquidationEngine   seizure of unhealthy positions
//
// =============================================================================

#include <atomic>
#include <vector>

#include "types.hpp"
#include "config.hpp"
#include "guard.hpp"
#include "ledger.hpp"
#include "liquidation.hpp"
#include "listener.hpp"
#include "oracle.hpp"
#include "position.hpp"
#include "registry.hpp"
#include "solvency.hpp"
#include "token.hpp"

namespace dsc {

class Engine {
public:
    // Throws CONFIGURATION_MISMATCH when tokens and feeds differ in length
    Engine(const EngineConfig& config, const PriceOracle& oracle,
           ICustody& custody, IDebtToken& debt_token);

    Engine(const std::vector<Address>& collateral_tokens,
           const std::vector<Address>& price_feeds,
           const Address& engine_address, const PriceOracle& oracle,
           ICustody& custody, IDebtToken& debt_token);

    ~Engine() = default;

    // Non-copyable
    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // =========================================================================
    // Mutating Entry Points
    //
    // `caller` is the acting user. Each call holds the engine's
    // non-reentrant guard and either applies all of its effects or none.
    // =========================================================================

    void deposit_collateral(const Address& caller, const Address& asset, I128 amount);
    void mint_debt(const Address& caller, I128 amount);
    void deposit_collateral_and_mint(const Address& caller, const Address& asset,
                                     I128 collateral_amount, I128 debt_amount);

    void redeem_collateral(const Address& caller, const Address& asset, I128 amount);
    void burn_debt(const Address& caller, I128 amount);
    void redeem_collateral_for_debt(const Address& caller, const Address& asset,
                                    I128 collateral_amount, I128 debt_amount);

    LiquidationResult liquidate(const Address& caller, const Address& asset,
                                const Address& user, I128 debt_to_cover);

    // =========================================================================
    // Queries (committed state, no engine lock)
    // =========================================================================

    AccountInfo account_information(const Address& user) const;
    I128 health_factor(const Address& user) const;
    I128 collateral_balance(const Address& user, const Address& asset) const;
    I128 account_collateral_value(const Address& user) const;
    I128 max_mintable_usd(const Address& user) const;

    const std::vector<Address>& collateral_assets() const { return registry_.assets(); }
    const Address& price_feed(const Address& asset) const { return registry_.price_feed(asset); }

    I128 usd_value(const Address& asset, I128 amount) const;
    I128 token_amount_from_usd(const Address& asset, I128 usd_amount) const;
    LiquidationQuote quote_liquidation(const Address& asset, I128 debt_to_cover) const;

    static I128 calculate_health_factor(I128 debt_minted, I128 collateral_usd) {
        return SolvencyCalculator::calculate_health_factor(debt_minted, collateral_usd);
    }

    const Address& address() const { return engine_address_; }
    IDebtToken& debt_token() const { return debt_token_; }
    const Ledger& ledger() const { return ledger_; }

    // =========================================================================
    // Protocol Constants
    // =========================================================================

    static constexpr I128 precision() { return protocol::PRECISION; }
    static constexpr I128 additional_feed_precision() { return protocol::ADDITIONAL_FEED_PRECISION; }
    static constexpr I128 liquidation_threshold() { return protocol::LIQUIDATION_THRESHOLD; }
    static constexpr I128 liquidation_bonus() { return protocol::LIQUIDATION_BONUS; }
    static constexpr I128 liquidation_precision() { return protocol::LIQUIDATION_PRECISION; }
    static constexpr I128 min_health_factor() { return protocol::MIN_HEALTH_FACTOR; }

    // Events are delivered after commit, outside the engine guard.
    // nullptr restores the no-op listener.
    void set_listener(EngineListener* listener);

private:
    void finish(Operation& op);

    Address engine_address_;
    AssetRegistry registry_;
    const PriceOracle& oracle_;
    SolvencyCalculator solvency_;
    Ledger ledger_;
    ICustody& custody_;
    IDebtToken& debt_token_;
    PositionManager positions_;
    LiquidationEngine liquidations_;

    NonReentrantMutex guard_;

    NullEngineListener null_listener_;
    std::atomic<EngineListener*> listener_;
};

} // namespace dsc

#endif // DSC_ENGINE_HPP
