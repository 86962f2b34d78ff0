#ifndef DSC_LISTENER_HPP
#define DSC_LISTENER_HPP

#include "types.hpp"
#include "ledger.hpp"

namespace dsc {

struct LiquidationResult {
    Address user;
    Address liquidator;
    Address asset;
    I128 debt_covered;
    I128 collateral_seized;      // debt_covered converted to asset units
    I128 bonus;                  // LIQUIDATION_BONUS% of collateral_seized
    I128 starting_health_factor;
    I128 ending_health_factor;

    I128 total_payout() const { return collateral_seized + bonus; }
};

// Callback interface for committed engine events
class EngineListener {
public:
    virtual ~EngineListener() = default;
    virtual void on_ledger_change(const LedgerChange& change) = 0;
    virtual void on_collateral_deposited(const Address& user, const Address& asset, I128 amount) = 0;
    virtual void on_collateral_redeemed(const Address& from, const Address& to,
                                        const Address& asset, I128 amount) = 0;
    virtual void on_debt_minted(const Address& user, I128 amount) = 0;
    virtual void on_debt_burned(const Address& from, const Address& on_behalf_of, I128 amount) = 0;
    virtual void on_liquidation(const LiquidationResult& result) = 0;
};

// No-op listener for when notifications aren't needed
class NullEngineListener : public EngineListener {
public:
    void on_ledger_change(const LedgerChange&) override {}
    void on_collateral_deposited(const Address&, const Address&, I128) override {}
    void on_collateral_redeemed(const Address&, const Address&, const Address&, I128) override {}
    void on_debt_minted(const Address&, I128) override {}
    void on_debt_burned(const Address&, const Address&, I128) override {}
    void on_liquidation(const LiquidationResult&) override {}
};

} // namespace dsc

#endif // DSC_LISTENER_HPP
