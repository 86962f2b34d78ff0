#ifndef DSC_SOLVENCY_HPP
#define DSC_SOLVENCY_HPP

#include "types.hpp"
#include "ledger.hpp"
#include "oracle.hpp"
#include "registry.hpp"

namespace dsc {

struct AccountInfo {
    I128 debt_minted;          // Debt units (1 unit = $1, 18 decimals)
    I128 collateral_usd;       // USD value, 18 decimals
};

// =============================================================================
// SolvencyCalculator - USD Valuation and Health Factor
//
// Read-only. Every price crossing into ledger precision goes through
// usd_value / token_amount_from_usd, which apply ADDITIONAL_FEED_PRECISION.
// =============================================================================

class SolvencyCalculator {
public:
    SolvencyCalculator(const AssetRegistry& registry, const PriceOracle& oracle);

    // amount * price * 1e10 / 1e18
    I128 usd_value(const Address& asset, I128 amount) const;

    // usd * 1e18 / (price * 1e10)
    I128 token_amount_from_usd(const Address& asset, I128 usd_amount) const;

    // Sum of usd_value over every registered asset, in registry order
    I128 total_collateral_usd(const LedgerView& ledger, const Address& user) const;
    I128 total_collateral_usd(const AccountState& account) const;

    AccountInfo account_information(const LedgerView& ledger, const Address& user) const;

    // MAX_HEALTH_FACTOR when the user has no debt; otherwise
    // (collateral_usd * 50 / 100) * 1e18 / debt
    I128 health_factor(const LedgerView& ledger, const Address& user) const;

    // Throws HealthFactorError when health_factor < MIN_HEALTH_FACTOR
    void assert_healthy(const LedgerView& ledger, const Address& user) const;

    // collateral_usd * 50 / 100
    I128 max_mintable_usd(const LedgerView& ledger, const Address& user) const;

    static I128 calculate_health_factor(I128 debt_minted, I128 collateral_usd);

private:
    I128 price_of(const Address& asset) const;

    const AssetRegistry& registry_;
    const PriceOracle& oracle_;
};

} // namespace dsc

#endif // DSC_SOLVENCY_HPP
