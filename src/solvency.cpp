// =============================================================================
// solvency.cpp - Collateral Valuation and Health Factor
// =============================================================================

#include "dsc/solvency.hpp"
#include "dsc/errors.hpp"
#include "dsc/math.hpp"

namespace dsc {

SolvencyCalculator::SolvencyCalculator(const AssetRegistry& registry, const PriceOracle& oracle)
    : registry_(registry), oracle_(oracle) {}

I128 SolvencyCalculator::price_of(const Address& asset) const {
    // Feed answer rescaled from 8 to 18 decimals
    I128 answer = oracle_.latest_price(registry_.price_feed(asset)).answer;
    return math::checked_mul(answer, protocol::ADDITIONAL_FEED_PRECISION);
}

// =============================================================================
// Conversions
// =============================================================================

I128 SolvencyCalculator::usd_value(const Address& asset, I128 amount) const {
    return math::mul_div(price_of(asset), amount, protocol::PRECISION);
}

I128 SolvencyCalculator::token_amount_from_usd(const Address& asset, I128 usd_amount) const {
    return math::mul_div(usd_amount, protocol::PRECISION, price_of(asset));
}

// =============================================================================
// Aggregates
// =============================================================================

I128 SolvencyCalculator::total_collateral_usd(const AccountState& account) const {
    I128 total = 0;
    for (const Address& asset : registry_.assets()) {
        total = math::checked_add(total, usd_value(asset, account.collateral_of(asset)));
    }
    return total;
}

I128 SolvencyCalculator::total_collateral_usd(const LedgerView& ledger, const Address& user) const {
    return total_collateral_usd(ledger.account(user));
}

AccountInfo SolvencyCalculator::account_information(const LedgerView& ledger,
                                                     const Address& user) const {
    AccountState account = ledger.account(user);
    return AccountInfo{account.debt_minted, total_collateral_usd(account)};
}

I128 SolvencyCalculator::max_mintable_usd(const LedgerView& ledger, const Address& user) const {
    return math::mul_div(total_collateral_usd(ledger, user),
                         protocol::LIQUIDATION_THRESHOLD, protocol::LIQUIDATION_PRECISION);
}

// =============================================================================
// Health Factor
// =============================================================================

I128 SolvencyCalculator::calculate_health_factor(I128 debt_minted, I128 collateral_usd) {
    if (debt_minted == 0) return protocol::MAX_HEALTH_FACTOR;

    I128 adjusted = math::mul_div(collateral_usd, protocol::LIQUIDATION_THRESHOLD,
                                  protocol::LIQUIDATION_PRECISION);
    return math::mul_div_saturating(adjusted, protocol::PRECISION, debt_minted);
}

I128 SolvencyCalculator::health_factor(const LedgerView& ledger, const Address& user) const {
    AccountState account = ledger.account(user);
    // No debt: never unhealthy, and no price lookups needed
    if (account.debt_minted == 0) return protocol::MAX_HEALTH_FACTOR;
    return calculate_health_factor(account.debt_minted, total_collateral_usd(account));
}

void SolvencyCalculator::assert_healthy(const LedgerView& ledger, const Address& user) const {
    I128 hf = health_factor(ledger, user);
    if (hf < protocol::MIN_HEALTH_FACTOR) {
        throw HealthFactorError(hf);
    }
}

} // namespace dsc
