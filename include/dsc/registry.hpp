#ifndef DSC_REGISTRY_HPP
#define DSC_REGISTRY_HPP

#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace dsc {

// =============================================================================
// AssetRegistry - Allow-listed Collateral Assets
//
// Immutable after construction. Assets keep the order they were configured
// in; valuation iterates them in that order.
// =============================================================================

class AssetRegistry {
public:
    // Throws CONFIGURATION_MISMATCH when the lists differ in length or an
    // asset appears twice.
    AssetRegistry(const std::vector<Address>& collateral_tokens,
                  const std::vector<Address>& price_feeds);

    bool is_registered(const Address& asset) const;

    // Throws ASSET_NOT_ALLOWED for unregistered assets
    void require_registered(const Address& asset) const;
    const Address& price_feed(const Address& asset) const;

    const std::vector<Address>& assets() const { return assets_; }
    size_t size() const { return assets_.size(); }

private:
    std::vector<Address> assets_;
    std::unordered_map<Address, Address, AddressHash> feeds_;
};

} // namespace dsc

#endif // DSC_REGISTRY_HPP
