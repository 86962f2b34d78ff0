// =============================================================================
// registry.cpp - Collateral Asset Allow-list
// =============================================================================

#include "dsc/registry.hpp"
#include "dsc/errors.hpp"

namespace dsc {

AssetRegistry::AssetRegistry(const std::vector<Address>& collateral_tokens,
                             const std::vector<Address>& price_feeds) {
    if (collateral_tokens.size() != price_feeds.size()) {
        throw EngineError(ErrorKind::CONFIGURATION_MISMATCH,
                          std::to_string(collateral_tokens.size()) + " collateral tokens but " +
                          std::to_string(price_feeds.size()) + " price feeds");
    }

    assets_.reserve(collateral_tokens.size());
    for (size_t i = 0; i < collateral_tokens.size(); ++i) {
        const Address& token = collateral_tokens[i];
        if (!feeds_.emplace(token, price_feeds[i]).second) {
            throw EngineError(ErrorKind::CONFIGURATION_MISMATCH,
                              "duplicate collateral token " + addresses::to_hex(token));
        }
        assets_.push_back(token);
    }
}

bool AssetRegistry::is_registered(const Address& asset) const {
    return feeds_.find(asset) != feeds_.end();
}

void AssetRegistry::require_registered(const Address& asset) const {
    if (!is_registered(asset)) {
        throw EngineError(ErrorKind::ASSET_NOT_ALLOWED, addresses::to_hex(asset));
    }
}

const Address& AssetRegistry::price_feed(const Address& asset) const {
    auto it = feeds_.find(asset);
    if (it == feeds_.end()) {
        throw EngineError(ErrorKind::ASSET_NOT_ALLOWED, addresses::to_hex(asset));
    }
    return it->second;
}

} // namespace dsc
