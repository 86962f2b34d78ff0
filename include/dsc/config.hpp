#ifndef DSC_CONFIG_HPP
#define DSC_CONFIG_HPP

#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace dsc {

// =============================================================================
// EngineConfig
//
// JSON layout:
//   {
//     "engine_address":    "0x...",
//     "collateral_tokens": ["0x...", ...],
//     "price_feeds":       ["0x...", ...],   // same order as the tokens
//     "log_level":         "info"            // optional, spdlog level name
//   }
// =============================================================================

struct EngineConfig {
    Address engine_address{};
    std::vector<Address> collateral_tokens;
    std::vector<Address> price_feeds;
    std::string log_level = "info";

    // Throw EngineError(INVALID_CONFIGURATION) on unreadable or malformed input
    static EngineConfig from_file(std::string_view path);
    static EngineConfig from_json(std::string_view content);

    // Builder methods
    EngineConfig& with_engine_address(const Address& addr) {
        engine_address = addr;
        return *this;
    }

    EngineConfig& with_collateral(const Address& token, const Address& price_feed) {
        collateral_tokens.push_back(token);
        price_feeds.push_back(price_feed);
        return *this;
    }

    EngineConfig& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }
};

// Apply log_level to the default spdlog logger
void configure_logging(const EngineConfig& config);

} // namespace dsc

#endif // DSC_CONFIG_HPP
