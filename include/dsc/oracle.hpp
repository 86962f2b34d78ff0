#ifndef DSC_ORACLE_HPP
#define DSC_ORACLE_HPP

#include <map>
#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <functional>

#include "types.hpp"

namespace dsc {

// =============================================================================
// Price Round (8-decimal USD answer)
// =============================================================================

struct PriceRound {
    uint64_t round_id;
    I128 answer;                 // USD per whole unit, FEED_DECIMALS precision
    uint64_t started_at;
    uint64_t updated_at;         // 0 = round never completed
    uint64_t answered_in_round;
};

// =============================================================================
// Price Feed Source Interface
// =============================================================================

class IPriceFeedSource {
public:
    virtual ~IPriceFeedSource() = default;

    // Latest round for a feed; an unknown feed yields a zeroed round
    virtual PriceRound latest_round(const Address& feed) const = 0;
};

// =============================================================================
// PriceFeedStore - In-memory Feed Source with Round History
// =============================================================================

class PriceFeedStore : public IPriceFeedSource {
public:
    PriceFeedStore() = default;

    PriceFeedStore(const PriceFeedStore&) = delete;
    PriceFeedStore& operator=(const PriceFeedStore&) = delete;

    PriceRound latest_round(const Address& feed) const override;
    std::optional<PriceRound> get_round(const Address& feed, uint64_t round_id) const;

    // Opens and completes the next round at `timestamp`
    void update_answer(const Address& feed, I128 answer, uint64_t timestamp);

    // Overwrites a round verbatim and makes it the latest
    void update_round_data(const Address& feed, const PriceRound& round);

    bool has_feed(const Address& feed) const;

private:
    struct FeedHistory {
        uint64_t latest_round = 0;
        std::map<uint64_t, PriceRound> rounds;
    };

    std::unordered_map<Address, FeedHistory, AddressHash> feeds_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// PriceOracle - Staleness-checked Price Lookup
// =============================================================================

using Clock = std::function<uint64_t()>;  // seconds since epoch

uint64_t system_clock_seconds();

class PriceOracle {
public:
    explicit PriceOracle(const IPriceFeedSource& source, Clock clock = {},
                         uint64_t timeout = protocol::ORACLE_TIMEOUT);

    // Throws STALE_PRICE when the round is incomplete, carried over from an
    // earlier round, or older than the timeout; INVALID_PRICE when answer <= 0.
    PriceRound latest_price(const Address& feed) const;

    uint64_t now() const { return clock_(); }
    uint64_t timeout() const { return timeout_; }

private:
    const IPriceFeedSource& source_;
    Clock clock_;
    uint64_t timeout_;
};

} // namespace dsc

#endif // DSC_ORACLE_HPP
