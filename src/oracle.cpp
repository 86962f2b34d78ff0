// =============================================================================
// oracle.cpp - Price Feed Store and Staleness-checked Oracle
// =============================================================================

#include "dsc/oracle.hpp"
#include "dsc/errors.hpp"

#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

namespace dsc {

// =============================================================================
// PriceFeedStore
// =============================================================================

PriceRound PriceFeedStore::latest_round(const Address& feed) const {
    std::shared_lock lock(mutex_);
    auto it = feeds_.find(feed);
    if (it == feeds_.end() || it->second.rounds.empty()) {
        return PriceRound{0, 0, 0, 0, 0};
    }
    return it->second.rounds.at(it->second.latest_round);
}

std::optional<PriceRound> PriceFeedStore::get_round(const Address& feed, uint64_t round_id) const {
    std::shared_lock lock(mutex_);
    auto it = feeds_.find(feed);
    if (it == feeds_.end()) return std::nullopt;

    auto round_it = it->second.rounds.find(round_id);
    if (round_it == it->second.rounds.end()) return std::nullopt;
    return round_it->second;
}

void PriceFeedStore::update_answer(const Address& feed, I128 answer, uint64_t timestamp) {
    std::unique_lock lock(mutex_);
    FeedHistory& history = feeds_[feed];

    uint64_t round_id = history.latest_round + 1;
    history.rounds[round_id] = PriceRound{round_id, answer, timestamp, timestamp, round_id};
    history.latest_round = round_id;
}

void PriceFeedStore::update_round_data(const Address& feed, const PriceRound& round) {
    std::unique_lock lock(mutex_);
    FeedHistory& history = feeds_[feed];
    history.rounds[round.round_id] = round;
    history.latest_round = round.round_id;
}

bool PriceFeedStore::has_feed(const Address& feed) const {
    std::shared_lock lock(mutex_);
    return feeds_.find(feed) != feeds_.end();
}

// =============================================================================
// PriceOracle
// =============================================================================

uint64_t system_clock_seconds() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count()
    );
}

PriceOracle::PriceOracle(const IPriceFeedSource& source, Clock clock, uint64_t timeout)
    : source_(source),
      clock_(clock ? std::move(clock) : Clock(system_clock_seconds)),
      timeout_(timeout) {}

PriceRound PriceOracle::latest_price(const Address& feed) const {
    PriceRound round = source_.latest_round(feed);

    if (round.updated_at == 0 || round.answered_in_round < round.round_id) {
        spdlog::debug("price feed {} has no completed round", addresses::to_hex(feed));
        throw EngineError(ErrorKind::STALE_PRICE,
                          "incomplete round " + std::to_string(round.round_id) +
                          " on feed " + addresses::to_hex(feed));
    }

    uint64_t now = clock_();
    uint64_t age = now > round.updated_at ? now - round.updated_at : 0;
    if (age > timeout_) {
        spdlog::debug("price feed {} stale: {}s old, timeout {}s",
                      addresses::to_hex(feed), age, timeout_);
        throw EngineError(ErrorKind::STALE_PRICE,
                          "feed " + addresses::to_hex(feed) + " last updated " +
                          std::to_string(age) + "s ago");
    }

    if (round.answer <= 0) {
        throw EngineError(ErrorKind::INVALID_PRICE,
                          "feed " + addresses::to_hex(feed) + " answered " + to_string(round.answer));
    }

    return round;
}

} // namespace dsc
