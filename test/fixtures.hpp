// DSC Tests - Shared fixtures

#ifndef DSC_TEST_FIXTURES_HPP
#define DSC_TEST_FIXTURES_HPP

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers.hpp>

#include <functional>
#include <string>
#include <vector>

#include "dsc/engine.hpp"
#include "dsc/errors.hpp"

namespace Catch {

template <>
struct StringMaker<__int128> {
    static std::string convert(__int128 v) { return dsc::to_string(v); }
};

template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 v) {
        if (v == 0) return "0";
        std::string out;
        for (; v != 0; v /= 10) out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
        return out;
    }
};

} // namespace Catch

namespace dsc::test {

// =============================================================================
// Identities
// =============================================================================

constexpr Address ENGINE = addresses::from_id(0xE0);

constexpr Address WETH = addresses::from_id(0x1001);
constexpr Address WBTC = addresses::from_id(0x1002);
constexpr Address DSC_TOKEN = addresses::from_id(0x2000);

constexpr Address ETH_FEED = addresses::from_id(0x3001);
constexpr Address BTC_FEED = addresses::from_id(0x3002);

constexpr Address USER = addresses::from_id(0xA1);
constexpr Address LIQUIDATOR = addresses::from_id(0xA2);
constexpr Address OTHER = addresses::from_id(0xA3);

constexpr uint64_t T0 = 1700000000;

inline I128 ether(int64_t n) { return x18::from_int(n); }
inline I128 usd(int64_t n) { return x18::from_int(n); }

// Whole dollars at 8-decimal feed precision
inline I128 feed_price(int64_t dollars) { return static_cast<I128>(dollars) * 100000000; }

// =============================================================================
// Matchers
// =============================================================================

class ErrorKindMatcher : public Catch::Matchers::MatcherBase<EngineError> {
public:
    explicit ErrorKindMatcher(ErrorKind kind) : kind_(kind) {}

    bool match(const EngineError& e) const override { return e.kind() == kind_; }

    std::string describe() const override {
        return std::string("has kind ") + to_string(kind_);
    }

private:
    ErrorKind kind_;
};

inline ErrorKindMatcher HasKind(ErrorKind kind) { return ErrorKindMatcher(kind); }

// Runs fn, requires a HealthFactorError, returns the carried value
template <typename Fn>
I128 rejected_health_factor(Fn&& fn) {
    try {
        fn();
    } catch (const HealthFactorError& e) {
        return e.health_factor();
    }
    FAIL("expected HealthFactorError");
    return 0;
}

// =============================================================================
// Collaborators with failure switches
// =============================================================================

class SwitchableCustody : public ICustody {
public:
    explicit SwitchableCustody(ICustody& inner) : inner_(inner) {}

    bool transfer_in(const Address& asset, const Address& from, I128 amount) override {
        if (on_transfer_in) on_transfer_in();
        if (fail_in) return false;
        return inner_.transfer_in(asset, from, amount);
    }

    bool transfer_out(const Address& asset, const Address& to, I128 amount) override {
        if (fail_out) return false;
        return inner_.transfer_out(asset, to, amount);
    }

    bool fail_in = false;
    bool fail_out = false;
    std::function<void()> on_transfer_in;

private:
    ICustody& inner_;
};

class SwitchableDebtToken : public IDebtToken {
public:
    explicit SwitchableDebtToken(IDebtToken& inner) : inner_(inner) {}

    bool mint(const Address& to, I128 amount) override {
        if (fail_mint) return false;
        return inner_.mint(to, amount);
    }

    void burn(I128 amount) override {
        if (fail_burn) throw TokenError("burn disabled");
        inner_.burn(amount);
    }

    bool transfer_from(const Address& from, const Address& to, I128 amount) override {
        if (fail_transfer) return false;
        return inner_.transfer_from(from, to, amount);
    }

    bool fail_mint = false;
    bool fail_transfer = false;
    bool fail_burn = false;

private:
    IDebtToken& inner_;
};

// =============================================================================
// Event recorder
// =============================================================================

class RecordingListener : public EngineListener {
public:
    void on_ledger_change(const LedgerChange& change) override {
        changes.push_back(change);
    }
    void on_collateral_deposited(const Address& user, const Address&, I128 amount) override {
        events.push_back("deposited " + addresses::to_hex(user) + " " + to_string(amount));
    }
    void on_collateral_redeemed(const Address& from, const Address& to, const Address&,
                                I128 amount) override {
        events.push_back("redeemed " + addresses::to_hex(from) + " -> " + addresses::to_hex(to) +
                         " " + to_string(amount));
    }
    void on_debt_minted(const Address& user, I128 amount) override {
        events.push_back("minted " + addresses::to_hex(user) + " " + to_string(amount));
    }
    void on_debt_burned(const Address& from, const Address& on_behalf_of, I128 amount) override {
        events.push_back("burned " + addresses::to_hex(from) + " for " +
                         addresses::to_hex(on_behalf_of) + " " + to_string(amount));
    }
    void on_liquidation(const LiquidationResult& result) override {
        liquidations.push_back(result);
    }

    std::vector<LedgerChange> changes;
    std::vector<std::string> events;
    std::vector<LiquidationResult> liquidations;
};

// =============================================================================
// EngineFixture - WETH ($2000) and WBTC ($1000) collateral, fixed clock
// =============================================================================

struct EngineFixture {
    uint64_t now = T0;

    PriceFeedStore feeds;
    PriceOracle oracle{feeds, [this] { return now; }};

    TokenBalances book;
    TokenCustody token_custody{book, ENGINE};
    StableToken stable{book, DSC_TOKEN, ENGINE};
    SwitchableCustody custody{token_custody};
    SwitchableDebtToken debt{stable};

    Engine engine{{WETH, WBTC}, {ETH_FEED, BTC_FEED}, ENGINE, oracle, custody, debt};

    EngineFixture() {
        set_price(ETH_FEED, 2000);
        set_price(BTC_FEED, 1000);
    }

    void set_price(const Address& feed, int64_t dollars) {
        feeds.update_answer(feed, feed_price(dollars), now);
    }

    // Mint collateral tokens to `user` and let the engine pull them
    void fund(const Address& user, const Address& asset, I128 amount) {
        book.mint(asset, user, amount);
        book.approve(asset, user, ENGINE, book.allowance(asset, user, ENGINE) + amount);
    }

    void approve_debt(const Address& user, I128 amount) {
        book.approve(DSC_TOKEN, user, ENGINE, amount);
    }

    // Deposit `collateral` WETH and mint `debt` USD for `user`
    void open_position(const Address& user, I128 collateral, I128 debt_amount) {
        fund(user, WETH, collateral);
        engine.deposit_collateral_and_mint(user, WETH, collateral, debt_amount);
    }
};

} // namespace dsc::test

#endif // DSC_TEST_FIXTURES_HPP
