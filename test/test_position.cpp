// DSC - Position Lifecycle Tests (deposit / mint / redeem / burn)

#include "fixtures.hpp"

using namespace dsc;
using namespace dsc::test;

TEST_CASE("Deposit collateral", "[position]") {
    EngineFixture f;
    f.fund(USER, WETH, ether(10));

    SECTION("Credits the ledger and pulls the tokens") {
        f.engine.deposit_collateral(USER, WETH, ether(10));

        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(10));
        REQUIRE(f.book.balance_of(WETH, USER) == 0);
        REQUIRE(f.book.balance_of(WETH, ENGINE) == ether(10));

        AccountInfo info = f.engine.account_information(USER);
        REQUIRE(info.debt_minted == 0);
        REQUIRE(info.collateral_usd == usd(20000));
        REQUIRE(f.engine.health_factor(USER) == protocol::MAX_HEALTH_FACTOR);
    }

    SECTION("Zero amount") {
        REQUIRE_THROWS_MATCHES(f.engine.deposit_collateral(USER, WETH, 0), EngineError,
                               HasKind(ErrorKind::INVALID_AMOUNT));
    }

    SECTION("Asset not on the allow-list") {
        f.fund(USER, DSC_TOKEN, ether(1));
        REQUIRE_THROWS_MATCHES(f.engine.deposit_collateral(USER, DSC_TOKEN, ether(1)), EngineError,
                               HasKind(ErrorKind::ASSET_NOT_ALLOWED));
        REQUIRE(f.book.balance_of(DSC_TOKEN, USER) == ether(1));
    }

    SECTION("Rejected pull leaves no ledger entry") {
        REQUIRE_THROWS_MATCHES(f.engine.deposit_collateral(USER, WETH, ether(11)), EngineError,
                               HasKind(ErrorKind::TRANSFER_FAILED));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == 0);
        REQUIRE(f.book.balance_of(WETH, USER) == ether(10));
    }

    SECTION("Custody refusing the transfer") {
        f.custody.fail_in = true;
        REQUIRE_THROWS_MATCHES(f.engine.deposit_collateral(USER, WETH, ether(1)), EngineError,
                               HasKind(ErrorKind::TRANSFER_FAILED));
        REQUIRE(f.engine.ledger().account_count() == 0);
    }
}

TEST_CASE("Mint debt", "[position]") {
    EngineFixture f;
    f.fund(USER, WETH, ether(10));
    f.engine.deposit_collateral(USER, WETH, ether(10));

    SECTION("Up to exactly the minimum health factor") {
        REQUIRE(f.engine.max_mintable_usd(USER) == usd(10000));

        f.engine.mint_debt(USER, usd(10000));

        REQUIRE(f.engine.health_factor(USER) == X18_ONE);
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
        REQUIRE(f.stable.balance_of(USER) == usd(10000));
        REQUIRE(f.stable.total_supply() == usd(10000));
    }

    SECTION("Over-minting is rejected with the would-be health factor") {
        I128 hf = rejected_health_factor([&] { f.engine.mint_debt(USER, usd(15000)); });
        REQUIRE(hf == 666666666666666666);

        REQUIRE(f.engine.account_information(USER).debt_minted == 0);
        REQUIRE(f.stable.total_supply() == 0);
    }

    SECTION("Mints accumulate") {
        f.engine.mint_debt(USER, usd(4000));
        f.engine.mint_debt(USER, usd(6000));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
        REQUIRE_THROWS_MATCHES(f.engine.mint_debt(USER, 1), EngineError,
                               HasKind(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR));
    }

    SECTION("Zero amount") {
        REQUIRE_THROWS_MATCHES(f.engine.mint_debt(USER, 0), EngineError,
                               HasKind(ErrorKind::INVALID_AMOUNT));
    }

    SECTION("Without collateral") {
        REQUIRE(rejected_health_factor([&] { f.engine.mint_debt(OTHER, usd(1)); }) == 0);
    }

    SECTION("Token refusing to mint") {
        f.debt.fail_mint = true;
        REQUIRE_THROWS_MATCHES(f.engine.mint_debt(USER, usd(100)), EngineError,
                               HasKind(ErrorKind::MINT_FAILED));
        REQUIRE(f.engine.account_information(USER).debt_minted == 0);
    }

    SECTION("Stale price blocks minting") {
        f.now += protocol::ORACLE_TIMEOUT + 1;
        REQUIRE_THROWS_MATCHES(f.engine.mint_debt(USER, usd(100)), EngineError,
                               HasKind(ErrorKind::STALE_PRICE));
    }
}

TEST_CASE("Deposit and mint in one step", "[position]") {
    EngineFixture f;
    f.fund(USER, WETH, ether(10));

    SECTION("Both effects apply") {
        f.engine.deposit_collateral_and_mint(USER, WETH, ether(10), usd(10000));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(10));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
        REQUIRE(f.book.balance_of(WETH, ENGINE) == ether(10));
        REQUIRE(f.stable.balance_of(USER) == usd(10000));
    }

    SECTION("Unhealthy mint cancels the deposit") {
        REQUIRE_THROWS_MATCHES(
            f.engine.deposit_collateral_and_mint(USER, WETH, ether(10), usd(10001)),
            EngineError, HasKind(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == 0);
        REQUIRE(f.book.balance_of(WETH, USER) == ether(10));
    }

    SECTION("Failed mint returns the pulled collateral") {
        f.debt.fail_mint = true;
        REQUIRE_THROWS_MATCHES(
            f.engine.deposit_collateral_and_mint(USER, WETH, ether(10), usd(5000)),
            EngineError, HasKind(ErrorKind::MINT_FAILED));

        REQUIRE(f.engine.collateral_balance(USER, WETH) == 0);
        REQUIRE(f.book.balance_of(WETH, USER) == ether(10));
        REQUIRE(f.book.balance_of(WETH, ENGINE) == 0);
    }
}

TEST_CASE("Redeem collateral", "[position]") {
    EngineFixture f;
    f.fund(USER, WETH, ether(10));
    f.engine.deposit_collateral(USER, WETH, ether(10));

    SECTION("Without debt everything can leave") {
        f.engine.redeem_collateral(USER, WETH, ether(10));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == 0);
        REQUIRE(f.book.balance_of(WETH, USER) == ether(10));
        REQUIRE(f.book.balance_of(WETH, ENGINE) == 0);
    }

    SECTION("All collateral out while in debt") {
        f.engine.mint_debt(USER, usd(100));
        I128 hf = rejected_health_factor([&] { f.engine.redeem_collateral(USER, WETH, ether(10)); });
        REQUIRE(hf == 0);
        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(10));
    }

    SECTION("Partial redemption keeps the position healthy") {
        f.engine.mint_debt(USER, usd(5000));
        f.engine.redeem_collateral(USER, WETH, ether(5));
        REQUIRE(f.engine.health_factor(USER) == X18_ONE);
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, WETH, 1), EngineError,
                               HasKind(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR));
    }

    SECTION("More than deposited") {
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, WETH, ether(11)), EngineError,
                               HasKind(ErrorKind::INSUFFICIENT_BALANCE));
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, WBTC, 1), EngineError,
                               HasKind(ErrorKind::INSUFFICIENT_BALANCE));
    }

    SECTION("Invalid requests") {
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, WETH, 0), EngineError,
                               HasKind(ErrorKind::INVALID_AMOUNT));
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, OTHER, 1), EngineError,
                               HasKind(ErrorKind::ASSET_NOT_ALLOWED));
    }

    SECTION("Custody refusing the payout") {
        f.custody.fail_out = true;
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral(USER, WETH, ether(1)), EngineError,
                               HasKind(ErrorKind::TRANSFER_FAILED));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(10));
    }
}

TEST_CASE("Burn debt", "[position]") {
    EngineFixture f;
    f.open_position(USER, ether(10), usd(10000));

    SECTION("Pulls the tokens and burns them") {
        f.approve_debt(USER, usd(4000));
        f.engine.burn_debt(USER, usd(4000));

        REQUIRE(f.engine.account_information(USER).debt_minted == usd(6000));
        REQUIRE(f.stable.balance_of(USER) == usd(6000));
        REQUIRE(f.stable.balance_of(ENGINE) == 0);
        REQUIRE(f.stable.total_supply() == usd(6000));
    }

    SECTION("Burning all debt restores the maximum health factor") {
        f.approve_debt(USER, usd(10000));
        f.engine.burn_debt(USER, usd(10000));
        REQUIRE(f.engine.health_factor(USER) == protocol::MAX_HEALTH_FACTOR);
    }

    SECTION("More than owed") {
        f.approve_debt(USER, usd(20000));
        REQUIRE_THROWS_MATCHES(f.engine.burn_debt(USER, usd(10001)), EngineError,
                               HasKind(ErrorKind::INSUFFICIENT_BALANCE));
    }

    SECTION("Without token approval") {
        REQUIRE_THROWS_MATCHES(f.engine.burn_debt(USER, usd(100)), EngineError,
                               HasKind(ErrorKind::TRANSFER_FAILED));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
        REQUIRE(f.stable.total_supply() == usd(10000));
    }

    SECTION("Token rejects the burn") {
        f.approve_debt(USER, usd(4000));
        f.debt.fail_burn = true;

        REQUIRE_THROWS_MATCHES(f.engine.burn_debt(USER, usd(4000)), EngineError,
                               HasKind(ErrorKind::TRANSFER_FAILED));

        // The pull is handed back and nothing is recorded
        REQUIRE(f.stable.balance_of(USER) == usd(10000));
        REQUIRE(f.stable.balance_of(ENGINE) == 0);
        REQUIRE(f.stable.total_supply() == usd(10000));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
    }

    SECTION("Partial burn that leaves the position unhealthy") {
        f.set_price(ETH_FEED, 1000);
        f.approve_debt(USER, usd(1000));
        REQUIRE_THROWS_MATCHES(f.engine.burn_debt(USER, usd(1000)), EngineError,
                               HasKind(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
        REQUIRE(f.stable.balance_of(USER) == usd(10000));
    }
}

TEST_CASE("Redeem collateral for debt", "[position]") {
    EngineFixture f;
    f.open_position(USER, ether(10), usd(10000));

    SECTION("Burn and redeem together") {
        f.approve_debt(USER, usd(5000));
        f.engine.redeem_collateral_for_debt(USER, WETH, ether(5), usd(5000));

        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(5));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(5000));
        REQUIRE(f.engine.health_factor(USER) == X18_ONE);
        REQUIRE(f.book.balance_of(WETH, USER) == ether(5));
        REQUIRE(f.stable.total_supply() == usd(5000));
    }

    SECTION("Close the whole position") {
        f.approve_debt(USER, usd(10000));
        f.engine.redeem_collateral_for_debt(USER, WETH, ether(10), usd(10000));
        REQUIRE(f.engine.account_information(USER).collateral_usd == 0);
        REQUIRE(f.engine.health_factor(USER) == protocol::MAX_HEALTH_FACTOR);
    }

    SECTION("Too much collateral for the debt repaid") {
        f.approve_debt(USER, usd(1000));
        REQUIRE_THROWS_MATCHES(
            f.engine.redeem_collateral_for_debt(USER, WETH, ether(5), usd(1000)),
            EngineError, HasKind(ErrorKind::BELOW_MINIMUM_HEALTH_FACTOR));
        REQUIRE(f.stable.balance_of(USER) == usd(10000));
    }

    SECTION("Failed payout hands the pulled tokens back") {
        f.approve_debt(USER, usd(5000));
        f.custody.fail_out = true;
        REQUIRE_THROWS_MATCHES(
            f.engine.redeem_collateral_for_debt(USER, WETH, ether(5), usd(5000)),
            EngineError, HasKind(ErrorKind::TRANSFER_FAILED));

        REQUIRE(f.stable.balance_of(USER) == usd(10000));
        REQUIRE(f.stable.balance_of(ENGINE) == 0);
        REQUIRE(f.stable.total_supply() == usd(10000));
        REQUIRE(f.engine.collateral_balance(USER, WETH) == ether(10));
        REQUIRE(f.engine.account_information(USER).debt_minted == usd(10000));
    }

    SECTION("Invalid requests") {
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral_for_debt(USER, WETH, 0, usd(1)),
                               EngineError, HasKind(ErrorKind::INVALID_AMOUNT));
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral_for_debt(USER, WETH, ether(1), 0),
                               EngineError, HasKind(ErrorKind::INVALID_AMOUNT));
        REQUIRE_THROWS_MATCHES(f.engine.redeem_collateral_for_debt(USER, OTHER, 1, 1),
                               EngineError, HasKind(ErrorKind::ASSET_NOT_ALLOWED));
    }
}
