// clamm - Token Ledger Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace clamm;
using clamm::test::thrown_code;

TEST_CASE("TokenLedger balances", "[token_ledger]") {
    TokenLedger ledger;
    Token token = addresses::from_u64(0x1000);
    Address alice = addresses::from_u64(1);
    Address bob = addresses::from_u64(2);

    ledger.mint(token, alice, 1000);
    REQUIRE(ledger.balance_of(token, alice) == U128(1000));
    REQUIRE(ledger.balance_of(token, bob) == U128(0));

    SECTION("Transfer") {
        ledger.transfer(token, alice, bob, 400);
        REQUIRE(ledger.balance_of(token, alice) == U128(600));
        REQUIRE(ledger.balance_of(token, bob) == U128(400));
    }

    SECTION("Insufficient balance leaves balances unchanged") {
        REQUIRE(thrown_code([&] { ledger.transfer(token, alice, bob, 1001); }) ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.balance_of(token, alice) == U128(1000));
        REQUIRE(ledger.balance_of(token, bob) == U128(0));
    }

    SECTION("Mint overflow") {
        REQUIRE(thrown_code([&] { ledger.mint(token, alice, U128_MAX); }) == errors::AMOUNT_OVERFLOW);
    }
}

TEST_CASE("TokenLedger allowances", "[token_ledger]") {
    TokenLedger ledger;
    Token token = addresses::from_u64(0x1000);
    Address alice = addresses::from_u64(1);
    Address router = addresses::from_u64(3);
    Address pool = addresses::from_u64(4);
    ledger.mint(token, alice, 1000);

    SECTION("Spending decrements the allowance") {
        ledger.approve(token, alice, router, 300);
        ledger.transfer_from(token, router, alice, pool, 200);
        REQUIRE(ledger.allowance(token, alice, router) == U128(100));
        REQUIRE(ledger.balance_of(token, pool) == U128(200));

        REQUIRE(thrown_code([&] { ledger.transfer_from(token, router, alice, pool, 101); }) ==
                errors::INSUFFICIENT_ALLOWANCE);
    }

    SECTION("Unlimited allowance is never decremented") {
        ledger.approve(token, alice, router, U128_MAX);
        ledger.transfer_from(token, router, alice, pool, 500);
        REQUIRE(ledger.allowance(token, alice, router) == U128_MAX);
    }

    SECTION("Owners spend their own balance without approval") {
        ledger.transfer_from(token, alice, alice, pool, 1000);
        REQUIRE(ledger.balance_of(token, alice) == U128(0));
    }

    SECTION("Failed transfer keeps the allowance") {
        ledger.approve(token, alice, router, 5000);
        REQUIRE(thrown_code([&] { ledger.transfer_from(token, router, alice, pool, 2000); }) ==
                errors::INSUFFICIENT_BALANCE);
        REQUIRE(ledger.allowance(token, alice, router) == U128(5000));
    }
}
