// clamm - Flash Accountant Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace clamm;
using clamm::test::thrown_code;

TEST_CASE("FlashAccountant lock frames", "[flash_accountant]") {
    FlashAccountant accountant(4);
    Address alice = addresses::from_u64(1);
    Address bob = addresses::from_u64(2);

    REQUIRE_FALSE(accountant.is_locked());
    REQUIRE(thrown_code([&] { accountant.current(); }) == errors::NOT_LOCKED);

    SECTION("Nested locks get their own debt context") {
        uint32_t outer = accountant.open_lock(alice);
        uint32_t inner = accountant.open_lock(bob);
        REQUIRE(outer == 0);
        REQUIRE(inner == 1);
        REQUIRE(accountant.current().parent_id == outer);
        REQUIRE(accountant.current().debt_id == inner);
        REQUIRE(accountant.current().locker == bob);
        REQUIRE(accountant.depth() == 2);

        accountant.close_lock();
        REQUIRE(accountant.current().locker == alice);
        REQUIRE_FALSE(accountant.current().parent_id.has_value());
        accountant.close_lock();
        REQUIRE_FALSE(accountant.is_locked());
    }

    SECTION("Forwarded frames share the parent's debt context") {
        uint32_t id = accountant.open_lock(alice);
        const LockFrame& frame = accountant.begin_forward(bob);
        REQUIRE(frame.forwarded);
        REQUIRE(frame.debt_id == id);
        REQUIRE(frame.locker == bob);

        Token token = addresses::from_u64(0x1000);
        accountant.account_debt(token, 50);
        accountant.end_forward();
        REQUIRE(accountant.debt(id, token) == 50);

        accountant.account_debt(token, -50);
        REQUIRE_NOTHROW(accountant.close_lock());
    }

    SECTION("Depth limit") {
        for (int i = 0; i < 4; ++i) {
            accountant.open_lock(alice);
        }
        REQUIRE(thrown_code([&] { accountant.open_lock(alice); }) == errors::LOCK_DEPTH_EXCEEDED);
        REQUIRE(thrown_code([&] { accountant.begin_forward(bob); }) == errors::LOCK_DEPTH_EXCEEDED);
    }

    SECTION("Forward and close must match their frame") {
        REQUIRE(thrown_code([&] { accountant.begin_forward(bob); }) == errors::NOT_LOCKED);
        accountant.open_lock(alice);
        REQUIRE(thrown_code([&] { accountant.end_forward(); }) == errors::NOT_LOCKED);
        accountant.begin_forward(bob);
        REQUIRE(thrown_code([&] { accountant.close_lock(); }) == errors::NOT_LOCKED);
    }
}

TEST_CASE("FlashAccountant debt settlement", "[flash_accountant]") {
    FlashAccountant accountant;
    Address alice = addresses::from_u64(1);
    Token token0 = addresses::from_u64(0x1000);
    Token token1 = addresses::from_u64(0x2000);

    SECTION("Debt outside a lock") {
        REQUIRE(thrown_code([&] { accountant.account_debt(token0, 1); }) == errors::NOT_LOCKED);
    }

    uint32_t id = accountant.open_lock(alice);

    SECTION("Balanced debts close cleanly") {
        accountant.account_debt(token0, 100);
        accountant.account_debt(token1, -30);
        REQUIRE(accountant.nonzero_debt_count(id) == 2);

        accountant.account_debt(token0, -100);
        accountant.account_debt(token1, 30);
        REQUIRE(accountant.nonzero_debt_count(id) == 0);
        REQUIRE_NOTHROW(accountant.close_lock());
    }

    SECTION("Unsettled debt fails the close and still pops the frame") {
        accountant.account_debt(token0, 100);
        accountant.account_debt(token0, -99);
        REQUIRE(thrown_code([&] { accountant.close_lock(); }) == errors::DEBTS_NOT_ZEROED);
        REQUIRE_FALSE(accountant.is_locked());
        REQUIRE(accountant.debt(id, token0) == 0);
    }

    SECTION("Credit is a debt too") {
        accountant.account_debt(token1, -1);
        REQUIRE(thrown_code([&] { accountant.close_lock(); }) == errors::DEBTS_NOT_ZEROED);
    }

    SECTION("Overflow") {
        accountant.account_debt(token0, I128_MAX);
        REQUIRE(thrown_code([&] { accountant.account_debt(token0, 1); }) == errors::DELTA_OVERFLOW);
        REQUIRE(accountant.debt(id, token0) == I128_MAX);
    }

    SECTION("Discarding skips settlement") {
        accountant.account_debt(token0, 5);
        accountant.discard_lock();
        REQUIRE_FALSE(accountant.is_locked());
        REQUIRE(accountant.nonzero_debt_count(id) == 0);
    }
}
