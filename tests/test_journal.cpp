// clamm - Journal Tests

#include <catch2/catch_test_macros.hpp>
#include <map>

#include "test_support.hpp"

using namespace clamm;

TEST_CASE("JournaledMap without a journal", "[journal]") {
    JournaledMap<std::map<int, int>> map;
    map.write(1) = 10;
    map.write(2) = 20;
    map.erase(1);

    REQUIRE_FALSE(map.journaling());
    REQUIRE(map.journal_size() == 0);
    REQUIRE(map.find(1) == nullptr);
    REQUIRE(*map.find(2) == 20);
    REQUIRE(map.size() == 1);
}

TEST_CASE("JournaledMap undo", "[journal]") {
    JournaledMap<std::map<int, int>> map;
    map.write(1) = 10;
    map.write(2) = 20;

    map.begin_journal();
    map.write(1) = 11;
    map.write(1) = 12;
    map.erase(2);
    map.write(3) = 30;
    map.erase(4);
    REQUIRE(map.journal_size() == 4);

    SECTION("Rollback restores prior values and removes new keys") {
        map.rollback_journal();
        REQUIRE(*map.find(1) == 10);
        REQUIRE(*map.find(2) == 20);
        REQUIRE_FALSE(map.contains(3));
        REQUIRE(map.size() == 2);
        REQUIRE_FALSE(map.journaling());
        REQUIRE(map.journal_size() == 0);
    }

    SECTION("Commit keeps the writes") {
        map.commit_journal();
        REQUIRE(*map.find(1) == 12);
        REQUIRE_FALSE(map.contains(2));
        REQUIRE(*map.find(3) == 30);
        REQUIRE(map.journal_size() == 0);

        map.write(1) = 13;
        REQUIRE(map.journal_size() == 0);
    }
}

TEST_CASE("TokenLedger journals only touched balances", "[journal]") {
    TokenLedger ledger;
    Token token = addresses::from_u64(0x1000);
    for (uint64_t holder = 1; holder <= 1000; ++holder) {
        ledger.mint(token, addresses::from_u64(holder), 100);
    }

    ledger.begin_journal();
    ledger.transfer(token, addresses::from_u64(1), addresses::from_u64(2), 40);
    ledger.approve(token, addresses::from_u64(3), addresses::from_u64(4), 5);
    REQUIRE(ledger.journal_size() == 3);

    ledger.rollback_journal();
    REQUIRE(ledger.balance_of(token, addresses::from_u64(1)) == U128(100));
    REQUIRE(ledger.balance_of(token, addresses::from_u64(2)) == U128(100));
    REQUIRE(ledger.allowance(token, addresses::from_u64(3), addresses::from_u64(4)) == U128(0));
}

TEST_CASE("PoolRegistry journal", "[journal]") {
    PoolRegistry registry;
    Token t0 = addresses::from_u64(1);
    Token t1 = addresses::from_u64(2);
    PoolKey a = make_pool_key(t0, t1, 0, 10);
    PoolKey b = make_pool_key(t0, t1, 0, 60);
    PoolKey c = make_pool_key(t0, t1, 0, 200);
    registry.create(a, PoolState{Q128, 0, 0});
    registry.create(b, PoolState{Q128, 0, 0});

    registry.begin_journal();
    registry.mutable_pool(a).state.liquidity = 5;
    registry.mutable_pool(a).state.liquidity = 6;
    registry.create(c, PoolState{Q128, 0, 0});
    // b is never copied
    REQUIRE(registry.journal_size() == 2);

    SECTION("Rollback") {
        registry.rollback_journal();
        REQUIRE(registry.pool(a).state.liquidity == U128(0));
        REQUIRE(registry.contains(b));
        REQUIRE_FALSE(registry.contains(c));
        REQUIRE(registry.size() == 2);
    }

    SECTION("Commit") {
        registry.commit_journal();
        REQUIRE(registry.pool(a).state.liquidity == U128(6));
        REQUIRE(registry.contains(c));
        REQUIRE(registry.journal_size() == 0);
    }
}
