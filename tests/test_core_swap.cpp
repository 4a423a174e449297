// clamm - Swap Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace clamm;
using clamm::test::Env;
using clamm::test::thrown_code;

namespace {

U256 sqrt_at(int32_t tick) { return tick_math::tick_to_sqrt_ratio(tick); }

// tick == floor(log(price)) at every rest state
bool tick_matches_price(const PoolState& state) {
    return sqrt_at(state.tick) <= state.sqrt_ratio &&
           (state.tick == tick_math::MAX_TICK || state.sqrt_ratio < sqrt_at(state.tick + 1));
}

} // namespace

TEST_CASE("Pool initialization", "[core][swap]") {
    Env env;

    SECTION("Starts at the tick price with no liquidity") {
        PoolKey key = make_pool_key(env.token0, env.token1, fees::FEE_030, 60);
        REQUIRE_FALSE(env.core.get_pool_state(key).has_value());

        U256 sqrt_ratio = env.core.initialize_pool(key, -100);
        REQUIRE(sqrt_ratio == sqrt_at(-100));

        auto state = env.core.get_pool_state(key);
        REQUIRE(state.has_value());
        REQUIRE(state->tick == -100);
        REQUIRE(state->sqrt_ratio == sqrt_ratio);
        REQUIRE(state->liquidity == U128(0));

        REQUIRE(thrown_code([&] { env.core.initialize_pool(key, 0); }) ==
                errors::POOL_ALREADY_INITIALIZED);
    }

    SECTION("Pool keys differ by every field") {
        PoolKey a = make_pool_key(env.token0, env.token1, fees::FEE_030, 60);
        PoolKey b = make_pool_key(env.token1, env.token0, fees::FEE_030, 60);
        PoolKey c = make_pool_key(env.token0, env.token1, fees::FEE_030, 10);
        REQUIRE(a == b);
        REQUIRE(a.id() == b.id());
        REQUIRE(a.id() != c.id());
        env.core.initialize_pool(a, 0);
        REQUIRE_NOTHROW(env.core.initialize_pool(c, 0));
    }

    SECTION("Rejects invalid keys") {
        PoolKey unsorted{env.token1, env.token0, 0, 10, {}};
        REQUIRE(thrown_code([&] { env.core.initialize_pool(unsorted, 0); }) ==
                errors::TOKENS_MUST_BE_SORTED);

        PoolKey same{env.token0, env.token0, 0, 10, {}};
        REQUIRE(thrown_code([&] { env.core.initialize_pool(same, 0); }) ==
                errors::TOKENS_MUST_BE_SORTED);

        PoolKey wide = make_pool_key(env.token0, env.token1, 0, tick_math::MAX_TICK_SPACING + 1);
        REQUIRE(thrown_code([&] { env.core.initialize_pool(wide, 0); }) ==
                errors::INVALID_TICK_SPACING);

        PoolKey hooked = make_pool_key(env.token0, env.token1, 0, 10, addresses::from_u64(0xE47));
        REQUIRE(thrown_code([&] { env.core.initialize_pool(hooked, 0); }) ==
                errors::EXTENSION_NOT_REGISTERED);

        PoolKey key = make_pool_key(env.token0, env.token1, 0, 10);
        REQUIRE(thrown_code([&] { env.core.initialize_pool(key, tick_math::MAX_TICK + 1); }) ==
                errors::INVALID_TICK);
        REQUIRE_FALSE(env.core.get_pool_state(key).has_value());
    }
}

TEST_CASE("Swaps against a full-range position", "[core][swap]") {
    Env env;
    PoolKey key = env.pool(fees::from_ratio(1, 20), 0);
    env.add_liquidity(env.alice, key, tick_math::MIN_TICK, tick_math::MAX_TICK, 10000);

    SECTION("Sell 100 token0") {
        auto result = env.swap(env.bob, key, 100, false, tick_math::MIN_SQRT_RATIO);
        REQUIRE(result.delta == BalanceDelta{100, -94});
        REQUIRE(result.state.sqrt_ratio ==
                U256::from_string("337080105914748354099430022220671829080"));
        REQUIRE(result.state.liquidity == U128(10000));
        REQUIRE(result.state.tick < 0);
        REQUIRE(tick_matches_price(result.state));
    }

    SECTION("Sell 100 token1") {
        auto result = env.swap(env.bob, key, 100, true, tick_math::MAX_SQRT_RATIO);
        REQUIRE(result.delta == BalanceDelta{-94, 100});
        REQUIRE(result.state.tick > 0);
        REQUIRE(tick_matches_price(result.state));
    }

    SECTION("Buy 100 token0") {
        auto result = env.swap(env.bob, key, -100, false, tick_math::MAX_SQRT_RATIO);
        REQUIRE(result.delta == BalanceDelta{-100, 108});
        REQUIRE(result.state.sqrt_ratio ==
                U256::from_string("343719562546402488346843037809866880259"));
        REQUIRE(tick_matches_price(result.state));
    }

    SECTION("Settlement moves the tokens") {
        U128 before0 = env.balance0(env.bob);
        U128 before1 = env.balance1(env.bob);
        env.swap(env.bob, key, 100, false, tick_math::MIN_SQRT_RATIO);
        REQUIRE(env.balance0(env.bob) == before0 - 100);
        REQUIRE(env.balance1(env.bob) == before1 + 94);
    }

    SECTION("Fees accrue to token0 growth when selling token0") {
        env.swap(env.bob, key, 100, false, tick_math::MIN_SQRT_RATIO);
        auto inside = env.core.get_fees_per_liquidity_inside(key, tick_math::MIN_TICK, tick_math::MAX_TICK);
        REQUIRE(inside.value0 == (U256(5) << 128) / U256(10000));
        REQUIRE(inside.value1 == U256());
    }

    SECTION("Zero amount is a no-op") {
        auto before = *env.core.get_pool_state(key);
        auto result = env.swap(env.bob, key, 0, false, tick_math::MIN_SQRT_RATIO);
        REQUIRE(result.delta == BalanceDelta{0, 0});
        REQUIRE(result.state.sqrt_ratio == before.sqrt_ratio);
        REQUIRE(result.state.tick == before.tick);
    }

    SECTION("Limit at the current price is a no-op") {
        auto result = env.swap(env.bob, key, 100, false, Q128);
        REQUIRE(result.delta == BalanceDelta{0, 0});
        REQUIRE(result.state.sqrt_ratio == Q128);
        REQUIRE(result.state.tick == 0);
    }

    SECTION("Stops at the price limit") {
        U256 limit = sqrt_at(-10);
        auto result = env.swap(env.bob, key, 100, false, limit);
        REQUIRE(result.delta == BalanceDelta{2, 0});
        REQUIRE(result.state.sqrt_ratio == limit);
        REQUIRE(result.state.tick == -10);
    }
}

TEST_CASE("Swap validation", "[core][swap]") {
    Env env;
    PoolKey key = env.pool(fees::FEE_030, 0);
    env.add_liquidity(env.alice, key, tick_math::MIN_TICK, tick_math::MAX_TICK, 10000);

    auto swap_code = [&](const PoolKey& k, I128 amount, bool is_token1, const U256& limit) {
        return thrown_code([&] { env.swap(env.bob, k, amount, is_token1, limit); });
    };

    REQUIRE(swap_code(key, 100, false, sqrt_at(10)) == errors::SQRT_RATIO_LIMIT_WRONG_DIRECTION);
    REQUIRE(swap_code(key, 100, true, sqrt_at(-10)) == errors::SQRT_RATIO_LIMIT_WRONG_DIRECTION);
    REQUIRE(swap_code(key, -100, false, sqrt_at(-10)) == errors::SQRT_RATIO_LIMIT_WRONG_DIRECTION);
    REQUIRE(swap_code(key, 100, false, U256()) == errors::INVALID_SQRT_RATIO_LIMIT);
    REQUIRE(swap_code(key, 100, false, tick_math::MAX_SQRT_RATIO + U256(1)) ==
            errors::INVALID_SQRT_RATIO_LIMIT);

    PoolKey missing = make_pool_key(env.token0, env.token1, 7, 0);
    REQUIRE(swap_code(missing, 100, false, tick_math::MIN_SQRT_RATIO) == errors::POOL_NOT_INITIALIZED);

    REQUIRE(thrown_code([&] {
        env.core.swap(key, SwapParams{100, false, tick_math::MIN_SQRT_RATIO, 0});
    }) == errors::NOT_LOCKED);

    // A zero-amount swap ignores the limit direction
    REQUIRE(swap_code(key, 0, false, sqrt_at(10)) == errors::OK);
}

TEST_CASE("Swapping without liquidity moves to the limit", "[core][swap]") {
    Env env;
    PoolKey key = env.pool(fees::FEE_030, 10);

    auto result = env.swap(env.bob, key, 100, false, sqrt_at(-500));
    REQUIRE(result.delta == BalanceDelta{0, 0});
    REQUIRE(result.state.sqrt_ratio == sqrt_at(-500));
    REQUIRE(result.state.tick == -500);
    REQUIRE(result.state.liquidity == U128(0));
}

TEST_CASE("Pools with colliding ids stay separate", "[core][swap]") {
    Env env;
    PoolKey a = make_pool_key(env.token0, env.token1, 0x9e3fe01f7693b2b8ULL, 15933);
    PoolKey b = make_pool_key(env.token0, env.token1, 0xb413937fca934eb8ULL, 29740);
    REQUIRE(a.id() == b.id());
    REQUIRE(a != b);

    REQUIRE(env.core.initialize_pool(a, 0) == Q128);
    REQUIRE(env.core.initialize_pool(b, 0) == Q128);
    env.add_liquidity(env.alice, a, -15933, 15933, 1000000000);

    REQUIRE(env.core.get_pool_state(b)->liquidity == U128(0));
    REQUIRE(env.core.get_initialized_ticks(b).empty());
    REQUIRE_FALSE(env.core.get_position(b, env.alice, 0, -15933, 15933).has_value());

    auto result = env.swap(env.bob, b, 1000, false, sqrt_at(-1000));
    REQUIRE(result.delta == BalanceDelta{0, 0});
    REQUIRE(env.core.get_pool_state(b)->sqrt_ratio == sqrt_at(-1000));

    auto state = env.core.get_pool_state(a);
    REQUIRE(state->tick == 0);
    REQUIRE(state->sqrt_ratio == Q128);
    REQUIRE(state->liquidity == U128(1000000000));
    REQUIRE(env.core.get_position(a, env.alice, 0, -15933, 15933)->liquidity == U128(1000000000));
}

TEST_CASE("Swaps crossing initialized ticks", "[core][swap]") {
    Env env;
    PoolKey key = env.pool(fees::FEE_100, 10);
    const I128 liquidity = 1000000000000;

    auto wide = env.add_liquidity(env.alice, key, -1000, 1000, liquidity);
    auto narrow = env.add_liquidity(env.alice, key, -50, 50, liquidity);
    REQUIRE(wide.delta == BalanceDelta{499874771, 499874771});
    REQUIRE(narrow.delta == BalanceDelta{24999676, 24999676});
    REQUIRE(env.core.get_pool_state(key)->liquidity == U128(2000000000000));

    // Down through -50: the narrow range drops out
    auto down = env.swap(env.bob, key, 1000000000000, false, sqrt_at(-200));
    REQUIRE(down.delta == BalanceDelta{126267932, -124994625});
    REQUIRE(down.state.tick == -200);
    REQUIRE(down.state.sqrt_ratio == sqrt_at(-200));
    REQUIRE(down.state.liquidity == U128(1000000000000));

    // The narrow range only earned while the price was inside it
    auto narrow_fees = env.collect(env.alice, key, -50, 50);
    auto wide_fees = env.collect(env.alice, key, -1000, 1000);
    REQUIRE(narrow_fees.amount0 == U128(252528));
    REQUIRE(narrow_fees.amount1 == U128(0));
    REQUIRE(wide_fees.amount0 == U128(1010151));
    REQUIRE(wide_fees.amount1 == U128(0));

    // Back up through -50
    auto up = env.swap(env.bob, key, 1000000000000, true, sqrt_at(0));
    REQUIRE(up.delta == BalanceDelta{-125005250, 126257200});
    REQUIRE(up.state.tick == 0);
    REQUIRE(up.state.liquidity == U128(2000000000000));

    narrow_fees = env.collect(env.alice, key, -50, 50);
    wide_fees = env.collect(env.alice, key, -1000, 1000);
    REQUIRE(narrow_fees.amount0 == U128(0));
    REQUIRE(narrow_fees.amount1 == U128(252521));
    REQUIRE(wide_fees.amount1 == U128(1010050));

    SECTION("Stopping exactly on an initialized tick leaves it active") {
        auto result = env.swap(env.bob, key, 1000000000000, false, sqrt_at(-50));
        REQUIRE(result.delta == BalanceDelta{50505658, -49999350});
        REQUIRE(result.state.sqrt_ratio == sqrt_at(-50));
        REQUIRE(result.state.tick == -50);
        REQUIRE(result.state.liquidity == U128(2000000000000));

        // A further move down crosses it once
        auto further = env.swap(env.bob, key, 1000000000000, false, sqrt_at(-60));
        REQUIRE(further.state.tick == -60);
        REQUIRE(further.state.liquidity == U128(1000000000000));
    }

    SECTION("Crossing the outer range leaves no active liquidity") {
        auto result = env.swap(env.bob, key, 1000000000000, true, sqrt_at(2000));
        REQUIRE(result.state.tick == 2000);
        REQUIRE(result.state.liquidity == U128(0));
        REQUIRE(tick_matches_price(result.state));

        auto back = env.swap(env.bob, key, 1000000000000, false, sqrt_at(0));
        REQUIRE(back.state.tick == 0);
        REQUIRE(back.state.liquidity == U128(2000000000000));
    }

    SECTION("A small skip-ahead still reaches distant ticks") {
        auto result = env.swap(env.bob, key, 1000000000000, true, sqrt_at(2000), 0);
        REQUIRE(result.state.tick == 2000);
        REQUIRE(result.state.liquidity == U128(0));
    }
}
