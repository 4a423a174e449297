// clamm - Tick Math Tests

#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

using namespace clamm;
using clamm::test::thrown_code;

TEST_CASE("tick_to_sqrt_ratio known values", "[tick_math]") {
    REQUIRE(tick_math::tick_to_sqrt_ratio(0) == Q128);
    REQUIRE(tick_math::tick_to_sqrt_ratio(1) ==
            U256::from_string("340282537062079388658008856451427006219"));
    REQUIRE(tick_math::tick_to_sqrt_ratio(-1) ==
            U256::from_string("340282196779882608775400081051345954875"));
    REQUIRE(tick_math::tick_to_sqrt_ratio(100) ==
            U256::from_string("340299381456137079477456794382624800654"));
    REQUIRE(tick_math::tick_to_sqrt_ratio(-100) ==
            U256::from_string("340265353236444914223731134834256897676"));
    REQUIRE(tick_math::tick_to_sqrt_ratio(tick_math::MIN_TICK) == tick_math::MIN_SQRT_RATIO);
    REQUIRE(tick_math::tick_to_sqrt_ratio(tick_math::MAX_TICK) == tick_math::MAX_SQRT_RATIO);
}

TEST_CASE("tick_to_sqrt_ratio domain", "[tick_math]") {
    REQUIRE(thrown_code([] { tick_math::tick_to_sqrt_ratio(tick_math::MAX_TICK + 1); }) ==
            errors::INVALID_TICK);
    REQUIRE(thrown_code([] { tick_math::tick_to_sqrt_ratio(tick_math::MIN_TICK - 1); }) ==
            errors::INVALID_TICK);
}

TEST_CASE("tick_to_sqrt_ratio is strictly increasing", "[tick_math]") {
    for (int32_t start : {tick_math::MIN_TICK, -500, tick_math::MAX_TICK - 500}) {
        U256 previous = tick_math::tick_to_sqrt_ratio(start);
        for (int32_t tick = start + 1; tick < start + 500; ++tick) {
            U256 current = tick_math::tick_to_sqrt_ratio(tick);
            REQUIRE(current > previous);
            previous = current;
        }
    }
}

TEST_CASE("sqrt_ratio_to_tick brackets the price", "[tick_math]") {
    SECTION("Exact tick prices") {
        for (int32_t tick : {tick_math::MIN_TICK, -1000000, -100, -1, 0, 1, 100, 1000000,
                             tick_math::MAX_TICK}) {
            REQUIRE(tick_math::sqrt_ratio_to_tick(tick_math::tick_to_sqrt_ratio(tick)) == tick);
        }
    }

    SECTION("Between tick prices") {
        for (int32_t tick : {tick_math::MIN_TICK, -7654321, -1, 0, 42, 7654321,
                             tick_math::MAX_TICK - 1}) {
            U256 lower = tick_math::tick_to_sqrt_ratio(tick);
            U256 upper = tick_math::tick_to_sqrt_ratio(tick + 1);
            REQUIRE(tick_math::sqrt_ratio_to_tick(lower + U256(1)) == tick);
            REQUIRE(tick_math::sqrt_ratio_to_tick(upper - U256(1)) == tick);
        }
    }

    SECTION("Outside the price domain") {
        REQUIRE(thrown_code([] {
            tick_math::sqrt_ratio_to_tick(tick_math::MIN_SQRT_RATIO - U256(1));
        }) == errors::INVALID_SQRT_RATIO);
        REQUIRE(thrown_code([] {
            tick_math::sqrt_ratio_to_tick(tick_math::MAX_SQRT_RATIO + U256(1));
        }) == errors::INVALID_SQRT_RATIO);
        REQUIRE_FALSE(tick_math::is_valid_sqrt_ratio(U256()));
        REQUIRE(tick_math::is_valid_sqrt_ratio(Q128));
    }
}

TEST_CASE("Full range bounds", "[tick_math]") {
    REQUIRE(tick_math::full_range_lower(0) == tick_math::MIN_TICK);
    REQUIRE(tick_math::full_range_upper(0) == tick_math::MAX_TICK);
    REQUIRE(tick_math::full_range_lower(1) == tick_math::MIN_TICK);
    REQUIRE(tick_math::full_range_upper(100) == 88722800);
    REQUIRE(tick_math::full_range_lower(100) == -88722800);
    REQUIRE(tick_math::full_range_upper(tick_math::MAX_TICK_SPACING) % 698605 == 0);
    REQUIRE(thrown_code([] { tick_math::full_range_lower(tick_math::MAX_TICK_SPACING + 1); }) ==
            errors::INVALID_TICK_SPACING);
}
