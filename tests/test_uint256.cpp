// clamm - U256 Tests

#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

#include "test_support.hpp"

using namespace clamm;
using clamm::test::thrown_code;

TEST_CASE("U256 parsing and formatting", "[uint256]") {
    SECTION("Decimal round trip") {
        const char* max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
        REQUIRE(U256::from_string(max) == U256::max());
        REQUIRE(U256::max().to_string() == max);
        REQUIRE(U256().to_string() == "0");
        REQUIRE(Q128.to_string() == "340282366920938463463374607431768211456");
    }

    SECTION("Hexadecimal") {
        REQUIRE(U256::from_string("0x100000000000000000000000000000000") == Q128);
        REQUIRE(Q128.to_hex() == "0x100000000000000000000000000000000");
        REQUIRE(U256().to_hex() == "0x0");
    }

    SECTION("Rejects malformed input") {
        REQUIRE_THROWS_AS(U256::from_string(""), std::invalid_argument);
        REQUIRE_THROWS_AS(U256::from_string("12a"), std::invalid_argument);
        REQUIRE_THROWS_AS(U256::from_string("0xZZ"), std::invalid_argument);
        REQUIRE_THROWS_AS(
            U256::from_string("115792089237316195423570985008687907853269984665640564039457584007913129639936"),
            std::out_of_range);
    }
}

TEST_CASE("U256 wrapping arithmetic", "[uint256]") {
    SECTION("Carry across limbs") {
        U256 a(U128_MAX, 0);
        REQUIRE(a + U256(1) == Q128);
        REQUIRE(Q128 - U256(1) == a);
    }

    SECTION("Wraps modulo 2^256") {
        REQUIRE(U256::max() + U256(1) == U256());
        REQUIRE(U256() - U256(1) == U256::max());
    }

    SECTION("Shifts") {
        REQUIRE((U256(1) << 128) == Q128);
        REQUIRE((Q128 >> 127) == U256(2));
        REQUIRE((U256(1) << 255).bit(255));
        REQUIRE((U256(1) << 256) == U256());
    }

    SECTION("Division and remainder") {
        U256 n = U256::from_string("1000000000000000000000000000000000000000000000000");
        U256 d = U256::from_string("3000000000000000000000");
        REQUIRE(n / d == U256::from_string("333333333333333333333333333"));
        REQUIRE(n % d == U256::from_string("1000000000000000000000"));
    }

    SECTION("Bit length") {
        REQUIRE(U256().bit_length() == 0);
        REQUIRE(U256(1).bit_length() == 1);
        REQUIRE(Q128.bit_length() == 129);
        REQUIRE(U256::max().bit_length() == 256);
    }
}

TEST_CASE("U256 checked arithmetic", "[uint256]") {
    SECTION("Overflow detection") {
        REQUIRE(add_overflows(U256::max(), U256(1)));
        REQUIRE_FALSE(add_overflows(U256::max(), U256()));
        REQUIRE(mul_overflows(Q128, Q128));
        REQUIRE_FALSE(mul_overflows(Q128, U256(U128_MAX)));
    }

    SECTION("Checked operations throw") {
        REQUIRE(thrown_code([] { checked_add(U256::max(), U256(1)); }) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(thrown_code([] { checked_sub(U256(1), U256(2)); }) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(thrown_code([] { checked_mul(Q128, Q128); }) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(checked_mul(U256(6), U256(7)) == U256(42));
    }

    SECTION("Conversion to U128") {
        REQUIRE(U256(12345).to_u128() == U128(12345));
        REQUIRE(thrown_code([] { (void)Q128.to_u128(); }) == errors::AMOUNT_OVERFLOW);
    }
}

TEST_CASE("mul_u128 full product", "[uint256]") {
    U256 product = mul_u128(U128_MAX, U128_MAX);
    // (2^128 - 1)^2 = 2^256 - 2^129 + 1
    REQUIRE(product.lo == U128(1));
    REQUIRE(product.hi == U128_MAX - 1);
}

TEST_CASE("mul_div rounding and overflow", "[uint256]") {
    SECTION("Floor and ceiling") {
        REQUIRE(mul_div(U256(10), U256(10), U256(3), false) == U256(33));
        REQUIRE(mul_div(U256(10), U256(10), U256(3), true) == U256(34));
        REQUIRE(mul_div(U256(9), U256(10), U256(3), true) == U256(30));
    }

    SECTION("512-bit intermediate") {
        // max * max / max == max
        REQUIRE(mul_div(U256::max(), U256::max(), U256::max(), false) == U256::max());
        REQUIRE(mul_div(Q128, Q128, Q128, false) == Q128);
        REQUIRE(mul_div(U256::max(), Q128, U256::max(), true) == Q128);
    }

    SECTION("Errors") {
        REQUIRE(thrown_code([] { mul_div(U256(1), U256(1), U256(), false); }) ==
                errors::DIVISION_BY_ZERO);
        REQUIRE(thrown_code([] { mul_div(U256::max(), U256(2), U256(1), false); }) ==
                errors::ARITHMETIC_OVERFLOW);
        REQUIRE(mul_div_overflows(U256::max(), U256(2), U256(1)));
        REQUIRE_FALSE(mul_div_overflows(U256::max(), U256(2), U256(2)));
    }

    SECTION("div_round") {
        REQUIRE(div_round(U256(7), U256(2), false) == U256(3));
        REQUIRE(div_round(U256(7), U256(2), true) == U256(4));
        REQUIRE(div_round(U256(8), U256(2), true) == U256(4));
        REQUIRE(thrown_code([] { div_round(U256(1), U256(), true); }) == errors::DIVISION_BY_ZERO);
    }
}
