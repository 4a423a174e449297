// =============================================================================
// liquidity_math.cpp - Liquidity <-> token amount conversions
// =============================================================================

#include "clamm/liquidity_math.hpp"
#include "clamm/error.hpp"
#include "clamm/tick_math.hpp"

#include <algorithm>
#include <string>

namespace clamm {
namespace liquidity_math {

namespace {

inline void sort_ratios(U256& a, U256& b) {
    if (a > b) std::swap(a, b);
}

inline U128 checked_amount(const U256& amount) {
    if (!amount.fits_u128()) {
        throw CoreError(errors::AMOUNT_OVERFLOW, amount.to_string());
    }
    return amount.lo;
}

inline U128 saturate(const U256& value) {
    return value.fits_u128() ? value.lo : U128_MAX;
}

inline I128 to_signed(U128 amount) {
    if (amount > static_cast<U128>(I128_MAX)) {
        throw CoreError(errors::AMOUNT_OVERFLOW, u128_to_string(amount));
    }
    return static_cast<I128>(amount);
}

} // namespace

// =============================================================================
// Amount Deltas
// =============================================================================

U128 amount0_delta(const U256& sqrt_ratio_a, const U256& sqrt_ratio_b,
                   U128 liquidity, bool round_up) {
    U256 lower = sqrt_ratio_a;
    U256 upper = sqrt_ratio_b;
    sort_ratios(lower, upper);

    if (liquidity == 0 || lower == upper) return 0;

    // (liquidity << 128) * (upper - lower) / upper / lower
    U256 numerator = U256(liquidity) << 128;
    U256 result = mul_div(numerator, upper - lower, upper, round_up);
    result = div_round(result, lower, round_up);
    return checked_amount(result);
}

U128 amount1_delta(const U256& sqrt_ratio_a, const U256& sqrt_ratio_b,
                   U128 liquidity, bool round_up) {
    U256 lower = sqrt_ratio_a;
    U256 upper = sqrt_ratio_b;
    sort_ratios(lower, upper);

    if (liquidity == 0 || lower == upper) return 0;

    return checked_amount(mul_div(U256(liquidity), upper - lower, Q128, round_up));
}

BalanceDelta liquidity_delta_to_amount_delta(const U256& sqrt_ratio, I128 liquidity_delta,
                                             const U256& sqrt_lower, const U256& sqrt_upper) {
    if (liquidity_delta == 0) return BalanceDelta{0, 0};

    bool round_up = liquidity_delta > 0;
    U128 magnitude = liquidity_delta > 0 ? static_cast<U128>(liquidity_delta)
                                         : U128(0) - static_cast<U128>(liquidity_delta);

    U128 amount0 = 0;
    U128 amount1 = 0;
    if (sqrt_ratio <= sqrt_lower) {
        // Range entirely above price: token0 only
        amount0 = amount0_delta(sqrt_lower, sqrt_upper, magnitude, round_up);
    } else if (sqrt_ratio < sqrt_upper) {
        amount0 = amount0_delta(sqrt_ratio, sqrt_upper, magnitude, round_up);
        amount1 = amount1_delta(sqrt_lower, sqrt_ratio, magnitude, round_up);
    } else {
        // Range entirely below price: token1 only
        amount1 = amount1_delta(sqrt_lower, sqrt_upper, magnitude, round_up);
    }

    I128 signed0 = to_signed(amount0);
    I128 signed1 = to_signed(amount1);
    return round_up ? BalanceDelta{signed0, signed1} : BalanceDelta{-signed0, -signed1};
}

// =============================================================================
// Liquidity Sizing
// =============================================================================

U128 max_liquidity_for_token0(const U256& sqrt_lower, const U256& sqrt_upper, U128 amount) {
    U256 lower = sqrt_lower;
    U256 upper = sqrt_upper;
    sort_ratios(lower, upper);
    if (lower == upper) return 0;

    U256 product = mul_div(lower, upper, Q128, false);
    return saturate(mul_div(U256(amount), product, upper - lower, false));
}

U128 max_liquidity_for_token1(const U256& sqrt_lower, const U256& sqrt_upper, U128 amount) {
    U256 lower = sqrt_lower;
    U256 upper = sqrt_upper;
    sort_ratios(lower, upper);
    if (lower == upper) return 0;

    return saturate((U256(amount) << 128) / (upper - lower));
}

U128 max_liquidity(const U256& sqrt_ratio, const U256& sqrt_lower, const U256& sqrt_upper,
                   U128 amount0, U128 amount1) {
    if (sqrt_ratio <= sqrt_lower) {
        return max_liquidity_for_token0(sqrt_lower, sqrt_upper, amount0);
    }
    if (sqrt_ratio < sqrt_upper) {
        return std::min(max_liquidity_for_token0(sqrt_ratio, sqrt_upper, amount0),
                        max_liquidity_for_token1(sqrt_lower, sqrt_ratio, amount1));
    }
    return max_liquidity_for_token1(sqrt_lower, sqrt_upper, amount1);
}

U128 max_liquidity_per_tick(uint32_t tick_spacing) {
    if (tick_spacing > tick_math::MAX_TICK_SPACING) {
        throw CoreError(errors::INVALID_TICK_SPACING, std::to_string(tick_spacing));
    }
    if (tick_spacing == tick_math::FULL_RANGE_ONLY_TICK_SPACING) return U128_MAX;

    U128 ticks_per_side = static_cast<U128>(tick_math::MAX_TICK) / tick_spacing;
    return U128_MAX / (1 + 2 * ticks_per_side);
}

U128 add_delta(U128 liquidity, I128 delta) {
    if (delta >= 0) {
        U128 result = liquidity + static_cast<U128>(delta);
        if (result < liquidity) {
            throw CoreError(errors::LIQUIDITY_OVERFLOW, "liquidity add");
        }
        return result;
    }
    U128 magnitude = U128(0) - static_cast<U128>(delta);
    if (magnitude > liquidity) {
        throw CoreError(errors::LIQUIDITY_OVERFLOW, "liquidity underflow");
    }
    return liquidity - magnitude;
}

} // namespace liquidity_math
} // namespace clamm
