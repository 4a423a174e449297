// =============================================================================
// swap_math.cpp - Fee application and single-step swap computation
// =============================================================================

#include "clamm/swap_math.hpp"
#include "clamm/error.hpp"
#include "clamm/liquidity_math.hpp"

#include <algorithm>

namespace clamm {
namespace swap_math {

namespace {

inline U128 magnitude(I128 amount) {
    return amount >= 0 ? static_cast<U128>(amount) : U128(0) - static_cast<U128>(amount);
}

inline I128 to_signed(U128 amount) {
    if (amount > static_cast<U128>(I128_MAX)) {
        throw CoreError(errors::AMOUNT_OVERFLOW, u128_to_string(amount));
    }
    return static_cast<I128>(amount);
}

} // namespace

// =============================================================================
// Fees
// =============================================================================

U128 compute_fee(U128 amount, uint64_t fee) {
    // amount * fee < 2^192, so adding 2^64 - 1 cannot overflow
    U256 product = mul_u128(amount, fee);
    product += U256((U128(1) << 64) - 1);
    return (product >> 64).lo;
}

U128 amount_before_fee(U128 after_fee, uint64_t fee) {
    U256 numerator = U256(after_fee) << 64;
    U256 denominator = U256((U128(1) << 64) - fee);
    U256 result = div_round(numerator, denominator, true);
    if (!result.fits_u128()) {
        throw CoreError(errors::AMOUNT_BEFORE_FEE_OVERFLOW, u128_to_string(after_fee));
    }
    return result.lo;
}

// =============================================================================
// Price Movement
// =============================================================================

U256 next_sqrt_ratio_from_amount0(const U256& sqrt_ratio, U128 liquidity, I128 amount) {
    if (amount == 0) return sqrt_ratio;

    U256 numerator = U256(liquidity) << 128;
    U256 size(magnitude(amount));

    if (amount > 0) {
        // L * s / (L + amount * s), falling back to L / (L / s + amount)
        if (!mul_overflows(size, sqrt_ratio)) {
            U256 product = size * sqrt_ratio;
            if (!add_overflows(numerator, product)) {
                return mul_div(numerator, sqrt_ratio, numerator + product, true);
            }
        }
        return div_round(numerator, numerator / sqrt_ratio + size, true);
    }

    // Removing token0: L * s / (L - amount * s)
    if (mul_overflows(size, sqrt_ratio)) return U256::max();
    U256 product = size * sqrt_ratio;
    if (product >= numerator) return U256::max();

    U256 denominator = numerator - product;
    if (mul_div_overflows(numerator, sqrt_ratio, denominator)) return U256::max();
    U256 result = mul_div(numerator, sqrt_ratio, denominator, false);
    if (result == U256::max()) return result;
    return mul_div(numerator, sqrt_ratio, denominator, true);
}

U256 next_sqrt_ratio_from_amount1(const U256& sqrt_ratio, U128 liquidity, I128 amount) {
    if (amount == 0) return sqrt_ratio;

    U256 shifted = U256(magnitude(amount)) << 128;

    if (amount > 0) {
        U256 quotient = shifted / U256(liquidity);
        if (add_overflows(sqrt_ratio, quotient)) return U256::max();
        return sqrt_ratio + quotient;
    }

    U256 quotient = div_round(shifted, U256(liquidity), true);
    if (quotient >= sqrt_ratio) return U256();
    return sqrt_ratio - quotient;
}

// =============================================================================
// Swap Step
// =============================================================================

SwapStep compute_step(const U256& sqrt_ratio, U128 liquidity, const U256& sqrt_ratio_limit,
                      I128 amount, bool is_token1, uint64_t fee) {
    if (amount == 0 || sqrt_ratio == sqrt_ratio_limit) {
        return SwapStep{0, 0, sqrt_ratio, 0};
    }

    bool increasing = is_price_increasing(amount, is_token1);

    // No depth: price moves straight to the limit without exchanging tokens
    if (liquidity == 0) {
        return SwapStep{0, 0, sqrt_ratio_limit, 0};
    }

    bool exact_out = amount < 0;
    I128 price_impact_amount = amount;
    if (!exact_out) {
        price_impact_amount = amount - static_cast<I128>(compute_fee(static_cast<U128>(amount), fee));
    }

    U256 sqrt_ratio_next = is_token1
        ? next_sqrt_ratio_from_amount1(sqrt_ratio, liquidity, price_impact_amount)
        : next_sqrt_ratio_from_amount0(sqrt_ratio, liquidity, price_impact_amount);

    bool within_limit = increasing ? sqrt_ratio_next <= sqrt_ratio_limit
                                   : sqrt_ratio_next >= sqrt_ratio_limit;

    if (within_limit) {
        // Amount too small to move the price: the pool keeps it all as fee
        if (sqrt_ratio_next == sqrt_ratio) {
            return SwapStep{amount, 0, sqrt_ratio, exact_out ? U128(0) : static_cast<U128>(amount)};
        }

        U128 calculated = is_token1
            ? liquidity_math::amount0_delta(sqrt_ratio_next, sqrt_ratio, liquidity, exact_out)
            : liquidity_math::amount1_delta(sqrt_ratio_next, sqrt_ratio, liquidity, exact_out);

        if (exact_out) {
            U128 including_fee = amount_before_fee(calculated, fee);
            return SwapStep{amount, to_signed(including_fee), sqrt_ratio_next,
                            including_fee - calculated};
        }
        return SwapStep{amount, -to_signed(calculated), sqrt_ratio_next,
                        static_cast<U128>(amount - price_impact_amount)};
    }

    // Limit reached first: size both sides off the price move to the limit
    U128 specified = is_token1
        ? liquidity_math::amount1_delta(sqrt_ratio_limit, sqrt_ratio, liquidity, !exact_out)
        : liquidity_math::amount0_delta(sqrt_ratio_limit, sqrt_ratio, liquidity, !exact_out);
    U128 calculated = is_token1
        ? liquidity_math::amount0_delta(sqrt_ratio_limit, sqrt_ratio, liquidity, exact_out)
        : liquidity_math::amount1_delta(sqrt_ratio_limit, sqrt_ratio, liquidity, exact_out);

    if (exact_out) {
        U128 including_fee = amount_before_fee(calculated, fee);
        return SwapStep{-to_signed(specified), to_signed(including_fee), sqrt_ratio_limit,
                        including_fee - calculated};
    }

    U128 including_fee = std::min(amount_before_fee(specified, fee), static_cast<U128>(amount));
    U128 fee_amount = including_fee > specified ? including_fee - specified : 0;
    return SwapStep{to_signed(including_fee), -to_signed(calculated), sqrt_ratio_limit, fee_amount};
}

} // namespace swap_math
} // namespace clamm
