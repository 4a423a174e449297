#ifndef CLAMM_LIQUIDITY_MATH_HPP
#define CLAMM_LIQUIDITY_MATH_HPP

#include <cstdint>

#include "types.hpp"
#include "uint256.hpp"

namespace clamm {
namespace liquidity_math {

// =============================================================================
// Amount Deltas
// =============================================================================

// Token0 amount covering the price move between two sqrt ratios:
// liquidity * (b - a) / (a * b), in either order. Throws CoreError(AMOUNT_OVERFLOW)
// when the result exceeds 128 bits.
U128 amount0_delta(const U256& sqrt_ratio_a, const U256& sqrt_ratio_b,
                   U128 liquidity, bool round_up);

// Token1 amount covering the price move: liquidity * (b - a) / 2^128
U128 amount1_delta(const U256& sqrt_ratio_a, const U256& sqrt_ratio_b,
                   U128 liquidity, bool round_up);

// Token amounts owed to (positive) or returned by (negative) the pool for a
// liquidity change over [sqrt_lower, sqrt_upper) at the current price.
// Deposits round up, withdrawals round down.
BalanceDelta liquidity_delta_to_amount_delta(const U256& sqrt_ratio, I128 liquidity_delta,
                                             const U256& sqrt_lower, const U256& sqrt_upper);

// =============================================================================
// Liquidity Sizing
// =============================================================================

// Largest liquidity purchasable with `amount` of a single token (saturates at U128_MAX)
U128 max_liquidity_for_token0(const U256& sqrt_lower, const U256& sqrt_upper, U128 amount);
U128 max_liquidity_for_token1(const U256& sqrt_lower, const U256& sqrt_upper, U128 amount);

// Largest liquidity both amounts can pay for at the current price
U128 max_liquidity(const U256& sqrt_ratio, const U256& sqrt_lower, const U256& sqrt_upper,
                   U128 amount0, U128 amount1);

// Per-tick gross liquidity cap: U128_MAX / (1 + 2 * (MAX_TICK / spacing)),
// U128_MAX for full-range-only pools
U128 max_liquidity_per_tick(uint32_t tick_spacing);

// liquidity + delta; throws CoreError(LIQUIDITY_OVERFLOW) on overflow or underflow
U128 add_delta(U128 liquidity, I128 delta);

} // namespace liquidity_math
} // namespace clamm

#endif // CLAMM_LIQUIDITY_MATH_HPP
