#ifndef CLAMM_SWAP_MATH_HPP
#define CLAMM_SWAP_MATH_HPP

#include <cstdint>

#include "types.hpp"
#include "uint256.hpp"

namespace clamm {
namespace swap_math {

// =============================================================================
// Fees
// =============================================================================

// ceil(amount * fee / 2^64)
U128 compute_fee(U128 amount, uint64_t fee);

// Smallest input that leaves `after_fee` once the fee is taken:
// ceil(after_fee * 2^64 / (2^64 - fee)). Throws CoreError(AMOUNT_BEFORE_FEE_OVERFLOW).
U128 amount_before_fee(U128 after_fee, uint64_t fee);

// =============================================================================
// Price Movement
// =============================================================================

// Sqrt ratio after adding (amount > 0) or removing (amount < 0) token0 at
// constant liquidity. Rounds up. Returns U256::max() when the reserve cannot
// supply the requested output.
U256 next_sqrt_ratio_from_amount0(const U256& sqrt_ratio, U128 liquidity, I128 amount);

// Same for token1. Rounds down. Returns 0 when the reserve cannot supply the
// requested output.
U256 next_sqrt_ratio_from_amount1(const U256& sqrt_ratio, U128 liquidity, I128 amount);

// Selling token0 lowers the price; buying token0 (paying token1) raises it
inline bool is_price_increasing(I128 amount, bool is_token1) {
    return is_token1 != (amount < 0);
}

// =============================================================================
// Swap Step
// =============================================================================

struct SwapStep {
    I128 consumed_amount;      // Portion of the specified amount used
    I128 calculated_amount;    // Other token: negative = paid out, positive = owed
    U256 sqrt_ratio_next;
    U128 fee_amount;           // In the input token
};

// One step of a swap against constant liquidity, stopping at the first of the
// amount running out or `sqrt_ratio_limit` being reached
SwapStep compute_step(const U256& sqrt_ratio, U128 liquidity, const U256& sqrt_ratio_limit,
                      I128 amount, bool is_token1, uint64_t fee);

} // namespace swap_math
} // namespace clamm

#endif // CLAMM_SWAP_MATH_HPP
