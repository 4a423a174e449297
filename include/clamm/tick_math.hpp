#ifndef CLAMM_TICK_MATH_HPP
#define CLAMM_TICK_MATH_HPP

#include <cstdint>

#include "types.hpp"
#include "uint256.hpp"

namespace clamm {
namespace tick_math {

// =============================================================================
// Tick Constants
// =============================================================================
//
// Prices are sqrt ratios in Q128.128: sqrt_ratio(t) = sqrt(1.000001^t) * 2^128.

constexpr int32_t MIN_TICK = -88722835;
constexpr int32_t MAX_TICK = 88722835;

constexpr uint32_t MAX_TICK_SPACING = 698605;
constexpr uint32_t FULL_RANGE_ONLY_TICK_SPACING = 0;

// tick_to_sqrt_ratio(MIN_TICK)
constexpr U256 MIN_SQRT_RATIO = U256((U128(0x1ULL) << 64) | 0x000196a05dfeb89eULL, 0);
// tick_to_sqrt_ratio(MAX_TICK)
constexpr U256 MAX_SQRT_RATIO = U256((U128(0x6906a28c6409402eULL) << 64) | 0xefdd9a358361e7ecULL,
                                     U128(0xfffe696227de541aULL));

// Throws CoreError(INVALID_TICK) outside [MIN_TICK, MAX_TICK]
U256 tick_to_sqrt_ratio(int32_t tick);

// Greatest tick whose sqrt ratio is <= sqrt_ratio.
// Throws CoreError(INVALID_SQRT_RATIO) outside [MIN_SQRT_RATIO, MAX_SQRT_RATIO].
int32_t sqrt_ratio_to_tick(const U256& sqrt_ratio);

inline bool is_valid_sqrt_ratio(const U256& sqrt_ratio) {
    return sqrt_ratio >= MIN_SQRT_RATIO && sqrt_ratio <= MAX_SQRT_RATIO;
}

// Widest usable range for a spacing. Spacing 0 spans the whole tick domain.
int32_t full_range_lower(uint32_t tick_spacing);
int32_t full_range_upper(uint32_t tick_spacing);

} // namespace tick_math
} // namespace clamm

#endif // CLAMM_TICK_MATH_HPP
