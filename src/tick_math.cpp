// =============================================================================
// tick_math.cpp - Tick <-> sqrt ratio conversion
// =============================================================================

#include "clamm/tick_math.hpp"
#include "clamm/error.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace clamm {
namespace tick_math {

namespace {

// Q128 value of 1 / sqrt(1.000001)^(2^i)
constexpr U128 TICK_FACTORS[27] = {
    (U128(0xfffff79c8499329cULL) << 64) | 0x7cbb2510d893283bULL,
    (U128(0xffffef390978c398ULL) << 64) | 0x134b4ff3764fe410ULL,
    (U128(0xffffde72140b00a3ULL) << 64) | 0x54bd3dc828e976c9ULL,
    (U128(0xffffbce42c7be6c9ULL) << 64) | 0x98ad6318193c0b18ULL,
    (U128(0xffff79c86a8f6150ULL) << 64) | 0xa32d9778eceef97cULL,
    (U128(0xfffef3911b7cff24ULL) << 64) | 0xba1b3dbb5f8f5974ULL,
    (U128(0xfffde72350725cc4ULL) << 64) | 0xea8feece3b5f13c8ULL,
    (U128(0xfffbce4b06c196e9ULL) << 64) | 0x247ac87695d53c60ULL,
    (U128(0xfff79ca7a4d1bf1eULL) << 64) | 0xe8556cea23cdbaa5ULL,
    (U128(0xffef3995a5b6a626ULL) << 64) | 0x7530f207142a5764ULL,
    (U128(0xffde7444b2814550ULL) << 64) | 0x8125d10077ba83b8ULL,
    (U128(0xffbceceeb791747fULL) << 64) | 0x10df216f2e53ec57ULL,
    (U128(0xff79eb706b9a64c6ULL) << 64) | 0x431d76e63531e929ULL,
    (U128(0xfef41d1a5f2ae3a2ULL) << 64) | 0x0676bec6f7f9459aULL,
    (U128(0xfde95287d26d81beULL) << 64) | 0xa159c37073122c73ULL,
    (U128(0xfbd701c7cbc4c8a6ULL) << 64) | 0xbb81efd232d1e4e7ULL,
    (U128(0xf7bf5211c72f5185ULL) << 64) | 0xf372aeb1d48f937eULL,
    (U128(0xefc2bf59df33ecc2ULL) << 64) | 0x8125cf78ec4f167fULL,
    (U128(0xe08d357062007962ULL) << 64) | 0x73f0b3a981d90cfdULL,
    (U128(0xc4f76b68947482dcULL) << 64) | 0x198a48a54348c4edULL,
    (U128(0x978bcb9894317807ULL) << 64) | 0xe5fa4498eee7c0faULL,
    (U128(0x59b63684b86e9f48ULL) << 64) | 0x6ec54727371ba6caULL,
    (U128(0x1f703399d88f6aa8ULL) << 64) | 0x3a28b22d4a1f56e3ULL,
    (U128(0x03dc5dac7376e20fULL) << 64) | 0xc8679758d1bcdcfcULL,
    (U128(0x000ee7e32d61fdb0ULL) << 64) | 0xa5e622b820f681d0ULL,
    (U128(0x000000de2ee4bc38ULL) << 64) | 0x1afa7089aa84bb66ULL,
    (U128(0x000000000000c0d5ULL) << 64) | 0x5d4d7152c25fb139ULL,
};

// ln(1.000001) / 2: log of the sqrt ratio step between adjacent ticks
const double LOG_HALF_TICK = std::log1p(1e-6) / 2.0;
const double LOG_Q128 = 128.0 * std::log(2.0);

} // namespace

U256 tick_to_sqrt_ratio(int32_t tick) {
    if (tick < MIN_TICK || tick > MAX_TICK) {
        throw CoreError(errors::INVALID_TICK, std::to_string(tick));
    }

    uint32_t abs_tick = static_cast<uint32_t>(tick < 0 ? -static_cast<int64_t>(tick) : tick);

    // ratio <= 2^128 and every factor < 2^128, so the product fits in 256 bits
    U256 ratio = Q128;
    for (int i = 0; i < 27; ++i) {
        if (abs_tick & (1u << i)) {
            ratio = (ratio * U256(TICK_FACTORS[i])) >> 128;
        }
    }

    if (tick > 0) {
        ratio = U256::max() / ratio;
    }
    return ratio;
}

int32_t sqrt_ratio_to_tick(const U256& sqrt_ratio) {
    if (!is_valid_sqrt_ratio(sqrt_ratio)) {
        throw CoreError(errors::INVALID_SQRT_RATIO, sqrt_ratio.to_string());
    }

    // Floating-point estimate lands within one tick of the answer; the exact
    // conversion settles it
    double log_ratio = std::log(sqrt_ratio.to_double()) - LOG_Q128;
    int64_t estimate = static_cast<int64_t>(std::floor(log_ratio / LOG_HALF_TICK));
    estimate = std::clamp<int64_t>(estimate, MIN_TICK, MAX_TICK);

    int32_t tick = static_cast<int32_t>(estimate);
    while (tick < MAX_TICK && tick_to_sqrt_ratio(tick + 1) <= sqrt_ratio) {
        ++tick;
    }
    while (tick > MIN_TICK && tick_to_sqrt_ratio(tick) > sqrt_ratio) {
        --tick;
    }
    return tick;
}

int32_t full_range_lower(uint32_t tick_spacing) {
    if (tick_spacing > MAX_TICK_SPACING) {
        throw CoreError(errors::INVALID_TICK_SPACING, std::to_string(tick_spacing));
    }
    if (tick_spacing == FULL_RANGE_ONLY_TICK_SPACING) return MIN_TICK;
    int32_t spacing = static_cast<int32_t>(tick_spacing);
    return -(MAX_TICK / spacing) * spacing;
}

int32_t full_range_upper(uint32_t tick_spacing) {
    return -full_range_lower(tick_spacing);
}

} // namespace tick_math
} // namespace clamm
