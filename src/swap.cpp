// =============================================================================
// swap.cpp - Core::swap, tick-crossing swap loop
// =============================================================================

#include "clamm/core.hpp"
#include "clamm/error.hpp"
#include "clamm/liquidity_math.hpp"
#include "clamm/swap_math.hpp"
#include "clamm/tick_math.hpp"
#include "entry_scope.hpp"

#include <algorithm>

namespace clamm {

namespace {

inline I128 checked_add_delta(I128 a, I128 b) {
    I128 result;
    if (__builtin_add_overflow(a, b, &result)) {
        throw CoreError(errors::DELTA_OVERFLOW, "swap amount");
    }
    return result;
}

inline I128 checked_sub_delta(I128 a, I128 b) {
    I128 result;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw CoreError(errors::DELTA_OVERFLOW, "swap amount");
    }
    return result;
}

} // namespace

TickBitmap::SearchResult Core::next_tick(const Pool& pool, int32_t from, bool increasing,
                                         uint32_t skip_ahead) const {
    // Full-range-only pools have ticks at the domain bounds only
    if (pool.key.tick_spacing == tick_math::FULL_RANGE_ONLY_TICK_SPACING) {
        int32_t tick = increasing || from >= tick_math::MAX_TICK ? tick_math::MAX_TICK
                                                                 : tick_math::MIN_TICK;
        return {tick, pool.is_tick_initialized(tick)};
    }
    return increasing ? pool.bitmap.next_initialized_tick(from, pool.key.tick_spacing, skip_ahead)
                      : pool.bitmap.prev_initialized_tick(from, pool.key.tick_spacing, skip_ahead);
}

SwapResult Core::swap(const PoolKey& key, const SwapParams& params) {
    EntryScope scope(*this);

    Address locker = current_locker();
    PoolId id = key.id();
    if (!state_.pools.contains(key)) {
        throw CoreError(errors::POOL_NOT_INITIALIZED);
    }
    if (!tick_math::is_valid_sqrt_ratio(params.sqrt_ratio_limit)) {
        throw CoreError(errors::INVALID_SQRT_RATIO_LIMIT, params.sqrt_ratio_limit.to_string());
    }

    state_.extensions.before_swap(locker, key, params);

    Pool& pool = state_.pools.mutable_pool(key);
    PoolState state = pool.state;
    bool increasing = swap_math::is_price_increasing(params.amount, params.is_token1);

    if (params.amount != 0) {
        if (increasing ? params.sqrt_ratio_limit < state.sqrt_ratio
                       : params.sqrt_ratio_limit > state.sqrt_ratio) {
            throw CoreError(errors::SQRT_RATIO_LIMIT_WRONG_DIRECTION);
        }
    }

    I128 remaining = params.amount;
    I128 calculated = 0;

    while (remaining != 0 && state.sqrt_ratio != params.sqrt_ratio_limit) {
        TickBitmap::SearchResult next = next_tick(pool, state.tick, increasing, params.skip_ahead);
        U256 next_sqrt_ratio = tick_math::tick_to_sqrt_ratio(next.tick);

        U256 step_limit = increasing ? std::min(next_sqrt_ratio, params.sqrt_ratio_limit)
                                     : std::max(next_sqrt_ratio, params.sqrt_ratio_limit);

        swap_math::SwapStep step = swap_math::compute_step(
            state.sqrt_ratio, state.liquidity, step_limit, remaining, params.is_token1, key.fee);

        // Fees are paid in the input token: token1 when the price rises
        if (step.fee_amount != 0 && state.liquidity != 0) {
            U256 growth = (U256(step.fee_amount) << 128) / U256(state.liquidity);
            if (increasing) {
                pool.fees_per_liquidity.value1 = wrapping_add(pool.fees_per_liquidity.value1, growth);
            } else {
                pool.fees_per_liquidity.value0 = wrapping_add(pool.fees_per_liquidity.value0, growth);
            }
        }

        remaining = checked_sub_delta(remaining, step.consumed_amount);
        calculated = checked_add_delta(calculated, step.calculated_amount);

        if (step.sqrt_ratio_next == next_sqrt_ratio) {
            state.sqrt_ratio = next_sqrt_ratio;
            if (next.initialized) {
                I128 liquidity_delta = pool.cross_tick(next.tick, increasing);
                state.liquidity = liquidity_math::add_delta(state.liquidity, liquidity_delta);
            }
            state.tick = increasing ? next.tick : next.tick - 1;
        } else if (step.sqrt_ratio_next != state.sqrt_ratio) {
            state.sqrt_ratio = step.sqrt_ratio_next;
            state.tick = tick_math::sqrt_ratio_to_tick(state.sqrt_ratio);
        }
    }

    // A downward swap that stops exactly on a tick's price sits at that tick:
    // undo the last crossing so tick and liquidity agree with the price
    if (!increasing && state.tick < tick_math::MAX_TICK &&
        tick_math::tick_to_sqrt_ratio(state.tick + 1) == state.sqrt_ratio) {
        int32_t boundary = state.tick + 1;
        if (pool.is_tick_initialized(boundary)) {
            I128 liquidity_delta = pool.cross_tick(boundary, true);
            state.liquidity = liquidity_math::add_delta(state.liquidity, liquidity_delta);
        }
        state.tick = boundary;
    }

    pool.state = state;

    I128 specified = checked_sub_delta(params.amount, remaining);
    BalanceDelta delta = params.is_token1 ? BalanceDelta{calculated, specified}
                                          : BalanceDelta{specified, calculated};

    accountant_.account_debt(key.token0, delta.amount0);
    accountant_.account_debt(key.token1, delta.amount1);

    state_.extensions.after_swap(locker, key, params, delta, state);

    logger_.debug("swap pool ", id, " amount ", i128_to_string(params.amount),
                  params.is_token1 ? " token1" : " token0",
                  " delta ", i128_to_string(delta.amount0), "/", i128_to_string(delta.amount1),
                  " tick ", state.tick);
    scope.commit();
    return SwapResult{delta, state};
}

} // namespace clamm
