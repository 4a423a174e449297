// =============================================================================
// pool.cpp - Tick, position and fee growth bookkeeping
// =============================================================================

#include "clamm/pool.hpp"
#include "clamm/error.hpp"
#include "clamm/liquidity_math.hpp"

#include <string>

namespace clamm {

namespace {

inline I128 checked_add_i128(I128 a, I128 b) {
    I128 result;
    if (__builtin_add_overflow(a, b, &result)) {
        throw CoreError(errors::LIQUIDITY_OVERFLOW, "tick liquidity delta");
    }
    return result;
}

inline I128 checked_sub_i128(I128 a, I128 b) {
    I128 result;
    if (__builtin_sub_overflow(a, b, &result)) {
        throw CoreError(errors::LIQUIDITY_OVERFLOW, "tick liquidity delta");
    }
    return result;
}

} // namespace

// =============================================================================
// Fee Growth
// =============================================================================

FeesPerLiquidity FeesPerLiquidity::from_amounts(U128 amount0, U128 amount1, U128 liquidity) {
    if (liquidity == 0) return FeesPerLiquidity{};
    return {(U256(amount0) << 128) / U256(liquidity),
            (U256(amount1) << 128) / U256(liquidity)};
}

std::pair<U128, U128> Position::fees(const FeesPerLiquidity& inside) const {
    if (liquidity == 0) return {0, 0};

    FeesPerLiquidity diff = inside - fees_per_liquidity_inside_last;
    U256 fees0 = mul_div(diff.value0, U256(liquidity), Q128, false);
    U256 fees1 = mul_div(diff.value1, U256(liquidity), Q128, false);
    if (!fees0.fits_u128() || !fees1.fits_u128()) {
        throw CoreError(errors::FEES_OVERFLOW);
    }
    return {fees0.lo, fees1.lo};
}

// =============================================================================
// Ticks
// =============================================================================

void Pool::update_tick(int32_t tick, I128 liquidity_delta, bool is_upper,
                       U128 max_liquidity_per_tick) {
    auto it = ticks.find(tick);
    bool fresh = it == ticks.end();
    TickInfo info = fresh ? TickInfo{0, 0, FeesPerLiquidity{}} : it->second;

    U128 net_next = liquidity_math::add_delta(info.liquidity_net, liquidity_delta);
    if (net_next > max_liquidity_per_tick) {
        throw CoreError(errors::MAX_LIQUIDITY_PER_TICK_EXCEEDED,
                        "tick " + std::to_string(tick) + " liquidity " + u128_to_string(net_next));
    }

    // Upper boundaries remove liquidity when crossed upward
    info.liquidity_delta = is_upper ? checked_sub_i128(info.liquidity_delta, liquidity_delta)
                                    : checked_add_i128(info.liquidity_delta, liquidity_delta);
    info.liquidity_net = net_next;

    if (fresh) {
        if (net_next == 0) return;
        // Convention: all growth before initialization happened below the tick
        if (state.tick >= tick) {
            info.fees_outside = fees_per_liquidity;
        }
        if (uses_bitmap()) {
            bitmap.flip(tick, key.tick_spacing);
        }
    }
    ticks[tick] = info;
}

void Pool::prune_tick(int32_t tick) {
    auto it = ticks.find(tick);
    if (it == ticks.end() || it->second.liquidity_net != 0) return;

    ticks.erase(it);
    if (uses_bitmap()) {
        bitmap.flip(tick, key.tick_spacing);
    }
}

FeesPerLiquidity Pool::fees_inside(int32_t tick_lower, int32_t tick_upper) const {
    auto lower_it = ticks.find(tick_lower);
    auto upper_it = ticks.find(tick_upper);
    FeesPerLiquidity lower_outside = lower_it != ticks.end() ? lower_it->second.fees_outside
                                                             : FeesPerLiquidity{};
    FeesPerLiquidity upper_outside = upper_it != ticks.end() ? upper_it->second.fees_outside
                                                             : FeesPerLiquidity{};

    // Fee growth below lower tick
    FeesPerLiquidity fee_below = state.tick >= tick_lower ? lower_outside
                                                          : fees_per_liquidity - lower_outside;
    // Fee growth above upper tick
    FeesPerLiquidity fee_above = state.tick < tick_upper ? upper_outside
                                                         : fees_per_liquidity - upper_outside;

    return fees_per_liquidity - fee_below - fee_above;
}

I128 Pool::cross_tick(int32_t tick, bool increasing) {
    auto it = ticks.find(tick);
    if (it == ticks.end()) return 0;

    TickInfo& info = it->second;
    info.fees_outside = fees_per_liquidity - info.fees_outside;
    return increasing ? info.liquidity_delta : -info.liquidity_delta;
}

// =============================================================================
// PoolRegistry
// =============================================================================

const Pool* PoolRegistry::find(const PoolKey& key) const {
    auto it = pools_.find(key);
    return it != pools_.end() ? it->second.get() : nullptr;
}

Pool& PoolRegistry::create(const PoolKey& key, const PoolState& state) {
    if (contains(key)) {
        throw CoreError(errors::POOL_ALREADY_INITIALIZED);
    }
    auto pool = std::make_unique<Pool>();
    pool->key = key;
    pool->state = state;
    Pool& ref = *pool;
    pools_.emplace(key, std::move(pool));
    if (journaling_) {
        originals_.emplace(key, nullptr);
    }
    return ref;
}

Pool& PoolRegistry::mutable_pool(const PoolKey& key) {
    auto it = pools_.find(key);
    if (it == pools_.end()) {
        throw CoreError(errors::POOL_NOT_INITIALIZED);
    }
    // First write in the journal: keep the original, work on a copy
    if (journaling_ && originals_.count(key) == 0) {
        auto copy = std::make_unique<Pool>(*it->second);
        originals_.emplace(key, std::move(it->second));
        it->second = std::move(copy);
    }
    return *it->second;
}

const Pool& PoolRegistry::pool(const PoolKey& key) const {
    const Pool* found = find(key);
    if (found == nullptr) {
        throw CoreError(errors::POOL_NOT_INITIALIZED);
    }
    return *found;
}

void PoolRegistry::begin_journal() {
    originals_.clear();
    journaling_ = true;
}

void PoolRegistry::commit_journal() {
    originals_.clear();
    journaling_ = false;
}

void PoolRegistry::rollback_journal() {
    for (auto& [key, original] : originals_) {
        if (original) {
            pools_[key] = std::move(original);
        } else {
            pools_.erase(key);
        }
    }
    commit_journal();
}

} // namespace clamm
