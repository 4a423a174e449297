#ifndef CLAMM_POOL_HPP
#define CLAMM_POOL_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "uint256.hpp"
#include "tick_bitmap.hpp"

namespace clamm {

// =============================================================================
// Pool State
// =============================================================================

struct PoolState {
    U256 sqrt_ratio;        // Q128.128
    int32_t tick;           // Greatest tick with tick_to_sqrt_ratio(tick) <= sqrt_ratio
    U128 liquidity;         // Active liquidity at the current tick
};

// =============================================================================
// Swap Parameters
// =============================================================================

struct SwapParams {
    I128 amount;               // > 0 exact input, < 0 exact output
    bool is_token1;            // Token the amount is denominated in
    U256 sqrt_ratio_limit;     // Price bound for the swap
    uint32_t skip_ahead;       // Bitmap words to scan per tick search
};

// =============================================================================
// Fee Growth
// =============================================================================

// Cumulative fees per unit of liquidity, Q128. Wraps modulo 2^256.
struct FeesPerLiquidity {
    U256 value0;
    U256 value1;

    FeesPerLiquidity operator-(const FeesPerLiquidity& other) const {
        return {wrapping_sub(value0, other.value0), wrapping_sub(value1, other.value1)};
    }
    FeesPerLiquidity operator+(const FeesPerLiquidity& other) const {
        return {wrapping_add(value0, other.value0), wrapping_add(value1, other.value1)};
    }
    bool operator==(const FeesPerLiquidity& other) const {
        return value0 == other.value0 && value1 == other.value1;
    }

    // floor(amount << 128 / liquidity) per token
    static FeesPerLiquidity from_amounts(U128 amount0, U128 amount1, U128 liquidity);
};

// =============================================================================
// Tick Info
// =============================================================================

struct TickInfo {
    I128 liquidity_delta;              // Applied to pool liquidity when crossed upward
    U128 liquidity_net;                // Gross liquidity referencing this tick
    FeesPerLiquidity fees_outside;     // Fee growth on the far side of the tick
};

// =============================================================================
// Position
// =============================================================================

struct Position {
    U128 liquidity = 0;
    FeesPerLiquidity fees_per_liquidity_inside_last;

    // Fees accrued since the checkpoint. Throws CoreError(FEES_OVERFLOW).
    std::pair<U128, U128> fees(const FeesPerLiquidity& inside) const;
};

// =============================================================================
// Pool
// =============================================================================

struct Pool {
    PoolKey key;
    PoolState state;
    FeesPerLiquidity fees_per_liquidity;         // Global fee growth
    std::map<int32_t, TickInfo> ticks;
    TickBitmap bitmap;
    std::map<PositionKey, Position> positions;

    // Apply a position's boundary change to a tick. Initializes the fee
    // snapshot when the tick gains its first reference.
    // Throws CoreError(MAX_LIQUIDITY_PER_TICK_EXCEEDED) above the cap.
    void update_tick(int32_t tick, I128 liquidity_delta, bool is_upper, U128 max_liquidity_per_tick);

    // Remove a tick no position references any more
    void prune_tick(int32_t tick);

    // Fee growth accrued inside [lower, upper)
    FeesPerLiquidity fees_inside(int32_t tick_lower, int32_t tick_upper) const;

    // Crossing a tick flips its outside snapshot relative to global growth
    // and returns the liquidity delta to apply (negated when moving down)
    I128 cross_tick(int32_t tick, bool increasing);

    bool is_tick_initialized(int32_t tick) const { return ticks.count(tick) != 0; }

private:
    bool uses_bitmap() const { return key.tick_spacing != 0; }
};

// =============================================================================
// PoolRegistry - PoolKey -> Pool
// =============================================================================
//
// Pools are keyed by the full PoolKey; the id is only the bucket hash.
// While a journal is open, the first write to a pool moves the original aside
// and continues on a copy; pools created in the journal are marked for removal.
// rollback_journal() puts the originals back.

class PoolRegistry {
public:
    PoolRegistry() = default;

    bool contains(const PoolKey& key) const { return pools_.count(key) != 0; }

    const Pool* find(const PoolKey& key) const;

    // Throws CoreError(POOL_ALREADY_INITIALIZED)
    Pool& create(const PoolKey& key, const PoolState& state);

    // Throws CoreError(POOL_NOT_INITIALIZED)
    Pool& mutable_pool(const PoolKey& key);
    const Pool& pool(const PoolKey& key) const;

    std::size_t size() const { return pools_.size(); }

    void begin_journal();
    void commit_journal();
    void rollback_journal();
    std::size_t journal_size() const { return originals_.size(); }

private:
    using PoolMap = std::unordered_map<PoolKey, std::unique_ptr<Pool>, PoolKeyHash>;

    PoolMap pools_;
    PoolMap originals_;     // nullptr: created in the journal
    bool journaling_ = false;
};

} // namespace clamm

#endif // CLAMM_POOL_HPP
