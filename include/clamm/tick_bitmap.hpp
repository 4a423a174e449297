#ifndef CLAMM_TICK_BITMAP_HPP
#define CLAMM_TICK_BITMAP_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>

namespace clamm {

// =============================================================================
// TickBitmap - sparse index of initialized ticks
// =============================================================================
//
// Ticks are compressed by the pool's tick spacing (floor division) and packed
// 64 per word. Only non-empty words are stored.

class TickBitmap {
public:
    // Result of a directional search. `initialized` is false when the search
    // stopped at a word or tick-range boundary without finding a tick.
    struct SearchResult {
        int32_t tick;
        bool initialized;
    };

    TickBitmap() = default;

    // Toggle the initialized flag of an aligned tick
    void flip(int32_t tick, uint32_t tick_spacing);

    bool is_set(int32_t tick, uint32_t tick_spacing) const;

    // Nearest initialized tick strictly above `from`, searching at most
    // `skip_ahead + 1` words; clamped to MAX_TICK
    SearchResult next_initialized_tick(int32_t from, uint32_t tick_spacing,
                                       uint32_t skip_ahead) const;

    // Nearest initialized tick at or below `from`, searching at most
    // `skip_ahead + 1` words; clamped to MIN_TICK
    SearchResult prev_initialized_tick(int32_t from, uint32_t tick_spacing,
                                       uint32_t skip_ahead) const;

    std::size_t word_count() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

private:
    std::map<int64_t, uint64_t> words_;
};

} // namespace clamm

#endif // CLAMM_TICK_BITMAP_HPP
