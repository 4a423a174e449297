// =============================================================================
// tick_bitmap.cpp - Initialized tick search
// =============================================================================

#include "clamm/tick_bitmap.hpp"
#include "clamm/error.hpp"
#include "clamm/tick_math.hpp"

#include <algorithm>
#include <string>

namespace clamm {

namespace {

constexpr int64_t WORD_BITS = 64;

inline int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

inline int64_t checked_spacing(uint32_t tick_spacing) {
    if (tick_spacing == 0 || tick_spacing > tick_math::MAX_TICK_SPACING) {
        throw CoreError(errors::INVALID_TICK_SPACING, std::to_string(tick_spacing));
    }
    return static_cast<int64_t>(tick_spacing);
}

// (word, bit) position of an aligned tick
inline std::pair<int64_t, unsigned> position(int32_t tick, int64_t spacing) {
    if (tick % spacing != 0) {
        throw CoreError(errors::INVALID_TICK, "tick " + std::to_string(tick) +
                        " not aligned to spacing " + std::to_string(spacing));
    }
    int64_t compressed = tick / spacing;
    int64_t word = floor_div(compressed, WORD_BITS);
    return {word, static_cast<unsigned>(compressed - word * WORD_BITS)};
}

} // namespace

void TickBitmap::flip(int32_t tick, uint32_t tick_spacing) {
    auto [word, bit] = position(tick, checked_spacing(tick_spacing));
    uint64_t& bits = words_[word];
    bits ^= uint64_t(1) << bit;
    if (bits == 0) {
        words_.erase(word);
    }
}

bool TickBitmap::is_set(int32_t tick, uint32_t tick_spacing) const {
    auto [word, bit] = position(tick, checked_spacing(tick_spacing));
    auto it = words_.find(word);
    return it != words_.end() && ((it->second >> bit) & 1) != 0;
}

TickBitmap::SearchResult TickBitmap::next_initialized_tick(int32_t from, uint32_t tick_spacing,
                                                           uint32_t skip_ahead) const {
    int64_t spacing = checked_spacing(tick_spacing);
    int64_t start = floor_div(from, spacing) + 1;
    int64_t start_word = floor_div(start, WORD_BITS);
    unsigned start_bit = static_cast<unsigned>(start - start_word * WORD_BITS);
    int64_t last_word = start_word + static_cast<int64_t>(skip_ahead);

    for (auto it = words_.lower_bound(start_word); it != words_.end() && it->first <= last_word; ++it) {
        uint64_t bits = it->second;
        if (it->first == start_word) {
            bits &= ~uint64_t(0) << start_bit;
        }
        if (bits != 0) {
            int64_t compressed = it->first * WORD_BITS + __builtin_ctzll(bits);
            return {static_cast<int32_t>(compressed * spacing), true};
        }
    }

    int64_t boundary = (last_word * WORD_BITS + WORD_BITS - 1) * spacing;
    return {static_cast<int32_t>(std::min<int64_t>(boundary, tick_math::MAX_TICK)), false};
}

TickBitmap::SearchResult TickBitmap::prev_initialized_tick(int32_t from, uint32_t tick_spacing,
                                                           uint32_t skip_ahead) const {
    int64_t spacing = checked_spacing(tick_spacing);
    int64_t compressed_from = floor_div(from, spacing);
    int64_t start_word = floor_div(compressed_from, WORD_BITS);
    unsigned start_bit = static_cast<unsigned>(compressed_from - start_word * WORD_BITS);
    int64_t last_word = start_word - static_cast<int64_t>(skip_ahead);

    auto it = words_.upper_bound(start_word);
    while (it != words_.begin()) {
        --it;
        if (it->first < last_word) break;

        uint64_t bits = it->second;
        if (it->first == start_word && start_bit < 63) {
            bits &= (uint64_t(1) << (start_bit + 1)) - 1;
        }
        if (bits != 0) {
            int64_t compressed = it->first * WORD_BITS + (63 - __builtin_clzll(bits));
            return {static_cast<int32_t>(compressed * spacing), true};
        }
    }

    int64_t boundary = last_word * WORD_BITS * spacing;
    return {static_cast<int32_t>(std::max<int64_t>(boundary, tick_math::MIN_TICK)), false};
}

} // namespace clamm
