#ifndef CLAMM_FLASH_ACCOUNTANT_HPP
#define CLAMM_FLASH_ACCOUNTANT_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Lock Frame
// =============================================================================

struct LockFrame {
    uint32_t id;                         // Position on the lock stack
    std::optional<uint32_t> parent_id;   // Enclosing frame, if nested
    uint32_t debt_id;                    // Context whose debts this frame moves
    Address locker;                      // Identity acting in this frame
    bool forwarded;                      // Pushed by forward(), settles into the parent
};

// =============================================================================
// FlashAccountant - nested lock contexts and per-context token debt
// =============================================================================
//
// A lock frame owns a debt context. Forwarded frames act under a different
// identity but charge the enclosing context, which must settle before it closes.

class FlashAccountant {
public:
    explicit FlashAccountant(uint32_t max_depth = 32);

    // Push a lock frame with its own debt context. Returns the lock id.
    // Throws CoreError(LOCK_DEPTH_EXCEEDED).
    uint32_t open_lock(const Address& locker);

    // Pop the top lock frame. Throws CoreError(DEBTS_NOT_ZEROED) if any token
    // debt in its context is nonzero; the frame is popped either way.
    void close_lock();

    // Pop the top frame without settlement checks (abort path)
    void discard_lock();

    // Push a frame acting as `target` within the current debt context.
    // Throws CoreError(NOT_LOCKED) or CoreError(LOCK_DEPTH_EXCEEDED).
    const LockFrame& begin_forward(const Address& target);
    void end_forward();

    // Throws CoreError(NOT_LOCKED)
    const LockFrame& current() const;

    bool is_locked() const { return !frames_.empty(); }
    std::size_t depth() const { return frames_.size(); }
    uint32_t max_depth() const { return max_depth_; }

    // Adjust the current context's debt: positive = owed to the engine.
    // Throws CoreError(NOT_LOCKED) or CoreError(DELTA_OVERFLOW).
    void account_debt(const Token& token, I128 delta);

    I128 debt(uint32_t debt_id, const Token& token) const;
    std::size_t nonzero_debt_count(uint32_t debt_id) const;

private:
    void release(uint32_t debt_id);

    uint32_t max_depth_;
    std::vector<LockFrame> frames_;
    std::map<std::pair<uint32_t, Token>, I128> debts_;
};

} // namespace clamm

#endif // CLAMM_FLASH_ACCOUNTANT_HPP
