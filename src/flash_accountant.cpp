// =============================================================================
// flash_accountant.cpp - Lock stack and debt settlement
// =============================================================================

#include "clamm/flash_accountant.hpp"
#include "clamm/error.hpp"

#include <cstddef>
#include <string>

namespace clamm {

FlashAccountant::FlashAccountant(uint32_t max_depth)
    : max_depth_(max_depth) {}

uint32_t FlashAccountant::open_lock(const Address& locker) {
    if (frames_.size() >= max_depth_) {
        throw CoreError(errors::LOCK_DEPTH_EXCEEDED, std::to_string(max_depth_));
    }
    uint32_t id = static_cast<uint32_t>(frames_.size());
    std::optional<uint32_t> parent;
    if (!frames_.empty()) parent = frames_.back().id;
    frames_.push_back(LockFrame{id, parent, id, locker, false});
    return id;
}

void FlashAccountant::close_lock() {
    if (frames_.empty() || frames_.back().forwarded) {
        throw CoreError(errors::NOT_LOCKED, "no lock frame to close");
    }
    uint32_t debt_id = frames_.back().debt_id;
    std::size_t outstanding = nonzero_debt_count(debt_id);
    frames_.pop_back();
    release(debt_id);

    if (outstanding != 0) {
        throw CoreError(errors::DEBTS_NOT_ZEROED,
                        std::to_string(outstanding) + " token(s) unsettled in lock " +
                        std::to_string(debt_id));
    }
}

void FlashAccountant::discard_lock() {
    if (frames_.empty()) return;
    uint32_t debt_id = frames_.back().debt_id;
    bool forwarded = frames_.back().forwarded;
    frames_.pop_back();
    if (!forwarded) {
        release(debt_id);
    }
}

const LockFrame& FlashAccountant::begin_forward(const Address& target) {
    const LockFrame& parent = current();
    if (frames_.size() >= max_depth_) {
        throw CoreError(errors::LOCK_DEPTH_EXCEEDED, std::to_string(max_depth_));
    }
    uint32_t id = static_cast<uint32_t>(frames_.size());
    uint32_t parent_id = parent.id;
    uint32_t debt_id = parent.debt_id;
    frames_.push_back(LockFrame{id, parent_id, debt_id, target, true});
    return frames_.back();
}

void FlashAccountant::end_forward() {
    if (frames_.empty() || !frames_.back().forwarded) {
        throw CoreError(errors::NOT_LOCKED, "no forwarded frame to end");
    }
    frames_.pop_back();
}

const LockFrame& FlashAccountant::current() const {
    if (frames_.empty()) {
        throw CoreError(errors::NOT_LOCKED);
    }
    return frames_.back();
}

void FlashAccountant::account_debt(const Token& token, I128 delta) {
    uint32_t debt_id = current().debt_id;
    if (delta == 0) return;

    auto key = std::make_pair(debt_id, token);
    auto it = debts_.find(key);
    I128 previous = it != debts_.end() ? it->second : 0;
    I128 next;
    if (__builtin_add_overflow(previous, delta, &next)) {
        throw CoreError(errors::DELTA_OVERFLOW, addresses::to_hex(token));
    }

    if (next == 0) {
        if (it != debts_.end()) debts_.erase(it);
    } else {
        debts_[key] = next;
    }
}

I128 FlashAccountant::debt(uint32_t debt_id, const Token& token) const {
    auto it = debts_.find({debt_id, token});
    return it != debts_.end() ? it->second : 0;
}

std::size_t FlashAccountant::nonzero_debt_count(uint32_t debt_id) const {
    // Zero debts are never stored
    auto first = debts_.lower_bound({debt_id, Token{}});
    std::size_t count = 0;
    for (auto it = first; it != debts_.end() && it->first.first == debt_id; ++it) {
        ++count;
    }
    return count;
}

void FlashAccountant::release(uint32_t debt_id) {
    auto first = debts_.lower_bound({debt_id, Token{}});
    auto last = first;
    while (last != debts_.end() && last->first.first == debt_id) ++last;
    debts_.erase(first, last);
}

} // namespace clamm
