// =============================================================================
// entry_scope.hpp - Core entry scope and lock frame guard (library internal)
// =============================================================================

#ifndef CLAMM_ENTRY_SCOPE_HPP
#define CLAMM_ENTRY_SCOPE_HPP

#include <exception>

#include "clamm/core.hpp"

namespace clamm {

// =============================================================================
// Entry Scope (all-or-nothing state changes)
// =============================================================================
//
// The outermost entry opens the state journal. Any scope that ends without
// commit() marks the operation aborted; the outermost scope then rolls the
// journal back, otherwise it commits it.

class Core::EntryScope {
public:
    explicit EntryScope(Core& core)
        : core_(core)
        , exceptions_(std::uncaught_exceptions()) {
        if (core_.entry_depth_ == 0) {
            core_.state_.begin_journal();
            core_.aborted_ = false;
        }
        ++core_.entry_depth_;
    }

    ~EntryScope() {
        --core_.entry_depth_;
        if (!committed_ || std::uncaught_exceptions() > exceptions_) {
            core_.aborted_ = true;
        }
        if (core_.entry_depth_ == 0) {
            if (core_.aborted_) {
                core_.state_.rollback_journal();
                core_.logger_.warn("operation aborted, state restored");
            } else {
                core_.state_.commit_journal();
            }
            core_.aborted_ = false;
        }
    }

    EntryScope(const EntryScope&) = delete;
    EntryScope& operator=(const EntryScope&) = delete;

    void commit() { committed_ = true; }

private:
    Core& core_;
    int exceptions_;
    bool committed_ = false;
};

// Pops the top lock frame unless released
class Core::FrameGuard {
public:
    explicit FrameGuard(FlashAccountant& accountant) : accountant_(accountant) {}
    ~FrameGuard() {
        if (active_) accountant_.discard_lock();
    }

    FrameGuard(const FrameGuard&) = delete;
    FrameGuard& operator=(const FrameGuard&) = delete;

    void release() { active_ = false; }

private:
    FlashAccountant& accountant_;
    bool active_ = true;
};

} // namespace clamm

#endif // CLAMM_ENTRY_SCOPE_HPP
