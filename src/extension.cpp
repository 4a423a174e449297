// =============================================================================
// extension.cpp - Extension registry and hook dispatch
// =============================================================================

#include "clamm/extension.hpp"
#include "clamm/error.hpp"

namespace clamm {

// =============================================================================
// Call Points
// =============================================================================

uint8_t CallPoints::to_mask() const {
    uint8_t mask = 0;
    if (before_initialize_pool) mask |= 1 << 0;
    if (after_initialize_pool)  mask |= 1 << 1;
    if (before_swap)            mask |= 1 << 2;
    if (after_swap)             mask |= 1 << 3;
    if (before_update_position) mask |= 1 << 4;
    if (after_update_position)  mask |= 1 << 5;
    if (before_collect_fees)    mask |= 1 << 6;
    if (after_collect_fees)     mask |= 1 << 7;
    return mask;
}

CallPoints CallPoints::from_mask(uint8_t mask) {
    CallPoints points;
    points.before_initialize_pool = (mask & (1 << 0)) != 0;
    points.after_initialize_pool  = (mask & (1 << 1)) != 0;
    points.before_swap            = (mask & (1 << 2)) != 0;
    points.after_swap             = (mask & (1 << 3)) != 0;
    points.before_update_position = (mask & (1 << 4)) != 0;
    points.after_update_position  = (mask & (1 << 5)) != 0;
    points.before_collect_fees    = (mask & (1 << 6)) != 0;
    points.after_collect_fees     = (mask & (1 << 7)) != 0;
    return points;
}

// =============================================================================
// Registry
// =============================================================================

void ExtensionDispatcher::register_extension(IExtension& extension, const CallPoints& call_points) {
    Address address = extension.address();
    if (addresses::is_zero(address)) {
        throw CoreError(errors::INVALID_EXTENSION, "zero address");
    }
    if (is_registered(address)) {
        throw CoreError(errors::EXTENSION_ALREADY_REGISTERED, addresses::to_hex(address));
    }
    registry_.write(address) = Registration{&extension, call_points};
}

const ExtensionDispatcher::Registration* ExtensionDispatcher::find(const Address& address) const {
    return registry_.find(address);
}

template <typename Selector>
IExtension* ExtensionDispatcher::target(const Address& actor, const PoolKey& key,
                                        Selector enabled) const {
    if (addresses::is_zero(key.extension)) return nullptr;

    const Registration* registration = find(key.extension);
    if (registration == nullptr) {
        throw CoreError(errors::EXTENSION_NOT_REGISTERED, addresses::to_hex(key.extension));
    }
    // An extension acting on its own pool does not re-enter its hooks
    if (actor == key.extension) return nullptr;
    if (!enabled(registration->call_points)) return nullptr;
    return registration->extension;
}

// =============================================================================
// Hooks
// =============================================================================

void ExtensionDispatcher::before_initialize_pool(const Address& actor, const PoolKey& key,
                                                 int32_t tick) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.before_initialize_pool; })) {
        ext->before_initialize_pool(actor, key, tick);
    }
}

void ExtensionDispatcher::after_initialize_pool(const Address& actor, const PoolKey& key,
                                                int32_t tick, const U256& sqrt_ratio) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.after_initialize_pool; })) {
        ext->after_initialize_pool(actor, key, tick, sqrt_ratio);
    }
}

void ExtensionDispatcher::before_update_position(const Address& actor, const PoolKey& key,
                                                 const UpdatePositionParams& params) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.before_update_position; })) {
        ext->before_update_position(actor, key, params);
    }
}

void ExtensionDispatcher::after_update_position(const Address& actor, const PoolKey& key,
                                                const UpdatePositionParams& params,
                                                const BalanceDelta& delta) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.after_update_position; })) {
        ext->after_update_position(actor, key, params, delta);
    }
}

void ExtensionDispatcher::before_swap(const Address& actor, const PoolKey& key,
                                      const SwapParams& params) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.before_swap; })) {
        ext->before_swap(actor, key, params);
    }
}

void ExtensionDispatcher::after_swap(const Address& actor, const PoolKey& key,
                                     const SwapParams& params, const BalanceDelta& delta,
                                     const PoolState& state) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.after_swap; })) {
        ext->after_swap(actor, key, params, delta, state);
    }
}

void ExtensionDispatcher::before_collect_fees(const Address& actor, const PoolKey& key,
                                              uint64_t salt, int32_t tick_lower,
                                              int32_t tick_upper) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.before_collect_fees; })) {
        ext->before_collect_fees(actor, key, salt, tick_lower, tick_upper);
    }
}

void ExtensionDispatcher::after_collect_fees(const Address& actor, const PoolKey& key,
                                             uint64_t salt, int32_t tick_lower, int32_t tick_upper,
                                             U128 amount0, U128 amount1) const {
    if (auto* ext = target(actor, key, [](const CallPoints& p) { return p.after_collect_fees; })) {
        ext->after_collect_fees(actor, key, salt, tick_lower, tick_upper, amount0, amount1);
    }
}

} // namespace clamm
