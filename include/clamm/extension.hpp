#ifndef CLAMM_EXTENSION_HPP
#define CLAMM_EXTENSION_HPP

#include <cstddef>
#include <cstdint>
#include <map>

#include "journal.hpp"
#include "types.hpp"
#include "uint256.hpp"
#include "pool.hpp"

namespace clamm {

// =============================================================================
// Call Points (capability mask)
// =============================================================================

struct CallPoints {
    bool before_initialize_pool = false;
    bool after_initialize_pool = false;
    bool before_swap = false;
    bool after_swap = false;
    bool before_update_position = false;
    bool after_update_position = false;
    bool before_collect_fees = false;
    bool after_collect_fees = false;

    uint8_t to_mask() const;
    static CallPoints from_mask(uint8_t mask);
    static CallPoints all() { return from_mask(0xFF); }

    bool operator==(const CallPoints& other) const { return to_mask() == other.to_mask(); }
};

// =============================================================================
// Extension Interface
// =============================================================================
//
// Hooks default to no-ops and run only when enabled in the extension's
// CallPoints. A hook that throws aborts the enclosing operation.

class IExtension {
public:
    virtual ~IExtension() = default;

    virtual Address address() const = 0;

    virtual void before_initialize_pool(const Address& caller, const PoolKey& key, int32_t tick) {}
    virtual void after_initialize_pool(const Address& caller, const PoolKey& key, int32_t tick,
                                       const U256& sqrt_ratio) {}

    virtual void before_update_position(const Address& locker, const PoolKey& key,
                                        const UpdatePositionParams& params) {}
    virtual void after_update_position(const Address& locker, const PoolKey& key,
                                       const UpdatePositionParams& params,
                                       const BalanceDelta& delta) {}

    virtual void before_swap(const Address& locker, const PoolKey& key, const SwapParams& params) {}
    virtual void after_swap(const Address& locker, const PoolKey& key, const SwapParams& params,
                            const BalanceDelta& delta, const PoolState& state) {}

    virtual void before_collect_fees(const Address& locker, const PoolKey& key, uint64_t salt,
                                     int32_t tick_lower, int32_t tick_upper) {}
    virtual void after_collect_fees(const Address& locker, const PoolKey& key, uint64_t salt,
                                    int32_t tick_lower, int32_t tick_upper,
                                    U128 amount0, U128 amount1) {}
};

// =============================================================================
// ExtensionDispatcher - registry and gated hook invocation
// =============================================================================

class ExtensionDispatcher {
public:
    struct Registration {
        IExtension* extension;
        CallPoints call_points;
    };

    // Throws CoreError(INVALID_EXTENSION) for the zero address and
    // CoreError(EXTENSION_ALREADY_REGISTERED) on repeat registration
    void register_extension(IExtension& extension, const CallPoints& call_points);

    bool is_registered(const Address& address) const { return registry_.contains(address); }
    const Registration* find(const Address& address) const;

    // Each call resolves the pool's extension and invokes the hook only when
    // it is enabled and `actor` is not the extension itself
    void before_initialize_pool(const Address& actor, const PoolKey& key, int32_t tick) const;
    void after_initialize_pool(const Address& actor, const PoolKey& key, int32_t tick,
                               const U256& sqrt_ratio) const;
    void before_update_position(const Address& actor, const PoolKey& key,
                                const UpdatePositionParams& params) const;
    void after_update_position(const Address& actor, const PoolKey& key,
                               const UpdatePositionParams& params, const BalanceDelta& delta) const;
    void before_swap(const Address& actor, const PoolKey& key, const SwapParams& params) const;
    void after_swap(const Address& actor, const PoolKey& key, const SwapParams& params,
                    const BalanceDelta& delta, const PoolState& state) const;
    void before_collect_fees(const Address& actor, const PoolKey& key, uint64_t salt,
                             int32_t tick_lower, int32_t tick_upper) const;
    void after_collect_fees(const Address& actor, const PoolKey& key, uint64_t salt,
                            int32_t tick_lower, int32_t tick_upper,
                            U128 amount0, U128 amount1) const;

    void begin_journal() { registry_.begin_journal(); }
    void commit_journal() { registry_.commit_journal(); }
    void rollback_journal() { registry_.rollback_journal(); }
    std::size_t journal_size() const { return registry_.journal_size(); }

private:
    // Extension to call for `key`, or nullptr when the hook is skipped
    template <typename Selector>
    IExtension* target(const Address& actor, const PoolKey& key, Selector enabled) const;

    JournaledMap<std::map<Address, Registration>> registry_;
};

} // namespace clamm

#endif // CLAMM_EXTENSION_HPP
