#ifndef CLAMM_LOCKER_HPP
#define CLAMM_LOCKER_HPP

#include <cstdint>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Locker Interfaces
// =============================================================================

// Caller-supplied logic run under a lock. Any pool operation, payment or
// withdrawal made from locked() is charged to the lock's debt context.
class ILocker {
public:
    virtual ~ILocker() = default;

    virtual Address address() const = 0;
    virtual Bytes locked(uint32_t lock_id, const Bytes& data) = 0;
};

// Collaborator reached through Core::forward. Acts as the locker for the
// duration of the call; its debts settle in the forwarding lock.
class IForwardee {
public:
    virtual ~IForwardee() = default;

    virtual Address address() const = 0;
    virtual Bytes forwarded(uint32_t lock_id, const Address& original_locker, const Bytes& data) = 0;
};

} // namespace clamm

#endif // CLAMM_LOCKER_HPP
