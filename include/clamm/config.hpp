#ifndef CLAMM_CONFIG_HPP
#define CLAMM_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "types.hpp"

namespace clamm {

// =============================================================================
// Config - engine settings (builder pattern, JSON-loadable)
// =============================================================================
//
// {
//   "log_level": "info",
//   "owner": "0x...",            // may withdraw protocol fees
//   "core_address": "0x...",     // engine's own token account
//   "max_lock_depth": 32
// }

class Config {
public:
    std::string log_level = "info";
    Address owner = {};
    Address core_address = addresses::from_u64(0xC0DE);
    uint32_t max_lock_depth = 32;

    Config() = default;

    // Throws std::runtime_error when the file cannot be read or parsed
    static Config from_file(std::string_view path);

    // Missing keys keep their defaults. Throws std::runtime_error on malformed
    // JSON or mistyped values.
    static Config from_json(std::string_view content);

    std::string to_json() const;

    // Throws std::invalid_argument on an unknown log level, a zero engine
    // address or a zero lock depth
    void validate() const;

    // Builder methods
    Config& with_owner(const Address& address) {
        owner = address;
        return *this;
    }

    Config& with_core_address(const Address& address) {
        core_address = address;
        return *this;
    }

    Config& with_log_level(std::string_view level) {
        log_level = std::string(level);
        return *this;
    }

    Config& with_max_lock_depth(uint32_t depth) {
        max_lock_depth = depth;
        return *this;
    }
};

} // namespace clamm

#endif // CLAMM_CONFIG_HPP
