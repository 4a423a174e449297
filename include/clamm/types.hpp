#ifndef CLAMM_TYPES_HPP
#define CLAMM_TYPES_HPP

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace clamm {

// =============================================================================
// Integer Types
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

constexpr U128 U128_MAX = ~U128(0);
constexpr I128 I128_MAX = static_cast<I128>(U128_MAX >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

inline std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

inline std::string i128_to_string(I128 v) {
    if (v >= 0) return u128_to_string(static_cast<U128>(v));
    return "-" + u128_to_string(U128(0) - static_cast<U128>(v));
}

// =============================================================================
// Addresses (EVM-style 20-byte identifiers for tokens, lockers, extensions)
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Token = Address;
using Bytes = std::vector<uint8_t>;

namespace addresses {

// Address whose trailing 8 bytes hold `value` (big-endian)
constexpr Address from_u64(uint64_t value) {
    Address addr = {};
    for (std::size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

inline std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    for (auto b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

// Parses "0x" followed by 40 hex digits
inline Address from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) {
        throw std::invalid_argument("address must have 40 hex digits: " + std::string(text));
    }
    auto nibble = [&](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::invalid_argument("invalid hex digit in address: " + std::string(text));
    };
    Address addr = {};
    for (std::size_t i = 0; i < 20; ++i) {
        addr[i] = static_cast<uint8_t>((nibble(text[2 * i]) << 4) | nibble(text[2 * i + 1]));
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Fees (fraction of 2^64)
// =============================================================================

namespace fees {

constexpr uint64_t from_ratio(uint64_t numerator, uint64_t denominator) {
    return static_cast<uint64_t>((U128(numerator) << 64) / denominator);
}

constexpr uint64_t FEE_001 = from_ratio(1, 10000);  // 0.01%
constexpr uint64_t FEE_005 = from_ratio(5, 10000);  // 0.05%
constexpr uint64_t FEE_030 = from_ratio(3, 1000);   // 0.30%
constexpr uint64_t FEE_100 = from_ratio(1, 100);    // 1.00%

} // namespace fees

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

using PoolId = uint64_t;

struct PoolKey {
    Token token0;            // Sorted: token0 < token1
    Token token1;
    uint64_t fee;            // Fraction of 2^64
    uint32_t tick_spacing;   // 0 = full-range-only pool
    Address extension;       // Zero = no extension

    // FNV-1a over every field
    PoolId id() const {
        uint64_t h = 0xcbf29ce484222325ULL;
        auto mix = [&h](uint8_t b) {
            h ^= b;
            h *= 0x100000001b3ULL;
        };
        for (auto b : token0) mix(b);
        for (auto b : token1) mix(b);
        for (int i = 0; i < 8; ++i) mix(static_cast<uint8_t>(fee >> (8 * i)));
        for (int i = 0; i < 4; ++i) mix(static_cast<uint8_t>(tick_spacing >> (8 * i)));
        for (auto b : extension) mix(b);
        return h;
    }

    bool operator==(const PoolKey& other) const {
        return token0 == other.token0 &&
               token1 == other.token1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               extension == other.extension;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }
};

// Builds a key with the pair in canonical order
inline PoolKey make_pool_key(const Token& a, const Token& b, uint64_t fee,
                             uint32_t tick_spacing, const Address& extension = {}) {
    return a < b ? PoolKey{a, b, fee, tick_spacing, extension}
                 : PoolKey{b, a, fee, tick_spacing, extension};
}

// Buckets by id(); equal ids with different keys stay distinct pools
struct PoolKeyHash {
    std::size_t operator()(const PoolKey& key) const { return static_cast<std::size_t>(key.id()); }
};

// =============================================================================
// Balance Delta (signed token amounts; positive = owed to the core)
// =============================================================================

struct BalanceDelta {
    I128 amount0;
    I128 amount1;

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
    bool operator!=(const BalanceDelta& other) const { return !(*this == other); }
};

// =============================================================================
// Operation Parameters
// =============================================================================

struct PositionKey {
    Address owner;
    uint64_t salt;
    int32_t tick_lower;
    int32_t tick_upper;

    bool operator<(const PositionKey& other) const {
        return std::tie(owner, salt, tick_lower, tick_upper) <
               std::tie(other.owner, other.salt, other.tick_lower, other.tick_upper);
    }
    bool operator==(const PositionKey& other) const {
        return owner == other.owner && salt == other.salt &&
               tick_lower == other.tick_lower && tick_upper == other.tick_upper;
    }
};

struct UpdatePositionParams {
    int32_t tick_lower;
    int32_t tick_upper;
    I128 liquidity_delta;    // positive = add, negative = remove
    uint64_t salt;           // For multiple positions at same range
};

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t INVALID_TICK_RANGE = -3;
constexpr int32_t INVALID_TICK = -4;
constexpr int32_t INVALID_SQRT_RATIO = -5;
constexpr int32_t INVALID_SQRT_RATIO_LIMIT = -6;
constexpr int32_t SQRT_RATIO_LIMIT_WRONG_DIRECTION = -7;
constexpr int32_t TOKENS_MUST_BE_SORTED = -8;
constexpr int32_t INVALID_TICK_SPACING = -9;
constexpr int32_t EXTENSION_NOT_REGISTERED = -10;
constexpr int32_t EXTENSION_ALREADY_REGISTERED = -11;
constexpr int32_t INVALID_EXTENSION = -12;

// Arithmetic safety
constexpr int32_t AMOUNT_OVERFLOW = -20;
constexpr int32_t DELTA_OVERFLOW = -21;
constexpr int32_t MAX_LIQUIDITY_PER_TICK_EXCEEDED = -22;
constexpr int32_t AMOUNT_BEFORE_FEE_OVERFLOW = -23;
constexpr int32_t LIQUIDITY_OVERFLOW = -24;
constexpr int32_t FEES_OVERFLOW = -25;
constexpr int32_t ARITHMETIC_OVERFLOW = -26;
constexpr int32_t DIVISION_BY_ZERO = -27;

// Invariant violations
constexpr int32_t DEBTS_NOT_ZEROED = -30;
constexpr int32_t MUST_COLLECT_FEES_BEFORE_WITHDRAWING_ALL_LIQUIDITY = -31;
constexpr int32_t SAVED_BALANCE_OVERFLOW = -32;
constexpr int32_t INSUFFICIENT_SAVED_BALANCE = -33;
constexpr int32_t INSUFFICIENT_LIQUIDITY = -34;
constexpr int32_t OPERATION_ABORTED = -35;
constexpr int32_t LOCK_DEPTH_EXCEEDED = -36;
constexpr int32_t INSUFFICIENT_BALANCE = -37;

// Access
constexpr int32_t NOT_LOCKED = -40;
constexpr int32_t UNAUTHORIZED = -41;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -42;
}

} // namespace clamm

#endif // CLAMM_TYPES_HPP
