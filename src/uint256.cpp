// =============================================================================
// uint256.cpp - 256-bit unsigned arithmetic for Q128.128 prices and fee growth
// =============================================================================

#include "clamm/uint256.hpp"
#include "clamm/error.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cmath>
#include <stdexcept>

namespace clamm {

namespace {

constexpr U128 MASK64 = (U128(1) << 64) - 1;

using Limbs4 = std::array<uint64_t, 4>;
using Limbs8 = std::array<uint64_t, 8>;

inline int bit_length_u128(U128 v) {
    int n = 0;
    uint64_t high = static_cast<uint64_t>(v >> 64);
    if (high != 0) {
        return 128 - __builtin_clzll(high);
    }
    uint64_t low = static_cast<uint64_t>(v);
    if (low != 0) {
        n = 64 - __builtin_clzll(low);
    }
    return n;
}

inline Limbs4 to_limbs(const U256& v) {
    return {static_cast<uint64_t>(v.lo), static_cast<uint64_t>(v.lo >> 64),
            static_cast<uint64_t>(v.hi), static_cast<uint64_t>(v.hi >> 64)};
}

// Schoolbook 256 x 256 -> 512 multiplication over 64-bit limbs
Limbs8 mul_full(const U256& a, const U256& b) {
    Limbs4 x = to_limbs(a);
    Limbs4 y = to_limbs(b);
    Limbs8 out = {};
    for (std::size_t i = 0; i < 4; ++i) {
        U128 carry = 0;
        for (std::size_t j = 0; j < 4; ++j) {
            U128 cur = U128(x[i]) * y[j] + out[i + j] + carry;
            out[i + j] = static_cast<uint64_t>(cur);
            carry = cur >> 64;
        }
        out[i + 4] = static_cast<uint64_t>(carry);
    }
    return out;
}

inline U256 limbs_low(const Limbs8& l) {
    return U256((U128(l[1]) << 64) | l[0], (U128(l[3]) << 64) | l[2]);
}

inline U256 limbs_high(const Limbs8& l) {
    return U256((U128(l[5]) << 64) | l[4], (U128(l[7]) << 64) | l[6]);
}

// Binary long division of (high * 2^256 + low) by d, requires high < d so the
// quotient fits in 256 bits
U256 div_512(const U256& high, const U256& low, const U256& d, U256& remainder) {
    U256 rem = high;
    U256 quot;
    for (int i = 255; i >= 0; --i) {
        bool carry = rem.bit(255);
        rem <<= 1;
        if (low.bit(i)) rem.lo |= 1;
        if (carry || rem >= d) {
            rem -= d;
            if (i >= 128) {
                quot.hi |= U128(1) << (i - 128);
            } else {
                quot.lo |= U128(1) << i;
            }
        }
    }
    remainder = rem;
    return quot;
}

void divmod(const U256& a, const U256& d, U256& quot, U256& rem) {
    if (d.is_zero()) {
        throw CoreError(errors::DIVISION_BY_ZERO);
    }
    if (a.hi == 0 && d.hi == 0) {
        quot = U256(a.lo / d.lo);
        rem = U256(a.lo % d.lo);
        return;
    }
    if (a < d) {
        quot = U256();
        rem = a;
        return;
    }
    quot = div_512(U256(), a, d, rem);
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Conversions
// =============================================================================

U256 U256::from_string(std::string_view text) {
    if (text.empty()) {
        throw std::invalid_argument("empty U256 literal");
    }
    U256 value;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
        for (char c : text) {
            int digit = hex_value(c);
            if (digit < 0) {
                throw std::invalid_argument("invalid hex digit in U256 literal: " + std::string(text));
            }
            if (value.hi >> 124 != 0) {
                throw std::out_of_range("U256 literal out of range: " + std::string(text));
            }
            value <<= 4;
            value.lo |= static_cast<U128>(digit);
        }
        return value;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid digit in U256 literal: " + std::string(text));
        }
        U256 digit(static_cast<U128>(c - '0'));
        if (mul_overflows(value, U256(10))) {
            throw std::out_of_range("U256 literal out of range: " + std::string(text));
        }
        value *= U256(10);
        if (add_overflows(value, digit)) {
            throw std::out_of_range("U256 literal out of range: " + std::string(text));
        }
        value += digit;
    }
    return value;
}

U128 U256::to_u128() const {
    if (hi != 0) {
        throw CoreError(errors::AMOUNT_OVERFLOW, to_string() + " exceeds 128 bits");
    }
    return lo;
}

int U256::bit_length() const {
    if (hi != 0) return 128 + bit_length_u128(hi);
    return bit_length_u128(lo);
}

bool U256::bit(int index) const {
    if (index < 0 || index > 255) return false;
    if (index >= 128) return ((hi >> (index - 128)) & 1) != 0;
    return ((lo >> index) & 1) != 0;
}

double U256::to_double() const {
    return std::ldexp(static_cast<double>(hi), 128) + static_cast<double>(lo);
}

std::string U256::to_string() const {
    if (hi == 0) return u128_to_string(lo);

    // Peel off 19 decimal digits at a time
    const U256 chunk(static_cast<U128>(10000000000000000000ULL));
    std::string out;
    U256 value = *this;
    while (!value.is_zero()) {
        U256 quot, rem;
        divmod(value, chunk, quot, rem);
        std::string digits = u128_to_string(rem.lo);
        if (!quot.is_zero()) {
            digits.insert(digits.begin(), 19 - digits.size(), '0');
        }
        out.insert(0, digits);
        value = quot;
    }
    return out;
}

std::string U256::to_hex() const {
    static const char* digits = "0123456789abcdef";
    if (is_zero()) return "0x0";
    std::string out;
    U256 value = *this;
    while (!value.is_zero()) {
        out.push_back(digits[static_cast<int>(value.lo & 0xF)]);
        value >>= 4;
    }
    out += "x0";
    std::reverse(out.begin(), out.end());
    return out;
}

std::ostream& operator<<(std::ostream& os, const U256& value) {
    return os << value.to_string();
}

// =============================================================================
// Wrapping Operators
// =============================================================================

U256& U256::operator+=(const U256& other) {
    U128 new_lo = lo + other.lo;
    hi += other.hi + (new_lo < lo ? 1 : 0);
    lo = new_lo;
    return *this;
}

U256& U256::operator-=(const U256& other) {
    U128 borrow = lo < other.lo ? 1 : 0;
    lo -= other.lo;
    hi -= other.hi + borrow;
    return *this;
}

U256& U256::operator*=(const U256& other) {
    U256 result = mul_u128(lo, other.lo);
    result.hi += lo * other.hi + hi * other.lo;
    *this = result;
    return *this;
}

U256& U256::operator/=(const U256& other) {
    U256 quot, rem;
    divmod(*this, other, quot, rem);
    *this = quot;
    return *this;
}

U256& U256::operator%=(const U256& other) {
    U256 quot, rem;
    divmod(*this, other, quot, rem);
    *this = rem;
    return *this;
}

U256& U256::operator<<=(unsigned shift) {
    if (shift >= 256) {
        lo = hi = 0;
    } else if (shift >= 128) {
        hi = lo << (shift - 128);
        lo = 0;
    } else if (shift > 0) {
        hi = (hi << shift) | (lo >> (128 - shift));
        lo <<= shift;
    }
    return *this;
}

U256& U256::operator>>=(unsigned shift) {
    if (shift >= 256) {
        lo = hi = 0;
    } else if (shift >= 128) {
        lo = hi >> (shift - 128);
        hi = 0;
    } else if (shift > 0) {
        lo = (lo >> shift) | (hi << (128 - shift));
        hi >>= shift;
    }
    return *this;
}

U256 operator+(U256 a, const U256& b) { return a += b; }
U256 operator-(U256 a, const U256& b) { return a -= b; }
U256 operator*(U256 a, const U256& b) { return a *= b; }
U256 operator/(U256 a, const U256& b) { return a /= b; }
U256 operator%(U256 a, const U256& b) { return a %= b; }
U256 operator<<(U256 a, unsigned shift) { return a <<= shift; }
U256 operator>>(U256 a, unsigned shift) { return a >>= shift; }

// =============================================================================
// Checked Arithmetic
// =============================================================================

U256 mul_u128(U128 a, U128 b) {
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 carry = mid >> 64;

    return U256((p0 & MASK64) | (mid << 64),
                p3 + (p1 >> 64) + (p2 >> 64) + carry);
}

bool add_overflows(const U256& a, const U256& b) {
    return a + b < a;
}

bool mul_overflows(const U256& a, const U256& b) {
    if (a.is_zero() || b.is_zero()) return false;
    return !limbs_high(mul_full(a, b)).is_zero();
}

U256 checked_add(const U256& a, const U256& b) {
    if (add_overflows(a, b)) {
        throw CoreError(errors::ARITHMETIC_OVERFLOW, "u256 add");
    }
    return a + b;
}

U256 checked_sub(const U256& a, const U256& b) {
    if (a < b) {
        throw CoreError(errors::ARITHMETIC_OVERFLOW, "u256 sub");
    }
    return a - b;
}

U256 checked_mul(const U256& a, const U256& b) {
    if (mul_overflows(a, b)) {
        throw CoreError(errors::ARITHMETIC_OVERFLOW, "u256 mul");
    }
    return a * b;
}

U256 div_round(const U256& a, const U256& d, bool round_up) {
    U256 quot, rem;
    divmod(a, d, quot, rem);
    if (round_up && !rem.is_zero()) {
        quot += U256(1);
    }
    return quot;
}

U256 mul_div(const U256& a, const U256& b, const U256& d, bool round_up) {
    if (d.is_zero()) {
        throw CoreError(errors::DIVISION_BY_ZERO);
    }
    Limbs8 product = mul_full(a, b);
    U256 high = limbs_high(product);
    U256 low = limbs_low(product);

    if (high >= d) {
        throw CoreError(errors::ARITHMETIC_OVERFLOW, "mul_div result exceeds 256 bits");
    }

    U256 quot, rem;
    if (high.is_zero()) {
        divmod(low, d, quot, rem);
    } else {
        quot = div_512(high, low, d, rem);
    }

    if (round_up && !rem.is_zero()) {
        if (quot == U256::max()) {
            throw CoreError(errors::ARITHMETIC_OVERFLOW, "mul_div result exceeds 256 bits");
        }
        quot += U256(1);
    }
    return quot;
}

bool mul_div_overflows(const U256& a, const U256& b, const U256& d) {
    if (d.is_zero()) {
        throw CoreError(errors::DIVISION_BY_ZERO);
    }
    return limbs_high(mul_full(a, b)) >= d;
}

} // namespace clamm
