#ifndef FUSION_U256_HPP
#define FUSION_U256_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// U256 - 256-bit unsigned integer stored as four little-endian 64-bit words
// =============================================================================
//
// add/sub/mul wrap modulo 2^256; the checked_* variants report overflow.
// Division is Knuth Algorithm D over 64-bit digits with fast paths for
// operands that fit in 128 bits or a single word. Dividing by zero throws
// std::domain_error.

class U256 {
public:
    constexpr U256() : words_{0, 0, 0, 0} {}
    constexpr U256(U128 value)
        : words_{static_cast<uint64_t>(value), static_cast<uint64_t>(value >> 64), 0, 0} {}

    static constexpr U256 from_words(uint64_t w0, uint64_t w1, uint64_t w2, uint64_t w3) {
        U256 r;
        r.words_ = {w0, w1, w2, w3};
        return r;
    }

    // 128 x 128 -> 256 multiply
    static U256 mul_u128(U128 a, U128 b);

    uint64_t word(size_t index) const { return words_[index]; }
    U128 low_u128() const { return u128(words_[1], words_[0]); }
    U128 high_u128() const { return u128(words_[3], words_[2]); }

    // Number of non-zero words counted from the top
    size_t num_words() const;
    // Position of the highest set bit plus one, 0 for zero
    unsigned bits() const;
    bool is_zero() const { return (words_[0] | words_[1] | words_[2] | words_[3]) == 0; }

    bool fits_u64() const { return num_words() <= 1; }
    bool fits_u128() const { return num_words() <= 2; }

    Result<U128> try_into_u128() const;

    // Arithmetic (wrapping)
    U256 operator+(const U256& other) const;
    U256 operator-(const U256& other) const;
    U256 operator*(const U256& other) const;
    U256 operator/(const U256& divisor) const { return div_rem(divisor).first; }
    U256 operator%(const U256& divisor) const { return div_rem(divisor).second; }

    std::optional<U256> checked_add(const U256& other) const;
    std::optional<U256> checked_sub(const U256& other) const;
    std::optional<U256> checked_mul(const U256& other) const;

    // Two's complement negation
    U256 add_inverse() const;

    // Quotient and remainder
    std::pair<U256, U256> div_rem(const U256& divisor) const;

    U256 operator<<(unsigned shift) const;
    U256 operator>>(unsigned shift) const;
    U256 operator&(const U256& other) const;

    bool operator==(const U256& other) const { return words_ == other.words_; }
    bool operator!=(const U256& other) const { return !(*this == other); }
    bool operator<(const U256& other) const;
    bool operator>(const U256& other) const { return other < *this; }
    bool operator<=(const U256& other) const { return !(other < *this); }
    bool operator>=(const U256& other) const { return !(*this < other); }

    // Decimal digits
    std::string to_string() const;

private:
    std::array<uint64_t, 4> words_;
};

// Decimal formatting/parsing of native 128-bit values
std::string to_string(U128 value);
std::optional<U128> parse_u128(const std::string& text);

} // namespace fusion

#endif // FUSION_U256_HPP
