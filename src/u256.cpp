// =============================================================================
// u256.cpp - 256-bit unsigned arithmetic
// Four 64-bit words, Knuth Algorithm D division, native U128 intermediates
// =============================================================================

#include "fusion/u256.hpp"

#include <algorithm>
#include <stdexcept>

namespace fusion {

namespace {

constexpr size_t NUM_WORDS = 4;

inline unsigned leading_zeros(uint64_t word) {
    return word == 0 ? 64 : static_cast<unsigned>(__builtin_clzll(word));
}

// Short division by a single word; quotient replaces the dividend words
uint64_t divide_by_word(uint64_t* words, size_t count, uint64_t divisor) {
    U128 remainder = 0;
    for (size_t i = count; i-- > 0;) {
        U128 current = (remainder << 64) | words[i];
        words[i] = static_cast<uint64_t>(current / divisor);
        remainder = current % divisor;
    }
    return static_cast<uint64_t>(remainder);
}

// Knuth TAOCP vol. 2, 4.3.1 Algorithm D.
// u has m + n words, v has n >= 2 words with v[n-1] != 0.
void knuth_divide(const uint64_t* u, size_t m_plus_n, const uint64_t* v, size_t n,
                  uint64_t* quotient, uint64_t* remainder) {
    const size_t m = m_plus_n - n;
    const unsigned shift = leading_zeros(v[n - 1]);

    // D1: normalize so the top divisor word has its high bit set
    uint64_t vn[NUM_WORDS] = {};
    uint64_t un[NUM_WORDS + 1] = {};
    for (size_t i = n - 1; i > 0; --i) {
        vn[i] = shift ? (v[i] << shift) | (v[i - 1] >> (64 - shift)) : v[i];
    }
    vn[0] = v[0] << shift;

    un[m_plus_n] = shift ? u[m_plus_n - 1] >> (64 - shift) : 0;
    for (size_t i = m_plus_n - 1; i > 0; --i) {
        un[i] = shift ? (u[i] << shift) | (u[i - 1] >> (64 - shift)) : u[i];
    }
    un[0] = u[0] << shift;

    for (size_t j = m + 1; j-- > 0;) {
        // D3: estimate the quotient digit
        U128 numerator = (static_cast<U128>(un[j + n]) << 64) | un[j + n - 1];
        U128 qhat = numerator / vn[n - 1];
        U128 rhat = numerator % vn[n - 1];
        while ((qhat >> 64) != 0 ||
               qhat * vn[n - 2] > ((rhat << 64) | un[j + n - 2])) {
            qhat -= 1;
            rhat += vn[n - 1];
            if ((rhat >> 64) != 0) break;
        }

        // D4: multiply and subtract
        uint64_t borrow = 0;
        U128 carry = 0;
        for (size_t i = 0; i < n; ++i) {
            U128 product = qhat * vn[i] + carry;
            carry = product >> 64;
            uint64_t low = static_cast<uint64_t>(product);
            uint64_t diff = un[i + j] - low;
            uint64_t next_borrow = un[i + j] < low ? 1 : 0;
            next_borrow |= diff < borrow ? 1 : 0;
            un[i + j] = diff - borrow;
            borrow = next_borrow;
        }
        uint64_t top_carry = static_cast<uint64_t>(carry);
        uint64_t top = un[j + n] - top_carry;
        uint64_t top_borrow = un[j + n] < top_carry ? 1 : 0;
        top_borrow |= top < borrow ? 1 : 0;
        un[j + n] = top - borrow;

        quotient[j] = static_cast<uint64_t>(qhat);

        // D6: add back when the estimate was one too large
        if (top_borrow) {
            quotient[j] -= 1;
            U128 add_carry = 0;
            for (size_t i = 0; i < n; ++i) {
                U128 sum = static_cast<U128>(un[i + j]) + vn[i] + add_carry;
                un[i + j] = static_cast<uint64_t>(sum);
                add_carry = sum >> 64;
            }
            un[j + n] += static_cast<uint64_t>(add_carry);
        }
    }

    // D8: unnormalize the remainder
    for (size_t i = 0; i < n; ++i) {
        remainder[i] = shift ? (un[i] >> shift) | (un[i + 1] << (64 - shift)) : un[i];
    }
}

} // anonymous namespace

// =============================================================================
// Construction / Inspection
// =============================================================================

U256 U256::mul_u128(U128 a, U128 b) {
    constexpr U128 MASK64 = (static_cast<U128>(1) << 64) - 1;
    U128 a_lo = a & MASK64;
    U128 a_hi = a >> 64;
    U128 b_lo = b & MASK64;
    U128 b_hi = b >> 64;

    U128 p0 = a_lo * b_lo;
    U128 p1 = a_lo * b_hi;
    U128 p2 = a_hi * b_lo;
    U128 p3 = a_hi * b_hi;

    U128 mid = (p0 >> 64) + (p1 & MASK64) + (p2 & MASK64);
    U128 high = p3 + (p1 >> 64) + (p2 >> 64) + (mid >> 64);

    return from_words(static_cast<uint64_t>(p0), static_cast<uint64_t>(mid),
                      static_cast<uint64_t>(high), static_cast<uint64_t>(high >> 64));
}

size_t U256::num_words() const {
    for (size_t i = NUM_WORDS; i > 0; --i) {
        if (words_[i - 1] != 0) return i;
    }
    return 0;
}

unsigned U256::bits() const {
    size_t n = num_words();
    if (n == 0) return 0;
    return static_cast<unsigned>(n * 64) - leading_zeros(words_[n - 1]);
}

Result<U128> U256::try_into_u128() const {
    if (num_words() > 2) {
        return Error::ARITHMETIC_OVERFLOW;
    }
    return low_u128();
}

// =============================================================================
// Add / Sub / Mul
// =============================================================================

U256 U256::operator+(const U256& other) const {
    U256 r;
    U128 carry = 0;
    for (size_t i = 0; i < NUM_WORDS; ++i) {
        U128 sum = static_cast<U128>(words_[i]) + other.words_[i] + carry;
        r.words_[i] = static_cast<uint64_t>(sum);
        carry = sum >> 64;
    }
    return r;
}

U256 U256::operator-(const U256& other) const {
    return *this + other.add_inverse();
}

U256 U256::add_inverse() const {
    U256 inverted = from_words(~words_[0], ~words_[1], ~words_[2], ~words_[3]);
    return inverted + U256(1);
}

U256 U256::operator*(const U256& other) const {
    uint64_t result[NUM_WORDS] = {};
    for (size_t i = 0; i < NUM_WORDS; ++i) {
        if (words_[i] == 0) continue;
        U128 carry = 0;
        for (size_t j = 0; i + j < NUM_WORDS; ++j) {
            U128 product = static_cast<U128>(words_[i]) * other.words_[j] + result[i + j] + carry;
            result[i + j] = static_cast<uint64_t>(product);
            carry = product >> 64;
        }
    }
    return from_words(result[0], result[1], result[2], result[3]);
}

std::optional<U256> U256::checked_add(const U256& other) const {
    U256 sum = *this + other;
    if (sum < *this) return std::nullopt;
    return sum;
}

std::optional<U256> U256::checked_sub(const U256& other) const {
    if (*this < other) return std::nullopt;
    return *this - other;
}

std::optional<U256> U256::checked_mul(const U256& other) const {
    if (is_zero() || other.is_zero()) return U256();
    if (bits() + other.bits() > 257) return std::nullopt;
    U256 product = *this * other;
    // bits() + bits() == 257 may or may not overflow
    if (product / other != *this) return std::nullopt;
    return product;
}

// =============================================================================
// Division
// =============================================================================

std::pair<U256, U256> U256::div_rem(const U256& divisor) const {
    if (divisor.is_zero()) {
        throw std::domain_error("U256 division by zero");
    }
    if (is_zero()) {
        return {U256(), U256()};
    }

    size_t dividend_words = num_words();
    size_t divisor_words = divisor.num_words();

    if (dividend_words < divisor_words || *this < divisor) {
        return {U256(), *this};
    }

    if (dividend_words <= 2) {
        U128 a = low_u128();
        U128 b = divisor.low_u128();
        return {U256(a / b), U256(a % b)};
    }

    if (divisor_words == 1) {
        U256 quotient = *this;
        uint64_t remainder = divide_by_word(quotient.words_.data(), dividend_words, divisor.words_[0]);
        return {quotient, U256(remainder)};
    }

    uint64_t quotient[NUM_WORDS] = {};
    uint64_t remainder[NUM_WORDS] = {};
    knuth_divide(words_.data(), dividend_words, divisor.words_.data(), divisor_words, quotient, remainder);
    return {from_words(quotient[0], quotient[1], quotient[2], quotient[3]),
            from_words(remainder[0], remainder[1], remainder[2], remainder[3])};
}

// =============================================================================
// Shifts / Bitwise / Compare
// =============================================================================

U256 U256::operator<<(unsigned shift) const {
    if (shift >= 256) return U256();
    U256 r;
    size_t word_shift = shift / 64;
    unsigned bit_shift = shift % 64;
    for (size_t i = NUM_WORDS; i-- > word_shift;) {
        uint64_t w = words_[i - word_shift] << bit_shift;
        if (bit_shift && i - word_shift > 0) {
            w |= words_[i - word_shift - 1] >> (64 - bit_shift);
        }
        r.words_[i] = w;
    }
    return r;
}

U256 U256::operator>>(unsigned shift) const {
    if (shift >= 256) return U256();
    U256 r;
    size_t word_shift = shift / 64;
    unsigned bit_shift = shift % 64;
    for (size_t i = 0; i + word_shift < NUM_WORDS; ++i) {
        uint64_t w = words_[i + word_shift] >> bit_shift;
        if (bit_shift && i + word_shift + 1 < NUM_WORDS) {
            w |= words_[i + word_shift + 1] << (64 - bit_shift);
        }
        r.words_[i] = w;
    }
    return r;
}

U256 U256::operator&(const U256& other) const {
    return from_words(words_[0] & other.words_[0], words_[1] & other.words_[1],
                      words_[2] & other.words_[2], words_[3] & other.words_[3]);
}

bool U256::operator<(const U256& other) const {
    for (size_t i = NUM_WORDS; i-- > 0;) {
        if (words_[i] != other.words_[i]) return words_[i] < other.words_[i];
    }
    return false;
}

// =============================================================================
// Decimal Formatting
// =============================================================================

std::string U256::to_string() const {
    if (is_zero()) return "0";
    std::string digits;
    U256 value = *this;
    const U256 ten(10);
    while (!value.is_zero()) {
        auto qr = value.div_rem(ten);
        digits.push_back(static_cast<char>('0' + qr.second.words_[0]));
        value = qr.first;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string to_string(U128 value) {
    return U256(value).to_string();
}

std::optional<U128> parse_u128(const std::string& text) {
    if (text.empty()) return std::nullopt;
    U128 value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (value > (U128_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }
    return value;
}

} // namespace fusion
