// =============================================================================
// tick_math.cpp - Tick index <-> Q64.64 sqrt price conversion
// Table driven powers of sqrt(1.0001), bit-by-bit log2 for the inverse
// =============================================================================

#include "fusion/tick_math.hpp"
#include "fusion/u256.hpp"

#include <cmath>
#include <stdexcept>

namespace fusion {
namespace tick_math {

namespace {

// sqrt(1.0001)^(2^k) in Q32.96, k = 1..18, for positive ticks
constexpr U128 POSITIVE_FACTORS[] = {
    u128(0x100068db8ULL, 0xbac710cb295e9e1bULL),
    u128(0x1000d1b9cULL, 0x68abe5f76b30fb75ULL),
    u128(0x1001a37e4ULL, 0xa234cb0830516e51ULL),
    u128(0x100347278ULL, 0xab0e92ada25ab460ULL),
    u128(0x10068efb0ULL, 0x0a525480a5d7fdc2ULL),
    u128(0x100d20a63ULL, 0xb4173839df9daaa5ULL),
    u128(0x101a4c11cULL, 0x742dd7729738df5eULL),
    u128(0x1034c35c3ULL, 0x1f64cfa6dc0d6de4ULL),
    u128(0x106a34b78ULL, 0xc8aaffbf81bed5a3ULL),
    u128(0x10d72a6a4ULL, 0x6ccd8bce9ae771b1ULL),
    u128(0x11b9a258eULL, 0x63928596dc757faaULL),
    u128(0x13a2e2bdaULL, 0x04f8379f3cd17be5ULL),
    u128(0x181954be6ULL, 0x9e0da8fe77f2ab42ULL),
    u128(0x244c2655dULL, 0x185a029080252877ULL),
    u128(0x525816eebULL, 0x9f935b1c616779e8ULL),
    u128(0x1a7c8d00b5ULL, 0x51684ff4d31ae065ULL),
    u128(0x2bd893d0b2dULL, 0xf7c97884590c66cdULL),
    u128(0x78278e1e19e44ULL, 0x8cf8b95d2152dccfULL),
};

// 1/sqrt(1.0001)^(2^k) in Q64.64, k = 1..18, for negative ticks
constexpr uint64_t NEGATIVE_FACTORS[] = {
    18444899583751176498ULL,
    18443055278223354162ULL,
    18439367220385604838ULL,
    18431993317065449817ULL,
    18417254355718160513ULL,
    18387811781193591352ULL,
    18329067761203520168ULL,
    18212142134806087854ULL,
    17980523815641551639ULL,
    17526086738831147013ULL,
    16651378430235024244ULL,
    15030750278693429944ULL,
    12247334978882834399ULL,
    8131365268884726200ULL,
    3584323654723342297ULL,
    696457651847595233ULL,
    26294789957452057ULL,
    37481735321082ULL,
};

constexpr U128 POSITIVE_ODD_START = u128(0x1000346d6ULL, 0xff11672ae55ad00fULL);  // sqrt(1.0001) Q32.96
constexpr U128 Q96 = static_cast<U128>(1) << 96;
constexpr uint64_t NEGATIVE_ODD_START = 18445821805675392311ULL;                   // 1/sqrt(1.0001) Q64.64

// log_b(2) in Q32.32 with b = sqrt(1.0001)
constexpr I128 LOG_B_2_X32 = 59543866431248LL;
constexpr unsigned BIT_PRECISION = 14;
constexpr I128 LOG_B_P_ERR_MARGIN_LOWER_X64 = 184467440737095516LL;
constexpr I128 LOG_B_P_ERR_MARGIN_UPPER_X64 = static_cast<I128>(15793534762490258745ULL);

constexpr double Q64_RESOLUTION = 18446744073709551616.0;

inline unsigned leading_zeros_128(U128 value) {
    uint64_t hi = static_cast<uint64_t>(value >> 64);
    if (hi != 0) return static_cast<unsigned>(__builtin_clzll(hi));
    uint64_t lo = static_cast<uint64_t>(value);
    if (lo != 0) return 64 + static_cast<unsigned>(__builtin_clzll(lo));
    return 128;
}

inline int32_t rem_euclid(int32_t value, int32_t modulus) {
    int32_t r = value % modulus;
    return r < 0 ? r + modulus : r;
}

inline int32_t div_euclid(int32_t value, int32_t divisor) {
    return (value - rem_euclid(value, divisor)) / divisor;
}

inline U128 sqrt_price_positive_tick(int32_t tick) {
    U128 ratio = (tick & 1) ? POSITIVE_ODD_START : Q96;
    for (size_t k = 0; k < 18; ++k) {
        if (tick & (2 << k)) {
            ratio = (U256::mul_u128(ratio, POSITIVE_FACTORS[k]) >> 96).low_u128();
        }
    }
    return ratio >> 32;
}

inline U128 sqrt_price_negative_tick(int32_t tick) {
    int32_t abs_tick = -tick;
    U128 ratio = (abs_tick & 1) ? static_cast<U128>(NEGATIVE_ODD_START) : Q64;
    for (size_t k = 0; k < 18; ++k) {
        if (abs_tick & (2 << k)) {
            ratio = (ratio * NEGATIVE_FACTORS[k]) >> 64;
        }
    }
    return ratio;
}

inline U128 floor_to_u128(double value) {
    if (!(value > 0.0)) return 0;
    if (value >= 340282366920938463463374607431768211456.0) return U128_MAX;
    return static_cast<U128>(value);
}

inline double decimals_power(uint8_t decimals_a, uint8_t decimals_b) {
    return std::pow(10.0, static_cast<int>(decimals_a) - static_cast<int>(decimals_b));
}

} // anonymous namespace

// =============================================================================
// Sqrt Price
// =============================================================================

U128 tick_index_to_sqrt_price(int32_t tick_index) {
    if (tick_index >= 0) {
        return sqrt_price_positive_tick(tick_index);
    }
    return sqrt_price_negative_tick(tick_index);
}

int32_t sqrt_price_to_tick_index(U128 sqrt_price) {
    if (sqrt_price == 0) {
        throw std::domain_error("Sqrt price of zero has no tick index");
    }
    const unsigned msb = 127 - leading_zeros_128(sqrt_price);
    const I128 log2_p_integer_x32 = (static_cast<I128>(msb) - 64) * (static_cast<I128>(1) << 32);

    // Normalize into [1, 2) as Q1.63 and square repeatedly to extract fraction bits
    U128 r = msb >= 64 ? sqrt_price >> (msb - 63) : sqrt_price << (63 - msb);
    uint64_t bit = 0x8000000000000000ULL;
    I128 log2_p_fraction_x64 = 0;
    for (unsigned precision = 0; bit > 0 && precision < BIT_PRECISION; ++precision) {
        r *= r;
        unsigned is_r_more_than_two = static_cast<unsigned>(r >> 127);
        r >>= 63 + is_r_more_than_two;
        log2_p_fraction_x64 += static_cast<I128>(bit) * is_r_more_than_two;
        bit >>= 1;
    }

    const I128 log2_p_x32 = log2_p_integer_x32 + (log2_p_fraction_x64 >> 32);
    const I128 logbp_x64 = log2_p_x32 * LOG_B_2_X32;

    const int32_t tick_low = static_cast<int32_t>((logbp_x64 - LOG_B_P_ERR_MARGIN_LOWER_X64) >> 64);
    const int32_t tick_high = static_cast<int32_t>((logbp_x64 + LOG_B_P_ERR_MARGIN_UPPER_X64) >> 64);

    if (tick_low == tick_high) {
        return tick_low;
    }
    return tick_index_to_sqrt_price(tick_high) <= sqrt_price ? tick_high : tick_low;
}

int32_t invert_tick_index(int32_t tick_index) {
    return -tick_index;
}

U128 invert_sqrt_price(U128 sqrt_price) {
    int32_t tick_index = sqrt_price_to_tick_index(sqrt_price);
    return tick_index_to_sqrt_price(invert_tick_index(tick_index));
}

// =============================================================================
// Tick Grid
// =============================================================================

int32_t get_tick_array_start_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    const int32_t spacing = tick_spacing;
    const int32_t array_size = static_cast<int32_t>(TICK_ARRAY_SIZE);
    int32_t real_index = div_euclid(div_euclid(tick_index, spacing), array_size);
    return real_index * spacing * array_size;
}

int32_t get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                     std::optional<bool> round_up) {
    const int32_t spacing = tick_spacing;
    int32_t remainder = rem_euclid(tick_index, spacing);
    int32_t result = div_euclid(tick_index, spacing) * spacing;

    bool should_round_up = round_up.has_value()
        ? (*round_up && remainder > 0)
        : (remainder >= spacing / 2 && remainder > 0);

    return should_round_up ? result + spacing : result;
}

int32_t get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    const int32_t spacing = tick_spacing;
    int32_t remainder = rem_euclid(tick_index, spacing);
    return remainder == 0 ? tick_index - spacing : tick_index - remainder;
}

int32_t get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing) {
    const int32_t spacing = tick_spacing;
    return tick_index - rem_euclid(tick_index, spacing) + spacing;
}

bool is_tick_initializable(int32_t tick_index, uint16_t tick_spacing) {
    return rem_euclid(tick_index, tick_spacing) == 0;
}

Result<uint32_t> get_tick_index_in_array(int32_t tick_index, int32_t tick_array_start_index,
                                         uint16_t tick_spacing) {
    const int32_t spacing = tick_spacing;
    const int32_t array_span = spacing * static_cast<int32_t>(TICK_ARRAY_SIZE);
    if (tick_index < tick_array_start_index || tick_index >= tick_array_start_index + array_span) {
        return Error::TICK_INDEX_NOT_IN_ARRAY;
    }
    return static_cast<uint32_t>(div_euclid(tick_index - tick_array_start_index, spacing));
}

TickRange get_full_range_tick_indexes(uint16_t tick_spacing) {
    const int32_t spacing = tick_spacing;
    return TickRange{(MIN_TICK_INDEX / spacing) * spacing, (MAX_TICK_INDEX / spacing) * spacing};
}

TickRange order_tick_indexes(int32_t tick_index_1, int32_t tick_index_2) {
    if (tick_index_1 < tick_index_2) {
        return TickRange{tick_index_1, tick_index_2};
    }
    return TickRange{tick_index_2, tick_index_1};
}

bool is_full_range_only(uint16_t tick_spacing) {
    return tick_spacing >= FULL_RANGE_ONLY_TICK_SPACING_THRESHOLD;
}

// =============================================================================
// Decimal-Adjusted Prices
// =============================================================================

U128 price_to_sqrt_price(double price, uint8_t decimals_a, uint8_t decimals_b) {
    double power = decimals_power(decimals_a, decimals_b);
    return floor_to_u128(std::floor(std::sqrt(price / power) * Q64_RESOLUTION));
}

double sqrt_price_to_price(U128 sqrt_price, uint8_t decimals_a, uint8_t decimals_b) {
    double power = decimals_power(decimals_a, decimals_b);
    double sqrt_value = static_cast<double>(sqrt_price) / Q64_RESOLUTION;
    return sqrt_value * sqrt_value * power;
}

int32_t price_to_tick_index(double price, uint8_t decimals_a, uint8_t decimals_b) {
    return sqrt_price_to_tick_index(price_to_sqrt_price(price, decimals_a, decimals_b));
}

double tick_index_to_price(int32_t tick_index, uint8_t decimals_a, uint8_t decimals_b) {
    return sqrt_price_to_price(tick_index_to_sqrt_price(tick_index), decimals_a, decimals_b);
}

double invert_price(double price, uint8_t decimals_a, uint8_t decimals_b) {
    int32_t tick_index = price_to_tick_index(price, decimals_a, decimals_b);
    return tick_index_to_price(invert_tick_index(tick_index), decimals_a, decimals_b);
}

} // namespace tick_math
} // namespace fusion
