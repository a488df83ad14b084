#ifndef FUSION_TICK_MATH_HPP
#define FUSION_TICK_MATH_HPP

#include <cstdint>
#include <optional>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Tick Index <-> Sqrt Price (Q64.64)
// =============================================================================

namespace tick_math {

// sqrt(1.0001^tick) * 2^64. tick_index must lie in [MIN_TICK_INDEX, MAX_TICK_INDEX].
U128 tick_index_to_sqrt_price(int32_t tick_index);

// Greatest tick whose sqrt price is <= sqrt_price.
// sqrt_price must lie in [MIN_SQRT_PRICE, MAX_SQRT_PRICE]. Throws std::domain_error for 0.
int32_t sqrt_price_to_tick_index(U128 sqrt_price);

inline bool is_tick_index_in_bounds(int32_t tick_index) {
    return tick_index >= MIN_TICK_INDEX && tick_index <= MAX_TICK_INDEX;
}

inline bool is_sqrt_price_in_bounds(U128 sqrt_price) {
    return sqrt_price >= MIN_SQRT_PRICE && sqrt_price <= MAX_SQRT_PRICE;
}

int32_t invert_tick_index(int32_t tick_index);
U128 invert_sqrt_price(U128 sqrt_price);

// =============================================================================
// Tick Grid Helpers
// =============================================================================

int32_t get_tick_array_start_tick_index(int32_t tick_index, uint16_t tick_spacing);

// Without round_up the nearest initializable tick is returned (halves round up)
int32_t get_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing,
                                     std::optional<bool> round_up = std::nullopt);
int32_t get_prev_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);
int32_t get_next_initializable_tick_index(int32_t tick_index, uint16_t tick_spacing);
bool is_tick_initializable(int32_t tick_index, uint16_t tick_spacing);

// Slot of tick_index inside the array starting at tick_array_start_index
Result<uint32_t> get_tick_index_in_array(int32_t tick_index, int32_t tick_array_start_index,
                                         uint16_t tick_spacing);

TickRange get_full_range_tick_indexes(uint16_t tick_spacing);
TickRange order_tick_indexes(int32_t tick_index_1, int32_t tick_index_2);
bool is_full_range_only(uint16_t tick_spacing);

// =============================================================================
// Decimal-Adjusted Prices (floating point, display only)
// =============================================================================

U128 price_to_sqrt_price(double price, uint8_t decimals_a, uint8_t decimals_b);
double sqrt_price_to_price(U128 sqrt_price, uint8_t decimals_a, uint8_t decimals_b);
int32_t price_to_tick_index(double price, uint8_t decimals_a, uint8_t decimals_b);
double tick_index_to_price(int32_t tick_index, uint8_t decimals_a, uint8_t decimals_b);
double invert_price(double price, uint8_t decimals_a, uint8_t decimals_b);

} // namespace tick_math

} // namespace fusion

#endif // FUSION_TICK_MATH_HPP
