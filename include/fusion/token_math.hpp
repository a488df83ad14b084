#ifndef FUSION_TOKEN_MATH_HPP
#define FUSION_TOKEN_MATH_HPP

#include <cstdint>
#include <utility>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Exact Integer Fee Math (no floating point)
// =============================================================================

namespace token_math {

// amount * product / denominator with explicit rounding.
// Zero amount or product yields 0. Overflow of the u128 product is
// ARITHMETIC_OVERFLOW, a result above u64 is AMOUNT_EXCEEDS_MAX_U64.
Result<uint64_t> try_mul_div(uint64_t amount, U128 product, U128 denominator, bool round_up);

// Swap fee (fee_rate in hundredths of bip)
Result<uint64_t> try_apply_swap_fee(uint64_t amount, uint16_t fee_rate);
Result<uint64_t> try_reverse_apply_swap_fee(uint64_t amount, uint16_t fee_rate);

// Token transfer fee, capped by max_fee
Result<uint64_t> try_apply_transfer_fee(uint64_t amount, const TransferFee& transfer_fee);
Result<uint64_t> try_reverse_apply_transfer_fee(uint64_t amount, const TransferFee& transfer_fee);

// Slippage bounds: min rounds down, max rounds up
Result<uint64_t> try_get_min_amount_with_slippage_tolerance(uint64_t amount, uint16_t slippage_tolerance_bps);
Result<uint64_t> try_get_max_amount_with_slippage_tolerance(uint64_t amount, uint16_t slippage_tolerance_bps);

// =============================================================================
// Amount Deltas Between Two Sqrt Prices
// =============================================================================

// L * (upper - lower) / (lower * upper)
Result<uint64_t> try_get_amount_delta_a(U128 sqrt_price_1, U128 sqrt_price_2, U128 liquidity, bool round_up);
// L * (upper - lower)
Result<uint64_t> try_get_amount_delta_b(U128 sqrt_price_1, U128 sqrt_price_2, U128 liquidity, bool round_up);

// Price reached after adding (specified_input) or removing an amount of token A.
// Always rounds up so the pool never gives away more than the amount covers.
Result<U128> try_get_next_sqrt_price_from_a(U128 current_sqrt_price, U128 current_liquidity,
                                            uint64_t amount, bool specified_input);
// Same for token B; rounds down on input and up on output.
Result<U128> try_get_next_sqrt_price_from_b(U128 current_sqrt_price, U128 current_liquidity,
                                            uint64_t amount, bool specified_input);

// =============================================================================
// Fixed Price Conversion (limit orders)
// =============================================================================

// amount * sqrt_price^2 (token A -> token B)
Result<uint64_t> mul_by_sqrt_price_squared(uint64_t amount, U128 sqrt_price, bool round_up);
// amount / sqrt_price^2 (token B -> token A)
Result<uint64_t> div_by_sqrt_price_squared(uint64_t amount, U128 sqrt_price, bool round_up);

} // namespace token_math

} // namespace fusion

#endif // FUSION_TOKEN_MATH_HPP
