#ifndef FUSION_LIQUIDITY_HPP
#define FUSION_LIQUIDITY_HPP

#include <cstdint>
#include <utility>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Liquidity <-> Token Amounts
// =============================================================================

// Liquidity provided by token A over [sqrt_price_lower, sqrt_price_upper]
Result<U128> try_get_liquidity_from_a(uint64_t token_delta_a, U128 sqrt_price_lower, U128 sqrt_price_upper);
// Liquidity provided by token B over [sqrt_price_lower, sqrt_price_upper]
Result<U128> try_get_liquidity_from_b(uint64_t token_delta_b, U128 sqrt_price_lower, U128 sqrt_price_upper);

// Token A and token B amounts backing liquidity at the current price
Result<std::pair<uint64_t, uint64_t>> try_get_token_estimates_from_liquidity(U128 liquidity_delta,
                                                                             U128 current_sqrt_price,
                                                                             U128 sqrt_price_lower,
                                                                             U128 sqrt_price_upper,
                                                                             bool round_up);

// =============================================================================
// Increase Liquidity Quotes
// =============================================================================

// Token estimates round up and the max bounds include slippage and transfer fees
Result<IncreaseLiquidityQuote> increase_liquidity_quote(U128 liquidity_delta,
                                                        uint16_t slippage_tolerance_bps,
                                                        U128 current_sqrt_price,
                                                        int32_t tick_index_1,
                                                        int32_t tick_index_2,
                                                        const TransferFee& transfer_fee_a = {},
                                                        const TransferFee& transfer_fee_b = {});

Result<IncreaseLiquidityQuote> increase_liquidity_quote_a(uint64_t token_amount_a,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a = {},
                                                          const TransferFee& transfer_fee_b = {});

Result<IncreaseLiquidityQuote> increase_liquidity_quote_b(uint64_t token_amount_b,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a = {},
                                                          const TransferFee& transfer_fee_b = {});

// =============================================================================
// Decrease Liquidity Quotes
// =============================================================================

// Token estimates round down and the min bounds include slippage and transfer fees
Result<DecreaseLiquidityQuote> decrease_liquidity_quote(U128 liquidity_delta,
                                                        uint16_t slippage_tolerance_bps,
                                                        U128 current_sqrt_price,
                                                        int32_t tick_index_1,
                                                        int32_t tick_index_2,
                                                        const TransferFee& transfer_fee_a = {},
                                                        const TransferFee& transfer_fee_b = {});

Result<DecreaseLiquidityQuote> decrease_liquidity_quote_a(uint64_t token_amount_a,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a = {},
                                                          const TransferFee& transfer_fee_b = {});

Result<DecreaseLiquidityQuote> decrease_liquidity_quote_b(uint64_t token_amount_b,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a = {},
                                                          const TransferFee& transfer_fee_b = {});

} // namespace fusion

#endif // FUSION_LIQUIDITY_HPP
