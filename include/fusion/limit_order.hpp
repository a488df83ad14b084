#ifndef FUSION_LIMIT_ORDER_HPP
#define FUSION_LIMIT_ORDER_HPP

#include <cstdint>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Limit Order Fill Accounting
// =============================================================================

// Converts an order input amount to its output at a fixed sqrt price:
// a->b multiplies by sqrt_price^2, b->a divides by it.
Result<uint64_t> get_limit_order_output_amount(uint64_t input_amount, bool a_to_b_order,
                                               U128 sqrt_price, bool round_up);

// Output expected for an order of amount_in placed at tick_index, including the
// OLP share of the swap fee paid by the taker who fills it.
Result<uint64_t> limit_order_quote_by_input_token(uint64_t amount_in, bool a_to_b_order,
                                                  int32_t tick_index, const FusionPoolFacade& pool);

// Input needed to receive amount_out. Floating point estimate, display only.
Result<uint64_t> limit_order_quote_by_output_token(uint64_t amount_out, bool a_to_b_order,
                                                   int32_t tick_index, const FusionPoolFacade& pool);

// Amounts returned when decreasing an order by `amount`. The order state is
// derived from the tick age delta: 0 open, 1 partially filled, >= 2 fulfilled.
Result<LimitOrderDecreaseQuote> decrease_limit_order_quote(const FusionPoolFacade& pool,
                                                           const LimitOrderFacade& limit_order,
                                                           const TickFacade& tick,
                                                           uint64_t amount,
                                                           const TransferFee& transfer_fee_a = {},
                                                           const TransferFee& transfer_fee_b = {});

} // namespace fusion

#endif // FUSION_LIMIT_ORDER_HPP
