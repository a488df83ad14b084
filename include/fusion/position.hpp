#ifndef FUSION_POSITION_HPP
#define FUSION_POSITION_HPP

#include <cstdint>

#include "error.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Position Range Status
// =============================================================================

// Tick bounds may be given in either order; equal bounds are Invalid
PositionStatus position_status(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2);

bool is_position_in_range(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2);

// Share of token A and token B in a position at the current price (Q64.64)
PositionRatio position_ratio_x64(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2);

const char* to_string(PositionStatus status);

// =============================================================================
// Fee Collection
// =============================================================================

// Fees a position can collect: growth inside its range since the checkpoint,
// plus fees already owed, net of the token transfer fees.
Result<CollectFeesQuote> collect_fees_quote(const FusionPoolFacade& pool,
                                            const PositionFacade& position,
                                            const TickFacade& tick_lower,
                                            const TickFacade& tick_upper,
                                            const TransferFee& transfer_fee_a = {},
                                            const TransferFee& transfer_fee_b = {});

} // namespace fusion

#endif // FUSION_POSITION_HPP
