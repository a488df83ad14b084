#ifndef FUSION_SWAP_HPP
#define FUSION_SWAP_HPP

#include <cstdint>
#include <vector>

#include "error.hpp"
#include "tick_array.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Swap Result
// =============================================================================

struct SwapResult {
    uint64_t token_a = 0;
    uint64_t token_b = 0;
    uint64_t fee_amount = 0;
    U128 next_sqrt_price = 0;
};

// =============================================================================
// Swap Quotes
// =============================================================================

// Exact input: token_in of token A (specified_token_a) or B is sold.
Result<ExactInSwapQuote> swap_quote_by_input_token(uint64_t token_in,
                                                   bool specified_token_a,
                                                   uint16_t slippage_tolerance_bps,
                                                   const FusionPoolFacade& pool,
                                                   const std::vector<TickArrayFacade>& tick_arrays,
                                                   const TransferFee& transfer_fee_a = {},
                                                   const TransferFee& transfer_fee_b = {});

// Exact output: token_out of token A (specified_token_a) or B is bought.
Result<ExactOutSwapQuote> swap_quote_by_output_token(uint64_t token_out,
                                                     bool specified_token_a,
                                                     uint16_t slippage_tolerance_bps,
                                                     const FusionPoolFacade& pool,
                                                     const std::vector<TickArrayFacade>& tick_arrays,
                                                     const TransferFee& transfer_fee_a = {},
                                                     const TransferFee& transfer_fee_b = {});

// Walks the tick sequence until token_amount is consumed or the price reaches
// sqrt_price_limit (0 selects the protocol bound in the swap direction).
// Limit orders resting on each crossed tick are filled after the
// concentrated liquidity step that lands on it.
Result<SwapResult> compute_swap(uint64_t token_amount,
                                U128 sqrt_price_limit,
                                const FusionPoolFacade& pool,
                                const TickArraySequence& tick_sequence,
                                bool a_to_b,
                                bool specified_input);

// Liquidity after crossing next_tick in the swap direction
Result<U128> get_next_liquidity(U128 current_liquidity, const TickFacade* next_tick, bool a_to_b);

} // namespace fusion

#endif // FUSION_SWAP_HPP
