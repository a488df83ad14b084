#ifndef FUSION_ORDER_BOOK_HPP
#define FUSION_ORDER_BOOK_HPP

#include <cstdint>
#include <utility>
#include <vector>

#include "error.hpp"
#include "tick_array.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Order Book Depth (floating point, display only)
// =============================================================================

// Buckets the liquidity of one side of the book by price_step.
// A positive step walks up the price (ask side), a negative step walks down (bid side).
// invert_price applies the step to 1/price instead.
// The walk stops at max_num_entries, at the protocol price bounds or where the
// supplied tick arrays end. Entries collected so far are returned in that case.
// Throws std::invalid_argument for |price_step| < 1e-13 or max_num_entries > 100.
Result<std::vector<OrderBookEntry>> get_order_book_side(const FusionPoolFacade& pool,
                                                        const TickArraySequence& tick_sequence,
                                                        double price_step,
                                                        uint32_t max_num_entries,
                                                        bool invert_price,
                                                        uint8_t decimals_a,
                                                        uint8_t decimals_b);

// Approximate token A and B amounts between two sqrt prices, saturating at u64
std::pair<uint64_t, uint64_t> get_amount_delta_a_and_b_approx(U128 sqrt_price_1, U128 sqrt_price_2,
                                                              U128 liquidity);

} // namespace fusion

#endif // FUSION_ORDER_BOOK_HPP
