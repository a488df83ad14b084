// =============================================================================
// order_book.cpp - Synthesized order book from liquidity and resting orders
// =============================================================================

#include "fusion/order_book.hpp"
#include "fusion/limit_order.hpp"
#include "fusion/swap.hpp"
#include "fusion/tick_math.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace fusion {

namespace {

constexpr double Q64_RESOLUTION = 18446744073709551616.0;
constexpr double MIN_PRICE_STEP = 0.0000000000001;
constexpr uint32_t MAX_ORDER_BOOK_ENTRIES = 100;

inline uint64_t saturate_to_u64(double value) {
    if (!(value > 0.0)) return 0;
    if (value >= Q64_RESOLUTION) return U64_MAX;
    return static_cast<uint64_t>(value);
}

inline uint64_t saturating_add(uint64_t a, uint64_t b) {
    uint64_t sum = 0;
    return __builtin_add_overflow(a, b, &sum) ? U64_MAX : sum;
}

} // anonymous namespace

std::pair<uint64_t, uint64_t> get_amount_delta_a_and_b_approx(U128 sqrt_price_1, U128 sqrt_price_2,
                                                              U128 liquidity) {
    const double price_1 = static_cast<double>(sqrt_price_1) / Q64_RESOLUTION;
    const double price_2 = static_cast<double>(sqrt_price_2) / Q64_RESOLUTION;

    const double amount_b = static_cast<double>(liquidity) * std::fabs(price_2 - price_1);
    const double amount_a = amount_b / (price_1 * price_2);
    return {saturate_to_u64(amount_a), saturate_to_u64(amount_b)};
}

Result<std::vector<OrderBookEntry>> get_order_book_side(const FusionPoolFacade& pool,
                                                        const TickArraySequence& tick_sequence,
                                                        double price_step,
                                                        uint32_t max_num_entries,
                                                        bool invert_price,
                                                        uint8_t decimals_a,
                                                        uint8_t decimals_b) {
    const double price_step_abs = std::fabs(price_step);
    if (!(price_step_abs >= MIN_PRICE_STEP)) {
        throw std::invalid_argument("Order book price step is too small");
    }
    if (max_num_entries > MAX_ORDER_BOOK_ENTRIES) {
        throw std::invalid_argument("Order book is limited to 100 entries");
    }

    // Walking down the (non inverted) price consumes token B liquidity
    const bool a_to_b = (price_step < 0.0) != invert_price;

    double current_price = tick_math::sqrt_price_to_price(pool.sqrt_price, decimals_a, decimals_b);
    if (invert_price) {
        current_price = 1.0 / current_price;
    }

    // Snap to the step grid behind the current price
    double next_price = price_step > 0.0
        ? std::floor(current_price / price_step_abs) * price_step_abs
        : std::ceil(current_price / price_step_abs) * price_step_abs;

    U128 current_sqrt_price = pool.sqrt_price;
    int32_t current_tick_index = pool.tick_current_index;
    U128 current_liquidity = pool.liquidity;

    uint64_t concentrated_total = 0;
    uint64_t concentrated_total_quote = 0;
    uint64_t limit_total = 0;
    uint64_t limit_total_quote = 0;

    const double min_price = tick_math::sqrt_price_to_price(MIN_SQRT_PRICE, 1, 1);
    const double max_price = tick_math::sqrt_price_to_price(MAX_SQRT_PRICE, 1, 1);

    std::vector<OrderBookEntry> entries;

    while (current_price != min_price && current_price != max_price && entries.size() < max_num_entries) {
        next_price = std::min(std::max(next_price + price_step, min_price), max_price);

        U128 next_sqrt_price = tick_math::price_to_sqrt_price(invert_price ? 1.0 / next_price : next_price,
                                                              decimals_a, decimals_b);
        next_sqrt_price = std::min(std::max(next_sqrt_price, MIN_SQRT_PRICE), MAX_SQRT_PRICE);

        entries.emplace_back();
        OrderBookEntry& entry = entries.back();
        entry.concentrated_total = concentrated_total;
        entry.concentrated_total_quote = concentrated_total_quote;
        entry.limit_total = limit_total;
        entry.limit_total_quote = limit_total_quote;
        entry.price = next_price;
        entry.ask_side = !a_to_b;

        while (current_sqrt_price != next_sqrt_price) {
            auto next = a_to_b
                ? tick_sequence.prev_initialized_tick(current_tick_index)
                : tick_sequence.next_initialized_tick(current_tick_index);
            if (!next) {
                // Out of tick data: the book ends here
                return entries;
            }

            const U128 next_tick_sqrt_price = tick_math::tick_index_to_sqrt_price(next->tick_index);
            const U128 step_sqrt_price = a_to_b
                ? std::max(next_sqrt_price, next_tick_sqrt_price)
                : std::min(next_sqrt_price, next_tick_sqrt_price);

            auto amounts = get_amount_delta_a_and_b_approx(current_sqrt_price, step_sqrt_price, current_liquidity);

            // Liquidity is token B on the bid side and token A on the ask side
            const uint64_t amount = a_to_b ? amounts.second : amounts.first;
            const uint64_t amount_quote = a_to_b ? amounts.first : amounts.second;

            entry.concentrated_amount = saturating_add(entry.concentrated_amount, amount);
            entry.concentrated_amount_quote = saturating_add(entry.concentrated_amount_quote, amount_quote);
            entry.concentrated_total = saturating_add(entry.concentrated_total, amount);
            entry.concentrated_total_quote = saturating_add(entry.concentrated_total_quote, amount_quote);
            concentrated_total = saturating_add(concentrated_total, amount);
            concentrated_total_quote = saturating_add(concentrated_total_quote, amount_quote);

            current_sqrt_price = step_sqrt_price;

            if (current_sqrt_price != next_tick_sqrt_price) {
                continue;
            }

            if (next->tick != nullptr) {
                const uint64_t swap_in = saturating_add(next->tick->open_orders_input,
                                                        next->tick->part_filled_orders_remaining_input);
                uint64_t swap_out = 0;
                if (swap_in > 0) {
                    auto output = get_limit_order_output_amount(swap_in, !a_to_b, current_sqrt_price, false);
                    if (!output) return output.error();
                    swap_out = *output;
                }

                entry.limit_amount = saturating_add(entry.limit_amount, swap_in);
                entry.limit_total = saturating_add(entry.limit_total, swap_in);
                limit_total = saturating_add(limit_total, swap_in);

                entry.limit_amount_quote = saturating_add(entry.limit_amount_quote, swap_out);
                entry.limit_total_quote = saturating_add(entry.limit_total_quote, swap_out);
                limit_total_quote = saturating_add(limit_total_quote, swap_out);
            }

            auto liquidity = get_next_liquidity(current_liquidity, next->tick, a_to_b);
            if (!liquidity) return liquidity.error();
            current_liquidity = *liquidity;
            current_tick_index = a_to_b ? next->tick_index - 1 : next->tick_index;
        }

        current_price = next_price;
    }

    return entries;
}

} // namespace fusion
