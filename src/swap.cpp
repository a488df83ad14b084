// =============================================================================
// swap.cpp - Swap quoting over concentrated liquidity and resting limit orders
// Integer only; every amount update is overflow checked
// =============================================================================

#include "fusion/swap.hpp"
#include "fusion/limit_order.hpp"
#include "fusion/tick_math.hpp"
#include "fusion/token_math.hpp"

#include <algorithm>

namespace fusion {

using namespace token_math;

namespace {

// =============================================================================
// Swap Loop State
// =============================================================================

struct SwapState {
    uint64_t amount_remaining;   // Specified token left to trade
    uint64_t amount_calculated;  // Other token accumulated so far
    U128 sqrt_price;
    int32_t tick_index;
    U128 liquidity;
    uint64_t fee_amount;
};

struct SwapStepQuote {
    uint64_t amount_in = 0;
    uint64_t amount_out = 0;
    U128 next_sqrt_price = 0;
    uint64_t fee_amount = 0;
};

struct LimitOrderFill {
    uint64_t amount_in = 0;
    uint64_t amount_out = 0;
    uint64_t fee_amount = 0;
};

inline bool add_u64(uint64_t& target, uint64_t value) {
    return !__builtin_add_overflow(target, value, &target);
}

inline bool sub_u64(uint64_t& target, uint64_t value) {
    return !__builtin_sub_overflow(target, value, &target);
}

// Books one step (or limit order fill) against the running amounts
bool apply_step(SwapState& state, uint64_t amount_in, uint64_t amount_out, uint64_t fee_amount,
                bool specified_input) {
    if (!add_u64(state.fee_amount, fee_amount)) return false;
    if (specified_input) {
        return sub_u64(state.amount_remaining, amount_in) &&
               sub_u64(state.amount_remaining, fee_amount) &&
               add_u64(state.amount_calculated, amount_out);
    }
    return sub_u64(state.amount_remaining, amount_out) &&
           add_u64(state.amount_calculated, amount_in) &&
           add_u64(state.amount_calculated, fee_amount);
}

// The fixed side is the specified token: A when a_to_b == specified_input
Result<uint64_t> amount_fixed_delta(U128 current_sqrt_price, U128 target_sqrt_price, U128 liquidity,
                                    bool a_to_b, bool specified_input) {
    if (a_to_b == specified_input) {
        return try_get_amount_delta_a(current_sqrt_price, target_sqrt_price, liquidity, specified_input);
    }
    return try_get_amount_delta_b(current_sqrt_price, target_sqrt_price, liquidity, specified_input);
}

Result<uint64_t> amount_unfixed_delta(U128 current_sqrt_price, U128 target_sqrt_price, U128 liquidity,
                                      bool a_to_b, bool specified_input) {
    if (a_to_b == specified_input) {
        return try_get_amount_delta_b(current_sqrt_price, target_sqrt_price, liquidity, !specified_input);
    }
    return try_get_amount_delta_a(current_sqrt_price, target_sqrt_price, liquidity, !specified_input);
}

Result<U128> next_sqrt_price(U128 current_sqrt_price, U128 liquidity, uint64_t amount,
                             bool a_to_b, bool specified_input) {
    if (a_to_b == specified_input) {
        return try_get_next_sqrt_price_from_a(current_sqrt_price, liquidity, amount, specified_input);
    }
    return try_get_next_sqrt_price_from_b(current_sqrt_price, liquidity, amount, specified_input);
}

// =============================================================================
// Concentrated Liquidity Step
// =============================================================================

Result<SwapStepQuote> compute_swap_step(uint64_t amount_remaining, uint16_t fee_rate, U128 liquidity,
                                        U128 current_sqrt_price, U128 target_sqrt_price,
                                        bool a_to_b, bool specified_input) {
    // Amount needed to reach the target; too large for u64 means the target is out of reach
    auto initial_fixed_delta = amount_fixed_delta(current_sqrt_price, target_sqrt_price, liquidity,
                                                  a_to_b, specified_input);
    const bool initial_overflow = !initial_fixed_delta &&
                                  initial_fixed_delta.error() == Error::AMOUNT_EXCEEDS_MAX_U64;
    if (!initial_fixed_delta && !initial_overflow) {
        return initial_fixed_delta.error();
    }

    uint64_t amount_calculated = amount_remaining;
    if (specified_input) {
        auto after_fee = try_apply_swap_fee(amount_remaining, fee_rate);
        if (!after_fee) return after_fee.error();
        amount_calculated = *after_fee;
    }

    SwapStepQuote step;
    if (!initial_overflow && *initial_fixed_delta <= amount_calculated) {
        step.next_sqrt_price = target_sqrt_price;
    } else {
        auto reached = next_sqrt_price(current_sqrt_price, liquidity, amount_calculated, a_to_b, specified_input);
        if (!reached) return reached.error();
        step.next_sqrt_price = *reached;
    }

    const bool is_max_swap = step.next_sqrt_price == target_sqrt_price;

    auto unfixed_delta = amount_unfixed_delta(current_sqrt_price, step.next_sqrt_price, liquidity,
                                              a_to_b, specified_input);
    if (!unfixed_delta) return unfixed_delta.error();

    // Recompute the fixed side at the price actually reached
    uint64_t fixed_delta = 0;
    if (!is_max_swap || initial_overflow) {
        auto recomputed = amount_fixed_delta(current_sqrt_price, step.next_sqrt_price, liquidity,
                                             a_to_b, specified_input);
        if (!recomputed) return recomputed.error();
        fixed_delta = *recomputed;
    } else {
        fixed_delta = *initial_fixed_delta;
    }

    if (specified_input) {
        step.amount_in = fixed_delta;
        step.amount_out = *unfixed_delta;
    } else {
        step.amount_in = *unfixed_delta;
        step.amount_out = std::min(fixed_delta, amount_remaining);
    }

    if (specified_input && !is_max_swap) {
        // Whatever the step did not consume is charged as fee
        if (step.amount_in > amount_remaining) {
            return Error::ARITHMETIC_OVERFLOW;
        }
        step.fee_amount = amount_remaining - step.amount_in;
    } else {
        auto pre_fee = try_reverse_apply_swap_fee(step.amount_in, fee_rate);
        if (!pre_fee) return pre_fee.error();
        step.fee_amount = *pre_fee - step.amount_in;
    }

    return step;
}

// =============================================================================
// Limit Order Fill At A Crossed Tick
// =============================================================================

Result<LimitOrderFill> fill_limit_orders(const TickFacade* tick, U128 sqrt_price, bool a_to_b,
                                         bool specified_input, uint64_t amount_remaining,
                                         uint16_t fee_rate) {
    LimitOrderFill fill;
    if (tick == nullptr) {
        return fill;
    }

    uint64_t available = 0;
    if (__builtin_add_overflow(tick->open_orders_input, tick->part_filled_orders_remaining_input, &available)) {
        return Error::ARITHMETIC_OVERFLOW;
    }
    const U128 fee_denominator = static_cast<U128>(fees::FEE_RATE_MUL_VALUE) - fee_rate;

    if (specified_input) {
        // Taker input needed to consume every resting order on the tick
        auto total_in = get_limit_order_output_amount(available, !a_to_b, sqrt_price, true);
        if (!total_in) return total_in.error();
        auto fee = try_mul_div(*total_in, fee_rate, fee_denominator, true);
        if (!fee) return fee.error();

        fill.amount_in = *total_in;
        fill.amount_out = available;
        fill.fee_amount = *fee;

        if (static_cast<U128>(amount_remaining) < static_cast<U128>(*total_in) + *fee) {
            // Partial fill: fee first, then pro rata output
            auto partial_fee = try_mul_div(amount_remaining, fee_rate, fees::FEE_RATE_MUL_VALUE, true);
            if (!partial_fee) return partial_fee.error();
            fill.fee_amount = *partial_fee;
            fill.amount_in = amount_remaining - *partial_fee;

            auto partial_out = try_mul_div(available, fill.amount_in, *total_in, false);
            if (!partial_out) return partial_out.error();
            fill.amount_out = *partial_out;
        }
    } else {
        fill.amount_out = std::min(available, amount_remaining);
        auto amount_in = get_limit_order_output_amount(fill.amount_out, !a_to_b, sqrt_price, true);
        if (!amount_in) return amount_in.error();
        auto fee = try_mul_div(*amount_in, fee_rate, fee_denominator, true);
        if (!fee) return fee.error();
        fill.amount_in = *amount_in;
        fill.fee_amount = *fee;
    }

    return fill;
}

} // anonymous namespace

// =============================================================================
// Liquidity Crossing
// =============================================================================

Result<U128> get_next_liquidity(U128 current_liquidity, const TickFacade* next_tick, bool a_to_b) {
    const I128 liquidity_net = next_tick ? next_tick->liquidity_net : 0;
    const U128 magnitude = liquidity_net < 0
        ? static_cast<U128>(-(liquidity_net + 1)) + 1
        : static_cast<U128>(liquidity_net);

    // Moving left (a_to_b) undoes the net change, moving right applies it
    const bool increase = a_to_b ? liquidity_net < 0 : liquidity_net >= 0;
    if (increase) {
        if (magnitude > U128_MAX - current_liquidity) {
            return Error::ARITHMETIC_OVERFLOW;
        }
        return current_liquidity + magnitude;
    }
    if (magnitude > current_liquidity) {
        return Error::ARITHMETIC_OVERFLOW;
    }
    return current_liquidity - magnitude;
}

// =============================================================================
// Swap Loop
// =============================================================================

Result<SwapResult> compute_swap(uint64_t token_amount,
                                U128 sqrt_price_limit,
                                const FusionPoolFacade& pool,
                                const TickArraySequence& tick_sequence,
                                bool a_to_b,
                                bool specified_input) {
    if (sqrt_price_limit == 0) {
        sqrt_price_limit = a_to_b ? MIN_SQRT_PRICE : MAX_SQRT_PRICE;
    }

    if (!tick_math::is_sqrt_price_in_bounds(sqrt_price_limit)) {
        return Error::SQRT_PRICE_LIMIT_OUT_OF_BOUNDS;
    }

    if ((a_to_b && sqrt_price_limit >= pool.sqrt_price) ||
        (!a_to_b && sqrt_price_limit <= pool.sqrt_price)) {
        return Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION;
    }

    if (token_amount == 0) {
        return Error::ZERO_TRADABLE_AMOUNT;
    }

    SwapState state{token_amount, 0, pool.sqrt_price, pool.tick_current_index, pool.liquidity, 0};

    while (state.amount_remaining > 0 && state.sqrt_price != sqrt_price_limit) {
        auto next = a_to_b
            ? tick_sequence.prev_initialized_tick(state.tick_index)
            : tick_sequence.next_initialized_tick(state.tick_index);
        if (!next) return next.error();

        const U128 next_tick_sqrt_price = tick_math::tick_index_to_sqrt_price(next->tick_index);
        const U128 target_sqrt_price = a_to_b
            ? std::max(next_tick_sqrt_price, sqrt_price_limit)
            : std::min(next_tick_sqrt_price, sqrt_price_limit);

        auto step = compute_swap_step(state.amount_remaining, pool.fee_rate, state.liquidity,
                                      state.sqrt_price, target_sqrt_price, a_to_b, specified_input);
        if (!step) return step.error();

        if (!apply_step(state, step->amount_in, step->amount_out, step->fee_amount, specified_input)) {
            return Error::ARITHMETIC_OVERFLOW;
        }

        if (step->next_sqrt_price == next_tick_sqrt_price) {
            // Landed on the tick: take resting orders, then cross it
            auto fill = fill_limit_orders(next->tick, next_tick_sqrt_price, a_to_b, specified_input,
                                          state.amount_remaining, pool.fee_rate);
            if (!fill) return fill.error();

            if (!apply_step(state, fill->amount_in, fill->amount_out, fill->fee_amount, specified_input)) {
                return Error::ARITHMETIC_OVERFLOW;
            }

            auto liquidity = get_next_liquidity(state.liquidity, next->tick, a_to_b);
            if (!liquidity) return liquidity.error();
            state.liquidity = *liquidity;
            state.tick_index = a_to_b ? next->tick_index - 1 : next->tick_index;
        } else if (step->next_sqrt_price != state.sqrt_price) {
            state.tick_index = tick_math::sqrt_price_to_tick_index(step->next_sqrt_price);
        }

        state.sqrt_price = step->next_sqrt_price;
    }

    const uint64_t swapped_amount = token_amount - state.amount_remaining;

    SwapResult result;
    result.token_a = a_to_b == specified_input ? swapped_amount : state.amount_calculated;
    result.token_b = a_to_b == specified_input ? state.amount_calculated : swapped_amount;
    result.fee_amount = state.fee_amount;
    result.next_sqrt_price = state.sqrt_price;
    return result;
}

// =============================================================================
// Quotes
// =============================================================================

Result<ExactInSwapQuote> swap_quote_by_input_token(uint64_t token_in,
                                                   bool specified_token_a,
                                                   uint16_t slippage_tolerance_bps,
                                                   const FusionPoolFacade& pool,
                                                   const std::vector<TickArrayFacade>& tick_arrays,
                                                   const TransferFee& transfer_fee_a,
                                                   const TransferFee& transfer_fee_b) {
    const TransferFee& transfer_fee_in = specified_token_a ? transfer_fee_a : transfer_fee_b;
    const TransferFee& transfer_fee_out = specified_token_a ? transfer_fee_b : transfer_fee_a;

    auto token_in_after_fee = try_apply_transfer_fee(token_in, transfer_fee_in);
    if (!token_in_after_fee) return token_in_after_fee.error();

    auto sequence = TickArraySequence::create(tick_arrays, pool.tick_spacing);
    if (!sequence) return sequence.error();

    auto swap = compute_swap(*token_in_after_fee, 0, pool, *sequence, specified_token_a, true);
    if (!swap) return swap.error();

    const uint64_t swapped_in = specified_token_a ? swap->token_a : swap->token_b;
    const uint64_t swapped_out = specified_token_a ? swap->token_b : swap->token_a;

    auto quoted_in = try_reverse_apply_transfer_fee(swapped_in, transfer_fee_in);
    if (!quoted_in) return quoted_in.error();
    auto est_out = try_apply_transfer_fee(swapped_out, transfer_fee_out);
    if (!est_out) return est_out.error();
    auto min_out = try_get_min_amount_with_slippage_tolerance(*est_out, slippage_tolerance_bps);
    if (!min_out) return min_out.error();

    ExactInSwapQuote quote;
    quote.token_in = *quoted_in;
    quote.token_est_out = *est_out;
    quote.token_min_out = *min_out;
    quote.trade_fee = swap->fee_amount;
    quote.next_sqrt_price = swap->next_sqrt_price;
    return quote;
}

Result<ExactOutSwapQuote> swap_quote_by_output_token(uint64_t token_out,
                                                     bool specified_token_a,
                                                     uint16_t slippage_tolerance_bps,
                                                     const FusionPoolFacade& pool,
                                                     const std::vector<TickArrayFacade>& tick_arrays,
                                                     const TransferFee& transfer_fee_a,
                                                     const TransferFee& transfer_fee_b) {
    const TransferFee& transfer_fee_out = specified_token_a ? transfer_fee_a : transfer_fee_b;
    const TransferFee& transfer_fee_in = specified_token_a ? transfer_fee_b : transfer_fee_a;

    auto token_out_before_fee = try_reverse_apply_transfer_fee(token_out, transfer_fee_out);
    if (!token_out_before_fee) return token_out_before_fee.error();

    auto sequence = TickArraySequence::create(tick_arrays, pool.tick_spacing);
    if (!sequence) return sequence.error();

    // Buying token A means selling token B
    auto swap = compute_swap(*token_out_before_fee, 0, pool, *sequence, !specified_token_a, false);
    if (!swap) return swap.error();

    const uint64_t swapped_out = specified_token_a ? swap->token_a : swap->token_b;
    const uint64_t swapped_in = specified_token_a ? swap->token_b : swap->token_a;

    auto quoted_out = try_apply_transfer_fee(swapped_out, transfer_fee_out);
    if (!quoted_out) return quoted_out.error();
    auto est_in = try_reverse_apply_transfer_fee(swapped_in, transfer_fee_in);
    if (!est_in) return est_in.error();
    auto max_in = try_get_max_amount_with_slippage_tolerance(*est_in, slippage_tolerance_bps);
    if (!max_in) return max_in.error();

    ExactOutSwapQuote quote;
    quote.token_out = *quoted_out;
    quote.token_est_in = *est_in;
    quote.token_max_in = *max_in;
    quote.trade_fee = swap->fee_amount;
    quote.next_sqrt_price = swap->next_sqrt_price;
    return quote;
}

} // namespace fusion
