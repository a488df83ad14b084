// =============================================================================
// limit_order.cpp - Limit order quotes and decrease settlement
// =============================================================================

#include "fusion/limit_order.hpp"
#include "fusion/tick_math.hpp"
#include "fusion/token_math.hpp"

namespace fusion {

using namespace token_math;

Result<uint64_t> get_limit_order_output_amount(uint64_t input_amount, bool a_to_b_order,
                                               U128 sqrt_price, bool round_up) {
    if (a_to_b_order) {
        return mul_by_sqrt_price_squared(input_amount, sqrt_price, round_up);
    }
    return div_by_sqrt_price_squared(input_amount, sqrt_price, round_up);
}

// =============================================================================
// Placement Quotes
// =============================================================================

Result<uint64_t> limit_order_quote_by_input_token(uint64_t amount_in, bool a_to_b_order,
                                                  int32_t tick_index, const FusionPoolFacade& pool) {
    U128 sqrt_price = tick_math::tick_index_to_sqrt_price(tick_index);
    auto amount_out = get_limit_order_output_amount(amount_in, a_to_b_order, sqrt_price, false);
    if (!amount_out) return amount_out.error();

    // Swap fee the taker pays on top of the order output
    auto gross = try_reverse_apply_swap_fee(*amount_out, pool.fee_rate);
    if (!gross) return gross.error();
    uint64_t swap_fee = *gross - *amount_out;

    auto protocol_fee = try_mul_div(swap_fee, pool.order_protocol_fee_rate,
                                    fees::PROTOCOL_FEE_RATE_MUL_VALUE, false);
    if (!protocol_fee) return protocol_fee.error();
    swap_fee -= *protocol_fee;

    // The CLP keeps (1 - reward ratio) of the remaining fee
    auto clp_share = try_mul_div(swap_fee, fees::MAX_CLP_REWARD_RATE - pool.clp_to_olp_reward_ratio,
                                 fees::MAX_CLP_REWARD_RATE, false);
    if (!clp_share) return clp_share.error();

    uint64_t olp_reward = swap_fee - *clp_share;
    if (*amount_out > U64_MAX - olp_reward) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    return *amount_out + olp_reward;
}

Result<uint64_t> limit_order_quote_by_output_token(uint64_t amount_out, bool a_to_b_order,
                                                   int32_t tick_index, const FusionPoolFacade& pool) {
    U128 sqrt_price = tick_math::tick_index_to_sqrt_price(tick_index);

    double f = static_cast<double>(pool.fee_rate) / fees::FEE_RATE_DENOMINATOR;
    double p = static_cast<double>(pool.order_protocol_fee_rate) / fees::PROTOCOL_FEE_RATE_MUL_VALUE;
    double r = static_cast<double>(pool.clp_to_olp_reward_ratio) / fees::MAX_CLP_REWARD_RATE;

    double denominator = 1.0 + (f / (1.0 - f) * (1.0 - r) * (1.0 - p));
    double amount_out_without_fees = static_cast<double>(amount_out) / denominator;

    if (amount_out_without_fees < 0.0 || amount_out_without_fees >= 18446744073709551616.0) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }

    return get_limit_order_output_amount(static_cast<uint64_t>(amount_out_without_fees),
                                         !a_to_b_order, sqrt_price, true);
}

// =============================================================================
// Decrease
// =============================================================================

Result<LimitOrderDecreaseQuote> decrease_limit_order_quote(const FusionPoolFacade& pool,
                                                           const LimitOrderFacade& limit_order,
                                                           const TickFacade& tick,
                                                           uint64_t amount,
                                                           const TransferFee& transfer_fee_a,
                                                           const TransferFee& transfer_fee_b) {
    if (amount > limit_order.amount) {
        return Error::AMOUNT_EXCEEDS_LIMIT_ORDER_INPUT_AMOUNT;
    }

    uint64_t amount_in = 0;   // unfilled input returned
    uint64_t amount_out = 0;  // filled output returned

    if (limit_order.age == tick.age) {
        amount_in = amount;
    } else if (limit_order.age + 1 == tick.age) {
        if (tick.part_filled_orders_input == 0) {
            return Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC;
        }
        U128 sqrt_price = tick_math::tick_index_to_sqrt_price(limit_order.tick_index);
        auto remaining = try_mul_div(amount, tick.part_filled_orders_remaining_input,
                                     tick.part_filled_orders_input, false);
        if (!remaining) return remaining.error();
        if (*remaining > amount) {
            return Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC;
        }
        auto out = get_limit_order_output_amount(amount - *remaining, limit_order.a_to_b, sqrt_price, false);
        if (!out) return out.error();
        amount_in = *remaining;
        amount_out = *out;
    } else if (limit_order.age + 2 <= tick.age) {
        U128 sqrt_price = tick_math::tick_index_to_sqrt_price(limit_order.tick_index);
        auto out = get_limit_order_output_amount(amount, limit_order.a_to_b, sqrt_price, false);
        if (!out) return out.error();
        amount_out = *out;
    } else {
        return Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC;
    }

    // OLP reward is paid in the output token, pro rata to the filled input
    const uint64_t filled_amount = amount - amount_in;
    const uint64_t orders_filled = limit_order.a_to_b ? pool.orders_filled_amount_a : pool.orders_filled_amount_b;
    const uint64_t olp_fee_owed = limit_order.a_to_b ? pool.olp_fee_owed_b : pool.olp_fee_owed_a;

    uint64_t reward = 0;
    if (filled_amount > 0) {
        if (orders_filled == 0) {
            return Error::LIMIT_ORDER_AND_POOL_ARE_OUT_OF_SYNC;
        }
        auto share = try_mul_div(olp_fee_owed, filled_amount, orders_filled, false);
        if (!share) return share.error();
        reward = *share;
    }

    if (amount_out > U64_MAX - reward) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }

    LimitOrderDecreaseQuote quote;
    uint64_t out_a;
    uint64_t out_b;
    if (limit_order.a_to_b) {
        quote.reward_b = reward;
        out_a = amount_in;
        out_b = amount_out + reward;
    } else {
        quote.reward_a = reward;
        out_a = amount_out + reward;
        out_b = amount_in;
    }

    auto net_a = try_apply_transfer_fee(out_a, transfer_fee_a);
    if (!net_a) return net_a.error();
    auto net_b = try_apply_transfer_fee(out_b, transfer_fee_b);
    if (!net_b) return net_b.error();

    quote.amount_out_a = *net_a;
    quote.amount_out_b = *net_b;
    return quote;
}

} // namespace fusion
