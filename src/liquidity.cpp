// =============================================================================
// liquidity.cpp - Liquidity quotes for opening, adding to and closing positions
// =============================================================================

#include "fusion/liquidity.hpp"
#include "fusion/position.hpp"
#include "fusion/tick_math.hpp"
#include "fusion/token_math.hpp"
#include "fusion/u256.hpp"

namespace fusion {

using namespace token_math;

namespace {

struct SqrtPriceRange {
    U128 lower;
    U128 upper;
};

SqrtPriceRange sqrt_price_range(int32_t tick_index_1, int32_t tick_index_2) {
    TickRange range = tick_math::order_tick_indexes(tick_index_1, tick_index_2);
    return SqrtPriceRange{tick_math::tick_index_to_sqrt_price(range.tick_lower_index),
                          tick_math::tick_index_to_sqrt_price(range.tick_upper_index)};
}

// Liquidity a single-token deposit buys. Token A only counts at or below the
// upper bound, token B only at or above the lower bound.
Result<U128> liquidity_for_token(bool token_a, uint64_t token_delta, U128 current_sqrt_price,
                                 int32_t tick_index_1, int32_t tick_index_2) {
    SqrtPriceRange range = sqrt_price_range(tick_index_1, tick_index_2);
    PositionStatus status = position_status(current_sqrt_price, tick_index_1, tick_index_2);

    if (token_a) {
        if (status == PositionStatus::PriceBelowRange) {
            return try_get_liquidity_from_a(token_delta, range.lower, range.upper);
        }
        if (status == PositionStatus::PriceInRange) {
            return try_get_liquidity_from_a(token_delta, current_sqrt_price, range.upper);
        }
        return U128{0};
    }

    if (status == PositionStatus::PriceAboveRange) {
        return try_get_liquidity_from_b(token_delta, range.lower, range.upper);
    }
    if (status == PositionStatus::PriceInRange) {
        return try_get_liquidity_from_b(token_delta, range.lower, current_sqrt_price);
    }
    return U128{0};
}

} // anonymous namespace

// =============================================================================
// Liquidity <-> Token Amounts
// =============================================================================

Result<U128> try_get_liquidity_from_a(uint64_t token_delta_a, U128 sqrt_price_lower, U128 sqrt_price_upper) {
    if (token_delta_a == 0 || sqrt_price_lower == sqrt_price_upper) {
        return U128{0};
    }
    if (sqrt_price_lower > sqrt_price_upper) {
        std::swap(sqrt_price_lower, sqrt_price_upper);
    }

    std::optional<U256> product = U256::mul_u128(sqrt_price_lower, sqrt_price_upper)
                                      .checked_mul(U256(static_cast<U128>(token_delta_a)));
    if (!product) {
        return Error::ARITHMETIC_OVERFLOW;
    }

    U256 liquidity = (*product / U256(sqrt_price_upper - sqrt_price_lower)) >> 64;
    return liquidity.try_into_u128();
}

Result<U128> try_get_liquidity_from_b(uint64_t token_delta_b, U128 sqrt_price_lower, U128 sqrt_price_upper) {
    if (token_delta_b == 0 || sqrt_price_lower == sqrt_price_upper) {
        return U128{0};
    }
    if (sqrt_price_lower > sqrt_price_upper) {
        std::swap(sqrt_price_lower, sqrt_price_upper);
    }
    return (static_cast<U128>(token_delta_b) << 64) / (sqrt_price_upper - sqrt_price_lower);
}

Result<std::pair<uint64_t, uint64_t>> try_get_token_estimates_from_liquidity(U128 liquidity_delta,
                                                                             U128 current_sqrt_price,
                                                                             U128 sqrt_price_lower,
                                                                             U128 sqrt_price_upper,
                                                                             bool round_up) {
    using Amounts = std::pair<uint64_t, uint64_t>;
    if (liquidity_delta == 0) {
        return Amounts{0, 0};
    }

    if (current_sqrt_price <= sqrt_price_lower) {
        auto token_a = try_get_amount_delta_a(sqrt_price_lower, sqrt_price_upper, liquidity_delta, round_up);
        if (!token_a) return token_a.error();
        return Amounts{*token_a, 0};
    }

    if (current_sqrt_price >= sqrt_price_upper) {
        auto token_b = try_get_amount_delta_b(sqrt_price_lower, sqrt_price_upper, liquidity_delta, round_up);
        if (!token_b) return token_b.error();
        return Amounts{0, *token_b};
    }

    auto token_a = try_get_amount_delta_a(current_sqrt_price, sqrt_price_upper, liquidity_delta, round_up);
    if (!token_a) return token_a.error();
    auto token_b = try_get_amount_delta_b(sqrt_price_lower, current_sqrt_price, liquidity_delta, round_up);
    if (!token_b) return token_b.error();
    return Amounts{*token_a, *token_b};
}

// =============================================================================
// Increase
// =============================================================================

Result<IncreaseLiquidityQuote> increase_liquidity_quote(U128 liquidity_delta,
                                                        uint16_t slippage_tolerance_bps,
                                                        U128 current_sqrt_price,
                                                        int32_t tick_index_1,
                                                        int32_t tick_index_2,
                                                        const TransferFee& transfer_fee_a,
                                                        const TransferFee& transfer_fee_b) {
    if (liquidity_delta == 0) {
        return IncreaseLiquidityQuote{};
    }

    SqrtPriceRange range = sqrt_price_range(tick_index_1, tick_index_2);
    auto estimates = try_get_token_estimates_from_liquidity(liquidity_delta, current_sqrt_price,
                                                            range.lower, range.upper, true);
    if (!estimates) return estimates.error();

    auto max_a = try_get_max_amount_with_slippage_tolerance(estimates->first, slippage_tolerance_bps);
    if (!max_a) return max_a.error();
    auto max_b = try_get_max_amount_with_slippage_tolerance(estimates->second, slippage_tolerance_bps);
    if (!max_b) return max_b.error();

    // The owner has to send enough to cover the transfer fee as well
    auto est_a = try_reverse_apply_transfer_fee(estimates->first, transfer_fee_a);
    if (!est_a) return est_a.error();
    auto est_b = try_reverse_apply_transfer_fee(estimates->second, transfer_fee_b);
    if (!est_b) return est_b.error();
    auto max_a_before_fee = try_reverse_apply_transfer_fee(*max_a, transfer_fee_a);
    if (!max_a_before_fee) return max_a_before_fee.error();
    auto max_b_before_fee = try_reverse_apply_transfer_fee(*max_b, transfer_fee_b);
    if (!max_b_before_fee) return max_b_before_fee.error();

    IncreaseLiquidityQuote quote;
    quote.liquidity_delta = liquidity_delta;
    quote.token_est_a = *est_a;
    quote.token_est_b = *est_b;
    quote.token_max_a = *max_a_before_fee;
    quote.token_max_b = *max_b_before_fee;
    return quote;
}

Result<IncreaseLiquidityQuote> increase_liquidity_quote_a(uint64_t token_amount_a,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a,
                                                          const TransferFee& transfer_fee_b) {
    auto token_delta_a = try_apply_transfer_fee(token_amount_a, transfer_fee_a);
    if (!token_delta_a) return token_delta_a.error();
    if (*token_delta_a == 0) {
        return IncreaseLiquidityQuote{};
    }

    auto liquidity = liquidity_for_token(true, *token_delta_a, current_sqrt_price, tick_index_1, tick_index_2);
    if (!liquidity) return liquidity.error();

    return increase_liquidity_quote(*liquidity, slippage_tolerance_bps, current_sqrt_price,
                                    tick_index_1, tick_index_2, transfer_fee_a, transfer_fee_b);
}

Result<IncreaseLiquidityQuote> increase_liquidity_quote_b(uint64_t token_amount_b,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a,
                                                          const TransferFee& transfer_fee_b) {
    auto token_delta_b = try_apply_transfer_fee(token_amount_b, transfer_fee_b);
    if (!token_delta_b) return token_delta_b.error();
    if (*token_delta_b == 0) {
        return IncreaseLiquidityQuote{};
    }

    auto liquidity = liquidity_for_token(false, *token_delta_b, current_sqrt_price, tick_index_1, tick_index_2);
    if (!liquidity) return liquidity.error();

    return increase_liquidity_quote(*liquidity, slippage_tolerance_bps, current_sqrt_price,
                                    tick_index_1, tick_index_2, transfer_fee_a, transfer_fee_b);
}

// =============================================================================
// Decrease
// =============================================================================

Result<DecreaseLiquidityQuote> decrease_liquidity_quote(U128 liquidity_delta,
                                                        uint16_t slippage_tolerance_bps,
                                                        U128 current_sqrt_price,
                                                        int32_t tick_index_1,
                                                        int32_t tick_index_2,
                                                        const TransferFee& transfer_fee_a,
                                                        const TransferFee& transfer_fee_b) {
    if (liquidity_delta == 0) {
        return DecreaseLiquidityQuote{};
    }

    SqrtPriceRange range = sqrt_price_range(tick_index_1, tick_index_2);
    auto estimates = try_get_token_estimates_from_liquidity(liquidity_delta, current_sqrt_price,
                                                            range.lower, range.upper, false);
    if (!estimates) return estimates.error();

    auto min_a = try_get_min_amount_with_slippage_tolerance(estimates->first, slippage_tolerance_bps);
    if (!min_a) return min_a.error();
    auto min_b = try_get_min_amount_with_slippage_tolerance(estimates->second, slippage_tolerance_bps);
    if (!min_b) return min_b.error();

    auto est_a = try_apply_transfer_fee(estimates->first, transfer_fee_a);
    if (!est_a) return est_a.error();
    auto est_b = try_apply_transfer_fee(estimates->second, transfer_fee_b);
    if (!est_b) return est_b.error();
    auto min_a_after_fee = try_apply_transfer_fee(*min_a, transfer_fee_a);
    if (!min_a_after_fee) return min_a_after_fee.error();
    auto min_b_after_fee = try_apply_transfer_fee(*min_b, transfer_fee_b);
    if (!min_b_after_fee) return min_b_after_fee.error();

    DecreaseLiquidityQuote quote;
    quote.liquidity_delta = liquidity_delta;
    quote.token_est_a = *est_a;
    quote.token_est_b = *est_b;
    quote.token_min_a = *min_a_after_fee;
    quote.token_min_b = *min_b_after_fee;
    return quote;
}

Result<DecreaseLiquidityQuote> decrease_liquidity_quote_a(uint64_t token_amount_a,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a,
                                                          const TransferFee& transfer_fee_b) {
    // Withdraw enough that token_amount_a arrives after the transfer fee
    auto token_delta_a = try_reverse_apply_transfer_fee(token_amount_a, transfer_fee_a);
    if (!token_delta_a) return token_delta_a.error();
    if (*token_delta_a == 0) {
        return DecreaseLiquidityQuote{};
    }

    auto liquidity = liquidity_for_token(true, *token_delta_a, current_sqrt_price, tick_index_1, tick_index_2);
    if (!liquidity) return liquidity.error();

    return decrease_liquidity_quote(*liquidity, slippage_tolerance_bps, current_sqrt_price,
                                    tick_index_1, tick_index_2, transfer_fee_a, transfer_fee_b);
}

Result<DecreaseLiquidityQuote> decrease_liquidity_quote_b(uint64_t token_amount_b,
                                                          uint16_t slippage_tolerance_bps,
                                                          U128 current_sqrt_price,
                                                          int32_t tick_index_1,
                                                          int32_t tick_index_2,
                                                          const TransferFee& transfer_fee_a,
                                                          const TransferFee& transfer_fee_b) {
    auto token_delta_b = try_reverse_apply_transfer_fee(token_amount_b, transfer_fee_b);
    if (!token_delta_b) return token_delta_b.error();
    if (*token_delta_b == 0) {
        return DecreaseLiquidityQuote{};
    }

    auto liquidity = liquidity_for_token(false, *token_delta_b, current_sqrt_price, tick_index_1, tick_index_2);
    if (!liquidity) return liquidity.error();

    return decrease_liquidity_quote(*liquidity, slippage_tolerance_bps, current_sqrt_price,
                                    tick_index_1, tick_index_2, transfer_fee_a, transfer_fee_b);
}

} // namespace fusion
