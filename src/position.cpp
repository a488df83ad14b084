// =============================================================================
// position.cpp - Position range status, token ratio and fee collection
// =============================================================================

#include "fusion/position.hpp"
#include "fusion/tick_math.hpp"
#include "fusion/token_math.hpp"
#include "fusion/u256.hpp"

namespace fusion {

namespace {

// Fee growth per unit of liquidity inside [lower, upper]. All arithmetic wraps.
U128 fee_growth_inside(int32_t tick_current, int32_t tick_lower_index, int32_t tick_upper_index,
                       U128 fee_growth_global, U128 lower_outside, U128 upper_outside) {
    U128 below = tick_current < tick_lower_index ? fee_growth_global - lower_outside : lower_outside;
    U128 above = tick_current < tick_upper_index ? upper_outside : fee_growth_global - upper_outside;
    return fee_growth_global - below - above;
}

Result<uint64_t> fees_earned(U128 growth_inside, U128 checkpoint, U128 liquidity, uint64_t fee_owed) {
    U256 delta = U256::mul_u128(growth_inside - checkpoint, liquidity) >> 64;
    if (!delta.fits_u64()) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    uint64_t total = 0;
    if (__builtin_add_overflow(delta.word(0), fee_owed, &total)) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    return total;
}

} // anonymous namespace

// =============================================================================
// Range Status
// =============================================================================

PositionStatus position_status(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2) {
    if (tick_index_1 == tick_index_2) {
        return PositionStatus::Invalid;
    }

    TickRange range = tick_math::order_tick_indexes(tick_index_1, tick_index_2);
    U128 sqrt_price_lower = tick_math::tick_index_to_sqrt_price(range.tick_lower_index);
    U128 sqrt_price_upper = tick_math::tick_index_to_sqrt_price(range.tick_upper_index);

    if (current_sqrt_price <= sqrt_price_lower) {
        return PositionStatus::PriceBelowRange;
    }
    if (current_sqrt_price >= sqrt_price_upper) {
        return PositionStatus::PriceAboveRange;
    }
    return PositionStatus::PriceInRange;
}

bool is_position_in_range(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2) {
    return position_status(current_sqrt_price, tick_index_1, tick_index_2) == PositionStatus::PriceInRange;
}

PositionRatio position_ratio_x64(U128 current_sqrt_price, int32_t tick_index_1, int32_t tick_index_2) {
    switch (position_status(current_sqrt_price, tick_index_1, tick_index_2)) {
        case PositionStatus::Invalid:
            return PositionRatio{0, 0};
        case PositionStatus::PriceBelowRange:
            return PositionRatio{Q64, 0};
        case PositionStatus::PriceAboveRange:
            return PositionRatio{0, Q64};
        case PositionStatus::PriceInRange:
            break;
    }

    TickRange range = tick_math::order_tick_indexes(tick_index_1, tick_index_2);
    const U128 sqrt_price_lower = tick_math::tick_index_to_sqrt_price(range.tick_lower_index);
    const U128 sqrt_price_upper = tick_math::tick_index_to_sqrt_price(range.tick_upper_index);

    // Deposits of a unit (2^64) liquidity position, both valued in token B
    const U256 one_x128 = U256(Q64) << 64;
    const U256 price = U256::mul_u128(current_sqrt_price, current_sqrt_price);

    U256 deposit_a = ((one_x128 / U256(current_sqrt_price) - one_x128 / U256(sqrt_price_upper)) * price) >> 64;
    U256 deposit_b = U256::mul_u128(Q64, current_sqrt_price - sqrt_price_lower);
    U256 total_deposit = deposit_a + deposit_b;

    // Keep deposit_a << 64 inside 256 bits
    const unsigned bits = deposit_a.bits();
    if (bits > 192) {
        deposit_a = deposit_a >> (bits - 192);
        total_deposit = total_deposit >> (bits - 192);
    }

    const U128 ratio_a = ((deposit_a << 64) / total_deposit).low_u128();
    return PositionRatio{ratio_a, Q64 - ratio_a};
}

const char* to_string(PositionStatus status) {
    switch (status) {
        case PositionStatus::PriceInRange: return "PriceInRange";
        case PositionStatus::PriceBelowRange: return "PriceBelowRange";
        case PositionStatus::PriceAboveRange: return "PriceAboveRange";
        case PositionStatus::Invalid: return "Invalid";
    }
    return "Unknown";
}

// =============================================================================
// Fee Collection
// =============================================================================

Result<CollectFeesQuote> collect_fees_quote(const FusionPoolFacade& pool,
                                            const PositionFacade& position,
                                            const TickFacade& tick_lower,
                                            const TickFacade& tick_upper,
                                            const TransferFee& transfer_fee_a,
                                            const TransferFee& transfer_fee_b) {
    const U128 growth_inside_a = fee_growth_inside(pool.tick_current_index,
                                                   position.tick_lower_index, position.tick_upper_index,
                                                   pool.fee_growth_global_a,
                                                   tick_lower.fee_growth_outside_a, tick_upper.fee_growth_outside_a);
    const U128 growth_inside_b = fee_growth_inside(pool.tick_current_index,
                                                   position.tick_lower_index, position.tick_upper_index,
                                                   pool.fee_growth_global_b,
                                                   tick_lower.fee_growth_outside_b, tick_upper.fee_growth_outside_b);

    auto owed_a = fees_earned(growth_inside_a, position.fee_growth_checkpoint_a,
                              position.liquidity, position.fee_owed_a);
    if (!owed_a) return owed_a.error();
    auto owed_b = fees_earned(growth_inside_b, position.fee_growth_checkpoint_b,
                              position.liquidity, position.fee_owed_b);
    if (!owed_b) return owed_b.error();

    auto net_a = token_math::try_apply_transfer_fee(*owed_a, transfer_fee_a);
    if (!net_a) return net_a.error();
    auto net_b = token_math::try_apply_transfer_fee(*owed_b, transfer_fee_b);
    if (!net_b) return net_b.error();

    return CollectFeesQuote{*net_a, *net_b};
}

} // namespace fusion
