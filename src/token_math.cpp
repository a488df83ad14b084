// =============================================================================
// token_math.cpp - Fee, transfer fee, slippage and amount delta arithmetic
// Every rounding direction favors the pool
// =============================================================================

#include "fusion/token_math.hpp"
#include "fusion/u256.hpp"

namespace fusion {
namespace token_math {

namespace {

const U256 LOW_64_MASK = U256(static_cast<U128>(U64_MAX));
const U256 LOW_128_MASK = U256(U128_MAX);

inline Result<uint64_t> narrow_to_u64(const U256& value) {
    if (!value.fits_u64()) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    return value.word(0);
}

inline std::pair<U128, U128> order_prices(U128 a, U128 b) {
    return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

} // anonymous namespace

// =============================================================================
// Mul-Div
// =============================================================================

Result<uint64_t> try_mul_div(uint64_t amount, U128 product, U128 denominator, bool round_up) {
    if (amount == 0 || product == 0) {
        return uint64_t{0};
    }
    if (denominator == 0 || product > U128_MAX / amount) {
        return Error::ARITHMETIC_OVERFLOW;
    }

    U128 numerator = static_cast<U128>(amount) * product;
    U128 quotient = numerator / denominator;
    if (quotient > U64_MAX) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    if (round_up && numerator % denominator != 0) {
        quotient += 1;
    }
    if (quotient > U64_MAX) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    return static_cast<uint64_t>(quotient);
}

// =============================================================================
// Swap Fee
// =============================================================================

Result<uint64_t> try_apply_swap_fee(uint64_t amount, uint16_t fee_rate) {
    return try_mul_div(amount, fees::FEE_RATE_DENOMINATOR - fee_rate, fees::FEE_RATE_DENOMINATOR, false);
}

Result<uint64_t> try_reverse_apply_swap_fee(uint64_t amount, uint16_t fee_rate) {
    return try_mul_div(amount, fees::FEE_RATE_DENOMINATOR, fees::FEE_RATE_DENOMINATOR - fee_rate, true);
}

// =============================================================================
// Transfer Fee
// =============================================================================

Result<uint64_t> try_apply_transfer_fee(uint64_t amount, const TransferFee& transfer_fee) {
    if (transfer_fee.fee_bps > fees::BPS_DENOMINATOR) {
        return Error::INVALID_TRANSFER_FEE;
    }
    if (transfer_fee.fee_bps == 0 || amount == 0) {
        return amount;
    }

    U128 numerator = static_cast<U128>(amount) * transfer_fee.fee_bps;
    U128 raw_fee = (numerator + fees::BPS_DENOMINATOR - 1) / fees::BPS_DENOMINATOR;
    uint64_t fee_amount = raw_fee < transfer_fee.max_fee ? static_cast<uint64_t>(raw_fee) : transfer_fee.max_fee;
    return amount - fee_amount;
}

Result<uint64_t> try_reverse_apply_transfer_fee(uint64_t amount, const TransferFee& transfer_fee) {
    if (transfer_fee.fee_bps > fees::BPS_DENOMINATOR) {
        return Error::INVALID_TRANSFER_FEE;
    }
    if (transfer_fee.fee_bps == 0) {
        return amount;
    }
    if (amount == 0) {
        return uint64_t{0};
    }

    auto add_max_fee = [&]() -> Result<uint64_t> {
        if (transfer_fee.max_fee > U64_MAX - amount) {
            return Error::AMOUNT_EXCEEDS_MAX_U64;
        }
        return amount + transfer_fee.max_fee;
    };

    // 100% fee: the only recoverable pre-fee amount is amount + max_fee
    if (transfer_fee.fee_bps == fees::BPS_DENOMINATOR) {
        return add_max_fee();
    }

    U128 numerator = static_cast<U128>(amount) * fees::BPS_DENOMINATOR;
    U128 denominator = fees::BPS_DENOMINATOR - transfer_fee.fee_bps;
    U128 raw_pre_fee_amount = (numerator + denominator - 1) / denominator;
    U128 fee_amount = raw_pre_fee_amount - amount;

    if (fee_amount >= transfer_fee.max_fee) {
        return add_max_fee();
    }
    if (raw_pre_fee_amount > U64_MAX) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }
    return static_cast<uint64_t>(raw_pre_fee_amount);
}

// =============================================================================
// Slippage
// =============================================================================

Result<uint64_t> try_get_min_amount_with_slippage_tolerance(uint64_t amount, uint16_t slippage_tolerance_bps) {
    if (slippage_tolerance_bps > fees::BPS_DENOMINATOR) {
        return Error::INVALID_SLIPPAGE_TOLERANCE;
    }
    return try_mul_div(amount, fees::BPS_DENOMINATOR - slippage_tolerance_bps, fees::BPS_DENOMINATOR, false);
}

Result<uint64_t> try_get_max_amount_with_slippage_tolerance(uint64_t amount, uint16_t slippage_tolerance_bps) {
    if (slippage_tolerance_bps > fees::BPS_DENOMINATOR) {
        return Error::INVALID_SLIPPAGE_TOLERANCE;
    }
    return try_mul_div(amount, static_cast<U128>(fees::BPS_DENOMINATOR) + slippage_tolerance_bps,
                       fees::BPS_DENOMINATOR, true);
}

// =============================================================================
// Amount Deltas
// =============================================================================

Result<uint64_t> try_get_amount_delta_a(U128 sqrt_price_1, U128 sqrt_price_2, U128 liquidity, bool round_up) {
    auto prices = order_prices(sqrt_price_1, sqrt_price_2);
    const U128 lower = prices.first;
    const U128 upper = prices.second;

    U256 numerator = U256::mul_u128(liquidity, upper - lower);
    U256 denominator = U256::mul_u128(lower, upper);
    if (numerator.is_zero()) {
        return uint64_t{0};
    }
    if (denominator.is_zero()) {
        return Error::ARITHMETIC_OVERFLOW;
    }
    // (numerator << 64) / denominator fits u64 only when numerator < denominator
    if (numerator >= denominator) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }

    // Two 32-bit long-division steps keep every intermediate below 2^256
    auto step1 = (numerator << 32).div_rem(denominator);
    auto step2 = (step1.second << 32).div_rem(denominator);
    U256 quotient = (step1.first << 32) + step2.first;
    if (round_up && !step2.second.is_zero()) {
        quotient = quotient + U256(1);
    }
    return narrow_to_u64(quotient);
}

Result<uint64_t> try_get_amount_delta_b(U128 sqrt_price_1, U128 sqrt_price_2, U128 liquidity, bool round_up) {
    auto prices = order_prices(sqrt_price_1, sqrt_price_2);

    U256 product = U256::mul_u128(liquidity, prices.second - prices.first);
    U256 quotient = product >> 64;
    if (round_up && !(product & LOW_64_MASK).is_zero()) {
        quotient = quotient + U256(1);
    }
    return narrow_to_u64(quotient);
}

// =============================================================================
// Next Sqrt Price
// =============================================================================

Result<U128> try_get_next_sqrt_price_from_a(U128 current_sqrt_price, U128 current_liquidity,
                                            uint64_t amount, bool specified_input) {
    if (amount == 0) {
        return current_sqrt_price;
    }

    U256 product = U256::mul_u128(current_sqrt_price, amount);
    U256 liquidity_times_price = U256::mul_u128(current_liquidity, current_sqrt_price);
    if (liquidity_times_price.bits() > 192) {
        return Error::ARITHMETIC_OVERFLOW;
    }
    U256 numerator = liquidity_times_price << 64;
    U256 liquidity_shifted = U256(current_liquidity) << 64;

    std::optional<U256> denominator = specified_input
        ? liquidity_shifted.checked_add(product)
        : liquidity_shifted.checked_sub(product);
    if (!denominator || denominator->is_zero()) {
        return Error::ARITHMETIC_OVERFLOW;
    }

    auto qr = numerator.div_rem(*denominator);
    U256 result = qr.second.is_zero() ? qr.first : qr.first + U256(1);

    if (result < U256(MIN_SQRT_PRICE) || result > U256(MAX_SQRT_PRICE)) {
        return Error::SQRT_PRICE_OUT_OF_BOUNDS;
    }
    return result.low_u128();
}

Result<U128> try_get_next_sqrt_price_from_b(U128 current_sqrt_price, U128 current_liquidity,
                                            uint64_t amount, bool specified_input) {
    if (amount == 0) {
        return current_sqrt_price;
    }
    if (current_liquidity == 0) {
        return Error::ARITHMETIC_OVERFLOW;
    }

    U128 amount_x64 = static_cast<U128>(amount) << 64;
    U128 delta = amount_x64 / current_liquidity;
    if (!specified_input && amount_x64 % current_liquidity != 0) {
        delta += 1;
    }

    U128 result;
    if (specified_input) {
        if (delta > U128_MAX - current_sqrt_price) {
            return Error::ARITHMETIC_OVERFLOW;
        }
        result = current_sqrt_price + delta;
    } else {
        if (delta > current_sqrt_price) {
            return Error::ARITHMETIC_OVERFLOW;
        }
        result = current_sqrt_price - delta;
    }

    if (result < MIN_SQRT_PRICE || result > MAX_SQRT_PRICE) {
        return Error::SQRT_PRICE_OUT_OF_BOUNDS;
    }
    return result;
}

// =============================================================================
// Sqrt Price Squared
// =============================================================================

Result<uint64_t> mul_by_sqrt_price_squared(uint64_t amount, U128 sqrt_price, bool round_up) {
    U256 price_squared = U256::mul_u128(sqrt_price, sqrt_price);
    std::optional<U256> product = price_squared.checked_mul(U256(static_cast<U128>(amount)));
    if (!product) {
        return Error::AMOUNT_EXCEEDS_MAX_U64;
    }

    U256 quotient = *product >> 128;
    if (round_up && !(*product & LOW_128_MASK).is_zero()) {
        quotient = quotient + U256(1);
    }
    return narrow_to_u64(quotient);
}

Result<uint64_t> div_by_sqrt_price_squared(uint64_t amount, U128 sqrt_price, bool round_up) {
    U256 price_squared = U256::mul_u128(sqrt_price, sqrt_price);
    if (price_squared.is_zero()) {
        return Error::ARITHMETIC_OVERFLOW;
    }

    U256 numerator = U256(static_cast<U128>(amount)) << 128;
    auto qr = numerator.div_rem(price_squared);
    U256 quotient = qr.first;
    if (round_up && !qr.second.is_zero()) {
        quotient = quotient + U256(1);
    }
    return narrow_to_u64(quotient);
}

} // namespace token_math
} // namespace fusion
