#ifndef FUSION_TYPES_HPP
#define FUSION_TYPES_HPP

#include <array>
#include <cstdint>
#include <limits>

namespace fusion {

// =============================================================================
// Native 128-bit integers
// =============================================================================

using I128 = __int128;
using U128 = unsigned __int128;

// Build a 128-bit constant from its two 64-bit halves
constexpr U128 u128(uint64_t hi, uint64_t lo) {
    return (static_cast<U128>(hi) << 64) | lo;
}

constexpr U128 Q64 = static_cast<U128>(1) << 64;
constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();
constexpr U128 U128_MAX = ~static_cast<U128>(0);

// =============================================================================
// Protocol Constants
// =============================================================================

constexpr int32_t MIN_TICK_INDEX = -443636;
constexpr int32_t MAX_TICK_INDEX = 443636;

constexpr U128 MIN_SQRT_PRICE = 4295048016ULL;
constexpr U128 MAX_SQRT_PRICE = u128(0xfffec4b1ULL, 0x35bb7f32a81b33afULL);  // 79226673515401279992447579055

constexpr size_t TICK_ARRAY_SIZE = 88;
constexpr uint16_t FULL_RANGE_ONLY_TICK_SPACING_THRESHOLD = 32768;

namespace fees {

constexpr uint32_t FEE_RATE_MUL_VALUE = 1000000;       // swap fee denominator (hundredths of bip)
constexpr uint32_t FEE_RATE_DENOMINATOR = FEE_RATE_MUL_VALUE;
constexpr uint16_t BPS_DENOMINATOR = 10000;
constexpr uint16_t PROTOCOL_FEE_RATE_MUL_VALUE = 10000;
constexpr uint16_t MAX_PROTOCOL_FEE_RATE = 2500;
constexpr uint16_t MAX_ORDER_PROTOCOL_FEE_RATE = 10000;
constexpr uint16_t MAX_CLP_REWARD_RATE = 10000;

} // namespace fees

// =============================================================================
// Pool State (read-only snapshot)
// =============================================================================

struct FusionPoolFacade {
    uint16_t tick_spacing = 0;
    uint16_t fee_rate = 0;                  // hundredths of bip
    uint16_t protocol_fee_rate = 0;         // bps of the swap fee
    uint16_t clp_to_olp_reward_ratio = 0;   // bps of the order swap fee paid to OLPs
    uint16_t order_protocol_fee_rate = 0;   // bps
    U128 liquidity = 0;
    U128 sqrt_price = 0;                    // Q64.64
    int32_t tick_current_index = 0;
    U128 fee_growth_global_a = 0;
    U128 fee_growth_global_b = 0;
    uint64_t orders_total_amount_a = 0;
    uint64_t orders_total_amount_b = 0;
    uint64_t orders_filled_amount_a = 0;
    uint64_t orders_filled_amount_b = 0;
    uint64_t olp_fee_owed_a = 0;
    uint64_t olp_fee_owed_b = 0;
};

// =============================================================================
// Tick State
// =============================================================================

struct TickFacade {
    bool initialized = false;
    I128 liquidity_net = 0;                 // Net liquidity change when crossing left to right
    U128 liquidity_gross = 0;
    U128 fee_growth_outside_a = 0;
    U128 fee_growth_outside_b = 0;
    uint64_t age = 0;                       // Incremented each time the tick is crossed
    uint64_t open_orders_input = 0;
    uint64_t part_filled_orders_input = 0;
    uint64_t part_filled_orders_remaining_input = 0;
    uint64_t fulfilled_a_to_b_orders_input = 0;
    uint64_t fulfilled_b_to_a_orders_input = 0;
};

struct TickArrayFacade {
    int32_t start_tick_index = 0;
    std::array<TickFacade, TICK_ARRAY_SIZE> ticks{};
};

struct TickRange {
    int32_t tick_lower_index = 0;
    int32_t tick_upper_index = 0;
};

// =============================================================================
// Limit Orders
// =============================================================================

struct LimitOrderFacade {
    int32_t tick_index = 0;
    uint64_t amount = 0;                    // Remaining input amount
    bool a_to_b = false;
    uint64_t age = 0;                       // Tick age snapshot at open/last modification
};

struct LimitOrderDecreaseQuote {
    uint64_t amount_out_a = 0;
    uint64_t amount_out_b = 0;
    uint64_t reward_a = 0;
    uint64_t reward_b = 0;
};

// =============================================================================
// Positions
// =============================================================================

struct PositionFacade {
    U128 liquidity = 0;
    int32_t tick_lower_index = 0;
    int32_t tick_upper_index = 0;
    U128 fee_growth_checkpoint_a = 0;
    uint64_t fee_owed_a = 0;
    U128 fee_growth_checkpoint_b = 0;
    uint64_t fee_owed_b = 0;
};

enum class PositionStatus : uint8_t {
    PriceInRange,
    PriceBelowRange,
    PriceAboveRange,
    Invalid
};

// Token shares of a position value, both Q64.64 and summing to 1.0
struct PositionRatio {
    U128 ratio_a = 0;
    U128 ratio_b = 0;
};

// =============================================================================
// Token Transfer Fee (token-2022 style)
// =============================================================================

struct TransferFee {
    uint16_t fee_bps = 0;
    uint64_t max_fee = U64_MAX;
};

// =============================================================================
// Quote Results
// =============================================================================

struct ExactInSwapQuote {
    uint64_t token_in = 0;
    uint64_t token_est_out = 0;
    uint64_t token_min_out = 0;
    uint64_t trade_fee = 0;
    U128 next_sqrt_price = 0;
};

struct ExactOutSwapQuote {
    uint64_t token_out = 0;
    uint64_t token_est_in = 0;
    uint64_t token_max_in = 0;
    uint64_t trade_fee = 0;
    U128 next_sqrt_price = 0;
};

struct IncreaseLiquidityQuote {
    U128 liquidity_delta = 0;
    uint64_t token_est_a = 0;
    uint64_t token_est_b = 0;
    uint64_t token_max_a = 0;
    uint64_t token_max_b = 0;
};

struct DecreaseLiquidityQuote {
    U128 liquidity_delta = 0;
    uint64_t token_est_a = 0;
    uint64_t token_est_b = 0;
    uint64_t token_min_a = 0;
    uint64_t token_min_b = 0;
};

struct CollectFeesQuote {
    uint64_t fee_owed_a = 0;
    uint64_t fee_owed_b = 0;
};

// One price bucket of a synthesized order book side
struct OrderBookEntry {
    uint64_t concentrated_amount = 0;
    uint64_t concentrated_amount_quote = 0;
    uint64_t concentrated_total = 0;
    uint64_t concentrated_total_quote = 0;
    uint64_t limit_amount = 0;
    uint64_t limit_amount_quote = 0;
    uint64_t limit_total = 0;
    uint64_t limit_total_quote = 0;
    double price = 0.0;
    bool ask_side = false;                  // Ask side is denominated in token A, bid side in token B
};

} // namespace fusion

#endif // FUSION_TYPES_HPP
