// =============================================================================
// snapshot.cpp - JSON codec for account state and quote results
// =============================================================================

#include "fusion/snapshot.hpp"
#include "fusion/u256.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fusion {

using json = nlohmann::json;

namespace {

U128 read_u128(const json& j, const char* key) {
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        auto parsed = parse_u128(value.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::invalid_argument(std::string("Invalid unsigned 128-bit value: ") + key);
}

I128 read_i128(const json& j, const char* key) {
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        return static_cast<I128>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_string()) {
        auto parsed = parse_i128(value.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::invalid_argument(std::string("Invalid signed 128-bit value: ") + key);
}

uint64_t read_u64(const json& j, const char* key) {
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        auto parsed = parse_u128(value.get<std::string>());
        if (parsed && *parsed <= U64_MAX) return static_cast<uint64_t>(*parsed);
    }
    throw std::invalid_argument(std::string("Invalid unsigned 64-bit value: ") + key);
}

template <typename T>
void read_field(const json& j, const char* key, T& out) {
    if (j.contains(key)) j.at(key).get_to(out);
}

// Narrow integers are range checked; get_to would wrap them
template <typename T>
void read_integer_field(const json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    const json& value = j.at(key);
    if (value.is_number_unsigned()) {
        const uint64_t number = value.get<uint64_t>();
        if (number <= static_cast<uint64_t>(std::numeric_limits<T>::max())) {
            out = static_cast<T>(number);
            return;
        }
    } else if (value.is_number_integer()) {
        const int64_t number = value.get<int64_t>();
        if (number >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
            number <= static_cast<int64_t>(std::numeric_limits<T>::max())) {
            out = static_cast<T>(number);
            return;
        }
    }
    throw std::invalid_argument(std::string("Integer value out of range: ") + key);
}

void read_u128_field(const json& j, const char* key, U128& out) {
    if (j.contains(key)) out = read_u128(j, key);
}

void read_u64_field(const json& j, const char* key, uint64_t& out) {
    if (j.contains(key)) out = read_u64(j, key);
}

} // anonymous namespace

// =============================================================================
// Signed 128-bit Text
// =============================================================================

std::string to_string(I128 value) {
    if (value >= 0) {
        return to_string(static_cast<U128>(value));
    }
    U128 magnitude = static_cast<U128>(-(value + 1)) + 1;
    return "-" + to_string(magnitude);
}

std::optional<I128> parse_i128(const std::string& text) {
    const bool negative = !text.empty() && text[0] == '-';
    auto magnitude = parse_u128(negative ? text.substr(1) : text);
    if (!magnitude) return std::nullopt;

    const U128 limit = static_cast<U128>(1) << 127;
    if (negative) {
        if (*magnitude > limit) return std::nullopt;
        if (*magnitude == limit) return static_cast<I128>(-static_cast<I128>(limit - 1) - 1);
        return -static_cast<I128>(*magnitude);
    }
    if (*magnitude >= limit) return std::nullopt;
    return static_cast<I128>(*magnitude);
}

// =============================================================================
// Account State
// =============================================================================

void from_json(const json& j, FusionPoolFacade& pool) {
    read_integer_field(j, "tickSpacing", pool.tick_spacing);
    read_integer_field(j, "feeRate", pool.fee_rate);
    read_integer_field(j, "protocolFeeRate", pool.protocol_fee_rate);
    read_integer_field(j, "clpToOlpRewardRatio", pool.clp_to_olp_reward_ratio);
    read_integer_field(j, "orderProtocolFeeRate", pool.order_protocol_fee_rate);
    read_u128_field(j, "liquidity", pool.liquidity);
    read_u128_field(j, "sqrtPrice", pool.sqrt_price);
    read_integer_field(j, "tickCurrentIndex", pool.tick_current_index);
    read_u128_field(j, "feeGrowthGlobalA", pool.fee_growth_global_a);
    read_u128_field(j, "feeGrowthGlobalB", pool.fee_growth_global_b);
    read_u64_field(j, "ordersTotalAmountA", pool.orders_total_amount_a);
    read_u64_field(j, "ordersTotalAmountB", pool.orders_total_amount_b);
    read_u64_field(j, "ordersFilledAmountA", pool.orders_filled_amount_a);
    read_u64_field(j, "ordersFilledAmountB", pool.orders_filled_amount_b);
    read_u64_field(j, "olpFeeOwedA", pool.olp_fee_owed_a);
    read_u64_field(j, "olpFeeOwedB", pool.olp_fee_owed_b);
}

void to_json(json& j, const FusionPoolFacade& pool) {
    j = json{
        {"tickSpacing", pool.tick_spacing},
        {"feeRate", pool.fee_rate},
        {"protocolFeeRate", pool.protocol_fee_rate},
        {"clpToOlpRewardRatio", pool.clp_to_olp_reward_ratio},
        {"orderProtocolFeeRate", pool.order_protocol_fee_rate},
        {"liquidity", to_string(pool.liquidity)},
        {"sqrtPrice", to_string(pool.sqrt_price)},
        {"tickCurrentIndex", pool.tick_current_index},
        {"feeGrowthGlobalA", to_string(pool.fee_growth_global_a)},
        {"feeGrowthGlobalB", to_string(pool.fee_growth_global_b)},
        {"ordersTotalAmountA", pool.orders_total_amount_a},
        {"ordersTotalAmountB", pool.orders_total_amount_b},
        {"ordersFilledAmountA", pool.orders_filled_amount_a},
        {"ordersFilledAmountB", pool.orders_filled_amount_b},
        {"olpFeeOwedA", pool.olp_fee_owed_a},
        {"olpFeeOwedB", pool.olp_fee_owed_b}
    };
}

void from_json(const json& j, TickFacade& tick) {
    read_field(j, "initialized", tick.initialized);
    if (j.contains("liquidityNet")) tick.liquidity_net = read_i128(j, "liquidityNet");
    read_u128_field(j, "liquidityGross", tick.liquidity_gross);
    read_u128_field(j, "feeGrowthOutsideA", tick.fee_growth_outside_a);
    read_u128_field(j, "feeGrowthOutsideB", tick.fee_growth_outside_b);
    read_u64_field(j, "age", tick.age);
    read_u64_field(j, "openOrdersInput", tick.open_orders_input);
    read_u64_field(j, "partFilledOrdersInput", tick.part_filled_orders_input);
    read_u64_field(j, "partFilledOrdersRemainingInput", tick.part_filled_orders_remaining_input);
    read_u64_field(j, "fulfilledAToBOrdersInput", tick.fulfilled_a_to_b_orders_input);
    read_u64_field(j, "fulfilledBToAOrdersInput", tick.fulfilled_b_to_a_orders_input);
}

void to_json(json& j, const TickFacade& tick) {
    j = json{
        {"initialized", tick.initialized},
        {"liquidityNet", to_string(tick.liquidity_net)},
        {"liquidityGross", to_string(tick.liquidity_gross)},
        {"feeGrowthOutsideA", to_string(tick.fee_growth_outside_a)},
        {"feeGrowthOutsideB", to_string(tick.fee_growth_outside_b)},
        {"age", tick.age},
        {"openOrdersInput", tick.open_orders_input},
        {"partFilledOrdersInput", tick.part_filled_orders_input},
        {"partFilledOrdersRemainingInput", tick.part_filled_orders_remaining_input},
        {"fulfilledAToBOrdersInput", tick.fulfilled_a_to_b_orders_input},
        {"fulfilledBToAOrdersInput", tick.fulfilled_b_to_a_orders_input}
    };
}

// Ticks may be listed densely (array, missing trailing ticks stay empty) or
// sparsely (object keyed by slot offset)
void from_json(const json& j, TickArrayFacade& tick_array) {
    read_integer_field(j, "startTickIndex", tick_array.start_tick_index);
    if (!j.contains("ticks")) {
        return;
    }

    const json& ticks = j.at("ticks");
    if (ticks.is_array()) {
        if (ticks.size() > TICK_ARRAY_SIZE) {
            throw std::invalid_argument("Tick array holds more than 88 ticks");
        }
        for (size_t i = 0; i < ticks.size(); ++i) {
            ticks[i].get_to(tick_array.ticks[i]);
        }
    } else if (ticks.is_object()) {
        for (auto it = ticks.begin(); it != ticks.end(); ++it) {
            size_t offset = std::stoul(it.key());
            if (offset >= TICK_ARRAY_SIZE) {
                throw std::invalid_argument("Tick offset out of range: " + it.key());
            }
            it.value().get_to(tick_array.ticks[offset]);
        }
    } else {
        throw std::invalid_argument("Tick array ticks must be an array or an object");
    }
}

void to_json(json& j, const TickArrayFacade& tick_array) {
    json ticks = json::array();
    for (const auto& tick : tick_array.ticks) {
        ticks.push_back(tick);
    }
    j = json{{"startTickIndex", tick_array.start_tick_index}, {"ticks", ticks}};
}

void from_json(const json& j, LimitOrderFacade& limit_order) {
    read_integer_field(j, "tickIndex", limit_order.tick_index);
    read_u64_field(j, "amount", limit_order.amount);
    read_field(j, "aToB", limit_order.a_to_b);
    read_u64_field(j, "age", limit_order.age);
}

void to_json(json& j, const LimitOrderFacade& limit_order) {
    j = json{
        {"tickIndex", limit_order.tick_index},
        {"amount", limit_order.amount},
        {"aToB", limit_order.a_to_b},
        {"age", limit_order.age}
    };
}

void from_json(const json& j, PositionFacade& position) {
    read_u128_field(j, "liquidity", position.liquidity);
    read_integer_field(j, "tickLowerIndex", position.tick_lower_index);
    read_integer_field(j, "tickUpperIndex", position.tick_upper_index);
    read_u128_field(j, "feeGrowthCheckpointA", position.fee_growth_checkpoint_a);
    read_u64_field(j, "feeOwedA", position.fee_owed_a);
    read_u128_field(j, "feeGrowthCheckpointB", position.fee_growth_checkpoint_b);
    read_u64_field(j, "feeOwedB", position.fee_owed_b);
}

void to_json(json& j, const PositionFacade& position) {
    j = json{
        {"liquidity", to_string(position.liquidity)},
        {"tickLowerIndex", position.tick_lower_index},
        {"tickUpperIndex", position.tick_upper_index},
        {"feeGrowthCheckpointA", to_string(position.fee_growth_checkpoint_a)},
        {"feeOwedA", position.fee_owed_a},
        {"feeGrowthCheckpointB", to_string(position.fee_growth_checkpoint_b)},
        {"feeOwedB", position.fee_owed_b}
    };
}

void from_json(const json& j, TransferFee& transfer_fee) {
    read_integer_field(j, "feeBps", transfer_fee.fee_bps);
    read_u64_field(j, "maxFee", transfer_fee.max_fee);
}

void to_json(json& j, const TransferFee& transfer_fee) {
    j = json{{"feeBps", transfer_fee.fee_bps}, {"maxFee", transfer_fee.max_fee}};
}

void from_json(const json& j, Snapshot& snapshot) {
    read_field(j, "pool", snapshot.pool);
    read_field(j, "tickArrays", snapshot.tick_arrays);
    if (j.contains("position")) snapshot.position = j.at("position").get<PositionFacade>();
    if (j.contains("limitOrder")) snapshot.limit_order = j.at("limitOrder").get<LimitOrderFacade>();
    if (j.contains("tick")) snapshot.tick = j.at("tick").get<TickFacade>();
    if (j.contains("tickLower")) snapshot.tick_lower = j.at("tickLower").get<TickFacade>();
    if (j.contains("tickUpper")) snapshot.tick_upper = j.at("tickUpper").get<TickFacade>();
    read_field(j, "transferFeeA", snapshot.transfer_fee_a);
    read_field(j, "transferFeeB", snapshot.transfer_fee_b);
}

Snapshot parse_snapshot(std::string_view content) {
    try {
        return json::parse(content.begin(), content.end()).get<Snapshot>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid snapshot: ") + e.what());
    } catch (const std::logic_error& e) {
        // Bad numeric text or tick offsets
        throw std::runtime_error(std::string("Invalid snapshot: ") + e.what());
    }
}

Snapshot load_snapshot(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open snapshot file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_snapshot(buffer.str());
}

// =============================================================================
// Quote Results
// =============================================================================

void to_json(json& j, const ExactInSwapQuote& quote) {
    j = json{
        {"tokenIn", quote.token_in},
        {"tokenEstOut", quote.token_est_out},
        {"tokenMinOut", quote.token_min_out},
        {"tradeFee", quote.trade_fee},
        {"nextSqrtPrice", to_string(quote.next_sqrt_price)}
    };
}

void to_json(json& j, const ExactOutSwapQuote& quote) {
    j = json{
        {"tokenOut", quote.token_out},
        {"tokenEstIn", quote.token_est_in},
        {"tokenMaxIn", quote.token_max_in},
        {"tradeFee", quote.trade_fee},
        {"nextSqrtPrice", to_string(quote.next_sqrt_price)}
    };
}

void to_json(json& j, const SwapResult& result) {
    j = json{
        {"tokenA", result.token_a},
        {"tokenB", result.token_b},
        {"feeAmount", result.fee_amount},
        {"nextSqrtPrice", to_string(result.next_sqrt_price)}
    };
}

void to_json(json& j, const IncreaseLiquidityQuote& quote) {
    j = json{
        {"liquidityDelta", to_string(quote.liquidity_delta)},
        {"tokenEstA", quote.token_est_a},
        {"tokenEstB", quote.token_est_b},
        {"tokenMaxA", quote.token_max_a},
        {"tokenMaxB", quote.token_max_b}
    };
}

void to_json(json& j, const DecreaseLiquidityQuote& quote) {
    j = json{
        {"liquidityDelta", to_string(quote.liquidity_delta)},
        {"tokenEstA", quote.token_est_a},
        {"tokenEstB", quote.token_est_b},
        {"tokenMinA", quote.token_min_a},
        {"tokenMinB", quote.token_min_b}
    };
}

void to_json(json& j, const CollectFeesQuote& quote) {
    j = json{{"feeOwedA", quote.fee_owed_a}, {"feeOwedB", quote.fee_owed_b}};
}

void to_json(json& j, const LimitOrderDecreaseQuote& quote) {
    j = json{
        {"amountOutA", quote.amount_out_a},
        {"amountOutB", quote.amount_out_b},
        {"rewardA", quote.reward_a},
        {"rewardB", quote.reward_b}
    };
}

void to_json(json& j, const PositionRatio& ratio) {
    j = json{{"ratioA", to_string(ratio.ratio_a)}, {"ratioB", to_string(ratio.ratio_b)}};
}

void to_json(json& j, const OrderBookEntry& entry) {
    j = json{
        {"price", entry.price},
        {"askSide", entry.ask_side},
        {"concentratedAmount", entry.concentrated_amount},
        {"concentratedAmountQuote", entry.concentrated_amount_quote},
        {"concentratedTotal", entry.concentrated_total},
        {"concentratedTotalQuote", entry.concentrated_total_quote},
        {"limitAmount", entry.limit_amount},
        {"limitAmountQuote", entry.limit_amount_quote},
        {"limitTotal", entry.limit_total},
        {"limitTotalQuote", entry.limit_total_quote}
    };
}

} // namespace fusion
