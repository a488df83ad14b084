#ifndef FUSION_SNAPSHOT_HPP
#define FUSION_SNAPSHOT_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "order_book.hpp"
#include "swap.hpp"
#include "types.hpp"

namespace fusion {

// =============================================================================
// Account State Snapshot
// =============================================================================

// Decoded account state a quote is computed against.
// 128-bit values travel as decimal strings; 64-bit values as numbers or strings.
struct Snapshot {
    FusionPoolFacade pool;
    std::vector<TickArrayFacade> tick_arrays;
    std::optional<PositionFacade> position;
    std::optional<LimitOrderFacade> limit_order;
    std::optional<TickFacade> tick;          // Tick holding limit_order
    std::optional<TickFacade> tick_lower;    // Position bounds
    std::optional<TickFacade> tick_upper;
    TransferFee transfer_fee_a;
    TransferFee transfer_fee_b;
};

// Throw std::runtime_error on unreadable or malformed input
Snapshot parse_snapshot(std::string_view content);
Snapshot load_snapshot(std::string_view path);

// =============================================================================
// JSON Conversions (found by nlohmann::json through ADL)
// =============================================================================

void from_json(const nlohmann::json& j, FusionPoolFacade& pool);
void from_json(const nlohmann::json& j, TickFacade& tick);
void from_json(const nlohmann::json& j, TickArrayFacade& tick_array);
void from_json(const nlohmann::json& j, LimitOrderFacade& limit_order);
void from_json(const nlohmann::json& j, PositionFacade& position);
void from_json(const nlohmann::json& j, TransferFee& transfer_fee);
void from_json(const nlohmann::json& j, Snapshot& snapshot);

void to_json(nlohmann::json& j, const FusionPoolFacade& pool);
void to_json(nlohmann::json& j, const TickFacade& tick);
void to_json(nlohmann::json& j, const TickArrayFacade& tick_array);
void to_json(nlohmann::json& j, const LimitOrderFacade& limit_order);
void to_json(nlohmann::json& j, const PositionFacade& position);
void to_json(nlohmann::json& j, const TransferFee& transfer_fee);

void to_json(nlohmann::json& j, const ExactInSwapQuote& quote);
void to_json(nlohmann::json& j, const ExactOutSwapQuote& quote);
void to_json(nlohmann::json& j, const SwapResult& result);
void to_json(nlohmann::json& j, const IncreaseLiquidityQuote& quote);
void to_json(nlohmann::json& j, const DecreaseLiquidityQuote& quote);
void to_json(nlohmann::json& j, const CollectFeesQuote& quote);
void to_json(nlohmann::json& j, const LimitOrderDecreaseQuote& quote);
void to_json(nlohmann::json& j, const PositionRatio& ratio);
void to_json(nlohmann::json& j, const OrderBookEntry& entry);

// Signed 128-bit decimal text
std::string to_string(I128 value);
std::optional<I128> parse_i128(const std::string& text);

} // namespace fusion

#endif // FUSION_SNAPSHOT_HPP
