// Fusion - Snapshot Tests

#include <catch2/catch_test_macros.hpp>
#include <fusion/snapshot.hpp>
#include <fusion/u256.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using namespace fusion;
using json = nlohmann::json;

namespace {

const char* SNAPSHOT = R"({
    "pool": {
        "tickSpacing": 2,
        "feeRate": 3000,
        "clpToOlpRewardRatio": 5000,
        "orderProtocolFeeRate": 100,
        "liquidity": "340282366920938463463374607431768211455",
        "sqrtPrice": "18446744073709551616",
        "tickCurrentIndex": 0,
        "feeGrowthGlobalA": 12345,
        "ordersFilledAmountA": "18446744073709551615",
        "olpFeeOwedB": 500
    },
    "tickArrays": [
        {
            "startTickIndex": 0,
            "ticks": [
                {"initialized": true, "liquidityNet": "-1000", "liquidityGross": "1000"},
                {"initialized": true, "liquidityNet": 250, "age": 3}
            ]
        },
        {
            "startTickIndex": -176,
            "ticks": {
                "87": {"initialized": true, "liquidityNet": "-170141183460469231731687303715884105728",
                       "openOrdersInput": 42}
            }
        }
    ],
    "position": {
        "liquidity": "1000",
        "tickLowerIndex": -10,
        "tickUpperIndex": 10,
        "feeOwedA": 5
    },
    "limitOrder": {"tickIndex": 128, "amount": 50000, "aToB": true, "age": 5},
    "tick": {"age": 6, "partFilledOrdersInput": 200000, "partFilledOrdersRemainingInput": 120000},
    "transferFeeA": {"feeBps": 100, "maxFee": "1000"}
})";

} // namespace

TEST_CASE("Signed 128-bit text", "[snapshot]") {
    const I128 min = -static_cast<I128>((static_cast<U128>(1) << 127) - 1) - 1;
    const I128 max = static_cast<I128>((static_cast<U128>(1) << 127) - 1);

    REQUIRE(to_string(I128{0}) == "0");
    REQUIRE(to_string(I128{-1000}) == "-1000");
    REQUIRE(to_string(min) == "-170141183460469231731687303715884105728");
    REQUIRE(to_string(max) == "170141183460469231731687303715884105727");

    REQUIRE(parse_i128("-1000").value() == -1000);
    REQUIRE(parse_i128(to_string(min)).value() == min);
    REQUIRE(parse_i128(to_string(max)).value() == max);
    REQUIRE_FALSE(parse_i128("170141183460469231731687303715884105728").has_value());
    REQUIRE_FALSE(parse_i128("-170141183460469231731687303715884105729").has_value());
    REQUIRE_FALSE(parse_i128("-").has_value());
    REQUIRE_FALSE(parse_i128("12a").has_value());
}

TEST_CASE("Parse snapshot", "[snapshot]") {
    Snapshot snapshot = parse_snapshot(SNAPSHOT);

    SECTION("Pool") {
        const FusionPoolFacade& pool = snapshot.pool;
        REQUIRE(pool.tick_spacing == 2);
        REQUIRE(pool.fee_rate == 3000);
        REQUIRE(pool.protocol_fee_rate == 0);
        REQUIRE(pool.clp_to_olp_reward_ratio == 5000);
        REQUIRE(pool.order_protocol_fee_rate == 100);
        REQUIRE(pool.liquidity == U128_MAX);
        REQUIRE(pool.sqrt_price == Q64);
        REQUIRE(pool.fee_growth_global_a == 12345);
        REQUIRE(pool.orders_filled_amount_a == U64_MAX);
        REQUIRE(pool.olp_fee_owed_b == 500);
    }

    SECTION("Dense and sparse tick arrays") {
        REQUIRE(snapshot.tick_arrays.size() == 2);

        const TickArrayFacade& dense = snapshot.tick_arrays[0];
        REQUIRE(dense.start_tick_index == 0);
        REQUIRE(dense.ticks[0].initialized);
        REQUIRE(dense.ticks[0].liquidity_net == -1000);
        REQUIRE(dense.ticks[0].liquidity_gross == 1000);
        REQUIRE(dense.ticks[1].liquidity_net == 250);
        REQUIRE(dense.ticks[1].age == 3);
        REQUIRE_FALSE(dense.ticks[2].initialized);

        const TickArrayFacade& sparse = snapshot.tick_arrays[1];
        REQUIRE(sparse.start_tick_index == -176);
        REQUIRE_FALSE(sparse.ticks[0].initialized);
        REQUIRE(sparse.ticks[87].initialized);
        REQUIRE(sparse.ticks[87].liquidity_net == -static_cast<I128>((static_cast<U128>(1) << 127) - 1) - 1);
        REQUIRE(sparse.ticks[87].open_orders_input == 42);
    }

    SECTION("Optional accounts") {
        REQUIRE(snapshot.position.has_value());
        REQUIRE(snapshot.position->liquidity == 1000);
        REQUIRE(snapshot.position->tick_lower_index == -10);
        REQUIRE(snapshot.position->fee_owed_a == 5);

        REQUIRE(snapshot.limit_order.has_value());
        REQUIRE(snapshot.limit_order->a_to_b);
        REQUIRE(snapshot.limit_order->amount == 50000);

        REQUIRE(snapshot.tick.has_value());
        REQUIRE(snapshot.tick->part_filled_orders_remaining_input == 120000);

        REQUIRE_FALSE(snapshot.tick_lower.has_value());
        REQUIRE_FALSE(snapshot.tick_upper.has_value());
    }

    SECTION("Transfer fees") {
        REQUIRE(snapshot.transfer_fee_a.fee_bps == 100);
        REQUIRE(snapshot.transfer_fee_a.max_fee == 1000);
        REQUIRE(snapshot.transfer_fee_b.fee_bps == 0);
        REQUIRE(snapshot.transfer_fee_b.max_fee == U64_MAX);
    }
}

TEST_CASE("Account state JSON round trip", "[snapshot]") {
    Snapshot snapshot = parse_snapshot(SNAPSHOT);

    json pool = snapshot.pool;
    REQUIRE(pool["liquidity"] == "340282366920938463463374607431768211455");
    REQUIRE(pool.get<FusionPoolFacade>().liquidity == snapshot.pool.liquidity);

    json tick_array = snapshot.tick_arrays[1];
    REQUIRE(tick_array["ticks"].size() == TICK_ARRAY_SIZE);
    REQUIRE(tick_array["ticks"][87]["liquidityNet"] == "-170141183460469231731687303715884105728");

    TickArrayFacade parsed = tick_array.get<TickArrayFacade>();
    REQUIRE(parsed.ticks[87].liquidity_net == snapshot.tick_arrays[1].ticks[87].liquidity_net);
}

TEST_CASE("Malformed snapshots", "[snapshot]") {
    REQUIRE_THROWS_AS(parse_snapshot("{"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"liquidity": "-1"}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"liquidity": "340282366920938463463374607431768211456"}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"olpFeeOwedA": "18446744073709551616"}})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"feeRate": "high"}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"tickArrays": [{"startTickIndex": 0, "ticks": {"88": {}}}]})"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"tickArrays": [{"startTickIndex": 0, "ticks": 7}]})"),
                      std::runtime_error);
}

TEST_CASE("Narrow integer fields are range checked", "[snapshot]") {
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"feeRate": 65536}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"tickSpacing": 65538}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"clpToOlpRewardRatio": -1}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"tickCurrentIndex": 2147483648}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"pool": {"feeRate": 3000.5}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"limitOrder": {"tickIndex": -2147483649}})"), std::runtime_error);
    REQUIRE_THROWS_AS(parse_snapshot(R"({"transferFeeA": {"feeBps": 65536}})"), std::runtime_error);

    Snapshot snapshot = parse_snapshot(
        R"({"pool": {"feeRate": 65535, "tickSpacing": 1, "tickCurrentIndex": -443636},
            "tickArrays": [{"startTickIndex": -2147483648}]})");
    REQUIRE(snapshot.pool.fee_rate == 65535);
    REQUIRE(snapshot.pool.tick_spacing == 1);
    REQUIRE(snapshot.pool.tick_current_index == -443636);
    REQUIRE(snapshot.tick_arrays[0].start_tick_index == std::numeric_limits<int32_t>::min());
}

TEST_CASE("Load snapshot from file", "[snapshot]") {
    const auto path = std::filesystem::temp_directory_path() / "fusion_snapshot_test.json";
    {
        std::ofstream file(path);
        file << SNAPSHOT;
    }

    Snapshot snapshot = load_snapshot(path.string());
    REQUIRE(snapshot.pool.fee_rate == 3000);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(load_snapshot("/nonexistent/snapshot.json"), std::runtime_error);
}

TEST_CASE("Quote results as JSON", "[snapshot]") {
    ExactInSwapQuote exact_in{1000, 996, 896, 3, U128{18446560163343826736ULL}};
    json j = exact_in;
    REQUIRE(j["tokenIn"] == 1000);
    REQUIRE(j["tokenEstOut"] == 996);
    REQUIRE(j["tokenMinOut"] == 896);
    REQUIRE(j["tradeFee"] == 3);
    REQUIRE(j["nextSqrtPrice"] == "18446560163343826736");

    IncreaseLiquidityQuote increase;
    increase.liquidity_delta = U128_MAX;
    increase.token_max_a = 1010000;
    json k = increase;
    REQUIRE(k["liquidityDelta"] == "340282366920938463463374607431768211455");
    REQUIRE(k["tokenMaxA"] == 1010000);

    LimitOrderDecreaseQuote decrease{15000, 10190, 0, 62};
    json d = decrease;
    REQUIRE(d["amountOutA"] == 15000);
    REQUIRE(d["rewardB"] == 62);

    OrderBookEntry entry;
    entry.price = 1.01;
    entry.ask_side = true;
    entry.limit_amount = 200000;
    json e = entry;
    REQUIRE(e["price"] == 1.01);
    REQUIRE(e["askSide"] == true);
    REQUIRE(e["limitAmount"] == 200000);
}
