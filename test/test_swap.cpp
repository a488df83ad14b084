// Fusion - Swap Tests

#include <catch2/catch_test_macros.hpp>
#include <fusion/swap.hpp>
#include <fusion/tick_math.hpp>

#include <vector>

using namespace fusion;

namespace {

FusionPoolFacade test_pool(U128 sqrt_price, bool sufficient_liquidity) {
    FusionPoolFacade pool;
    pool.sqrt_price = sqrt_price;
    pool.tick_current_index = tick_math::sqrt_price_to_tick_index(sqrt_price);
    pool.fee_rate = 3000;
    pool.tick_spacing = 2;
    pool.liquidity = sufficient_liquidity ? 100000000 : 265000;
    return pool;
}

// Pool holding no concentrated liquidity, only resting orders
FusionPoolFacade order_pool(U128 sqrt_price) {
    FusionPoolFacade pool;
    pool.sqrt_price = sqrt_price;
    pool.tick_current_index = tick_math::sqrt_price_to_tick_index(sqrt_price);
    pool.fee_rate = 10000;
    pool.tick_spacing = 2;
    pool.liquidity = 0;
    return pool;
}

TickArrayFacade tick_array(int32_t start_tick_index, I128 liquidity_net, uint64_t resting_input) {
    TickArrayFacade array;
    array.start_tick_index = start_tick_index;
    for (auto& tick : array.ticks) {
        tick.initialized = true;
        tick.liquidity_net = liquidity_net;
        tick.part_filled_orders_input = resting_input;
        tick.part_filled_orders_remaining_input = resting_input;
    }
    return array;
}

// Liquidity drops by 1000 per tick moving away from the current price in either direction
std::vector<TickArrayFacade> test_tick_arrays() {
    std::vector<TickArrayFacade> arrays;
    for (int32_t start : {0, 176, 352, -176, -352}) {
        arrays.push_back(tick_array(start, start < 0 ? 1000 : -1000, 0));
    }
    return arrays;
}

std::vector<TickArrayFacade> order_tick_arrays() {
    std::vector<TickArrayFacade> arrays;
    for (int32_t start : {0, 176, 352, -176, -352}) {
        arrays.push_back(tick_array(start, 0, 10000));
    }
    return arrays;
}

void require_quote(const Result<ExactInSwapQuote>& quote, uint64_t token_in, uint64_t est_out,
                   uint64_t min_out, uint64_t fee, U128 next_sqrt_price) {
    REQUIRE(quote.ok());
    CHECK(quote->token_in == token_in);
    CHECK(quote->token_est_out == est_out);
    CHECK(quote->token_min_out == min_out);
    CHECK(quote->trade_fee == fee);
    CHECK(quote->next_sqrt_price == next_sqrt_price);
}

void require_quote(const Result<ExactOutSwapQuote>& quote, uint64_t token_out, uint64_t est_in,
                   uint64_t max_in, uint64_t fee, U128 next_sqrt_price) {
    REQUIRE(quote.ok());
    CHECK(quote->token_out == token_out);
    CHECK(quote->token_est_in == est_in);
    CHECK(quote->token_max_in == max_in);
    CHECK(quote->trade_fee == fee);
    CHECK(quote->next_sqrt_price == next_sqrt_price);
}

} // namespace

TEST_CASE("Exact input swap over concentrated liquidity", "[swap]") {
    SECTION("a to b, sufficient liquidity") {
        auto quote = swap_quote_by_input_token(1000, true, 1000, test_pool(Q64, true), test_tick_arrays());
        require_quote(quote, 1000, 996, 896, 3, U128{18446560163343826736ULL});
    }

    SECTION("a to b, crossing ticks") {
        auto quote = swap_quote_by_input_token(1000, true, 1000, test_pool(Q64, false), test_tick_arrays());
        require_quote(quote, 1000, 920, 828, 38, U128{18376782954535863426ULL});
    }

    SECTION("b to a, sufficient liquidity") {
        auto quote = swap_quote_by_input_token(1000, false, 1000, test_pool(Q64, true), test_tick_arrays());
        require_quote(quote, 1000, 996, 896, 3, u128(0x1ULL, 0x0000a744d2edce24ULL));
    }

    SECTION("b to a, crossing ticks") {
        auto quote = swap_quote_by_input_token(1000, false, 1000, test_pool(Q64, false), test_tick_arrays());
        require_quote(quote, 1000, 918, 826, 39, u128(0x1ULL, 0x00fa5d3b4a91b5a5ULL));
    }
}

TEST_CASE("Exact output swap over concentrated liquidity", "[swap]") {
    SECTION("Buy b, sufficient liquidity") {
        auto quote = swap_quote_by_output_token(1000, false, 1000, test_pool(Q64, true), test_tick_arrays());
        require_quote(quote, 1000, 1005, 1106, 4, U128{18446559608113470481ULL});
    }

    SECTION("Buy b, crossing ticks") {
        auto quote = swap_quote_by_output_token(1000, false, 1000, test_pool(Q64, false), test_tick_arrays());
        require_quote(quote, 1000, 1088, 1197, 42, U128{18370123224663708854ULL});
    }

    SECTION("Buy a, sufficient liquidity") {
        auto quote = swap_quote_by_output_token(1000, true, 1000, test_pool(Q64, true), test_tick_arrays());
        require_quote(quote, 1000, 1005, 1106, 4, u128(0x1ULL, 0x0000a7c61a3ae2beULL));
    }

    SECTION("Buy a, crossing ticks") {
        auto quote = swap_quote_by_output_token(1000, true, 1000, test_pool(Q64, false), test_tick_arrays());
        require_quote(quote, 1000, 1088, 1197, 42, u128(0x1ULL, 0x01128bb76c16d2eeULL));
    }
}

TEST_CASE("Swap filling resting limit orders", "[swap]") {
    SECTION("Sell a") {
        auto quote = swap_quote_by_input_token(85000, true, 1000, order_pool(Q64), order_tick_arrays());
        require_quote(quote, 85000, 84072, 75664, 858, U128{18431993317065449817ULL});
    }

    SECTION("Buy b") {
        auto quote = swap_quote_by_output_token(85000, false, 1000, order_pool(Q64), order_tick_arrays());
        require_quote(quote, 85000, 85939, 94533, 867, U128{18431993317065449817ULL});
    }

    SECTION("Sell b") {
        auto quote = swap_quote_by_input_token(85000, false, 1000, order_pool(Q64), order_tick_arrays());
        require_quote(quote, 85000, 84054, 75648, 858, u128(0x1ULL, 0x003b01891d8ea6b6ULL));
    }

    SECTION("Buy a") {
        auto quote = swap_quote_by_output_token(85000, true, 1000, order_pool(Q64), order_tick_arrays());
        require_quote(quote, 85000, 85957, 94553, 867, u128(0x1ULL, 0x003b01891d8ea6b6ULL));
    }
}

TEST_CASE("Swap running past the supplied tick arrays", "[swap]") {
    auto fits = swap_quote_by_input_token(3428, true, 0, test_pool(Q64, false), test_tick_arrays());
    require_quote(fits, 3428, 3032, 3032, 176, U128{18124937670847186632ULL});

    auto exhausted = swap_quote_by_input_token(3429, true, 0, test_pool(Q64, false), test_tick_arrays());
    REQUIRE_FALSE(exhausted.ok());
    REQUIRE(exhausted.error() == Error::INVALID_TICK_ARRAY_SEQUENCE);
}

TEST_CASE("Swap input validation", "[swap]") {
    const FusionPoolFacade pool = test_pool(Q64, true);
    auto sequence = TickArraySequence::create(test_tick_arrays(), pool.tick_spacing);
    REQUIRE(sequence.ok());

    SECTION("Zero amount") {
        REQUIRE(compute_swap(0, 0, pool, *sequence, true, true).error() == Error::ZERO_TRADABLE_AMOUNT);
    }

    SECTION("Limit outside the protocol bounds") {
        REQUIRE(compute_swap(1000, MIN_SQRT_PRICE - 1, pool, *sequence, true, true).error() ==
                Error::SQRT_PRICE_LIMIT_OUT_OF_BOUNDS);
        REQUIRE(compute_swap(1000, MAX_SQRT_PRICE + 1, pool, *sequence, false, true).error() ==
                Error::SQRT_PRICE_LIMIT_OUT_OF_BOUNDS);
    }

    SECTION("Limit on the wrong side of the price") {
        REQUIRE(compute_swap(1000, Q64 + 1, pool, *sequence, true, true).error() ==
                Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION);
        REQUIRE(compute_swap(1000, Q64 - 1, pool, *sequence, false, true).error() ==
                Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION);
        REQUIRE(compute_swap(1000, Q64, pool, *sequence, true, true).error() ==
                Error::INVALID_SQRT_PRICE_LIMIT_DIRECTION);
    }

    SECTION("Invalid slippage tolerance") {
        REQUIRE(swap_quote_by_input_token(1000, true, 10001, pool, test_tick_arrays()).error() ==
                Error::INVALID_SLIPPAGE_TOLERANCE);
    }

    SECTION("Empty tick arrays") {
        REQUIRE(swap_quote_by_input_token(1000, true, 100, pool, {}).error() == Error::TICK_SEQUENCE_EMPTY);
    }
}

TEST_CASE("Swap stops at the price limit", "[swap]") {
    const FusionPoolFacade pool = test_pool(Q64, true);
    auto sequence = TickArraySequence::create(test_tick_arrays(), pool.tick_spacing);
    REQUIRE(sequence.ok());

    const U128 limit = tick_math::tick_index_to_sqrt_price(-1);
    auto swap = compute_swap(1000000, limit, pool, *sequence, true, true);
    REQUIRE(swap.ok());
    REQUIRE(swap->next_sqrt_price == limit);
    REQUIRE(swap->token_a < 1000000);
    REQUIRE(swap->token_b > 0);
}

TEST_CASE("Swap amounts are conserved", "[swap]") {
    auto sequence = TickArraySequence::create(test_tick_arrays(), 2);
    REQUIRE(sequence.ok());

    for (bool a_to_b : {true, false}) {
        for (uint64_t amount : {1ULL, 10ULL, 999ULL, 2500ULL}) {
            auto swap = compute_swap(amount, 0, test_pool(Q64, false), *sequence, a_to_b, true);
            REQUIRE(swap.ok());
            // Exact input is consumed entirely, fee included
            const uint64_t consumed = a_to_b ? swap->token_a : swap->token_b;
            REQUIRE(consumed == amount);
            REQUIRE(swap->fee_amount <= amount);
        }
    }
}

TEST_CASE("Liquidity crossing", "[swap]") {
    TickFacade tick;
    tick.liquidity_net = 1000;

    REQUIRE(get_next_liquidity(5000, &tick, false).value() == 6000);
    REQUIRE(get_next_liquidity(5000, &tick, true).value() == 4000);
    REQUIRE(get_next_liquidity(5000, nullptr, true).value() == 5000);

    tick.liquidity_net = -1000;
    REQUIRE(get_next_liquidity(5000, &tick, false).value() == 4000);
    REQUIRE(get_next_liquidity(500, &tick, false).error() == Error::ARITHMETIC_OVERFLOW);
    REQUIRE(get_next_liquidity(U128_MAX, &tick, true).error() == Error::ARITHMETIC_OVERFLOW);
}
