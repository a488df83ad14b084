// Fusion - Tick Math Tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fusion/tick_math.hpp>

using namespace fusion;
using namespace fusion::tick_math;
using Catch::Approx;

TEST_CASE("Tick index to sqrt price", "[tick_math]") {
    SECTION("Reference values") {
        REQUIRE(tick_index_to_sqrt_price(0) == Q64);
        REQUIRE(tick_index_to_sqrt_price(1) == u128(0x1ULL, 0x000346d6ff11672aULL));
        REQUIRE(tick_index_to_sqrt_price(-1) == U128{18445821805675392311ULL});
        REQUIRE(tick_index_to_sqrt_price(-16) == U128{18431993317065449817ULL});
        REQUIRE(tick_index_to_sqrt_price(-100) == U128{18354745142194483561ULL});
        REQUIRE(tick_index_to_sqrt_price(100) == u128(0x1ULL, 0x01487bee1c17ddb4ULL));
    }

    SECTION("Protocol bounds") {
        REQUIRE(tick_index_to_sqrt_price(MIN_TICK_INDEX) == MIN_SQRT_PRICE);
        REQUIRE(tick_index_to_sqrt_price(MAX_TICK_INDEX) == MAX_SQRT_PRICE);
        REQUIRE(tick_index_to_sqrt_price(MIN_TICK_INDEX + 1) == U128{4295262763ULL});
        REQUIRE(tick_index_to_sqrt_price(MAX_TICK_INDEX - 1) == u128(0xfffb7de8ULL, 0xfc4aab4bd0ec8700ULL));
    }
}

TEST_CASE("Sqrt price to tick index", "[tick_math]") {
    REQUIRE(sqrt_price_to_tick_index(Q64) == 0);
    REQUIRE(sqrt_price_to_tick_index(Q64 - 1) == -1);
    REQUIRE(sqrt_price_to_tick_index(MIN_SQRT_PRICE) == MIN_TICK_INDEX);
    REQUIRE(sqrt_price_to_tick_index(MIN_SQRT_PRICE + 1) == MIN_TICK_INDEX);
    REQUIRE(sqrt_price_to_tick_index(MAX_SQRT_PRICE) == MAX_TICK_INDEX);
    REQUIRE(sqrt_price_to_tick_index(U128{18354745142194483561ULL}) == -100);
    REQUIRE(sqrt_price_to_tick_index(U128{18354745142194483562ULL}) == -100);
    REQUIRE(sqrt_price_to_tick_index(U128{18354745142194483560ULL}) == -101);
}

TEST_CASE("Tick conversions round trip and increase monotonically", "[tick_math]") {
    U128 previous = 0;
    for (int32_t tick = MIN_TICK_INDEX; tick <= MAX_TICK_INDEX; ++tick) {
        U128 sqrt_price = tick_index_to_sqrt_price(tick);
        REQUIRE(sqrt_price > previous);
        REQUIRE(sqrt_price_to_tick_index(sqrt_price) == tick);
        if (tick < MAX_TICK_INDEX) {
            // Just below the next tick still belongs to this one
            REQUIRE(sqrt_price_to_tick_index(tick_index_to_sqrt_price(tick + 1) - 1) == tick);
        }
        previous = sqrt_price;
    }
}

TEST_CASE("Zero sqrt price has no tick", "[tick_math]") {
    REQUIRE_THROWS_AS(sqrt_price_to_tick_index(0), std::domain_error);
}

TEST_CASE("Bounds and inversion", "[tick_math]") {
    REQUIRE(is_tick_index_in_bounds(MIN_TICK_INDEX));
    REQUIRE(is_tick_index_in_bounds(MAX_TICK_INDEX));
    REQUIRE_FALSE(is_tick_index_in_bounds(MAX_TICK_INDEX + 1));
    REQUIRE_FALSE(is_tick_index_in_bounds(MIN_TICK_INDEX - 1));

    REQUIRE(is_sqrt_price_in_bounds(MIN_SQRT_PRICE));
    REQUIRE(is_sqrt_price_in_bounds(MAX_SQRT_PRICE));
    REQUIRE_FALSE(is_sqrt_price_in_bounds(MIN_SQRT_PRICE - 1));
    REQUIRE_FALSE(is_sqrt_price_in_bounds(MAX_SQRT_PRICE + 1));

    REQUIRE(invert_tick_index(100) == -100);
    REQUIRE(invert_sqrt_price(u128(0x1ULL, 0x01487bee1c17ddb4ULL)) == U128{18354745142194483561ULL});
}

TEST_CASE("Tick grid helpers", "[tick_math]") {
    SECTION("Tick array start") {
        REQUIRE(get_tick_array_start_tick_index(0, 2) == 0);
        REQUIRE(get_tick_array_start_tick_index(175, 2) == 0);
        REQUIRE(get_tick_array_start_tick_index(176, 2) == 176);
        REQUIRE(get_tick_array_start_tick_index(-1, 2) == -176);
        REQUIRE(get_tick_array_start_tick_index(-176, 2) == -176);
        REQUIRE(get_tick_array_start_tick_index(-177, 2) == -352);
        REQUIRE(get_tick_array_start_tick_index(1000, 64) == 0);
        REQUIRE(get_tick_array_start_tick_index(-1000, 64) == -5632);
    }

    SECTION("Initializable tick rounding") {
        REQUIRE(get_initializable_tick_index(7, 10) == 10);
        REQUIRE(get_initializable_tick_index(5, 10) == 10);
        REQUIRE(get_initializable_tick_index(4, 10) == 0);
        REQUIRE(get_initializable_tick_index(-4, 10) == 0);
        REQUIRE(get_initializable_tick_index(-6, 10) == -10);
        REQUIRE(get_initializable_tick_index(7, 10, false) == 0);
        REQUIRE(get_initializable_tick_index(1, 10, true) == 10);
        REQUIRE(get_initializable_tick_index(10, 10, true) == 10);
        REQUIRE(get_initializable_tick_index(-7, 10, false) == -10);
    }

    SECTION("Previous and next initializable") {
        REQUIRE(get_prev_initializable_tick_index(10, 10) == 0);
        REQUIRE(get_prev_initializable_tick_index(9, 10) == 0);
        REQUIRE(get_prev_initializable_tick_index(-1, 10) == -10);
        REQUIRE(get_next_initializable_tick_index(0, 10) == 10);
        REQUIRE(get_next_initializable_tick_index(-1, 10) == 0);
        REQUIRE(get_next_initializable_tick_index(-10, 10) == 0);
        REQUIRE(is_tick_initializable(-20, 10));
        REQUIRE_FALSE(is_tick_initializable(-21, 10));
    }

    SECTION("Offset inside a tick array") {
        REQUIRE(get_tick_index_in_array(0, 0, 2).value() == 0);
        REQUIRE(get_tick_index_in_array(174, 0, 2).value() == 87);
        REQUIRE(get_tick_index_in_array(-2, -176, 2).value() == 87);

        auto outside = get_tick_index_in_array(176, 0, 2);
        REQUIRE_FALSE(outside.ok());
        REQUIRE(outside.error() == Error::TICK_INDEX_NOT_IN_ARRAY);
        REQUIRE(get_tick_index_in_array(-1, 0, 2).error() == Error::TICK_INDEX_NOT_IN_ARRAY);
    }

    SECTION("Ranges") {
        TickRange full = get_full_range_tick_indexes(128);
        REQUIRE(full.tick_lower_index == -443520);
        REQUIRE(full.tick_upper_index == 443520);

        TickRange ordered = order_tick_indexes(100, -100);
        REQUIRE(ordered.tick_lower_index == -100);
        REQUIRE(ordered.tick_upper_index == 100);

        REQUIRE(is_full_range_only(32768));
        REQUIRE_FALSE(is_full_range_only(128));
    }
}

TEST_CASE("Decimal adjusted prices", "[tick_math]") {
    REQUIRE(price_to_sqrt_price(1.0, 6, 6) == Q64);
    REQUIRE(price_to_sqrt_price(100.0, 8, 6) == Q64);
    REQUIRE(sqrt_price_to_price(Q64, 6, 6) == 1.0);
    REQUIRE(sqrt_price_to_price(Q64, 8, 6) == Approx(100.0));
    REQUIRE(price_to_tick_index(2.0, 1, 1) == 6931);
    REQUIRE(tick_index_to_price(6931, 1, 1) == Approx(1.999836340196928));
    REQUIRE(tick_index_to_price(0, 6, 6) == 1.0);
    REQUIRE(invert_price(tick_index_to_price(100, 6, 6), 6, 6) == Approx(tick_index_to_price(-100, 6, 6)));
}
