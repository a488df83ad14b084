// Fusion - Liquidity Quote Tests

#include <catch2/catch_test_macros.hpp>
#include <fusion/liquidity.hpp>
#include <fusion/tick_math.hpp>

using namespace fusion;

TEST_CASE("Liquidity from token amounts", "[liquidity]") {
    const U128 lower = tick_math::tick_index_to_sqrt_price(-100);
    const U128 upper = tick_math::tick_index_to_sqrt_price(100);

    REQUIRE(try_get_liquidity_from_a(1000000, Q64, upper).value() == 200510416);
    REQUIRE(try_get_liquidity_from_a(1000000, upper, Q64).value() == 200510416);
    REQUIRE(try_get_liquidity_from_b(1000000, lower, Q64).value() == 200510416);

    SECTION("Degenerate inputs give no liquidity") {
        REQUIRE(try_get_liquidity_from_a(0, lower, upper).value() == 0);
        REQUIRE(try_get_liquidity_from_a(1000, upper, upper).value() == 0);
        REQUIRE(try_get_liquidity_from_b(0, lower, upper).value() == 0);
        REQUIRE(try_get_liquidity_from_b(1000, lower, lower).value() == 0);
    }
}

TEST_CASE("Token estimates from liquidity", "[liquidity]") {
    const U128 lower = tick_math::tick_index_to_sqrt_price(-100);
    const U128 upper = tick_math::tick_index_to_sqrt_price(100);

    auto rounded_up = try_get_token_estimates_from_liquidity(200510416, Q64, lower, upper, true);
    REQUIRE(rounded_up.ok());
    REQUIRE(rounded_up->first == 1000000);
    REQUIRE(rounded_up->second == 1000000);

    auto rounded_down = try_get_token_estimates_from_liquidity(200510416, Q64, lower, upper, false);
    REQUIRE(rounded_down.ok());
    REQUIRE(rounded_down->first == 999999);
    REQUIRE(rounded_down->second == 999999);

    auto below = try_get_token_estimates_from_liquidity(200510416, lower, lower, upper, true);
    REQUIRE(below.ok());
    REQUIRE(below->second == 0);

    auto above = try_get_token_estimates_from_liquidity(200510416, upper, lower, upper, true);
    REQUIRE(above.ok());
    REQUIRE(above->first == 0);

    auto none = try_get_token_estimates_from_liquidity(0, Q64, lower, upper, true);
    REQUIRE(none.ok());
    REQUIRE(none->first == 0);
    REQUIRE(none->second == 0);
}

TEST_CASE("Increase liquidity quote", "[liquidity]") {
    SECTION("Token A below the range") {
        auto quote = increase_liquidity_quote_a(1000000, 0, Q64, 150, 300);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 134848152);
        REQUIRE(quote->token_est_a == 1000000);
        REQUIRE(quote->token_est_b == 0);
    }

    SECTION("Token B above the range") {
        auto quote = increase_liquidity_quote_b(1000000, 0, Q64, -300, -150);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 134848152);
        REQUIRE(quote->token_est_a == 0);
        REQUIRE(quote->token_est_b == 1000000);
    }

    SECTION("Token A with the price in range") {
        auto quote = increase_liquidity_quote_a(1000000, 100, Q64, -100, 100);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 200510416);
        REQUIRE(quote->token_est_a == 1000000);
        REQUIRE(quote->token_est_b == 1000000);
        REQUIRE(quote->token_max_a == 1010000);
        REQUIRE(quote->token_max_b == 1010000);
    }

    SECTION("Token on the wrong side of the range") {
        auto quote = increase_liquidity_quote_a(1000000, 0, Q64, -300, -150);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 0);
        REQUIRE(quote->token_est_a == 0);
        REQUIRE(quote->token_est_b == 0);
    }

    SECTION("Transfer fee") {
        auto quote = increase_liquidity_quote_a(1000000, 100, Q64, -100, 100,
                                                TransferFee{100, U64_MAX}, TransferFee{100, U64_MAX});
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 198505312);
        REQUIRE(quote->token_est_a == 1000000);
        REQUIRE(quote->token_est_b == 1000000);
        REQUIRE(quote->token_max_a == 1010000);
        REQUIRE(quote->token_max_b == 1010000);
    }

    SECTION("Invalid slippage tolerance") {
        REQUIRE(increase_liquidity_quote(1000, 10001, Q64, -100, 100).error() == Error::INVALID_SLIPPAGE_TOLERANCE);
    }
}

TEST_CASE("Decrease liquidity quote", "[liquidity]") {
    SECTION("By liquidity") {
        auto quote = decrease_liquidity_quote(200510416, 100, Q64, -100, 100);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 200510416);
        REQUIRE(quote->token_est_a == 999999);
        REQUIRE(quote->token_est_b == 999999);
        REQUIRE(quote->token_min_a == 989999);
        REQUIRE(quote->token_min_b == 989999);
    }

    SECTION("By token A") {
        auto quote = decrease_liquidity_quote_a(1000000, 100, Q64, -100, 100);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 200510416);
        REQUIRE(quote->token_est_a == 999999);
    }

    SECTION("By token B") {
        auto quote = decrease_liquidity_quote_b(1000000, 0, Q64, -300, -150);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 134848152);
        REQUIRE(quote->token_est_a == 0);
        REQUIRE(quote->token_est_b == 999999);
    }

    SECTION("Zero amount") {
        auto quote = decrease_liquidity_quote_a(0, 100, Q64, -100, 100);
        REQUIRE(quote.ok());
        REQUIRE(quote->liquidity_delta == 0);
        REQUIRE(quote->token_est_a == 0);
        REQUIRE(quote->token_min_b == 0);
    }
}
