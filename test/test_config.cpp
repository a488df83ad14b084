// Fusion - Config Tests

#include <catch2/catch_test_macros.hpp>
#include <fusion/config.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace fusion;

TEST_CASE("Config defaults", "[config]") {
    Config config;
    REQUIRE(config.slippage_tolerance_bps == 100);
    REQUIRE(config.funder == "11111111111111111111111111111111");
    REQUIRE(config.wrapping_strategy == NativeMintWrappingStrategy::Keypair);
    REQUIRE(config.validate().ok());
}

TEST_CASE("Config builders and reset", "[config]") {
    Config config;
    config.with_slippage_tolerance_bps(250)
          .with_funder("9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin")
          .with_wrapping_strategy(NativeMintWrappingStrategy::Ata);

    REQUIRE(config.slippage_tolerance_bps == 250);
    REQUIRE(config.funder == "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin");
    REQUIRE(config.wrapping_strategy == NativeMintWrappingStrategy::Ata);

    config.reset();
    REQUIRE(config.slippage_tolerance_bps == Config::DEFAULT_SLIPPAGE_TOLERANCE_BPS);
    REQUIRE(config.funder == Config::DEFAULT_FUNDER);
    REQUIRE(config.wrapping_strategy == Config::DEFAULT_WRAPPING_STRATEGY);
}

TEST_CASE("Config validation", "[config]") {
    REQUIRE(Config{}.with_slippage_tolerance_bps(10000).validate().ok());

    auto result = Config{}.with_slippage_tolerance_bps(10001).validate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error() == Error::INVALID_SLIPPAGE_TOLERANCE);
}

TEST_CASE("Wrapping strategy names", "[config]") {
    REQUIRE(parse_wrapping_strategy("keypair") == NativeMintWrappingStrategy::Keypair);
    REQUIRE(parse_wrapping_strategy("Seed") == NativeMintWrappingStrategy::Seed);
    REQUIRE(parse_wrapping_strategy("ATA") == NativeMintWrappingStrategy::Ata);
    REQUIRE(parse_wrapping_strategy("none") == NativeMintWrappingStrategy::None);
    REQUIRE_THROWS_AS(parse_wrapping_strategy("wrapped"), std::invalid_argument);

    for (auto strategy : {NativeMintWrappingStrategy::Keypair, NativeMintWrappingStrategy::Seed,
                          NativeMintWrappingStrategy::Ata, NativeMintWrappingStrategy::None}) {
        REQUIRE(parse_wrapping_strategy(to_string(strategy)) == strategy);
    }
}

TEST_CASE("Config from JSON", "[config]") {
    SECTION("All keys") {
        Config config = Config::from_json(R"({
            "slippageToleranceBps": 50,
            "funder": "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin",
            "wrappingStrategy": "seed"
        })");
        REQUIRE(config.slippage_tolerance_bps == 50);
        REQUIRE(config.funder == "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin");
        REQUIRE(config.wrapping_strategy == NativeMintWrappingStrategy::Seed);
    }

    SECTION("Missing keys keep defaults, unknown keys are ignored") {
        Config config = Config::from_json(R"({"slippageToleranceBps": 30, "rpcUrl": "http://localhost"})");
        REQUIRE(config.slippage_tolerance_bps == 30);
        REQUIRE(config.funder == Config::DEFAULT_FUNDER);
        REQUIRE(config.wrapping_strategy == Config::DEFAULT_WRAPPING_STRATEGY);
    }

    SECTION("Malformed input") {
        REQUIRE_THROWS_AS(Config::from_json("{"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"slippageToleranceBps": "high"})"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"wrappingStrategy": "wrapped"})"), std::runtime_error);
    }

    SECTION("Slippage outside 16 bits is rejected, not wrapped") {
        REQUIRE_THROWS_AS(Config::from_json(R"({"slippageToleranceBps": 70000})"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"slippageToleranceBps": -1})"), std::runtime_error);
        REQUIRE_THROWS_AS(Config::from_json(R"({"slippageToleranceBps": 2.5})"), std::runtime_error);

        Config widest = Config::from_json(R"({"slippageToleranceBps": 65535})");
        REQUIRE(widest.slippage_tolerance_bps == 65535);
        REQUIRE(widest.validate().error() == Error::INVALID_SLIPPAGE_TOLERANCE);
    }
}

TEST_CASE("Config JSON round trip", "[config]") {
    Config config;
    config.with_slippage_tolerance_bps(75).with_wrapping_strategy(NativeMintWrappingStrategy::None);

    auto j = nlohmann::json::parse(config.to_json());
    REQUIRE(j["slippageToleranceBps"] == 75);
    REQUIRE(j["wrappingStrategy"] == "none");

    Config parsed = Config::from_json(config.to_json());
    REQUIRE(parsed.slippage_tolerance_bps == 75);
    REQUIRE(parsed.funder == config.funder);
    REQUIRE(parsed.wrapping_strategy == NativeMintWrappingStrategy::None);
}

TEST_CASE("Config from file", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "fusion_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"slippageToleranceBps": 20, "wrappingStrategy": "ata"})";
    }

    Config config = Config::from_file(path.string());
    REQUIRE(config.slippage_tolerance_bps == 20);
    REQUIRE(config.wrapping_strategy == NativeMintWrappingStrategy::Ata);
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(Config::from_file("/nonexistent/fusion.json"), std::runtime_error);
}
