// =============================================================================
// config.cpp - Quote settings loaded from JSON
// =============================================================================

#include "fusion/config.hpp"
#include "fusion/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace fusion {

using json = nlohmann::json;

const char* to_string(NativeMintWrappingStrategy strategy) {
    switch (strategy) {
        case NativeMintWrappingStrategy::Keypair: return "keypair";
        case NativeMintWrappingStrategy::Seed: return "seed";
        case NativeMintWrappingStrategy::Ata: return "ata";
        case NativeMintWrappingStrategy::None: return "none";
    }
    return "unknown";
}

NativeMintWrappingStrategy parse_wrapping_strategy(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "keypair") return NativeMintWrappingStrategy::Keypair;
    if (lower == "seed") return NativeMintWrappingStrategy::Seed;
    if (lower == "ata") return NativeMintWrappingStrategy::Ata;
    if (lower == "none") return NativeMintWrappingStrategy::None;
    throw std::invalid_argument("Unknown wrapping strategy: " + std::string(text));
}

Config& Config::reset() {
    slippage_tolerance_bps = DEFAULT_SLIPPAGE_TOLERANCE_BPS;
    funder = DEFAULT_FUNDER;
    wrapping_strategy = DEFAULT_WRAPPING_STRATEGY;
    return *this;
}

Result<bool> Config::validate() const {
    if (slippage_tolerance_bps > fees::BPS_DENOMINATOR) {
        return Error::INVALID_SLIPPAGE_TOLERANCE;
    }
    return true;
}

Config Config::from_json(std::string_view content) {
    Config config;
    try {
        json j = json::parse(content.begin(), content.end());
        if (j.contains("slippageToleranceBps")) {
            const json& bps = j.at("slippageToleranceBps");
            if (!bps.is_number_unsigned() || bps.get<uint64_t>() > std::numeric_limits<uint16_t>::max()) {
                throw std::invalid_argument("slippageToleranceBps must be an integer in [0, 65535]");
            }
            config.slippage_tolerance_bps = static_cast<uint16_t>(bps.get<uint64_t>());
        }
        if (j.contains("funder")) {
            config.funder = j.at("funder").get<std::string>();
        }
        if (j.contains("wrappingStrategy")) {
            config.wrapping_strategy = parse_wrapping_strategy(j.at("wrappingStrategy").get<std::string>());
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid config: ") + e.what());
    }
    return config;
}

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json(buffer.str());
}

std::string Config::to_json() const {
    json j = {
        {"slippageToleranceBps", slippage_tolerance_bps},
        {"funder", funder},
        {"wrappingStrategy", to_string(wrapping_strategy)}
    };
    return j.dump();
}

} // namespace fusion
