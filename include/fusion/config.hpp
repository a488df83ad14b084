#ifndef FUSION_CONFIG_HPP
#define FUSION_CONFIG_HPP

#include <cstdint>
#include <string>
#include <string_view>

#include "error.hpp"

namespace fusion {

// =============================================================================
// Quote Settings
// =============================================================================

// How native SOL is wrapped when it is one of the pool tokens
enum class NativeMintWrappingStrategy : uint8_t {
    Keypair,   // Temporary keypair account
    Seed,      // Account derived from a seed
    Ata,       // Associated token account
    None       // Caller wraps beforehand
};

const char* to_string(NativeMintWrappingStrategy strategy);
// Accepts "keypair", "seed", "ata" and "none" in any case; throws std::invalid_argument otherwise
NativeMintWrappingStrategy parse_wrapping_strategy(std::string_view text);

// Passed explicitly to every caller that needs it; there is no process-wide instance
class Config {
public:
    static constexpr uint16_t DEFAULT_SLIPPAGE_TOLERANCE_BPS = 100;
    static constexpr const char* DEFAULT_FUNDER = "11111111111111111111111111111111";
    static constexpr NativeMintWrappingStrategy DEFAULT_WRAPPING_STRATEGY = NativeMintWrappingStrategy::Keypair;

    uint16_t slippage_tolerance_bps = DEFAULT_SLIPPAGE_TOLERANCE_BPS;
    std::string funder = DEFAULT_FUNDER;
    NativeMintWrappingStrategy wrapping_strategy = DEFAULT_WRAPPING_STRATEGY;

    Config() = default;

    Config& with_slippage_tolerance_bps(uint16_t bps) {
        slippage_tolerance_bps = bps;
        return *this;
    }

    Config& with_funder(std::string_view address) {
        funder = std::string(address);
        return *this;
    }

    Config& with_wrapping_strategy(NativeMintWrappingStrategy strategy) {
        wrapping_strategy = strategy;
        return *this;
    }

    Config& reset();

    // INVALID_SLIPPAGE_TOLERANCE above 10000 bps
    Result<bool> validate() const;

    // Missing keys keep their defaults, unknown keys are ignored.
    // Malformed JSON or mistyped values throw std::runtime_error.
    static Config from_json(std::string_view content);
    static Config from_file(std::string_view path);

    std::string to_json() const;
};

} // namespace fusion

#endif // FUSION_CONFIG_HPP
