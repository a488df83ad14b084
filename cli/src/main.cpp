// Fusion Quote CLI
// SPDX-License-Identifier: MIT
//
// Offline quoting against a JSON snapshot of pool, tick array, position and
// limit order state. Results are printed to stdout as JSON.

#include <fusion/config.hpp>
#include <fusion/liquidity.hpp>
#include <fusion/limit_order.hpp>
#include <fusion/order_book.hpp>
#include <fusion/position.hpp>
#include <fusion/snapshot.hpp>
#include <fusion/swap.hpp>
#include <fusion/tick_math.hpp>
#include <fusion/u256.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string snapshot_path;
    std::string config_path;
    std::optional<uint16_t> slippage_tolerance_bps;
    bool verbose = false;
    std::vector<std::string> command_args;
};

//------------------------------------------------------------------------------
// Argument Parsing
//------------------------------------------------------------------------------

uint64_t parse_amount(const std::string& text) {
    auto value = fusion::parse_u128(text);
    if (!value || *value > fusion::U64_MAX) {
        throw std::invalid_argument("Invalid amount: " + text);
    }
    return static_cast<uint64_t>(*value);
}

fusion::U128 parse_liquidity(const std::string& text) {
    auto value = fusion::parse_u128(text);
    if (!value) {
        throw std::invalid_argument("Invalid liquidity: " + text);
    }
    return *value;
}

int32_t parse_tick_index(const std::string& text) {
    int32_t tick_index = std::stoi(text);
    if (!fusion::tick_math::is_tick_index_in_bounds(tick_index)) {
        throw std::invalid_argument("Tick index out of bounds: " + text);
    }
    return tick_index;
}

uint8_t parse_decimals(const std::string& text) {
    int decimals = std::stoi(text);
    if (decimals < 0 || decimals > std::numeric_limits<uint8_t>::max()) {
        throw std::invalid_argument("Invalid decimals: " + text);
    }
    return static_cast<uint8_t>(decimals);
}

// "a" or "b"
bool parse_token_is_a(const std::string& text) {
    if (text == "a" || text == "A") return true;
    if (text == "b" || text == "B") return false;
    throw std::invalid_argument("Token must be 'a' or 'b': " + text);
}

// "a_to_b" or "b_to_a"
bool parse_direction(const std::string& text) {
    if (text == "a_to_b") return true;
    if (text == "b_to_a") return false;
    throw std::invalid_argument("Direction must be 'a_to_b' or 'b_to_a': " + text);
}

//------------------------------------------------------------------------------
// Output
//------------------------------------------------------------------------------

template <typename T>
int print_result(const fusion::Result<T>& result) {
    if (!result) {
        json error = {
            {"error", fusion::error_code(result.error())},
            {"message", fusion::to_string(result.error())}
        };
        std::cerr << error.dump(2) << "\n";
        return 1;
    }
    json out = *result;
    std::cout << out.dump(2) << "\n";
    return 0;
}

void require_args(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("Usage: fusion-quote ") + usage);
    }
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

class QuoteRunner {
public:
    QuoteRunner(const Options& options, const fusion::Config& config)
        : options_(options)
        , config_(config)
    {}

    int run(const std::vector<std::string>& args) {
        const std::string& cmd = args[0];

        if (cmd == "swap-in") return swap_in(args);
        if (cmd == "swap-out") return swap_out(args);
        if (cmd == "limit-decrease") return limit_decrease(args);
        if (cmd == "limit-in") return limit_in(args);
        if (cmd == "limit-out") return limit_out(args);
        if (cmd == "increase-liquidity") return increase_liquidity(args);
        if (cmd == "decrease-liquidity") return decrease_liquidity(args);
        if (cmd == "collect-fees") return collect_fees();
        if (cmd == "position") return position(args);
        if (cmd == "order-book") return order_book(args);
        if (cmd == "tick") return tick(args);

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;
    }

private:
    const fusion::Snapshot& snapshot() {
        if (!snapshot_) {
            if (options_.snapshot_path.empty()) {
                throw std::invalid_argument("This command needs --snapshot <file>");
            }
            snapshot_ = fusion::load_snapshot(options_.snapshot_path);
            if (options_.verbose) {
                std::cerr << "Snapshot: " << options_.snapshot_path
                          << " (" << snapshot_->tick_arrays.size() << " tick arrays, sqrt price "
                          << fusion::to_string(snapshot_->pool.sqrt_price) << ")\n";
            }
        }
        return *snapshot_;
    }

    int swap_in(const std::vector<std::string>& args) {
        require_args(args, 3, "swap-in <amount> <a|b>");
        const auto& s = snapshot();
        return print_result(fusion::swap_quote_by_input_token(
            parse_amount(args[1]), parse_token_is_a(args[2]), config_.slippage_tolerance_bps,
            s.pool, s.tick_arrays, s.transfer_fee_a, s.transfer_fee_b));
    }

    int swap_out(const std::vector<std::string>& args) {
        require_args(args, 3, "swap-out <amount> <a|b>");
        const auto& s = snapshot();
        return print_result(fusion::swap_quote_by_output_token(
            parse_amount(args[1]), parse_token_is_a(args[2]), config_.slippage_tolerance_bps,
            s.pool, s.tick_arrays, s.transfer_fee_a, s.transfer_fee_b));
    }

    int limit_decrease(const std::vector<std::string>& args) {
        require_args(args, 2, "limit-decrease <amount>");
        const auto& s = snapshot();
        if (!s.limit_order || !s.tick) {
            throw std::invalid_argument("Snapshot needs limitOrder and tick");
        }
        return print_result(fusion::decrease_limit_order_quote(
            s.pool, *s.limit_order, *s.tick, parse_amount(args[1]), s.transfer_fee_a, s.transfer_fee_b));
    }

    int limit_in(const std::vector<std::string>& args) {
        require_args(args, 4, "limit-in <amount> <a_to_b|b_to_a> <tick_index>");
        auto amount_out = fusion::limit_order_quote_by_input_token(
            parse_amount(args[1]), parse_direction(args[2]), parse_tick_index(args[3]), snapshot().pool);
        if (!amount_out) return print_result(amount_out);
        std::cout << json{{"amountOut", *amount_out}}.dump(2) << "\n";
        return 0;
    }

    int limit_out(const std::vector<std::string>& args) {
        require_args(args, 4, "limit-out <amount> <a_to_b|b_to_a> <tick_index>");
        auto amount_in = fusion::limit_order_quote_by_output_token(
            parse_amount(args[1]), parse_direction(args[2]), parse_tick_index(args[3]), snapshot().pool);
        if (!amount_in) return print_result(amount_in);
        std::cout << json{{"amountIn", *amount_in}}.dump(2) << "\n";
        return 0;
    }

    int increase_liquidity(const std::vector<std::string>& args) {
        require_args(args, 5, "increase-liquidity <liquidity|a|b> <amount> <tick_1> <tick_2>");
        const auto& s = snapshot();
        const int32_t tick_1 = parse_tick_index(args[3]);
        const int32_t tick_2 = parse_tick_index(args[4]);
        const uint16_t slippage = config_.slippage_tolerance_bps;

        if (args[1] == "liquidity") {
            return print_result(fusion::increase_liquidity_quote(
                parse_liquidity(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
                s.transfer_fee_a, s.transfer_fee_b));
        }
        if (parse_token_is_a(args[1])) {
            return print_result(fusion::increase_liquidity_quote_a(
                parse_amount(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
                s.transfer_fee_a, s.transfer_fee_b));
        }
        return print_result(fusion::increase_liquidity_quote_b(
            parse_amount(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
            s.transfer_fee_a, s.transfer_fee_b));
    }

    int decrease_liquidity(const std::vector<std::string>& args) {
        require_args(args, 5, "decrease-liquidity <liquidity|a|b> <amount> <tick_1> <tick_2>");
        const auto& s = snapshot();
        const int32_t tick_1 = parse_tick_index(args[3]);
        const int32_t tick_2 = parse_tick_index(args[4]);
        const uint16_t slippage = config_.slippage_tolerance_bps;

        if (args[1] == "liquidity") {
            return print_result(fusion::decrease_liquidity_quote(
                parse_liquidity(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
                s.transfer_fee_a, s.transfer_fee_b));
        }
        if (parse_token_is_a(args[1])) {
            return print_result(fusion::decrease_liquidity_quote_a(
                parse_amount(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
                s.transfer_fee_a, s.transfer_fee_b));
        }
        return print_result(fusion::decrease_liquidity_quote_b(
            parse_amount(args[2]), slippage, s.pool.sqrt_price, tick_1, tick_2,
            s.transfer_fee_a, s.transfer_fee_b));
    }

    int collect_fees() {
        const auto& s = snapshot();
        if (!s.position || !s.tick_lower || !s.tick_upper) {
            throw std::invalid_argument("Snapshot needs position, tickLower and tickUpper");
        }
        return print_result(fusion::collect_fees_quote(
            s.pool, *s.position, *s.tick_lower, *s.tick_upper, s.transfer_fee_a, s.transfer_fee_b));
    }

    int position(const std::vector<std::string>& args) {
        require_args(args, 3, "position <tick_1> <tick_2>");
        const fusion::U128 sqrt_price = snapshot().pool.sqrt_price;
        const int32_t tick_1 = parse_tick_index(args[1]);
        const int32_t tick_2 = parse_tick_index(args[2]);

        json out = {
            {"status", fusion::to_string(fusion::position_status(sqrt_price, tick_1, tick_2))},
            {"inRange", fusion::is_position_in_range(sqrt_price, tick_1, tick_2)},
            {"ratio", fusion::position_ratio_x64(sqrt_price, tick_1, tick_2)}
        };
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    int order_book(const std::vector<std::string>& args) {
        require_args(args, 5, "order-book <price_step> <max_entries> <decimals_a> <decimals_b> [invert]");
        const auto& s = snapshot();
        const double price_step = std::stod(args[1]);
        const uint32_t max_entries = static_cast<uint32_t>(std::stoul(args[2]));
        const bool invert = args.size() > 5 && args[5] == "invert";

        auto sequence = fusion::TickArraySequence::create(s.tick_arrays, s.pool.tick_spacing);
        if (!sequence) {
            return print_result(fusion::Result<std::vector<fusion::OrderBookEntry>>(sequence.error()));
        }

        return print_result(fusion::get_order_book_side(
            s.pool, *sequence, price_step, max_entries, invert,
            parse_decimals(args[3]), parse_decimals(args[4])));
    }

    int tick(const std::vector<std::string>& args) {
        require_args(args, 2, "tick <tick_index> [decimals_a decimals_b] [tick_spacing]");
        const int32_t tick_index = parse_tick_index(args[1]);
        const uint8_t decimals_a = args.size() > 3 ? parse_decimals(args[2]) : 0;
        const uint8_t decimals_b = args.size() > 3 ? parse_decimals(args[3]) : 0;

        json out = {
            {"tickIndex", tick_index},
            {"sqrtPrice", fusion::to_string(fusion::tick_math::tick_index_to_sqrt_price(tick_index))},
            {"price", fusion::tick_math::tick_index_to_price(tick_index, decimals_a, decimals_b)},
            {"invertedTickIndex", fusion::tick_math::invert_tick_index(tick_index)}
        };
        if (args.size() > 4) {
            const int spacing = std::stoi(args[4]);
            if (spacing <= 0 || spacing > std::numeric_limits<uint16_t>::max()) {
                throw std::invalid_argument("Invalid tick spacing: " + args[4]);
            }
            const auto tick_spacing = static_cast<uint16_t>(spacing);
            out["tickArrayStartIndex"] = fusion::tick_math::get_tick_array_start_tick_index(tick_index, tick_spacing);
            out["initializable"] = fusion::tick_math::is_tick_initializable(tick_index, tick_spacing);
            out["prevInitializable"] = fusion::tick_math::get_prev_initializable_tick_index(tick_index, tick_spacing);
            out["nextInitializable"] = fusion::tick_math::get_next_initializable_tick_index(tick_index, tick_spacing);
        }
        std::cout << out.dump(2) << "\n";
        return 0;
    }

    const Options& options_;
    const fusion::Config& config_;
    std::optional<fusion::Snapshot> snapshot_;
};

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

void print_usage(const char* prog) {
    std::cout << "Fusion Quote CLI\n\n"
              << "Usage: " << prog << " [options] <command> [args...]\n\n"
              << "Options:\n"
              << "  -S, --snapshot <file>  Account state snapshot (JSON)\n"
              << "  -c, --config <file>    Quote settings (JSON)\n"
              << "  -s, --slippage <bps>   Slippage tolerance override\n"
              << "  -v, --verbose          Echo settings and inputs on stderr\n"
              << "  -h, --help             Show this help message\n\n"
              << "Commands:\n"
              << "  swap-in <amount> <a|b>\n"
              << "  swap-out <amount> <a|b>\n"
              << "  limit-decrease <amount>\n"
              << "  limit-in <amount> <a_to_b|b_to_a> <tick_index>\n"
              << "  limit-out <amount> <a_to_b|b_to_a> <tick_index>\n"
              << "  increase-liquidity <liquidity|a|b> <amount> <tick_1> <tick_2>\n"
              << "  decrease-liquidity <liquidity|a|b> <amount> <tick_1> <tick_2>\n"
              << "  collect-fees\n"
              << "  position <tick_1> <tick_2>\n"
              << "  order-book <price_step> <max_entries> <decimals_a> <decimals_b> [invert]\n"
              << "  tick <tick_index> [decimals_a decimals_b] [tick_spacing]\n\n"
              << "Examples:\n"
              << "  " << prog << " -S pool.json swap-in 1000 a\n"
              << "  " << prog << " -S pool.json -s 50 swap-out 1000 b\n"
              << "  " << prog << " -S pool.json order-book 0.01 20 6 6\n"
              << "  " << prog << " tick -16\n";
}

Options parse_args(int argc, char* argv[]) {
    Options options;

    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-S" || arg == "--snapshot") {
            if (i + 1 >= argc) {
                std::cerr << "Missing snapshot file argument\n";
                std::exit(1);
            }
            options.snapshot_path = argv[++i];
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "Missing config file argument\n";
                std::exit(1);
            }
            options.config_path = argv[++i];
        } else if (arg == "-s" || arg == "--slippage") {
            if (i + 1 >= argc) {
                std::cerr << "Missing slippage argument\n";
                std::exit(1);
            }
            int bps = std::atoi(argv[++i]);
            if (bps < 0 || bps > std::numeric_limits<uint16_t>::max()) {
                std::cerr << "Invalid slippage: " << argv[i] << "\n";
                std::exit(1);
            }
            options.slippage_tolerance_bps = static_cast<uint16_t>(bps);
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg[0] != '-' || (arg.size() > 1 && std::isdigit(static_cast<unsigned char>(arg[1])) &&
                                     !options.command_args.empty())) {
            options.command_args.push_back(arg);
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        }
        ++i;
    }

    return options;
}

int main(int argc, char* argv[]) {
    Options options = parse_args(argc, argv);
    if (options.command_args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        fusion::Config config = options.config_path.empty()
            ? fusion::Config()
            : fusion::Config::from_file(options.config_path);
        if (options.slippage_tolerance_bps) {
            config.with_slippage_tolerance_bps(*options.slippage_tolerance_bps);
        }

        auto valid = config.validate();
        if (!valid) {
            return print_result(valid);
        }

        if (options.verbose) {
            std::cerr << "Config: " << config.to_json() << "\n";
            std::cerr << "Command:";
            for (const auto& arg : options.command_args) {
                std::cerr << " " << arg;
            }
            std::cerr << "\n";
        }

        QuoteRunner runner(options, config);
        return runner.run(options.command_args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
