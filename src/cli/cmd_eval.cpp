/**
 * @file cmd_eval.cpp
 * @brief Eval subcommand: run one operation through the local backend
 *
 * Usage:
 *   mpcint eval -type int64 -op add -a -8000000000 -b 3000000000
 *   mpcint eval -type uint128 -op div -a 0x1234567890abcdef1234 -b 97 -public-b
 *   mpcint eval -type uint256 -op shl -a 1 -b 200
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <map>
#include <string>

#include "mpcint/mpcint.h"

#include "cli_utils.h"

using mpcint::cli::parse_plaintext;
using mpcint::cli::print_stats;

namespace {

using ValueOp = std::function<mpcint::WideValue(mpcint::WordBackend&, const mpcint::Operand&,
                                                const mpcint::Operand&)>;
using BoolOp = std::function<mpcint::SecretBool(mpcint::WordBackend&, const mpcint::Operand&,
                                                const mpcint::Operand&)>;
using FlagOp = std::function<mpcint::CheckedResult(mpcint::WordBackend&, const mpcint::Operand&,
                                                   const mpcint::Operand&)>;

const std::map<std::string, ValueOp>& value_ops() {
    static const std::map<std::string, ValueOp> ops = {
        {"add", mpcint::add},
        {"sub", mpcint::sub},
        {"mul", mpcint::mul},
        {"div", mpcint::div},
        {"rem", mpcint::rem},
        {"and", mpcint::bit_and},
        {"or", mpcint::bit_or},
        {"xor", mpcint::bit_xor},
        {"min", mpcint::min},
        {"max", mpcint::max},
        {"checked_add", mpcint::checked_add},
        {"checked_sub", mpcint::checked_sub},
        {"checked_mul", mpcint::checked_mul},
    };
    return ops;
}

const std::map<std::string, BoolOp>& bool_ops() {
    static const std::map<std::string, BoolOp> ops = {
        {"eq", mpcint::eq}, {"ne", mpcint::ne},
        {"lt", mpcint::lt}, {"le", mpcint::le},
        {"gt", mpcint::gt}, {"ge", mpcint::ge},
    };
    return ops;
}

const std::map<std::string, FlagOp>& flag_ops() {
    static const std::map<std::string, FlagOp> ops = {
        {"checked_add_bit", mpcint::checked_add_with_overflow_bit},
        {"checked_sub_bit", mpcint::checked_sub_with_overflow_bit},
        {"checked_mul_bit", mpcint::checked_mul_with_overflow_bit},
    };
    return ops;
}

} // namespace

/**
 * @brief Print eval subcommand help
 */
void print_eval_help() {
    std::cout << "\nUsage: mpcint eval [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -type <type>      Operand type: uint8..uint256, int8..int256 (required)\n";
    std::cout << "  -type-b <type>    Type of the second operand (default: -type)\n";
    std::cout << "  -op <name>        Operation (required)\n";
    std::cout << "  -a <int>          First operand, decimal or 0x hex (required)\n";
    std::cout << "  -b <int>          Second operand or shift amount\n";
    std::cout << "  -public-a         Pass the first operand as a public constant\n";
    std::cout << "  -public-b         Pass the second operand as a public constant\n";
    std::cout << "  -seed <n>         Deterministic keys and randomness\n";
    std::cout << "  -verbose          Debug logging\n";
    std::cout << "  --help            Show this help message\n\n";
    std::cout << "Operations:\n";
    std::cout << "  add sub mul div rem and or xor min max\n";
    std::cout << "  eq ne lt le gt ge\n";
    std::cout << "  checked_add checked_sub checked_mul\n";
    std::cout << "  checked_add_bit checked_sub_bit checked_mul_bit\n";
    std::cout << "  shl shr negate abs\n\n";
    std::cout << "Examples:\n";
    std::cout << "  mpcint eval -type int64 -op add -a -8000000000 -b 3000000000\n";
    std::cout << "  mpcint eval -type uint8 -op checked_add_bit -a 200 -b 100\n\n";
}

/**
 * @brief Eval subcommand handler
 */
int cmd_eval(int argc, char* argv[]) {
    std::string type_name, type_b_name, op, a_text, b_text;
    bool public_a = false;
    bool public_b = false;
    bool seeded = false;
    uint64_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-type" && i + 1 < argc) {
            type_name = argv[++i];
        } else if (arg == "-type-b" && i + 1 < argc) {
            type_b_name = argv[++i];
        } else if (arg == "-op" && i + 1 < argc) {
            op = argv[++i];
            std::transform(op.begin(), op.end(), op.begin(), ::tolower);
        } else if (arg == "-a" && i + 1 < argc) {
            a_text = argv[++i];
        } else if (arg == "-b" && i + 1 < argc) {
            b_text = argv[++i];
        } else if (arg == "-public-a") {
            public_a = true;
        } else if (arg == "-public-b") {
            public_b = true;
        } else if (arg == "-seed" && i + 1 < argc) {
            seeded = true;
            seed = std::stoull(argv[++i]);
        } else if (arg == "-verbose") {
            mpcint::set_log_level(spdlog::level::debug);
        } else if (arg == "--help" || arg == "-h") {
            print_eval_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_eval_help();
            return 1;
        }
    }

    const bool unary = (op == "negate" || op == "abs");
    if (type_name.empty() || op.empty() || a_text.empty() || (!unary && b_text.empty())) {
        std::cerr << "Error: Missing required arguments (-type, -op, -a, -b)\n";
        print_eval_help();
        return 1;
    }

    try {
        const mpcint::IntType type = mpcint::parse_int_type(type_name);
        const mpcint::IntType type_b = type_b_name.empty() ? type : mpcint::parse_int_type(type_b_name);
        const mpcint::backend::LocalBackendConfig config = seeded
            ? mpcint::backend::LocalBackendConfig::from_seed(seed)
            : mpcint::backend::LocalBackendConfig::generate();
        mpcint::backend::LocalWordBackend be(config);

        auto make_operand = [&](mpcint::IntType t, const std::string& text, bool is_public) {
            const mpz_class v = parse_plaintext(text);
            if (is_public) {
                return mpcint::Operand::plain(t, v);
            }
            return mpcint::Operand(mpcint::validate_ciphertext(be, mpcint::backend::encrypt_input(config, t, v)));
        };

        const mpcint::Operand a = make_operand(type, a_text, public_a);
        std::cout << "Type:      " << type.name() << "\n";
        be.reset_stats();

        if (op == "shl" || op == "shr") {
            const int64_t amount = std::stoll(b_text);
            mpcint::WideValue r = op == "shl" ? mpcint::shl(be, a, amount) : mpcint::shr(be, a, amount);
            const auto stats = be.stats();
            std::cout << "Operation: " << op << " by " << amount << "\n";
            std::cout << "Result:    " << mpcint::decrypt(be, r).get_str() << "\n";
            print_stats(stats);
            return 0;
        }

        if (unary) {
            mpcint::WideValue r = op == "negate" ? mpcint::negate(be, a) : mpcint::abs(be, a);
            const auto stats = be.stats();
            std::cout << "Operation: " << op << "\n";
            std::cout << "Result:    " << mpcint::decrypt(be, r).get_str() << "\n";
            print_stats(stats);
            return 0;
        }

        const mpcint::Operand b = make_operand(type_b, b_text, public_b);
        be.reset_stats();
        std::cout << "Operation: " << op << " (" << mpcint::operand_mode_name(mpcint::operand_mode(a, b)) << ")\n";

        auto vit = value_ops().find(op);
        if (vit != value_ops().end()) {
            mpcint::WideValue r = vit->second(be, a, b);
            const auto stats = be.stats();
            std::cout << "Result:    " << mpcint::decrypt(be, r).get_str() << "\n";
            print_stats(stats);
            return 0;
        }

        auto bit = bool_ops().find(op);
        if (bit != bool_ops().end()) {
            mpcint::SecretBool r = bit->second(be, a, b);
            const auto stats = be.stats();
            std::cout << "Result:    " << (mpcint::decrypt(be, r) ? "true" : "false") << "\n";
            print_stats(stats);
            return 0;
        }

        auto fit = flag_ops().find(op);
        if (fit != flag_ops().end()) {
            mpcint::CheckedResult r = fit->second(be, a, b);
            const auto stats = be.stats();
            std::cout << "Result:    " << mpcint::decrypt(be, r.value).get_str() << "\n";
            std::cout << "Overflow:  " << (mpcint::decrypt(be, r.overflow) ? "true" : "false") << "\n";
            print_stats(stats);
            return 0;
        }

        std::cerr << "Error: Unknown operation '" << op << "'\n";
        print_eval_help();
        return 1;

    } catch (const mpcint::MpcError& e) {
        std::cerr << "Error: " << e.what() << " (" << mpcint_error_string(e.code()) << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
