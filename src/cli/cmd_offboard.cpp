/**
 * @file cmd_offboard.cpp
 * @brief Offboard subcommand: durable and recipient forms of a value
 *
 * Usage:
 *   mpcint offboard -type uint128 -value 340282366920938463463374607431768211455
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 */

#include <iostream>
#include <string>

#include <openssl/rand.h>

#include "mpcint/mpcint.h"

#include "cli_utils.h"

using mpcint::cli::bytes_to_hex;
using mpcint::cli::parse_plaintext;

/**
 * @brief Print offboard subcommand help
 */
void print_offboard_help() {
    std::cout << "\nUsage: mpcint offboard [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -type <type>    Value type: uint8..uint256, int8..int256 (required)\n";
    std::cout << "  -value <int>    Plaintext, decimal or 0x hex (required)\n";
    std::cout << "  --help          Show this help message\n\n";
    std::cout << "Validates an encrypted input, offboards it under the network key and\n";
    std::cout << "to a fresh recipient key, then decrypts the recipient copy.\n\n";
}

/**
 * @brief Offboard subcommand handler
 */
int cmd_offboard(int argc, char* argv[]) {
    std::string type_name, value_text;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "-type" && i + 1 < argc) {
            type_name = argv[++i];
        } else if (arg == "-value" && i + 1 < argc) {
            value_text = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_offboard_help();
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_offboard_help();
            return 1;
        }
    }

    if (type_name.empty() || value_text.empty()) {
        std::cerr << "Error: Missing required arguments (-type, -value)\n";
        print_offboard_help();
        return 1;
    }

    try {
        const mpcint::IntType type = mpcint::parse_int_type(type_name);
        const mpz_class value = parse_plaintext(value_text);

        const auto config = mpcint::backend::LocalBackendConfig::generate();
        mpcint::backend::LocalWordBackend be(config);

        mpcint::UserKey recipient{};
        if (RAND_bytes(recipient.data(), static_cast<int>(recipient.size())) != 1) {
            std::cerr << "Error: RAND_bytes failure\n";
            return 1;
        }

        mpcint::WideValue v = mpcint::validate_ciphertext(be, mpcint::backend::encrypt_input(config, type, value));
        mpcint::CombinedCiphertext ct = mpcint::offboard_combined(be, v, recipient);

        std::cout << "Type:      " << type.name() << "\n";
        for (size_t i = 0; i < ct.network.limbs.size(); ++i) {
            const auto& n = ct.network.limbs[i].bytes;
            const auto& u = ct.user.limbs[i].bytes;
            std::cout << "Limb " << i << ":    network " << bytes_to_hex(n.data(), n.size())
                      << "  user " << bytes_to_hex(u.data(), u.size()) << "\n";
        }
        std::cout << "Recipient: " << mpcint::backend::decrypt_user(ct.user, recipient).get_str() << "\n";
        std::cout << "Onboarded: " << mpcint::decrypt(be, mpcint::onboard(be, ct.network)).get_str() << "\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
