/**
 * @file test_integration.cpp
 * @brief End-to-end flows across input, arithmetic and output boundaries
 *
 * Tests cross-module usage scenarios:
 * - Client encrypts inputs, operations run, recipient decrypts the result
 * - Values persisted through offboard/onboard between sessions
 * - Balance-style transfer guarded by checked arithmetic and select
 *
 * @author knightc
 * @copyright Copyright (c) 2019-2026 knightc. All rights reserved.
 * @license Apache-2.0
 */

#include <gtest/gtest.h>
#include <vector>

#include "test_util.h"

using namespace mpcint;
using mpcint_test::pow2;

class IntegrationTest : public mpcint_test::BackendTest {
protected:
    UserKey recipient_key() {
        UserKey key{};
        key.fill(0x5A);
        key[0] = 0x01;
        return key;
    }
};

// ============================================================================
// Input -> Compute -> Recipient
// ============================================================================

TEST_F(IntegrationTest, EncryptComputeDecryptForRecipient) {
    const UserKey key = recipient_key();

    WideValue price = secret(kUint128, mpz_class("340282366920938463463374607431"));
    WideValue qty = secret(kUint128, 12);
    WideValue fee = secret(kUint128, 999);

    WideValue total = add(be_, mul(be_, price, qty), fee);
    WideUserCiphertext out = offboard_to_user(be_, total, key);

    const mpz_class expected = mpz_class("340282366920938463463374607431") * 12 + 999;
    EXPECT_EQ(backend::decrypt_user(out, key), expected);
}

TEST_F(IntegrationTest, GuardedTransfer) {
    WideValue balance = secret(kUint64, 1000);
    WideValue amount = secret(kUint64, 250);

    SecretBool enough = ge(be_, balance, amount);
    WideValue debited = select(be_, enough, sub(be_, balance, amount), balance);
    EXPECT_EQ(reveal(debited), 750);

    WideValue too_much = secret(kUint64, 5000);
    SecretBool enough2 = ge(be_, debited, too_much);
    WideValue unchanged = select(be_, enough2, sub(be_, debited, too_much), debited);
    EXPECT_EQ(reveal(unchanged), 750);

    CheckedResult r = checked_sub_with_overflow_bit(be_, debited, too_much);
    EXPECT_TRUE(reveal(r.overflow));
}

TEST_F(IntegrationTest, PersistAcrossSessions) {
    WideValue v = secret(kInt256, -pow2(254) + 7);
    WideCiphertext stored = offboard(be_, v);

    // Same keys, new backend instance
    backend::LocalWordBackend next(config_);
    WideValue restored = onboard(next, stored);
    WideValue doubled = add(next, restored, restored);
    EXPECT_EQ(decrypt(next, doubled), wrap_to(kInt256, 2 * (-pow2(254) + 7)));
}

TEST_F(IntegrationTest, CombinedOutputServesBothConsumers) {
    const UserKey key = recipient_key();
    WideValue v = max(be_, secret(kInt32, -4), secret(kInt32, 19));
    CombinedCiphertext ct = offboard_combined(be_, v, key);

    EXPECT_EQ(backend::decrypt_user(ct.user, key), 19);
    WideValue back = onboard(be_, ct.network);
    EXPECT_EQ(reveal(mul(be_, back, pub(kInt32, -2))), -38);
}

TEST_F(IntegrationTest, SumOfManyInputs) {
    const int count = 20;
    mpz_class expected = 0;
    WideValue acc = set_public(be_, kUint256, 0);
    for (int i = 0; i < count; ++i) {
        const mpz_class x = sample(kUint256);
        expected += x;
        acc = add(be_, acc, secret(kUint256, x));
    }
    EXPECT_EQ(reveal(acc), wrap_to(kUint256, expected));
}

TEST_F(IntegrationTest, DivisionPipeline) {
    // Average of three 128-bit amounts, exact for small totals
    std::vector<WideValue> xs = {secret(kUint128, 300), secret(kUint128, 450), secret(kUint128, 151)};
    WideValue total = add(be_, add(be_, xs[0], xs[1]), xs[2]);
    EXPECT_EQ(reveal(div(be_, total, pub(kUint128, 3))), 300);
    EXPECT_EQ(reveal(rem(be_, total, pub(kUint128, 3))), 1);
}

TEST_F(IntegrationTest, FailedBackendSurfacesAsError) {
    WideValue a = secret(kInt128, 5);
    be_.set_fault_budget(0);
    EXPECT_THROW(add(be_, a, a), BackendError);
    be_.set_fault_budget(-1);
    EXPECT_EQ(reveal(add(be_, a, a)), 10);
}
