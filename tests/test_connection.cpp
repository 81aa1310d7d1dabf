#include "test_framework.hpp"
#include "test_helpers.hpp"
#include "prudp/connection.hpp"
#include "utils/crypto.hpp"

using namespace prudp;
using namespace prudp::test;

// =============================================================================
// Connection Tests
// =============================================================================

TEST(Connection_Defaults) {
    Connection connection;
    ASSERT_EQ(connection.getChecksumVersion(), 1);
    ASSERT_EQ(connection.getFlagsVersion(), 1);
    ASSERT_EQ(connection.getChecksumSize(), 1u);
    ASSERT_TRUE(connection.getChecksumPolicy() == ChecksumPolicy::Permissive);
    ASSERT_EQ(connection.getSignatureBase(), 0u);
    ASSERT_FALSE(connection.isFriendsService());
    PASS();
}

TEST(Connection_AccessKeyDerivesSeedAndKey) {
    Connection connection(makeConfig(FRIENDS_ACCESS_KEY, 0, 0));
    ASSERT_TRUE(connection.isFriendsService());
    ASSERT_EQ(connection.getSignatureBase(), 775u);
    ASSERT_TRUE(connection.getSignatureKey() == utils::Crypto::md5(FRIENDS_ACCESS_KEY));
    ASSERT_EQ(connection.getChecksumSize(), 4u);

    connection.updateAccessKey("abc");
    ASSERT_EQ(connection.getSignatureBase(), 294u);
    ASSERT_FALSE(connection.isFriendsService());
    PASS();
}

TEST(Connection_ResetZeroesConnectionSignatures) {
    Connection connection;
    ASSERT_TRUE(connection.getServerConnectionSignature().has_value());
    ASSERT_TRUE(*connection.getServerConnectionSignature() == Signature{});

    connection.setServerConnectionSignature({1, 2, 3, 4});
    connection.clearClientConnectionSignature();
    ASSERT_FALSE(connection.getClientConnectionSignature().has_value());

    connection.reset();
    ASSERT_TRUE(*connection.getServerConnectionSignature() == Signature{});
    ASSERT_TRUE(*connection.getClientConnectionSignature() == Signature{});
    PASS();
}

TEST(Connection_ResetRestartsKeystream) {
    Connection connection;
    std::vector<uint8_t> first = {1, 2, 3, 4, 5, 6, 7, 8};
    std::vector<uint8_t> second = first;

    connection.getCipher().apply(first);
    connection.reset();
    connection.getCipher().apply(second);
    ASSERT_TRUE(first == second);
    PASS();
}

TEST(Connection_DirectionsHaveIndependentCiphers) {
    Connection connection;
    std::vector<uint8_t> out = {9, 9, 9, 9};
    std::vector<uint8_t> in = out;

    // Advancing the encrypt side leaves the decrypt keystream where it was
    connection.getCipher().apply(out);
    connection.getCipher().apply(out);
    connection.getDecipher().apply(in);

    std::vector<uint8_t> expected = {9, 9, 9, 9};
    Rc4Cipher fresh{std::string(DEFAULT_RC4_KEY)};
    fresh.apply(expected);
    ASSERT_TRUE(in == expected);
    PASS();
}

TEST(Connection_UpdateRC4Key) {
    Connection connection;
    std::vector<uint8_t> key = {'K', 'e', 'y'};
    connection.updateRC4Key(key);

    std::vector<uint8_t> data = {'P', 'l', 'a', 'i', 'n', 't', 'e', 'x', 't'};
    connection.getCipher().apply(data);
    ASSERT_STREQ(utils::Crypto::toHex(data), "bbf316e8d940af0ad3");
    PASS();
}
