#include "test_framework.hpp"
#include "prudp/checksum.hpp"

using namespace prudp;
using namespace prudp::test;

// =============================================================================
// Checksum Tests
// =============================================================================

TEST(Checksum_EmptyIsSeed) {
    std::vector<uint8_t> empty;
    ASSERT_EQ(calculateChecksum(empty, 0), 0u);
    ASSERT_EQ(calculateChecksum(empty, 0x42), 0x42u);
    // Only the low byte of the seed survives
    ASSERT_EQ(calculateChecksum(empty, 0x1FF), 0xFFu);
    PASS();
}

TEST(Checksum_WordsAndTrailingBytes) {
    // word 0x04030201 -> 1+2+3+4, trailing 5
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    ASSERT_EQ(calculateChecksum(data, 0), 15u);
    ASSERT_EQ(calculateChecksum(data, 10), 25u);
    PASS();
}

TEST(Checksum_WordSumCarriesAcrossBytes) {
    // 0x000000FF + 0x00000001 = 0x00000100 -> bytes 00 01 00 00
    std::vector<uint8_t> data = {0xFF, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00};
    ASSERT_EQ(calculateChecksum(data, 0), 1u);
    PASS();
}

TEST(Checksum_WordSumWrapsAt32Bits) {
    // 0xFFFFFFFF + 1 wraps to 0
    std::vector<uint8_t> data = {0xFF, 0xFF, 0xFF, 0xFF, 0x01, 0x00, 0x00, 0x00};
    ASSERT_EQ(calculateChecksum(data, 0), 0u);
    ASSERT_EQ(calculateChecksum(data, 7), 7u);
    PASS();
}

TEST(Checksum_OnlyTrailingBytes) {
    std::vector<uint8_t> data = {0x80, 0x80, 0x01};
    ASSERT_EQ(calculateChecksum(data, 0), 0x01u);
    PASS();
}

TEST(Checksum_Deterministic) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 37; i++) {
        data.push_back(static_cast<uint8_t>(i * 7 + 3));
    }

    uint32_t first = calculateChecksum(data, 775);
    for (int i = 0; i < 10; i++) {
        ASSERT_EQ(calculateChecksum(data, 775), first);
    }
    ASSERT_TRUE(first <= 0xFF);
    PASS();
}

TEST(Checksum_SingleByteChange) {
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04, 0x05};
    std::vector<uint8_t> changed = {0x01, 0x02, 0x03, 0x04, 0x06};
    ASSERT_NE(calculateChecksum(data, 0), calculateChecksum(changed, 0));

    std::vector<uint8_t> changedWord = {0x01, 0x02, 0x13, 0x04, 0x05};
    ASSERT_NE(calculateChecksum(data, 0), calculateChecksum(changedWord, 0));
    PASS();
}

TEST(Checksum_PointerOverload) {
    std::vector<uint8_t> data = {0x10, 0x20, 0x30, 0x40, 0x50, 0x60};
    ASSERT_EQ(calculateChecksum(data.data(), 4, 0), 0xA0u);
    ASSERT_EQ(calculateChecksum(data.data(), data.size(), 0), calculateChecksum(data, 0));
    PASS();
}
