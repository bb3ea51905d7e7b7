#include "replay_options.h"
#include <cstdint>
#include <gtest/gtest.h>

using seatsense::ChecksumPolicy;

TEST(ReplayOptionsTest, UnsignedWithinRange) {
    unsigned long v = 0;
    EXPECT_TRUE(parseUnsigned("4", UINT16_MAX, v));
    EXPECT_EQ(v, 4ul);
    EXPECT_TRUE(parseUnsigned("65535", UINT16_MAX, v));
    EXPECT_EQ(v, 65535ul);
    EXPECT_TRUE(parseUnsigned("0", UINT8_MAX, v));
    EXPECT_EQ(v, 0ul);
}

TEST(ReplayOptionsTest, OutOfRangeIsRejectedNotWrapped) {
    unsigned long v = 7;
    EXPECT_FALSE(parseUnsigned("65537", UINT16_MAX, v));
    EXPECT_FALSE(parseUnsigned("256", UINT8_MAX, v));
    EXPECT_FALSE(parseUnsigned("99999999999999999999999", UINT32_MAX, v));
    EXPECT_EQ(v, 7ul);
}

TEST(ReplayOptionsTest, MalformedNumbersAreRejected) {
    unsigned long v = 7;
    EXPECT_FALSE(parseUnsigned("-1", UINT8_MAX, v));
    EXPECT_FALSE(parseUnsigned("+3", UINT8_MAX, v));
    EXPECT_FALSE(parseUnsigned("", UINT8_MAX, v));
    EXPECT_FALSE(parseUnsigned("12abc", UINT8_MAX, v));
    EXPECT_EQ(v, 7ul);

    float f = 5.0f;
    EXPECT_TRUE(parseFloat("4.5", f));
    EXPECT_FLOAT_EQ(f, 4.5f);
    EXPECT_FALSE(parseFloat("4.5C", f));
    EXPECT_FALSE(parseFloat("", f));
    EXPECT_FALSE(parseFloat("1e99", f));
    EXPECT_FLOAT_EQ(f, 4.5f);
}

TEST(ReplayOptionsTest, ChecksumPolicyNames) {
    ChecksumPolicy p = ChecksumPolicy::ADDITIVE16_FRAME;
    EXPECT_TRUE(parseChecksumPolicy("additive8-payload", p));
    EXPECT_EQ(p, ChecksumPolicy::ADDITIVE8_PAYLOAD);
    EXPECT_TRUE(parseChecksumPolicy("additive16-payload", p));
    EXPECT_EQ(p, ChecksumPolicy::ADDITIVE16_PAYLOAD);
    EXPECT_FALSE(parseChecksumPolicy("crc16", p));
    EXPECT_EQ(p, ChecksumPolicy::ADDITIVE16_PAYLOAD);
}
