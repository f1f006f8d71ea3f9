#include <gtest/gtest.h>

#include "xv11_lidar_ros2/checksum.hpp"
#include "test_streams.hpp"

using xv11_test::REF_CHECKSUM;
using xv11_test::REF_FRAME;

TEST(Checksum, MatchesReferenceFrame)
{
    EXPECT_EQ(REF_CHECKSUM, xv11::compute_checksum(REF_FRAME.data()));
}

TEST(Checksum, TransmittedChecksumIsLittleEndian)
{
    EXPECT_EQ(0x6BF6, xv11::transmitted_checksum(REF_FRAME));
    EXPECT_TRUE(xv11::checksum_matches(REF_FRAME));
}

TEST(Checksum, IgnoresTrailingChecksumBytes)
{
    xv11::Frame f = REF_FRAME;
    f[20] = 0xA6;
    f[21] = 0xCE;
    EXPECT_EQ(REF_CHECKSUM, xv11::compute_checksum(f.data()));
    EXPECT_FALSE(xv11::checksum_matches(f));
}

TEST(Checksum, AllZeroSpanIsZero)
{
    xv11::Frame f{};
    EXPECT_EQ(0, xv11::compute_checksum(f.data()));
}

TEST(Checksum, ResultFitsFifteenBits)
{
    xv11::Frame f;
    f.fill(0xFF);
    EXPECT_LE(xv11::compute_checksum(f.data()), 0x7FFF);
}

TEST(Checksum, SingleByteChangeIsDetected)
{
    xv11::Frame f = REF_FRAME;
    f[9] ^= 0x01;
    EXPECT_FALSE(xv11::checksum_matches(f));
}
