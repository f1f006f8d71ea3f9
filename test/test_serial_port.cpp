#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <string>
#include <unistd.h>

#include "xv11_lidar_ros2/serial_port.hpp"

namespace
{
    // Pseudo-terminal pair: the test writes on the master, SerialPort reads the slave.
    class SerialPortTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            master_ = posix_openpt(O_RDWR | O_NOCTTY);
            ASSERT_GE(master_, 0);
            ASSERT_EQ(0, grantpt(master_));
            ASSERT_EQ(0, unlockpt(master_));
            const char *name = ptsname(master_);
            ASSERT_NE(nullptr, name);
            slave_name_ = name;

            ASSERT_TRUE(port_.open(slave_name_)) << port_.last_error();
            ASSERT_TRUE(port_.set_read_timeout(200));
            ASSERT_TRUE(port_.configure(115200)) << port_.last_error();
        }

        void TearDown() override
        {
            port_.close();
            close_master();
        }

        void feed(const std::string &bytes)
        {
            ASSERT_EQ(static_cast<ssize_t>(bytes.size()), ::write(master_, bytes.data(), bytes.size()));
        }

        void close_master()
        {
            if (master_ >= 0)
            {
                ::close(master_);
                master_ = -1;
            }
        }

        int master_ = -1;
        std::string slave_name_;
        xv11::SerialPort port_;
    };
}

TEST_F(SerialPortTest, ReadsExactByteCount)
{
    feed("\xFA\xA0\x01");
    uint8_t buf[3] = {};
    ASSERT_TRUE(port_.read_exact(buf, 3)) << port_.last_error();
    EXPECT_EQ(0xFA, buf[0]);
    EXPECT_EQ(0xA0, buf[1]);
    EXPECT_EQ(0x01, buf[2]);
}

TEST_F(SerialPortTest, PartialReadTimesOut)
{
    feed("\x55");
    uint8_t buf[2] = {};
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(port_.read_exact(buf, 2));
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ("operation timed out", port_.last_error());
    EXPECT_GE(waited, std::chrono::milliseconds(150));
    EXPECT_LT(waited, std::chrono::seconds(2));
}

TEST_F(SerialPortTest, ReadFailsAfterPeerCloses)
{
    close_master();
    uint8_t buf[1] = {};
    EXPECT_FALSE(port_.read_exact(buf, 1));
    EXPECT_FALSE(port_.last_error().empty());
    EXPECT_NE("operation timed out", port_.last_error());
}

TEST(SerialPort, OpenMissingDeviceFails)
{
    xv11::SerialPort port;
    EXPECT_FALSE(port.open("/nonexistent/xv11-lidar"));
    EXPECT_NE(std::string::npos, port.last_error().find("open /nonexistent/xv11-lidar"));
}

TEST(SerialPort, ReadOnClosedPortFails)
{
    xv11::SerialPort port;
    uint8_t b = 0;
    EXPECT_FALSE(port.read_exact(&b, 1));
    EXPECT_EQ("port not open", port.last_error());
}

TEST(SerialPort, NegativeTimeoutIsRejected)
{
    xv11::SerialPort port;
    EXPECT_FALSE(port.set_read_timeout(-1));
    EXPECT_EQ("negative timeout", port.last_error());
}
