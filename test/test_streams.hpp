#pragma once
#include <chrono>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "xv11_lidar_ros2/byte_stream.hpp"
#include "xv11_lidar_ros2/checksum.hpp"
#include "xv11_lidar_ros2/channel.hpp"
#include "xv11_lidar_ros2/lidar_types.hpp"
#include "xv11_lidar_ros2/protocol.hpp"

namespace xv11_test
{

    // Reference frame captured from a real sensor.
    inline const xv11::Frame REF_FRAME = {0xFA, 0xB1, 0xE3, 0x49, 0xE4, 0x00, 0xE1, 0x05, 0xE2, 0x00, 0x34,
                                          0x06, 0xE0, 0x00, 0x25, 0x06, 0xDF, 0x00, 0x84, 0x06, 0xF6, 0x6B};
    constexpr uint16_t REF_CHECKSUM = 0x6BF6;

    struct RawReading
    {
        uint16_t distance; // flags included
        uint16_t quality;
    };

    // Well-formed frame with a correct checksum.
    inline xv11::Frame make_frame(size_t frame_index, uint16_t speed_raw, const RawReading (&r)[4])
    {
        xv11::Frame f{};
        f[0] = xv11::kStartByte;
        f[1] = static_cast<uint8_t>(xv11::kIndexMin + frame_index);
        f[2] = uint8_t(speed_raw & 0xFF);
        f[3] = uint8_t(speed_raw >> 8);
        for (size_t i = 0; i < 4; ++i)
        {
            f[4 + 4 * i] = uint8_t(r[i].distance & 0xFF);
            f[5 + 4 * i] = uint8_t(r[i].distance >> 8);
            f[6 + 4 * i] = uint8_t(r[i].quality & 0xFF);
            f[7 + 4 * i] = uint8_t(r[i].quality >> 8);
        }
        uint16_t chk = xv11::compute_checksum(f.data());
        f[20] = uint8_t(chk & 0xFF);
        f[21] = uint8_t(chk >> 8);
        return f;
    }

    // 300 rpm, four clean readings of about one metre.
    inline xv11::Frame plain_frame(size_t frame_index)
    {
        const RawReading r[4] = {{1000, 200}, {1010, 210}, {1020, 220}, {1030, 230}};
        return make_frame(frame_index, 300 * 64, r);
    }

    inline void append(std::vector<uint8_t> &out, const xv11::Frame &f)
    {
        out.insert(out.end(), f.begin(), f.end());
    }

    // Finite in-memory stream; running dry is a read failure.
    class ScriptedStream : public xv11::ByteStream
    {
    public:
        explicit ScriptedStream(std::vector<uint8_t> bytes) : data_(std::move(bytes)) {}

        bool read_exact(uint8_t *buf, size_t n) override
        {
            ++reads_;
            if (pos_ + n > data_.size())
            {
                last_error_ = "end of stream";
                return false;
            }
            std::memcpy(buf, data_.data() + pos_, n);
            pos_ += n;
            return true;
        }

        std::string last_error() const override { return last_error_; }

        size_t reads() const { return reads_; }
        size_t consumed() const { return pos_; }

    private:
        std::vector<uint8_t> data_;
        size_t pos_{0};
        size_t reads_{0};
        std::string last_error_;
    };

    // Endless stream repeating the same bytes, each read taking a little time.
    class CyclicStream : public xv11::ByteStream
    {
    public:
        CyclicStream(std::vector<uint8_t> bytes, std::chrono::microseconds delay)
            : data_(std::move(bytes)), delay_(delay) {}

        bool read_exact(uint8_t *buf, size_t n) override
        {
            std::this_thread::sleep_for(delay_);
            for (size_t i = 0; i < n; ++i)
            {
                buf[i] = data_[pos_];
                pos_ = (pos_ + 1) % data_.size();
            }
            return true;
        }

        std::string last_error() const override { return ""; }

    private:
        std::vector<uint8_t> data_;
        std::chrono::microseconds delay_;
        size_t pos_{0};
    };

    // Everything left in the channel once the sender side is gone.
    inline std::vector<xv11::DriverMessage> drain(xv11::Receiver<xv11::DriverMessage> &rx)
    {
        std::vector<xv11::DriverMessage> out;
        xv11::DriverMessage m;
        while (rx.try_recv(m) == xv11::RecvStatus::Ok)
            out.push_back(std::move(m));
        return out;
    }

} // namespace xv11_test
