#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

#include "xv11_lidar_ros2/byte_stream.hpp"

namespace xv11
{

    class SerialPort : public ByteStream
    {
    public:
        SerialPort();
        ~SerialPort() override;

        SerialPort(const SerialPort &) = delete;
        SerialPort &operator=(const SerialPort &) = delete;

        bool open(const std::string &device);
        bool set_read_timeout(int timeout_ms);
        // Raw 8N1, no flow control.
        bool configure(int baud);
        void close();

        bool read_exact(uint8_t *buf, size_t n) override;
        std::string last_error() const override { return last_error_; }

    private:
        void set_error(const std::string &what, int err);

        int fd_;
        int timeout_ms_;
        std::string last_error_;
    };

} // namespace xv11
