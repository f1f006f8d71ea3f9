#include "xv11_lidar_ros2/serial_port.hpp"
#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>

namespace
{
    speed_t baud_to_flag(int baud)
    {
        switch (baud)
        {
        case 9600:
            return B9600;
        case 19200:
            return B19200;
        case 38400:
            return B38400;
        case 57600:
            return B57600;
        case 115200:
            return B115200;
        case 230400:
            return B230400;
        default:
            return B115200;
        }
    }
}

namespace xv11
{

    SerialPort::SerialPort() : fd_(-1), timeout_ms_(1000) {}
    SerialPort::~SerialPort() { close(); }

    void SerialPort::set_error(const std::string &what, int err)
    {
        last_error_ = what + ": " + std::strerror(err);
    }

    bool SerialPort::open(const std::string &device)
    {
        close();
        fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0)
        {
            int err = errno;
            set_error("open " + device, err);
            return false;
        }

        // switch to blocking reads, poll() bounds the wait
        int flags = fcntl(fd_, F_GETFL, 0);
        if (flags < 0 || fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) != 0)
        {
            int err = errno;
            set_error("fcntl " + device, err);
            close();
            return false;
        }
        return true;
    }

    bool SerialPort::set_read_timeout(int timeout_ms)
    {
        if (timeout_ms < 0)
        {
            last_error_ = "negative timeout";
            return false;
        }
        timeout_ms_ = timeout_ms;
        return true;
    }

    bool SerialPort::configure(int baud)
    {
        if (fd_ < 0)
        {
            last_error_ = "port not open";
            return false;
        }

        struct termios tio{};
        if (tcgetattr(fd_, &tio) != 0)
        {
            int err = errno;
            set_error("tcgetattr", err);
            return false;
        }

        cfmakeraw(&tio);
        tio.c_cflag |= (CLOCAL | CREAD);
        tio.c_cflag &= ~CRTSCTS; // no HW flow
        tio.c_iflag &= ~(IXON | IXOFF | IXANY);
        tio.c_cflag &= ~PARENB; // 8N1
        tio.c_cflag &= ~CSTOPB;
        tio.c_cflag &= ~CSIZE;
        tio.c_cflag |= CS8;

        // read() returns whatever is buffered; read_exact() does the waiting
        tio.c_cc[VMIN] = 0;
        tio.c_cc[VTIME] = 0;

        speed_t spd = baud_to_flag(baud);
        cfsetispeed(&tio, spd);
        cfsetospeed(&tio, spd);

        if (tcsetattr(fd_, TCSANOW, &tio) != 0)
        {
            int err = errno;
            set_error("tcsetattr", err);
            return false;
        }
        tcflush(fd_, TCIOFLUSH);
        return true;
    }

    bool SerialPort::read_exact(uint8_t *buf, size_t n)
    {
        if (fd_ < 0)
        {
            last_error_ = "port not open";
            return false;
        }

        using clock = std::chrono::steady_clock;
        const auto deadline = clock::now() + std::chrono::milliseconds(timeout_ms_);
        size_t got = 0;
        while (got < n)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            if (left <= 0)
            {
                last_error_ = "operation timed out";
                return false;
            }

            struct pollfd pfd = {fd_, POLLIN, 0};
            int ret = poll(&pfd, 1, static_cast<int>(left));
            if (ret < 0)
            {
                if (errno == EINTR)
                    continue;
                int err = errno;
                set_error("poll", err);
                return false;
            }
            if (ret == 0)
            {
                last_error_ = "operation timed out";
                return false;
            }
            if (pfd.revents & (POLLERR | POLLNVAL))
            {
                last_error_ = "device error";
                return false;
            }

            ssize_t r = ::read(fd_, buf + got, n - got);
            if (r < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                int err = errno;
                set_error("read", err);
                return false;
            }
            if (r == 0)
            {
                // readable but empty: the device went away
                last_error_ = "device disconnected";
                return false;
            }
            got += static_cast<size_t>(r);
        }
        return true;
    }

    void SerialPort::close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

} // namespace xv11
