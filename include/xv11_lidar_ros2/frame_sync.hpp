#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "xv11_lidar_ros2/byte_stream.hpp"
#include "xv11_lidar_ros2/protocol.hpp"

// Aligns a raw XV-11 byte stream on 22-byte frame boundaries.
//
// HUNT: read one byte at a time until 0xFA, then the remaining 21 bytes.
//       A frame number outside 0xA0..0xF9 throws the bytes away and the
//       single-byte scan resumes with the next unread byte.
// LOCKED: read 22 bytes at once. A bad start byte or frame number drops
//       back to HUNT and is reported as ResyncRequired.
namespace xv11
{

    class FrameSynchronizer
    {
    public:
        enum class Result
        {
            FrameReady,
            ResyncRequired,
            ReadError,
        };

        explicit FrameSynchronizer(std::chrono::microseconds hunt_interval = std::chrono::microseconds(100));

        // Fills frame with the next candidate frame. On ReadError the
        // stream failed and last_error() holds its reason.
        Result next(ByteStream &stream, Frame &frame);

        void reset();
        bool locked() const { return state_ == State::LOCKED; }

        std::string last_error() const { return last_error_; }
        // Bytes skipped while hunting since the last lock.
        size_t dropped_bytes() const { return dropped_; }

    private:
        enum class State
        {
            HUNT,
            LOCKED,
        };

        bool hunt(ByteStream &stream, Frame &frame);
        bool read(ByteStream &stream, uint8_t *buf, size_t n);

        std::chrono::microseconds hunt_interval_;
        State state_;
        size_t dropped_;
        std::string last_error_;
    };

} // namespace xv11
