#include "xv11_lidar_ros2/frame_sync.hpp"
#include <thread>

namespace xv11
{

    FrameSynchronizer::FrameSynchronizer(std::chrono::microseconds hunt_interval)
        : hunt_interval_(hunt_interval)
    {
        reset();
    }

    void FrameSynchronizer::reset()
    {
        state_ = State::HUNT;
        dropped_ = 0;
        last_error_.clear();
    }

    bool FrameSynchronizer::read(ByteStream &stream, uint8_t *buf, size_t n)
    {
        if (stream.read_exact(buf, n))
            return true;
        last_error_ = stream.last_error();
        return false;
    }

    bool FrameSynchronizer::hunt(ByteStream &stream, Frame &frame)
    {
        dropped_ = 0;
        while (true)
        {
            if (hunt_interval_.count() > 0)
                std::this_thread::sleep_for(hunt_interval_);

            if (!read(stream, &frame[0], 1))
                return false;
            if (frame[0] != kStartByte)
            {
                ++dropped_;
                continue;
            }

            if (!read(stream, &frame[1], kFrameSize - 1))
                return false;
            if (!valid_index_byte(frame[1]))
            {
                // false start; the 21 bytes are not rescanned
                dropped_ += kFrameSize;
                continue;
            }
            return true;
        }
    }

    FrameSynchronizer::Result FrameSynchronizer::next(ByteStream &stream, Frame &frame)
    {
        switch (state_)
        {
        case State::HUNT:
            if (!hunt(stream, frame))
                return Result::ReadError;
            state_ = State::LOCKED;
            return Result::FrameReady;

        case State::LOCKED:
            if (!read(stream, frame.data(), frame.size()))
                return Result::ReadError;
            if (!valid_header(frame))
            {
                state_ = State::HUNT;
                return Result::ResyncRequired;
            }
            return Result::FrameReady;
        }
        return Result::ReadError;
    }

} // namespace xv11
