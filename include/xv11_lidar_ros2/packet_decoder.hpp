#pragma once
#include <cstddef>
#include <variant>

#include "xv11_lidar_ros2/lidar_types.hpp"
#include "xv11_lidar_ros2/protocol.hpp"

namespace xv11
{

    struct ChecksumError
    {
        size_t frame_index;

        bool operator==(const ChecksumError &o) const { return frame_index == o.frame_index; }
    };

    using DecodeResult = std::variant<Packet, ChecksumError>;

    // Decodes one 22-byte frame. frame[1] must lie in [0xA0, 0xF9], otherwise
    // std::invalid_argument is thrown. On checksum mismatch no reading is decoded.
    DecodeResult decode_packet(const Frame &frame);

} // namespace xv11
