#pragma once
#include <cstdint>
#include "xv11_lidar_ros2/protocol.hpp"

namespace xv11
{

    // 15-bit checksum over the first 20 bytes of a frame:
    // 10 little-endian words, acc = (acc << 1) + word, folded to 15 bits.
    uint16_t compute_checksum(const uint8_t *data);

    // Checksum transmitted in bytes 20..21.
    uint16_t transmitted_checksum(const Frame &frame);

    bool checksum_matches(const Frame &frame);

} // namespace xv11
