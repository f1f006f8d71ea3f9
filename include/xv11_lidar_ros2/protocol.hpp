#pragma once
#include <array>
#include <cstdint>
#include <cstddef>

// Neato XV-11 wire format, 22 bytes per frame, little-endian:
//
// START=0xFA, INDEX (0xA0..0xF9), SPEED_L, SPEED_H,
// 4 x [DIST_L, DIST_H|flags, QUAL_L, QUAL_H],
// CHK_L, CHK_H
//
// Distance flags (high byte of DIST):
//  - bit 15: invalid data, low byte carries the error code
//  - bit 14: signal strength warning
namespace xv11
{

    constexpr size_t kFrameSize = 22;
    constexpr size_t kChecksumSpan = 20;
    constexpr size_t kReadingsPerFrame = 4;
    constexpr size_t kFramesPerScan = 90;
    constexpr size_t kReadingsPerScan = kFramesPerScan * kReadingsPerFrame;

    constexpr uint8_t kStartByte = 0xFA;
    constexpr uint8_t kIndexMin = 0xA0;
    constexpr uint8_t kIndexMax = 0xF9;

    constexpr uint16_t kInvalidDataFlag = 0x8000;
    constexpr uint16_t kSignalStrengthFlag = 0x4000;
    constexpr uint16_t kDistanceMask = 0x3FFF;
    constexpr uint16_t kErrorCodeMask = 0x00FF;

    constexpr double kSpeedDivisor = 64.0;

    using Frame = std::array<uint8_t, kFrameSize>;

    inline bool valid_index_byte(uint8_t b)
    {
        return b >= kIndexMin && b <= kIndexMax;
    }

    // Start marker and frame number both plausible.
    inline bool valid_header(const Frame &frame)
    {
        return frame[0] == kStartByte && valid_index_byte(frame[1]);
    }

} // namespace xv11
