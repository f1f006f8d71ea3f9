#include "xv11_lidar_ros2/packet_decoder.hpp"
#include "xv11_lidar_ros2/byte_cursor.hpp"
#include "xv11_lidar_ros2/checksum.hpp"

#include <stdexcept>

namespace xv11
{

    namespace
    {
        Reading make_reading(size_t index, uint16_t raw, uint16_t quality)
        {
            Reading r{index, raw, quality, ReadingError::None, 0};
            if (raw & kInvalidDataFlag)
            {
                // bit 15 wins over bit 14; distance stays raw
                r.error = ReadingError::InvalidData;
                r.error_code = static_cast<uint8_t>(raw & kErrorCodeMask);
            }
            else if (raw & kSignalStrengthFlag)
            {
                r.error = ReadingError::SignalStrengthWarning;
                r.distance = raw & kDistanceMask;
            }
            return r;
        }
    }

    DecodeResult decode_packet(const Frame &frame)
    {
        Cursor c(frame.data(), frame.size());
        c.u8(); // start byte
        const uint8_t index_byte = c.u8();
        if (!valid_index_byte(index_byte))
            throw std::invalid_argument("xv11::decode_packet: index byte out of range");
        const size_t frame_index = static_cast<size_t>(index_byte - kIndexMin);
        const double speed = c.u16() / kSpeedDivisor;

        if (!checksum_matches(frame))
            return ChecksumError{frame_index};

        Packet pkt{};
        pkt.speed = speed;
        for (size_t i = 0; i < kReadingsPerFrame; ++i)
        {
            uint16_t raw = c.u16();
            uint16_t quality = c.u16();
            pkt.readings[i] = make_reading(kReadingsPerFrame * frame_index + i, raw, quality);
        }
        return pkt;
    }

} // namespace xv11
