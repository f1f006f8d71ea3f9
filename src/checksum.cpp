#include "xv11_lidar_ros2/checksum.hpp"
#include "xv11_lidar_ros2/byte_cursor.hpp"

namespace xv11
{

    uint16_t compute_checksum(const uint8_t *data)
    {
        Cursor c(data, kChecksumSpan);
        uint32_t chk32 = 0;
        for (size_t i = 0; i < kChecksumSpan / 2; ++i)
            chk32 = (chk32 << 1) + c.u16();

        // wrap around to fit into 15 bits
        uint32_t folded = (chk32 & 0x7FFFu) + (chk32 >> 15);
        return static_cast<uint16_t>(folded & 0x7FFFu);
    }

    uint16_t transmitted_checksum(const Frame &frame)
    {
        Cursor c(frame.data() + kChecksumSpan, kFrameSize - kChecksumSpan);
        return c.u16();
    }

    bool checksum_matches(const Frame &frame)
    {
        return compute_checksum(frame.data()) == transmitted_checksum(frame);
    }

} // namespace xv11
