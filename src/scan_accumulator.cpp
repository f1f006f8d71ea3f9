#include "xv11_lidar_ros2/scan_accumulator.hpp"
#include <limits>
#include <utility>

namespace xv11
{

    ScanAccumulator::ScanAccumulator() { reset(); }

    void ScanAccumulator::reset()
    {
        clear_current();
        last_frame_.reset();
    }

    void ScanAccumulator::clear_current()
    {
        current_.ranges.fill(std::numeric_limits<float>::quiet_NaN());
        current_.intensities.fill(0.0f);
        current_.rpm = 0.0;
        current_.packets = 0;
        rpm_sum_ = 0.0;
    }

    std::optional<Scan> ScanAccumulator::add(const Packet &pkt)
    {
        std::optional<Scan> done;
        const size_t frame = pkt.frame_index();
        if (last_frame_ && frame <= *last_frame_ && current_.packets > 0)
        {
            current_.rpm = rpm_sum_ / static_cast<double>(current_.packets);
            done = std::move(current_);
            clear_current();
        }
        last_frame_ = frame;

        for (const Reading &r : pkt.readings)
        {
            if (r.index >= kReadingsPerScan)
                continue;
            if (r.error == ReadingError::InvalidData)
            {
                current_.ranges[r.index] = std::numeric_limits<float>::quiet_NaN();
                current_.intensities[r.index] = 0.0f;
                continue;
            }
            current_.ranges[r.index] = static_cast<float>(r.distance) / 1000.0f;
            current_.intensities[r.index] = static_cast<float>(r.quality);
        }
        rpm_sum_ += pkt.speed;
        ++current_.packets;
        return done;
    }

} // namespace xv11
