#pragma once
#include <array>
#include <cstddef>
#include <optional>

#include "xv11_lidar_ros2/lidar_types.hpp"
#include "xv11_lidar_ros2/protocol.hpp"

namespace xv11
{

    // One revolution, slot i = i degrees.
    struct Scan
    {
        std::array<float, kReadingsPerScan> ranges;      // metres, NaN = no valid reading
        std::array<float, kReadingsPerScan> intensities; // raw quality, 0 when invalid
        double rpm{0.0};                                 // mean over the packets received
        size_t packets{0};
    };

    // Consumer-side assembly of packets into full scans. A revolution ends
    // when the frame index stops increasing.
    class ScanAccumulator
    {
    public:
        ScanAccumulator();

        // Returns the finished scan when pkt opens a new revolution.
        std::optional<Scan> add(const Packet &pkt);

        void reset();
        size_t pending_packets() const { return current_.packets; }

    private:
        void clear_current();

        Scan current_;
        double rpm_sum_;
        std::optional<size_t> last_frame_;
    };

} // namespace xv11
