#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

#include "xv11_lidar_ros2/protocol.hpp"

namespace xv11
{

    enum class ReadingError
    {
        None,
        InvalidData,           // error_code holds the low byte of the distance field
        SignalStrengthWarning, // distance already stripped of the flag
    };

    // One angular measurement. For InvalidData the distance is the raw
    // 16-bit field as transmitted (flag bits included); quality is meaningless.
    struct Reading
    {
        size_t index;     // angular slot 0..359
        int32_t distance; // millimetres
        int32_t quality;
        ReadingError error;
        uint8_t error_code;

        bool operator==(const Reading &o) const
        {
            return index == o.index && distance == o.distance && quality == o.quality &&
                   error == o.error && error_code == o.error_code;
        }
    };

    // Four readings from one frame, all sharing the frame's spin speed.
    struct Packet
    {
        std::array<Reading, kReadingsPerFrame> readings;
        double speed; // RPM

        size_t frame_index() const { return readings[0].index / kReadingsPerFrame; }

        bool operator==(const Packet &o) const { return readings == o.readings && speed == o.speed; }
    };

    enum class DriverErrorKind
    {
        Checksum,       // frame_index set
        ResyncRequired,
        OpenSerialPort,
        SetTimeout,
        Configure,
        SerialRead,
    };

    struct DriverError
    {
        DriverErrorKind kind;
        size_t frame_index{0};
        std::string detail;

        bool fatal() const
        {
            return kind != DriverErrorKind::Checksum && kind != DriverErrorKind::ResyncRequired;
        }

        bool operator==(const DriverError &o) const
        {
            return kind == o.kind && frame_index == o.frame_index && detail == o.detail;
        }
    };

    struct Shutdown
    {
        bool operator==(const Shutdown &) const { return true; }
    };

    // Everything the driver publishes to its consumer.
    using DriverMessage = std::variant<Packet, DriverError, Shutdown>;

    enum class Command
    {
        Run,
        Pause,
        Stop,
    };

    const char *to_string(Command cmd);
    const char *to_string(ReadingError err);
    std::string to_string(const DriverError &err);
    std::string to_string(const Packet &pkt);

    // Accepts "run", "pause", "stop" in any case, surrounding blanks ignored.
    std::optional<Command> parse_command(const std::string &text);

} // namespace xv11
