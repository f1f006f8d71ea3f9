#include "xv11_lidar_ros2/lidar_types.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace xv11
{

    const char *to_string(Command cmd)
    {
        switch (cmd)
        {
        case Command::Run:
            return "Run";
        case Command::Pause:
            return "Pause";
        case Command::Stop:
            return "Stop";
        }
        return "?";
    }

    const char *to_string(ReadingError err)
    {
        switch (err)
        {
        case ReadingError::None:
            return "none";
        case ReadingError::InvalidData:
            return "invalid-data";
        case ReadingError::SignalStrengthWarning:
            return "signal-strength-warning";
        }
        return "?";
    }

    std::string to_string(const DriverError &err)
    {
        std::ostringstream os;
        switch (err.kind)
        {
        case DriverErrorKind::Checksum:
            os << "checksum error in frame " << err.frame_index;
            break;
        case DriverErrorKind::ResyncRequired:
            os << "resync required";
            break;
        case DriverErrorKind::OpenSerialPort:
            os << "unable to open serial port";
            break;
        case DriverErrorKind::SetTimeout:
            os << "unable to set timeout";
            break;
        case DriverErrorKind::Configure:
            os << "unable to configure serial port";
            break;
        case DriverErrorKind::SerialRead:
            os << "unable to read from serial port";
            break;
        }
        if (!err.detail.empty())
            os << ": " << err.detail;
        return os.str();
    }

    std::string to_string(const Packet &pkt)
    {
        std::ostringstream os;
        os.setf(std::ios::fixed);
        os << std::setprecision(2);
        os << "{frame:" << pkt.frame_index() << ", rpm:" << pkt.speed << ", readings:[";
        for (size_t i = 0; i < pkt.readings.size(); ++i)
        {
            const Reading &r = pkt.readings[i];
            if (i)
                os << ", ";
            os << "{idx:" << r.index << ", dist:" << r.distance << ", q:" << r.quality;
            if (r.error == ReadingError::InvalidData)
                os << ", err:0x" << std::hex << std::setw(2) << std::setfill('0') << unsigned(r.error_code)
                   << std::dec << std::setfill(' ');
            else if (r.error == ReadingError::SignalStrengthWarning)
                os << ", warn";
            os << "}";
        }
        os << "]}";
        return os.str();
    }

    std::optional<Command> parse_command(const std::string &text)
    {
        std::string s = text;
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
            s.erase(s.begin());
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
            s.pop_back();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (s == "run")
            return Command::Run;
        if (s == "pause")
            return Command::Pause;
        if (s == "stop")
            return Command::Stop;
        return std::nullopt;
    }

} // namespace xv11
