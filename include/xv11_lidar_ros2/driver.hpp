#pragma once
#include <chrono>
#include <optional>
#include <string>

#include <rclcpp/logger.hpp>

#include "xv11_lidar_ros2/byte_stream.hpp"
#include "xv11_lidar_ros2/channel.hpp"
#include "xv11_lidar_ros2/lidar_types.hpp"

namespace xv11
{

    struct DriverConfig
    {
        std::string port{"/dev/ttyUSB0"};
        int baud{115200};
        std::chrono::milliseconds read_timeout{1000};
        bool start_paused{false};
        // Sleep before every loop iteration.
        std::chrono::microseconds poll_interval{1000};
        // Sleep before every single-byte read while hunting for 0xFA.
        std::chrono::microseconds hunt_interval{100};
    };

    // Supervisory loop for one XV-11 sensor. Meant to run on a dedicated
    // thread: it owns the stream while running and talks to the rest of the
    // program only through the two channels.
    //
    // Every decode outcome is sent on tx. The loop ends on Stop, on a
    // disconnected command channel, on a transport failure or when tx has
    // no receiver left, and always tries to send Shutdown last.
    // Without a command channel the loop never pauses.
    class LidarDriver
    {
    public:
        explicit LidarDriver(DriverConfig cfg,
                             rclcpp::Logger logger = rclcpp::get_logger("xv11_driver"));

        // Opens and configures cfg.port, then runs the loop.
        void run(Sender<DriverMessage> tx,
                 std::optional<Receiver<Command>> commands = std::nullopt);

        // Runs the loop over a stream that is already open.
        void run_stream(ByteStream &stream, Sender<DriverMessage> tx,
                        std::optional<Receiver<Command>> commands = std::nullopt);

    private:
        bool publish(Sender<DriverMessage> &tx, DriverMessage msg);
        void send_shutdown(Sender<DriverMessage> &tx);
        void fail_startup(Sender<DriverMessage> &tx, DriverErrorKind kind, const std::string &detail);

        DriverConfig cfg_;
        rclcpp::Logger logger_;
    };

} // namespace xv11
