#include <rclcpp/rclcpp.hpp>
#include <sensor_msgs/msg/laser_scan.hpp>
#include <std_msgs/msg/float32.hpp>
#include <std_msgs/msg/string.hpp>

#include "xv11_lidar_ros2/channel.hpp"
#include "xv11_lidar_ros2/driver.hpp"
#include "xv11_lidar_ros2/lidar_types.hpp"
#include "xv11_lidar_ros2/scan_accumulator.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <thread>
#include <utility>

static constexpr double TWO_PI = 2.0 * M_PI;

// ================= helper utils =================
static sensor_msgs::msg::LaserScan to_laser_scan(const xv11::Scan &scan, const rclcpp::Time &stamp,
                                                 const std::string &frame_id, double range_min, double range_max)
{
    sensor_msgs::msg::LaserScan msg;
    msg.header.stamp = stamp;
    msg.header.frame_id = frame_id;

    const size_t n = scan.ranges.size();
    msg.angle_min = 0.0f;
    msg.angle_increment = static_cast<float>(TWO_PI / n);
    msg.angle_max = static_cast<float>(TWO_PI * (n - 1) / n);
    msg.scan_time = scan.rpm > 0.0 ? static_cast<float>(60.0 / scan.rpm) : 0.0f;
    msg.time_increment = msg.scan_time / static_cast<float>(n);
    msg.range_min = static_cast<float>(range_min);
    msg.range_max = static_cast<float>(range_max);
    msg.ranges.assign(scan.ranges.begin(), scan.ranges.end());
    msg.intensities.assign(scan.intensities.begin(), scan.intensities.end());
    return msg;
}

// ================= main =================
int main(int argc, char **argv)
{
    rclcpp::init(argc, argv);
    auto node = rclcpp::Node::make_shared("xv11_lidar");

    xv11::DriverConfig cfg;
    cfg.port = node->declare_parameter<std::string>("port", "/dev/ttyUSB0");
    cfg.read_timeout = std::chrono::milliseconds(node->declare_parameter<int>("read_timeout_ms", 1000));
    cfg.start_paused = node->declare_parameter<bool>("start_paused", false);

    const std::string frame_id = node->declare_parameter<std::string>("frame_id", "laser");
    const double range_min = node->declare_parameter<double>("range_min", 0.06);
    const double range_max = node->declare_parameter<double>("range_max", 5.0);
    const bool log_packets = node->declare_parameter<bool>("log_packets", false);

    auto scan_pub = node->create_publisher<sensor_msgs::msg::LaserScan>("scan", rclcpp::SensorDataQoS());
    auto rpm_pub = node->create_publisher<std_msgs::msg::Float32>("rpm", rclcpp::QoS(10).reliable());

    auto msg_chan = xv11::make_channel<xv11::DriverMessage>();
    auto cmd_chan = xv11::make_channel<xv11::Command>();
    xv11::Sender<xv11::Command> &cmd_tx = cmd_chan.first;
    xv11::Receiver<xv11::DriverMessage> &msg_rx = msg_chan.second;

    auto cmd_sub = node->create_subscription<std_msgs::msg::String>(
        "command", rclcpp::QoS(10).reliable(),
        [&node, &cmd_tx](std_msgs::msg::String::ConstSharedPtr msg)
        {
            auto cmd = xv11::parse_command(msg->data);
            if (!cmd)
            {
                RCLCPP_WARN(node->get_logger(), "Unknown command '%s' (expected run/pause/stop)", msg->data.c_str());
                return;
            }
            if (!cmd_tx.send(*cmd))
                RCLCPP_WARN(node->get_logger(), "Driver is gone, command %s dropped", xv11::to_string(*cmd));
        });

    RCLCPP_INFO(node->get_logger(), "Opening %s (timeout %lld ms, %s)", cfg.port.c_str(),
                static_cast<long long>(cfg.read_timeout.count()), cfg.start_paused ? "paused" : "running");

    xv11::LidarDriver driver(cfg, node->get_logger().get_child("driver"));
    std::thread worker(
        [&driver, tx = std::move(msg_chan.first), rx = std::move(cmd_chan.second)]() mutable
        {
            driver.run(std::move(tx), std::move(rx));
        });

    xv11::ScanAccumulator acc;
    size_t checksum_errors = 0;
    bool fatal = false;
    bool done = false;

    while (rclcpp::ok() && !done)
    {
        xv11::DriverMessage m;
        auto st = msg_rx.recv_for(m, std::chrono::milliseconds(10));
        if (st == xv11::RecvStatus::Disconnected)
            break;

        if (st == xv11::RecvStatus::Ok)
        {
            if (auto *pkt = std::get_if<xv11::Packet>(&m))
            {
                if (log_packets)
                    RCLCPP_DEBUG(node->get_logger(), "PKT %s", xv11::to_string(*pkt).c_str());

                std_msgs::msg::Float32 rpm;
                rpm.data = static_cast<float>(pkt->speed);
                rpm_pub->publish(rpm);

                if (auto scan = acc.add(*pkt))
                {
                    try
                    {
                        scan_pub->publish(to_laser_scan(*scan, node->now(), frame_id, range_min, range_max));
                        RCLCPP_DEBUG(node->get_logger(), "SCAN %zu packets, %.1f rpm, %zu checksum errors",
                                     scan->packets, scan->rpm, checksum_errors);
                    }
                    catch (const std::exception &e)
                    {
                        RCLCPP_WARN(node->get_logger(), "Scan publish error: %s", e.what());
                    }
                    checksum_errors = 0;
                }
            }
            else if (auto *err = std::get_if<xv11::DriverError>(&m))
            {
                if (err->fatal())
                {
                    RCLCPP_ERROR(node->get_logger(), "Driver failed: %s", xv11::to_string(*err).c_str());
                    fatal = true;
                }
                else if (err->kind == xv11::DriverErrorKind::Checksum)
                {
                    ++checksum_errors;
                }
                else
                {
                    RCLCPP_INFO(node->get_logger(), "Driver resynchronizing");
                }
            }
            else
            {
                RCLCPP_INFO(node->get_logger(), "Driver shut down");
                done = true;
            }
        }

        rclcpp::spin_some(node);
    }

    if (!done && !cmd_tx.send(xv11::Command::Stop))
        RCLCPP_DEBUG(node->get_logger(), "Driver already stopped");
    worker.join();

    rclcpp::shutdown();
    return fatal ? 1 : 0;
}
