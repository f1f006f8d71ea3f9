#include "xv11_lidar_ros2/driver.hpp"
#include "xv11_lidar_ros2/frame_sync.hpp"
#include "xv11_lidar_ros2/packet_decoder.hpp"
#include "xv11_lidar_ros2/serial_port.hpp"

#include <rclcpp/logging.hpp>

#include <thread>
#include <utility>

namespace xv11
{

    LidarDriver::LidarDriver(DriverConfig cfg, rclcpp::Logger logger)
        : cfg_(std::move(cfg)), logger_(std::move(logger))
    {
    }

    bool LidarDriver::publish(Sender<DriverMessage> &tx, DriverMessage msg)
    {
        if (tx.send(std::move(msg)))
            return true;
        RCLCPP_ERROR(logger_, "Unable to send message, receiver is gone");
        return false;
    }

    void LidarDriver::fail_startup(Sender<DriverMessage> &tx, DriverErrorKind kind, const std::string &detail)
    {
        DriverError err{kind, 0, detail};
        RCLCPP_ERROR(logger_, "%s", to_string(err).c_str());
        if (publish(tx, err))
            send_shutdown(tx);
    }

    void LidarDriver::send_shutdown(Sender<DriverMessage> &tx)
    {
        RCLCPP_INFO(logger_, "Shutting down lidar");
        if (!tx.send(Shutdown{}))
            RCLCPP_DEBUG(logger_, "Shutdown not delivered, receiver is gone");
    }

    void LidarDriver::run(Sender<DriverMessage> tx, std::optional<Receiver<Command>> commands)
    {
        SerialPort port;
        if (!port.open(cfg_.port))
        {
            fail_startup(tx, DriverErrorKind::OpenSerialPort, port.last_error());
            return;
        }
        RCLCPP_INFO(logger_, "Opened serial port %s", cfg_.port.c_str());

        if (!port.set_read_timeout(static_cast<int>(cfg_.read_timeout.count())))
        {
            fail_startup(tx, DriverErrorKind::SetTimeout, port.last_error());
            return;
        }
        RCLCPP_INFO(logger_, "Read timeout set to %lld ms", static_cast<long long>(cfg_.read_timeout.count()));

        if (!port.configure(cfg_.baud))
        {
            fail_startup(tx, DriverErrorKind::Configure, port.last_error());
            return;
        }
        RCLCPP_INFO(logger_, "Configured %s @ %d baud 8N1", cfg_.port.c_str(), cfg_.baud);

        run_stream(port, std::move(tx), std::move(commands));
    }

    void LidarDriver::run_stream(ByteStream &stream, Sender<DriverMessage> tx,
                                 std::optional<Receiver<Command>> commands)
    {
        Frame buffer{};
        FrameSynchronizer sync(cfg_.hunt_interval);
        bool paused = commands && cfg_.start_paused;
        bool stop = false;

        if (paused)
            RCLCPP_INFO(logger_, "Starting paused, waiting for Run");

        while (!stop)
        {
            if (cfg_.poll_interval.count() > 0)
                std::this_thread::sleep_for(cfg_.poll_interval);

            if (commands)
            {
                Command cmd = Command::Run;
                switch (commands->try_recv(cmd))
                {
                case RecvStatus::Ok:
                    RCLCPP_INFO(logger_, "Received command %s", to_string(cmd));
                    if (cmd == Command::Run)
                        paused = false;
                    else if (cmd == Command::Pause)
                        paused = true;
                    else
                        stop = true;
                    break;
                case RecvStatus::Empty:
                    break;
                case RecvStatus::Disconnected:
                    RCLCPP_ERROR(logger_, "Command channel disconnected");
                    stop = true;
                    break;
                }
            }
            if (stop)
                break;
            if (paused)
                continue;

            buffer.fill(0);

            const bool was_locked = sync.locked();
            auto r = sync.next(stream, buffer);
            if (r == FrameSynchronizer::Result::ReadError)
            {
                DriverError err{DriverErrorKind::SerialRead, 0, sync.last_error()};
                RCLCPP_ERROR(logger_, "%s", to_string(err).c_str());
                // fatal either way; publish() logs a lost report
                publish(tx, std::move(err));
                break;
            }
            if (r == FrameSynchronizer::Result::ResyncRequired)
            {
                RCLCPP_WARN(logger_, "Corrupted data, resync required");
                if (!publish(tx, DriverError{DriverErrorKind::ResyncRequired, 0, ""}))
                    break;
                continue;
            }
            if (!was_locked && sync.dropped_bytes() > 0)
                RCLCPP_DEBUG(logger_, "SYNC: dropped %zu bytes before frame", sync.dropped_bytes());

            DriverMessage msg;
            auto decoded = decode_packet(buffer);
            if (auto *pkt = std::get_if<Packet>(&decoded))
            {
                msg = std::move(*pkt);
            }
            else
            {
                size_t idx = std::get<ChecksumError>(decoded).frame_index;
                RCLCPP_WARN(logger_, "Checksum error in frame %zu, data is corrupted", idx);
                msg = DriverError{DriverErrorKind::Checksum, idx, ""};
            }
            if (!publish(tx, std::move(msg)))
                break;
        }

        send_shutdown(tx);
    }

} // namespace xv11
