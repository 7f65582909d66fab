#pragma once

#include "feeder_monitor/sensor_backend.hpp"
#include "feeder_monitor/sysfs_io.hpp"

#include <opencv2/videoio.hpp>
#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace feeder_monitor {

struct HardwareConfig {
  std::string gpio_root{"/sys/class/gpio"};
  int gpio_base{0};           // added to the BCM numbers below
  int hx_data_pin{5};
  int hx_clock_pin{6};
  int water_trig_pin{23};
  int water_echo_pin{24};
  std::string pwm_chip{"/sys/class/pwm/pwmchip0"};
  int pwm_channel{0};
  long pwm_period_ns{1000000};
  int camera_device{0};
  std::chrono::milliseconds hx_ready_timeout{200};
  std::chrono::milliseconds echo_timeout{100};
};

// HX711 load cell + HC-SR04 ultrasonic + PWM feeder motor + V4L2 camera,
// all on the host's GPIO header.
class RealBackend : public SensorBackend {
public:
  // Claims the lines immediately; throws HardwareError if they are unusable.
  explicit RealBackend(const HardwareConfig & cfg,
                       rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.hardware"));
  ~RealBackend() override;

  BackendKind kind() const override { return BackendKind::Real; }
  bool hardware_available() const override { return true; }

  std::optional<double> read_weight() override;
  std::optional<double> read_water_echo() override;
  void drive(double duty_percent) override;
  void stop_motor() override;
  std::optional<cv::Mat> capture() override;
  void release() override;

private:
  void ensure_open();

  HardwareConfig cfg_;
  rclcpp::Logger logger_;
  std::unique_ptr<SysfsGpio> hx_data_;
  std::unique_ptr<SysfsGpio> hx_clock_;
  std::unique_ptr<SysfsGpio> trig_;
  std::unique_ptr<SysfsGpio> echo_;
  std::unique_ptr<SysfsPwm> motor_;
  cv::VideoCapture camera_;
};

} // namespace feeder_monitor
