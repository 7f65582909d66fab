#include "feeder_monitor/real_backend.hpp"

#include <cstdint>
#include <thread>

using namespace std::chrono_literals;

namespace feeder_monitor {

namespace
{

// Spin until the line reaches `level` or the deadline passes.
bool wait_level(SysfsGpio & line, bool level, std::chrono::steady_clock::time_point deadline)
{
  while (line.read() != level) {
    if (std::chrono::steady_clock::now() > deadline) return false;
  }
  return true;
}

} // namespace

RealBackend::RealBackend(const HardwareConfig & cfg, rclcpp::Logger logger)
: cfg_(cfg), logger_(logger)
{
  ensure_open();
  RCLCPP_INFO(logger_, "Hardware rig ready: HX711 on GPIO %d/%d, HC-SR04 on GPIO %d/%d, motor on %s/pwm%d",
              cfg_.hx_data_pin, cfg_.hx_clock_pin, cfg_.water_trig_pin, cfg_.water_echo_pin,
              cfg_.pwm_chip.c_str(), cfg_.pwm_channel);
}

RealBackend::~RealBackend()
{
  try {
    release();
  } catch (const HardwareError & e) {
    RCLCPP_ERROR(logger_, "Release on shutdown failed: %s", e.what());
  }
}

void RealBackend::ensure_open()
{
  using Dir = SysfsGpio::Direction;
  if (!hx_data_) hx_data_ = std::make_unique<SysfsGpio>(cfg_.gpio_base + cfg_.hx_data_pin, Dir::In, cfg_.gpio_root);
  if (!hx_clock_) {
    hx_clock_ = std::make_unique<SysfsGpio>(cfg_.gpio_base + cfg_.hx_clock_pin, Dir::Out, cfg_.gpio_root);
    // PD_SCK low powers the HX711 up
    hx_clock_->write(false);
  }
  if (!trig_) {
    trig_ = std::make_unique<SysfsGpio>(cfg_.gpio_base + cfg_.water_trig_pin, Dir::Out, cfg_.gpio_root);
    trig_->write(false);
  }
  if (!echo_) echo_ = std::make_unique<SysfsGpio>(cfg_.gpio_base + cfg_.water_echo_pin, Dir::In, cfg_.gpio_root);
  if (!motor_) motor_ = std::make_unique<SysfsPwm>(cfg_.pwm_chip, cfg_.pwm_channel, cfg_.pwm_period_ns);
}

std::optional<double> RealBackend::read_weight()
{
  ensure_open();
  // DOUT goes low when a conversion is ready (10 or 80 SPS)
  const auto deadline = std::chrono::steady_clock::now() + cfg_.hx_ready_timeout;
  while (hx_data_->read()) {
    if (std::chrono::steady_clock::now() > deadline) {
      RCLCPP_DEBUG(logger_, "HX711 not ready within %lld ms",
                   static_cast<long long>(cfg_.hx_ready_timeout.count()));
      return std::nullopt;
    }
    std::this_thread::sleep_for(1ms);
  }

  uint32_t value = 0;
  for (int i = 0; i < 24; ++i) {
    hx_clock_->write(true);
    hx_clock_->write(false);
    value = (value << 1) | (hx_data_->read() ? 1u : 0u);
  }
  // 25th pulse: channel A, gain 128 for the next conversion
  hx_clock_->write(true);
  hx_clock_->write(false);

  // 24-bit two's complement
  int32_t counts = static_cast<int32_t>(value);
  if (value & 0x800000u) counts = static_cast<int32_t>(value | 0xFF000000u);
  return static_cast<double>(counts);
}

std::optional<double> RealBackend::read_water_echo()
{
  ensure_open();
  trig_->write(true);
  std::this_thread::sleep_for(10us);
  trig_->write(false);

  auto deadline = std::chrono::steady_clock::now() + cfg_.echo_timeout;
  if (!wait_level(*echo_, true, deadline)) {
    RCLCPP_DEBUG(logger_, "Ultrasonic echo never started");
    return std::nullopt;
  }
  const auto rise = std::chrono::steady_clock::now();
  deadline = rise + cfg_.echo_timeout;
  if (!wait_level(*echo_, false, deadline)) {
    RCLCPP_DEBUG(logger_, "Ultrasonic echo never ended");
    return std::nullopt;
  }
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - rise).count();
}

void RealBackend::drive(double duty_percent)
{
  ensure_open();
  motor_->set_duty_percent(duty_percent);
  motor_->enable(duty_percent > 0.0);
}

void RealBackend::stop_motor()
{
  if (!motor_) return;
  motor_->set_duty_percent(0.0);
  motor_->enable(false);
}

std::optional<cv::Mat> RealBackend::capture()
{
  if (!camera_.isOpened()) {
    if (!camera_.open(cfg_.camera_device)) {
      throw HardwareError("Failed to open camera device " + std::to_string(cfg_.camera_device));
    }
  }
  cv::Mat frame;
  if (!camera_.read(frame) || frame.empty()) {
    RCLCPP_WARN(logger_, "Camera returned no frame");
    return std::nullopt;
  }
  return frame;
}

void RealBackend::release()
{
  stop_motor();
  motor_.reset();
  hx_data_.reset();
  hx_clock_.reset();
  trig_.reset();
  echo_.reset();
  if (camera_.isOpened()) camera_.release();
}

} // namespace feeder_monitor
