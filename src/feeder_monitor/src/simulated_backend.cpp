#include "feeder_monitor/simulated_backend.hpp"

#include <algorithm>

namespace feeder_monitor {

SimulatedBackend::SimulatedBackend(const SimulationConfig & cfg, rclcpp::Logger logger)
: cfg_(cfg), logger_(logger), rng_(cfg.seed),
  raw_weight_(cfg.initial_raw_weight), water_level_(cfg.initial_water_level)
{
  RCLCPP_WARN(logger_, "Hardware not available - running in simulation mode");
}

std::optional<double> SimulatedBackend::read_weight()
{
  settle_motor();
  if (cfg_.weight_jitter > 0.0) {
    std::uniform_real_distribution<double> jitter(-cfg_.weight_jitter, cfg_.weight_jitter);
    raw_weight_ = std::max(0.0, raw_weight_ + jitter(rng_));
  }
  return raw_weight_;
}

std::optional<double> SimulatedBackend::read_water_echo()
{
  if (cfg_.water_jitter > 0.0) {
    std::uniform_real_distribution<double> jitter(-cfg_.water_jitter, cfg_.water_jitter);
    water_level_ = std::clamp(water_level_ + jitter(rng_), 0.0, 100.0);
  }
  return echo_for_water_level(water_level_, cfg_.max_distance_cm);
}

void SimulatedBackend::drive(double duty_percent)
{
  settle_motor();
  duty_ = std::clamp(duty_percent, 0.0, 100.0);
  motor_since_ = std::chrono::steady_clock::now();
  RCLCPP_DEBUG(logger_, "Simulated motor duty=%.0f%%", duty_);
}

void SimulatedBackend::stop_motor()
{
  settle_motor();
  duty_ = 0.0;
}

// Credit the food the motor pushed out since the last duty change.
void SimulatedBackend::settle_motor()
{
  if (duty_ <= 0.0) return;
  const auto now = std::chrono::steady_clock::now();
  const double elapsed = std::chrono::duration<double>(now - motor_since_).count();
  raw_weight_ += elapsed * cfg_.motor_raw_per_s * duty_ / 100.0;
  motor_since_ = now;
}

std::optional<cv::Mat> SimulatedBackend::capture()
{
  // Mid-grey frame at the usual camera resolution
  return cv::Mat(480, 640, CV_8UC3, cv::Scalar(127, 127, 127));
}

void SimulatedBackend::release()
{
  stop_motor();
}

} // namespace feeder_monitor
