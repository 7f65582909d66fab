#pragma once

#include "feeder_monitor/sensor_backend.hpp"

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <random>

namespace feeder_monitor {

struct SimulationConfig {
  double initial_raw_weight{0.0};
  double initial_water_level{100.0};
  double weight_jitter{1.0};      // +/- raw counts per read
  double water_jitter{2.0};       // +/- percent per read
  double motor_raw_per_s{10.0};   // raw counts added per second at full duty
  double max_distance_cm{20.0};
  unsigned int seed{42};
};

// Stand-in rig used when no hardware is present. Every read perturbs the
// previous value by a bounded jitter from a seeded generator.
class SimulatedBackend : public SensorBackend {
public:
  explicit SimulatedBackend(const SimulationConfig & cfg = SimulationConfig(),
                            rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.simulation"));

  BackendKind kind() const override { return BackendKind::Simulated; }
  bool hardware_available() const override { return false; }

  std::optional<double> read_weight() override;
  std::optional<double> read_water_echo() override;
  void drive(double duty_percent) override;
  void stop_motor() override;
  std::optional<cv::Mat> capture() override;
  void release() override;

  // Scenario hooks
  void set_raw_weight(double raw) { raw_weight_ = raw; }
  void set_water_level(double percent) { water_level_ = percent; }
  double raw_weight() const { return raw_weight_; }
  bool motor_running() const { return duty_ > 0.0; }

private:
  void settle_motor();

  SimulationConfig cfg_;
  rclcpp::Logger logger_;
  std::mt19937 rng_;
  double raw_weight_{0.0};
  double water_level_{100.0};
  double duty_{0.0};
  std::chrono::steady_clock::time_point motor_since_{};
};

} // namespace feeder_monitor
