#pragma once

#include "feeder_monitor/sensor_backend.hpp"
#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <string>

namespace feeder_monitor {

struct CalibrationSettings {
  double reference_mass_g{100.0};
  int samples{10};
  std::chrono::milliseconds sample_interval{100};
};

// Converts raw load-cell counts to grams. The config only changes through
// tare(), calibrate() or set_config(); callers serialize those with reads.
class Calibrator {
public:
  explicit Calibrator(const CalibrationSettings & settings = CalibrationSettings(),
                      rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.calibrator"));

  // Records the current raw reading as the zero offset.
  bool tare(SensorBackend & backend);

  // Averages `samples` readings with the reference mass on the scale and sets
  // scale_factor = reference_mass_g / (average - tare_offset). Rejected (and
  // the previous config kept) when no reading arrives or the net average is
  // not positive.
  bool calibrate(SensorBackend & backend, double reference_mass_g);

  double to_grams(double raw) const;

  const CalibrationConfig & config() const { return config_; }
  bool set_config(const CalibrationConfig & cfg);
  const CalibrationSettings & settings() const { return settings_; }

private:
  CalibrationSettings settings_;
  rclcpp::Logger logger_;
  CalibrationConfig config_;
};

bool load_calibration(const std::string & path, CalibrationConfig & out, std::string & err);
bool save_calibration(const std::string & path, const CalibrationConfig & cfg, std::string & err);

} // namespace feeder_monitor
