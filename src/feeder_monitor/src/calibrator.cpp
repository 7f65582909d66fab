#include "feeder_monitor/calibrator.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <thread>

namespace feeder_monitor {

Calibrator::Calibrator(const CalibrationSettings & settings, rclcpp::Logger logger)
: settings_(settings), logger_(logger)
{
  config_.reference_mass_g = settings_.reference_mass_g;
}

bool Calibrator::tare(SensorBackend & backend)
{
  const auto raw = backend.read_weight();
  if (!raw) {
    RCLCPP_WARN(logger_, "Tare failed: no reading from load cell");
    return false;
  }
  config_.tare_offset = *raw;
  RCLCPP_INFO(logger_, "Tare complete. Offset: %.3f", config_.tare_offset);
  return true;
}

bool Calibrator::calibrate(SensorBackend & backend, double reference_mass_g)
{
  if (reference_mass_g <= 0.0) {
    RCLCPP_WARN(logger_, "Rejecting calibration: reference mass %.3f g", reference_mass_g);
    return false;
  }
  RCLCPP_INFO(logger_, "Starting weight sensor calibration with %.1fg reference...", reference_mass_g);

  const int n = std::max(1, settings_.samples);
  double sum = 0.0;
  int valid = 0;
  for (int i = 0; i < n; ++i) {
    if (auto raw = backend.read_weight()) {
      sum += *raw;
      ++valid;
    }
    if (i + 1 < n) std::this_thread::sleep_for(settings_.sample_interval);
  }
  if (valid == 0) {
    RCLCPP_WARN(logger_, "Calibration failed: load cell returned no readings");
    return false;
  }
  const double net = sum / valid - config_.tare_offset;
  if (net <= 0.0) {
    RCLCPP_WARN(logger_, "Calibration failed: net reading %.3f is not positive (is the mass on the scale?)", net);
    return false;
  }
  config_.reference_mass_g = reference_mass_g;
  config_.scale_factor = reference_mass_g / net;
  RCLCPP_INFO(logger_, "Calibration complete. Scale factor: %.6f (%d/%d samples)",
              config_.scale_factor, valid, n);
  return true;
}

double Calibrator::to_grams(double raw) const
{
  return std::max(0.0, (raw - config_.tare_offset) * config_.scale_factor);
}

bool Calibrator::set_config(const CalibrationConfig & cfg)
{
  if (!(cfg.scale_factor > 0.0)) {
    RCLCPP_WARN(logger_, "Ignoring calibration with scale factor %.6f", cfg.scale_factor);
    return false;
  }
  config_ = cfg;
  return true;
}

bool load_calibration(const std::string & path, CalibrationConfig & out, std::string & err)
{
  try {
    YAML::Node root = YAML::LoadFile(path);
    const YAML::Node cal = root["calibration"];
    if (!cal) {
      err = "YAML has no 'calibration' key: " + path;
      return false;
    }
    out.reference_mass_g = cal["reference_mass_g"].as<double>(out.reference_mass_g);
    out.tare_offset = cal["tare_offset"].as<double>(0.0);
    out.scale_factor = cal["scale_factor"].as<double>(1.0);
    return true;
  } catch (const std::exception & e) {
    err = std::string("Failed to load calibration: ") + e.what();
    return false;
  }
}

bool save_calibration(const std::string & path, const CalibrationConfig & cfg, std::string & err)
{
  YAML::Node root;
  YAML::Node cal;
  cal["reference_mass_g"] = cfg.reference_mass_g;
  cal["tare_offset"] = cfg.tare_offset;
  cal["scale_factor"] = cfg.scale_factor;
  root["calibration"] = cal;
  std::ofstream out(path);
  if (!out) {
    err = "Failed to open " + path + " for writing";
    return false;
  }
  out << root << "\n";
  if (!out) {
    err = "Failed to write calibration to " + path;
    return false;
  }
  return true;
}

} // namespace feeder_monitor
