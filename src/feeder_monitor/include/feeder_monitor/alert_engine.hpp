#pragma once

#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <functional>
#include <vector>

namespace feeder_monitor {

struct AlertThresholds {
  double min_food_weight_g{10.0};
  double min_water_level_pct{20.0};
};

// Low food / low water alerts, latched per kind: raised once when the value
// drops below its minimum, cleared when it is back at or above it.
class AlertEngine {
public:
  using Listener = std::function<void(const Alert &)>;

  explicit AlertEngine(const AlertThresholds & thresholds = AlertThresholds(),
                       rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.alerts"));

  // Returns the alerts raised by this evaluation (usually none).
  std::vector<Alert> evaluate(double food_g, double water_pct);

  bool active(AlertKind kind) const;
  std::vector<Alert> active_alerts() const;

  void set_listener(Listener l) { listener_ = std::move(l); }
  const AlertThresholds & thresholds() const { return thresholds_; }

private:
  bool step(AlertKind kind, bool below, const std::string & message, std::vector<Alert> & raised);

  AlertThresholds thresholds_;
  rclcpp::Logger logger_;
  Listener listener_;
  bool food_low_{false};
  bool water_low_{false};
  std::string food_message_;
  std::string water_message_;
};

} // namespace feeder_monitor
