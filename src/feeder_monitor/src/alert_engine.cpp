#include "feeder_monitor/alert_engine.hpp"

#include <cstdio>

namespace feeder_monitor {

namespace
{

std::string format_message(const char * fmt, double value)
{
  char buf[96];
  std::snprintf(buf, sizeof(buf), fmt, value);
  return buf;
}

} // namespace

AlertEngine::AlertEngine(const AlertThresholds & thresholds, rclcpp::Logger logger)
: thresholds_(thresholds), logger_(logger)
{
}

std::vector<Alert> AlertEngine::evaluate(double food_g, double water_pct)
{
  std::vector<Alert> raised;
  const auto food_msg = format_message("Food level low: %.1fg remaining", food_g);
  const auto water_msg = format_message("Water level low: %.1f%%", water_pct);
  if (step(AlertKind::FoodLow, food_g < thresholds_.min_food_weight_g, food_msg, raised)) {
    food_message_ = food_msg;
  }
  if (step(AlertKind::WaterLow, water_pct < thresholds_.min_water_level_pct, water_msg, raised)) {
    water_message_ = water_msg;
  }
  for (const auto & a : raised) {
    RCLCPP_WARN(logger_, "ALERT: %s", a.message.c_str());
    if (listener_) listener_(a);
  }
  return raised;
}

// Returns true when the latch went from clear to raised.
bool AlertEngine::step(AlertKind kind, bool below, const std::string & message, std::vector<Alert> & raised)
{
  bool & latch = (kind == AlertKind::FoodLow) ? food_low_ : water_low_;
  if (below && !latch) {
    latch = true;
    raised.push_back(Alert{kind, message, true});
    return true;
  }
  if (!below && latch) {
    latch = false;
    RCLCPP_INFO(logger_, "Alert cleared: %s", to_string(kind));
  }
  return false;
}

bool AlertEngine::active(AlertKind kind) const
{
  return kind == AlertKind::FoodLow ? food_low_ : water_low_;
}

std::vector<Alert> AlertEngine::active_alerts() const
{
  std::vector<Alert> out;
  if (food_low_) out.push_back(Alert{AlertKind::FoodLow, food_message_, true});
  if (water_low_) out.push_back(Alert{AlertKind::WaterLow, water_message_, true});
  return out;
}

} // namespace feeder_monitor
