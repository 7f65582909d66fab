#include "feeder_monitor/feed_actuator.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <thread>

namespace feeder_monitor {

FeedActuator::FeedActuator(SensorBackend & backend, std::mutex & rig_mutex, double feed_rate_g_per_s,
                           rclcpp::Logger logger)
: backend_(backend), rig_mutex_(rig_mutex), feed_rate_(feed_rate_g_per_s), logger_(logger)
{
}

DispenseCommand FeedActuator::plan(double amount_g) const
{
  DispenseCommand cmd;
  cmd.requested_g = amount_g;
  cmd.duration_s = feed_rate_ > 0.0 ? amount_g / feed_rate_ : 0.0;
  return cmd;
}

FeedResult FeedActuator::trigger(double amount_g, FeedingKind kind, const std::optional<CatIdentity> & cat)
{
  if (!backend_.hardware_available()) {
    return {false, "Hardware not available"};
  }
  if (kind != FeedingKind::AutomaticFeed && kind != FeedingKind::ManualFeed) {
    return {false, "Invalid feed kind"};
  }
  if (!std::isfinite(amount_g) || !(amount_g > 0.0)) {
    return {false, "Feed amount must be positive"};
  }
  if (amount_g > max_amount_g_) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "Feed amount %.1fg exceeds the %.1fg limit", amount_g, max_amount_g_);
    return {false, buf};
  }
  if (!(feed_rate_ > 0.0)) {
    return {false, "Feed rate is not configured"};
  }
  const DispenseCommand cmd = plan(amount_g);

  std::lock_guard<std::mutex> lk(rig_mutex_);
  RCLCPP_INFO(logger_, "Dispensing %.1fg (%s): motor on for %.2fs", cmd.requested_g, to_string(kind), cmd.duration_s);
  try {
    backend_.drive(100.0);
    std::this_thread::sleep_for(std::chrono::duration<double>(cmd.duration_s));
    backend_.stop_motor();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Motor drive failed: %s", e.what());
    try {
      backend_.stop_motor();
    } catch (const std::exception & stop_err) {
      RCLCPP_ERROR(logger_, "Motor stop after failure also failed: %s", stop_err.what());
    }
    return {false, std::string("Motor drive failed: ") + e.what()};
  }

  FeedingEvent ev;
  ev.timestamp = Clock::now();
  ev.kind = kind;
  ev.amount_g = cmd.requested_g;
  if (hook_) hook_(ev);

  char buf[64];
  std::snprintf(buf, sizeof(buf), "Dispensed %.1fg", cmd.requested_g);
  FeedResult result{true, buf};
  if (log_) {
    FeedingRecord rec;
    rec.timestamp = ev.timestamp;
    rec.kind = kind;
    rec.amount_g = ev.amount_g;
    rec.source = source_tag(kind);
    if (cat) {
      rec.cat_id = cat->id;
      rec.cat_name = cat->name;
    }
    try {
      log_->append(rec);
    } catch (const std::exception & e) {
      RCLCPP_ERROR(logger_, "Failed to log feeding: %s", e.what());
      result.message += " (not logged)";
    }
  }
  return result;
}

} // namespace feeder_monitor
