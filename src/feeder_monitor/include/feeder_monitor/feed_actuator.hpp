#pragma once

#include "feeder_monitor/cat_registry.hpp"
#include "feeder_monitor/feeding_log.hpp"
#include "feeder_monitor/sensor_backend.hpp"
#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <functional>
#include <mutex>
#include <optional>

namespace feeder_monitor {

// Open-loop dispenser: runs the feeder motor at full duty for
// amount / feed_rate seconds. Holds the rig lock for the whole run.
class FeedActuator {
public:
  // Called with the rig lock still held once the motor has stopped.
  using DispensedHook = std::function<void(const FeedingEvent &)>;

  FeedActuator(SensorBackend & backend, std::mutex & rig_mutex, double feed_rate_g_per_s,
               rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.feed_actuator"));

  DispenseCommand plan(double amount_g) const;

  // kind is AutomaticFeed (schedule) or ManualFeed (user). Blocks for the
  // dispense duration.
  FeedResult trigger(double amount_g, FeedingKind kind = FeedingKind::ManualFeed,
                     const std::optional<CatIdentity> & cat = std::nullopt);

  void set_log(FeedingLog * log) { log_ = log; }
  void set_dispensed_hook(DispensedHook hook) { hook_ = std::move(hook); }
  // Larger requests are refused; the rig lock is held for the whole dispense.
  void set_max_amount(double max_amount_g) { max_amount_g_ = max_amount_g; }
  double feed_rate() const { return feed_rate_; }
  double max_amount() const { return max_amount_g_; }

private:
  SensorBackend & backend_;
  std::mutex & rig_mutex_;
  double feed_rate_;
  double max_amount_g_{500.0};
  rclcpp::Logger logger_;
  FeedingLog * log_{nullptr};
  DispensedHook hook_;
};

} // namespace feeder_monitor
