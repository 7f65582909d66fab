#pragma once

#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace feeder_monitor {

struct ScheduleEntry {
  int hour{0};
  int minute{0};
  unsigned days{0x7F};   // bit n = tm_wday n (0 = Sunday)
  double amount_g{0.0};
  int cat_id{kUnknownCatId};
  bool active{true};
};

// Parses "mon", "monday", "Tue", ... into a tm_wday index.
std::optional<int> weekday_from_string(const std::string & s);

// Timed feeding table. Loaded from YAML of the form
//   schedules:
//     - {time: "07:30", days: [mon, wed, fri], amount_g: 40, cat_id: 1}
// `days` defaults to every day, `active` to true.
class FeedingSchedule {
public:
  explicit FeedingSchedule(rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.schedule"));

  bool load(const std::string & path);
  void add(const ScheduleEntry & entry);

  // Entries matching this minute that have not fired yet today. Each entry
  // fires at most once per calendar day.
  std::vector<ScheduleEntry> due(const std::tm & local);
  std::vector<ScheduleEntry> due(Timestamp now);

  const std::vector<ScheduleEntry> & entries() const { return entries_; }

private:
  rclcpp::Logger logger_;
  std::vector<ScheduleEntry> entries_;
  std::vector<long> fired_day_;  // yday key of the last firing, per entry
};

} // namespace feeder_monitor
