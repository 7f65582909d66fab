#include "feeder_monitor/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace feeder_monitor {

const char * to_string(FeedingKind kind)
{
  switch (kind) {
    case FeedingKind::Eating: return "eating";
    case FeedingKind::FoodAdded: return "food_added";
    case FeedingKind::AutomaticFeed: return "automatic_feed";
    case FeedingKind::ManualFeed: return "manual_feed";
  }
  return "?";
}

const char * to_string(AlertKind kind)
{
  switch (kind) {
    case AlertKind::FoodLow: return "food_low";
    case AlertKind::WaterLow: return "water_low";
  }
  return "?";
}

const char * source_tag(FeedingKind kind)
{
  switch (kind) {
    case FeedingKind::Eating:
    case FeedingKind::FoodAdded:
      return "Auto Detected";
    case FeedingKind::ManualFeed: return "Manual";
    case FeedingKind::AutomaticFeed: return "Scheduled";
  }
  return "Auto Detected";
}

std::optional<FeedingKind> feeding_kind_from_string(const std::string & s)
{
  for (auto k : {FeedingKind::Eating, FeedingKind::FoodAdded,
                 FeedingKind::AutomaticFeed, FeedingKind::ManualFeed}) {
    if (s == to_string(k)) return k;
  }
  return std::nullopt;
}

std::string format_timestamp(Timestamp t)
{
  const std::time_t tt = Clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return ss.str();
}

std::optional<Timestamp> parse_timestamp(const std::string & s)
{
  std::tm tm{};
  std::istringstream ss(s);
  ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) return std::nullopt;
  tm.tm_isdst = -1;
  const std::time_t tt = std::mktime(&tm);
  if (tt == static_cast<std::time_t>(-1)) return std::nullopt;
  return Clock::from_time_t(tt);
}

} // namespace feeder_monitor
