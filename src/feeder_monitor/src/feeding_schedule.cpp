#include "feeder_monitor/feeding_schedule.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace feeder_monitor {

namespace {

const char * const kDayNames[] = {"sunday", "monday", "tuesday", "wednesday",
                                  "thursday", "friday", "saturday"};

bool parse_hhmm(const std::string & s, int & hour, int & minute)
{
  int h = -1, m = -1;
  char tail = 0;
  if (std::sscanf(s.c_str(), "%d:%d%c", &h, &m, &tail) != 2) return false;
  if (h < 0 || h > 23 || m < 0 || m > 59) return false;
  hour = h;
  minute = m;
  return true;
}

long day_key(const std::tm & t)
{
  return static_cast<long>(t.tm_year) * 400 + t.tm_yday;
}

} // namespace

std::optional<int> weekday_from_string(const std::string & s)
{
  std::string lower(s);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower.size() < 3) return std::nullopt;
  for (int d = 0; d < 7; ++d) {
    const std::string name(kDayNames[d]);
    if (name == lower || name.compare(0, lower.size(), lower) == 0) return d;
  }
  return std::nullopt;
}

FeedingSchedule::FeedingSchedule(rclcpp::Logger logger)
: logger_(logger)
{
}

bool FeedingSchedule::load(const std::string & path)
{
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception & e) {
    RCLCPP_WARN(logger_, "Cannot read schedule file %s: %s", path.c_str(), e.what());
    return false;
  }
  const auto list = root["schedules"];
  if (!list || !list.IsSequence()) {
    RCLCPP_WARN(logger_, "%s has no 'schedules' list", path.c_str());
    return false;
  }
  std::size_t i = 0;
  for (const auto & n : list) {
    ++i;
    try {
      ScheduleEntry e;
      if (!parse_hhmm(n["time"].as<std::string>(""), e.hour, e.minute)) {
        RCLCPP_WARN(logger_, "Schedule entry %zu: bad or missing time, skipped", i);
        continue;
      }
      if (n["days"]) {
        e.days = 0;
        for (const auto & d : n["days"]) {
          auto wd = weekday_from_string(d.as<std::string>());
          if (!wd) {
            RCLCPP_WARN(logger_, "Schedule entry %zu: unknown day '%s' ignored", i,
                        d.as<std::string>().c_str());
            continue;
          }
          e.days |= 1u << *wd;
        }
      }
      e.amount_g = n["amount_g"].as<double>(0.0);
      e.cat_id = n["cat_id"].as<int>(kUnknownCatId);
      e.active = n["active"].as<bool>(true);
      if (e.amount_g <= 0.0 || e.days == 0) {
        RCLCPP_WARN(logger_, "Schedule entry %zu: needs a positive amount and at least one day, skipped", i);
        continue;
      }
      add(e);
    } catch (const YAML::Exception & ex) {
      RCLCPP_WARN(logger_, "Schedule entry %zu malformed (%s), skipped", i, ex.what());
    }
  }
  RCLCPP_INFO(logger_, "Loaded %zu feeding schedule(s) from %s", entries_.size(), path.c_str());
  return true;
}

void FeedingSchedule::add(const ScheduleEntry & entry)
{
  entries_.push_back(entry);
  fired_day_.push_back(-1);
}

std::vector<ScheduleEntry> FeedingSchedule::due(const std::tm & local)
{
  std::vector<ScheduleEntry> out;
  const long today = day_key(local);
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto & e = entries_[i];
    if (!e.active) continue;
    if (!(e.days & (1u << local.tm_wday))) continue;
    if (e.hour != local.tm_hour || e.minute != local.tm_min) continue;
    if (fired_day_[i] == today) continue;
    fired_day_[i] = today;
    out.push_back(e);
  }
  return out;
}

std::vector<ScheduleEntry> FeedingSchedule::due(Timestamp now)
{
  const std::time_t t = Clock::to_time_t(now);
  std::tm local{};
  localtime_r(&t, &local);
  return due(local);
}

} // namespace feeder_monitor
