#include "feeder_monitor/feeding_log.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace feeder_monitor {

YamlFeedingLog::YamlFeedingLog(const std::string & path, rclcpp::Logger logger, std::size_t max_cached)
: path_(path), logger_(logger), max_cached_(std::max<std::size_t>(1, max_cached))
{
  load();
}

void YamlFeedingLog::push(const FeedingRecord & record)
{
  records_.push_back(record);
  while (records_.size() > max_cached_) records_.pop_front();
}

void YamlFeedingLog::load()
{
  if (!std::ifstream(path_).good()) {
    RCLCPP_INFO(logger_, "Feeding log %s does not exist yet; starting empty", path_.c_str());
    return;
  }
  try {
    YAML::Node root = YAML::LoadFile(path_);
    if (!root || root.IsNull()) return;
    if (!root.IsSequence()) {
      RCLCPP_WARN(logger_, "Feeding log %s is not a YAML sequence; ignoring its contents", path_.c_str());
      return;
    }
    std::size_t loaded = 0;
    for (const auto & n : root) {
      FeedingRecord r;
      auto ts = parse_timestamp(n["timestamp"].as<std::string>(""));
      auto kind = feeding_kind_from_string(n["kind"].as<std::string>(""));
      if (!ts || !kind) {
        RCLCPP_WARN(logger_, "Skipping malformed feeding record in %s", path_.c_str());
        continue;
      }
      r.timestamp = *ts;
      r.kind = *kind;
      r.cat_id = n["cat_id"].as<int>(kUnknownCatId);
      r.cat_name = n["cat"].as<std::string>(kUnknownCatName);
      r.amount_g = n["amount_g"].as<double>(0.0);
      r.source = n["source"].as<std::string>(source_tag(r.kind));
      push(r);
      ++loaded;
    }
    RCLCPP_INFO(logger_, "Loaded %zu feeding records from %s (keeping the newest %zu)",
                loaded, path_.c_str(), records_.size());
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Failed to parse feeding log %s: %s", path_.c_str(), e.what());
  }
}

void YamlFeedingLog::append(const FeedingRecord & record)
{
  YAML::Emitter em;
  em << YAML::Flow << YAML::BeginMap
     << YAML::Key << "timestamp" << YAML::Value << format_timestamp(record.timestamp)
     << YAML::Key << "cat_id" << YAML::Value << record.cat_id
     << YAML::Key << "cat" << YAML::Value << record.cat_name
     << YAML::Key << "amount_g" << YAML::Value << record.amount_g
     << YAML::Key << "kind" << YAML::Value << to_string(record.kind)
     << YAML::Key << "source" << YAML::Value << record.source
     << YAML::EndMap;

  std::lock_guard<std::mutex> lk(mutex_);
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    throw std::runtime_error("Failed to open feeding log " + path_);
  }
  out << "- " << em.c_str() << "\n";
  out.flush();
  if (!out) {
    throw std::runtime_error("Failed to append to feeding log " + path_);
  }
  push(record);
}

std::vector<FeedingRecord> YamlFeedingLog::recent(std::size_t limit) const
{
  std::lock_guard<std::mutex> lk(mutex_);
  std::vector<FeedingRecord> out;
  for (auto it = records_.rbegin(); it != records_.rend() && out.size() < limit; ++it) {
    out.push_back(*it);
  }
  return out;
}

} // namespace feeder_monitor
