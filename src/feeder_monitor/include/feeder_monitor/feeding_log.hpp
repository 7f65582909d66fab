#pragma once

#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace feeder_monitor {

// Append-only store of feeding records. append() throws std::runtime_error
// when the record could not be persisted.
class FeedingLog {
public:
  virtual ~FeedingLog() = default;
  virtual void append(const FeedingRecord & record) = 0;
  // Newest first.
  virtual std::vector<FeedingRecord> recent(std::size_t limit) const = 0;
};

// Keeps the log as a top-level YAML sequence, one flow map per record, so a
// record is persisted by appending a single line. Only the newest max_cached
// records stay in memory; recent() never returns more than that.
class YamlFeedingLog : public FeedingLog {
public:
  explicit YamlFeedingLog(const std::string & path,
                          rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.feeding_log"),
                          std::size_t max_cached = 500);

  void append(const FeedingRecord & record) override;
  std::vector<FeedingRecord> recent(std::size_t limit) const override;

  const std::string & path() const { return path_; }

private:
  void load();
  void push(const FeedingRecord & record);

  std::string path_;
  rclcpp::Logger logger_;
  mutable std::mutex mutex_;
  std::size_t max_cached_;
  std::deque<FeedingRecord> records_;
};

} // namespace feeder_monitor
