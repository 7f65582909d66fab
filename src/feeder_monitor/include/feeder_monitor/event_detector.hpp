#pragma once

#include "feeder_monitor/types.hpp"

#include <optional>

namespace feeder_monitor {

// Classifies bowl weight changes. Changes smaller than the threshold are
// treated as noise and never produce an event.
class EventDetector {
public:
  explicit EventDetector(double eating_threshold_g = 5.0);

  // Feeds the next calibrated weight. The first sample after construction or
  // reset() only seeds the previous weight.
  std::optional<FeedingEvent> update(double current_g, Timestamp t);

  // Forget the previous weight; the next update() re-seeds.
  void reset() { previous_.reset(); }

  std::optional<double> previous() const { return previous_; }
  double threshold() const { return threshold_; }

  static std::optional<FeedingEvent> classify(double previous_g, double current_g,
                                              double threshold_g, Timestamp t);

private:
  double threshold_;
  std::optional<double> previous_;
};

} // namespace feeder_monitor
