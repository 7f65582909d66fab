#include "feeder_monitor/event_detector.hpp"

#include <cmath>

namespace feeder_monitor {

EventDetector::EventDetector(double eating_threshold_g)
: threshold_(eating_threshold_g)
{
}

std::optional<FeedingEvent> EventDetector::update(double current_g, Timestamp t)
{
  if (!previous_) {
    previous_ = current_g;
    return std::nullopt;
  }
  auto event = classify(*previous_, current_g, threshold_, t);
  previous_ = current_g;
  return event;
}

std::optional<FeedingEvent> EventDetector::classify(double previous_g, double current_g,
                                                    double threshold_g, Timestamp t)
{
  const double delta = current_g - previous_g;
  if (std::abs(delta) < threshold_g) return std::nullopt;
  FeedingEvent ev;
  ev.timestamp = t;
  ev.kind = delta < 0.0 ? FeedingKind::Eating : FeedingKind::FoodAdded;
  ev.amount_g = std::abs(delta);
  return ev;
}

} // namespace feeder_monitor
