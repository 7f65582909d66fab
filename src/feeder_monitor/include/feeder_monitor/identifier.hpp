#pragma once

#include "feeder_monitor/cat_classifier.hpp"
#include "feeder_monitor/cat_registry.hpp"
#include "feeder_monitor/sensor_backend.hpp"
#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <memory>
#include <mutex>

namespace feeder_monitor {

// Camera frame -> classifier -> registered cat. Never throws: every failure
// comes back as success=false with a message.
class Identifier {
public:
  Identifier(SensorBackend & backend, std::mutex & rig_mutex,
             std::shared_ptr<CatClassifier> classifier,
             const CatRegistry & cats,
             rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.identifier"));

  // Takes the rig lock for the capture. frame_out, when given, receives the
  // captured frame.
  IdentificationResult identify(cv::Mat * frame_out = nullptr);

  // Same pipeline for callers already holding the rig lock.
  IdentificationResult identify_locked(cv::Mat * frame_out = nullptr);

  bool enabled() const { return classifier_ && classifier_->loaded(); }

private:
  IdentificationResult failure(const std::string & message) const;

  SensorBackend & backend_;
  std::mutex & rig_mutex_;
  std::shared_ptr<CatClassifier> classifier_;
  const CatRegistry & cats_;
  rclcpp::Logger logger_;
};

} // namespace feeder_monitor
