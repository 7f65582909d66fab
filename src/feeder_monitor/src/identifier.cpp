#include "feeder_monitor/identifier.hpp"

#include <algorithm>
#include <iterator>

namespace feeder_monitor {

Identifier::Identifier(SensorBackend & backend, std::mutex & rig_mutex,
                       std::shared_ptr<CatClassifier> classifier,
                       const CatRegistry & cats, rclcpp::Logger logger)
: backend_(backend), rig_mutex_(rig_mutex), classifier_(std::move(classifier)),
  cats_(cats), logger_(logger)
{
}

IdentificationResult Identifier::failure(const std::string & message) const
{
  IdentificationResult r;
  r.success = false;
  r.message = message;
  return r;
}

IdentificationResult Identifier::identify(cv::Mat * frame_out)
{
  if (!backend_.hardware_available()) return failure("Hardware not available");
  if (!enabled()) return failure("No trained classifier loaded");
  std::lock_guard<std::mutex> lk(rig_mutex_);
  return identify_locked(frame_out);
}

IdentificationResult Identifier::identify_locked(cv::Mat * frame_out)
{
  if (!backend_.hardware_available()) return failure("Hardware not available");
  if (!enabled()) return failure("No trained classifier loaded");

  std::vector<float> probs;
  try {
    auto frame = backend_.capture();
    if (!frame || frame->empty()) return failure("Camera capture failed");
    if (frame_out) *frame_out = *frame;
    probs = classifier_->classify(*frame);
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Identification failed: %s", e.what());
    return failure(std::string("Identification failed: ") + e.what());
  }
  if (probs.empty()) return failure("Classifier returned no classes");

  const auto best = std::max_element(probs.begin(), probs.end());
  const int class_index = static_cast<int>(std::distance(probs.begin(), best));
  const float confidence = std::clamp(*best, 0.0f, 1.0f);

  auto cat = cats_.for_class_index(class_index);
  if (!cat) {
    RCLCPP_WARN(logger_, "Predicted class %d (%.2f) has no registered cat", class_index, confidence);
    auto r = failure("Predicted class " + std::to_string(class_index) + " has no registered cat");
    r.confidence = confidence;
    return r;
  }

  IdentificationResult r;
  r.success = true;
  r.cat_id = cat->id;
  r.cat_name = cat->name;
  r.confidence = confidence;
  r.message = "Detected cat: " + cat->name;
  RCLCPP_INFO(logger_, "Identified %s (id %d) with confidence %.1f%%",
              cat->name.c_str(), cat->id, confidence * 100.0f);
  return r;
}

} // namespace feeder_monitor
