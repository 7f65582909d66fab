#pragma once

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <rclcpp/rclcpp.hpp>

#include <array>
#include <string>
#include <vector>

namespace feeder_monitor {

class CatClassifier {
public:
  virtual ~CatClassifier() = default;
  virtual bool loaded() const = 0;
  // One probability per known cat, indexed by class. Throws on inference
  // failure.
  virtual std::vector<float> classify(const cv::Mat & bgr) = 0;
};

struct ClassifierConfig {
  std::string model_path;           // ONNX (or any format cv::dnn::readNet accepts)
  int input_width{224};
  int input_height{224};
  std::array<double, 3> mean{{0.485, 0.456, 0.406}};   // RGB
  std::array<double, 3> stddev{{0.229, 0.224, 0.225}}; // RGB
  bool apply_softmax{true};         // model emits logits
};

// Convolutional classifier run through OpenCV's DNN module. A missing or
// unreadable model leaves the classifier unloaded rather than throwing.
class DnnCatClassifier : public CatClassifier {
public:
  explicit DnnCatClassifier(const ClassifierConfig & cfg,
                            rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.classifier"));

  bool loaded() const override { return loaded_; }
  std::vector<float> classify(const cv::Mat & bgr) override;

  // Resize, BGR->RGB, [0,1], per-channel normalize, NCHW blob.
  static cv::Mat make_blob(const cv::Mat & bgr, const ClassifierConfig & cfg);

private:
  ClassifierConfig cfg_;
  rclcpp::Logger logger_;
  cv::dnn::Net net_;
  bool loaded_{false};
};

std::vector<float> softmax(const std::vector<float> & logits);

} // namespace feeder_monitor
