#include "feeder_monitor/cat_classifier.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>

namespace feeder_monitor {

DnnCatClassifier::DnnCatClassifier(const ClassifierConfig & cfg, rclcpp::Logger logger)
: cfg_(cfg), logger_(logger)
{
  if (cfg_.model_path.empty()) {
    RCLCPP_WARN(logger_, "classifier_model parameter is empty; cat identification disabled");
    return;
  }
  if (!std::ifstream(cfg_.model_path).good()) {
    RCLCPP_WARN(logger_, "Classifier model %s not found; cat identification disabled",
                cfg_.model_path.c_str());
    return;
  }
  try {
    net_ = cv::dnn::readNet(cfg_.model_path);
    loaded_ = !net_.empty();
  } catch (const cv::Exception & e) {
    RCLCPP_ERROR(logger_, "Failed to load classifier %s: %s", cfg_.model_path.c_str(), e.what());
    loaded_ = false;
  }
  if (loaded_) {
    RCLCPP_INFO(logger_, "Loaded classifier %s (input %dx%d)", cfg_.model_path.c_str(),
                cfg_.input_width, cfg_.input_height);
  }
}

cv::Mat DnnCatClassifier::make_blob(const cv::Mat & bgr, const ClassifierConfig & cfg)
{
  cv::Mat resized;
  cv::resize(bgr, resized, cv::Size(cfg.input_width, cfg.input_height), 0, 0, cv::INTER_LINEAR);
  cv::Mat rgb;
  cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
  cv::Mat f;
  rgb.convertTo(f, CV_32FC3, 1.0 / 255.0);
  cv::subtract(f, cv::Scalar(cfg.mean[0], cfg.mean[1], cfg.mean[2]), f);
  cv::divide(f, cv::Scalar(cfg.stddev[0], cfg.stddev[1], cfg.stddev[2]), f);
  // already scaled and in RGB order
  return cv::dnn::blobFromImage(f, 1.0, cv::Size(), cv::Scalar(), false, false, CV_32F);
}

std::vector<float> DnnCatClassifier::classify(const cv::Mat & bgr)
{
  if (!loaded_) return {};
  net_.setInput(make_blob(bgr, cfg_));
  cv::Mat out = net_.forward();
  const cv::Mat flat = out.reshape(1, 1);
  std::vector<float> scores;
  scores.reserve(flat.total());
  for (int i = 0; i < static_cast<int>(flat.total()); ++i) {
    scores.push_back(flat.at<float>(0, i));
  }
  return cfg_.apply_softmax ? softmax(scores) : scores;
}

std::vector<float> softmax(const std::vector<float> & logits)
{
  if (logits.empty()) return {};
  const float mx = *std::max_element(logits.begin(), logits.end());
  std::vector<float> out(logits.size());
  float sum = 0.0f;
  for (std::size_t i = 0; i < logits.size(); ++i) {
    out[i] = std::exp(logits[i] - mx);
    sum += out[i];
  }
  for (auto & v : out) v /= sum;
  return out;
}

} // namespace feeder_monitor
