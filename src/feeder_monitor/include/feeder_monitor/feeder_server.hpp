#pragma once

#include "feeder_monitor/cat_registry.hpp"
#include "feeder_monitor/feeding_log.hpp"
#include "feeder_monitor/feeding_schedule.hpp"
#include "feeder_monitor/monitoring_loop.hpp"

#include <rclcpp/rclcpp.hpp>
#include <std_msgs/msg/bool.hpp>
#include <std_msgs/msg/float64.hpp>
#include <std_msgs/msg/string.hpp>
#include <std_srvs/srv/trigger.hpp>
#include <image_transport/image_transport.hpp>

#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace feeder_monitor {

// ROS front end of the monitoring loop: publishes the status, forwards
// alerts, exposes feed / identify / calibration as Trigger services and runs
// the feeding schedule.
class FeederServer : public rclcpp::Node {
public:
  using Trigger = std_srvs::srv::Trigger;

  explicit FeederServer(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());
  ~FeederServer() override;

  bool interactive_calibration_requested() const { return interactive_calibration_; }
  // Walks an operator through tare + reference-mass calibration on a console.
  bool run_interactive_calibration(std::istream & in, std::ostream & out);

private:
  MonitorConfig load_monitor_config();
  HardwareConfig load_hardware_config();
  ClassifierConfig load_classifier_config();
  void load_calibration_file();
  void save_calibration_file();

  void publish_status();
  void check_schedule();
  void publish_debug_image(const cv::Mat & frame, const IdentificationResult & result);

  void on_get_status(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);
  void on_feed(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);
  void on_identify(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);
  void on_tare(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);
  void on_calibrate(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);
  void on_recent_feedings(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res);

  std::string calibration_file_;
  bool interactive_calibration_{false};
  bool publish_debug_image_{true};
  int recent_feedings_limit_{10};

  CatRegistry cats_;
  FeedingSchedule schedule_;
  std::unique_ptr<FeedingLog> log_;
  std::unique_ptr<MonitoringLoop> loop_;

  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr food_pub_;
  rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr water_pub_;
  rclcpp::Publisher<std_msgs::msg::Bool>::SharedPtr hardware_pub_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr alert_pub_;
  image_transport::Publisher debug_pub_;

  // feed, identify and calibrate block for seconds; keep them off the
  // status timer's group
  rclcpp::CallbackGroup::SharedPtr rig_group_;
  rclcpp::Service<Trigger>::SharedPtr status_srv_;
  rclcpp::Service<Trigger>::SharedPtr feed_srv_;
  rclcpp::Service<Trigger>::SharedPtr identify_srv_;
  rclcpp::Service<Trigger>::SharedPtr tare_srv_;
  rclcpp::Service<Trigger>::SharedPtr calibrate_srv_;
  rclcpp::Service<Trigger>::SharedPtr recent_srv_;
  rclcpp::TimerBase::SharedPtr status_timer_;
  rclcpp::TimerBase::SharedPtr schedule_timer_;
};

} // namespace feeder_monitor
