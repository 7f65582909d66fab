#include "feeder_monitor/feeder_server.hpp"

#include "feeder_monitor/backend_factory.hpp"
#include "feeder_monitor/cat_classifier.hpp"

#include <cv_bridge/cv_bridge.h>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace feeder_monitor {

namespace {

std::string describe(const Status & s)
{
  char buf[160];
  std::snprintf(buf, sizeof(buf), "food=%.1fg water=%.1f%% hardware=%s updated=%s",
                s.food_weight_g, s.water_level_percent, s.hardware_available ? "yes" : "no",
                s.timestamp == Timestamp{} ? "never" : format_timestamp(s.timestamp).c_str());
  return buf;
}

} // namespace

FeederServer::FeederServer(const rclcpp::NodeOptions & options)
: rclcpp::Node("feeder_monitor_node", options),
  cats_(this->get_logger().get_child("cats")),
  schedule_(this->get_logger().get_child("schedule"))
{
  this->declare_parameter<std::string>("backend", "auto"); // auto|real|simulated
  this->declare_parameter<std::string>("cats_file", "");
  this->declare_parameter<std::string>("feeding_log_file", "feeding_log.yaml");
  this->declare_parameter<std::string>("calibration_file", "calibration.yaml");
  this->declare_parameter<std::string>("schedule_file", "");
  this->declare_parameter<double>("manual_feed_g", 50.0);
  this->declare_parameter<int>("manual_feed_cat_id", kUnknownCatId);
  this->declare_parameter<double>("calibration_reference_g", 100.0);
  this->declare_parameter<bool>("interactive_calibration", false);
  this->declare_parameter<bool>("publish_debug_image", true);
  this->declare_parameter<int>("recent_feedings_limit", 10);
  this->declare_parameter<int>("schedule_check_ms", 30000);

  calibration_file_ = this->get_parameter("calibration_file").as_string();
  interactive_calibration_ = this->get_parameter("interactive_calibration").as_bool();
  publish_debug_image_ = this->get_parameter("publish_debug_image").as_bool();
  recent_feedings_limit_ = std::max(1, static_cast<int>(this->get_parameter("recent_feedings_limit").as_int()));

  const MonitorConfig mcfg = load_monitor_config();
  const HardwareConfig hw = load_hardware_config();
  SimulationConfig sim;
  sim.max_distance_cm = mcfg.max_distance_cm;

  const auto cats_file = this->get_parameter("cats_file").as_string();
  if (!cats_file.empty()) cats_.load(cats_file);
  const auto schedule_file = this->get_parameter("schedule_file").as_string();
  if (!schedule_file.empty()) schedule_.load(schedule_file);

  log_ = std::make_unique<YamlFeedingLog>(this->get_parameter("feeding_log_file").as_string(),
                                          this->get_logger().get_child("feeding_log"),
                                          static_cast<std::size_t>(recent_feedings_limit_));
  auto classifier = std::make_shared<DnnCatClassifier>(load_classifier_config(),
                                                       this->get_logger().get_child("classifier"));

  const auto kind = select_backend(this->get_parameter("backend").as_string(), hw, this->get_logger());
  loop_ = std::make_unique<MonitoringLoop>(make_backend(kind, hw, sim, this->get_logger()),
                                           *log_, cats_, classifier, mcfg,
                                           this->get_logger().get_child("loop"));
  load_calibration_file();

  food_pub_ = this->create_publisher<std_msgs::msg::Float64>("food_weight", 10);
  water_pub_ = this->create_publisher<std_msgs::msg::Float64>("water_level", 10);
  hardware_pub_ = this->create_publisher<std_msgs::msg::Bool>("hardware_available", 10);
  alert_pub_ = this->create_publisher<std_msgs::msg::String>("feeder_alerts", 10);
  if (publish_debug_image_) {
    debug_pub_ = image_transport::create_publisher(this, "identify_cat/debug_image");
  }
  loop_->set_alert_listener([this](const Alert & a) {
    std_msgs::msg::String msg;
    msg.data = a.message;
    alert_pub_->publish(msg);
  });

  using std::placeholders::_1;
  using std::placeholders::_2;
  rig_group_ = this->create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
  status_srv_ = this->create_service<Trigger>("get_status", std::bind(&FeederServer::on_get_status, this, _1, _2));
  recent_srv_ = this->create_service<Trigger>("recent_feedings", std::bind(&FeederServer::on_recent_feedings, this, _1, _2));
  feed_srv_ = this->create_service<Trigger>("feed", std::bind(&FeederServer::on_feed, this, _1, _2),
                                            rmw_qos_profile_services_default, rig_group_);
  identify_srv_ = this->create_service<Trigger>("identify_cat", std::bind(&FeederServer::on_identify, this, _1, _2),
                                                rmw_qos_profile_services_default, rig_group_);
  tare_srv_ = this->create_service<Trigger>("tare", std::bind(&FeederServer::on_tare, this, _1, _2),
                                            rmw_qos_profile_services_default, rig_group_);
  calibrate_srv_ = this->create_service<Trigger>("calibrate", std::bind(&FeederServer::on_calibrate, this, _1, _2),
                                                 rmw_qos_profile_services_default, rig_group_);

  status_timer_ = this->create_wall_timer(mcfg.sample_interval, std::bind(&FeederServer::publish_status, this));
  if (!schedule_.entries().empty()) {
    const auto period = std::chrono::milliseconds(std::max<int64_t>(1000, this->get_parameter("schedule_check_ms").as_int()));
    schedule_timer_ = this->create_wall_timer(period, std::bind(&FeederServer::check_schedule, this), rig_group_);
  }

  loop_->start();
  RCLCPP_INFO(this->get_logger(), "Feeder monitor up (%s backend, %zu cats, %zu schedules)",
              to_string(loop_->backend_kind()), cats_.size(), schedule_.entries().size());
}

FeederServer::~FeederServer()
{
  if (loop_) loop_->stop();
}

MonitorConfig FeederServer::load_monitor_config()
{
  this->declare_parameter<int>("sample_interval_ms", 1000);
  this->declare_parameter<int>("error_backoff_ms", 5000);
  this->declare_parameter<double>("eating_threshold_g", 5.0);
  this->declare_parameter<double>("min_food_weight_g", 10.0);
  this->declare_parameter<double>("min_water_level_pct", 20.0);
  this->declare_parameter<double>("feed_rate_g_per_s", 10.0);
  this->declare_parameter<double>("max_feed_g", 500.0);
  this->declare_parameter<double>("max_distance_cm", 20.0);
  this->declare_parameter<int>("calibration_samples", 10);
  this->declare_parameter<int>("calibration_sample_interval_ms", 100);
  this->declare_parameter<bool>("identify_on_eating", false);
  this->declare_parameter<double>("min_identify_confidence", 0.5);

  MonitorConfig c;
  c.sample_interval = std::chrono::milliseconds(std::max<int64_t>(10, this->get_parameter("sample_interval_ms").as_int()));
  c.error_backoff = std::chrono::milliseconds(std::max<int64_t>(0, this->get_parameter("error_backoff_ms").as_int()));
  c.eating_threshold_g = this->get_parameter("eating_threshold_g").as_double();
  c.alerts.min_food_weight_g = this->get_parameter("min_food_weight_g").as_double();
  c.alerts.min_water_level_pct = this->get_parameter("min_water_level_pct").as_double();
  c.feed_rate_g_per_s = this->get_parameter("feed_rate_g_per_s").as_double();
  c.max_feed_g = this->get_parameter("max_feed_g").as_double();
  c.max_distance_cm = this->get_parameter("max_distance_cm").as_double();
  c.calibration.reference_mass_g = this->get_parameter("calibration_reference_g").as_double();
  c.calibration.samples = static_cast<int>(this->get_parameter("calibration_samples").as_int());
  c.calibration.sample_interval = std::chrono::milliseconds(this->get_parameter("calibration_sample_interval_ms").as_int());
  c.identify_on_eating = this->get_parameter("identify_on_eating").as_bool();
  c.min_identify_confidence = this->get_parameter("min_identify_confidence").as_double();
  if (c.feed_rate_g_per_s <= 0.0) {
    RCLCPP_WARN(this->get_logger(), "feed_rate_g_per_s must be positive, using 10.0");
    c.feed_rate_g_per_s = 10.0;
  }
  if (!(c.max_feed_g > 0.0)) {
    RCLCPP_WARN(this->get_logger(), "max_feed_g must be positive, using 500.0");
    c.max_feed_g = 500.0;
  }
  if (c.max_distance_cm <= 0.0) {
    RCLCPP_WARN(this->get_logger(), "max_distance_cm must be positive, using 20.0");
    c.max_distance_cm = 20.0;
  }
  return c;
}

HardwareConfig FeederServer::load_hardware_config()
{
  HardwareConfig d;
  this->declare_parameter<std::string>("gpio_root", d.gpio_root);
  this->declare_parameter<int>("gpio_base", d.gpio_base);
  this->declare_parameter<int>("hx711_data_pin", d.hx_data_pin);
  this->declare_parameter<int>("hx711_clock_pin", d.hx_clock_pin);
  this->declare_parameter<int>("water_trig_pin", d.water_trig_pin);
  this->declare_parameter<int>("water_echo_pin", d.water_echo_pin);
  this->declare_parameter<std::string>("pwm_chip", d.pwm_chip);
  this->declare_parameter<int>("pwm_channel", d.pwm_channel);
  this->declare_parameter<int>("pwm_period_ns", static_cast<int>(d.pwm_period_ns));
  this->declare_parameter<int>("camera_device", d.camera_device);
  this->declare_parameter<int>("hx711_ready_timeout_ms", static_cast<int>(d.hx_ready_timeout.count()));
  this->declare_parameter<int>("echo_timeout_ms", static_cast<int>(d.echo_timeout.count()));

  HardwareConfig hw;
  hw.gpio_root = this->get_parameter("gpio_root").as_string();
  hw.gpio_base = static_cast<int>(this->get_parameter("gpio_base").as_int());
  hw.hx_data_pin = static_cast<int>(this->get_parameter("hx711_data_pin").as_int());
  hw.hx_clock_pin = static_cast<int>(this->get_parameter("hx711_clock_pin").as_int());
  hw.water_trig_pin = static_cast<int>(this->get_parameter("water_trig_pin").as_int());
  hw.water_echo_pin = static_cast<int>(this->get_parameter("water_echo_pin").as_int());
  hw.pwm_chip = this->get_parameter("pwm_chip").as_string();
  hw.pwm_channel = static_cast<int>(this->get_parameter("pwm_channel").as_int());
  hw.pwm_period_ns = static_cast<long>(this->get_parameter("pwm_period_ns").as_int());
  hw.camera_device = static_cast<int>(this->get_parameter("camera_device").as_int());
  hw.hx_ready_timeout = std::chrono::milliseconds(this->get_parameter("hx711_ready_timeout_ms").as_int());
  hw.echo_timeout = std::chrono::milliseconds(this->get_parameter("echo_timeout_ms").as_int());
  return hw;
}

ClassifierConfig FeederServer::load_classifier_config()
{
  ClassifierConfig d;
  this->declare_parameter<std::string>("classifier_model", "");
  this->declare_parameter<int>("classifier_input_width", d.input_width);
  this->declare_parameter<int>("classifier_input_height", d.input_height);
  this->declare_parameter<std::vector<double>>("classifier_mean", {d.mean[0], d.mean[1], d.mean[2]});
  this->declare_parameter<std::vector<double>>("classifier_std", {d.stddev[0], d.stddev[1], d.stddev[2]});
  this->declare_parameter<bool>("classifier_softmax", d.apply_softmax);

  ClassifierConfig c;
  c.model_path = this->get_parameter("classifier_model").as_string();
  c.input_width = static_cast<int>(this->get_parameter("classifier_input_width").as_int());
  c.input_height = static_cast<int>(this->get_parameter("classifier_input_height").as_int());
  const auto mean = this->get_parameter("classifier_mean").as_double_array();
  const auto stddev = this->get_parameter("classifier_std").as_double_array();
  if (mean.size() == 3 && stddev.size() == 3) {
    for (int i = 0; i < 3; ++i) {
      c.mean[i] = mean[i];
      c.stddev[i] = stddev[i];
    }
  } else {
    RCLCPP_WARN(this->get_logger(), "classifier_mean/classifier_std need 3 values each, using ImageNet defaults");
  }
  c.apply_softmax = this->get_parameter("classifier_softmax").as_bool();
  return c;
}

void FeederServer::load_calibration_file()
{
  if (calibration_file_.empty() || !std::ifstream(calibration_file_).good()) {
    RCLCPP_INFO(this->get_logger(), "No stored calibration, using defaults (call 'tare' and 'calibrate')");
    return;
  }
  CalibrationConfig cfg = loop_->calibration();
  std::string err;
  if (!load_calibration(calibration_file_, cfg, err)) {
    RCLCPP_WARN(this->get_logger(), "%s", err.c_str());
    return;
  }
  if (loop_->set_calibration(cfg)) {
    RCLCPP_INFO(this->get_logger(), "Loaded calibration from %s (offset %.3f, scale %.6f)",
                calibration_file_.c_str(), cfg.tare_offset, cfg.scale_factor);
  }
}

void FeederServer::save_calibration_file()
{
  if (calibration_file_.empty()) return;
  std::string err;
  if (!save_calibration(calibration_file_, loop_->calibration(), err)) {
    RCLCPP_ERROR(this->get_logger(), "%s", err.c_str());
  }
}

bool FeederServer::run_interactive_calibration(std::istream & in, std::ostream & out)
{
  std::string line;
  out << "Remove all weight from the scale and press Enter..." << std::endl;
  if (!std::getline(in, line)) return false;
  if (!loop_->tare()) {
    out << "Tare failed: no reading from the load cell" << std::endl;
    return false;
  }
  double reference = this->get_parameter("calibration_reference_g").as_double();
  out << "Place a known weight on the scale and enter its mass in grams ["
      << reference << "]: " << std::flush;
  if (!std::getline(in, line)) return false;
  if (!line.empty()) {
    try {
      reference = std::stod(line);
    } catch (const std::exception &) {
      out << "Not a number: " << line << std::endl;
      return false;
    }
  }
  if (!loop_->calibrate(reference)) {
    out << "Calibration failed, see log" << std::endl;
    return false;
  }
  save_calibration_file();
  out << "Calibration complete. Scale factor: " << loop_->calibration().scale_factor << std::endl;
  return true;
}

void FeederServer::publish_status()
{
  const Status s = loop_->get_current_status();
  std_msgs::msg::Float64 food;
  food.data = s.food_weight_g;
  food_pub_->publish(food);
  std_msgs::msg::Float64 water;
  water.data = s.water_level_percent;
  water_pub_->publish(water);
  std_msgs::msg::Bool hw;
  hw.data = s.hardware_available;
  hardware_pub_->publish(hw);
}

void FeederServer::check_schedule()
{
  for (const auto & e : schedule_.due(Clock::now())) {
    RCLCPP_INFO(this->get_logger(), "Scheduled feeding %02d:%02d: %.1fg for cat %d",
                e.hour, e.minute, e.amount_g, e.cat_id);
    const auto r = loop_->trigger_feeding(e.amount_g, FeedingKind::AutomaticFeed, e.cat_id);
    if (!r.success) {
      RCLCPP_WARN(this->get_logger(), "Scheduled feeding failed: %s", r.message.c_str());
    }
  }
}

void FeederServer::publish_debug_image(const cv::Mat & frame, const IdentificationResult & result)
{
  if (!publish_debug_image_ || frame.empty()) return;
  cv::Mat dbg = frame.clone();
  char label[96];
  std::snprintf(label, sizeof(label), "%s %.0f%%",
                result.success ? result.cat_name.c_str() : kUnknownCatName, result.confidence * 100.0f);
  const cv::Scalar colour = result.success ? cv::Scalar(0, 255, 0) : cv::Scalar(0, 0, 255);
  cv::putText(dbg, label, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 1.0, colour, 2);
  auto msg = cv_bridge::CvImage(std_msgs::msg::Header(), "bgr8", dbg).toImageMsg();
  msg->header.stamp = this->now();
  msg->header.frame_id = "camera";
  debug_pub_.publish(msg);
}

void FeederServer::on_get_status(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  std::ostringstream ss;
  ss << describe(loop_->get_current_status());
  for (const auto & a : loop_->active_alerts()) {
    ss << "; " << a.message;
  }
  res->success = true;
  res->message = ss.str();
}

void FeederServer::on_feed(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  const double amount = this->get_parameter("manual_feed_g").as_double();
  const int cat_id = static_cast<int>(this->get_parameter("manual_feed_cat_id").as_int());
  const auto r = loop_->trigger_feeding(amount, FeedingKind::ManualFeed, cat_id);
  res->success = r.success;
  res->message = r.message;
}

void FeederServer::on_identify(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  cv::Mat frame;
  const auto r = loop_->identify_cat(&frame);
  if (!frame.empty()) {
    try {
      publish_debug_image(frame, r);
    } catch (const std::exception & e) {
      RCLCPP_WARN(this->get_logger(), "Debug image not published: %s", e.what());
    }
  }
  res->success = r.success;
  if (r.success) {
    char buf[128];
    std::snprintf(buf, sizeof(buf), "%s (id %d, confidence %.2f)", r.message.c_str(), r.cat_id, r.confidence);
    res->message = buf;
  } else {
    res->message = r.message;
  }
}

void FeederServer::on_tare(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  res->success = loop_->tare();
  if (res->success) {
    save_calibration_file();
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Tare offset %.3f", loop_->calibration().tare_offset);
    res->message = buf;
  } else {
    res->message = "Tare failed: no reading from load cell";
  }
}

void FeederServer::on_calibrate(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  const double reference = this->get_parameter("calibration_reference_g").as_double();
  res->success = loop_->calibrate(reference);
  if (res->success) {
    save_calibration_file();
    char buf[80];
    std::snprintf(buf, sizeof(buf), "Scale factor %.6f", loop_->calibration().scale_factor);
    res->message = buf;
  } else {
    res->message = "Calibration failed: is the reference mass on the scale?";
  }
}

void FeederServer::on_recent_feedings(const std::shared_ptr<Trigger::Request>, std::shared_ptr<Trigger::Response> res)
{
  std::ostringstream ss;
  const auto records = log_->recent(static_cast<std::size_t>(recent_feedings_limit_));
  for (const auto & r : records) {
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.1fg", r.amount_g);
    ss << format_timestamp(r.timestamp) << " " << r.cat_name << " " << buf << " "
       << to_string(r.kind) << " (" << r.source << ")\n";
  }
  res->success = true;
  res->message = records.empty() ? "No feedings recorded" : ss.str();
}

} // namespace feeder_monitor
