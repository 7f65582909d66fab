#include "feeder_monitor/monitoring_loop.hpp"

namespace feeder_monitor {

MonitoringLoop::MonitoringLoop(std::unique_ptr<SensorBackend> backend, FeedingLog & log,
                               const CatRegistry & cats, std::shared_ptr<CatClassifier> classifier,
                               const MonitorConfig & cfg, rclcpp::Logger logger)
: cfg_(cfg),
  logger_(logger),
  backend_(std::move(backend)),
  log_(log),
  cats_(cats),
  calibrator_(cfg.calibration, logger.get_child("calibrator")),
  detector_(cfg.eating_threshold_g),
  alerts_(cfg.alerts, logger.get_child("alerts")),
  actuator_(*backend_, rig_mutex_, cfg.feed_rate_g_per_s, logger.get_child("feed_actuator")),
  identifier_(*backend_, rig_mutex_, std::move(classifier), cats, logger.get_child("identifier"))
{
  actuator_.set_log(&log_);
  actuator_.set_max_amount(cfg_.max_feed_g);
  // rig lock is held here; the dispensed food must not show up as FoodAdded
  actuator_.set_dispensed_hook([this](const FeedingEvent &) { detector_.reset(); });
  RCLCPP_INFO(logger_, "Monitoring loop ready (%s backend, every %ld ms)",
              to_string(backend_->kind()), static_cast<long>(cfg_.sample_interval.count()));
}

MonitoringLoop::~MonitoringLoop()
{
  stop();
}

void MonitoringLoop::start()
{
  // waits out a stop() that is still joining the previous worker
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::lock_guard<std::mutex> lk(run_mutex_);
  if (worker_.joinable()) return;
  stop_requested_ = false;
  worker_ = std::thread(&MonitoringLoop::run, this);
  RCLCPP_INFO(logger_, "Monitoring started");
}

void MonitoringLoop::stop()
{
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::thread worker;
  {
    std::lock_guard<std::mutex> lk(run_mutex_);
    if (!worker_.joinable()) return;
    stop_requested_ = true;
    worker = std::move(worker_);
  }
  stop_cv_.notify_all();
  worker.join();

  std::lock_guard<std::mutex> rig(rig_mutex_);
  try {
    backend_->stop_motor();
    backend_->release();
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Error while releasing hardware: %s", e.what());
  }
  RCLCPP_INFO(logger_, "Monitoring stopped");
}

bool MonitoringLoop::running() const
{
  std::lock_guard<std::mutex> lk(run_mutex_);
  return worker_.joinable() && !stop_requested_;
}

void MonitoringLoop::run()
{
  std::unique_lock<std::mutex> lk(run_mutex_);
  while (!stop_requested_) {
    lk.unlock();
    const auto cycle_start = std::chrono::steady_clock::now();
    auto next = cycle_start + cfg_.sample_interval;
    try {
      run_cycle();
    } catch (const std::exception & e) {
      RCLCPP_ERROR(logger_, "Error in monitoring loop: %s", e.what());
      next = std::chrono::steady_clock::now() + cfg_.error_backoff;
    }
    lk.lock();
    stop_cv_.wait_until(lk, next, [this] { return stop_requested_; });
  }
}

void MonitoringLoop::run_cycle()
{
  std::optional<FeedingRecord> record;
  {
    std::lock_guard<std::mutex> rig(rig_mutex_);
    // a sensor that timed out keeps its last-known reading
    if (auto raw = backend_->read_weight()) {
      last_sample_.raw_weight = *raw;
    } else {
      RCLCPP_DEBUG(logger_, "Load cell timed out, reusing last reading");
    }
    if (auto echo = backend_->read_water_echo()) {
      last_sample_.raw_water_echo = *echo;
    } else {
      RCLCPP_DEBUG(logger_, "Ultrasonic echo timed out, reusing last level");
    }
    last_sample_.timestamp = Clock::now();

    const double food_g = calibrator_.to_grams(last_sample_.raw_weight);
    const double water_pct = water_level_from_echo(last_sample_.raw_water_echo, cfg_.max_distance_cm);
    auto event = detector_.update(food_g, last_sample_.timestamp);
    if (event) {
      RCLCPP_INFO(logger_, "Detected %s: %.1fg", to_string(event->kind), event->amount_g);
      record = attribute(*event);
    }
    alerts_.evaluate(food_g, water_pct);

    std::lock_guard<std::mutex> st(status_mutex_);
    status_.timestamp = last_sample_.timestamp;
    status_.food_weight_g = food_g;
    status_.water_level_percent = water_pct;
    status_.hardware_available = backend_->hardware_available();
  }
  if (record) {
    log_.append(*record);
  }
}

FeedingRecord MonitoringLoop::attribute(const FeedingEvent & ev)
{
  FeedingRecord rec;
  rec.timestamp = ev.timestamp;
  rec.kind = ev.kind;
  rec.amount_g = ev.amount_g;
  rec.source = source_tag(ev.kind);
  if (ev.kind != FeedingKind::Eating || !cfg_.identify_on_eating || !identifier_.enabled()) {
    return rec;
  }
  auto id = identifier_.identify_locked();
  if (id.success && id.confidence >= cfg_.min_identify_confidence) {
    rec.cat_id = id.cat_id;
    rec.cat_name = id.cat_name;
  } else {
    RCLCPP_INFO(logger_, "Eating event left unattributed: %s (confidence %.2f)",
                id.message.c_str(), id.confidence);
  }
  return rec;
}

Status MonitoringLoop::get_current_status() const
{
  std::lock_guard<std::mutex> lk(status_mutex_);
  Status s = status_;
  // simulated readings drive detection and alerts but are never reported
  if (!s.hardware_available) {
    s.food_weight_g = 0.0;
    s.water_level_percent = 0.0;
  }
  return s;
}

std::vector<Alert> MonitoringLoop::active_alerts() const
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  return alerts_.active_alerts();
}

void MonitoringLoop::set_alert_listener(AlertEngine::Listener listener)
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  alerts_.set_listener(std::move(listener));
}

FeedResult MonitoringLoop::trigger_feeding(double amount_g, FeedingKind kind, std::optional<int> cat_id)
{
  std::optional<CatIdentity> cat;
  if (cat_id && *cat_id != kUnknownCatId) {
    cat = cats_.find(*cat_id);
    if (!cat) {
      return {false, "Unknown cat id " + std::to_string(*cat_id)};
    }
  }
  return actuator_.trigger(amount_g, kind, cat);
}

IdentificationResult MonitoringLoop::identify_cat(cv::Mat * frame_out)
{
  return identifier_.identify(frame_out);
}

bool MonitoringLoop::tare()
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  const bool ok = calibrator_.tare(*backend_);
  if (ok) detector_.reset();
  return ok;
}

bool MonitoringLoop::calibrate(double reference_mass_g)
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  const bool ok = calibrator_.calibrate(*backend_, reference_mass_g);
  if (ok) detector_.reset();
  return ok;
}

CalibrationConfig MonitoringLoop::calibration() const
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  return calibrator_.config();
}

bool MonitoringLoop::set_calibration(const CalibrationConfig & cfg)
{
  std::lock_guard<std::mutex> lk(rig_mutex_);
  const bool ok = calibrator_.set_config(cfg);
  if (ok) detector_.reset();
  return ok;
}

} // namespace feeder_monitor
