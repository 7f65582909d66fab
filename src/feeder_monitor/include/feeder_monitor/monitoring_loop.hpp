#pragma once

#include "feeder_monitor/alert_engine.hpp"
#include "feeder_monitor/calibrator.hpp"
#include "feeder_monitor/cat_classifier.hpp"
#include "feeder_monitor/cat_registry.hpp"
#include "feeder_monitor/event_detector.hpp"
#include "feeder_monitor/feed_actuator.hpp"
#include "feeder_monitor/feeding_log.hpp"
#include "feeder_monitor/identifier.hpp"
#include "feeder_monitor/sensor_backend.hpp"
#include "feeder_monitor/types.hpp"

#include <rclcpp/rclcpp.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace feeder_monitor {

struct MonitorConfig {
  std::chrono::milliseconds sample_interval{1000};
  std::chrono::milliseconds error_backoff{5000};
  double eating_threshold_g{5.0};
  AlertThresholds alerts;
  double feed_rate_g_per_s{10.0};
  double max_feed_g{500.0};
  double max_distance_cm{20.0};
  CalibrationSettings calibration;
  // Identify the cat at the bowl for every Eating event.
  bool identify_on_eating{false};
  double min_identify_confidence{0.5};
};

// Owns the rig and runs the sampling cycle on its own thread. Every access to
// the rig (cycle, feed, identify, tare, calibrate) goes through one mutex.
class MonitoringLoop {
public:
  MonitoringLoop(std::unique_ptr<SensorBackend> backend, FeedingLog & log,
                 const CatRegistry & cats, std::shared_ptr<CatClassifier> classifier,
                 const MonitorConfig & cfg = MonitorConfig(),
                 rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.loop"));
  ~MonitoringLoop();

  MonitoringLoop(const MonitoringLoop &) = delete;
  MonitoringLoop & operator=(const MonitoringLoop &) = delete;

  // Both idempotent; a stopped loop can be started again.
  void start();
  // Waits for an in-flight dispense, then stops the motor and releases the rig.
  void stop();
  bool running() const;

  // One sample/detect/alert/persist pass. Throws when the pass failed; the
  // status is already updated if only the persistence step failed.
  void run_cycle();

  // Food and water read as zero while hardware_available is false.
  Status get_current_status() const;
  std::vector<Alert> active_alerts() const;

  FeedResult trigger_feeding(double amount_g, FeedingKind kind = FeedingKind::ManualFeed,
                             std::optional<int> cat_id = std::nullopt);
  IdentificationResult identify_cat(cv::Mat * frame_out = nullptr);

  bool tare();
  bool calibrate(double reference_mass_g);
  CalibrationConfig calibration() const;
  bool set_calibration(const CalibrationConfig & cfg);

  void set_alert_listener(AlertEngine::Listener listener);

  BackendKind backend_kind() const { return backend_->kind(); }
  const MonitorConfig & config() const { return cfg_; }

private:
  void run();
  FeedingRecord attribute(const FeedingEvent & ev);

  MonitorConfig cfg_;
  rclcpp::Logger logger_;
  std::unique_ptr<SensorBackend> backend_;
  FeedingLog & log_;
  const CatRegistry & cats_;

  mutable std::mutex rig_mutex_;
  Calibrator calibrator_;
  EventDetector detector_;
  AlertEngine alerts_;
  FeedActuator actuator_;
  Identifier identifier_;
  SensorSample last_sample_;  // echo 0 reads as a full tank until the first echo

  mutable std::mutex status_mutex_;
  Status status_;

  // Serialises start() and stop(); held by stop() across the join.
  std::mutex lifecycle_mutex_;
  mutable std::mutex run_mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
  std::thread worker_;
};

} // namespace feeder_monitor
