#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace feeder_monitor {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Cat id used for events nobody could attribute to a registered cat.
constexpr int kUnknownCatId = 0;
constexpr const char * kUnknownCatName = "Unknown";

struct CalibrationConfig {
  double reference_mass_g{100.0};
  double tare_offset{0.0};
  double scale_factor{1.0};
};

struct SensorSample {
  Timestamp timestamp{};
  double raw_weight{0.0};
  double raw_water_echo{0.0}; // echo high time, seconds
};

struct Status {
  Timestamp timestamp{};
  double food_weight_g{0.0};
  double water_level_percent{0.0};
  bool hardware_available{false};
};

enum class FeedingKind { Eating, FoodAdded, AutomaticFeed, ManualFeed };

struct FeedingEvent {
  Timestamp timestamp{};
  FeedingKind kind{FeedingKind::Eating};
  double amount_g{0.0};
};

enum class AlertKind { FoodLow, WaterLow };

struct Alert {
  AlertKind kind{AlertKind::FoodLow};
  std::string message;
  bool active{false};
};

struct DispenseCommand {
  double requested_g{0.0};
  double duration_s{0.0};
};

struct FeedResult {
  bool success{false};
  std::string message;
};

struct IdentificationResult {
  bool success{false};
  int cat_id{kUnknownCatId};
  std::string cat_name;
  float confidence{0.0f};
  std::string message;
};

// One persisted row of the feeding log.
struct FeedingRecord {
  Timestamp timestamp{};
  int cat_id{kUnknownCatId};
  std::string cat_name{kUnknownCatName};
  double amount_g{0.0};
  FeedingKind kind{FeedingKind::Eating};
  std::string source;
};

const char * to_string(FeedingKind kind);
const char * to_string(AlertKind kind);
// "Auto Detected", "Manual" or "Scheduled"
const char * source_tag(FeedingKind kind);

std::optional<FeedingKind> feeding_kind_from_string(const std::string & s);

// Local time, ISO 8601 without zone ("2024-05-01T07:30:00")
std::string format_timestamp(Timestamp t);
std::optional<Timestamp> parse_timestamp(const std::string & s);

} // namespace feeder_monitor
