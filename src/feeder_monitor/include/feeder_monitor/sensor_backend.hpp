#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace feeder_monitor {

enum class BackendKind { Real, Simulated };

const char * to_string(BackendKind kind);

// Thrown by low-level device access (sysfs GPIO/PWM, camera) on the real rig.
class HardwareError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The physical rig: load cell, ultrasonic water sensor, feeder motor, camera.
// Reads return std::nullopt when the device did not answer within its bounded
// wait; callers keep their last-known value in that case.
class SensorBackend {
public:
  virtual ~SensorBackend() = default;

  virtual BackendKind kind() const = 0;
  virtual bool hardware_available() const = 0;

  // Raw load-cell counts.
  virtual std::optional<double> read_weight() = 0;
  // Echo high time in seconds.
  virtual std::optional<double> read_water_echo() = 0;

  // duty_percent 0..100
  virtual void drive(double duty_percent) = 0;
  virtual void stop_motor() = 0;

  virtual std::optional<cv::Mat> capture() = 0;

  // Give the lines back to the kernel; the backend reacquires on next use.
  virtual void release() = 0;
};

// Speed of sound halved, in cm per second of echo.
constexpr double kEchoCmPerSecond = 17150.0;

double echo_to_distance_cm(double echo_s);
// 0..100, 100 when the water surface is at the sensor.
double water_level_from_echo(double echo_s, double max_distance_cm);
double echo_for_water_level(double level_percent, double max_distance_cm);

} // namespace feeder_monitor
