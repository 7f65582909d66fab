#include "feeder_monitor/sensor_backend.hpp"

#include <algorithm>

namespace feeder_monitor {

const char * to_string(BackendKind kind)
{
  switch (kind) {
    case BackendKind::Real: return "real";
    case BackendKind::Simulated: return "simulated";
  }
  return "?";
}

double echo_to_distance_cm(double echo_s)
{
  return echo_s * kEchoCmPerSecond;
}

double water_level_from_echo(double echo_s, double max_distance_cm)
{
  if (max_distance_cm <= 0.0) return 0.0;
  const double distance = echo_to_distance_cm(echo_s);
  return std::clamp((1.0 - distance / max_distance_cm) * 100.0, 0.0, 100.0);
}

double echo_for_water_level(double level_percent, double max_distance_cm)
{
  const double level = std::clamp(level_percent, 0.0, 100.0);
  return (1.0 - level / 100.0) * max_distance_cm / kEchoCmPerSecond;
}

} // namespace feeder_monitor
