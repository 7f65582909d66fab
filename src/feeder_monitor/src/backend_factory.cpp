#include "feeder_monitor/backend_factory.hpp"

#include <unistd.h>

namespace feeder_monitor {

BackendKind probe_backend(const HardwareConfig & hw)
{
  const std::string gpio_export = hw.gpio_root + "/export";
  const std::string pwm_export = hw.pwm_chip + "/export";
  if (::access(gpio_export.c_str(), W_OK) != 0) return BackendKind::Simulated;
  if (::access(pwm_export.c_str(), W_OK) != 0) return BackendKind::Simulated;
  return BackendKind::Real;
}

BackendKind select_backend(const std::string & request, const HardwareConfig & hw,
                           rclcpp::Logger logger)
{
  if (request == "real") return BackendKind::Real;
  if (request == "simulated") return BackendKind::Simulated;
  if (request != "auto") {
    RCLCPP_WARN(logger, "Unknown backend '%s'. Using 'auto'.", request.c_str());
  }
  const BackendKind kind = probe_backend(hw);
  RCLCPP_INFO(logger, "Backend probe: %s", to_string(kind));
  return kind;
}

std::unique_ptr<SensorBackend> make_backend(BackendKind kind,
                                            const HardwareConfig & hw,
                                            const SimulationConfig & sim,
                                            rclcpp::Logger logger)
{
  if (kind == BackendKind::Real) {
    try {
      return std::make_unique<RealBackend>(hw, logger.get_child("hardware"));
    } catch (const HardwareError & e) {
      RCLCPP_WARN(logger, "Real hardware unavailable (%s); falling back to simulation", e.what());
    }
  }
  return std::make_unique<SimulatedBackend>(sim, logger.get_child("simulation"));
}

} // namespace feeder_monitor
