#pragma once

#include "feeder_monitor/real_backend.hpp"
#include "feeder_monitor/simulated_backend.hpp"

#include <memory>
#include <string>

namespace feeder_monitor {

// Checks that the sysfs GPIO and PWM interfaces the real rig needs exist and
// are writable.
BackendKind probe_backend(const HardwareConfig & hw);

// request is "auto", "real" or "simulated"; "auto" probes.
BackendKind select_backend(const std::string & request, const HardwareConfig & hw,
                           rclcpp::Logger logger);

// Builds the requested backend. A real backend that cannot claim its lines is
// replaced by the simulation.
std::unique_ptr<SensorBackend> make_backend(BackendKind kind,
                                            const HardwareConfig & hw,
                                            const SimulationConfig & sim,
                                            rclcpp::Logger logger);

} // namespace feeder_monitor
