#include "feeder_monitor/feeder_server.hpp"

#include <iostream>

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  auto node = std::make_shared<feeder_monitor::FeederServer>();
  if (node->interactive_calibration_requested()) {
    node->run_interactive_calibration(std::cin, std::cout);
  }
  rclcpp::executors::MultiThreadedExecutor exec;
  exec.add_node(node);
  exec.spin();
  rclcpp::shutdown();
  return 0;
}
