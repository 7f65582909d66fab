#pragma once

#include <rclcpp/rclcpp.hpp>

#include <map>
#include <optional>
#include <string>

namespace feeder_monitor {

struct CatIdentity {
  int id{0};          // 1-based; classifier class i is cat i + 1
  std::string name;
};

// Known cats, loaded from a YAML file of the form
//   cats:
//     - {id: 1, name: Whiskers}
class CatRegistry {
public:
  explicit CatRegistry(rclcpp::Logger logger = rclcpp::get_logger("feeder_monitor.cats"));

  bool load(const std::string & path);
  void add(const CatIdentity & cat);

  std::optional<CatIdentity> find(int id) const;
  std::optional<CatIdentity> for_class_index(int class_index) const;
  std::size_t size() const { return cats_.size(); }

private:
  rclcpp::Logger logger_;
  std::map<int, CatIdentity> cats_;
};

} // namespace feeder_monitor
