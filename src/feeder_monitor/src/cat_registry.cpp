#include "feeder_monitor/cat_registry.hpp"

#include <yaml-cpp/yaml.h>

namespace feeder_monitor {

CatRegistry::CatRegistry(rclcpp::Logger logger)
: logger_(logger)
{
}

bool CatRegistry::load(const std::string & path)
{
  if (path.empty()) {
    RCLCPP_WARN(logger_, "cats_file parameter is empty; identification will report ids only");
    return false;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root["cats"]) {
      RCLCPP_WARN(logger_, "YAML has no 'cats' key: %s", path.c_str());
      return false;
    }
    for (const auto & n : root["cats"]) {
      CatIdentity cat;
      cat.id = n["id"].as<int>(0);
      cat.name = n["name"].as<std::string>("");
      if (cat.id <= 0 || cat.name.empty()) {
        RCLCPP_WARN(logger_, "Invalid cat entry in %s", path.c_str());
        continue;
      }
      cats_[cat.id] = cat;
    }
  } catch (const std::exception & e) {
    RCLCPP_ERROR(logger_, "Failed to parse cats YAML: %s", e.what());
    return false;
  }
  RCLCPP_INFO(logger_, "Loaded %zu cats from %s", cats_.size(), path.c_str());
  return true;
}

void CatRegistry::add(const CatIdentity & cat)
{
  cats_[cat.id] = cat;
}

std::optional<CatIdentity> CatRegistry::find(int id) const
{
  auto it = cats_.find(id);
  if (it == cats_.end()) return std::nullopt;
  return it->second;
}

std::optional<CatIdentity> CatRegistry::for_class_index(int class_index) const
{
  return find(class_index + 1);
}

} // namespace feeder_monitor
