#include "dmk_data/serialization.h"

#include "dmk/log.h"

#if DMK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace dmk::data {

#if DMK_ENABLE_DATA_YAML
bool load_yaml_file(const std::filesystem::path& path, YAML::Node& out) {
  try {
    out = YAML::LoadFile(path.string());
    return true;
  } catch (const YAML::Exception& e) {
    log::warn(std::string("YAML load failed: ") + e.what());
    return false;
  }
}

nlohmann::json yaml_to_json(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Sequence: {
      nlohmann::json out = nlohmann::json::array();
      for (const auto& item : node) {
        out.push_back(yaml_to_json(item));
      }
      return out;
    }
    case YAML::NodeType::Map: {
      nlohmann::json out = nlohmann::json::object();
      for (const auto& kv : node) {
        out[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return out;
    }
    case YAML::NodeType::Scalar: {
      // Quoted scalars stay strings ("0042" is an id, not a number).
      if (node.Tag() == "!") {
        return node.as<std::string>();
      }
      bool b = false;
      if (YAML::convert<bool>::decode(node, b)) {
        return b;
      }
      long long i = 0;
      if (YAML::convert<long long>::decode(node, i)) {
        return i;
      }
      double d = 0.0;
      if (YAML::convert<double>::decode(node, d)) {
        return d;
      }
      return node.as<std::string>();
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
    default:
      return nullptr;
  }
}
#endif

} // namespace dmk::data
