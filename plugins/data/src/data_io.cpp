#include "dmk_data/serialization.h"

#include "dmk/log.h"

#include <fstream>
#include <sstream>

namespace dmk::data {

bool read_text_file(const std::filesystem::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    log::warn(std::string("failed to read file: ") + path.string());
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

std::string read_text_file(const std::filesystem::path& path) {
  std::string out;
  read_text_file(path, out);
  return out;
}

bool write_text_file(const std::filesystem::path& path, const std::string& contents) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    log::warn(std::string("failed to write file: ") + path.string());
    return false;
  }
  out << contents;
  return static_cast<bool>(out);
}

bool load_structured_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  const std::string ext = path.extension().string();
  if (ext == ".yaml" || ext == ".yml") {
#if DMK_ENABLE_DATA_YAML
    YAML::Node node;
    if (!load_yaml_file(path, node)) {
      error = "YAML load failed: " + path.string();
      return false;
    }
    out = yaml_to_json(node);
    return true;
#else
    error = "YAML support disabled (built without yaml-cpp): " + path.string();
    return false;
#endif
  }
  if (!load_json_file(path, out)) {
    error = "JSON load failed: " + path.string();
    return false;
  }
  return true;
}

} // namespace dmk::data
