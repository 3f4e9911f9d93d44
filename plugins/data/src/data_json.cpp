#include "dmk_data/serialization.h"

#include "dmk/log.h"

#include <fstream>

namespace dmk::data {

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out) {
  std::ifstream in(path);
  if (!in) {
    log::warn(std::string("JSON read failed: ") + path.string());
    return false;
  }
  try {
    in >> out;
  } catch (const nlohmann::json::exception& e) {
    log::warn(std::string("JSON parse failed: ") + path.string() + ": " + e.what());
    return false;
  }
  return true;
}

bool save_json_file(const std::filesystem::path& path, const nlohmann::json& node) {
  // Invalid UTF-8 in document text is replaced rather than aborting the dump.
  return write_text_file(path, node.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n");
}

} // namespace dmk::data
