#include "dmk/config.h"

#include "dmk/log.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <optional>

#if DMK_ENABLE_DATA_YAML
#include <yaml-cpp/yaml.h>
#endif

namespace dmk {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

// Values read from either format before they are applied.
struct ConfigFields {
  std::optional<int> max_ops;
  std::optional<long long> max_text_len;
  std::optional<long long> max_table_cells;
  std::optional<int> deadline_ms;
  std::string anchor_mode;
  std::optional<bool> backup;
  std::optional<bool> change_log;
  std::string host;
  std::string directive_prefix;
  std::string store_kind;
  std::string store_path;
  std::string audit_log;
};

void apply_common_fields(MacroConfig& cfg, const ConfigFields& f) {
  if (f.max_ops) cfg.limits.max_ops = *f.max_ops;
  if (f.max_text_len && *f.max_text_len > 0) cfg.limits.max_text_len = static_cast<size_t>(*f.max_text_len);
  if (f.max_table_cells && *f.max_table_cells > 0) cfg.limits.max_table_cells = static_cast<size_t>(*f.max_table_cells);
  if (f.deadline_ms) cfg.limits.deadline_ms = *f.deadline_ms;
  cfg.limits = cfg.limits.clamped();

  if (!f.anchor_mode.empty()) {
    if (auto mode = parse_anchor_mode(f.anchor_mode)) {
      cfg.anchor_mode = *mode;
    } else {
      log::warn("config: unknown anchor_mode '" + f.anchor_mode + "', keeping " + anchor_mode_name(cfg.anchor_mode));
    }
  }
  if (f.backup) cfg.backup = *f.backup;
  if (f.change_log) cfg.change_log = *f.change_log;
  if (!f.host.empty()) {
    const HostFlavor host = parse_host_flavor(f.host);
    if (host == HostFlavor::Unknown) {
      log::warn("config: unknown host '" + f.host + "'");
    } else {
      cfg.host = host;
    }
  }
  if (!f.directive_prefix.empty()) cfg.directive_prefix = f.directive_prefix;
  if (!f.store_kind.empty()) {
    if (f.store_kind == "memory" || f.store_kind == "sqlite") {
      cfg.backup_store_kind = f.store_kind;
    } else {
      log::warn("config: unknown backup_store.kind '" + f.store_kind + "'");
    }
  }
  if (!f.store_path.empty()) cfg.backup_store_path = f.store_path;
  if (!f.audit_log.empty()) cfg.audit_log = f.audit_log;
}

void read_json(const nlohmann::json& root, ConfigFields& f) {
  if (root.contains("limits") && root["limits"].is_object()) {
    const auto& limits = root["limits"];
    if (limits.contains("max_ops")) f.max_ops = limits["max_ops"].get<int>();
    if (limits.contains("max_text_len")) f.max_text_len = limits["max_text_len"].get<long long>();
    if (limits.contains("max_table_cells")) f.max_table_cells = limits["max_table_cells"].get<long long>();
    if (limits.contains("deadline_ms")) f.deadline_ms = limits["deadline_ms"].get<int>();
  }
  if (root.contains("anchor_mode")) f.anchor_mode = root["anchor_mode"].get<std::string>();
  if (root.contains("backup")) f.backup = root["backup"].get<bool>();
  if (root.contains("change_log")) f.change_log = root["change_log"].get<bool>();
  if (root.contains("host")) f.host = root["host"].get<std::string>();
  if (root.contains("directive_prefix")) f.directive_prefix = root["directive_prefix"].get<std::string>();
  if (root.contains("backup_store") && root["backup_store"].is_object()) {
    const auto& store = root["backup_store"];
    if (store.contains("kind")) f.store_kind = store["kind"].get<std::string>();
    if (store.contains("path")) f.store_path = store["path"].get<std::string>();
  }
  if (root.contains("audit_log")) f.audit_log = root["audit_log"].get<std::string>();
}

#if DMK_ENABLE_DATA_YAML
void read_yaml(const YAML::Node& root, ConfigFields& f) {
  if (root["limits"]) {
    auto limits = root["limits"];
    if (limits["max_ops"]) f.max_ops = limits["max_ops"].as<int>();
    if (limits["max_text_len"]) f.max_text_len = limits["max_text_len"].as<long long>();
    if (limits["max_table_cells"]) f.max_table_cells = limits["max_table_cells"].as<long long>();
    if (limits["deadline_ms"]) f.deadline_ms = limits["deadline_ms"].as<int>();
  }
  if (root["anchor_mode"]) f.anchor_mode = root["anchor_mode"].as<std::string>();
  if (root["backup"]) f.backup = root["backup"].as<bool>();
  if (root["change_log"]) f.change_log = root["change_log"].as<bool>();
  if (root["host"]) f.host = root["host"].as<std::string>();
  if (root["directive_prefix"]) f.directive_prefix = root["directive_prefix"].as<std::string>();
  if (root["backup_store"]) {
    auto store = root["backup_store"];
    if (store["kind"]) f.store_kind = store["kind"].as<std::string>();
    if (store["path"]) f.store_path = store["path"].as<std::string>();
  }
  if (root["audit_log"]) f.audit_log = root["audit_log"].as<std::string>();
}
#endif
} // namespace

MacroConfig load_macro_config(const std::filesystem::path& path) {
  MacroConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    ConfigFields fields;
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      const auto& root = j.contains("macro") ? j["macro"] : j;
      read_json(root, fields);
    } catch (const nlohmann::json::exception& e) {
      log::warn("config " + path.string() + " unreadable (" + e.what() + "); using defaults.");
      return cfg;
    }
    apply_common_fields(cfg, fields);
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
#if DMK_ENABLE_DATA_YAML
    ConfigFields fields;
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["macro"] ? doc["macro"] : doc;
      read_yaml(root, fields);
    } catch (const YAML::Exception& e) {
      log::warn("config " + path.string() + " unreadable (" + e.what() + "); using defaults.");
      return cfg;
    }
    apply_common_fields(cfg, fields);
#else
    log::warn("YAML config requested but YAML support is disabled.");
#endif
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace dmk
