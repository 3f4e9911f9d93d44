#pragma once

#include "dmk/directives.h"
#include "dmk/guard.h"
#include "dmk/host_flavor.h"

#include <filesystem>
#include <string>

namespace dmk {

struct MacroConfig {
  GuardLimits limits;
  AnchorMode anchor_mode = AnchorMode::Auto;
  bool backup = true;
  bool change_log = true;
  HostFlavor host = HostFlavor::Writer;
  std::string directive_prefix = "@dmk:";
  std::string backup_store_kind = "memory";  // "memory" or "sqlite"
  // sqlite: database file (build/dmk_backups.db when empty); memory: optional JSON snapshot.
  std::filesystem::path backup_store_path;
  std::filesystem::path audit_log;  // empty: no audit file
};

// .json or .yaml/.yml, optionally nested under a `macro:` root key. Missing
// files, unknown extensions and malformed documents log a warning and yield
// defaults; limits are clamped.
MacroConfig load_macro_config(const std::filesystem::path& path);

} // namespace dmk
