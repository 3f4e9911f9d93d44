#include "dmk/config.h"
#include "dmk/log.h"
#include "dmk_data/serialization.h"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

fs::path write_config(const std::string& name, const std::string& contents) {
  const fs::path path = fs::current_path() / name;
  dmk::data::write_text_file(path, contents);
  return path;
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", fs::current_path());

  int failures = 0;

  // Test: defaults when the file is missing or unreadable.
  {
    const dmk::MacroConfig missing = dmk::load_macro_config(fs::current_path() / "no_such_config.json");
    if (missing.limits.max_ops != 200 || missing.limits.deadline_ms != 45000 || !missing.backup ||
        missing.backup_store_kind != "memory" || missing.directive_prefix != "@dmk:") {
      std::cerr << "missing config must yield defaults\n";
      ++failures;
    }
    const auto broken = dmk::load_macro_config(write_config("test_config_broken.json", "{ \"limits\": "));
    if (broken.limits.max_ops != 200) {
      std::cerr << "malformed config must yield defaults\n";
      ++failures;
    }
    const auto ini = dmk::load_macro_config(write_config("test_config.ini", "max_ops=5\n"));
    if (ini.limits.max_ops != 200) {
      std::cerr << "unknown extension must yield defaults\n";
      ++failures;
    }
  }

  // Test: JSON config under a macro root key, with limits clamped.
  {
    const auto cfg = dmk::load_macro_config(write_config("test_config.json", R"({
      "macro": {
        "limits": {"max_ops": 5000, "max_text_len": 10, "max_table_cells": 64, "deadline_ms": 2000},
        "anchor_mode": "marker_only",
        "backup": false,
        "change_log": false,
        "host": "spreadsheet",
        "directive_prefix": "@macro:",
        "backup_store": {"kind": "sqlite", "path": "backups.db"},
        "audit_log": "audit.jsonl"
      }
    })"));
    if (cfg.limits.max_ops != 2000 || cfg.limits.max_text_len != 100 || cfg.limits.max_table_cells != 64 ||
        cfg.limits.deadline_ms != 2000) {
      std::cerr << "limits not read or clamped: " << cfg.limits.max_ops << " " << cfg.limits.max_text_len << "\n";
      ++failures;
    }
    if (cfg.anchor_mode != dmk::AnchorMode::MarkerOnly || cfg.backup || cfg.change_log ||
        cfg.host != dmk::HostFlavor::Spreadsheet || cfg.directive_prefix != "@macro:") {
      std::cerr << "json options not applied\n";
      ++failures;
    }
    if (cfg.backup_store_kind != "sqlite" || cfg.backup_store_path != fs::path("backups.db") ||
        cfg.audit_log != fs::path("audit.jsonl")) {
      std::cerr << "backup store or audit settings not applied\n";
      ++failures;
    }
  }

  // Test: unknown enum values keep the defaults.
  {
    const auto cfg = dmk::load_macro_config(write_config("test_config_unknown.json", R"({
      "anchor_mode": "sideways", "host": "notepad", "backup_store": {"kind": "redis"}, "limits": {"max_ops": 0}
    })"));
    if (cfg.anchor_mode != dmk::AnchorMode::Auto || cfg.host != dmk::HostFlavor::Writer ||
        cfg.backup_store_kind != "memory" || cfg.limits.max_ops != 1) {
      std::cerr << "unknown values must fall back to defaults\n";
      ++failures;
    }
  }

#if DMK_ENABLE_DATA_YAML
  // Test: YAML config, top level and nested.
  {
    const auto flat = dmk::load_macro_config(write_config("test_config.yaml",
                                                          "limits:\n"
                                                          "  max_ops: 50\n"
                                                          "  deadline_ms: 100\n"
                                                          "anchor_mode: bookmark_only\n"
                                                          "backup: false\n"));
    if (flat.limits.max_ops != 50 || flat.limits.deadline_ms != 1000 ||
        flat.anchor_mode != dmk::AnchorMode::BookmarkOnly || flat.backup) {
      std::cerr << "yaml config not applied\n";
      ++failures;
    }
    const auto nested = dmk::load_macro_config(write_config("test_config_nested.yml",
                                                            "macro:\n"
                                                            "  host: writer\n"
                                                            "  backup_store:\n"
                                                            "    kind: memory\n"
                                                            "    path: snap.json\n"));
    if (nested.host != dmk::HostFlavor::Writer || nested.backup_store_path != fs::path("snap.json")) {
      std::cerr << "nested yaml config not applied\n";
      ++failures;
    }
    const auto broken = dmk::load_macro_config(write_config("test_config_broken.yaml", "limits: [unclosed\n"));
    if (broken.limits.max_ops != 200) {
      std::cerr << "malformed yaml must yield defaults\n";
      ++failures;
    }
  }
#endif

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
