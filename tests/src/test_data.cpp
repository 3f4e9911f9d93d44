#include "dmk/log.h"
#include "dmk/memory_document.h"
#include "dmk_data/backup_store.h"
#include "dmk_data/document_io.h"
#include "dmk_data/serialization.h"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

fs::path fresh_path(const std::string& name) {
  const fs::path path = fs::current_path() / name;
  std::error_code ec;
  fs::remove(path, ec);
  return path;
}

dmk::BackupPayload text_payload(const std::string& text) {
  dmk::BackupPayload p;
  p.text = text;
  p.ts = "2026-01-01T00:00:00Z";
  return p;
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", fs::current_path());

  int failures = 0;

  // Test: JSON snapshot of the memory backup store survives a restart.
  {
    const fs::path path = fresh_path("test_data_backups.json");
    std::string error;
    {
      dmk::data::MemoryBackupStore store(path);
      dmk::BackupPayload patch;
      patch.kind = dmk::BackupPayload::Kind::PatchOps;
      patch.ops.push_back({"cell_a1", "[[DMK:cell_a1:START]]old[[DMK:cell_a1:END]]"});
      if (!store.save("doc1", "report1", text_payload("Q1 results"), error) ||
          !store.save("doc1", "sheet", patch, error) || !store.save("doc2", "other", text_payload("x"), error)) {
        std::cerr << "memory store save failed: " << error << "\n";
        ++failures;
      }
      // Latest backup wins.
      if (!store.save("doc1", "report1", text_payload("Q2 results"), error) || store.size() != 3) {
        std::cerr << "save must replace the previous backup\n";
        ++failures;
      }
    }
    dmk::data::MemoryBackupStore reloaded(path);
    if (reloaded.size() != 3 || reloaded.list_blocks("doc1") != std::vector<std::string>{"report1", "sheet"}) {
      std::cerr << "snapshot reload mismatch: " << reloaded.size() << "\n";
      ++failures;
    }
    const auto report = reloaded.load("doc1", "report1");
    if (!report || report->kind != dmk::BackupPayload::Kind::Text || report->text != "Q2 results") {
      std::cerr << "text payload not restored\n";
      ++failures;
    }
    const auto sheet = reloaded.load("doc1", "sheet");
    if (!sheet || sheet->kind != dmk::BackupPayload::Kind::PatchOps || sheet->ops.size() != 1 ||
        sheet->ops[0].marker != "cell_a1") {
      std::cerr << "patch payload not restored\n";
      ++failures;
    }
    if (!reloaded.remove("doc1", "sheet") || reloaded.remove("doc1", "sheet") || reloaded.load("doc1", "sheet")) {
      std::cerr << "remove must drop the entry once\n";
      ++failures;
    }
  }

  // Test: malformed backup payloads are rejected with a reason.
  {
    dmk::BackupPayload out;
    std::string error;
    if (dmk::from_json(nlohmann::json{{"kind", "zip"}}, out, error) || error.find("unknown backup kind") != 0) {
      std::cerr << "unknown kind must fail: " << error << "\n";
      ++failures;
    }
    error.clear();
    const nlohmann::json bad_ops{{"kind", "patch_ops"}, {"ops", nlohmann::json::array({{{"prevText", "x"}}})}};
    if (dmk::from_json(bad_ops, out, error) || error != "patch op without marker") {
      std::cerr << "patch op without marker must fail: " << error << "\n";
      ++failures;
    }
    error.clear();
    if (dmk::from_json(nlohmann::json{{"kind", "text"}}, out, error) || error.empty()) {
      std::cerr << "text payload without text must fail\n";
      ++failures;
    }

    // Wrong field types fail with a reason instead of throwing.
    const nlohmann::json wrong_types[] = {
        {{"kind", 5}, {"text", "a"}},
        {{"kind", "text"}, {"text", "a"}, {"ts", 7}},
        {{"kind", "patch_ops"}, {"ops", nlohmann::json::array({{{"marker", "m"}, {"prevText", 3}}})}},
    };
    for (const auto& payload : wrong_types) {
      error.clear();
      try {
        if (dmk::from_json(payload, out, error) || error.empty()) {
          std::cerr << "wrong field type must fail: " << payload.dump() << "\n";
          ++failures;
        }
      } catch (const std::exception& e) {
        std::cerr << "wrong field type threw: " << e.what() << "\n";
        ++failures;
      }
    }

    const fs::path snapshot = fresh_path("test_data_typed_snapshot.json");
    nlohmann::json root;
    root["backups"] = nlohmann::json::array(
        {{{"doc_id", 1}, {"block_id", "a"}, {"payload", {{"kind", "text"}, {"text", "x"}}}},
         {{"doc_id", "d"}, {"block_id", "b"}, {"payload", {{"kind", "text"}, {"text", 9}}}},
         {{"doc_id", "d"}, {"block_id", "c"}, {"payload", {{"kind", "text"}, {"text", "kept"}}}}});
    if (!dmk::data::save_json_file(snapshot, root)) {
      std::cerr << "could not write typed snapshot\n";
      ++failures;
    }
    try {
      dmk::data::MemoryBackupStore typed(snapshot);
      if (typed.list_blocks("d") != std::vector<std::string>{"c"}) {
        std::cerr << "mistyped snapshot entries must be skipped\n";
        ++failures;
      }
    } catch (const std::exception& e) {
      std::cerr << "mistyped snapshot threw: " << e.what() << "\n";
      ++failures;
    }
    fs::remove(snapshot);
  }

  // Test: document snapshots keep tables, bookmarks, hidden ranges and selection.
  {
    dmk::MemoryDocument doc("Intro\n");
    dmk::TableSpec table;
    table.rows = 1;
    table.cols = 2;
    table.cells = {{"a", "b"}};
    doc.insert_table(table);
    doc.type_text("Tail");
    doc.add_bookmark("DMK_report1", dmk::TextRange{0, 5});
    doc.set_hidden(dmk::TextRange{0, 2}, true);
    doc.set_selection(dmk::TextRange{1, 3});

    const fs::path path = fresh_path("test_data_doc.json");
    std::string error;
    if (!dmk::data::save_document(path, doc, error)) {
      std::cerr << "save_document failed: " << error << "\n";
      ++failures;
    }
    auto loaded = dmk::data::load_document(path, {}, error);
    if (!loaded) {
      std::cerr << "load_document failed: " << error << "\n";
      ++failures;
    } else {
      if (loaded->raw_text() != doc.raw_text() || loaded->tables().size() != 1 ||
          loaded->tables()[0].cells[0][1] != "b") {
        std::cerr << "text or tables lost in snapshot\n";
        ++failures;
      }
      const auto mark = loaded->bookmark("DMK_report1");
      if (!mark || mark->start != 0 || mark->end != 5) {
        std::cerr << "bookmark lost in snapshot\n";
        ++failures;
      }
      if (loaded->hidden_ranges().size() != 1 || loaded->selection().start != 1 || loaded->selection().end != 3) {
        std::cerr << "hidden ranges or selection lost in snapshot\n";
        ++failures;
      }
      if (loaded->visible_text() != doc.visible_text()) {
        std::cerr << "visible text differs after reload\n";
        ++failures;
      }
    }
  }

  // Test: snapshot validation.
  {
    std::string error;
    const nlohmann::json mismatch{{"text", "no placeholder"}, {"tables", {{{"rows", 1}, {"cols", 1}}}}};
    if (dmk::data::document_from_json(mismatch, {}, error) || error.find("table placeholder") == std::string::npos) {
      std::cerr << "placeholder count mismatch must fail: " << error << "\n";
      ++failures;
    }
    error.clear();
    if (dmk::data::document_from_json(nlohmann::json{{"text", "x"}, {"flavor", "notepad"}}, {}, error) ||
        error != "unknown document flavor: notepad") {
      std::cerr << "unknown flavor must fail: " << error << "\n";
      ++failures;
    }
    error.clear();
    if (dmk::data::document_from_json(nlohmann::json{{"id", "d"}}, {}, error) || error.empty()) {
      std::cerr << "snapshot without text must fail\n";
      ++failures;
    }
    error.clear();
    const nlohmann::json caps{{"text", "abc"}, {"capabilities", {{"bookmarks", false}}}};
    auto doc = dmk::data::document_from_json(caps, {}, error);
    if (!doc || doc->capabilities().bookmarks || !doc->capabilities().find) {
      std::cerr << "capability overrides not applied: " << error << "\n";
      ++failures;
    }
    error.clear();
    const nlohmann::json mistyped{{"text", "abc"}, {"id", 5}, {"capabilities", {{"find", "no"}}}};
    try {
      auto typed = dmk::data::document_from_json(mistyped, {}, error);
      if (!typed || !typed->capabilities().find) {
        std::cerr << "mistyped optional fields must fall back to defaults: " << error << "\n";
        ++failures;
      }
    } catch (const std::exception& e) {
      std::cerr << "mistyped snapshot fields threw: " << e.what() << "\n";
      ++failures;
    }
  }

  // Test: plain text documents take their file name as id.
  {
    const fs::path path = fresh_path("test_data_plain.txt");
    dmk::data::write_text_file(path, "Hello\n");
    std::string error;
    auto doc = dmk::data::load_document(path, {}, error);
    if (!doc || doc->document_id() != "test_data_plain.txt" || doc->raw_text() != "Hello\n") {
      std::cerr << "plain text load failed: " << error << "\n";
      ++failures;
    }
    if (dmk::data::load_document(fs::current_path() / "does_not_exist.txt", {}, error) ||
        error.find("cannot read document") != 0) {
      std::cerr << "missing file must fail: " << error << "\n";
      ++failures;
    }
  }

  // Test: structured files by extension.
  {
    const fs::path json_path = fresh_path("test_data_plan.json");
    dmk::data::write_text_file(json_path, R"({"schema_version": "dmk.plan.v1", "actions": []})");
    nlohmann::json out;
    std::string error;
    if (!dmk::data::load_structured_file(json_path, out, error) || out["schema_version"] != "dmk.plan.v1") {
      std::cerr << "json plan load failed: " << error << "\n";
      ++failures;
    }

    const fs::path yaml_path = fresh_path("test_data_plan.yaml");
    dmk::data::write_text_file(yaml_path,
                               "schema_version: dmk.plan.v1\n"
                               "actions:\n"
                               "  - op: insert_table\n"
                               "    rows: 2\n"
                               "    cols: 1\n"
                               "    data: [[\"0042\"], [3.5]]\n"
                               "  - op: insert_paragraph\n"
                               "    freeze: true\n");
#if DMK_ENABLE_DATA_YAML
    if (!dmk::data::load_structured_file(yaml_path, out, error)) {
      std::cerr << "yaml plan load failed: " << error << "\n";
      ++failures;
    } else {
      const auto& actions = out["actions"];
      if (!actions.is_array() || actions.size() != 2 || actions[0]["rows"] != 2 ||
          actions[0]["data"][0][0] != "0042" || actions[0]["data"][1][0] != 3.5 || actions[1]["freeze"] != true) {
        std::cerr << "yaml to json conversion mismatch: " << out.dump() << "\n";
        ++failures;
      }
    }
#else
    if (dmk::data::load_structured_file(yaml_path, out, error) || error.find("YAML support disabled") != 0) {
      std::cerr << "yaml without yaml-cpp must fail clearly: " << error << "\n";
      ++failures;
    }
#endif
  }

  // Test: backup store factory.
  {
    std::string error;
    if (dmk::data::make_backup_store("redis", "", error) || error != "unknown backup store kind: redis") {
      std::cerr << "unknown store kind must fail: " << error << "\n";
      ++failures;
    }
    if (!dmk::data::make_backup_store("memory", "", error)) {
      std::cerr << "memory store must always be available\n";
      ++failures;
    }
  }

#if DMK_HAVE_SQLITE3
  // Test: sqlite store keeps the latest payload per block.
  {
    const fs::path path = fresh_path("test_data_backups.db");
    std::string error;
    auto store = dmk::data::make_backup_store("sqlite", path.string(), error);
    if (!store) {
      std::cerr << "sqlite store open failed: " << error << "\n";
      ++failures;
    } else {
      if (!store->save("doc1", "b", text_payload("one"), error) ||
          !store->save("doc1", "a", text_payload("two"), error) ||
          !store->save("doc1", "b", text_payload("three"), error)) {
        std::cerr << "sqlite save failed: " << error << "\n";
        ++failures;
      }
      const auto b = store->load("doc1", "b");
      if (!b || b->text != "three") {
        std::cerr << "sqlite upsert must keep the latest payload\n";
        ++failures;
      }
      if (store->list_blocks("doc1") != std::vector<std::string>{"a", "b"} || !store->list_blocks("doc2").empty()) {
        std::cerr << "sqlite list_blocks mismatch\n";
        ++failures;
      }
      if (!store->remove("doc1", "a") || store->load("doc1", "a")) {
        std::cerr << "sqlite remove failed\n";
        ++failures;
      }
    }
  }
#endif

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
