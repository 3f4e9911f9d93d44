#include "dmk/log.h"
#include "dmk/memory_document.h"
#include "dmk/plan_executor.h"
#include "dmk_data/backup_store.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <string>

using json = nlohmann::json;

namespace {

const dmk::HostCapabilities kFullCaps{true, true, true, true, true};

bool invalid(const json& plan, dmk::HostFlavor host, const std::string& expect_fragment) {
  std::string error;
  if (dmk::PlanExecutor::validate(plan, host, error)) {
    return false;
  }
  return error.find(expect_fragment) != std::string::npos;
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", std::filesystem::current_path());

  int failures = 0;

  // Test: structural validation.
  {
    const json ok = json::parse(R"({
      "schema_version": "dmk.plan.v1",
      "host_app": "wps",
      "actions": [{"op": "upsertBlock", "blockId": "s", "actions": [{"op": "insertText", "text": "hi"}]}]
    })");
    std::string error;
    if (!dmk::PlanExecutor::validate(ok, dmk::HostFlavor::Writer, error)) {
      std::cerr << "valid plan rejected: " << error << "\n";
      ++failures;
    }
    if (!invalid(json::array(), dmk::HostFlavor::Writer, "JSON object")) {
      std::cerr << "non-object plan accepted\n";
      ++failures;
    }
    if (!invalid(json{{"schema_version", "v0"}, {"actions", json::array()}}, dmk::HostFlavor::Writer,
                 "schema_version mismatch")) {
      std::cerr << "wrong schema accepted\n";
      ++failures;
    }
    json host = ok;
    host["host_app"] = "et";
    if (!invalid(host, dmk::HostFlavor::Writer, "host_app mismatch")) {
      std::cerr << "host mismatch accepted\n";
      ++failures;
    }
    json unknown = ok;
    unknown["actions"][0]["actions"][0]["op"] = "delete_everything";
    if (!invalid(unknown, dmk::HostFlavor::Writer, "actions[1].actions[1]: unsupported op: delete_everything")) {
      std::cerr << "unsupported nested op not located\n";
      ++failures;
    }
    json no_id = ok;
    no_id["actions"][0].erase("blockId");
    if (!invalid(no_id, dmk::HostFlavor::Writer, "requires block_id")) {
      std::cerr << "upsert_block without block_id accepted\n";
      ++failures;
    }
    const json bad_table = json::parse(R"({"schema_version": "dmk.plan.v1",
      "actions": [{"op": "insert_table", "rows": 0}]})");
    if (!invalid(bad_table, dmk::HostFlavor::Writer, "insert_table requires")) {
      std::cerr << "empty table accepted\n";
      ++failures;
    }
    if (dmk::canonical_plan_op("setBlockText") != "set_block_text" || dmk::canonical_plan_op("x") != "x") {
      std::cerr << "op canonicalization mismatch\n";
      ++failures;
    }
  }

  // Test: a nested plan writes one block and reports step ids.
  {
    dmk::MemoryDocument doc("Title\n");
    dmk::data::MemoryBackupStore store;
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{}, &store);
    dmk::PlanExecutor plans(ctx);
    const json plan = json::parse(R"({
      "schema_version": "dmk.plan.v1",
      "host_app": "writer",
      "actions": [
        {"op": "upsert_block", "block_id": "summary", "actions": [
          {"op": "insert_paragraph", "text": "Quarterly summary"},
          {"op": "insert_table", "data": [["Q", "Revenue"], ["Q1", 10]]}
        ]}
      ]
    })");
    const auto result = plans.execute(plan);
    if (!result.success) {
      std::cerr << "plan failed: " << result.message << "\n";
      ++failures;
    }
    if (result.steps.size() != 3 || result.steps[0].id != "1" || result.steps[1].id != "1.1" ||
        result.steps[2].id != "1.2" || result.steps[2].op != "insert_table") {
      std::cerr << "step ids mismatch\n";
      ++failures;
    }
    if (result.upserted.size() != 1 || result.upserted[0] != "summary") {
      std::cerr << "upserted list mismatch\n";
      ++failures;
    }
    if (doc.tables().size() != 1 || doc.tables()[0].cells[1][1] != "10") {
      std::cerr << "table not inserted from data\n";
      ++failures;
    }
    if (doc.visible_text().find("Quarterly summary\nQ | Revenue\nQ1 | 10\n") == std::string::npos) {
      std::cerr << "plan output mismatch: " << doc.visible_text() << "\n";
      ++failures;
    }

    // Same plan again: still one block, one table.
    const auto again = plans.execute(plan);
    if (!again.success || doc.tables().size() != 1 || doc.occurrences("Quarterly summary") != 1) {
      std::cerr << "re-running a plan must replace the block\n";
      ++failures;
    }

    // set_block_text then rollback_block in one plan.
    const json edit = json::parse(R"({
      "schema_version": "dmk.plan.v1",
      "actions": [
        {"op": "set_block_text", "block_id": "summary", "text": "Replaced summary"},
        {"op": "rollback_block", "block_id": "summary"}
      ]
    })");
    const auto edited = plans.execute(edit);
    if (!edited.success || doc.occurrences("Quarterly summary") != 1) {
      std::cerr << "rollback_block must restore the upserted content: " << edited.message << "\n";
      ++failures;
    }
  }

  // Test: execution stops at the first failing action.
  {
    dmk::MemoryDocument doc;
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{});
    dmk::PlanExecutor plans(ctx);
    const json plan = json::parse(R"({
      "schema_version": "dmk.plan.v1",
      "actions": [
        {"op": "insert_text", "text": "first"},
        {"op": "set_block_text", "block_id": "missing", "text": "x"},
        {"op": "insert_text", "text": "never"}
      ]
    })");
    const auto result = plans.execute(plan);
    if (result.success || !result.error || result.error->code() != "block_not_found") {
      std::cerr << "plan must fail with block_not_found\n";
      ++failures;
    }
    if (result.steps.size() != 2 || !result.steps[0].ok || result.steps[1].ok ||
        result.steps[1].error.rfind("ContentNotProduced: ", 0) != 0) {
      std::cerr << "step outcomes mismatch\n";
      ++failures;
    }
    if (doc.raw_text() != "first") {
      std::cerr << "actions after the failure must not run: " << doc.raw_text() << "\n";
      ++failures;
    }
  }

  // Test: invalid plans report SyntaxDefect before anything runs.
  {
    dmk::MemoryDocument doc("keep");
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{});
    dmk::PlanExecutor plans(ctx);
    const auto result = plans.execute(json{{"schema_version", "dmk.plan.v1"}, {"actions", json::array()}});
    if (result.success || !result.error || result.error->kind() != dmk::ErrorKind::SyntaxDefect ||
        result.error->code() != "invalid_plan" || doc.raw_text() != "keep") {
      std::cerr << "empty action list must be an invalid plan\n";
      ++failures;
    }
  }

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
