#include "dmk/plan_executor.h"

#include "dmk/errors.h"
#include "dmk/log.h"
#include "dmk/safety_gate.h"

#include <algorithm>
#include <map>
#include <set>

namespace dmk {

namespace {

const std::set<std::string>& supported_ops() {
  static const std::set<std::string> ops = {"upsert_block", "insert_text",    "insert_paragraph",
                                            "insert_table", "set_block_text", "rollback_block"};
  return ops;
}

const nlohmann::json* member(const nlohmann::json& j, const char* key, const char* alias = nullptr) {
  auto it = j.find(key);
  if (it != j.end()) {
    return &*it;
  }
  if (alias) {
    it = j.find(alias);
    if (it != j.end()) {
      return &*it;
    }
  }
  return nullptr;
}

std::string string_member(const nlohmann::json& j, const char* key, const char* alias = nullptr) {
  const nlohmann::json* v = member(j, key, alias);
  return v && v->is_string() ? v->get<std::string>() : std::string();
}

bool bool_member(const nlohmann::json& j, const char* key, bool fallback) {
  const nlohmann::json* v = member(j, key);
  return v && v->is_boolean() ? v->get<bool>() : fallback;
}

std::string cell_text(const nlohmann::json& cell) {
  if (cell.is_string()) {
    return cell.get<std::string>();
  }
  if (cell.is_null()) {
    return std::string();
  }
  return cell.dump();
}

TableSpec table_from(const nlohmann::json& action) {
  TableSpec table;
  if (const nlohmann::json* data = member(action, "data", "cells")) {
    if (data->is_array()) {
      for (const auto& row : *data) {
        std::vector<std::string> cells;
        if (row.is_array()) {
          for (const auto& cell : row) {
            cells.push_back(cell_text(cell));
          }
        } else {
          cells.push_back(cell_text(row));
        }
        table.cols = std::max(table.cols, cells.size());
        table.cells.push_back(std::move(cells));
      }
      table.rows = table.cells.size();
    }
  }
  const nlohmann::json* rows = member(action, "rows");
  const nlohmann::json* cols = member(action, "cols", "columns");
  if (rows && rows->is_number_integer() && rows->get<long long>() > 0) {
    table.rows = static_cast<size_t>(rows->get<long long>());
  }
  if (cols && cols->is_number_integer() && cols->get<long long>() > 0) {
    table.cols = static_cast<size_t>(cols->get<long long>());
  }
  return table;
}

bool validate_actions(const nlohmann::json& actions, const std::string& where, std::string& error) {
  if (!actions.is_array() || actions.empty()) {
    error = where + ": actions must be a non-empty array";
    return false;
  }
  size_t index = 0;
  for (const auto& action : actions) {
    ++index;
    const std::string at = where + "[" + std::to_string(index) + "]";
    if (!action.is_object()) {
      error = at + ": action must be an object";
      return false;
    }
    const std::string op = canonical_plan_op(string_member(action, "op", "type"));
    if (op.empty()) {
      error = at + ": missing op";
      return false;
    }
    if (!supported_ops().count(op)) {
      error = at + ": unsupported op: " + op;
      return false;
    }
    if ((op == "upsert_block" || op == "set_block_text" || op == "rollback_block") &&
        string_member(action, "block_id", "blockId").empty()) {
      error = at + ": " + op + " requires block_id";
      return false;
    }
    if (op == "insert_text" || op == "set_block_text") {
      const nlohmann::json* text = member(action, "text");
      if (!text || !text->is_string()) {
        error = at + ": " + op + " requires a text string";
        return false;
      }
    }
    if (op == "insert_table") {
      const TableSpec table = table_from(action);
      if (table.rows == 0 || table.cols == 0) {
        error = at + ": insert_table requires rows/cols or data";
        return false;
      }
    }
    if (op == "upsert_block") {
      const nlohmann::json* nested = member(action, "actions");
      const bool has_text = member(action, "text") && member(action, "text")->is_string();
      if (nested) {
        if (!validate_actions(*nested, at + ".actions", error)) {
          return false;
        }
      } else if (!has_text) {
        error = at + ": upsert_block requires actions or text";
        return false;
      }
    }
  }
  return true;
}

} // namespace

std::string canonical_plan_op(const std::string& op) {
  static const std::map<std::string, std::string> aliases = {
      {"upsertBlock", "upsert_block"},         {"insertText", "insert_text"},
      {"insertParagraph", "insert_paragraph"}, {"insertTable", "insert_table"},
      {"setBlockText", "set_block_text"},      {"rollbackBlock", "rollback_block"},
  };
  auto it = aliases.find(op);
  return it == aliases.end() ? op : it->second;
}

PlanExecutor::PlanExecutor(RunContext& ctx) : ctx_(ctx), blocks_(ctx) {}

bool PlanExecutor::validate(const nlohmann::json& plan, HostFlavor host, std::string& error) {
  if (!plan.is_object()) {
    error = "plan must be a JSON object";
    return false;
  }
  const std::string schema = string_member(plan, "schema_version", "schema");
  if (schema != kPlanSchemaVersion) {
    error = "schema_version mismatch: expected " + std::string(kPlanSchemaVersion);
    return false;
  }
  const std::string host_app = string_member(plan, "host_app", "hostApp");
  if (!host_app.empty()) {
    const HostFlavor wanted = parse_host_flavor(host_app);
    if (wanted == HostFlavor::Unknown) {
      error = "unknown host_app: " + host_app;
      return false;
    }
    if (host != HostFlavor::Unknown && wanted != host) {
      error = std::string("host_app mismatch: plan=") + host_flavor_name(wanted) + " actual=" + host_flavor_name(host);
      return false;
    }
  }
  const nlohmann::json* actions = member(plan, "actions");
  if (!actions) {
    error = "plan has no actions";
    return false;
  }
  return validate_actions(*actions, "actions", error);
}

PlanResult PlanExecutor::execute(const nlohmann::json& plan) {
  PlanResult result;
  std::string error;
  if (!validate(plan, ctx_.doc().flavor(), error)) {
    result.message = "invalid plan: " + error;
    result.error = MacroError(ErrorKind::SyntaxDefect, "invalid_plan", result.message);
    log::warn("plan: " + result.message);
    return result;
  }

  const nlohmann::json& actions = *member(plan, "actions");
  log::info("plan: " + std::to_string(actions.size()) + " action(s) on " + ctx_.doc().document_id());
  BlockWriter writer = blocks_.selection_writer();
  try {
    run_actions(actions, "", writer, result.steps);
    result.success = true;
    result.message = "plan applied: " + std::to_string(result.steps.size()) + " step(s)";
  } catch (const MacroError& e) {
    result.error = e;
    result.message = e.display();
    log::warn("plan failed: " + result.message);
  }
  result.upserted = ctx_.upserted_blocks();
  return result;
}

void PlanExecutor::run_actions(const nlohmann::json& actions, const std::string& prefix, BlockWriter& writer,
                               std::vector<PlanStep>& steps) {
  size_t index = 0;
  for (const auto& action : actions) {
    ++index;
    const std::string step_id = prefix + std::to_string(index);
    const std::string op = canonical_plan_op(string_member(action, "op", "type"));
    const size_t slot = steps.size();
    steps.push_back(PlanStep{step_id, op, false, {}});
    try {
      run_action(action, op, writer, steps, step_id);
    } catch (const MacroError& e) {
      steps[slot].error = e.display();
      throw;
    } catch (const std::exception& e) {
      const HostApiError wrapped(e.what());
      steps[slot].error = wrapped.display();
      throw wrapped;
    }
    steps[slot].ok = true;
  }
}

void PlanExecutor::run_action(const nlohmann::json& action, const std::string& op, BlockWriter& writer,
                              std::vector<PlanStep>& steps, const std::string& step_id) {
  if (op == "insert_text") {
    if (bool_member(action, "new_paragraph_before", false)) {
      writer.type_paragraph();
    }
    writer.type_text(string_member(action, "text"));
    if (bool_member(action, "new_paragraph_after", false)) {
      writer.type_paragraph();
    }
  } else if (op == "insert_paragraph") {
    const std::string text = string_member(action, "text");
    if (!text.empty()) {
      writer.type_text(text);
    }
    writer.type_paragraph();
  } else if (op == "insert_table") {
    writer.insert_table(table_from(action));
  } else if (op == "set_block_text") {
    blocks_.set_block_text(sanitize_block_id(string_member(action, "block_id", "blockId")),
                           string_member(action, "text"));
  } else if (op == "rollback_block") {
    blocks_.rollback(sanitize_block_id(string_member(action, "block_id", "blockId")));
  } else if (op == "upsert_block") {
    UpsertOptions options;
    if (auto anchor = parse_anchor_placement(string_member(action, "anchor"))) {
      options.anchor = *anchor;
    }
    if (auto mode = parse_anchor_mode(string_member(action, "anchor_mode", "anchorMode"))) {
      options.anchor_mode = mode;
    }
    if (const nlohmann::json* backup = member(action, "backup")) {
      if (backup->is_boolean()) {
        options.backup = backup->get<bool>();
      }
    }
    options.freeze_selection = bool_member(action, "freeze_cursor", true);

    const nlohmann::json* nested = member(action, "actions");
    const nlohmann::json* text = member(action, "text");
    const std::string prefix = step_id + ".";
    blocks_.upsert(
        sanitize_block_id(string_member(action, "block_id", "blockId")),
        [&](BlockWriter& inner) -> std::optional<std::string> {
          if (nested) {
            run_actions(*nested, prefix, inner, steps);
          }
          if (text && text->is_string()) {
            return text->get<std::string>();
          }
          return std::nullopt;
        },
        options);
  } else {
    throw MacroError(ErrorKind::SyntaxDefect, "invalid_plan", "unsupported op: " + op);
  }
}

} // namespace dmk
