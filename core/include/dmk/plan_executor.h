#pragma once

#include "dmk/block_manager.h"
#include "dmk/errors.h"
#include "dmk/run_context.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dmk {

struct PlanStep {
  std::string id;  // "1", "2.1", ... (nested actions of an upsert_block)
  std::string op;
  bool ok = false;
  std::string error;
};

struct PlanResult {
  bool success = false;
  std::string message;
  std::vector<PlanStep> steps;
  std::vector<std::string> upserted;
  // Set when success is false.
  std::optional<MacroError> error;
};

// Runs a dmk.plan.v1 document against the run's host document:
//
//   {"schema_version": "dmk.plan.v1", "host_app": "writer",
//    "actions": [{"op": "upsert_block", "block_id": "summary",
//                 "actions": [{"op": "insert_text", "text": "..."}]}]}
//
// Supported ops: upsert_block, insert_text, insert_paragraph, insert_table,
// set_block_text, rollback_block. camelCase spellings are accepted. Execution
// stops at the first failing action.
class PlanExecutor {
 public:
  explicit PlanExecutor(RunContext& ctx);

  // Structural problems are reported as SyntaxDefect "invalid_plan" before
  // anything runs. Engine errors from an action end the run and are returned
  // in PlanResult::error; anything else propagates.
  PlanResult execute(const nlohmann::json& plan);

  // Structural check only. Returns false with a reason.
  static bool validate(const nlohmann::json& plan, HostFlavor host, std::string& error);

 private:
  void run_actions(const nlohmann::json& actions, const std::string& prefix, BlockWriter& writer,
                   std::vector<PlanStep>& steps);
  void run_action(const nlohmann::json& action, const std::string& op, BlockWriter& writer,
                  std::vector<PlanStep>& steps, const std::string& step_id);

  RunContext& ctx_;
  BlockManager blocks_;
};

// "insertText" -> "insert_text"; unknown names pass through unchanged.
std::string canonical_plan_op(const std::string& op);

} // namespace dmk
