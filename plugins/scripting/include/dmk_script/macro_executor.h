#pragma once

#include "dmk/backup.h"
#include "dmk/diagnostics.h"
#include "dmk/exec_wrapper.h"
#include "dmk/guard.h"
#include "dmk/host_document.h"
#include "dmk/normalize.h"
#include "dmk/run_context.h"
#include "dmk/safety_gate.h"
#include "dmk_script/script_runtime.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dmk {

class BlockManager;

// One execution request. Attempt metadata is carried through to the audit
// event and diagnostic so the repair loop can correlate retries.
struct SourceUnit {
  std::string code;
  HostFlavor host = HostFlavor::Writer;
  int attempt = 1;
  std::string prior_error_type;
  std::string prior_error_message;
};

struct ExecutionResult {
  bool success = false;
  // "OK" or "<Kind>: <message>".
  std::string message;
  nlohmann::json value;  // completion value of the macro
  nlohmann::json diagnostic = nlohmann::json::object();
};

struct ExecutorOptions {
  GuardLimits limits;
  RunOptions run;
  std::string directive_prefix = "@dmk:";
  std::string session_id;
};

// Everything decided before the script runs.
struct PreparedMacro {
  PayloadClass payload;
  NormalizationResult normalized;
  Directives directives;
  RunnableUnit unit;
};

// Drives one macro from raw text to document side effects:
// gate -> normalize -> check -> wrap -> evaluate -> post-run checks -> audit.
class MacroExecutor {
 public:
  MacroExecutor(IHostDocument& doc, script::IScriptRuntime& runtime, IBackupStore* backups = nullptr,
                IAuditSink* audit = nullptr);

  void set_options(const ExecutorOptions& options) { options_ = options; }
  const ExecutorOptions& options() const { return options_; }

  // Probed on first use and reused for the rest of the session.
  const HostCapabilities& capabilities();

  // Runs the front half of the pipeline. Throws MacroError (SyntaxDefect,
  // SecurityViolation) exactly as execute() would report it. Plans stop after
  // classification.
  PreparedMacro prepare(const SourceUnit& source) const;

  ExecutionResult execute(const SourceUnit& source);
  ExecutionResult execute_plan(const nlohmann::json& plan, int attempt = 1);

  // Restores the latest backup of a block outside any macro.
  ExecutionResult rollback(const std::string& block_id);

 private:
  ExecutionResult run_script(const SourceUnit& source, const PreparedMacro& prepared, AuditEvent& audit);
  void bind_natives(RunContext& ctx, BlockManager& blocks, std::vector<std::string>& alerts);
  void finish(AuditEvent& audit, ExecutionResult& result, RunContext* ctx);
  ExecutionResult failure(const MacroError& error, nlohmann::json diagnostic);
  // Uncaught error thrown by the script itself ("ReferenceError: x is not defined").
  ExecutionResult script_failure(const std::string& name, const std::string& message, const std::string& stack,
                                 nlohmann::json diagnostic);

  IHostDocument& doc_;
  script::IScriptRuntime& runtime_;
  IBackupStore* backups_;
  IAuditSink* audit_;
  ExecutorOptions options_;
  std::optional<HostCapabilities> caps_;
  bool runtime_ready_ = false;
};

} // namespace dmk
