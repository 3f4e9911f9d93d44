#include "dmk_script/macro_executor.h"

#include "dmk/block_manager.h"
#include "dmk/errors.h"
#include "dmk/log.h"
#include "dmk/plan_executor.h"
#include "dmk/text_util.h"

#include <set>

namespace dmk {

namespace {

constexpr size_t kMaxAlerts = 20;
constexpr const char* kUnitName = "dmk_macro.js";

const char* kNativeNames[] = {natives::kUpsert,     natives::kTypeText,     natives::kTypeParagraph,
                              natives::kInsertTable, natives::kBlockExists,  natives::kGetBlockText,
                              natives::kSetBlockText, natives::kRollback,    natives::kAlert,
                              natives::kLog};

// Natives capture run-scoped objects; once the run is over they are replaced
// by stubs so a stray evaluation cannot reach a dead context.
class ScopedRun {
 public:
  explicit ScopedRun(script::IScriptRuntime& runtime) : runtime_(runtime) {}
  ~ScopedRun() {
    runtime_.set_interrupt({});
    for (const char* name : kNativeNames) {
      runtime_.bind_native({name, [](const script::NativeCall&) -> nlohmann::json {
                              throw MacroError(ErrorKind::EnvironmentUnavailable, "no_active_run",
                                               "document natives are only available while a macro runs");
                            }});
    }
  }
  ScopedRun(const ScopedRun&) = delete;
  ScopedRun& operator=(const ScopedRun&) = delete;

 private:
  script::IScriptRuntime& runtime_;
};

TableSpec table_from_args(const script::NativeCall& call) {
  TableSpec table;
  const nlohmann::json& cells = call.arg(2);
  if (cells.is_array()) {
    for (const auto& row : cells) {
      std::vector<std::string> out;
      if (row.is_array()) {
        for (const auto& cell : row) {
          out.push_back(cell.is_string() ? cell.get<std::string>() : (cell.is_null() ? std::string() : cell.dump()));
        }
      }
      if (out.size() > table.cols) {
        table.cols = out.size();
      }
      table.cells.push_back(std::move(out));
    }
    table.rows = table.cells.size();
  }
  if (call.arg(0).is_number_integer() && call.arg(0).get<long long>() > 0) {
    table.rows = static_cast<size_t>(call.arg(0).get<long long>());
  }
  if (call.arg(1).is_number_integer() && call.arg(1).get<long long>() > 0) {
    table.cols = static_cast<size_t>(call.arg(1).get<long long>());
  }
  if (table.rows == 0 || table.cols == 0) {
    throw MacroError(ErrorKind::SyntaxDefect, "invalid_table", "BID.insertTable needs rows and cols");
  }
  return table;
}

UpsertOptions upsert_options_from(const nlohmann::json& opts) {
  UpsertOptions options;
  if (!opts.is_object()) {
    return options;
  }
  if (auto it = opts.find("anchor"); it != opts.end() && it->is_string()) {
    if (auto placement = parse_anchor_placement(it->get<std::string>())) {
      options.anchor = *placement;
    } else if (auto mode = parse_anchor_mode(it->get<std::string>())) {
      options.anchor_mode = mode;
    }
  }
  if (auto it = opts.find("anchorMode"); it != opts.end() && it->is_string()) {
    if (auto mode = parse_anchor_mode(it->get<std::string>())) {
      options.anchor_mode = mode;
    }
  }
  if (auto it = opts.find("backup"); it != opts.end() && it->is_boolean()) {
    options.backup = it->get<bool>();
  }
  if (auto it = opts.find("changeLog"); it != opts.end() && it->is_boolean()) {
    options.change_log = it->get<bool>();
  }
  if (auto it = opts.find("freezeCursor"); it != opts.end() && it->is_boolean()) {
    options.freeze_selection = it->get<bool>();
  }
  return options;
}

nlohmann::json normalization_json(const NormalizationResult& n) {
  return nlohmann::json{{"changed", n.changed}, {"notes", n.notes}};
}

} // namespace

MacroExecutor::MacroExecutor(IHostDocument& doc, script::IScriptRuntime& runtime, IBackupStore* backups,
                             IAuditSink* audit)
    : doc_(doc), runtime_(runtime), backups_(backups), audit_(audit) {}

const HostCapabilities& MacroExecutor::capabilities() {
  if (!caps_) {
    caps_ = probe_capabilities(doc_);
    log::info(std::string("host capabilities: bookmarks=") + (caps_->bookmarks ? "1" : "0") +
              " set_range=" + (caps_->set_range ? "1" : "0") + " find=" + (caps_->find ? "1" : "0") +
              " hidden=" + (caps_->hidden_font ? "1" : "0") + " tables=" + (caps_->tables ? "1" : "0"));
  }
  return *caps_;
}

PreparedMacro MacroExecutor::prepare(const SourceUnit& source) const {
  PreparedMacro prepared;
  prepared.payload = classify_payload(source.code);
  if (prepared.payload.kind == PayloadKind::Plan) {
    return prepared;
  }
  const std::string& script = prepared.payload.script;
  prepared.directives = parse_directives(script, options_.directive_prefix);

  NormalizeOptions normalize;
  normalize.host = source.host;
  normalize.directive_prefix = options_.directive_prefix;
  prepared.normalized = normalize_source(script, normalize);
  if (prepared.payload.kind == PayloadKind::WrappedScript) {
    prepared.normalized.add_note("unwrapped script from JSON envelope");
  }

  check_script(prepared.normalized.code, prepared.directives);
  prepared.unit = build_runnable_unit(prepared.normalized.code, prepared.directives, source.host);
  return prepared;
}

ExecutionResult MacroExecutor::failure(const MacroError& error, nlohmann::json diagnostic) {
  ExecutionResult result;
  result.success = false;
  result.message = error.display();
  diagnostic["error_kind"] = error_kind_name(error.kind());
  diagnostic["error_code"] = error.code();
  diagnostic["details"] = error.details();
  diagnostic["failure_class"] = failure_class_name(classify_failure(error));
  result.diagnostic = std::move(diagnostic);
  return result;
}

ExecutionResult MacroExecutor::script_failure(const std::string& name, const std::string& message,
                                              const std::string& stack, nlohmann::json diagnostic) {
  ExecutionResult result;
  result.success = false;
  result.message = name + ": " + message;
  diagnostic["script_error"] = {{"name", name}, {"message", message}, {"stack", stack}};
  diagnostic["error_kind"] = name;
  diagnostic["error_code"] = "script_error";
  diagnostic["failure_class"] = failure_class_name(classify_failure(name, message));
  result.diagnostic = std::move(diagnostic);
  return result;
}

void MacroExecutor::finish(AuditEvent& audit, ExecutionResult& result, RunContext* ctx) {
  audit.success = result.success;
  if (!result.success) {
    audit.error_type = result.diagnostic.value("error_kind", std::string());
    audit.error_message = truncate_bytes(result.message, DiagRing::kMaxMessage);
    audit.failure_class = result.diagnostic.value("failure_class", std::string());
  }
  if (ctx) {
    const Guard& guard = ctx->guard();
    audit.ops_performed.insert(guard.op_log().begin(), guard.op_log().end());
    result.diagnostic["ops_used"] = guard.ops_used();
    result.diagnostic["elapsed_ms"] = guard.elapsed_ms();
    result.diagnostic["ops"] = guard.op_log();
    result.diagnostic["diag"] = to_json(ctx->diag());
    if (ctx->diag().dropped() > 0) {
      result.diagnostic["diag_dropped"] = ctx->diag().dropped();
    }
    if (audit.block_id.empty() && !ctx->upserted_blocks().empty()) {
      audit.block_id = ctx->upserted_blocks().front();
    }
  }
  result.diagnostic["attempt"] = audit.attempt;

  if (result.success) {
    log::info(audit.mode + " ok" + (audit.block_id.empty() ? std::string() : " block=" + audit.block_id));
  } else {
    log::warn(audit.mode + " failed (" + audit.failure_class + "): " + result.message);
  }
  if (audit_) {
    audit_->emit(audit);
  }
}

ExecutionResult MacroExecutor::execute(const SourceUnit& source) {
  AuditEvent audit;
  audit.mode = "macro";
  audit.session_id = options_.session_id;
  audit.host_app = host_flavor_name(source.host);
  audit.attempt = source.attempt;
  audit.ts = now_iso();

  PreparedMacro prepared;
  try {
    prepared = prepare(source);
  } catch (const MacroError& e) {
    nlohmann::json diagnostic;
    if (!source.prior_error_type.empty()) {
      diagnostic["prior_error"] = {{"type", source.prior_error_type}, {"message", source.prior_error_message}};
    }
    if (e.kind() == ErrorKind::SyntaxDefect) {
      nlohmann::json chars = nlohmann::json::array();
      for (const auto& sc : find_suspicious_chars(source.code)) {
        chars.push_back({{"offset", sc.offset}, {"ch", sc.ch}, {"code_point", sc.code_point}});
      }
      diagnostic["suspicious_chars"] = std::move(chars);
    }
    ExecutionResult result = failure(e, std::move(diagnostic));
    finish(audit, result, nullptr);
    return result;
  }

  if (prepared.payload.kind == PayloadKind::Plan) {
    log::info("payload is a " + std::string(kPlanSchemaVersion) + " plan");
    return execute_plan(prepared.payload.plan, source.attempt);
  }
  return run_script(source, prepared, audit);
}

ExecutionResult MacroExecutor::run_script(const SourceUnit& source, const PreparedMacro& prepared,
                                          AuditEvent& audit) {
  nlohmann::json diagnostic;
  diagnostic["normalization"] = normalization_json(prepared.normalized);
  diagnostic["wrapped"] = prepared.unit.wrapped;
  if (prepared.unit.wrapped) {
    diagnostic["block_id"] = prepared.unit.block_id;
    audit.block_id = prepared.unit.block_id;
  }
  if (!source.prior_error_type.empty()) {
    diagnostic["prior_error"] = {{"type", source.prior_error_type}, {"message", source.prior_error_message}};
  }

  RunContext ctx(doc_, capabilities(), options_.limits, backups_);
  ctx.options() = options_.run;
  if (prepared.directives.backup_off) {
    ctx.options().backup = false;
  }
  if (prepared.directives.anchor_mode) {
    ctx.options().anchor_mode = *prepared.directives.anchor_mode;
  }
  BlockManager blocks(ctx);
  std::vector<std::string> alerts;

  ExecutionResult result;
  try {
    if (!runtime_ready_) {
      std::string error;
      if (!runtime_.init(error)) {
        throw MacroError(ErrorKind::EnvironmentUnavailable, "runtime_unavailable", error);
      }
      runtime_ready_ = true;
    }
    ScopedRun scope(runtime_);
    bind_natives(ctx, blocks, alerts);
    runtime_.set_interrupt([&ctx] { ctx.guard().poll(); });

    const script::EvalOutcome outcome = runtime_.evaluate(prepared.unit.code, kUnitName);
    if (!outcome.ok) {
      result = script_failure(outcome.error_name, outcome.error_message, outcome.stack, std::move(diagnostic));
    } else {
      // A block the macro upserted must still be addressable afterwards.
      std::set<std::string> seen;
      for (const auto& id : ctx.upserted_blocks()) {
        if (seen.insert(id).second && !blocks.block_exists(id)) {
          throw MacroError(ErrorKind::ContentNotProduced, "block_not_found",
                           "upsertBlock ran for " + id + " but no anchor exists afterwards");
        }
      }
      result.success = true;
      result.message = "OK";
      result.value = outcome.value;
      result.diagnostic = std::move(diagnostic);
    }
  } catch (const MacroError& e) {
    result = failure(e, std::move(diagnostic));
  } catch (const script::ScriptError& e) {
    result = script_failure(e.name(), e.what(), std::string(), std::move(diagnostic));
  } catch (const std::exception& e) {
    result = failure(HostApiError(e.what()), std::move(diagnostic));
  }
  if (!alerts.empty()) {
    result.diagnostic["alerts"] = alerts;
  }
  finish(audit, result, &ctx);
  return result;
}

void MacroExecutor::bind_natives(RunContext& ctx, BlockManager& blocks, std::vector<std::string>& alerts) {
  using script::NativeCall;
  runtime_.bind_native({natives::kUpsert, [&blocks](const NativeCall& call) -> nlohmann::json {
                          if (!call.is_function(1)) {
                            throw MacroError(ErrorKind::SyntaxDefect, "invalid_upsert",
                                             "BID.upsertBlock expects (blockId, function, opts)");
                          }
                          nlohmann::json produced;
                          blocks.upsert(
                              sanitize_block_id(call.string_arg(0)),
                              [&](BlockWriter&) -> std::optional<std::string> {
                                produced = call.call_function(1);
                                if (produced.is_string()) {
                                  return produced.get<std::string>();
                                }
                                if (produced.is_number()) {
                                  return produced.dump();
                                }
                                return std::nullopt;
                              },
                              upsert_options_from(call.arg(2)));
                          return produced;
                        }});
  runtime_.bind_native({natives::kTypeText, [&blocks](const NativeCall& call) -> nlohmann::json {
                          blocks.selection_writer().type_text(call.string_arg(0));
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kTypeParagraph, [&blocks](const NativeCall&) -> nlohmann::json {
                          blocks.selection_writer().type_paragraph();
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kInsertTable, [&blocks](const NativeCall& call) -> nlohmann::json {
                          blocks.selection_writer().insert_table(table_from_args(call));
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kBlockExists, [&blocks](const NativeCall& call) -> nlohmann::json {
                          return blocks.block_exists(sanitize_block_id(call.string_arg(0)));
                        }});
  runtime_.bind_native({natives::kGetBlockText, [&blocks](const NativeCall& call) -> nlohmann::json {
                          const auto text = blocks.get_block_text(sanitize_block_id(call.string_arg(0)));
                          return text ? nlohmann::json(*text) : nlohmann::json();
                        }});
  runtime_.bind_native({natives::kSetBlockText, [&blocks](const NativeCall& call) -> nlohmann::json {
                          blocks.set_block_text(sanitize_block_id(call.string_arg(0)), call.string_arg(1));
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kRollback, [&blocks](const NativeCall& call) -> nlohmann::json {
                          blocks.rollback(sanitize_block_id(call.string_arg(0)));
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kAlert, [&ctx, &alerts](const NativeCall& call) -> nlohmann::json {
                          const std::string message = truncate_bytes(call.string_arg(0), DiagRing::kMaxMessage);
                          if (alerts.size() < kMaxAlerts) {
                            alerts.push_back(message);
                          } else {
                            ctx.diag().record("alert_dropped", message);
                          }
                          log::info("macro alert: " + message);
                          return nullptr;
                        }});
  runtime_.bind_native({natives::kLog, [](const NativeCall& call) -> nlohmann::json {
                          log::info("macro: " + truncate_bytes(call.string_arg(0), DiagRing::kMaxMessage));
                          return nullptr;
                        }});
}

ExecutionResult MacroExecutor::execute_plan(const nlohmann::json& plan, int attempt) {
  AuditEvent audit;
  audit.mode = "plan";
  audit.session_id = options_.session_id;
  audit.host_app = host_flavor_name(doc_.flavor());
  audit.attempt = attempt;
  audit.ts = now_iso();

  RunContext ctx(doc_, capabilities(), options_.limits, backups_);
  ctx.options() = options_.run;
  PlanExecutor executor(ctx);
  const PlanResult plan_result = executor.execute(plan);

  nlohmann::json diagnostic;
  nlohmann::json steps = nlohmann::json::array();
  for (const auto& step : plan_result.steps) {
    nlohmann::json s{{"id", step.id}, {"op", step.op}, {"ok", step.ok}};
    if (!step.error.empty()) {
      s["error"] = step.error;
    }
    steps.push_back(std::move(s));
  }
  diagnostic["steps"] = std::move(steps);

  ExecutionResult result;
  if (plan_result.error) {
    result = failure(*plan_result.error, std::move(diagnostic));
  } else {
    result.success = true;
    result.message = plan_result.message;
    result.diagnostic = std::move(diagnostic);
  }
  finish(audit, result, &ctx);
  return result;
}

ExecutionResult MacroExecutor::rollback(const std::string& block_id) {
  AuditEvent audit;
  audit.mode = "rollback";
  audit.session_id = options_.session_id;
  audit.host_app = host_flavor_name(doc_.flavor());
  audit.block_id = sanitize_block_id(block_id);
  audit.ts = now_iso();

  RunContext ctx(doc_, capabilities(), options_.limits, backups_);
  ctx.options() = options_.run;
  BlockManager blocks(ctx);
  ExecutionResult result;
  try {
    blocks.rollback(audit.block_id);
    result.success = true;
    result.message = "OK";
  } catch (const MacroError& e) {
    result = failure(e, nlohmann::json::object());
  } catch (const std::exception& e) {
    result = failure(HostApiError(e.what()), nlohmann::json::object());
  }
  finish(audit, result, &ctx);
  return result;
}

} // namespace dmk
