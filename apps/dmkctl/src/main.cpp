#include "dmk/block_manager.h"
#include "dmk/config.h"
#include "dmk/diagnostics.h"
#include "dmk/errors.h"
#include "dmk/log.h"
#include "dmk/memory_document.h"
#include "dmk/plan_executor.h"
#include "dmk/text_util.h"
#include "dmk_data/backup_store.h"
#include "dmk_data/document_io.h"
#include "dmk_data/serialization.h"
#include "dmk_script/macro_executor.h"
#include "dmk_script/script_runtime.h"
#include "dmkctl/cli_api.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool parse_int(const std::string& text, int& out) {
  if (text.empty()) {
    return false;
  }
  int value = 0;
  for (char c : text) {
    if (c < '0' || c > '9' || value > 100000) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

bool needs_document(const std::string& command) {
  return command == "run" || command == "plan" || command == "rollback" || command == "blocks";
}

json result_json(const dmk::ExecutionResult& result) {
  json j;
  j["success"] = result.success;
  j["message"] = result.message;
  j["value"] = result.value;
  j["diagnostic"] = result.diagnostic;
  return j;
}

void print_result(const CliOptions& opts, const dmk::ExecutionResult& result, std::ostream& out,
                  std::ostream& err) {
  if (opts.json) {
    out << result_json(result).dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return;
  }
  if (result.success) {
    out << result.message << "\n";
    if (!result.value.is_null()) {
      out << "value: " << (result.value.is_string() ? result.value.get<std::string>() : result.value.dump()) << "\n";
    }
  } else {
    err << result.message << "\n";
    if (result.diagnostic.contains("details")) {
      for (const auto& d : result.diagnostic["details"]) {
        err << "  - " << d.get<std::string>() << "\n";
      }
    }
  }
}

struct Session {
  dmk::MacroConfig config;
  std::unique_ptr<dmk::MemoryDocument> doc;
  std::unique_ptr<dmk::IBackupStore> backups;
  std::unique_ptr<dmk::IAuditSink> audit;
};

bool open_session(const CliOptions& opts, Session& session, std::string& error) {
  if (!resolve_config(opts, session.config, error)) {
    return false;
  }
  if (needs_document(opts.command)) {
    dmk::MemoryDocumentOptions doc_options;
    doc_options.flavor = session.config.host;
    session.doc = dmk::data::load_document(opts.doc_path, doc_options, error);
    if (!session.doc) {
      return false;
    }
  }
  session.backups = dmk::data::make_backup_store(session.config.backup_store_kind,
                                                 session.config.backup_store_path.string(), error);
  if (!session.backups) {
    return false;
  }
  if (!session.config.audit_log.empty()) {
    session.audit = std::make_unique<dmk::JsonlAuditSink>(session.config.audit_log);
  }
  return true;
}

dmk::ExecutorOptions executor_options(const dmk::MacroConfig& config) {
  dmk::ExecutorOptions options;
  options.limits = config.limits;
  options.run.backup = config.backup;
  options.run.change_log = config.change_log;
  options.run.anchor_mode = config.anchor_mode;
  options.directive_prefix = config.directive_prefix;
  options.session_id = "dmkctl-" + dmk::to_hex(dmk::fnv1a_64(dmk::now_iso()), 8);
  return options;
}

bool save_output(const CliOptions& opts, const Session& session, std::ostream& err) {
  const fs::path target = output_document_path(opts);
  std::string error;
  if (!dmk::data::save_document(target, *session.doc, error)) {
    err << error << "\n";
    return false;
  }
  dmk::log::info("document written: " + target.string());
  return true;
}

int cmd_source(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  std::string code;
  if (!dmk::data::read_text_file(opts.in_path, code)) {
    err << "cannot read " << opts.in_path.string() << "\n";
    return 1;
  }
  dmk::MacroConfig config;
  std::string error;
  if (!resolve_config(opts, config, error)) {
    err << error << "\n";
    return 1;
  }

  if (opts.command == "normalize") {
    dmk::NormalizeOptions normalize;
    normalize.host = config.host;
    normalize.directive_prefix = config.directive_prefix;
    const dmk::NormalizationResult result = dmk::normalize_source(code, normalize);
    if (opts.json) {
      out << json{{"code", result.code}, {"changed", result.changed}, {"notes", result.notes}}.dump(2) << "\n";
    } else {
      out << result.code;
      if (!result.code.empty() && result.code.back() != '\n') {
        out << "\n";
      }
      for (const auto& note : result.notes) {
        err << "note: " << note << "\n";
      }
    }
    return 0;
  }

  // check / wrap share the executor's front half; no document or runtime is touched.
  dmk::MemoryDocument scratch;
  auto runtime = dmk::script::make_js_runtime();
  dmk::MacroExecutor executor(scratch, *runtime);
  dmk::ExecutorOptions options = executor_options(config);
  executor.set_options(options);
  dmk::SourceUnit source;
  source.code = code;
  source.host = config.host;
  try {
    const dmk::PreparedMacro prepared = executor.prepare(source);
    if (prepared.payload.kind == dmk::PayloadKind::Plan) {
      std::string plan_error;
      if (!dmk::PlanExecutor::validate(prepared.payload.plan, config.host, plan_error)) {
        err << "SyntaxDefect: invalid plan: " << plan_error << "\n";
        return 1;
      }
      out << (opts.command == "check" ? "OK (plan)\n" : prepared.payload.plan.dump(2) + "\n");
      return 0;
    }
    if (opts.command == "check") {
      if (opts.json) {
        out << json{{"ok", true},
                    {"wrapped", prepared.unit.wrapped},
                    {"block_id", prepared.unit.block_id},
                    {"notes", prepared.normalized.notes}}
                   .dump(2)
            << "\n";
      } else {
        out << "OK" << (prepared.unit.wrapped ? " (wraps as block " + prepared.unit.block_id + ")" : "") << "\n";
      }
      return 0;
    }
    out << prepared.unit.code;
    if (!prepared.unit.code.empty() && prepared.unit.code.back() != '\n') {
      out << "\n";
    }
    for (const auto& note : prepared.unit.notes) {
      err << "note: " << note << "\n";
    }
    return 0;
  } catch (const dmk::MacroError& e) {
    if (opts.json) {
      out << json{{"ok", false},
                  {"error_kind", dmk::error_kind_name(e.kind())},
                  {"error_code", e.code()},
                  {"message", e.display()},
                  {"details", e.details()}}
                 .dump(2)
          << "\n";
    } else {
      err << e.display() << "\n";
      for (const auto& d : e.details()) {
        err << "  - " << d << "\n";
      }
    }
    return 1;
  }
}

int cmd_blocks(const Session& session, const CliOptions& opts, std::ostream& out) {
  std::vector<std::string> ids = dmk::marker_block_ids(session.doc->raw_text());
  const std::vector<std::string> backed_up = session.backups->list_blocks(session.doc->document_id());
  for (const auto& id : backed_up) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
      ids.push_back(id);
    }
  }

  dmk::RunContext ctx(*session.doc, dmk::probe_capabilities(*session.doc), session.config.limits,
                      session.backups.get());
  dmk::BlockManager blocks(ctx);
  json rows = json::array();
  for (const auto& id : ids) {
    const bool exists = blocks.block_exists(id);
    const auto text = blocks.get_block_text(id);
    rows.push_back({{"block_id", id},
                    {"exists", exists},
                    {"anchors", blocks.anchor_count(id)},
                    {"backup", blocks.has_backup(id)},
                    {"text", text ? json(*text) : json()}});
  }
  if (opts.json) {
    out << rows.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    return 0;
  }
  for (const auto& row : rows) {
    out << row["block_id"].get<std::string>() << (row["exists"].get<bool>() ? "" : " (missing)")
        << " anchors=" << row["anchors"].get<size_t>() << (row["backup"].get<bool>() ? " backup" : "") << "\n";
  }
  return 0;
}

} // namespace

bool parse_cli(int argc, char** argv, CliOptions& out, std::string& error) {
  if (argc < 2) {
    error = "missing command";
    return false;
  }
  out.command = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--in" && has_value) {
      out.in_path = argv[++i];
    } else if (arg == "--doc" && has_value) {
      out.doc_path = argv[++i];
    } else if (arg == "--out" && has_value) {
      out.out_path = argv[++i];
    } else if (arg == "--plan" && has_value) {
      out.plan_path = argv[++i];
    } else if (arg == "--config" && has_value) {
      out.config_path = argv[++i];
    } else if (arg == "--host" && has_value) {
      out.host = std::string(argv[++i]);
    } else if (arg == "--store" && has_value) {
      out.store_kind = std::string(argv[++i]);
    } else if (arg == "--backups" && has_value) {
      out.store_path = fs::path(argv[++i]);
    } else if (arg == "--audit" && has_value) {
      out.audit_path = fs::path(argv[++i]);
    } else if (arg == "--block" && has_value) {
      out.block_id = argv[++i];
    } else if (arg == "--attempt" && has_value) {
      if (!parse_int(argv[++i], out.attempt) || out.attempt < 1) {
        error = "--attempt expects a positive integer";
        return false;
      }
    } else if (arg == "--prior-error-type" && has_value) {
      out.prior_error_type = argv[++i];
    } else if (arg == "--prior-error" && has_value) {
      out.prior_error_message = argv[++i];
    } else if (arg == "--json") {
      out.json = true;
    } else if (arg == "--verbose") {
      out.verbose = true;
    } else {
      error = "unknown or incomplete option: " + arg;
      return false;
    }
  }

  const std::string& c = out.command;
  if (c == "normalize" || c == "check" || c == "wrap") {
    if (out.in_path.empty()) {
      error = c + " requires --in <file>";
      return false;
    }
  } else if (c == "run") {
    if (out.in_path.empty() || out.doc_path.empty()) {
      error = "run requires --in <file> and --doc <file>";
      return false;
    }
  } else if (c == "plan") {
    if (out.plan_path.empty() || out.doc_path.empty()) {
      error = "plan requires --plan <file> and --doc <file>";
      return false;
    }
  } else if (c == "rollback") {
    if (out.block_id.empty() || out.doc_path.empty()) {
      error = "rollback requires --block <id> and --doc <file>";
      return false;
    }
  } else if (c == "blocks") {
    if (out.doc_path.empty()) {
      error = "blocks requires --doc <file>";
      return false;
    }
  } else {
    error = "unknown command: " + c;
    return false;
  }
  return true;
}

bool resolve_config(const CliOptions& opts, dmk::MacroConfig& out, std::string& error) {
  dmk::MacroConfig config;
  if (!opts.config_path.empty()) {
    std::error_code ec;
    if (!fs::exists(opts.config_path, ec)) {
      error = "config not found: " + opts.config_path.string();
      return false;
    }
    config = dmk::load_macro_config(opts.config_path);
  }
  if (opts.host) {
    const dmk::HostFlavor host = dmk::parse_host_flavor(*opts.host);
    if (host == dmk::HostFlavor::Unknown) {
      error = "unknown host: " + *opts.host;
      return false;
    }
    config.host = host;
  }
  if (opts.store_kind) {
    config.backup_store_kind = *opts.store_kind;
  }
  if (opts.store_path) {
    config.backup_store_path = *opts.store_path;
  }
  if (opts.audit_path) {
    config.audit_log = *opts.audit_path;
  }
  out = std::move(config);
  return true;
}

fs::path output_document_path(const CliOptions& opts) {
  if (!opts.out_path.empty()) {
    return opts.out_path;
  }
  if (opts.doc_path.extension() == ".json") {
    return opts.doc_path;
  }
  fs::path snapshot = opts.doc_path;
  snapshot += ".json";
  return snapshot;
}

int run_command(const CliOptions& opts, std::ostream& out, std::ostream& err) {
  if (opts.command == "normalize" || opts.command == "check" || opts.command == "wrap") {
    return cmd_source(opts, out, err);
  }

  Session session;
  std::string error;
  if (!open_session(opts, session, error)) {
    dmk::log::error("session setup failed: " + error);
    err << error << "\n";
    return 1;
  }
  if (opts.command == "blocks") {
    return cmd_blocks(session, opts, out);
  }

  auto runtime = dmk::script::make_js_runtime();
  dmk::MacroExecutor executor(*session.doc, *runtime, session.backups.get(), session.audit.get());
  executor.set_options(executor_options(session.config));

  dmk::ExecutionResult result;
  if (opts.command == "run") {
    dmk::SourceUnit source;
    if (!dmk::data::read_text_file(opts.in_path, source.code)) {
      err << "cannot read " << opts.in_path.string() << "\n";
      return 1;
    }
    source.host = session.config.host;
    source.attempt = opts.attempt;
    source.prior_error_type = opts.prior_error_type;
    source.prior_error_message = opts.prior_error_message;
    result = executor.execute(source);
  } else if (opts.command == "plan") {
    json plan;
    if (!dmk::data::load_structured_file(opts.plan_path, plan, error)) {
      err << error << "\n";
      return 1;
    }
    result = executor.execute_plan(plan, opts.attempt);
  } else {
    result = executor.rollback(opts.block_id);
  }

  print_result(opts, result, out, err);
  // Failed runs may still have touched the document (rollback restores, partial plans).
  if (!save_output(opts, session, err)) {
    return 1;
  }
  return result.success ? 0 : 1;
}

void print_usage(std::ostream& out) {
  out << "Usage:\n"
      << "  dmkctl normalize --in <macro.js> [--host writer|spreadsheet|presentation] [--json]\n"
      << "  dmkctl check --in <macro.js> [--host <host>] [--json]\n"
      << "  dmkctl wrap --in <macro.js> [--host <host>]\n"
      << "  dmkctl run --in <macro.js> --doc <document> [--out <snapshot.json>] [--attempt <n>] "
         "[--prior-error-type <kind>] [--prior-error <message>] [--json]\n"
      << "  dmkctl plan --plan <plan.json|plan.yaml> --doc <document> [--out <snapshot.json>] [--json]\n"
      << "  dmkctl rollback --block <id> --doc <document> [--out <snapshot.json>] [--json]\n"
      << "  dmkctl blocks --doc <document> [--json]\n"
      << "Common options: --config <file> --store memory|sqlite --backups <path> --audit <file.jsonl> --verbose\n";
}

int dmkctl_main(int argc, char** argv, std::ostream& out, std::ostream& err) {
  CliOptions opts;
  std::string error;
  if (!parse_cli(argc, argv, opts, error)) {
    err << error << "\n";
    print_usage(err);
    return 1;
  }
  dmk::log::set_console(opts.verbose);
  dmk::log::init("dmkctl", fs::current_path());
  const int rc = run_command(opts, out, err);
  dmk::log::shutdown();
  return rc;
}

#ifndef DMKCTL_LIB
int main(int argc, char** argv) {
  dmk::log::install_crash_handlers();
  return dmkctl_main(argc, argv, std::cout, std::cerr);
}
#endif
