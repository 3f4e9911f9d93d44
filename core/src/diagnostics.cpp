#include "dmk/diagnostics.h"

#include "dmk/log.h"
#include "dmk/text_util.h"

#include <fstream>

namespace dmk {

void DiagRing::record(std::string_view tag, std::string_view message, std::string_view extra) {
  if (entries_.size() >= kCapacity) {
    entries_.pop_front();
    ++dropped_;
  }
  entries_.push_back({std::string(tag), truncate_bytes(message, kMaxMessage), truncate_bytes(extra, kMaxMessage)});
}

const char* failure_class_name(FailureClass c) {
  switch (c) {
    case FailureClass::Syntax: return "syntax";
    case FailureClass::Reference: return "reference";
    case FailureClass::Type: return "type";
    case FailureClass::Range: return "range";
    case FailureClass::Security: return "security";
    case FailureClass::Environment: return "environment";
    case FailureClass::Content: return "content";
  }
  return "environment";
}

FailureClass classify_failure(const MacroError& error) {
  switch (error.kind()) {
    case ErrorKind::SyntaxDefect: return FailureClass::Syntax;
    case ErrorKind::SecurityViolation: return FailureClass::Security;
    case ErrorKind::EnvironmentUnavailable: return FailureClass::Environment;
    case ErrorKind::GuardExceeded: return FailureClass::Range;
    case ErrorKind::ContentNotProduced:
    case ErrorKind::NoBackup: return FailureClass::Content;
    case ErrorKind::HostApiFailure: break;
  }
  return classify_failure("", error.what());
}

FailureClass classify_failure(std::string_view error_name, std::string_view message) {
  const auto has = [&](std::string_view needle) {
    return error_name.find(needle) != std::string_view::npos || message.find(needle) != std::string_view::npos;
  };
  if (has("SyntaxError") || has("Unexpected token") || has("Invalid or unexpected")) {
    return FailureClass::Syntax;
  }
  if (has("ReferenceError") || has("is not defined")) {
    return FailureClass::Reference;
  }
  if (has("RangeError") || has("out of range") || has("out of bounds")) {
    return FailureClass::Range;
  }
  if (has("MacroSafetyError") || has("SecurityViolation")) {
    return FailureClass::Security;
  }
  return FailureClass::Type;
}

nlohmann::json to_json(const AuditEvent& event) {
  nlohmann::json j;
  j["ts"] = event.ts.empty() ? now_iso() : event.ts;
  j["mode"] = event.mode;
  j["session_id"] = event.session_id;
  j["host_app"] = event.host_app;
  j["block_id"] = event.block_id;
  j["ops"] = nlohmann::json::array();
  for (const auto& op : event.ops_performed) {
    j["ops"].push_back(op);
  }
  j["success"] = event.success;
  j["attempt"] = event.attempt;
  if (!event.success) {
    j["error_type"] = event.error_type;
    j["error_message"] = event.error_message;
    j["failure_class"] = event.failure_class;
  }
  return j;
}

nlohmann::json to_json(const DiagRing& ring) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& e : ring.entries()) {
    nlohmann::json j;
    j["tag"] = e.tag;
    j["message"] = e.message;
    if (!e.extra.empty()) {
      j["extra"] = e.extra;
    }
    arr.push_back(std::move(j));
  }
  return arr;
}

JsonlAuditSink::JsonlAuditSink(std::filesystem::path path) : path_(std::move(path)) {}

void JsonlAuditSink::emit(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  std::ofstream out(path_, std::ios::app);
  if (!out) {
    log::warn("audit sink not writable: " + path_.string());
    return;
  }
  out << to_json(event).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

} // namespace dmk
