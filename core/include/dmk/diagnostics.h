#pragma once

#include "dmk/errors.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

// Non-fatal host exception, recorded instead of being rethrown.
struct DiagEntry {
  std::string tag;
  std::string message;
  std::string extra;
};

// Bounded ring of DiagEntry. Oldest entries drop first.
class DiagRing {
 public:
  static constexpr size_t kCapacity = 80;
  static constexpr size_t kMaxMessage = 500;

  void record(std::string_view tag, std::string_view message, std::string_view extra = {});
  const std::deque<DiagEntry>& entries() const { return entries_; }
  size_t dropped() const { return dropped_; }

 private:
  std::deque<DiagEntry> entries_;
  size_t dropped_ = 0;
};

enum class FailureClass { Syntax, Reference, Type, Range, Security, Environment, Content };

const char* failure_class_name(FailureClass c);

FailureClass classify_failure(const MacroError& error);
// Runtime errors raised by the script engine ("ReferenceError: x is not
// defined", "TypeError: ...").
FailureClass classify_failure(std::string_view error_name, std::string_view message);

// One per top-level execution attempt.
struct AuditEvent {
  std::string mode = "macro";  // "macro" or "plan"
  std::string session_id;
  std::string host_app;
  std::string block_id;
  std::set<std::string> ops_performed;
  bool success = false;
  std::string error_type;
  std::string error_message;
  std::string failure_class;
  int attempt = 0;
  std::string ts;
};

nlohmann::json to_json(const AuditEvent& event);
nlohmann::json to_json(const DiagRing& ring);

class IAuditSink {
 public:
  virtual ~IAuditSink() = default;
  virtual void emit(const AuditEvent& event) = 0;
};

// Appends one JSON object per line.
class JsonlAuditSink final : public IAuditSink {
 public:
  explicit JsonlAuditSink(std::filesystem::path path);
  void emit(const AuditEvent& event) override;
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
  std::mutex mutex_;
};

class MemoryAuditSink final : public IAuditSink {
 public:
  void emit(const AuditEvent& event) override { events_.push_back(event); }
  const std::vector<AuditEvent>& events() const { return events_; }

 private:
  std::vector<AuditEvent> events_;
};

} // namespace dmk
