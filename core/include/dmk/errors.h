#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

enum class ErrorKind {
  SyntaxDefect,
  SecurityViolation,
  EnvironmentUnavailable,
  GuardExceeded,
  ContentNotProduced,
  HostApiFailure,
  NoBackup
};

const char* error_kind_name(ErrorKind kind);

// Engine-level failure. `code` is a short machine-readable discriminator
// ("modality_mismatch", "max_ops", "cancelled", ...); `details` carries the
// structured evidence the repair loop needs (matched reasons, offending
// constructs, suspicious characters).
class MacroError : public std::runtime_error {
 public:
  MacroError(ErrorKind kind, std::string code, const std::string& message,
             std::vector<std::string> details = {});

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& code() const noexcept { return code_; }
  const std::vector<std::string>& details() const noexcept { return details_; }

  // "<Kind>: <message>"
  std::string display() const;

 private:
  ErrorKind kind_;
  std::string code_;
  std::vector<std::string> details_;
};

// Raised by host adapters when an individual host call fails. Block manager
// internals catch it wherever a fallback exists.
class HostApiError : public MacroError {
 public:
  explicit HostApiError(const std::string& message);
};

} // namespace dmk
