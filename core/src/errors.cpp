#include "dmk/errors.h"

#include <utility>

namespace dmk {

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SyntaxDefect: return "SyntaxDefect";
    case ErrorKind::SecurityViolation: return "SecurityViolation";
    case ErrorKind::EnvironmentUnavailable: return "EnvironmentUnavailable";
    case ErrorKind::GuardExceeded: return "GuardExceeded";
    case ErrorKind::ContentNotProduced: return "ContentNotProduced";
    case ErrorKind::HostApiFailure: return "HostApiFailure";
    case ErrorKind::NoBackup: return "NoBackup";
  }
  return "Unknown";
}

MacroError::MacroError(ErrorKind kind, std::string code, const std::string& message,
                       std::vector<std::string> details)
    : std::runtime_error(message), kind_(kind), code_(std::move(code)), details_(std::move(details)) {}

std::string MacroError::display() const {
  return std::string(error_kind_name(kind_)) + ": " + what();
}

HostApiError::HostApiError(const std::string& message)
    : MacroError(ErrorKind::HostApiFailure, "host_call_failed", message) {}

} // namespace dmk
