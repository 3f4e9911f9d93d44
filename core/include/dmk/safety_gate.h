#pragma once

#include "dmk/directives.h"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace dmk {

constexpr const char* kPlanSchemaVersion = "dmk.plan.v1";

enum class PayloadKind {
  Script,
  Plan,
  // A JSON envelope whose `code`/`js`/`macro`/`input` field carries the script.
  WrappedScript
};

struct PayloadClass {
  PayloadKind kind = PayloadKind::Script;
  nlohmann::json plan;  // PayloadKind::Plan
  std::string script;   // Script (trimmed input) or WrappedScript (unwrapped)
};

// Decides what the payload is before any normalization runs. Throws
// MacroError(SyntaxDefect, "modality_mismatch") for a bare JSON object/array
// that is neither a plan nor a script envelope.
PayloadClass classify_payload(std::string_view text);

// Every matched capability reason, in a fixed order. Strings, comments and
// regex literals are blanked before matching.
std::vector<std::string> find_security_violations(std::string_view code);

// Constructs the host engine cannot parse: "template literal",
// "arrow function", "class declaration", "async/await".
std::vector<std::string> find_forbidden_syntax(std::string_view code);

// Throws MacroError(SecurityViolation, "disallowed_capability") unless the
// unsafe directive is set, then MacroError(SyntaxDefect, "forbidden_syntax")
// with the offending constructs and suspicious characters as details.
void check_script(std::string_view code, const Directives& directives);

} // namespace dmk
