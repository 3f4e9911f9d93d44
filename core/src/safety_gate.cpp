#include "dmk/safety_gate.h"

#include "dmk/errors.h"
#include "dmk/lexer.h"
#include "dmk/log.h"
#include "dmk/normalize.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace dmk {

namespace {

// Plans larger than this are not worth a parse attempt.
constexpr size_t kMaxJsonParseChars = 2 * 1024 * 1024;

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// ```json ... ``` around the whole payload.
std::string_view unfence(std::string_view s) {
  s = trim(s);
  if (s.substr(0, 3) != "```") {
    return s;
  }
  const size_t body = s.find('\n');
  if (body == std::string_view::npos) {
    return s;
  }
  std::string_view inner = s.substr(body + 1);
  inner = trim(inner);
  if (inner.size() >= 3 && inner.substr(inner.size() - 3) == "```") {
    inner.remove_suffix(3);
  }
  return trim(inner);
}

bool looks_like_json_container(std::string_view t) {
  return t.size() >= 2 && ((t.front() == '{' && t.back() == '}') || (t.front() == '[' && t.back() == ']'));
}

nlohmann::json parse_quiet(std::string_view text) {
  if (text.size() > kMaxJsonParseChars) {
    log::warn("safety gate: JSON candidate too large (" + std::to_string(text.size()) + " bytes), not parsed");
    return nlohmann::json(nlohmann::json::value_t::discarded);
  }
  return nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
}

bool is_plan(const nlohmann::json& j) {
  if (!j.is_object()) {
    return false;
  }
  auto it = j.find("schema_version");
  return it != j.end() && it->is_string() && it->get<std::string>() == kPlanSchemaVersion;
}

// Plans are sometimes wrapped in prose or a fence; the outermost {...} is tried
// after a direct parse fails.
bool extract_plan(std::string_view text, nlohmann::json& out) {
  if (text.find("schema_version") == std::string_view::npos ||
      text.find(kPlanSchemaVersion) == std::string_view::npos) {
    return false;
  }
  const std::string_view t = unfence(text);
  if (looks_like_json_container(t)) {
    nlohmann::json j = parse_quiet(t);
    if (is_plan(j)) {
      out = std::move(j);
      return true;
    }
  }
  const size_t first = text.find('{');
  const size_t last = text.rfind('}');
  if (first == std::string_view::npos || last == std::string_view::npos || last <= first) {
    return false;
  }
  nlohmann::json j = parse_quiet(text.substr(first, last - first + 1));
  if (is_plan(j)) {
    out = std::move(j);
    return true;
  }
  return false;
}

const nlohmann::json* string_field(const nlohmann::json& j, const char* key) {
  if (!j.is_object()) {
    return nullptr;
  }
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return nullptr;
  }
  return &*it;
}

std::string envelope_script(const nlohmann::json& j) {
  static const char* kKeys[] = {"code", "js", "jsCode", "macro", "macroCode", "input"};
  const nlohmann::json* roots[] = {&j, j.is_object() && j.contains("payload") ? &j["payload"] : nullptr};
  for (const nlohmann::json* root : roots) {
    if (!root) {
      continue;
    }
    for (const char* key : kKeys) {
      if (const nlohmann::json* field = string_field(*root, key)) {
        std::string_view s = trim(field->get_ref<const std::string&>());
        if (!s.empty()) {
          return std::string(s);
        }
      }
    }
  }
  return {};
}

bool word_boundary_before(std::string_view s, size_t i) {
  if (i == 0) {
    return true;
  }
  const unsigned char p = static_cast<unsigned char>(s[i - 1]);
  return !lex::is_ident_char(p);
}

size_t skip_space(std::string_view s, size_t i) {
  while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
    ++i;
  }
  return i;
}

// Offsets just past each standalone occurrence of `word` that is not a member
// access (`x.word`).
std::vector<size_t> word_ends(std::string_view s, std::string_view word) {
  std::vector<size_t> out;
  size_t pos = s.find(word);
  while (pos != std::string_view::npos) {
    const size_t end = pos + word.size();
    const bool after_ok = end >= s.size() || !lex::is_ident_char(static_cast<unsigned char>(s[end]));
    bool member = false;
    if (pos > 0) {
      size_t k = pos;
      while (k > 0 && (s[k - 1] == ' ' || s[k - 1] == '\t')) --k;
      member = k > 0 && s[k - 1] == '.';
    }
    if (after_ok && word_boundary_before(s, pos) && !member) {
      out.push_back(end);
    }
    pos = s.find(word, pos + 1);
  }
  return out;
}

// `word` followed (after optional whitespace) by `(`.
bool has_call(std::string_view s, std::string_view word) {
  for (size_t end : word_ends(s, word)) {
    const size_t k = skip_space(s, end);
    if (k < s.size() && s[k] == '(') {
      return true;
    }
  }
  return false;
}

bool has_word(std::string_view s, std::string_view word) {
  return !word_ends(s, word).empty();
}

// setTimeout("...") / setInterval('...'): the first argument is a string or
// template literal in the original text.
bool has_string_timer(std::string_view code, std::string_view blanked, const std::vector<lex::Region>& regions,
                      std::string_view word) {
  for (size_t end : word_ends(blanked, word)) {
    size_t k = skip_space(blanked, end);
    if (k >= blanked.size() || blanked[k] != '(') {
      continue;
    }
    k = skip_space(code, k + 1);
    if (k < code.size() && lex::is_string(regions[k])) {
      return true;
    }
  }
  return false;
}

bool matches_infinite_loop(std::string_view s) {
  for (size_t end : word_ends(s, "while")) {
    size_t k = skip_space(s, end);
    if (k >= s.size() || s[k] != '(') continue;
    k = skip_space(s, k + 1);
    if (s.substr(k, 4) != "true") continue;
    k = skip_space(s, k + 4);
    if (k < s.size() && s[k] == ')') return true;
  }
  for (size_t end : word_ends(s, "for")) {
    size_t k = skip_space(s, end);
    if (k >= s.size() || s[k] != '(') continue;
    k = skip_space(s, k + 1);
    if (k >= s.size() || s[k] != ';') continue;
    k = skip_space(s, k + 1);
    if (k >= s.size() || s[k] != ';') continue;
    k = skip_space(s, k + 1);
    if (k < s.size() && s[k] == ')') return true;
  }
  return false;
}

bool has_class_declaration(std::string_view s) {
  for (size_t end : word_ends(s, "class")) {
    const size_t k = skip_space(s, end);
    if (k < s.size() && (s[k] == '{' || lex::is_ident_start(static_cast<unsigned char>(s[k])))) {
      // `class extends` and `class Name` both qualify; an object key `class:` does not.
      return true;
    }
  }
  return false;
}

bool has_async_await(std::string_view s) {
  for (const char* word : {"async", "await"}) {
    for (size_t end : word_ends(s, word)) {
      const size_t k = skip_space(s, end);
      if (k == end || k >= s.size()) {
        continue;
      }
      if (s[k] == '(' || lex::is_ident_start(static_cast<unsigned char>(s[k]))) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

PayloadClass classify_payload(std::string_view text) {
  PayloadClass out;
  nlohmann::json plan;
  if (extract_plan(text, plan)) {
    out.kind = PayloadKind::Plan;
    out.plan = std::move(plan);
    return out;
  }

  const std::string_view t = trim(text);
  if (looks_like_json_container(t)) {
    nlohmann::json j = parse_quiet(t);
    if (!j.is_discarded()) {
      std::string script = envelope_script(j);
      if (!script.empty()) {
        log::debug("safety gate: unwrapped script from JSON envelope");
        out.kind = PayloadKind::WrappedScript;
        out.script = std::move(script);
        return out;
      }
      throw MacroError(ErrorKind::SyntaxDefect, "modality_mismatch",
                       std::string("payload is a bare JSON ") + (j.is_array() ? "array" : "object") +
                           ", not a script; answer with script code or a " + kPlanSchemaVersion + " plan");
    }
  }

  out.kind = PayloadKind::Script;
  out.script = std::string(t);
  return out;
}

std::vector<std::string> find_security_violations(std::string_view code) {
  const auto regions = lex::scan_regions(code);
  const std::string s = lex::blank_non_code(code, regions);
  std::vector<std::string> reasons;

  if (has_call(s, "eval") || has_call(s, "Function")) {
    reasons.push_back("disallowed dynamic evaluation (eval/Function)");
  }
  if (has_string_timer(code, s, regions, "setTimeout") || has_string_timer(code, s, regions, "setInterval")) {
    reasons.push_back("disallowed string-based timers (setTimeout/setInterval with string)");
  }
  if (matches_infinite_loop(s)) {
    reasons.push_back("potential infinite loop (while(true)/for(;;))");
  }
  if (has_call(s, "fetch") || has_word(s, "XMLHttpRequest") || has_word(s, "WebSocket")) {
    reasons.push_back("disallowed network APIs (fetch/XMLHttpRequest/WebSocket)");
  }
  if (has_call(s, "import")) {
    reasons.push_back("disallowed dynamic import");
  }
  return reasons;
}

std::vector<std::string> find_forbidden_syntax(std::string_view code) {
  std::vector<std::string> found;
  if (has_template_delimiter(code)) {
    found.push_back("template literal");
  }
  const std::string s = lex::blank_non_code(code);
  if (s.find("=>") != std::string::npos) {
    found.push_back("arrow function");
  }
  if (has_class_declaration(s)) {
    found.push_back("class declaration");
  }
  if (has_async_await(s)) {
    found.push_back("async/await");
  }
  return found;
}

void check_script(std::string_view code, const Directives& directives) {
  if (!directives.unsafe) {
    std::vector<std::string> reasons = find_security_violations(code);
    if (!reasons.empty()) {
      std::string message = "macro rejected: ";
      for (size_t i = 0; i < reasons.size(); ++i) {
        message += (i ? "; " : "") + reasons[i];
      }
      throw MacroError(ErrorKind::SecurityViolation, "disallowed_capability", message, std::move(reasons));
    }
  } else {
    log::warn("safety gate: capability scan skipped (unsafe directive)");
  }

  const std::vector<std::string> forbidden = find_forbidden_syntax(code);
  if (forbidden.empty()) {
    return;
  }
  std::string message = "unsupported syntax for the host engine: ";
  for (size_t i = 0; i < forbidden.size(); ++i) {
    message += (i ? ", " : "") + forbidden[i];
  }
  std::vector<std::string> details = forbidden;
  for (const auto& sc : find_suspicious_chars(code, 20)) {
    details.push_back(sc.code_point + " at " + std::to_string(sc.offset));
  }
  throw MacroError(ErrorKind::SyntaxDefect, "forbidden_syntax", message, std::move(details));
}

} // namespace dmk
