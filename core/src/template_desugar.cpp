#include "dmk/normalize.h"

#include "dmk/lexer.h"

#include <optional>

namespace dmk {

namespace {

struct TemplatePart {
  bool is_expr = false;
  std::string value;
};

struct ParsedTemplate {
  size_t end = 0;  // index one past the closing backtick
  std::string replacement;
};

std::string trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) --e;
  return std::string(s.substr(b, e - b));
}

// Template text (raw, escapes intact) as a single-quoted literal. Escape
// sequences keep their meaning; bare quotes and line breaks get escaped.
std::string single_quoted(std::string_view raw) {
  std::string out = "'";
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c == '\\' && i + 1 < raw.size()) {
      const char e = raw[i + 1];
      if (e == '\n') {
        // Line continuation contributes nothing.
        ++i;
        continue;
      }
      if (e == '`' || e == '$' || e == '{') {
        out.push_back(e);
      } else {
        out.push_back(c);
        out.push_back(e);
      }
      ++i;
      continue;
    }
    if (c == '\'') {
      out += "\\'";
    } else if (c == '\r') {
      if (i + 1 < raw.size() && raw[i + 1] == '\n') ++i;
      out += "\\n";
    } else if (c == '\n') {
      out += "\\n";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string build_concat(const std::vector<TemplatePart>& parts) {
  std::vector<std::string> toks;
  for (const auto& p : parts) {
    if (!p.is_expr) {
      if (!p.value.empty()) {
        toks.push_back(single_quoted(p.value));
      }
      continue;
    }
    const std::string expr = trim(p.value);
    if (!expr.empty()) {
      toks.push_back("(" + expr + ")");
    }
  }
  if (toks.empty()) {
    return "''";
  }
  // Left-associative `+` only concatenates once a string is on the left.
  if (toks.front().front() != '\'') {
    toks.insert(toks.begin(), "''");
  }
  std::string out = toks[0];
  for (size_t k = 1; k < toks.size(); ++k) {
    out += " + ";
    out += toks[k];
  }
  return out;
}

std::optional<ParsedTemplate> parse_template(std::string_view src, size_t start);

// Consumes a quoted string starting at `i`; returns index past its end.
size_t skip_quoted(std::string_view src, size_t i, std::string& out) {
  const char quote = src[i];
  out.push_back(quote);
  ++i;
  while (i < src.size()) {
    const char c = src[i];
    out.push_back(c);
    if (c == '\\' && i + 1 < src.size()) {
      out.push_back(src[i + 1]);
      i += 2;
      continue;
    }
    ++i;
    if (c == quote) {
      break;
    }
  }
  return i;
}

// Parses an interpolation body starting just after `${`. Nested templates are
// desugared in place. Returns the index one past the closing brace.
std::optional<size_t> parse_interpolation(std::string_view src, size_t i, std::string& expr) {
  int depth = 1;
  while (i < src.size()) {
    const char c = src[i];
    const char n = i + 1 < src.size() ? src[i + 1] : '\0';
    if (c == '\'' || c == '"') {
      i = skip_quoted(src, i, expr);
      continue;
    }
    if (c == '/' && n == '/') {
      while (i < src.size() && src[i] != '\n') {
        expr.push_back(src[i]);
        ++i;
      }
      continue;
    }
    if (c == '/' && n == '*') {
      const size_t close = src.find("*/", i + 2);
      const size_t stop = close == std::string_view::npos ? src.size() : close + 2;
      expr.append(src.substr(i, stop - i));
      i = stop;
      continue;
    }
    if (c == '`') {
      auto nested = parse_template(src, i);
      if (!nested) {
        return std::nullopt;
      }
      expr += "(" + nested->replacement + ")";
      i = nested->end;
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0) {
        return i + 1;
      }
    }
    expr.push_back(c);
    ++i;
  }
  return std::nullopt;
}

std::optional<ParsedTemplate> parse_template(std::string_view src, size_t start) {
  std::vector<TemplatePart> parts;
  std::string text;
  size_t j = start + 1;
  while (j < src.size()) {
    const char c = src[j];
    const char n = j + 1 < src.size() ? src[j + 1] : '\0';
    if (c == '\\') {
      text.push_back(c);
      if (j + 1 < src.size()) {
        text.push_back(n);
      }
      j += 2;
      continue;
    }
    if (c == '`') {
      if (!text.empty()) {
        parts.push_back({false, std::move(text)});
      }
      return ParsedTemplate{j + 1, build_concat(parts)};
    }
    if (c == '$' && n == '{') {
      if (!text.empty()) {
        parts.push_back({false, std::move(text)});
        text.clear();
      }
      std::string expr;
      const auto after = parse_interpolation(src, j + 2, expr);
      if (!after) {
        return std::nullopt;
      }
      parts.push_back({true, std::move(expr)});
      j = *after;
      continue;
    }
    text.push_back(c);
    ++j;
  }
  return std::nullopt;
}

NormalizationResult desugar_once(std::string_view code) {
  const auto regions = lex::scan_regions(code);
  std::string out;
  out.reserve(code.size() + 16);
  bool changed = false;

  size_t i = 0;
  while (i < code.size()) {
    if (code[i] == '`' && regions[i] == lex::Region::Template) {
      // Template bodies are consumed whole below, so any backtick reached
      // here opens a literal.
      const auto parsed = parse_template(code, i);
      if (parsed) {
        out += parsed->replacement;
        i = parsed->end;
        changed = true;
        continue;
      }
      // Unterminated: leave the rest untouched for the gate to report.
      out.append(code.substr(i));
      break;
    }
    out.push_back(code[i]);
    ++i;
  }
  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("converted template literals to string concatenation");
  return result;
}

} // namespace

NormalizationResult desugar_templates(std::string_view code, int max_passes) {
  NormalizationResult result = unchanged(std::string(code));
  for (int pass = 0; pass < max_passes && has_template_delimiter(result.code); ++pass) {
    NormalizationResult next = desugar_once(result.code);
    if (!next.changed) {
      break;
    }
    result.absorb(std::move(next));
  }
  return result;
}

} // namespace dmk
