#include "dmk/normalize.h"

#include "dmk/lexer.h"

#include <cctype>

namespace dmk {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Line ranges [begin, end) excluding the terminator.
struct Line {
  size_t begin = 0;
  size_t end = 0;
};

std::vector<Line> split_lines(std::string_view text) {
  std::vector<Line> lines;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      lines.push_back({start, i});
      start = i + 1;
    }
  }
  lines.push_back({start, text.size()});
  return lines;
}

bool is_fence_line(std::string_view line) {
  size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
  if (line.compare(i, 3, "```") != 0 && line.compare(i, 3, "~~~") != 0) {
    return false;
  }
  i += 3;
  // Optional language tag, nothing else.
  while (i < line.size() && (std::isalnum(static_cast<unsigned char>(line[i])) || line[i] == '_' ||
                             line[i] == '-' || line[i] == '+')) {
    ++i;
  }
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) ++i;
  return i == line.size();
}

bool is_directive_comment(std::string_view comment, std::string_view prefix) {
  // comment starts with "//"
  size_t i = 2;
  while (i < comment.size() && (comment[i] == ' ' || comment[i] == '\t')) ++i;
  if (comment.size() - i < prefix.size()) {
    return false;
  }
  for (size_t k = 0; k < prefix.size(); ++k) {
    if (std::tolower(static_cast<unsigned char>(comment[i + k])) !=
        std::tolower(static_cast<unsigned char>(prefix[k]))) {
      return false;
    }
  }
  return true;
}

char prev_significant(const std::string& out) {
  for (size_t k = out.size(); k-- > 0;) {
    if (!is_space(out[k])) {
      return out[k];
    }
  }
  return '\0';
}

} // namespace

NormalizationResult strip_code_fences(std::string_view code) {
  if (code.find("```") == std::string_view::npos && code.find("~~~") == std::string_view::npos) {
    return unchanged(std::string(code));
  }
  const auto lines = split_lines(code);
  std::vector<bool> candidate(lines.size(), false);
  std::string probe(code);
  bool any = false;
  for (size_t li = 0; li < lines.size(); ++li) {
    const Line& line = lines[li];
    if (is_fence_line(code.substr(line.begin, line.end - line.begin))) {
      candidate[li] = true;
      any = true;
      for (size_t k = line.begin; k < line.end; ++k) probe[k] = ' ';
    }
  }
  if (!any) {
    return unchanged(std::string(code));
  }
  // Scan without the fences; a fence line inside a template literal is content.
  const auto regions = lex::scan_regions(probe);

  std::string out;
  out.reserve(code.size());
  bool changed = false;
  for (size_t li = 0; li < lines.size(); ++li) {
    const Line& line = lines[li];
    const bool in_template = line.begin > 0 && regions[line.begin - 1] == lex::Region::Template;
    if (candidate[li] && !in_template) {
      // Keep the line break so line numbers in diagnostics stay stable.
      changed = true;
    } else {
      out.append(code.substr(line.begin, line.end - line.begin));
    }
    if (li + 1 < lines.size()) {
      out.push_back('\n');
    }
  }
  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("stripped markdown code fences");
  return result;
}

NormalizationResult strip_comments(std::string_view code, std::string_view directive_prefix) {
  const auto regions = lex::scan_regions(code);
  std::string out;
  out.reserve(code.size());
  bool changed = false;

  size_t i = 0;
  while (i < code.size()) {
    const lex::Region region = regions[i];
    if (region == lex::Region::LineComment) {
      size_t j = i;
      while (j < code.size() && regions[j] == lex::Region::LineComment) ++j;
      const std::string_view comment = code.substr(i, j - i);
      if (is_directive_comment(comment, directive_prefix)) {
        out.append(comment);
      } else {
        out.push_back(' ');
        changed = true;
      }
      i = j;
      continue;
    }
    if (region == lex::Region::BlockComment) {
      size_t j = i;
      size_t newlines = 0;
      // Adjacent block comments (/* a *//* b */) are separate tokens.
      while (j < code.size() && regions[j] == lex::Region::BlockComment) {
        if (code[j] == '\n') ++newlines;
        if (j > i + 2 && code[j] == '/' && code[j - 1] == '*') {
          ++j;
          break;
        }
        ++j;
      }
      if (newlines > 0) {
        out.append(newlines, '\n');
      } else {
        out.push_back(' ');
      }
      changed = true;
      i = j;
      continue;
    }
    out.push_back(code[i]);
    ++i;
  }

  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("stripped non-directive comments");
  return result;
}

NormalizationResult downgrade_declarations(std::string_view code) {
  const auto regions = lex::scan_regions(code);
  std::string out;
  out.reserve(code.size());
  bool changed = false;

  size_t i = 0;
  while (i < code.size()) {
    const auto c = static_cast<unsigned char>(code[i]);
    if (!lex::is_code(regions[i]) || !lex::is_ident_start(c)) {
      out.push_back(code[i]);
      ++i;
      continue;
    }
    size_t j = i;
    while (j < code.size() && lex::is_code(regions[j]) &&
           lex::is_ident_char(static_cast<unsigned char>(code[j]))) {
      ++j;
    }
    const std::string_view word = code.substr(i, j - i);
    // `obj.let` / `obj.const` are property names, not declarations.
    const bool member = prev_significant(out) == '.';
    size_t k = j;
    while (k < code.size() && (code[k] == ' ' || code[k] == '\t' || code[k] == '\n' || code[k] == '\r')) ++k;
    const bool followed_by_binding =
        k > j && k < code.size() &&
        (lex::is_ident_start(static_cast<unsigned char>(code[k])) || code[k] == '[' || code[k] == '{');
    if ((word == "let" || word == "const") && !member && followed_by_binding) {
      out += "var";
      changed = true;
    } else {
      out.append(word);
    }
    i = j;
  }

  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("downgraded let/const to var");
  return result;
}

NormalizationResult repair_stray_escapes(std::string_view code) {
  if (code.find("\\n") == std::string_view::npos && code.find("\\r") == std::string_view::npos) {
    return unchanged(std::string(code));
  }
  const auto regions = lex::scan_regions(code);
  std::string out;
  out.reserve(code.size());
  bool changed = false;

  auto next_significant = [&](size_t from) -> size_t {
    size_t j = from;
    while (j < code.size() && is_space(code[j])) ++j;
    return j;
  };

  size_t i = 0;
  while (i < code.size()) {
    const char ch = code[i];
    const char nx = i + 1 < code.size() ? code[i + 1] : '\0';
    if (ch == '\\' && (nx == 'n' || nx == 'r') && lex::is_code(regions[i])) {
      const char prev = prev_significant(out);
      const size_t nn_i = next_significant(i + 2);
      const char nn = nn_i < code.size() ? code[nn_i] : '\0';

      // `/\n/` style patterns are left for the parser to report.
      if (prev == '/' || nn == '/') {
        out.push_back(ch);
        ++i;
        continue;
      }
      const bool prev_ok = prev == '\0' || prev == ',' || prev == ';' || prev == ']' || prev == '}' ||
                           prev == ')' || prev == '\'' || prev == '"';
      const bool next_ok =
          nn == '\0' || nn == '\'' || nn == '"' || nn == '[' || nn == ']' || nn == '{' || nn == '}' ||
          nn == '(' || nn == ')' || lex::is_ident_char(static_cast<unsigned char>(nn)) ||
          (nn == '\\' && nn_i + 1 < code.size() && (code[nn_i + 1] == 'n' || code[nn_i + 1] == 'r'));
      if (prev_ok && next_ok) {
        out.push_back('\n');
        changed = true;
        i += 2;
        continue;
      }
    }
    out.push_back(ch);
    ++i;
  }

  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("normalized stray \\n/\\r tokens outside strings");
  return result;
}

bool has_template_delimiter(std::string_view code) {
  if (code.find('`') == std::string_view::npos) {
    return false;
  }
  const auto regions = lex::scan_regions(code);
  for (size_t i = 0; i < code.size(); ++i) {
    if (code[i] == '`' && regions[i] == lex::Region::Template) {
      return true;
    }
  }
  return false;
}

} // namespace dmk
