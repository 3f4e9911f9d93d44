#include "dmk/normalize.h"

#include "dmk/lexer.h"

namespace dmk {

namespace {

bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

bool is_ident(char c) {
  return lex::is_ident_char(static_cast<unsigned char>(c));
}

size_t skip_ws(std::string_view s, size_t i) {
  while (i < s.size() && is_ws(s[i])) ++i;
  return i;
}

// Horizontal whitespace only; type annotations never span lines here.
size_t skip_blank(std::string_view s, size_t i) {
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return i;
}

bool word_at(std::string_view s, size_t i, std::string_view word) {
  if (i > s.size() || s.compare(i, word.size(), word) != 0) {
    return false;
  }
  if (i > 0 && is_ident(s[i - 1])) {
    return false;
  }
  const size_t end = i + word.size();
  return end >= s.size() || !is_ident(s[end]);
}

// `keyword` followed by a name or a block, so `namespace = 'x';` stays code.
bool declaration_at(std::string_view s, size_t i, std::string_view keyword) {
  if (!word_at(s, i, keyword)) {
    return false;
  }
  const size_t next = skip_blank(s, i + keyword.size());
  if (next >= s.size()) {
    return false;
  }
  return s[next] == '{' || (next > i + keyword.size() && lex::is_ident_start(static_cast<unsigned char>(s[next])));
}

char prev_significant(std::string_view s, size_t i) {
  while (i > 0) {
    --i;
    if (!is_ws(s[i])) {
      return s[i];
    }
  }
  return '\0';
}

size_t skip_balanced(std::string_view s, size_t i) {
  const char open = s[i];
  const char close = open == '(' ? ')' : open == '[' ? ']' : open == '{' ? '}' : '>';
  int depth = 0;
  for (size_t j = i; j < s.size(); ++j) {
    if (s[j] == open) {
      ++depth;
    } else if (s[j] == close) {
      if (--depth == 0) {
        return j + 1;
      }
    } else if (s[j] == '\n' && open == '<') {
      break;
    }
  }
  return std::string_view::npos;
}

// End of a type expression starting at `i` (after the colon / `as`), or `i`
// when nothing type-like is there. `allow_object` admits `{...}` atoms, which
// is ambiguous with a function body in return position.
size_t parse_type(std::string_view s, size_t i, bool allow_object) {
  size_t pos = skip_blank(s, i);
  size_t end = i;
  bool expect_atom = true;
  while (pos < s.size()) {
    const char c = s[pos];
    if (expect_atom) {
      if (lex::is_ident_start(static_cast<unsigned char>(c))) {
        while (pos < s.size() && (is_ident(s[pos]) || s[pos] == '.')) ++pos;
        if (pos < s.size() && s[pos] == '<') {
          const size_t g = skip_balanced(s, pos);
          if (g == std::string_view::npos) {
            break;
          }
          pos = g;
        }
      } else if (c == '[' || (c == '{' && allow_object)) {
        const size_t g = skip_balanced(s, pos);
        if (g == std::string_view::npos) {
          break;
        }
        pos = g;
      } else {
        break;
      }
      while (pos + 1 < s.size() && s[pos] == '[' && s[pos + 1] == ']') pos += 2;
      end = pos;
      expect_atom = false;
      pos = skip_blank(s, pos);
      continue;
    }
    if (c == '|' || c == '&') {
      expect_atom = true;
      allow_object = true;
      pos = skip_blank(s, pos + 1);
      continue;
    }
    break;
  }
  return expect_atom && end == i ? i : end;
}

struct Lines {
  std::vector<std::string_view> code;
  std::vector<std::string_view> blank;
};

Lines split(std::string_view code, std::string_view blank) {
  Lines lines;
  size_t start = 0;
  for (size_t i = 0; i <= code.size(); ++i) {
    if (i == code.size() || code[i] == '\n') {
      lines.code.push_back(code.substr(start, i - start));
      lines.blank.push_back(blank.substr(start, i - start));
      start = i + 1;
    }
  }
  return lines;
}

int brace_delta(std::string_view blank_line) {
  int delta = 0;
  for (char c : blank_line) {
    if (c == '{') ++delta;
    if (c == '}') --delta;
  }
  return delta;
}

// Statement-level declarations with no runtime meaning. Removed lines keep
// their line break.
NormalizationResult strip_declarations(std::string_view code) {
  const std::string blank = lex::blank_non_code(code);
  const Lines lines = split(code, blank);
  std::string out;
  out.reserve(code.size());
  NormalizationResult result;

  int skip_depth = 0;
  bool skipping = false;
  bool skip_export_list = false;
  for (size_t li = 0; li < lines.code.size(); ++li) {
    std::string_view line = lines.code[li];
    const std::string_view bl = lines.blank[li];
    const size_t s = skip_ws(bl, 0);
    bool drop = false;

    if (skipping) {
      skip_depth += brace_delta(bl);
      if (skip_depth <= 0 && bl.find('}') != std::string_view::npos) {
        skipping = false;
      }
      drop = true;
    } else if (skip_export_list) {
      if (bl.find('}') != std::string_view::npos) {
        skip_export_list = false;
      }
      drop = true;
    } else if (word_at(bl, s, "import") && skip_ws(bl, s + 6) < bl.size() && bl[skip_ws(bl, s + 6)] != '(' &&
               bl[skip_ws(bl, s + 6)] != '.') {
      drop = true;
      result.add_note("removed import statements");
    } else if (word_at(bl, s, "export") && bl.compare(skip_ws(bl, s + 6), 1, "{") == 0) {
      drop = true;
      skip_export_list = bl.find('}') == std::string_view::npos;
      result.add_note("removed export list statements");
    } else if (declaration_at(bl, s, "interface") || declaration_at(bl, s, "enum") ||
               declaration_at(bl, s, "namespace") || declaration_at(bl, s, "declare")) {
      const std::string_view keyword = word_at(bl, s, "interface")   ? "interface declarations"
                                       : word_at(bl, s, "enum")      ? "enum declarations"
                                       : word_at(bl, s, "namespace") ? "namespace declarations"
                                                                     : "declare statements";
      result.add_note(std::string("removed ") + std::string(keyword));
      drop = true;
      skip_depth = brace_delta(bl);
      // A block opens on this line or the next one.
      const bool opens_later = bl.find('{') == std::string_view::npos && li + 1 < lines.blank.size() &&
                               lines.blank[li + 1].find('{') != std::string_view::npos &&
                               bl.find(';') == std::string_view::npos && !word_at(bl, s, "declare");
      skipping = skip_depth > 0 || opens_later;
    } else if (word_at(bl, s, "type") && bl.find('=', s) != std::string_view::npos) {
      size_t n = skip_ws(bl, s + 4);
      const size_t name = n;
      while (n < bl.size() && is_ident(bl[n])) ++n;
      if (n > name) {
        drop = true;
        skip_depth = brace_delta(bl);
        skipping = skip_depth > 0;
        result.add_note("removed type aliases");
      }
    }

    if (!drop) {
      if (word_at(bl, s, "export")) {
        const size_t after = skip_ws(bl, s + 6);
        if (word_at(bl, after, "default")) {
          line = line.substr(skip_ws(bl, after + 7));
          result.add_note("stripped export default");
        } else if (word_at(bl, after, "function") || word_at(bl, after, "var") ||
                   word_at(bl, after, "let") || word_at(bl, after, "const") ||
                   word_at(bl, after, "class") || word_at(bl, after, "async")) {
          out.append(std::string(s, ' '));
          line = line.substr(after);
          result.add_note("stripped export keywords");
        }
      }
      out.append(line);
    }
    if (li + 1 < lines.code.size()) {
      out.push_back('\n');
    }
  }

  if (result.notes.empty()) {
    return unchanged(std::string(code));
  }
  result.code = std::move(out);
  result.changed = true;
  return result;
}

// A `(` opens a parameter list when it follows `function` or `function name`.
bool opens_function_params(std::string_view blank, size_t paren) {
  size_t j = paren;
  while (j > 0 && is_ws(blank[j - 1])) --j;
  size_t k = j;
  while (k > 0 && is_ident(blank[k - 1])) --k;
  if (k == j) {
    return false;
  }
  const std::string_view word = blank.substr(k, j - k);
  if (word == "function") {
    return true;
  }
  while (k > 0 && is_ws(blank[k - 1])) --k;
  return k >= 8 && word_at(blank, k - 8, "function");
}

struct Frame {
  char open = '(';
  bool params = false;
  bool in_default = false;
};

// Expression-level annotations: parameter/return/variable types, `as`,
// `satisfies` and non-null assertions.
NormalizationResult strip_annotations(std::string_view code) {
  const auto regions = lex::scan_regions(code);
  const std::string blank = lex::blank_non_code(code, regions);
  std::string out;
  out.reserve(code.size());
  NormalizationResult result;
  std::vector<Frame> stack;

  size_t i = 0;
  while (i < code.size()) {
    const char c = blank[i];
    if (c == ' ' && !lex::is_code(regions[i])) {
      out.push_back(code[i]);
      ++i;
      continue;
    }

    if (c == '(' || c == '[' || c == '{') {
      stack.push_back({c, c == '(' && opens_function_params(blank, i), false});
      out.push_back(code[i]);
      ++i;
      continue;
    }
    if (c == ')' || c == ']' || c == '}') {
      const bool closing_params = !stack.empty() && stack.back().params && c == ')';
      if (!stack.empty()) {
        stack.pop_back();
      }
      out.push_back(code[i]);
      ++i;
      if (closing_params) {
        const size_t colon = skip_ws(blank, i);
        if (colon < blank.size() && blank[colon] == ':') {
          const size_t end = parse_type(blank, colon + 1, true);
          const size_t body = skip_ws(blank, end);
          if (end > colon + 1 && body < blank.size() && blank[body] == '{') {
            out.push_back(' ');
            i = body;
            result.add_note("stripped return type annotations");
          }
        }
      }
      continue;
    }

    Frame* top = stack.empty() ? nullptr : &stack.back();
    if (top && top->params) {
      if (c == ',') {
        top->in_default = false;
      } else if (c == '=' && (i + 1 >= blank.size() || blank[i + 1] != '=')) {
        top->in_default = true;
      } else if (!top->in_default && (c == ':' || (c == '?' && blank.compare(skip_ws(blank, i + 1), 1, ":") == 0))) {
        const size_t colon = c == ':' ? i : skip_ws(blank, i + 1);
        const size_t end = parse_type(blank, colon + 1, true);
        const size_t next = skip_ws(blank, end);
        if (end > colon + 1 && next < blank.size() && (blank[next] == ',' || blank[next] == ')' || blank[next] == '=')) {
          while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
          i = end;
          result.add_note(c == '?' ? "stripped optional parameter annotations" : "stripped parameter type annotations");
          continue;
        }
      }
    }

    if (lex::is_ident_start(static_cast<unsigned char>(c)) && (i == 0 || !is_ident(blank[i - 1]))) {
      size_t j = i;
      while (j < blank.size() && is_ident(blank[j])) ++j;
      const std::string_view word = std::string_view(blank).substr(i, j - i);
      const bool after_member = prev_significant(blank, i) == '.';

      if (!after_member && (word == "var" || word == "let" || word == "const")) {
        size_t n = skip_ws(blank, j);
        const size_t name = n;
        while (n < blank.size() && is_ident(blank[n])) ++n;
        const size_t colon = skip_blank(blank, n);
        if (n > name && colon < blank.size() && blank[colon] == ':') {
          const size_t end = parse_type(blank, colon + 1, true);
          const size_t next = skip_blank(blank, end);
          const bool terminated = next >= blank.size() || blank[next] == '=' || blank[next] == ';' ||
                                  blank[next] == ',' || blank[next] == '\n' || blank[next] == '\r';
          if (end > colon + 1 && terminated) {
            out.append(code.substr(i, n - i));
            if (next < blank.size() && blank[next] == '=') {
              out.push_back(' ');
            }
            i = next;
            result.add_note("stripped variable type annotations");
            continue;
          }
        }
      }

      if (!after_member && (word == "as" || word == "satisfies") && i > 0 && is_ws(code[i - 1])) {
        // Original text, so a closing quote counts as an operand.
        const char prev = prev_significant(code, i);
        const bool operand = is_ident(prev) || prev == ')' || prev == ']' || prev == '}' || prev == '\'' ||
                             prev == '"';
        const size_t end = parse_type(blank, j, true);
        if (operand && end > j) {
          while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
          i = end;
          result.add_note(word == "as" ? "removed \"as Type\" assertions" : "removed satisfies operator");
          continue;
        }
      }

      out.append(code.substr(i, j - i));
      i = j;
      // Non-null assertion directly after an identifier.
      if (i < blank.size() && blank[i] == '!' && (i + 1 >= blank.size() || blank[i + 1] != '=')) {
        const size_t next = skip_ws(blank, i + 1);
        if (next < blank.size() && (blank[next] == '.' || blank[next] == '[' || blank[next] == '(')) {
          i = i + 1;
          result.add_note("removed non-null assertions");
        }
      }
      continue;
    }

    out.push_back(code[i]);
    ++i;
  }

  if (result.notes.empty()) {
    return unchanged(std::string(code));
  }
  result.code = std::move(out);
  result.changed = true;
  return result;
}

} // namespace

NormalizationResult strip_type_syntax(std::string_view code) {
  NormalizationResult result = strip_declarations(code);
  result.absorb(strip_annotations(result.code));
  return result;
}

} // namespace dmk
