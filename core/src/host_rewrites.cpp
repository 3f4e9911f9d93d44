#include "dmk/normalize.h"

#include "dmk/lexer.h"

#include <initializer_list>
#include <set>

namespace dmk {

namespace {

constexpr const char* kAlertHelper = "__dmk_safe_alert";

bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

size_t skip_ws(std::string_view s, size_t i) {
  while (i < s.size() && is_ws(s[i])) ++i;
  return i;
}

bool word_at(std::string_view s, size_t i, std::string_view word) {
  if (s.compare(i, word.size(), word) != 0) {
    return false;
  }
  const size_t end = i + word.size();
  return end >= s.size() || !lex::is_ident_char(static_cast<unsigned char>(s[end]));
}

bool boundary_before(std::string_view s, size_t i) {
  return i == 0 || !lex::is_ident_char(static_cast<unsigned char>(s[i - 1]));
}

std::string trim_copy(std::string_view s) {
  size_t b = skip_ws(s, 0);
  size_t e = s.size();
  while (e > b && is_ws(s[e - 1])) --e;
  return std::string(s.substr(b, e - b));
}

// Call arguments of the `(` at `open`, split on top-level commas. `blank` is
// the code with literals and comments blanked, `code` the original text.
struct CallArgs {
  std::vector<std::string> args;
  size_t close = 0;  // index of the matching ')'
  bool ok = false;
};

CallArgs read_call_args(std::string_view code, std::string_view blank, size_t open) {
  CallArgs result;
  int depth = 0;
  size_t arg_begin = open + 1;
  for (size_t j = open; j < blank.size(); ++j) {
    const char c = blank[j];
    if (c == '(' || c == '[' || c == '{') {
      ++depth;
    } else if (c == ')' || c == ']' || c == '}') {
      --depth;
      if (depth == 0) {
        if (c != ')') {
          return result;
        }
        const std::string last = trim_copy(code.substr(arg_begin, j - arg_begin));
        if (!last.empty() || !result.args.empty()) {
          result.args.push_back(last);
        }
        result.close = j;
        result.ok = true;
        return result;
      }
    } else if (c == ',' && depth == 1) {
      result.args.push_back(trim_copy(code.substr(arg_begin, j - arg_begin)));
      arg_begin = j + 1;
    }
  }
  return result;
}

bool mentions_any(std::string_view expr, std::initializer_list<std::string_view> needles) {
  for (const auto& n : needles) {
    if (expr.find(n) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

// Names bound by `var NAME = <expr>` where the initializer yields a table
// (Writer) or a worksheet (Spreadsheet).
std::set<std::string> collect_bindings(std::string_view blank, HostFlavor host) {
  std::set<std::string> names;
  size_t i = 0;
  while (i < blank.size()) {
    const bool decl = boundary_before(blank, i) &&
                      (word_at(blank, i, "var") || word_at(blank, i, "let") || word_at(blank, i, "const"));
    if (!decl) {
      ++i;
      continue;
    }
    size_t j = skip_ws(blank, i + (blank[i] == 'c' ? 5 : 3));
    const size_t name_begin = j;
    while (j < blank.size() && lex::is_ident_char(static_cast<unsigned char>(blank[j]))) ++j;
    if (j == name_begin) {
      i = j + 1;
      continue;
    }
    const std::string name(blank.substr(name_begin, j - name_begin));
    j = skip_ws(blank, j);
    if (j >= blank.size() || blank[j] != '=' || (j + 1 < blank.size() && blank[j + 1] == '=')) {
      i = j;
      continue;
    }
    size_t end = j + 1;
    while (end < blank.size() && blank[end] != ';' && blank[end] != '\n') ++end;
    const std::string_view init = blank.substr(j + 1, end - j - 1);
    if (host == HostFlavor::Writer && mentions_any(init, {"Tables.Item", "Tables.Add", "Tables("})) {
      names.insert(name);
    } else if (host == HostFlavor::Spreadsheet &&
               mentions_any(init, {"ActiveSheet", "Worksheets.Item", "Worksheets(", "Sheets.Item",
                                   "Sheets("})) {
      names.insert(name);
    }
    i = end;
  }
  return names;
}

// Rewrites `<bound>.Cells(r, c)` (and, for Writer, `<bound>.Cells.Item(r, c)`)
// plus Writer `.Styles(x)`.
NormalizationResult rewrite_collections(std::string_view code, HostFlavor host) {
  if (host != HostFlavor::Writer && host != HostFlavor::Spreadsheet) {
    return unchanged(std::string(code));
  }
  const std::string blank = lex::blank_non_code(code);
  const auto bound = collect_bindings(blank, host);

  std::string out;
  out.reserve(code.size() + 32);
  bool cells_changed = false;
  bool styles_changed = false;

  size_t i = 0;
  while (i < code.size()) {
    const char c = blank[i];
    if (lex::is_ident_start(static_cast<unsigned char>(c)) && boundary_before(blank, i) &&
        (i == 0 || blank[i - 1] != '.')) {
      size_t j = i;
      while (j < blank.size() && lex::is_ident_char(static_cast<unsigned char>(blank[j]))) ++j;
      const std::string word(code.substr(i, j - i));
      size_t k = skip_ws(blank, j);
      if (bound.count(word) != 0 && k < blank.size() && blank[k] == '.') {
        size_t p = skip_ws(blank, k + 1);
        if (word_at(blank, p, "Cells")) {
          size_t q = skip_ws(blank, p + 5);
          if (host == HostFlavor::Writer && q < blank.size() && blank[q] == '.') {
            const size_t r = skip_ws(blank, q + 1);
            if (word_at(blank, r, "Item")) {
              q = skip_ws(blank, r + 4);
            }
          }
          if (q < blank.size() && blank[q] == '(') {
            const CallArgs call = read_call_args(code, blank, q);
            if (call.ok && call.args.size() == 2) {
              out += word;
              if (host == HostFlavor::Writer) {
                out += ".Rows.Item(" + call.args[0] + ").Cells.Item(" + call.args[1] + ")";
              } else {
                out += ".Cells.Item(" + call.args[0] + ", " + call.args[1] + ")";
              }
              cells_changed = true;
              i = call.close + 1;
              continue;
            }
          }
        }
      }
      out.append(code.substr(i, j - i));
      i = j;
      continue;
    }
    if (host == HostFlavor::Writer && c == '.') {
      const size_t p = skip_ws(blank, i + 1);
      if (word_at(blank, p, "Styles")) {
        const size_t q = skip_ws(blank, p + 6);
        if (q < blank.size() && blank[q] == '(') {
          out += ".Styles.Item(";
          styles_changed = true;
          i = q + 1;
          continue;
        }
      }
    }
    out.push_back(code[i]);
    ++i;
  }

  if (!cells_changed && !styles_changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  if (cells_changed) {
    result.add_note(host == HostFlavor::Writer ? "rewrote table.Cells(r, c) to table.Rows.Item(r).Cells.Item(c)"
                                                : "rewrote sheet.Cells(r, c) to sheet.Cells.Item(r, c)");
  }
  if (styles_changed) {
    result.add_note("normalized Styles(x) -> Styles.Item(x)");
  }
  return result;
}

std::string alert_helper_source() {
  return std::string("function ") + kAlertHelper +
         "(app){\n"
         "  try {\n"
         "    if (app && typeof app.Alert === 'function') {\n"
         "      return app.Alert.apply(app, Array.prototype.slice.call(arguments, 1));\n"
         "    }\n"
         "  } catch (e) {\n"
         "  }\n"
         "  return null;\n"
         "}\n";
}

bool is_directive_line(std::string_view line, std::string_view prefix) {
  size_t i = skip_ws(line, 0);
  if (line.compare(i, 2, "//") != 0) {
    return false;
  }
  i = skip_ws(line, i + 2);
  return line.compare(i, prefix.size(), prefix) == 0;
}

// `app.Alert(...)` / `Application.Alert(...)` go through a helper that
// tolerates hosts without the method.
NormalizationResult rewrite_alerts(std::string_view code, std::string_view directive_prefix) {
  const std::string blank = lex::blank_non_code(code);
  std::string out;
  out.reserve(code.size() + 64);
  bool changed = false;

  size_t i = 0;
  while (i < code.size()) {
    if (boundary_before(blank, i) && (i == 0 || blank[i - 1] != '.')) {
      std::string receiver;
      size_t after = 0;
      if (word_at(blank, i, "app")) {
        receiver = "app";
        after = i + 3;
      } else if (word_at(blank, i, "window")) {
        const size_t d = skip_ws(blank, i + 6);
        if (d < blank.size() && blank[d] == '.' && word_at(blank, skip_ws(blank, d + 1), "Application")) {
          receiver = "window.Application";
          after = skip_ws(blank, d + 1) + 11;
        }
      } else if (word_at(blank, i, "Application")) {
        receiver = "window.Application";
        after = i + 11;
      }
      if (!receiver.empty()) {
        const size_t d = skip_ws(blank, after);
        const size_t a = d < blank.size() && blank[d] == '.' ? skip_ws(blank, d + 1) : blank.size();
        if (a < blank.size() && word_at(blank, a, "Alert")) {
          const size_t open = skip_ws(blank, a + 5);
          if (open < blank.size() && blank[open] == '(') {
            // Literals are blank in `blank`; the first argument is located in the code.
            const size_t first = skip_ws(code, open + 1);
            out += kAlertHelper;
            out += "(" + receiver;
            if (first < code.size() && code[first] != ')') {
              out += ", ";
            }
            i = first;
            changed = true;
            continue;
          }
        }
      }
    }
    out.push_back(code[i]);
    ++i;
  }
  if (!changed) {
    return unchanged(std::string(code));
  }

  NormalizationResult result{std::move(out), true, {}};
  result.add_note("normalized app.Alert calls");
  if (result.code.find(std::string("function ") + kAlertHelper) == std::string::npos) {
    // Helper goes after the leading directive comments.
    size_t pos = 0;
    while (pos < result.code.size()) {
      const size_t eol = result.code.find('\n', pos);
      const size_t line_end = eol == std::string::npos ? result.code.size() : eol;
      if (!is_directive_line(std::string_view(result.code).substr(pos, line_end - pos), directive_prefix)) {
        break;
      }
      pos = eol == std::string::npos ? result.code.size() : eol + 1;
    }
    std::string helper = alert_helper_source();
    if (pos == result.code.size() && pos > 0 && result.code.back() != '\n') {
      helper.insert(helper.begin(), '\n');
    }
    result.code.insert(pos, helper);
    result.add_note("injected safe alert helper");
  }
  return result;
}

// `var BID = window.BID;` shadows the injected facade with a possibly
// undefined global.
NormalizationResult strip_bid_alias(std::string_view code) {
  if (code.find("window.BID") == std::string_view::npos) {
    return unchanged(std::string(code));
  }
  const std::string blank = lex::blank_non_code(code);
  std::string out;
  out.reserve(code.size());
  bool changed = false;

  size_t pos = 0;
  while (pos <= code.size()) {
    const size_t eol = code.find('\n', pos);
    const size_t end = eol == std::string_view::npos ? code.size() : eol;
    const std::string_view line = code.substr(pos, end - pos);
    const std::string_view bline = std::string_view(blank).substr(pos, end - pos);

    bool alias = line == bline;
    size_t i = skip_ws(bline, 0);
    if (alias) {
      if (word_at(bline, i, "var") || word_at(bline, i, "let")) {
        i += 3;
      } else if (word_at(bline, i, "const")) {
        i += 5;
      } else {
        alias = false;
      }
    }
    if (alias) {
      const std::string_view tail[] = {"BID", "=", "window", ".", "BID"};
      for (const auto& tok : tail) {
        i = skip_ws(bline, i);
        if (bline.compare(i, tok.size(), tok) != 0) {
          alias = false;
          break;
        }
        i += tok.size();
      }
    }
    if (alias) {
      i = skip_ws(bline, i);
      if (i < bline.size() && bline[i] == ';') ++i;
      alias = skip_ws(bline, i) == bline.size();
    }

    if (alias) {
      out.push_back(' ');
      changed = true;
    } else {
      out.append(line);
    }
    if (eol == std::string_view::npos) {
      break;
    }
    out.push_back('\n');
    pos = eol + 1;
  }
  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("stripped redundant `var BID = window.BID;`");
  return result;
}

} // namespace

NormalizationResult rewrite_host_calls(std::string_view code, HostFlavor host,
                                       std::string_view directive_prefix) {
  NormalizationResult result = rewrite_collections(code, host);
  result.absorb(rewrite_alerts(result.code, directive_prefix));
  result.absorb(strip_bid_alias(result.code));
  return result;
}

} // namespace dmk
