#include "dmk/lexer.h"

#include <cstring>

namespace dmk::lex {

namespace {

// Keywords after which a `/` starts a regex literal rather than a division.
bool is_regex_keyword(std::string_view word) {
  static const char* kWords[] = {"return", "typeof", "instanceof", "in",   "of",    "new",
                                 "delete", "void",   "throw",      "case", "do",    "else",
                                 "yield",  "await"};
  for (const char* w : kWords) {
    if (word == w) {
      return true;
    }
  }
  return false;
}

bool regex_allowed_after(char prev) {
  if (prev == '\0') {
    return true;
  }
  return std::strchr("(,=:[!&|?{};+-*%<>~^", prev) != nullptr;
}

struct ScanState {
  Region mode = Region::Code;
  // Brace depth for each open template interpolation, innermost last.
  std::vector<int> expr_depth;
  // Last significant (non-whitespace) code character and the identifier that
  // ended at it, for the regex-vs-division decision.
  char prev_sig = '\0';
  size_t word_start = 0;
  size_t word_end = 0;
  bool prev_was_word = false;
  // Offset of prev_sig when it was set by an operator character.
  size_t prev_pos = 0;

  Region code_mode() const {
    return expr_depth.empty() ? Region::Code : Region::TemplateExpr;
  }
};

} // namespace

bool is_ident_start(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

bool is_ident_char(unsigned char c) {
  return is_ident_start(c) || (c >= '0' && c <= '9');
}

std::vector<Region> scan_regions(std::string_view text) {
  const size_t n = text.size();
  std::vector<Region> out(n, Region::Code);
  ScanState st;

  size_t i = 0;
  while (i < n) {
    const char ch = text[i];
    const char next = (i + 1 < n) ? text[i + 1] : '\0';

    switch (st.mode) {
      case Region::LineComment:
        out[i] = Region::LineComment;
        if (ch == '\n' || ch == '\r') {
          out[i] = st.code_mode();
          st.mode = st.code_mode();
        }
        ++i;
        continue;

      case Region::BlockComment:
        out[i] = Region::BlockComment;
        if (ch == '*' && next == '/') {
          out[i + 1] = Region::BlockComment;
          st.mode = st.code_mode();
          i += 2;
          continue;
        }
        ++i;
        continue;

      case Region::StringSingle:
      case Region::StringDouble: {
        out[i] = st.mode;
        if (ch == '\\') {
          if (i + 1 < n) {
            out[i + 1] = st.mode;
          }
          i += 2;
          continue;
        }
        const char quote = st.mode == Region::StringSingle ? '\'' : '"';
        if (ch == quote) {
          st.mode = st.code_mode();
          st.prev_sig = quote;
          st.prev_was_word = false;
        }
        ++i;
        continue;
      }

      case Region::Template:
        out[i] = Region::Template;
        if (ch == '\\') {
          if (i + 1 < n) {
            out[i + 1] = Region::Template;
          }
          i += 2;
          continue;
        }
        if (ch == '`') {
          // Closing backtick: back to whatever encloses this template.
          st.mode = st.code_mode();
          st.prev_sig = '`';
          st.prev_was_word = false;
          ++i;
          continue;
        }
        if (ch == '$' && next == '{') {
          out[i + 1] = Region::Template;
          st.expr_depth.push_back(1);
          st.mode = Region::TemplateExpr;
          st.prev_sig = '\0';
          st.prev_was_word = false;
          i += 2;
          continue;
        }
        ++i;
        continue;

      case Region::Regex:
        out[i] = Region::Regex;
        if (ch == '\n' || ch == '\r') {
          out[i] = st.code_mode();
          st.mode = st.code_mode();
          ++i;
          continue;
        }
        if (ch == '\\') {
          if (i + 1 < n && text[i + 1] != '\n') {
            out[i + 1] = Region::Regex;
            i += 2;
            continue;
          }
          ++i;
          continue;
        }
        if (ch == '[') {
          st.mode = Region::RegexCharClass;
          ++i;
          continue;
        }
        if (ch == '/') {
          st.mode = st.code_mode();
          st.prev_sig = '/';
          // Flags that follow read as an identifier; a later `/` is a division.
          st.prev_was_word = true;
          st.word_start = st.word_end = i;
        }
        ++i;
        continue;

      case Region::RegexCharClass:
        out[i] = Region::RegexCharClass;
        if (ch == '\n' || ch == '\r') {
          out[i] = st.code_mode();
          st.mode = st.code_mode();
          ++i;
          continue;
        }
        if (ch == '\\') {
          if (i + 1 < n && text[i + 1] != '\n') {
            out[i + 1] = Region::RegexCharClass;
            i += 2;
            continue;
          }
          ++i;
          continue;
        }
        if (ch == ']') {
          st.mode = Region::Regex;
        }
        ++i;
        continue;

      case Region::Code:
      case Region::TemplateExpr:
        break;
    }

    // Code (top level or inside an interpolation).
    const Region here = st.code_mode();
    out[i] = here;

    if (ch == '/' && next == '/') {
      out[i] = Region::LineComment;
      out[i + 1] = Region::LineComment;
      st.mode = Region::LineComment;
      i += 2;
      continue;
    }
    if (ch == '/' && next == '*') {
      out[i] = Region::BlockComment;
      out[i + 1] = Region::BlockComment;
      st.mode = Region::BlockComment;
      i += 2;
      continue;
    }
    if (ch == '\'') {
      out[i] = Region::StringSingle;
      st.mode = Region::StringSingle;
      ++i;
      continue;
    }
    if (ch == '"') {
      out[i] = Region::StringDouble;
      st.mode = Region::StringDouble;
      ++i;
      continue;
    }
    if (ch == '`') {
      out[i] = Region::Template;
      st.mode = Region::Template;
      ++i;
      continue;
    }
    if (ch == '/') {
      bool starts_regex = false;
      if (st.prev_was_word) {
        starts_regex = is_regex_keyword(text.substr(st.word_start, st.word_end - st.word_start));
      } else if ((st.prev_sig == '+' || st.prev_sig == '-') && st.prev_pos > 0 &&
                 text[st.prev_pos - 1] == st.prev_sig) {
        // Postfix `++`/`--` ends an operand.
        starts_regex = false;
      } else {
        starts_regex = regex_allowed_after(st.prev_sig);
      }
      if (starts_regex) {
        out[i] = Region::Regex;
        st.mode = Region::Regex;
        ++i;
        continue;
      }
    }

    if (!st.expr_depth.empty()) {
      if (ch == '{') {
        ++st.expr_depth.back();
      } else if (ch == '}') {
        if (--st.expr_depth.back() == 0) {
          st.expr_depth.pop_back();
          out[i] = Region::Template;
          st.mode = Region::Template;
          ++i;
          continue;
        }
      }
    }

    const auto uc = static_cast<unsigned char>(ch);
    if (is_ident_char(uc)) {
      size_t j = i;
      while (j < n && is_ident_char(static_cast<unsigned char>(text[j]))) {
        out[j] = here;
        ++j;
      }
      st.prev_was_word = true;
      st.word_start = i;
      st.word_end = j;
      st.prev_sig = text[j - 1];
      i = j;
      continue;
    }
    if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
      st.prev_sig = ch;
      st.prev_pos = i;
      st.prev_was_word = false;
    }
    ++i;
  }
  return out;
}

std::string blank_non_code(std::string_view text, const std::vector<Region>& regions) {
  std::string out(text);
  for (size_t i = 0; i < out.size() && i < regions.size(); ++i) {
    if (!is_code(regions[i]) && out[i] != '\n' && out[i] != '\r') {
      out[i] = ' ';
    }
  }
  return out;
}

std::string blank_non_code(std::string_view text) {
  return blank_non_code(text, scan_regions(text));
}

} // namespace dmk::lex
