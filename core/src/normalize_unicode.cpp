#include "dmk/normalize.h"

#include "dmk/lexer.h"
#include "dmk/utf8.h"

#include <unordered_map>

namespace dmk {

namespace {

enum class ControlAction { Keep, Drop, Space, Newline };

ControlAction classify_control(char32_t cp) {
  switch (cp) {
    case 0xFEFF:  // BOM / zero width no-break space
    case 0x200B:
    case 0x200C:
    case 0x200D:
    case 0x2060:
    case 0x200E:  // directional marks
    case 0x200F:
    case 0x00AD:  // soft hyphen
      return ControlAction::Drop;
    case 0x2028:
    case 0x2029:
      return ControlAction::Newline;
    case 0x00A0:
    case 0x1680:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return ControlAction::Space;
    default:
      break;
  }
  if (cp >= 0x202A && cp <= 0x202E) return ControlAction::Drop;   // embeddings/overrides
  if (cp >= 0x2066 && cp <= 0x2069) return ControlAction::Drop;   // isolates
  if (cp >= 0x2000 && cp <= 0x200A) return ControlAction::Space;  // en quad .. hair space
  if (cp < 0x20 && cp != '\t' && cp != '\n' && cp != '\r') return ControlAction::Drop;
  if (cp >= 0x7F && cp <= 0x9F) return ControlAction::Drop;       // DEL + C1
  return ControlAction::Keep;
}

const std::unordered_map<char32_t, char>& punctuation_table() {
  static const std::unordered_map<char32_t, char> kTable = {
      // double quotes
      {0x201C, '"'}, {0x201D, '"'}, {0x201E, '"'}, {0x201F, '"'}, {0x00AB, '"'},
      {0x00BB, '"'}, {0x300C, '"'}, {0x300D, '"'}, {0x300E, '"'}, {0x300F, '"'},
      {0x301D, '"'}, {0x301E, '"'}, {0x301F, '"'}, {0xFF02, '"'},
      // single quotes
      {0x2018, '\''}, {0x2019, '\''}, {0x201A, '\''}, {0x201B, '\''}, {0x2039, '\''},
      {0x203A, '\''}, {0xFF07, '\''},
      // brackets
      {0xFF08, '('}, {0xFF09, ')'}, {0x3010, '['}, {0x3011, ']'}, {0xFF3B, '['},
      {0xFF3D, ']'}, {0xFF5B, '{'}, {0xFF5D, '}'},
      // separators and operators
      {0xFF0C, ','}, {0x3001, ','}, {0xFF1B, ';'}, {0xFF1A, ':'}, {0xFF1D, '='},
      {0xFF0B, '+'}, {0xFF0D, '-'}, {0x2013, '-'}, {0x2014, '-'}, {0x2212, '-'},
      {0xFF0A, '*'}, {0x00D7, '*'}, {0xFF0F, '/'}, {0x00F7, '/'}, {0xFF3C, '\\'},
      {0xFF1C, '<'}, {0xFF1E, '>'}, {0xFF06, '&'}, {0xFF5C, '|'}, {0xFF3E, '^'},
      {0xFF5E, '~'}, {0xFF05, '%'}, {0xFF03, '#'}, {0xFF20, '@'}, {0xFF04, '$'},
      {0xFF01, '!'}, {0xFF1F, '?'}, {0xFF0E, '.'}, {0x3002, '.'}, {0x00B7, '.'},
  };
  return kTable;
}

bool closes_mapped_string(char32_t cp, char quote) {
  if (quote == '"') {
    return cp == '"' || cp == 0x201C || cp == 0x201D || cp == 0x201E || cp == 0x201F ||
           cp == 0xFF02 || cp == 0x300D || cp == 0x300F || cp == 0x00BB;
  }
  return cp == '\'' || cp == 0x2018 || cp == 0x2019 || cp == 0x201A || cp == 0x201B ||
         cp == 0xFF07 || cp == 0x203A;
}

bool is_suspicious(char32_t cp) {
  if (cp == '`') return true;
  if (classify_control(cp) != ControlAction::Keep) {
    return cp != '\t' && cp != '\n' && cp != '\r';
  }
  if (punctuation_table().count(cp) != 0) return true;
  return cp == 0x2026;  // ellipsis
}

// Maps curly quote pairs that sit in code to ASCII quotes, leaving the body of
// each string alone. Regions are rescanned after every pair, since a mapped
// quote changes how the rest of the text lexes.
size_t map_quote_delimiters(std::string& text) {
  const auto& table = punctuation_table();
  size_t mapped = 0;
  size_t from = 0;
  while (from < text.size()) {
    const auto regions = lex::scan_regions(text);
    size_t open = text.size();
    char quote = '\0';
    size_t open_len = 0;
    for (size_t i = from; i < text.size();) {
      const auto d = utf8::decode_at(text, i);
      if (d.valid && d.cp >= 0x80 && lex::is_code(regions[i])) {
        const auto it = table.find(d.cp);
        if (it != table.end() && (it->second == '"' || it->second == '\'')) {
          open = i;
          quote = it->second;
          open_len = d.len;
          break;
        }
      }
      i += d.len;
    }
    if (quote == '\0') {
      break;
    }

    text.replace(open, open_len, 1, quote);
    ++mapped;
    size_t j = open + 1;
    while (j < text.size() && text[j] != '\n' && text[j] != '\r') {
      const auto d = utf8::decode_at(text, j);
      if (d.valid && closes_mapped_string(d.cp, quote)) {
        if (d.cp != static_cast<char32_t>(quote)) {
          text.replace(j, d.len, 1, quote);
          ++mapped;
        }
        ++j;
        break;
      }
      j += d.len;
    }
    from = j;
  }
  return mapped;
}

} // namespace

NormalizationResult normalize_control_chars(std::string_view code) {
  std::string out;
  out.reserve(code.size());
  bool changed = false;
  size_t i = 0;
  while (i < code.size()) {
    const auto d = utf8::decode_at(code, i);
    const ControlAction action = d.valid ? classify_control(d.cp) : ControlAction::Keep;
    switch (action) {
      case ControlAction::Keep:
        out.append(code.substr(i, d.len));
        break;
      case ControlAction::Drop:
        changed = true;
        break;
      case ControlAction::Space:
        out.push_back(' ');
        changed = true;
        break;
      case ControlAction::Newline:
        out.push_back('\n');
        changed = true;
        break;
    }
    i += d.len;
  }
  if (!changed) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  result.add_note("removed zero-width/BOM/line-separator characters");
  return result;
}

NormalizationResult normalize_punctuation(std::string_view code) {
  std::string text(code);
  size_t mapped = map_quote_delimiters(text);
  size_t escaped_newlines = 0;

  const auto regions = lex::scan_regions(text);
  const auto& table = punctuation_table();
  std::string out;
  out.reserve(text.size());

  size_t i = 0;
  while (i < text.size()) {
    const auto d = utf8::decode_at(text, i);
    const lex::Region region = regions[i];

    if ((region == lex::Region::StringSingle || region == lex::Region::StringDouble) &&
        (text[i] == '\n' || text[i] == '\r')) {
      // A raw line break cannot appear inside a quoted string.
      out += "\\n";
      ++escaped_newlines;
      i += (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
      continue;
    }

    if (lex::is_code(region) && d.valid && d.cp >= 0x80) {
      const auto it = table.find(d.cp);
      if (it != table.end()) {
        out.push_back(it->second);
        ++mapped;
        i += d.len;
        continue;
      }
    }
    out.append(text, i, d.len);
    i += d.len;
  }

  if (mapped == 0 && escaped_newlines == 0) {
    return unchanged(std::string(code));
  }
  NormalizationResult result{std::move(out), true, {}};
  if (mapped > 0) {
    result.add_note("normalized curly quotes/fullwidth punctuation");
  }
  if (escaped_newlines > 0) {
    result.add_note("escaped literal newlines inside string literals");
  }
  return result;
}

NormalizationResult normalize_unicode(std::string_view code) {
  NormalizationResult result = normalize_control_chars(code);
  result.absorb(normalize_punctuation(result.code));
  return result;
}

std::vector<SuspiciousChar> find_suspicious_chars(std::string_view code, size_t limit) {
  std::vector<SuspiciousChar> out;
  size_t i = 0;
  while (i < code.size() && out.size() < limit) {
    const auto d = utf8::decode_at(code, i);
    if (d.valid && is_suspicious(d.cp)) {
      out.push_back({i, std::string(code.substr(i, d.len)), utf8::code_point_label(d.cp)});
    }
    i += d.len;
  }
  return out;
}

} // namespace dmk
