#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dmk::lex {

enum class Region : uint8_t {
  Code,
  StringSingle,
  StringDouble,
  Template,
  TemplateExpr,
  Regex,
  RegexCharClass,
  LineComment,
  BlockComment
};

// Classifies every byte offset of `text`. One left-to-right pass with a single
// character of lookahead. Never throws; unterminated strings, templates and
// block comments extend to the end of the text. Regex literals additionally end
// at a line break, since the grammar does not allow one inside a pattern.
std::vector<Region> scan_regions(std::string_view text);

// Code or the expression part of a template interpolation.
inline bool is_code(Region r) {
  return r == Region::Code || r == Region::TemplateExpr;
}

inline bool is_comment(Region r) {
  return r == Region::LineComment || r == Region::BlockComment;
}

inline bool is_string(Region r) {
  return r == Region::StringSingle || r == Region::StringDouble || r == Region::Template;
}

// Copy of `text` with every non-code byte replaced by a space (line breaks are
// kept so offsets and line numbers stay aligned). Used by pattern scans that
// must not match inside literals or comments.
std::string blank_non_code(std::string_view text, const std::vector<Region>& regions);
std::string blank_non_code(std::string_view text);

bool is_ident_start(unsigned char c);
bool is_ident_char(unsigned char c);

} // namespace dmk::lex
