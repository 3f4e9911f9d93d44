#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dmk::utf8 {

struct Decoded {
  char32_t cp = 0;
  size_t len = 1;  // bytes consumed; 1 for invalid sequences
  bool valid = false;
};

// Decodes the code point starting at byte offset `i`. Invalid or truncated
// sequences decode as a single byte with valid == false.
Decoded decode_at(std::string_view text, size_t i);

// Number of code points; invalid bytes count one each.
size_t length(std::string_view text);

// "U+201C" style label.
std::string code_point_label(char32_t cp);

} // namespace dmk::utf8
