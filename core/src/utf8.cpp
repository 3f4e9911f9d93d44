#include "dmk/utf8.h"

#include <cstdio>

namespace dmk::utf8 {

Decoded decode_at(std::string_view text, size_t i) {
  Decoded d;
  if (i >= text.size()) {
    d.len = 0;
    return d;
  }
  const auto b0 = static_cast<unsigned char>(text[i]);
  if (b0 < 0x80) {
    d.cp = b0;
    d.valid = true;
    return d;
  }

  size_t need = 0;
  char32_t cp = 0;
  if ((b0 & 0xE0) == 0xC0) {
    need = 1;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    need = 2;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    need = 3;
    cp = b0 & 0x07;
  } else {
    d.cp = b0;
    return d;
  }
  if (i + need >= text.size()) {
    d.cp = b0;
    return d;
  }
  for (size_t k = 1; k <= need; ++k) {
    const auto b = static_cast<unsigned char>(text[i + k]);
    if ((b & 0xC0) != 0x80) {
      d.cp = b0;
      return d;
    }
    cp = (cp << 6) | (b & 0x3F);
  }
  d.cp = cp;
  d.len = need + 1;
  d.valid = true;
  return d;
}

std::string code_point_label(char32_t cp) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "U+%04X", static_cast<unsigned>(cp));
  return buf;
}

size_t length(std::string_view text) {
  size_t count = 0;
  size_t i = 0;
  while (i < text.size()) {
    i += decode_at(text, i).len;
    ++count;
  }
  return count;
}

} // namespace dmk::utf8
