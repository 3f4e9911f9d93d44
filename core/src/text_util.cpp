#include "dmk/text_util.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace dmk {

uint64_t fnv1a_64(std::string_view text) {
  uint64_t hash = 1469598103934665603ull;
  for (unsigned char c : text) {
    hash ^= static_cast<uint64_t>(c);
    hash *= 1099511628211ull;
  }
  return hash;
}

std::string to_hex(uint64_t value, int width) {
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << value;
  std::string s = out.str();
  if (width > 0 && static_cast<size_t>(width) < s.size()) {
    s = s.substr(s.size() - static_cast<size_t>(width));
  }
  return s;
}

std::string now_iso() {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const auto t = clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

size_t count_non_space(std::string_view text) {
  size_t n = 0;
  for (unsigned char c : text) {
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v' && c != '\f') {
      ++n;
    }
  }
  return n;
}

std::string truncate_bytes(std::string_view text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return std::string(text);
  }
  // Back off to a UTF-8 lead byte so the cut never splits a code point.
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
  return std::string(text.substr(0, cut));
}

} // namespace dmk
