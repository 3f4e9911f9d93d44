#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace dmk {

uint64_t fnv1a_64(std::string_view text);
std::string to_hex(uint64_t value, int width = 16);

// Local time, "YYYY-mm-ddTHH:MM:SS".
std::string now_iso();

// Non-whitespace bytes; used for the "effectively empty" span checks.
size_t count_non_space(std::string_view text);

std::string truncate_bytes(std::string_view text, size_t max_bytes);

} // namespace dmk
