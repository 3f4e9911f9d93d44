#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace dmk {

enum class AnchorPlacement { Cursor, End };

enum class AnchorMode { Auto, BookmarkOnly, MarkerOnly };

const char* anchor_placement_name(AnchorPlacement placement);
const char* anchor_mode_name(AnchorMode mode);
std::optional<AnchorPlacement> parse_anchor_placement(std::string_view value);
std::optional<AnchorMode> parse_anchor_mode(std::string_view value);

// Settings carried by `// @dmk:` comments in the macro source.
struct Directives {
  std::optional<std::string> block_id;
  std::optional<AnchorPlacement> anchor;
  std::optional<AnchorMode> anchor_mode;
  bool no_upsert = false;
  bool direct = false;
  bool unsafe = false;
  bool backup_off = false;

  bool disables_upsert() const { return no_upsert || direct; }
};

// Reads `// <prefix>key=value` lines and `/* <prefix>blockId=x */` comments.
// Keys are case-insensitive; unknown keys are ignored.
Directives parse_directives(std::string_view code, std::string_view prefix = "@dmk:");

// Block ids keep [A-Za-z0-9_-:.] and at most 64 characters.
std::string sanitize_block_id(std::string_view raw);

// "dmk_auto_<8 hex>" derived from the source text, stable across retries of
// the same snippet.
std::string auto_block_id(std::string_view code);

// Anchor-safe token: [A-Za-z0-9_], leading letter, at most 30 characters,
// prefixed "DMK_".
std::string bookmark_name(std::string_view block_id);

std::string start_marker(std::string_view block_id);
std::string end_marker(std::string_view block_id);

} // namespace dmk
