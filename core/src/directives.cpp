#include "dmk/directives.h"

#include "dmk/lexer.h"
#include "dmk/text_util.h"

#include <algorithm>
#include <cctype>

namespace dmk {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
  return s;
}

bool starts_with_ci(std::string_view s, std::string_view prefix) {
  if (s.size() < prefix.size()) {
    return false;
  }
  return lower(s.substr(0, prefix.size())) == lower(prefix);
}

void apply(Directives& d, std::string_view body) {
  const size_t eq = body.find('=');
  const std::string key = lower(trim(body.substr(0, eq)));
  std::string_view value = eq == std::string_view::npos ? std::string_view{} : trim(body.substr(eq + 1));
  // Values end at the first whitespace.
  const size_t ws = value.find_first_of(" \t");
  if (ws != std::string_view::npos) {
    value = value.substr(0, ws);
  }

  if (key == "blockid" || key == "block_id") {
    if (!value.empty()) {
      d.block_id = sanitize_block_id(value);
    }
  } else if (key == "anchor") {
    // `anchor=bookmark_only` is accepted as shorthand for anchor_mode.
    if (auto placement = parse_anchor_placement(value)) {
      d.anchor = placement;
    } else if (auto mode = parse_anchor_mode(value)) {
      d.anchor_mode = mode;
    }
  } else if (key == "anchor_mode" || key == "anchor-mode" || key == "anchormode") {
    if (auto mode = parse_anchor_mode(value)) {
      d.anchor_mode = mode;
    }
  } else if (key == "no_upsert" || key == "no-upsert") {
    d.no_upsert = true;
  } else if (key == "direct") {
    d.direct = true;
  } else if (key == "unsafe") {
    d.unsafe = true;
  } else if (key == "backup") {
    const std::string v = lower(value);
    d.backup_off = v == "off" || v == "false" || v == "0" || v == "no";
  }
}

} // namespace

const char* anchor_placement_name(AnchorPlacement placement) {
  return placement == AnchorPlacement::End ? "end" : "cursor";
}

const char* anchor_mode_name(AnchorMode mode) {
  switch (mode) {
    case AnchorMode::Auto:
      return "auto";
    case AnchorMode::BookmarkOnly:
      return "bookmark_only";
    case AnchorMode::MarkerOnly:
      return "marker_only";
  }
  return "auto";
}

std::optional<AnchorPlacement> parse_anchor_placement(std::string_view value) {
  const std::string v = lower(value);
  if (v == "cursor" || v == "selection") {
    return AnchorPlacement::Cursor;
  }
  if (v == "end" || v == "doc_end" || v == "document_end") {
    return AnchorPlacement::End;
  }
  return std::nullopt;
}

std::optional<AnchorMode> parse_anchor_mode(std::string_view value) {
  const std::string v = lower(value);
  if (v == "auto") {
    return AnchorMode::Auto;
  }
  if (v == "bookmark_only" || v == "bookmark-only" || v == "bookmark") {
    return AnchorMode::BookmarkOnly;
  }
  if (v == "marker_only" || v == "marker-only" || v == "marker" || v == "text") {
    return AnchorMode::MarkerOnly;
  }
  return std::nullopt;
}

Directives parse_directives(std::string_view code, std::string_view prefix) {
  Directives d;
  const auto regions = lex::scan_regions(code);
  size_t i = 0;
  while (i < code.size()) {
    const lex::Region r = regions[i];
    if (!lex::is_comment(r)) {
      ++i;
      continue;
    }
    size_t j = i;
    while (j < code.size() && regions[j] == r) {
      if (r == lex::Region::BlockComment && j > i + 2 && code[j] == '/' && code[j - 1] == '*') {
        ++j;
        break;
      }
      ++j;
    }
    std::string_view text = code.substr(i + 2, j - i - 2);
    if (r == lex::Region::BlockComment && text.size() >= 2 && text.substr(text.size() - 2) == "*/") {
      text.remove_suffix(2);
    }
    text = trim(text);
    if (starts_with_ci(text, prefix)) {
      text.remove_prefix(prefix.size());
      // Block comments only carry block ids.
      if (r == lex::Region::LineComment || starts_with_ci(text, "blockid") || starts_with_ci(text, "block_id")) {
        apply(d, text);
      }
    }
    i = j;
  }
  return d;
}

std::string sanitize_block_id(std::string_view raw) {
  std::string out;
  for (char c : raw) {
    if (out.size() >= 64) {
      break;
    }
    const auto u = static_cast<unsigned char>(c);
    out.push_back(std::isalnum(u) || c == '_' || c == '-' || c == ':' || c == '.' ? c : '_');
  }
  return out;
}

std::string auto_block_id(std::string_view code) {
  return "dmk_auto_" + to_hex(fnv1a_64(code), 8);
}

std::string bookmark_name(std::string_view block_id) {
  std::string s;
  for (char c : block_id) {
    const auto u = static_cast<unsigned char>(c);
    s.push_back(u < 0x80 && (std::isalnum(u) || c == '_') ? c : '_');
  }
  if (s.empty()) {
    s = "dmk_auto";
  }
  if (!std::isalpha(static_cast<unsigned char>(s.front()))) {
    s.insert(s.begin(), 'B');
  }
  if (s.size() > 30) {
    s.resize(30);
  }
  return "DMK_" + s;
}

std::string start_marker(std::string_view block_id) {
  return "[[DMK:" + std::string(block_id) + ":START]]";
}

std::string end_marker(std::string_view block_id) {
  return "[[DMK:" + std::string(block_id) + ":END]]";
}

} // namespace dmk
