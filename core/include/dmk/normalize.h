#pragma once

#include "dmk/host_flavor.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

struct NormalizationResult {
  std::string code;
  bool changed = false;
  // Deduplicated, first-insertion order.
  std::vector<std::string> notes;

  void add_note(const std::string& note);
  // Threads `next` (produced from this->code) into this result.
  void absorb(NormalizationResult next);
};

NormalizationResult unchanged(std::string code);

struct NormalizeOptions {
  HostFlavor host = HostFlavor::Writer;
  std::string directive_prefix = "@dmk:";
  int max_template_passes = 4;
};

// Individual passes, in pipeline order. Each one is idempotent and only
// rewrites code regions (unless removing comments/templates is the point).
NormalizationResult normalize_control_chars(std::string_view code);
NormalizationResult normalize_punctuation(std::string_view code);
NormalizationResult strip_code_fences(std::string_view code);
NormalizationResult strip_comments(std::string_view code, std::string_view directive_prefix);
NormalizationResult downgrade_declarations(std::string_view code);
NormalizationResult desugar_templates(std::string_view code, int max_passes = 4);
NormalizationResult repair_stray_escapes(std::string_view code);
NormalizationResult rewrite_host_calls(std::string_view code, HostFlavor host,
                                       std::string_view directive_prefix);
NormalizationResult strip_type_syntax(std::string_view code);

// Passes 1 and 2; re-applied to the assembled unit after wrapping.
NormalizationResult normalize_unicode(std::string_view code);

// Full pipeline.
NormalizationResult normalize_source(std::string_view code, const NormalizeOptions& options = {});

// True when a backtick opens a template literal somewhere in code position.
bool has_template_delimiter(std::string_view code);

struct SuspiciousChar {
  size_t offset = 0;
  std::string ch;
  std::string code_point;  // "U+201C"
};

// Characters that commonly break the host parser ("Invalid or unexpected
// token"). At most `limit` entries.
std::vector<SuspiciousChar> find_suspicious_chars(std::string_view code, size_t limit = 50);

} // namespace dmk
