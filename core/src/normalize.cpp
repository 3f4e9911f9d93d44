#include "dmk/normalize.h"

#include "dmk/log.h"

#include <algorithm>
#include <cctype>

namespace dmk {

void NormalizationResult::add_note(const std::string& note) {
  if (note.empty()) {
    return;
  }
  if (std::find(notes.begin(), notes.end(), note) == notes.end()) {
    notes.push_back(note);
  }
}

void NormalizationResult::absorb(NormalizationResult next) {
  if (!next.changed) {
    return;
  }
  code = std::move(next.code);
  changed = true;
  for (const auto& note : next.notes) {
    add_note(note);
  }
}

NormalizationResult unchanged(std::string code) {
  NormalizationResult result;
  result.code = std::move(code);
  return result;
}

const char* host_flavor_name(HostFlavor flavor) {
  switch (flavor) {
    case HostFlavor::Writer:
      return "writer";
    case HostFlavor::Spreadsheet:
      return "spreadsheet";
    case HostFlavor::Presentation:
      return "presentation";
    case HostFlavor::Unknown:
      break;
  }
  return "unknown";
}

HostFlavor parse_host_flavor(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "writer" || lower == "wps") {
    return HostFlavor::Writer;
  }
  if (lower == "spreadsheet" || lower == "et") {
    return HostFlavor::Spreadsheet;
  }
  if (lower == "presentation" || lower == "wpp") {
    return HostFlavor::Presentation;
  }
  return HostFlavor::Unknown;
}

NormalizationResult normalize_source(std::string_view code, const NormalizeOptions& options) {
  NormalizationResult result = unchanged(std::string(code));
  result.absorb(normalize_control_chars(result.code));
  result.absorb(normalize_punctuation(result.code));
  result.absorb(strip_code_fences(result.code));
  result.absorb(strip_comments(result.code, options.directive_prefix));
  result.absorb(downgrade_declarations(result.code));
  result.absorb(desugar_templates(result.code, options.max_template_passes));
  result.absorb(repair_stray_escapes(result.code));
  result.absorb(rewrite_host_calls(result.code, options.host, options.directive_prefix));
  result.absorb(strip_type_syntax(result.code));
  if (result.changed) {
    log::debug("normalize: " + std::to_string(result.notes.size()) + " note(s), " +
               std::to_string(code.size()) + " -> " + std::to_string(result.code.size()) + " bytes");
  }
  return result;
}

} // namespace dmk
