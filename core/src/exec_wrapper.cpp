#include "dmk/exec_wrapper.h"

#include "dmk/lexer.h"
#include "dmk/log.h"
#include "dmk/normalize.h"

#include <cctype>

namespace dmk {

namespace {

const char* kFacade = R"JS(var window = (typeof window !== 'undefined' && window) ? window : this;
var console = (typeof console !== 'undefined' && console) ? console : {
  log: function () { __dmk_log(Array.prototype.join.call(arguments, ' ')); }
};
if (!console.warn) { console.warn = console.log; }
if (!console.error) { console.error = console.log; }
function __dmk_text(v) { return (v === undefined || v === null) ? '' : String(v); }
var BID = {
  host: '@HOST@',
  upsertBlock: function (blockId, fn, opts) {
    if (typeof fn !== 'function') { throw new TypeError('BID.upsertBlock expects (blockId, function, opts)'); }
    return __dmk_upsert(__dmk_text(blockId), fn, opts || {});
  },
  typeText: function (text) { __dmk_type_text(__dmk_text(text)); },
  insertParagraph: function (text) {
    if (text !== undefined && text !== null) { __dmk_type_text(__dmk_text(text)); }
    __dmk_type_paragraph();
  },
  insertTable: function (rows, cols, cells) { __dmk_insert_table(rows | 0, cols | 0, cells || []); },
  blockExists: function (blockId) { return !!__dmk_block_exists(__dmk_text(blockId)); },
  getBlockText: function (blockId) { return __dmk_get_block_text(__dmk_text(blockId)); },
  setBlockText: function (blockId, text) { __dmk_set_block_text(__dmk_text(blockId), __dmk_text(text)); },
  rollbackBlock: function (blockId) { __dmk_rollback(__dmk_text(blockId)); },
  alert: function (msg) { __dmk_alert(__dmk_text(msg)); }
};
window.BID = BID;
)JS";

// Writer hosts also get a Selection that types through the facade, so
// `Application.Selection.TypeText(...)` lands inside the current block.
const char* kWriterShim = R"JS(var Application = (typeof Application !== 'undefined' && Application) ? Application : {};
if (!Application.Alert) { Application.Alert = function (msg) { BID.alert(msg); }; }
if (!Application.Selection) {
  Application.Selection = {
    TypeText: function (text) { BID.typeText(text); },
    TypeParagraph: function () { BID.insertParagraph(); }
  };
}
window.Application = Application;
)JS";

const char* kOtherShim = R"JS(var Application = (typeof Application !== 'undefined' && Application) ? Application : {};
if (!Application.Alert) { Application.Alert = function (msg) { BID.alert(msg); }; }
window.Application = Application;
)JS";

std::string compact_code(std::string_view code) {
  const std::string blanked = lex::blank_non_code(code);
  std::string out;
  out.reserve(blanked.size());
  for (char c : blanked) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      out.push_back(c);
    }
  }
  return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool is_identifier(std::string_view s) {
  if (s.empty() || !lex::is_ident_start(static_cast<unsigned char>(s.front()))) {
    return false;
  }
  for (char c : s) {
    if (!lex::is_ident_char(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

// Inside the producer function the trailing `name();` of a body that declares
// `function name(` is turned into `return name();` so its value can be
// materialized.
std::string promote_trailing_call(std::string_view body) {
  std::string_view t = trim(body);
  const size_t nl = t.find_last_of('\n');
  std::string_view last = trim(nl == std::string_view::npos ? t : t.substr(nl + 1));
  if (ends_with(last, ";")) {
    last.remove_suffix(1);
    last = trim(last);
  }
  if (!ends_with(last, "()")) {
    return std::string(body);
  }
  const std::string_view name = trim(last.substr(0, last.size() - 2));
  if (!is_identifier(name) || name == "return") {
    return std::string(body);
  }
  const std::string decl = "function " + std::string(name);
  if (body.find(decl) == std::string_view::npos) {
    return std::string(body);
  }
  const size_t at = body.rfind(name);
  std::string out(body);
  out.insert(at, "return ");
  return out;
}

std::string wrap_options(const RunnableUnit& unit) {
  std::string parts;
  if (unit.anchor == AnchorPlacement::End) {
    parts += std::string("anchor: '") + anchor_placement_name(unit.anchor) + "'";
  }
  if (unit.anchor_mode && *unit.anchor_mode != AnchorMode::Auto) {
    if (!parts.empty()) parts += ", ";
    parts += std::string("anchorMode: '") + anchor_mode_name(*unit.anchor_mode) + "'";
  }
  return parts.empty() ? std::string() : ", { " + parts + " }";
}

} // namespace

std::string shim_preamble(HostFlavor host) {
  std::string facade = kFacade;
  const std::string token = "@HOST@";
  facade.replace(facade.find(token), token.size(), host_flavor_name(host));
  facade += host == HostFlavor::Writer ? kWriterShim : kOtherShim;
  return facade;
}

bool looks_like_insertion(std::string_view code) {
  static const char* kPatterns[] = {
      ".Range.Text=", "Tables.Add(", "InlineShapes.Add", "Shapes.Add", "AddTextEffect(", "AddChart(",
      "AddChart2(", "AddPicture(", "TypeParagraph(", "TypeText(", "BID.typeText(", "BID.insertParagraph(",
      "BID.insertTable("};
  const std::string s = compact_code(code);
  for (const char* pattern : kPatterns) {
    if (s.find(pattern) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool calls_upsert(std::string_view code) {
  return compact_code(code).find("BID.upsertBlock(") != std::string::npos;
}

bool should_wrap(std::string_view body, const Directives& directives, HostFlavor host) {
  if (directives.disables_upsert() || calls_upsert(body)) {
    return false;
  }
  if (directives.block_id) {
    return true;
  }
  return host == HostFlavor::Writer && looks_like_insertion(body);
}

RunnableUnit build_runnable_unit(std::string_view body, const Directives& directives, HostFlavor host) {
  RunnableUnit unit;
  const std::string trimmed(trim(body));
  std::string assembled = shim_preamble(host);

  if (should_wrap(trimmed, directives, host)) {
    unit.wrapped = true;
    unit.block_id = directives.block_id ? *directives.block_id : auto_block_id(trimmed);
    unit.anchor = directives.anchor.value_or(AnchorPlacement::Cursor);
    unit.anchor_mode = directives.anchor_mode;
    assembled += "BID.upsertBlock(\"" + unit.block_id + "\", function () {\n" + promote_trailing_call(trimmed) +
                 "\n}" + wrap_options(unit) + ");\n";
    unit.notes.push_back("wrapped body in BID.upsertBlock(" + unit.block_id + ")");
  } else {
    assembled += trimmed;
    assembled += "\n";
  }

  NormalizationResult again = normalize_unicode(assembled);
  if (again.changed) {
    for (const auto& note : again.notes) {
      unit.notes.push_back(note);
    }
  }
  unit.code = std::move(again.code);
  log::debug(std::string("exec wrapper: ") + (unit.wrapped ? "wrapped as " + unit.block_id : "unwrapped") +
             ", " + std::to_string(unit.code.size()) + " bytes");
  return unit;
}

} // namespace dmk
