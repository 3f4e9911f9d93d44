#pragma once

#include "dmk/directives.h"
#include "dmk/host_flavor.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

// Global functions the script runtime must provide. The preamble's BID facade
// is written entirely in terms of these.
namespace natives {
constexpr const char* kUpsert = "__dmk_upsert";              // (id, fn, opts) -> value
constexpr const char* kTypeText = "__dmk_type_text";         // (text)
constexpr const char* kTypeParagraph = "__dmk_type_paragraph";
constexpr const char* kInsertTable = "__dmk_insert_table";   // (rows, cols, cells)
constexpr const char* kBlockExists = "__dmk_block_exists";   // (id) -> bool
constexpr const char* kGetBlockText = "__dmk_get_block_text";  // (id) -> string|null
constexpr const char* kSetBlockText = "__dmk_set_block_text";  // (id, text)
constexpr const char* kRollback = "__dmk_rollback";          // (id)
constexpr const char* kAlert = "__dmk_alert";                // (message)
constexpr const char* kLog = "__dmk_log";                    // (message)
} // namespace natives

struct RunnableUnit {
  std::string code;
  bool wrapped = false;
  std::string block_id;  // set when wrapped
  AnchorPlacement anchor = AnchorPlacement::Cursor;
  std::optional<AnchorMode> anchor_mode;
  std::vector<std::string> notes;
};

// Host-specific shims plus the BID facade. ES5 only.
std::string shim_preamble(HostFlavor host);

// Conservative match on code regions for calls that put content into the
// document (Range.Text assignment, Tables.Add, TypeText, ...).
bool looks_like_insertion(std::string_view code);

// Body already calls BID.upsertBlock itself.
bool calls_upsert(std::string_view code);

// Wrap decision: never when the body upserts itself or a no_upsert/direct
// directive is present; otherwise a blockId directive always wraps and, on
// Writer only, an insertion-looking body wraps too.
bool should_wrap(std::string_view body, const Directives& directives, HostFlavor host);

// preamble + body, wrapped in BID.upsertBlock(...) when should_wrap() says so.
// Unicode normalization is re-applied to the assembled text.
RunnableUnit build_runnable_unit(std::string_view body, const Directives& directives, HostFlavor host);

} // namespace dmk
