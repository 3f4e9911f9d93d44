#pragma once

#include "dmk/backup.h"
#include "dmk/directives.h"
#include "dmk/run_context.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

constexpr const char* kChangeLogBlockId = "__dmk_change_log_v1";

enum class AnchorKind { Bookmark, MarkerPair };

const char* anchor_kind_name(AnchorKind kind);

class BlockManager;

// Handed to producers. Every call is guarded before it touches the document
// and writes at the block cursor.
class BlockWriter {
 public:
  void type_text(std::string_view text);
  void type_paragraph();
  void insert_table(const TableSpec& table);

  const std::string& block_id() const { return block_id_; }

 private:
  friend class BlockManager;
  BlockWriter(RunContext& ctx, std::string block_id) : ctx_(ctx), block_id_(std::move(block_id)) {}

  RunContext& ctx_;
  std::string block_id_;
};

// Returns text to materialize when the producer wrote nothing itself.
using Producer = std::function<std::optional<std::string>(BlockWriter&)>;

struct UpsertOptions {
  AnchorPlacement anchor = AnchorPlacement::Cursor;
  std::optional<AnchorMode> anchor_mode;  // run default when unset
  std::optional<bool> backup;
  std::optional<bool> change_log;
  bool freeze_selection = true;
};

struct UpsertResult {
  std::string block_id;
  bool created = false;
  AnchorKind anchor = AnchorKind::Bookmark;
  std::optional<std::string> returned;
  std::string previous_text;
  std::string text;
};

// Ids of every `[[DMK:<id>:START]]` marker in `text`, in document order,
// without duplicates.
std::vector<std::string> marker_block_ids(std::string_view text);

// Named, re-locatable document regions. Re-running an upsert with the same id
// replaces the block's content in place.
class BlockManager {
 public:
  explicit BlockManager(RunContext& ctx);

  UpsertResult upsert(std::string_view block_id, const Producer& producer, const UpsertOptions& options = {});

  // Restores the latest backup; throws MacroError(NoBackup) when none exists.
  void rollback(std::string_view block_id);

  bool block_exists(std::string_view block_id);
  std::optional<std::string> get_block_text(std::string_view block_id);
  // Throws MacroError(ContentNotProduced, "block_not_found") for unknown ids.
  void set_block_text(std::string_view block_id, std::string_view text);
  bool has_backup(std::string_view block_id);
  void record_patch_backup(std::string_view block_id, std::vector<PatchOp> ops);

  // Bookmarks plus marker pairs carrying this id; 1 for a healthy block.
  size_t anchor_count(std::string_view block_id);

  // Guarded writes at the current selection, outside any block.
  BlockWriter selection_writer() { return BlockWriter(ctx_, std::string()); }

 private:
  struct Located {
    AnchorKind kind = AnchorKind::Bookmark;
    TextRange content;
  };

  std::optional<Located> locate(const std::string& id, AnchorMode mode);
  std::optional<TextRange> find_marker_span(const std::string& id);
  void hide_markers(const std::string& id);
  void reattach(const std::string& id, AnchorKind kind, TextRange content);
  Located create_anchor(const std::string& id, AnchorKind kind, AnchorPlacement placement);
  void save_backup(const std::string& id, const BackupPayload& payload);
  void append_change_log(const std::string& id, const std::string& before, const std::string& after);
  void rollback_patch_ops(const std::string& id, const std::vector<PatchOp>& ops);
  AnchorMode resolve_mode(const UpsertOptions& options) const;

  RunContext& ctx_;
};

} // namespace dmk
