#include "dmk/block_manager.h"

#include "dmk/errors.h"
#include "dmk/log.h"
#include "dmk/text_util.h"
#include "dmk/utf8.h"

#include <algorithm>

namespace dmk {

namespace {

// Puts the user's selection back where it was once the block is written.
// Positions after the edited region move by the change in document length.
class SelectionFreeze {
 public:
  SelectionFreeze(IHostDocument& doc, DiagRing& diag, bool active, size_t pivot, size_t old_end)
      : doc_(doc), diag_(diag), active_(active), pivot_(pivot), old_end_(old_end) {
    if (active_) {
      saved_ = doc_.selection();
      length_before_ = doc_.length();
    }
  }

  ~SelectionFreeze() {
    if (!active_) {
      return;
    }
    const long long delta = static_cast<long long>(doc_.length()) - static_cast<long long>(length_before_);
    const auto map = [&](size_t p) -> size_t {
      if (p <= pivot_) return p;
      if (p < old_end_) return pivot_;
      const long long moved = static_cast<long long>(p) + delta;
      return moved < 0 ? 0 : static_cast<size_t>(moved);
    };
    const TextRange restored{map(saved_.start), map(saved_.end)};
    best_effort(diag_, "restore_selection", [&] { doc_.set_selection(restored); });
  }

  SelectionFreeze(const SelectionFreeze&) = delete;
  SelectionFreeze& operator=(const SelectionFreeze&) = delete;

 private:
  IHostDocument& doc_;
  DiagRing& diag_;
  bool active_;
  size_t pivot_;
  size_t old_end_;
  TextRange saved_;
  size_t length_before_ = 0;
};

bool ends_paragraph(IHostDocument& doc, size_t pos) {
  return pos == 0 || doc.text(TextRange{pos - 1, pos}) == "\n";
}

} // namespace

const char* anchor_kind_name(AnchorKind kind) {
  return kind == AnchorKind::Bookmark ? "bookmark" : "marker_pair";
}

void BlockWriter::type_text(std::string_view text) {
  ctx_.guard().check("typeText", utf8::length(text));
  ctx_.doc().type_text(text);
}

void BlockWriter::type_paragraph() {
  ctx_.guard().check("typeParagraph");
  ctx_.doc().type_paragraph();
}

void BlockWriter::insert_table(const TableSpec& table) {
  ctx_.guard().check("insertTable", 0, table.cell_count());
  ctx_.doc().insert_table(table);
}

BlockManager::BlockManager(RunContext& ctx) : ctx_(ctx) {}

AnchorMode BlockManager::resolve_mode(const UpsertOptions& options) const {
  return options.anchor_mode.value_or(ctx_.options().anchor_mode);
}

std::optional<TextRange> BlockManager::find_marker_span(const std::string& id) {
  if (!ctx_.capabilities().find) {
    return std::nullopt;
  }
  IHostDocument& doc = ctx_.doc();
  const auto start = doc.find(start_marker(id), 0);
  if (!start) {
    return std::nullopt;
  }
  const auto end = doc.find(end_marker(id), start->end);
  if (!end) {
    return std::nullopt;
  }
  return TextRange{start->end, end->start};
}

std::optional<BlockManager::Located> BlockManager::locate(const std::string& id, AnchorMode mode) {
  IHostDocument& doc = ctx_.doc();
  if (mode != AnchorMode::MarkerOnly && ctx_.capabilities().bookmarks) {
    const std::string name = bookmark_name(id);
    const auto range = best_effort(ctx_.diag(), "bookmark_lookup", [&] { return doc.bookmark(name); });
    if (range && *range) {
      return Located{AnchorKind::Bookmark, **range};
    }
  }
  if (mode != AnchorMode::BookmarkOnly) {
    if (const auto span = find_marker_span(id)) {
      return Located{AnchorKind::MarkerPair, *span};
    }
  }
  return std::nullopt;
}

void BlockManager::hide_markers(const std::string& id) {
  if (!ctx_.capabilities().hidden_font || !ctx_.capabilities().find) {
    return;
  }
  IHostDocument& doc = ctx_.doc();
  const auto start = doc.find(start_marker(id), 0);
  if (!start) {
    return;
  }
  best_effort(ctx_.diag(), "hide_marker", [&] { doc.set_hidden(*start, true); });
  if (const auto end = doc.find(end_marker(id), start->end)) {
    best_effort(ctx_.diag(), "hide_marker", [&] { doc.set_hidden(*end, true); });
  }
}

void BlockManager::reattach(const std::string& id, AnchorKind kind, TextRange content) {
  if (kind == AnchorKind::Bookmark) {
    const std::string name = bookmark_name(id);
    best_effort(ctx_.diag(), "add_bookmark", [&] { ctx_.doc().add_bookmark(name, content); });
    return;
  }
  hide_markers(id);
}

BlockManager::Located BlockManager::create_anchor(const std::string& id, AnchorKind kind,
                                                  AnchorPlacement placement) {
  IHostDocument& doc = ctx_.doc();
  const size_t at = placement == AnchorPlacement::End ? doc.length() : doc.selection().start;

  // Isolate the block in its own paragraph.
  const std::string lead = ends_paragraph(doc, at) ? "" : "\n";
  const bool at_end = at >= doc.length();
  const std::string trail = at_end || doc.text(TextRange{at, at + 1}) != "\n" ? "\n" : "";

  std::string inserted = lead;
  size_t content_start = at + lead.size();
  if (kind == AnchorKind::MarkerPair) {
    inserted += start_marker(id);
    content_start += start_marker(id).size();
    inserted += end_marker(id);
  }
  inserted += trail;
  doc.replace(TextRange{at, at}, inserted);
  if (kind == AnchorKind::MarkerPair) {
    hide_markers(id);
  }
  return Located{kind, TextRange{content_start, content_start}};
}

void BlockManager::save_backup(const std::string& id, const BackupPayload& payload) {
  IBackupStore* store = ctx_.backups();
  if (!store) {
    return;
  }
  std::string error;
  if (!store->save(ctx_.doc().document_id(), id, payload, error)) {
    ctx_.diag().record("save_backup", error, id);
    log::warn("backup save failed for block " + id + ": " + error);
  }
}

UpsertResult BlockManager::upsert(std::string_view block_id, const Producer& producer,
                                  const UpsertOptions& options) {
  ctx_.guard().check("upsertBlock");
  const std::string id = block_id.empty() ? std::string("dmk_auto") : std::string(block_id);
  ctx_.note_upsert(id);

  IHostDocument& doc = ctx_.doc();
  const HostCapabilities& caps = ctx_.capabilities();
  const AnchorMode mode = resolve_mode(options);
  if (mode == AnchorMode::BookmarkOnly && !caps.bookmarks) {
    throw MacroError(ErrorKind::EnvironmentUnavailable, "bookmark_anchor_unavailable",
                     "host does not support bookmarks; bookmark_only anchors cannot be used");
  }
  const bool use_markers = mode == AnchorMode::MarkerOnly || (mode == AnchorMode::Auto && !caps.bookmarks);
  if (use_markers && !caps.find) {
    throw MacroError(ErrorKind::EnvironmentUnavailable, "marker_anchor_unavailable",
                     "host supports neither bookmarks nor text search; blocks cannot be anchored");
  }
  if (!caps.set_range) {
    throw MacroError(ErrorKind::EnvironmentUnavailable, "selection_unavailable",
                     "host cannot position the cursor");
  }

  const bool want_backup = options.backup.value_or(ctx_.options().backup) && ctx_.backups() != nullptr;
  const bool want_change_log =
      want_backup && options.change_log.value_or(ctx_.options().change_log) && id != kChangeLogBlockId;

  UpsertResult result;
  result.block_id = id;

  size_t pivot = 0;
  size_t old_end = 0;
  const auto located = locate(id, mode);
  if (located) {
    pivot = located->content.start;
    old_end = located->content.end;
  } else {
    pivot = options.anchor == AnchorPlacement::End ? doc.length() : doc.selection().start;
    old_end = pivot;
  }

  // Content written since the cursor was placed: everything between the block
  // start and the untouched tail of the document.
  const auto span_after = [&doc](size_t start, size_t tail_length) {
    const size_t len = doc.length();
    const size_t end = len >= tail_length ? len - tail_length : start;
    return TextRange{start, end < start ? start : end};
  };

  std::optional<std::string> returned;
  Located block;
  size_t tail = 0;
  {
    SelectionFreeze freeze(doc, ctx_.diag(), options.freeze_selection, pivot, old_end);

    if (located) {
      block = *located;
      result.previous_text = doc.text(block.content);
      if (want_backup) {
        save_backup(id, BackupPayload{BackupPayload::Kind::Text, result.previous_text, {}, now_iso()});
      }
      if (block.kind == AnchorKind::Bookmark) {
        const std::string name = bookmark_name(id);
        best_effort(ctx_.diag(), "remove_bookmark", [&] { doc.remove_bookmark(name); });
      }
      doc.replace(block.content, "");
      block.content.end = block.content.start;
    } else {
      result.created = true;
      if (want_backup) {
        // A fresh block rolls back to empty.
        save_backup(id, BackupPayload{BackupPayload::Kind::Text, std::string(), {}, now_iso()});
      }
      block = create_anchor(id, use_markers ? AnchorKind::MarkerPair : AnchorKind::Bookmark, options.anchor);
    }
    result.anchor = block.kind;

    tail = doc.length() - block.content.start;
    doc.set_selection(TextRange{block.content.start, block.content.start});
    BlockWriter writer(ctx_, id);
    try {
      if (producer) {
        returned = producer(writer);
      }
    } catch (...) {
      // Keep the block addressable so a retry replaces it instead of adding a second one.
      reattach(id, block.kind, span_after(block.content.start, tail));
      throw;
    }
  }

  TextRange content = span_after(block.content.start, tail);
  std::string text = doc.text(content);

  // Producers that only return text get it written for them.
  if (returned && count_non_space(text) < 2 && count_non_space(*returned) > 0) {
    try {
      ctx_.guard().check("typeText", utf8::length(*returned));
    } catch (const MacroError&) {
      reattach(id, block.kind, content);
      throw;
    }
    const bool written = best_effort(ctx_.diag(), "materialize_return", [&] { doc.replace(content, *returned); });
    if (written) {
      content.end = content.start + returned->size();
      text = *returned;
    }
  }

  reattach(id, block.kind, content);

  if (!returned) {
    size_t tables = 0;
    if (caps.tables) {
      tables = best_effort(ctx_.diag(), "count_tables", [&] { return doc.count_tables(content); }).value_or(0);
    }
    if (tables == 0 && count_non_space(text) < 5) {
      throw MacroError(ErrorKind::ContentNotProduced, "no_content",
                       "upsertBlock produced empty output for block " + id);
    }
  }

  if (want_change_log && text != result.previous_text) {
    best_effort(ctx_.diag(), "change_log", [&] { append_change_log(id, result.previous_text, text); });
  }

  result.returned = std::move(returned);
  result.text = std::move(text);
  log::debug("upsert " + id + (result.created ? " created" : " replaced") + " (" +
             anchor_kind_name(result.anchor) + ", " + std::to_string(result.text.size()) + " bytes)");
  return result;
}

void BlockManager::append_change_log(const std::string& id, const std::string& before, const std::string& after) {
  if (!ctx_.capabilities().find) {
    return;
  }
  IHostDocument& doc = ctx_.doc();
  const std::string log_id = kChangeLogBlockId;
  auto span = find_marker_span(log_id);
  if (!span) {
    const size_t at = doc.length();
    const std::string lead = ends_paragraph(doc, at) ? "" : "\n";
    doc.replace(TextRange{at, at}, lead + start_marker(log_id) + "\nChange log\n" + end_marker(log_id) + "\n");
    hide_markers(log_id);
    span = find_marker_span(log_id);
    if (!span) {
      return;
    }
  }
  const std::string entry = now_iso() + " blockId=" + id + " len " + std::to_string(utf8::length(before)) +
                            "->" + std::to_string(utf8::length(after));
  doc.replace(TextRange{span->end, span->end}, entry + "\n");
}

bool BlockManager::block_exists(std::string_view block_id) {
  return locate(std::string(block_id), AnchorMode::Auto).has_value();
}

std::optional<std::string> BlockManager::get_block_text(std::string_view block_id) {
  const auto located = locate(std::string(block_id), AnchorMode::Auto);
  if (!located) {
    return std::nullopt;
  }
  return ctx_.doc().text(located->content);
}

void BlockManager::set_block_text(std::string_view block_id, std::string_view text) {
  ctx_.guard().check("setBlockText", utf8::length(text));
  const std::string id(block_id);
  const auto located = locate(id, AnchorMode::Auto);
  if (!located) {
    throw MacroError(ErrorKind::ContentNotProduced, "block_not_found", "block not found: " + id);
  }
  IHostDocument& doc = ctx_.doc();
  if (located->kind == AnchorKind::Bookmark) {
    const std::string name = bookmark_name(id);
    best_effort(ctx_.diag(), "remove_bookmark", [&] { doc.remove_bookmark(name); });
  }
  doc.replace(located->content, text);
  reattach(id, located->kind, TextRange{located->content.start, located->content.start + text.size()});
}

bool BlockManager::has_backup(std::string_view block_id) {
  IBackupStore* store = ctx_.backups();
  return store && store->load(ctx_.doc().document_id(), std::string(block_id)).has_value();
}

void BlockManager::record_patch_backup(std::string_view block_id, std::vector<PatchOp> ops) {
  BackupPayload payload;
  payload.kind = BackupPayload::Kind::PatchOps;
  payload.ops = std::move(ops);
  payload.ts = now_iso();
  save_backup(std::string(block_id), payload);
}

void BlockManager::rollback_patch_ops(const std::string& id, const std::vector<PatchOp>& ops) {
  IHostDocument& doc = ctx_.doc();
  size_t restored = 0;
  for (const auto& op : ops) {
    const auto start = doc.find(start_marker(op.marker), 0);
    const auto end = start ? doc.find(end_marker(op.marker), start->end) : std::nullopt;
    if (!start || !end) {
      throw MacroError(ErrorKind::NoBackup, "patch_marker_not_found",
                       "rollback of block " + id + " failed: marker not found: " + op.marker);
    }
    doc.replace(TextRange{start->start, end->end}, op.prev_text);
    ++restored;
  }
  if (restored == 0) {
    throw MacroError(ErrorKind::NoBackup, "no_backup", "rollback of block " + id + " restored nothing");
  }
}

void BlockManager::rollback(std::string_view block_id) {
  ctx_.guard().check("rollbackBlock");
  const std::string id(block_id);
  std::optional<BackupPayload> payload;
  if (IBackupStore* store = ctx_.backups()) {
    payload = store->load(ctx_.doc().document_id(), id);
  }
  if (!payload) {
    throw MacroError(ErrorKind::NoBackup, "no_backup", "no previous version recorded for block " + id);
  }
  if (payload->kind == BackupPayload::Kind::PatchOps) {
    rollback_patch_ops(id, payload->ops);
  } else {
    set_block_text(id, payload->text);
  }
  log::info("rolled back block " + id);
}

size_t BlockManager::anchor_count(std::string_view block_id) {
  const std::string id(block_id);
  IHostDocument& doc = ctx_.doc();
  size_t count = 0;
  if (ctx_.capabilities().bookmarks) {
    const auto range = best_effort(ctx_.diag(), "bookmark_lookup", [&] { return doc.bookmark(bookmark_name(id)); });
    if (range && *range) {
      ++count;
    }
  }
  if (ctx_.capabilities().find) {
    const std::string marker = start_marker(id);
    size_t from = 0;
    while (const auto hit = doc.find(marker, from)) {
      ++count;
      from = hit->end;
    }
  }
  return count;
}

std::vector<std::string> marker_block_ids(std::string_view text) {
  static constexpr std::string_view kOpen = "[[DMK:";
  static constexpr std::string_view kClose = ":START]]";
  std::vector<std::string> ids;
  size_t i = text.find(kOpen);
  while (i != std::string_view::npos) {
    const size_t id_start = i + kOpen.size();
    const size_t close = text.find(kClose, id_start);
    const size_t next_open = text.find(kOpen, id_start);
    if (close == std::string_view::npos) {
      break;
    }
    if (close < next_open) {
      std::string id(text.substr(id_start, close - id_start));
      if (!id.empty() && std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(std::move(id));
      }
    }
    i = next_open;
  }
  return ids;
}

} // namespace dmk
