#include "dmk/block_manager.h"
#include "dmk/errors.h"
#include "dmk/guard.h"
#include "dmk/log.h"
#include "dmk/memory_document.h"
#include "dmk/run_context.h"
#include "dmk_data/backup_store.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

namespace {

const dmk::HostCapabilities kFullCaps{true, true, true, true, true};

dmk::Producer writes(const std::string& text) {
  return [text](dmk::BlockWriter& w) -> std::optional<std::string> {
    w.type_text(text);
    return std::nullopt;
  };
}

// Runs `fn` and returns the MacroError code it raised, or "" when it did not throw.
template <typename Fn>
std::string error_code(Fn&& fn, dmk::ErrorKind* kind = nullptr) {
  try {
    fn();
  } catch (const dmk::MacroError& e) {
    if (kind) {
      *kind = e.kind();
    }
    return e.code();
  }
  return std::string();
}

} // namespace

int main() {
  dmk::log::set_console(false);
  dmk::log::init("dmk_tests", std::filesystem::current_path());

  int failures = 0;

  // Test: re-running an upsert replaces the block in place.
  {
    dmk::MemoryDocument doc("Intro\n");
    dmk::data::MemoryBackupStore store;
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{}, &store);
    dmk::BlockManager blocks(ctx);

    const auto first = blocks.upsert("report1", writes("Q1 results"));
    if (!first.created || first.anchor != dmk::AnchorKind::Bookmark || first.text != "Q1 results") {
      std::cerr << "first upsert must create a bookmarked block\n";
      ++failures;
    }
    const auto second = blocks.upsert("report1", writes("Q2 results"));
    if (second.created || second.previous_text != "Q1 results" || second.text != "Q2 results") {
      std::cerr << "second upsert must replace the existing block\n";
      ++failures;
    }
    if (blocks.anchor_count("report1") != 1) {
      std::cerr << "expected exactly one anchor, got " << blocks.anchor_count("report1") << "\n";
      ++failures;
    }
    if (doc.occurrences("Q1 results") != 0 || doc.occurrences("Q2 results") != 1) {
      std::cerr << "stale block content left behind: " << doc.raw_text() << "\n";
      ++failures;
    }
    if (doc.visible_text().rfind("Intro\nQ2 results\n", 0) != 0) {
      std::cerr << "block must sit in its own paragraph after the intro: " << doc.visible_text() << "\n";
      ++failures;
    }
    if (blocks.get_block_text("report1").value_or("") != "Q2 results") {
      std::cerr << "get_block_text mismatch\n";
      ++failures;
    }

    // Change log block at the document end, under hidden markers.
    if (doc.occurrences("[[DMK:__dmk_change_log_v1:START]]") != 1 ||
        doc.occurrences("blockId=report1 len 0->10") != 1 || doc.occurrences("blockId=report1 len 10->10") != 1) {
      std::cerr << "change log entries missing: " << doc.raw_text() << "\n";
      ++failures;
    }
    if (doc.visible_text().find("[[DMK:") != std::string::npos) {
      std::cerr << "markers must be hidden\n";
      ++failures;
    }

    // Rollback restores the previous content byte for byte.
    blocks.rollback("report1");
    if (blocks.get_block_text("report1").value_or("") != "Q1 results") {
      std::cerr << "rollback did not restore Q1 results\n";
      ++failures;
    }
    if (blocks.anchor_count("report1") != 1) {
      std::cerr << "rollback must keep a single anchor\n";
      ++failures;
    }
    if (store.list_blocks("memory").size() != 1) {
      std::cerr << "backup store must hold one entry for report1\n";
      ++failures;
    }
  }

  // Test: a new block backs up to empty.
  {
    dmk::MemoryDocument doc("Intro");
    dmk::data::MemoryBackupStore store;
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{}, &store);
    dmk::BlockManager blocks(ctx);
    blocks.upsert("fresh", writes("brand new text"));
    const auto backup = store.load("memory", "fresh");
    if (!backup || backup->kind != dmk::BackupPayload::Kind::Text || !backup->text.empty()) {
      std::cerr << "first upsert must record an empty backup\n";
      ++failures;
    }
    blocks.rollback("fresh");
    if (blocks.get_block_text("fresh").value_or("x") != "") {
      std::cerr << "rolling back a fresh block empties it\n";
      ++failures;
    }
  }

  // Test: marker anchors when the host has no bookmarks.
  {
    dmk::MemoryDocumentOptions options;
    options.capabilities.bookmarks = false;
    dmk::MemoryDocument doc("", options);
    const dmk::HostCapabilities caps = dmk::probe_capabilities(doc);
    if (caps.bookmarks || !caps.find || !caps.set_range) {
      std::cerr << "capability probe mismatch\n";
      ++failures;
    }
    dmk::RunContext ctx(doc, caps, dmk::GuardLimits{});
    dmk::BlockManager blocks(ctx);
    const auto first = blocks.upsert("report1", writes("Q1 results"));
    blocks.upsert("report1", writes("Q2 results"));
    if (first.anchor != dmk::AnchorKind::MarkerPair) {
      std::cerr << "expected marker anchor without bookmarks\n";
      ++failures;
    }
    if (doc.raw_text() != "[[DMK:report1:START]]Q2 results[[DMK:report1:END]]\n") {
      std::cerr << "marker layout mismatch: " << doc.raw_text() << "\n";
      ++failures;
    }
    if (doc.visible_text() != "Q2 results\n" || blocks.anchor_count("report1") != 1) {
      std::cerr << "markers must be hidden and unique: " << doc.visible_text() << "\n";
      ++failures;
    }
    if (dmk::marker_block_ids(doc.raw_text()) != std::vector<std::string>{"report1"}) {
      std::cerr << "marker_block_ids mismatch\n";
      ++failures;
    }

    dmk::UpsertOptions bookmark_only;
    bookmark_only.anchor_mode = dmk::AnchorMode::BookmarkOnly;
    dmk::ErrorKind kind{};
    if (error_code([&] { blocks.upsert("b", writes("some text"), bookmark_only); }, &kind) !=
            "bookmark_anchor_unavailable" ||
        kind != dmk::ErrorKind::EnvironmentUnavailable) {
      std::cerr << "bookmark_only without bookmarks must be EnvironmentUnavailable\n";
      ++failures;
    }
  }

  // Test: marker_only mode on a host that has bookmarks.
  {
    dmk::MemoryDocument doc("Title\n");
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{});
    ctx.options().anchor_mode = dmk::AnchorMode::MarkerOnly;
    dmk::BlockManager blocks(ctx);
    blocks.upsert("m", writes("marker text"));
    if (!doc.bookmark_names().empty() || doc.occurrences("[[DMK:m:START]]") != 1) {
      std::cerr << "marker_only must not create bookmarks\n";
      ++failures;
    }
  }

  // Test: the guard stops writes before they happen.
  {
    dmk::MemoryDocument doc("Intro\n");
    dmk::GuardLimits limits;
    limits.max_ops = 1;
    dmk::RunContext ctx(doc, kFullCaps, limits);
    dmk::BlockManager blocks(ctx);
    dmk::ErrorKind kind{};
    const std::string code = error_code([&] { blocks.upsert("g", writes("never written")); }, &kind);
    if (code != "max_ops" || kind != dmk::ErrorKind::GuardExceeded) {
      std::cerr << "expected max_ops, got '" << code << "'\n";
      ++failures;
    }
    if (doc.occurrences("never written") != 0) {
      std::cerr << "guarded write happened after the budget ran out\n";
      ++failures;
    }
    if (ctx.guard().ops_used() != 2 || ctx.guard().op_log().back() != "typeText") {
      std::cerr << "op log mismatch\n";
      ++failures;
    }
  }

  // Test: text length, table cells, deadline and cancellation.
  {
    dmk::MemoryDocument doc;
    dmk::GuardLimits limits;
    limits.max_text_len = 1;  // clamped to 100
    limits.max_table_cells = 1;  // clamped to 10
    dmk::RunContext ctx(doc, kFullCaps, limits);
    if (ctx.guard().limits().max_text_len != 100 || ctx.guard().limits().max_table_cells != 10) {
      std::cerr << "limits must be clamped\n";
      ++failures;
    }
    auto writer = dmk::BlockManager(ctx).selection_writer();
    if (error_code([&] { writer.type_text(std::string(150, 'x')); }) != "max_text_len") {
      std::cerr << "max_text_len not enforced\n";
      ++failures;
    }
    dmk::TableSpec table;
    table.rows = 4;
    table.cols = 4;
    if (error_code([&] { writer.insert_table(table); }) != "max_table_cells") {
      std::cerr << "max_table_cells not enforced\n";
      ++failures;
    }
    if (doc.length() != 0) {
      std::cerr << "rejected writes must not touch the document\n";
      ++failures;
    }

    auto now = dmk::Guard::Clock::now();
    dmk::CancelToken cancel;
    dmk::Guard guard(dmk::GuardLimits{}, &cancel, [&now] { return now; });
    guard.check("typeText");
    cancel.request();
    if (error_code([&] { guard.check("typeText"); }) != "cancelled") {
      std::cerr << "cancellation not observed\n";
      ++failures;
    }
    cancel.reset();
    now += std::chrono::milliseconds(46000);
    if (error_code([&] { guard.poll(); }) != "deadline") {
      std::cerr << "deadline not enforced\n";
      ++failures;
    }
  }

  // Test: returned text is materialized, empty output is an error.
  {
    dmk::MemoryDocument doc("Intro\n");
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{});
    dmk::BlockManager blocks(ctx);
    const auto result = blocks.upsert("ret", [](dmk::BlockWriter&) -> std::optional<std::string> {
      return std::string("Returned text");
    });
    if (result.text != "Returned text" || blocks.get_block_text("ret").value_or("") != "Returned text") {
      std::cerr << "returned text not materialized\n";
      ++failures;
    }

    // Returned text is held to the same length limit as typed text.
    const size_t before = doc.length();
    dmk::ErrorKind big_kind{};
    const std::string big_code = error_code(
        [&] {
          blocks.upsert("big", [](dmk::BlockWriter&) -> std::optional<std::string> {
            return std::string(50000, 'x');
          });
        },
        &big_kind);
    if (big_code != "max_text_len" || big_kind != dmk::ErrorKind::GuardExceeded ||
        doc.length() > before + 200) {
      std::cerr << "oversized returned text must be rejected: '" << big_code << "' length " << doc.length()
                << "\n";
      ++failures;
    }

    dmk::ErrorKind kind{};
    if (error_code([&] { blocks.upsert("empty", writes("ab")); }, &kind) != "no_content" ||
        kind != dmk::ErrorKind::ContentNotProduced) {
      std::cerr << "near-empty block must raise ContentNotProduced\n";
      ++failures;
    }

    const auto tabled = blocks.upsert("tbl", [](dmk::BlockWriter& w) -> std::optional<std::string> {
      dmk::TableSpec t;
      t.rows = 2;
      t.cols = 2;
      t.cells = {{"a", "b"}, {"c", "d"}};
      w.insert_table(t);
      return std::nullopt;
    });
    if (doc.tables().size() != 1 || doc.visible_text().find("a | b\nc | d\n") == std::string::npos) {
      std::cerr << "a table alone is produced content\n";
      ++failures;
    }
    (void)tabled;

    if (error_code([&] { blocks.set_block_text("ghost", "x"); }) != "block_not_found") {
      std::cerr << "set_block_text on an unknown id must raise block_not_found\n";
      ++failures;
    }
  }

  // Test: the user's selection survives an upsert at the document end.
  {
    dmk::MemoryDocument doc("Hello world");
    doc.set_selection(dmk::TextRange{0, 5});
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{});
    dmk::BlockManager blocks(ctx);
    dmk::UpsertOptions options;
    options.anchor = dmk::AnchorPlacement::End;
    blocks.upsert("tail", writes("Appended block"), options);
    if (doc.selection().start != 0 || doc.selection().end != 5) {
      std::cerr << "selection moved by upsert\n";
      ++failures;
    }
    if (doc.visible_text() != "Hello world\nAppended block\n") {
      std::cerr << "end anchor layout mismatch: " << doc.visible_text() << "\n";
      ++failures;
    }
  }

  // Test: rollback errors and patch-op backups.
  {
    dmk::MemoryDocument doc("[[DMK:p1:START]]new text[[DMK:p1:END]]");
    dmk::data::MemoryBackupStore store;
    dmk::RunContext ctx(doc, kFullCaps, dmk::GuardLimits{}, &store);
    dmk::BlockManager blocks(ctx);

    dmk::ErrorKind kind{};
    if (error_code([&] { blocks.rollback("nothing"); }, &kind) != "no_backup" || kind != dmk::ErrorKind::NoBackup) {
      std::cerr << "rollback without backup must raise NoBackup\n";
      ++failures;
    }

    blocks.record_patch_backup("patched", {dmk::PatchOp{"p1", "old text"}});
    if (!blocks.has_backup("patched")) {
      std::cerr << "patch backup not stored\n";
      ++failures;
    }
    blocks.rollback("patched");
    if (doc.raw_text() != "old text") {
      std::cerr << "patch rollback mismatch: " << doc.raw_text() << "\n";
      ++failures;
    }
    if (error_code([&] { blocks.rollback("patched"); }) != "patch_marker_not_found") {
      std::cerr << "patch rollback without markers must fail\n";
      ++failures;
    }
  }

  // Test: a host failure while hiding markers is recorded, not fatal.
  {
    dmk::MemoryDocumentOptions options;
    options.capabilities.bookmarks = false;
    dmk::MemoryDocument doc("", options);
    doc.fail_on("set_hidden");
    dmk::HostCapabilities caps = kFullCaps;
    caps.bookmarks = false;
    dmk::RunContext ctx(doc, caps, dmk::GuardLimits{});
    dmk::BlockManager blocks(ctx);
    blocks.upsert("h", writes("still written"));
    if (doc.occurrences("still written") != 1 || ctx.diag().entries().empty()) {
      std::cerr << "set_hidden failure must be recorded and skipped\n";
      ++failures;
    }
  }

  dmk::log::shutdown();
  return failures == 0 ? 0 : 1;
}
