#pragma once

#include "dmk/host_document.h"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace dmk {

struct MemoryDocumentOptions {
  std::string id = "memory";
  HostFlavor flavor = HostFlavor::Writer;
  HostCapabilities capabilities{true, true, true, true, true};
};

// Word-processor document held in memory. Tables occupy one U+FFFC character
// each in the text; the n-th placeholder maps to tables()[n]. Bookmarks,
// hidden ranges and the selection move with edits like their host
// counterparts: text inserted exactly at a range boundary lands outside it.
class MemoryDocument final : public IHostDocument {
 public:
  static constexpr std::string_view kTablePlaceholder = "\xEF\xBF\xBC";

  explicit MemoryDocument(std::string text = {}, MemoryDocumentOptions options = {});

  // Rebuilds a saved document whose raw text still carries one table
  // placeholder per entry of `tables`.
  static std::unique_ptr<MemoryDocument> restore(std::string raw_text, std::vector<TableSpec> tables,
                                                 MemoryDocumentOptions options, std::string& error);

  std::string document_id() const override { return options_.id; }
  HostFlavor flavor() const override { return options_.flavor; }
  const HostCapabilities& capabilities() const { return options_.capabilities; }

  size_t length() const override { return text_.size(); }
  std::string text(TextRange range) const override;
  void replace(TextRange range, std::string_view text) override;

  TextRange selection() const override { return selection_; }
  void set_selection(TextRange range) override;
  void type_text(std::string_view text) override;
  void type_paragraph() override;
  void insert_table(const TableSpec& table) override;
  size_t count_tables(TextRange range) const override;

  std::optional<TextRange> find(std::string_view needle, size_t from = 0) const override;

  std::optional<TextRange> bookmark(std::string_view name) const override;
  void add_bookmark(std::string_view name, TextRange range) override;
  void remove_bookmark(std::string_view name) override;

  void set_hidden(TextRange range, bool hidden) override;

  // Raw text including hidden markers and table placeholders.
  const std::string& raw_text() const { return text_; }
  // Text as displayed: hidden ranges removed, tables rendered row by row.
  std::string visible_text() const;
  const std::vector<TableSpec>& tables() const { return tables_; }
  std::vector<std::string> bookmark_names() const;
  const std::vector<TextRange>& hidden_ranges() const { return hidden_; }
  size_t occurrences(std::string_view needle) const;
  bool is_hidden(size_t pos) const;

  // Makes the named operation ("replace", "set_hidden", "add_bookmark", ...)
  // throw HostApiError, to simulate flaky host builds.
  void fail_on(const std::string& op) { failing_.insert(op); }

 private:
  void check(std::string_view op, bool supported) const;
  TextRange clamp(TextRange range) const;
  size_t table_index_at(size_t pos) const;
  // Raw edit: swaps [range) for `text` and moves every tracked range.
  void splice(TextRange range, std::string_view text);

  MemoryDocumentOptions options_;
  std::string text_;
  TextRange selection_;
  std::map<std::string, TextRange, std::less<>> bookmarks_;
  std::vector<TextRange> hidden_;
  std::vector<TableSpec> tables_;
  std::set<std::string, std::less<>> failing_;
};

} // namespace dmk
