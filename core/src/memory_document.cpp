#include "dmk/memory_document.h"

#include <algorithm>

namespace dmk {

namespace {

// New position of a range start after [s, e) became `n` bytes.
size_t shift_start(size_t p, size_t s, size_t e, size_t n) {
  if (p < s) return p;
  if (e == s) return p + n;
  if (p >= e) return p - (e - s) + n;
  return s;
}

size_t shift_end(size_t p, size_t s, size_t e, size_t n) {
  if (p <= s) return p;
  if (p >= e) return p - (e - s) + n;
  return s + n;
}

void shift(TextRange& r, size_t s, size_t e, size_t n) {
  r.start = shift_start(r.start, s, e, n);
  r.end = shift_end(r.end, s, e, n);
  if (r.end < r.start) {
    r.end = r.start;
  }
}

std::string strip_placeholders(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text.compare(i, MemoryDocument::kTablePlaceholder.size(), MemoryDocument::kTablePlaceholder) == 0) {
      i += MemoryDocument::kTablePlaceholder.size();
      continue;
    }
    out.push_back(text[i]);
    ++i;
  }
  return out;
}

} // namespace

MemoryDocument::MemoryDocument(std::string text, MemoryDocumentOptions options)
    : options_(std::move(options)), text_(strip_placeholders(text)) {
  selection_ = TextRange{text_.size(), text_.size()};
}

std::unique_ptr<MemoryDocument> MemoryDocument::restore(std::string raw_text, std::vector<TableSpec> tables,
                                                       MemoryDocumentOptions options, std::string& error) {
  size_t placeholders = 0;
  for (size_t i = raw_text.find(kTablePlaceholder); i != std::string::npos;
       i = raw_text.find(kTablePlaceholder, i + kTablePlaceholder.size())) {
    ++placeholders;
  }
  if (placeholders != tables.size()) {
    error = "document has " + std::to_string(placeholders) + " table placeholder(s) but " +
            std::to_string(tables.size()) + " table(s)";
    return nullptr;
  }
  auto doc = std::make_unique<MemoryDocument>(std::string(), std::move(options));
  doc->text_ = std::move(raw_text);
  doc->tables_ = std::move(tables);
  doc->selection_ = TextRange{doc->text_.size(), doc->text_.size()};
  return doc;
}

void MemoryDocument::check(std::string_view op, bool supported) const {
  if (!supported) {
    throw HostApiError(std::string(op) + " is not supported by this host");
  }
  if (failing_.find(op) != failing_.end()) {
    throw HostApiError(std::string(op) + " failed");
  }
}

TextRange MemoryDocument::clamp(TextRange range) const {
  range.start = std::min(range.start, text_.size());
  range.end = std::min(std::max(range.end, range.start), text_.size());
  return range;
}

size_t MemoryDocument::table_index_at(size_t pos) const {
  size_t count = 0;
  size_t i = text_.find(kTablePlaceholder);
  while (i != std::string::npos && i < pos) {
    ++count;
    i = text_.find(kTablePlaceholder, i + kTablePlaceholder.size());
  }
  return count;
}

void MemoryDocument::splice(TextRange range, std::string_view text) {
  const size_t s = range.start;
  const size_t e = range.end;
  const size_t n = text.size();
  text_.replace(s, e - s, text);
  shift(selection_, s, e, n);
  for (auto& [name, r] : bookmarks_) {
    shift(r, s, e, n);
  }
  for (auto& r : hidden_) {
    shift(r, s, e, n);
  }
  hidden_.erase(std::remove_if(hidden_.begin(), hidden_.end(), [](const TextRange& r) { return r.empty(); }),
                hidden_.end());
}

std::string MemoryDocument::text(TextRange range) const {
  check("text", true);
  const TextRange r = clamp(range);
  return text_.substr(r.start, r.length());
}

void MemoryDocument::replace(TextRange range, std::string_view text) {
  check("replace", true);
  if (range.start > text_.size()) {
    throw HostApiError("range start out of bounds");
  }
  const TextRange r = clamp(range);
  const size_t first = table_index_at(r.start);
  const size_t removed = count_tables(r);
  tables_.erase(tables_.begin() + static_cast<std::ptrdiff_t>(first),
                tables_.begin() + static_cast<std::ptrdiff_t>(first + removed));
  splice(r, strip_placeholders(text));
}

void MemoryDocument::set_selection(TextRange range) {
  check("set_selection", options_.capabilities.set_range);
  selection_ = clamp(range);
}

void MemoryDocument::type_text(std::string_view text) {
  check("type_text", true);
  const std::string clean = strip_placeholders(text);
  const size_t start = selection_.start;
  replace(selection_, clean);
  selection_ = TextRange{start + clean.size(), start + clean.size()};
}

void MemoryDocument::type_paragraph() {
  check("type_paragraph", true);
  type_text("\n");
}

void MemoryDocument::insert_table(const TableSpec& table) {
  check("insert_table", options_.capabilities.tables);
  if (table.rows == 0 || table.cols == 0) {
    throw HostApiError("table needs at least one row and one column");
  }
  replace(selection_, "");
  const size_t at = selection_.start;
  TableSpec stored = table;
  stored.cells.resize(table.rows);
  for (auto& row : stored.cells) {
    row.resize(table.cols);
  }
  tables_.insert(tables_.begin() + static_cast<std::ptrdiff_t>(table_index_at(at)), std::move(stored));
  splice(TextRange{at, at}, kTablePlaceholder);
  selection_ = TextRange{at + kTablePlaceholder.size(), at + kTablePlaceholder.size()};
}

size_t MemoryDocument::count_tables(TextRange range) const {
  check("count_tables", options_.capabilities.tables);
  const TextRange r = clamp(range);
  size_t count = 0;
  size_t i = text_.find(kTablePlaceholder, r.start);
  while (i != std::string::npos && i + kTablePlaceholder.size() <= r.end) {
    ++count;
    i = text_.find(kTablePlaceholder, i + kTablePlaceholder.size());
  }
  return count;
}

std::optional<TextRange> MemoryDocument::find(std::string_view needle, size_t from) const {
  check("find", options_.capabilities.find);
  if (needle.empty() || from > text_.size()) {
    return std::nullopt;
  }
  const size_t i = text_.find(needle, from);
  if (i == std::string::npos) {
    return std::nullopt;
  }
  return TextRange{i, i + needle.size()};
}

std::optional<TextRange> MemoryDocument::bookmark(std::string_view name) const {
  check("bookmark", options_.capabilities.bookmarks);
  const auto it = bookmarks_.find(name);
  if (it == bookmarks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryDocument::add_bookmark(std::string_view name, TextRange range) {
  check("add_bookmark", options_.capabilities.bookmarks);
  bookmarks_[std::string(name)] = clamp(range);
}

void MemoryDocument::remove_bookmark(std::string_view name) {
  check("remove_bookmark", options_.capabilities.bookmarks);
  const auto it = bookmarks_.find(name);
  if (it != bookmarks_.end()) {
    bookmarks_.erase(it);
  }
}

void MemoryDocument::set_hidden(TextRange range, bool hidden) {
  check("set_hidden", options_.capabilities.hidden_font);
  const TextRange r = clamp(range);
  if (r.empty()) {
    return;
  }
  hidden_.erase(std::remove_if(hidden_.begin(), hidden_.end(),
                               [&](const TextRange& h) { return h.start >= r.start && h.end <= r.end; }),
                hidden_.end());
  if (hidden) {
    hidden_.push_back(r);
  }
}

bool MemoryDocument::is_hidden(size_t pos) const {
  return std::any_of(hidden_.begin(), hidden_.end(),
                     [&](const TextRange& h) { return pos >= h.start && pos < h.end; });
}

std::string MemoryDocument::visible_text() const {
  std::string out;
  size_t table = 0;
  size_t i = 0;
  while (i < text_.size()) {
    if (text_.compare(i, kTablePlaceholder.size(), kTablePlaceholder) == 0) {
      const TableSpec& t = tables_[table++];
      if (is_hidden(i)) {
        i += kTablePlaceholder.size();
        continue;
      }
      for (size_t r = 0; r < t.rows; ++r) {
        for (size_t c = 0; c < t.cols; ++c) {
          if (c > 0) out += " | ";
          out += t.cells[r][c];
        }
        out.push_back('\n');
      }
      i += kTablePlaceholder.size();
      continue;
    }
    if (!is_hidden(i)) {
      out.push_back(text_[i]);
    }
    ++i;
  }
  return out;
}

std::vector<std::string> MemoryDocument::bookmark_names() const {
  std::vector<std::string> names;
  for (const auto& [name, r] : bookmarks_) {
    names.push_back(name);
  }
  return names;
}

size_t MemoryDocument::occurrences(std::string_view needle) const {
  if (needle.empty()) {
    return 0;
  }
  size_t count = 0;
  size_t i = text_.find(needle);
  while (i != std::string::npos) {
    ++count;
    i = text_.find(needle, i + needle.size());
  }
  return count;
}

} // namespace dmk
