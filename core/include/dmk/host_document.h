#pragma once

#include "dmk/diagnostics.h"
#include "dmk/errors.h"
#include "dmk/host_flavor.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace dmk {

// Half-open byte range into the document text.
struct TextRange {
  size_t start = 0;
  size_t end = 0;

  size_t length() const { return end > start ? end - start : 0; }
  bool empty() const { return end <= start; }
};

struct TableSpec {
  size_t rows = 0;
  size_t cols = 0;
  // Row-major; missing cells are empty.
  std::vector<std::vector<std::string>> cells;

  size_t cell_count() const { return rows * cols; }
};

// What the connected host build supports. Probed once per session.
struct HostCapabilities {
  bool bookmarks = false;
  bool set_range = false;
  bool find = false;
  bool hidden_font = false;
  bool tables = false;
};

// The slice of the host document object model the engine relies on. Calls the
// host build does not support throw HostApiError.
class IHostDocument {
 public:
  virtual ~IHostDocument() = default;

  virtual std::string document_id() const = 0;
  virtual HostFlavor flavor() const = 0;

  virtual size_t length() const = 0;
  virtual std::string text(TextRange range) const = 0;
  virtual void replace(TextRange range, std::string_view text) = 0;

  virtual TextRange selection() const = 0;
  virtual void set_selection(TextRange range) = 0;
  // Insert at the selection and collapse it after the inserted content.
  virtual void type_text(std::string_view text) = 0;
  virtual void type_paragraph() = 0;
  virtual void insert_table(const TableSpec& table) = 0;
  virtual size_t count_tables(TextRange range) const = 0;

  virtual std::optional<TextRange> find(std::string_view needle, size_t from = 0) const = 0;

  virtual std::optional<TextRange> bookmark(std::string_view name) const = 0;
  virtual void add_bookmark(std::string_view name, TextRange range) = 0;
  virtual void remove_bookmark(std::string_view name) = 0;

  virtual void set_hidden(TextRange range, bool hidden) = 0;
};

HostCapabilities probe_capabilities(IHostDocument& doc);

// Runs `fn`; a HostApiError is recorded under `tag` instead of propagating.
// Returns the value (or true for void calls) on success, nullopt / false on a
// recorded failure. Every other exception propagates.
template <typename Fn>
auto best_effort(DiagRing& diag, std::string_view tag, Fn&& fn) {
  using R = decltype(fn());
  if constexpr (std::is_void_v<R>) {
    try {
      fn();
      return true;
    } catch (const HostApiError& e) {
      diag.record(tag, e.what());
      return false;
    }
  } else {
    try {
      return std::optional<R>(fn());
    } catch (const HostApiError& e) {
      diag.record(tag, e.what());
      return std::optional<R>();
    }
  }
}

} // namespace dmk
