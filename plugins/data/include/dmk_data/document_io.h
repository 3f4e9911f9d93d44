#pragma once

#include "dmk/memory_document.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace dmk::data {

// Snapshot layout:
//   {"id", "flavor", "text", "tables": [{rows, cols, cells}],
//    "bookmarks": {name: [start, end]}, "hidden": [[start, end]], "selection": [start, end],
//    "capabilities": {bookmarks, set_range, find, hidden_font, tables}}
// Offsets are byte offsets into `text`, which keeps one U+FFFC per table.
nlohmann::json document_to_json(const MemoryDocument& doc);
std::unique_ptr<MemoryDocument> document_from_json(const nlohmann::json& j, MemoryDocumentOptions defaults,
                                                   std::string& error);

// .json files are snapshots; anything else is read as plain text.
std::unique_ptr<MemoryDocument> load_document(const std::filesystem::path& path, MemoryDocumentOptions defaults,
                                              std::string& error);
bool save_document(const std::filesystem::path& path, const MemoryDocument& doc, std::string& error);

} // namespace dmk::data
