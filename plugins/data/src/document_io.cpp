#include "dmk_data/document_io.h"

#include "dmk/log.h"
#include "dmk_data/serialization.h"

namespace dmk::data {

namespace {

nlohmann::json range_json(TextRange r) {
  return nlohmann::json::array({r.start, r.end});
}

bool range_from(const nlohmann::json& j, TextRange& out) {
  if (!j.is_array() || j.size() != 2 || !j[0].is_number_unsigned() || !j[1].is_number_unsigned()) {
    return false;
  }
  out.start = j[0].get<size_t>();
  out.end = j[1].get<size_t>();
  return out.end >= out.start;
}

bool table_from(const nlohmann::json& j, TableSpec& out) {
  if (!j.is_object()) {
    return false;
  }
  if (!j.contains("rows") || !j["rows"].is_number_integer() || j["rows"].get<int64_t>() <= 0 ||
      !j.contains("cols") || !j["cols"].is_number_integer() || j["cols"].get<int64_t>() <= 0) {
    return false;
  }
  out.rows = j["rows"].get<size_t>();
  out.cols = j["cols"].get<size_t>();
  out.cells.assign(out.rows, std::vector<std::string>(out.cols));
  if (j.contains("cells") && j["cells"].is_array()) {
    const auto& rows = j["cells"];
    for (size_t r = 0; r < out.rows && r < rows.size(); ++r) {
      if (!rows[r].is_array()) continue;
      for (size_t c = 0; c < out.cols && c < rows[r].size(); ++c) {
        if (rows[r][c].is_string()) {
          out.cells[r][c] = rows[r][c].get<std::string>();
        }
      }
    }
  }
  return out.rows > 0 && out.cols > 0;
}

void read_flag(const nlohmann::json& j, const char* key, bool& out) {
  const auto it = j.find(key);
  if (it != j.end() && it->is_boolean()) {
    out = it->get<bool>();
  }
}

void read_capabilities(const nlohmann::json& j, HostCapabilities& caps) {
  read_flag(j, "bookmarks", caps.bookmarks);
  read_flag(j, "set_range", caps.set_range);
  read_flag(j, "find", caps.find);
  read_flag(j, "hidden_font", caps.hidden_font);
  read_flag(j, "tables", caps.tables);
}

} // namespace

nlohmann::json document_to_json(const MemoryDocument& doc) {
  nlohmann::json j;
  j["id"] = doc.document_id();
  j["flavor"] = host_flavor_name(doc.flavor());
  j["text"] = doc.raw_text();
  j["tables"] = nlohmann::json::array();
  for (const auto& t : doc.tables()) {
    j["tables"].push_back({{"rows", t.rows}, {"cols", t.cols}, {"cells", t.cells}});
  }
  j["bookmarks"] = nlohmann::json::object();
  for (const auto& name : doc.bookmark_names()) {
    if (auto r = doc.bookmark(name)) {
      j["bookmarks"][name] = range_json(*r);
    }
  }
  j["hidden"] = nlohmann::json::array();
  for (const auto& r : doc.hidden_ranges()) {
    j["hidden"].push_back(range_json(r));
  }
  j["selection"] = range_json(doc.selection());
  const HostCapabilities& caps = doc.capabilities();
  j["capabilities"] = {{"bookmarks", caps.bookmarks},
                       {"set_range", caps.set_range},
                       {"find", caps.find},
                       {"hidden_font", caps.hidden_font},
                       {"tables", caps.tables}};
  return j;
}

std::unique_ptr<MemoryDocument> document_from_json(const nlohmann::json& j, MemoryDocumentOptions defaults,
                                                   std::string& error) {
  if (!j.is_object() || !j.contains("text") || !j["text"].is_string()) {
    error = "document snapshot needs a text string";
    return nullptr;
  }
  MemoryDocumentOptions options = std::move(defaults);
  if (j.contains("id") && j["id"].is_string()) {
    options.id = j["id"].get<std::string>();
  }
  if (j.contains("flavor") && j["flavor"].is_string()) {
    const HostFlavor flavor = parse_host_flavor(j["flavor"].get<std::string>());
    if (flavor == HostFlavor::Unknown) {
      error = "unknown document flavor: " + j["flavor"].get<std::string>();
      return nullptr;
    }
    options.flavor = flavor;
  }
  if (j.contains("capabilities") && j["capabilities"].is_object()) {
    read_capabilities(j["capabilities"], options.capabilities);
  }

  std::vector<TableSpec> tables;
  if (j.contains("tables") && j["tables"].is_array()) {
    for (const auto& t : j["tables"]) {
      TableSpec spec;
      if (!table_from(t, spec)) {
        error = "table " + std::to_string(tables.size()) + " needs rows and cols";
        return nullptr;
      }
      tables.push_back(std::move(spec));
    }
  }

  const HostCapabilities caps = options.capabilities;
  auto doc = MemoryDocument::restore(j["text"].get<std::string>(), std::move(tables), std::move(options), error);
  if (!doc) {
    return nullptr;
  }

  if (j.contains("bookmarks") && j["bookmarks"].is_object()) {
    for (const auto& [name, value] : j["bookmarks"].items()) {
      TextRange r;
      if (!range_from(value, r)) {
        error = "bookmark " + name + " has an invalid range";
        return nullptr;
      }
      if (caps.bookmarks) {
        doc->add_bookmark(name, r);
      }
    }
  }
  if (j.contains("hidden") && j["hidden"].is_array()) {
    for (const auto& value : j["hidden"]) {
      TextRange r;
      if (!range_from(value, r)) {
        error = "hidden range is invalid";
        return nullptr;
      }
      if (caps.hidden_font) {
        doc->set_hidden(r, true);
      }
    }
  }
  TextRange selection;
  if (caps.set_range && j.contains("selection") && range_from(j["selection"], selection)) {
    doc->set_selection(selection);
  }
  return doc;
}

std::unique_ptr<MemoryDocument> load_document(const std::filesystem::path& path, MemoryDocumentOptions defaults,
                                              std::string& error) {
  if (path.extension() == ".json") {
    nlohmann::json j;
    if (!load_json_file(path, j)) {
      error = "cannot read document snapshot: " + path.string();
      return nullptr;
    }
    auto doc = document_from_json(j, std::move(defaults), error);
    if (!doc) {
      error = path.string() + ": " + error;
    }
    return doc;
  }
  std::string text;
  if (!read_text_file(path, text)) {
    error = "cannot read document: " + path.string();
    return nullptr;
  }
  if (defaults.id == MemoryDocumentOptions().id) {
    defaults.id = path.filename().string();
  }
  log::debug("document loaded as plain text: " + path.string());
  return std::make_unique<MemoryDocument>(std::move(text), std::move(defaults));
}

bool save_document(const std::filesystem::path& path, const MemoryDocument& doc, std::string& error) {
  if (!save_json_file(path, document_to_json(doc))) {
    error = "cannot write document snapshot: " + path.string();
    return false;
  }
  return true;
}

} // namespace dmk::data
