#include "dmk_data/backup_store.h"

#include "dmk/log.h"
#include "dmk_data/serialization.h"

#include <chrono>

namespace dmk::data {

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS block_backups ("
    "doc_id TEXT NOT NULL, "
    "block_id TEXT NOT NULL, "
    "payload TEXT NOT NULL, "
    "updated_at INTEGER NOT NULL, "
    "PRIMARY KEY(doc_id, block_id))";

int64_t now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace

MemoryBackupStore::MemoryBackupStore(std::filesystem::path snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {
  std::error_code ec;
  if (!snapshot_path_.empty() && std::filesystem::exists(snapshot_path_, ec)) {
    load_snapshot();
  }
}

bool MemoryBackupStore::load_snapshot() {
  nlohmann::json root;
  if (!load_json_file(snapshot_path_, root) || !root.is_object() || !root.contains("backups") ||
      !root["backups"].is_array()) {
    log::warn("backup snapshot unreadable, starting empty: " + snapshot_path_.string());
    return false;
  }
  for (const auto& entry : root["backups"]) {
    if (!entry.is_object()) continue;
    const auto doc_it = entry.find("doc_id");
    const auto block_it = entry.find("block_id");
    const std::string doc_id = doc_it != entry.end() && doc_it->is_string() ? doc_it->get<std::string>() : "";
    const std::string block_id =
        block_it != entry.end() && block_it->is_string() ? block_it->get<std::string>() : "";
    BackupPayload payload;
    std::string error;
    if (doc_id.empty() || block_id.empty() || !entry.contains("payload") ||
        !from_json(entry["payload"], payload, error)) {
      log::warn("backup snapshot: skipped entry " + doc_id + "/" + block_id + (error.empty() ? "" : ": " + error));
      continue;
    }
    entries_[{doc_id, block_id}] = std::move(payload);
  }
  log::debug("backup snapshot loaded: " + std::to_string(entries_.size()) + " entr(ies)");
  return true;
}

bool MemoryBackupStore::flush(std::string& error) const {
  if (snapshot_path_.empty()) {
    return true;
  }
  nlohmann::json root;
  root["backups"] = nlohmann::json::array();
  for (const auto& kv : entries_) {
    root["backups"].push_back(
        {{"doc_id", kv.first.first}, {"block_id", kv.first.second}, {"payload", to_json(kv.second)}});
  }
  if (!save_json_file(snapshot_path_, root)) {
    error = "failed to write backup snapshot: " + snapshot_path_.string();
    return false;
  }
  return true;
}

bool MemoryBackupStore::save(const std::string& doc_id, const std::string& block_id, const BackupPayload& payload,
                             std::string& error) {
  entries_[{doc_id, block_id}] = payload;
  return flush(error);
}

std::optional<BackupPayload> MemoryBackupStore::load(const std::string& doc_id, const std::string& block_id) {
  auto it = entries_.find({doc_id, block_id});
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryBackupStore::remove(const std::string& doc_id, const std::string& block_id) {
  if (entries_.erase({doc_id, block_id}) == 0) {
    return false;
  }
  std::string error;
  if (!flush(error)) {
    log::warn(error);
  }
  return true;
}

std::vector<std::string> MemoryBackupStore::list_blocks(const std::string& doc_id) {
  std::vector<std::string> out;
  for (const auto& kv : entries_) {
    if (kv.first.first == doc_id) {
      out.push_back(kv.first.second);
    }
  }
  return out;
}

bool SqliteBackupStore::open(const std::string& path, std::string& error) {
  if (!db_.open(path)) {
    error = "backup database: " + db_.last_error();
    return false;
  }
  if (!db_.exec(kSchema)) {
    error = "backup schema: " + db_.last_error();
    db_.close();
    return false;
  }
  log::info("backup store: sqlite " + path);
  return true;
}

bool SqliteBackupStore::save(const std::string& doc_id, const std::string& block_id, const BackupPayload& payload,
                             std::string& error) {
  SqliteStatement stmt(db_,
                       "INSERT INTO block_backups(doc_id, block_id, payload, updated_at) VALUES(?1, ?2, ?3, ?4) "
                       "ON CONFLICT(doc_id, block_id) DO UPDATE SET payload = excluded.payload, "
                       "updated_at = excluded.updated_at");
  if (!stmt.ok() || !stmt.bind_text(1, doc_id) || !stmt.bind_text(2, block_id) ||
      !stmt.bind_text(3, to_json(payload).dump()) || !stmt.bind_int64(4, now_ms()) || !stmt.run()) {
    error = "backup save failed: " + db_.last_error();
    return false;
  }
  return true;
}

std::optional<BackupPayload> SqliteBackupStore::load(const std::string& doc_id, const std::string& block_id) {
  SqliteStatement stmt(db_, "SELECT payload FROM block_backups WHERE doc_id = ?1 AND block_id = ?2");
  if (!stmt.ok() || !stmt.bind_text(1, doc_id) || !stmt.bind_text(2, block_id) || !stmt.step()) {
    return std::nullopt;
  }
  const nlohmann::json j = nlohmann::json::parse(stmt.column_text(0), nullptr, false);
  BackupPayload payload;
  std::string error;
  if (j.is_discarded() || !from_json(j, payload, error)) {
    log::warn("backup row unreadable: " + doc_id + "/" + block_id + (error.empty() ? "" : ": " + error));
    return std::nullopt;
  }
  return payload;
}

bool SqliteBackupStore::remove(const std::string& doc_id, const std::string& block_id) {
  SqliteStatement stmt(db_, "DELETE FROM block_backups WHERE doc_id = ?1 AND block_id = ?2");
  return stmt.ok() && stmt.bind_text(1, doc_id) && stmt.bind_text(2, block_id) && stmt.run();
}

std::vector<std::string> SqliteBackupStore::list_blocks(const std::string& doc_id) {
  std::vector<std::string> out;
  SqliteStatement stmt(db_, "SELECT block_id FROM block_backups WHERE doc_id = ?1 ORDER BY block_id");
  if (!stmt.ok() || !stmt.bind_text(1, doc_id)) {
    return out;
  }
  while (stmt.step()) {
    out.push_back(stmt.column_text(0));
  }
  return out;
}

std::unique_ptr<IBackupStore> make_backup_store(const std::string& kind, const std::string& path,
                                                std::string& error) {
  if (kind.empty() || kind == "memory") {
    return path.empty() ? std::make_unique<MemoryBackupStore>()
                        : std::make_unique<MemoryBackupStore>(std::filesystem::path(path));
  }
  if (kind == "sqlite") {
    auto store = std::make_unique<SqliteBackupStore>();
    if (!store->open(path.empty() ? std::string("build/dmk_backups.db") : path, error)) {
      return nullptr;
    }
    return store;
  }
  error = "unknown backup store kind: " + kind;
  return nullptr;
}

} // namespace dmk::data
