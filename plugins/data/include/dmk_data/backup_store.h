#pragma once

#include "dmk/backup.h"
#include "dmk_data/database.h"

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace dmk::data {

// Keeps the latest backup per (document, block) in memory. With a snapshot
// path every save/remove rewrites the JSON snapshot, and the constructor
// loads an existing one.
class MemoryBackupStore final : public IBackupStore {
 public:
  MemoryBackupStore() = default;
  explicit MemoryBackupStore(std::filesystem::path snapshot_path);

  bool save(const std::string& doc_id, const std::string& block_id, const BackupPayload& payload,
            std::string& error) override;
  std::optional<BackupPayload> load(const std::string& doc_id, const std::string& block_id) override;
  bool remove(const std::string& doc_id, const std::string& block_id) override;
  std::vector<std::string> list_blocks(const std::string& doc_id) override;

  size_t size() const { return entries_.size(); }
  bool flush(std::string& error) const;

 private:
  bool load_snapshot();

  std::filesystem::path snapshot_path_;
  std::map<std::pair<std::string, std::string>, BackupPayload> entries_;
};

// Backups in the `block_backups` table; the payload column holds the JSON form.
class SqliteBackupStore final : public IBackupStore {
 public:
  bool open(const std::string& path, std::string& error);

  bool save(const std::string& doc_id, const std::string& block_id, const BackupPayload& payload,
            std::string& error) override;
  std::optional<BackupPayload> load(const std::string& doc_id, const std::string& block_id) override;
  bool remove(const std::string& doc_id, const std::string& block_id) override;
  std::vector<std::string> list_blocks(const std::string& doc_id) override;

 private:
  SqliteDatabase db_;
};

// kind: "memory" (path, when set, is a JSON snapshot) or "sqlite".
std::unique_ptr<IBackupStore> make_backup_store(const std::string& kind, const std::string& path,
                                                std::string& error);

} // namespace dmk::data
