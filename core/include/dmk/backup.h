#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dmk {

// Marker-keyed edit: the span `[[DMK:<marker>:START]]..[[DMK:<marker>:END]]`
// (markers included) held `prev_text` before the edit.
struct PatchOp {
  std::string marker;
  std::string prev_text;
};

struct BackupPayload {
  enum class Kind { Text, PatchOps };

  Kind kind = Kind::Text;
  std::string text;
  std::vector<PatchOp> ops;
  std::string ts;
};

nlohmann::json to_json(const BackupPayload& payload);
bool from_json(const nlohmann::json& j, BackupPayload& out, std::string& error);

// Latest backup per (document, block). Saving replaces the previous entry.
class IBackupStore {
 public:
  virtual ~IBackupStore() = default;
  virtual bool save(const std::string& doc_id, const std::string& block_id, const BackupPayload& payload,
                    std::string& error) = 0;
  virtual std::optional<BackupPayload> load(const std::string& doc_id, const std::string& block_id) = 0;
  virtual bool remove(const std::string& doc_id, const std::string& block_id) = 0;
  virtual std::vector<std::string> list_blocks(const std::string& doc_id) = 0;
};

} // namespace dmk
