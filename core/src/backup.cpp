#include "dmk/backup.h"

namespace dmk {

namespace {

// Absent keys keep `out`; a present key must hold a string.
bool read_string(const nlohmann::json& j, const char* key, std::string& out) {
  const auto it = j.find(key);
  if (it == j.end()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

} // namespace

nlohmann::json to_json(const BackupPayload& payload) {
  nlohmann::json j;
  if (payload.kind == BackupPayload::Kind::PatchOps) {
    j["kind"] = "patch_ops";
    j["ops"] = nlohmann::json::array();
    for (const auto& op : payload.ops) {
      j["ops"].push_back({{"marker", op.marker}, {"prevText", op.prev_text}});
    }
  } else {
    j["kind"] = "text";
    j["text"] = payload.text;
  }
  j["ts"] = payload.ts;
  return j;
}

bool from_json(const nlohmann::json& j, BackupPayload& out, std::string& error) {
  if (!j.is_object()) {
    error = "backup payload is not an object";
    return false;
  }
  BackupPayload p;
  std::string kind = "text";
  if (!read_string(j, "kind", kind)) {
    error = "backup kind is not a string";
    return false;
  }
  if (!read_string(j, "ts", p.ts)) {
    error = "backup timestamp is not a string";
    return false;
  }
  if (kind == "patch_ops") {
    p.kind = BackupPayload::Kind::PatchOps;
    if (!j.contains("ops") || !j["ops"].is_array()) {
      error = "patch_ops payload without ops";
      return false;
    }
    for (const auto& op : j["ops"]) {
      if (!op.is_object() || !op.contains("marker") || !op["marker"].is_string()) {
        error = "patch op without marker";
        return false;
      }
      PatchOp patch{op["marker"].get<std::string>(), std::string()};
      if (!read_string(op, "prevText", patch.prev_text)) {
        error = "patch op prevText is not a string";
        return false;
      }
      p.ops.push_back(std::move(patch));
    }
  } else if (kind == "text") {
    if (!j.contains("text") || !j["text"].is_string()) {
      error = "text payload without text";
      return false;
    }
    p.text = j["text"].get<std::string>();
  } else {
    error = "unknown backup kind: " + kind;
    return false;
  }
  out = std::move(p);
  return true;
}

} // namespace dmk
