#pragma once

#include "dmk/backup.h"
#include "dmk/diagnostics.h"
#include "dmk/directives.h"
#include "dmk/guard.h"
#include "dmk/host_document.h"

#include <string>
#include <vector>

namespace dmk {

struct RunOptions {
  bool backup = true;
  bool change_log = true;
  AnchorMode anchor_mode = AnchorMode::Auto;
};

// Everything one execution needs: the document, its capability set, the
// operation budget and the diagnostics ring. Nothing here outlives the run.
class RunContext {
 public:
  RunContext(IHostDocument& doc, const HostCapabilities& caps, GuardLimits limits,
             IBackupStore* backups = nullptr, const CancelToken* cancel = &global_cancel_token(),
             Guard::ClockFn clock = {});

  IHostDocument& doc() { return doc_; }
  const HostCapabilities& capabilities() const { return caps_; }
  Guard& guard() { return guard_; }
  DiagRing& diag() { return diag_; }
  IBackupStore* backups() { return backups_; }
  RunOptions& options() { return options_; }
  const RunOptions& options() const { return options_; }

  // Block ids passed to upsert during this run, in call order.
  void note_upsert(const std::string& block_id);
  const std::vector<std::string>& upserted_blocks() const { return upserted_; }

 private:
  IHostDocument& doc_;
  HostCapabilities caps_;
  Guard guard_;
  DiagRing diag_;
  IBackupStore* backups_;
  RunOptions options_;
  std::vector<std::string> upserted_;
};

} // namespace dmk
