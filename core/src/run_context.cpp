#include "dmk/run_context.h"

#include <algorithm>

namespace dmk {

RunContext::RunContext(IHostDocument& doc, const HostCapabilities& caps, GuardLimits limits,
                       IBackupStore* backups, const CancelToken* cancel, Guard::ClockFn clock)
    : doc_(doc), caps_(caps), guard_(limits, cancel, std::move(clock)), backups_(backups) {}

void RunContext::note_upsert(const std::string& block_id) {
  if (std::find(upserted_.begin(), upserted_.end(), block_id) == upserted_.end()) {
    upserted_.push_back(block_id);
  }
}

} // namespace dmk
