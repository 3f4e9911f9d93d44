#include "dmk/guard.h"

#include "dmk/errors.h"

#include <algorithm>
#include <utility>

namespace dmk {

GuardLimits GuardLimits::clamped() const {
  GuardLimits out;
  out.max_ops = std::clamp(max_ops, 1, 2000);
  out.max_text_len = std::clamp<size_t>(max_text_len, 100, 200000);
  out.max_table_cells = std::clamp<size_t>(max_table_cells, 10, 5000);
  out.deadline_ms = std::clamp(deadline_ms, 1000, 300000);
  return out;
}

CancelToken& global_cancel_token() {
  static CancelToken token;
  return token;
}

Guard::Guard(GuardLimits limits, const CancelToken* cancel, ClockFn clock)
    : limits_(limits.clamped()), cancel_(cancel), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = [] { return Clock::now(); };
  }
  started_at_ = clock_();
}

long long Guard::elapsed_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_at_).count();
}

void Guard::poll() const {
  if (elapsed_ms() > limits_.deadline_ms) {
    throw MacroError(ErrorKind::GuardExceeded, "deadline",
                     "deadline exceeded (" + std::to_string(limits_.deadline_ms) + " ms)");
  }
  if (cancel_ && cancel_->requested()) {
    throw MacroError(ErrorKind::GuardExceeded, "cancelled", "macro cancelled");
  }
}

void Guard::check(std::string_view op, size_t text_len, size_t table_cells) {
  ++ops_used_;
  if (op_log_.size() < kMaxOpLog) {
    op_log_.emplace_back(op);
  }
  if (ops_used_ > limits_.max_ops) {
    throw MacroError(ErrorKind::GuardExceeded, "max_ops",
                     "maxOps exceeded (" + std::to_string(limits_.max_ops) + ") at " + std::string(op));
  }
  poll();
  if (text_len > limits_.max_text_len) {
    throw MacroError(ErrorKind::GuardExceeded, "max_text_len",
                     "maxTextLen exceeded (" + std::to_string(text_len) + " > " +
                         std::to_string(limits_.max_text_len) + ")");
  }
  if (table_cells > limits_.max_table_cells) {
    throw MacroError(ErrorKind::GuardExceeded, "max_table_cells",
                     "maxTableCells exceeded (" + std::to_string(table_cells) + " > " +
                         std::to_string(limits_.max_table_cells) + ")");
  }
}

} // namespace dmk
