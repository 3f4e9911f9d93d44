#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dmk {

struct GuardLimits {
  int max_ops = 200;
  size_t max_text_len = 20000;
  size_t max_table_cells = 500;
  int deadline_ms = 45000;

  // Copy with every field forced into its accepted range
  // (ops 1..2000, text 100..200000, cells 10..5000, deadline 1000..300000).
  GuardLimits clamped() const;
};

// Process-wide cancel flag. Set from any thread; polled by the guard on every
// counted operation.
class CancelToken {
 public:
  void request() { cancelled_.store(true, std::memory_order_relaxed); }
  void reset() { cancelled_.store(false, std::memory_order_relaxed); }
  bool requested() const { return cancelled_.load(std::memory_order_relaxed); }

 private:
  std::atomic<bool> cancelled_{false};
};

CancelToken& global_cancel_token();

// Per-run operation budget. `check` throws MacroError(GuardExceeded) before the
// guarded side effect happens; checks run in the order ops, deadline, cancel,
// text length, table cells.
class Guard {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  static constexpr size_t kMaxOpLog = 1000;

  explicit Guard(GuardLimits limits, const CancelToken* cancel = nullptr, ClockFn clock = {});

  void check(std::string_view op, size_t text_len = 0, size_t table_cells = 0);
  // Deadline and cancellation only; nothing is counted. Used while script code
  // runs between guarded operations.
  void poll() const;

  const GuardLimits& limits() const { return limits_; }
  int ops_used() const { return ops_used_; }
  long long elapsed_ms() const;
  // Names of guarded operations in call order, capped at kMaxOpLog.
  const std::vector<std::string>& op_log() const { return op_log_; }

 private:
  GuardLimits limits_;
  const CancelToken* cancel_;
  ClockFn clock_;
  Clock::time_point started_at_;
  int ops_used_ = 0;
  std::vector<std::string> op_log_;
};

} // namespace dmk
