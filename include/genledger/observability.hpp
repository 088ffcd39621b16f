#pragma once

// genledger/observability.hpp — Logging, structured ledger events, counters.
//
// DESIGN:
//   LedgerEvent is the canonical observable unit. Every admission, claim,
//   terminal transition, refund and reconciler correction emits one event,
//   which is:
//     - folded into SchedulerStats (atomic counters, always on),
//     - passed to the registered hook (if any),
//     - appended as one JSON line to GENLEDGER_EVENT_LOG (if set).
//   Free-form diagnostics go through log(), which writes to stderr and is
//   gated by GENLEDGER_LOG_LEVEL (debug|info|warn|error; default warn).
//
// INVARIANT: event emission never throws and never blocks on anything but the
// event-log file mutex. Sink failures are counted, not propagated.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace genledger {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------
enum class LogLevel { debug, info, warn, error };

std::string to_string(LogLevel level);
LogLevel parse_log_level(const std::string& s, LogLevel def);
void set_log_level(LogLevel level);

// [genledger][warn][reconciler] message
void log(LogLevel level, const std::string& component, const std::string& message);

// ---------------------------------------------------------------------------
// LedgerEvent
// ---------------------------------------------------------------------------
enum class EventKind {
  admitted,
  rejected,
  replayed,
  claimed,
  claim_conflict,
  cancelled_before_start,
  completed,
  failed,
  timeout,
  refund,
  refund_skipped,
  healed,
  stale_swept,
  reconcile_error,
  retried,
  cancelled,
  deleted,
  adjusted,
};

std::string to_string(EventKind kind);

struct LedgerEvent {
  EventKind   kind{EventKind::admitted};
  std::string owner;
  std::string batch_id;
  std::string task_id;
  int64_t     delta{0};            // credit movement, if any
  uint64_t    duration_ns{0};      // execution unit wall time, terminal events only
  std::string detail;              // error code or short reason; no prompt text
  uint64_t    timestamp_unix_ms{0};
};

std::string event_to_json(const LedgerEvent& ev);

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two millisecond buckets
// ---------------------------------------------------------------------------
// Bucket i covers [2^(i-1), 2^i) ms; bucket 0 is [0, 1) ms. Execution units
// routinely run for minutes, so milliseconds rather than microseconds.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ns);
  double percentile(double p) const;   // milliseconds
  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_ms() const;
  std::string to_json() const;
  void reset();

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// SchedulerStats — process-wide counters
// ---------------------------------------------------------------------------
class SchedulerStats {
 public:
  void record(const LedgerEvent& ev);
  std::string to_json() const;
  void reset();

  std::atomic<uint64_t> admissions{0};
  std::atomic<uint64_t> rejections{0};
  std::atomic<uint64_t> replays{0};
  std::atomic<uint64_t> claims{0};
  std::atomic<uint64_t> claim_conflicts{0};
  std::atomic<uint64_t> cancelled_before_start{0};
  std::atomic<uint64_t> completed{0};
  std::atomic<uint64_t> failed{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> refunds{0};
  std::atomic<uint64_t> refund_dedup_hits{0};
  std::atomic<uint64_t> heals{0};
  std::atomic<uint64_t> stale_sweeps{0};
  std::atomic<uint64_t> reconcile_errors{0};
  std::atomic<uint64_t> event_sink_failures{0};

  LatencyHistogram execution_latency;
};

SchedulerStats& global_stats();

// Stamps timestamp_unix_ms when zero, then stats → hook → JSONL sink.
void emit_event(LedgerEvent ev);

using LedgerEventHook = void (*)(const LedgerEvent&);
void set_event_hook(LedgerEventHook hook);

// Overrides GENLEDGER_EVENT_LOG. Empty string disables the file sink.
void set_event_log_path(const std::string& path);

// ---------------------------------------------------------------------------
// ScopeTimer — RAII duration capture
// ---------------------------------------------------------------------------
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  uint64_t elapsed_ns() const {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count());
  }
};

}  // namespace genledger
