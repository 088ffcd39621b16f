#include "genledger/observability.hpp"

#include "genledger/jsonlite.hpp"
#include "genledger/types.hpp"

#include <bit>
#include <cstdio>
#include <cstdlib>
#include <iostream>

namespace genledger {

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

namespace {

LogLevel level_from_env() {
  const char* e = std::getenv("GENLEDGER_LOG_LEVEL");
  return parse_log_level(e ? e : "", LogLevel::warn);
}

std::atomic<int> g_log_level{static_cast<int>(level_from_env())};
std::mutex g_log_mu;

}  // namespace

std::string to_string(LogLevel level) {
  switch (level) {
    case LogLevel::debug: return "debug";
    case LogLevel::info:  return "info";
    case LogLevel::warn:  return "warn";
    case LogLevel::error: return "error";
  }
  return "warn";
}

LogLevel parse_log_level(const std::string& s, LogLevel def) {
  if (s == "debug") return LogLevel::debug;
  if (s == "info")  return LogLevel::info;
  if (s == "warn")  return LogLevel::warn;
  if (s == "error") return LogLevel::error;
  return def;
}

void set_log_level(LogLevel level) {
  g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

void log(LogLevel level, const std::string& component, const std::string& message) {
  if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;
  std::lock_guard<std::mutex> lk(g_log_mu);
  std::cerr << "[genledger][" << to_string(level) << "][" << component << "] "
            << message << "\n";
}

// ---------------------------------------------------------------------------
// EventKind
// ---------------------------------------------------------------------------

std::string to_string(EventKind kind) {
  switch (kind) {
    case EventKind::admitted:               return "admitted";
    case EventKind::rejected:               return "rejected";
    case EventKind::replayed:               return "replayed";
    case EventKind::claimed:                return "claimed";
    case EventKind::claim_conflict:         return "claim_conflict";
    case EventKind::cancelled_before_start: return "cancelled_before_start";
    case EventKind::completed:              return "completed";
    case EventKind::failed:                 return "failed";
    case EventKind::timeout:                return "timeout";
    case EventKind::refund:                 return "refund";
    case EventKind::refund_skipped:         return "refund_skipped";
    case EventKind::healed:                 return "healed";
    case EventKind::stale_swept:            return "stale_swept";
    case EventKind::reconcile_error:        return "reconcile_error";
    case EventKind::retried:                return "retried";
    case EventKind::cancelled:              return "cancelled";
    case EventKind::deleted:                return "deleted";
    case EventKind::adjusted:               return "adjusted";
  }
  return "unknown";
}

std::string event_to_json(const LedgerEvent& ev) {
  std::string line;
  line.reserve(256);
  line += "{\"kind\":\"";
  line += to_string(ev.kind);
  line += "\",\"owner\":\"";
  line += jsonlite::escape(ev.owner);
  line += "\",\"batch_id\":\"";
  line += jsonlite::escape(ev.batch_id);
  line += "\",\"task_id\":\"";
  line += jsonlite::escape(ev.task_id);
  line += "\",\"delta\":";
  line += std::to_string(ev.delta);
  line += ",\"duration_ns\":";
  line += std::to_string(ev.duration_ns);
  line += ",\"detail\":\"";
  line += jsonlite::escape(ev.detail);
  line += "\",\"ts\":";
  line += std::to_string(ev.timestamp_unix_ms);
  line += "}";
  return line;
}

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

namespace {
inline size_t bucket_for_ms(uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  size_t b = static_cast<size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}
}  // namespace

void LatencyHistogram::record(uint64_t duration_ns) {
  const uint64_t ms = duration_ns / 1000000u;
  buckets_[bucket_for_ms(ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += '}';
  return out;
}

void LatencyHistogram::reset() {
  for (auto& b : buckets_) b.store(0, std::memory_order_relaxed);
  count_.store(0, std::memory_order_relaxed);
  sum_ms_.store(0, std::memory_order_relaxed);
}

// ---------------------------------------------------------------------------
// SchedulerStats
// ---------------------------------------------------------------------------

void SchedulerStats::record(const LedgerEvent& ev) {
  switch (ev.kind) {
    case EventKind::admitted:               admissions.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::rejected:               rejections.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::replayed:               replays.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::claimed:                claims.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::claim_conflict:         claim_conflicts.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::cancelled_before_start: cancelled_before_start.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::completed:              completed.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::failed:                 failed.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::timeout:                timeouts.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::refund:                 refunds.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::refund_skipped:         refund_dedup_hits.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::healed:                 heals.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::stale_swept:            stale_sweeps.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::reconcile_error:        reconcile_errors.fetch_add(1, std::memory_order_relaxed); break;
    case EventKind::retried:
    case EventKind::cancelled:
    case EventKind::deleted:
    case EventKind::adjusted:
      break;
  }
  if (ev.duration_ns > 0) execution_latency.record(ev.duration_ns);
}

std::string SchedulerStats::to_json() const {
  std::string out;
  out.reserve(512);
  auto field = [&out](const char* name, const std::atomic<uint64_t>& v, bool first = false) {
    if (!first) out += ",";
    out += "\"";
    out += name;
    out += "\":";
    out += std::to_string(v.load(std::memory_order_relaxed));
  };
  out += "{";
  field("admissions", admissions, true);
  field("rejections", rejections);
  field("replays", replays);
  field("claims", claims);
  field("claim_conflicts", claim_conflicts);
  field("cancelled_before_start", cancelled_before_start);
  field("completed", completed);
  field("failed", failed);
  field("timeouts", timeouts);
  field("refunds", refunds);
  field("refund_dedup_hits", refund_dedup_hits);
  field("heals", heals);
  field("stale_sweeps", stale_sweeps);
  field("reconcile_errors", reconcile_errors);
  field("event_sink_failures", event_sink_failures);
  out += ",\"execution_latency\":";
  out += execution_latency.to_json();
  out += "}";
  return out;
}

void SchedulerStats::reset() {
  for (auto* c : {&admissions, &rejections, &replays, &claims, &claim_conflicts,
                  &cancelled_before_start, &completed, &failed, &timeouts, &refunds,
                  &refund_dedup_hits, &heals, &stale_sweeps, &reconcile_errors,
                  &event_sink_failures}) {
    c->store(0, std::memory_order_relaxed);
  }
  execution_latency.reset();
}

// ---------------------------------------------------------------------------
// Global singleton + event emission
// ---------------------------------------------------------------------------

SchedulerStats& global_stats() {
  static SchedulerStats inst;
  return inst;
}

namespace {
std::atomic<LedgerEventHook> g_event_hook{nullptr};
std::mutex g_sink_mu;
bool g_sink_overridden{false};
std::string g_sink_path;
}  // namespace

void set_event_hook(LedgerEventHook hook) {
  g_event_hook.store(hook, std::memory_order_release);
}

void set_event_log_path(const std::string& path) {
  std::lock_guard<std::mutex> lk(g_sink_mu);
  g_sink_overridden = true;
  g_sink_path = path;
}

void emit_event(LedgerEvent ev) {
  if (ev.timestamp_unix_ms == 0) ev.timestamp_unix_ms = system_now_unix_ms();

  // 1. Stats (always).
  global_stats().record(ev);

  // 2. Optional hook.
  if (LedgerEventHook hook = g_event_hook.load(std::memory_order_acquire)) hook(ev);

  // 3. JSONL sink: set GENLEDGER_EVENT_LOG=/path/to/events.jsonl
  std::lock_guard<std::mutex> lk(g_sink_mu);
  std::string path = g_sink_path;
  if (!g_sink_overridden) {
    const char* e = std::getenv("GENLEDGER_EVENT_LOG");
    path = (e && e[0]) ? e : "";
  }
  if (path.empty()) return;

  const std::string line = event_to_json(ev) + "\n";
  FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    global_stats().event_sink_failures.fetch_add(1, std::memory_order_relaxed);
    return;
  }
  if (std::fwrite(line.data(), 1, line.size(), f) != line.size()) {
    global_stats().event_sink_failures.fetch_add(1, std::memory_order_relaxed);
  }
  std::fclose(f);
}

}  // namespace genledger
