#include "genledger/reconciler.hpp"

#include "genledger/observability.hpp"

#include <chrono>
#include <sstream>

namespace genledger {

namespace {

constexpr const char* kStaleReason = "timeout: no provider update";

void report_error(const Task& t, const std::string& what, ReconcileReport& report) {
  ++report.errors;
  log(LogLevel::error, "reconciler", what + " task=" + t.id);
  LedgerEvent ev;
  ev.kind = EventKind::reconcile_error;
  ev.owner = t.owner;
  ev.batch_id = t.batch_id;
  ev.task_id = t.id;
  ev.detail = what;
  emit_event(ev);
}

}  // namespace

ReconcileReport& ReconcileReport::operator+=(const ReconcileReport& o) {
  batches += o.batches;
  healed += o.healed;
  stale_failed += o.stale_failed;
  refunds += o.refunds;
  errors += o.errors;
  return *this;
}

std::string ReconcileReport::to_json() const {
  std::ostringstream o;
  o << "{\"batches\":" << batches << ",\"healed\":" << healed
    << ",\"stale_failed\":" << stale_failed << ",\"refunds\":" << refunds
    << ",\"errors\":" << errors << "}";
  return o.str();
}

Reconciler::Reconciler(ILedgerStore& store, CreditLedger& ledger, const Config& config,
                       UnixMsClock clock)
    : store_(store), ledger_(ledger), config_(config), clock_(std::move(clock)) {}

Reconciler::~Reconciler() { stop(); }

void Reconciler::refund(const Task& t, ReconcileReport& report) {
  const RefundOutcome r = ledger_.refund_task(t.id);
  if (!r.ok) {
    // not_refundable: someone retried the task between our read and now.
    if (r.error_code != "not_refundable") report_error(t, "refund " + r.error_code, report);
    return;
  }
  if (r.refunded) ++report.refunds;
}

ReconcileReport Reconciler::reconcile_batch(const std::string& batch_id) {
  ReconcileReport report;
  report.batches = 1;
  const uint64_t now = clock_();

  for (const Task& t : store_.tasks_for_batch(batch_id)) {
    if (t.status == TaskStatus::running && !t.result_locator.empty()) {
      TaskPatch patch;
      patch.progress = 100;
      const StoreStatus st =
          store_.transition_task(t.id, {TaskStatus::running}, TaskStatus::completed, patch, now);
      if (st == StoreStatus::ok) {
        ++report.healed;
        LedgerEvent ev;
        ev.kind = EventKind::healed;
        ev.owner = t.owner;
        ev.batch_id = t.batch_id;
        ev.task_id = t.id;
        emit_event(ev);
      } else if (st != StoreStatus::conflict) {
        report_error(t, "heal " + to_string(st), report);
      }
      continue;
    }

    if (t.status == TaskStatus::running && now > t.updated_at_ms &&
        now - t.updated_at_ms > config_.stale_running_ms) {
      TaskPatch patch;
      patch.error_summary = kStaleReason;
      const StoreStatus st =
          store_.transition_task(t.id, {TaskStatus::running}, TaskStatus::failed, patch, now);
      if (st == StoreStatus::ok) {
        ++report.stale_failed;
        log(LogLevel::warn, "reconciler", "stale running task failed: " + t.id);
        LedgerEvent ev;
        ev.kind = EventKind::stale_swept;
        ev.owner = t.owner;
        ev.batch_id = t.batch_id;
        ev.task_id = t.id;
        ev.detail = "timeout";
        emit_event(ev);
        refund(t, report);
      } else if (st != StoreStatus::conflict) {
        report_error(t, "stale sweep " + to_string(st), report);
      }
      continue;
    }

    // A failure whose refund was never written (crash between the two writes,
    // or a refund that hit a store error).
    if (t.status == TaskStatus::failed && !store_.has_refund_for_task(t.id)) {
      refund(t, report);
    }
  }

  if (!recompute(batch_id)) ++report.errors;
  return report;
}

bool Reconciler::recompute(const std::string& batch_id) {
  const BatchCounters counters = store_.count_tasks_by_status(batch_id);
  const StoreStatus st = store_.write_batch_counters(batch_id, counters, clock_());
  if (st == StoreStatus::ok) return true;
  log(LogLevel::error, "reconciler", "recompute " + batch_id + ": " + to_string(st));
  global_stats().reconcile_errors.fetch_add(1, std::memory_order_relaxed);
  return false;
}

ReconcileReport Reconciler::sweep() {
  ReconcileReport total;
  for (const auto& id : store_.live_batch_ids()) {
    if (stopping_.load()) break;
    total += reconcile_batch(id);
  }
  if (total.healed || total.stale_failed || total.refunds || total.errors) {
    log(LogLevel::info, "reconciler", "sweep " + total.to_json());
  }
  return total;
}

void Reconciler::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (worker_.joinable()) return;
  stopping_ = false;
  worker_ = std::thread([this] { worker_loop(); });
}

void Reconciler::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

bool Reconciler::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return worker_.joinable() && !stopping_.load();
}

void Reconciler::worker_loop() {
  const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait_for(lock, interval, [this] { return stopping_.load(); });
      if (stopping_) return;
    }
    sweep();
  }
}

}  // namespace genledger
