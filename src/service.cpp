#include "genledger/service.hpp"

#include "genledger/observability.hpp"

#include <utility>

namespace genledger {

namespace {

LedgerEvent task_event(EventKind kind, const Task& t) {
  LedgerEvent ev;
  ev.kind = kind;
  ev.owner = t.owner;
  ev.batch_id = t.batch_id;
  ev.task_id = t.id;
  return ev;
}

ServiceResult from_store(StoreStatus st, const std::string& what) {
  switch (st) {
    case StoreStatus::ok:                 return ServiceResult::success();
    case StoreStatus::not_found:          return ServiceResult::failure("not_found", what + " not found");
    case StoreStatus::conflict:
    case StoreStatus::invalid_transition:
      return ServiceResult::failure("invalid_state", what + " changed state; reload and retry");
    case StoreStatus::write_failed:
      return ServiceResult::failure("store_write_failed", what + " not recorded");
  }
  return ServiceResult::failure("store_write_failed", what + " not recorded");
}

}  // namespace

LedgerService::LedgerService(ILedgerStore& store, IRemoteJobClient& client,
                             const PriceTable& prices, const Config& config, UnixMsClock clock)
    : store_(store),
      config_(config),
      clock_(std::move(clock)),
      ledger_(store_, clock_),
      reconciler_(store_, ledger_, config_, clock_),
      scheduler_(store_, ledger_, client, reconciler_, config_, clock_),
      admission_(store_, ledger_, prices, reconciler_, config_, clock_) {
  admission_.set_dispatch(
      [this](const std::vector<std::string>& ids) { scheduler_.enqueue(ids); });
}

LedgerService::~LedgerService() { stop(); }

void LedgerService::start() {
  scheduler_.start();
  reconciler_.start();
}

void LedgerService::stop() {
  scheduler_.stop();
  reconciler_.stop();
}

std::optional<Task> LedgerService::owned_task(const std::string& owner,
                                              const std::string& task_id) const {
  auto t = store_.get_task(task_id);
  if (!t || t->deleted() || t->owner != owner) return std::nullopt;
  return t;
}

std::optional<Batch> LedgerService::owned_batch(const std::string& owner,
                                                const std::string& batch_id) const {
  auto b = store_.get_batch(batch_id);
  if (!b || b->deleted() || b->owner != owner) return std::nullopt;
  return b;
}

StoreStatus LedgerService::cancel(const Task& t, uint64_t now) {
  const StoreStatus st = store_.transition_task(
      t.id, {TaskStatus::pending, TaskStatus::queued, TaskStatus::running},
      TaskStatus::cancelled, TaskPatch{}, now);
  if (st == StoreStatus::ok) emit_event(task_event(EventKind::cancelled, t));
  return st;
}

SubmitResult LedgerService::submit_batch(const std::string& owner, const SubmitRequest& req) {
  return admission_.submit(owner, req);
}

BatchPage LedgerService::list_batches(const std::string& owner, uint32_t page,
                                      uint32_t page_size) {
  BatchPage out;
  out.page = page;
  out.page_size = page_size;
  if (page < 1 || page_size < 1 || page_size > kMaxPageSize) {
    out.result = ServiceResult::failure(
        "validation", "page must be >= 1 and page_size 1.." + std::to_string(kMaxPageSize));
    return out;
  }
  const size_t offset = static_cast<size_t>(page - 1) * page_size;
  out.batches = store_.list_batches(owner, offset, page_size);
  out.total = store_.count_batches(owner);
  out.result = ServiceResult::success();
  return out;
}

TaskList LedgerService::list_tasks(const std::string& owner, const std::string& batch_id) {
  TaskList out;
  if (!owned_batch(owner, batch_id)) {
    out.result = ServiceResult::failure("not_found", "batch not found");
    return out;
  }
  // Reconciler errors are logged and counted there; reads always succeed.
  reconciler_.reconcile_batch(batch_id);
  out.batch = store_.get_batch(batch_id);
  out.tasks = store_.tasks_for_batch(batch_id);
  out.result = ServiceResult::success();
  return out;
}

TaskLookup LedgerService::get_task(const std::string& owner, const std::string& task_id) {
  TaskLookup out;
  out.task = owned_task(owner, task_id);
  out.result = out.task ? ServiceResult::success()
                        : ServiceResult::failure("not_found", "task not found");
  return out;
}

ServiceResult LedgerService::retry_task(const std::string& owner, const std::string& task_id) {
  const auto t = owned_task(owner, task_id);
  if (!t) return ServiceResult::failure("not_found", "task not found");
  if (t->status != TaskStatus::failed) {
    return ServiceResult::failure("invalid_state",
                                  "only failed tasks can be retried (status " +
                                      to_string(t->status) + ")");
  }
  TaskPatch patch;
  patch.error_summary = "";
  patch.result_locator = "";
  patch.remote_job_handle = "";
  patch.progress = 0;
  patch.remote_started_at_ms = 0;
  patch.remote_finished_at_ms = 0;
  patch.bump_retries = true;
  const StoreStatus st =
      store_.transition_task(task_id, {TaskStatus::failed}, TaskStatus::queued, patch, clock_());
  if (st != StoreStatus::ok) return from_store(st, "task");

  emit_event(task_event(EventKind::retried, *t));
  scheduler_.enqueue(task_id);
  reconciler_.recompute(t->batch_id);
  return ServiceResult::success();
}

ServiceResult LedgerService::cancel_task(const std::string& owner, const std::string& task_id) {
  const auto t = owned_task(owner, task_id);
  if (!t) return ServiceResult::failure("not_found", "task not found");
  if (!is_active(t->status)) {
    return ServiceResult::failure("invalid_state",
                                  "task is " + to_string(t->status) + "; nothing to cancel");
  }
  const StoreStatus st = cancel(*t, clock_());
  if (st != StoreStatus::ok) return from_store(st, "task");
  reconciler_.recompute(t->batch_id);
  return ServiceResult::success();
}

ServiceResult LedgerService::delete_task(const std::string& owner, const std::string& task_id) {
  const auto t = owned_task(owner, task_id);
  if (!t) return ServiceResult::failure("not_found", "task not found");
  const uint64_t now = clock_();
  if (is_active(t->status)) {
    const StoreStatus st = cancel(*t, now);
    // conflict: it reached a terminal state meanwhile; delete it anyway.
    if (st != StoreStatus::ok && st != StoreStatus::conflict) return from_store(st, "task");
  }
  const StoreStatus st = store_.soft_delete_task(task_id, now);
  if (st != StoreStatus::ok) return from_store(st, "task");
  emit_event(task_event(EventKind::deleted, *t));
  reconciler_.recompute(t->batch_id);
  return ServiceResult::success();
}

ServiceResult LedgerService::delete_batch(const std::string& owner, const std::string& batch_id) {
  const auto b = owned_batch(owner, batch_id);
  if (!b) return ServiceResult::failure("not_found", "batch not found");
  const uint64_t now = clock_();
  for (const Task& t : store_.tasks_for_batch(batch_id)) {
    if (!is_active(t.status)) continue;
    const StoreStatus st = cancel(t, now);
    if (st != StoreStatus::ok && st != StoreStatus::conflict) return from_store(st, "task " + t.id);
  }
  const StoreStatus st = store_.soft_delete_batch(batch_id, now);
  if (st != StoreStatus::ok) return from_store(st, "batch");

  LedgerEvent ev;
  ev.kind = EventKind::deleted;
  ev.owner = owner;
  ev.batch_id = batch_id;
  emit_event(ev);
  reconciler_.recompute(batch_id);
  return ServiceResult::success();
}

int64_t LedgerService::balance(const std::string& owner) const { return ledger_.balance(owner); }

std::vector<CreditTransaction> LedgerService::transactions(const std::string& owner) const {
  return store_.transactions_for(owner);
}

AdjustResult LedgerService::admin_adjust(const std::string& owner, int64_t delta,
                                         const std::string& note) {
  return ledger_.admin_adjust(owner, delta, note);
}

ReconcileReport LedgerService::sweep() { return reconciler_.sweep(); }

}  // namespace genledger
