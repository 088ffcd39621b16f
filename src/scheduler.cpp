#include "genledger/scheduler.hpp"

#include "genledger/observability.hpp"

#include <exception>
#include <system_error>
#include <utility>

namespace genledger {

namespace {

constexpr const char* kCancelledBeforeStart = "cancelled before start";

LedgerEvent task_event(EventKind kind, const Task& t) {
  LedgerEvent ev;
  ev.kind = kind;
  ev.owner = t.owner;
  ev.batch_id = t.batch_id;
  ev.task_id = t.id;
  return ev;
}

// Writes from an execution unit apply only while its claimed attempt is current.
TaskPatch attempt_patch(const Task& claimed) {
  TaskPatch p;
  p.expected_retries = claimed.retries;
  return p;
}

}  // namespace

std::string to_string(ExecKind k) {
  switch (k) {
    case ExecKind::none:           return "none";
    case ExecKind::provider_error: return "provider_error";
    case ExecKind::timeout:        return "timeout";
    case ExecKind::claim_lost:     return "claim_lost";
    case ExecKind::cancelled:      return "cancelled";
  }
  return "none";
}

std::string truncate_summary(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
  return s.substr(0, cut);
}

Scheduler::Scheduler(ILedgerStore& store, CreditLedger& ledger, IRemoteJobClient& client,
                     Reconciler& reconciler, const Config& config, UnixMsClock clock)
    : store_(store),
      ledger_(ledger),
      client_(client),
      reconciler_(reconciler),
      config_(config),
      clock_(std::move(clock)) {}

Scheduler::~Scheduler() { stop(); }

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void Scheduler::start() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (loop_thread_.joinable()) return;
  }
  {
    std::lock_guard<std::mutex> lk(stop_mu_);
    stopping_ = false;
  }
  const size_t n = rebuild_queue();
  log(LogLevel::info, "scheduler", "started with " + std::to_string(n) + " queued task(s)");
  std::lock_guard<std::mutex> lk(mu_);
  loop_thread_ = std::thread([this] { loop(); });
}

void Scheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(stop_mu_);
    stopping_ = true;
  }
  stop_cv_.notify_all();
  {
    std::lock_guard<std::mutex> lk(mu_);
    wake_ = true;
  }
  wake_cv_.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();

  std::list<std::future<void>> units;
  {
    std::lock_guard<std::mutex> lk(mu_);
    units.swap(units_);
  }
  for (auto& f : units) f.wait();
}

bool Scheduler::running() const {
  std::lock_guard<std::mutex> lk(mu_);
  return loop_thread_.joinable();
}

size_t Scheduler::rebuild_queue() {
  auto ids = store_.task_ids_with_status({TaskStatus::pending, TaskStatus::queued});
  std::lock_guard<std::mutex> lk(mu_);
  queue_.assign(ids.begin(), ids.end());
  return queue_.size();
}

void Scheduler::enqueue(const std::string& task_id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.push_back(task_id);
    wake_ = true;
  }
  wake_cv_.notify_all();
}

void Scheduler::enqueue(const std::vector<std::string>& task_ids) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    queue_.insert(queue_.end(), task_ids.begin(), task_ids.end());
    wake_ = true;
  }
  wake_cv_.notify_all();
}

size_t Scheduler::queue_depth() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

uint32_t Scheduler::inflight() const {
  std::lock_guard<std::mutex> lk(mu_);
  return inflight_;
}

uint32_t Scheduler::inflight_for(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = inflight_by_owner_.find(owner);
  return it == inflight_by_owner_.end() ? 0 : it->second;
}

bool Scheduler::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  return idle_cv_.wait_for(lk, timeout, [this] { return queue_.empty() && inflight_ == 0; });
}

size_t Scheduler::reap() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (auto it = units_.begin(); it != units_.end();) {
    if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it->get();
      it = units_.erase(it);
      ++n;
    } else {
      ++it;
    }
  }
  return n;
}

// ---------------------------------------------------------------------------
// Scheduling loop
// ---------------------------------------------------------------------------

TickResult Scheduler::tick() {
  std::string batch_id;
  TickResult result = TickResult::idle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queue_.empty()) return TickResult::idle;
    const std::string head = queue_.front();

    const auto task = store_.get_task(head);
    if (!task || task->deleted() ||
        (task->status != TaskStatus::pending && task->status != TaskStatus::queued)) {
      queue_.pop_front();
      idle_cv_.notify_all();
      return TickResult::dropped;
    }

    const uint32_t owner_inflight = inflight_by_owner_[task->owner];
    if (inflight_ >= config_.global_concurrency ||
        owner_inflight >= config_.per_owner_concurrency) {
      return TickResult::deferred;
    }

    TaskPatch patch = attempt_patch(*task);
    patch.progress = 0;
    const StoreStatus st = store_.transition_task(
        head, {TaskStatus::pending, TaskStatus::queued}, TaskStatus::running, patch, clock_());
    if (st == StoreStatus::write_failed) {
      log(LogLevel::error, "scheduler", "claim of " + head + " not recorded; retrying next tick");
      return TickResult::deferred;
    }
    queue_.pop_front();
    if (st != StoreStatus::ok) {
      emit_event(task_event(EventKind::claim_conflict, *task));
      idle_cv_.notify_all();
      return TickResult::dropped;
    }

    ++inflight_;
    ++inflight_by_owner_[task->owner];
    emit_event(task_event(EventKind::claimed, *task));

    Task claimed = *task;
    claimed.status = TaskStatus::running;
    try {
      units_.push_back(std::async(std::launch::async, [this, claimed] { run_unit(claimed); }));
    } catch (const std::system_error& e) {
      // The task stays running with no unit; the stale rule fails and refunds it.
      log(LogLevel::error, "scheduler", "cannot launch unit for " + head + ": " + e.what());
      --inflight_;
      if (--inflight_by_owner_[task->owner] == 0) inflight_by_owner_.erase(task->owner);
      idle_cv_.notify_all();
    }
    batch_id = task->batch_id;
    result = TickResult::claimed;
  }
  reconciler_.recompute(batch_id);
  return result;
}

void Scheduler::loop() {
  const auto interval = std::chrono::milliseconds(config_.tick_interval_ms);
  while (true) {
    {
      std::lock_guard<std::mutex> lk(stop_mu_);
      if (stopping_) return;
    }
    TickResult r;
    do {
      r = tick();
    } while (r == TickResult::claimed || r == TickResult::dropped);
    reap();

    std::unique_lock<std::mutex> lk(mu_);
    wake_cv_.wait_for(lk, interval, [this] { return wake_; });
    wake_ = false;
  }
}

// ---------------------------------------------------------------------------
// Execution unit
// ---------------------------------------------------------------------------

bool Scheduler::pause(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(stop_mu_);
  return !stop_cv_.wait_for(lk, d, [this] { return stopping_; });
}

void Scheduler::release(const std::string& owner) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    --inflight_;
    auto it = inflight_by_owner_.find(owner);
    if (it != inflight_by_owner_.end() && --it->second == 0) inflight_by_owner_.erase(it);
    wake_ = true;
  }
  wake_cv_.notify_all();
  idle_cv_.notify_all();
}

void Scheduler::run_unit(Task task) {
  ScopeTimer timer;
  ExecOutcome outcome;
  try {
    outcome = execute(task);
  } catch (const std::exception& e) {
    outcome.kind = ExecKind::provider_error;
    outcome.message = e.what();
  }
  try {
    finalize(task, outcome, timer.elapsed_ns());
  } catch (const std::exception& e) {
    log(LogLevel::error, "scheduler", "finalize " + task.id + ": " + e.what());
  }
  release(task.owner);
  reconciler_.recompute(task.batch_id);
}

ExecOutcome Scheduler::execute(const Task& task) {
  ExecOutcome out;

  // The one cancellation check: after claim, before the provider is touched.
  const auto current = store_.get_task(task.id);
  if (current && current->status == TaskStatus::cancelled) {
    out.kind = ExecKind::cancelled;
    out.message = kCancelledBeforeStart;
    return out;
  }
  if (!current || current->deleted() || current->status != TaskStatus::running ||
      current->retries != task.retries) {
    out.kind = ExecKind::claim_lost;
    out.message = "task no longer running";
    return out;
  }

  CreateJobRequest req;
  req.prompt = task.params.prompt;
  req.media_reference = task.params.media_reference;
  req.model = task.params.model;
  req.orientation = task.params.orientation;
  req.size = task.params.size;
  req.duration_s = task.params.duration_s;
  req.idempotency_key = task.id + ":" + std::to_string(task.retries);

  const CreateJobResult created = client_.create(req);
  if (!created.ok) {
    out.kind = ExecKind::provider_error;
    out.message = created.error.empty() ? "create failed" : created.error;
    return out;
  }

  TaskPatch handle = attempt_patch(task);
  handle.remote_job_handle = created.job_handle;
  const StoreStatus handle_st = store_.record_progress(task.id, handle, clock_());
  if (handle_st == StoreStatus::conflict) {
    out.kind = ExecKind::claim_lost;
    out.message = "attempt superseded before job " + created.job_handle + " was recorded";
    return out;
  }
  if (handle_st == StoreStatus::write_failed) {
    log(LogLevel::warn, "scheduler", "job handle for " + task.id + " not recorded");
  }

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.max_poll_ms);
  const auto interval = std::chrono::milliseconds(config_.poll_interval_ms);
  while (true) {
    if (!pause(interval)) {
      out.kind = ExecKind::cancelled;
      out.message = "scheduler stopping";
      return out;
    }

    const PollResult pr = client_.poll(created.job_handle);
    if (!pr.ok) {
      out.kind = ExecKind::provider_error;
      out.message = "poll failed: " + pr.error;
      return out;
    }

    TaskPatch patch = attempt_patch(task);
    patch.progress = pr.progress;
    if (pr.remote_started_at_ms) patch.remote_started_at_ms = pr.remote_started_at_ms;
    if (pr.remote_finished_at_ms) patch.remote_finished_at_ms = pr.remote_finished_at_ms;

    if (pr.status == RemoteStatus::completed && !pr.result_locator.empty()) {
      // Locator lands before the status flip so a crash in between is healable.
      patch.result_locator = pr.result_locator;
      patch.progress = 100;
      const StoreStatus st = store_.record_progress(task.id, patch, clock_());
      if (st == StoreStatus::conflict) {
        out.kind = ExecKind::claim_lost;
        out.message = "attempt superseded; result of job " + created.job_handle + " discarded";
        return out;
      }
      if (st == StoreStatus::write_failed) {
        log(LogLevel::warn, "scheduler", "locator for " + task.id + " not recorded");
      }
      out.kind = ExecKind::none;
      out.locator = pr.result_locator;
      return out;
    }
    if (pr.status == RemoteStatus::failed || pr.status == RemoteStatus::cancelled) {
      out.kind = ExecKind::provider_error;
      out.message = pr.error.empty() ? "provider reported " + to_string(pr.status) : pr.error;
      return out;
    }
    if (pr.status == RemoteStatus::completed) {
      log(LogLevel::debug, "scheduler", "job " + created.job_handle + " completed without url");
    }

    const StoreStatus progress_st = store_.record_progress(task.id, patch, clock_());
    if (progress_st == StoreStatus::conflict) {
      out.kind = ExecKind::claim_lost;
      out.message = "attempt superseded while polling job " + created.job_handle;
      return out;
    }
    if (progress_st == StoreStatus::write_failed) {
      log(LogLevel::warn, "scheduler", "progress for " + task.id + " not recorded");
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      out.kind = ExecKind::timeout;
      out.message = "timeout: no result after " + std::to_string(config_.max_poll_ms) + "ms";
      return out;
    }
  }
}

void Scheduler::finalize(const Task& task, const ExecOutcome& outcome, uint64_t duration_ns) {
  const uint64_t now = clock_();
  switch (outcome.kind) {
    case ExecKind::none: {
      TaskPatch patch = attempt_patch(task);
      patch.result_locator = outcome.locator;
      patch.progress = 100;
      const StoreStatus st =
          store_.transition_task(task.id, {TaskStatus::running}, TaskStatus::completed, patch, now);
      if (st == StoreStatus::ok) {
        auto ev = task_event(EventKind::completed, task);
        ev.duration_ns = duration_ns;
        emit_event(ev);
      } else if (st == StoreStatus::conflict) {
        log(LogLevel::info, "scheduler", "completion of " + task.id + " discarded: task moved on");
      } else {
        log(LogLevel::error, "scheduler", "completion of " + task.id + ": " + to_string(st));
      }
      return;
    }

    case ExecKind::provider_error:
    case ExecKind::timeout: {
      TaskPatch patch = attempt_patch(task);
      patch.error_summary = truncate_summary(outcome.message, config_.error_summary_max);
      const StoreStatus st =
          store_.transition_task(task.id, {TaskStatus::running}, TaskStatus::failed, patch, now);
      if (st != StoreStatus::ok) {
        if (st == StoreStatus::conflict) {
          log(LogLevel::info, "scheduler", "failure of " + task.id + " discarded: task moved on");
        } else {
          log(LogLevel::error, "scheduler", "failure of " + task.id + ": " + to_string(st));
        }
        return;
      }
      auto ev = task_event(
          outcome.kind == ExecKind::timeout ? EventKind::timeout : EventKind::failed, task);
      ev.duration_ns = duration_ns;
      ev.detail = to_string(outcome.kind);
      emit_event(ev);

      const RefundOutcome r = ledger_.refund_task(task.id);
      if (!r.ok) {
        // The reconciler's refund repair picks this up on the next sweep.
        log(LogLevel::error, "scheduler", "refund for " + task.id + ": " + r.error_code);
      }
      return;
    }

    case ExecKind::cancelled:
      if (outcome.message == kCancelledBeforeStart) {
        emit_event(task_event(EventKind::cancelled_before_start, task));
      } else {
        log(LogLevel::info, "scheduler", task.id + " left running: " + outcome.message);
      }
      return;

    case ExecKind::claim_lost:
      log(LogLevel::debug, "scheduler", task.id + ": " + outcome.message);
      return;
  }
}

}  // namespace genledger
