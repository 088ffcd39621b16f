#include "genledger/store.hpp"

#include "genledger/observability.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace genledger {

std::string to_string(StoreStatus s) {
  switch (s) {
    case StoreStatus::ok:                 return "ok";
    case StoreStatus::not_found:          return "not_found";
    case StoreStatus::conflict:           return "conflict";
    case StoreStatus::invalid_transition: return "invalid_transition";
    case StoreStatus::write_failed:       return "store_write_failed";
  }
  return "store_write_failed";
}

namespace {

void apply_patch(Task& t, const TaskPatch& p) {
  if (p.error_summary) t.error_summary = *p.error_summary;
  if (p.result_locator) t.result_locator = *p.result_locator;
  if (p.remote_job_handle) t.remote_job_handle = *p.remote_job_handle;
  if (p.progress) t.progress = std::min<uint32_t>(*p.progress, 100);
  if (p.remote_started_at_ms) t.remote_started_at_ms = *p.remote_started_at_ms;
  if (p.remote_finished_at_ms) t.remote_finished_at_ms = *p.remote_finished_at_ms;
  if (p.bump_retries) ++t.retries;
}

std::string tasks_to_json(const std::vector<Task>& tasks) {
  std::string out = "[";
  for (size_t i = 0; i < tasks.size(); ++i) {
    if (i) out += ",";
    out += task_to_json(tasks[i]);
  }
  out += "]";
  return out;
}

std::string admission_to_json(const AdmissionRecord& rec) {
  std::ostringstream o;
  o << "{\"batch\":" << batch_to_json(rec.batch)
    << ",\"tasks\":" << tasks_to_json(rec.tasks)
    << ",\"debit\":" << transaction_to_json(rec.debit)
    << ",\"idempotency\":" << (rec.idempotency ? idempotency_to_json(*rec.idempotency) : "null")
    << "}";
  return o.str();
}

bool tasks_from_json(const jsonlite::Array& arr, std::vector<Task>& out) {
  for (const auto& item : arr) {
    if (!std::holds_alternative<jsonlite::Object>(item.v)) return false;
    auto t = task_from_json(std::get<jsonlite::Object>(item.v));
    if (!t) return false;
    out.push_back(std::move(*t));
  }
  return true;
}

}  // namespace

// ---------------------------------------------------------------------------
// Open / replay
// ---------------------------------------------------------------------------

MemoryLedgerStore::OpenResult MemoryLedgerStore::open(const std::string& journal_path,
                                                      bool read_only) {
  OpenResult r;
  auto store = std::make_unique<MemoryLedgerStore>();
  if (journal_path.empty()) {
    r.ok = true;
    r.store = std::move(store);
    return r;
  }

  MemoryLedgerStore* raw = store.get();
  r.replay = replay_journal(journal_path, [raw](const std::string& op, const jsonlite::Object& data) {
    return raw->apply_journal_op(op, data);
  });
  if (!r.replay.ok) {
    r.error_code = r.replay.error_code;
    r.error_message = journal_path + ":" + std::to_string(r.replay.error_line) + ": " +
                      r.replay.error_message;
    return r;
  }
  if (read_only) {
    r.ok = true;
    r.store = std::move(store);
    return r;
  }
  if (!truncate_torn_tail(journal_path, r.replay)) {
    r.error_code = "journal_truncate_failed";
    r.error_message = "cannot cut torn tail of " + journal_path;
    return r;
  }

  store->journal_ = std::make_unique<Journal>(journal_path);
  if (!store->journal_->is_open()) {
    r.error_code = "journal_unwritable";
    r.error_message = "cannot open " + journal_path + " for append";
    return r;
  }
  store->journal_->resume(r.replay.last_sequence, r.replay.last_digest);

  log(LogLevel::info, "store",
      "replayed " + std::to_string(r.replay.entries) + " journal entries from " + journal_path);
  r.ok = true;
  r.store = std::move(store);
  return r;
}

std::string MemoryLedgerStore::apply_journal_op(const std::string& op, const jsonlite::Object& data) {
  // Called during open(), before the store is shared; no lock needed.
  if (op == "admit") {
    AdmissionRecord rec;
    rec.batch = batch_from_json(jsonlite::get_object(data, "batch"));
    if (!tasks_from_json(jsonlite::get_array(data, "tasks"), rec.tasks)) return "admit: bad task record";
    rec.debit = transaction_from_json(jsonlite::get_object(data, "debit"));
    if (jsonlite::has(data, "idempotency")) {
      rec.idempotency = idempotency_from_json(jsonlite::get_object(data, "idempotency"));
    }
    if (rec.batch.id.empty()) return "admit: missing batch id";
    apply_admission(rec);
    return "";
  }
  if (op == "put_task") {
    auto t = task_from_json(data);
    if (!t || t->id.empty()) return "put_task: bad task record";
    apply_task(*t);
    return "";
  }
  if (op == "put_batch") {
    Batch b = batch_from_json(data);
    if (b.id.empty()) return "put_batch: missing batch id";
    apply_batch(b);
    return "";
  }
  if (op == "put_batch_tree") {
    Batch b = batch_from_json(jsonlite::get_object(data, "batch"));
    std::vector<Task> tasks;
    if (b.id.empty() || !tasks_from_json(jsonlite::get_array(data, "tasks"), tasks)) {
      return "put_batch_tree: bad record";
    }
    apply_batch(b);
    for (const auto& t : tasks) apply_task(t);
    return "";
  }
  if (op == "append_tx") {
    CreditTransaction tx = transaction_from_json(data);
    if (tx.id == 0) return "append_tx: missing id";
    apply_transaction(tx);
    return "";
  }
  return "unknown journal op: " + op;
}

bool MemoryLedgerStore::persist(const std::string& op, const std::string& data_json) {
  if (!journal_) return true;
  if (journal_->append(op, data_json)) return true;
  log(LogLevel::error, "store", "journal append failed for op " + op);
  return false;
}

void MemoryLedgerStore::apply_admission(const AdmissionRecord& rec) {
  apply_batch(rec.batch);
  for (const auto& t : rec.tasks) apply_task(t);
  apply_transaction(rec.debit);
  if (rec.idempotency) {
    idempotency_[{rec.idempotency->owner, rec.idempotency->key}] = *rec.idempotency;
  }
}

void MemoryLedgerStore::apply_task(const Task& t) {
  auto it = tasks_.find(t.id);
  if (it == tasks_.end()) {
    task_order_.push_back(t.id);
    batch_tasks_[t.batch_id].push_back(t.id);
    tasks_.emplace(t.id, t);
  } else {
    it->second = t;
  }
}

void MemoryLedgerStore::apply_batch(const Batch& b) {
  auto it = batches_.find(b.id);
  if (it == batches_.end()) {
    batch_order_.push_back(b.id);
    batches_.emplace(b.id, b);
  } else {
    it->second = b;
  }
}

void MemoryLedgerStore::apply_transaction(const CreditTransaction& tx) {
  transactions_.push_back(tx);
  next_tx_id_ = std::max(next_tx_id_, tx.id + 1);
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

StoreStatus MemoryLedgerStore::commit_admission(AdmissionRecord& rec) {
  std::lock_guard<std::mutex> lk(mu_);
  if (batches_.contains(rec.batch.id)) return StoreStatus::conflict;
  for (const auto& t : rec.tasks) {
    if (tasks_.contains(t.id)) return StoreStatus::conflict;
  }
  rec.debit.id = next_tx_id_;
  if (!persist("admit", admission_to_json(rec))) {
    rec.debit.id = 0;
    return StoreStatus::write_failed;
  }
  apply_admission(rec);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::transition_task(const std::string& task_id,
                                               const std::vector<TaskStatus>& from,
                                               TaskStatus to,
                                               const TaskPatch& patch,
                                               uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return StoreStatus::not_found;
  const Task& cur = it->second;
  if (cur.deleted()) return StoreStatus::conflict;
  if (std::find(from.begin(), from.end(), cur.status) == from.end()) return StoreStatus::conflict;
  if (patch.expected_retries && cur.retries != *patch.expected_retries) return StoreStatus::conflict;
  if (!is_valid_transition(cur.status, to)) return StoreStatus::invalid_transition;

  Task next = cur;
  next.status = to;
  apply_patch(next, patch);
  next.updated_at_ms = now_ms;
  if (!persist("put_task", task_to_json(next))) return StoreStatus::write_failed;
  it->second = std::move(next);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::record_progress(const std::string& task_id,
                                               const TaskPatch& patch,
                                               uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return StoreStatus::not_found;
  if (it->second.deleted() || it->second.status != TaskStatus::running) return StoreStatus::conflict;
  if (patch.expected_retries && it->second.retries != *patch.expected_retries) {
    return StoreStatus::conflict;
  }

  Task next = it->second;
  apply_patch(next, patch);
  next.updated_at_ms = now_ms;
  if (!persist("put_task", task_to_json(next))) return StoreStatus::write_failed;
  it->second = std::move(next);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::append_transaction(CreditTransaction& tx) {
  std::lock_guard<std::mutex> lk(mu_);
  tx.id = next_tx_id_;
  if (!persist("append_tx", transaction_to_json(tx))) {
    tx.id = 0;
    return StoreStatus::write_failed;
  }
  apply_transaction(tx);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::soft_delete_task(const std::string& task_id, uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end() || it->second.deleted()) return StoreStatus::not_found;
  Task next = it->second;
  next.deleted_at_ms = now_ms;
  next.updated_at_ms = now_ms;
  if (!persist("put_task", task_to_json(next))) return StoreStatus::write_failed;
  it->second = std::move(next);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::soft_delete_batch(const std::string& batch_id, uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = batches_.find(batch_id);
  if (it == batches_.end() || it->second.deleted()) return StoreStatus::not_found;

  Batch batch = it->second;
  batch.deleted_at_ms = now_ms;
  batch.updated_at_ms = now_ms;
  std::vector<Task> tasks;
  for (const auto& id : batch_tasks_[batch_id]) {
    Task t = tasks_.at(id);
    if (t.deleted()) continue;
    t.deleted_at_ms = now_ms;
    t.updated_at_ms = now_ms;
    tasks.push_back(std::move(t));
  }

  std::ostringstream o;
  o << "{\"batch\":" << batch_to_json(batch) << ",\"tasks\":" << tasks_to_json(tasks) << "}";
  if (!persist("put_batch_tree", o.str())) return StoreStatus::write_failed;
  apply_batch(batch);
  for (const auto& t : tasks) apply_task(t);
  return StoreStatus::ok;
}

StoreStatus MemoryLedgerStore::write_batch_counters(const std::string& batch_id,
                                                    const BatchCounters& counters,
                                                    uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = batches_.find(batch_id);
  if (it == batches_.end()) return StoreStatus::not_found;
  // Unchanged counters are not rewritten; reads reconcile often.
  if (it->second.counters == counters) return StoreStatus::ok;
  Batch next = it->second;
  next.counters = counters;
  next.updated_at_ms = now_ms;
  if (!persist("put_batch", batch_to_json(next))) return StoreStatus::write_failed;
  it->second = std::move(next);
  return StoreStatus::ok;
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

std::optional<Batch> MemoryLedgerStore::get_batch(const std::string& batch_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = batches_.find(batch_id);
  if (it == batches_.end()) return std::nullopt;
  return it->second;
}

std::optional<Task> MemoryLedgerStore::get_task(const std::string& task_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

std::vector<Batch> MemoryLedgerStore::list_batches(const std::string& owner,
                                                   size_t offset, size_t limit) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Batch> out;
  size_t skipped = 0;
  for (auto it = batch_order_.rbegin(); it != batch_order_.rend(); ++it) {
    const Batch& b = batches_.at(*it);
    if (b.owner != owner || b.deleted()) continue;
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    if (limit != 0 && out.size() >= limit) break;
    out.push_back(b);
  }
  return out;
}

size_t MemoryLedgerStore::count_batches(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = 0;
  for (const auto& [id, b] : batches_) {
    if (b.owner == owner && !b.deleted()) ++n;
  }
  return n;
}

std::vector<std::string> MemoryLedgerStore::live_batch_ids() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& id : batch_order_) {
    if (!batches_.at(id).deleted()) out.push_back(id);
  }
  return out;
}

std::vector<Task> MemoryLedgerStore::tasks_for_batch(const std::string& batch_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Task> out;
  auto it = batch_tasks_.find(batch_id);
  if (it == batch_tasks_.end()) return out;
  for (const auto& id : it->second) {
    const Task& t = tasks_.at(id);
    if (!t.deleted()) out.push_back(t);
  }
  return out;
}

std::vector<std::string> MemoryLedgerStore::task_ids_with_status(
    const std::vector<TaskStatus>& statuses) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> out;
  for (const auto& id : task_order_) {
    const Task& t = tasks_.at(id);
    if (t.deleted()) continue;
    if (std::find(statuses.begin(), statuses.end(), t.status) != statuses.end()) out.push_back(id);
  }
  return out;
}

BatchCounters MemoryLedgerStore::count_tasks_by_status(const std::string& batch_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  BatchCounters c;
  auto it = batch_tasks_.find(batch_id);
  if (it == batch_tasks_.end()) return c;
  for (const auto& id : it->second) {
    const Task& t = tasks_.at(id);
    if (t.deleted()) continue;
    switch (t.status) {
      case TaskStatus::completed: ++c.completed; break;
      case TaskStatus::failed:    ++c.failed; break;
      case TaskStatus::running:   ++c.running; break;
      case TaskStatus::pending:
      case TaskStatus::queued:    ++c.queued; break;
      case TaskStatus::cancelled: break;
    }
  }
  c.total = c.completed + c.failed + c.running + c.queued;
  return c;
}

std::vector<CreditTransaction> MemoryLedgerStore::transactions_for(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<CreditTransaction> out;
  for (const auto& tx : transactions_) {
    if (tx.owner == owner) out.push_back(tx);
  }
  return out;
}

std::vector<CreditTransaction> MemoryLedgerStore::all_transactions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return transactions_;
}

std::vector<std::string> MemoryLedgerStore::owners() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::set<std::string> seen;
  for (const auto& tx : transactions_) seen.insert(tx.owner);
  for (const auto& [id, b] : batches_) seen.insert(b.owner);
  return {seen.begin(), seen.end()};
}

int64_t MemoryLedgerStore::sum_deltas(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mu_);
  int64_t sum = 0;
  for (const auto& tx : transactions_) {
    if (tx.owner == owner) sum += tx.delta;
  }
  return sum;
}

bool MemoryLedgerStore::has_refund_for_task(const std::string& task_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& tx : transactions_) {
    if (tx.delta > 0 && tx.ref_task_id == task_id) return true;
  }
  return false;
}

std::optional<IdempotencyRecord> MemoryLedgerStore::get_idempotency(const std::string& owner,
                                                                    const std::string& key) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = idempotency_.find({owner, key});
  if (it == idempotency_.end()) return std::nullopt;
  return it->second;
}

std::string MemoryLedgerStore::backend_id() const {
  std::lock_guard<std::mutex> lk(mu_);
  return journal_ ? "memory+journal:" + journal_->path() : "memory";
}

uint64_t MemoryLedgerStore::journal_failures() const {
  std::lock_guard<std::mutex> lk(mu_);
  return journal_ ? journal_->failure_count() : 0;
}

uint64_t MemoryLedgerStore::journal_sequence() const {
  std::lock_guard<std::mutex> lk(mu_);
  return journal_ ? journal_->sequence() : 0;
}

}  // namespace genledger
