#pragma once

// genledger/store.hpp — Ledger Store: the single source of truth for batches,
// tasks, credit transactions and idempotency records.
//
// DESIGN INVARIANTS (must not be broken):
//   1. Every mutation is atomic with respect to the rows it touches. A
//      conditional status change either applies completely or reports
//      StoreStatus::conflict with nothing written.
//   2. transition_task() is the claim primitive: "set status to `to` only if
//      current status is in `from`". Exactly one of N concurrent callers with
//      the same precondition observes ok; the rest observe conflict.
//   3. Transactions are append-only. There is no update or delete for them.
//   4. Soft-deleted tasks are invisible to tasks_for_batch(),
//      task_ids_with_status() and count_tasks_by_status(); they keep their
//      transactions.
//   5. Edges outside is_valid_transition() are refused (invalid_transition).
//
// EXTENSION_POINT: relational_backend
//   Current: MemoryLedgerStore, optionally durable through the journal.
//   Upgrade path: a SQL-backed ILedgerStore where transition_task() is
//   `UPDATE task SET status=? WHERE id=? AND status IN (...)` and the refund
//   dedup becomes a partial unique index on (ref_task_id) WHERE delta > 0.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "genledger/journal.hpp"
#include "genledger/types.hpp"

namespace genledger {

enum class StoreStatus {
  ok,
  not_found,
  conflict,            // precondition not met: zero rows affected
  invalid_transition,  // edge outside the task state machine
  write_failed,        // journal append failed; nothing applied
};

std::string to_string(StoreStatus s);

// Fields written alongside a status change or progress update.
// Unset optionals leave the stored value untouched.
struct TaskPatch {
  std::optional<std::string> error_summary;
  std::optional<std::string> result_locator;
  std::optional<std::string> remote_job_handle;
  std::optional<uint32_t>    progress;
  std::optional<uint64_t>    remote_started_at_ms;
  std::optional<uint64_t>    remote_finished_at_ms;
  bool                       bump_retries{false};
  // Precondition, not a write: the stored retries counter must equal this,
  // else conflict. Pins an execution unit's writes to the attempt it claimed.
  std::optional<uint32_t>    expected_retries;
};

// Everything an admitted submission writes, committed as one unit.
struct AdmissionRecord {
  Batch                            batch;
  std::vector<Task>                tasks;
  CreditTransaction                debit;
  std::optional<IdempotencyRecord> idempotency;
};

// ---------------------------------------------------------------------------
// ILedgerStore — abstract store interface
// ---------------------------------------------------------------------------
// Thread-safety: all implementations MUST be safe for concurrent calls.
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  // --- Mutations ---

  // Batch + tasks + debit + idempotency record, all or nothing.
  // Assigns the debit transaction id.
  virtual StoreStatus commit_admission(AdmissionRecord& rec) = 0;

  // Conditional status change. ok = one row affected.
  virtual StoreStatus transition_task(const std::string& task_id,
                                      const std::vector<TaskStatus>& from,
                                      TaskStatus to,
                                      const TaskPatch& patch,
                                      uint64_t now_ms) = 0;

  // Progress/heartbeat for a running task; refreshes updated_at.
  // conflict if the task is no longer running.
  virtual StoreStatus record_progress(const std::string& task_id,
                                      const TaskPatch& patch,
                                      uint64_t now_ms) = 0;

  // Assigns tx.id. created_at_ms must be set by the caller.
  virtual StoreStatus append_transaction(CreditTransaction& tx) = 0;

  virtual StoreStatus soft_delete_task(const std::string& task_id, uint64_t now_ms) = 0;

  // Marks the batch and all of its tasks deleted in one unit.
  virtual StoreStatus soft_delete_batch(const std::string& batch_id, uint64_t now_ms) = 0;

  virtual StoreStatus write_batch_counters(const std::string& batch_id,
                                           const BatchCounters& counters,
                                           uint64_t now_ms) = 0;

  // --- Reads ---

  virtual std::optional<Batch> get_batch(const std::string& batch_id) const = 0;
  virtual std::optional<Task> get_task(const std::string& task_id) const = 0;

  // Non-deleted batches of owner, newest first.
  virtual std::vector<Batch> list_batches(const std::string& owner,
                                          size_t offset, size_t limit) const = 0;
  virtual size_t count_batches(const std::string& owner) const = 0;

  // Non-deleted batch ids, creation order.
  virtual std::vector<std::string> live_batch_ids() const = 0;

  // Non-deleted tasks of a batch, creation order.
  virtual std::vector<Task> tasks_for_batch(const std::string& batch_id) const = 0;

  // Non-deleted task ids whose status is in `statuses`, creation order.
  virtual std::vector<std::string> task_ids_with_status(
      const std::vector<TaskStatus>& statuses) const = 0;

  // Fresh count of a batch's non-deleted tasks grouped by status.
  virtual BatchCounters count_tasks_by_status(const std::string& batch_id) const = 0;

  virtual std::vector<CreditTransaction> transactions_for(const std::string& owner) const = 0;
  virtual std::vector<CreditTransaction> all_transactions() const = 0;
  virtual std::vector<std::string> owners() const = 0;

  // Sum of delta over the owner's transactions.
  virtual int64_t sum_deltas(const std::string& owner) const = 0;

  // True if any transaction with delta > 0 references task_id.
  virtual bool has_refund_for_task(const std::string& task_id) const = 0;

  virtual std::optional<IdempotencyRecord> get_idempotency(const std::string& owner,
                                                           const std::string& key) const = 0;

  virtual std::string backend_id() const = 0;
  // Appends that failed and were reported as write_failed.
  virtual uint64_t journal_failures() const = 0;
  // Sequence number of the last committed journal line; 0 without a journal.
  virtual uint64_t journal_sequence() const = 0;
};

// ---------------------------------------------------------------------------
// MemoryLedgerStore
// ---------------------------------------------------------------------------
// Mutex-protected maps. With a journal attached, every mutation is appended
// to the journal before it is applied, and open() rebuilds state by replay.
class MemoryLedgerStore : public ILedgerStore {
 public:
  MemoryLedgerStore() = default;

  struct OpenResult {
    bool                               ok{false};
    std::unique_ptr<MemoryLedgerStore> store;
    ReplayResult                       replay;
    std::string                        error_code;
    std::string                        error_message;
  };

  // Replays `journal_path` (if it exists) and attaches it for appends.
  // An empty path yields a purely in-memory store. With read_only the torn
  // tail is left in place and no journal is attached (mutations stay in memory).
  static OpenResult open(const std::string& journal_path, bool read_only = false);

  StoreStatus commit_admission(AdmissionRecord& rec) override;
  StoreStatus transition_task(const std::string& task_id,
                              const std::vector<TaskStatus>& from,
                              TaskStatus to,
                              const TaskPatch& patch,
                              uint64_t now_ms) override;
  StoreStatus record_progress(const std::string& task_id,
                              const TaskPatch& patch,
                              uint64_t now_ms) override;
  StoreStatus append_transaction(CreditTransaction& tx) override;
  StoreStatus soft_delete_task(const std::string& task_id, uint64_t now_ms) override;
  StoreStatus soft_delete_batch(const std::string& batch_id, uint64_t now_ms) override;
  StoreStatus write_batch_counters(const std::string& batch_id,
                                   const BatchCounters& counters,
                                   uint64_t now_ms) override;

  std::optional<Batch> get_batch(const std::string& batch_id) const override;
  std::optional<Task> get_task(const std::string& task_id) const override;
  std::vector<Batch> list_batches(const std::string& owner,
                                  size_t offset, size_t limit) const override;
  size_t count_batches(const std::string& owner) const override;
  std::vector<std::string> live_batch_ids() const override;
  std::vector<Task> tasks_for_batch(const std::string& batch_id) const override;
  std::vector<std::string> task_ids_with_status(
      const std::vector<TaskStatus>& statuses) const override;
  BatchCounters count_tasks_by_status(const std::string& batch_id) const override;
  std::vector<CreditTransaction> transactions_for(const std::string& owner) const override;
  std::vector<CreditTransaction> all_transactions() const override;
  std::vector<std::string> owners() const override;
  int64_t sum_deltas(const std::string& owner) const override;
  bool has_refund_for_task(const std::string& task_id) const override;
  std::optional<IdempotencyRecord> get_idempotency(const std::string& owner,
                                                   const std::string& key) const override;
  std::string backend_id() const override;
  uint64_t journal_failures() const override;
  uint64_t journal_sequence() const override;

 private:
  // Journal first, then memory. Returns false when the journal refused.
  bool persist(const std::string& op, const std::string& data_json);

  // Replay entry point, one op per journal line.
  std::string apply_journal_op(const std::string& op, const jsonlite::Object& data);

  void apply_admission(const AdmissionRecord& rec);
  void apply_task(const Task& t);
  void apply_batch(const Batch& b);
  void apply_transaction(const CreditTransaction& tx);

  mutable std::mutex                                             mu_;
  std::map<std::string, Batch>                                   batches_;
  std::vector<std::string>                                       batch_order_;
  std::map<std::string, Task>                                    tasks_;
  std::map<std::string, std::vector<std::string>>                batch_tasks_;
  std::vector<std::string>                                       task_order_;
  std::vector<CreditTransaction>                                 transactions_;
  std::map<std::pair<std::string, std::string>, IdempotencyRecord> idempotency_;
  uint64_t                                                       next_tx_id_{1};
  std::unique_ptr<Journal>                                       journal_;
};

}  // namespace genledger
