#pragma once

// genledger/service.hpp — User-facing operations over one wired subsystem.
//
// LedgerService owns the ledger, reconciler, scheduler and admission
// controller and wires them: admission dispatches into the scheduler, every
// component recomputes through the same reconciler. The store, the remote
// client and the price table are borrowed and must outlive the service.
//
// Ownership: an operation naming another owner's batch or task reports
// not_found, exactly as if it did not exist.
//
// Error codes: not_found | invalid_state | validation | store_write_failed.

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "genledger/admission.hpp"
#include "genledger/config.hpp"
#include "genledger/ledger.hpp"
#include "genledger/pricing.hpp"
#include "genledger/reconciler.hpp"
#include "genledger/remote_client.hpp"
#include "genledger/scheduler.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"

namespace genledger {

struct ServiceResult {
  bool        ok{false};
  std::string error_code;
  std::string message;

  static ServiceResult success() { return ServiceResult{true, "", ""}; }
  static ServiceResult failure(std::string code, std::string message) {
    return ServiceResult{false, std::move(code), std::move(message)};
  }
};

struct BatchPage {
  ServiceResult      result;
  std::vector<Batch> batches;
  size_t             total{0};
  uint32_t           page{1};
  uint32_t           page_size{0};
};

struct TaskList {
  ServiceResult     result;
  std::optional<Batch> batch;
  std::vector<Task> tasks;
};

struct TaskLookup {
  ServiceResult       result;
  std::optional<Task> task;
};

constexpr uint32_t kMaxPageSize = 50;

class LedgerService {
 public:
  LedgerService(ILedgerStore& store, IRemoteJobClient& client, const PriceTable& prices,
                const Config& config, UnixMsClock clock);
  ~LedgerService();

  LedgerService(const LedgerService&) = delete;
  LedgerService& operator=(const LedgerService&) = delete;

  // Scheduler loop + background reconciler.
  void start();
  void stop();

  SubmitResult submit_batch(const std::string& owner, const SubmitRequest& req);

  // page is 1-based; page_size 1..kMaxPageSize.
  BatchPage list_batches(const std::string& owner, uint32_t page, uint32_t page_size);

  // Reconciles the batch before reading it.
  TaskList list_tasks(const std::string& owner, const std::string& batch_id);

  TaskLookup get_task(const std::string& owner, const std::string& task_id);

  // failed → queued; clears error and locator; retries + 1; re-enters the queue.
  ServiceResult retry_task(const std::string& owner, const std::string& task_id);

  // {pending, queued, running} → cancelled. Cancelled tasks keep their debit.
  ServiceResult cancel_task(const std::string& owner, const std::string& task_id);

  // Cancels the task if still active, then soft-deletes it.
  ServiceResult delete_task(const std::string& owner, const std::string& task_id);

  // Cancels active tasks, then soft-deletes the batch and all its tasks.
  ServiceResult delete_batch(const std::string& owner, const std::string& batch_id);

  int64_t balance(const std::string& owner) const;
  std::vector<CreditTransaction> transactions(const std::string& owner) const;
  AdjustResult admin_adjust(const std::string& owner, int64_t delta, const std::string& note);

  ReconcileReport sweep();

  ILedgerStore&        store() { return store_; }
  CreditLedger&        ledger() { return ledger_; }
  Reconciler&          reconciler() { return reconciler_; }
  Scheduler&           scheduler() { return scheduler_; }
  const Config&        config() const { return config_; }

 private:
  std::optional<Task> owned_task(const std::string& owner, const std::string& task_id) const;
  std::optional<Batch> owned_batch(const std::string& owner, const std::string& batch_id) const;
  StoreStatus cancel(const Task& t, uint64_t now);

  ILedgerStore&       store_;
  Config              config_;
  UnixMsClock         clock_;
  CreditLedger        ledger_;
  Reconciler          reconciler_;
  Scheduler           scheduler_;
  AdmissionController admission_;
};

}  // namespace genledger
