#pragma once

// genledger/reconciler.hpp — Heals drift between recorded and actual task
// state, and owns batch aggregates.
//
// Rules, applied per non-deleted task of a batch:
//   heal   running + result_locator set       → completed
//   stale  running + no update for stale_running_ms
//                                             → failed ("timeout: no provider update") + refund
//   repair failed  + no refund on record      → refund
// then recompute(batch) writes counters from a fresh count.
//
// INVARIANTS:
//   1. recompute() is the only writer of Batch::counters.
//   2. Every correction is a conditional store transition; losing a race to
//      the scheduler is a no-op, not an error.
//   3. Nothing here throws to the caller. Failed corrective writes are logged,
//      counted (reconcile_errors) and retried on the next pass.

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "genledger/config.hpp"
#include "genledger/ledger.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"

namespace genledger {

struct ReconcileReport {
  uint32_t batches{0};
  uint32_t healed{0};
  uint32_t stale_failed{0};
  uint32_t refunds{0};
  uint32_t errors{0};

  ReconcileReport& operator+=(const ReconcileReport& o);
  std::string to_json() const;
};

class Reconciler {
 public:
  Reconciler(ILedgerStore& store, CreditLedger& ledger, const Config& config, UnixMsClock clock);
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  ReconcileReport reconcile_batch(const std::string& batch_id);

  // Fresh count → Batch::counters. false when the write failed.
  bool recompute(const std::string& batch_id);

  // reconcile_batch() over every non-deleted batch.
  ReconcileReport sweep();

  // Background sweep every sweep_interval_ms.
  void start();
  void stop();
  bool running() const;

 private:
  void worker_loop();
  void refund(const Task& t, ReconcileReport& report);

  ILedgerStore&           store_;
  CreditLedger&           ledger_;
  Config                  config_;
  UnixMsClock             clock_;

  std::thread             worker_;
  mutable std::mutex      mu_;
  std::condition_variable cv_;
  std::atomic<bool>       stopping_{false};
};

}  // namespace genledger
