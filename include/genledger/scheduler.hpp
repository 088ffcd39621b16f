#pragma once

// genledger/scheduler.hpp — Scheduler/Executor.
//
// DESIGN:
//   One scheduling loop per Scheduler instance, ticking every
//   tick_interval_ms (and woken early by enqueue/unit exit). Each tick looks
//   at the queue HEAD only:
//     - head would exceed the global or the owner's in-flight cap → defer;
//       the loop does not look past the head (head-of-line blocking);
//     - otherwise claim it: transition_task({pending, queued} → running).
//       conflict → pop and drop (another actor owns it); ok → pop, count it
//       in flight and launch an execution unit (std::async future).
//   An execution unit checks cancellation once, creates the remote job and
//   polls it every poll_interval_ms until a terminal status or max_poll_ms.
//   Its result is an ExecOutcome; exceptions from the client are converted to
//   provider_error at the unit boundary.
//
// INVARIANTS:
//   1. The queue holds task ids only and is never the source of truth.
//      start() rebuilds it from the store (pending/queued, creation order).
//   2. inflight() ≤ global_concurrency and inflight_for(o) ≤
//      per_owner_concurrency at every observable instant. Counters move only
//      at claim (+1) and unit exit (−1), under mu_.
//   3. Terminal writes are conditional on running. A unit that loses the race
//      (cancel, stale sweep) discards its result without side effects.
//   4. The refund is attempted only after running → failed succeeded.
//
// SHUTDOWN:
//   stop() wakes every poll wait. Units still polling end as `cancelled` and
//   leave their task running; the reconciler's stale rule finalizes them.

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "genledger/config.hpp"
#include "genledger/ledger.hpp"
#include "genledger/reconciler.hpp"
#include "genledger/remote_client.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"

namespace genledger {

enum class ExecKind {
  none,            // completed with a locator
  provider_error,
  timeout,
  claim_lost,
  cancelled,
};

std::string to_string(ExecKind k);

struct ExecOutcome {
  ExecKind    kind{ExecKind::none};
  std::string message;
  std::string locator;
};

enum class TickResult {
  idle,       // queue empty
  deferred,   // head blocked by a cap
  claimed,    // head claimed and launched
  dropped,    // head was not claimable
};


// Cuts s to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_summary(const std::string& s, size_t max_bytes);

class Scheduler {
 public:
  Scheduler(ILedgerStore& store, CreditLedger& ledger, IRemoteJobClient& client,
            Reconciler& reconciler, const Config& config, UnixMsClock clock);
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // rebuild_queue() + scheduling loop thread.
  void start();
  void stop();
  bool running() const;

  // Replaces the queue with every pending/queued task in the store.
  size_t rebuild_queue();

  void enqueue(const std::string& task_id);
  void enqueue(const std::vector<std::string>& task_ids);

  // One scheduling decision. The loop calls this; tests drive it directly.
  TickResult tick();

  size_t queue_depth() const;
  uint32_t inflight() const;
  uint32_t inflight_for(const std::string& owner) const;

  // Queue empty and nothing in flight, or timeout.
  bool wait_idle(std::chrono::milliseconds timeout);

  // Collects finished execution units. Returns how many were reaped.
  size_t reap();

 private:
  void loop();
  void run_unit(Task task);
  ExecOutcome execute(const Task& task);
  void finalize(const Task& task, const ExecOutcome& outcome, uint64_t duration_ns);
  void release(const std::string& owner);

  // Sleeps up to `d`; false when stop() was requested.
  bool pause(std::chrono::milliseconds d);

  ILedgerStore&     store_;
  CreditLedger&     ledger_;
  IRemoteJobClient& client_;
  Reconciler&       reconciler_;
  Config            config_;
  UnixMsClock       clock_;

  mutable std::mutex               mu_;
  std::condition_variable          wake_cv_;
  std::condition_variable          idle_cv_;
  std::deque<std::string>          queue_;
  uint32_t                         inflight_{0};
  std::map<std::string, uint32_t>  inflight_by_owner_;
  std::list<std::future<void>>     units_;
  bool                             wake_{false};

  std::mutex                       stop_mu_;
  std::condition_variable          stop_cv_;
  bool                             stopping_{false};

  std::thread                      loop_thread_;
};

}  // namespace genledger
