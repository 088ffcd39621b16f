#pragma once

// genledger/types.hpp — Records shared by the store, ledger, scheduler and
// reconciler.
//
// DESIGN INVARIANTS (must not be broken):
//   1. Task status only moves along the edges accepted by is_valid_transition().
//      The store rejects every other edge.
//   2. Batch::counters is derived data. Reconciler::recompute() is its only
//      writer; nothing increments it in place.
//   3. CreditTransaction rows are append-only. A user's balance is the sum of
//      delta over their rows; no balance field exists anywhere.
//   4. Timestamps are unix milliseconds. 0 means "unset".
//   5. Optional string fields use "" for absent (error_summary,
//      result_locator, ref_task_id, ...).

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "genledger/jsonlite.hpp"

namespace genledger {

// ---------------------------------------------------------------------------
// Task state machine
// ---------------------------------------------------------------------------
//   pending → queued → running → {completed, failed, cancelled}
//   failed  → queued                       (explicit retry)
//   {pending, queued, running} → cancelled (explicit cancel or batch deletion)
// completed and cancelled are terminal.
enum class TaskStatus {
  pending,
  queued,
  running,
  completed,
  failed,
  cancelled,
};

std::string to_string(TaskStatus s);
std::optional<TaskStatus> parse_task_status(const std::string& s);
bool is_valid_transition(TaskStatus from, TaskStatus to);

// pending, queued or running.
bool is_active(TaskStatus s);

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------

struct GenerationParams {
  std::string prompt;
  std::string model;
  std::string orientation;
  std::string size;
  uint32_t    duration_s{0};
  std::string media_reference;  // optional input image/video locator
};

// queued folds pending + queued. total excludes cancelled tasks.
struct BatchCounters {
  uint32_t total{0};
  uint32_t completed{0};
  uint32_t failed{0};
  uint32_t running{0};
  uint32_t queued{0};

  bool operator==(const BatchCounters&) const = default;
};

struct Batch {
  std::string      id;
  std::string      owner;
  GenerationParams params;
  uint32_t         requested_count{0};
  int64_t          unit_cost{0};      // price per task at admission; refunds use it
  BatchCounters    counters;
  uint64_t         created_at_ms{0};
  uint64_t         updated_at_ms{0};
  uint64_t         deleted_at_ms{0};

  bool deleted() const { return deleted_at_ms != 0; }
};

struct Task {
  std::string      id;
  std::string      batch_id;
  std::string      owner;
  GenerationParams params;
  TaskStatus       status{TaskStatus::pending};
  std::string      error_summary;
  std::string      result_locator;
  std::string      remote_job_handle;
  uint32_t         progress{0};       // 0..100, provider-reported
  uint32_t         retries{0};
  uint64_t         remote_started_at_ms{0};
  uint64_t         remote_finished_at_ms{0};
  uint64_t         created_at_ms{0};
  uint64_t         updated_at_ms{0};
  uint64_t         deleted_at_ms{0};

  bool deleted() const { return deleted_at_ms != 0; }
};

struct CreditTransaction {
  uint64_t    id{0};                  // assigned by the store, monotonic
  std::string owner;
  int64_t     delta{0};
  std::string reason;
  std::string ref_batch_id;
  std::string ref_task_id;
  uint64_t    created_at_ms{0};
};

struct IdempotencyRecord {
  std::string owner;
  std::string key;
  std::string batch_id;
  std::string request_digest;         // request_fingerprint() of the submission
  uint64_t    created_at_ms{0};
};

// Reason tags written to CreditTransaction::reason.
std::string debit_reason(const std::string& batch_id);
std::string refund_reason(const std::string& task_id);
std::string adjust_reason(const std::string& note);

// ---------------------------------------------------------------------------
// Time
// ---------------------------------------------------------------------------
using UnixMsClock = std::function<uint64_t()>;
uint64_t system_now_unix_ms();
UnixMsClock wall_clock();

// ---------------------------------------------------------------------------
// JSON (journal records and CLI responses)
// ---------------------------------------------------------------------------
std::string params_to_json(const GenerationParams& p);
std::string counters_to_json(const BatchCounters& c);
std::string batch_to_json(const Batch& b);
std::string task_to_json(const Task& t);
std::string transaction_to_json(const CreditTransaction& tx);
std::string idempotency_to_json(const IdempotencyRecord& r);

GenerationParams params_from_json(const jsonlite::Object& o);
BatchCounters counters_from_json(const jsonlite::Object& o);
Batch batch_from_json(const jsonlite::Object& o);
std::optional<Task> task_from_json(const jsonlite::Object& o);
CreditTransaction transaction_from_json(const jsonlite::Object& o);
IdempotencyRecord idempotency_from_json(const jsonlite::Object& o);

}  // namespace genledger
