#include "genledger/types.hpp"

#include <chrono>
#include <sstream>

namespace genledger {

std::string to_string(TaskStatus s) {
  switch (s) {
    case TaskStatus::pending:   return "pending";
    case TaskStatus::queued:    return "queued";
    case TaskStatus::running:   return "running";
    case TaskStatus::completed: return "completed";
    case TaskStatus::failed:    return "failed";
    case TaskStatus::cancelled: return "cancelled";
  }
  return "pending";
}

std::optional<TaskStatus> parse_task_status(const std::string& s) {
  if (s == "pending")   return TaskStatus::pending;
  if (s == "queued")    return TaskStatus::queued;
  if (s == "running")   return TaskStatus::running;
  if (s == "completed") return TaskStatus::completed;
  if (s == "failed")    return TaskStatus::failed;
  if (s == "cancelled") return TaskStatus::cancelled;
  return std::nullopt;
}

bool is_valid_transition(TaskStatus from, TaskStatus to) {
  switch (from) {
    case TaskStatus::pending:
      return to == TaskStatus::queued || to == TaskStatus::running ||
             to == TaskStatus::cancelled;
    case TaskStatus::queued:
      return to == TaskStatus::running || to == TaskStatus::cancelled;
    case TaskStatus::running:
      return to == TaskStatus::completed || to == TaskStatus::failed ||
             to == TaskStatus::cancelled;
    case TaskStatus::failed:
      return to == TaskStatus::queued;
    case TaskStatus::completed:
    case TaskStatus::cancelled:
      return false;
  }
  return false;
}

bool is_active(TaskStatus s) {
  return s == TaskStatus::pending || s == TaskStatus::queued || s == TaskStatus::running;
}

std::string debit_reason(const std::string& batch_id) { return "debit_batch:" + batch_id; }
std::string refund_reason(const std::string& task_id) { return "refund_task:" + task_id; }
std::string adjust_reason(const std::string& note) { return "admin_adjust:" + note; }

uint64_t system_now_unix_ms() {
  using SC = std::chrono::system_clock;
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(SC::now().time_since_epoch()).count());
}

UnixMsClock wall_clock() { return [] { return system_now_unix_ms(); }; }

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

namespace {
std::string q(const std::string& s) { return "\"" + jsonlite::escape(s) + "\""; }
}  // namespace

std::string params_to_json(const GenerationParams& p) {
  std::ostringstream o;
  o << "{"
    << "\"prompt\":" << q(p.prompt)
    << ",\"model\":" << q(p.model)
    << ",\"orientation\":" << q(p.orientation)
    << ",\"size\":" << q(p.size)
    << ",\"duration_s\":" << p.duration_s
    << ",\"media_reference\":" << q(p.media_reference)
    << "}";
  return o.str();
}

std::string counters_to_json(const BatchCounters& c) {
  std::ostringstream o;
  o << "{\"total\":" << c.total << ",\"completed\":" << c.completed
    << ",\"failed\":" << c.failed << ",\"running\":" << c.running
    << ",\"queued\":" << c.queued << "}";
  return o.str();
}

std::string batch_to_json(const Batch& b) {
  std::ostringstream o;
  o << "{"
    << "\"id\":" << q(b.id)
    << ",\"owner\":" << q(b.owner)
    << ",\"params\":" << params_to_json(b.params)
    << ",\"requested_count\":" << b.requested_count
    << ",\"unit_cost\":" << b.unit_cost
    << ",\"counters\":" << counters_to_json(b.counters)
    << ",\"created_at_ms\":" << b.created_at_ms
    << ",\"updated_at_ms\":" << b.updated_at_ms
    << ",\"deleted_at_ms\":" << b.deleted_at_ms
    << "}";
  return o.str();
}

std::string task_to_json(const Task& t) {
  std::ostringstream o;
  o << "{"
    << "\"id\":" << q(t.id)
    << ",\"batch_id\":" << q(t.batch_id)
    << ",\"owner\":" << q(t.owner)
    << ",\"params\":" << params_to_json(t.params)
    << ",\"status\":" << q(to_string(t.status))
    << ",\"error_summary\":" << q(t.error_summary)
    << ",\"result_locator\":" << q(t.result_locator)
    << ",\"remote_job_handle\":" << q(t.remote_job_handle)
    << ",\"progress\":" << t.progress
    << ",\"retries\":" << t.retries
    << ",\"remote_started_at_ms\":" << t.remote_started_at_ms
    << ",\"remote_finished_at_ms\":" << t.remote_finished_at_ms
    << ",\"created_at_ms\":" << t.created_at_ms
    << ",\"updated_at_ms\":" << t.updated_at_ms
    << ",\"deleted_at_ms\":" << t.deleted_at_ms
    << "}";
  return o.str();
}

std::string transaction_to_json(const CreditTransaction& tx) {
  std::ostringstream o;
  o << "{"
    << "\"id\":" << tx.id
    << ",\"owner\":" << q(tx.owner)
    << ",\"delta\":" << tx.delta
    << ",\"reason\":" << q(tx.reason)
    << ",\"ref_batch_id\":" << q(tx.ref_batch_id)
    << ",\"ref_task_id\":" << q(tx.ref_task_id)
    << ",\"created_at_ms\":" << tx.created_at_ms
    << "}";
  return o.str();
}

std::string idempotency_to_json(const IdempotencyRecord& r) {
  std::ostringstream o;
  o << "{"
    << "\"owner\":" << q(r.owner)
    << ",\"key\":" << q(r.key)
    << ",\"batch_id\":" << q(r.batch_id)
    << ",\"request_digest\":" << q(r.request_digest)
    << ",\"created_at_ms\":" << r.created_at_ms
    << "}";
  return o.str();
}

GenerationParams params_from_json(const jsonlite::Object& o) {
  GenerationParams p;
  p.prompt = jsonlite::get_string(o, "prompt");
  p.model = jsonlite::get_string(o, "model");
  p.orientation = jsonlite::get_string(o, "orientation");
  p.size = jsonlite::get_string(o, "size");
  p.duration_s = static_cast<uint32_t>(jsonlite::get_u64(o, "duration_s"));
  p.media_reference = jsonlite::get_string(o, "media_reference");
  return p;
}

BatchCounters counters_from_json(const jsonlite::Object& o) {
  BatchCounters c;
  c.total = static_cast<uint32_t>(jsonlite::get_u64(o, "total"));
  c.completed = static_cast<uint32_t>(jsonlite::get_u64(o, "completed"));
  c.failed = static_cast<uint32_t>(jsonlite::get_u64(o, "failed"));
  c.running = static_cast<uint32_t>(jsonlite::get_u64(o, "running"));
  c.queued = static_cast<uint32_t>(jsonlite::get_u64(o, "queued"));
  return c;
}

Batch batch_from_json(const jsonlite::Object& o) {
  Batch b;
  b.id = jsonlite::get_string(o, "id");
  b.owner = jsonlite::get_string(o, "owner");
  b.params = params_from_json(jsonlite::get_object(o, "params"));
  b.requested_count = static_cast<uint32_t>(jsonlite::get_u64(o, "requested_count"));
  b.unit_cost = jsonlite::get_i64(o, "unit_cost");
  b.counters = counters_from_json(jsonlite::get_object(o, "counters"));
  b.created_at_ms = jsonlite::get_u64(o, "created_at_ms");
  b.updated_at_ms = jsonlite::get_u64(o, "updated_at_ms");
  b.deleted_at_ms = jsonlite::get_u64(o, "deleted_at_ms");
  return b;
}

std::optional<Task> task_from_json(const jsonlite::Object& o) {
  auto status = parse_task_status(jsonlite::get_string(o, "status"));
  if (!status) return std::nullopt;
  Task t;
  t.id = jsonlite::get_string(o, "id");
  t.batch_id = jsonlite::get_string(o, "batch_id");
  t.owner = jsonlite::get_string(o, "owner");
  t.params = params_from_json(jsonlite::get_object(o, "params"));
  t.status = *status;
  t.error_summary = jsonlite::get_string(o, "error_summary");
  t.result_locator = jsonlite::get_string(o, "result_locator");
  t.remote_job_handle = jsonlite::get_string(o, "remote_job_handle");
  t.progress = static_cast<uint32_t>(jsonlite::get_u64(o, "progress"));
  t.retries = static_cast<uint32_t>(jsonlite::get_u64(o, "retries"));
  t.remote_started_at_ms = jsonlite::get_u64(o, "remote_started_at_ms");
  t.remote_finished_at_ms = jsonlite::get_u64(o, "remote_finished_at_ms");
  t.created_at_ms = jsonlite::get_u64(o, "created_at_ms");
  t.updated_at_ms = jsonlite::get_u64(o, "updated_at_ms");
  t.deleted_at_ms = jsonlite::get_u64(o, "deleted_at_ms");
  return t;
}

CreditTransaction transaction_from_json(const jsonlite::Object& o) {
  CreditTransaction tx;
  tx.id = jsonlite::get_u64(o, "id");
  tx.owner = jsonlite::get_string(o, "owner");
  tx.delta = jsonlite::get_i64(o, "delta");
  tx.reason = jsonlite::get_string(o, "reason");
  tx.ref_batch_id = jsonlite::get_string(o, "ref_batch_id");
  tx.ref_task_id = jsonlite::get_string(o, "ref_task_id");
  tx.created_at_ms = jsonlite::get_u64(o, "created_at_ms");
  return tx;
}

IdempotencyRecord idempotency_from_json(const jsonlite::Object& o) {
  IdempotencyRecord r;
  r.owner = jsonlite::get_string(o, "owner");
  r.key = jsonlite::get_string(o, "key");
  r.batch_id = jsonlite::get_string(o, "batch_id");
  r.request_digest = jsonlite::get_string(o, "request_digest");
  r.created_at_ms = jsonlite::get_u64(o, "created_at_ms");
  return r;
}

}  // namespace genledger
