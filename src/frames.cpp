#include "genledger/frames.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "genledger/admission.hpp"
#include "genledger/jsonlite.hpp"
#include "genledger/ledger.hpp"
#include "genledger/observability.hpp"
#include "genledger/service.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"
#include "genledger/version.hpp"
#include "genledger/worker.hpp"

namespace genledger {

namespace {

using jsonlite::Object;

// `body` is a comma-prefixed list of extra members, or empty.
std::string ok_frame(const std::string& id, const std::string& op, const std::string& body) {
  std::ostringstream o;
  o << "{\"ok\":true,\"v\":" << version::PROTOCOL_FRAMING_VERSION;
  if (!id.empty()) o << ",\"id\":\"" << jsonlite::escape(id) << "\"";
  o << ",\"op\":\"" << jsonlite::escape(op) << "\"" << body << "}";
  return o.str();
}

std::string service_frame(const std::string& id, const std::string& op, const ServiceResult& r) {
  return r.ok ? ok_frame(id, op, "") : error_frame(id, r.error_code, r.message);
}

std::string tasks_json(const std::vector<Task>& tasks) {
  std::string out = "[";
  for (size_t i = 0; i < tasks.size(); ++i) {
    if (i) out += ",";
    out += task_to_json(tasks[i]);
  }
  return out + "]";
}

// Absent → def. Present → must be an unsigned integer no larger than uint32.
std::optional<uint32_t> read_u32(const Object& req, const std::string& key, uint32_t def,
                                 std::string& why) {
  const auto it = req.find(key);
  if (it == req.end()) return def;
  if (!std::holds_alternative<std::uint64_t>(it->second.v)) {
    why = key + " must be a non-negative integer";
    return std::nullopt;
  }
  const auto u = std::get<std::uint64_t>(it->second.v);
  if (u > std::numeric_limits<uint32_t>::max()) {
    why = key + " out of range";
    return std::nullopt;
  }
  return static_cast<uint32_t>(u);
}

std::optional<int64_t> read_i64(const Object& req, const std::string& key, std::string& why) {
  const auto it = req.find(key);
  if (it == req.end()) {
    why = key + " required";
    return std::nullopt;
  }
  if (std::holds_alternative<std::int64_t>(it->second.v)) return std::get<std::int64_t>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    const auto u = std::get<std::uint64_t>(it->second.v);
    if (u <= static_cast<std::uint64_t>(std::numeric_limits<int64_t>::max())) {
      return static_cast<int64_t>(u);
    }
  }
  why = key + " must be a 64-bit integer";
  return std::nullopt;
}

std::string stats_body(LedgerService& svc) {
  const auto health = worker_health_snapshot(&svc.scheduler(), svc.config().global_concurrency);
  return ",\"stats\":" + global_stats().to_json() +
         ",\"health\":" + worker_health_to_json(health) +
         ",\"store\":{\"backend\":\"" + jsonlite::escape(svc.store().backend_id()) +
         "\",\"journal_failures\":" + std::to_string(svc.store().journal_failures()) +
         ",\"journal_sequence\":" + std::to_string(svc.store().journal_sequence()) + "}";
}

}  // namespace

std::string error_frame(const std::string& id, const std::string& code, const std::string& message) {
  std::ostringstream o;
  o << "{\"ok\":false,\"v\":" << version::PROTOCOL_FRAMING_VERSION;
  if (!id.empty()) o << ",\"id\":\"" << jsonlite::escape(id) << "\"";
  o << ",\"error\":{\"code\":\"" << jsonlite::escape(code) << "\",\"message\":\""
    << jsonlite::escape(message) << "\"}}";
  return o.str();
}

std::string handle_frame(LedgerService& svc, const std::string& line) {
  namespace jl = jsonlite;
  std::optional<jl::JsonError> err;
  const Object req = jl::parse(line, &err);
  if (err) return error_frame("", "bad_frame", err->code + ": " + err->message);

  const std::string id = jl::get_string(req, "id");
  const std::string op = jl::get_string(req, "op");
  const std::string owner = jl::get_string(req, "owner");
  std::string why;

  if (op == "submit") {
    const auto duration = read_u32(req, "duration", 10, why);
    const auto count = duration ? read_u32(req, "count", 1, why) : std::nullopt;
    if (!duration || !count) return error_frame(id, "validation", why);
    SubmitRequest sr;
    sr.params.prompt = jl::get_string(req, "prompt");
    sr.params.model = jl::get_string(req, "model", "sora-2");
    sr.params.orientation = jl::get_string(req, "orientation", "portrait");
    sr.params.size = jl::get_string(req, "size", "small");
    sr.params.duration_s = *duration;
    sr.params.media_reference = jl::get_string(req, "media_reference");
    sr.count = *count;
    sr.idempotency_key = jl::get_string(req, "idempotency_key");
    const auto r = svc.submit_batch(owner, sr);
    if (!r.ok) return error_frame(id, to_string(r.error), r.message);
    std::ostringstream b;
    b << ",\"batch_id\":\"" << r.batch_id << "\",\"replayed\":" << (r.replayed ? "true" : "false")
      << ",\"total_cost\":" << r.total_cost;
    return ok_frame(id, op, b.str());
  }

  if (op == "list_batches") {
    const auto page_no = read_u32(req, "page", 1, why);
    const auto page_size = page_no ? read_u32(req, "page_size", 20, why) : std::nullopt;
    if (!page_no || !page_size) return error_frame(id, "validation", why);
    const auto page = svc.list_batches(owner, *page_no, *page_size);
    if (!page.result.ok) return error_frame(id, page.result.error_code, page.result.message);
    std::ostringstream b;
    b << ",\"total\":" << page.total << ",\"page\":" << page.page
      << ",\"page_size\":" << page.page_size << ",\"batches\":[";
    for (size_t i = 0; i < page.batches.size(); ++i) {
      if (i) b << ",";
      b << batch_to_json(page.batches[i]);
    }
    b << "]";
    return ok_frame(id, op, b.str());
  }

  if (op == "list_tasks") {
    const auto list = svc.list_tasks(owner, jl::get_string(req, "batch_id"));
    if (!list.result.ok) return error_frame(id, list.result.error_code, list.result.message);
    return ok_frame(id, op,
                    ",\"batch\":" + batch_to_json(*list.batch) + ",\"tasks\":" + tasks_json(list.tasks));
  }

  if (op == "get_task") {
    const auto t = svc.get_task(owner, jl::get_string(req, "task_id"));
    if (!t.result.ok) return error_frame(id, t.result.error_code, t.result.message);
    return ok_frame(id, op, ",\"task\":" + task_to_json(*t.task));
  }

  if (op == "retry") return service_frame(id, op, svc.retry_task(owner, jl::get_string(req, "task_id")));
  if (op == "cancel") return service_frame(id, op, svc.cancel_task(owner, jl::get_string(req, "task_id")));
  if (op == "delete_task") {
    return service_frame(id, op, svc.delete_task(owner, jl::get_string(req, "task_id")));
  }
  if (op == "delete_batch") {
    return service_frame(id, op, svc.delete_batch(owner, jl::get_string(req, "batch_id")));
  }

  if (op == "balance") {
    if (owner.empty()) return error_frame(id, "validation", "owner required");
    return ok_frame(id, op, ",\"balance\":" + std::to_string(svc.balance(owner)));
  }

  if (op == "transactions") {
    const auto txs = svc.transactions(owner);
    std::string b = ",\"transactions\":[";
    for (size_t i = 0; i < txs.size(); ++i) {
      if (i) b += ",";
      b += transaction_to_json(txs[i]);
    }
    return ok_frame(id, op, b + "]");
  }

  if (op == "adjust") {
    const auto delta = read_i64(req, "delta", why);
    if (!delta) return error_frame(id, "validation", why);
    const auto r = svc.admin_adjust(owner, *delta, jl::get_string(req, "reason"));
    if (!r.ok) return error_frame(id, r.error_code, r.message);
    return ok_frame(id, op,
                    ",\"balance\":" + std::to_string(r.balance) + ",\"tx_id\":" + std::to_string(r.tx_id));
  }

  if (op == "sweep") return ok_frame(id, op, ",\"report\":" + svc.sweep().to_json());
  if (op == "stats") return ok_frame(id, op, stats_body(svc));

  return error_frame(id, "unknown_op", "unknown op '" + op + "'");
}

VerifyOutcome verify_journal(const std::string& path) {
  VerifyOutcome out;
  auto opened = MemoryLedgerStore::open(path, /*read_only=*/true);
  if (!opened.ok) {
    out.report_json = "{\"ok\":false,\"error\":{\"code\":\"" + jsonlite::escape(opened.error_code) +
                      "\",\"message\":\"" + jsonlite::escape(opened.error_message) + "\"}}";
    return out;
  }
  CreditLedger ledger(*opened.store, wall_clock());
  const std::string verdict = ledger.verify_invariants();
  std::ostringstream o;
  o << "{\"ok\":" << (verdict.empty() ? "true" : "false")
    << ",\"entries\":" << opened.replay.entries
    << ",\"last_sequence\":" << opened.replay.last_sequence
    << ",\"torn_tail\":" << (opened.replay.torn_tail ? "true" : "false")
    << ",\"owners\":" << opened.store->owners().size();
  if (!verdict.empty()) o << ",\"violation\":\"" << jsonlite::escape(verdict) << "\"";
  o << "}";
  out.report_json = o.str();
  out.exit_code = verdict.empty() ? 0 : 2;
  return out;
}

}  // namespace genledger
