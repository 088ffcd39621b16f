#include "genledger/admission.hpp"

#include "genledger/hash.hpp"
#include "genledger/observability.hpp"

#include <sstream>
#include <utility>

namespace genledger {

namespace {

std::string trim(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

}  // namespace

std::string to_string(SubmitError e) {
  switch (e) {
    case SubmitError::none:               return "none";
    case SubmitError::validation:         return "validation";
    case SubmitError::insufficient_funds: return "insufficient_funds";
    case SubmitError::rate_limited:       return "rate_limited";
    case SubmitError::duplicate:          return "duplicate";
    case SubmitError::store_write_failed: return "store_write_failed";
  }
  return "none";
}

size_t utf8_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if ((c & 0xC0) != 0x80) ++n;
  }
  return n;
}

std::string submit_fingerprint(const SubmitRequest& req) {
  std::ostringstream o;
  o << "{\"count\":" << req.count << ",\"params\":" << params_to_json(req.params) << "}";
  return request_fingerprint(o.str());
}

AdmissionController::AdmissionController(ILedgerStore& store, CreditLedger& ledger,
                                         const PriceTable& prices, Reconciler& reconciler,
                                         const Config& config, UnixMsClock clock)
    : store_(store),
      ledger_(ledger),
      prices_(prices),
      reconciler_(reconciler),
      config_(config),
      clock_(clock),
      limiter_(config.rate_limit_per_window, config.rate_window_ms, clock) {}

void AdmissionController::set_dispatch(DispatchFn fn) {
  std::lock_guard<std::mutex> lk(mu_);
  dispatch_ = std::move(fn);
}

SubmitResult AdmissionController::reject(const std::string& owner, SubmitError e,
                                         std::string message) const {
  SubmitResult r;
  r.error = e;
  r.message = std::move(message);
  LedgerEvent ev;
  ev.kind = EventKind::rejected;
  ev.owner = owner;
  ev.detail = to_string(e);
  emit_event(ev);
  return r;
}

std::string AdmissionController::validate(const std::string& owner, SubmitRequest& req) const {
  if (owner.empty()) return "owner required";
  req.params.prompt = trim(req.params.prompt);
  if (req.params.prompt.empty()) return "prompt required";
  if (utf8_length(req.params.prompt) > config_.max_prompt_chars) {
    return "prompt exceeds " + std::to_string(config_.max_prompt_chars) + " characters";
  }
  if (req.count < 1 || req.count > config_.max_tasks_per_batch) {
    return "count must be 1.." + std::to_string(config_.max_tasks_per_batch);
  }
  const PriceValidation pv = prices_.validate(req.params);
  if (!pv.ok) return pv.message;
  return "";
}

SubmitResult AdmissionController::submit(const std::string& owner, const SubmitRequest& in) {
  std::lock_guard<std::mutex> lk(mu_);
  SubmitRequest req = in;

  // 1. validation
  if (auto err = validate(owner, req); !err.empty()) {
    return reject(owner, SubmitError::validation, err);
  }
  const std::string fingerprint = submit_fingerprint(req);
  const uint64_t now = clock_();

  // 2. idempotency replay
  if (!req.idempotency_key.empty()) {
    const auto prior = store_.get_idempotency(owner, req.idempotency_key);
    if (prior && now >= prior->created_at_ms &&
        now - prior->created_at_ms < config_.idempotency_window_ms) {
      // Soft-deleted batches still replay: the key stays spent for its window.
      const auto batch = store_.get_batch(prior->batch_id);
      if (!batch) {
        return reject(owner, SubmitError::duplicate,
                      "idempotency key bound to unknown batch " + prior->batch_id);
      }
      if (prior->request_digest != fingerprint) {
        log(LogLevel::warn, "admission",
            "idempotency key reused with a different request; replaying batch " + batch->id);
      }
      SubmitResult r;
      r.ok = true;
      r.batch_id = batch->id;
      r.replayed = true;
      r.total_cost = batch->unit_cost * static_cast<int64_t>(batch->requested_count);
      LedgerEvent ev;
      ev.kind = EventKind::replayed;
      ev.owner = owner;
      ev.batch_id = batch->id;
      emit_event(ev);
      return r;
    }
  }

  // 3. rate limit
  if (!limiter_.allow(owner)) {
    return reject(owner, SubmitError::rate_limited,
                  "more than " + std::to_string(config_.rate_limit_per_window) +
                      " submissions in " + std::to_string(config_.rate_window_ms) + "ms");
  }

  // 4. funds
  const int64_t unit = prices_.unit_cost(req.params.model, req.params.duration_s, req.params.size);
  const int64_t total = unit * static_cast<int64_t>(req.count);
  const int64_t balance = ledger_.balance(owner);
  if (balance < total) {
    return reject(owner, SubmitError::insufficient_funds,
                  "balance " + std::to_string(balance) + " < cost " + std::to_string(total));
  }

  // 5. commit
  AdmissionRecord rec;
  rec.batch.id = make_record_id("bat");
  rec.batch.owner = owner;
  rec.batch.params = req.params;
  rec.batch.requested_count = req.count;
  rec.batch.unit_cost = unit;
  rec.batch.created_at_ms = now;
  rec.batch.updated_at_ms = now;
  rec.tasks.reserve(req.count);
  for (uint32_t i = 0; i < req.count; ++i) {
    Task t;
    t.id = make_record_id("tsk");
    t.batch_id = rec.batch.id;
    t.owner = owner;
    t.params = req.params;
    t.status = TaskStatus::queued;
    t.created_at_ms = now;
    t.updated_at_ms = now;
    rec.tasks.push_back(std::move(t));
  }
  rec.debit = ledger_.make_debit(owner, rec.batch.id, total);
  if (!req.idempotency_key.empty()) {
    IdempotencyRecord idem;
    idem.owner = owner;
    idem.key = req.idempotency_key;
    idem.batch_id = rec.batch.id;
    idem.request_digest = fingerprint;
    idem.created_at_ms = now;
    rec.idempotency = idem;
  }

  const StoreStatus st = store_.commit_admission(rec);
  if (st != StoreStatus::ok) {
    log(LogLevel::error, "admission", "commit failed: " + to_string(st));
    return reject(owner, SubmitError::store_write_failed, "admission not recorded");
  }

  LedgerEvent ev;
  ev.kind = EventKind::admitted;
  ev.owner = owner;
  ev.batch_id = rec.batch.id;
  ev.delta = rec.debit.delta;
  emit_event(ev);

  // 6. dispatch
  if (dispatch_) {
    std::vector<std::string> ids;
    ids.reserve(rec.tasks.size());
    for (const auto& t : rec.tasks) ids.push_back(t.id);
    dispatch_(ids);
  }

  // 7. aggregates
  reconciler_.recompute(rec.batch.id);

  SubmitResult r;
  r.ok = true;
  r.batch_id = rec.batch.id;
  r.total_cost = total;
  return r;
}

}  // namespace genledger
