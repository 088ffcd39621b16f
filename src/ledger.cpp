#include "genledger/ledger.hpp"

#include "genledger/observability.hpp"

#include <map>

namespace genledger {

CreditLedger::CreditLedger(ILedgerStore& store, UnixMsClock clock)
    : store_(store), clock_(std::move(clock)) {}

int64_t CreditLedger::balance(const std::string& owner) const {
  return store_.sum_deltas(owner);
}

CreditTransaction CreditLedger::make_debit(const std::string& owner, const std::string& batch_id,
                                           int64_t total) const {
  CreditTransaction tx;
  tx.owner = owner;
  tx.delta = -total;
  tx.reason = debit_reason(batch_id);
  tx.ref_batch_id = batch_id;
  tx.created_at_ms = clock_();
  return tx;
}

RefundOutcome CreditLedger::refund_task(const std::string& task_id) {
  RefundOutcome out;
  const auto task = store_.get_task(task_id);
  if (!task) {
    out.error_code = "not_found";
    return out;
  }
  if (task->status != TaskStatus::failed) {
    out.error_code = "not_refundable";
    return out;
  }
  const auto batch = store_.get_batch(task->batch_id);
  if (!batch) {
    out.error_code = "not_found";
    return out;
  }

  std::lock_guard<std::mutex> lk(refund_mu_);
  if (store_.has_refund_for_task(task_id)) {
    out.ok = true;
    out.already_refunded = true;
    LedgerEvent ev;
    ev.kind = EventKind::refund_skipped;
    ev.owner = task->owner;
    ev.batch_id = task->batch_id;
    ev.task_id = task_id;
    emit_event(ev);
    return out;
  }

  CreditTransaction tx;
  tx.owner = task->owner;
  tx.delta = batch->unit_cost;
  tx.reason = refund_reason(task_id);
  tx.ref_batch_id = task->batch_id;
  tx.ref_task_id = task_id;
  tx.created_at_ms = clock_();
  const StoreStatus st = store_.append_transaction(tx);
  if (st != StoreStatus::ok) {
    out.error_code = to_string(st);
    log(LogLevel::error, "ledger", "refund for " + task_id + " not written: " + out.error_code);
    return out;
  }

  out.ok = true;
  out.refunded = true;
  out.amount = tx.delta;
  out.tx_id = tx.id;

  LedgerEvent ev;
  ev.kind = EventKind::refund;
  ev.owner = tx.owner;
  ev.batch_id = tx.ref_batch_id;
  ev.task_id = task_id;
  ev.delta = tx.delta;
  emit_event(ev);
  return out;
}

AdjustResult CreditLedger::admin_adjust(const std::string& owner, int64_t delta,
                                        const std::string& note) {
  AdjustResult r;
  if (owner.empty()) {
    r.error_code = "validation";
    r.message = "owner required";
    return r;
  }
  if (delta == 0) {
    r.error_code = "validation";
    r.message = "delta must be non-zero";
    return r;
  }
  if (note.empty() || note.size() > 64) {
    r.error_code = "validation";
    r.message = "reason must be 1..64 characters";
    return r;
  }

  CreditTransaction tx;
  tx.owner = owner;
  tx.delta = delta;
  tx.reason = adjust_reason(note);
  tx.created_at_ms = clock_();
  const StoreStatus st = store_.append_transaction(tx);
  if (st != StoreStatus::ok) {
    r.error_code = to_string(st);
    r.message = "adjustment not recorded";
    return r;
  }

  LedgerEvent ev;
  ev.kind = EventKind::adjusted;
  ev.owner = owner;
  ev.delta = delta;
  ev.detail = note;
  emit_event(ev);

  r.ok = true;
  r.tx_id = tx.id;
  r.balance = balance(owner);
  return r;
}

std::vector<std::string> CreditLedger::find_duplicate_refunds() const {
  std::map<std::string, int> seen;
  for (const auto& tx : store_.all_transactions()) {
    if (tx.delta > 0 && !tx.ref_task_id.empty()) seen[tx.ref_task_id]++;
  }
  std::vector<std::string> dups;
  for (const auto& [task_id, count] : seen) {
    if (count > 1) dups.push_back(task_id);
  }
  return dups;
}

std::string CreditLedger::verify_invariants() const {
  const auto txs = store_.all_transactions();

  std::map<std::string, int> refunds_per_task;
  std::map<std::string, int> debits_per_batch;
  for (const auto& tx : txs) {
    if (tx.delta > 0 && !tx.ref_task_id.empty()) {
      if (++refunds_per_task[tx.ref_task_id] > 1) {
        return "FAIL duplicate_refund: task=" + tx.ref_task_id;
      }
      const auto task = store_.get_task(tx.ref_task_id);
      if (!task) return "FAIL refund_orphan: task=" + tx.ref_task_id;
      const auto batch = store_.get_batch(task->batch_id);
      if (!batch || tx.delta != batch->unit_cost) {
        return "FAIL refund_amount_mismatch: task=" + tx.ref_task_id +
               " amount=" + std::to_string(tx.delta);
      }
    }
    if (tx.delta < 0 && !tx.ref_batch_id.empty() && tx.ref_task_id.empty()) {
      const auto batch = store_.get_batch(tx.ref_batch_id);
      if (!batch) return "FAIL debit_orphan: batch=" + tx.ref_batch_id;
      const int64_t expected = -batch->unit_cost * static_cast<int64_t>(batch->requested_count);
      if (tx.delta != expected) {
        return "FAIL debit_amount_mismatch: batch=" + tx.ref_batch_id +
               " expected=" + std::to_string(expected) + " actual=" + std::to_string(tx.delta);
      }
      if (++debits_per_batch[tx.ref_batch_id] > 1) {
        return "FAIL duplicate_debit: batch=" + tx.ref_batch_id;
      }
    }
  }

  // Balance is an aggregation on read; recompute independently per owner.
  std::map<std::string, int64_t> sums;
  for (const auto& tx : txs) sums[tx.owner] += tx.delta;
  for (const auto& [owner, sum] : sums) {
    const int64_t reported = balance(owner);
    if (reported != sum) {
      return "FAIL balance_mismatch: owner=" + owner + " expected=" + std::to_string(sum) +
             " actual=" + std::to_string(reported);
    }
  }
  return "";
}

}  // namespace genledger
