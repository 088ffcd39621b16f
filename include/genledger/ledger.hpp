#pragma once

// genledger/ledger.hpp — Credit Ledger: debit at admission, refund on failure.
//
// INVARIANTS:
//   1. balance(owner) == sum of delta over owner's transactions. Nothing
//      caches a balance.
//   2. At most one transaction with delta > 0 references a given task.
//      refund_task() checks for an existing one before inserting.
//   3. Only tasks whose stored status is `failed` are refunded. Cancelled
//      tasks keep their debit.
//
// REFUND DEDUP SCOPE:
//   The check-then-insert in refund_task() is serialized by refund_mu_, which
//   is process-local. Two processes sharing one store could both pass the
//   check. A multi-process deployment needs a store-level uniqueness
//   constraint on (ref_task_id, delta > 0); see ILedgerStore
//   EXTENSION_POINT: relational_backend.

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "genledger/store.hpp"
#include "genledger/types.hpp"

namespace genledger {

struct RefundOutcome {
  bool        ok{false};
  bool        refunded{false};          // a new positive transaction was written
  bool        already_refunded{false};  // dedup hit, nothing written
  int64_t     amount{0};
  uint64_t    tx_id{0};
  std::string error_code;               // not_found | not_refundable | store_write_failed
};

struct AdjustResult {
  bool        ok{false};
  int64_t     balance{0};
  uint64_t    tx_id{0};
  std::string error_code;               // validation | store_write_failed
  std::string message;
};

class CreditLedger {
 public:
  CreditLedger(ILedgerStore& store, UnixMsClock clock);

  int64_t balance(const std::string& owner) const;

  // The debit row written by admission: delta = -total.
  CreditTransaction make_debit(const std::string& owner, const std::string& batch_id,
                               int64_t total) const;

  RefundOutcome refund_task(const std::string& task_id);

  // Manual correction. delta != 0, note 1..64 chars.
  AdjustResult admin_adjust(const std::string& owner, int64_t delta, const std::string& note);

  // Task ids referenced by more than one positive transaction.
  std::vector<std::string> find_duplicate_refunds() const;

  // Checks the ledger against the batch/task records.
  // Returns "" on pass, "FAIL <reason>: ..." on the first violation.
  std::string verify_invariants() const;

 private:
  ILedgerStore& store_;
  UnixMsClock   clock_;
  std::mutex    refund_mu_;
};

}  // namespace genledger
