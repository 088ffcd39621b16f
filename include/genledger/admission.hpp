#pragma once

// genledger/admission.hpp — Admission Controller: the only way work and
// debits enter the system.
//
// submit() runs, in this order, under one mutex:
//   1. validation         (nothing touched on rejection)
//   2. idempotency replay (owner-scoped key inside idempotency_window_ms →
//                          prior batch id, replayed=true; no rate slot used)
//   3. rate limit         (sliding window per owner)
//   4. funds              (balance >= unit_cost × count)
//   5. commit_admission   (batch + tasks + debit + key, one store unit)
//   6. dispatch           (task ids handed to the scheduler)
//   7. recompute          (batch counters)
// Serializing the whole sequence closes the window between the funds check
// and the debit, and between the key lookup and the key insert.

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "genledger/config.hpp"
#include "genledger/ledger.hpp"
#include "genledger/pricing.hpp"
#include "genledger/rate_limiter.hpp"
#include "genledger/reconciler.hpp"
#include "genledger/store.hpp"
#include "genledger/types.hpp"

namespace genledger {

struct SubmitRequest {
  GenerationParams params;
  uint32_t         count{1};
  std::string      idempotency_key;   // optional
};

enum class SubmitError {
  none,
  validation,
  insufficient_funds,
  rate_limited,
  duplicate,
  store_write_failed,
};

std::string to_string(SubmitError e);

struct SubmitResult {
  bool        ok{false};
  std::string batch_id;
  SubmitError error{SubmitError::none};
  std::string message;
  bool        replayed{false};
  int64_t     total_cost{0};
};

// Receives the task ids of a freshly admitted batch, creation order.
using DispatchFn = std::function<void(const std::vector<std::string>& task_ids)>;

class AdmissionController {
 public:
  AdmissionController(ILedgerStore& store, CreditLedger& ledger, const PriceTable& prices,
                      Reconciler& reconciler, const Config& config, UnixMsClock clock);

  void set_dispatch(DispatchFn fn);

  SubmitResult submit(const std::string& owner, const SubmitRequest& req);


 private:
  SubmitResult reject(const std::string& owner, SubmitError e, std::string message) const;
  std::string validate(const std::string& owner, SubmitRequest& req) const;

  ILedgerStore&        store_;
  CreditLedger&        ledger_;
  const PriceTable&    prices_;
  Reconciler&          reconciler_;
  Config               config_;
  UnixMsClock          clock_;
  SlidingWindowLimiter limiter_;
  DispatchFn           dispatch_;
  std::mutex           mu_;
};

// Digest over every field that shapes the batch. Same request → same digest.
std::string submit_fingerprint(const SubmitRequest& req);

// Code points in a UTF-8 string; malformed bytes count one each.
size_t utf8_length(const std::string& s);

}  // namespace genledger
