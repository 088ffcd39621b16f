#pragma once

// genledger/frames.hpp — NDJSON request/response frames for the serve loop,
// and the offline journal verifier behind `genledger verify`.
//
// INVARIANTS:
//   1. Exactly one response frame per request line, success or not.
//   2. Numeric members are range-checked before use: a value that is not a
//      non-negative integer, or does not fit the field, is a `validation`
//      error frame and nothing is submitted.
//   3. verify_journal() opens the journal read-only; it never truncates a torn
//      tail and never appends.

#include <string>

namespace genledger {

class LedgerService;

std::string error_frame(const std::string& id, const std::string& code, const std::string& message);

// One request line → one response line (without the trailing newline).
std::string handle_frame(LedgerService& svc, const std::string& line);

struct VerifyOutcome {
  int         exit_code{2};  // 0 = journal intact and ledger invariants hold
  std::string report_json;
};

VerifyOutcome verify_journal(const std::string& path);

}  // namespace genledger
