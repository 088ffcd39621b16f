#pragma once

// genledger/journal.hpp — Append-only, hash-chained NDJSON operation journal.
//
// DESIGN INVARIANTS (must not be broken):
//   1. APPEND-ONLY: lines are never modified or deleted. The one exception is
//      a torn final line (crash mid-write), which truncate_torn_tail() cuts off
//      before the journal is reopened for writing.
//   2. SEQUENTIAL: each line carries seq = previous seq + 1, starting at 1.
//   3. CHAINED: each line carries prev = journal_link_digest(previous line),
//      or 64 zeros for the first line. Any edit to a committed line breaks
//      the chain at the next line and replay stops there.
//   4. ATOMIC UNIT: one line = one store operation. Multi-record operations
//      (batch admission) are written as a single line so they replay
//      all-or-nothing.
//   5. WRITE-BEFORE-APPLY: the store applies a mutation in memory only after
//      append() returned true.
//
// Line format (JOURNAL_FORMAT_VERSION 1):
//   {"v":1,"seq":7,"prev":"<64 hex>","op":"append_tx","data":{...}}

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "genledger/jsonlite.hpp"

namespace genledger {

inline constexpr const char* kGenesisDigest =
    "0000000000000000000000000000000000000000000000000000000000000000";

struct JournalImpl;

class Journal {
 public:
  // path: journal file. Created if absent. Caller must ensure the directory exists.
  explicit Journal(const std::string& path);
  ~Journal();

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  bool is_open() const;

  // Continue a chain recovered by replay_journal().
  void resume(uint64_t last_sequence, const std::string& last_digest);

  // Append one operation. data_json must be a JSON object.
  // Returns false on write error; in that case the line was not committed and
  // the sequence/digest state is unchanged.
  bool append(const std::string& op, const std::string& data_json);

  uint64_t sequence() const;
  uint64_t failure_count() const;
  const std::string& path() const { return path_; }

 private:
  std::string path_;
  std::unique_ptr<JournalImpl> impl_;
};

struct ReplayResult {
  bool        ok{false};
  uint64_t    entries{0};
  uint64_t    last_sequence{0};
  std::string last_digest{kGenesisDigest};
  bool        torn_tail{false};     // final line incomplete; ignored
  uint64_t    valid_bytes{0};       // byte length of the intact prefix
  uint64_t    error_line{0};        // 1-based
  std::string error_code;           // journal_unreadable | journal_parse_error |
                                    // journal_chain_broken | journal_sequence_gap |
                                    // journal_version_unsupported | journal_apply_failed
  std::string error_message;
};

// Visitor returns "" to continue, or an error description to stop replay.
using JournalVisitor =
    std::function<std::string(const std::string& op, const jsonlite::Object& data)>;

// Replays every intact line in order, verifying version, sequence and chain.
// A missing file is an empty journal (ok=true, entries=0).
ReplayResult replay_journal(const std::string& path, const JournalVisitor& visit);

// Cuts a torn tail reported by replay_journal(). Returns false on I/O error.
bool truncate_torn_tail(const std::string& path, const ReplayResult& r);

}  // namespace genledger
