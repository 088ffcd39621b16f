#include "genledger/journal.hpp"

#include "genledger/hash.hpp"
#include "genledger/observability.hpp"
#include "genledger/version.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <system_error>
#include <unistd.h>

namespace genledger {

// ---------------------------------------------------------------------------
// Journal
// ---------------------------------------------------------------------------

struct JournalImpl {
  std::mutex mu;
  FILE* file{nullptr};
  uint64_t seq{0};
  uint64_t failure_count{0};
  std::string last_digest{kGenesisDigest};
};

Journal::Journal(const std::string& path) : path_(path), impl_(std::make_unique<JournalImpl>()) {
  if (!path_.empty()) {
    impl_->file = std::fopen(path_.c_str(), "a");
    if (!impl_->file) log(LogLevel::error, "journal", "cannot open " + path_ + " for append");
  }
}

Journal::~Journal() {
  if (impl_ && impl_->file) {
    std::fclose(impl_->file);
    impl_->file = nullptr;
  }
}

bool Journal::is_open() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->file != nullptr;
}

void Journal::resume(uint64_t last_sequence, const std::string& last_digest) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  impl_->seq = last_sequence;
  impl_->last_digest = last_digest;
}

bool Journal::append(const std::string& op, const std::string& data_json) {
  std::lock_guard<std::mutex> lk(impl_->mu);
  if (!impl_->file) {
    ++impl_->failure_count;
    return false;
  }

  // Seek to end before writing so nothing committed can be overwritten.
  std::fseek(impl_->file, 0, SEEK_END);
  const long pre_write_pos = std::ftell(impl_->file);
  if (pre_write_pos < 0) {
    ++impl_->failure_count;
    return false;
  }

  const uint64_t seq = impl_->seq + 1;
  std::ostringstream o;
  o << "{\"v\":" << version::JOURNAL_FORMAT_VERSION
    << ",\"seq\":" << seq
    << ",\"prev\":\"" << impl_->last_digest << "\""
    << ",\"op\":\"" << jsonlite::escape(op) << "\""
    << ",\"data\":" << data_json << "}";
  const std::string line = o.str();
  const std::string final_line = line + "\n";

  bool written = std::fwrite(final_line.data(), 1, final_line.size(), impl_->file) == final_line.size();
  written = (std::fflush(impl_->file) == 0) && written;
  if (written) {
    const long post_write_pos = std::ftell(impl_->file);
    if (post_write_pos < 0 ||
        post_write_pos < pre_write_pos + static_cast<long>(final_line.size())) {
      written = false;
    }
  }

  if (!written) {
    // Roll back a partial line so the next append does not extend garbage.
    if (::ftruncate(::fileno(impl_->file), static_cast<off_t>(pre_write_pos)) != 0) {
      log(LogLevel::error, "journal", "rollback of partial write failed on " + path_);
    }
    ++impl_->failure_count;
    return false;
  }

  impl_->seq = seq;
  impl_->last_digest = journal_link_digest(line);
  return true;
}

uint64_t Journal::sequence() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->seq;
}

uint64_t Journal::failure_count() const {
  std::lock_guard<std::mutex> lk(impl_->mu);
  return impl_->failure_count;
}

// ---------------------------------------------------------------------------
// Replay
// ---------------------------------------------------------------------------

ReplayResult replay_journal(const std::string& path, const JournalVisitor& visit) {
  ReplayResult r;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    r.ok = true;
    return r;
  }

  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    r.error_code = "journal_unreadable";
    r.error_message = "cannot open " + path;
    return r;
  }
  std::ostringstream ss;
  ss << ifs.rdbuf();
  const std::string text = ss.str();

  auto stop = [&r](uint64_t line_no, const std::string& code, const std::string& message) {
    r.ok = false;
    r.error_line = line_no;
    r.error_code = code;
    r.error_message = message;
    return r;
  };

  size_t pos = 0;
  uint64_t line_no = 0;
  while (pos < text.size()) {
    const size_t nl = text.find('\n', pos);
    ++line_no;
    if (nl == std::string::npos) {
      // Incomplete final line: the writer crashed mid-append.
      r.torn_tail = true;
      log(LogLevel::warn, "journal",
          path + ": ignoring torn final line " + std::to_string(line_no));
      break;
    }
    const std::string line = text.substr(pos, nl - pos);
    const size_t line_end = nl + 1;
    if (line.empty()) {
      pos = line_end;
      r.valid_bytes = pos;
      continue;
    }

    std::optional<jsonlite::JsonError> err;
    const auto obj = jsonlite::parse(line, &err);
    if (err) return stop(line_no, "journal_parse_error", err->code + ": " + err->message);

    const uint64_t v = jsonlite::get_u64(obj, "v", 0);
    if (v == 0 || v > version::JOURNAL_FORMAT_VERSION) {
      return stop(line_no, "journal_version_unsupported", "format version " + std::to_string(v));
    }
    const uint64_t seq = jsonlite::get_u64(obj, "seq", 0);
    if (seq != r.last_sequence + 1) {
      return stop(line_no, "journal_sequence_gap",
                  "expected seq " + std::to_string(r.last_sequence + 1) + " got " + std::to_string(seq));
    }
    if (jsonlite::get_string(obj, "prev") != r.last_digest) {
      return stop(line_no, "journal_chain_broken", "prev digest mismatch at seq " + std::to_string(seq));
    }

    const std::string problem = visit(jsonlite::get_string(obj, "op"), jsonlite::get_object(obj, "data"));
    if (!problem.empty()) return stop(line_no, "journal_apply_failed", problem);

    r.last_sequence = seq;
    r.last_digest = journal_link_digest(line);
    ++r.entries;
    pos = line_end;
    r.valid_bytes = pos;
  }

  r.ok = true;
  return r;
}

bool truncate_torn_tail(const std::string& path, const ReplayResult& r) {
  if (!r.torn_tail) return true;
  std::error_code ec;
  std::filesystem::resize_file(path, r.valid_bytes, ec);
  if (ec) {
    log(LogLevel::error, "journal", "cannot truncate torn tail of " + path + ": " + ec.message());
    return false;
  }
  return true;
}

}  // namespace genledger
