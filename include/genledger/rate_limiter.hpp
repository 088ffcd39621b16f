#pragma once

// genledger/rate_limiter.hpp — Per-owner sliding-window submission limiter.
//
// An owner may record at most `limit` submissions inside any trailing window
// of `window_ms`. History is a bounded deque per owner: entries older than
// the window are pruned on every access, so memory per owner never exceeds
// `limit` timestamps. An owner whose window empties is dropped, and allow()
// sweeps every owner once the map doubles past its last compacted size, so
// the map is bounded by owners active in the current window.
//
// Thread-safety: all methods lock mu_.

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>

#include "genledger/types.hpp"

namespace genledger {

class SlidingWindowLimiter {
 public:
  SlidingWindowLimiter(uint32_t limit, uint64_t window_ms, UnixMsClock clock);

  // Accept-and-record. false = rejected, nothing recorded.
  bool allow(const std::string& owner);

  // Would allow() accept right now? Records nothing.
  bool peek_allowed(const std::string& owner);

  // Submissions currently counted against owner.
  size_t in_window(const std::string& owner);

  // Owners currently holding history.
  size_t tracked_owners();

  void reset();

 private:
  static constexpr size_t kMinCompactAt = 64;

  void prune(std::deque<uint64_t>& hist, uint64_t now) const;
  void compact(uint64_t now);

  uint32_t                                     limit_;
  uint64_t                                     window_ms_;
  UnixMsClock                                  clock_;
  std::mutex                                   mu_;
  std::map<std::string, std::deque<uint64_t>>  history_;
  size_t                                       compact_at_{kMinCompactAt};
};

}  // namespace genledger
