#include "genledger/rate_limiter.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace genledger {

SlidingWindowLimiter::SlidingWindowLimiter(uint32_t limit, uint64_t window_ms, UnixMsClock clock)
    : limit_(limit), window_ms_(window_ms), clock_(std::move(clock)) {}

void SlidingWindowLimiter::prune(std::deque<uint64_t>& hist, uint64_t now) const {
  // A stamp exactly window_ms old has left the window. Stamps from the future
  // (clock stepped back) stay counted.
  while (!hist.empty() && now >= hist.front() && now - hist.front() >= window_ms_) {
    hist.pop_front();
  }
}

void SlidingWindowLimiter::compact(uint64_t now) {
  for (auto it = history_.begin(); it != history_.end();) {
    prune(it->second, now);
    it = it->second.empty() ? history_.erase(it) : std::next(it);
  }
  compact_at_ = std::max(kMinCompactAt, history_.size() * 2);
}

bool SlidingWindowLimiter::allow(const std::string& owner) {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  if (limit_ == 0) return false;
  auto it = history_.find(owner);
  if (it == history_.end()) {
    if (history_.size() >= compact_at_) compact(now);
    history_[owner].push_back(now);
    return true;
  }
  prune(it->second, now);
  if (it->second.size() >= limit_) return false;
  it->second.push_back(now);
  return true;
}

bool SlidingWindowLimiter::peek_allowed(const std::string& owner) {
  return in_window(owner) < limit_;
}

size_t SlidingWindowLimiter::in_window(const std::string& owner) {
  const uint64_t now = clock_();
  std::lock_guard<std::mutex> lk(mu_);
  auto it = history_.find(owner);
  if (it == history_.end()) return 0;
  prune(it->second, now);
  if (it->second.empty()) {
    history_.erase(it);
    return 0;
  }
  return it->second.size();
}

size_t SlidingWindowLimiter::tracked_owners() {
  std::lock_guard<std::mutex> lk(mu_);
  return history_.size();
}

void SlidingWindowLimiter::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  history_.clear();
  compact_at_ = kMinCompactAt;
}

}  // namespace genledger
