#include "catalog/rate_limiter.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <thread>

namespace discofill {
namespace catalog {

RateLimiter::RateLimiter(std::chrono::milliseconds min_interval, Sleeper sleeper)
    : min_interval_(min_interval), sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

void RateLimiter::Acquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  int64_t now = util::GetTimeMillis();
  if (last_request_ms_ >= 0 && min_interval_.count() > 0) {
    const int64_t ready_at = last_request_ms_ + min_interval_.count();
    if (now < ready_at) {
      const std::chrono::milliseconds wait(ready_at - now);
      sleeper_(wait);
      total_wait_ += wait;
      now = std::max(util::GetTimeMillis(), ready_at);
    }
  }
  last_request_ms_ = now;
}

std::chrono::milliseconds RateLimiter::total_wait() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_wait_;
}

} // namespace catalog
} // namespace discofill
