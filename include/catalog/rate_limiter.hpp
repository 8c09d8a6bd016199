#ifndef DISCOFILL_CATALOG_RATE_LIMITER_HPP
#define DISCOFILL_CATALOG_RATE_LIMITER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace discofill {
namespace catalog {

/**
 * Spaces requests at least min_interval apart
 *
 * Time comes from util::GetTimeMillis() so tests can drive it with mock
 * time; the sleeper is injectable for the same reason.
 */
class RateLimiter {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit RateLimiter(std::chrono::milliseconds min_interval,
                       Sleeper sleeper = nullptr);

  // Blocks until the next request may go out, then claims the slot
  void Acquire();

  std::chrono::milliseconds min_interval() const { return min_interval_; }
  // Total time spent waiting so far
  std::chrono::milliseconds total_wait() const;

private:
  std::chrono::milliseconds min_interval_;
  Sleeper sleeper_;
  mutable std::mutex mutex_;
  int64_t last_request_ms_{-1};
  std::chrono::milliseconds total_wait_{0};
};

} // namespace catalog
} // namespace discofill

#endif // DISCOFILL_CATALOG_RATE_LIMITER_HPP
