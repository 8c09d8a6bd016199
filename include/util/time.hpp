// Copyright (c) 2024 Discofill
// Distributed under the MIT software license

#ifndef DISCOFILL_UTIL_TIME_HPP
#define DISCOFILL_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace discofill {
namespace util {

/**
 * Mockable wall clock
 *
 * Transfer timestamps go through these functions so tests can pin
 * created/completed times instead of racing the real clock.
 * A mock value of 0 (default) means "use the system clock".
 */

/**
 * Get current time as milliseconds since the Unix epoch
 * Returns mock time if set, otherwise real system time
 */
int64_t GetTimeMillis();

/**
 * Set mock time for testing
 * @param time_ms Unix time in milliseconds (0 to disable mocking)
 *
 * Mock time does not advance on its own.
 */
void SetMockTime(int64_t time_ms);

/**
 * Get current mock time setting (0 if disabled)
 */
int64_t GetMockTime();

/**
 * Format a millisecond timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t time_ms);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) : previous_time_(GetMockTime()) {
    SetMockTime(time_ms);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace discofill

#endif // DISCOFILL_UTIL_TIME_HPP
