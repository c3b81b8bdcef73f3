// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_UTIL_TIME_HPP
#define ANCHORSYNC_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace anchorsync {
namespace util {

/**
 * Mockable wall clock
 *
 * Job timestamps and retry deadlines are taken from here so tests can
 * control time without sleeping.
 *
 * - Production code calls GetTime()/GetTimeMillis() instead of the system
 *   clock directly
 * - Tests call SetMockTime() to pin the current time
 * - When mock time is 0 (default), the real system time is returned
 */

/**
 * Current time as Unix timestamp (seconds since epoch)
 */
int64_t GetTime();

/**
 * Current time in milliseconds since epoch
 * Returns mock time * 1000 if mock time is set
 */
int64_t GetTimeMillis();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting (0 when disabled)
 */
int64_t GetMockTime();

/**
 * Format milliseconds since epoch as ISO-8601 UTC, e.g.
 * "2023-02-21T20:58:47.867Z"
 */
std::string FormatIso8601Millis(int64_t millis);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace anchorsync

#endif // ANCHORSYNC_UTIL_TIME_HPP
