// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace teleophub {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code calls GetTime() instead of reading the system clock so
 * tests can pin record timestamps with SetMockTime(). Per-call deadlines use
 * std::chrono::steady_clock directly and are not affected by mock time.
 */

/**
 * Current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise real system time
 */
int64_t GetTime();

/**
 * Set mock time (0 disables mocking)
 */
void SetMockTime(int64_t time);

/**
 * Current mock time setting (0 if disabled)
 */
int64_t GetMockTime();

/**
 * Format a Unix timestamp as "YYYY-MM-DD HH:MM:SS UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace teleophub
