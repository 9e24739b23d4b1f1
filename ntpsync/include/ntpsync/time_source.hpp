// Copyright (c) 2025 <Your Name>
/**
 * @file time_source.hpp
 * @brief Minimal local time source interface (UNIX milliseconds provider).
 */
#pragma once

#include <chrono>
#include <cstdint>

namespace ntpsync {

/**
 * Interface for local time sources.
 *
 * The sync engine reads wall-clock time for the t0/t3 exchange timestamps,
 * monotonic time for cache aging, and sleeps between retries through this
 * interface so tests can run against a deterministic fake.
 */
class TimeSource {
 public:
  virtual ~TimeSource() = default;

  /** Returns the current wall-clock time in milliseconds since the epoch. */
  virtual int64_t NowUnixMillis() = 0;

  /** Returns a monotonic timestamp in milliseconds (arbitrary origin). */
  virtual int64_t MonotonicMillis() = 0;

  /** Blocks the calling thread for the given duration. */
  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

/**
 * @brief TimeSource backed by std::chrono::system_clock / steady_clock.
 */
class SystemTimeSource : public TimeSource {
 public:
  int64_t NowUnixMillis() override;
  int64_t MonotonicMillis() override;
  void SleepFor(std::chrono::milliseconds duration) override;

  /** Process-wide instance used when no source is injected. */
  static SystemTimeSource& Instance();
};

}  // namespace ntpsync
