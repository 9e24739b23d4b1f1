// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_client.hpp
 * @brief SNTP client with multi-server fallback and an offset-corrected clock.
 *
 * The client never changes the OS clock. It keeps the offset measured by the
 * last successful exchange and adds it to the local time on every read.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

#include "ntpsync/ntp_config.hpp"
#include "ntpsync/sync_result.hpp"
#include "ntpsync/time_source.hpp"
#include "ntpsync/transport.hpp"

namespace ntpsync {

/** Wall-clock instant at millisecond resolution. */
using TimePoint =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/**
 * SNTP synchronization engine.
 *
 * Responsibilities
 * - Try each configured server in order, up to RetryCount()+1 attempts each,
 *   pausing RetryDelay() between attempts on the same server.
 * - Per attempt: t0 -> request -> Transport::Exchange -> t3 -> decode.
 *   Stratum 0 (kiss-of-death) counts as a failed attempt.
 * - offset = ((t1 - t0) + (t2 - t3)) / 2, delay = (t3 - t0) - (t2 - t1).
 * - On the first success, replace the synchronized state as one unit.
 *
 * Thread safety: all methods may be called concurrently. Sync() calls may
 * overlap; each success replaces the whole state under one mutex, and reads
 * copy the whole state under the same mutex.
 */
class NtpClient {
 public:
  /** Client using the platform UDP transport and system time. */
  explicit NtpClient(const NtpConfig& config = NtpConfig());

  /**
   * @brief Client with an injected transport and time source.
   * @param config Immutable configuration snapshot.
   * @param transport Transport used for every exchange (shared ownership).
   * @param time_source Local clock (not owned; nullptr = system time).
   */
  NtpClient(const NtpConfig& config, std::shared_ptr<Transport> transport,
            TimeSource* time_source = nullptr);
  ~NtpClient();

  NtpClient(const NtpClient&) = delete;
  NtpClient& operator=(const NtpClient&) = delete;

  /**
   * @brief Run one synchronization against the configured server list.
   *
   * Blocks for at most the sum of all attempt timeouts and retry delays.
   * Per-attempt failures are absorbed by the retry/fallback loop; only
   * total exhaustion produces a Failure, which leaves the state unchanged.
   */
  SyncResult Sync();

  /** Network time, or empty if no sync has succeeded since the last reset. */
  std::optional<TimePoint> Now() const;

  /** Local time plus the current offset (zero when unsynchronized). */
  TimePoint NowOrSystem() const;

  /** Same as NowOrSystem() as UNIX milliseconds. */
  int64_t CurrentTimeMillis() const;

  /** Offset from the last successful sync, zero when unsynchronized. */
  std::chrono::milliseconds Offset() const;

  bool IsSynchronized() const;

  TimeSnapshot Snapshot() const;

  /**
   * @brief True when unsynchronized or the last sync is older than
   *        CacheDuration() on the monotonic clock.
   */
  bool NeedsSync() const;

  /** Returns the state to unsynchronized with a zero offset. No I/O. */
  void Reset();

  const NtpConfig& Config() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace ntpsync
