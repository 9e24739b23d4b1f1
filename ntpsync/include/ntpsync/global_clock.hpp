// Copyright (c) 2025 <Your Name>
/**
 * @file global_clock.hpp
 * @brief Process-wide convenience wrapper around one shared NtpClient.
 *
 * Lifecycle: Initialize() installs a client (replacing any previous one),
 * Shutdown() drops it. Every other call before Initialize() throws
 * NotInitializedError. Library code should prefer an explicit NtpClient.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>

#include "ntpsync/ntp_client.hpp"
#include "ntpsync/ntp_config.hpp"
#include "ntpsync/sync_result.hpp"
#include "ntpsync/time_source.hpp"
#include "ntpsync/transport.hpp"

namespace ntpsync {

/** Thrown when GlobalClock is used before Initialize(). */
class NotInitializedError : public std::logic_error {
 public:
  NotInitializedError()
      : std::logic_error(
            "GlobalClock not initialized. Call Initialize() first.") {}
};

/**
 * @brief Static facade over a process-wide NtpClient.
 *
 * Sync() calls are serialized: at most one synchronization is in flight at a
 * time, so concurrent callers never issue redundant network traffic.
 */
class GlobalClock {
 public:
  GlobalClock() = delete;

  /**
   * @brief Install a new shared client.
   *
   * If config.SyncOnInit() is true, runs one Sync() before returning.
   * @param config Client configuration.
   * @param transport Transport (nullptr = platform UDP).
   * @param time_source Local clock (not owned; nullptr = system time).
   */
  static void Initialize(const NtpConfig& config = NtpConfig(),
                         std::shared_ptr<Transport> transport = nullptr,
                         TimeSource* time_source = nullptr);

  static bool IsInitialized();

  /** Drops the shared client; IsInitialized() becomes false. */
  static void Shutdown();

  /** Returns the shared client. @throws NotInitializedError */
  static std::shared_ptr<NtpClient> Client();

  /** @throws NotInitializedError */
  static SyncResult Sync();
  /** @throws NotInitializedError */
  static std::optional<TimePoint> Now();
  /** @throws NotInitializedError */
  static TimePoint NowOrSystem();
  /** @throws NotInitializedError */
  static int64_t CurrentTimeMillis();
  /** @throws NotInitializedError */
  static bool IsSynchronized();
  /** @throws NotInitializedError */
  static TimeSnapshot Snapshot();
  /** @throws NotInitializedError */
  static void Reset();
};

}  // namespace ntpsync
