// Copyright (c) 2025 <Your Name>
/**
 * @file sync_result.hpp
 * @brief Outcome of NtpClient::Sync() and the read-only time snapshot.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "ntpsync/error.hpp"

namespace ntpsync {

/**
 * @brief Result of one synchronization run: Success or Failure.
 *
 * Failure is a routine outcome (all servers unreachable) and is returned,
 * never thrown. Success-only fields are zero/empty on a Failure and vice
 * versa.
 */
class SyncResult {
 public:
  enum class Kind { kSuccess, kFailure };

  static SyncResult Success(std::chrono::milliseconds offset,
                            std::chrono::milliseconds round_trip_delay,
                            std::string server_address);

  static SyncResult Failure(std::string error,
                            std::optional<Error> cause = std::nullopt);

  Kind kind() const { return kind_; }
  bool IsSuccess() const { return kind_ == Kind::kSuccess; }
  bool IsFailure() const { return kind_ == Kind::kFailure; }

  /** @name Success fields */
  ///@{
  /** Local-to-reference clock offset: positive means local is behind. */
  std::chrono::milliseconds Offset() const { return offset_; }
  std::chrono::milliseconds RoundTripDelay() const { return round_trip_delay_; }
  const std::string& ServerAddress() const { return server_address_; }
  ///@}

  /** @name Failure fields */
  ///@{
  const std::string& ErrorMessage() const { return error_; }
  /** Last per-attempt error observed, if any. */
  const std::optional<Error>& Cause() const { return cause_; }
  ///@}

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const SyncResult& r);

 private:
  SyncResult() = default;

  Kind kind_ = Kind::kFailure;
  std::chrono::milliseconds offset_{0};
  std::chrono::milliseconds round_trip_delay_{0};
  std::string server_address_;
  std::string error_;
  std::optional<Error> cause_;
};

/**
 * @brief Consistent read of the synchronized state plus a fresh clock read.
 */
struct TimeSnapshot {
  int64_t epoch_millis = 0;                  ///< System time + offset
  std::chrono::milliseconds offset{0};       ///< Zero when unsynchronized
  bool synced = false;
  std::optional<int64_t> last_sync_time_millis;  ///< Empty when unsynced

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const TimeSnapshot& s);
};

}  // namespace ntpsync
