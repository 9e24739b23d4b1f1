// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_config.hpp
 * @brief Immutable configuration for NtpClient.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace ntpsync {

/**
 * @brief Immutable options for NtpClient.
 *
 * Use the Builder to construct instances. All fields are read-only via
 * getters.
 */
class NtpConfig {
 public:
  using LogCallback = std::function<void(const std::string&)>;

  /** Cache duration meaning "never stale". */
  static constexpr std::chrono::milliseconds kInfinite =
      std::chrono::milliseconds::max();

  static constexpr std::chrono::milliseconds kDefaultTimeout =
      std::chrono::seconds(10);
  static constexpr int kDefaultRetryCount = 3;
  static constexpr std::chrono::milliseconds kDefaultRetryDelay =
      std::chrono::seconds(1);
  static constexpr uint16_t kDefaultPort = 123;

  /** Upper bound for Timeout() and RetryDelay() (INT_MAX ms, ~24.8 days). */
  static constexpr std::chrono::milliseconds kMaxWait =
      std::chrono::milliseconds(std::numeric_limits<int>::max());
  /** Upper bound for RetryCount(); RetryCount() + 1 attempts must fit. */
  static constexpr int kMaxRetryCount = std::numeric_limits<int>::max() - 1;

  /** time.google.com, time.apple.com, time.cloudflare.com, pool.ntp.org,
   *  time.windows.com */
  static const std::vector<std::string>& DefaultServers();

  /**
   * @brief Fluent builder for NtpConfig.
   */
  class Builder {
   public:
    Builder();
    explicit Builder(const NtpConfig& base);

    /** Servers tried in order (default: DefaultServers()). */
    Builder& NtpServers(std::vector<std::string> servers);
    /** Per-exchange timeout (default: 10 s; clamped to [0, kMaxWait]). */
    Builder& Timeout(std::chrono::milliseconds v);
    /** Retries per server after the first try (default: 3; clamped to
     *  [0, kMaxRetryCount]). */
    Builder& RetryCount(int v);
    /** Pause between attempts on the same server (default: 1 s; clamped to
     *  [0, kMaxWait]). */
    Builder& RetryDelay(std::chrono::milliseconds v);
    /** Sync when the global clock is initialized (default: true). */
    Builder& SyncOnInit(bool v);
    /** How long a successful sync stays fresh (default: kInfinite). */
    Builder& CacheDuration(std::chrono::milliseconds v);
    /** Destination port (default: 123). */
    Builder& Port(uint16_t v);
    /** Log sink for diagnostic lines (default: none). */
    Builder& LogSink(LogCallback cb);

    NtpConfig Build() const;

   private:
    std::vector<std::string> ntp_servers_;
    std::chrono::milliseconds timeout_;
    int retry_count_;
    std::chrono::milliseconds retry_delay_;
    bool sync_on_init_;
    std::chrono::milliseconds cache_duration_;
    uint16_t port_;
    LogCallback log_sink_cb_;
  };

  /** Default configuration. */
  NtpConfig();

  /** @name Getters (immutable) */
  ///@{
  const std::vector<std::string>& NtpServers() const { return ntp_servers_; }
  std::chrono::milliseconds Timeout() const { return timeout_; }
  int RetryCount() const { return retry_count_; }
  std::chrono::milliseconds RetryDelay() const { return retry_delay_; }
  bool SyncOnInit() const { return sync_on_init_; }
  std::chrono::milliseconds CacheDuration() const { return cache_duration_; }
  uint16_t Port() const { return port_; }
  const LogCallback& LogSink() const { return log_callback_; }
  ///@}

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const NtpConfig& c);

 private:
  NtpConfig(std::vector<std::string> servers, std::chrono::milliseconds timeout,
            int retry_count, std::chrono::milliseconds retry_delay,
            bool sync_on_init, std::chrono::milliseconds cache_duration,
            uint16_t port, LogCallback log_cb);

  std::vector<std::string> ntp_servers_;
  std::chrono::milliseconds timeout_;
  int retry_count_;
  std::chrono::milliseconds retry_delay_;
  bool sync_on_init_;
  std::chrono::milliseconds cache_duration_;
  uint16_t port_;
  LogCallback log_callback_;
};

}  // namespace ntpsync
