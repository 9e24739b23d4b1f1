// Copyright (c) 2025 <Your Name>
#include "ntpsync/ntp_config.hpp"

#include <algorithm>
#include <utility>

namespace ntpsync {

using std::chrono::milliseconds;

const std::vector<std::string>& NtpConfig::DefaultServers() {
  static const std::vector<std::string> kServers = {
      "time.google.com", "time.apple.com", "time.cloudflare.com",
      "pool.ntp.org",    "time.windows.com",
  };
  return kServers;
}

// ---------------- Builder ----------------
NtpConfig::Builder::Builder()
    : ntp_servers_(NtpConfig::DefaultServers()),
      timeout_(NtpConfig::kDefaultTimeout),
      retry_count_(NtpConfig::kDefaultRetryCount),
      retry_delay_(NtpConfig::kDefaultRetryDelay),
      sync_on_init_(true),
      cache_duration_(NtpConfig::kInfinite),
      port_(NtpConfig::kDefaultPort),
      log_sink_cb_(NtpConfig::LogCallback()) {}

NtpConfig::Builder::Builder(const NtpConfig& base)
    : ntp_servers_(base.NtpServers()),
      timeout_(base.Timeout()),
      retry_count_(base.RetryCount()),
      retry_delay_(base.RetryDelay()),
      sync_on_init_(base.SyncOnInit()),
      cache_duration_(base.CacheDuration()),
      port_(base.Port()),
      log_sink_cb_(base.LogSink()) {}

NtpConfig::Builder& NtpConfig::Builder::NtpServers(
    std::vector<std::string> servers) {
  ntp_servers_ = std::move(servers);
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::Timeout(milliseconds v) {
  timeout_ = std::min(std::max(milliseconds(0), v), NtpConfig::kMaxWait);
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::RetryCount(int v) {
  retry_count_ = std::min(std::max(0, v), NtpConfig::kMaxRetryCount);
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::RetryDelay(milliseconds v) {
  retry_delay_ = std::min(std::max(milliseconds(0), v), NtpConfig::kMaxWait);
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::SyncOnInit(bool v) {
  sync_on_init_ = v;
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::CacheDuration(milliseconds v) {
  cache_duration_ = std::max(milliseconds(0), v);
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::Port(uint16_t v) {
  port_ = v;
  return *this;
}

NtpConfig::Builder& NtpConfig::Builder::LogSink(LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

NtpConfig NtpConfig::Builder::Build() const {
  return NtpConfig(ntp_servers_, timeout_, retry_count_, retry_delay_,
                   sync_on_init_, cache_duration_, port_, log_sink_cb_);
}

// ---------------- NtpConfig ----------------
NtpConfig::NtpConfig()
    : ntp_servers_(DefaultServers()),
      timeout_(kDefaultTimeout),
      retry_count_(kDefaultRetryCount),
      retry_delay_(kDefaultRetryDelay),
      sync_on_init_(true),
      cache_duration_(kInfinite),
      port_(kDefaultPort) {}

NtpConfig::NtpConfig(std::vector<std::string> servers, milliseconds timeout,
                     int retry_count, milliseconds retry_delay,
                     bool sync_on_init, milliseconds cache_duration,
                     uint16_t port, LogCallback log_cb)
    : ntp_servers_(std::move(servers)),
      timeout_(timeout),
      retry_count_(retry_count),
      retry_delay_(retry_delay),
      sync_on_init_(sync_on_init),
      cache_duration_(cache_duration),
      port_(port),
      log_callback_(std::move(log_cb)) {}

std::ostream& operator<<(std::ostream& os, const NtpConfig& c) {
  os << "servers=[";
  for (size_t i = 0; i < c.NtpServers().size(); ++i) {
    if (i) os << ",";
    os << c.NtpServers()[i];
  }
  os << "], port=" << c.Port() << ", timeout=" << c.Timeout().count()
     << "ms, retries=" << c.RetryCount()
     << ", retry_delay=" << c.RetryDelay().count()
     << "ms, sync_on_init=" << (c.SyncOnInit() ? "true" : "false")
     << ", cache=";
  if (c.CacheDuration() == NtpConfig::kInfinite) {
    os << "infinite";
  } else {
    os << c.CacheDuration().count() << "ms";
  }
  return os;
}

}  // namespace ntpsync
