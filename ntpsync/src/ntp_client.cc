// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the SNTP synchronization engine.
 *
 * Servers are tried strictly in configured order and attempts on one server
 * are strictly sequential. The only blocking points are the transport
 * exchange (bounded by the configured timeout) and the retry delay.
 */
#include "ntpsync/ntp_client.hpp"

#include <exception>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "ntpsync/ntp_packet.hpp"

namespace ntpsync {

namespace {

/** Synchronized state; always copied and replaced as a whole. */
struct SyncState {
  int64_t offset_millis = 0;
  bool synced = false;
  int64_t last_sync_time_millis = 0;
  int64_t last_sync_monotonic_millis = 0;
};

/** Outcome of one successful exchange. */
struct Sample {
  int64_t offset_ms = 0;
  int64_t delay_ms = 0;
};

}  // namespace

struct NtpClient::Impl {
  Impl(const NtpConfig& cfg, std::shared_ptr<Transport> tr, TimeSource* ts)
      : config(cfg),
        transport(std::move(tr)),
        time_source(ts ? ts : &SystemTimeSource::Instance()),
        log_callback(cfg.LogSink()) {}

  const NtpConfig config;
  std::shared_ptr<Transport> transport;
  TimeSource* time_source;  // not owned

  mutable std::mutex state_mtx;
  SyncState state;

  NtpConfig::LogCallback log_callback;

  SyncResult Sync();

  /**
   * @brief Perform one request/response exchange with a server.
   *
   * @param server Hostname passed to the transport.
   * @param out Offset and round-trip delay on success.
   * @param err Reason for failure.
   * @return true if the server answered with a usable packet.
   */
  bool ExchangeOnce(const std::string& server, Sample* out, Error* err);

  /** Calls ExchangeOnce() and turns transport exceptions into kIoError. */
  bool GuardedExchange(const std::string& server, Sample* out, Error* err);

  void Commit(const Sample& sample);
  SyncState Load() const;
  void Log(const std::string& msg) const;
};

bool NtpClient::Impl::ExchangeOnce(const std::string& server, Sample* out,
                                   Error* err) {
  // t0: local transmit time
  const int64_t t0 = time_source->NowUnixMillis();
  const NtpPacket request = NtpPacket::CreateRequest(t0);

  std::vector<uint8_t> rx;
  if (!transport->Exchange(server, config.Port(), NtpPacket::Encode(request),
                           config.Timeout(), &rx, err)) {
    return false;
  }

  // t3: local receive time
  const int64_t t3 = time_source->NowUnixMillis();

  NtpPacket response;
  if (!NtpPacket::Decode(rx, &response, err)) {
    return false;
  }

  if (response.stratum == 0) {
    SetError(err, ErrorCode::kServerRejected,
             "Server stratum is 0 (kiss-of-death)");
    return false;
  }

  // t1: server receive time, t2: server transmit time
  const int64_t t1 = response.receive_timestamp.ToEpochMillis();
  const int64_t t2 = response.transmit_timestamp.ToEpochMillis();

  out->offset_ms = ((t1 - t0) + (t2 - t3)) / 2;
  out->delay_ms = (t3 - t0) - (t2 - t1);
  return true;
}

bool NtpClient::Impl::GuardedExchange(const std::string& server, Sample* out,
                                      Error* err) {
  try {
    return ExchangeOnce(server, out, err);
  } catch (const std::exception& e) {
    SetError(err, ErrorCode::kIoError,
             std::string("transport exception: ") + e.what());
    return false;
  }
}

SyncResult NtpClient::Impl::Sync() {
  std::optional<Error> last_error;
  const int64_t attempts = static_cast<int64_t>(config.RetryCount()) + 1;

  for (const std::string& server : config.NtpServers()) {
    for (int64_t attempt = 0; attempt < attempts; ++attempt) {
      Sample sample;
      Error err;
      if (GuardedExchange(server, &sample, &err)) {
        Commit(sample);
        if (log_callback) {
          std::ostringstream oss;
          oss << "[NtpClient] synced with " << server
              << ": offset=" << sample.offset_ms
              << "ms rtt=" << sample.delay_ms << "ms (attempt "
              << (attempt + 1) << "/" << attempts << ")";
          Log(oss.str());
        }
        return SyncResult::Success(std::chrono::milliseconds(sample.offset_ms),
                                   std::chrono::milliseconds(sample.delay_ms),
                                   server);
      }

      if (err.ok()) {
        err = Error(ErrorCode::kIoError, "exchange failed");
      }
      if (log_callback) {
        std::ostringstream oss;
        oss << "[NtpClient] " << server << " attempt " << (attempt + 1) << "/"
            << attempts << " failed: " << err;
        Log(oss.str());
      }
      last_error = err;

      // Kiss-of-death is charged the same delay as any other failure.
      if (attempt + 1 < attempts) {
        time_source->SleepFor(config.RetryDelay());
      }
    }
  }

  if (log_callback) {
    Log("[NtpClient] failed to sync with any NTP server");
  }
  return SyncResult::Failure("Failed to sync with any NTP server", last_error);
}

void NtpClient::Impl::Commit(const Sample& sample) {
  SyncState next;
  next.offset_millis = sample.offset_ms;
  next.synced = true;
  next.last_sync_time_millis = time_source->NowUnixMillis();
  next.last_sync_monotonic_millis = time_source->MonotonicMillis();

  std::lock_guard<std::mutex> lk(state_mtx);
  state = next;
}

SyncState NtpClient::Impl::Load() const {
  std::lock_guard<std::mutex> lk(state_mtx);
  return state;
}

void NtpClient::Impl::Log(const std::string& msg) const {
  if (log_callback) log_callback(msg);
}

// ---------------- NtpClient ----------------
NtpClient::NtpClient(const NtpConfig& config)
    : p_(new Impl(config, std::shared_ptr<Transport>(CreateUdpTransport()),
                  nullptr)) {}

NtpClient::NtpClient(const NtpConfig& config,
                     std::shared_ptr<Transport> transport,
                     TimeSource* time_source)
    : p_(new Impl(config,
                  transport ? std::move(transport)
                            : std::shared_ptr<Transport>(CreateUdpTransport()),
                  time_source)) {}

NtpClient::~NtpClient() = default;

SyncResult NtpClient::Sync() { return p_->Sync(); }

std::optional<TimePoint> NtpClient::Now() const {
  const SyncState st = p_->Load();
  if (!st.synced) return std::nullopt;
  return TimePoint(std::chrono::milliseconds(
      p_->time_source->NowUnixMillis() + st.offset_millis));
}

TimePoint NtpClient::NowOrSystem() const {
  return TimePoint(std::chrono::milliseconds(CurrentTimeMillis()));
}

int64_t NtpClient::CurrentTimeMillis() const {
  const SyncState st = p_->Load();
  return p_->time_source->NowUnixMillis() + st.offset_millis;
}

std::chrono::milliseconds NtpClient::Offset() const {
  return std::chrono::milliseconds(p_->Load().offset_millis);
}

bool NtpClient::IsSynchronized() const { return p_->Load().synced; }

TimeSnapshot NtpClient::Snapshot() const {
  const SyncState st = p_->Load();
  TimeSnapshot snap;
  snap.epoch_millis = p_->time_source->NowUnixMillis() + st.offset_millis;
  snap.offset = std::chrono::milliseconds(st.offset_millis);
  snap.synced = st.synced;
  if (st.synced) snap.last_sync_time_millis = st.last_sync_time_millis;
  return snap;
}

bool NtpClient::NeedsSync() const {
  const SyncState st = p_->Load();
  if (!st.synced) return true;
  const std::chrono::milliseconds cache = p_->config.CacheDuration();
  if (cache == NtpConfig::kInfinite) return false;
  const int64_t age =
      p_->time_source->MonotonicMillis() - st.last_sync_monotonic_millis;
  return age >= cache.count();
}

void NtpClient::Reset() {
  std::lock_guard<std::mutex> lk(p_->state_mtx);
  p_->state = SyncState();
}

const NtpConfig& NtpClient::Config() const { return p_->config; }

}  // namespace ntpsync
