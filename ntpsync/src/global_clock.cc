// Copyright (c) 2025 <Your Name>
#include "ntpsync/global_clock.hpp"

#include <mutex>
#include <utility>

namespace ntpsync {

namespace {

struct GlobalState {
  std::mutex client_mtx;  // guards client
  std::shared_ptr<NtpClient> client;
  std::mutex sync_mtx;  // one Sync() in flight
};

GlobalState& State() {
  static GlobalState state;
  return state;
}

std::shared_ptr<NtpClient> LoadClient() {
  GlobalState& g = State();
  std::lock_guard<std::mutex> lk(g.client_mtx);
  return g.client;
}

}  // namespace

void GlobalClock::Initialize(const NtpConfig& config,
                             std::shared_ptr<Transport> transport,
                             TimeSource* time_source) {
  auto client =
      std::make_shared<NtpClient>(config, std::move(transport), time_source);
  {
    GlobalState& g = State();
    std::lock_guard<std::mutex> lk(g.client_mtx);
    g.client = client;
  }
  if (config.SyncOnInit()) {
    SyncResult r = Sync();
    if (config.LogSink() && r.IsFailure()) {
      config.LogSink()("[GlobalClock] initial sync failed: " +
                       r.ErrorMessage());
    }
  }
}

bool GlobalClock::IsInitialized() { return LoadClient() != nullptr; }

void GlobalClock::Shutdown() {
  GlobalState& g = State();
  std::lock_guard<std::mutex> lk(g.client_mtx);
  g.client.reset();
}

std::shared_ptr<NtpClient> GlobalClock::Client() {
  std::shared_ptr<NtpClient> c = LoadClient();
  if (!c) throw NotInitializedError();
  return c;
}

SyncResult GlobalClock::Sync() {
  std::shared_ptr<NtpClient> c = Client();
  std::lock_guard<std::mutex> lk(State().sync_mtx);
  return c->Sync();
}

std::optional<TimePoint> GlobalClock::Now() { return Client()->Now(); }

TimePoint GlobalClock::NowOrSystem() { return Client()->NowOrSystem(); }

int64_t GlobalClock::CurrentTimeMillis() {
  return Client()->CurrentTimeMillis();
}

bool GlobalClock::IsSynchronized() { return Client()->IsSynchronized(); }

TimeSnapshot GlobalClock::Snapshot() { return Client()->Snapshot(); }

void GlobalClock::Reset() { Client()->Reset(); }

}  // namespace ntpsync
