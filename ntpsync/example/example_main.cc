// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Example program: one SNTP sync and a printout of the corrected clock.
 *
 * Usage:
 *   ntpsync_example --server time.google.com --server pool.ntp.org \
 *     --timeout 3000 --retries 1 --retry-delay 500 --debug
 *   ntpsync_example --http          # fetch time over HTTP instead of UDP
 *   ntpsync_example --global        # go through the GlobalClock facade
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "ntpsync/global_clock.hpp"
#include "ntpsync/http_time_transport.hpp"
#include "ntpsync/ntp_client.hpp"
#include "ntpsync/ntp_config.hpp"

namespace {
/**
 * @brief Thread-safe logger for debug messages.
 */
class Logger {
 public:
  explicit Logger(bool enabled) : enabled_(enabled) {}

  void Log(const std::string& msg) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s\n", msg.c_str());
  }

 private:
  bool enabled_;
  std::mutex mutex_;
};

std::string FormatUtc(int64_t epoch_ms) {
  int64_t sec = epoch_ms / 1000;
  int64_t ms = epoch_ms % 1000;
  if (ms < 0) {
    ms += 1000;
    --sec;
  }
  std::tm tm{};
  time_t t = static_cast<time_t>(sec);
  gmtime_r(&t, &tm);
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d UTC",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  return buf;
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: ntpsync_example [options]\n"
               "Options:\n"
               "  --server HOST        (repeatable; default: built-in list)\n"
               "  --port N             (default 123)\n"
               "  --timeout ms         (default 10000)\n"
               "  --retries n          (default 3)\n"
               "  --retry-delay ms     (default 1000)\n"
               "  --http               Use the HTTP time service transport\n"
               "  --global             Use the GlobalClock facade\n"
               "  --debug              Enable debug logging\n");
}
}  // namespace

int main(int argc, char** argv) {
  std::vector<std::string> servers;
  bool use_http = false;
  bool use_global = false;
  bool debug = false;

  auto builder = ntpsync::NtpConfig::Builder();

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--server" && need(1)) {
      servers.push_back(argv[++i]);
    } else if (a == "--port" && need(1)) {
      builder.Port(static_cast<uint16_t>(std::atoi(argv[++i])));
    } else if (a == "--timeout" && need(1)) {
      builder.Timeout(std::chrono::milliseconds(std::atoi(argv[++i])));
    } else if (a == "--retries" && need(1)) {
      builder.RetryCount(std::atoi(argv[++i]));
    } else if (a == "--retry-delay" && need(1)) {
      builder.RetryDelay(std::chrono::milliseconds(std::atoi(argv[++i])));
    } else if (a == "--http") {
      use_http = true;
    } else if (a == "--global") {
      use_global = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (!servers.empty()) builder.NtpServers(servers);

  Logger logger(debug);
  builder.LogSink([&logger](const std::string& msg) { logger.Log(msg); });

  std::shared_ptr<ntpsync::Transport> transport;
  if (use_http) transport = std::make_shared<ntpsync::HttpTimeTransport>();

  // The facade syncs inside Initialize(); the plain client syncs explicitly.
  const ntpsync::NtpConfig cfg = builder.SyncOnInit(use_global).Build();
  {
    std::ostringstream oss;
    oss << "[example] config: " << cfg;
    logger.Log(oss.str());
  }

  ntpsync::TimeSnapshot snap;
  if (use_global) {
    ntpsync::GlobalClock::Initialize(cfg, transport);
    snap = ntpsync::GlobalClock::Snapshot();
    ntpsync::GlobalClock::Shutdown();
  } else {
    ntpsync::NtpClient client(cfg, transport);
    ntpsync::SyncResult r = client.Sync();
    if (r.IsFailure()) {
      std::ostringstream oss;
      oss << r;
      std::fprintf(stderr, "ntpsync: %s\n", oss.str().c_str());
      return 1;
    }
    std::printf("ntpsync: synced with %s, offset=%lldms, rtt=%lldms\n",
                r.ServerAddress().c_str(),
                static_cast<long long>(r.Offset().count()),
                static_cast<long long>(r.RoundTripDelay().count()));
    snap = client.Snapshot();
  }

  if (!snap.synced) {
    std::fprintf(stderr, "ntpsync: not synchronized, showing system time\n");
  }
  std::printf("now=%s offset=%lldms\n", FormatUtc(snap.epoch_millis).c_str(),
              static_cast<long long>(snap.offset.count()));
  return snap.synced ? 0 : 1;
}
