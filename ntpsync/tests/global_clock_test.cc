// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Tests for the process-wide GlobalClock facade.
 */
#include "ntpsync/global_clock.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "test_fakes.hpp"

namespace ntpsync {

using std::chrono::milliseconds;
using test::FakeTimeSource;
using test::ScriptedTransport;
using test::ServerReply;

namespace {

/** Replies with the current system time after a short pause; counts overlap. */
class OverlapCountingTransport : public Transport {
 public:
  bool Exchange(const std::string&, uint16_t, const std::vector<uint8_t>&,
                milliseconds, std::vector<uint8_t>* response,
                Error*) override {
    const int now_active = ++active_;
    int prev = max_active_.load();
    while (now_active > prev &&
           !max_active_.compare_exchange_weak(prev, now_active)) {
    }
    std::this_thread::sleep_for(milliseconds(20));
    const int64_t now_ms =
        std::chrono::duration_cast<milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();
    *response = ServerReply(now_ms, now_ms);
    ++calls_;
    --active_;
    return true;
  }

  int MaxActive() const { return max_active_.load(); }
  int Calls() const { return calls_.load(); }

 private:
  std::atomic<int> active_{0};
  std::atomic<int> max_active_{0};
  std::atomic<int> calls_{0};
};

NtpConfig OneServer(bool sync_on_init) {
  return NtpConfig::Builder()
      .NtpServers({"a.example"})
      .RetryCount(0)
      .SyncOnInit(sync_on_init)
      .Build();
}

}  // namespace

class GlobalClockTest : public ::testing::Test {
 protected:
  void SetUp() override { GlobalClock::Shutdown(); }
  void TearDown() override { GlobalClock::Shutdown(); }
};

/**
 * @test GlobalClockTest.ThrowsBeforeInitialize
 * @brief Every accessor rejects use before Initialize().
 *
 * @steps
 * 1. Ensure the facade is shut down.
 * 2. Call each accessor.
 *
 * @expected IsInitialized() is false and every other call throws
 * NotInitializedError.
 */
TEST_F(GlobalClockTest, ThrowsBeforeInitialize) {
  EXPECT_FALSE(GlobalClock::IsInitialized());
  EXPECT_THROW(GlobalClock::Client(), NotInitializedError);
  EXPECT_THROW(GlobalClock::Sync(), NotInitializedError);
  EXPECT_THROW(GlobalClock::Now(), NotInitializedError);
  EXPECT_THROW(GlobalClock::NowOrSystem(), NotInitializedError);
  EXPECT_THROW(GlobalClock::CurrentTimeMillis(), NotInitializedError);
  EXPECT_THROW(GlobalClock::IsSynchronized(), NotInitializedError);
  EXPECT_THROW(GlobalClock::Snapshot(), NotInitializedError);
  EXPECT_THROW(GlobalClock::Reset(), NotInitializedError);
}

TEST_F(GlobalClockTest, InitializeSyncsWhenConfigured) {
  FakeTimeSource clock(1000);
  auto tr = std::make_shared<ScriptedTransport>();
  tr->Push([&clock](const std::vector<uint8_t>&, std::vector<uint8_t>* resp,
                    Error*) {
    clock.Advance(100);
    *resp = ServerReply(1050, 1060);
    return true;
  });

  GlobalClock::Initialize(OneServer(true), tr, &clock);
  EXPECT_TRUE(GlobalClock::IsInitialized());
  EXPECT_TRUE(GlobalClock::IsSynchronized());
  EXPECT_EQ(GlobalClock::CurrentTimeMillis(), 1105);
  ASSERT_TRUE(GlobalClock::Now().has_value());
  EXPECT_EQ(GlobalClock::Snapshot().offset, milliseconds(5));
}

TEST_F(GlobalClockTest, InitializeWithoutSyncLeavesClockUnsynced) {
  FakeTimeSource clock(5000);
  auto tr = std::make_shared<ScriptedTransport>();

  GlobalClock::Initialize(OneServer(false), tr, &clock);
  EXPECT_TRUE(GlobalClock::IsInitialized());
  EXPECT_FALSE(GlobalClock::IsSynchronized());
  EXPECT_TRUE(tr->Calls().empty());
  EXPECT_FALSE(GlobalClock::Now().has_value());
  EXPECT_EQ(GlobalClock::NowOrSystem().time_since_epoch(), milliseconds(5000));
}

TEST_F(GlobalClockTest, FailedInitialSyncIsLogged) {
  FakeTimeSource clock(5000);
  auto tr = std::make_shared<ScriptedTransport>();
  std::vector<std::string> lines;
  NtpConfig cfg =
      NtpConfig::Builder(OneServer(true))
          .LogSink([&lines](const std::string& s) { lines.push_back(s); })
          .Build();

  GlobalClock::Initialize(cfg, tr, &clock);
  EXPECT_TRUE(GlobalClock::IsInitialized());
  EXPECT_FALSE(GlobalClock::IsSynchronized());
  ASSERT_FALSE(lines.empty());
  EXPECT_EQ(lines.back().rfind("[GlobalClock]", 0), 0u);
}

/**
 * @test GlobalClockTest.ReinitializeReplacesAndShutdownDrops
 * @brief Initialize() swaps the shared client; Shutdown() removes it.
 *
 * @steps
 * 1. Initialize, sync, keep a handle to the client.
 * 2. Initialize again without syncing.
 * 3. Shutdown().
 *
 * @expected The new client is unsynchronized and distinct; the old handle
 * stays usable; after Shutdown() accessors throw again.
 */
TEST_F(GlobalClockTest, ReinitializeReplacesAndShutdownDrops) {
  FakeTimeSource clock(1000);
  auto tr = std::make_shared<ScriptedTransport>();
  tr->PushReply(ServerReply(1000, 1000));
  GlobalClock::Initialize(OneServer(true), tr, &clock);
  std::shared_ptr<NtpClient> first = GlobalClock::Client();
  ASSERT_TRUE(first->IsSynchronized());

  GlobalClock::Initialize(OneServer(false), tr, &clock);
  EXPECT_NE(GlobalClock::Client(), first);
  EXPECT_FALSE(GlobalClock::IsSynchronized());
  EXPECT_TRUE(first->IsSynchronized());

  GlobalClock::Shutdown();
  EXPECT_FALSE(GlobalClock::IsInitialized());
  EXPECT_THROW(GlobalClock::Snapshot(), NotInitializedError);
}

TEST_F(GlobalClockTest, ResetClearsSharedState) {
  FakeTimeSource clock(1000);
  auto tr = std::make_shared<ScriptedTransport>();
  tr->PushReply(ServerReply(1000, 1000));
  GlobalClock::Initialize(OneServer(true), tr, &clock);
  ASSERT_TRUE(GlobalClock::IsSynchronized());

  GlobalClock::Reset();
  EXPECT_FALSE(GlobalClock::IsSynchronized());
  GlobalClock::Reset();
  EXPECT_FALSE(GlobalClock::IsSynchronized());
}

/**
 * @test GlobalClockTest.ConcurrentSyncsDoNotOverlap
 * @brief Sync() through the facade is serialized.
 *
 * @steps
 * 1. Initialize with a transport that records concurrent exchanges.
 * 2. Call GlobalClock::Sync() from four threads at once.
 *
 * @expected Four exchanges, never more than one in flight; all succeed.
 */
TEST_F(GlobalClockTest, ConcurrentSyncsDoNotOverlap) {
  auto counter = std::make_shared<OverlapCountingTransport>();
  GlobalClock::Initialize(OneServer(false), counter);

  std::atomic<int> ok{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&ok] {
      if (GlobalClock::Sync().IsSuccess()) ++ok;
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(ok.load(), 4);
  EXPECT_EQ(counter->Calls(), 4);
  EXPECT_EQ(counter->MaxActive(), 1);
  EXPECT_TRUE(GlobalClock::IsSynchronized());
}

}  // namespace ntpsync
