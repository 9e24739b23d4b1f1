// Copyright (c) 2025 <Your Name>
#include "ntpsync/time_source.hpp"

#include <chrono>
#include <thread>

namespace ntpsync {

int64_t SystemTimeSource::NowUnixMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t SystemTimeSource::MonotonicMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

void SystemTimeSource::SleepFor(std::chrono::milliseconds duration) {
  if (duration.count() <= 0) return;
  std::this_thread::sleep_for(duration);
}

SystemTimeSource& SystemTimeSource::Instance() {
  static SystemTimeSource instance;
  return instance;
}

}  // namespace ntpsync
