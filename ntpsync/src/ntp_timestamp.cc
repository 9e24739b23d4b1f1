// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_timestamp.cc
 * @brief NTP timestamp <-> UNIX milliseconds conversion.
 */
#include "ntpsync/ntp_timestamp.hpp"

#include <iomanip>

namespace ntpsync {

namespace {
constexpr int64_t kMillisPerSec = 1000;
constexpr uint64_t kFractionPerSec = 1ULL << 32;
constexpr int64_t kEraSeconds = 1LL << 32;
constexpr uint32_t kEraPivotBit = 0x80000000u;
}  // namespace

NtpTimestamp NtpTimestamp::FromEpochMillis(int64_t epoch_ms) {
  // Floor division keeps the fraction in [0, 2^32) for pre-1970 inputs.
  int64_t sec = epoch_ms / kMillisPerSec;
  int64_t ms = epoch_ms % kMillisPerSec;
  if (ms < 0) {
    ms += kMillisPerSec;
    --sec;
  }

  const int64_t ntp_sec = sec + static_cast<int64_t>(kNtpUnixEpochDiff);
  const uint64_t frac =
      (static_cast<uint64_t>(ms) * kFractionPerSec) / kMillisPerSec;

  return NtpTimestamp(ntp_sec, static_cast<uint32_t>(frac & 0xFFFFFFFFULL));
}

NtpTimestamp NtpTimestamp::FromWire(uint32_t seconds, uint32_t fraction) {
  if (seconds == 0 && fraction == 0) return NtpTimestamp();
  int64_t sec = static_cast<int64_t>(seconds);
  if ((seconds & kEraPivotBit) == 0) sec += kEraSeconds;
  return NtpTimestamp(sec, fraction);
}

int64_t NtpTimestamp::ToEpochMillis() const {
  const int64_t unix_sec = seconds_ - static_cast<int64_t>(kNtpUnixEpochDiff);
  // frac * 1000 / 2^32 (fits: 2^32 * 1000 < 2^42)
  const int64_t frac_ms = static_cast<int64_t>(
      (static_cast<uint64_t>(fraction_) * kMillisPerSec) >> 32);
  return unix_sec * kMillisPerSec + frac_ms;
}

std::ostream& operator<<(std::ostream& os, const NtpTimestamp& ts) {
  std::ios_base::fmtflags flags = os.flags();
  os << "0x" << std::hex << std::setw(8) << std::setfill('0') << ts.Seconds()
     << "." << std::setw(8) << std::setfill('0') << ts.Fraction();
  os.flags(flags);
  os << std::setfill(' ');
  return os;
}

}  // namespace ntpsync
