// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_timestamp.hpp
 * @brief NTP 64-bit fixed-point timestamp (seconds.fraction since 1900).
 *
 * Conversion to and from UNIX epoch milliseconds truncates the fractional
 * part, so a round trip through FromEpochMillis()/ToEpochMillis() is exact
 * to within 1 ms. That tolerance is a property of the format at millisecond
 * granularity.
 *
 * In memory the seconds count is 64-bit and does not wrap in 2036. Only the
 * wire form carries 32 bits; FromWire() maps it back into the window
 * 1968-01-20 .. 2104-02-26 (RFC 4330 section 3).
 */
#pragma once

#include <cstdint>
#include <ostream>

namespace ntpsync {

/** @brief NTP epoch offset from UNIX epoch (seconds, 1900-01-01 vs 1970-01-01).
 */
constexpr uint32_t kNtpUnixEpochDiff = 2208988800UL;

/**
 * @brief NTP timestamp: seconds since 1900 plus a 2^-32 s fraction.
 */
class NtpTimestamp {
 public:
  /** Zero timestamp (NTP "unknown time"). */
  constexpr NtpTimestamp() : seconds_(0), fraction_(0) {}

  constexpr NtpTimestamp(int64_t seconds, uint32_t fraction)
      : seconds_(seconds), fraction_(fraction) {}

  static constexpr NtpTimestamp Zero() { return NtpTimestamp(); }

  /**
   * @brief Create from milliseconds since the UNIX epoch.
   *
   * seconds = floor(ms / 1000) + 2208988800,
   * fraction = (ms mod 1000) * 2^32 / 1000.
   */
  static NtpTimestamp FromEpochMillis(int64_t epoch_ms);

  /**
   * @brief Create from the 32-bit seconds and fraction words of a packet.
   *
   * Seconds with the most significant bit clear belong to era 1 (after
   * 2036-02-07 06:28:16 UTC) and get 2^32 added. An all-zero value stays
   * zero ("unknown time").
   */
  static NtpTimestamp FromWire(uint32_t seconds, uint32_t fraction);

  /** @brief Convert to milliseconds since the UNIX epoch (truncating). */
  int64_t ToEpochMillis() const;

  /**
   * @brief Pack as 64-bit host-order value (seconds << 32 | fraction).
   *
   * Only the low 32 bits of the seconds are kept, as on the wire.
   */
  uint64_t ToNtp64() const {
    return (static_cast<uint64_t>(WireSeconds()) << 32) | fraction_;
  }

  /** @brief Unpack a 64-bit host-order value (era pivot as FromWire()). */
  static NtpTimestamp FromNtp64(uint64_t v) {
    return FromWire(static_cast<uint32_t>(v >> 32),
                    static_cast<uint32_t>(v & 0xFFFFFFFFULL));
  }

  /** Seconds since 1900-01-01, not reduced to one era. */
  int64_t Seconds() const { return seconds_; }
  /** Low 32 bits of Seconds(), as written to a packet. */
  uint32_t WireSeconds() const {
    return static_cast<uint32_t>(static_cast<uint64_t>(seconds_) &
                                 0xFFFFFFFFULL);
  }
  uint32_t Fraction() const { return fraction_; }

 private:
  int64_t seconds_;
  uint32_t fraction_;
};

inline bool operator==(const NtpTimestamp& a, const NtpTimestamp& b) {
  return a.Seconds() == b.Seconds() && a.Fraction() == b.Fraction();
}

inline bool operator!=(const NtpTimestamp& a, const NtpTimestamp& b) {
  return !(a == b);
}

/** Stream formatter for logging ("seconds.fraction" in hex). */
std::ostream& operator<<(std::ostream& os, const NtpTimestamp& ts);

}  // namespace ntpsync
