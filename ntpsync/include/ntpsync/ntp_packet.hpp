// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_packet.hpp
 * @brief SNTP (RFC 4330) packet and its 48-byte wire codec.
 *
 * Layout (all multi-byte fields big-endian):
 *
 *   offset  size  field
 *   0       1     LI (bits 7-6) | VN (bits 5-3) | Mode (bits 2-0)
 *   1       1     Stratum
 *   2       1     Poll (log2 seconds, signed)
 *   3       1     Precision (log2 seconds, signed)
 *   4       4     Root Delay
 *   8       4     Root Dispersion
 *   12      4     Reference Identifier
 *   16      8     Reference Timestamp
 *   24      8     Originate Timestamp
 *   32      8     Receive Timestamp
 *   40      8     Transmit Timestamp
 *
 * Extension fields and MACs that may follow the header are ignored.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <vector>

#include "ntpsync/error.hpp"
#include "ntpsync/ntp_timestamp.hpp"

namespace ntpsync {

/**
 * @brief Decoded SNTP packet (host byte order).
 *
 * Header fields hold their decoded values; Encode() masks them to their
 * bit widths (LI 2 bits, VN 3 bits, Mode 3 bits).
 */
struct NtpPacket {
  static constexpr size_t kPacketSize = 48;  ///< Basic header size (bytes)
  static constexpr uint16_t kNtpPort = 123;  ///< Well-known NTP port
  static constexpr uint8_t kVersion = 4;     ///< Version sent in requests
  static constexpr uint8_t kModeClient = 3;
  static constexpr uint8_t kModeServer = 4;

  uint8_t leap_indicator = 0;     ///< 0 none, 1 +1s, 2 -1s, 3 unsynchronized
  uint8_t version = 0;            ///< Version number
  uint8_t mode = 0;               ///< 3 client, 4 server
  uint8_t stratum = 0;            ///< 0 = kiss-of-death / unspecified
  int8_t poll_interval = 0;       ///< Poll interval (log2 seconds)
  int8_t precision = 0;           ///< Precision (log2 seconds)
  uint32_t root_delay = 0;        ///< NTP short format
  uint32_t root_dispersion = 0;   ///< NTP short format
  uint32_t reference_identifier = 0;
  NtpTimestamp reference_timestamp;
  NtpTimestamp originate_timestamp;
  NtpTimestamp receive_timestamp;
  NtpTimestamp transmit_timestamp;

  /**
   * @brief Build a client request (LI=0, VN=4, Mode=3).
   * @param transmit_ms Local send time in UNIX milliseconds.
   * @return Packet with every other field zero.
   */
  static NtpPacket CreateRequest(int64_t transmit_ms);

  /**
   * @brief Serialize into exactly kPacketSize bytes.
   *
   * Timestamp seconds are written modulo 2^32; Decode() restores the era, so
   * timestamps between 1968-01-20 and 2104-02-26 (and zero) survive a round
   * trip unchanged.
   */
  static std::vector<uint8_t> Encode(const NtpPacket& p);

  /**
   * @brief Parse the first kPacketSize bytes of a datagram.
   * @param bytes Received bytes; trailing data is ignored.
   * @param out Parsed packet on success; untouched on failure.
   * @param err Optional error (kMalformedPacket when input is short).
   * @return true on success.
   */
  static bool Decode(const std::vector<uint8_t>& bytes, NtpPacket* out,
                     Error* err = nullptr);

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const NtpPacket& p);
};

bool operator==(const NtpPacket& a, const NtpPacket& b);

inline bool operator!=(const NtpPacket& a, const NtpPacket& b) {
  return !(a == b);
}

}  // namespace ntpsync
