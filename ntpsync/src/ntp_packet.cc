// Copyright (c) 2025 <Your Name>
/**
 * @file ntp_packet.cc
 * @brief SNTP packet encode/decode.
 */
#include "ntpsync/ntp_packet.hpp"

#include <sstream>
#include <vector>

namespace ntpsync {

NtpPacket NtpPacket::CreateRequest(int64_t transmit_ms) {
  NtpPacket p;
  p.leap_indicator = 0;
  p.version = kVersion;
  p.mode = kModeClient;
  p.transmit_timestamp = NtpTimestamp::FromEpochMillis(transmit_ms);
  return p;
}

std::vector<uint8_t> NtpPacket::Encode(const NtpPacket& p) {
  std::vector<uint8_t> out;
  out.reserve(kPacketSize);

  auto append_be32 = [&](uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xffU));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xffU));
    out.push_back(static_cast<uint8_t>(v & 0xffU));
  };
  auto append_timestamp = [&](const NtpTimestamp& ts) {
    append_be32(ts.WireSeconds());
    append_be32(ts.Fraction());
  };

  out.push_back(static_cast<uint8_t>(((p.leap_indicator & 0x03U) << 6) |
                                     ((p.version & 0x07U) << 3) |
                                     (p.mode & 0x07U)));
  out.push_back(p.stratum);
  out.push_back(static_cast<uint8_t>(p.poll_interval));
  out.push_back(static_cast<uint8_t>(p.precision));

  append_be32(p.root_delay);
  append_be32(p.root_dispersion);
  append_be32(p.reference_identifier);

  append_timestamp(p.reference_timestamp);
  append_timestamp(p.originate_timestamp);
  append_timestamp(p.receive_timestamp);
  append_timestamp(p.transmit_timestamp);
  return out;
}

bool NtpPacket::Decode(const std::vector<uint8_t>& bytes, NtpPacket* out,
                       Error* err) {
  if (out == nullptr) return false;
  if (bytes.size() < kPacketSize) {
    std::ostringstream oss;
    oss << "NTP packet must be at least " << kPacketSize << " bytes, got "
        << bytes.size();
    SetError(err, ErrorCode::kMalformedPacket, oss.str());
    return false;
  }

  auto rd32 = [&](size_t at) {
    return (static_cast<uint32_t>(bytes[at]) << 24) |
           (static_cast<uint32_t>(bytes[at + 1]) << 16) |
           (static_cast<uint32_t>(bytes[at + 2]) << 8) |
           (static_cast<uint32_t>(bytes[at + 3]));
  };
  auto rd_timestamp = [&](size_t at) {
    return NtpTimestamp::FromWire(rd32(at), rd32(at + 4));
  };

  NtpPacket p;
  const uint8_t b0 = bytes[0];
  p.leap_indicator = static_cast<uint8_t>((b0 >> 6) & 0x03U);
  p.version = static_cast<uint8_t>((b0 >> 3) & 0x07U);
  p.mode = static_cast<uint8_t>(b0 & 0x07U);
  p.stratum = bytes[1];
  p.poll_interval = static_cast<int8_t>(bytes[2]);
  p.precision = static_cast<int8_t>(bytes[3]);
  p.root_delay = rd32(4);
  p.root_dispersion = rd32(8);
  p.reference_identifier = rd32(12);
  p.reference_timestamp = rd_timestamp(16);
  p.originate_timestamp = rd_timestamp(24);
  p.receive_timestamp = rd_timestamp(32);
  p.transmit_timestamp = rd_timestamp(40);

  *out = p;
  return true;
}

bool operator==(const NtpPacket& a, const NtpPacket& b) {
  return a.leap_indicator == b.leap_indicator && a.version == b.version &&
         a.mode == b.mode && a.stratum == b.stratum &&
         a.poll_interval == b.poll_interval && a.precision == b.precision &&
         a.root_delay == b.root_delay &&
         a.root_dispersion == b.root_dispersion &&
         a.reference_identifier == b.reference_identifier &&
         a.reference_timestamp == b.reference_timestamp &&
         a.originate_timestamp == b.originate_timestamp &&
         a.receive_timestamp == b.receive_timestamp &&
         a.transmit_timestamp == b.transmit_timestamp;
}

std::ostream& operator<<(std::ostream& os, const NtpPacket& p) {
  os << "li=" << static_cast<int>(p.leap_indicator)
     << ", vn=" << static_cast<int>(p.version)
     << ", mode=" << static_cast<int>(p.mode)
     << ", stratum=" << static_cast<int>(p.stratum)
     << ", poll=" << static_cast<int>(p.poll_interval)
     << ", precision=" << static_cast<int>(p.precision)
     << ", rx=" << p.receive_timestamp << ", tx=" << p.transmit_timestamp;
  return os;
}

}  // namespace ntpsync
