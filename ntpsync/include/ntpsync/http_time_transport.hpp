// Copyright (c) 2025 <Your Name>
/**
 * @file http_time_transport.hpp
 * @brief Transport for hosts without UDP access: HTTP time service.
 *
 * Instead of an NTP exchange, the transport fetches the current UNIX time
 * from an HTTP JSON endpoint (integer field "unixtime", seconds) and returns
 * a synthesized 48-byte server reply: VN=4, Mode=4, stratum 2, with
 * receive == transmit == the fetched time. The offset computed from it is
 * therefore only accurate to about one second plus half the HTTP round trip.
 * The host/port requested by the engine are ignored; the service endpoint is
 * fixed at construction.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "ntpsync/transport.hpp"

namespace ntpsync {

class HttpTimeTransport : public Transport {
 public:
  static constexpr const char* kDefaultHost = "worldtimeapi.org";
  static constexpr const char* kDefaultPort = "80";
  static constexpr const char* kDefaultTarget = "/api/ip";

  explicit HttpTimeTransport(std::string host = kDefaultHost,
                             std::string port = kDefaultPort,
                             std::string target = kDefaultTarget);

  bool Exchange(const std::string& host, uint16_t port,
                const std::vector<uint8_t>& request,
                std::chrono::milliseconds timeout,
                std::vector<uint8_t>* response, Error* err) override;

  /**
   * @brief Convert a time-service JSON body into an encoded NTP reply.
   * @param body Response body, e.g. {"unixtime": 1704067200, ...}.
   * @param out Encoded 48-byte packet on success.
   * @param err kIoError when the body is not JSON, lacks an integer
   *        "unixtime", or the value falls outside 1968-01-20 .. 2104-02-26.
   * @return true on success.
   */
  static bool PacketFromBody(const std::string& body, std::vector<uint8_t>* out,
                             Error* err);

 private:
  std::string host_;
  std::string port_;
  std::string target_;
};

}  // namespace ntpsync
