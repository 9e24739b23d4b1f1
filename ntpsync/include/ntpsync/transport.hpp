// Copyright (c) 2025 <Your Name>
/**
 * @file transport.hpp
 * @brief Request/response transport used by the sync engine.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "ntpsync/error.hpp"

namespace ntpsync {

/** Longest wait a transport honors; larger timeouts are capped to it. */
constexpr std::chrono::milliseconds kMaxExchangeTimeout =
    std::chrono::milliseconds(std::numeric_limits<int>::max());

/**
 * Send one request datagram and wait for one response.
 *
 * Implementations must bound the wait by @p timeout and release any socket
 * or connection they opened before returning, on success and on failure.
 * The engine never knows which concrete transport is in use.
 *
 * Host name lookup is part of the exchange and its time is charged against
 * @p timeout. The UDP transport resolves through the blocking system
 * resolver (getaddrinfo), which cannot be cancelled: a slow lookup may
 * overrun the timeout, after which the exchange fails with kTimeout without
 * sending. Pass a numeric address to keep the bound strict.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * @brief Exchange one request/response pair with host:port.
   * @param host Hostname or numeric IPv4 address.
   * @param port Destination port.
   * @param request Encoded request bytes.
   * @param timeout Upper bound for the whole exchange (capped to
   *        kMaxExchangeTimeout).
   * @param response Received bytes on success.
   * @param err Failure reason (kTimeout, kHostUnresolvable, kIoError).
   * @return true on success.
   */
  virtual bool Exchange(const std::string& host, uint16_t port,
                        const std::vector<uint8_t>& request,
                        std::chrono::milliseconds timeout,
                        std::vector<uint8_t>* response, Error* err) = 0;
};

/**
 * @brief Creates the UDP transport for the current platform.
 */
std::unique_ptr<Transport> CreateUdpTransport();

}  // namespace ntpsync
