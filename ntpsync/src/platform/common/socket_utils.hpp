// Copyright (c) 2025 <Your Name>
/**
 * @file socket_utils.hpp
 * @brief Address resolution helpers shared by the socket transports.
 */
#pragma once

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstring>
#include <string>

#include "ntpsync/error.hpp"

namespace ntpsync {
namespace platform {

/**
 * @brief Resolve host:port into an IPv4 sockaddr_in.
 *
 * Numeric addresses are parsed directly; names go through getaddrinfo(),
 * which blocks for as long as the system resolver takes.
 * @param host Hostname or dotted-quad address.
 * @param port Destination port (host order).
 * @param addr Output address.
 * @param err Set to kHostUnresolvable on failure.
 * @return true on success.
 */
inline bool ResolveIpv4(const std::string& host, uint16_t port,
                        sockaddr_in* addr, Error* err) {
  std::memset(addr, 0, sizeof(*addr));
  addr->sin_family = AF_INET;
  addr->sin_port = htons(port);

  if (inet_pton(AF_INET, host.c_str(), &addr->sin_addr) == 1) {
    return true;
  }

  addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  hints.ai_protocol = IPPROTO_UDP;
  addrinfo* res = nullptr;
  const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &res);
  if (rc != 0 || res == nullptr) {
    SetError(err, ErrorCode::kHostUnresolvable,
             "getaddrinfo(" + host + ") failed: " +
                 (rc != 0 ? gai_strerror(rc) : "no address"));
    if (res) freeaddrinfo(res);
    return false;
  }
  const auto* sin = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
  addr->sin_addr = sin->sin_addr;
  freeaddrinfo(res);
  return true;
}

/**
 * @brief Owns a socket descriptor and closes it on scope exit.
 */
class ScopedSocket {
 public:
  explicit ScopedSocket(int fd) : fd_(fd) {}
  ~ScopedSocket() {
    if (fd_ >= 0) close(fd_);
  }

  ScopedSocket(const ScopedSocket&) = delete;
  ScopedSocket& operator=(const ScopedSocket&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

 private:
  int fd_;
};

}  // namespace platform
}  // namespace ntpsync
