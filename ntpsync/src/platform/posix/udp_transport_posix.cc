// Copyright (c) 2025 <Your Name>
/**
 * @file udp_transport_posix.cc
 * @brief POSIX (Linux/macOS) UDP implementation of the Transport interface.
 */
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "ntpsync/transport.hpp"
#include "platform/common/socket_utils.hpp"

namespace ntpsync {
namespace platform {

namespace {
// Large enough for an NTP header plus extension fields / MAC.
constexpr size_t kMaxDatagram = 1500;

std::string ErrnoText(const std::string& context) {
  int err = errno;
  std::ostringstream oss;
  oss << context << " (errno " << err << ": " << std::strerror(err) << ")";
  return oss.str();
}
}  // namespace

class UdpTransportPosix : public Transport {
 public:
  bool Exchange(const std::string& host, uint16_t port,
                const std::vector<uint8_t>& request,
                std::chrono::milliseconds timeout,
                std::vector<uint8_t>* response, Error* err) override {
    if (response == nullptr) {
      SetError(err, ErrorCode::kIoError, "null response buffer");
      return false;
    }
    if (timeout > kMaxExchangeTimeout) timeout = kMaxExchangeTimeout;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    sockaddr_in addr{};
    if (!ResolveIpv4(host, port, &addr, err)) return false;
    // getaddrinfo() cannot be cut short; skip the send once past the deadline.
    if (std::chrono::steady_clock::now() >= deadline) {
      SetError(err, ErrorCode::kTimeout, "timeout before send");
      return false;
    }

    ScopedSocket sock(socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP));
    if (!sock.valid()) {
      SetError(err, ErrorCode::kIoError, ErrnoText("socket creation failed"));
      return false;
    }

    // Connected UDP: the kernel drops datagrams from other peers.
    if (connect(sock.get(), reinterpret_cast<const sockaddr*>(&addr),
                sizeof(addr)) < 0) {
      SetError(err, ErrorCode::kIoError, ErrnoText("connect failed"));
      return false;
    }

    ssize_t sent = send(sock.get(), request.data(), request.size(), 0);
    if (sent < 0) {
      SetError(err, ErrorCode::kIoError, ErrnoText("send failed"));
      return false;
    }
    if (sent != static_cast<ssize_t>(request.size())) {
      std::ostringstream oss;
      oss << "Partial send: sent " << sent << " of " << request.size()
          << " bytes";
      SetError(err, ErrorCode::kIoError, oss.str());
      return false;
    }

    if (!WaitReadable(sock.get(), deadline, err)) return false;

    std::vector<uint8_t> rx(kMaxDatagram);
    ssize_t n = recv(sock.get(), rx.data(), rx.size(), 0);
    if (n < 0) {
      SetError(err, ErrorCode::kIoError, ErrnoText("recv failed"));
      return false;
    }
    rx.resize(static_cast<size_t>(n));
    *response = std::move(rx);
    return true;
  }

 private:
  /** Polls until readable or the deadline passes; restarts on EINTR. */
  static bool WaitReadable(int fd,
                           std::chrono::steady_clock::time_point deadline,
                           Error* err) {
    for (;;) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        SetError(err, ErrorCode::kTimeout, "receive timeout");
        return false;
      }

      // remaining <= kMaxExchangeTimeout, so it fits poll()'s int.
      pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLIN;
      int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (ready < 0) {
        if (errno == EINTR) continue;
        SetError(err, ErrorCode::kIoError, ErrnoText("poll failed"));
        return false;
      }
      if (ready == 0) {
        SetError(err, ErrorCode::kTimeout, "receive timeout");
        return false;
      }
      if (pfd.revents & POLLIN) return true;
      // POLLERR: e.g. ICMP port unreachable on a connected socket.
      int so_err = 0;
      socklen_t len = sizeof(so_err);
      if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_err, &len) < 0) {
        SetError(err, ErrorCode::kIoError, ErrnoText("getsockopt failed"));
        return false;
      }
      std::ostringstream oss;
      oss << "socket error (errno " << so_err << ": " << std::strerror(so_err)
          << ")";
      SetError(err, ErrorCode::kIoError, oss.str());
      return false;
    }
  }
};

}  // namespace platform

std::unique_ptr<Transport> CreateUdpTransport() {
  return std::unique_ptr<Transport>(new platform::UdpTransportPosix());
}

}  // namespace ntpsync
