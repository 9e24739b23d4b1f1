// Copyright (c) 2025 <Your Name>
/**
 * @file http_time_transport.cc
 * @brief HTTP time-service transport (Boost.Beast client, nlohmann::json).
 */
#include "ntpsync/http_time_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <sstream>
#include <utility>

#include "ntpsync/ntp_packet.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ntpsync {

namespace {
constexpr uint8_t kSynthesizedStratum = 2;
// UNIX seconds a packet timestamp can carry (1968-01-20 .. 2104-02-26).
constexpr int64_t kMinUnixSeconds =
    0x80000000LL - static_cast<int64_t>(kNtpUnixEpochDiff);
constexpr int64_t kMaxUnixSeconds =
    (1LL << 32) + 0x7FFFFFFFLL - static_cast<int64_t>(kNtpUnixEpochDiff);
}  // namespace

HttpTimeTransport::HttpTimeTransport(std::string host, std::string port,
                                     std::string target)
    : host_(std::move(host)),
      port_(std::move(port)),
      target_(std::move(target)) {}

bool HttpTimeTransport::Exchange(const std::string& /*host*/,
                                 uint16_t /*port*/,
                                 const std::vector<uint8_t>& /*request*/,
                                 std::chrono::milliseconds timeout,
                                 std::vector<uint8_t>* response, Error* err) {
  if (response == nullptr) {
    SetError(err, ErrorCode::kIoError, "null response buffer");
    return false;
  }
  if (timeout > kMaxExchangeTimeout) timeout = kMaxExchangeTimeout;

  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::request<http::empty_body> req{http::verb::get, target_, 11};
  req.set(http::field::host, host_);
  req.set(http::field::user_agent, "ntpsync/1.0");
  http::response<http::string_body> res;

  bool done = false;
  Error failure;
  auto fail = [&](const std::string& what, const beast::error_code& ec,
                  ErrorCode code) {
    if (ec == beast::error::timeout) code = ErrorCode::kTimeout;
    failure = Error(code, what + ": " + ec.message());
    done = true;
  };

  resolver.async_resolve(
      host_, port_,
      [&](const beast::error_code& resolve_ec,
          tcp::resolver::results_type results) {
        if (resolve_ec) {
          return fail("resolve " + host_, resolve_ec,
                      ErrorCode::kHostUnresolvable);
        }
        stream.expires_after(timeout);
        stream.async_connect(results, [&](const beast::error_code& connect_ec,
                                          const tcp::endpoint&) {
          if (connect_ec) {
            return fail("connect", connect_ec, ErrorCode::kIoError);
          }
          http::async_write(stream, req, [&](const beast::error_code& write_ec,
                                             std::size_t) {
            if (write_ec) return fail("write", write_ec, ErrorCode::kIoError);
            http::async_read(stream, buffer, res,
                             [&](const beast::error_code& read_ec,
                                 std::size_t) {
                               if (read_ec) {
                                 return fail("read", read_ec,
                                             ErrorCode::kIoError);
                               }
                               done = true;
                             });
          });
        });
      });

  // Bounds the resolve step too, which tcp_stream's expiry does not cover.
  ioc.run_for(timeout);

  if (!done) {
    SetError(err, ErrorCode::kTimeout, "HTTP time request timed out");
    return false;
  }
  if (!failure.ok()) {
    if (err) *err = failure;
    return false;
  }
  if (res.result() != http::status::ok) {
    std::ostringstream oss;
    oss << "HTTP status " << res.result_int() << " from " << host_ << target_;
    SetError(err, ErrorCode::kIoError, oss.str());
    return false;
  }
  return PacketFromBody(res.body(), response, err);
}

bool HttpTimeTransport::PacketFromBody(const std::string& body,
                                       std::vector<uint8_t>* out, Error* err) {
  if (out == nullptr) return false;

  const nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    SetError(err, ErrorCode::kIoError, "time service body is not a JSON object");
    return false;
  }
  auto it = j.find("unixtime");
  if (it == j.end() || !it->is_number_integer()) {
    SetError(err, ErrorCode::kIoError, "time service body lacks \"unixtime\"");
    return false;
  }
  const bool in_range =
      it->is_number_unsigned()
          ? it->get<uint64_t>() <= static_cast<uint64_t>(kMaxUnixSeconds)
          : it->get<int64_t>() >= kMinUnixSeconds &&
                it->get<int64_t>() <= kMaxUnixSeconds;
  if (!in_range) {
    SetError(err, ErrorCode::kIoError,
             "time service \"unixtime\" " + it->dump() +
                 " is outside the NTP timestamp range");
    return false;
  }
  const int64_t unix_sec = it->get<int64_t>();

  const NtpTimestamp ts = NtpTimestamp::FromEpochMillis(unix_sec * 1000);
  NtpPacket p;
  p.leap_indicator = 0;
  p.version = NtpPacket::kVersion;
  p.mode = NtpPacket::kModeServer;
  p.stratum = kSynthesizedStratum;
  p.receive_timestamp = ts;
  p.transmit_timestamp = ts;

  *out = NtpPacket::Encode(p);
  return true;
}

}  // namespace ntpsync
