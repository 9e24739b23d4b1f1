// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Tests for the HTTP time-service transport.
 */
#include "ntpsync/http_time_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ntpsync/ntp_client.hpp"
#include "ntpsync/ntp_packet.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace ntpsync {

namespace {

/** Serves one HTTP request on 127.0.0.1 with a fixed status and body. */
class OneShotHttpServer {
 public:
  OneShotHttpServer(http::status status, std::string body)
      : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)),
        status_(status),
        port_(acceptor_.local_endpoint().port()),
        body_(std::move(body)) {
    thread_ = std::thread([this] { Serve(); });
  }
  ~OneShotHttpServer() {
    if (thread_.joinable()) thread_.join();
  }

  std::string Port() const { return std::to_string(port_); }
  /** Request target seen by the server (valid after the exchange). */
  const std::string& Target() {
    if (thread_.joinable()) thread_.join();
    return target_;
  }

 private:
  void Serve() {
    beast::error_code ec;
    tcp::socket sock(ioc_);
    acceptor_.accept(sock, ec);
    if (ec) return;

    beast::flat_buffer buf;
    http::request<http::string_body> req;
    http::read(sock, buf, req, ec);
    if (ec) return;
    target_ = std::string(req.target());

    http::response<http::string_body> res{status_, req.version()};
    res.set(http::field::content_type, "application/json");
    res.body() = body_;
    res.prepare_payload();
    http::write(sock, res, ec);
    sock.shutdown(tcp::socket::shutdown_send, ec);
  }

  net::io_context ioc_;
  tcp::acceptor acceptor_;
  http::status status_;
  unsigned short port_;
  std::string body_;
  std::string target_;
  std::thread thread_;
};

}  // namespace

/**
 * @test HttpTimeTransportTest.BodyBecomesServerReply
 * @brief A "unixtime" body is turned into a stratum-2 server packet.
 *
 * @steps
 * 1. PacketFromBody() with unixtime 1704067200.
 *
 * @expected 48-byte packet; VN=4, Mode=4, stratum 2; receive and transmit
 * both equal 1704067200000 ms.
 */
TEST(HttpTimeTransportTest, BodyBecomesServerReply) {
  std::vector<uint8_t> out;
  Error err;
  ASSERT_TRUE(HttpTimeTransport::PacketFromBody(
      R"({"abbreviation":"UTC","unixtime":1704067200,"utc_offset":"+00:00"})",
      &out, &err))
      << err;
  ASSERT_EQ(out.size(), NtpPacket::kPacketSize);

  NtpPacket p;
  ASSERT_TRUE(NtpPacket::Decode(out, &p));
  EXPECT_EQ(p.version, 4);
  EXPECT_EQ(p.mode, NtpPacket::kModeServer);
  EXPECT_EQ(p.stratum, 2);
  EXPECT_EQ(p.receive_timestamp, p.transmit_timestamp);
  EXPECT_EQ(p.transmit_timestamp.ToEpochMillis(), 1704067200000LL);
}

TEST(HttpTimeTransportTest, RejectsUnusableBodies) {
  const char* bodies[] = {
      "not json",
      "[1, 2, 3]",
      R"({"datetime":"2024-01-01T00:00:00Z"})",
      R"({"unixtime":"1704067200"})",
  };
  for (const char* body : bodies) {
    std::vector<uint8_t> out;
    Error err;
    EXPECT_FALSE(HttpTimeTransport::PacketFromBody(body, &out, &err)) << body;
    EXPECT_EQ(err.code, ErrorCode::kIoError) << body;
    EXPECT_TRUE(out.empty());
  }
}

/**
 * @test HttpTimeTransportTest.RejectsUnixtimeOutsideTimestampRange
 * @brief Values that cannot become a packet timestamp are refused.
 *
 * @steps
 * 1. PacketFromBody() with values beyond int64, near the int64 limits, and
 *    one second past either end of 1968-01-20 .. 2104-02-26.
 * 2. PacketFromBody() with both ends of that window.
 *
 * @expected Out-of-range values fail with kIoError and leave the output
 * empty; the window ends decode to the served time.
 */
TEST(HttpTimeTransportTest, RejectsUnixtimeOutsideTimestampRange) {
  const char* bad[] = {
      R"({"unixtime":18446744073709551615})",
      R"({"unixtime":9223372036854775807})",
      R"({"unixtime":9223372036854776})",
      R"({"unixtime":-9223372036854775808})",
      R"({"unixtime":4233462144})",
      R"({"unixtime":-61505153})",
  };
  for (const char* body : bad) {
    std::vector<uint8_t> out;
    Error err;
    EXPECT_FALSE(HttpTimeTransport::PacketFromBody(body, &out, &err)) << body;
    EXPECT_EQ(err.code, ErrorCode::kIoError) << body;
    EXPECT_TRUE(out.empty()) << body;
  }

  const int64_t good[] = {4233462143LL, -61505152LL};
  for (int64_t sec : good) {
    std::vector<uint8_t> out;
    Error err;
    ASSERT_TRUE(HttpTimeTransport::PacketFromBody(
        "{\"unixtime\":" + std::to_string(sec) + "}", &out, &err))
        << sec << " " << err;
    NtpPacket p;
    ASSERT_TRUE(NtpPacket::Decode(out, &p));
    EXPECT_EQ(p.transmit_timestamp.ToEpochMillis(), sec * 1000) << sec;
  }
}

/**
 * @test HttpTimeTransportTest.FetchesFromLocalService
 * @brief Exchange() issues a GET and ignores the NTP host/port it is given.
 *
 * @steps
 * 1. Run a one-shot HTTP server on 127.0.0.1 returning unixtime JSON.
 * 2. Exchange() with an unrelated NTP host name.
 *
 * @expected Success; the server saw GET /api/ip; the reply decodes to the
 * served time.
 */
TEST(HttpTimeTransportTest, FetchesFromLocalService) {
  OneShotHttpServer server(http::status::ok, R"({"unixtime":1700000000})");
  HttpTimeTransport tr("127.0.0.1", server.Port());

  std::vector<uint8_t> resp;
  Error err;
  ASSERT_TRUE(tr.Exchange("time.google.com", 123, {},
                          std::chrono::milliseconds(3000), &resp, &err))
      << err;
  EXPECT_EQ(server.Target(), "/api/ip");

  NtpPacket p;
  ASSERT_TRUE(NtpPacket::Decode(resp, &p));
  EXPECT_EQ(p.transmit_timestamp.ToEpochMillis(), 1700000000000LL);
}

TEST(HttpTimeTransportTest, NonOkStatusIsIoError) {
  OneShotHttpServer server(http::status::service_unavailable, "{}");
  HttpTimeTransport tr("127.0.0.1", server.Port());

  std::vector<uint8_t> resp;
  Error err;
  EXPECT_FALSE(tr.Exchange("ignored", 123, {}, std::chrono::milliseconds(3000),
                           &resp, &err));
  EXPECT_EQ(err.code, ErrorCode::kIoError);
  EXPECT_NE(err.message.find("503"), std::string::npos);
}

/**
 * @test HttpTimeTransportTest.ClientSyncsThroughHttp
 * @brief NtpClient accepts the HTTP transport as a drop-in replacement.
 *
 * @steps
 * 1. Serve the current system time in whole seconds.
 * 2. Sync a client whose transport is HttpTimeTransport.
 *
 * @expected Success with |offset| below two seconds.
 */
TEST(HttpTimeTransportTest, ClientSyncsThroughHttp) {
  const auto now_sec = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  OneShotHttpServer server(
      http::status::ok, "{\"unixtime\":" + std::to_string(now_sec) + "}");

  NtpConfig cfg = NtpConfig::Builder()
                      .NtpServers({"time.example"})
                      .RetryCount(0)
                      .Timeout(std::chrono::milliseconds(3000))
                      .Build();
  NtpClient client(cfg,
                   std::make_shared<HttpTimeTransport>("127.0.0.1",
                                                       server.Port()));
  SyncResult r = client.Sync();
  ASSERT_TRUE(r.IsSuccess()) << r;
  EXPECT_EQ(r.ServerAddress(), "time.example");
  EXPECT_LT(std::abs(r.Offset().count()), 2000);
}

}  // namespace ntpsync
