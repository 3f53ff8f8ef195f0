/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <folly/FileUtil.h>
#include <folly/io/async/EventBase.h>
#include <glog/logging.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

#include "batchgate/runners/CurlTransport.h"
#include "batchgate/utils/Exception.h"

using namespace batchgate;
using folly::dynamic;

namespace {

// A listening socket on a free loopback port.
int listenOnLoopback(uint16_t* port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(fd >= 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  PCHECK(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
  PCHECK(::listen(fd, 1) == 0);
  socklen_t len = sizeof(addr);
  PCHECK(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
  *port = ntohs(addr.sin_port);
  return fd;
}

std::string urlForPort(uint16_t port) {
  return folly::to<std::string>("http://127.0.0.1:", port, "/v1/embeddings");
}

/**
 * Answers exactly one HTTP request with a canned body, from a background
 * thread, and remembers what it was sent.
 */
class OneShotHTTPServer {
public:
  OneShotHTTPServer(int status, std::string body)
    : listenFd_(listenOnLoopback(&port_)),
      thread_([this, status, body]() { serve(status, body); }) {}

  ~OneShotHTTPServer() {
    thread_.join();
    ::close(listenFd_);
  }

  std::string url() const { return urlForPort(port_); }

  // Only valid after the response was received.
  const std::string& request() const { return request_; }

private:
  void serve(int status, const std::string& body) {
    int fd = ::accept(listenFd_, nullptr, nullptr);
    PCHECK(fd >= 0);
    char buf[4096];
    size_t body_start = std::string::npos;
    size_t content_length = 0;
    while (body_start == std::string::npos
           || request_.size() < body_start + content_length) {
      auto n = folly::readNoInt(fd, buf, sizeof(buf));
      PCHECK(n >= 0);
      if (n == 0) {
        break;
      }
      request_.append(buf, n);
      if (body_start == std::string::npos) {
        auto end = request_.find("\r\n\r\n");
        if (end != std::string::npos) {
          body_start = end + 4;
          auto headers = boost::algorithm::to_lower_copy(
            request_.substr(0, end)
          );
          auto p = headers.find("content-length:");
          if (p != std::string::npos) {
            content_length = std::stoul(headers.substr(p + 15));
          }
        }
      }
    }
    auto response = folly::to<std::string>(
      "HTTP/1.1 ", status, " Whatever\r\n",
      "Content-Length: ", body.size(), "\r\n",
      "Connection: close\r\n\r\n",
      body
    );
    PCHECK(folly::writeFull(fd, response.data(), response.size()) >= 0);
    ::close(fd);
  }

  uint16_t port_;
  int listenFd_;
  std::string request_;
  std::thread thread_;
};

folly::Try<dynamic> postAndWait(
    folly::EventBase* evb,
    const std::string& url,
    const dynamic& payload) {
  CurlTransport transport(evb, url, {"Content-Type: application/json"});
  return transport.post(payload).via(evb).getTryVia(evb);
}

}  // anonymous namespace

TEST(TestCurlTransport, PostsJSON) {
  folly::EventBase evb;
  OneShotHTTPServer server(200, "{\"data\": [1, 2]}");
  auto r = postAndWait(&evb, server.url(), dynamic::object("input", "hi"));
  ASSERT_TRUE(r.hasValue()) << r.exception().what();
  EXPECT_EQ(dynamic::object("data", dynamic::array(1, 2)), r.value());
  EXPECT_EQ(0, server.request().find("POST /v1/embeddings HTTP/1.1\r\n"));
  EXPECT_NE(
    std::string::npos,
    server.request().find("Content-Type: application/json\r\n")
  );
  EXPECT_NE(std::string::npos, server.request().find("{\"input\":\"hi\"}"));
}

TEST(TestCurlTransport, ErrorStatusStillYieldsTheBody) {
  folly::EventBase evb;
  OneShotHTTPServer server(
    429, "{\"error\": {\"message\": \"Rate limit reached\"}}"
  );
  auto r = postAndWait(&evb, server.url(), dynamic::object("input", "hi"));
  ASSERT_TRUE(r.hasValue());
  EXPECT_EQ(dynamic("Rate limit reached"), r.value()["error"]["message"]);
}

TEST(TestCurlTransport, NonJSONBodyIsATransportError) {
  folly::EventBase evb;
  OneShotHTTPServer server(502, "<html>Bad Gateway</html>");
  auto r = postAndWait(&evb, server.url(), dynamic::object("input", "hi"));
  ASSERT_TRUE(r.hasException());
  EXPECT_TRUE(r.exception().is_compatible_with<TransportError>());
  EXPECT_NE(
    std::string::npos,
    std::string(r.exception().what().toStdString()).find("HTTP 502")
  );
}

TEST(TestCurlTransport, ConnectionRefused) {
  uint16_t port;
  ::close(listenOnLoopback(&port));  // Nobody listens there now
  folly::EventBase evb;
  auto r = postAndWait(&evb, urlForPort(port), dynamic::object("input", "x"));
  ASSERT_TRUE(r.hasException());
  EXPECT_TRUE(r.exception().is_compatible_with<TransportError>());
}

TEST(TestCurlTransport, DestroyFailsPendingCalls) {
  uint16_t port;
  ::close(listenOnLoopback(&port));
  folly::EventBase evb;
  folly::SemiFuture<dynamic> f = folly::makeSemiFuture(dynamic(nullptr));
  {
    CurlTransport transport(&evb, urlForPort(port), {});
    f = transport.post(dynamic::object("input", "x"));
    EXPECT_EQ(1, transport.numPending());
  }
  auto r = std::move(f).via(&evb).getTryVia(&evb);
  ASSERT_TRUE(r.hasException());
  EXPECT_TRUE(r.exception().is_compatible_with<TransportError>());
}
