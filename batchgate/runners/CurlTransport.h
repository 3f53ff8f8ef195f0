/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <chrono>
#include <curl/curl.h>
#include <folly/io/async/AsyncTimeout.h>
#include <folly/io/async/EventHandler.h>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "batchgate/runners/Transport.h"

namespace batchgate {

/**
 * POSTs JSON to a fixed URL, over libcurl's "multi_socket" interface.
 *
 * All I/O happens on one EventBase: curl tells us which sockets to watch
 * (one EventHandler each), and when to call it back (one AsyncTimeout).
 * No extra threads, so any number of calls can be in flight while the
 * scheduler keeps running on the same loop.
 *
 * Not thread-safe: construct, post() and destroy on the EventBase thread.
 * Destroying the transport fails every call still in flight.
 */
class CurlTransport : public Transport {
public:
  CurlTransport(
    folly::EventBase* evb,
    std::string url,
    std::vector<std::string> headers,
    // 0 = no deadline on individual calls.
    std::chrono::milliseconds timeout = std::chrono::milliseconds(0)
  );
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  folly::SemiFuture<folly::dynamic> post(const folly::dynamic& payload)
    override;

  size_t numPending() const { return requests_.size(); }

private:
  struct Request;

  class SocketHandler : public folly::EventHandler {
  public:
    SocketHandler(CurlTransport* transport, curl_socket_t fd);
    void watch(int curl_what);
    void handlerReady(uint16_t events) noexcept override;
  private:
    CurlTransport* const transport_;
    const curl_socket_t fd_;
  };

  class TimerHandler : public folly::AsyncTimeout {
  public:
    explicit TimerHandler(CurlTransport* transport);
    void timeoutExpired() noexcept override;
  private:
    CurlTransport* const transport_;
  };

  // libcurl callbacks
  static int onSocket(
    CURL* easy, curl_socket_t fd, int what, void* userp, void* socketp
  );
  static int onTimer(CURLM* multi, long timeout_ms, void* userp);
  static size_t onData(char* ptr, size_t size, size_t nmemb, void* userp);

  void updateSocket(curl_socket_t fd, int what);
  void socketAction(curl_socket_t fd, int ev_bitmask) noexcept;
  void finishCompleted() noexcept;
  void finish(CURL* easy, CURLcode code) noexcept;

  folly::EventBase* const evb_;
  const std::string url_;
  curl_slist* headers_{nullptr};
  const std::chrono::milliseconds timeout_;
  CURLM* multi_{nullptr};
  TimerHandler timer_;
  std::unordered_map<curl_socket_t, std::unique_ptr<SocketHandler>> sockets_;
  std::unordered_map<CURL*, std::unique_ptr<Request>> requests_;
};

}  // namespace batchgate
