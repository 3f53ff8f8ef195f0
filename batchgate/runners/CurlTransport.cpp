/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/runners/CurlTransport.h"

#include <folly/io/async/EventBase.h>
#include <folly/json.h>
#include <glog/logging.h>
#include <mutex>

#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {

void initCurlOnce() {
  static std::once_flag once;
  std::call_once(once, []() {
    auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
      throw BatchGateException(
        "curl_global_init failed: ", curl_easy_strerror(code)
      );
    }
  });
}

template <typename Code>
void checkCurlOk(Code code, Code ok, const char* what) {
  if (code != ok) {
    throw BatchGateException(
      "libcurl ", what, " failed with code ", static_cast<int>(code)
    );
  }
}

}  // anonymous namespace

struct CurlTransport::Request {
  explicit Request(CURL* e) : easy(e) {}
  ~Request() {
    if (easy) {
      curl_easy_cleanup(easy);
    }
  }

  CURL* easy;
  std::string response;
  folly::Promise<folly::dynamic> promise;
};

CurlTransport::SocketHandler::SocketHandler(
    CurlTransport* transport,
    curl_socket_t fd)
  : EventHandler(transport->evb_, folly::NetworkSocket::fromFd(fd)),
    transport_(transport),
    fd_(fd) {}

void CurlTransport::SocketHandler::watch(int curl_what) {
  uint16_t events = EventHandler::PERSIST;
  if (curl_what == CURL_POLL_IN || curl_what == CURL_POLL_INOUT) {
    events |= EventHandler::READ;
  }
  if (curl_what == CURL_POLL_OUT || curl_what == CURL_POLL_INOUT) {
    events |= EventHandler::WRITE;
  }
  unregisterHandler();
  CHECK(registerHandler(events));
}

void CurlTransport::SocketHandler::handlerReady(uint16_t events) noexcept {
  int ev_bitmask = 0;
  if (events & EventHandler::READ) {
    ev_bitmask |= CURL_CSELECT_IN;
  }
  if (events & EventHandler::WRITE) {
    ev_bitmask |= CURL_CSELECT_OUT;
  }
  // May destroy this handler, via onSocket(CURL_POLL_REMOVE).
  transport_->socketAction(fd_, ev_bitmask);
}

CurlTransport::TimerHandler::TimerHandler(CurlTransport* transport)
  : AsyncTimeout(transport->evb_), transport_(transport) {}

void CurlTransport::TimerHandler::timeoutExpired() noexcept {
  transport_->socketAction(CURL_SOCKET_TIMEOUT, 0);
}

CurlTransport::CurlTransport(
    folly::EventBase* evb,
    std::string url,
    std::vector<std::string> headers,
    std::chrono::milliseconds timeout)
  : evb_(evb),
    url_(std::move(url)),
    timeout_(timeout),
    timer_(this) {
  CHECK(evb_);
  initCurlOnce();
  for (const auto& header : headers) {
    auto* list = curl_slist_append(headers_, header.c_str());
    if (!list) {
      curl_slist_free_all(headers_);
      throw BatchGateException("Cannot add HTTP header: ", header);
    }
    headers_ = list;
  }
  multi_ = curl_multi_init();
  if (!multi_) {
    curl_slist_free_all(headers_);
    throw BatchGateException("curl_multi_init failed");
  }
  curl_multi_setopt(multi_, CURLMOPT_SOCKETFUNCTION, &CurlTransport::onSocket);
  curl_multi_setopt(multi_, CURLMOPT_SOCKETDATA, this);
  curl_multi_setopt(multi_, CURLMOPT_TIMERFUNCTION, &CurlTransport::onTimer);
  curl_multi_setopt(multi_, CURLMOPT_TIMERDATA, this);
}

CurlTransport::~CurlTransport() {
  timer_.cancelTimeout();
  for (auto& p : requests_) {
    curl_multi_remove_handle(multi_, p.first);
    p.second->promise.setException(
      TransportError("Transport destroyed with the request in flight")
    );
  }
  requests_.clear();
  sockets_.clear();
  curl_multi_cleanup(multi_);
  curl_slist_free_all(headers_);
}

folly::SemiFuture<folly::dynamic> CurlTransport::post(
    const folly::dynamic& payload) {
  evb_->dcheckIsInEventBaseThread();
  auto body = folly::toJson(payload);

  CURL* easy = curl_easy_init();
  if (!easy) {
    throw TransportError("curl_easy_init failed");
  }
  auto request = std::make_unique<Request>(easy);
  checkCurlOk(
    curl_easy_setopt(easy, CURLOPT_URL, url_.c_str()), CURLE_OK, "URL"
  );
  checkCurlOk(
    curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers_), CURLE_OK, "headers"
  );
  checkCurlOk(
    curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE_LARGE, curl_off_t(body.size())),
    CURLE_OK,
    "body size"
  );
  // Copies the body, so it need not outlive this call.
  checkCurlOk(
    curl_easy_setopt(easy, CURLOPT_COPYPOSTFIELDS, body.c_str()),
    CURLE_OK,
    "body"
  );
  curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, &CurlTransport::onData);
  curl_easy_setopt(easy, CURLOPT_WRITEDATA, request.get());
  curl_easy_setopt(easy, CURLOPT_PRIVATE, request.get());
  curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
  if (timeout_.count() > 0) {
    curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, long(timeout_.count()));
  }

  auto future = request->promise.getSemiFuture();
  checkCurlOk(
    curl_multi_add_handle(multi_, easy), CURLM_OK, "curl_multi_add_handle"
  );
  requests_.emplace(easy, std::move(request));
  return future;
}

int CurlTransport::onSocket(
    CURL* /*easy*/,
    curl_socket_t fd,
    int what,
    void* userp,
    void* /*socketp*/) {
  static_cast<CurlTransport*>(userp)->updateSocket(fd, what);
  return 0;
}

int CurlTransport::onTimer(CURLM* /*multi*/, long timeout_ms, void* userp) {
  auto* self = static_cast<CurlTransport*>(userp);
  if (timeout_ms < 0) {
    self->timer_.cancelTimeout();
  } else {
    // A 0 timeout fires on the next loop iteration, since libcurl does
    // not allow socket actions from inside its callbacks.
    self->timer_.scheduleTimeout(std::chrono::milliseconds(timeout_ms));
  }
  return 0;
}

size_t CurlTransport::onData(
    char* ptr,
    size_t size,
    size_t nmemb,
    void* userp) {
  static_cast<Request*>(userp)->response.append(ptr, size * nmemb);
  return size * nmemb;
}

void CurlTransport::updateSocket(curl_socket_t fd, int what) {
  if (what == CURL_POLL_REMOVE) {
    auto it = sockets_.find(fd);
    if (it == sockets_.end()) {
      return;
    }
    it->second->unregisterHandler();
    // We may be inside this very handler's handlerReady().
    evb_->runInLoop([handler = std::move(it->second)]() mutable {
      handler.reset();
    });
    sockets_.erase(it);
    return;
  }
  auto& handler = sockets_[fd];
  if (!handler) {
    handler = std::make_unique<SocketHandler>(this, fd);
  }
  handler->watch(what);
}

void CurlTransport::socketAction(curl_socket_t fd, int ev_bitmask) noexcept {
  int running = 0;
  auto code = curl_multi_socket_action(multi_, fd, ev_bitmask, &running);
  if (code != CURLM_OK) {
    LOG(ERROR) << "curl_multi_socket_action failed: "
      << curl_multi_strerror(code);
  }
  finishCompleted();
}

void CurlTransport::finishCompleted() noexcept {
  int num_left = 0;
  while (CURLMsg* msg = curl_multi_info_read(multi_, &num_left)) {
    if (msg->msg == CURLMSG_DONE) {
      finish(msg->easy_handle, msg->data.result);
    }
  }
}

void CurlTransport::finish(CURL* easy, CURLcode code) noexcept {
  auto it = requests_.find(easy);
  CHECK(it != requests_.end());
  auto request = std::move(it->second);
  requests_.erase(it);
  curl_multi_remove_handle(multi_, easy);

  if (code != CURLE_OK) {
    request->promise.setException(TransportError(folly::to<std::string>(
      "POST to ", url_, " failed: ", curl_easy_strerror(code)
    )));
    return;
  }
  long http_code = 0;
  curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &http_code);
  VLOG(2) << "POST to " << url_ << " got HTTP " << http_code << ", "
    << request->response.size() << " bytes";
  try {
    request->promise.setValue(folly::parseJson(request->response));
  } catch (const std::exception& ex) {
    request->promise.setException(TransportError(folly::to<std::string>(
      "HTTP ", http_code, " response from ", url_, " is not JSON (",
      ex.what(), "): ", request->response.substr(0, 200)
    )));
  }
}

}  // namespace batchgate
