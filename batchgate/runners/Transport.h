/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>
#include <folly/futures/Future.h>

namespace batchgate {

/**
 * Sends one request to the remote service.  The URL and headers are fixed
 * when the transport is made; each call only supplies the JSON body.
 *
 * post() must not block, and must copy whatever it needs from `payload`
 * before returning.  The future yields the decoded JSON response
 * body, whatever the HTTP status -- providers report errors inside the
 * body.  It yields an exception iff no usable response was obtained
 * (connection failure, non-JSON body, ...).
 *
 * There is no per-call deadline here; a transport may impose its own.
 */
class Transport {
public:
  virtual ~Transport() {}
  virtual folly::SemiFuture<folly::dynamic> post(
    const folly::dynamic& payload
  ) = 0;
};

}  // namespace batchgate
