/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <folly/Conv.h>

namespace batchgate {

template<typename... Args>
std::runtime_error BatchGateException(Args&&... args) {
  return
    std::runtime_error(folly::to<std::string>(std::forward<Args>(args)...));
}

/**
 * An input line that cannot become a job.  Fatal for the whole run: we
 * never skip lines silently, since the output would then be missing rows
 * with no record of why.
 */
class MalformedInputError : public std::runtime_error {
public:
  MalformedInputError(size_t line_number, const std::string& what)
    : std::runtime_error(folly::to<std::string>(
        "Malformed input on line ", line_number, ": ", what
      )),
      lineNumber_(line_number) {}

  size_t lineNumber() const { return lineNumber_; }

private:
  size_t lineNumber_;
};

// The result file already exists, or cannot be created.
class OutputPathError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The outbound call produced no response at all.
class TransportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Describes the current errno, for messages about failed syscalls.
std::string strError();

}  // namespace batchgate
