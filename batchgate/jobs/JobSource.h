/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <folly/dynamic.h>
#include <folly/Optional.h>
#include <istream>
#include <memory>

namespace batchgate {

/**
 * Streams job descriptions out of newline-delimited JSON, one object per
 * line, in file order.  Only the current line is ever in memory.
 *
 * Forward-only and not restartable: once next() returns none, it always
 * will.  A line that does not parse as a JSON object throws
 * MalformedInputError, after which the source is considered exhausted.
 * That includes blank lines.  A final newline does not make one.
 */
class JobSource {
public:
  // Throws if the file cannot be opened.
  explicit JobSource(const boost::filesystem::path& path);
  explicit JobSource(std::unique_ptr<std::istream> in);

  JobSource(const JobSource&) = delete;
  JobSource& operator=(const JobSource&) = delete;

  folly::Optional<folly::dynamic> next();

  bool exhausted() const { return exhausted_; }
  // 1-based number of the line most recently returned (or rejected).
  size_t lineNumber() const { return lineNumber_; }

private:
  std::unique_ptr<std::istream> in_;
  size_t lineNumber_{0};
  bool exhausted_{false};
};

}  // namespace batchgate
