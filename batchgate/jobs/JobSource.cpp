/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/jobs/JobSource.h"

#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem.hpp>
#include <folly/json.h>
#include <fstream>
#include <glog/logging.h>

#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {
std::unique_ptr<std::istream> openOrThrow(const boost::filesystem::path& p) {
  if (!boost::filesystem::is_regular_file(p)) {
    throw BatchGateException("Requests file ", p.native(), " not found");
  }
  auto in = std::make_unique<std::ifstream>(p.native());
  if (!*in) {
    throw BatchGateException(
      "Cannot open requests file ", p.native(), ": ", strError()
    );
  }
  return std::move(in);
}
}  // anonymous namespace

JobSource::JobSource(const boost::filesystem::path& path)
  : JobSource(openOrThrow(path)) {}

JobSource::JobSource(std::unique_ptr<std::istream> in) : in_(std::move(in)) {
  CHECK(in_);
}

folly::Optional<folly::dynamic> JobSource::next() {
  if (exhausted_) {
    return folly::none;
  }
  std::string line;
  if (!std::getline(*in_, line)) {
    exhausted_ = true;
    VLOG(1) << "Requests exhausted after " << lineNumber_ << " lines";
    return folly::none;
  }
  ++lineNumber_;
  boost::algorithm::trim(line);
  if (line.empty()) {
    exhausted_ = true;
    throw MalformedInputError(lineNumber_, "empty line");
  }
  folly::dynamic d;
  try {
    d = folly::parseJson(line);
  } catch (const std::exception& ex) {
    exhausted_ = true;
    throw MalformedInputError(lineNumber_, ex.what());
  }
  if (!d.isObject()) {
    exhausted_ = true;
    throw MalformedInputError(
      lineNumber_,
      folly::to<std::string>("expected a JSON object, got ", d.typeName())
    );
  }
  return std::move(d);
}

}  // namespace batchgate
