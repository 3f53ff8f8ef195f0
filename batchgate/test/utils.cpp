/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/test/utils.h"

#include <folly/FileUtil.h>
#include <folly/json.h>
#include <folly/String.h>
#include <glog/logging.h>

#include "batchgate/config/Config.h"
#include "batchgate/cost/CostEstimatorRegistry.h"

namespace batchgate {

void writeLines(
    const boost::filesystem::path& path,
    const std::vector<std::string>& lines) {
  std::string contents;
  for (const auto& line : lines) {
    contents.append(line);
    contents.push_back('\n');
  }
  CHECK(folly::writeFile(contents, path.c_str()));
}

std::vector<folly::dynamic> readJsonLines(
    const boost::filesystem::path& path) {
  std::string contents;
  CHECK(folly::readFile(path.c_str(), contents)) << path.native();
  std::vector<folly::StringPiece> lines;
  folly::split('\n', contents, lines, /*ignoreEmpty*/ true);
  std::vector<folly::dynamic> result;
  for (auto line : lines) {
    result.emplace_back(folly::parseJson(line));
  }
  return result;
}

folly::dynamic fastConfig(const boost::filesystem::path& requests_path) {
  return folly::dynamic::object
    (kRequestsFilepath, requests_path.native())
    (kMaxRequestsPerPeriod, 1000)
    (kRequestPeriodSec, 1)
    (kMaxCostPerPeriod, 1000)
    (kCostPeriodSec, 1)
    (kMaxAttempts, 3)
    (kCooldownSec, 0)
    (kLoopSleepMs, 1)
    (kCostEstimator, kCostEstimatorZero);
}

}  // namespace batchgate
