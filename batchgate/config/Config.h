/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <chrono>
#include <folly/dynamic.h>
#include <folly/Range.h>
#include <string>

namespace batchgate {

// Config keys, shared with the command-line flags of the same names.
constexpr folly::StringPiece kRequestsFilepath = "requests_filepath";
constexpr folly::StringPiece kSaveFilepath = "save_filepath";
constexpr folly::StringPiece kRequestURL = "request_url";
constexpr folly::StringPiece kMaxRequestsPerPeriod = "max_requests_per_period";
constexpr folly::StringPiece kRequestPeriodSec = "request_period_sec";
constexpr folly::StringPiece kMaxCostPerPeriod = "max_cost_per_period";
constexpr folly::StringPiece kCostPeriodSec = "cost_period_sec";
constexpr folly::StringPiece kMaxAttempts = "max_attempts";
constexpr folly::StringPiece kCooldownSec = "cooldown_sec";
constexpr folly::StringPiece kLoopSleepMs = "loop_sleep_ms";
constexpr folly::StringPiece kCostEstimator = "cost_estimator";
constexpr folly::StringPiece kTokenEncoding = "token_encoding";
constexpr folly::StringPiece kRateLimitSignature = "rate_limit_signature";
constexpr folly::StringPiece kRenameOnFailure = "rename_on_failure";
constexpr folly::StringPiece kDryRun = "dry_run";

/**
 * Everything that shapes one run.  Parsed from a JSON object, which the
 * CLI assembles from flags and an optional config file.  Every field has
 * a default except the requests path.  Any invalid value throws from the
 * constructor -- a batch that starts with a bad config would waste its
 * whole rate budget before anyone noticed.
 *
 * Immutable after construction.
 */
class Config {
public:
  explicit Config(const folly::dynamic& d);

  folly::dynamic toDynamic() const;

  boost::filesystem::path requestsPath;
  // Defaults to defaultResultsPath(requestsPath).
  boost::filesystem::path savePath;
  std::string requestURL{"https://api.openai.com/v1/embeddings"};

  // The two token buckets.  The defaults are 75% of OpenAI's chat limits
  // of 3,500 requests & 90,000 tokens per minute, leaving some headroom.
  double maxRequestsPerPeriod{3500 * 0.75};
  std::chrono::duration<double> requestPeriod{60};
  double maxCostPerPeriod{90000 * 0.75};
  std::chrono::duration<double> costPeriod{60};

  int maxAttempts{5};
  // No new requests start for this long after a rate-limit rejection.
  std::chrono::duration<double> cooldown{15};
  // The admission loop's pause between passes.  1 ms caps admissions at
  // 1,000 requests per second.
  std::chrono::milliseconds loopSleep{1};

  std::string costEstimatorName;
  std::string tokenEncoding{"cl100k_base"};
  // Substring of a provider error message that marks a rate-limit error.
  std::string rateLimitSignature{"Rate limit"};

  bool renameOnFailure{true};
  bool dryRun{false};
};

}  // namespace batchgate
