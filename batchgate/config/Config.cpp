/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/config/Config.h"

#include <folly/experimental/DynamicParser.h>
#include <limits>

#include "batchgate/cost/CostEstimatorRegistry.h"
#include "batchgate/utils/Exception.h"
#include "batchgate/utils/ResultWriter.h"

namespace batchgate {

namespace {
double positiveOrThrow(folly::StringPiece key, double v) {
  if (!(v > 0)) {
    throw BatchGateException(key, " must be positive, got ", v);
  }
  return v;
}
}  // anonymous namespace

// Defaults are set by the member initializers, before parsing, so a field
// that is absent simply keeps its default.
Config::Config(const folly::dynamic& d)
  : costEstimatorName(kCostEstimatorOpenAI.str()) {

  folly::DynamicParser p(folly::DynamicParser::OnError::THROW, &d);

  p.required(kRequestsFilepath, [&](const std::string& s) {
    if (s.empty()) {
      throw BatchGateException("Empty requests file path");
    }
    requestsPath = s;
  });
  p.optional(kSaveFilepath, [&](const std::string& s) { savePath = s; });
  p.optional(kRequestURL, [&](const std::string& s) { requestURL = s; });

  p.optional(kMaxRequestsPerPeriod, [&](double n) {
    maxRequestsPerPeriod = positiveOrThrow(kMaxRequestsPerPeriod, n);
  });
  p.optional(kRequestPeriodSec, [&](double n) {
    requestPeriod = std::chrono::duration<double>(
      positiveOrThrow(kRequestPeriodSec, n)
    );
  });
  p.optional(kMaxCostPerPeriod, [&](double n) {
    maxCostPerPeriod = positiveOrThrow(kMaxCostPerPeriod, n);
  });
  p.optional(kCostPeriodSec, [&](double n) {
    costPeriod = std::chrono::duration<double>(
      positiveOrThrow(kCostPeriodSec, n)
    );
  });

  p.optional(kMaxAttempts, [&](int64_t n) {
    if (n < 1 || n > std::numeric_limits<int>::max()) {
      throw BatchGateException(
        kMaxAttempts, " must be between 1 and ",
        std::numeric_limits<int>::max(), ", got ", n
      );
    }
    maxAttempts = static_cast<int>(n);
  });
  p.optional(kCooldownSec, [&](double n) {
    if (n < 0) {
      throw BatchGateException(kCooldownSec, " must be >= 0, got ", n);
    }
    cooldown = std::chrono::duration<double>(n);
  });
  p.optional(kLoopSleepMs, [&](int64_t n) {
    if (n < 0) {
      throw BatchGateException(kLoopSleepMs, " must be >= 0, got ", n);
    }
    loopSleep = std::chrono::milliseconds(n);
  });

  p.optional(kCostEstimator, [&](const std::string& s) {
    // Invalid value? Throw at parse-time rather than at runtime.
    throwUnlessCostEstimatorExists(s);
    costEstimatorName = s;
  });
  p.optional(kTokenEncoding, [&](const std::string& s) { tokenEncoding = s; });
  p.optional(kRateLimitSignature, [&](const std::string& s) {
    rateLimitSignature = s;
  });

  p.optional(kRenameOnFailure, [&](bool b) { renameOnFailure = b; });
  p.optional(kDryRun, [&](bool b) { dryRun = b; });

  if (savePath.empty()) {
    savePath = defaultResultsPath(requestsPath);
  }
  if (savePath == requestsPath) {
    throw BatchGateException(
      "Results would overwrite the requests file ", requestsPath.native()
    );
  }
}

folly::dynamic Config::toDynamic() const {
  return folly::dynamic::object
    (kRequestsFilepath, requestsPath.native())
    (kSaveFilepath, savePath.native())
    (kRequestURL, requestURL)
    (kMaxRequestsPerPeriod, maxRequestsPerPeriod)
    (kRequestPeriodSec, requestPeriod.count())
    (kMaxCostPerPeriod, maxCostPerPeriod)
    (kCostPeriodSec, costPeriod.count())
    (kMaxAttempts, maxAttempts)
    (kCooldownSec, cooldown.count())
    (kLoopSleepMs, loopSleep.count())
    (kCostEstimator, costEstimatorName)
    (kTokenEncoding, tokenEncoding)
    (kRateLimitSignature, rateLimitSignature)
    (kRenameOnFailure, renameOnFailure)
    (kDryRun, dryRun);
}

}  // namespace batchgate
