/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/jobs/Job.h"

#include <glog/logging.h>

#include "batchgate/utils/Exception.h"

namespace batchgate {

const char* failureKindName(FailureKind kind) {
  switch (kind) {
    case FailureKind::RateLimit:
      return "rate_limit";
    case FailureKind::ApiError:
      return "api_error";
    case FailureKind::Transport:
      return "transport";
  }
  LOG(FATAL) << "Unknown FailureKind " << static_cast<int>(kind);
  return "";  // Not reached
}

folly::dynamic FailureRecord::toDynamic() const {
  return folly::dynamic::object("kind", failureKindName(kind))("error", error);
}

constexpr const char* Job::kMetadataKey;

Job::Job(ID id, folly::dynamic request, int max_attempts)
  : id_(id),
    payload_(std::move(request)),
    attemptsRemaining_(max_attempts) {
  if (!payload_.isObject()) {
    throw BatchGateException(
      "A job must be a JSON object, got ", payload_.typeName()
    );
  }
  CHECK_GT(max_attempts, 0);
  if (auto* metadata = payload_.get_ptr(kMetadataKey)) {
    if (!metadata->isNull()) {
      metadata_ = std::move(*metadata);
    }
    payload_.erase(kMetadataKey);
  }
}

void Job::setCost(double cost) {
  if (cost < 0) {
    throw BatchGateException("Job cost must be non-negative, got ", cost);
  }
  cost_ = cost;
}

void Job::startAttempt() {
  CHECK_GT(attemptsRemaining_, 0) << "Job " << id_ << " has no attempts left";
  --attemptsRemaining_;
}

folly::dynamic Job::successLine(folly::dynamic response) const {
  return resultLine(std::move(response));
}

folly::dynamic Job::failureLine() const {
  folly::dynamic errors = folly::dynamic::array;
  for (const auto& record : errorHistory_) {
    errors.push_back(record.toDynamic());
  }
  return resultLine(std::move(errors));
}

folly::dynamic Job::resultLine(folly::dynamic outcome) const {
  folly::dynamic line = folly::dynamic::array(payload_, std::move(outcome));
  if (metadata_.has_value()) {
    line.push_back(*metadata_);
  }
  return line;
}

}  // namespace batchgate
