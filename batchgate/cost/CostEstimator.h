/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/dynamic.h>

namespace batchgate {

/**
 * Predicts how many resource units (e.g. tokens) a request will use, so
 * that the cost bucket can be charged before the request is sent.  It is
 * chosen once, from the config, and bound to the endpoint and encoding
 * at construction.
 *
 * estimate() runs once per job, when it is read.  It throws if the payload
 * is not something this estimator understands -- the scheduler reports
 * that as malformed input.  It must never return a negative number.
 */
class CostEstimator {
public:
  virtual ~CostEstimator() {}
  virtual double estimate(const folly::dynamic& payload) const = 0;
};

// For providers without a cost limit, or for testing.  A zero cost is
// always admissible, so only the request bucket throttles.
class ZeroCostEstimator : public CostEstimator {
public:
  double estimate(const folly::dynamic&) const override { return 0; }
};

}  // namespace batchgate
