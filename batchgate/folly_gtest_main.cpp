/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <folly/init/Init.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

#include "batchgate/cost/CostEstimatorRegistry.h"

int main(int argc, char **argv) {
  FLAGS_logtostderr = 1;
  testing::InitGoogleTest(&argc, argv);
  folly::init(&argc, &argv);
  // Config parsing validates estimator names against the registry.
  batchgate::registerDefaultCostEstimators();
  return RUN_ALL_TESTS();
}
