/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Range.h>
#include <functional>
#include <memory>
#include <string>

namespace batchgate {

class CostEstimator;

constexpr folly::StringPiece kCostEstimatorZero = "zero";
constexpr folly::StringPiece kCostEstimatorOpenAI = "openai";

using CostEstimatorFactory = std::function<std::unique_ptr<CostEstimator>(
  const std::string& /*request_url*/,
  const std::string& /*token_encoding*/
)>;

void registerCostEstimator(std::string name, CostEstimatorFactory factory);
void throwUnlessCostEstimatorExists(const std::string& name);
// Throws if the name is unknown, or if the factory rejects its arguments.
std::unique_ptr<CostEstimator> makeCostEstimator(
  const std::string& name,
  const std::string& request_url,
  const std::string& token_encoding
);

// Safe to call more than once.
void registerDefaultCostEstimators();

}  // namespace batchgate
