/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/cost/CostEstimatorRegistry.h"

#include <glog/logging.h>
#include <mutex>
#include <unordered_map>

#include "batchgate/cost/CostEstimator.h"
#include "batchgate/cost/OpenAICostEstimator.h"
#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {
std::unordered_map<std::string, CostEstimatorFactory> factories;

decltype(factories)::iterator findFactoryOrThrow(const std::string& name) {
  auto it = factories.find(name);
  if (it == factories.end()) {
    throw BatchGateException("cost estimator ", name, " is not registered");
  }
  return it;
}
}  // anonymous namespace

void registerCostEstimator(std::string name, CostEstimatorFactory factory) {
  auto p = factories.emplace(std::move(name), std::move(factory));
  CHECK(p.second) << "cost estimator " << p.first->first
    << " is already registered";
}

void throwUnlessCostEstimatorExists(const std::string& name) {
  findFactoryOrThrow(name);
}

std::unique_ptr<CostEstimator> makeCostEstimator(
    const std::string& name,
    const std::string& request_url,
    const std::string& token_encoding) {
  return findFactoryOrThrow(name)->second(request_url, token_encoding);
}

void registerDefaultCostEstimators() {
  static std::once_flag once;
  std::call_once(once, []() {
    registerCostEstimator(
      kCostEstimatorZero.str(),
      [](const std::string&, const std::string&) {
        return std::make_unique<ZeroCostEstimator>();
      }
    );
    registerCostEstimator(
      kCostEstimatorOpenAI.str(),
      [](const std::string& url, const std::string& encoding) {
        return std::make_unique<OpenAICostEstimator>(
          openAIEndpointFromURL(url),
          std::make_unique<ApproximateTokenCounter>(encoding)
        );
      }
    );
  });
}

}  // namespace batchgate
