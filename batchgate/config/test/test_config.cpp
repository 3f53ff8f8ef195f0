/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <limits>
#include <stdlib.h>

#include "batchgate/config/Config.h"
#include "batchgate/config/Credentials.h"

using namespace batchgate;
using folly::dynamic;

namespace {
dynamic minimal() {
  return dynamic::object(kRequestsFilepath, "data/reqs.jsonl");
}

dynamic with(folly::StringPiece key, dynamic value) {
  auto d = minimal();
  d[key] = std::move(value);
  return d;
}
}  // anonymous namespace

TEST(TestConfig, Defaults) {
  Config c(minimal());
  EXPECT_EQ("data/reqs.jsonl", c.requestsPath.native());
  EXPECT_EQ("data/reqs_results.jsonl", c.savePath.native());
  EXPECT_EQ("https://api.openai.com/v1/embeddings", c.requestURL);
  EXPECT_EQ(2625, c.maxRequestsPerPeriod);
  EXPECT_EQ(60, c.requestPeriod.count());
  EXPECT_EQ(67500, c.maxCostPerPeriod);
  EXPECT_EQ(60, c.costPeriod.count());
  EXPECT_EQ(5, c.maxAttempts);
  EXPECT_EQ(15, c.cooldown.count());
  EXPECT_EQ(1, c.loopSleep.count());
  EXPECT_EQ("openai", c.costEstimatorName);
  EXPECT_EQ("cl100k_base", c.tokenEncoding);
  EXPECT_EQ("Rate limit", c.rateLimitSignature);
  EXPECT_TRUE(c.renameOnFailure);
  EXPECT_FALSE(c.dryRun);
}

TEST(TestConfig, AllFields) {
  Config c(dynamic::object
    (kRequestsFilepath, "in.jsonl")
    (kSaveFilepath, "out/res.jsonl")
    (kRequestURL, "https://api.openai.com/v1/chat/completions")
    (kMaxRequestsPerPeriod, 10)
    (kRequestPeriodSec, 1.5)
    (kMaxCostPerPeriod, 1000)
    (kCostPeriodSec, 30)
    (kMaxAttempts, 2)
    (kCooldownSec, 0)
    (kLoopSleepMs, 0)
    (kCostEstimator, "zero")
    (kTokenEncoding, "p50k_base")
    (kRateLimitSignature, "Too Many Requests")
    (kRenameOnFailure, false)
    (kDryRun, true)
  );
  EXPECT_EQ("out/res.jsonl", c.savePath.native());
  EXPECT_EQ(10, c.maxRequestsPerPeriod);
  EXPECT_EQ(1.5, c.requestPeriod.count());
  EXPECT_EQ(2, c.maxAttempts);
  EXPECT_EQ(0, c.cooldown.count());
  EXPECT_EQ(0, c.loopSleep.count());
  EXPECT_EQ("zero", c.costEstimatorName);
  EXPECT_EQ("Too Many Requests", c.rateLimitSignature);
  EXPECT_FALSE(c.renameOnFailure);
  EXPECT_TRUE(c.dryRun);

  // The dumped config parses back to the same thing.
  EXPECT_EQ(c.toDynamic(), Config(c.toDynamic()).toDynamic());
}

TEST(TestConfig, RequiresRequestsPath) {
  EXPECT_THROW({
    Config c(dynamic::object);
  }, std::runtime_error);
  EXPECT_THROW({
    Config c(dynamic::object(kRequestsFilepath, ""));
  }, std::runtime_error);
}

TEST(TestConfig, RejectsInvalidValues) {
  EXPECT_THROW(Config(with(kMaxRequestsPerPeriod, 0)), std::runtime_error);
  EXPECT_THROW(Config(with(kRequestPeriodSec, -1)), std::runtime_error);
  EXPECT_THROW(Config(with(kMaxCostPerPeriod, 0)), std::runtime_error);
  EXPECT_THROW(Config(with(kCostPeriodSec, 0)), std::runtime_error);
  EXPECT_THROW(Config(with(kMaxAttempts, 0)), std::runtime_error);
  EXPECT_THROW(Config(with(kCooldownSec, -0.5)), std::runtime_error);
  EXPECT_THROW(Config(with(kLoopSleepMs, -1)), std::runtime_error);
  EXPECT_THROW(Config(with(kCostEstimator, "psychic")), std::runtime_error);
  EXPECT_THROW(Config(with(kMaxAttempts, "many")), std::runtime_error);
  // Would wrap around as an int.
  EXPECT_THROW(
    Config(with(kMaxAttempts, int64_t(1) << 31)),
    std::runtime_error
  );
  EXPECT_THROW(
    Config(with(kSaveFilepath, "data/reqs.jsonl")),
    std::runtime_error
  );
}

TEST(TestConfig, LargestMaxAttempts) {
  Config c(with(kMaxAttempts, std::numeric_limits<int>::max()));
  EXPECT_EQ(std::numeric_limits<int>::max(), c.maxAttempts);
}

TEST(TestCredentials, ExplicitKeyWins) {
  ::setenv(kApiKeyEnvVar, "from-env", 1);
  EXPECT_EQ("explicit", resolveApiKey("explicit"));
  EXPECT_EQ("from-env", resolveApiKey(""));
  ::unsetenv(kApiKeyEnvVar);
  EXPECT_EQ("", resolveApiKey(""));
}

TEST(TestCredentials, Headers) {
  EXPECT_EQ(
    (std::vector<std::string>{
      "Content-Type: application/json",
      "Authorization: Bearer sk-123",
    }),
    requestHeaders("sk-123")
  );
  // No key, no Authorization header.
  EXPECT_EQ(
    std::vector<std::string>{"Content-Type: application/json"},
    requestHeaders("")
  );
}
