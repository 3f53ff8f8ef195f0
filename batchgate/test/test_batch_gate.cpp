/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>
#include <set>

#include "batchgate/BatchGate.h"
#include "batchgate/config/Config.h"
#include "batchgate/runners/test/FakeTransport.h"
#include "batchgate/test/utils.h"
#include "batchgate/utils/Exception.h"

using namespace batchgate;
using folly::dynamic;

namespace {

struct BatchGateTest : public ::testing::Test {
  BatchGateTest()
    : transport(std::make_shared<FakeTransport>()),
      requestsPath(pathIn(tmp, "reqs.jsonl")),
      settings(fastConfig(requestsPath)) {}

  RunSummary run() {
    Config config(settings);
    BatchGate batch_gate(config, [this](folly::EventBase*) {
      return transport;
    });
    return batch_gate.run();
  }

  folly::test::TemporaryDirectory tmp;
  std::shared_ptr<FakeTransport> transport;
  boost::filesystem::path requestsPath;
  dynamic settings;
};

}  // anonymous namespace

TEST_F(BatchGateTest, AllSucceed) {
  writeLines(requestsPath, {
    "{\"input\": \"a\", \"metadata\": {\"row\": 0}}",
    "{\"input\": \"b\", \"metadata\": {\"row\": 1}}",
    "{\"input\": \"c\", \"metadata\": {\"row\": 2}}",
  });
  transport->apiError();  // Retried, so it doesn't show
  auto summary = run();

  EXPECT_EQ(pathIn(tmp, "reqs_results.jsonl"), summary.resultsPath);
  EXPECT_EQ(3, summary.status.started);
  EXPECT_EQ(3, summary.status.succeeded);
  EXPECT_EQ(0, summary.status.failed);
  EXPECT_EQ(1, summary.status.apiErrors);

  auto lines = readJsonLines(summary.resultsPath);
  ASSERT_EQ(3, lines.size());
  std::set<int64_t> rows;
  for (const auto& line : lines) {
    ASSERT_EQ(3, line.size());
    EXPECT_FALSE(line[0].count("metadata"));
    // The fake echoes the payload back.
    EXPECT_EQ(line[0], line[1]["data"]);
    rows.insert(line[2]["row"].asInt());
  }
  EXPECT_EQ((std::set<int64_t>{0, 1, 2}), rows);
}

TEST_F(BatchGateTest, FailuresRenameTheResults) {
  writeLines(requestsPath, {"{\"input\": \"a\"}", "{\"input\": \"b\"}"});
  settings[kMaxAttempts] = 1;
  transport->fail("Connection refused");
  auto summary = run();

  EXPECT_EQ(1, summary.status.failed);
  EXPECT_EQ(1, summary.status.succeeded);
  EXPECT_EQ(
    pathIn(tmp, "reqs_results_with_errors.jsonl"),
    summary.resultsPath
  );
  EXPECT_FALSE(boost::filesystem::exists(pathIn(tmp, "reqs_results.jsonl")));
  EXPECT_EQ(2, readJsonLines(summary.resultsPath).size());
}

TEST_F(BatchGateTest, FailuresWithoutRenaming) {
  writeLines(requestsPath, {"{\"input\": \"a\"}"});
  settings[kMaxAttempts] = 1;
  settings[kRenameOnFailure] = false;
  settings[kSaveFilepath] = pathIn(tmp, "out/custom.jsonl").native();
  transport->apiError();
  auto summary = run();

  EXPECT_EQ(1, summary.status.failed);
  EXPECT_EQ(pathIn(tmp, "out/custom.jsonl"), summary.resultsPath);
  auto lines = readJsonLines(summary.resultsPath);
  ASSERT_EQ(1, lines.size());
  EXPECT_EQ(dynamic("api_error"), lines[0][1][0]["kind"]);
}

TEST_F(BatchGateTest, MissingInput) {
  try {
    run();
    FAIL() << "Expected an error";
  } catch (const std::runtime_error& ex) {
    EXPECT_NE(
      std::string::npos,
      std::string(ex.what()).find(requestsPath.native())
    );
  }
  EXPECT_TRUE(transport->posted().empty());
}

TEST_F(BatchGateTest, ExistingOutput) {
  writeLines(requestsPath, {"{\"input\": \"a\"}"});
  writeLines(pathIn(tmp, "reqs_results.jsonl"), {"[{}, {}]"});
  EXPECT_THROW(run(), OutputPathError);
  EXPECT_TRUE(transport->posted().empty());
  EXPECT_EQ(1, readJsonLines(pathIn(tmp, "reqs_results.jsonl")).size());
}

TEST_F(BatchGateTest, DryRun) {
  writeLines(requestsPath, {"{\"input\": \"a\"}"});
  settings[kDryRun] = true;
  auto summary = run();
  EXPECT_EQ(0, summary.status.started);
  EXPECT_TRUE(summary.resultsPath.empty());
  EXPECT_TRUE(transport->posted().empty());
  EXPECT_FALSE(boost::filesystem::exists(pathIn(tmp, "reqs_results.jsonl")));

  // Even a dry run needs the input.
  boost::filesystem::remove(requestsPath);
  EXPECT_THROW(run(), std::runtime_error);
}

TEST_F(BatchGateTest, MalformedInputStopsTheRun) {
  writeLines(requestsPath, {
    "{\"input\": \"a\"}",
    "{\"input\": ",
    "{\"input\": \"c\"}",
  });
  try {
    run();
    FAIL() << "Expected MalformedInputError";
  } catch (const MalformedInputError& ex) {
    EXPECT_EQ(2, ex.lineNumber());
  }
  // Line 3 was never sent, but line 1's result is kept.
  ASSERT_EQ(1, transport->posted().size());
  EXPECT_EQ(1, readJsonLines(pathIn(tmp, "reqs_results.jsonl")).size());
}

TEST_F(BatchGateTest, BlankLineStopsTheRun) {
  writeLines(requestsPath, {"{\"input\": \"a\"}", "", "{\"input\": \"c\"}"});
  EXPECT_THROW(run(), MalformedInputError);
  ASSERT_EQ(1, transport->posted().size());
}

TEST_F(BatchGateTest, OpenAIEstimatorThrottlesByTokens) {
  writeLines(requestsPath, {
    "{\"model\": \"text-embedding-ada-002\", \"input\": \"Hi\"}",
    "{\"model\": \"text-embedding-ada-002\", \"input\": [\"Hi\", \"Hi\"]}",
  });
  settings[kCostEstimator] = "openai";
  settings[kRequestURL] = "https://api.openai.com/v1/embeddings";
  auto summary = run();
  EXPECT_EQ(2, summary.status.succeeded);
}
