/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

#include "batchgate/test/utils.h"
#include "batchgate/utils/Exception.h"
#include "batchgate/utils/ResultWriter.h"

using namespace batchgate;
using folly::dynamic;

TEST(TestResultWriter, WritesOneLinePerResult) {
  folly::test::TemporaryDirectory tmp;
  // Missing parent directories are created.
  auto path = pathIn(tmp, "a/b/out.jsonl");
  ResultWriter w(path);
  w.write(dynamic::array(dynamic::object("input", "x"), "ok"));
  w.write(dynamic::array(dynamic::object("input", "y"), "ok", 5));
  EXPECT_EQ(2, w.linesWritten());
  w.close();

  auto lines = readJsonLines(path);
  ASSERT_EQ(2, lines.size());
  EXPECT_EQ(dynamic::array(dynamic::object("input", "x"), "ok"), lines[0]);
  EXPECT_EQ(dynamic(5), lines[1][2]);
}

TEST(TestResultWriter, RefusesExistingFile) {
  folly::test::TemporaryDirectory tmp;
  auto path = pathIn(tmp, "out.jsonl");
  writeLines(path, {"[{}, {}]"});
  try {
    ResultWriter w(path);
    FAIL() << "Expected OutputPathError";
  } catch (const OutputPathError& ex) {
    EXPECT_NE(std::string::npos, std::string(ex.what()).find(path.native()));
  }
  // Untouched
  EXPECT_EQ(1, readJsonLines(path).size());
}

TEST(TestResultWriter, WriteAfterCloseThrows) {
  folly::test::TemporaryDirectory tmp;
  auto path = pathIn(tmp, "out.jsonl");
  ResultWriter w(path);
  w.write(dynamic::array(dynamic::object("input", "x"), "ok"));
  w.close();
  w.close();
  EXPECT_THROW(
    w.write(dynamic::array(dynamic::object("input", "y"), "ok")),
    OutputPathError
  );
  EXPECT_EQ(1, w.linesWritten());
  EXPECT_EQ(1, readJsonLines(path).size());
}

TEST(TestResultWriter, DerivedPaths) {
  EXPECT_EQ(
    "dir/reqs_results.jsonl",
    defaultResultsPath("dir/reqs.jsonl").native()
  );
  EXPECT_EQ("reqs.txt_results.jsonl", defaultResultsPath("reqs.txt").native());
  EXPECT_EQ(
    "dir/reqs_results_with_errors.jsonl",
    withErrorsPath("dir/reqs_results.jsonl").native()
  );
  EXPECT_EQ("out_with_errors.jsonl", withErrorsPath("out").native());
}
