/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <folly/Range.h>
#include <memory>
#include <string>

#include "batchgate/cost/CostEstimator.h"

namespace batchgate {

/**
 * Counts the tokens a piece of text encodes to.  The cost estimator only
 * ever needs the count, never the tokens.
 */
class TokenCounter {
public:
  virtual ~TokenCounter() {}
  virtual size_t countTokens(folly::StringPiece text) const = 0;
};

/**
 * An offline approximation of OpenAI's BPE encodings.  It splits text the
 * way those encodings pre-tokenize it (letter runs with their leading
 * space, digit groups of up to 3, punctuation, whitespace), and charges a
 * letter run one token per 4 bytes, rounded up.  Typical English text
 * lands within 10-20% of the real count, and long unusual words are
 * over-estimated, which errs on the side of throttling.
 *
 * Throws on an unknown encoding name.
 */
class ApproximateTokenCounter : public TokenCounter {
public:
  explicit ApproximateTokenCounter(const std::string& encoding);
  size_t countTokens(folly::StringPiece text) const override;

private:
  size_t bytesPerToken_;
  size_t digitsPerToken_;
};

/**
 * "https://api.openai.com/v1/chat/completions" => "chat/completions".
 * Throws if the URL does not look like an OpenAI API URL.
 */
std::string openAIEndpointFromURL(const std::string& url);

/**
 * Estimates the tokens an OpenAI request will consume:
 *  - completions: prompt tokens + n * max_tokens for each prompt,
 *  - chat/completions: 4 per message plus its field values (one fewer
 *    for messages with a "name"), plus 2 for priming the reply, plus
 *    n * max_tokens,
 *  - embeddings: the tokens of "input".
 * n defaults to 1 and max_tokens to 15.  Other endpoints are rejected at
 * construction time.
 */
class OpenAICostEstimator : public CostEstimator {
public:
  OpenAICostEstimator(
    std::string endpoint,
    std::unique_ptr<TokenCounter> counter
  );

  double estimate(const folly::dynamic& payload) const override;

private:
  size_t countCompletion(const folly::dynamic& payload) const;
  size_t countChat(const folly::dynamic& payload) const;
  size_t countEmbedding(const folly::dynamic& payload) const;
  // Sums over a string, or a list of strings.  Sets *num_texts.
  size_t countTextOrList(
    const folly::dynamic& d,
    const char* field,
    size_t* num_texts
  ) const;

  enum class Endpoint { Completions, ChatCompletions, Embeddings };

  const std::string endpointName_;
  Endpoint endpoint_;
  std::unique_ptr<TokenCounter> counter_;
};

}  // namespace batchgate
