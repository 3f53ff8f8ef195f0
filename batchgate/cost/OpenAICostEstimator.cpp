/*
 * Copyright (c) Facebook, Inc. and its affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "batchgate/cost/OpenAICostEstimator.h"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/regex.hpp>
#include <cctype>
#include <folly/lang/CheckedMath.h>
#include <glog/logging.h>

#include "batchgate/utils/Exception.h"

namespace batchgate {

namespace {
  const int64_t kDefaultMaxTokens = 15;
  const int64_t kDefaultN = 1;
  // Every message is wrapped as <im_start>{role/name}\n{content}<im_end>\n
  const size_t kTokensPerMessage = 4;
  // Every reply is primed with <im_start>assistant
  const size_t kTokensPerReply = 2;

  bool isLetter(unsigned char c) {
    return std::isalpha(c) || c >= 0x80;  // Count UTF-8 as letters
  }

  int64_t getIntOrThrow(
      const folly::dynamic& payload,
      const char* key,
      int64_t dflt) {
    auto* p = payload.get_ptr(key);
    if (!p) {
      return dflt;
    }
    if (!p->isInt() || p->asInt() < 0) {
      throw BatchGateException(
        "Expected a non-negative integer \"", key, "\" in request"
      );
    }
    return p->asInt();
  }

  size_t multiplyOrThrow(size_t a, size_t b, const char* what) {
    size_t product = 0;
    if (!folly::checked_mul(&product, a, b)) {
      throw BatchGateException(
        "Too many ", what, " requested: ", a, " * ", b, " overflows"
      );
    }
    return product;
  }

  // "n" completions of up to "max_tokens" each.
  size_t completionTokens(const folly::dynamic& payload) {
    return multiplyOrThrow(
      getIntOrThrow(payload, "n", kDefaultN),
      getIntOrThrow(payload, "max_tokens", kDefaultMaxTokens),
      "completion tokens"
    );
  }
}  // anonymous namespace

ApproximateTokenCounter::ApproximateTokenCounter(const std::string& encoding) {
  if (encoding == "cl100k_base") {
    bytesPerToken_ = 4;
    digitsPerToken_ = 3;
  } else if (encoding == "p50k_base" || encoding == "r50k_base") {
    // The older vocabularies split words and numbers more finely.
    bytesPerToken_ = 3;
    digitsPerToken_ = 2;
  } else {
    throw BatchGateException("Unknown token encoding: ", encoding);
  }
}

size_t ApproximateTokenCounter::countTokens(folly::StringPiece text) const {
  size_t tokens = 0;
  size_t i = 0;
  const size_t n = text.size();
  while (i < n) {
    const unsigned char c = text[i];
    size_t j = i + 1;
    if (c == ' ' && j < n && isLetter(text[j])) {
      // A leading space is merged into the word that follows.
      ++j;
      while (j < n && isLetter(text[j])) { ++j; }
      tokens += (j - i - 1 + bytesPerToken_ - 1) / bytesPerToken_;
    } else if (isLetter(c)) {
      while (j < n && isLetter(text[j])) { ++j; }
      tokens += (j - i + bytesPerToken_ - 1) / bytesPerToken_;
    } else if (std::isdigit(c)) {
      while (j < n && std::isdigit(static_cast<unsigned char>(text[j]))) {
        ++j;
      }
      tokens += (j - i + digitsPerToken_ - 1) / digitsPerToken_;
    } else if (std::isspace(c)) {
      while (j < n && std::isspace(static_cast<unsigned char>(text[j]))) {
        ++j;
      }
      ++tokens;
    } else {
      ++tokens;  // Punctuation and symbols
    }
    i = j;
  }
  return tokens;
}

std::string openAIEndpointFromURL(const std::string& url) {
  static const boost::regex kEndpointRegex("^https://[^/]+/v\\d+/(.+)$");
  boost::smatch match;
  if (!boost::regex_match(url, match, kEndpointRegex)) {
    throw BatchGateException(
      "Request URL does not look like an OpenAI API URL: ", url
    );
  }
  return match[1].str();
}

OpenAICostEstimator::OpenAICostEstimator(
    std::string endpoint,
    std::unique_ptr<TokenCounter> counter)
  : endpointName_(std::move(endpoint)),
    counter_(std::move(counter)) {
  CHECK(counter_);
  if (boost::starts_with(endpointName_, "chat/")
      && boost::ends_with(endpointName_, "completions")) {
    endpoint_ = Endpoint::ChatCompletions;
  } else if (boost::ends_with(endpointName_, "completions")) {
    endpoint_ = Endpoint::Completions;
  } else if (endpointName_ == "embeddings") {
    endpoint_ = Endpoint::Embeddings;
  } else {
    // Edits, inserts, images, etc. would need their own formulas.
    throw BatchGateException(
      "Cannot estimate token usage for API endpoint \"", endpointName_, "\""
    );
  }
}

double OpenAICostEstimator::estimate(const folly::dynamic& payload) const {
  switch (endpoint_) {
    case Endpoint::ChatCompletions:
      return countChat(payload);
    case Endpoint::Completions:
      return countCompletion(payload);
    case Endpoint::Embeddings:
      return countEmbedding(payload);
  }
  LOG(FATAL) << "Unknown endpoint " << endpointName_;
  return 0;  // Not reached
}

size_t OpenAICostEstimator::countTextOrList(
    const folly::dynamic& d,
    const char* field,
    size_t* num_texts) const {
  if (d.isString()) {
    *num_texts = 1;
    return counter_->countTokens(d.stringPiece());
  }
  if (d.isArray()) {
    size_t tokens = 0;
    for (const auto& item : d) {
      if (!item.isString()) {
        throw BatchGateException(
          "Expecting either string or list of strings for \"", field,
          "\" field"
        );
      }
      tokens += counter_->countTokens(item.stringPiece());
    }
    *num_texts = d.size();
    return tokens;
  }
  throw BatchGateException(
    "Expecting either string or list of strings for \"", field, "\" field"
  );
}

size_t OpenAICostEstimator::countCompletion(
    const folly::dynamic& payload) const {
  const size_t completion_tokens = completionTokens(payload);
  auto* prompt = payload.get_ptr("prompt");
  if (!prompt) {
    throw BatchGateException("Completion request lacks \"prompt\"");
  }
  size_t num_prompts = 0;
  size_t prompt_tokens = countTextOrList(*prompt, "prompt", &num_prompts);
  return prompt_tokens + multiplyOrThrow(
    completion_tokens, num_prompts, "completion tokens"
  );
}

size_t OpenAICostEstimator::countChat(const folly::dynamic& payload) const {
  const size_t completion_tokens = completionTokens(payload);
  auto* messages = payload.get_ptr("messages");
  if (!messages || !messages->isArray()) {
    throw BatchGateException("Chat request needs a \"messages\" list");
  }
  size_t tokens = 0;
  for (const auto& message : *messages) {
    if (!message.isObject()) {
      throw BatchGateException("Each chat message must be an object");
    }
    tokens += kTokensPerMessage;
    for (const auto& kv : message.items()) {
      if (!kv.second.isString()) {
        throw BatchGateException(
          "Chat message field \"", kv.first.asString(), "\" is not a string"
        );
      }
      tokens += counter_->countTokens(kv.second.stringPiece());
      if (kv.first == "name") {  // If there's a name, the role is omitted
        --tokens;
      }
    }
  }
  return tokens + kTokensPerReply + completion_tokens;
}

size_t OpenAICostEstimator::countEmbedding(
    const folly::dynamic& payload) const {
  auto* input = payload.get_ptr("input");
  if (!input) {
    throw BatchGateException("Embedding request lacks \"input\"");
  }
  size_t num_inputs = 0;
  return countTextOrList(*input, "input", &num_inputs);
}

}  // namespace batchgate
