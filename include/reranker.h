#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "catalog.h"
#include "http_client.h"
#include "ranking.h"

namespace rec {

class RequestContext;

// Advisory reordering of a shortlist by an external reasoning service.
// Implementations return a permutation of their input (same records, same
// count) or throw RerankUnavailable; they must honour the context deadline.
class Reranker {
public:
  virtual ~Reranker() = default;

  virtual std::vector<RankedCandidate> rerank(const std::string& query,
                                              const std::vector<RankedCandidate>& candidates,
                                              const Catalog& catalog,
                                              const RequestContext& context) = 0;

  virtual std::string name() const = 0;
};

// True when output holds exactly the records of input, each once
bool isPermutation(const std::vector<RankedCandidate>& input,
                   const std::vector<RankedCandidate>& output);

struct LlmRerankerOptions {
  std::string api_key;
  std::string model = "gemini-pro";
  std::string endpoint = "https://generativelanguage.googleapis.com/v1beta/models";
  std::chrono::milliseconds timeout{4000};
  double temperature = 0.2;
};

// Asks a Gemini generateContent model to order the numbered shortlist and
// reply with a JSON array of the numbers.
class LlmReranker : public Reranker {
public:
  explicit LlmReranker(LlmRerankerOptions options);

  std::vector<RankedCandidate> rerank(const std::string& query,
                                      const std::vector<RankedCandidate>& candidates,
                                      const Catalog& catalog,
                                      const RequestContext& context) override;

  std::string name() const override { return "llm:" + options_.model; }

  std::string buildPrompt(const std::string& query,
                          const std::vector<RankedCandidate>& candidates,
                          const Catalog& catalog) const;

  // 1-based candidate numbers from the model reply -> 0-based order.
  // Throws RerankUnavailable unless the reply is a permutation of 1..count.
  static std::vector<size_t> parseOrder(const std::string& reply_text, size_t count);

  // Text of the first candidate part of a generateContent response
  static std::string extractReplyText(const std::string& response_body);

private:
  LlmRerankerOptions options_;
  HttpClient http_;
};

} // namespace rec
