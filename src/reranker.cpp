#include "reranker.h"
#include "errors.h"
#include "request_context.h"
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rec {

bool isPermutation(const std::vector<RankedCandidate>& input,
                   const std::vector<RankedCandidate>& output) {
  if (input.size() != output.size()) {
    return false;
  }

  std::unordered_map<std::string, int> counts;
  for (const auto& candidate : input) {
    ++counts[candidate.record_id];
  }
  for (const auto& candidate : output) {
    auto it = counts.find(candidate.record_id);
    if (it == counts.end() || it->second == 0) {
      return false;
    }
    --it->second;
  }
  return true;
}

LlmReranker::LlmReranker(LlmRerankerOptions options) : options_(std::move(options)) {
  if (options_.api_key.empty()) {
    throw std::invalid_argument("LLM reranker requires an API key");
  }
}

std::string LlmReranker::buildPrompt(const std::string& query,
                                     const std::vector<RankedCandidate>& candidates,
                                     const Catalog& catalog) const {
  std::ostringstream prompt;
  prompt << "You are an expert HR assessment consultant.\n\n"
         << "Given a job requirement or query, order the candidate assessments from most to least relevant. "
         << "Keep a balanced mix when the query asks for several skill types "
         << "(for example technical skills and communication).\n\n"
         << "Query: " << query << "\n\n"
         << "Candidate assessments:\n";

  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& record = catalog.at(candidates[i].position);
    prompt << (i + 1) << ". " << record.name << "\n";
    if (!record.description.empty()) {
      prompt << "   Description: " << record.description << "\n";
    }
    prompt << "   Type:";
    for (auto category : record.categories) {
      prompt << " " << categoryName(category) << ";";
    }
    prompt << "\n";
    if (record.duration_minutes) {
      prompt << "   Duration: " << *record.duration_minutes << " minutes\n";
    }
  }

  prompt << "\nReply with only a JSON array containing each candidate number exactly once, "
         << "most relevant first, e.g. [3, 1, 2]. Do not add or drop candidates.";
  return prompt.str();
}

std::string LlmReranker::extractReplyText(const std::string& response_body) {
  try {
    json doc = json::parse(response_body);
    const auto& parts = doc.at("candidates").at(0).at("content").at("parts");
    std::string text;
    for (const auto& part : parts) {
      text += part.value("text", "");
    }
    if (text.empty()) {
      throw RerankUnavailable("Reasoning service reply has no text");
    }
    return text;
  } catch (const json::exception& e) {
    throw RerankUnavailable(std::string("Malformed reasoning service response: ") + e.what());
  }
}

std::vector<size_t> LlmReranker::parseOrder(const std::string& reply_text, size_t count) {
  auto open = reply_text.find('[');
  auto close = reply_text.rfind(']');
  if (open == std::string::npos || close == std::string::npos || close < open) {
    throw RerankUnavailable("Reasoning service reply contains no JSON array");
  }

  json order;
  try {
    order = json::parse(reply_text.substr(open, close - open + 1));
  } catch (const json::exception& e) {
    throw RerankUnavailable(std::string("Reasoning service reply is not valid JSON: ") + e.what());
  }

  if (!order.is_array() || order.size() != count) {
    throw RerankUnavailable("Reasoning service reply has " + std::to_string(order.size()) +
                            " entries, expected " + std::to_string(count));
  }

  std::vector<size_t> positions;
  std::vector<bool> used(count, false);
  positions.reserve(count);
  for (const auto& item : order) {
    if (!item.is_number_integer()) {
      throw RerankUnavailable("Reasoning service reply contains a non-integer entry");
    }
    int64_t number = item.get<int64_t>();
    if (number < 1 || static_cast<size_t>(number) > count || used[number - 1]) {
      throw RerankUnavailable("Reasoning service reply is not a permutation");
    }
    used[number - 1] = true;
    positions.push_back(static_cast<size_t>(number - 1));
  }
  return positions;
}

std::vector<RankedCandidate> LlmReranker::rerank(const std::string& query,
                                                 const std::vector<RankedCandidate>& candidates,
                                                 const Catalog& catalog,
                                                 const RequestContext& context) {
  if (candidates.size() < 2) {
    return candidates;
  }

  json part;
  part["text"] = buildPrompt(query, candidates, catalog);
  json content;
  content["parts"] = json::array({part});

  json request;
  request["contents"] = json::array({content});
  request["generationConfig"] = {{"temperature", options_.temperature},
                                 {"responseMimeType", "application/json"}};

  std::string url = options_.endpoint + "/" + options_.model + ":generateContent";
  std::vector<std::string> headers = {"x-goog-api-key: " + options_.api_key};
  auto timeout = std::min(options_.timeout, context.remaining(options_.timeout));

  HttpResponse response;
  try {
    response = http_.postJson(url, request.dump(), headers, timeout, &context);
  } catch (const HttpError& e) {
    throw RerankUnavailable(std::string("Reasoning service call failed: ") + e.what());
  }
  if (response.status != 200) {
    throw RerankUnavailable("Reasoning service returned HTTP " + std::to_string(response.status));
  }

  auto order = parseOrder(extractReplyText(response.body), candidates.size());

  std::vector<RankedCandidate> reordered;
  reordered.reserve(candidates.size());
  for (size_t position : order) {
    reordered.push_back(candidates[position]);
  }
  return reordered;
}

} // namespace rec
