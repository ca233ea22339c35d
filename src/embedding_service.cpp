#include "embedding_service.h"
#include "errors.h"
#include "request_context.h"
#include "text_util.h"
#include <openssl/sha.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rec {

HashingEmbeddingService::HashingEmbeddingService(int dim) : dim_(dim) {
  if (dim_ <= 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
}

std::string HashingEmbeddingService::modelId() const {
  return "sha256-hashing-" + std::to_string(dim_);
}

std::vector<float> HashingEmbeddingService::embed(const std::string& text, const RequestContext*) {
  std::vector<float> embedding(dim_, 0.0f);

  auto tokens = textutil::tokenize(text);
  if (tokens.empty()) {
    return embedding;
  }

  for (const auto& token : tokens) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(token.data()), token.size(), hash);

    // Two independent buckets per token keep single collisions from
    // dominating the cosine between short texts
    for (int probe = 0; probe < 2; ++probe) {
      const unsigned char* h = hash + probe * 8;
      uint32_t bucket = (static_cast<uint32_t>(h[0]) << 24) | (static_cast<uint32_t>(h[1]) << 16) |
                        (static_cast<uint32_t>(h[2]) << 8) | static_cast<uint32_t>(h[3]);
      float sign = (h[4] & 1) ? -1.0f : 1.0f;
      embedding[bucket % static_cast<uint32_t>(dim_)] += sign;
    }
  }

  // Normalize to unit length
  float norm = 0.0f;
  for (float v : embedding) {
    norm += v * v;
  }
  norm = std::sqrt(norm);

  if (norm > 0.0f) {
    for (float& v : embedding) {
      v /= norm;
    }
  }

  return embedding;
}

RemoteEmbeddingService::RemoteEmbeddingService(std::string url, std::string model, int dim,
                                               std::chrono::milliseconds timeout, std::string api_key)
  : url_(std::move(url)), model_(std::move(model)), dim_(dim), timeout_(timeout),
    api_key_(std::move(api_key)) {
  if (url_.empty()) {
    throw std::invalid_argument("Remote embedding service requires a URL");
  }
  if (dim_ <= 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
}

std::vector<float> RemoteEmbeddingService::embed(const std::string& text, const RequestContext* context) {
  json request;
  request["model"] = model_;
  request["input"] = text;

  std::vector<std::string> headers;
  if (!api_key_.empty()) {
    headers.push_back("Authorization: Bearer " + api_key_);
  }

  auto timeout = context ? std::min(timeout_, context->remaining(timeout_)) : timeout_;

  HttpResponse response;
  try {
    response = http_.postJson(url_, request.dump(), headers, timeout, context);
  } catch (const HttpError& e) {
    throw EmbeddingUnavailable(std::string("Embedding request failed: ") + e.what());
  }

  if (response.status != 200) {
    throw EmbeddingUnavailable("Embedding endpoint returned HTTP " + std::to_string(response.status));
  }
  return parseResponse(response.body);
}

std::vector<float> RemoteEmbeddingService::parseResponse(const std::string& body) {
  try {
    json doc = json::parse(body);
    const json* values = nullptr;
    if (doc.contains("embedding")) {
      values = &doc["embedding"];
    } else if (doc.contains("data") && doc["data"].is_array() && !doc["data"].empty()) {
      values = &doc["data"][0]["embedding"];
    }
    if (!values || !values->is_array() || values->empty()) {
      throw EmbeddingUnavailable("Embedding response has no embedding array");
    }

    std::vector<float> embedding;
    embedding.reserve(values->size());
    for (const auto& v : *values) {
      float f = v.get<float>();
      if (!std::isfinite(f)) {
        throw EmbeddingUnavailable("Embedding response contains non-finite values");
      }
      embedding.push_back(f);
    }
    return embedding;
  } catch (const json::exception& e) {
    throw EmbeddingUnavailable(std::string("Malformed embedding response: ") + e.what());
  }
}

} // namespace rec
