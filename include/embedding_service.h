#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "http_client.h"

namespace rec {

class RequestContext;

// Text -> fixed-length vector. Implementations must be deterministic for
// identical input and safe to call from several threads at once.
class EmbeddingService {
public:
  virtual ~EmbeddingService() = default;

  // Throws EmbeddingUnavailable when no vector can be produced.
  // Callers check the returned size against dimension().
  virtual std::vector<float> embed(const std::string& text,
                                   const RequestContext* context = nullptr) = 0;

  virtual int dimension() const = 0;

  // Identifies the model; cached embeddings are only reused for the same id
  virtual std::string modelId() const = 0;
};

// Local feature-hashing embedder: each token is hashed with SHA-256 into a
// signed bucket, then the vector is normalized to unit length. Texts that
// share tokens land close together, which is enough for a self-contained
// deployment and for tests.
class HashingEmbeddingService : public EmbeddingService {
public:
  explicit HashingEmbeddingService(int dim = 384);

  std::vector<float> embed(const std::string& text,
                           const RequestContext* context = nullptr) override;
  int dimension() const override { return dim_; }
  std::string modelId() const override;

private:
  int dim_;
};

// Embedding endpoint reachable over HTTP, e.g. a sentence-transformers
// sidecar. Request: {"model": ..., "input": ...}
// Response: {"embedding": [...]} or {"data": [{"embedding": [...]}]}
class RemoteEmbeddingService : public EmbeddingService {
public:
  RemoteEmbeddingService(std::string url, std::string model, int dim,
                         std::chrono::milliseconds timeout, std::string api_key = "");

  std::vector<float> embed(const std::string& text,
                           const RequestContext* context = nullptr) override;
  int dimension() const override { return dim_; }
  std::string modelId() const override { return model_; }

  static std::vector<float> parseResponse(const std::string& body);

private:
  std::string url_;
  std::string model_;
  int dim_;
  std::chrono::milliseconds timeout_;
  std::string api_key_;
  HttpClient http_;
};

} // namespace rec
