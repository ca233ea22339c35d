#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "recommendation_engine.h"

namespace rec {

enum class EmbedderKind { kHashing, kRemote };

struct ServiceConfig {
  std::string socket_path = "/tmp/recommender.sock";
  std::string catalog_path = "data/catalog.json";
  std::string cache_path;  // empty: no embedding cache

  EmbedderKind embedder = EmbedderKind::kHashing;
  int dimension = 384;
  std::string embed_url;
  std::string embed_model = "all-MiniLM-L6-v2";
  std::string embed_api_key;
  std::chrono::milliseconds embed_timeout{1500};

  // Reranker defaults to on whenever an API key is available
  std::optional<bool> rerank;
  std::string rerank_model = "gemini-pro";
  std::string google_api_key;
  std::chrono::milliseconds rerank_timeout{4000};

  EngineOptions engine;

  int workers = 0;  // 0: hardware concurrency, at least 2
  std::chrono::milliseconds request_timeout{10000};

  bool verbose = false;
  bool show_help = false;

  bool rerankEnabled() const { return rerank.value_or(!google_api_key.empty()); }
  int workerCount() const;
};

// Defaults <- --config JSON file <- environment <- command line.
// Throws std::invalid_argument on malformed values.
ServiceConfig loadConfig(int argc, char* argv[]);

// Same layering, pieces exposed for tests
void applyConfigFile(ServiceConfig& config, const std::string& path);
void applyEnvironment(ServiceConfig& config);
void applyArguments(ServiceConfig& config, int argc, char* argv[]);

std::string usage(const char* program);

} // namespace rec
