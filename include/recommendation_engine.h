#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "catalog.h"
#include "diversity_balancer.h"
#include "index_snapshot.h"
#include "ranking.h"

namespace rec {

class EmbeddingService;
class Reranker;
class RequestContext;

// Results per request never exceed this, whatever the configuration says
constexpr size_t kHardMaxResults = 10;

enum class LongQueryPolicy { kTruncate, kReject };

struct EngineOptions {
  size_t default_k = 10;
  size_t max_k = kHardMaxResults;
  size_t overfetch_factor = 3;
  size_t max_query_chars = 2000;
  LongQueryPolicy long_query_policy = LongQueryPolicy::kTruncate;
  bool rerank_enabled = true;
  BalancerOptions balancer;
};

struct RecommendationResult {
  std::vector<CatalogRecord> records;
  ScoringStrategy strategy = ScoringStrategy::kVector;
  bool reranked = false;
  bool query_truncated = false;
};

struct HealthStatus {
  bool catalog_loaded = false;
  size_t catalog_size = 0;
  bool vector_index_ready = false;
  bool embedding_reachable = false;
  bool reranker_configured = false;
  std::string model_id;
  int dimension = 0;
  std::chrono::system_clock::time_point built_at;  // of the published snapshot

  bool ready() const { return catalog_loaded; }
  // Serving, but on the lexical fallback
  bool degraded() const { return catalog_loaded && !(vector_index_ready && embedding_reachable); }
};

// Validate -> Embed -> Retrieve(overfetch * k) -> Balance(k) -> Rerank -> Finalize
//
// The engine keeps no per-request state; the published snapshot is the only
// shared data and is never mutated. publish() swaps it atomically, so
// requests already running finish against the snapshot they started with.
class RecommendationEngine {
public:
  RecommendationEngine(std::shared_ptr<EmbeddingService> embedder,
                       std::shared_ptr<Reranker> reranker,
                       EngineOptions options = EngineOptions());

  void publish(std::shared_ptr<const IndexSnapshot> snapshot);
  std::shared_ptr<const IndexSnapshot> snapshot() const;

  // Throws InvalidQuery, IndexNotReady or RequestCancelled. Embedding and
  // rerank failures are absorbed. k defaults to options().default_k and is
  // clamped to [1, max_k].
  RecommendationResult recommend(const std::string& query,
                                 std::optional<int> k,
                                 const RequestContext& context) const;
  RecommendationResult recommend(const std::string& query, std::optional<int> k = std::nullopt) const;

  HealthStatus health() const;

  const EngineOptions& options() const { return options_; }

private:
  std::string validateQuery(const std::string& query, bool& truncated) const;
  size_t clampK(std::optional<int> k) const;

  std::vector<RankedCandidate> retrieve(const IndexSnapshot& snapshot,
                                        const std::string& query,
                                        size_t pool,
                                        const RequestContext& context) const;

  std::vector<RankedCandidate> rerankBestEffort(const IndexSnapshot& snapshot,
                                                const std::string& query,
                                                std::vector<RankedCandidate> shortlist,
                                                const RequestContext& context,
                                                bool& reranked) const;

  std::shared_ptr<EmbeddingService> embedder_;
  std::shared_ptr<Reranker> reranker_;
  EngineOptions options_;
  DiversityBalancer balancer_;
  std::shared_ptr<const IndexSnapshot> snapshot_;
};

} // namespace rec
