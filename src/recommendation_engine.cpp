#include "recommendation_engine.h"
#include "embedding_service.h"
#include "errors.h"
#include "log.h"
#include "request_context.h"
#include "reranker.h"
#include "text_util.h"
#include <algorithm>
#include <atomic>

namespace rec {

RecommendationEngine::RecommendationEngine(std::shared_ptr<EmbeddingService> embedder,
                                           std::shared_ptr<Reranker> reranker,
                                           EngineOptions options)
  : embedder_(std::move(embedder)),
    reranker_(std::move(reranker)),
    options_(options),
    balancer_(options.balancer) {
  if (options_.max_k == 0 || options_.max_k > kHardMaxResults) {
    throw std::invalid_argument("max_k must be between 1 and " + std::to_string(kHardMaxResults));
  }
  if (options_.default_k == 0 || options_.default_k > options_.max_k) {
    throw std::invalid_argument("default_k must be between 1 and max_k");
  }
  if (options_.overfetch_factor == 0) {
    throw std::invalid_argument("overfetch_factor must be positive");
  }
}

void RecommendationEngine::publish(std::shared_ptr<const IndexSnapshot> snapshot) {
  std::atomic_store(&snapshot_, std::move(snapshot));
}

std::shared_ptr<const IndexSnapshot> RecommendationEngine::snapshot() const {
  return std::atomic_load(&snapshot_);
}

std::string RecommendationEngine::validateQuery(const std::string& query, bool& truncated) const {
  std::string text = textutil::trim(query);
  if (text.empty()) {
    throw InvalidQuery("Query is required");
  }

  truncated = false;
  if (textutil::utf8Length(text) > options_.max_query_chars) {
    if (options_.long_query_policy == LongQueryPolicy::kReject) {
      throw InvalidQuery("Query exceeds " + std::to_string(options_.max_query_chars) + " characters");
    }
    text = textutil::trim(textutil::truncateUtf8(text, options_.max_query_chars));
    truncated = true;
  }
  return text;
}

size_t RecommendationEngine::clampK(std::optional<int> k) const {
  if (!k) {
    return options_.default_k;
  }
  if (*k < 1) {
    return 1;
  }
  return std::min(static_cast<size_t>(*k), options_.max_k);
}

std::vector<RankedCandidate> RecommendationEngine::retrieve(const IndexSnapshot& snapshot,
                                                            const std::string& query,
                                                            size_t pool,
                                                            const RequestContext& context) const {
  if (snapshot.hasVectors() && embedder_) {
    try {
      auto query_vec = embedder_->embed(query, &context);
      return snapshot.vectors()->topN(query_vec, pool);
    } catch (const EmbeddingUnavailable& e) {
      // cancellation surfaces as a transport failure; report it as such
      context.throwIfCancelled("embedding");
      log::warn(std::string("Embedding unavailable, using lexical ranking: ") + e.what());
    }
  }
  auto ranked = snapshot.lexical().topN(query, pool);
  if (!ranked.empty()) {
    const auto& best = std::get<LexicalScore>(ranked.front().score);
    log::debug("Lexical ranking: best match shares " + std::to_string(best.shared_terms) + " terms (" +
               std::to_string(static_cast<int>(best.coverage * 100.0)) + "% of the query)");
  }
  return ranked;
}

std::vector<RankedCandidate> RecommendationEngine::rerankBestEffort(const IndexSnapshot& snapshot,
                                                                    const std::string& query,
                                                                    std::vector<RankedCandidate> shortlist,
                                                                    const RequestContext& context,
                                                                    bool& reranked) const {
  reranked = false;
  if (!reranker_ || !options_.rerank_enabled || shortlist.size() < 2) {
    return shortlist;
  }

  try {
    auto reordered = reranker_->rerank(query, shortlist, snapshot.catalog(), context);
    if (!isPermutation(shortlist, reordered)) {
      log::warn("Reranker " + reranker_->name() + " changed the candidate set, keeping balanced order");
      return shortlist;
    }
    reranked = true;
    return reordered;
  } catch (const RerankUnavailable& e) {
    context.throwIfCancelled("rerank");
    log::warn(std::string("Rerank skipped: ") + e.what());
  } catch (const std::exception& e) {
    context.throwIfCancelled("rerank");
    log::warn("Rerank failed in " + reranker_->name() + ": " + e.what());
  }
  return shortlist;
}

RecommendationResult RecommendationEngine::recommend(const std::string& query,
                                                     std::optional<int> k,
                                                     const RequestContext& context) const {
  auto snapshot = this->snapshot();
  if (!snapshot) {
    throw IndexNotReady("Catalog index is not built yet");
  }

  RecommendationResult result;
  const std::string text = validateQuery(query, result.query_truncated);
  const size_t limit = clampK(k);

  const Catalog& catalog = snapshot->catalog();
  if (catalog.empty()) {
    return result;
  }

  context.throwIfCancelled("retrieval");
  const size_t pool = std::min(limit * options_.overfetch_factor, catalog.size());
  auto ranked = retrieve(*snapshot, text, pool, context);
  if (!ranked.empty()) {
    result.strategy = ranked.front().strategy();
  }

  auto shortlist = balancer_.balance(ranked, catalog, limit);

  context.throwIfCancelled("rerank");
  shortlist = rerankBestEffort(*snapshot, text, std::move(shortlist), context, result.reranked);

  context.throwIfCancelled("finalize");
  if (shortlist.size() > limit) {
    shortlist.resize(limit);
  }
  result.records.reserve(shortlist.size());
  for (const auto& candidate : shortlist) {
    result.records.push_back(catalog.at(candidate.position));
  }
  return result;
}

RecommendationResult RecommendationEngine::recommend(const std::string& query, std::optional<int> k) const {
  RequestContext context;
  return recommend(query, k, context);
}

HealthStatus RecommendationEngine::health() const {
  HealthStatus status;
  status.reranker_configured = reranker_ != nullptr && options_.rerank_enabled;

  auto snapshot = this->snapshot();
  if (snapshot) {
    status.catalog_loaded = true;
    status.catalog_size = snapshot->catalog().size();
    status.vector_index_ready = snapshot->hasVectors();
    status.model_id = snapshot->modelId();
    status.built_at = snapshot->builtAt();
  }

  if (embedder_) {
    status.dimension = embedder_->dimension();
    try {
      auto probe = embedder_->embed("health check");
      status.embedding_reachable = static_cast<int>(probe.size()) == status.dimension;
    } catch (const EmbeddingUnavailable& e) {
      log::warn(std::string("Embedding health probe failed: ") + e.what());
    }
  }
  return status;
}

} // namespace rec
