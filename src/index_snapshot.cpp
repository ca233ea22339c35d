#include "index_snapshot.h"
#include "embedding_service.h"
#include "embedding_store.h"
#include "errors.h"
#include "log.h"

namespace rec {

IndexSnapshot::IndexSnapshot(Catalog catalog, std::unique_ptr<VectorIndex> vectors, std::string model_id)
  : catalog_(std::move(catalog)),
    lexical_(catalog_),
    vectors_(std::move(vectors)),
    model_id_(std::move(model_id)),
    built_at_(std::chrono::system_clock::now()) {
  if (vectors_ && vectors_->size() != catalog_.size()) {
    throw InternalInconsistency("Vector index holds " + std::to_string(vectors_->size()) +
                                " embeddings for " + std::to_string(catalog_.size()) + " records");
  }
}

SnapshotBuilder::SnapshotBuilder(std::shared_ptr<EmbeddingService> embedder,
                                 std::shared_ptr<EmbeddingStore> store)
  : embedder_(std::move(embedder)), store_(std::move(store)) {}

std::shared_ptr<const IndexSnapshot> SnapshotBuilder::build(Catalog catalog) const {
  if (!embedder_) {
    log::warn("No embedding provider configured, building lexical-only index");
    return std::make_shared<const IndexSnapshot>(std::move(catalog), nullptr, "");
  }

  const int dim = embedder_->dimension();
  const std::string model_id = embedder_->modelId();
  if (dim <= 0) {
    throw InternalInconsistency("Embedding provider reports dimension " + std::to_string(dim));
  }

  std::vector<std::string> ids;
  std::vector<float> vectors;
  ids.reserve(catalog.size());
  vectors.reserve(catalog.size() * static_cast<size_t>(dim));

  size_t cache_hits = 0;
  for (const auto& record : catalog.records()) {
    const std::string text = record.canonicalText();

    std::optional<std::vector<float>> cached;
    if (store_) {
      cached = store_->get(model_id, dim, text);
    }

    std::vector<float> embedding;
    if (cached) {
      embedding = std::move(*cached);
      ++cache_hits;
    } else {
      try {
        embedding = embedder_->embed(text);
      } catch (const EmbeddingUnavailable& e) {
        log::warn("Embedding provider unavailable while indexing '" + record.name +
                  "': " + e.what() + "; serving lexical rankings only");
        return std::make_shared<const IndexSnapshot>(std::move(catalog), nullptr, model_id);
      }

      if (static_cast<int>(embedding.size()) != dim) {
        throw InternalInconsistency("Embedding for '" + record.name + "' has dimension " +
                                    std::to_string(embedding.size()) + ", provider declares " +
                                    std::to_string(dim));
      }
      if (store_) {
        store_->put(model_id, text, embedding);
      }
    }

    ids.push_back(record.id);
    vectors.insert(vectors.end(), embedding.begin(), embedding.end());
  }

  auto index = std::make_unique<VectorIndex>(dim);
  index->add(ids, std::move(vectors));

  log::info("Indexed " + std::to_string(catalog.size()) + " records with " + model_id +
            " (dim " + std::to_string(dim) + ", " + std::to_string(cache_hits) + " cached)");
  return std::make_shared<const IndexSnapshot>(std::move(catalog), std::move(index), model_id);
}

std::shared_ptr<const IndexSnapshot> SnapshotBuilder::buildFromFile(const std::string& path) const {
  return build(Catalog::loadFromFile(path));
}

} // namespace rec
