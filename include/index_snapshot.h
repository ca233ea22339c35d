#pragma once

#include <chrono>
#include <memory>
#include <string>
#include "catalog.h"
#include "lexical_index.h"
#include "vector_index.h"

namespace rec {

class EmbeddingService;
class EmbeddingStore;

// Immutable catalog plus the indexes built over it. Published to the engine
// as shared_ptr<const IndexSnapshot>; a refresh builds a new one.
class IndexSnapshot {
public:
  // vectors may be null: the snapshot then serves lexical rankings only
  IndexSnapshot(Catalog catalog, std::unique_ptr<VectorIndex> vectors, std::string model_id);

  const Catalog& catalog() const { return catalog_; }
  const LexicalIndex& lexical() const { return lexical_; }
  const VectorIndex* vectors() const { return vectors_.get(); }
  bool hasVectors() const { return vectors_ != nullptr; }
  const std::string& modelId() const { return model_id_; }
  std::chrono::system_clock::time_point builtAt() const { return built_at_; }

private:
  Catalog catalog_;
  LexicalIndex lexical_;
  std::unique_ptr<VectorIndex> vectors_;
  std::string model_id_;
  std::chrono::system_clock::time_point built_at_;
};

class SnapshotBuilder {
public:
  explicit SnapshotBuilder(std::shared_ptr<EmbeddingService> embedder,
                           std::shared_ptr<EmbeddingStore> store = nullptr);

  // Embeds every record (cache first). An unreachable provider yields a
  // lexical-only snapshot; a wrong embedding dimension throws
  // InternalInconsistency.
  std::shared_ptr<const IndexSnapshot> build(Catalog catalog) const;

  std::shared_ptr<const IndexSnapshot> buildFromFile(const std::string& path) const;

private:
  std::shared_ptr<EmbeddingService> embedder_;
  std::shared_ptr<EmbeddingStore> store_;
};

} // namespace rec
