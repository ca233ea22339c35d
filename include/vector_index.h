#pragma once

#include <memory>
#include <string>
#include <vector>
#include <faiss/IndexFlat.h>
#include "ranking.h"

namespace rec {

// Exhaustive cosine search over one embedding per catalog record.
// Vectors are normalized to unit length on insert so inner product equals
// cosine. Read-only after build; search is safe from many threads.
class VectorIndex {
public:
  explicit VectorIndex(int dimension);

  // vectors is packed: ids.size() * dimension floats, row i belongs to ids[i]
  void add(const std::vector<std::string>& ids, std::vector<float> vectors);

  // min(n, size()) candidates, best first, ties by insertion order.
  // Throws EmbeddingUnavailable for a query of the wrong dimension or with
  // zero / non-finite norm.
  std::vector<RankedCandidate> topN(const std::vector<float>& query, size_t n) const;

  int dimension() const { return dimension_; }
  size_t size() const { return id_map_.size(); }

private:
  int dimension_;
  std::unique_ptr<faiss::IndexFlatIP> index_;
  std::vector<std::string> id_map_;
};

} // namespace rec
