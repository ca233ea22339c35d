#include "vector_index.h"
#include "errors.h"
#include <algorithm>
#include <cmath>
#include <faiss/utils/distances.h>

namespace rec {

VectorIndex::VectorIndex(int dimension) : dimension_(dimension) {
  if (dimension_ <= 0) {
    throw InternalInconsistency("Vector index dimension must be positive");
  }
  index_ = std::make_unique<faiss::IndexFlatIP>(dimension_);
}

void VectorIndex::add(const std::vector<std::string>& ids, std::vector<float> vectors) {
  if (vectors.size() != ids.size() * static_cast<size_t>(dimension_)) {
    throw InternalInconsistency("Embedding block holds " + std::to_string(vectors.size()) +
                                " floats, expected " + std::to_string(ids.size()) + " x " +
                                std::to_string(dimension_));
  }
  if (ids.empty()) {
    return;
  }

  // zero rows are left untouched and score 0 against everything
  faiss::fvec_renorm_L2(static_cast<size_t>(dimension_), ids.size(), vectors.data());

  index_->add(static_cast<faiss::idx_t>(ids.size()), vectors.data());
  id_map_.insert(id_map_.end(), ids.begin(), ids.end());
}

std::vector<RankedCandidate> VectorIndex::topN(const std::vector<float>& query, size_t n) const {
  if (query.size() != static_cast<size_t>(dimension_)) {
    throw EmbeddingUnavailable("Query embedding has dimension " + std::to_string(query.size()) +
                               ", index expects " + std::to_string(dimension_));
  }

  double norm2 = 0.0;
  for (float v : query) {
    norm2 += static_cast<double>(v) * v;
  }
  if (!std::isfinite(norm2) || norm2 == 0.0) {
    throw EmbeddingUnavailable("Query embedding is zero or non-finite");
  }

  std::vector<RankedCandidate> hits;
  n = std::min(n, id_map_.size());
  if (n == 0) {
    return hits;
  }

  std::vector<float> unit(query);
  float inv = static_cast<float>(1.0 / std::sqrt(norm2));
  for (float& v : unit) {
    v *= inv;
  }

  // Score every record; faiss does not order ties, so rank them here
  const faiss::idx_t total = index_->ntotal;
  std::vector<float> scores(static_cast<size_t>(total));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(total));
  index_->search(1, unit.data(), total, scores.data(), labels.data());

  hits.reserve(static_cast<size_t>(total));
  for (faiss::idx_t i = 0; i < total; ++i) {
    faiss::idx_t label = labels[i];
    if (label < 0 || label >= static_cast<faiss::idx_t>(id_map_.size())) {
      continue;
    }
    RankedCandidate hit;
    hit.position = static_cast<size_t>(label);
    hit.record_id = id_map_[hit.position];
    hit.score = VectorScore{scores[i]};
    hits.push_back(std::move(hit));
  }

  std::sort(hits.begin(), hits.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
    float sa = std::get<VectorScore>(a.score).cosine;
    float sb = std::get<VectorScore>(b.score).cosine;
    if (sa != sb) return sa > sb;
    return a.position < b.position;
  });

  if (hits.size() > n) hits.resize(n);
  return hits;
}

} // namespace rec
