#pragma once

#include <cstddef>
#include <string>
#include <variant>

namespace rec {

// Cosine similarity against the embedded query, in [-1, 1]
struct VectorScore {
  float cosine = 0.0f;
};

// Fallback scoring: distinct query terms found in the record text.
// Carries lower confidence than a VectorScore and is never mixed with one.
struct LexicalScore {
  size_t shared_terms = 0;
  double coverage = 0.0;  // shared_terms / distinct query terms
};

using CandidateScore = std::variant<VectorScore, LexicalScore>;

enum class ScoringStrategy { kVector, kLexical };

const char* strategyName(ScoringStrategy strategy);

struct RankedCandidate {
  size_t position = 0;  // index into the snapshot catalog
  std::string record_id;
  CandidateScore score;

  // Ordering signal within a single ranked list
  double similarity() const;
  ScoringStrategy strategy() const;
};

} // namespace rec
