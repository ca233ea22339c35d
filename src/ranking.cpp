#include "ranking.h"

namespace rec {

namespace {

struct SimilarityVisitor {
  double operator()(const VectorScore& s) const { return s.cosine; }
  double operator()(const LexicalScore& s) const { return static_cast<double>(s.shared_terms); }
};

} // namespace

const char* strategyName(ScoringStrategy strategy) {
  return strategy == ScoringStrategy::kVector ? "vector" : "lexical";
}

double RankedCandidate::similarity() const {
  return std::visit(SimilarityVisitor{}, score);
}

ScoringStrategy RankedCandidate::strategy() const {
  return std::holds_alternative<VectorScore>(score) ? ScoringStrategy::kVector : ScoringStrategy::kLexical;
}

} // namespace rec
