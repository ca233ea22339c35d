#pragma once

#include <vector>
#include "catalog.h"
#include "ranking.h"

namespace rec {

struct BalancerOptions {
  // Candidates at or below this similarity do not compete for category
  // slots; they only fill what is left, in rank order.
  double min_score = 0.0;
};

// Greedy round-robin over primary categories. Each step takes the best
// remaining candidate of the category with the fewest picks so far; ties
// go to the category whose best remaining candidate ranks highest overall.
//
// The first pick is therefore always the overall best candidate, a
// single-category pool comes back in plain rank order, and the output
// never holds more than k entries or more than the input.
class DiversityBalancer {
public:
  explicit DiversityBalancer(BalancerOptions options = BalancerOptions());

  std::vector<RankedCandidate> balance(const std::vector<RankedCandidate>& candidates,
                                       const Catalog& catalog, size_t k) const;

private:
  BalancerOptions options_;
};

} // namespace rec
