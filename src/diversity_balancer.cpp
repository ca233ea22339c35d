#include "diversity_balancer.h"
#include <algorithm>
#include <deque>
#include <map>
#include <unordered_set>

namespace rec {

DiversityBalancer::DiversityBalancer(BalancerOptions options) : options_(options) {}

std::vector<RankedCandidate> DiversityBalancer::balance(const std::vector<RankedCandidate>& candidates,
                                                        const Catalog& catalog, size_t k) const {
  std::vector<RankedCandidate> picked;
  if (k == 0 || candidates.empty()) {
    return picked;
  }

  struct Lane {
    std::deque<size_t> ranks;  // indices into candidates, best first
    size_t picks = 0;
  };

  std::map<Category, Lane> lanes;
  std::vector<size_t> leftovers;
  std::unordered_set<std::string> seen;

  for (size_t rank = 0; rank < candidates.size(); ++rank) {
    const auto& candidate = candidates[rank];
    if (!seen.insert(candidate.record_id).second) {
      continue;
    }
    if (candidate.similarity() > options_.min_score) {
      lanes[catalog.at(candidate.position).primaryCategory()].ranks.push_back(rank);
    } else {
      leftovers.push_back(rank);
    }
  }

  picked.reserve(std::min(k, seen.size()));

  while (picked.size() < k) {
    Lane* best = nullptr;
    for (auto& entry : lanes) {
      Lane& lane = entry.second;
      if (lane.ranks.empty()) {
        continue;
      }
      if (!best || lane.picks < best->picks ||
          (lane.picks == best->picks && lane.ranks.front() < best->ranks.front())) {
        best = &lane;
      }
    }
    if (!best) {
      break;
    }

    picked.push_back(candidates[best->ranks.front()]);
    best->ranks.pop_front();
    ++best->picks;
  }

  for (size_t i = 0; i < leftovers.size() && picked.size() < k; ++i) {
    picked.push_back(candidates[leftovers[i]]);
  }

  return picked;
}

} // namespace rec
