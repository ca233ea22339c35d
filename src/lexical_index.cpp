#include "lexical_index.h"
#include "text_util.h"
#include <algorithm>

namespace rec {

LexicalIndex::LexicalIndex(const Catalog& catalog) {
  entries_.reserve(catalog.size());
  for (const auto& record : catalog.records()) {
    Entry entry;
    entry.id = record.id;
    for (auto& token : textutil::tokenize(record.canonicalText())) {
      entry.terms.insert(std::move(token));
    }
    entries_.push_back(std::move(entry));
  }
}

std::vector<RankedCandidate> LexicalIndex::topN(const std::string& query, size_t n) const {
  std::unordered_set<std::string> query_terms;
  for (auto& token : textutil::tokenize(query)) {
    query_terms.insert(std::move(token));
  }

  std::vector<RankedCandidate> hits;
  hits.reserve(entries_.size());

  for (size_t i = 0; i < entries_.size(); ++i) {
    size_t shared = 0;
    for (const auto& term : query_terms) {
      if (entries_[i].terms.count(term)) {
        ++shared;
      }
    }

    RankedCandidate hit;
    hit.position = i;
    hit.record_id = entries_[i].id;
    hit.score = LexicalScore{shared, query_terms.empty() ? 0.0 : static_cast<double>(shared) / query_terms.size()};
    hits.push_back(std::move(hit));
  }

  std::stable_sort(hits.begin(), hits.end(), [](const RankedCandidate& a, const RankedCandidate& b) {
    return std::get<LexicalScore>(a.score).shared_terms > std::get<LexicalScore>(b.score).shared_terms;
  });

  if (hits.size() > n) hits.resize(n);
  return hits;
}

} // namespace rec
