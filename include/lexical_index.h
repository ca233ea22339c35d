#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "catalog.h"
#include "ranking.h"

namespace rec {

// Term-overlap ranking used when no query embedding is available.
// Every record is returned (zero overlap last) so a non-empty catalog
// always yields a ranking.
class LexicalIndex {
public:
  LexicalIndex() = default;
  explicit LexicalIndex(const Catalog& catalog);

  // min(n, size()) candidates by shared distinct terms, ties by catalog order
  std::vector<RankedCandidate> topN(const std::string& query, size_t n) const;

  size_t size() const { return entries_.size(); }

private:
  struct Entry {
    std::string id;
    std::unordered_set<std::string> terms;
  };

  std::vector<Entry> entries_;
};

} // namespace rec
