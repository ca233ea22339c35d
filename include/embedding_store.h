#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <rocksdb/db.h>

namespace rec {

// Persistent cache of catalog embeddings so restarts and catalog refreshes
// only embed records whose canonical text changed. Values are JSON
// documents {"model", "dimension", "embedding"} keyed by
// "emb:<model>:<dimension>:<sha256(text)>".
class EmbeddingStore {
public:
  explicit EmbeddingStore(const std::string& db_path);
  ~EmbeddingStore();

  std::optional<std::vector<float>> get(const std::string& model_id, int dimension,
                                        const std::string& text) const;
  bool put(const std::string& model_id, const std::string& text,
           const std::vector<float>& embedding);

  // Number of cached embeddings
  size_t size() const;

  // Drops every entry written by other models; returns how many were removed
  size_t purgeOtherModels(const std::string& model_id);

  static std::string cacheKey(const std::string& model_id, int dimension, const std::string& text);

private:
  std::unique_ptr<rocksdb::DB> db_;
  std::string db_path_;
  std::mutex write_mutex_;
};

} // namespace rec
