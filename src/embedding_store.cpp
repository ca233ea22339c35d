#include "embedding_store.h"
#include "log.h"
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>
#include <rocksdb/options.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rec {

namespace {

const std::string kKeyPrefix = "emb:";

std::string sha256Hex(const std::string& text) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), hash);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char byte : hash) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

} // namespace

EmbeddingStore::EmbeddingStore(const std::string& db_path) : db_path_(db_path) {
  rocksdb::Options options;
  options.create_if_missing = true;
  options.compression = rocksdb::kSnappyCompression;

  rocksdb::DB* db_ptr;
  rocksdb::Status status = rocksdb::DB::Open(options, db_path, &db_ptr);
  if (!status.ok()) {
    throw std::runtime_error("Failed to open RocksDB: " + status.ToString());
  }
  db_.reset(db_ptr);
}

EmbeddingStore::~EmbeddingStore() = default;

std::string EmbeddingStore::cacheKey(const std::string& model_id, int dimension, const std::string& text) {
  return kKeyPrefix + model_id + ":" + std::to_string(dimension) + ":" + sha256Hex(text);
}

std::optional<std::vector<float>> EmbeddingStore::get(const std::string& model_id, int dimension,
                                                      const std::string& text) const {
  std::string value;
  rocksdb::Status status = db_->Get(rocksdb::ReadOptions(), cacheKey(model_id, dimension, text), &value);
  if (!status.ok()) {
    return std::nullopt;
  }

  try {
    json doc = json::parse(value);
    if (doc.value("model", "") != model_id || doc.value("dimension", 0) != dimension) {
      return std::nullopt;
    }
    auto embedding = doc.at("embedding").get<std::vector<float>>();
    if (static_cast<int>(embedding.size()) != dimension) {
      return std::nullopt;
    }
    return embedding;
  } catch (const json::exception& e) {
    log::warn("Skipping unreadable cached embedding: " + std::string(e.what()));
    return std::nullopt;
  }
}

bool EmbeddingStore::put(const std::string& model_id, const std::string& text,
                         const std::vector<float>& embedding) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  json doc;
  doc["model"] = model_id;
  doc["dimension"] = embedding.size();
  doc["embedding"] = embedding;

  int dimension = static_cast<int>(embedding.size());
  rocksdb::Status status = db_->Put(rocksdb::WriteOptions(), cacheKey(model_id, dimension, text), doc.dump());
  if (!status.ok()) {
    log::warn("Failed to cache embedding: " + status.ToString());
    return false;
  }
  return true;
}

size_t EmbeddingStore::size() const {
  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));

  size_t count = 0;
  for (it->Seek(kKeyPrefix); it->Valid() && it->key().starts_with(kKeyPrefix); it->Next()) {
    ++count;
  }
  return count;
}

size_t EmbeddingStore::purgeOtherModels(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);

  const std::string keep_prefix = kKeyPrefix + model_id + ":";
  std::vector<std::string> stale;

  std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
  for (it->Seek(kKeyPrefix); it->Valid() && it->key().starts_with(kKeyPrefix); it->Next()) {
    std::string key = it->key().ToString();
    if (key.rfind(keep_prefix, 0) != 0) {
      stale.push_back(std::move(key));
    }
  }

  size_t removed = 0;
  for (const auto& key : stale) {
    if (db_->Delete(rocksdb::WriteOptions(), key).ok()) {
      ++removed;
    }
  }
  return removed;
}

} // namespace rec
