#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace rec {

// Closed set of assessment categories (test types)
enum class Category {
  kKnowledgeSkills,
  kPersonalityBehavior,
  kAbilityAptitude,
  kSimulations,
  kOther,
};

const char* categoryName(Category category);
char categoryCode(Category category);

// Accepts a single-letter code ("K") or a full name ("Knowledge & Skills").
std::optional<Category> parseCategory(const std::string& text);

struct CatalogRecord {
  std::string id;
  std::string name;
  std::string url;
  std::string description;
  std::vector<Category> categories;
  std::optional<int> duration_minutes;
  bool adaptive_support = false;
  bool remote_support = false;

  Category primaryCategory() const;

  // name + description + category names; the text that gets embedded
  std::string canonicalText() const;
};

// Read-only record collection, loaded once from an external snapshot
class Catalog {
public:
  Catalog() = default;
  explicit Catalog(std::vector<CatalogRecord> records);

  static Catalog fromJson(const nlohmann::json& doc);
  static Catalog loadFromFile(const std::string& path);

  const std::vector<CatalogRecord>& records() const { return records_; }
  const CatalogRecord& at(size_t position) const { return records_.at(position); }
  const CatalogRecord* find(const std::string& id) const;

  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }

private:
  std::vector<CatalogRecord> records_;
  std::unordered_map<std::string, size_t> by_id_;
};

} // namespace rec
