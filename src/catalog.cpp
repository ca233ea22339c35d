#include "catalog.h"
#include "errors.h"
#include "log.h"
#include "text_util.h"
#include <algorithm>
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace rec {

namespace {

bool parseFlag(const json& value) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_string()) {
    std::string s = textutil::toLowerAscii(textutil::trim(value.get<std::string>()));
    return s == "yes" || s == "y" || s == "true" || s == "1";
  }
  if (value.is_number_integer()) {
    return value.get<int64_t>() != 0;
  }
  return false;
}

std::optional<int> parseDuration(const json& value) {
  if (value.is_number_integer()) {
    int64_t minutes = value.get<int64_t>();
    if (minutes < 0) return std::nullopt;
    return static_cast<int>(minutes);
  }
  if (value.is_number_float()) {
    double minutes = value.get<double>();
    if (minutes < 0.0) return std::nullopt;
    return static_cast<int>(minutes);
  }
  if (value.is_string()) {
    // "30", "30 minutes", "max 30"
    std::string s = value.get<std::string>();
    auto it = std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
    if (it == s.end()) return std::nullopt;
    int minutes = 0;
    for (; it != s.end() && std::isdigit(static_cast<unsigned char>(*it)); ++it) {
      minutes = minutes * 10 + (*it - '0');
      if (minutes > 100000) return std::nullopt;
    }
    return minutes;
  }
  return std::nullopt;
}

void appendCategories(const json& value, const std::string& record_name, std::vector<std::string>& out) {
  if (value.is_string()) {
    out.push_back(value.get<std::string>());
  } else if (value.is_array()) {
    for (const auto& item : value) {
      if (item.is_string()) {
        out.push_back(item.get<std::string>());
      }
    }
  } else if (!value.is_null()) {
    log::warn("Ignoring non-string category on record '" + record_name + "'");
  }
}

CatalogRecord parseRecord(const json& item, size_t position) {
  if (!item.is_object()) {
    throw InternalInconsistency("Catalog entry " + std::to_string(position) + " is not an object");
  }

  CatalogRecord record;
  record.name = textutil::trim(item.value("name", item.value("assessment_name", "")));
  if (record.name.empty()) {
    throw InternalInconsistency("Catalog entry " + std::to_string(position) + " has no name");
  }

  record.url = item.value("url", "");
  record.description = item.value("description", "");

  if (item.contains("id") && item["id"].is_string()) {
    record.id = item["id"].get<std::string>();
  } else if (item.contains("id") && item["id"].is_number_integer()) {
    record.id = std::to_string(item["id"].get<int64_t>());
  } else {
    record.id = record.url;
  }
  if (record.id.empty()) {
    throw InternalInconsistency("Catalog entry '" + record.name + "' has neither id nor url");
  }

  std::vector<std::string> raw_categories;
  for (const char* key : {"categories", "test_type", "test_type_full", "category"}) {
    if (item.contains(key)) {
      appendCategories(item[key], record.name, raw_categories);
    }
  }
  for (const auto& raw : raw_categories) {
    auto parsed = parseCategory(raw);
    if (!parsed) {
      log::warn("Unknown category '" + raw + "' on record '" + record.name + "', using Other");
      parsed = Category::kOther;
    }
    if (std::find(record.categories.begin(), record.categories.end(), *parsed) == record.categories.end()) {
      record.categories.push_back(*parsed);
    }
  }
  if (record.categories.empty()) {
    record.categories.push_back(Category::kOther);
  }

  for (const char* key : {"duration_minutes", "duration"}) {
    if (item.contains(key)) {
      record.duration_minutes = parseDuration(item[key]);
      break;
    }
  }

  if (item.contains("adaptive_support")) {
    record.adaptive_support = parseFlag(item["adaptive_support"]);
  }
  if (item.contains("remote_support")) {
    record.remote_support = parseFlag(item["remote_support"]);
  }

  return record;
}

} // namespace

const char* categoryName(Category category) {
  switch (category) {
    case Category::kKnowledgeSkills: return "Knowledge & Skills";
    case Category::kPersonalityBehavior: return "Personality & Behavior";
    case Category::kAbilityAptitude: return "Ability & Aptitude";
    case Category::kSimulations: return "Simulations";
    case Category::kOther: return "Other";
  }
  return "Other";
}

char categoryCode(Category category) {
  switch (category) {
    case Category::kKnowledgeSkills: return 'K';
    case Category::kPersonalityBehavior: return 'P';
    case Category::kAbilityAptitude: return 'A';
    case Category::kSimulations: return 'S';
    case Category::kOther: return 'O';
  }
  return 'O';
}

std::optional<Category> parseCategory(const std::string& text) {
  std::string s = textutil::toLowerAscii(textutil::trim(text));
  if (s.size() == 1) {
    switch (s[0]) {
      case 'k': return Category::kKnowledgeSkills;
      case 'p': return Category::kPersonalityBehavior;
      case 'a':
      case 'c': return Category::kAbilityAptitude;
      case 's': return Category::kSimulations;
      case 'o': return Category::kOther;
      default: return std::nullopt;
    }
  }

  for (const auto& token : textutil::tokenize(s)) {
    if (token == "knowledge" || token == "skills" || token == "skill") {
      return Category::kKnowledgeSkills;
    }
    if (token == "personality" || token == "behavior" || token == "behaviour") {
      return Category::kPersonalityBehavior;
    }
    if (token == "ability" || token == "aptitude" || token == "cognitive") {
      return Category::kAbilityAptitude;
    }
    if (token == "simulation" || token == "simulations" || token == "situational") {
      return Category::kSimulations;
    }
    if (token == "other") {
      return Category::kOther;
    }
  }
  return std::nullopt;
}

Category CatalogRecord::primaryCategory() const {
  return categories.empty() ? Category::kOther : categories.front();
}

std::string CatalogRecord::canonicalText() const {
  std::string text = name;
  if (!description.empty()) {
    text += " " + description;
  }
  for (auto category : categories) {
    text += " ";
    text += categoryName(category);
  }
  return textutil::trim(text);
}

Catalog::Catalog(std::vector<CatalogRecord> records) : records_(std::move(records)) {
  by_id_.reserve(records_.size());
  for (size_t i = 0; i < records_.size(); ++i) {
    const auto& record = records_[i];
    if (record.name.empty()) {
      throw InternalInconsistency("Catalog record '" + record.id + "' has no name");
    }
    if (record.categories.empty()) {
      throw InternalInconsistency("Catalog record '" + record.id + "' has no category");
    }
    if (!by_id_.emplace(record.id, i).second) {
      throw InternalInconsistency("Duplicate catalog id: " + record.id);
    }
  }
}

Catalog Catalog::fromJson(const json& doc) {
  const json* items = &doc;
  // Accept either a bare array or {"assessments": [...]}
  if (doc.is_object() && doc.contains("assessments")) {
    items = &doc["assessments"];
  }
  if (!items->is_array()) {
    throw InternalInconsistency("Catalog snapshot must be a JSON array of records");
  }

  std::vector<CatalogRecord> records;
  records.reserve(items->size());
  size_t position = 0;
  for (const auto& item : *items) {
    records.push_back(parseRecord(item, position++));
  }
  return Catalog(std::move(records));
}

Catalog Catalog::loadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open catalog: " + path);
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::exception& e) {
    throw std::runtime_error("Failed to parse catalog " + path + ": " + e.what());
  }

  Catalog catalog = fromJson(doc);
  log::info("Loaded " + std::to_string(catalog.size()) + " catalog records from " + path);
  return catalog;
}

const CatalogRecord* Catalog::find(const std::string& id) const {
  auto it = by_id_.find(id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &records_[it->second];
}

} // namespace rec
