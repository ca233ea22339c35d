#include "evaluator.h"
#include "errors.h"
#include "log.h"
#include "recommendation_engine.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <set>
#include <unordered_map>
#include <unordered_set>

namespace rec {

namespace {

// RFC 4180 style: quoted fields, doubled quotes, newlines inside quotes
std::vector<std::vector<std::string>> readCsv(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open CSV: " + path);
  }

  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;

  char c;
  while (in.get(c)) {
    if (in_quotes) {
      if (c == '"') {
        if (in.peek() == '"') {
          field.push_back('"');
          in.get(c);
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }

    if (c == '"') {
      in_quotes = true;
      row_has_content = true;
    } else if (c == ',') {
      row.push_back(std::move(field));
      field.clear();
      row_has_content = true;
    } else if (c == '\n') {
      if (row_has_content || !field.empty()) {
        row.push_back(std::move(field));
        rows.push_back(std::move(row));
      }
      row.clear();
      field.clear();
      row_has_content = false;
    } else if (c != '\r') {
      field.push_back(c);
      row_has_content = true;
    }
  }
  if (row_has_content || !field.empty()) {
    row.push_back(std::move(field));
    rows.push_back(std::move(row));
  }
  return rows;
}

std::string csvEscape(const std::string& s) {
  if (s.find_first_of(",\"\n\r") == std::string::npos) {
    return s;
  }
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

// Labels name assessments by URL; records without one fall back to their id
const std::string& labelKey(const CatalogRecord& record) {
  return record.url.empty() ? record.id : record.url;
}

} // namespace

Evaluator::Evaluator(const RecommendationEngine& engine) : engine_(engine) {}

double Evaluator::recallAtK(const std::vector<std::string>& predicted,
                            const std::vector<std::string>& relevant,
                            size_t k) {
  std::unordered_set<std::string> relevant_set(relevant.begin(), relevant.end());
  if (relevant_set.empty()) {
    return 0.0;
  }

  std::unordered_set<std::string> top_k;
  for (size_t i = 0; i < predicted.size() && i < k; ++i) {
    top_k.insert(predicted[i]);
  }

  size_t hits = 0;
  for (const auto& id : relevant_set) {
    if (top_k.count(id)) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(relevant_set.size());
}

double Evaluator::meanRecallAtK(const std::map<std::string, std::vector<std::string>>& predictions,
                                const std::vector<LabeledQuery>& ground_truth,
                                size_t k) {
  if (ground_truth.empty()) {
    return 0.0;
  }

  double total = 0.0;
  for (const auto& labeled : ground_truth) {
    auto it = predictions.find(labeled.query);
    if (it == predictions.end()) {
      log::warn("Query not in predictions: " + labeled.query.substr(0, 50));
      continue;
    }
    total += recallAtK(it->second, labeled.relevant_ids, k);
  }
  return total / static_cast<double>(ground_truth.size());
}

std::map<std::string, std::vector<std::string>> Evaluator::predict(const std::vector<std::string>& queries,
                                                                   size_t k) const {
  std::map<std::string, std::vector<std::string>> predictions;
  for (const auto& query : queries) {
    std::vector<std::string> ids;
    try {
      auto result = engine_.recommend(query, static_cast<int>(k));
      for (const auto& record : result.records) {
        ids.push_back(labelKey(record));
      }
    } catch (const InvalidQuery& e) {
      log::warn("Skipping invalid query '" + query.substr(0, 50) + "': " + e.what());
    }
    predictions[query] = std::move(ids);
  }
  return predictions;
}

EvaluationReport Evaluator::evaluate(const std::vector<LabeledQuery>& labeled, size_t k) const {
  EvaluationReport report;
  report.k = k;
  if (labeled.empty()) {
    return report;
  }

  auto snapshot = engine_.snapshot();
  if (!snapshot) {
    throw IndexNotReady("Catalog index is not built yet");
  }

  double recall_sum = 0.0;
  double diversity_sum = 0.0;
  report.min_diversity = 1.0;
  report.max_diversity = 0.0;

  for (const auto& item : labeled) {
    QueryEvaluation eval;
    eval.query = item.query;

    std::set<Category> categories;
    try {
      auto result = engine_.recommend(item.query, static_cast<int>(k));
      for (const auto& record : result.records) {
        eval.predicted_ids.push_back(labelKey(record));
        categories.insert(record.primaryCategory());
      }
    } catch (const InvalidQuery& e) {
      log::warn("Scoring invalid query '" + item.query.substr(0, 50) + "' as 0: " + e.what());
    }

    eval.recall = recallAtK(eval.predicted_ids, item.relevant_ids, k);
    eval.diversity = eval.predicted_ids.empty()
                       ? 0.0
                       : static_cast<double>(categories.size()) / static_cast<double>(eval.predicted_ids.size());

    recall_sum += eval.recall;
    diversity_sum += eval.diversity;
    report.min_diversity = std::min(report.min_diversity, eval.diversity);
    report.max_diversity = std::max(report.max_diversity, eval.diversity);
    report.per_query.push_back(std::move(eval));
  }

  report.mean_recall = recall_sum / static_cast<double>(labeled.size());
  report.mean_diversity = diversity_sum / static_cast<double>(labeled.size());
  return report;
}

std::vector<LabeledQuery> Evaluator::loadLabeledCsv(const std::string& path) {
  auto rows = readCsv(path);

  std::vector<LabeledQuery> labeled;
  std::unordered_map<std::string, size_t> by_query;

  for (size_t i = 1; i < rows.size(); ++i) {
    const auto& row = rows[i];
    if (row.size() < 2 || row[0].empty() || row[1].empty()) {
      continue;
    }
    auto it = by_query.find(row[0]);
    if (it == by_query.end()) {
      it = by_query.emplace(row[0], labeled.size()).first;
      labeled.push_back(LabeledQuery{row[0], {}});
    }
    labeled[it->second].relevant_ids.push_back(row[1]);
  }

  log::info("Loaded " + std::to_string(labeled.size()) + " labeled queries from " + path);
  return labeled;
}

std::vector<std::string> Evaluator::loadQueriesCsv(const std::string& path) {
  auto rows = readCsv(path);

  std::vector<std::string> queries;
  for (size_t i = 1; i < rows.size(); ++i) {
    if (!rows[i].empty() && !rows[i][0].empty()) {
      queries.push_back(rows[i][0]);
    }
  }
  return queries;
}

void Evaluator::writePredictionsCsv(const std::vector<std::string>& queries, size_t k,
                                    const std::string& path) const {
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open predictions file: " + path);
  }

  auto predictions = predict(queries, k);
  size_t rows = 0;

  out << "query,assessment_url\n";
  for (const auto& query : queries) {
    for (const auto& url : predictions[query]) {
      out << csvEscape(query) << "," << csvEscape(url) << "\n";
      ++rows;
    }
  }

  if (!out) {
    throw std::runtime_error("Failed writing predictions file: " + path);
  }
  log::info("Saved " + std::to_string(rows) + " predictions to " + path);
}

void Evaluator::printReport(const EvaluationReport& report, std::ostream& out) {
  const std::string rule(80, '=');
  out << "\n" << rule << "\nEVALUATION REPORT\n" << rule << "\n\n";
  out << std::fixed << std::setprecision(4);
  out << "Mean Recall@" << report.k << ": " << report.mean_recall << "\n";
  out << "Mean diversity: " << report.mean_diversity
      << " (min " << report.min_diversity << ", max " << report.max_diversity << ")\n";
  out << "Number of queries: " << report.per_query.size() << "\n\n";

  if (!report.per_query.empty()) {
    out << "Per-Query Results:\n" << std::string(80, '-') << "\n";
    for (const auto& eval : report.per_query) {
      out << "Query: " << eval.query.substr(0, 60) << (eval.query.size() > 60 ? "..." : "") << "\n";
      out << "  Recall@" << report.k << ": " << eval.recall << "\n\n";
    }
  }
  out << rule << "\n";
}

} // namespace rec
