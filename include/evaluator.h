#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace rec {

class RecommendationEngine;

struct LabeledQuery {
  std::string query;
  std::vector<std::string> relevant_ids;
};

struct QueryEvaluation {
  std::string query;
  std::vector<std::string> predicted_ids;  // URLs, or ids for records without one
  double recall = 0.0;
  double diversity = 0.0;  // distinct primary categories / results
};

struct EvaluationReport {
  size_t k = 0;
  std::vector<QueryEvaluation> per_query;
  double mean_recall = 0.0;
  double mean_diversity = 0.0;
  double min_diversity = 0.0;
  double max_diversity = 0.0;
};

// Offline recall@k evaluation. Runs the engine as a black box and writes
// nothing unless asked to export predictions.
class Evaluator {
public:
  explicit Evaluator(const RecommendationEngine& engine);

  // |top-k predicted ∩ relevant| / |relevant|; 0 when nothing is relevant
  static double recallAtK(const std::vector<std::string>& predicted,
                          const std::vector<std::string>& relevant,
                          size_t k);

  // Queries missing from predictions count as 0
  static double meanRecallAtK(const std::map<std::string, std::vector<std::string>>& predictions,
                              const std::vector<LabeledQuery>& ground_truth,
                              size_t k);

  EvaluationReport evaluate(const std::vector<LabeledQuery>& labeled, size_t k) const;

  // query -> predicted assessment URLs (id when a record has no URL), in
  // the order the engine returned them
  std::map<std::string, std::vector<std::string>> predict(const std::vector<std::string>& queries, size_t k) const;

  // CSV with a header row and columns query,assessment_url; rows sharing a
  // query are grouped in first-seen order
  static std::vector<LabeledQuery> loadLabeledCsv(const std::string& path);

  // First column of a CSV with a header row
  static std::vector<std::string> loadQueriesCsv(const std::string& path);

  // One row per recommendation: query,assessment_url
  void writePredictionsCsv(const std::vector<std::string>& queries, size_t k, const std::string& path) const;

  static void printReport(const EvaluationReport& report, std::ostream& out);

private:
  const RecommendationEngine& engine_;
};

} // namespace rec
