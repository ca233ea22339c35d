#include "embedding_service.h"
#include "embedding_store.h"
#include "evaluator.h"
#include "http_client.h"
#include "index_snapshot.h"
#include "log.h"
#include "recommendation_engine.h"
#include "reranker.h"
#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
  std::string catalog_path = "data/catalog.json";
  std::string labels_path;
  std::string queries_path;
  std::string predictions_path = "predictions.csv";
  std::string cache_path;
  std::string embed_url;
  std::string embed_model = "all-MiniLM-L6-v2";
  int dimension = 384;
  int k = 10;
  bool rerank = false;

  // Parse command-line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--catalog" && i + 1 < argc) {
      catalog_path = argv[++i];
    } else if (arg == "--labels" && i + 1 < argc) {
      labels_path = argv[++i];
    } else if (arg == "--predict" && i + 1 < argc) {
      queries_path = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      predictions_path = argv[++i];
    } else if (arg == "--cache" && i + 1 < argc) {
      cache_path = argv[++i];
    } else if (arg == "--embed-url" && i + 1 < argc) {
      embed_url = argv[++i];
    } else if (arg == "--embed-model" && i + 1 < argc) {
      embed_model = argv[++i];
    } else if (arg == "--dim" && i + 1 < argc) {
      dimension = std::atoi(argv[++i]);
    } else if (arg == "--k" && i + 1 < argc) {
      k = std::atoi(argv[++i]);
    } else if (arg == "--rerank") {
      rerank = true;
    } else if (arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [options]\n"
                << "Options:\n"
                << "  --catalog PATH    Catalog snapshot JSON (default: data/catalog.json)\n"
                << "  --labels PATH     Labeled CSV (query,assessment_url) to score\n"
                << "  --predict PATH    CSV of queries to generate predictions for\n"
                << "  --out PATH        Predictions output (default: predictions.csv)\n"
                << "  --cache PATH      RocksDB embedding cache\n"
                << "  --embed-url URL   Remote embedding endpoint (default: local hashing)\n"
                << "  --embed-model M   Remote embedding model\n"
                << "  --dim N           Embedding dimension (default: 384)\n"
                << "  --k N             Results per query (default: 10)\n"
                << "  --rerank          Use the LLM reranker (needs GOOGLE_API_KEY)\n"
                << "  --help            Show this help\n";
      return 0;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return 2;
    }
  }

  if (labels_path.empty() && queries_path.empty()) {
    std::cerr << "Nothing to do: pass --labels and/or --predict" << std::endl;
    return 2;
  }
  if (dimension <= 0 || k < 1 || static_cast<size_t>(k) > rec::kHardMaxResults) {
    std::cerr << "Invalid --dim or --k" << std::endl;
    return 2;
  }

  try {
    rec::CurlGlobal curl;

    std::shared_ptr<rec::EmbeddingService> embedder;
    if (!embed_url.empty()) {
      embedder = std::make_shared<rec::RemoteEmbeddingService>(embed_url, embed_model, dimension,
                                                               std::chrono::milliseconds(5000));
    } else {
      embedder = std::make_shared<rec::HashingEmbeddingService>(dimension);
    }

    std::shared_ptr<rec::EmbeddingStore> store;
    if (!cache_path.empty()) {
      store = std::make_shared<rec::EmbeddingStore>(cache_path);
    }

    std::shared_ptr<rec::Reranker> reranker;
    const char* api_key = std::getenv("GOOGLE_API_KEY");
    if (rerank && api_key && *api_key) {
      rec::LlmRerankerOptions options;
      options.api_key = api_key;
      reranker = std::make_shared<rec::LlmReranker>(options);
    } else if (rerank) {
      rec::log::warn("--rerank given but GOOGLE_API_KEY is not set; evaluating without reranking");
    }

    rec::EngineOptions options;
    options.default_k = static_cast<size_t>(k);
    rec::RecommendationEngine engine(embedder, reranker, options);
    rec::SnapshotBuilder builder(embedder, store);
    engine.publish(builder.buildFromFile(catalog_path));

    rec::Evaluator evaluator(engine);

    if (!labels_path.empty()) {
      auto labeled = rec::Evaluator::loadLabeledCsv(labels_path);
      auto report = evaluator.evaluate(labeled, static_cast<size_t>(k));
      rec::Evaluator::printReport(report, std::cout);
    }

    if (!queries_path.empty()) {
      auto queries = rec::Evaluator::loadQueriesCsv(queries_path);
      evaluator.writePredictionsCsv(queries, static_cast<size_t>(k), predictions_path);
    }

  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
