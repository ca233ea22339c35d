#include "config.h"
#include "embedding_service.h"
#include "embedding_store.h"
#include "http_client.h"
#include "index_snapshot.h"
#include "log.h"
#include "recommendation_engine.h"
#include "request_handler.h"
#include "reranker.h"
#include "server.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>

static std::atomic<bool> g_stop{false};

void signalHandler(int) {
  g_stop.store(true);
}

int main(int argc, char* argv[]) {
  rec::ServiceConfig config;
  try {
    config = rec::loadConfig(argc, argv);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n\n" << rec::usage(argv[0]);
    return 2;
  }
  if (config.show_help) {
    std::cout << rec::usage(argv[0]);
    return 0;
  }
  if (config.verbose) {
    rec::log::setLevel(rec::log::Level::kDebug);
  }

  std::cout << "Recommendation service starting...\n"
            << "  Socket: " << config.socket_path << "\n"
            << "  Catalog: " << config.catalog_path << "\n"
            << "  Embedder: " << (config.embedder == rec::EmbedderKind::kRemote ? config.embed_url : "hashing")
            << " (dim " << config.dimension << ")\n"
            << "  Rerank: " << (config.rerankEnabled() ? config.rerank_model : "off") << std::endl;

  try {
    rec::CurlGlobal curl;

    // Initialize components
    std::shared_ptr<rec::EmbeddingService> embedder;
    if (config.embedder == rec::EmbedderKind::kRemote) {
      embedder = std::make_shared<rec::RemoteEmbeddingService>(
        config.embed_url, config.embed_model, config.dimension, config.embed_timeout, config.embed_api_key);
    } else {
      embedder = std::make_shared<rec::HashingEmbeddingService>(config.dimension);
    }

    std::shared_ptr<rec::EmbeddingStore> store;
    if (!config.cache_path.empty()) {
      store = std::make_shared<rec::EmbeddingStore>(config.cache_path);
      size_t purged = store->purgeOtherModels(embedder->modelId());
      rec::log::info("Embedding cache " + config.cache_path + ": " + std::to_string(store->size()) +
                     " entries (" + std::to_string(purged) + " stale removed)");
    }

    std::shared_ptr<rec::Reranker> reranker;
    if (config.rerankEnabled()) {
      if (config.google_api_key.empty()) {
        rec::log::warn("Reranking requested but GOOGLE_API_KEY is not set; continuing without it");
      } else {
        rec::LlmRerankerOptions options;
        options.api_key = config.google_api_key;
        options.model = config.rerank_model;
        options.timeout = config.rerank_timeout;
        reranker = std::make_shared<rec::LlmReranker>(options);
      }
    }

    auto builder = std::make_shared<rec::SnapshotBuilder>(embedder, store);
    auto engine = std::make_shared<rec::RecommendationEngine>(embedder, reranker, config.engine);

    // A dimension mismatch throws here and stops startup
    engine->publish(builder->buildFromFile(config.catalog_path));

    const std::string catalog_path = config.catalog_path;
    auto handler = std::make_shared<rec::RequestHandler>(engine, [builder, catalog_path]() {
      return builder->buildFromFile(catalog_path);
    });

    rec::UnixSocketServer server(config.socket_path, handler, config.workerCount(), config.request_timeout);

    // Set up signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    server.start();

    auto health = engine->health();
    std::cout << "Recommendation service ready. Catalog: " << health.catalog_size
              << " records, vectors: " << (health.vector_index_ready ? "yes" : "no (lexical fallback)")
              << std::endl;

    // Keep main thread alive
    while (server.isRunning() && !g_stop.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutting down..." << std::endl;
    server.stop();

  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
