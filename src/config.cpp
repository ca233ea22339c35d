#include "config.h"
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rec {

namespace {

int parseInt(const std::string& name, const std::string& value) {
  size_t used = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &used);
  } catch (const std::exception&) {
    throw std::invalid_argument("Invalid value for " + name + ": " + value);
  }
  if (used != value.size()) {
    throw std::invalid_argument("Invalid value for " + name + ": " + value);
  }
  return parsed;
}

int parsePositive(const std::string& name, const std::string& value) {
  int parsed = parseInt(name, value);
  if (parsed <= 0) {
    throw std::invalid_argument(name + " must be positive, got " + value);
  }
  return parsed;
}

EmbedderKind parseEmbedder(const std::string& value) {
  if (value == "hash" || value == "hashing") return EmbedderKind::kHashing;
  if (value == "remote") return EmbedderKind::kRemote;
  throw std::invalid_argument("Unknown embedder: " + value + " (expected hash or remote)");
}

LongQueryPolicy parseLongQuery(const std::string& value) {
  if (value == "truncate") return LongQueryPolicy::kTruncate;
  if (value == "reject") return LongQueryPolicy::kReject;
  throw std::invalid_argument("Unknown long query policy: " + value + " (expected truncate or reject)");
}

size_t parseK(const std::string& name, const std::string& value) {
  int k = parseInt(name, value);
  if (k < 1 || static_cast<size_t>(k) > kHardMaxResults) {
    throw std::invalid_argument(name + " must be between 1 and " + std::to_string(kHardMaxResults));
  }
  return static_cast<size_t>(k);
}

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

} // namespace

int ServiceConfig::workerCount() const {
  if (workers > 0) {
    return workers;
  }
  unsigned hw = std::thread::hardware_concurrency();
  return hw < 2 ? 2 : static_cast<int>(hw);
}

void applyConfigFile(ServiceConfig& config, const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::invalid_argument("Cannot open config file: " + path);
  }

  json doc;
  try {
    in >> doc;
  } catch (const json::exception& e) {
    throw std::invalid_argument("Invalid config file " + path + ": " + e.what());
  }
  if (!doc.is_object()) {
    throw std::invalid_argument("Config file must hold a JSON object: " + path);
  }

  // Numbers from the file go through the same checks as the flags
  auto positive = [&doc](const char* key, int current) {
    if (!doc.contains(key)) {
      return current;
    }
    return parsePositive(key, std::to_string(doc[key].get<int64_t>()));
  };

  try {
    config.socket_path = doc.value("socket", config.socket_path);
    config.catalog_path = doc.value("catalog", config.catalog_path);
    config.cache_path = doc.value("cache", config.cache_path);
    if (doc.contains("embedder")) config.embedder = parseEmbedder(doc["embedder"].get<std::string>());
    config.dimension = positive("dimension", config.dimension);
    config.embed_url = doc.value("embed_url", config.embed_url);
    config.embed_model = doc.value("embed_model", config.embed_model);
    config.embed_timeout = std::chrono::milliseconds(positive("embed_timeout_ms", static_cast<int>(config.embed_timeout.count())));
    if (doc.contains("rerank")) config.rerank = doc["rerank"].get<bool>();
    config.rerank_model = doc.value("rerank_model", config.rerank_model);
    config.rerank_timeout = std::chrono::milliseconds(positive("rerank_timeout_ms", static_cast<int>(config.rerank_timeout.count())));
    if (doc.contains("k")) config.engine.default_k = parseK("k", std::to_string(doc["k"].get<int64_t>()));
    if (doc.contains("max_k")) config.engine.max_k = parseK("max_k", std::to_string(doc["max_k"].get<int64_t>()));
    config.engine.max_query_chars = static_cast<size_t>(
      positive("max_query_chars", static_cast<int>(config.engine.max_query_chars)));
    if (doc.contains("long_query")) config.engine.long_query_policy = parseLongQuery(doc["long_query"].get<std::string>());
    config.workers = positive("workers", config.workers);
    config.request_timeout = std::chrono::milliseconds(positive("request_timeout_ms", static_cast<int>(config.request_timeout.count())));
  } catch (const json::exception& e) {
    throw std::invalid_argument("Invalid config file " + path + ": " + e.what());
  }
}

void applyEnvironment(ServiceConfig& config) {
  if (const char* v = env("REC_SOCKET")) config.socket_path = v;
  if (const char* v = env("REC_CATALOG")) config.catalog_path = v;
  if (const char* v = env("REC_CACHE")) config.cache_path = v;
  if (const char* v = env("REC_EMBEDDER")) config.embedder = parseEmbedder(v);
  if (const char* v = env("REC_DIM")) config.dimension = parsePositive("REC_DIM", v);
  if (const char* v = env("REC_EMBED_URL")) config.embed_url = v;
  if (const char* v = env("REC_EMBED_MODEL")) config.embed_model = v;
  if (const char* v = env("REC_EMBED_API_KEY")) config.embed_api_key = v;
  if (const char* v = env("REC_RERANK_MODEL")) config.rerank_model = v;
  if (const char* v = env("GOOGLE_API_KEY")) config.google_api_key = v;
  if (const char* v = env("REC_WORKERS")) config.workers = parsePositive("REC_WORKERS", v);
}

void applyArguments(ServiceConfig& config, int argc, char* argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](const std::string& flag) -> std::string {
      if (i + 1 >= argc) {
        throw std::invalid_argument("Missing value for " + flag);
      }
      return argv[++i];
    };

    if (arg == "--socket") {
      config.socket_path = next(arg);
    } else if (arg == "--catalog") {
      config.catalog_path = next(arg);
    } else if (arg == "--cache") {
      config.cache_path = next(arg);
    } else if (arg == "--embedder") {
      config.embedder = parseEmbedder(next(arg));
    } else if (arg == "--dim") {
      config.dimension = parsePositive(arg, next(arg));
    } else if (arg == "--embed-url") {
      config.embed_url = next(arg);
    } else if (arg == "--embed-model") {
      config.embed_model = next(arg);
    } else if (arg == "--embed-timeout-ms") {
      config.embed_timeout = std::chrono::milliseconds(parsePositive(arg, next(arg)));
    } else if (arg == "--rerank") {
      config.rerank = true;
    } else if (arg == "--no-rerank") {
      config.rerank = false;
    } else if (arg == "--rerank-model") {
      config.rerank_model = next(arg);
    } else if (arg == "--rerank-timeout-ms") {
      config.rerank_timeout = std::chrono::milliseconds(parsePositive(arg, next(arg)));
    } else if (arg == "--k") {
      config.engine.default_k = parseK(arg, next(arg));
    } else if (arg == "--max-k") {
      config.engine.max_k = parseK(arg, next(arg));
    } else if (arg == "--max-query-chars") {
      config.engine.max_query_chars = static_cast<size_t>(parsePositive(arg, next(arg)));
    } else if (arg == "--long-query") {
      config.engine.long_query_policy = parseLongQuery(next(arg));
    } else if (arg == "--workers") {
      config.workers = parsePositive(arg, next(arg));
    } else if (arg == "--request-timeout-ms") {
      config.request_timeout = std::chrono::milliseconds(parsePositive(arg, next(arg)));
    } else if (arg == "--verbose") {
      config.verbose = true;
    } else if (arg == "--help") {
      config.show_help = true;
    } else if (arg == "--config") {
      ++i;  // already applied
    } else {
      throw std::invalid_argument("Unknown option: " + arg);
    }
  }
}

ServiceConfig loadConfig(int argc, char* argv[]) {
  ServiceConfig config;

  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") {
      applyConfigFile(config, argv[i + 1]);
      break;
    }
  }
  applyEnvironment(config);
  applyArguments(config, argc, argv);

  if (config.engine.default_k > config.engine.max_k) {
    config.engine.default_k = config.engine.max_k;
  }
  if (config.embedder == EmbedderKind::kRemote && config.embed_url.empty()) {
    throw std::invalid_argument("--embedder remote requires --embed-url");
  }
  config.engine.rerank_enabled = config.rerankEnabled();
  return config;
}

std::string usage(const char* program) {
  return std::string("Usage: ") + program + " [options]\n" +
         "Options:\n"
         "  --config PATH             JSON config file\n"
         "  --socket PATH             Unix socket to listen on (default: /tmp/recommender.sock)\n"
         "  --catalog PATH            Catalog snapshot JSON (default: data/catalog.json)\n"
         "  --cache PATH              RocksDB embedding cache (default: disabled)\n"
         "  --embedder hash|remote    Embedding provider (default: hash)\n"
         "  --dim N                   Embedding dimension (default: 384)\n"
         "  --embed-url URL           Remote embedding endpoint\n"
         "  --embed-model NAME        Remote embedding model (default: all-MiniLM-L6-v2)\n"
         "  --embed-timeout-ms N      Embedding call timeout (default: 1500)\n"
         "  --rerank / --no-rerank    LLM reranking (default: on when GOOGLE_API_KEY is set)\n"
         "  --rerank-model NAME       Reasoning model (default: gemini-pro)\n"
         "  --rerank-timeout-ms N     Rerank call timeout (default: 4000)\n"
         "  --k N                     Default number of results (default: 10)\n"
         "  --max-k N                 Maximum number of results, at most 10 (default: 10)\n"
         "  --max-query-chars N       Longest accepted query (default: 2000)\n"
         "  --long-query truncate|reject  Policy for longer queries (default: truncate)\n"
         "  --workers N               Request worker threads (default: hardware concurrency)\n"
         "  --request-timeout-ms N    Per-request deadline (default: 10000)\n"
         "  --verbose                 Debug logging\n"
         "  --help                    Show this help\n";
}

} // namespace rec
