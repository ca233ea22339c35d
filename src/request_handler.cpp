#include "request_handler.h"
#include "errors.h"
#include "log.h"
#include "recommendation_engine.h"
#include "request_context.h"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace rec {

namespace {

const char* yesNo(bool flag) {
  return flag ? "Yes" : "No";
}

json recordToJson(const CatalogRecord& record) {
  json item;
  item["id"] = record.id;
  item["url"] = record.url;
  item["name"] = record.name;
  item["description"] = record.description;
  if (record.duration_minutes) {
    item["duration"] = *record.duration_minutes;
  } else {
    item["duration"] = nullptr;
  }
  item["adaptive_support"] = yesNo(record.adaptive_support);
  item["remote_support"] = yesNo(record.remote_support);
  item["test_type"] = json::array();
  for (auto category : record.categories) {
    item["test_type"].push_back(categoryName(category));
  }
  return item;
}

json errorResponse(const std::string& message, const char* code) {
  json response;
  response["success"] = false;
  response["error"] = message;
  response["code"] = code;
  return response;
}

} // namespace

RequestHandler::RequestHandler(std::shared_ptr<RecommendationEngine> engine, SnapshotLoader loader)
  : engine_(std::move(engine)), loader_(std::move(loader)) {}

std::string RequestHandler::handle(const std::string& request_json) {
  RequestContext context;
  return handle(request_json, context);
}

std::string RequestHandler::handle(const std::string& request_json, const RequestContext& context) {
  try {
    json request = json::parse(request_json);

    std::string endpoint = request.value("endpoint", "");
    json params = request.value("params", json::object());

    json response;

    if (endpoint == "/recommend") {
      response = handleRecommend(params, context);
    } else if (endpoint == "/health") {
      response = handleHealth();
    } else if (endpoint == "/info") {
      response = handleInfo();
    } else if (endpoint == "/reload") {
      response = handleReload();
    } else {
      response = errorResponse("Unknown endpoint: " + endpoint, "unknown_endpoint");
    }

    return response.dump();

  } catch (const json::exception& e) {
    return errorResponse("JSON parse error: " + std::string(e.what()), "bad_request").dump();
  } catch (const RecommendError& e) {
    return errorResponse(e.what(), errorCodeName(e.code())).dump();
  } catch (const std::exception& e) {
    log::error(std::string("Request failed: ") + e.what());
    return errorResponse("Error: " + std::string(e.what()), "internal").dump();
  }
}

json RequestHandler::handleRecommend(const json& params, const RequestContext& context) {
  if (!params.contains("query") || !params["query"].is_string()) {
    return errorResponse("Missing required field: query", errorCodeName(ErrorCode::kInvalidQuery));
  }
  std::string query = params["query"].get<std::string>();

  std::optional<int> k;
  if (params.contains("k") && !params["k"].is_null()) {
    if (!params["k"].is_number_integer()) {
      return errorResponse("Field k must be an integer", errorCodeName(ErrorCode::kInvalidQuery));
    }
    // Saturate into int range; the engine clamps to [1, max_k]
    const json& value = params["k"];
    if (value.is_number_unsigned()) {
      k = static_cast<int>(std::min<uint64_t>(value.get<uint64_t>(), std::numeric_limits<int>::max()));
    } else {
      int64_t wide = value.get<int64_t>();
      wide = std::max<int64_t>(wide, std::numeric_limits<int>::min());
      wide = std::min<int64_t>(wide, std::numeric_limits<int>::max());
      k = static_cast<int>(wide);
    }
  }

  RecommendationResult result = engine_->recommend(query, k, context);

  json response;
  response["success"] = true;
  response["strategy"] = strategyName(result.strategy);
  response["reranked"] = result.reranked;
  response["query_truncated"] = result.query_truncated;
  response["recommended_assessments"] = json::array();
  for (const auto& record : result.records) {
    response["recommended_assessments"].push_back(recordToJson(record));
  }
  return response;
}

json RequestHandler::handleHealth() {
  HealthStatus health = engine_->health();

  json response;
  response["success"] = true;
  if (!health.ready()) {
    response["status"] = "unavailable";
  } else if (health.degraded()) {
    response["status"] = "degraded";
  } else {
    response["status"] = "healthy";
  }
  response["catalog_loaded"] = health.catalog_loaded;
  response["catalog_size"] = health.catalog_size;
  response["vector_index_ready"] = health.vector_index_ready;
  response["embedding_reachable"] = health.embedding_reachable;
  response["reranker_configured"] = health.reranker_configured;
  response["model"] = health.model_id;
  response["dimension"] = health.dimension;
  if (health.catalog_loaded) {
    response["snapshot_built_at"] = std::chrono::duration_cast<std::chrono::seconds>(
      health.built_at.time_since_epoch()).count();
  } else {
    response["snapshot_built_at"] = nullptr;
  }
  return response;
}

json RequestHandler::handleInfo() {
  json response;
  response["success"] = true;
  response["name"] = "Assessment Recommendation Service";
  response["version"] = "1.0.0";
  response["endpoints"] = {
    {"/health", "Dependency readiness"},
    {"/recommend", "Ranked assessments for a query or job description"},
    {"/info", "Service information"},
    {"/reload", "Rebuild the index from the catalog snapshot"},
  };
  response["recommendation_details"] = {
    {"min_recommendations", 1},
    {"max_recommendations", engine_->options().max_k},
    {"default_recommendations", engine_->options().default_k},
    {"max_query_chars", engine_->options().max_query_chars},
  };
  return response;
}

json RequestHandler::handleReload() {
  if (!loader_) {
    return errorResponse("Reload is not configured", "unsupported");
  }

  auto snapshot = loader_();
  size_t size = snapshot->catalog().size();
  bool vectors = snapshot->hasVectors();
  engine_->publish(std::move(snapshot));
  log::info("Published new index snapshot with " + std::to_string(size) + " records");

  json response;
  response["success"] = true;
  response["catalog_size"] = size;
  response["vector_index_ready"] = vectors;
  return response;
}

} // namespace rec
