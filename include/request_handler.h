#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace rec {

class IndexSnapshot;
class RecommendationEngine;
class RequestContext;

// JSON request envelope: {"endpoint": "/recommend", "params": {...}}
class RequestHandler {
public:
  using SnapshotLoader = std::function<std::shared_ptr<const IndexSnapshot>()>;

  // loader rebuilds the snapshot for /reload; may be empty
  RequestHandler(std::shared_ptr<RecommendationEngine> engine, SnapshotLoader loader = nullptr);

  std::string handle(const std::string& request_json);
  std::string handle(const std::string& request_json, const RequestContext& context);

private:
  nlohmann::json handleRecommend(const nlohmann::json& params, const RequestContext& context);
  nlohmann::json handleHealth();
  nlohmann::json handleInfo();
  nlohmann::json handleReload();

  std::shared_ptr<RecommendationEngine> engine_;
  SnapshotLoader loader_;
};

} // namespace rec
