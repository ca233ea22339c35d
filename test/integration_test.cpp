#include <iostream>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <cstring>
#include <set>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "embedding_service.h"
#include "embedding_store.h"
#include "evaluator.h"
#include "index_snapshot.h"
#include "recommendation_engine.h"
#include "request_handler.h"
#include "server.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

static int g_failures = 0;

void print_separator() {
  std::cout << std::string(60, '=') << std::endl;
}

void check(bool ok, const std::string& what) {
  std::cout << "  " << (ok ? "✓ " : "✗ ") << what << std::endl;
  if (!ok) {
    ++g_failures;
  }
}

// One request per connection, newline terminated
std::string roundTrip(const std::string& socket_path, const std::string& request) {
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    return "";
  }

  struct sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return "";
  }

  std::string payload = request + "\n";
  if (send(fd, payload.data(), payload.size(), 0) < 0) {
    close(fd);
    return "";
  }

  std::string response;
  char buffer[4096];
  ssize_t n;
  while ((n = recv(fd, buffer, sizeof(buffer), 0)) > 0) {
    response.append(buffer, static_cast<size_t>(n));
  }
  close(fd);
  return response;
}

int main() {
  std::cout << "Recommendation Service Integration Test" << std::endl;
  print_separator();

  // Setup
  std::string work_dir = "/tmp/rec_integration_test_" + std::to_string(
    std::chrono::steady_clock::now().time_since_epoch().count()
  );
  fs::create_directories(work_dir);
  std::string catalog_path = work_dir + "/catalog.json";
  std::string cache_path = work_dir + "/cache";
  std::string socket_path = work_dir + "/rec.sock";

  json catalog = json::array({
    {{"assessment_name", "Core Java (Advanced Level)"}, {"url", "https://catalog.example/core-java-advanced"},
     {"description", "Java programming: collections, concurrency, generics"}, {"test_type", {"K"}},
     {"duration", "30 minutes"}, {"remote_support", "Yes"}, {"adaptive_support", "No"}},
    {{"assessment_name", "Java 8"}, {"url", "https://catalog.example/java-8"},
     {"description", "Java programming language features such as streams and lambdas"}, {"test_type", {"K"}},
     {"duration", 18}, {"remote_support", "Yes"}, {"adaptive_support", "Yes"}},
    {{"assessment_name", "Python (New)"}, {"url", "https://catalog.example/python-new"},
     {"description", "Python programming for data and scripting"}, {"test_type", {"K"}},
     {"duration", 11}, {"remote_support", "Yes"}, {"adaptive_support", "No"}},
    {{"assessment_name", "Interpersonal Communications"}, {"url", "https://catalog.example/interpersonal-communications"},
     {"description", "Communication and teamwork with colleagues and customers"}, {"test_type", {"P"}},
     {"remote_support", "Yes"}, {"adaptive_support", "No"}},
    {{"assessment_name", "Verify Numerical Ability"}, {"url", "https://catalog.example/verify-numerical"},
     {"description", "Numerical reasoning with tables and charts"}, {"test_type", {"A"}},
     {"duration", 20}, {"remote_support", "Yes"}, {"adaptive_support", "Yes"}},
    {{"assessment_name", "Automata Fix"}, {"url", "https://catalog.example/automata-fix"},
     {"description", "Coding simulation: find and fix bugs in Java programs"}, {"test_type", {"S", "K"}},
     {"duration", 20}, {"remote_support", "Yes"}, {"adaptive_support", "No"}},
  });
  {
    std::ofstream out(catalog_path);
    out << catalog.dump(2);
  }

  auto embedder = std::make_shared<rec::HashingEmbeddingService>(256);
  auto store = std::make_shared<rec::EmbeddingStore>(cache_path);
  auto builder = std::make_shared<rec::SnapshotBuilder>(embedder, store);
  auto engine = std::make_shared<rec::RecommendationEngine>(embedder, nullptr);

  std::cout << "✓ Components initialized" << std::endl;
  std::cout << "  Work dir: " << work_dir << std::endl;
  std::cout << "  Model: " << embedder->modelId() << std::endl;
  print_separator();

  // Test 1: Build and publish the index
  std::cout << "\n[Test 1] Building index from catalog snapshot..." << std::endl;
  engine->publish(builder->buildFromFile(catalog_path));
  auto snapshot = engine->snapshot();
  check(snapshot && snapshot->catalog().size() == 6, "6 records indexed");
  check(snapshot && snapshot->hasVectors(), "vector index ready");
  check(store->size() == 6, "embeddings cached");
  print_separator();

  // Test 2: Recommendations through the engine
  std::cout << "\n[Test 2] Recommending for sample queries..." << std::endl;

  struct SampleQuery {
    std::string query;
    int k;
  };

  std::vector<SampleQuery> queries = {
    {"Java developer who collaborates with business teams, communication matters", 4},
    {"Python programming for data scripting", 3},
    {"numerical reasoning", 2},
  };

  for (const auto& sample : queries) {
    std::cout << "\n  Query: \"" << sample.query << "\" (k=" << sample.k << ")" << std::endl;
    auto result = engine->recommend(sample.query, sample.k);

    std::set<std::string> unique;
    for (size_t i = 0; i < result.records.size(); ++i) {
      const auto& record = result.records[i];
      unique.insert(record.id);
      std::cout << "    " << (i + 1) << ". [" << rec::categoryName(record.primaryCategory()) << "] "
                << record.name << std::endl;
    }
    check(!result.records.empty() && result.records.size() <= static_cast<size_t>(sample.k),
          "between 1 and k results");
    check(unique.size() == result.records.size(), "no duplicates");
    check(result.strategy == rec::ScoringStrategy::kVector, "vector strategy");
  }

  auto mixed = engine->recommend(queries[0].query, 4);
  std::set<rec::Category> categories;
  for (const auto& record : mixed.records) {
    categories.insert(record.primaryCategory());
  }
  check(categories.size() >= 2, "mixed query spans several categories");
  print_separator();

  // Test 3: Serve over the Unix socket
  std::cout << "\n[Test 3] Serving requests over " << socket_path << "..." << std::endl;
  auto handler = std::make_shared<rec::RequestHandler>(engine, [builder, catalog_path]() {
    return builder->buildFromFile(catalog_path);
  });
  rec::UnixSocketServer server(socket_path, handler, 2, std::chrono::milliseconds(5000));
  server.start();
  check(server.isRunning(), "server running");

  json health = json::parse(roundTrip(socket_path, R"({"endpoint": "/health"})"), nullptr, false);
  check(!health.is_discarded() && health.value("status", "") == "healthy", "health is healthy");

  json request = {{"endpoint", "/recommend"}, {"params", {{"query", "Java programming"}, {"k", 3}}}};
  json reply = json::parse(roundTrip(socket_path, request.dump()), nullptr, false);
  check(!reply.is_discarded() && reply.value("success", false), "recommend succeeded");
  if (!reply.is_discarded() && reply.contains("recommended_assessments")) {
    for (const auto& item : reply["recommended_assessments"]) {
      std::cout << "    - " << item["name"].get<std::string>() << " (" << item["url"].get<std::string>() << ")"
                << std::endl;
    }
    check(reply["recommended_assessments"].size() == 3, "3 assessments returned");
  }

  json bad = json::parse(roundTrip(socket_path, R"({"endpoint": "/recommend", "params": {"query": ""}})"),
                         nullptr, false);
  check(!bad.is_discarded() && bad.value("code", "") == "invalid_query", "blank query rejected");

  json reload = json::parse(roundTrip(socket_path, R"({"endpoint": "/reload"})"), nullptr, false);
  check(!reload.is_discarded() && reload.value("success", false), "reload published a new snapshot");

  server.stop();
  check(!server.isRunning(), "server stopped");
  print_separator();

  // Test 4: Offline evaluation
  std::cout << "\n[Test 4] Evaluating recall@3..." << std::endl;
  rec::Evaluator evaluator(*engine);
  std::vector<rec::LabeledQuery> labeled = {
    {"Java programming", {"https://catalog.example/core-java-advanced", "https://catalog.example/java-8"}},
    {"Python programming for data scripting", {"https://catalog.example/python-new"}},
  };
  auto report = evaluator.evaluate(labeled, 3);
  rec::Evaluator::printReport(report, std::cout);
  check(report.per_query.size() == 2, "every labeled query scored");
  check(report.mean_recall >= 0.0 && report.mean_recall <= 1.0, "mean recall within [0, 1]");
  print_separator();

  // Cleanup
  std::cout << "\n[Cleanup] Removing work directory..." << std::endl;
  store.reset();
  builder.reset();
  if (fs::exists(work_dir)) {
    fs::remove_all(work_dir);
    std::cout << "  ✓ Work directory removed" << std::endl;
  }

  print_separator();
  if (g_failures > 0) {
    std::cout << "\n✗ " << g_failures << " integration check(s) failed" << std::endl;
    print_separator();
    return 1;
  }
  std::cout << "\n✓ All integration tests completed successfully!" << std::endl;
  print_separator();

  return 0;
}
