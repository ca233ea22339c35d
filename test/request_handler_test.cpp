#include <gtest/gtest.h>
#include "index_snapshot.h"
#include "recommendation_engine.h"
#include "request_context.h"
#include "request_handler.h"
#include "test_support.h"

using json = nlohmann::json;

class RequestHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    embedder_ = std::make_shared<rec::testing_support::VocabularyEmbedder>(
      rec::testing_support::threeRecordVocabulary());
    engine_ = std::make_shared<rec::RecommendationEngine>(embedder_, nullptr);
    builder_ = std::make_shared<rec::SnapshotBuilder>(embedder_);
    engine_->publish(builder_->build(rec::testing_support::threeRecordCatalog()));

    auto builder = builder_;
    handler_ = std::make_unique<rec::RequestHandler>(engine_, [builder]() {
      auto catalog = rec::testing_support::threeRecordCatalog();
      std::vector<rec::CatalogRecord> records = catalog.records();
      records.push_back(rec::testing_support::makeRecord("D", "Verify numerical reasoning",
                                                         {rec::Category::kAbilityAptitude}));
      return builder->build(rec::Catalog(records));
    });
  }

  json call(const json& request) {
    return json::parse(handler_->handle(request.dump()));
  }

  std::shared_ptr<rec::testing_support::VocabularyEmbedder> embedder_;
  std::shared_ptr<rec::RecommendationEngine> engine_;
  std::shared_ptr<rec::SnapshotBuilder> builder_;
  std::unique_ptr<rec::RequestHandler> handler_;
};

// Test 1: /recommend
TEST_F(RequestHandlerTest, RecommendReturnsAssessments) {
  auto response = call({{"endpoint", "/recommend"},
                        {"params", {{"query", "Java developer with strong communication"}, {"k", 2}}}});

  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["strategy"], "vector");
  EXPECT_FALSE(response["reranked"].get<bool>());
  EXPECT_FALSE(response["query_truncated"].get<bool>());

  const auto& items = response["recommended_assessments"];
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0]["id"], "A");
  EXPECT_EQ(items[0]["name"], "Java programming test");
  EXPECT_EQ(items[0]["url"], "https://catalog.example/A");
  EXPECT_TRUE(items[0]["duration"].is_null());
  EXPECT_EQ(items[0]["adaptive_support"], "No");
  EXPECT_EQ(items[0]["remote_support"], "No");
  ASSERT_EQ(items[0]["test_type"].size(), 1u);
  EXPECT_EQ(items[0]["test_type"][0], "Knowledge & Skills");
  EXPECT_EQ(items[1]["id"], "B");
}

TEST_F(RequestHandlerTest, RecommendUsesDefaultK) {
  auto response = call({{"endpoint", "/recommend"}, {"params", {{"query", "programming"}}}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["recommended_assessments"].size(), 3u);
}

TEST_F(RequestHandlerTest, RecommendReportsLexicalFallback) {
  embedder_->fail = true;
  auto response = call({{"endpoint", "/recommend"}, {"params", {{"query", "java"}, {"k", 1}}}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["strategy"], "lexical");
  EXPECT_EQ(response["recommended_assessments"][0]["id"], "A");
}

TEST_F(RequestHandlerTest, OversizedKIsClampedNotWrapped) {
  auto response = call({{"endpoint", "/recommend"},
                        {"params", {{"query", "programming"}, {"k", 4294967296LL}}}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["recommended_assessments"].size(), 3u);

  response = call({{"endpoint", "/recommend"},
                   {"params", {{"query", "programming"}, {"k", 18446744073709551615ULL}}}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["recommended_assessments"].size(), 3u);

  response = call({{"endpoint", "/recommend"},
                   {"params", {{"query", "programming"}, {"k", -4294967296LL}}}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["recommended_assessments"].size(), 1u);
}

// Test 2: Error envelopes
TEST_F(RequestHandlerTest, MissingOrBlankQueryIsInvalid) {
  auto response = call({{"endpoint", "/recommend"}, {"params", json::object()}});
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "invalid_query");

  response = call({{"endpoint", "/recommend"}, {"params", {{"query", "   "}}}});
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "invalid_query");

  response = call({{"endpoint", "/recommend"}, {"params", {{"query", "java"}, {"k", "three"}}}});
  EXPECT_EQ(response["code"], "invalid_query");
}

TEST_F(RequestHandlerTest, MalformedJsonAndUnknownEndpoint) {
  auto response = json::parse(handler_->handle("{not json"));
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "bad_request");
  EXPECT_NE(response["error"].get<std::string>().find("JSON parse error"), std::string::npos);

  response = call({{"endpoint", "/nope"}});
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["error"], "Unknown endpoint: /nope");
}

TEST_F(RequestHandlerTest, NotReadyBeforePublish) {
  auto engine = std::make_shared<rec::RecommendationEngine>(embedder_, nullptr);
  rec::RequestHandler handler(engine);

  auto response = json::parse(handler.handle(R"({"endpoint": "/recommend", "params": {"query": "java"}})"));
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "not_ready");

  response = json::parse(handler.handle(R"({"endpoint": "/health"})"));
  EXPECT_EQ(response["status"], "unavailable");
  ASSERT_TRUE(response.contains("snapshot_built_at"));
  EXPECT_TRUE(response["snapshot_built_at"].is_null());

  response = json::parse(handler.handle(R"({"endpoint": "/reload"})"));
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "unsupported");
}

TEST_F(RequestHandlerTest, CancelledContextReportsCancelled) {
  rec::RequestContext context;
  context.cancel();
  auto response = json::parse(handler_->handle(
    R"({"endpoint": "/recommend", "params": {"query": "java"}})", context));
  EXPECT_FALSE(response["success"].get<bool>());
  EXPECT_EQ(response["code"], "cancelled");
}

// Test 3: /health and /info
TEST_F(RequestHandlerTest, HealthReflectsDependencies) {
  auto response = call({{"endpoint", "/health"}});
  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["status"], "healthy");
  EXPECT_EQ(response["catalog_size"], 3);
  EXPECT_TRUE(response["vector_index_ready"].get<bool>());
  EXPECT_GT(response["snapshot_built_at"].get<int64_t>(), 0);

  embedder_->fail = true;
  response = call({{"endpoint", "/health"}});
  EXPECT_EQ(response["status"], "degraded");
  EXPECT_FALSE(response["embedding_reachable"].get<bool>());
}

TEST_F(RequestHandlerTest, InfoDescribesLimits) {
  auto response = call({{"endpoint", "/info"}});
  EXPECT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["recommendation_details"]["max_recommendations"], 10);
  EXPECT_TRUE(response["endpoints"].contains("/recommend"));
}

// Test 4: /reload
TEST_F(RequestHandlerTest, ReloadPublishesNewSnapshot) {
  auto response = call({{"endpoint", "/reload"}});
  ASSERT_TRUE(response["success"].get<bool>());
  EXPECT_EQ(response["catalog_size"], 4);
  EXPECT_EQ(engine_->snapshot()->catalog().size(), 4u);
  EXPECT_NE(engine_->snapshot()->catalog().find("D"), nullptr);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
