#include <gtest/gtest.h>
#include <chrono>
#include "embedding_service.h"
#include "errors.h"
#include "http_client.h"
#include "request_context.h"
#include "test_support.h"

using rec::testing_support::norm;

// Test 1: Hashing embedder properties
TEST(HashingEmbeddingServiceTest, ProducesUnitVectorsOfDeclaredDimension) {
  rec::HashingEmbeddingService embedder(128);
  EXPECT_EQ(embedder.dimension(), 128);
  EXPECT_EQ(embedder.modelId(), "sha256-hashing-128");

  auto v = embedder.embed("Java developer with strong communication skills");
  ASSERT_EQ(v.size(), 128u);
  EXPECT_NEAR(norm(v), 1.0f, 1e-5);
}

TEST(HashingEmbeddingServiceTest, IsDeterministic) {
  rec::HashingEmbeddingService a(64);
  rec::HashingEmbeddingService b(64);
  EXPECT_EQ(a.embed("Core Java Advanced"), b.embed("Core Java Advanced"));
  EXPECT_NE(a.embed("Core Java Advanced"), a.embed("Personality questionnaire"));
}

TEST(HashingEmbeddingServiceTest, CaseAndPunctuationDoNotMatter) {
  rec::HashingEmbeddingService embedder(64);
  EXPECT_EQ(embedder.embed("Java, SQL!"), embedder.embed("java sql"));
}

TEST(HashingEmbeddingServiceTest, EmptyTextIsZeroVector) {
  rec::HashingEmbeddingService embedder(32);
  auto v = embedder.embed("  ... ");
  ASSERT_EQ(v.size(), 32u);
  EXPECT_FLOAT_EQ(norm(v), 0.0f);
}

TEST(HashingEmbeddingServiceTest, SharedWordsRaiseSimilarity) {
  rec::HashingEmbeddingService embedder(384);
  auto query = embedder.embed("java programming");
  auto close = embedder.embed("java programming test");
  auto far = embedder.embed("teamwork communication");

  auto dot = [](const std::vector<float>& x, const std::vector<float>& y) {
    float sum = 0.0f;
    for (size_t i = 0; i < x.size(); ++i) sum += x[i] * y[i];
    return sum;
  };
  EXPECT_GT(dot(query, close), dot(query, far));
}

TEST(HashingEmbeddingServiceTest, RejectsBadDimension) {
  EXPECT_THROW(rec::HashingEmbeddingService embedder(0), std::invalid_argument);
}

// Test 2: Remote response parsing
TEST(RemoteEmbeddingServiceTest, ParsesBothResponseShapes) {
  auto flat = rec::RemoteEmbeddingService::parseResponse(R"({"embedding": [0.5, -0.25, 1]})");
  std::vector<float> expected = {0.5f, -0.25f, 1.0f};
  EXPECT_EQ(flat, expected);

  auto wrapped = rec::RemoteEmbeddingService::parseResponse(
    R"({"object": "list", "data": [{"object": "embedding", "embedding": [0.5, -0.25, 1], "index": 0}]})");
  EXPECT_EQ(wrapped, expected);
}

TEST(RemoteEmbeddingServiceTest, MalformedResponsesAreUnavailable) {
  EXPECT_THROW(rec::RemoteEmbeddingService::parseResponse("<html>"), rec::EmbeddingUnavailable);
  EXPECT_THROW(rec::RemoteEmbeddingService::parseResponse("{}"), rec::EmbeddingUnavailable);
  EXPECT_THROW(rec::RemoteEmbeddingService::parseResponse(R"({"embedding": []})"), rec::EmbeddingUnavailable);
  EXPECT_THROW(rec::RemoteEmbeddingService::parseResponse(R"({"embedding": ["a"]})"), rec::EmbeddingUnavailable);
  EXPECT_THROW(rec::RemoteEmbeddingService::parseResponse(R"({"data": []})"), rec::EmbeddingUnavailable);
}

// Test 3: Transport failures
TEST(RemoteEmbeddingServiceTest, UnreachableEndpointIsUnavailable) {
  rec::CurlGlobal curl;
  // nothing listens on the discard port
  rec::RemoteEmbeddingService embedder("http://127.0.0.1:9/embed", "test-model", 8,
                                       std::chrono::milliseconds(500));
  EXPECT_EQ(embedder.modelId(), "test-model");
  EXPECT_THROW(embedder.embed("java"), rec::EmbeddingUnavailable);
}

TEST(RemoteEmbeddingServiceTest, CancelledContextAbortsCall) {
  rec::CurlGlobal curl;
  rec::RemoteEmbeddingService embedder("http://127.0.0.1:9/embed", "test-model", 8,
                                       std::chrono::milliseconds(500));
  rec::RequestContext context;
  context.cancel();
  EXPECT_THROW(embedder.embed("java", &context), rec::EmbeddingUnavailable);
}

TEST(RemoteEmbeddingServiceTest, RequiresUrl) {
  EXPECT_THROW(rec::RemoteEmbeddingService("", "m", 8, std::chrono::milliseconds(100)), std::invalid_argument);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
