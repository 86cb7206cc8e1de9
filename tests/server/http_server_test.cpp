/**
 * @file http_server_test.cpp
 * @brief Unit tests for HTTP server
 *
 * Tests HTTP endpoints:
 * - Health endpoints
 * - Info endpoint
 * - Retrieval endpoints (/query, /search, /similar, /chunks/:id)
 * - Error statuses
 */

#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "../support/filing_corpus.h"
#include "config/config.h"
#include "embeddings/embedding_generator.h"
#include "query/entity_extractor.h"
#include "query/query_router.h"
#include "retrieval/retrieval_engine.h"
#include "server/http_server.h"
#include "server/server_types.h"
#include "vectors/vector_store.h"

using json = nlohmann::json;
using namespace finrag;

namespace {

constexpr int kTestPort = 18081;

/**
 * @brief Components of one finragd instance, wired the way main() wires them
 */
struct Stack {
  explicit Stack(const config::Config& cfg, vectors::VectorStore::LoadPolicy policy)
      : config(cfg),
        generator(config.embedding, nullptr),
        store(config, &generator, policy),
        engine(store, config.retrieval),
        extractor(config.entities),
        router(extractor, &engine, &generator) {
    context.config = &config;
    context.generator = &generator;
    context.store = &store;
    context.engine = &engine;
    context.router = &router;
  }

  config::Config config;
  embeddings::EmbeddingGenerator generator;
  vectors::VectorStore store;
  retrieval::RetrievalEngine engine;
  query::EntityExtractor extractor;
  query::QueryRouter router;
  server::HandlerContext context;
};

// Test fixture with HTTP server and components
class HttpServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto cfg = test_support::MakeFallbackConfig("http_server");
    std::filesystem::remove_all(cfg.snapshot.dir);
    stack_ = std::make_unique<Stack>(cfg, vectors::VectorStore::LoadPolicy::kEmpty);
    ASSERT_EQ(test_support::FitAndAdd(stack_->generator, stack_->store, test_support::SampleFilings()), 12U);

    server::HttpServerConfig http_config;
    http_config.bind = "127.0.0.1";
    http_config.port = kTestPort;
    http_server_ = std::make_unique<server::HttpServer>(http_config, &stack_->context);

    auto result = http_server_->Start();
    ASSERT_TRUE(result) << "Failed to start HTTP server: " << result.error().message();

    client_ = std::make_unique<httplib::Client>("127.0.0.1", kTestPort);
  }

  void TearDown() override {
    client_.reset();
    if (http_server_) {
      http_server_->Stop();
    }
    if (stack_) {
      std::filesystem::remove_all(stack_->config.snapshot.dir);
    }
  }

  httplib::Result PostJson(const std::string& path, const json& body) {
    return client_->Post(path.c_str(), body.dump(), "application/json");
  }

  std::unique_ptr<Stack> stack_;
  std::unique_ptr<server::HttpServer> http_server_;
  std::unique_ptr<httplib::Client> client_;
};

}  // namespace

// ============================================================================
// Health
// ============================================================================

TEST_F(HttpServerTest, Health) {
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_TRUE(body.contains("timestamp"));
}

TEST_F(HttpServerTest, HealthLive) {
  auto res = client_->Get("/health/live");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(json::parse(res->body)["status"], "alive");
}

TEST_F(HttpServerTest, HealthReady) {
  auto res = client_->Get("/health/ready");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ready");
  EXPECT_EQ(body["chunks"], 12);
}

// ============================================================================
// Info
// ============================================================================

TEST_F(HttpServerTest, Info) {
  auto res = client_->Get("/info");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["server"], "finragd");
  EXPECT_TRUE(body.contains("version"));
  EXPECT_TRUE(body.contains("memory"));
  EXPECT_EQ(body["collection"]["total_chunks"], 12);
  EXPECT_EQ(body["collection"]["active_method"], "fallback");
  EXPECT_EQ(body["embedding"]["method"], "fallback");
  EXPECT_EQ(body["embedding"]["fitted"], true);
  EXPECT_EQ(body["requests"]["info"], 1);
}

// ============================================================================
// Query
// ============================================================================

TEST_F(HttpServerTest, QueryRoutesComparison) {
  auto res = PostJson("/query", {{"query", "Compare Apple and Microsoft revenue"}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["strategy"], "multi_entity_balanced");
  EXPECT_EQ(body["routing"]["query_type"], "multi_company");
  EXPECT_EQ(body["routing"]["context"]["tickers"], json::array({"AAPL", "MSFT"}));
  EXPECT_TRUE(body["per_ticker_counts"].contains("AAPL"));
  EXPECT_TRUE(body["per_ticker_counts"].contains("MSFT"));
  ASSERT_FALSE(body["results"].empty());
  EXPECT_TRUE(body["results"][0].contains("chunk_id"));
  EXPECT_TRUE(body["results"][0]["metadata"].contains("filing_date"));
  EXPECT_EQ(http_server_->GetStats().query_requests.load(), 1U);
}

TEST_F(HttpServerTest, QueryReportsBroadening) {
  auto res = PostJson("/query", {{"query", "Boeing stock revenue growth"}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  auto body = json::parse(res->body);
  EXPECT_EQ(body["routing"]["query_type"], "single_company");
  EXPECT_EQ(body["broadened"], true);
  EXPECT_FALSE(body["results"].empty());
  EXPECT_EQ(http_server_->GetStats().broadened_queries.load(), 1U);
}

TEST_F(HttpServerTest, QueryMissingField) {
  auto res = PostJson("/query", {{"text", "Apple"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_TRUE(json::parse(res->body).contains("error"));
}

TEST_F(HttpServerTest, QueryInvalidJson) {
  auto res = client_->Post("/query", "{not json", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(http_server_->GetStats().failed_requests.load(), 1U);
}

// ============================================================================
// Search
// ============================================================================

TEST_F(HttpServerTest, SearchWithFilter) {
  auto res = PostJson("/search", {{"query", "risk factors"}, {"filter", {{"ticker", "JPM"}}}, {"top_k", 5}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  EXPECT_EQ(body["candidate_count"], 3);
  for (const auto& hit : body["results"]) {
    EXPECT_EQ(hit["metadata"]["ticker"], "JPM");
  }
}

TEST_F(HttpServerTest, SearchNoMatches) {
  auto res = PostJson("/search", {{"query", "revenue"}, {"filter", {{"ticker", {"NVDA"}}}}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(json::parse(res->body)["status"], "no_matches");
}

TEST_F(HttpServerTest, SearchBadFilterShape) {
  auto res = PostJson("/search", {{"query", "revenue"}, {"filter", {{"ticker", 42}}}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
}

TEST_F(HttpServerTest, SearchNonStringDateIsBadRequest) {
  auto res = PostJson("/search", {{"query", "revenue"}, {"date_from", 2023}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400) << res->body;
  EXPECT_NE(json::parse(res->body)["error"].get<std::string>().find("date_from"), std::string::npos);

  auto flag = PostJson("/search", {{"query", "revenue"}, {"apply_threshold", "no"}});
  ASSERT_TRUE(flag);
  EXPECT_EQ(flag->status, 400);
  EXPECT_EQ(http_server_->GetStats().failed_requests.load(), 2U);
}

TEST_F(HttpServerTest, SearchDateRange) {
  auto res = PostJson("/search", {{"query", "revenue"}, {"date_from", "2023-01-01"}, {"date_to", "2023-12-31"}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  for (const auto& hit : json::parse(res->body)["results"]) {
    EXPECT_EQ(hit["metadata"]["filing_date"].get<std::string>().substr(0, 4), "2023");
  }
}

TEST_F(HttpServerTest, SectionSearch) {
  auto res = PostJson("/sections", {{"query", "supply chain"}, {"keywords", {"risk factors"}}, {"top_k", 3}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  auto body = json::parse(res->body);
  EXPECT_EQ(body["status"], "ok");
  ASSERT_FALSE(body["results"].empty());
  EXPECT_LE(body["results"].size(), 3U);
  for (const auto& hit : body["results"]) {
    EXPECT_EQ(hit["metadata"]["section_type"], "risk_factors");
  }
}

TEST_F(HttpServerTest, SectionSearchBadKeywords) {
  auto missing = PostJson("/sections", {{"query", "supply chain"}});
  ASSERT_TRUE(missing);
  EXPECT_EQ(missing->status, 400);

  auto wrong_type = PostJson("/sections", {{"query", "supply chain"}, {"keywords", {1, 2}}});
  ASSERT_TRUE(wrong_type);
  EXPECT_EQ(wrong_type->status, 400);
}

// ============================================================================
// Chunks and similarity
// ============================================================================

TEST_F(HttpServerTest, GetChunk) {
  auto res = client_->Get("/chunks/MSFT-10K-2023-risk");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);

  auto body = json::parse(res->body);
  EXPECT_EQ(body["id"], "MSFT-10K-2023-risk");
  EXPECT_EQ(body["metadata"]["section_type"], "risk_factors");
}

TEST_F(HttpServerTest, GetChunkNotFound) {
  auto res = client_->Get("/chunks/NOPE");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

TEST_F(HttpServerTest, Similar) {
  auto res = PostJson("/similar", {{"chunk_id", "AAPL-10K-2023-mdna"}, {"top_k", 3}});
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;

  auto body = json::parse(res->body);
  EXPECT_LE(body["count"].get<int>(), 3);
  for (const auto& hit : body["results"]) {
    EXPECT_NE(hit["chunk_id"], "AAPL-10K-2023-mdna");
  }
}

TEST_F(HttpServerTest, SimilarUnknownChunk) {
  auto res = PostJson("/similar", {{"chunk_id", "NOPE"}});
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(HttpServerTest, StartTwiceFails) {
  auto result = http_server_->Start();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kNetworkAlreadyRunning);
}

TEST(HttpServerStandaloneTest, EmptyCorpusSearchReportsNoData) {
  auto cfg = test_support::MakeFallbackConfig("http_server_empty");
  std::filesystem::remove_all(cfg.snapshot.dir);
  Stack stack(cfg, vectors::VectorStore::LoadPolicy::kLazySnapshot);

  server::HttpServerConfig http_config;
  http_config.port = kTestPort + 1;
  server::HttpServer http_server(http_config, &stack.context);
  ASSERT_TRUE(http_server.Start());

  httplib::Client client("127.0.0.1", kTestPort + 1);
  auto search = client.Post("/search", R"({"query": "revenue"})", "application/json");
  ASSERT_TRUE(search);
  EXPECT_EQ(search->status, 200);
  EXPECT_EQ(json::parse(search->body)["status"], "no_data");

  auto query = client.Post("/query", R"({"query": "Apple revenue"})", "application/json");
  ASSERT_TRUE(query);
  EXPECT_EQ(query->status, 200);
  EXPECT_EQ(json::parse(query->body)["status"], "no_data");

  http_server.Stop();
}

TEST(HttpServerStandaloneTest, CorruptedSnapshotIsNotReady) {
  auto cfg = test_support::MakeFallbackConfig("http_server_corrupt");
  std::filesystem::remove_all(cfg.snapshot.dir);
  std::filesystem::create_directories(cfg.snapshot.dir);
  {
    std::ofstream out(cfg.SnapshotPath(), std::ios::binary);
    out << "FRAG but not really a snapshot";
  }
  Stack stack(cfg, vectors::VectorStore::LoadPolicy::kLazySnapshot);

  server::HttpServerConfig http_config;
  http_config.port = kTestPort + 2;
  http_config.enable_cors = true;
  http_config.cors_allow_origin = "https://example.test";
  server::HttpServer http_server(http_config, &stack.context);
  ASSERT_TRUE(http_server.Start());

  httplib::Client client("127.0.0.1", kTestPort + 2);
  auto ready = client.Get("/health/ready");
  ASSERT_TRUE(ready);
  EXPECT_EQ(ready->status, 503);
  EXPECT_EQ(json::parse(ready->body)["status"], "not_ready");
  EXPECT_EQ(ready->get_header_value("Access-Control-Allow-Origin"), "https://example.test");

  auto query = client.Post("/query", R"({"query": "Apple revenue"})", "application/json");
  ASSERT_TRUE(query);
  EXPECT_EQ(query->status, 503);

  http_server.Stop();
  std::filesystem::remove_all(cfg.snapshot.dir);
}
