/**
 * @file ingest_pipeline_test.cpp
 * @brief Unit tests for IngestPipeline
 */

#include "ingest/ingest_pipeline.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>

#include <nlohmann/json.hpp>

#include "../support/fake_primary.h"
#include "../support/filing_corpus.h"

namespace fs = std::filesystem;

namespace finrag::ingest {
namespace {

class IngestPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = test_support::MakeFallbackConfig("ingest");
    fs::remove_all(config_.snapshot.dir);
    fs::create_directories(config_.snapshot.dir);
  }

  void TearDown() override { fs::remove_all(config_.snapshot.dir); }

  /**
   * @brief Write chunks as JSON Lines, optionally followed by one bad line
   */
  std::string WriteChunks(const std::vector<vectors::Chunk>& chunks, bool with_bad_line = false) {
    const std::string path = config_.snapshot.dir + "/chunks.jsonl";
    std::ofstream out(path);
    for (const auto& chunk : chunks) {
      nlohmann::json metadata = {{"ticker", chunk.metadata.ticker},
                                 {"filing_type", chunk.metadata.filing_type},
                                 {"filing_date", chunk.metadata.filing_date},
                                 {"section_type", chunk.metadata.section_type},
                                 {"quality_score", chunk.metadata.quality_score}};
      for (const auto& [key, value] : chunk.metadata.extra) {
        metadata[key] = value;
      }
      out << nlohmann::json{{"id", chunk.id}, {"text", chunk.text}, {"metadata", metadata}}.dump() << "\n";
    }
    if (with_bad_line) {
      out << R"({"id": "orphan", "text": "no metadata"})" << "\n";
    }
    return path;
  }

  config::Config config_;
};

TEST_F(IngestPipelineTest, FirstIngestFitsModel) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  auto report = pipeline.IngestFile(WriteChunks(test_support::SampleFilings(), true));
  ASSERT_TRUE(report) << report.error().to_string();
  EXPECT_TRUE(report->model_fitted);
  EXPECT_TRUE(generator.IsFitted());
  EXPECT_EQ(report->load.lines, 13U);
  EXPECT_EQ(report->load.loaded, 12U);
  EXPECT_EQ(report->load.skipped, 1U);
  EXPECT_EQ(report->store.added, 12U);
  EXPECT_EQ(store.ChunkCount(), 12U);

  auto chunk = store.GetChunk("AAPL-10K-2023-risk");
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(chunk->metadata.extra.at("sector"), "Technology");
}

TEST_F(IngestPipelineTest, LaterIngestReusesModel) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  ASSERT_TRUE(pipeline.IngestChunks(test_support::SampleFilings()));
  const uint32_t fingerprint = generator.ModelFingerprint();

  auto extra = test_support::MakeChunk("JPM-8K-2023-event", "JPM", "8-K", "2023-05-01", "other",
                                       "JPMorgan acquired assets and deposits of a regional bank.");
  auto report = pipeline.IngestChunks({extra});
  ASSERT_TRUE(report) << report.error().to_string();
  EXPECT_FALSE(report->model_fitted);
  EXPECT_EQ(report->store.added, 1U);
  EXPECT_EQ(generator.ModelFingerprint(), fingerprint);
  EXPECT_EQ(store.ChunkCount(), 13U);
}

TEST_F(IngestPipelineTest, DuplicatesAreSkipped) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  ASSERT_TRUE(pipeline.IngestChunks(test_support::SampleFilings()));
  auto report = pipeline.IngestChunks(test_support::SampleFilings());
  ASSERT_TRUE(report) << report.error().to_string();
  EXPECT_EQ(report->store.added, 0U);
  EXPECT_EQ(report->store.skipped_duplicate, 12U);
  EXPECT_EQ(store.ChunkCount(), 12U);
}

TEST_F(IngestPipelineTest, FailedPrimaryEmbeddingsAreSkipped) {
  auto primary = std::make_unique<test_support::FakePrimary>(true, 16);
  primary->fail_containing = "Tesla";
  embeddings::EmbeddingGenerator generator(config_.embedding, std::move(primary));
  ASSERT_EQ(generator.Method(), embeddings::EmbeddingMethod::kPrimary);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  auto report = pipeline.IngestChunks(test_support::SampleFilings());
  ASSERT_TRUE(report) << report.error().to_string();
  EXPECT_FALSE(report->model_fitted);
  EXPECT_EQ(report->store.added, 9U);
  EXPECT_EQ(report->store.skipped_embedding_failed, 3U);
  EXPECT_EQ(report->store.warnings.size(), 3U);
  EXPECT_EQ(store.ChunkCount(), 9U);
  EXPECT_FALSE(store.GetChunk("TSLA-10K-2023-risk").has_value());
  EXPECT_TRUE(store.GetChunk("AAPL-10K-2023-risk").has_value());
}

TEST_F(IngestPipelineTest, EmptyInputIsNoOp) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  auto report = pipeline.IngestChunks({});
  ASSERT_TRUE(report);
  EXPECT_FALSE(report->model_fitted);
  EXPECT_FALSE(generator.IsFitted());
  EXPECT_EQ(store.ChunkCount(), 0U);
}

TEST_F(IngestPipelineTest, MissingFilePropagates) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  IngestPipeline pipeline(generator, store);

  auto report = pipeline.IngestFile(config_.snapshot.dir + "/missing.jsonl");
  ASSERT_FALSE(report);
  EXPECT_EQ(report.error().code(), utils::ErrorCode::kIngestFileNotFound);
}

}  // namespace
}  // namespace finrag::ingest
