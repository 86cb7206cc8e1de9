/**
 * @file snapshot_integration_test.cpp
 * @brief Integration tests for corpus persistence across store and generator restarts
 *
 * Tests:
 * - Round-trip: ingest, save, restart with a fresh generator, query
 * - Lazy restore from the configured snapshot path
 * - Method and model mismatches between snapshot and generator
 * - Corrupted snapshot surfaces on every access
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "../../support/filing_corpus.h"
#include "embeddings/embedding_generator.h"
#include "storage/snapshot_format_v1.h"
#include "vectors/vector_store.h"

namespace fs = std::filesystem;

using namespace finrag;

namespace {

/**
 * @brief Primary backend that always answers with a fixed vector
 */
class ConstantPrimary : public embeddings::PrimaryEmbedder {
 public:
  explicit ConstantPrimary(uint32_t dimension) : dimension_(dimension) {}

  utils::Expected<void, utils::Error> Probe(uint32_t dimension) override {
    if (dimension != dimension_) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kEmbeddingDimensionMismatch, "dimension"));
    }
    return {};
  }

  utils::Expected<std::vector<float>, utils::Error> Embed(const std::string& /*text*/) override {
    return std::vector<float>(dimension_, 1.0F);
  }

  std::string Describe() const override { return "constant://primary"; }

 private:
  uint32_t dimension_;
};

class SnapshotIntegrationTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = test_support::MakeFallbackConfig("snapshot_integration");
    fs::remove_all(config_.snapshot.dir);
    fs::create_directories(config_.snapshot.dir);
  }

  void TearDown() override { fs::remove_all(config_.snapshot.dir); }

  /**
   * @brief Ingest the sample corpus with a fallback generator and save it
   */
  uint32_t SaveSample() {
    embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
    vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
    EXPECT_EQ(test_support::FitAndAdd(generator, store, test_support::SampleFilings()), 12U);
    auto saved = store.Save(config_.SnapshotPath());
    EXPECT_TRUE(saved.has_value()) << saved.error().to_string();
    return generator.ModelFingerprint();
  }

  std::vector<std::string> TopIds(embeddings::EmbeddingGenerator& generator, vectors::VectorStore& store,
                                  const std::string& query) {
    auto embedding = generator.EmbedOne(query);
    EXPECT_TRUE(embedding.has_value());
    vectors::SearchOptions options;
    options.top_k = 5;
    auto response = store.Search(*embedding, query, options);
    EXPECT_TRUE(response.has_value());
    std::vector<std::string> ids;
    if (response) {
      for (const auto& result : response->results) {
        ids.push_back(result.chunk_id);
      }
    }
    return ids;
  }

  config::Config config_;
};

}  // namespace

TEST_F(SnapshotIntegrationTest, RestartServesSameResults) {
  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator, vectors::VectorStore::LoadPolicy::kEmpty);
  ASSERT_EQ(test_support::FitAndAdd(generator, store, test_support::SampleFilings()), 12U);
  const auto before = TopIds(generator, store, "JPMorgan working capital liquidity");
  ASSERT_FALSE(before.empty());
  ASSERT_TRUE(store.Save(config_.SnapshotPath()));

  // Fresh process: unfitted generator, store restored lazily
  embeddings::EmbeddingGenerator restarted_generator(config_.embedding, nullptr);
  vectors::VectorStore restarted_store(config_, &restarted_generator);
  ASSERT_TRUE(restarted_store.EnsureLoaded());
  EXPECT_TRUE(restarted_generator.IsFitted());
  EXPECT_EQ(restarted_store.ChunkCount(), 12U);

  const auto after = TopIds(restarted_generator, restarted_store, "JPMorgan working capital liquidity");
  EXPECT_EQ(before, after);
}

TEST_F(SnapshotIntegrationTest, SnapshotInfoDescribesCorpus) {
  const uint32_t fingerprint = SaveSample();

  storage::snapshot_v1::SnapshotInfo info;
  auto result = storage::snapshot_v1::GetSnapshotInfo(config_.SnapshotPath(), info);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(info.manifest.active_method, "fallback");
  EXPECT_EQ(info.manifest.chunk_count, 12U);
  EXPECT_EQ(info.manifest.dimension, 16U);
  EXPECT_EQ(info.manifest.model_fingerprint, fingerprint);
}

TEST_F(SnapshotIntegrationTest, PrimaryGeneratorRejectsFallbackSnapshot) {
  SaveSample();

  embeddings::EmbeddingGenerator primary(config_.embedding, std::make_unique<ConstantPrimary>(16));
  ASSERT_EQ(primary.Method(), embeddings::EmbeddingMethod::kPrimary);
  vectors::VectorStore store(config_, &primary);
  auto loaded = store.EnsureLoaded();
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kSnapshotMethodMismatch);
}

TEST_F(SnapshotIntegrationTest, DifferentFittedModelIsRejected) {
  SaveSample();

  embeddings::EmbeddingGenerator other(config_.embedding, nullptr);
  ASSERT_TRUE(other.Fit({"completely different corpus about semiconductors", "foundry capacity and wafers"}));
  vectors::VectorStore store(config_, &other, vectors::VectorStore::LoadPolicy::kEmpty);
  auto loaded = store.Load(config_.SnapshotPath());
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kSnapshotModelMismatch);
  EXPECT_EQ(store.ChunkCount(), 0U);
}

TEST_F(SnapshotIntegrationTest, SameFittedModelIsAccepted) {
  SaveSample();

  embeddings::EmbeddingGenerator same(config_.embedding, nullptr);
  ASSERT_TRUE(same.Fit(test_support::TextsOf(test_support::SampleFilings())));
  vectors::VectorStore store(config_, &same, vectors::VectorStore::LoadPolicy::kEmpty);
  auto loaded = store.Load(config_.SnapshotPath());
  ASSERT_TRUE(loaded) << loaded.error().to_string();
  EXPECT_EQ(store.ChunkCount(), 12U);
}

TEST_F(SnapshotIntegrationTest, CorruptedSnapshotFailsEveryAccess) {
  SaveSample();
  {
    std::fstream file(config_.SnapshotPath(), std::ios::in | std::ios::out | std::ios::binary);
    file.seekg(-5, std::ios::end);
    const char original = static_cast<char>(file.get());
    file.seekp(-5, std::ios::end);
    file.put(static_cast<char>(original ^ 0x5A));
  }

  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator);
  auto first = store.EnsureLoaded();
  ASSERT_FALSE(first);
  EXPECT_EQ(first.error().code(), utils::ErrorCode::kSnapshotCorrupted);

  auto second = store.EnsureLoaded();
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code(), utils::ErrorCode::kSnapshotCorrupted);
  EXPECT_EQ(store.ChunkCount(), 0U);
  EXPECT_FALSE(generator.IsFitted());
}

TEST_F(SnapshotIntegrationTest, ExplicitLoadRecoversAfterFailedLazyLoad) {
  SaveSample();
  const std::string good = config_.snapshot.dir + "/good.snapshot";
  fs::copy_file(config_.SnapshotPath(), good);
  {
    std::ofstream file(config_.SnapshotPath(), std::ios::binary | std::ios::trunc);
    file << "garbage";
  }

  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator);
  ASSERT_FALSE(store.EnsureLoaded());

  auto loaded = store.Load(good);
  ASSERT_TRUE(loaded) << loaded.error().to_string();
  EXPECT_TRUE(store.EnsureLoaded());
  EXPECT_EQ(store.ChunkCount(), 12U);
}

TEST_F(SnapshotIntegrationTest, IngestAfterRestoreKeepsModel) {
  SaveSample();

  embeddings::EmbeddingGenerator generator(config_.embedding, nullptr);
  vectors::VectorStore store(config_, &generator);
  ASSERT_TRUE(store.EnsureLoaded());

  auto extra = test_support::MakeChunk("AAPL-10Q-2024-mdna", "AAPL", "10-Q", "2024-02-02", "mdna",
                                       "Apple services revenue reached a record.");
  auto embeddings = generator.EmbedBatch({extra.text});
  ASSERT_TRUE(embeddings);
  auto summary = store.Add({extra}, *embeddings);
  ASSERT_TRUE(summary) << summary.error().to_string();
  EXPECT_EQ(summary->added, 1U);

  ASSERT_TRUE(store.Save(config_.SnapshotPath()));
  storage::snapshot_v1::SnapshotInfo info;
  ASSERT_TRUE(storage::snapshot_v1::GetSnapshotInfo(config_.SnapshotPath(), info));
  EXPECT_EQ(info.manifest.chunk_count, 13U);
  EXPECT_EQ(info.manifest.model_fingerprint, generator.ModelFingerprint());
}
