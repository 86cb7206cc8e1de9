/**
 * @file snapshot_format_test.cpp
 * @brief Unit tests for the V1 snapshot file format
 */

#include "storage/snapshot_format_v1.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>

#include "../support/filing_corpus.h"

namespace finrag::storage::snapshot_v1 {
namespace {

using snapshot_format::CRCErrorType;
using snapshot_format::IntegrityError;
using utils::ErrorCode;

std::string ReadFile(const std::string& path) {
  std::ifstream input(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

void WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
}

class SnapshotFormatTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / ("finrag_snapshot_format_test_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
    path_ = (dir_ / "corpus.snapshot").string();
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  /**
   * @brief Sample chunks with synthetic 4-dimensional embeddings
   */
  static SnapshotPayload MakePayload(bool with_model) {
    SnapshotPayload payload;
    payload.chunks = test_support::SampleFilings();
    for (uint32_t position = 0; position < payload.chunks.size(); ++position) {
      payload.embeddings.push_back({static_cast<float>(position), 1.0F, 0.5F, -0.25F});
      payload.index.Add(position, payload.chunks[position].metadata);
    }
    payload.manifest.dimension = 4;
    payload.manifest.chunk_count = payload.chunks.size();
    payload.manifest.created_at = 1700000000;
    if (with_model) {
      payload.manifest.active_method = "fallback";
      payload.fallback_model = std::string("model-bytes\0with-null", 21);
      payload.manifest.model_fingerprint = CalculateCRC32(payload.fallback_model);
    } else {
      payload.manifest.active_method = "primary";
    }
    return payload;
  }

  std::filesystem::path dir_;
  std::string path_;
};

// ============================================================================
// Round trip
// ============================================================================

TEST_F(SnapshotFormatTest, WriteAndReadPrimary) {
  auto original = MakePayload(false);
  auto written = WriteSnapshotV1(path_, original);
  ASSERT_TRUE(written) << written.error().to_string();

  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded);
  ASSERT_TRUE(read) << read.error().to_string();

  EXPECT_EQ(loaded.manifest.active_method, "primary");
  EXPECT_EQ(loaded.manifest.dimension, 4U);
  EXPECT_EQ(loaded.manifest.chunk_count, 12U);
  EXPECT_EQ(loaded.manifest.created_at, 1700000000U);
  ASSERT_EQ(loaded.chunks.size(), original.chunks.size());
  for (size_t i = 0; i < loaded.chunks.size(); ++i) {
    EXPECT_EQ(loaded.chunks[i].id, original.chunks[i].id);
    EXPECT_EQ(loaded.chunks[i].text, original.chunks[i].text);
    EXPECT_EQ(loaded.chunks[i].metadata.ticker, original.chunks[i].metadata.ticker);
    EXPECT_EQ(loaded.chunks[i].metadata.filing_date, original.chunks[i].metadata.filing_date);
    EXPECT_DOUBLE_EQ(loaded.chunks[i].metadata.quality_score, original.chunks[i].metadata.quality_score);
    EXPECT_EQ(loaded.chunks[i].metadata.extra, original.chunks[i].metadata.extra);
  }
  EXPECT_EQ(loaded.embeddings, original.embeddings);
  EXPECT_EQ(loaded.index.Match({{"ticker", {"TSLA"}}}), original.index.Match({{"ticker", {"TSLA"}}}));
  EXPECT_TRUE(loaded.fallback_model.empty());
}

TEST_F(SnapshotFormatTest, FallbackModelIsStored) {
  auto original = MakePayload(true);
  ASSERT_TRUE(WriteSnapshotV1(path_, original));

  SnapshotPayload loaded;
  ASSERT_TRUE(ReadSnapshotV1(path_, loaded));
  EXPECT_EQ(loaded.fallback_model, original.fallback_model);
  EXPECT_EQ(loaded.manifest.model_fingerprint, original.manifest.model_fingerprint);

  SnapshotInfo info;
  ASSERT_TRUE(GetSnapshotInfo(path_, info));
  EXPECT_EQ(info.version, 1U);
  EXPECT_NE(info.flags & snapshot_format::flags_v1::kWithFallbackModel, 0U);
  EXPECT_NE(info.flags & snapshot_format::flags_v1::kWithCRC, 0U);
  EXPECT_EQ(info.file_size, std::filesystem::file_size(path_));
  EXPECT_EQ(info.timestamp, 1700000000U);
  EXPECT_EQ(info.manifest.active_method, "fallback");
}

TEST_F(SnapshotFormatTest, EmptyStoreSnapshot) {
  SnapshotPayload empty;
  ASSERT_TRUE(WriteSnapshotV1(path_, empty));

  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded);
  ASSERT_TRUE(read) << read.error().to_string();
  EXPECT_TRUE(loaded.chunks.empty());
  EXPECT_TRUE(loaded.manifest.active_method.empty());
}

TEST_F(SnapshotFormatTest, WriteCreatesDirectoryAndLeavesNoTempFile) {
  const std::string nested = (dir_ / "a" / "b" / "corpus.snapshot").string();
  ASSERT_TRUE(WriteSnapshotV1(nested, MakePayload(false)));
  EXPECT_TRUE(std::filesystem::exists(nested));
  EXPECT_FALSE(std::filesystem::exists(nested + ".tmp"));
}

TEST_F(SnapshotFormatTest, OverwriteReplacesPreviousSnapshot) {
  ASSERT_TRUE(WriteSnapshotV1(path_, MakePayload(false)));
  auto smaller = MakePayload(false);
  smaller.chunks.resize(1);
  smaller.embeddings.resize(1);
  smaller.index.Clear();
  smaller.index.Add(0, smaller.chunks[0].metadata);
  smaller.manifest.chunk_count = 1;
  ASSERT_TRUE(WriteSnapshotV1(path_, smaller));

  SnapshotPayload loaded;
  ASSERT_TRUE(ReadSnapshotV1(path_, loaded));
  EXPECT_EQ(loaded.chunks.size(), 1U);
}

// ============================================================================
// Integrity failures
// ============================================================================

TEST_F(SnapshotFormatTest, MissingFile) {
  SnapshotPayload loaded;
  auto read = ReadSnapshotV1((dir_ / "absent.snapshot").string(), loaded);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kSnapshotNotFound);
}

TEST_F(SnapshotFormatTest, TruncatedFile) {
  ASSERT_TRUE(WriteSnapshotV1(path_, MakePayload(false)));
  const std::string contents = ReadFile(path_);
  WriteFile(path_, contents.substr(0, contents.size() - 10));

  IntegrityError integrity;
  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded, &integrity);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kStorageDumpReadError);
  EXPECT_EQ(integrity.type, CRCErrorType::FileCRC);
  EXPECT_TRUE(loaded.chunks.empty());
}

TEST_F(SnapshotFormatTest, FlippedBodyByteFailsCrc) {
  ASSERT_TRUE(WriteSnapshotV1(path_, MakePayload(false)));
  std::string contents = ReadFile(path_);
  contents[contents.size() - 3] = static_cast<char>(contents[contents.size() - 3] ^ 0x5A);
  WriteFile(path_, contents);

  IntegrityError integrity;
  auto verify = VerifySnapshotIntegrity(path_, integrity);
  ASSERT_FALSE(verify);
  EXPECT_EQ(verify.error().code(), ErrorCode::kSnapshotCorrupted);
  EXPECT_TRUE(integrity.HasError());
  EXPECT_EQ(integrity.type, CRCErrorType::FileCRC);

  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kSnapshotCorrupted);
}

TEST_F(SnapshotFormatTest, BadMagic) {
  ASSERT_TRUE(WriteSnapshotV1(path_, MakePayload(false)));
  std::string contents = ReadFile(path_);
  contents[0] = 'X';
  WriteFile(path_, contents);

  IntegrityError integrity;
  auto verify = VerifySnapshotIntegrity(path_, integrity);
  ASSERT_FALSE(verify);
  EXPECT_EQ(verify.error().code(), ErrorCode::kStorageDumpReadError);
}

TEST_F(SnapshotFormatTest, VerifyAcceptsIntactFile) {
  ASSERT_TRUE(WriteSnapshotV1(path_, MakePayload(true)));
  IntegrityError integrity;
  auto verify = VerifySnapshotIntegrity(path_, integrity);
  EXPECT_TRUE(verify) << verify.error().to_string();
  EXPECT_FALSE(integrity.HasError());
}

// ============================================================================
// Cross-section consistency
// ============================================================================

TEST_F(SnapshotFormatTest, ManifestCountMismatch) {
  auto payload = MakePayload(false);
  payload.manifest.chunk_count = 99;
  ASSERT_TRUE(WriteSnapshotV1(path_, payload));

  IntegrityError integrity;
  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded, &integrity);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kSnapshotCorrupted);
  EXPECT_EQ(integrity.type, CRCErrorType::Consistency);
}

TEST_F(SnapshotFormatTest, EmbeddingDimensionMismatch) {
  auto payload = MakePayload(false);
  payload.manifest.dimension = 8;
  ASSERT_TRUE(WriteSnapshotV1(path_, payload));

  IntegrityError integrity;
  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded, &integrity);
  ASSERT_FALSE(read);
  EXPECT_EQ(integrity.type, CRCErrorType::Consistency);
  EXPECT_EQ(integrity.section, snapshot_format::sections::kEmbeddings);
}

TEST_F(SnapshotFormatTest, IndexMustCoverCorpus) {
  auto payload = MakePayload(false);
  payload.index.Clear();
  ASSERT_TRUE(WriteSnapshotV1(path_, payload));

  IntegrityError integrity;
  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded, &integrity);
  ASSERT_FALSE(read);
  EXPECT_EQ(integrity.section, snapshot_format::sections::kMetadataIndex);
}

TEST_F(SnapshotFormatTest, FallbackWithoutModel) {
  auto payload = MakePayload(false);
  payload.manifest.active_method = "fallback";
  ASSERT_TRUE(WriteSnapshotV1(path_, payload));

  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kSnapshotCorrupted);
}

TEST_F(SnapshotFormatTest, UnknownMethod) {
  auto payload = MakePayload(false);
  payload.manifest.active_method = "word2vec";
  ASSERT_TRUE(WriteSnapshotV1(path_, payload));

  SnapshotPayload loaded;
  auto read = ReadSnapshotV1(path_, loaded);
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), ErrorCode::kSnapshotCorrupted);
}

TEST(SnapshotCrcTest, MatchesKnownValue) {
  // Standard CRC-32 check value
  EXPECT_EQ(CalculateCRC32(std::string("123456789")), 0xCBF43926U);
  EXPECT_EQ(CalculateCRC32(std::string()), 0U);
}

}  // namespace
}  // namespace finrag::storage::snapshot_v1
