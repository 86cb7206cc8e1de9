/**
 * @file metadata_index_test.cpp
 * @brief Unit tests for MetadataIndex
 */

#include "vectors/metadata_index.h"

#include <gtest/gtest.h>

#include <sstream>

#include "../support/filing_corpus.h"

namespace finrag::vectors {
namespace {

class MetadataIndexTest : public ::testing::Test {
 protected:
  void SetUp() override {
    corpus_ = test_support::SampleFilings();
    for (uint32_t position = 0; position < corpus_.size(); ++position) {
      index_.Add(position, corpus_[position].metadata);
    }
  }

  std::vector<Chunk> corpus_;
  MetadataIndex index_;
};

TEST_F(MetadataIndexTest, SingleValue) {
  auto matches = index_.Match({{"ticker", {"AAPL"}}});
  EXPECT_EQ(matches, (MetadataIndex::Postings{0, 1, 2}));
}

TEST_F(MetadataIndexTest, ValuesOfOneFieldAreOred) {
  auto matches = index_.Match({{"ticker", {"AAPL", "JPM"}}});
  EXPECT_EQ(matches, (MetadataIndex::Postings{0, 1, 2, 9, 10, 11}));
}

TEST_F(MetadataIndexTest, FieldsAreAnded) {
  auto matches = index_.Match({{"ticker", {"MSFT", "TSLA"}}, {"section_type", {"risk_factors"}}});
  EXPECT_EQ(matches, (MetadataIndex::Postings{4, 6}));

  auto quarterly = index_.Match({{"filing_type", {"10-Q"}}, {"section_type", {"mdna"}}});
  EXPECT_EQ(quarterly, (MetadataIndex::Postings{5, 11}));
}

TEST_F(MetadataIndexTest, ExtraFieldsAreIndexed) {
  auto matches = index_.Match({{"sector", {"Technology"}}});
  EXPECT_EQ(matches, (MetadataIndex::Postings{0, 3}));
  EXPECT_TRUE(index_.HasField("sector"));
}

TEST_F(MetadataIndexTest, UnknownFieldOrValueMatchesNothing) {
  EXPECT_TRUE(index_.Match({{"exchange", {"NASDAQ"}}}).empty());
  EXPECT_TRUE(index_.Match({{"ticker", {"NVDA"}}}).empty());
  EXPECT_TRUE(index_.Match({{"ticker", {"AAPL"}}, {"filing_type", {"8-K"}}}).empty());
}

TEST_F(MetadataIndexTest, ValuesAndCounts) {
  EXPECT_EQ(index_.Values("ticker"), (std::vector<std::string>{"AAPL", "JPM", "MSFT", "TSLA"}));
  EXPECT_EQ(index_.Values("filing_type"), (std::vector<std::string>{"10-K", "10-Q", "8-K"}));
  EXPECT_TRUE(index_.Values("missing").empty());
  EXPECT_EQ(index_.Count("ticker", "TSLA"), 3U);
  EXPECT_EQ(index_.Count("filing_type", "10-K"), 9U);
  EXPECT_EQ(index_.Count("ticker", "NVDA"), 0U);
}

TEST_F(MetadataIndexTest, VerifyAcceptsMatchingCorpus) {
  auto result = index_.Verify(corpus_);
  EXPECT_TRUE(result) << result.error().to_string();
}

TEST_F(MetadataIndexTest, VerifyRejectsMissingChunk) {
  auto extended = corpus_;
  extended.push_back(test_support::MakeChunk("NVDA-10K-2023-mdna", "NVDA", "10-K", "2023-02-24", "mdna",
                                             "Data center revenue grew."));
  auto result = index_.Verify(extended);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kSnapshotCorrupted);
}

TEST_F(MetadataIndexTest, VerifyRejectsExtraPostings) {
  std::vector<Chunk> shorter(corpus_.begin(), corpus_.end() - 1);
  auto result = index_.Verify(shorter);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kSnapshotCorrupted);
}

TEST_F(MetadataIndexTest, SerializeRoundTrip) {
  std::stringstream stream;
  ASSERT_TRUE(index_.Serialize(stream));

  MetadataIndex restored;
  auto result = restored.Deserialize(stream);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_TRUE(restored.Verify(corpus_));
  EXPECT_EQ(restored.Match({{"ticker", {"JPM"}}}), index_.Match({{"ticker", {"JPM"}}}));
}

TEST_F(MetadataIndexTest, DeserializeTruncated) {
  std::stringstream full;
  ASSERT_TRUE(index_.Serialize(full));
  const std::string bytes = full.str();

  std::stringstream truncated(bytes.substr(0, bytes.size() / 2));
  MetadataIndex restored;
  auto result = restored.Deserialize(truncated);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kStorageDumpReadError);
}

TEST_F(MetadataIndexTest, Clear) {
  index_.Clear();
  EXPECT_EQ(index_.FieldCount(), 0U);
  EXPECT_TRUE(index_.Match({{"ticker", {"AAPL"}}}).empty());
}

}  // namespace
}  // namespace finrag::vectors
