/**
 * @file retrieval_engine_test.cpp
 * @brief Unit tests for RetrievalEngine strategies
 */

#include "retrieval/retrieval_engine.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "../support/filing_corpus.h"

namespace finrag::retrieval {
namespace {

using vectors::SearchStatus;

class RetrievalEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_ = test_support::MakeFallbackConfig("retrieval");
    std::filesystem::remove_all(config_.snapshot.dir);
    generator_ = std::make_unique<embeddings::EmbeddingGenerator>(config_.embedding, nullptr);
    store_ = std::make_unique<vectors::VectorStore>(config_, generator_.get(),
                                                    vectors::VectorStore::LoadPolicy::kEmpty);
  }

  void LoadSample() {
    ASSERT_EQ(test_support::FitAndAdd(*generator_, *store_, test_support::SampleFilings()), 12U);
  }

  RetrievalResult Run(RetrievalEngine& engine, const std::string& query, const query::QueryContext& context,
                      Strategy strategy) {
    auto vector = generator_->EmbedOne(query);
    EXPECT_TRUE(vector) << vector.error().to_string();
    auto result = engine.Retrieve(*vector, query, context, strategy);
    EXPECT_TRUE(result) << result.error().to_string();
    return result ? *result : RetrievalResult{};
  }

  config::Config config_;
  std::unique_ptr<embeddings::EmbeddingGenerator> generator_;
  std::unique_ptr<vectors::VectorStore> store_;
};

// ============================================================================
// Helpers
// ============================================================================

TEST(RetrievalEngineQuotaTest, PerEntityQuota) {
  EXPECT_EQ(RetrievalEngine::PerEntityQuota(20, 2, 5), 10U);
  EXPECT_EQ(RetrievalEngine::PerEntityQuota(20, 3, 5), 6U);
  EXPECT_EQ(RetrievalEngine::PerEntityQuota(20, 5, 5), 5U);
  EXPECT_EQ(RetrievalEngine::PerEntityQuota(20, 10, 5), 5U);
  EXPECT_EQ(RetrievalEngine::PerEntityQuota(20, 0, 5), 20U);
}

TEST(RetrievalEngineDateRangeTest, NoYears) {
  query::TimePeriods periods;
  periods.quarters = {"Q1"};
  auto range = RetrievalEngine::DateRange(periods);
  EXPECT_TRUE(range.first.empty());
  EXPECT_TRUE(range.second.empty());
}

TEST(RetrievalEngineDateRangeTest, YearsSpanWholeYears) {
  query::TimePeriods periods;
  periods.years = {2021, 2023};
  auto range = RetrievalEngine::DateRange(periods);
  EXPECT_EQ(range.first, "2021-01-01");
  EXPECT_EQ(range.second, "2023-12-31");
}

TEST(RetrievalEngineDateRangeTest, QuartersNarrowSingleYear) {
  query::TimePeriods periods;
  periods.years = {2023};
  periods.quarters = {"Q2", "Q3"};
  auto range = RetrievalEngine::DateRange(periods);
  EXPECT_EQ(range.first, "2023-04-01");
  EXPECT_EQ(range.second, "2023-09-30");

  periods.years = {2022, 2023};
  range = RetrievalEngine::DateRange(periods);
  EXPECT_EQ(range.first, "2022-01-01");
  EXPECT_EQ(range.second, "2023-12-31");
}

// ============================================================================
// Strategies
// ============================================================================

TEST_F(RetrievalEngineTest, EmptyStoreReportsNoData) {
  RetrievalEngine engine(*store_, config_.retrieval);
  embeddings::Embedding zero;
  zero.values.assign(16, 0.0F);

  query::QueryContext context;
  context.tickers = {"AAPL"};
  auto result = engine.Retrieve(zero, "Apple revenue", context, Strategy::kFiltered);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->status, SearchStatus::kNoData);
  EXPECT_FALSE(result->broadened);
  EXPECT_TRUE(result->results.empty());
}

TEST_F(RetrievalEngineTest, FilteredStaysWithinTicker) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"AAPL"};

  auto result = Run(engine, "Apple revenue growth", context, Strategy::kFiltered);
  EXPECT_EQ(result.status, SearchStatus::kOk);
  EXPECT_EQ(result.strategy, Strategy::kFiltered);
  ASSERT_FALSE(result.results.empty());
  for (const auto& hit : result.results) {
    EXPECT_EQ(hit.metadata.ticker, "AAPL");
  }
  EXPECT_EQ(result.per_ticker_counts.size(), 1U);
  EXPECT_EQ(result.per_ticker_counts["AAPL"], result.results.size());
}

TEST_F(RetrievalEngineTest, FilteredAppliesFilingTypes) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"MSFT"};
  context.filing_types = {"10-Q"};

  auto result = Run(engine, "Microsoft quarterly revenue", context, Strategy::kFiltered);
  ASSERT_EQ(result.results.size(), 1U);
  EXPECT_EQ(result.results[0].chunk_id, "MSFT-10Q-2022-mdna");
}

TEST_F(RetrievalEngineTest, MultiEntityConcatenatesInTickerOrder) {
  config_.retrieval.multi_entity_budget = 2;
  config_.retrieval.min_per_entity = 1;
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"AAPL", "MSFT", "TSLA"};

  auto result = Run(engine, "revenue growth risk", context, Strategy::kMultiEntityBalanced);
  ASSERT_EQ(result.results.size(), 3U);
  EXPECT_EQ(result.results[0].metadata.ticker, "AAPL");
  EXPECT_EQ(result.results[1].metadata.ticker, "MSFT");
  EXPECT_EQ(result.results[2].metadata.ticker, "TSLA");
  EXPECT_EQ(result.per_ticker_counts.size(), 3U);
}

TEST_F(RetrievalEngineTest, MultiEntityQuotaBoundsEachTicker) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"AAPL", "MSFT"};

  auto result = Run(engine, "Compare Apple and Microsoft revenue", context, Strategy::kMultiEntityBalanced);
  EXPECT_EQ(result.status, SearchStatus::kOk);
  EXPECT_GT(result.per_ticker_counts["AAPL"], 0U);
  EXPECT_GT(result.per_ticker_counts["MSFT"], 0U);
  EXPECT_LE(result.per_ticker_counts["AAPL"], 10U);

  // Blocks are contiguous
  bool seen_msft = false;
  for (const auto& hit : result.results) {
    if (hit.metadata.ticker == "MSFT") {
      seen_msft = true;
    } else {
      EXPECT_FALSE(seen_msft) << hit.chunk_id;
    }
  }
}

TEST_F(RetrievalEngineTest, MultiEntitySkipsUnknownTicker) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"XOM", "JPM"};

  auto result = Run(engine, "interest rates and working capital", context, Strategy::kMultiEntityBalanced);
  EXPECT_FALSE(result.broadened);
  EXPECT_EQ(result.per_ticker_counts.count("XOM"), 0U);
  EXPECT_GT(result.per_ticker_counts["JPM"], 0U);
}

TEST_F(RetrievalEngineTest, TemporalBoundsDates) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"AAPL"};
  context.time_periods.years = {2023};

  auto result = Run(engine, "Apple revenue 2023", context, Strategy::kTemporal);
  EXPECT_EQ(result.strategy, Strategy::kTemporal);
  ASSERT_FALSE(result.results.empty());
  for (const auto& hit : result.results) {
    EXPECT_EQ(hit.metadata.ticker, "AAPL");
    EXPECT_EQ(hit.metadata.filing_date.substr(0, 4), "2023");
  }
}

TEST_F(RetrievalEngineTest, GeneralRespectsBudget) {
  config_.retrieval.general_budget = 2;
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);

  auto result = Run(engine, "revenue growth", query::QueryContext{}, Strategy::kGeneral);
  EXPECT_EQ(result.results.size(), 2U);
}

TEST_F(RetrievalEngineTest, ConceptsWeightGeneralSearch) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.concepts = {"working_capital"};

  auto result = Run(engine, "working capital changes for financial services companies", context,
                    Strategy::kGeneral);
  ASSERT_FALSE(result.results.empty());
  EXPECT_EQ(result.results[0].metadata.ticker, "JPM");
}

// ============================================================================
// Broadening
// ============================================================================

TEST_F(RetrievalEngineTest, EmptyScopedSearchBroadens) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"NVDA"};

  auto result = Run(engine, "Apple revenue growth", context, Strategy::kFiltered);
  EXPECT_TRUE(result.broadened);
  EXPECT_EQ(result.status, SearchStatus::kOk);
  EXPECT_EQ(result.strategy, Strategy::kFiltered);
  EXPECT_FALSE(result.results.empty());
}

TEST_F(RetrievalEngineTest, BroadeningCanBeDisabled) {
  config_.retrieval.broaden_on_empty = false;
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  query::QueryContext context;
  context.tickers = {"NVDA"};

  auto result = Run(engine, "Apple revenue growth", context, Strategy::kFiltered);
  EXPECT_FALSE(result.broadened);
  EXPECT_EQ(result.status, SearchStatus::kNoMatches);
  EXPECT_TRUE(result.results.empty());
}

TEST_F(RetrievalEngineTest, DegradedQueryIsReported) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  embeddings::Embedding zero;
  zero.values.assign(16, 0.0F);
  zero.degraded = true;

  auto result = engine.Retrieve(zero, "JPMorgan working capital", query::QueryContext{}, Strategy::kGeneral);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_TRUE(result->degraded);
  ASSERT_FALSE(result->results.empty());
  EXPECT_EQ(result->results[0].metadata.ticker, "JPM");
}

TEST_F(RetrievalEngineTest, MismatchedQueryVectorFails) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  embeddings::Embedding wrong;
  wrong.values.assign(8, 0.0F);

  auto result = engine.Retrieve(wrong, "revenue", query::QueryContext{}, Strategy::kGeneral);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kVectorDimensionMismatch);
}

// ============================================================================
// Section search
// ============================================================================

TEST_F(RetrievalEngineTest, SectionSearchKeepsMatchingText) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  auto vector = generator_->EmbedOne("supply chain");
  ASSERT_TRUE(vector);

  auto result = engine.SearchBySection(*vector, "supply chain", {"Risk Factors"}, 10);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->status, SearchStatus::kOk);
  ASSERT_FALSE(result->results.empty());
  EXPECT_LE(result->results.size(), 4U);
  bool found_apple = false;
  for (const auto& hit : result->results) {
    EXPECT_NE(hit.text.find("risk factors"), std::string::npos) << hit.chunk_id;
    found_apple = found_apple || hit.chunk_id == "AAPL-10K-2023-risk";
  }
  EXPECT_TRUE(found_apple);

  auto limited = engine.SearchBySection(*vector, "supply chain", {"risk factors"}, 1);
  ASSERT_TRUE(limited);
  EXPECT_EQ(limited->results.size(), 1U);
}

TEST_F(RetrievalEngineTest, SectionSearchWithoutMatchingText) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  auto vector = generator_->EmbedOne("revenue");
  ASSERT_TRUE(vector);

  auto result = engine.SearchBySection(*vector, "revenue", {"goodwill impairment"}, 10);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->status, SearchStatus::kNoMatches);
  EXPECT_TRUE(result->results.empty());
}

TEST_F(RetrievalEngineTest, SectionSearchNeedsKeywords) {
  LoadSample();
  RetrievalEngine engine(*store_, config_.retrieval);
  auto vector = generator_->EmbedOne("revenue");
  ASSERT_TRUE(vector);

  auto result = engine.SearchBySection(*vector, "revenue", {"  "}, 10);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), utils::ErrorCode::kInvalidArgument);
}

}  // namespace
}  // namespace finrag::retrieval
