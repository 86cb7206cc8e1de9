/**
 * @file entity_extractor_test.cpp
 * @brief Unit tests for entity extraction and the company registry
 */

#include "query/entity_extractor.h"

#include <gtest/gtest.h>

#include <algorithm>

namespace finrag::query {
namespace {

using Tickers = std::vector<std::string>;

class EntityExtractorTest : public ::testing::Test {
 protected:
  EntityExtractor extractor_;
};

// ============================================================================
// Companies
// ============================================================================

TEST_F(EntityExtractorTest, NoCompanyInConceptQuery) {
  auto context = extractor_.Extract("working capital changes for financial services companies");
  EXPECT_TRUE(context.tickers.empty());
  EXPECT_EQ(context.concepts, (std::vector<std::string>{"working_capital"}));
  EXPECT_FALSE(context.comparison_cue);
}

TEST_F(EntityExtractorTest, PossessiveCompanyName) {
  auto context = extractor_.Extract("Apple's risk factors");
  EXPECT_EQ(context.tickers, Tickers{"AAPL"});
  EXPECT_EQ(context.concepts, (std::vector<std::string>{"risk_factors"}));
  EXPECT_EQ(context.original_query, "Apple's risk factors");
}

TEST_F(EntityExtractorTest, TickersInOrderOfFirstMention) {
  auto context = extractor_.Extract("Microsoft versus AAPL and jpmorgan");
  EXPECT_EQ(context.tickers, (Tickers{"MSFT", "AAPL", "JPM"}));
}

TEST_F(EntityExtractorTest, SymbolAndNameAreMerged) {
  auto context = extractor_.Extract("Apple (AAPL) services revenue");
  EXPECT_EQ(context.tickers, Tickers{"AAPL"});
}

TEST_F(EntityExtractorTest, MultiWordAliases) {
  EXPECT_EQ(extractor_.Extract("Bank of America deposits").tickers, Tickers{"BAC"});
  EXPECT_EQ(extractor_.Extract("what did JP Morgan say").tickers, Tickers{"JPM"});
  EXPECT_EQ(extractor_.Extract("Johnson and Johnson litigation").tickers, Tickers{"JNJ"});
}

TEST_F(EntityExtractorTest, TickersAreCaseSensitiveAndWordBounded) {
  EXPECT_TRUE(extractor_.Extract("aapl and msft").tickers.empty());
  EXPECT_TRUE(extractor_.Extract("MSFTX and AAPL2 codes").tickers.empty());
  EXPECT_EQ(extractor_.Extract("BAC credit losses").tickers, Tickers{"BAC"});
}

TEST_F(EntityExtractorTest, ShortTickerNeedsCompanyCue) {
  EXPECT_TRUE(extractor_.Extract("What did BA report").tickers.empty());
  EXPECT_EQ(extractor_.Extract("BA stock performance").tickers, Tickers{"BA"});
  EXPECT_EQ(extractor_.Extract("Risks for $BA").tickers, Tickers{"BA"});
  EXPECT_EQ(extractor_.Extract("NYSE: BA deliveries").tickers, Tickers{"BA"});
  EXPECT_EQ(extractor_.Extract("The GE 10-K").tickers, Tickers{"GE"});
}

TEST_F(EntityExtractorTest, CommonWordTickerNeedsCompanyCue) {
  EXPECT_TRUE(extractor_.Extract("The CAT sat on the balance sheet").tickers.empty());
  EXPECT_EQ(extractor_.Extract("CAT shares fell").tickers, Tickers{"CAT"});
  EXPECT_EQ(extractor_.Extract("Caterpillar, ticker CAT").tickers, Tickers{"CAT"});
}

TEST_F(EntityExtractorTest, ComparisonWordIsCompanyCue) {
  auto context = extractor_.Extract("Compare GE and Boeing revenue");
  EXPECT_EQ(context.tickers, (Tickers{"GE", "BA"}));
  EXPECT_TRUE(context.comparison_intent);
  EXPECT_EQ(extractor_.Extract("BA versus Caterpillar").tickers, (Tickers{"BA", "CAT"}));
  EXPECT_TRUE(extractor_.Extract("Compare it to GE").tickers.empty());
}

TEST_F(EntityExtractorTest, AliasMentionAndGuardedTickerMerge) {
  auto context = extractor_.Extract("Boeing: is BA still delivering?");
  EXPECT_EQ(context.tickers, Tickers{"BA"});
}

TEST_F(EntityExtractorTest, ConfiguredCompaniesReplaceBuiltins) {
  config::EntitiesConfig config;
  config.companies.push_back({"TSLA", "Tesla, Inc.", "Automotive", {"tesla"}});
  EntityExtractor custom(config);

  EXPECT_EQ(custom.Extract("Tesla battery supply").tickers, Tickers{"TSLA"});
  EXPECT_EQ(custom.Extract("TSLA deliveries").tickers, Tickers{"TSLA"});
  EXPECT_TRUE(custom.Extract("Apple revenue").tickers.empty());
}

// ============================================================================
// Time periods
// ============================================================================

TEST_F(EntityExtractorTest, YearsWithinRange) {
  auto context = extractor_.Extract("from 2023 back to 2019, not 1850 or 2099");
  EXPECT_EQ(context.time_periods.years, (std::vector<int>{2019, 2023}));
}

TEST_F(EntityExtractorTest, ConfiguredYearRange) {
  config::EntitiesConfig config;
  config.min_year = 2020;
  config.max_year = 2022;
  EntityExtractor narrow(config);
  EXPECT_EQ(narrow.Extract("2019 2021 2023").time_periods.years, std::vector<int>{2021});
}

TEST_F(EntityExtractorTest, QuarterNotations) {
  auto context = extractor_.Extract("Q3 2023 versus 4Q and the second quarter");
  EXPECT_EQ(context.time_periods.quarters, (std::vector<std::string>{"Q2", "Q3", "Q4"}));
  EXPECT_EQ(context.time_periods.years, std::vector<int>{2023});
}

TEST_F(EntityExtractorTest, RelativeTermsInLexiconOrder) {
  auto context = extractor_.Extract("trend in the most recent filings");
  EXPECT_EQ(context.time_periods.relative_terms, (std::vector<std::string>{"recent", "trend"}));
  EXPECT_FALSE(context.time_periods.Empty());
  EXPECT_TRUE(extractor_.Extract("revenue").time_periods.Empty());
}

TEST_F(EntityExtractorTest, CurrentInBalanceSheetPhraseIsNotRelative) {
  auto assets = extractor_.Extract("Apple current assets");
  EXPECT_TRUE(assets.time_periods.Empty());
  EXPECT_EQ(assets.concepts, (std::vector<std::string>{"working_capital"}));

  auto report = extractor_.Extract("Apple's current report");
  EXPECT_TRUE(report.time_periods.Empty());
  EXPECT_EQ(report.filing_types, std::vector<std::string>{"8-K"});

  EXPECT_TRUE(extractor_.Extract("current ratio and current liabilities").time_periods.Empty());
  EXPECT_EQ(extractor_.Extract("current assets in the current quarter").time_periods.relative_terms,
            std::vector<std::string>{"current"});
}

// ============================================================================
// Filing types and concepts
// ============================================================================

TEST_F(EntityExtractorTest, FilingTypeSynonyms) {
  EXPECT_EQ(extractor_.Extract("annual report and proxy statement").filing_types,
            (std::vector<std::string>{"10-K", "DEF 14A"}));
  EXPECT_EQ(extractor_.Extract("latest 10q and 8-K").filing_types, (std::vector<std::string>{"10-Q", "8-K"}));
  EXPECT_EQ(extractor_.Extract("insider trading by directors").filing_types,
            (std::vector<std::string>{"3", "4", "5"}));
  EXPECT_TRUE(extractor_.Extract("revenue growth").filing_types.empty());
}

TEST_F(EntityExtractorTest, ConceptsInLexiconOrder) {
  auto context = extractor_.Extract("R&D spending and cash flow");
  EXPECT_EQ(context.concepts, (std::vector<std::string>{"expenses", "cash_flow", "r&d"}));
}

TEST_F(EntityExtractorTest, ConceptKeywords) {
  auto keywords = ConceptExtractor::KeywordsFor("working_capital");
  EXPECT_EQ(keywords, (std::vector<std::string>{"working capital", "current assets"}));
  EXPECT_TRUE(ConceptExtractor::KeywordsFor("unknown").empty());
}

// ============================================================================
// Comparison
// ============================================================================

TEST_F(EntityExtractorTest, ComparisonIntentNeedsTwoCompanies) {
  auto both = extractor_.Extract("Compare Apple and Microsoft revenue");
  EXPECT_TRUE(both.comparison_cue);
  EXPECT_TRUE(both.comparison_intent);

  auto single = extractor_.Extract("Compare Apple revenue over time");
  EXPECT_TRUE(single.comparison_cue);
  EXPECT_FALSE(single.comparison_intent);

  auto none = extractor_.Extract("Apple and Microsoft revenue");
  EXPECT_FALSE(none.comparison_cue);
  EXPECT_FALSE(none.comparison_intent);
}

TEST_F(EntityExtractorTest, EmptyQuery) {
  auto context = extractor_.Extract("");
  EXPECT_TRUE(context.tickers.empty());
  EXPECT_TRUE(context.time_periods.Empty());
  EXPECT_TRUE(context.filing_types.empty());
  EXPECT_TRUE(context.concepts.empty());
  EXPECT_FALSE(context.comparison_cue);
}

// ============================================================================
// CompanyRegistry
// ============================================================================

TEST(CompanyRegistryTest, BuiltinTable) {
  CompanyRegistry registry;
  EXPECT_EQ(registry.Companies().size(), 15U);
  ASSERT_NE(registry.Find("JPM"), nullptr);
  EXPECT_EQ(registry.Find("JPM")->sector, "Finance");
  EXPECT_EQ(registry.Find("TSLA"), nullptr);
  EXPECT_TRUE(registry.Contains("XOM"));
}

TEST(CompanyRegistryTest, AliasesLowercaseLongestFirst) {
  CompanyRegistry registry;
  const auto& aliases = registry.Aliases();
  ASSERT_FALSE(aliases.empty());
  for (size_t i = 1; i < aliases.size(); ++i) {
    EXPECT_GE(aliases[i - 1].first.size(), aliases[i].first.size());
  }
  // Legal names are aliases too
  auto legal = std::find(aliases.begin(), aliases.end(), std::make_pair(std::string("apple inc."), std::string("AAPL")));
  EXPECT_NE(legal, aliases.end());
}

TEST(CompanyRegistryTest, ConfiguredEntriesDeduplicateAliases) {
  CompanyRegistry registry({{"NVDA", "NVIDIA Corporation", "Technology", {"nvidia", "NVIDIA", " Nvidia "}}});
  EXPECT_EQ(registry.Companies().size(), 1U);
  EXPECT_EQ(registry.Aliases().size(), 2U);  // "nvidia corporation", "nvidia"
}

}  // namespace
}  // namespace finrag::query
