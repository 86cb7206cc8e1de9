/**
 * @file company_registry.cpp
 * @brief Company alias table
 */

#include "query/company_registry.h"

#include <algorithm>

#include "utils/string_utils.h"

namespace finrag::query {

const std::vector<config::CompanyEntry>& CompanyRegistry::BuiltinCompanies() {
  static const std::vector<config::CompanyEntry> kCompanies = {
      // Technology
      {"AAPL", "Apple Inc.", "Technology", {"apple"}},
      {"MSFT", "Microsoft Corporation", "Technology", {"microsoft"}},
      {"GOOGL", "Alphabet Inc.", "Technology", {"alphabet", "google"}},
      // Finance
      {"JPM", "JPMorgan Chase & Co.", "Finance", {"jpmorgan", "jp morgan", "jpmorgan chase"}},
      {"BAC", "Bank of America Corporation", "Finance", {"bank of america"}},
      {"WFC", "Wells Fargo & Company", "Finance", {"wells fargo"}},
      // Healthcare
      {"JNJ", "Johnson & Johnson", "Healthcare", {"johnson and johnson"}},
      {"PFE", "Pfizer Inc.", "Healthcare", {"pfizer"}},
      // Energy
      {"XOM", "Exxon Mobil Corporation", "Energy", {"exxon", "exxon mobil", "exxonmobil"}},
      {"CVX", "Chevron Corporation", "Energy", {"chevron"}},
      // Retail
      {"AMZN", "Amazon.com Inc.", "Retail", {"amazon"}},
      {"WMT", "Walmart Inc.", "Retail", {"walmart"}},
      // Manufacturing
      {"GE", "General Electric Company", "Manufacturing", {"general electric"}},
      {"CAT", "Caterpillar Inc.", "Manufacturing", {"caterpillar"}},
      {"BA", "The Boeing Company", "Manufacturing", {"boeing"}},
  };
  return kCompanies;
}

CompanyRegistry::CompanyRegistry(const std::vector<config::CompanyEntry>& companies)
    : companies_(companies.empty() ? BuiltinCompanies() : companies) {
  for (size_t i = 0; i < companies_.size(); ++i) {
    const auto& entry = companies_[i];
    by_ticker_[entry.ticker] = i;

    std::vector<std::string> names = entry.aliases;
    if (!entry.name.empty()) {
      names.push_back(entry.name);
    }
    for (const auto& name : names) {
      std::string alias = utils::Trim(utils::ToLower(name));
      if (alias.empty()) {
        continue;
      }
      std::pair<std::string, std::string> item{alias, entry.ticker};
      if (std::find(aliases_.begin(), aliases_.end(), item) == aliases_.end()) {
        aliases_.push_back(std::move(item));
      }
    }
  }

  std::stable_sort(aliases_.begin(), aliases_.end(),
                   [](const auto& lhs, const auto& rhs) { return lhs.first.size() > rhs.first.size(); });
}

const config::CompanyEntry* CompanyRegistry::Find(const std::string& ticker) const {
  auto iter = by_ticker_.find(ticker);
  if (iter == by_ticker_.end()) {
    return nullptr;
  }
  return &companies_[iter->second];
}

}  // namespace finrag::query
