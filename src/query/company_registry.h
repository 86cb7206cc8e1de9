/**
 * @file company_registry.h
 * @brief Known companies: ticker, legal name, sector and aliases
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.h"

namespace finrag::query {

/**
 * @brief Alias table used by entity extraction
 *
 * Built from the `entities.companies` config section, or from the built-in
 * table of 15 companies when that section is empty. Aliases are stored
 * lowercase; the legal name is always an alias.
 */
class CompanyRegistry {
 public:
  explicit CompanyRegistry(const std::vector<config::CompanyEntry>& companies = {});

  /**
   * @brief Built-in companies (technology, finance, healthcare, energy, retail, manufacturing)
   */
  static const std::vector<config::CompanyEntry>& BuiltinCompanies();

  bool Contains(const std::string& ticker) const { return by_ticker_.count(ticker) > 0; }

  /**
   * @brief Entry for a ticker, nullptr when unknown
   */
  const config::CompanyEntry* Find(const std::string& ticker) const;

  const std::vector<config::CompanyEntry>& Companies() const { return companies_; }

  /**
   * @brief (alias, ticker) pairs, longest alias first
   */
  const std::vector<std::pair<std::string, std::string>>& Aliases() const { return aliases_; }

 private:
  std::vector<config::CompanyEntry> companies_;
  std::unordered_map<std::string, size_t> by_ticker_;
  std::vector<std::pair<std::string, std::string>> aliases_;
};

}  // namespace finrag::query
