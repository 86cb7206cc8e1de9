/**
 * @file config.h
 * @brief Configuration structures and YAML parser for finrag
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::config {

// Default values for configuration
namespace defaults {

// Embedding defaults
constexpr uint32_t kEmbeddingDimension = 384;
constexpr const char* kPrimaryUrl = "http://127.0.0.1:11434";
constexpr const char* kPrimaryModel = "all-minilm";
constexpr int kPrimaryConnectTimeoutMs = 2000;
constexpr int kPrimaryReadTimeoutMs = 10000;
constexpr uint32_t kFallbackMaxFeatures = 5000;
constexpr uint32_t kFallbackMinTokenLength = 2;
constexpr uint32_t kSvdOversampling = 10;
constexpr uint32_t kSvdPowerIterations = 2;
constexpr uint32_t kSvdSeed = 42;

// Scoring defaults (semantic-heavy for the primary method, keyword-heavy for the fallback)
constexpr double kPrimarySemanticWeight = 0.7;
constexpr double kPrimaryKeywordWeight = 0.3;
constexpr double kPrimaryMinScore = 0.1;
constexpr double kFallbackSemanticWeight = 0.4;
constexpr double kFallbackKeywordWeight = 0.6;
constexpr double kFallbackMinScore = 0.05;

// Retrieval budgets
constexpr uint32_t kSingleEntityBudget = 15;
constexpr uint32_t kMultiEntityBudget = 20;
constexpr uint32_t kMinPerEntity = 5;
constexpr uint32_t kTemporalBudget = 20;
constexpr uint32_t kConceptBudget = 25;
constexpr uint32_t kGeneralBudget = 15;

// Entity extraction
constexpr int kMinYear = 1990;
constexpr int kMaxYear = 2035;

// Snapshot defaults
constexpr const char* kSnapshotDefaultFilename = "finrag.snapshot";

// API defaults
constexpr int kHttpPort = 8080;

}  // namespace defaults

/**
 * @brief Primary (HTTP model endpoint) embedding configuration
 */
struct PrimaryEmbeddingConfig {
  bool enable = true;                                          ///< Probe the endpoint at startup
  std::string url = defaults::kPrimaryUrl;                     ///< Base URL of the embedding service
  std::string model = defaults::kPrimaryModel;                 ///< Model name sent with each request
  int connect_timeout_ms = defaults::kPrimaryConnectTimeoutMs;  ///< Connection timeout
  int read_timeout_ms = defaults::kPrimaryReadTimeoutMs;        ///< Per-request read timeout
};

/**
 * @brief Fallback (TF-IDF + truncated SVD) embedding configuration
 */
struct FallbackEmbeddingConfig {
  uint32_t max_features = defaults::kFallbackMaxFeatures;         ///< Vocabulary cap
  uint32_t min_token_length = defaults::kFallbackMinTokenLength;  ///< Shorter tokens are dropped
  uint32_t svd_oversampling = defaults::kSvdOversampling;         ///< Extra random projections
  uint32_t svd_power_iterations = defaults::kSvdPowerIterations;  ///< Subspace iterations
  uint32_t seed = defaults::kSvdSeed;                              ///< RNG seed (deterministic fit)
};

/**
 * @brief Embedding configuration
 */
struct EmbeddingConfig {
  uint32_t dimension = defaults::kEmbeddingDimension;  ///< Output dimension for both methods
  PrimaryEmbeddingConfig primary;
  FallbackEmbeddingConfig fallback;
};

/**
 * @brief Weights and cutoff for one embedding method
 */
struct ScoringWeights {
  double semantic_weight = 0.0;
  double keyword_weight = 0.0;
  double min_score = 0.0;  ///< Results with a lower combined score are dropped
};

/**
 * @brief Hybrid scoring configuration
 */
struct ScoringConfig {
  ScoringWeights primary{defaults::kPrimarySemanticWeight, defaults::kPrimaryKeywordWeight,
                         defaults::kPrimaryMinScore};
  ScoringWeights fallback{defaults::kFallbackSemanticWeight, defaults::kFallbackKeywordWeight,
                          defaults::kFallbackMinScore};
};

/**
 * @brief Retrieval budgets per strategy
 */
struct RetrievalConfig {
  uint32_t single_entity_budget = defaults::kSingleEntityBudget;
  uint32_t multi_entity_budget = defaults::kMultiEntityBudget;
  uint32_t min_per_entity = defaults::kMinPerEntity;
  uint32_t temporal_budget = defaults::kTemporalBudget;
  uint32_t concept_budget = defaults::kConceptBudget;
  uint32_t general_budget = defaults::kGeneralBudget;
  bool broaden_on_empty = true;  ///< Retry unscoped when a scoped search finds nothing
};

/**
 * @brief One entry of the company alias table
 */
struct CompanyEntry {
  std::string ticker;
  std::string name;
  std::string sector;
  std::vector<std::string> aliases;  ///< Lowercase names matched case-insensitively
};

/**
 * @brief Entity extraction configuration
 */
struct EntitiesConfig {
  int min_year = defaults::kMinYear;
  int max_year = defaults::kMaxYear;
  std::vector<CompanyEntry> companies;  ///< Empty = built-in company table
};

/**
 * @brief Snapshot configuration
 */
struct SnapshotConfig {
  std::string dir = "/var/lib/finrag";                                ///< Snapshot directory
  std::string default_filename = defaults::kSnapshotDefaultFilename;  ///< Default snapshot filename
};

/**
 * @brief API configuration
 */
struct ApiConfig {
  struct {
    bool enable = true;
    std::string bind = "127.0.0.1";
    int port = defaults::kHttpPort;
    int read_timeout_sec = 30;
    int write_timeout_sec = 30;
    bool enable_cors = false;
    std::string cors_allow_origin;  ///< Empty = "null"
  } http;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  EmbeddingConfig embedding;  ///< Embedding configuration
  ScoringConfig scoring;      ///< Hybrid scoring configuration
  RetrievalConfig retrieval;  ///< Retrieval budgets
  EntitiesConfig entities;    ///< Entity extraction configuration
  SnapshotConfig snapshot;    ///< Snapshot configuration
  ApiConfig api;              ///< API configuration
  LoggingConfig logging;      ///< Logging configuration

  /**
   * @brief Full path of the snapshot file (dir + default_filename)
   */
  std::string SnapshotPath() const;
};

/**
 * @brief Load configuration from YAML file
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Parse configuration from a YAML string (same checks as LoadConfig)
 */
utils::Expected<Config, utils::Error> ParseConfigString(const std::string& yaml_text);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace finrag::config
