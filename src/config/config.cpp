/**
 * @file config.cpp
 * @brief Configuration parser implementation for finrag
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace finrag::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Scalars are tried as integer, then floating point, then boolean, and are
 * kept as strings when none of those decodes.
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.as<std::string>();
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      json_object[pair.first.as<std::string>()] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Assign node[key] to target when present
 */
template <typename T>
void ReadIfPresent(const YAML::Node& node, const char* key, T& target) {
  if (node[key]) {
    target = node[key].as<T>();
  }
}

/**
 * @brief Parse embedding configuration
 */
EmbeddingConfig ParseEmbeddingConfig(const YAML::Node& node) {
  EmbeddingConfig config;

  ReadIfPresent(node, "dimension", config.dimension);

  if (node["primary"]) {
    const auto& primary = node["primary"];
    ReadIfPresent(primary, "enable", config.primary.enable);
    ReadIfPresent(primary, "url", config.primary.url);
    ReadIfPresent(primary, "model", config.primary.model);
    ReadIfPresent(primary, "connect_timeout_ms", config.primary.connect_timeout_ms);
    ReadIfPresent(primary, "read_timeout_ms", config.primary.read_timeout_ms);
  }

  if (node["fallback"]) {
    const auto& fallback = node["fallback"];
    ReadIfPresent(fallback, "max_features", config.fallback.max_features);
    ReadIfPresent(fallback, "min_token_length", config.fallback.min_token_length);
    ReadIfPresent(fallback, "svd_oversampling", config.fallback.svd_oversampling);
    ReadIfPresent(fallback, "svd_power_iterations", config.fallback.svd_power_iterations);
    ReadIfPresent(fallback, "seed", config.fallback.seed);
  }

  return config;
}

ScoringWeights ParseScoringWeights(const YAML::Node& node, ScoringWeights weights) {
  ReadIfPresent(node, "semantic_weight", weights.semantic_weight);
  ReadIfPresent(node, "keyword_weight", weights.keyword_weight);
  ReadIfPresent(node, "min_score", weights.min_score);
  return weights;
}

/**
 * @brief Parse scoring configuration
 */
ScoringConfig ParseScoringConfig(const YAML::Node& node) {
  ScoringConfig config;

  if (node["primary"]) {
    config.primary = ParseScoringWeights(node["primary"], config.primary);
  }
  if (node["fallback"]) {
    config.fallback = ParseScoringWeights(node["fallback"], config.fallback);
  }

  return config;
}

/**
 * @brief Parse retrieval configuration
 */
RetrievalConfig ParseRetrievalConfig(const YAML::Node& node) {
  RetrievalConfig config;

  ReadIfPresent(node, "single_entity_budget", config.single_entity_budget);
  ReadIfPresent(node, "multi_entity_budget", config.multi_entity_budget);
  ReadIfPresent(node, "min_per_entity", config.min_per_entity);
  ReadIfPresent(node, "temporal_budget", config.temporal_budget);
  ReadIfPresent(node, "concept_budget", config.concept_budget);
  ReadIfPresent(node, "general_budget", config.general_budget);
  ReadIfPresent(node, "broaden_on_empty", config.broaden_on_empty);

  return config;
}

/**
 * @brief Parse entity extraction configuration
 */
EntitiesConfig ParseEntitiesConfig(const YAML::Node& node) {
  EntitiesConfig config;

  ReadIfPresent(node, "min_year", config.min_year);
  ReadIfPresent(node, "max_year", config.max_year);

  if (node["companies"] && node["companies"].IsSequence()) {
    for (const auto& company_node : node["companies"]) {
      CompanyEntry entry;
      ReadIfPresent(company_node, "ticker", entry.ticker);
      ReadIfPresent(company_node, "name", entry.name);
      ReadIfPresent(company_node, "sector", entry.sector);
      if (company_node["aliases"] && company_node["aliases"].IsSequence()) {
        for (const auto& alias : company_node["aliases"]) {
          entry.aliases.push_back(alias.as<std::string>());
        }
      }
      config.companies.push_back(std::move(entry));
    }
  }

  return config;
}

/**
 * @brief Parse snapshot configuration
 */
SnapshotConfig ParseSnapshotConfig(const YAML::Node& node) {
  SnapshotConfig config;

  ReadIfPresent(node, "dir", config.dir);
  ReadIfPresent(node, "default_filename", config.default_filename);

  return config;
}

/**
 * @brief Parse API configuration
 */
ApiConfig ParseApiConfig(const YAML::Node& node) {
  ApiConfig config;

  if (node["http"]) {
    const auto& http_node = node["http"];
    ReadIfPresent(http_node, "enable", config.http.enable);
    ReadIfPresent(http_node, "bind", config.http.bind);
    ReadIfPresent(http_node, "port", config.http.port);
    ReadIfPresent(http_node, "read_timeout_sec", config.http.read_timeout_sec);
    ReadIfPresent(http_node, "write_timeout_sec", config.http.write_timeout_sec);
    ReadIfPresent(http_node, "enable_cors", config.http.enable_cors);
    ReadIfPresent(http_node, "cors_allow_origin", config.http.cors_allow_origin);
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  ReadIfPresent(node, "level", config.level);
  ReadIfPresent(node, "json", config.json);
  ReadIfPresent(node, "file", config.file);

  return config;
}

/**
 * @brief Validate configuration against the embedded JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed: " << e.what() << "\n";
      err_msg << "  Check for unknown keys, wrong value types and out of range numbers.";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

/**
 * @brief Shared path for file and string input
 */
utils::Expected<Config, utils::Error> BuildConfig(const YAML::Node& root) {
  // An empty document means "all defaults"
  if (root.IsNull()) {
    Config config;
    return config;
  }

  auto validation_result = ValidateConfigSchema(YamlToJson(root));
  if (!validation_result) {
    return utils::MakeUnexpected(validation_result.error());
  }

  Config config;

  if (root["embedding"]) {
    config.embedding = ParseEmbeddingConfig(root["embedding"]);
  }
  if (root["scoring"]) {
    config.scoring = ParseScoringConfig(root["scoring"]);
  }
  if (root["retrieval"]) {
    config.retrieval = ParseRetrievalConfig(root["retrieval"]);
  }
  if (root["entities"]) {
    config.entities = ParseEntitiesConfig(root["entities"]);
  }
  if (root["snapshot"]) {
    config.snapshot = ParseSnapshotConfig(root["snapshot"]);
  }
  if (root["api"]) {
    config.api = ParseApiConfig(root["api"]);
  }
  if (root["logging"]) {
    config.logging = ParseLoggingConfig(root["logging"]);
  }

  auto semantic_validation = ValidateConfig(config);
  if (!semantic_validation) {
    return utils::MakeUnexpected(semantic_validation.error());
  }

  return config;
}

utils::Expected<void, utils::Error> InvalidValue(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, message));
}

utils::Expected<void, utils::Error> ValidateWeights(const ScoringWeights& weights, const std::string& prefix) {
  if (weights.semantic_weight < 0.0 || weights.semantic_weight > 1.0) {
    return InvalidValue(prefix + ".semantic_weight must be between 0.0 and 1.0");
  }
  if (weights.keyword_weight < 0.0 || weights.keyword_weight > 1.0) {
    return InvalidValue(prefix + ".keyword_weight must be between 0.0 and 1.0");
  }
  if (weights.semantic_weight + weights.keyword_weight <= 0.0) {
    return InvalidValue(prefix + ": semantic_weight + keyword_weight must be greater than 0");
  }
  if (weights.min_score < 0.0 || weights.min_score >= 1.0) {
    return InvalidValue(prefix + ".min_score must be in [0.0, 1.0)");
  }
  return {};
}

}  // namespace

std::string Config::SnapshotPath() const {
  return (std::filesystem::path(snapshot.dir) / snapshot.default_filename).string();
}

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    return BuildConfig(YAML::LoadFile(path));
  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<Config, utils::Error> ParseConfigString(const std::string& yaml_text) {
  try {
    return BuildConfig(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Embedding
  if (config.embedding.dimension == 0) {
    return InvalidValue("embedding.dimension must be greater than 0");
  }
  if (config.embedding.primary.enable && config.embedding.primary.url.empty()) {
    return InvalidValue("embedding.primary.url must be set when embedding.primary.enable is true");
  }
  if (config.embedding.primary.connect_timeout_ms <= 0 || config.embedding.primary.read_timeout_ms <= 0) {
    return InvalidValue("embedding.primary timeouts must be greater than 0");
  }
  if (config.embedding.fallback.max_features == 0) {
    return InvalidValue("embedding.fallback.max_features must be greater than 0");
  }
  if (config.embedding.fallback.min_token_length == 0) {
    return InvalidValue("embedding.fallback.min_token_length must be greater than 0");
  }

  // Scoring
  auto primary_result = ValidateWeights(config.scoring.primary, "scoring.primary");
  if (!primary_result) {
    return primary_result;
  }
  auto fallback_result = ValidateWeights(config.scoring.fallback, "scoring.fallback");
  if (!fallback_result) {
    return fallback_result;
  }
  // The fallback vectors carry less meaning, so keyword evidence must dominate there
  if (config.scoring.fallback.keyword_weight < config.scoring.fallback.semantic_weight) {
    return InvalidValue("scoring.fallback.keyword_weight must be >= scoring.fallback.semantic_weight");
  }
  if (config.scoring.primary.semantic_weight < config.scoring.primary.keyword_weight) {
    return InvalidValue("scoring.primary.semantic_weight must be >= scoring.primary.keyword_weight");
  }
  if (config.scoring.fallback.min_score > config.scoring.primary.min_score) {
    return InvalidValue("scoring.fallback.min_score must be <= scoring.primary.min_score");
  }

  // Retrieval
  const auto& retrieval = config.retrieval;
  if (retrieval.single_entity_budget == 0 || retrieval.multi_entity_budget == 0 || retrieval.temporal_budget == 0 ||
      retrieval.concept_budget == 0 || retrieval.general_budget == 0) {
    return InvalidValue("retrieval budgets must be greater than 0");
  }
  if (retrieval.min_per_entity == 0) {
    return InvalidValue("retrieval.min_per_entity must be greater than 0");
  }

  // Entities
  if (config.entities.min_year > config.entities.max_year) {
    return InvalidValue("entities.min_year must be <= entities.max_year");
  }
  for (const auto& company : config.entities.companies) {
    if (company.ticker.empty()) {
      return InvalidValue("entities.companies[].ticker must not be empty");
    }
  }

  // Snapshot
  if (config.snapshot.default_filename.empty()) {
    return InvalidValue("snapshot.default_filename must not be empty");
  }

  // API
  if (config.api.http.enable && (config.api.http.port <= 0 || config.api.http.port > 65535)) {
    return InvalidValue("api.http.port must be between 1 and 65535");
  }

  // Logging
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return InvalidValue("logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level +
                        ")");
  }

  return {};
}

}  // namespace finrag::config
