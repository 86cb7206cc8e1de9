/**
 * @file primary_embedder.cpp
 * @brief HTTP primary embedding backend
 */

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include "embeddings/primary_embedder.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace finrag::embeddings {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kEmbeddingsPath = "/api/embeddings";
constexpr const char* kProbeText = "financial filing";
constexpr int kHttpOk = 200;

}  // namespace

HttpPrimaryEmbedder::HttpPrimaryEmbedder(config::PrimaryEmbeddingConfig config) : config_(std::move(config)) {}

std::string HttpPrimaryEmbedder::Describe() const {
  return config_.url + kEmbeddingsPath + " (model=" + config_.model + ")";
}

Expected<std::vector<float>, Error> HttpPrimaryEmbedder::Embed(const std::string& text) {
  httplib::Client client(config_.url);
  client.set_connection_timeout(std::chrono::milliseconds(config_.connect_timeout_ms));
  client.set_read_timeout(std::chrono::milliseconds(config_.read_timeout_ms));

  nlohmann::json request = {{"model", config_.model}, {"prompt", text}};
  auto response = client.Post(kEmbeddingsPath, request.dump(), "application/json");
  if (!response) {
    const auto code = response.error() == httplib::Error::ConnectionTimeout || response.error() == httplib::Error::Read
                          ? ErrorCode::kTimeout
                          : ErrorCode::kEmbeddingPrimaryUnavailable;
    return MakeUnexpected(MakeError(code, "Embedding request failed: " + httplib::to_string(response.error()),
                                    Describe()));
  }
  if (response->status != kHttpOk) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingPrimaryResponseError,
                                    "Embedding endpoint returned HTTP " + std::to_string(response->status),
                                    Describe()));
  }

  auto body = nlohmann::json::parse(response->body, nullptr, false);
  if (body.is_discarded() || !body.contains("embedding") || !body["embedding"].is_array()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kEmbeddingPrimaryResponseError, "Response has no embedding array", Describe()));
  }

  std::vector<float> values;
  values.reserve(body["embedding"].size());
  for (const auto& item : body["embedding"]) {
    if (!item.is_number()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kEmbeddingPrimaryResponseError, "Embedding contains a non-numeric entry", Describe()));
    }
    values.push_back(item.get<float>());
  }
  return values;
}

Expected<void, Error> HttpPrimaryEmbedder::Probe(uint32_t dimension) {
  auto probe = Embed(kProbeText);
  if (!probe) {
    return MakeUnexpected(probe.error());
  }
  if (probe->size() != dimension) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingDimensionMismatch,
                                    "Endpoint returned " + std::to_string(probe->size()) +
                                        " dimensions, expected " + std::to_string(dimension),
                                    Describe()));
  }
  return {};
}

std::unique_ptr<PrimaryEmbedder> MakePrimaryEmbedder(const config::PrimaryEmbeddingConfig& config) {
  if (!config.enable) {
    return nullptr;
  }
  return std::make_unique<HttpPrimaryEmbedder>(config);
}

}  // namespace finrag::embeddings
