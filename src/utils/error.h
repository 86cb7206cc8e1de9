/**
 * @file error.h
 * @brief Error codes and error value type used across finrag
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace finrag::utils {

/**
 * @brief Error categories
 *
 * Codes are grouped by subsystem in blocks of 100 so that a code's origin can be
 * read from its numeric value in logs.
 */
enum class ErrorCode : std::uint16_t {
  // General (0-99)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotFound = 4,
  kAlreadyExists = 5,
  kTimeout = 6,
  kNotImplemented = 7,
  kInternalError = 8,

  // Configuration (100-199)
  kConfigFileNotFound = 100,
  kConfigParseError = 101,
  kConfigYamlError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Embedding (200-299)
  kEmbeddingNotFitted = 200,
  kEmbeddingEmptyCorpus = 201,
  kEmbeddingPrimaryUnavailable = 202,
  kEmbeddingPrimaryResponseError = 203,
  kEmbeddingDimensionMismatch = 204,
  kEmbeddingModelCorrupted = 205,

  // Vector store (300-399)
  kVectorDimensionMismatch = 300,
  kVectorMethodMismatch = 301,
  kChunkNotFound = 302,
  kChunkInvalid = 303,
  kChunkCountMismatch = 304,

  // Ingestion (400-499)
  kIngestFileNotFound = 400,
  kIngestMalformedRecord = 401,

  // Storage / snapshot (500-599)
  kStorageDumpReadError = 500,
  kStorageDumpWriteError = 501,
  kSnapshotCorrupted = 502,
  kSnapshotMethodMismatch = 503,
  kSnapshotModelMismatch = 504,
  kSnapshotNotFound = 505,

  // Network (600-699)
  kNetworkBindFailed = 600,
  kNetworkAlreadyRunning = 601,
};

/**
 * @brief Convert error code to a stable string
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kNotImplemented:
      return "NotImplemented";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kEmbeddingNotFitted:
      return "EmbeddingNotFitted";
    case ErrorCode::kEmbeddingEmptyCorpus:
      return "EmbeddingEmptyCorpus";
    case ErrorCode::kEmbeddingPrimaryUnavailable:
      return "EmbeddingPrimaryUnavailable";
    case ErrorCode::kEmbeddingPrimaryResponseError:
      return "EmbeddingPrimaryResponseError";
    case ErrorCode::kEmbeddingDimensionMismatch:
      return "EmbeddingDimensionMismatch";
    case ErrorCode::kEmbeddingModelCorrupted:
      return "EmbeddingModelCorrupted";
    case ErrorCode::kVectorDimensionMismatch:
      return "VectorDimensionMismatch";
    case ErrorCode::kVectorMethodMismatch:
      return "VectorMethodMismatch";
    case ErrorCode::kChunkNotFound:
      return "ChunkNotFound";
    case ErrorCode::kChunkInvalid:
      return "ChunkInvalid";
    case ErrorCode::kChunkCountMismatch:
      return "ChunkCountMismatch";
    case ErrorCode::kIngestFileNotFound:
      return "IngestFileNotFound";
    case ErrorCode::kIngestMalformedRecord:
      return "IngestMalformedRecord";
    case ErrorCode::kStorageDumpReadError:
      return "StorageDumpReadError";
    case ErrorCode::kStorageDumpWriteError:
      return "StorageDumpWriteError";
    case ErrorCode::kSnapshotCorrupted:
      return "SnapshotCorrupted";
    case ErrorCode::kSnapshotMethodMismatch:
      return "SnapshotMethodMismatch";
    case ErrorCode::kSnapshotModelMismatch:
      return "SnapshotModelMismatch";
    case ErrorCode::kSnapshotNotFound:
      return "SnapshotNotFound";
    case ErrorCode::kNetworkBindFailed:
      return "NetworkBindFailed";
    case ErrorCode::kNetworkAlreadyRunning:
      return "NetworkAlreadyRunning";
  }
  return "Unknown";
}

/**
 * @brief Error value: code, human-readable message, optional context
 */
class Error {
 public:
  Error() = default;
  explicit Error(ErrorCode code, std::string message = {}, std::string context = {})
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  /**
   * @brief Format as "[Code] message (context)"
   */
  std::string to_string() const {
    std::string out = "[";
    out += ErrorCodeToString(code_);
    out += "] ";
    out += message_;
    if (!context_.empty()) {
      out += " (" + context_ + ")";
    }
    return out;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code, std::string message = {}, std::string context = {}) {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace finrag::utils
