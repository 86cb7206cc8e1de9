/**
 * @file snapshot_format.h
 * @brief Binary format definitions for finrag snapshot files
 *
 * A snapshot holds the complete retrieval state: corpus chunks, their
 * embeddings, the metadata index and, for the fallback method, the fitted
 * embedding model.
 *
 * File Format Overview:
 * Every snapshot file starts with an 8-byte fixed header:
 *   - 4 bytes: Magic number "FRAG"
 *   - 4 bytes: Format version (uint32_t, little-endian)
 *
 * The fixed header is followed by version-specific data.
 * See snapshot_format_v1.h for Version 1 format details.
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace finrag::storage {

/**
 * @brief Snapshot file format constants
 */
namespace snapshot_format {

// Magic number for snapshot files ("FRAG" in ASCII)
constexpr std::array<char, 4> kMagicNumber = {'F', 'R', 'A', 'G'};

// Current format version (version we write)
constexpr uint32_t kCurrentVersion = 1;

// Range of versions we can read
constexpr uint32_t kMaxSupportedVersion = 1;
constexpr uint32_t kMinSupportedVersion = 1;

// Fixed file header size (magic + version)
constexpr size_t kFixedHeaderSize = 8;

/**
 * @brief Flags stored in the V1 header
 */
namespace flags_v1 {
constexpr uint32_t kNone = 0x00000000;
constexpr uint32_t kWithCRC = 0x00000010;            // Section and file CRC32 present (always set in V1)
constexpr uint32_t kWithFallbackModel = 0x00000020;  // fallback_model section present
}  // namespace flags_v1

/**
 * @brief Section names, in write order
 */
namespace sections {
constexpr const char* kManifest = "manifest";
constexpr const char* kChunks = "chunks";
constexpr const char* kEmbeddings = "embeddings";
constexpr const char* kMetadataIndex = "metadata_index";
constexpr const char* kFallbackModel = "fallback_model";
}  // namespace sections

/**
 * @brief Where an integrity check failed
 */
enum class CRCErrorType : std::uint8_t {
  None = 0,
  FileCRC = 1,           // Header, size or whole-body checksum
  ManifestCRC = 2,
  ChunksCRC = 3,
  EmbeddingsCRC = 4,
  MetadataIndexCRC = 5,
  FallbackModelCRC = 6,
  Consistency = 7,  // Sections parse but disagree with each other
};

/**
 * @brief File integrity error information
 */
struct IntegrityError {
  CRCErrorType type = CRCErrorType::None;
  std::string message;
  std::string section;

  [[nodiscard]] bool HasError() const { return type != CRCErrorType::None; }
};

}  // namespace snapshot_format

/**
 * @brief Snapshot manifest: identity of the stored state
 */
struct SnapshotManifest {
  std::string active_method;        // "primary", "fallback", or empty for an empty store
  uint32_t dimension = 0;           // Embedding dimension
  uint64_t created_at = 0;          // Unix timestamp (seconds)
  uint32_t model_fingerprint = 0;   // CRC32 of the fallback model (0 for primary)
  uint64_t chunk_count = 0;         // Number of chunks (and embeddings)
};

}  // namespace finrag::storage
