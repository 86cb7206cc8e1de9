/**
 * @file snapshot_format_v1.h
 * @brief Snapshot file format Version 1 serialization/deserialization
 *
 * File Structure:
 * ┌─────────────────────────────────────────────────────────────┐
 * │ Fixed File Header (8 bytes)                                 │
 * │   - Magic: "FRAG" (4 bytes)                                 │
 * │   - Format Version: 1 (4 bytes)                             │
 * ├─────────────────────────────────────────────────────────────┤
 * │ Version 1 Header                                            │
 * │   - Header Size                                             │
 * │   - Flags (kWithCRC, kWithFallbackModel)                    │
 * │   - Snapshot Timestamp                                      │
 * │   - Total File Size (for truncation detection)              │
 * │   - Body CRC32 (everything after this header)               │
 * │   - Reserved (length-prefixed)                              │
 * ├─────────────────────────────────────────────────────────────┤
 * │ Body                                                        │
 * │   - Section Count (4 bytes)                                 │
 * │   ┌───────────────────────────────────────────────────────┐ │
 * │   │ For each section:                                     │ │
 * │   │   - Section Name (length-prefixed string)             │ │
 * │   │   - Length (4 bytes) + CRC32 (4 bytes) + data         │ │
 * │   └───────────────────────────────────────────────────────┘ │
 * │   Sections: manifest, chunks, embeddings, metadata_index,   │
 * │             fallback_model (fallback method only)           │
 * └─────────────────────────────────────────────────────────────┘
 *
 * All multi-byte integers are stored in little-endian format.
 * All strings are UTF-8 encoded with length-prefix (uint32_t).
 * CRC32 checksums use zlib implementation (polynomial: 0xEDB88320).
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "storage/snapshot_format.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/chunk.h"
#include "vectors/metadata_index.h"

namespace finrag::storage::snapshot_v1 {

using utils::Error;
using utils::Expected;

/**
 * @brief Version 1 snapshot header
 *
 * | Offset | Size | Field              |
 * |--------|------|--------------------|
 * | 0      | 4    | header_size        |
 * | 4      | 4    | flags              |
 * | 8      | 8    | snapshot_timestamp |
 * | 16     | 8    | total_file_size    |
 * | 24     | 4    | body_crc32         |
 * | 28     | 4+N  | reserved           |
 */
struct HeaderV1 {
  uint32_t header_size = 0;
  uint32_t flags = 0;
  uint64_t snapshot_timestamp = 0;
  uint64_t total_file_size = 0;
  uint32_t body_crc32 = 0;
  std::string reserved;
};

/**
 * @brief Everything a snapshot stores
 */
struct SnapshotPayload {
  SnapshotManifest manifest;
  std::vector<vectors::Chunk> chunks;
  std::vector<std::vector<float>> embeddings;  // Parallel to chunks
  vectors::MetadataIndex index;
  std::string fallback_model;  // Serialized model, empty for primary
};

Expected<void, Error> SerializeManifest(std::ostream& output_stream, const SnapshotManifest& manifest);
Expected<void, Error> DeserializeManifest(std::istream& input_stream, SnapshotManifest& manifest);

Expected<void, Error> SerializeChunks(std::ostream& output_stream, const std::vector<vectors::Chunk>& chunks);
Expected<void, Error> DeserializeChunks(std::istream& input_stream, std::vector<vectors::Chunk>& chunks);

Expected<void, Error> SerializeEmbeddings(std::ostream& output_stream,
                                          const std::vector<std::vector<float>>& embeddings);
Expected<void, Error> DeserializeEmbeddings(std::istream& input_stream, std::vector<std::vector<float>>& embeddings);

Expected<void, Error> WriteHeaderV1(std::ostream& output_stream, const HeaderV1& header);
Expected<void, Error> ReadHeaderV1(std::istream& input_stream, HeaderV1& header);

/**
 * @brief Write a complete snapshot (Version 1 format)
 *
 * The body is assembled in memory, checksummed, then written to
 * `filepath + ".tmp"` and renamed over `filepath`, so readers see either the
 * previous snapshot or the new one, never a partial file.
 *
 * @param filepath Output file path
 * @param payload State to persist
 * @return Expected<void, Error> Success or error (context: filepath)
 */
Expected<void, Error> WriteSnapshotV1(const std::string& filepath, const SnapshotPayload& payload);

/**
 * @brief Read a complete snapshot (Version 1 format)
 *
 * Verifies, in order: magic and version, total file size, body CRC32, each
 * section CRC32, presence of the required sections, and cross-section
 * consistency (chunk and embedding counts, dimensions, index coverage).
 *
 * @param filepath Input file path
 * @param payload Receives the stored state (replaced on success only)
 * @param integrity_error Optional detail about which check failed
 * @return kSnapshotNotFound, kStorageDumpReadError or kSnapshotCorrupted on failure
 */
Expected<void, Error> ReadSnapshotV1(const std::string& filepath, SnapshotPayload& payload,
                                     snapshot_format::IntegrityError* integrity_error = nullptr);

/**
 * @brief Verify header, size and body CRC without deserializing sections
 */
Expected<void, Error> VerifySnapshotIntegrity(const std::string& filepath,
                                              snapshot_format::IntegrityError& integrity_error);

uint32_t CalculateCRC32(const void* data, size_t length);
uint32_t CalculateCRC32(const std::string& str);

/**
 * @brief Snapshot file metadata (header and manifest only)
 */
struct SnapshotInfo {
  uint32_t version = 0;
  uint32_t flags = 0;
  uint64_t file_size = 0;
  uint64_t timestamp = 0;
  SnapshotManifest manifest;
};

/**
 * @brief Read header and manifest without loading chunks or embeddings
 */
Expected<void, Error> GetSnapshotInfo(const std::string& filepath, SnapshotInfo& info);

}  // namespace finrag::storage::snapshot_v1
