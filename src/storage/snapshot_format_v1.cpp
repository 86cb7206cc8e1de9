/**
 * @file snapshot_format_v1.cpp
 * @brief Snapshot file format Version 1 implementation
 */

#include "storage/snapshot_format_v1.h"

#include <zlib.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>

#include "utils/binary_io.h"
#include "utils/structured_log.h"

namespace finrag::storage::snapshot_v1 {

using namespace utils;

namespace {

/**
 * @brief Section name -> integrity error type
 */
snapshot_format::CRCErrorType SectionErrorType(const std::string& name) {
  if (name == snapshot_format::sections::kManifest) {
    return snapshot_format::CRCErrorType::ManifestCRC;
  }
  if (name == snapshot_format::sections::kChunks) {
    return snapshot_format::CRCErrorType::ChunksCRC;
  }
  if (name == snapshot_format::sections::kEmbeddings) {
    return snapshot_format::CRCErrorType::EmbeddingsCRC;
  }
  if (name == snapshot_format::sections::kMetadataIndex) {
    return snapshot_format::CRCErrorType::MetadataIndexCRC;
  }
  return snapshot_format::CRCErrorType::FallbackModelCRC;
}

/**
 * @brief Append one section (name + length + CRC32 + data)
 */
bool WriteSection(std::ostream& output_stream, const std::string& name, const std::string& data) {
  return WriteString(output_stream, name) && WriteBinary(output_stream, static_cast<uint32_t>(data.size())) &&
         WriteBinary(output_stream, CalculateCRC32(data)) &&
         output_stream.write(data.data(), static_cast<std::streamsize>(data.size())).good();
}

Unexpected<Error> Fail(snapshot_format::IntegrityError* integrity_error, snapshot_format::CRCErrorType type,
                       ErrorCode code, const std::string& message, const std::string& section = {}) {
  if (integrity_error != nullptr) {
    integrity_error->type = type;
    integrity_error->message = message;
    integrity_error->section = section;
  }
  return MakeUnexpected(MakeError(code, message, section));
}

/**
 * @brief Read the whole file and check magic, version, size and body CRC
 *
 * On success `body` holds everything after the V1 header.
 */
Expected<void, Error> ReadAndCheckFile(const std::string& filepath, HeaderV1& header, std::string& body,
                                       snapshot_format::IntegrityError* integrity_error) {
  std::error_code exists_error;
  if (!std::filesystem::exists(filepath, exists_error)) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotNotFound, "Snapshot file does not exist", filepath));
  }

  std::ifstream input_stream(filepath, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError,
                                    "Failed to open file for reading: " + filepath + " (" + std::strerror(errno) +
                                        ")"));
  }
  std::string contents((std::istreambuf_iterator<char>(input_stream)), std::istreambuf_iterator<char>());

  std::istringstream header_stream(contents);
  std::array<char, 4> magic{};
  header_stream.read(magic.data(), magic.size());
  if (!header_stream || magic != snapshot_format::kMagicNumber) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                "Invalid magic number");
  }

  uint32_t version = 0;
  if (!ReadBinary(header_stream, version) || version < snapshot_format::kMinSupportedVersion ||
      version > snapshot_format::kMaxSupportedVersion) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                "Unsupported version: " + std::to_string(version));
  }

  auto header_result = ReadHeaderV1(header_stream, header);
  if (!header_result) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                header_result.error().message());
  }

  if (contents.size() != header.total_file_size) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                "File size mismatch: expected " + std::to_string(header.total_file_size) + ", got " +
                    std::to_string(contents.size()));
  }

  const size_t body_offset = snapshot_format::kFixedHeaderSize + header.header_size;
  if (body_offset > contents.size()) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                "Header size exceeds file size");
  }
  body = contents.substr(body_offset);

  if (CalculateCRC32(body) != header.body_crc32) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kSnapshotCorrupted,
                "File CRC32 mismatch");
  }
  return {};
}

/**
 * @brief Split the body into name -> data, verifying each section CRC
 */
Expected<std::map<std::string, std::string>, Error> ReadSections(const std::string& body,
                                                                 snapshot_format::IntegrityError* integrity_error) {
  std::istringstream body_stream(body);
  uint32_t section_count = 0;
  if (!ReadBinary(body_stream, section_count)) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                "Failed to read section count");
  }

  std::map<std::string, std::string> sections;
  for (uint32_t i = 0; i < section_count; ++i) {
    std::string name;
    uint32_t size = 0;
    uint32_t crc = 0;
    if (!ReadString(body_stream, name) || !ReadBinary(body_stream, size) || !ReadBinary(body_stream, crc)) {
      return Fail(integrity_error, snapshot_format::CRCErrorType::FileCRC, ErrorCode::kStorageDumpReadError,
                  "Failed to read section header");
    }
    std::string data(size, '\0');
    if (size > 0 && !body_stream.read(data.data(), size)) {
      return Fail(integrity_error, SectionErrorType(name), ErrorCode::kStorageDumpReadError, "Section truncated",
                  name);
    }
    if (CalculateCRC32(data) != crc) {
      return Fail(integrity_error, SectionErrorType(name), ErrorCode::kSnapshotCorrupted, "Section CRC32 mismatch",
                  name);
    }
    sections[name] = std::move(data);
  }
  return sections;
}

}  // namespace

// ============================================================================
// CRC32 Calculation
// ============================================================================

uint32_t CalculateCRC32(const void* data, size_t length) {
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(data), length));
}

uint32_t CalculateCRC32(const std::string& str) {
  return CalculateCRC32(str.data(), str.size());
}

// ============================================================================
// Header V1 Serialization
// ============================================================================

Expected<void, Error> WriteHeaderV1(std::ostream& output_stream, const HeaderV1& header) {
  if (!WriteBinary(output_stream, header.header_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write header size"));
  }
  if (!WriteBinary(output_stream, header.flags)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write header flags"));
  }
  if (!WriteBinary(output_stream, header.snapshot_timestamp)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write snapshot timestamp"));
  }
  if (!WriteBinary(output_stream, header.total_file_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write total file size"));
  }
  if (!WriteBinary(output_stream, header.body_crc32)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write body CRC32"));
  }
  if (!WriteString(output_stream, header.reserved)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write reserved field"));
  }
  return {};
}

Expected<void, Error> ReadHeaderV1(std::istream& input_stream, HeaderV1& header) {
  if (!ReadBinary(input_stream, header.header_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read header size"));
  }
  if (!ReadBinary(input_stream, header.flags)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read header flags"));
  }
  if (!ReadBinary(input_stream, header.snapshot_timestamp)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read snapshot timestamp"));
  }
  if (!ReadBinary(input_stream, header.total_file_size)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read total file size"));
  }
  if (!ReadBinary(input_stream, header.body_crc32)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read body CRC32"));
  }
  if (!ReadString(input_stream, header.reserved)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read reserved field"));
  }
  return {};
}

// ============================================================================
// Manifest Serialization
// ============================================================================

Expected<void, Error> SerializeManifest(std::ostream& output_stream, const SnapshotManifest& manifest) {
  if (!WriteString(output_stream, manifest.active_method) || !WriteBinary(output_stream, manifest.dimension) ||
      !WriteBinary(output_stream, manifest.created_at) || !WriteBinary(output_stream, manifest.model_fingerprint) ||
      !WriteBinary(output_stream, manifest.chunk_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write manifest"));
  }
  return {};
}

Expected<void, Error> DeserializeManifest(std::istream& input_stream, SnapshotManifest& manifest) {
  if (!ReadString(input_stream, manifest.active_method) || !ReadBinary(input_stream, manifest.dimension) ||
      !ReadBinary(input_stream, manifest.created_at) || !ReadBinary(input_stream, manifest.model_fingerprint) ||
      !ReadBinary(input_stream, manifest.chunk_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read manifest"));
  }
  return {};
}

// ============================================================================
// Chunk Serialization
// ============================================================================

Expected<void, Error> SerializeChunks(std::ostream& output_stream, const std::vector<vectors::Chunk>& chunks) {
  if (!WriteBinary(output_stream, static_cast<uint64_t>(chunks.size()))) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write chunk count"));
  }

  for (const auto& chunk : chunks) {
    const auto& metadata = chunk.metadata;
    bool ok = WriteString(output_stream, chunk.id) && WriteString(output_stream, chunk.text) &&
              WriteString(output_stream, metadata.ticker) && WriteString(output_stream, metadata.filing_type) &&
              WriteString(output_stream, metadata.filing_date) && WriteString(output_stream, metadata.section_type) &&
              WriteBinary(output_stream, metadata.quality_score) &&
              WriteBinary(output_stream, static_cast<uint32_t>(metadata.extra.size()));
    for (const auto& [key, value] : metadata.extra) {
      ok = ok && WriteString(output_stream, key) && WriteString(output_stream, value);
    }
    if (!ok) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write chunk: " + chunk.id));
    }
  }
  return {};
}

Expected<void, Error> DeserializeChunks(std::istream& input_stream, std::vector<vectors::Chunk>& chunks) {
  uint64_t count = 0;
  if (!ReadBinary(input_stream, count) || count > kMaxSerializedLength) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read chunk count"));
  }

  std::vector<vectors::Chunk> loaded;
  loaded.reserve(static_cast<size_t>(count));
  for (uint64_t i = 0; i < count; ++i) {
    vectors::Chunk chunk;
    auto& metadata = chunk.metadata;
    uint32_t extra_count = 0;
    bool ok = ReadString(input_stream, chunk.id) && ReadString(input_stream, chunk.text) &&
              ReadString(input_stream, metadata.ticker) && ReadString(input_stream, metadata.filing_type) &&
              ReadString(input_stream, metadata.filing_date) && ReadString(input_stream, metadata.section_type) &&
              ReadBinary(input_stream, metadata.quality_score) && ReadBinary(input_stream, extra_count);
    for (uint32_t e = 0; ok && e < extra_count; ++e) {
      std::string key;
      std::string value;
      ok = ReadString(input_stream, key) && ReadString(input_stream, value);
      metadata.extra.emplace(std::move(key), std::move(value));
    }
    if (!ok) {
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageDumpReadError, "Failed to read chunk " + std::to_string(i)));
    }
    loaded.push_back(std::move(chunk));
  }
  chunks = std::move(loaded);
  return {};
}

// ============================================================================
// Embedding Serialization
// ============================================================================

Expected<void, Error> SerializeEmbeddings(std::ostream& output_stream,
                                          const std::vector<std::vector<float>>& embeddings) {
  if (!WriteBinary(output_stream, static_cast<uint64_t>(embeddings.size()))) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write embedding count"));
  }
  for (const auto& values : embeddings) {
    if (!WriteFloats(output_stream, values)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write embedding"));
    }
  }
  return {};
}

Expected<void, Error> DeserializeEmbeddings(std::istream& input_stream, std::vector<std::vector<float>>& embeddings) {
  uint64_t count = 0;
  if (!ReadBinary(input_stream, count) || count > kMaxSerializedLength) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read embedding count"));
  }
  std::vector<std::vector<float>> loaded(static_cast<size_t>(count));
  for (auto& values : loaded) {
    if (!ReadFloats(input_stream, values)) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read embedding"));
    }
  }
  embeddings = std::move(loaded);
  return {};
}

// ============================================================================
// Main Snapshot Write/Read Functions
// ============================================================================

Expected<void, Error> WriteSnapshotV1(const std::string& filepath, const SnapshotPayload& payload) {
  // Serialize every section into memory first
  std::ostringstream manifest_ss;
  auto manifest_result = SerializeManifest(manifest_ss, payload.manifest);
  if (!manifest_result) {
    return manifest_result;
  }
  std::ostringstream chunks_ss;
  auto chunks_result = SerializeChunks(chunks_ss, payload.chunks);
  if (!chunks_result) {
    return chunks_result;
  }
  std::ostringstream embeddings_ss;
  auto embeddings_result = SerializeEmbeddings(embeddings_ss, payload.embeddings);
  if (!embeddings_result) {
    return embeddings_result;
  }
  std::ostringstream index_ss;
  if (!payload.index.Serialize(index_ss)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to serialize metadata index"));
  }

  const bool with_model = !payload.fallback_model.empty();
  std::ostringstream body_ss;
  uint32_t section_count = with_model ? 5 : 4;
  bool ok = WriteBinary(body_ss, section_count) &&
            WriteSection(body_ss, snapshot_format::sections::kManifest, manifest_ss.str()) &&
            WriteSection(body_ss, snapshot_format::sections::kChunks, chunks_ss.str()) &&
            WriteSection(body_ss, snapshot_format::sections::kEmbeddings, embeddings_ss.str()) &&
            WriteSection(body_ss, snapshot_format::sections::kMetadataIndex, index_ss.str());
  if (ok && with_model) {
    ok = WriteSection(body_ss, snapshot_format::sections::kFallbackModel, payload.fallback_model);
  }
  if (!ok) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to assemble snapshot body"));
  }
  const std::string body = body_ss.str();

  HeaderV1 header;
  header.flags = snapshot_format::flags_v1::kWithCRC;
  if (with_model) {
    header.flags |= snapshot_format::flags_v1::kWithFallbackModel;
  }
  header.snapshot_timestamp = payload.manifest.created_at;
  header.body_crc32 = CalculateCRC32(body);

  // Header size does not depend on the field values, only on the reserved length
  std::ostringstream header_ss;
  auto header_result = WriteHeaderV1(header_ss, header);
  if (!header_result) {
    return header_result;
  }
  header.header_size = static_cast<uint32_t>(header_ss.str().size());
  header.total_file_size = snapshot_format::kFixedHeaderSize + header.header_size + body.size();

  std::error_code dir_error;
  const auto parent = std::filesystem::path(filepath).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, dir_error);
    if (dir_error) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError,
                                      "Failed to create snapshot directory: " + dir_error.message(), filepath));
    }
  }

  const std::string temp_filepath = filepath + ".tmp";
  {
    std::ofstream output_stream(temp_filepath, std::ios::binary | std::ios::trunc);
    if (!output_stream) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError,
                                      "Failed to open file for writing: " + temp_filepath + " (" +
                                          std::strerror(errno) + ")"));
    }

    output_stream.write(snapshot_format::kMagicNumber.data(), snapshot_format::kMagicNumber.size());
    uint32_t version = snapshot_format::kCurrentVersion;
    bool written = WriteBinary(output_stream, version) && WriteHeaderV1(output_stream, header).has_value() &&
                   output_stream.write(body.data(), static_cast<std::streamsize>(body.size())).good();
    output_stream.flush();
    if (!written || !output_stream) {
      output_stream.close();
      std::error_code remove_error;
      std::filesystem::remove(temp_filepath, remove_error);
      LogStorageError("snapshot_write", filepath, "write failed");
      return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to write snapshot", filepath));
    }
  }

  std::error_code rename_error;
  std::filesystem::rename(temp_filepath, filepath, rename_error);
  if (rename_error) {
    std::error_code remove_error;
    std::filesystem::remove(temp_filepath, remove_error);
    LogStorageError("snapshot_write", filepath, rename_error.message());
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageDumpWriteError, "Failed to rename snapshot: " + rename_error.message(), filepath));
  }

  StructuredLog()
      .Event("snapshot_write")
      .Field("filepath", filepath)
      .Field("chunks", static_cast<uint64_t>(payload.chunks.size()))
      .Field("method", payload.manifest.active_method)
      .Field("bytes", header.total_file_size)
      .Info();
  return {};
}

Expected<void, Error> ReadSnapshotV1(const std::string& filepath, SnapshotPayload& payload,
                                     snapshot_format::IntegrityError* integrity_error) {
  HeaderV1 header;
  std::string body;
  auto file_result = ReadAndCheckFile(filepath, header, body, integrity_error);
  if (!file_result) {
    return file_result;
  }

  auto sections = ReadSections(body, integrity_error);
  if (!sections) {
    return MakeUnexpected(sections.error());
  }

  for (const char* required : {snapshot_format::sections::kManifest, snapshot_format::sections::kChunks,
                               snapshot_format::sections::kEmbeddings, snapshot_format::sections::kMetadataIndex}) {
    if (sections->count(required) == 0) {
      return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                  "Missing section", required);
    }
  }

  SnapshotPayload loaded;
  {
    std::istringstream stream(sections->at(snapshot_format::sections::kManifest));
    auto result = DeserializeManifest(stream, loaded.manifest);
    if (!result) {
      return result;
    }
  }
  {
    std::istringstream stream(sections->at(snapshot_format::sections::kChunks));
    auto result = DeserializeChunks(stream, loaded.chunks);
    if (!result) {
      return result;
    }
  }
  {
    std::istringstream stream(sections->at(snapshot_format::sections::kEmbeddings));
    auto result = DeserializeEmbeddings(stream, loaded.embeddings);
    if (!result) {
      return result;
    }
  }
  {
    std::istringstream stream(sections->at(snapshot_format::sections::kMetadataIndex));
    auto result = loaded.index.Deserialize(stream);
    if (!result) {
      return result;
    }
  }
  auto model_iter = sections->find(snapshot_format::sections::kFallbackModel);
  if (model_iter != sections->end()) {
    loaded.fallback_model = model_iter->second;
  }

  // Cross-section consistency
  const auto& manifest = loaded.manifest;
  // An empty store has no method yet
  const bool method_known = manifest.active_method == "primary" || manifest.active_method == "fallback";
  if (!method_known && !(manifest.active_method.empty() && loaded.chunks.empty())) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                "Unknown embedding method: " + manifest.active_method, snapshot_format::sections::kManifest);
  }
  if (manifest.active_method == "fallback" && !loaded.chunks.empty() && loaded.fallback_model.empty()) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                "Fallback snapshot has no model section", snapshot_format::sections::kFallbackModel);
  }
  if (manifest.chunk_count != loaded.chunks.size() || loaded.chunks.size() != loaded.embeddings.size()) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                "Chunk/embedding count mismatch");
  }
  for (const auto& values : loaded.embeddings) {
    if (values.size() != manifest.dimension) {
      return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                  "Embedding dimension differs from manifest", snapshot_format::sections::kEmbeddings);
    }
  }
  auto index_result = loaded.index.Verify(loaded.chunks);
  if (!index_result) {
    return Fail(integrity_error, snapshot_format::CRCErrorType::Consistency, ErrorCode::kSnapshotCorrupted,
                index_result.error().message(), snapshot_format::sections::kMetadataIndex);
  }

  payload = std::move(loaded);
  LogStorageInfo("snapshot_read", "Snapshot loaded from " + filepath);
  return {};
}

Expected<void, Error> VerifySnapshotIntegrity(const std::string& filepath,
                                              snapshot_format::IntegrityError& integrity_error) {
  HeaderV1 header;
  std::string body;
  auto file_result = ReadAndCheckFile(filepath, header, body, &integrity_error);
  if (!file_result) {
    return file_result;
  }
  auto sections = ReadSections(body, &integrity_error);
  if (!sections) {
    return MakeUnexpected(sections.error());
  }
  LogStorageInfo("snapshot_verify", "Snapshot integrity verified: " + filepath);
  return {};
}

Expected<void, Error> GetSnapshotInfo(const std::string& filepath, SnapshotInfo& info) {
  HeaderV1 header;
  std::string body;
  auto file_result = ReadAndCheckFile(filepath, header, body, nullptr);
  if (!file_result) {
    return file_result;
  }
  auto sections = ReadSections(body, nullptr);
  if (!sections) {
    return MakeUnexpected(sections.error());
  }
  auto manifest_iter = sections->find(snapshot_format::sections::kManifest);
  if (manifest_iter == sections->end()) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotCorrupted, "Missing manifest section", filepath));
  }
  std::istringstream manifest_stream(manifest_iter->second);
  auto manifest_result = DeserializeManifest(manifest_stream, info.manifest);
  if (!manifest_result) {
    return manifest_result;
  }

  info.version = snapshot_format::kCurrentVersion;
  info.flags = header.flags;
  info.file_size = header.total_file_size;
  info.timestamp = header.snapshot_timestamp;
  return {};
}

}  // namespace finrag::storage::snapshot_v1
