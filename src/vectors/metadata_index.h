/**
 * @file metadata_index.h
 * @brief Inverted index over chunk metadata (field -> value -> chunk positions)
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/chunk.h"

namespace finrag::vectors {

/**
 * @brief Exact-match metadata filter
 *
 * Values of one field are OR-ed; fields are AND-ed.
 */
using MetadataFilter = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Inverted index over string metadata fields
 *
 * Chunks are identified by their position in the store's append-only corpus,
 * so every posting list is sorted by construction.
 *
 * Not thread-safe: guarded by the owning VectorStore's lock.
 */
class MetadataIndex {
 public:
  using Postings = std::vector<uint32_t>;

  /**
   * @brief Index every string field of a chunk appended at `position`
   */
  void Add(uint32_t position, const ChunkMetadata& metadata);

  /**
   * @brief Positions matching the filter, ascending
   *
   * An unknown field, or a field whose listed values are all unknown, yields
   * an empty result.
   */
  Postings Match(const MetadataFilter& filter) const;

  /**
   * @brief Distinct values of a field, sorted
   */
  std::vector<std::string> Values(const std::string& field) const;

  /**
   * @brief Number of chunks carrying field == value
   */
  size_t Count(const std::string& field, const std::string& value) const;

  bool HasField(const std::string& field) const { return index_.count(field) > 0; }
  size_t FieldCount() const { return index_.size(); }
  void Clear() { index_.clear(); }

  /**
   * @brief Check the index describes exactly `corpus`
   *
   * Every chunk must be listed under each of its string fields, and no
   * posting may reference a missing chunk or a value the chunk does not carry.
   */
  utils::Expected<void, utils::Error> Verify(const std::vector<Chunk>& corpus) const;

  bool Serialize(std::ostream& output_stream) const;
  utils::Expected<void, utils::Error> Deserialize(std::istream& input_stream);

 private:
  std::unordered_map<std::string, std::unordered_map<std::string, Postings>> index_;
};

}  // namespace finrag::vectors
