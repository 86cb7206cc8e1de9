/**
 * @file metadata_index.cpp
 * @brief Inverted index over chunk metadata
 */

#include "vectors/metadata_index.h"

#include <algorithm>
#include <iterator>

#include "utils/binary_io.h"

namespace finrag::vectors {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

MetadataIndex::Postings Union(const MetadataIndex::Postings& lhs, const MetadataIndex::Postings& rhs) {
  MetadataIndex::Postings out;
  out.reserve(lhs.size() + rhs.size());
  std::set_union(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(out));
  return out;
}

MetadataIndex::Postings Intersect(const MetadataIndex::Postings& lhs, const MetadataIndex::Postings& rhs) {
  MetadataIndex::Postings out;
  std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(out));
  return out;
}

}  // namespace

void MetadataIndex::Add(uint32_t position, const ChunkMetadata& metadata) {
  for (const auto& [field, value] : metadata.IndexedFields()) {
    index_[field][value].push_back(position);
  }
}

MetadataIndex::Postings MetadataIndex::Match(const MetadataFilter& filter) const {
  Postings result;
  bool first = true;

  for (const auto& [field, values] : filter) {
    auto field_iter = index_.find(field);
    if (field_iter == index_.end()) {
      return {};
    }

    Postings field_matches;
    for (const auto& value : values) {
      auto value_iter = field_iter->second.find(value);
      if (value_iter != field_iter->second.end()) {
        field_matches = Union(field_matches, value_iter->second);
      }
    }

    result = first ? std::move(field_matches) : Intersect(result, field_matches);
    first = false;
    if (result.empty()) {
      return {};
    }
  }
  return result;
}

std::vector<std::string> MetadataIndex::Values(const std::string& field) const {
  std::vector<std::string> values;
  auto field_iter = index_.find(field);
  if (field_iter == index_.end()) {
    return values;
  }
  for (const auto& [value, postings] : field_iter->second) {
    if (!value.empty()) {
      values.push_back(value);
    }
  }
  std::sort(values.begin(), values.end());
  return values;
}

size_t MetadataIndex::Count(const std::string& field, const std::string& value) const {
  auto field_iter = index_.find(field);
  if (field_iter == index_.end()) {
    return 0;
  }
  auto value_iter = field_iter->second.find(value);
  return value_iter == field_iter->second.end() ? 0 : value_iter->second.size();
}

Expected<void, Error> MetadataIndex::Verify(const std::vector<Chunk>& corpus) const {
  size_t expected_entries = 0;
  for (size_t position = 0; position < corpus.size(); ++position) {
    const auto fields = corpus[position].metadata.IndexedFields();
    expected_entries += fields.size();
    for (const auto& [field, value] : fields) {
      auto field_iter = index_.find(field);
      bool found = false;
      if (field_iter != index_.end()) {
        auto value_iter = field_iter->second.find(value);
        found = value_iter != field_iter->second.end() &&
                std::binary_search(value_iter->second.begin(), value_iter->second.end(),
                                   static_cast<uint32_t>(position));
      }
      if (!found) {
        return MakeUnexpected(MakeError(ErrorCode::kSnapshotCorrupted,
                                        "Chunk " + corpus[position].id + " missing from index field " + field));
      }
    }
  }

  size_t actual_entries = 0;
  for (const auto& [field, values] : index_) {
    for (const auto& [value, postings] : values) {
      actual_entries += postings.size();
      if (!postings.empty() && postings.back() >= corpus.size()) {
        return MakeUnexpected(
            MakeError(ErrorCode::kSnapshotCorrupted, "Index field " + field + " references a missing chunk"));
      }
    }
  }

  // Every corpus pair is present, so equal totals rule out extra postings
  if (actual_entries != expected_entries) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotCorrupted,
                                    "Index holds " + std::to_string(actual_entries) + " postings, corpus implies " +
                                        std::to_string(expected_entries)));
  }
  return {};
}

bool MetadataIndex::Serialize(std::ostream& output_stream) const {
  // Sorted order keeps snapshots byte-stable across runs
  std::vector<std::string> fields;
  fields.reserve(index_.size());
  for (const auto& entry : index_) {
    fields.push_back(entry.first);
  }
  std::sort(fields.begin(), fields.end());

  if (!utils::WriteBinary(output_stream, static_cast<uint32_t>(fields.size()))) {
    return false;
  }
  for (const auto& field : fields) {
    const auto& values = index_.at(field);
    std::vector<std::string> keys;
    keys.reserve(values.size());
    for (const auto& entry : values) {
      keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());

    if (!utils::WriteString(output_stream, field) ||
        !utils::WriteBinary(output_stream, static_cast<uint32_t>(keys.size()))) {
      return false;
    }
    for (const auto& key : keys) {
      const auto& postings = values.at(key);
      if (!utils::WriteString(output_stream, key) ||
          !utils::WriteBinary(output_stream, static_cast<uint32_t>(postings.size()))) {
        return false;
      }
      for (uint32_t position : postings) {
        if (!utils::WriteBinary(output_stream, position)) {
          return false;
        }
      }
    }
  }
  return true;
}

Expected<void, Error> MetadataIndex::Deserialize(std::istream& input_stream) {
  auto read_error = [](const std::string& what) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpReadError, "Failed to read metadata index " + what));
  };

  index_.clear();
  uint32_t field_count = 0;
  if (!utils::ReadBinary(input_stream, field_count)) {
    return read_error("field count");
  }
  for (uint32_t f = 0; f < field_count; ++f) {
    std::string field;
    uint32_t value_count = 0;
    if (!utils::ReadString(input_stream, field) || !utils::ReadBinary(input_stream, value_count)) {
      return read_error("field header");
    }
    auto& values = index_[field];
    for (uint32_t v = 0; v < value_count; ++v) {
      std::string value;
      uint32_t posting_count = 0;
      if (!utils::ReadString(input_stream, value) || !utils::ReadBinary(input_stream, posting_count) ||
          posting_count > utils::kMaxSerializedLength) {
        return read_error("value header");
      }
      Postings postings(posting_count);
      for (auto& position : postings) {
        if (!utils::ReadBinary(input_stream, position)) {
          return read_error("postings");
        }
      }
      if (!std::is_sorted(postings.begin(), postings.end())) {
        return MakeUnexpected(MakeError(ErrorCode::kSnapshotCorrupted, "Unsorted postings for " + field));
      }
      values.emplace(std::move(value), std::move(postings));
    }
  }
  return {};
}

}  // namespace finrag::vectors
