/**
 * @file chunk_loader.cpp
 * @brief JSON Lines chunk reader
 */

#include "ingest/chunk_loader.h"

#include <fstream>
#include <istream>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace finrag::ingest {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;
using utils::Unexpected;

namespace {

Unexpected<Error> Malformed(const std::string& message) {
  return MakeUnexpected(MakeError(ErrorCode::kIngestMalformedRecord, message));
}

/**
 * @brief String form of a scalar metadata value
 */
std::string ScalarToString(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

/**
 * @brief YYYY-MM-DD with month 01-12 and day 01-31
 */
bool IsIsoDate(const std::string& date) {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
    return false;
  }
  for (int i : {0, 1, 2, 3, 5, 6, 8, 9}) {
    if (date[i] < '0' || date[i] > '9') {
      return false;
    }
  }
  const int month = (date[5] - '0') * 10 + (date[6] - '0');
  const int day = (date[8] - '0') * 10 + (date[9] - '0');
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

}  // namespace

Expected<vectors::Chunk, Error> ChunkLoader::ParseRecord(const nlohmann::json& record) {
  if (!record.is_object()) {
    return Malformed("record is not a JSON object");
  }

  vectors::Chunk chunk;
  auto id_iter = record.find("id");
  if (id_iter == record.end() || !id_iter->is_string() || utils::IsBlank(id_iter->get<std::string>())) {
    return Malformed("missing id");
  }
  chunk.id = id_iter->get<std::string>();

  auto text_iter = record.find("text");
  if (text_iter == record.end() || !text_iter->is_string() || utils::IsBlank(text_iter->get<std::string>())) {
    return Malformed("empty text");
  }
  chunk.text = text_iter->get<std::string>();

  auto metadata_iter = record.find("metadata");
  if (metadata_iter == record.end() || !metadata_iter->is_object()) {
    return Malformed("missing metadata");
  }
  const auto& metadata = *metadata_iter;

  for (const char* field : {"ticker", "filing_type", "filing_date"}) {
    auto iter = metadata.find(field);
    if (iter == metadata.end() || !iter->is_string() || utils::IsBlank(iter->get<std::string>())) {
      return Malformed(std::string("missing metadata.") + field);
    }
  }

  auto& target = chunk.metadata;
  target.ticker = metadata.at("ticker").get<std::string>();
  target.filing_type = metadata.at("filing_type").get<std::string>();
  target.filing_date = metadata.at("filing_date").get<std::string>();
  if (!IsIsoDate(target.filing_date)) {
    return Malformed("metadata.filing_date is not YYYY-MM-DD: " + target.filing_date);
  }

  for (auto iter = metadata.begin(); iter != metadata.end(); ++iter) {
    const std::string& key = iter.key();
    const auto& value = iter.value();
    if (key == "ticker" || key == "filing_type" || key == "filing_date") {
      continue;
    }
    if (key == "section_type" || key == "section") {
      if (!value.is_string()) {
        return Malformed("metadata." + key + " must be a string");
      }
      if (target.section_type.empty() || key == "section_type") {
        target.section_type = value.get<std::string>();
      }
      continue;
    }
    if (key == "quality_score") {
      if (!value.is_number()) {
        return Malformed("metadata.quality_score must be a number");
      }
      target.quality_score = value.get<double>();
      if (target.quality_score < 0.0 || target.quality_score > 1.0) {
        return Malformed("metadata.quality_score outside [0, 1]");
      }
      continue;
    }
    if (value.is_null() || value.is_object() || value.is_array()) {
      continue;
    }
    target.extra[key] = ScalarToString(value);
  }
  return chunk;
}

Expected<vectors::Chunk, Error> ChunkLoader::ParseLine(const std::string& line) {
  nlohmann::json record = nlohmann::json::parse(line, nullptr, false);
  if (record.is_discarded()) {
    return Malformed("invalid JSON");
  }
  return ParseRecord(record);
}

LoadedChunks ChunkLoader::LoadStream(std::istream& input, const std::string& source) {
  LoadedChunks loaded;
  std::string line;
  size_t line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    if (utils::IsBlank(line)) {
      continue;
    }
    ++loaded.summary.lines;

    auto chunk = ParseLine(line);
    if (!chunk) {
      ++loaded.summary.skipped;
      utils::LogIngestSkip(source, line_no, chunk.error().message());
      loaded.summary.warnings.push_back(source + ":" + std::to_string(line_no) + ": " + chunk.error().message());
      continue;
    }
    loaded.chunks.push_back(std::move(*chunk));
    ++loaded.summary.loaded;
  }
  return loaded;
}

Expected<LoadedChunks, Error> ChunkLoader::LoadFile(const std::string& path) {
  std::ifstream input(path);
  if (!input) {
    return MakeUnexpected(MakeError(ErrorCode::kIngestFileNotFound, "Cannot open chunk file", path));
  }
  auto loaded = LoadStream(input, path);
  utils::StructuredLog()
      .Event("chunks_loaded")
      .Field("source", path)
      .Field("lines", static_cast<uint64_t>(loaded.summary.lines))
      .Field("loaded", static_cast<uint64_t>(loaded.summary.loaded))
      .Field("skipped", static_cast<uint64_t>(loaded.summary.skipped))
      .Info();
  return loaded;
}

}  // namespace finrag::ingest
