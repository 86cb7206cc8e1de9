/**
 * @file chunk_loader.h
 * @brief JSON Lines chunk reader with structural validation
 *
 * One chunk per line:
 * @code
 * {"id": "AAPL_10-K_2023_0001", "text": "...",
 *  "metadata": {"ticker": "AAPL", "filing_type": "10-K", "filing_date": "2023-11-03",
 *               "section_type": "risk_factors", "quality_score": 0.82, "sector": "Technology"}}
 * @endcode
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/chunk.h"

namespace finrag::ingest {

/**
 * @brief Per-file loading outcome
 */
struct LoadSummary {
  size_t lines = 0;    ///< Non-blank lines read
  size_t loaded = 0;   ///< Records that passed validation
  size_t skipped = 0;  ///< Malformed lines and records
  std::vector<std::string> warnings;
};

struct LoadedChunks {
  std::vector<vectors::Chunk> chunks;
  LoadSummary summary;
};

/**
 * @brief Reads chunk records, skipping malformed ones
 *
 * A record is malformed when the line is not a JSON object, `id` or `text`
 * is missing or blank, or one of metadata.ticker, metadata.filing_type and
 * metadata.filing_date is missing. Other metadata keys are kept as string
 * attributes. Filing content itself is not validated.
 */
class ChunkLoader {
 public:
  /**
   * @return kIngestFileNotFound when the file cannot be opened
   */
  static utils::Expected<LoadedChunks, utils::Error> LoadFile(const std::string& path);

  static LoadedChunks LoadStream(std::istream& input, const std::string& source);

  /**
   * @return kIngestMalformedRecord describing the first problem found
   */
  static utils::Expected<vectors::Chunk, utils::Error> ParseRecord(const nlohmann::json& record);

  static utils::Expected<vectors::Chunk, utils::Error> ParseLine(const std::string& line);
};

}  // namespace finrag::ingest
