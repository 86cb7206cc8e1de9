/**
 * @file vector_store.h
 * @brief Chunk storage, metadata filtering and hybrid search
 *
 * Thread-safe, append-only storage of filing chunks and their embeddings,
 * persisted as a single snapshot file and restored lazily on first access.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.h"
#include "embeddings/embedding.h"
#include "embeddings/embedding_generator.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/chunk.h"
#include "vectors/keyword_scorer.h"
#include "vectors/metadata_index.h"

namespace finrag::vectors {

/**
 * @brief Outcome of one Add() call
 */
struct IngestSummary {
  size_t received = 0;
  size_t added = 0;
  size_t skipped_invalid = 0;
  size_t skipped_duplicate = 0;
  size_t skipped_embedding_failed = 0;  ///< Embedding call failed, zero vector not stored
  std::vector<std::string> warnings;  ///< One line per skipped chunk
};

/**
 * @brief Search parameters
 */
struct SearchOptions {
  MetadataFilter filter;                    ///< Exact-match pre-filter (empty = whole corpus)
  size_t top_k = 10;                        ///< Maximum results
  std::string date_from;                    ///< Inclusive ISO date lower bound (empty = none)
  std::string date_to;                      ///< Inclusive ISO date upper bound (empty = none)
  std::optional<double> min_quality;        ///< Drop chunks with a lower quality_score
  std::vector<std::string> extra_keywords;  ///< Appended to the query keywords
  bool apply_threshold = true;              ///< Apply the scoring profile cutoff
};

enum class SearchStatus : std::uint8_t {
  kOk = 0,
  kNoData = 1,     // Corpus is empty
  kNoMatches = 2,  // Corpus has data but nothing passed filters and cutoff
};

inline const char* SearchStatusToString(SearchStatus status) {
  switch (status) {
    case SearchStatus::kOk:
      return "ok";
    case SearchStatus::kNoData:
      return "no_data";
    case SearchStatus::kNoMatches:
      return "no_matches";
  }
  return "unknown";
}

struct SearchResponse {
  SearchStatus status = SearchStatus::kNoData;
  std::vector<SearchResult> results;
  size_t candidate_count = 0;  ///< Chunks that passed filters, before the cutoff
  bool degraded = false;       ///< Query vector was a substituted zero vector
};

/**
 * @brief Collection statistics
 */
struct CollectionStatistics {
  size_t total_chunks = 0;
  size_t embeddings_count = 0;
  std::vector<std::string> tickers;
  std::vector<std::string> filing_types;
  std::vector<std::string> sectors;
  std::string earliest_date;
  std::string latest_date;
  uint64_t total_words = 0;
  double avg_words_per_chunk = 0.0;
  size_t min_words = 0;
  size_t max_words = 0;
  std::string active_method;  ///< Empty until the first Add or load
  size_t dimension = 0;
  size_t memory_bytes = 0;  ///< Estimated
};

/**
 * @brief Thread-safe chunk store
 *
 * Invariants:
 * - chunks_, embeddings_ and terms_ are parallel and append-only
 * - every stored embedding was produced by the single active method
 * - the metadata index describes exactly the stored chunks
 *
 * Thread-safety:
 * - Search, lookups and statistics take a shared lock
 * - Add, Load, Clear and the first lazy load take the exclusive lock
 * - Every accessor except Save runs the lazy load first, hence non-const
 *
 * Example:
 * @code
 * VectorStore store(config, generator.get());
 * auto embeddings = generator->EmbedBatch(texts);
 * auto summary = store.Add(chunks, *embeddings);
 * auto query = generator->EmbedOne("Apple revenue growth");
 * SearchOptions options;
 * options.filter["ticker"] = {"AAPL"};
 * auto response = store.Search(*query, "Apple revenue growth", options);
 * @endcode
 */
class VectorStore {
 public:
  enum class LoadPolicy : std::uint8_t {
    kLazySnapshot = 0,  // Restore config.SnapshotPath() on first access if it exists
    kEmpty = 1,         // Start empty, load only on explicit Load()
  };

  /**
   * @param config Scoring weights and snapshot location
   * @param generator Used to check and restore the embedding model on load (may be nullptr)
   * @param policy Initial load behaviour
   */
  explicit VectorStore(const config::Config& config, embeddings::EmbeddingGenerator* generator = nullptr,
                       LoadPolicy policy = LoadPolicy::kLazySnapshot);

  /**
   * @brief Append chunks with their embeddings
   *
   * Structurally invalid chunks (empty id or text, missing ticker,
   * filing_type or filing_date, quality_score outside [0, 1]) and duplicate
   * ids are skipped and counted. A count, method or dimension mismatch
   * rejects the whole batch before anything is stored.
   */
  utils::Expected<IngestSummary, utils::Error> Add(const std::vector<Chunk>& chunks,
                                                   const std::vector<embeddings::Embedding>& embeddings);

  /**
   * @brief Hybrid search
   *
   * @param query Query embedding; must match the active method and dimension
   * @param query_text Raw query, source of the keywords
   * @param options Filters, limits and threshold switch
   */
  utils::Expected<SearchResponse, utils::Error> Search(const embeddings::Embedding& query,
                                                       const std::string& query_text,
                                                       const SearchOptions& options);

  std::optional<Chunk> GetChunk(const std::string& chunk_id);

  /**
   * @brief Chunks matching a filter, newest filing first, no scoring
   */
  std::vector<Chunk> SearchByMetadata(const MetadataFilter& filter, size_t limit);

  /**
   * @brief Chunks closest to a stored chunk (semantic score only, chunk excluded)
   */
  utils::Expected<std::vector<SearchResult>, utils::Error> FindSimilar(const std::string& chunk_id,
                                                                       size_t top_k);

  CollectionStatistics GetStatistics();

  /**
   * @brief Write the complete state to a snapshot file (atomic)
   */
  utils::Expected<void, utils::Error> Save(const std::string& path) const;

  /**
   * @brief Replace the state with a snapshot
   *
   * Fails with kSnapshotMethodMismatch when the generator uses another method,
   * kSnapshotModelMismatch when its fitted fallback model differs from the
   * stored one. An unfitted fallback generator is restored from the snapshot.
   */
  utils::Expected<void, utils::Error> Load(const std::string& path);

  /**
   * @brief Run the lazy snapshot load once; returns its outcome on every call
   */
  utils::Expected<void, utils::Error> EnsureLoaded();

  void Clear();

  std::optional<embeddings::EmbeddingMethod> ActiveMethod();
  size_t ChunkCount();
  size_t Dimension();

 private:
  config::Config config_;
  embeddings::EmbeddingGenerator* generator_;
  LoadPolicy policy_;

  std::vector<Chunk> chunks_;
  std::vector<std::vector<float>> embeddings_;
  std::vector<ChunkTerms> terms_;
  std::unordered_map<std::string, uint32_t> positions_;
  MetadataIndex index_;
  std::optional<embeddings::EmbeddingMethod> active_method_;
  size_t dimension_ = 0;
  std::string model_blob_;  ///< Fallback model restored from a snapshot

  mutable std::shared_mutex mutex_;
  std::atomic<bool> loaded_{false};
  std::optional<utils::Error> load_error_;

  utils::Expected<void, utils::Error> LoadLocked(const std::string& path);
  bool PassesPostFilters(const ChunkMetadata& metadata, const SearchOptions& options) const;
  SearchResult MakeResult(uint32_t position, double semantic, double keyword, double combined) const;
  void ClearLocked();
};

}  // namespace finrag::vectors
