/**
 * @file vector_store.cpp
 * @brief Vector store implementation
 */

#include "vectors/vector_store.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <unordered_set>

#include "storage/snapshot_format_v1.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"
#include "vectors/distance.h"
#include "vectors/scoring_profile.h"

namespace finrag::vectors {

using embeddings::EmbeddingMethod;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

double ClampUnit(double value) {
  return std::clamp(value, 0.0, 1.0);
}

/**
 * @brief Reason a chunk cannot be stored, empty when valid
 */
std::string ValidateChunk(const Chunk& chunk) {
  if (chunk.id.empty()) {
    return "empty id";
  }
  if (utils::IsBlank(chunk.text)) {
    return "empty text";
  }
  if (chunk.metadata.ticker.empty()) {
    return "missing ticker";
  }
  if (chunk.metadata.filing_type.empty()) {
    return "missing filing_type";
  }
  if (chunk.metadata.filing_date.empty()) {
    return "missing filing_date";
  }
  if (chunk.metadata.quality_score < 0.0 || chunk.metadata.quality_score > 1.0) {
    return "quality_score outside [0, 1]";
  }
  return {};
}

void SortAndTruncate(std::vector<SearchResult>& results, size_t top_k) {
  if (results.size() > top_k) {
    std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(top_k), results.end(),
                      ResultOrder);
    results.resize(top_k);
  } else {
    std::sort(results.begin(), results.end(), ResultOrder);
  }
}

}  // namespace

VectorStore::VectorStore(const config::Config& config, embeddings::EmbeddingGenerator* generator, LoadPolicy policy)
    : config_(config), generator_(generator), policy_(policy) {
  if (policy_ == LoadPolicy::kEmpty) {
    loaded_.store(true, std::memory_order_release);
  }
}

// ============================================================================
// Lazy loading
// ============================================================================

Expected<void, Error> VectorStore::EnsureLoaded() {
  if (!loaded_.load(std::memory_order_acquire)) {
    std::unique_lock lock(mutex_);
    if (!loaded_.load(std::memory_order_relaxed)) {
      const std::string path = config_.SnapshotPath();
      std::error_code exists_error;
      if (std::filesystem::exists(path, exists_error)) {
        auto result = LoadLocked(path);
        if (!result) {
          load_error_ = result.error();
          utils::LogStorageError("lazy_load", path, result.error().to_string());
        }
      }
      loaded_.store(true, std::memory_order_release);
    }
  }

  if (load_error_) {
    return MakeUnexpected(*load_error_);
  }
  return {};
}

// ============================================================================
// Ingestion
// ============================================================================

Expected<IngestSummary, Error> VectorStore::Add(const std::vector<Chunk>& chunks,
                                                const std::vector<embeddings::Embedding>& embeddings) {
  auto loaded = EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  if (chunks.size() != embeddings.size()) {
    return MakeUnexpected(MakeError(ErrorCode::kChunkCountMismatch,
                                    "Got " + std::to_string(chunks.size()) + " chunks and " +
                                        std::to_string(embeddings.size()) + " embeddings"));
  }

  IngestSummary summary;
  summary.received = chunks.size();
  if (chunks.empty()) {
    return summary;
  }

  std::unique_lock lock(mutex_);

  // Whole-batch checks first: nothing is stored when they fail
  const EmbeddingMethod batch_method = embeddings.front().method;
  const size_t batch_dimension = embeddings.front().values.size();
  if (batch_dimension == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch, "Embedding is empty"));
  }
  for (const auto& embedding : embeddings) {
    if (embedding.method != batch_method) {
      return MakeUnexpected(MakeError(ErrorCode::kVectorMethodMismatch, "Batch mixes embedding methods"));
    }
    if (embedding.values.size() != batch_dimension) {
      return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch, "Batch mixes embedding dimensions"));
    }
  }
  if (active_method_ && *active_method_ != batch_method) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorMethodMismatch,
                                    std::string("Store holds ") + embeddings::MethodToString(*active_method_) +
                                        " embeddings, got " + embeddings::MethodToString(batch_method)));
  }
  if (dimension_ != 0 && dimension_ != batch_dimension) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch,
                                    "Vector dimension mismatch: expected " + std::to_string(dimension_) + ", got " +
                                        std::to_string(batch_dimension)));
  }

  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    std::string reason = ValidateChunk(chunk);
    if (!reason.empty()) {
      ++summary.skipped_invalid;
    } else if (positions_.count(chunk.id) > 0) {
      ++summary.skipped_duplicate;
      reason = "duplicate id " + chunk.id;
    } else if (embeddings[i].degraded) {
      ++summary.skipped_embedding_failed;
      reason = "embedding failed for " + chunk.id;
    }
    if (!reason.empty()) {
      utils::LogIngestSkip("vector_store", i, reason);
      summary.warnings.push_back("chunk " + std::to_string(i) + ": " + reason);
      continue;
    }

    const auto position = static_cast<uint32_t>(chunks_.size());
    chunks_.push_back(chunk);
    embeddings_.push_back(embeddings[i].values);
    terms_.push_back(KeywordScorer::Analyze(chunk.text));
    positions_.emplace(chunk.id, position);
    index_.Add(position, chunk.metadata);
    ++summary.added;
  }

  if (summary.added > 0) {
    active_method_ = batch_method;
    dimension_ = batch_dimension;
  }

  utils::StructuredLog()
      .Event("ingest_batch")
      .Field("received", static_cast<uint64_t>(summary.received))
      .Field("added", static_cast<uint64_t>(summary.added))
      .Field("skipped_invalid", static_cast<uint64_t>(summary.skipped_invalid))
      .Field("skipped_duplicate", static_cast<uint64_t>(summary.skipped_duplicate))
      .Field("skipped_embedding_failed", static_cast<uint64_t>(summary.skipped_embedding_failed))
      .Field("total", static_cast<uint64_t>(chunks_.size()))
      .Info();
  return summary;
}

// ============================================================================
// Search
// ============================================================================

bool VectorStore::PassesPostFilters(const ChunkMetadata& metadata, const SearchOptions& options) const {
  if (!options.date_from.empty() && metadata.filing_date < options.date_from) {
    return false;
  }
  if (!options.date_to.empty() && metadata.filing_date > options.date_to) {
    return false;
  }
  if (options.min_quality && metadata.quality_score < *options.min_quality) {
    return false;
  }
  return true;
}

SearchResult VectorStore::MakeResult(uint32_t position, double semantic, double keyword, double combined) const {
  SearchResult result;
  result.chunk_id = chunks_[position].id;
  result.text = chunks_[position].text;
  result.metadata = chunks_[position].metadata;
  result.semantic_score = semantic;
  result.keyword_score = keyword;
  result.combined_score = combined;
  return result;
}

Expected<SearchResponse, Error> VectorStore::Search(const embeddings::Embedding& query, const std::string& query_text,
                                                    const SearchOptions& options) {
  auto loaded = EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  std::shared_lock lock(mutex_);

  SearchResponse response;
  response.degraded = query.degraded;
  if (chunks_.empty() || !active_method_) {
    response.status = SearchStatus::kNoData;
    return response;
  }

  if (query.method != *active_method_) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorMethodMismatch,
                                    std::string("Query embedding is ") + embeddings::MethodToString(query.method) +
                                        ", store is " + embeddings::MethodToString(*active_method_)));
  }
  if (query.values.size() != dimension_) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch,
                                    "Query dimension mismatch: expected " + std::to_string(dimension_) + ", got " +
                                        std::to_string(query.values.size())));
  }

  std::vector<uint32_t> candidates;
  if (options.filter.empty()) {
    candidates.resize(chunks_.size());
    for (uint32_t i = 0; i < candidates.size(); ++i) {
      candidates[i] = i;
    }
  } else {
    candidates = index_.Match(options.filter);
  }

  std::vector<std::string> keywords = KeywordScorer::ExtractKeywords(query_text);
  for (const auto& extra : options.extra_keywords) {
    for (auto& keyword : KeywordScorer::ExtractKeywords(extra)) {
      if (std::find(keywords.begin(), keywords.end(), keyword) == keywords.end()) {
        keywords.push_back(std::move(keyword));
      }
    }
  }

  const auto profile = ScoringProfile::For(*active_method_, config_.scoring);
  const bool zero_query = query.IsZero();

  for (uint32_t position : candidates) {
    if (!PassesPostFilters(chunks_[position].metadata, options)) {
      continue;
    }
    ++response.candidate_count;

    const double semantic = zero_query ? 0.0 : ClampUnit(DotProduct(query.values, embeddings_[position]));
    const double keyword = KeywordScorer::Score(keywords, terms_[position]);
    const double combined = profile.Combine(semantic, keyword);
    if (options.apply_threshold && !profile.Accepts(combined)) {
      continue;
    }
    response.results.push_back(MakeResult(position, semantic, keyword, combined));
  }

  SortAndTruncate(response.results, options.top_k);
  response.status = response.results.empty() ? SearchStatus::kNoMatches : SearchStatus::kOk;
  return response;
}

std::optional<Chunk> VectorStore::GetChunk(const std::string& chunk_id) {
  if (!EnsureLoaded()) {
    return std::nullopt;
  }
  std::shared_lock lock(mutex_);
  auto iter = positions_.find(chunk_id);
  if (iter == positions_.end()) {
    return std::nullopt;
  }
  return chunks_[iter->second];
}

std::vector<Chunk> VectorStore::SearchByMetadata(const MetadataFilter& filter, size_t limit) {
  if (!EnsureLoaded()) {
    return {};
  }
  std::shared_lock lock(mutex_);

  std::vector<uint32_t> matches;
  if (filter.empty()) {
    matches.resize(chunks_.size());
    for (uint32_t i = 0; i < matches.size(); ++i) {
      matches[i] = i;
    }
  } else {
    matches = index_.Match(filter);
  }

  std::sort(matches.begin(), matches.end(), [this](uint32_t lhs, uint32_t rhs) {
    const auto& left = chunks_[lhs];
    const auto& right = chunks_[rhs];
    if (left.metadata.filing_date != right.metadata.filing_date) {
      return left.metadata.filing_date > right.metadata.filing_date;
    }
    return left.id < right.id;
  });
  if (matches.size() > limit) {
    matches.resize(limit);
  }

  std::vector<Chunk> result;
  result.reserve(matches.size());
  for (uint32_t position : matches) {
    result.push_back(chunks_[position]);
  }
  return result;
}

Expected<std::vector<SearchResult>, Error> VectorStore::FindSimilar(const std::string& chunk_id, size_t top_k) {
  auto loaded = EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  std::shared_lock lock(mutex_);

  auto iter = positions_.find(chunk_id);
  if (iter == positions_.end()) {
    return MakeUnexpected(MakeError(ErrorCode::kChunkNotFound, "Chunk not found", chunk_id));
  }
  const uint32_t source = iter->second;
  const auto& source_vector = embeddings_[source];

  std::vector<SearchResult> results;
  if (IsZeroVector(source_vector)) {
    return results;
  }
  for (uint32_t position = 0; position < chunks_.size(); ++position) {
    if (position == source) {
      continue;
    }
    const double semantic = ClampUnit(DotProduct(source_vector, embeddings_[position]));
    results.push_back(MakeResult(position, semantic, 0.0, semantic));
  }
  SortAndTruncate(results, top_k);
  return results;
}

// ============================================================================
// Statistics
// ============================================================================

CollectionStatistics VectorStore::GetStatistics() {
  CollectionStatistics stats;
  if (!EnsureLoaded()) {
    return stats;
  }
  std::shared_lock lock(mutex_);

  stats.total_chunks = chunks_.size();
  stats.embeddings_count = embeddings_.size();
  stats.tickers = index_.Values("ticker");
  stats.filing_types = index_.Values("filing_type");
  stats.sectors = index_.Values("sector");
  stats.active_method = active_method_ ? embeddings::MethodToString(*active_method_) : "";
  stats.dimension = dimension_;

  size_t memory = 0;
  bool first = true;
  for (size_t i = 0; i < chunks_.size(); ++i) {
    const auto& chunk = chunks_[i];
    const size_t words = utils::SplitWhitespace(chunk.text).size();
    stats.total_words += words;
    if (first) {
      stats.min_words = words;
      stats.max_words = words;
      first = false;
    } else {
      stats.min_words = std::min(stats.min_words, words);
      stats.max_words = std::max(stats.max_words, words);
    }

    const auto& date = chunk.metadata.filing_date;
    if (stats.earliest_date.empty() || date < stats.earliest_date) {
      stats.earliest_date = date;
    }
    if (date > stats.latest_date) {
      stats.latest_date = date;
    }

    memory += sizeof(Chunk) + chunk.id.size() + chunk.text.size();
    memory += embeddings_[i].size() * sizeof(float);
    memory += terms_[i].lowered.size() + terms_[i].tokens.size() * 16;
  }
  if (!chunks_.empty()) {
    stats.avg_words_per_chunk = static_cast<double>(stats.total_words) / static_cast<double>(chunks_.size());
  }
  stats.memory_bytes = memory + model_blob_.size();
  return stats;
}

std::optional<EmbeddingMethod> VectorStore::ActiveMethod() {
  if (!EnsureLoaded()) {
    return std::nullopt;
  }
  std::shared_lock lock(mutex_);
  return active_method_;
}

size_t VectorStore::ChunkCount() {
  if (!EnsureLoaded()) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return chunks_.size();
}

size_t VectorStore::Dimension() {
  if (!EnsureLoaded()) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return dimension_;
}

// ============================================================================
// Persistence
// ============================================================================

Expected<void, Error> VectorStore::Save(const std::string& path) const {
  std::shared_lock lock(mutex_);

  storage::snapshot_v1::SnapshotPayload payload;
  if (active_method_) {
    payload.manifest.active_method = embeddings::MethodToString(*active_method_);
  }
  payload.manifest.dimension = static_cast<uint32_t>(dimension_);
  payload.manifest.chunk_count = chunks_.size();
  payload.manifest.created_at = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());

  if (active_method_ == EmbeddingMethod::kFallback) {
    if (generator_ != nullptr && generator_->Method() == EmbeddingMethod::kFallback && generator_->IsFitted()) {
      auto blob = generator_->ExportModel();
      if (!blob) {
        return MakeUnexpected(blob.error());
      }
      payload.fallback_model = std::move(*blob);
    } else {
      payload.fallback_model = model_blob_;
    }
    if (payload.fallback_model.empty()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kEmbeddingNotFitted, "No fallback model available to save with the corpus", path));
    }
    payload.manifest.model_fingerprint = storage::snapshot_v1::CalculateCRC32(payload.fallback_model);
  }

  payload.chunks = chunks_;
  payload.embeddings = embeddings_;
  payload.index = index_;
  return storage::snapshot_v1::WriteSnapshotV1(path, payload);
}

Expected<void, Error> VectorStore::Load(const std::string& path) {
  std::unique_lock lock(mutex_);
  auto result = LoadLocked(path);
  if (result) {
    load_error_.reset();
    loaded_.store(true, std::memory_order_release);
  }
  return result;
}

Expected<void, Error> VectorStore::LoadLocked(const std::string& path) {
  storage::snapshot_v1::SnapshotPayload payload;
  auto read_result = storage::snapshot_v1::ReadSnapshotV1(path, payload);
  if (!read_result) {
    return read_result;
  }

  const auto method = embeddings::ParseMethod(payload.manifest.active_method);
  if (method && generator_ != nullptr && generator_->Method() != *method) {
    return MakeUnexpected(MakeError(ErrorCode::kSnapshotMethodMismatch,
                                    std::string("Snapshot uses ") + payload.manifest.active_method +
                                        " embeddings, generator uses " +
                                        embeddings::MethodToString(generator_->Method()),
                                    path));
  }

  if (method == EmbeddingMethod::kFallback) {
    if (storage::snapshot_v1::CalculateCRC32(payload.fallback_model) != payload.manifest.model_fingerprint) {
      return MakeUnexpected(
          MakeError(ErrorCode::kSnapshotCorrupted, "Fallback model does not match manifest fingerprint", path));
    }
    if (generator_ != nullptr) {
      if (generator_->IsFitted()) {
        if (generator_->ModelFingerprint() != payload.manifest.model_fingerprint) {
          return MakeUnexpected(MakeError(ErrorCode::kSnapshotModelMismatch,
                                          "Fitted fallback model differs from the snapshot model", path));
        }
      } else {
        auto import_result = generator_->ImportModel(payload.fallback_model);
        if (!import_result) {
          return import_result;
        }
      }
    }
  }

  ClearLocked();
  chunks_ = std::move(payload.chunks);
  embeddings_ = std::move(payload.embeddings);
  index_ = std::move(payload.index);
  terms_.reserve(chunks_.size());
  for (uint32_t position = 0; position < chunks_.size(); ++position) {
    terms_.push_back(KeywordScorer::Analyze(chunks_[position].text));
    positions_.emplace(chunks_[position].id, position);
  }
  if (!chunks_.empty()) {
    active_method_ = method;
    dimension_ = payload.manifest.dimension;
  }
  model_blob_ = std::move(payload.fallback_model);

  utils::StructuredLog()
      .Event("snapshot_restored")
      .Field("filepath", path)
      .Field("chunks", static_cast<uint64_t>(chunks_.size()))
      .Field("method", payload.manifest.active_method)
      .Info();
  return {};
}

// ============================================================================
// Reset
// ============================================================================

void VectorStore::Clear() {
  std::unique_lock lock(mutex_);
  ClearLocked();
  load_error_.reset();
  // A cleared store must not pick up the snapshot afterwards
  loaded_.store(true, std::memory_order_release);
}

void VectorStore::ClearLocked() {
  chunks_.clear();
  embeddings_.clear();
  terms_.clear();
  positions_.clear();
  index_.Clear();
  active_method_.reset();
  dimension_ = 0;
  model_blob_.clear();
}

}  // namespace finrag::vectors
