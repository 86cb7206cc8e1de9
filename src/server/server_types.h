/**
 * @file server_types.h
 * @brief Common server type definitions for finragd
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <ctime>

#include "config/config.h"

namespace finrag {
namespace embeddings {
class EmbeddingGenerator;
}  // namespace embeddings

namespace vectors {
class VectorStore;
}  // namespace vectors

namespace retrieval {
class RetrievalEngine;
}  // namespace retrieval

namespace query {
class QueryRouter;
}  // namespace query
}  // namespace finrag

namespace finrag::server {

/**
 * @brief Thread-safe server statistics tracker
 *
 * Uses std::atomic for thread-safe counter updates without locks.
 */
struct ServerStats {
  // Server start time (Unix timestamp)
  uint64_t start_time = static_cast<uint64_t>(std::time(nullptr));

  std::atomic<uint64_t> total_requests{0};
  std::atomic<uint64_t> failed_requests{0};
  std::atomic<uint64_t> query_requests{0};
  std::atomic<uint64_t> search_requests{0};
  std::atomic<uint64_t> similar_requests{0};
  std::atomic<uint64_t> chunk_requests{0};
  std::atomic<uint64_t> info_requests{0};
  std::atomic<uint64_t> broadened_queries{0};

  uint64_t GetUptimeSeconds() const { return static_cast<uint64_t>(std::time(nullptr)) - start_time; }

  /**
   * @brief Get queries per second
   */
  double GetQueriesPerSecond() const {
    uint64_t uptime = GetUptimeSeconds();
    if (uptime == 0) {
      return 0.0;
    }
    return static_cast<double>(total_requests.load()) / static_cast<double>(uptime);
  }
};

/**
 * @brief Components shared by the request handlers
 *
 * Owned by the caller (finragd main); must outlive the server.
 */
struct HandlerContext {
  const config::Config* config = nullptr;
  embeddings::EmbeddingGenerator* generator = nullptr;
  vectors::VectorStore* store = nullptr;
  retrieval::RetrievalEngine* engine = nullptr;
  query::QueryRouter* router = nullptr;
};

}  // namespace finrag::server
