/**
 * @file http_server.cpp
 * @brief HTTP server implementation
 */

#include "server/http_server.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <mutex>

#include "embeddings/embedding_generator.h"
#include "query/query_router.h"
#include "retrieval/retrieval_engine.h"
#include "server/response_json.h"
#include "utils/memory_utils.h"
#include "utils/structured_log.h"
#include "vectors/vector_store.h"
#include "version.h"

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
#define NI_MAXHOST 1025
#endif

using json = nlohmann::json;

namespace finrag::server {

namespace {
// HTTP status codes
constexpr int kHttpOk = 200;
constexpr int kHttpNoContent = 204;
constexpr int kHttpBadRequest = 400;
constexpr int kHttpNotFound = 404;
constexpr int kHttpInternalServerError = 500;
constexpr int kHttpServiceUnavailable = 503;

// Server startup delay (milliseconds)
constexpr int kStartupDelayMs = 100;

constexpr size_t kDefaultTopK = 10;
constexpr size_t kMaxTopK = 1000;

int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

/**
 * @brief Read "top_k", clamped to [1, kMaxTopK]
 */
size_t ReadTopK(const json& body, size_t fallback) {
  auto iter = body.find("top_k");
  if (iter == body.end() || !iter->is_number_integer()) {
    return fallback;
  }
  auto value = iter->get<int64_t>();
  if (value < 1) {
    return 1;
  }
  return std::min(static_cast<size_t>(value), kMaxTopK);
}

/**
 * @brief Read an optional string field, "" when absent
 */
utils::Expected<std::string, utils::Error> ReadOptionalString(const json& body, const std::string& key) {
  auto iter = body.find(key);
  if (iter == body.end() || iter->is_null()) {
    return std::string();
  }
  if (!iter->is_string()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, key + " must be a string"));
  }
  return iter->get<std::string>();
}

}  // namespace

HttpServer::HttpServer(HttpServerConfig config, HandlerContext* handler_context)
    : config_(std::move(config)), handler_context_(handler_context) {
  server_ = std::make_unique<httplib::Server>();

  // Set timeouts
  server_->set_read_timeout(config_.read_timeout_sec, 0);
  server_->set_write_timeout(config_.write_timeout_sec, 0);

  SetupRoutes();

  if (config_.enable_cors) {
    SetupCors();
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::SetupRoutes() {
  // Retrieval
  server_->Post("/query", [this](const httplib::Request& req, httplib::Response& res) { HandleQuery(req, res); });
  server_->Post("/search", [this](const httplib::Request& req, httplib::Response& res) { HandleSearch(req, res); });
  server_->Post("/similar",
                [this](const httplib::Request& req, httplib::Response& res) { HandleSimilar(req, res); });
  server_->Post("/sections",
                [this](const httplib::Request& req, httplib::Response& res) { HandleSections(req, res); });
  server_->Get(R"(/chunks/([^/]+))",
               [this](const httplib::Request& req, httplib::Response& res) { HandleChunk(req, res); });

  server_->Get("/info", [this](const httplib::Request& req, httplib::Response& res) { HandleInfo(req, res); });

  // Health check endpoints
  server_->Get("/health", [this](const httplib::Request& req, httplib::Response& res) { HandleHealth(req, res); });
  server_->Get("/health/live",
               [this](const httplib::Request& req, httplib::Response& res) { HandleHealthLive(req, res); });
  server_->Get("/health/ready",
               [this](const httplib::Request& req, httplib::Response& res) { HandleHealthReady(req, res); });
}

void HttpServer::SetupCors() {
  const std::string allow_origin = config_.cors_allow_origin.empty() ? "null" : config_.cors_allow_origin;

  // CORS preflight
  server_->Options(".*", [allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.status = kHttpNoContent;
  });

  // Add CORS headers to all responses
  server_->set_post_routing_handler([allow_origin](const httplib::Request& /*req*/, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
  });
}

utils::Expected<void, utils::Error> HttpServer::Start() {
  using utils::ErrorCode;
  using utils::MakeError;
  using utils::MakeUnexpected;

  if (running_) {
    auto error = MakeError(ErrorCode::kNetworkAlreadyRunning, "HTTP server already running");
    utils::StructuredLog()
        .Event("server_error")
        .Field("operation", "http_server_start")
        .Field("error", error.to_string())
        .Error();
    return MakeUnexpected(error);
  }

  // Set running flag before starting thread to avoid race condition
  running_ = true;

  std::string thread_error;
  std::mutex error_mutex;

  server_thread_ = std::make_unique<std::thread>([this, &thread_error, &error_mutex]() {
    spdlog::info("Starting HTTP server on {}:{}", config_.bind, config_.port);

    if (!server_->listen(config_.bind, config_.port)) {
      std::lock_guard<std::mutex> lock(error_mutex);
      thread_error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
      utils::StructuredLog()
          .Event("server_error")
          .Field("operation", "http_server_listen")
          .Field("bind", config_.bind)
          .Field("port", static_cast<uint64_t>(config_.port))
          .Field("error", thread_error)
          .Error();
      running_ = false;
      return;
    }
  });

  // Wait a bit for server to start
  std::this_thread::sleep_for(std::chrono::milliseconds(kStartupDelayMs));

  if (!running_) {
    if (server_thread_ && server_thread_->joinable()) {
      server_thread_->join();
    }
    std::lock_guard<std::mutex> lock(error_mutex);
    auto error =
        MakeError(ErrorCode::kNetworkBindFailed, thread_error.empty() ? "Failed to start HTTP server" : thread_error);
    return MakeUnexpected(error);
  }

  spdlog::info("HTTP server started successfully on {}:{}", config_.bind, config_.port);
  return {};
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }

  spdlog::info("Stopping HTTP server...");
  running_ = false;

  if (server_) {
    server_->stop();
  }

  if (server_thread_ && server_thread_->joinable()) {
    server_thread_->join();
  }

  spdlog::info("HTTP server stopped");
}

void HttpServer::SendJson(httplib::Response& res, int status_code, const json& body) {
  res.status = status_code;
  res.set_content(body.dump(), "application/json");
}

void HttpServer::SendError(httplib::Response& res, int status_code, const std::string& message) {
  json error_obj;
  error_obj["error"] = message;
  SendJson(res, status_code, error_obj);
}

void HttpServer::SendFailure(httplib::Response& res, const utils::Error& error) {
  stats_.failed_requests.fetch_add(1);

  int status = kHttpInternalServerError;
  switch (error.code()) {
    case utils::ErrorCode::kInvalidArgument:
    case utils::ErrorCode::kVectorDimensionMismatch:
    case utils::ErrorCode::kVectorMethodMismatch:
      status = kHttpBadRequest;
      break;
    case utils::ErrorCode::kChunkNotFound:
    case utils::ErrorCode::kNotFound:
      status = kHttpNotFound;
      break;
    case utils::ErrorCode::kSnapshotCorrupted:
    case utils::ErrorCode::kSnapshotMethodMismatch:
    case utils::ErrorCode::kSnapshotModelMismatch:
    case utils::ErrorCode::kStorageDumpReadError:
      status = kHttpServiceUnavailable;
      break;
    default:
      break;
  }

  json body;
  body["error"] = error.message();
  body["code"] = static_cast<int>(error.code());
  SendJson(res, status, body);
}

//
// Retrieval handlers
//

void HttpServer::HandleQuery(const httplib::Request& req, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);

  try {
    json body = json::parse(req.body);

    auto query_iter = body.find("query");
    if (query_iter == body.end() || !query_iter->is_string()) {
      stats_.failed_requests.fetch_add(1);
      SendError(res, kHttpBadRequest, "Missing required field: query");
      return;
    }

    auto routed = handler_context_->router->Process(query_iter->get<std::string>());
    if (!routed) {
      SendFailure(res, routed.error());
      return;
    }

    stats_.query_requests.fetch_add(1);
    if (routed->retrieval.broadened) {
      stats_.broadened_queries.fetch_add(1);
    }
    SendJson(res, kHttpOk, RoutedQueryToJson(*routed));

  } catch (const json::parse_error& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpBadRequest, "Invalid JSON: " + std::string(e.what()));
  } catch (const std::exception& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
  }
}

void HttpServer::HandleSearch(const httplib::Request& req, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);

  try {
    json body = json::parse(req.body);

    auto query_iter = body.find("query");
    if (query_iter == body.end() || !query_iter->is_string()) {
      stats_.failed_requests.fetch_add(1);
      SendError(res, kHttpBadRequest, "Missing required field: query");
      return;
    }
    const std::string query_text = query_iter->get<std::string>();

    vectors::SearchOptions options;
    options.top_k = ReadTopK(body, kDefaultTopK);
    auto date_from = ReadOptionalString(body, "date_from");
    if (!date_from) {
      SendFailure(res, date_from.error());
      return;
    }
    auto date_to = ReadOptionalString(body, "date_to");
    if (!date_to) {
      SendFailure(res, date_to.error());
      return;
    }
    options.date_from = std::move(*date_from);
    options.date_to = std::move(*date_to);
    if (body.contains("apply_threshold")) {
      if (!body["apply_threshold"].is_boolean()) {
        SendFailure(res, utils::MakeError(utils::ErrorCode::kInvalidArgument, "apply_threshold must be a boolean"));
        return;
      }
      options.apply_threshold = body["apply_threshold"].get<bool>();
    }
    if (body.contains("min_quality") && body["min_quality"].is_number()) {
      options.min_quality = body["min_quality"].get<double>();
    }
    if (body.contains("filter")) {
      auto filter = ParseFilter(body["filter"]);
      if (!filter) {
        SendFailure(res, filter.error());
        return;
      }
      options.filter = std::move(*filter);
    }

    auto loaded = handler_context_->store->EnsureLoaded();
    if (!loaded) {
      SendFailure(res, loaded.error());
      return;
    }

    stats_.search_requests.fetch_add(1);
    if (!handler_context_->generator->IsFitted()) {
      SendJson(res, kHttpOk, SearchResponseToJson(vectors::SearchResponse{}));
      return;
    }

    auto query_vector = handler_context_->generator->EmbedOne(query_text);
    if (!query_vector) {
      SendFailure(res, query_vector.error());
      return;
    }

    auto response = handler_context_->store->Search(*query_vector, query_text, options);
    if (!response) {
      SendFailure(res, response.error());
      return;
    }
    SendJson(res, kHttpOk, SearchResponseToJson(*response));

  } catch (const json::parse_error& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpBadRequest, "Invalid JSON: " + std::string(e.what()));
  } catch (const std::exception& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
  }
}

void HttpServer::HandleSimilar(const httplib::Request& req, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);

  try {
    json body = json::parse(req.body);

    auto id_iter = body.find("chunk_id");
    if (id_iter == body.end() || !id_iter->is_string()) {
      stats_.failed_requests.fetch_add(1);
      SendError(res, kHttpBadRequest, "Missing required field: chunk_id");
      return;
    }

    auto similar = handler_context_->store->FindSimilar(id_iter->get<std::string>(), ReadTopK(body, kDefaultTopK));
    if (!similar) {
      SendFailure(res, similar.error());
      return;
    }

    stats_.similar_requests.fetch_add(1);

    json response;
    response["status"] = "ok";
    response["count"] = similar->size();
    json results = json::array();
    for (const auto& hit : *similar) {
      results.push_back(ResultToJson(hit));
    }
    response["results"] = std::move(results);
    SendJson(res, kHttpOk, response);

  } catch (const json::parse_error& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpBadRequest, "Invalid JSON: " + std::string(e.what()));
  } catch (const std::exception& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
  }
}

void HttpServer::HandleSections(const httplib::Request& req, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);

  try {
    json body = json::parse(req.body);

    auto query_iter = body.find("query");
    auto keywords_iter = body.find("keywords");
    if (query_iter == body.end() || !query_iter->is_string() || keywords_iter == body.end() ||
        !keywords_iter->is_array()) {
      stats_.failed_requests.fetch_add(1);
      SendError(res, kHttpBadRequest, "Required fields: query (string), keywords (array of strings)");
      return;
    }
    std::vector<std::string> keywords;
    for (const auto& keyword : *keywords_iter) {
      if (!keyword.is_string()) {
        SendFailure(res, utils::MakeError(utils::ErrorCode::kInvalidArgument, "keywords must be strings"));
        return;
      }
      keywords.push_back(keyword.get<std::string>());
    }
    const std::string query_text = query_iter->get<std::string>();

    auto loaded = handler_context_->store->EnsureLoaded();
    if (!loaded) {
      SendFailure(res, loaded.error());
      return;
    }

    stats_.search_requests.fetch_add(1);
    if (!handler_context_->generator->IsFitted()) {
      SendJson(res, kHttpOk, RetrievalToJson(retrieval::RetrievalResult{}));
      return;
    }

    auto query_vector = handler_context_->generator->EmbedOne(query_text);
    if (!query_vector) {
      SendFailure(res, query_vector.error());
      return;
    }

    auto result =
        handler_context_->engine->SearchBySection(*query_vector, query_text, keywords, ReadTopK(body, kDefaultTopK));
    if (!result) {
      SendFailure(res, result.error());
      return;
    }
    SendJson(res, kHttpOk, RetrievalToJson(*result));

  } catch (const json::parse_error& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpBadRequest, "Invalid JSON: " + std::string(e.what()));
  } catch (const std::exception& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
  }
}

void HttpServer::HandleChunk(const httplib::Request& req, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);

  const std::string chunk_id = req.matches[1];
  auto chunk = handler_context_->store->GetChunk(chunk_id);
  if (!chunk) {
    SendFailure(res, utils::MakeError(utils::ErrorCode::kChunkNotFound, "Chunk not found: " + chunk_id));
    return;
  }
  stats_.chunk_requests.fetch_add(1);
  SendJson(res, kHttpOk, ChunkToJson(*chunk));
}

//
// Info and health handlers
//

void HttpServer::HandleInfo(const httplib::Request& /*req*/, httplib::Response& res) {
  stats_.total_requests.fetch_add(1);
  stats_.info_requests.fetch_add(1);

  try {
    json response;

    response["server"] = "finragd";
    response["version"] = Version::String();
    response["uptime_seconds"] = stats_.GetUptimeSeconds();

    response["requests"] = {{"total", stats_.total_requests.load()},
                            {"failed", stats_.failed_requests.load()},
                            {"query", stats_.query_requests.load()},
                            {"search", stats_.search_requests.load()},
                            {"similar", stats_.similar_requests.load()},
                            {"chunk", stats_.chunk_requests.load()},
                            {"info", stats_.info_requests.load()},
                            {"broadened_queries", stats_.broadened_queries.load()},
                            {"per_second", stats_.GetQueriesPerSecond()}};

    auto loaded = handler_context_->store->EnsureLoaded();
    if (!loaded) {
      response["store_error"] = loaded.error().message();
    }

    auto stats = handler_context_->store->GetStatistics();
    response["collection"] = StatisticsToJson(stats);

    const auto* generator = handler_context_->generator;
    response["embedding"] = {{"method", embeddings::MethodToString(generator->Method())},
                             {"dimension", generator->Dimension()},
                             {"fitted", generator->IsFitted()},
                             {"model_fingerprint", generator->ModelFingerprint()}};

    json memory;
    memory["store_bytes"] = stats.memory_bytes;
    memory["store_human"] = utils::FormatBytes(stats.memory_bytes);
    auto process = utils::GetProcessMemoryInfo();
    if (process) {
      memory["process_rss_bytes"] = process->rss_bytes;
      memory["process_rss_human"] = utils::FormatBytes(process->rss_bytes);
      memory["process_peak_rss_human"] = utils::FormatBytes(process->peak_rss_bytes);
    }
    response["memory"] = memory;

    SendJson(res, kHttpOk, response);
  } catch (const std::exception& e) {
    stats_.failed_requests.fetch_add(1);
    SendError(res, kHttpInternalServerError, "Internal error: " + std::string(e.what()));
  }
}

void HttpServer::HandleHealth(const httplib::Request& /*req*/, httplib::Response& res) {
  json response;
  response["status"] = "ok";
  response["timestamp"] = NowSeconds();
  SendJson(res, kHttpOk, response);
}

void HttpServer::HandleHealthLive(const httplib::Request& /*req*/, httplib::Response& res) {
  json response;
  response["status"] = "alive";
  response["timestamp"] = NowSeconds();
  SendJson(res, kHttpOk, response);
}

void HttpServer::HandleHealthReady(const httplib::Request& /*req*/, httplib::Response& res) {
  auto loaded = handler_context_->store->EnsureLoaded();

  json response;
  response["timestamp"] = NowSeconds();
  if (loaded) {
    response["status"] = "ready";
    response["chunks"] = handler_context_->store->ChunkCount();
    SendJson(res, kHttpOk, response);
  } else {
    response["status"] = "not_ready";
    response["reason"] = loaded.error().message();
    SendJson(res, kHttpServiceUnavailable, response);
  }
}

}  // namespace finrag::server
