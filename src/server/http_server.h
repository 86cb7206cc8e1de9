/**
 * @file http_server.h
 * @brief HTTP server for the JSON retrieval API
 */

#pragma once

// Fix for httplib missing NI_MAXHOST on some platforms
#ifndef NI_MAXHOST
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define NI_MAXHOST 1025
#endif

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "config/config.h"
#include "server/server_types.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::server {

/**
 * @brief HTTP server configuration
 */
struct HttpServerConfig {
  std::string bind = "127.0.0.1";
  int port = config::defaults::kHttpPort;
  int read_timeout_sec = 30;
  int write_timeout_sec = 30;
  bool enable_cors = false;
  std::string cors_allow_origin;

  static HttpServerConfig FromConfig(const config::ApiConfig& api) {
    HttpServerConfig server_config;
    server_config.bind = api.http.bind;
    server_config.port = api.http.port;
    server_config.read_timeout_sec = api.http.read_timeout_sec;
    server_config.write_timeout_sec = api.http.write_timeout_sec;
    server_config.enable_cors = api.http.enable_cors;
    server_config.cors_allow_origin = api.http.cors_allow_origin;
    return server_config;
  }
};

/**
 * @brief HTTP server for the JSON retrieval API
 *
 * Endpoints:
 * - POST /query - Route a question and run the chosen retrieval strategy
 * - POST /search - Direct hybrid search with explicit filters
 * - POST /similar - Chunks closest to a stored chunk
 * - POST /sections - Search limited to chunks mentioning section keywords
 * - GET /chunks/:id - Chunk lookup
 * - GET /info - Collection statistics and server counters
 * - GET /health, /health/live, /health/ready - Health checks
 *
 * Handlers run on httplib's worker threads; the store is safe for
 * concurrent readers.
 */
class HttpServer {
 public:
  /**
   * @param config Server configuration
   * @param handler_context Shared components (must outlive the server)
   */
  HttpServer(HttpServerConfig config, HandlerContext* handler_context);

  ~HttpServer();

  // Non-copyable and non-movable (manages server thread)
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  /**
   * @brief Start server (non-blocking)
   * @return kNetworkBindFailed when the port cannot be bound
   */
  utils::Expected<void, utils::Error> Start();

  void Stop();

  bool IsRunning() const { return running_; }

  int GetPort() const { return config_.port; }

  const ServerStats& GetStats() const { return stats_; }

 private:
  HttpServerConfig config_;
  HandlerContext* handler_context_;

  std::atomic<bool> running_{false};

  ServerStats stats_;

  std::unique_ptr<httplib::Server> server_;
  std::unique_ptr<std::thread> server_thread_;

  void SetupRoutes();

  void SetupCors();

  void HandleQuery(const httplib::Request& req, httplib::Response& res);

  void HandleSearch(const httplib::Request& req, httplib::Response& res);

  void HandleSimilar(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief POST /sections: search restricted to chunks mentioning section keywords
   */
  void HandleSections(const httplib::Request& req, httplib::Response& res);

  void HandleChunk(const httplib::Request& req, httplib::Response& res);

  void HandleInfo(const httplib::Request& req, httplib::Response& res);

  void HandleHealth(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Liveness probe, 200 while the process runs
   */
  void HandleHealthLive(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Readiness probe, 503 until the snapshot loaded cleanly
   */
  void HandleHealthReady(const httplib::Request& req, httplib::Response& res);

  /**
   * @brief Send an Error, mapping its code to an HTTP status
   */
  void SendFailure(httplib::Response& res, const utils::Error& error);

  static void SendJson(httplib::Response& res, int status_code, const nlohmann::json& body);

  static void SendError(httplib::Response& res, int status_code, const std::string& message);
};

}  // namespace finrag::server
