/**
 * @file main.cpp
 * @brief Entry point for the finragd retrieval server
 */

#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <thread>

#include "config/config.h"
#include "embeddings/embedding_generator.h"
#include "query/entity_extractor.h"
#include "query/query_router.h"
#include "retrieval/retrieval_engine.h"
#include "server/http_server.h"
#include "utils/log_setup.h"
#include "vectors/vector_store.h"
#include "version.h"

namespace {
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kShutdownPollIntervalMs = 100;  // Main loop poll interval

/**
 * @brief Signal handler for graceful shutdown
 *
 * This handler is async-signal-safe: it only sets an atomic flag.
 */
void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested = 1;
  }
}

void PrintConfigSummary(const finrag::config::Config& config) {
  std::cout << "Configuration file is valid\n";
  std::cout << "\nConfiguration summary:\n";
  std::cout << "  Embedding:\n";
  std::cout << "    dimension: " << config.embedding.dimension << "\n";
  std::cout << "    primary.enable: " << (config.embedding.primary.enable ? "true" : "false") << "\n";
  std::cout << "    primary.url: " << config.embedding.primary.url << "\n";
  std::cout << "    primary.model: " << config.embedding.primary.model << "\n";
  std::cout << "  Retrieval:\n";
  std::cout << "    single_entity_budget: " << config.retrieval.single_entity_budget << "\n";
  std::cout << "    multi_entity_budget: " << config.retrieval.multi_entity_budget << "\n";
  std::cout << "    broaden_on_empty: " << (config.retrieval.broaden_on_empty ? "true" : "false") << "\n";
  std::cout << "  Entities:\n";
  std::cout << "    years: " << config.entities.min_year << "-" << config.entities.max_year << "\n";
  std::cout << "    companies: "
            << (config.entities.companies.empty() ? std::string("built-in")
                                                  : std::to_string(config.entities.companies.size()))
            << "\n";
  std::cout << "  Snapshot:\n";
  std::cout << "    path: " << config.SnapshotPath() << "\n";
  std::cout << "  API:\n";
  std::cout << "    http.bind: " << config.api.http.bind << "\n";
  std::cout << "    http.port: " << config.api.http.port << "\n";
}

}  // namespace

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  spdlog::set_level(spdlog::level::info);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      std::cout << "Usage: " << argv[0] << " [OPTIONS] [<config.yaml>]\n";
      std::cout << "       " << argv[0] << " -c <config.yaml> [OPTIONS]\n";
      std::cout << "\n";
      std::cout << "Options:\n";
      std::cout << "  -c, --config <file>            Configuration file path\n";
      std::cout << "  -t, --config-test              Test configuration file and exit\n";
      std::cout << "  -h, --help                     Show this help message\n";
      std::cout << "  -v, --version                  Show version information\n";
      std::cout << "\n";
      std::cout << "Example:\n";
      std::cout << "  " << argv[0] << " -c /etc/finrag/config.yaml\n";
      std::cout << "  " << argv[0] << " examples/config.yaml\n";
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "finragd version " << finrag::Version::String() << "\n";
      std::cout << "Retrieval server for regulatory filings\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg[0] != '-') {
      if (config_path == nullptr) {
        config_path = argv[i];
      } else {
        std::cerr << "Error: Multiple config files specified\n";
        return 1;
      }
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  finrag::config::Config config;
  if (config_path != nullptr) {
    auto config_result = finrag::config::LoadConfig(config_path);
    if (!config_result) {
      spdlog::error("Failed to load config: {}", config_result.error().to_string());
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      PrintConfigSummary(config);
      return 0;
    }
  } else {
    spdlog::info("No configuration file specified, using defaults");
  }

  auto logging = finrag::utils::ConfigureLogging(config.logging.level, config.logging.json, config.logging.file);
  if (!logging) {
    spdlog::error("Failed to configure logging: {}", logging.error().to_string());
    return 1;
  }

  spdlog::info("finragd {} starting...", finrag::Version::String());

  if (!config.api.http.enable) {
    spdlog::error("api.http.enable is false; nothing to serve");
    return 1;
  }

  auto generator = finrag::embeddings::EmbeddingGenerator::Create(config.embedding);
  spdlog::info("Embedding method: {} (dimension {})", finrag::embeddings::MethodToString(generator->Method()),
               generator->Dimension());

  finrag::vectors::VectorStore store(config, generator.get());

  // Restore the snapshot before accepting traffic so that load errors surface at startup
  auto loaded = store.EnsureLoaded();
  if (!loaded) {
    spdlog::error("Failed to load snapshot {}: {}", config.SnapshotPath(), loaded.error().to_string());
    return 1;
  }
  spdlog::info("Corpus ready: {} chunks", store.ChunkCount());

  finrag::retrieval::RetrievalEngine engine(store, config.retrieval);
  finrag::query::EntityExtractor extractor(config.entities);
  finrag::query::QueryRouter router(extractor, &engine, generator.get());

  finrag::server::HandlerContext context;
  context.config = &config;
  context.generator = generator.get();
  context.store = &store;
  context.engine = &engine;
  context.router = &router;

  finrag::server::HttpServer server(finrag::server::HttpServerConfig::FromConfig(config.api), &context);

  auto start_result = server.Start();
  if (!start_result) {
    spdlog::error("Failed to start server: {}", start_result.error().message());
    return 1;
  }

  spdlog::info("Server is running. Press Ctrl+C to stop.");

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(kShutdownPollIntervalMs));
  }

  spdlog::info("Shutdown signal received");

  server.Stop();

  spdlog::info("Server stopped gracefully");

  return 0;
}
