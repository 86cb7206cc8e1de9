/**
 * @file finrag-cli.cpp
 * @brief Command-line tool for ingestion, retrieval and snapshot maintenance
 *
 * Operates on the snapshot named by the configuration, in-process.
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Try to use readline if available
#ifdef HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define USE_READLINE 1
#endif

#include "config/config.h"
#include "embeddings/embedding_generator.h"
#include "ingest/ingest_pipeline.h"
#include "query/entity_extractor.h"
#include "query/query_router.h"
#include "retrieval/retrieval_engine.h"
#include "server/response_json.h"
#include "storage/snapshot_format_v1.h"
#include "utils/log_setup.h"
#include "utils/memory_utils.h"
#include "utils/string_utils.h"
#include "vectors/vector_store.h"
#include "version.h"

namespace {

using json = nlohmann::json;

constexpr size_t kDefaultSimilarTopK = 5;
constexpr size_t kPreviewLength = 160;

#ifdef USE_READLINE
// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,cppcoreguidelines-avoid-non-const-global-variables)
const char* command_list[] = {"ingest", "query", "route", "chunk", "similar", "info",
                              "verify", "save",  "quit",  "exit",  "help",    nullptr};

/**
 * @brief Command name generator for readline completion
 */
char* CommandGenerator(const char* text, int state) {
  static int list_index;
  static int len;
  const char* name = nullptr;

  if (state == 0) {
    list_index = 0;
    len = static_cast<int>(strlen(text));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-constant-array-index)
  while ((name = command_list[list_index++]) != nullptr) {
    if (strncasecmp(name, text, len) == 0) {
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      return strdup(name);
    }
  }

  return nullptr;
}

char** CommandCompletion(const char* text, int start, int /* end */) {
  // Complete command names only; arguments fall back to filename completion
  if (start != 0) {
    return nullptr;
  }
  rl_attempted_completion_over = 1;
  return rl_completion_matches(text, CommandGenerator);
}
#endif

std::string Preview(const std::string& text) {
  if (text.size() <= kPreviewLength) {
    return text;
  }
  return text.substr(0, kPreviewLength) + "...";
}

struct CliOptions {
  std::string config_path;
  bool json_output = false;
  bool interactive = true;
};

/**
 * @brief In-process shell over one corpus
 */
class FinragShell {
 public:
  FinragShell(finrag::config::Config config, bool json_output)
      : config_(std::move(config)),
        json_output_(json_output),
        generator_(finrag::embeddings::EmbeddingGenerator::Create(config_.embedding)),
        store_(config_, generator_.get()),
        engine_(store_, config_.retrieval),
        extractor_(config_.entities),
        router_(extractor_, &engine_, generator_.get()) {}

  /**
   * @brief Execute one command line
   * @return false when the command failed
   */
  bool Execute(const std::string& line) {
    std::string command;
    std::string rest;
    auto space = line.find_first_of(" \t");
    if (space == std::string::npos) {
      command = line;
    } else {
      command = line.substr(0, space);
      rest = finrag::utils::Trim(line.substr(space + 1));
    }
    command = finrag::utils::ToLower(command);

    if (command == "ingest") {
      return Ingest(rest);
    }
    if (command == "query") {
      return Query(rest);
    }
    if (command == "route") {
      return Route(rest);
    }
    if (command == "chunk") {
      return Chunk(rest);
    }
    if (command == "similar") {
      return Similar(rest);
    }
    if (command == "info") {
      return Info();
    }
    if (command == "verify") {
      return Verify(rest.empty() ? config_.SnapshotPath() : rest);
    }
    if (command == "save") {
      return Save(rest.empty() ? config_.SnapshotPath() : rest);
    }
    if (command == "help") {
      PrintHelp();
      return true;
    }
    std::cout << "(error) Unknown command: " << command << " (type 'help')\n";
    return false;
  }

  void RunInteractive() {
    std::cout << "finrag-cli " << finrag::Version::String() << " (" << config_.SnapshotPath() << ")\n";
    std::cout << "Type 'quit' or 'exit' to exit, 'help' for help\n\n";

#ifdef USE_READLINE
    rl_attempted_completion_function = CommandCompletion;
#endif

    while (true) {
      std::string line;

#ifdef USE_READLINE
      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      char* raw_input = readline("finrag> ");
      if (raw_input == nullptr) {
        // EOF (Ctrl-D)
        std::cout << '\n';
        break;
      }

      // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
      std::unique_ptr<char, decltype(&free)> input(raw_input, &free);
      line = finrag::utils::Trim(input.get());
      if (!line.empty()) {
        add_history(input.get());
      }
#else
      std::cout << "finrag> ";
      std::cout.flush();
      if (!std::getline(std::cin, line)) {
        break;  // EOF
      }
      line = finrag::utils::Trim(line);
#endif

      if (line.empty()) {
        continue;
      }
      if (line == "quit" || line == "exit") {
        std::cout << "Bye!\n";
        break;
      }
      Execute(line);
    }
  }

 private:
  finrag::config::Config config_;
  bool json_output_;
  std::unique_ptr<finrag::embeddings::EmbeddingGenerator> generator_;
  finrag::vectors::VectorStore store_;
  finrag::retrieval::RetrievalEngine engine_;
  finrag::query::EntityExtractor extractor_;
  finrag::query::QueryRouter router_;

  static void PrintError(const finrag::utils::Error& error) {
    std::cout << "(error) " << error.to_string() << '\n';
  }

  static void PrintHelp() {
    std::cout << "Available commands:\n";
    std::cout << "  ingest <chunks.jsonl>     - Load, embed and store chunks, then save the snapshot\n";
    std::cout << "  query <text>              - Route a question and retrieve context\n";
    std::cout << "  route <text>              - Show the routing decision only\n";
    std::cout << "  chunk <id>                - Show a stored chunk\n";
    std::cout << "  similar <id> [top_k]      - Chunks closest to a stored chunk\n";
    std::cout << "  info                      - Collection statistics\n";
    std::cout << "  verify [path]             - Check snapshot integrity\n";
    std::cout << "  save [path]               - Write the snapshot\n";
    std::cout << '\n';
    std::cout << "Examples:\n";
    std::cout << "  ingest data/chunks.jsonl\n";
    std::cout << "  query Compare Apple and Microsoft revenue growth\n";
    std::cout << "  query What are Tesla's risk factors in 2023?\n";
  }

  void PrintResults(const std::vector<finrag::vectors::SearchResult>& results) const {
    for (size_t i = 0; i < results.size(); ++i) {
      const auto& hit = results[i];
      std::cout << (i + 1) << ") " << hit.chunk_id << " [" << hit.metadata.ticker << " " << hit.metadata.filing_type
                << " " << hit.metadata.filing_date;
      if (!hit.metadata.section_type.empty()) {
        std::cout << " " << hit.metadata.section_type;
      }
      std::cout << "] score=" << hit.combined_score << " (semantic " << hit.semantic_score << ", keyword "
                << hit.keyword_score << ")\n";
      std::cout << "   " << Preview(hit.text) << '\n';
    }
  }

  static void PrintDecision(const finrag::query::RoutingDecision& decision) {
    std::cout << "type: " << finrag::query::QueryTypeToString(decision.type) << '\n';
    std::cout << "strategy: " << finrag::retrieval::StrategyToString(decision.strategy) << '\n';
    std::cout << "complexity: " << finrag::query::ComplexityToString(decision.complexity) << '\n';
    std::cout << "approach: " << decision.hints.approach << '\n';
    std::cout << "context: " << finrag::server::ContextToJson(decision.context).dump() << '\n';
  }

  bool Ingest(const std::string& path) {
    if (path.empty()) {
      std::cout << "(error) ingest requires a file path\n";
      return false;
    }
    finrag::ingest::IngestPipeline pipeline(*generator_, store_);
    auto report = pipeline.IngestFile(path);
    if (!report) {
      PrintError(report.error());
      return false;
    }

    bool saved = true;
    if (report->store.added > 0) {
      auto save = store_.Save(config_.SnapshotPath());
      if (!save) {
        PrintError(save.error());
        saved = false;
      }
    }

    if (json_output_) {
      json output;
      output["lines"] = report->load.lines;
      output["loaded"] = report->load.loaded;
      output["skipped_malformed"] = report->load.skipped;
      output["added"] = report->store.added;
      output["skipped_invalid"] = report->store.skipped_invalid;
      output["skipped_duplicate"] = report->store.skipped_duplicate;
      output["skipped_embedding_failed"] = report->store.skipped_embedding_failed;
      output["model_fitted"] = report->model_fitted;
      output["warnings"] = report->load.warnings;
      for (const auto& warning : report->store.warnings) {
        output["warnings"].push_back(warning);
      }
      std::cout << output.dump(2) << '\n';
    } else {
      std::cout << "lines: " << report->load.lines << ", added: " << report->store.added
                << ", malformed: " << report->load.skipped << ", invalid: " << report->store.skipped_invalid
                << ", duplicate: " << report->store.skipped_duplicate
                << ", embedding failed: " << report->store.skipped_embedding_failed << '\n';
      if (report->model_fitted) {
        std::cout << "fallback model fitted on " << report->load.loaded << " chunks\n";
      }
      for (const auto& warning : report->load.warnings) {
        std::cout << "  warning: " << warning << '\n';
      }
      for (const auto& warning : report->store.warnings) {
        std::cout << "  warning: " << warning << '\n';
      }
    }
    return saved;
  }

  bool Query(const std::string& text) {
    auto routed = router_.Process(text);
    if (!routed) {
      PrintError(routed.error());
      return false;
    }
    if (json_output_) {
      std::cout << finrag::server::RoutedQueryToJson(*routed).dump(2) << '\n';
      return true;
    }

    PrintDecision(routed->decision);
    const auto& retrieval = routed->retrieval;
    std::cout << "status: " << finrag::vectors::SearchStatusToString(retrieval.status);
    if (retrieval.broadened) {
      std::cout << " (broadened)";
    }
    if (retrieval.degraded) {
      std::cout << " (degraded)";
    }
    std::cout << ", " << retrieval.results.size() << " results\n";
    for (const auto& [ticker, count] : retrieval.per_ticker_counts) {
      std::cout << "  " << ticker << ": " << count << '\n';
    }
    PrintResults(retrieval.results);
    return true;
  }

  bool Route(const std::string& text) const {
    auto decision = router_.Route(text);
    if (json_output_) {
      std::cout << finrag::server::DecisionToJson(decision).dump(2) << '\n';
    } else {
      PrintDecision(decision);
    }
    return true;
  }

  bool Chunk(const std::string& chunk_id) {
    auto chunk = store_.GetChunk(chunk_id);
    if (!chunk) {
      std::cout << "(error) Chunk not found: " << chunk_id << '\n';
      return false;
    }
    std::cout << finrag::server::ChunkToJson(*chunk).dump(2) << '\n';
    return true;
  }

  bool Similar(const std::string& args) {
    std::istringstream iss(args);
    std::string chunk_id;
    size_t top_k = kDefaultSimilarTopK;
    iss >> chunk_id;
    if (chunk_id.empty()) {
      std::cout << "(error) similar requires a chunk id\n";
      return false;
    }
    if (!(iss >> top_k) || top_k == 0) {
      top_k = kDefaultSimilarTopK;
    }

    auto similar = store_.FindSimilar(chunk_id, top_k);
    if (!similar) {
      PrintError(similar.error());
      return false;
    }
    if (json_output_) {
      json results = json::array();
      for (const auto& hit : *similar) {
        results.push_back(finrag::server::ResultToJson(hit));
      }
      std::cout << results.dump(2) << '\n';
    } else {
      PrintResults(*similar);
    }
    return true;
  }

  bool Info() {
    auto loaded = store_.EnsureLoaded();
    if (!loaded) {
      PrintError(loaded.error());
      return false;
    }
    json output = finrag::server::StatisticsToJson(store_.GetStatistics());
    output["snapshot"] = config_.SnapshotPath();
    output["embedding"] = {{"configured_method", finrag::embeddings::MethodToString(generator_->Method())},
                           {"fitted", generator_->IsFitted()}};
    auto process = finrag::utils::GetProcessMemoryInfo();
    if (process) {
      output["process_rss"] = finrag::utils::FormatBytes(process->rss_bytes);
    }
    std::cout << output.dump(2) << '\n';
    return true;
  }

  static bool Verify(const std::string& path) {
    finrag::storage::snapshot_format::IntegrityError integrity;
    auto verified = finrag::storage::snapshot_v1::VerifySnapshotIntegrity(path, integrity);
    if (!verified) {
      PrintError(verified.error());
      if (integrity.HasError()) {
        std::cout << "  section: " << (integrity.section.empty() ? "-" : integrity.section)
                  << ", detail: " << integrity.message << '\n';
      }
      return false;
    }

    finrag::storage::snapshot_v1::SnapshotInfo info;
    auto described = finrag::storage::snapshot_v1::GetSnapshotInfo(path, info);
    if (!described) {
      PrintError(described.error());
      return false;
    }
    std::cout << "OK " << path << '\n';
    std::cout << "  version: " << info.version << ", size: " << finrag::utils::FormatBytes(info.file_size) << '\n';
    std::cout << "  method: " << (info.manifest.active_method.empty() ? "-" : info.manifest.active_method)
              << ", dimension: " << info.manifest.dimension << ", chunks: " << info.manifest.chunk_count << '\n';
    return true;
  }

  bool Save(const std::string& path) {
    auto loaded = store_.EnsureLoaded();
    if (!loaded) {
      PrintError(loaded.error());
      return false;
    }
    auto saved = store_.Save(path);
    if (!saved) {
      PrintError(saved.error());
      return false;
    }
    std::cout << "OK saved " << store_.ChunkCount() << " chunks to " << path << '\n';
    return true;
  }
};

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] [COMMAND [ARGS...]]\n";
  std::cout << '\n';
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>   Configuration file (default: built-in defaults)\n";
  std::cout << "  --json                Print machine-readable JSON\n";
  std::cout << "  --help                Show this help\n";
  std::cout << "  --version             Show version information\n";
  std::cout << '\n';
  std::cout << "Examples:\n";
  std::cout << "  " << program_name << " -c config.yaml                        # Interactive mode\n";
  std::cout << "  " << program_name << " -c config.yaml ingest chunks.jsonl\n";
  std::cout << "  " << program_name << " -c config.yaml query \"Apple risk factors 2023\"\n";
  std::cout << "  " << program_name << " -c config.yaml verify\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  // Line-buffered stdout so piped output is not lost on exit
  std::setvbuf(stdout, nullptr, _IOLBF, 0);

  CliOptions options;
  std::vector<std::string> command_args;

  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help") {
      PrintUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      return 0;
    }
    if (arg == "--version") {
      std::cout << "finrag-cli version " << finrag::Version::String() << '\n';
      return 0;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        options.config_path = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      } else {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
    } else if (arg == "--json") {
      options.json_output = true;
    } else {
      // Remaining args are a command
      for (int j = i; j < argc; ++j) {
        command_args.emplace_back(argv[j]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      options.interactive = false;
      break;
    }
  }

  finrag::config::Config config;
  if (!options.config_path.empty()) {
    auto loaded = finrag::config::LoadConfig(options.config_path);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().to_string() << '\n';
      return 1;
    }
    config = *loaded;
  }

  // Diagnostics go to the log file, or to the console at warn level
  std::string level = config.logging.file.empty() ? "warn" : config.logging.level;
  auto logging = finrag::utils::ConfigureLogging(level, config.logging.json, config.logging.file);
  if (!logging) {
    std::cerr << "Error: " << logging.error().to_string() << '\n';
    return 1;
  }

  FinragShell shell(config, options.json_output);

  if (options.interactive) {
    shell.RunInteractive();
    return 0;
  }

  std::ostringstream command;
  for (size_t i = 0; i < command_args.size(); ++i) {
    if (i > 0) {
      command << " ";
    }
    command << command_args[i];
  }
  return shell.Execute(command.str()) ? 0 : 1;
}
