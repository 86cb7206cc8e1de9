/**
 * @file log_setup.cpp
 * @brief Process-wide spdlog configuration
 */

#include "utils/log_setup.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>

#include "utils/structured_log.h"

namespace finrag::utils {

Expected<void, Error> ConfigureLogging(const std::string& level, bool json_format, const std::string& file) {
  spdlog::level::level_enum parsed = spdlog::level::info;
  if (level == "trace") {
    parsed = spdlog::level::trace;
  } else if (level == "debug") {
    parsed = spdlog::level::debug;
  } else if (level == "info") {
    parsed = spdlog::level::info;
  } else if (level == "warn") {
    parsed = spdlog::level::warn;
  } else if (level == "error") {
    parsed = spdlog::level::err;
  } else {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid logging level: " + level));
  }

  StructuredLog::SetFormat(json_format ? LogFormat::JSON : LogFormat::TEXT);

  if (!file.empty()) {
    try {
      std::filesystem::path path(file);
      if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
      }
      auto logger = spdlog::basic_logger_mt("finrag", file);
      spdlog::set_default_logger(logger);
      spdlog::flush_on(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& e) {
      return MakeUnexpected(MakeError(ErrorCode::kInternalError, "Cannot open log file", file + ": " + e.what()));
    } catch (const std::filesystem::filesystem_error& e) {
      return MakeUnexpected(MakeError(ErrorCode::kInternalError, "Cannot create log directory", e.what()));
    }
  }

  spdlog::set_level(parsed);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  return {};
}

}  // namespace finrag::utils
