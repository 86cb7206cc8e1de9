/**
 * @file memory_utils.cpp
 * @brief Process memory reporting
 */

#include "utils/memory_utils.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace finrag::utils {

namespace {
constexpr uint64_t kBytesPerKB = 1024;
}  // namespace

std::optional<ProcessMemoryInfo> GetProcessMemoryInfo() {
  ProcessMemoryInfo info;

#ifdef __linux__
  std::ifstream status("/proc/self/status");
  if (!status) {
    spdlog::debug("Cannot open /proc/self/status");
    return std::nullopt;
  }

  std::string line;
  while (std::getline(status, line)) {
    std::istringstream iss(line);
    std::string key;
    uint64_t value = 0;
    iss >> key >> value;
    value *= kBytesPerKB;

    if (key == "VmRSS:") {
      info.rss_bytes = value;
    } else if (key == "VmSize:") {
      info.virtual_bytes = value;
    } else if (key == "VmHWM:") {
      info.peak_rss_bytes = value;
    }
  }

  if (info.rss_bytes == 0) {
    spdlog::debug("Failed to parse RSS from /proc/self/status");
    return std::nullopt;
  }
  return info;
#else
  return std::nullopt;
#endif
}

std::string FormatBytes(uint64_t bytes) {
  static constexpr std::array<const char*, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};
  if (bytes < kBytesPerKB) {
    return std::to_string(bytes) + " B";
  }
  auto value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= static_cast<double>(kBytesPerKB) && unit + 1 < kUnits.size()) {
    value /= static_cast<double>(kBytesPerKB);
    ++unit;
  }
  std::array<char, 32> buffer{};
  std::snprintf(buffer.data(), buffer.size(), "%.2f %s", value, kUnits[unit]);
  return buffer.data();
}

}  // namespace finrag::utils
