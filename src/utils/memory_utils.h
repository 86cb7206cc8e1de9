/**
 * @file memory_utils.h
 * @brief Process memory reporting for /info and the CLI
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace finrag::utils {

/**
 * @brief Process memory usage information
 */
struct ProcessMemoryInfo {
  uint64_t rss_bytes = 0;       ///< Resident Set Size
  uint64_t virtual_bytes = 0;   ///< Virtual memory size
  uint64_t peak_rss_bytes = 0;  ///< Peak RSS (high water mark)
};

/**
 * @brief Current process memory usage
 *
 * @return std::nullopt when /proc/self/status is unavailable
 */
std::optional<ProcessMemoryInfo> GetProcessMemoryInfo();

/**
 * @brief Human-readable byte count ("512 B", "1.50 KB", "3.20 GB")
 */
std::string FormatBytes(uint64_t bytes);

}  // namespace finrag::utils
