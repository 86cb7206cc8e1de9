/**
 * @file log_setup.h
 * @brief Process-wide spdlog configuration
 */

#pragma once

#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::utils {

/**
 * @brief Apply level, structured format and optional file sink
 *
 * @param level trace, debug, info, warn or error
 * @param json_format StructuredLog emits JSON when true, key=value text otherwise
 * @param file Log file path; empty keeps the console logger
 * @return kInvalidArgument for an unknown level, kInternalError when the file cannot be opened
 */
Expected<void, Error> ConfigureLogging(const std::string& level, bool json_format, const std::string& file);

}  // namespace finrag::utils
