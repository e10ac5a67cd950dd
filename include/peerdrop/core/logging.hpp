#pragma once

/**
 * @file logging.hpp
 * @brief Process-wide logging setup on top of spdlog.
 *
 * Library code logs through the spdlog default logger:
 * debug for wire traffic, info for milestones, warn for input that
 * was dropped or ignored. Only the application layer logs at error.
 */

#include <cstdint>
#include <span>
#include <string>

namespace peerdrop::logging {

/**
 * @brief Installs the console pattern and level.
 *
 * @param verbose Lower the threshold from info to debug.
 */
void Configure(bool verbose);

/**
 * @brief Converts bytes to lowercase hex, truncated for large buffers.
 */
std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 32);

}  // namespace peerdrop::logging
