#include "peerdrop/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace peerdrop::logging {

void Configure(const bool verbose) {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::string ToHexTruncated(const std::span<const uint8_t> data, const size_t max_bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() <= max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 16);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

}  // namespace peerdrop::logging
