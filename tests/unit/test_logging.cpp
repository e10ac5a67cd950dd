#include <catch2/catch_test_macros.hpp>
#include "peerdrop/core/logging.hpp"
#include <spdlog/spdlog.h>
#include <vector>
using namespace peerdrop;
TEST_CASE("Logging - Hex rendering", "[logging]") {
    SECTION("Short buffers are shown whole") {
        const std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
        REQUIRE(logging::ToHexTruncated(data) == "000fa5ff");
        REQUIRE(logging::ToHexTruncated(std::vector<uint8_t>{}).empty());
    }
    SECTION("Long buffers are truncated with their size") {
        const std::vector<uint8_t> data(40, 0xab);
        REQUIRE(logging::ToHexTruncated(data, 2) == "abab...(40 bytes)");
    }
}
TEST_CASE("Logging - Configure sets the threshold", "[logging]") {
    logging::Configure(true);
    REQUIRE(spdlog::get_level() == spdlog::level::debug);
    logging::Configure(false);
    REQUIRE(spdlog::get_level() == spdlog::level::info);
}
