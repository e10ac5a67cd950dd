#include <catch2/catch_test_macros.hpp>
#include "peerdrop/crypto/sodium_interop.hpp"
#include <set>
#include <string>
#include <vector>
using namespace peerdrop;
using namespace peerdrop::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds and is idempotent") {
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::Initialize().IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
}
TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    std::vector<uint8_t> buffer(64, 0xAB);
    REQUIRE(SodiumInterop::SecureWipe(buffer).IsOk());
    for (const uint8_t byte : buffer) {
        REQUIRE(byte == 0);
    }
    std::vector<uint8_t> empty;
    REQUIRE(SodiumInterop::SecureWipe(empty).IsOk());
}
TEST_CASE("SodiumInterop - Random Number Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Requested size is honored") {
        REQUIRE(SodiumInterop::GetRandomBytes(32).size() == 32);
    }
    SECTION("Consecutive draws differ") {
        REQUIRE(SodiumInterop::GetRandomBytes(32) != SodiumInterop::GetRandomBytes(32));
    }
    SECTION("RandomUniform stays below its bound") {
        for (int i = 0; i < 1000; ++i) {
            REQUIRE(SodiumInterop::RandomUniform(7) < 7);
        }
    }
}
TEST_CASE("SodiumInterop - Base64", "[sodium][crypto][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Standard padded alphabet") {
        const std::vector<uint8_t> data = {'p', 'e', 'e', 'r'};
        REQUIRE(SodiumInterop::ToBase64(data) == "cGVlcg==");
    }
    SECTION("Surrounding whitespace is ignored") {
        auto decoded = SodiumInterop::FromBase64("  cGVlcg==\n");
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == std::vector<uint8_t>{'p', 'e', 'e', 'r'});
    }
    SECTION("Invalid input is rejected") {
        REQUIRE(SodiumInterop::FromBase64("not base64!").IsErr());
        REQUIRE(SodiumInterop::FromBase64("").IsErr());
    }
}
