#include <catch2/catch_test_macros.hpp>
#include "peerdrop/core/result.hpp"
#include "peerdrop/core/failures.hpp"
#include <optional>
#include <stdexcept>
#include <string>
using namespace peerdrop;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr() == "error");
        REQUIRE_THROWS_AS(result.Unwrap(), std::runtime_error);
    }
    SECTION("FromOptional") {
        auto some = Result<int, std::string>::FromOptional(7, "none");
        REQUIRE(some.Unwrap() == 7);
        auto none = Result<int, std::string>::FromOptional(std::nullopt, "none");
        REQUIRE(none.UnwrapErr() == "none");
    }
}
TEST_CASE("Result<T, E> - Map and MapErr", "[result][core]") {
    SECTION("Map transforms Ok value") {
        auto mapped = Result<int, std::string>::Ok(21).Map([](int x) { return x * 2; });
        REQUIRE(mapped.Unwrap() == 42);
    }
    SECTION("MapErr converts the failure type") {
        auto mapped = Result<int, std::string>::Err("disk full").MapErr([](std::string s) {
            return PeerDropFailure::Io(std::move(s));
        });
        REQUIRE(mapped.IsErr());
        REQUIRE(mapped.UnwrapErr().type == PeerDropFailureType::Io);
    }
    SECTION("UnwrapOr falls back on Err") {
        REQUIRE(Result<int, std::string>::Err("x").UnwrapOr(5) == 5);
    }
}
TEST_CASE("Result<T, E> - Try factory", "[result][core]") {
    auto ok = Result<int, PeerDropFailure>::Try(
        [] { return 3; },
        [](const std::exception& ex) { return PeerDropFailure::Connection(ex.what()); });
    REQUIRE(ok.Unwrap() == 3);
    auto failed = Result<Unit, PeerDropFailure>::Try(
        [] { throw std::runtime_error("engine gone"); },
        [](const std::exception& ex) { return PeerDropFailure::Connection(ex.what()); });
    REQUIRE(failed.IsErr());
    REQUIRE(failed.UnwrapErr().message == "engine gone");
}
TEST_CASE("PeerDropFailure - Describe", "[result][core]") {
    REQUIRE(PeerDropFailure::Timeout("").Describe() == "connection timeout");
    REQUIRE(PeerDropFailure::Transfer("chunk 3 missing").Describe() == "transfer error: chunk 3 missing");
    const auto converted = PeerDropFailure::FromSodiumFailure(SodiumFailure::DecodeFailed("bad"));
    REQUIRE(converted.type == PeerDropFailureType::Encryption);
}
