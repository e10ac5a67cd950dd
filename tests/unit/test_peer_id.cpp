#include <catch2/catch_test_macros.hpp>
#include "peerdrop/identity/peer_id.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include <regex>
#include <set>
#include <string>
using namespace peerdrop;
using namespace peerdrop::identity;
TEST_CASE("PeerId - Validation", "[identity]") {
    SECTION("Accepted forms") {
        REQUIRE(PeerId::IsValid("a"));
        REQUIRE(PeerId::IsValid("happy-tiger-moon"));
        REQUIRE(PeerId::IsValid("peer_42-x"));
        REQUIRE(PeerId::IsValid(std::string(64, 'z')));
    }
    SECTION("Rejected forms") {
        REQUIRE_FALSE(PeerId::IsValid(""));
        REQUIRE_FALSE(PeerId::IsValid("-abc"));
        REQUIRE_FALSE(PeerId::IsValid("abc-"));
        REQUIRE_FALSE(PeerId::IsValid("_abc"));
        REQUIRE_FALSE(PeerId::IsValid("ab cd"));
        REQUIRE_FALSE(PeerId::IsValid("ab/cd"));
        REQUIRE_FALSE(PeerId::IsValid("caf\xC3\xA9"));
        REQUIRE_FALSE(PeerId::IsValid(std::string(65, 'z')));
    }
    SECTION("Parse reports InvalidPeerId") {
        auto parsed = PeerId::Parse("abc-");
        REQUIRE(parsed.IsErr());
        REQUIRE(parsed.UnwrapErr().type == PeerDropFailureType::InvalidPeerId);
        REQUIRE(PeerId::Parse("swift-falcon").Unwrap().Value() == "swift-falcon");
    }
}
TEST_CASE("PeerId - Generation", "[identity]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::regex shape("^[a-z]+-[a-z]+-[a-z]+$");
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto id = PeerId::Generate();
        REQUIRE(PeerId::IsValid(id.Value()));
        REQUIRE(std::regex_match(id.Value(), shape));
        seen.insert(id.Value());
    }
    REQUIRE(seen.size() > 150);
}
TEST_CASE("PeerId - Connection ids and tokens", "[identity]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const std::regex uuid_v4("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    const auto token = GenerateToken();
    const auto connection_id = GenerateConnectionId();
    REQUIRE(std::regex_match(token, uuid_v4));
    REQUIRE(std::regex_match(connection_id, uuid_v4));
    REQUIRE(token != connection_id);
}
