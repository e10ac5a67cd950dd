#include "peerdrop/identity/peer_id.hpp"
#include "peerdrop/crypto/sodium_interop.hpp"
#include "peerdrop/core/constants.hpp"

#include <array>
#include <cctype>

namespace peerdrop::identity {

namespace {

constexpr std::array<std::string_view, 60> kAdjectives = {
    "happy", "sunny", "brave", "calm", "cool", "cute", "fast", "kind", "neat", "nice",
    "quiet", "smart", "soft", "warm", "wild", "wise", "bold", "bright", "clean", "clever",
    "cozy", "eager", "fair", "fancy", "gentle", "glad", "golden", "grand", "great", "jolly",
    "keen", "lively", "lucky", "merry", "mighty", "noble", "proud", "pure", "quick", "rapid",
    "rich", "royal", "sharp", "shiny", "silver", "simple", "smooth", "snowy", "spicy", "steady",
    "strong", "super", "sweet", "swift", "tender", "tiny", "vivid", "witty", "young", "zesty",
};

constexpr std::array<std::string_view, 61> kNouns = {
    "apple", "banana", "cherry", "dolphin", "eagle", "falcon", "grape", "harbor", "island", "jungle",
    "kitten", "lemon", "mango", "nectar", "orange", "panda", "quartz", "rabbit", "sunset", "tiger",
    "umbrella", "violet", "walrus", "xenon", "yellow", "zebra", "anchor", "breeze", "castle", "dragon",
    "ember", "forest", "glacier", "horizon", "indigo", "jasper", "kraken", "lantern", "meadow", "nebula",
    "ocean", "phoenix", "quasar", "river", "shadow", "thunder", "unicorn", "vortex", "willow", "crystal",
    "dusk", "echo", "flame", "glow", "haze", "iris", "jewel", "karma", "lotus", "moon",
    "nova",
};

template<size_t N>
std::string_view Pick(const std::array<std::string_view, N>& words) {
    return words[crypto::SodiumInterop::RandomUniform(static_cast<uint32_t>(N))];
}

bool IsAsciiAlnum(const char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x80 && std::isalnum(u) != 0;
}

// RFC 4122 version 4 layout: 8-4-4-4-12 hex digits.
std::string RandomUuid() {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto bytes = crypto::SodiumInterop::GetRandomBytes(16);
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex_chars[bytes[i] >> 4]);
        out.push_back(hex_chars[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace

bool PeerId::IsValid(std::string_view text) noexcept {
    if (text.empty() || text.size() > kMaxPeerIdLength) {
        return false;
    }
    if (!IsAsciiAlnum(text.front()) || !IsAsciiAlnum(text.back())) {
        return false;
    }
    for (const char c : text) {
        if (!IsAsciiAlnum(c) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

Result<PeerId, PeerDropFailure> PeerId::Parse(std::string_view text) {
    if (!IsValid(text)) {
        return Result<PeerId, PeerDropFailure>::Err(
            PeerDropFailure::InvalidPeerId("'" + std::string(text) + "'"));
    }
    return Result<PeerId, PeerDropFailure>::Ok(PeerId(std::string(text)));
}

PeerId PeerId::Generate() {
    std::string value;
    value.append(Pick(kAdjectives));
    value.push_back('-');
    value.append(Pick(kNouns));
    value.push_back('-');
    value.append(Pick(kNouns));
    return PeerId(std::move(value));
}

std::string GenerateToken() {
    return RandomUuid();
}

std::string GenerateConnectionId() {
    return RandomUuid();
}

} // namespace peerdrop::identity
