#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace peerdrop::rtc {

enum class DescriptionType {
    Offer,
    Answer
};

struct SessionDescription {
    DescriptionType type = DescriptionType::Offer;
    std::string sdp;

    bool operator==(const SessionDescription&) const = default;
};

struct IceCandidate {
    std::string candidate;
    std::optional<std::string> sdp_mid;
    std::optional<uint16_t> sdp_mline_index;

    bool operator==(const IceCandidate&) const = default;
};

enum class ConnectionState {
    New,
    Connecting,
    Connected,
    Disconnected,
    Failed,
    Closed
};

struct IceServer {
    std::string url;
    std::string username;
    std::string credential;
};

constexpr std::string_view ToString(const DescriptionType type) noexcept {
    return type == DescriptionType::Offer ? "offer" : "answer";
}

constexpr std::optional<DescriptionType> ParseDescriptionType(const std::string_view text) noexcept {
    if (text == "offer") {
        return DescriptionType::Offer;
    }
    if (text == "answer") {
        return DescriptionType::Answer;
    }
    return std::nullopt;
}

constexpr std::string_view ToString(const ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::New: return "new";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Failed: return "failed";
        case ConnectionState::Closed: return "closed";
    }
    return "unknown";
}

} // namespace peerdrop::rtc
